/// @file bom_panel.cpp
/// @brief Implements the BOM panel with category headers and quantity rows

#include "ui/bom_panel.hpp"

#include "ui/ui_scale.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <string>

namespace framekit {

namespace {

const Color BG_COLOR = {35, 35, 42, 230};
const Color BORDER_COLOR = {70, 70, 85, 255};
const Color TEXT_COLOR = {220, 220, 230, 255};
const Color LABEL_COLOR = {160, 160, 180, 255};
const Color QTY_COLOR = {80, 220, 130, 255};
const Color AUTO_COLOR = {220, 200, 120, 255}; // Derived lock pin line
const Color EMPTY_COLOR = {120, 120, 135, 255};

constexpr float QTY_COLUMN = 44.0f;

} // namespace

float draw_bom_panel(const std::vector<BomEntry>& bom, float panel_x, float panel_y, float panel_w,
                     float max_h) {
    const UIScale& s = ui_scale();
    float cx = panel_x + s.padding;
    float cy = panel_y + s.padding;

    // Category headers are drawn whenever the category changes
    int headers = 0;
    for (size_t i = 0; i < bom.size(); i++) {
        if (i == 0 || bom[i].category != bom[i - 1].category) {
            headers++;
        }
    }
    int lines = std::max(1, static_cast<int>(bom.size()) + headers);
    float wanted = 2.0f * s.padding + s.row_height * static_cast<float>(lines + 2);
    float panel_h = std::min(wanted, std::max(max_h, 3.0f * s.row_height));
    int visible_lines =
        static_cast<int>((panel_h - 2.0f * s.padding) / s.row_height) - 2; // title + total
    if (lines > visible_lines) {
        visible_lines--; // room for the "+N more" line
    }

    DrawRectangleRec({panel_x, panel_y, panel_w, panel_h}, BG_COLOR);
    DrawRectangleLinesEx({panel_x, panel_y, panel_w, panel_h}, 1.0f, BORDER_COLOR);

    DrawText("BILL OF MATERIALS", static_cast<int>(cx), static_cast<int>(cy), s.font_title,
             TEXT_COLOR);
    cy += s.row_height;

    if (bom.empty()) {
        DrawText("No parts placed", static_cast<int>(cx), static_cast<int>(cy), s.font_small,
                 EMPTY_COLOR);
        return panel_h;
    }

    int total = 0;
    int drawn = 0;
    size_t hidden = 0;
    for (size_t i = 0; i < bom.size(); i++) {
        const BomEntry& entry = bom[i];
        total += entry.quantity;

        bool header = i == 0 || entry.category != bom[i - 1].category;
        int needed = header ? 2 : 1;
        if (drawn + needed > visible_lines) {
            hidden++;
            continue;
        }

        if (header) {
            std::string title(category_name(entry.category));
            std::transform(title.begin(), title.end(), title.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            DrawText(title.c_str(), static_cast<int>(cx), static_cast<int>(cy), s.font_small,
                     LABEL_COLOR);
            cy += s.row_height;
            drawn++;
        }

        char qty[16];
        std::snprintf(qty, sizeof(qty), "%dx", entry.quantity);
        DrawText(qty, static_cast<int>(cx), static_cast<int>(cy), s.font_normal, QTY_COLOR);
        Color name_color = entry.category == PartCategory::LOCKPIN ? AUTO_COLOR : TEXT_COLOR;
        DrawText(entry.name.c_str(), static_cast<int>(cx + QTY_COLUMN), static_cast<int>(cy),
                 s.font_normal, name_color);
        cy += s.row_height;
        drawn++;
    }

    if (hidden > 0) {
        std::string more = "+" + std::to_string(hidden) + " more";
        DrawText(more.c_str(), static_cast<int>(cx), static_cast<int>(cy), s.font_small,
                 EMPTY_COLOR);
        cy += s.row_height;
    }

    std::string summary = "Total: " + std::to_string(total) + " pieces";
    DrawText(summary.c_str(), static_cast<int>(cx), static_cast<int>(cy), s.font_normal,
             TEXT_COLOR);
    return panel_h;
}

} // namespace framekit
