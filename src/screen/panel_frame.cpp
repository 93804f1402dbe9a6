/**
 * @file panel_frame.cpp
 * @brief 面板框绘制实现
 */

#include "screen/panel_frame.hpp"
#include <algorithm>

namespace finder::screen {

namespace {

void putGlyph(ftxui::Screen& screen, int x, int y, const char* glyph, ftxui::Color color) {
    ftxui::Pixel& pixel = screen.PixelAt(x, y);
    pixel.character = glyph;
    pixel.foreground_color = color;
    pixel.bold = false;
}

bool hasTopRow(const FrameSpec& spec) {
    const bool border = borderGlyphs(spec.style) != nullptr && spec.sharedEdge != Edge::TOP;
    return border || (spec.title && spec.titleEdge == Edge::TOP);
}

bool hasBottomRow(const FrameSpec& spec) {
    const bool border = borderGlyphs(spec.style) != nullptr && spec.sharedEdge != Edge::BOTTOM;
    return border || (spec.title && spec.titleEdge == Edge::BOTTOM);
}

} // anonymous namespace

Line titleLine(const std::string& text, ftxui::Color color) {
    return Line{Span{" " + text + " ", color, true, false}};
}

Rect frameInterior(const Rect& rect, const FrameSpec& spec) {
    const int side = borderGlyphs(spec.style) != nullptr ? 1 : 0;
    Padding chrome;
    chrome.left = side;
    chrome.right = side;
    chrome.top = hasTopRow(spec) ? 1 : 0;
    chrome.bottom = hasBottomRow(spec) ? 1 : 0;
    return rect.inner(chrome).inner(spec.padding);
}

Rect drawPanelFrame(ftxui::Screen& screen, const Rect& rect, const FrameSpec& spec) {
    const Rect inner = frameInterior(rect, spec);
    if (inner.empty()) {
        return inner;
    }

    fillRect(screen, rect, spec.background);

    const BorderGlyphs* glyphs = borderGlyphs(spec.style);
    if (glyphs != nullptr) {
        const bool drawTop = spec.sharedEdge != Edge::TOP;
        const bool drawBottom = spec.sharedEdge != Edge::BOTTOM;
        const int last_x = rect.right() - 1;
        const int last_y = rect.bottom() - 1;

        if (drawTop) {
            for (int x = rect.x; x <= last_x; ++x) {
                putGlyph(screen, x, rect.y, glyphs->top, spec.borderColor);
            }
            putGlyph(screen, rect.x, rect.y, glyphs->topLeft, spec.borderColor);
            putGlyph(screen, last_x, rect.y, glyphs->topRight, spec.borderColor);
        }
        if (drawBottom) {
            for (int x = rect.x; x <= last_x; ++x) {
                putGlyph(screen, x, last_y, glyphs->bottom, spec.borderColor);
            }
            putGlyph(screen, rect.x, last_y, glyphs->bottomLeft, spec.borderColor);
            putGlyph(screen, last_x, last_y, glyphs->bottomRight, spec.borderColor);
        }

        const int first_side_row = rect.y + (drawTop ? 1 : 0);
        const int last_side_row = last_y - (drawBottom ? 1 : 0);
        for (int y = first_side_row; y <= last_side_row; ++y) {
            putGlyph(screen, rect.x, y, glyphs->left, spec.borderColor);
            putGlyph(screen, last_x, y, glyphs->right, spec.borderColor);
        }
    }

    if (spec.title) {
        const int side = glyphs != nullptr ? 1 : 0;
        const int available = std::max(0, rect.width - 2 * side);
        const int width = lineWidth(*spec.title);
        // 居中时奇数余量的较小一半给左侧
        const int offset = std::max(0, (available - width) / 2);
        const int row = spec.titleEdge == Edge::TOP ? rect.y : rect.bottom() - 1;
        drawLine(screen, rect.x + side + offset, row, available - offset, *spec.title);
    }

    return inner;
}

} // namespace finder::screen
