/**
 * @file shared_border.cpp
 * @brief 共享边框实现
 */

#include "screen/shared_border.hpp"
#include "screen/canvas.hpp"

namespace finder::screen {

SharedBorderLine composeSharedBorder(const BorderGlyphs& glyphs,
                                     int width,
                                     const std::optional<std::string>& label) {
    SharedBorderLine line;
    if (width < 2) {
        return line;
    }

    const int interior = width - 2;
    line.cells.reserve(static_cast<std::size_t>(width));
    line.cells.push_back(glyphs.teeLeft);
    for (int i = 0; i < interior; ++i) {
        line.cells.push_back(glyphs.top);
    }
    line.cells.push_back(glyphs.teeRight);

    if (!label || label->empty()) {
        return line;
    }
    const auto label_cells = toCells(" " + *label + " ");
    const int label_width = static_cast<int>(label_cells.size());
    if (label_width > interior) {
        return line;
    }

    const int left = (interior - label_width) / 2;
    line.labelBegin = 1 + left;
    line.labelEnd = line.labelBegin + label_width;
    for (int i = 0; i < label_width; ++i) {
        line.cells[static_cast<std::size_t>(line.labelBegin + i)] = label_cells[static_cast<std::size_t>(i)];
    }
    return line;
}

int sharedBorderRow(const Rect& resultsFrame, InputPosition position) {
    return position == InputPosition::TOP ? resultsFrame.y : resultsFrame.bottom() - 1;
}

bool paintSharedBorder(ftxui::Screen& screen,
                       const Rect& resultsFrame,
                       InputPosition position,
                       BorderStyle style,
                       const std::optional<std::string>& label,
                       const Theme& theme) {
    const BorderGlyphs* glyphs = borderGlyphs(style);
    if (glyphs == nullptr || resultsFrame.width < 2 || resultsFrame.height < 1) {
        return false;
    }

    const SharedBorderLine line = composeSharedBorder(*glyphs, resultsFrame.width, label);
    const int row = sharedBorderRow(resultsFrame, position);
    for (int i = 0; i < resultsFrame.width; ++i) {
        ftxui::Pixel& pixel = screen.PixelAt(resultsFrame.x + i, row);
        const bool in_label = i >= line.labelBegin && i < line.labelEnd;
        pixel.character = line.cells[static_cast<std::size_t>(i)];
        pixel.foreground_color = in_label ? theme.title : theme.border;
        pixel.bold = in_label;
        pixel.italic = false;
        pixel.background_color = theme.background;
    }
    return true;
}

} // namespace finder::screen
