/**
 * @file preview_panel.cpp
 * @brief 预览面板实现
 */

#include "screen/preview_panel.hpp"
#include "screen/panel_frame.hpp"

namespace finder::screen {

Rect drawPreviewPanel(ftxui::Screen& screen,
                      const Rect& rect,
                      const PreviewPanelSpec& spec,
                      const std::string& fallbackTitle,
                      const std::vector<std::string>& lines,
                      const Theme& theme) {
    FrameSpec frame;
    frame.style = spec.style;
    frame.padding = spec.padding;
    // 没有高亮条目时 fallbackTitle 为空，此时不画标题
    auto title = spec.header.resolve(fallbackTitle);
    if (title && !title->empty()) {
        frame.title = titleLine(*title, theme.title);
    }
    frame.borderColor = theme.border;
    frame.background = theme.background;

    const Rect inner = drawPanelFrame(screen, rect, frame);
    if (inner.empty()) {
        return inner;
    }

    int row = 0;
    for (const auto& text : lines) {
        if (row >= inner.height) {
            break;
        }
        drawLine(screen, inner.x, inner.y + row, inner.width, Line{Span{text, theme.input}});
        ++row;
    }
    return inner;
}

} // namespace finder::screen
