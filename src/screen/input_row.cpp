/**
 * @file input_row.cpp
 * @brief 输入栏绘制实现
 */

#include "screen/input_row.hpp"
#include "screen/panel_frame.hpp"
#include <algorithm>

namespace finder::screen {

namespace {

int decimalDigits(std::uint32_t value) {
    int digits = 1;
    while (value >= 10) {
        value /= 10;
        ++digits;
    }
    return digits;
}

std::string counterText(const InputRowModel& model, InputRowMode mode) {
    const std::string results = std::to_string(model.resultsCount);
    const std::string total = std::to_string(model.totalCount);
    if (mode == InputRowMode::MERGED) {
        return " " + results + "/" + total + " ";
    }
    return " " + results + " / " + total + " ";
}

} // anonymous namespace

int promptWidth(const std::optional<std::string>& prompt) {
    if (!prompt) {
        return 2;
    }
    return toCoord(toCells(*prompt).size() + 1, "prompt width");
}

int counterWidth(std::uint32_t totalCount) {
    return 3 * decimalDigits(std::max<std::uint32_t>(totalCount, 1)) + 3;
}

int busyIndicatorWidth(InputRowMode mode) {
    return mode == InputRowMode::MERGED ? 2 : 1;
}

int reservedFieldColumns(InputRowMode mode) {
    // 独立面板保留 2 列，合并面板只为光标保留 1 列
    return mode == InputRowMode::MERGED ? 1 : 2;
}

int visibleFieldWidth(int fieldWidth, InputRowMode mode) {
    const int reserved = reservedFieldColumns(mode);
    return std::max(fieldWidth, reserved) - reserved;
}

InputRowLayout layoutInputRow(const Rect& rect, const InputRowModel& model, InputRowMode mode) {
    auto chunks = split(Direction::HORIZONTAL,
                        {
                            Constraint::fixedLength(promptWidth(model.prompt)),
                            Constraint::fill(1),
                            Constraint::fixedLength(counterWidth(model.totalCount)),
                            Constraint::fixedLength(busyIndicatorWidth(mode)),
                        },
                        rect);
    InputRowLayout layout;
    layout.prompt = chunks[0];
    layout.field = chunks[1];
    layout.counter = chunks[2];
    layout.busy = chunks[3];
    return layout;
}

std::optional<CursorPosition> drawInputRow(ftxui::Screen& screen,
                                           const Rect& rect,
                                           const InputState& input,
                                           const InputRowModel& model,
                                           const Theme& theme,
                                           InputRowMode mode) {
    if (rect.empty()) {
        return std::nullopt;
    }
    const InputRowLayout layout = layoutInputRow(rect, model, mode);

    // 提示符
    const std::string prompt = model.prompt.value_or(DEFAULT_PROMPT);
    drawLine(screen, layout.prompt.x, layout.prompt.y, layout.prompt.width,
             Line{Span{prompt + " ", theme.input, true, false}});

    // 输入文本，从滚动偏移处开始显示
    const int visible = visibleFieldWidth(layout.field.width, mode);
    const CursorState cursor = input.cursorState(static_cast<std::size_t>(visible));
    const int scroll = toCoord(cursor.scrollOffset, "input scroll offset");
    const auto cells = toCells(input.value());
    std::string shown;
    for (std::size_t i = static_cast<std::size_t>(scroll); i < cells.size(); ++i) {
        shown += cells[i];
    }
    drawLine(screen, layout.field.x, layout.field.y, layout.field.width,
             Line{Span{shown, theme.input, true, true}});

    // 忙碌指示
    if (model.matcherRunning && !layout.busy.empty()) {
        if (mode == InputRowMode::MERGED) {
            drawLine(screen, layout.busy.x, layout.busy.y, layout.busy.width,
                     Line{Span{LOADING_GLYPH, ftxui::Color::Green}});
        } else {
            drawLine(screen, layout.busy.x, layout.busy.y, layout.busy.width,
                     Line{Span{model.spinnerFrame, theme.counter}});
        }
    }

    // 结果计数，右对齐
    const std::string counter = counterText(model, mode);
    const int counter_width = std::min(displayWidth(counter), layout.counter.width);
    drawLine(screen, layout.counter.right() - counter_width, layout.counter.y, counter_width,
             Line{Span{counter, theme.counter, false, true}});

    if (layout.field.width <= 0) {
        return std::nullopt;
    }
    const std::size_t caret = std::max(cursor.visualCursor, cursor.scrollOffset) - cursor.scrollOffset;
    const int offset = std::min(toCoord(caret, "cursor offset"), layout.field.width - 1);
    return CursorPosition{layout.field.x + offset, layout.field.y};
}

int inputPanelHeight(const InputPanelSpec& spec) {
    int chrome_rows = 0;
    if (borderGlyphs(spec.style) != nullptr) {
        chrome_rows = spec.fusedWithResults ? 1 : 2;
    } else if (spec.header.resolve(spec.channelName)) {
        chrome_rows = 1;    // 无边框时标题单独占一行
    }
    return 1 + std::max(spec.padding.top, 0) + std::max(spec.padding.bottom, 0) + chrome_rows;
}

std::optional<CursorPosition> drawInputPanel(ftxui::Screen& screen,
                                             const Rect& rect,
                                             const InputPanelSpec& spec,
                                             const InputState& input,
                                             const InputRowModel& model,
                                             const Theme& theme) {
    FrameSpec frame;
    frame.style = spec.style;
    frame.padding = spec.padding;
    frame.titleEdge = spec.position == InputPosition::TOP ? Edge::TOP : Edge::BOTTOM;
    if (auto title = spec.header.resolve(spec.channelName)) {
        frame.title = titleLine(*title, theme.title);
    }
    if (spec.fusedWithResults) {
        frame.sharedEdge = spec.position == InputPosition::TOP ? Edge::BOTTOM : Edge::TOP;
    }
    frame.borderColor = theme.border;
    frame.background = theme.background;

    const Rect inner = drawPanelFrame(screen, rect, frame);
    if (inner.empty()) {
        return std::nullopt;
    }
    return drawInputRow(screen, inner, input, model, theme, InputRowMode::SINGLE_PANEL);
}

} // namespace finder::screen
