/**
 * @file merged_panel.cpp
 * @brief 合并面板实现
 */

#include "screen/merged_panel.hpp"
#include "screen/panel_frame.hpp"
#include <algorithm>

namespace finder::screen {

MergedPanelLayout layoutMergedPanel(const Rect& inner, const Padding& inputPadding, InputPosition position) {
    const int input_row_height = 1 + std::max(inputPadding.top, 0) + std::max(inputPadding.bottom, 0);
    const Constraint input = Constraint::fixedLength(input_row_height);
    const Constraint separator = Constraint::fixedLength(1);
    const Constraint results = Constraint::fill(1);

    MergedPanelLayout layout;
    if (position == InputPosition::TOP) {
        auto chunks = split(Direction::VERTICAL, {input, separator, results}, inner);
        layout.inputRow = chunks[0];
        layout.separator = chunks[1];
        layout.results = chunks[2];
    } else {
        auto chunks = split(Direction::VERTICAL, {results, separator, input}, inner);
        layout.results = chunks[0];
        layout.separator = chunks[1];
        layout.inputRow = chunks[2];
    }
    return layout;
}

std::optional<CursorPosition> drawMergedPanel(ftxui::Screen& screen,
                                              const Rect& rect,
                                              const MergedPanelSpec& spec,
                                              const InputState& input,
                                              const InputRowModel& model,
                                              const std::vector<Entry>& entries,
                                              const SelectionSet& selection,
                                              ListState& list,
                                              const RowFormatter& formatter,
                                              const Theme& theme) {
    // 外框：完整边框，唯一的标题位于输入栏一侧
    FrameSpec outer;
    outer.style = spec.style;
    outer.titleEdge = spec.position == InputPosition::TOP ? Edge::TOP : Edge::BOTTOM;
    if (auto title = spec.inputHeader.resolve(spec.channelName)) {
        outer.title = titleLine(*title, theme.title);
    }
    outer.borderColor = theme.border;
    outer.background = theme.background;

    const Rect inner = drawPanelFrame(screen, rect, outer);
    if (inner.empty()) {
        return std::nullopt;
    }
    const MergedPanelLayout layout = layoutMergedPanel(inner, spec.inputPadding, spec.position);

    // 分隔线
    if (!layout.separator.empty()) {
        const BorderGlyphs* glyphs = borderGlyphs(spec.style);
        const std::string fill = glyphs != nullptr ? glyphs->top : "─";
        std::string rule;
        for (int i = 0; i < layout.separator.width; ++i) {
            rule += fill;
        }
        drawLine(screen, layout.separator.x, layout.separator.y, layout.separator.width,
                 Line{Span{rule, theme.border}});
    }

    // 输入栏：先扣除内边距
    const Rect input_inner = layout.inputRow.inner(spec.inputPadding);
    if (input_inner.empty()) {
        return std::nullopt;
    }
    auto cursor = drawInputRow(screen, input_inner, input, model, theme, InputRowMode::MERGED);

    // 结果区：无边框，由 drawResultsList 扣除内边距
    ResultsChrome chrome;
    chrome.kind = ResultsChromeKind::BORDERLESS;
    chrome.padding = spec.resultsPadding;
    chrome.direction = listDirectionFor(spec.position);
    drawResultsList(screen, layout.results, entries, selection, list, chrome, formatter, theme);

    return cursor;
}

} // namespace finder::screen
