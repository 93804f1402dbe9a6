/**
 * @file results_list.cpp
 * @brief 结果列表实现
 */

#include "screen/results_list.hpp"
#include "screen/panel_frame.hpp"
#include <algorithm>

namespace finder::screen {

using namespace ftxui;

ListDirection listDirectionFor(InputPosition position) {
    return position == InputPosition::BOTTOM ? ListDirection::BOTTOM_TO_TOP
                                             : ListDirection::TOP_TO_BOTTOM;
}

void ListState::selectNext(std::size_t count) {
    if (count == 0) {
        selected.reset();
        return;
    }
    if (!selected) {
        selected = 0;
        return;
    }
    selected = std::min(*selected + 1, count - 1);
}

void ListState::selectPrevious(std::size_t count) {
    if (count == 0) {
        selected.reset();
        return;
    }
    if (!selected || *selected == 0) {
        selected = 0;
        return;
    }
    selected = std::min(*selected - 1, count - 1);
}

void ListState::scrollToSelection(std::size_t count, int height) {
    if (count == 0) {
        offset = 0;
        return;
    }
    const std::size_t visible = static_cast<std::size_t>(std::max(height, 1));
    if (selected) {
        if (*selected >= count) {
            selected = count - 1;
        }
        if (*selected < offset) {
            offset = *selected;
        } else if (*selected >= offset + visible) {
            offset = *selected + 1 - visible;
        }
    }
    const std::size_t max_offset = count > visible ? count - visible : 0;
    offset = std::min(offset, max_offset);
}

Element DefaultRowFormatter::formatRow(const Entry& entry,
                                       std::optional<bool> selected,
                                       int width,
                                       bool highlighted,
                                       const Theme& theme) const {
    Elements parts;
    parts.push_back(text(highlighted ? "> " : "  ") | color(theme.input) | bold);
    if (selected) {
        parts.push_back(text(*selected ? "● " : "  ") | color(theme.selection));
    }
    parts.push_back(text(entry.label()));

    Element row = hbox(std::move(parts)) | size(WIDTH, LESS_THAN, std::max(width, 0));
    if (highlighted) {
        row = row | bgcolor(theme.highlight) | bold;
    }
    return row;
}

std::optional<bool> selectionFlag(const Entry& entry, const SelectionSet& selection) {
    if (selection.empty()) {
        return std::nullopt;
    }
    return selection.contains(entry);
}

std::optional<Line> resultsTitle(const HeaderSpec& header,
                                 std::size_t sourceIndex,
                                 std::size_t sourceCount,
                                 const std::optional<std::string>& cycleKey,
                                 const Theme& theme) {
    auto text = header.resolve(DEFAULT_RESULTS_HEADER);
    if (!text) {
        return std::nullopt;
    }
    Line line = titleLine(*text, theme.title);
    if (sourceCount <= 1) {
        return line;
    }

    line.push_back(Span{sourceIndicator(sourceIndex, sourceCount), theme.counter});
    if (cycleKey) {
        line.push_back(Span{" " + *cycleKey, theme.border});
    }
    line.push_back(Span{" ", theme.title});
    return line;
}

std::string sourceIndicator(std::size_t sourceIndex, std::size_t sourceCount) {
    if (sourceCount <= 1) {
        return std::string();
    }
    std::string dots;
    for (std::size_t i = 0; i < sourceCount; ++i) {
        if (i > 0) dots += " ";
        dots += i == sourceIndex ? "●" : "○";
    }
    return "⟨ " + dots + " ⟩";
}

std::optional<std::string> resultsLabel(const HeaderSpec& header,
                                        std::size_t sourceIndex,
                                        std::size_t sourceCount,
                                        const std::optional<std::string>& cycleKey,
                                        int maxWidth) {
    auto text = header.resolve(DEFAULT_RESULTS_HEADER);
    if (!text || sourceCount <= 1) {
        return text;
    }
    std::string full = *text + " " + sourceIndicator(sourceIndex, sourceCount);
    if (cycleKey) {
        full += " " + *cycleKey;
    }
    // 放不下时退回纯标题
    if (displayWidth(full) + 2 > maxWidth) {
        return text;
    }
    return full;
}

Rect drawResultsList(ftxui::Screen& screen,
                     const Rect& rect,
                     const std::vector<Entry>& entries,
                     const SelectionSet& selection,
                     ListState& list,
                     const ResultsChrome& chrome,
                     const RowFormatter& formatter,
                     const Theme& theme) {
    FrameSpec frame;
    frame.padding = chrome.padding;
    frame.borderColor = theme.border;
    frame.background = theme.background;
    if (chrome.kind == ResultsChromeKind::FRAMED) {
        frame.style = chrome.style;
        frame.title = chrome.title;
    } else {
        frame.style = BorderStyle::NONE;
    }

    const Rect inner = drawPanelFrame(screen, rect, frame);
    if (inner.empty()) {
        return inner;
    }

    // 右侧留一列空白
    const int content_width = std::max(inner.width - 1, 0);
    list.scrollToSelection(entries.size(), inner.height);

    for (int row = 0; row < inner.height; ++row) {
        const std::size_t index = list.offset + static_cast<std::size_t>(row);
        if (index >= entries.size()) {
            break;
        }
        const int y = chrome.direction == ListDirection::TOP_TO_BOTTOM ? inner.y + row
                                                                       : inner.bottom() - 1 - row;
        const bool highlighted = list.selected && *list.selected == index;
        Element element = formatter.formatRow(entries[index], selectionFlag(entries[index], selection),
                                              content_width, highlighted, theme);
        renderElement(screen, element, Rect{inner.x, y, inner.width, 1});
    }
    return inner;
}

} // namespace finder::screen
