/**
 * @file results_list.hpp
 * @brief 结果列表：把条目、多选状态和列表方向交给行格式化器并渲染到区域中
 *
 * 同一个渲染器同时服务于独立结果面板（带外框）和合并面板内部（无边框），
 * 两者只在外观参数 ResultsChrome 上不同。
 */

#pragma once

#include "screen/border.hpp"
#include "screen/canvas.hpp"
#include "screen/entry.hpp"
#include "screen/geometry.hpp"
#include "screen/header_spec.hpp"
#include "screen/layout.hpp"
#include "screen/theme.hpp"
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/screen.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace finder::screen {

/// 结果面板的默认标题
constexpr const char* DEFAULT_RESULTS_HEADER = "Results";

/**
 * @brief 列表方向
 *
 * 输入栏在上时自上而下，在下时自下而上，
 * 使离输入栏最近的总是排名最高的条目。
 */
enum class ListDirection {
    TOP_TO_BOTTOM,
    BOTTOM_TO_TOP
};

ListDirection listDirectionFor(InputPosition position);

/**
 * @struct ListState
 * @brief 列表的滚动偏移与光标行，由调用方持有并跨帧保留
 */
struct ListState {
    std::size_t offset = 0;
    std::optional<std::size_t> selected;

    /// 光标移向排名更低的条目（下标 +1），到末尾停住
    void selectNext(std::size_t count);
    /// 光标移向排名更高的条目（下标 -1），到开头停住
    void selectPrevious(std::size_t count);

    /**
     * @brief 调整偏移，使光标行可见且偏移不越过末尾
     *
     * 光标超出条目数时收回到最后一条。
     */
    void scrollToSelection(std::size_t count, int height);
};

/**
 * @class RowFormatter
 * @brief 行格式化器：把一条条目变成可渲染的一行
 */
class RowFormatter {
public:
    virtual ~RowFormatter() = default;

    /**
     * @param entry 条目
     * @param selected 多选标记；没有任何条目被多选时为 std::nullopt
     * @param width 可用内容宽度
     * @param highlighted 是否为光标所在行
     */
    virtual ftxui::Element formatRow(const Entry& entry,
                                     std::optional<bool> selected,
                                     int width,
                                     bool highlighted,
                                     const Theme& theme) const = 0;
};

/**
 * @class DefaultRowFormatter
 * @brief 默认行格式：光标标记 "> "、多选标记 "● "、条目文本
 */
class DefaultRowFormatter : public RowFormatter {
public:
    ftxui::Element formatRow(const Entry& entry,
                             std::optional<bool> selected,
                             int width,
                             bool highlighted,
                             const Theme& theme) const override;
};

/**
 * @brief 某一行的多选标记
 */
std::optional<bool> selectionFlag(const Entry& entry, const SelectionSet& selection);

/**
 * @brief 结果面板标题
 *
 * 默认标题为 "Results"。多个数据源时在标题后附加 ⟨ ● ○ ⟩ 指示当前数据源，
 * 绑定了切换按键时再附加按键名。
 *
 * @return HIDDEN 时返回 std::nullopt
 */
std::optional<Line> resultsTitle(const HeaderSpec& header,
                                 std::size_t sourceIndex,
                                 std::size_t sourceCount,
                                 const std::optional<std::string>& cycleKey,
                                 const Theme& theme);

/**
 * @brief 数据源指示 ⟨ ● ○ ⟩，只有一个数据源时为空串
 */
std::string sourceIndicator(std::size_t sourceIndex, std::size_t sourceCount);

/**
 * @brief 结果标题的纯文本形式，供拼接模式的共享边框作标签
 *
 * 与 resultsTitle 内容相同（标题、数据源指示、切换按键）。
 * 加上两侧空格后超过 maxWidth 时只保留标题文字。
 *
 * @return HIDDEN 时返回 std::nullopt
 */
std::optional<std::string> resultsLabel(const HeaderSpec& header,
                                        std::size_t sourceIndex,
                                        std::size_t sourceCount,
                                        const std::optional<std::string>& cycleKey,
                                        int maxWidth);

/**
 * @brief 结果列表的外观形态
 */
enum class ResultsChromeKind {
    FRAMED,       ///< 自带外框、标题
    BORDERLESS    ///< 位于合并面板内部，只应用内边距
};

/**
 * @struct ResultsChrome
 * @brief 结果列表的外观参数
 */
struct ResultsChrome {
    ResultsChromeKind kind = ResultsChromeKind::FRAMED;
    BorderStyle style = BorderStyle::ROUNDED;
    Padding padding;
    std::optional<Line> title;
    ListDirection direction = ListDirection::TOP_TO_BOTTOM;
};

/**
 * @brief 绘制结果列表
 *
 * @param list 调用方持有的列表状态，仅在本次调用中修改
 * @return 列表内容区域；为空时未做任何绘制
 */
Rect drawResultsList(ftxui::Screen& screen,
                     const Rect& rect,
                     const std::vector<Entry>& entries,
                     const SelectionSet& selection,
                     ListState& list,
                     const ResultsChrome& chrome,
                     const RowFormatter& formatter,
                     const Theme& theme);

} // namespace finder::screen
