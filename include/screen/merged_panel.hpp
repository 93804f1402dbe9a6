/**
 * @file merged_panel.hpp
 * @brief 合并面板：输入栏与结果列表共用一个外框，中间以一条分隔线隔开
 *
 * 按输入栏位置自上而下排列：输入栏、分隔线、结果区（或反之）。
 * 输入栏高度 = 1 + 上下内边距，分隔线 1 行，结果区占其余。
 * 分隔线是纯水平线：只有一个外框，不存在需要接合的缝。
 */

#pragma once

#include "screen/border.hpp"
#include "screen/canvas.hpp"
#include "screen/entry.hpp"
#include "screen/geometry.hpp"
#include "screen/header_spec.hpp"
#include "screen/input_row.hpp"
#include "screen/input_state.hpp"
#include "screen/layout.hpp"
#include "screen/results_list.hpp"
#include "screen/theme.hpp"
#include <ftxui/screen/screen.hpp>
#include <optional>
#include <string>
#include <vector>

namespace finder::screen {

/**
 * @struct MergedPanelSpec
 * @brief 合并面板参数
 *
 * 外框只有一个标题，取输入栏标题（缺省为频道名）；
 * 结果面板标题在合并模式下不显示，分隔线上也不放标签。
 */
struct MergedPanelSpec {
    BorderStyle style = BorderStyle::ROUNDED;
    HeaderSpec inputHeader;
    std::string channelName;
    Padding inputPadding;
    Padding resultsPadding;
    InputPosition position = InputPosition::TOP;
};

/**
 * @struct MergedPanelLayout
 * @brief 外框内部的三个子区域
 */
struct MergedPanelLayout {
    Rect inputRow;
    Rect separator;
    Rect results;
};

/**
 * @brief 切分外框内部区域
 */
MergedPanelLayout layoutMergedPanel(const Rect& inner, const Padding& inputPadding, InputPosition position);

/**
 * @brief 绘制合并面板
 *
 * @return 终端光标位置
 * @throws NumericConversionError 来自输入栏
 */
std::optional<CursorPosition> drawMergedPanel(ftxui::Screen& screen,
                                              const Rect& rect,
                                              const MergedPanelSpec& spec,
                                              const InputState& input,
                                              const InputRowModel& model,
                                              const std::vector<Entry>& entries,
                                              const SelectionSet& selection,
                                              ListState& list,
                                              const RowFormatter& formatter,
                                              const Theme& theme);

} // namespace finder::screen
