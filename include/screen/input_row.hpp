/**
 * @file input_row.hpp
 * @brief 输入栏：提示符、输入文本、结果计数、忙碌指示
 *
 * 从左到右四段：
 * - 提示符：提示符字符数 + 1（未设置时为 2）
 * - 输入文本：剩余宽度
 * - 结果计数：3 × max(total, 1) 的十进制位数 + 3
 * - 忙碌指示：独立面板 1 格，合并面板 2 格
 */

#pragma once

#include "screen/border.hpp"
#include "screen/canvas.hpp"
#include "screen/geometry.hpp"
#include "screen/header_spec.hpp"
#include "screen/input_state.hpp"
#include "screen/layout.hpp"
#include "screen/theme.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace finder::screen {

/// 未配置提示符时使用的提示符
constexpr const char* DEFAULT_PROMPT = ">";

/// 合并面板中匹配进行中的指示字形
constexpr const char* LOADING_GLYPH = "●";

/**
 * @brief 输入栏所处的面板形态
 */
enum class InputRowMode {
    SINGLE_PANEL,   ///< 输入栏有自己的面板框
    MERGED          ///< 输入栏位于合并面板内部
};

/**
 * @struct InputRowModel
 * @brief 一帧输入栏需要的数据快照
 */
struct InputRowModel {
    std::optional<std::string> prompt;
    std::uint32_t resultsCount = 0;
    std::uint32_t totalCount = 0;
    bool matcherRunning = false;
    std::string spinnerFrame;   ///< 独立面板忙碌时显示的字形
};

/**
 * @struct InputRowLayout
 * @brief 输入栏四段的位置
 */
struct InputRowLayout {
    Rect prompt;
    Rect field;
    Rect counter;
    Rect busy;
};

/**
 * @brief 提示符段宽度
 * @throws NumericConversionError 提示符过长
 */
int promptWidth(const std::optional<std::string>& prompt);

/**
 * @brief 结果计数段宽度：3 × digits(max(total, 1)) + 3
 */
int counterWidth(std::uint32_t totalCount);

/**
 * @brief 忙碌指示段宽度
 */
int busyIndicatorWidth(InputRowMode mode);

/**
 * @brief 输入文本段中保留不用于显示文本的列数
 */
int reservedFieldColumns(InputRowMode mode);

/**
 * @brief 输入文本的可见宽度：max(字段宽度, 保留列) - 保留列
 */
int visibleFieldWidth(int fieldWidth, InputRowMode mode);

/**
 * @brief 计算四段位置
 * @throws NumericConversionError 提示符过长
 */
InputRowLayout layoutInputRow(const Rect& rect, const InputRowModel& model, InputRowMode mode);

/**
 * @brief 在 rect 内绘制输入栏
 *
 * @return 终端光标位置；rect 为空或输入字段宽度为 0 时返回 std::nullopt
 * @throws NumericConversionError 提示符、滚动偏移或光标偏移超出终端坐标范围
 */
std::optional<CursorPosition> drawInputRow(ftxui::Screen& screen,
                                           const Rect& rect,
                                           const InputState& input,
                                           const InputRowModel& model,
                                           const Theme& theme,
                                           InputRowMode mode);

/**
 * @struct InputPanelSpec
 * @brief 独立输入面板的外框参数
 */
struct InputPanelSpec {
    BorderStyle style = BorderStyle::ROUNDED;
    Padding padding;
    HeaderSpec header;
    std::string channelName;                        ///< 标题缺省时使用
    InputPosition position = InputPosition::TOP;
    bool fusedWithResults = false;                  ///< 省略朝向结果面板的那条边
};

/**
 * @brief 独立输入面板的总高度：1 + 上下内边距 + 边框/标题行数
 *
 * 边框行数：完整边框 2，与结果面板拼接时 1；无边框时有标题占 1 行，否则 0。
 */
int inputPanelHeight(const InputPanelSpec& spec);

/**
 * @brief 绘制独立输入面板（外框 + 输入栏）
 *
 * 标题位于输入栏所在的屏幕边一侧。
 */
std::optional<CursorPosition> drawInputPanel(ftxui::Screen& screen,
                                             const Rect& rect,
                                             const InputPanelSpec& spec,
                                             const InputState& input,
                                             const InputRowModel& model,
                                             const Theme& theme);

} // namespace finder::screen
