/**
 * @file shared_border.hpp
 * @brief 共享边框：让两个独立面板的相邻边看起来是一条带接合字形的分隔线
 *
 * 用于"拼接"模式：输入面板省略朝向结果面板的边，结果面板画完整边框，
 * 之后用本模块把结果面板靠近输入面板的那条边改写为 ├───┤，
 * 可在中间嵌入居中的标签。合并模式只有一个外框，不使用本模块。
 */

#pragma once

#include "screen/border.hpp"
#include "screen/geometry.hpp"
#include "screen/layout.hpp"
#include "screen/theme.hpp"
#include <ftxui/screen/screen.hpp>
#include <optional>
#include <string>
#include <vector>

namespace finder::screen {

/**
 * @struct SharedBorderLine
 * @brief 组合好的一行共享边框
 *
 * cells 的长度恰好等于目标宽度；[labelBegin, labelEnd) 为标签所在格。
 */
struct SharedBorderLine {
    std::vector<std::string> cells;
    int labelBegin = 0;
    int labelEnd = 0;
};

/**
 * @brief 组合共享边框行：左接合 + 填充 + 右接合
 *
 * 标签存在、非空，且其显示宽度（字符数 + 两侧各一个空格）不超过内部宽度
 * （总宽 - 2）时居中放置，奇数余量的较小一半给左侧；否则为纯填充线。
 *
 * @return width < 2 时返回空行
 */
SharedBorderLine composeSharedBorder(const BorderGlyphs& glyphs,
                                     int width,
                                     const std::optional<std::string>& label);

/**
 * @brief 目标行：结果面板靠近输入面板的那条边
 *
 * 输入在上取结果面板的上边，输入在下取下边。
 */
int sharedBorderRow(const Rect& resultsFrame, InputPosition position);

/**
 * @brief 改写结果面板的相邻边
 *
 * 没有接合字形的样式或宽度小于 2 时不做任何事。
 * 相同输入总是写出相同的一行。
 *
 * @return 是否改写了该行
 */
bool paintSharedBorder(ftxui::Screen& screen,
                       const Rect& resultsFrame,
                       InputPosition position,
                       BorderStyle style,
                       const std::optional<std::string>& label,
                       const Theme& theme);

} // namespace finder::screen
