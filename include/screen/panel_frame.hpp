/**
 * @file panel_frame.hpp
 * @brief 带标题、边框与内边距的面板框
 *
 * drawPanelFrame 返回面板内部区域。内部区域为空时什么都不画，
 * 下游渲染器据此统一跳过退化的区域。
 */

#pragma once

#include "screen/border.hpp"
#include "screen/canvas.hpp"
#include "screen/geometry.hpp"
#include <ftxui/screen/color.hpp>
#include <ftxui/screen/screen.hpp>
#include <optional>
#include <string>

namespace finder::screen {

/**
 * @brief 面板的水平边
 */
enum class Edge {
    TOP,
    BOTTOM
};

/**
 * @struct FrameSpec
 * @brief 面板框的绘制参数
 */
struct FrameSpec {
    BorderStyle style = BorderStyle::ROUNDED;
    Padding padding;
    std::optional<Line> title;          ///< 已解析的标题；std::nullopt 表示不画标题
    Edge titleEdge = Edge::TOP;
    std::optional<Edge> sharedEdge;     ///< 与相邻面板共享的边，不绘制（部分边框）
    ftxui::Color borderColor = ftxui::Color::Default;
    ftxui::Color background = ftxui::Color::Default;
};

/**
 * @brief 生成居中标题用的 " text " 行，粗体、标题色
 */
Line titleLine(const std::string& text, ftxui::Color color);

/**
 * @brief 计算内部区域，不绘制
 *
 * 画了边框的边各占一格；没有边框但该边有标题时标题占一行。
 */
Rect frameInterior(const Rect& rect, const FrameSpec& spec);

/**
 * @brief 绘制面板框
 *
 * 先用背景色清空整个区域，再画边框与标题。部分边框时，
 * 左右竖线一直延伸到被省略的那条边所在的行。
 *
 * @return 内部区域；为空时不做任何绘制
 */
Rect drawPanelFrame(ftxui::Screen& screen, const Rect& rect, const FrameSpec& spec);

} // namespace finder::screen
