/**
 * @file canvas.hpp
 * @brief 帧缓冲上的基础绘制操作
 *
 * 帧缓冲即 ftxui::Screen：每个 Pixel 对应一个字符格。
 * 全角字符占两格，第二格的字符为空串（与 FTXUI 的约定一致）。
 */

#pragma once

#include "screen/geometry.hpp"
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/color.hpp>
#include <ftxui/screen/screen.hpp>
#include <string>
#include <vector>

namespace finder::screen {

/**
 * @struct Span
 * @brief 一段同样式的文本
 */
struct Span {
    std::string text;
    ftxui::Color foreground = ftxui::Color::Default;
    bool bold = false;
    bool italic = false;
};

/// 一行由若干 Span 组成
using Line = std::vector<Span>;

/**
 * @struct CursorPosition
 * @brief 终端光标位置（列、行）
 */
struct CursorPosition {
    int x = 0;
    int y = 0;

    bool operator==(const CursorPosition& other) const { return x == other.x && y == other.y; }
};

/**
 * @brief 将 UTF-8 文本拆成字符格序列
 */
std::vector<std::string> toCells(const std::string& text);

/**
 * @brief 文本占用的字符格数
 */
int displayWidth(const std::string& text);

/**
 * @brief 一行占用的字符格数
 */
int lineWidth(const Line& line);

/**
 * @brief 用空格和背景色清空区域
 */
void fillRect(ftxui::Screen& screen, const Rect& rect, ftxui::Color background);

/**
 * @brief 在 (x, y) 处写一行，最多写 maxWidth 格，保留原有背景色
 * @return 实际写入的格数
 */
int drawLine(ftxui::Screen& screen, int x, int y, int maxWidth, const Line& line);

/**
 * @brief 把 FTXUI 元素渲染到帧缓冲的指定区域
 *
 * 元素先在同尺寸的离屏 Screen 上排版，再逐格拷贝；
 * 元素未设置背景色的格子保留目标原有背景。
 */
void renderElement(ftxui::Screen& screen, ftxui::Element element, const Rect& rect);

/**
 * @brief 读取一行中 [x, x + width) 的字符（测试与日志用）
 */
std::string readRow(ftxui::Screen& screen, int x, int y, int width);

} // namespace finder::screen
