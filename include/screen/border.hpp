/**
 * @file border.hpp
 * @brief 边框样式与字形表
 *
 * 每种样式对应一组八个边框字形和四个接合字形。
 * NONE 在表中显式映射为"无字形"，调用方据此跳过边框与接合绘制。
 */

#pragma once

#include <optional>
#include <string>

namespace finder::screen {

/**
 * @brief 边框样式
 */
enum class BorderStyle {
    NONE,
    PLAIN,
    ROUNDED,
    DOUBLE,
    THICK
};

/**
 * @struct BorderGlyphs
 * @brief 一种边框样式的全部字形
 */
struct BorderGlyphs {
    const char* topLeft;
    const char* topRight;
    const char* bottomLeft;
    const char* bottomRight;
    const char* top;          ///< 上边水平线
    const char* bottom;       ///< 下边水平线
    const char* left;         ///< 左边竖线
    const char* right;        ///< 右边竖线

    const char* teeLeft;      ///< ├ 左边竖线上向右分出的接合
    const char* teeRight;     ///< ┤ 右边竖线上向左分出的接合
    const char* teeDown;      ///< ┬
    const char* teeUp;        ///< ┴
};

/**
 * @brief 查字形表
 * @return 该样式的字形；NONE 返回 nullptr
 */
const BorderGlyphs* borderGlyphs(BorderStyle style);

/**
 * @brief 解析配置中的样式名（none/plain/rounded/double/thick，不区分大小写）
 */
std::optional<BorderStyle> parseBorderStyle(const std::string& name);

/**
 * @brief 样式名
 */
const char* borderStyleName(BorderStyle style);

} // namespace finder::screen
