/**
 * @file geometry.hpp
 * @brief 字符格坐标下的矩形、内边距与约束切分
 *
 * 所有布局计算都以终端字符格为单位。切分算法保证输出的矩形
 * 按输入顺序无缝、无重叠地铺满源矩形。
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace finder::screen {

/// 终端坐标的上限（与终端协议的 16 位坐标一致）
constexpr int MAX_COORD = 65535;

/**
 * @class NumericConversionError
 * @brief 计算出的宽度/偏移/计数超出终端坐标范围
 *
 * 只影响抛出它的那一次面板绘制，调用方可以在下一帧重试。
 */
class NumericConversionError : public std::overflow_error {
public:
    explicit NumericConversionError(const std::string& what)
        : std::overflow_error(what) {}
};

/**
 * @brief 将无符号计数转换为终端坐标
 * @param value 待转换的值
 * @param what 出错时写入异常信息的量名
 * @throws NumericConversionError 超出 [0, MAX_COORD]
 */
int toCoord(std::size_t value, const char* what);

/**
 * @struct Padding
 * @brief 面板内边距（非负）
 */
struct Padding {
    int top = 0;
    int bottom = 0;
    int left = 0;
    int right = 0;

    static Padding uniform(int n) { return Padding{n, n, n, n}; }

    bool isZero() const { return top == 0 && bottom == 0 && left == 0 && right == 0; }

    bool operator==(const Padding& other) const {
        return top == other.top && bottom == other.bottom &&
               left == other.left && right == other.right;
    }
    bool operator!=(const Padding& other) const { return !(*this == other); }
};

/**
 * @struct Rect
 * @brief 字符格矩形，宽高为 0 表示"无内容可画"
 */
struct Rect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    std::int64_t area() const {
        if (width <= 0 || height <= 0) return 0;
        return static_cast<std::int64_t>(width) * height;
    }
    bool empty() const { return area() == 0; }
    int right() const { return x + width; }
    int bottom() const { return y + height; }

    /**
     * @brief 去掉内边距后的内部区域（饱和计算，不会出现负宽高）
     */
    Rect inner(const Padding& padding) const;

    bool contains(int px, int py) const {
        return px >= x && px < right() && py >= y && py < bottom();
    }

    bool operator==(const Rect& other) const {
        return x == other.x && y == other.y && width == other.width && height == other.height;
    }
    bool operator!=(const Rect& other) const { return !(*this == other); }
};

/**
 * @struct Constraint
 * @brief 切分约束：固定长度、按权重填充或按百分比
 */
struct Constraint {
    enum class Kind {
        FIXED_LENGTH,
        FILL,
        PERCENTAGE
    };

    Kind kind = Kind::FILL;
    int value = 1;

    static Constraint fixedLength(int n) { return Constraint{Kind::FIXED_LENGTH, n}; }
    static Constraint fill(int weight = 1) { return Constraint{Kind::FILL, weight}; }
    static Constraint percentage(int p) { return Constraint{Kind::PERCENTAGE, p}; }

    bool operator==(const Constraint& other) const {
        return kind == other.kind && value == other.value;
    }
    bool operator!=(const Constraint& other) const { return !(*this == other); }
};

/**
 * @brief 切分方向
 */
enum class Direction {
    VERTICAL,    ///< 自上而下排列（切高度）
    HORIZONTAL   ///< 自左而右排列（切宽度）
};

/**
 * @brief 按约束序列切分矩形
 *
 * 规则：
 * 1. FIXED_LENGTH 与 PERCENTAGE 按顺序申领空间，每次申领裁剪到剩余量；
 * 2. 剩余空间按权重分给 FILL（权重 0 按 1 计），整除余下的格子
 *    逐个分给靠前的 FILL；
 * 3. 没有 FILL 时，剩余空间并入最后一段，保证铺满。
 *
 * @return 与约束一一对应的矩形；约束为空时返回空序列
 */
std::vector<Rect> split(Direction direction, const std::vector<Constraint>& constraints, const Rect& area);

/**
 * @brief 两个矩形的外包矩形
 */
Rect mergeRects(const Rect& a, const Rect& b);

} // namespace finder::screen
