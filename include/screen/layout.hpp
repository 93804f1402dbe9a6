/**
 * @file layout.hpp
 * @brief 屏幕区域规划：输入栏、结果列表、预览窗的位置
 *
 * 规划函数是纯函数：相同输入总是得到相同的约束序列，任何参数组合都不会抛出。
 */

#pragma once

#include "screen/geometry.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace finder::screen {

/**
 * @brief 输入栏位置
 *
 * 决定竖直布局中的先后顺序，以及合并模式下哪条边是"共享"的。
 */
enum class InputPosition {
    TOP,
    BOTTOM
};

/**
 * @brief 预览窗与列表的相对方向
 */
enum class Orientation {
    PORTRAIT,   ///< 预览窗与列表上下堆叠
    LANDSCAPE   ///< 预览窗位于列表右侧
};

/**
 * @struct LayoutPlan
 * @brief 区域切分计划
 *
 * 合并模式下 inputIndex 与 resultsIndex 指向同一个合并面板区域。
 */
struct LayoutPlan {
    std::vector<Constraint> constraints;
    std::size_t inputIndex = 0;
    std::size_t resultsIndex = 0;
    std::optional<std::size_t> previewIndex;
};

/**
 * @brief 合并模式（输入栏与结果列表共用一个外框）的竖直切分计划
 *
 * - 预览隐藏：单一区域 fill(1)；
 * - 预览可见：两个等分区域，合并面板总是紧贴输入栏所在的那条屏幕边。
 */
LayoutPlan planMergedLayout(InputPosition position, bool previewHidden);

/**
 * @brief 非合并模式的常规堆叠切分计划
 *
 * TOP：[输入 fixed(h), 结果 fill(1), 预览 percentage(p)]；
 * BOTTOM：[预览 percentage(p), 结果 fill(1), 输入 fixed(h)]。
 * 预览隐藏时省略预览区域。
 */
LayoutPlan planStackedLayout(InputPosition position, bool previewHidden, int inputHeight, int previewPercent);

/**
 * @struct LayoutConfig
 * @brief 计算屏幕布局所需的全部参数
 */
struct LayoutConfig {
    InputPosition inputPosition = InputPosition::TOP;
    Orientation orientation = Orientation::PORTRAIT;
    bool mergeInputAndResults = false;
    bool previewHidden = false;
    int previewSize = 50;   ///< 预览窗占比（百分比）
    int inputHeight = 3;    ///< 非合并模式下输入面板的总高度
};

/**
 * @struct ScreenLayout
 * @brief 具体到坐标的屏幕布局
 *
 * merged 为 true 时 input 与 results 是同一个矩形。
 */
struct ScreenLayout {
    Rect input;
    Rect results;
    std::optional<Rect> preview;
    bool merged = false;
};

/**
 * @brief 在给定区域上应用规划
 *
 * 竖屏直接按规划竖直切分；横屏先水平切出右侧预览窗，
 * 左侧列再按输入栏位置竖直切分。
 */
ScreenLayout computeScreenLayout(const LayoutConfig& config, const Rect& area);

} // namespace finder::screen
