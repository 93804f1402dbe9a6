/**
 * @file spinner.hpp
 * @brief 匹配进行中时输入栏右侧的转圈指示
 */

#pragma once

#include <cstddef>
#include <string>

namespace finder::screen {

/**
 * @class Spinner
 * @brief 盲文点阵转圈动画，每次 tick() 前进一帧
 */
class Spinner {
public:
    /**
     * @brief 当前帧字形（单个字符格）
     */
    const std::string& frame() const;

    void tick();

    std::size_t index() const { return index_; }

private:
    std::size_t index_ = 0;
};

} // namespace finder::screen
