/**
 * @file input_state.hpp
 * @brief 单行输入框的文本与光标状态
 *
 * 提供渲染所需的可视光标列与水平滚动偏移，以及宿主程序使用的基本编辑操作。
 * 状态由调用方持有，跨帧保留。
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace finder::screen {

/**
 * @struct CursorState
 * @brief 水平滚动偏移与可视光标列（均以字符格计）
 *
 * 不变量：0 <= visualCursor - scrollOffset <= 可见宽度。
 */
struct CursorState {
    std::size_t scrollOffset = 0;
    std::size_t visualCursor = 0;
};

/**
 * @class InputState
 * @brief 单行文本编辑状态
 *
 * 文本按字形（grapheme）存储，光标位置是字形下标；
 * 全角字符占两个字符格。
 */
class InputState {
public:
    InputState() = default;

    /**
     * @brief 以给定文本构造，光标置于末尾
     */
    explicit InputState(const std::string& value);

    /**
     * @brief 当前文本
     */
    std::string value() const;

    /**
     * @brief 光标位置（字形下标）
     */
    std::size_t cursor() const { return cursor_; }

    /**
     * @brief 光标前文本占用的字符格数
     */
    std::size_t visualCursor() const;

    /**
     * @brief 在可见宽度 width 下，使光标保持可见所需的水平滚动偏移
     *
     * 偏移总是落在字形边界上。
     */
    std::size_t visualScroll(std::size_t width) const;

    /**
     * @brief 一次性取得滚动偏移与可视光标列
     */
    CursorState cursorState(std::size_t width) const;

    void setValue(const std::string& value);
    void clear();

    /// 在光标处插入文本（可以是多个字符）
    void insert(const std::string& text);
    /// 删除光标前一个字形
    bool backspace();
    /// 删除光标处的字形
    bool deleteForward();

    void moveLeft();
    void moveRight();
    void moveHome();
    void moveEnd();

private:
    std::vector<std::string> glyphs_;
    std::size_t cursor_ = 0;
};

} // namespace finder::screen
