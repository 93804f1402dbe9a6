/**
 * @file input_state.cpp
 * @brief 单行输入状态实现
 */

#include "screen/input_state.hpp"
#include <ftxui/screen/string.hpp>
#include <algorithm>

namespace finder::screen {

namespace {

/// 拆分字形，去掉 FTXUI 为全角字符补的占位空串
std::vector<std::string> splitGlyphs(const std::string& text) {
    std::vector<std::string> out;
    for (auto& glyph : ftxui::Utf8ToGlyphs(text)) {
        if (!glyph.empty()) {
            out.push_back(std::move(glyph));
        }
    }
    return out;
}

std::size_t glyphWidth(const std::string& glyph) {
    return static_cast<std::size_t>(std::max(ftxui::string_width(glyph), 0));
}

} // anonymous namespace

InputState::InputState(const std::string& value) {
    setValue(value);
}

std::string InputState::value() const {
    std::string out;
    for (const auto& glyph : glyphs_) {
        out += glyph;
    }
    return out;
}

std::size_t InputState::visualCursor() const {
    std::size_t width = 0;
    for (std::size_t i = 0; i < cursor_ && i < glyphs_.size(); ++i) {
        width += glyphWidth(glyphs_[i]);
    }
    return width;
}

std::size_t InputState::visualScroll(std::size_t width) const {
    const std::size_t visual = visualCursor();
    const std::size_t scroll = std::max(visual, width) - width;
    std::size_t uscroll = 0;
    for (const auto& glyph : glyphs_) {
        if (uscroll >= scroll) {
            break;
        }
        uscroll += glyphWidth(glyph);
    }
    return uscroll;
}

CursorState InputState::cursorState(std::size_t width) const {
    CursorState state;
    state.scrollOffset = visualScroll(width);
    state.visualCursor = visualCursor();
    return state;
}

void InputState::setValue(const std::string& value) {
    glyphs_ = splitGlyphs(value);
    cursor_ = glyphs_.size();
}

void InputState::clear() {
    glyphs_.clear();
    cursor_ = 0;
}

void InputState::insert(const std::string& text) {
    auto inserted = splitGlyphs(text);
    glyphs_.insert(glyphs_.begin() + static_cast<std::ptrdiff_t>(cursor_), inserted.begin(), inserted.end());
    cursor_ += inserted.size();
}

bool InputState::backspace() {
    if (cursor_ == 0) {
        return false;
    }
    --cursor_;
    glyphs_.erase(glyphs_.begin() + static_cast<std::ptrdiff_t>(cursor_));
    return true;
}

bool InputState::deleteForward() {
    if (cursor_ >= glyphs_.size()) {
        return false;
    }
    glyphs_.erase(glyphs_.begin() + static_cast<std::ptrdiff_t>(cursor_));
    return true;
}

void InputState::moveLeft() {
    if (cursor_ > 0) --cursor_;
}

void InputState::moveRight() {
    if (cursor_ < glyphs_.size()) ++cursor_;
}

void InputState::moveHome() {
    cursor_ = 0;
}

void InputState::moveEnd() {
    cursor_ = glyphs_.size();
}

} // namespace finder::screen
