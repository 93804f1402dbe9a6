/**
 * @file border.cpp
 * @brief 边框字形表实现
 */

#include "screen/border.hpp"
#include <algorithm>
#include <array>
#include <cctype>

namespace finder::screen {

namespace {

constexpr BorderGlyphs PLAIN_GLYPHS{
    "┌", "┐", "└", "┘", "─", "─", "│", "│",
    "├", "┤", "┬", "┴",
};

constexpr BorderGlyphs ROUNDED_GLYPHS{
    "╭", "╮", "╰", "╯", "─", "─", "│", "│",
    "├", "┤", "┬", "┴",
};

constexpr BorderGlyphs DOUBLE_GLYPHS{
    "╔", "╗", "╚", "╝", "═", "═", "║", "║",
    "╠", "╣", "╦", "╩",
};

constexpr BorderGlyphs THICK_GLYPHS{
    "┏", "┓", "┗", "┛", "━", "━", "┃", "┃",
    "┣", "┫", "┳", "┻",
};

struct StyleEntry {
    BorderStyle style;
    const char* name;
    const BorderGlyphs* glyphs;
};

constexpr std::array<StyleEntry, 5> STYLE_TABLE{{
    {BorderStyle::NONE, "none", nullptr},
    {BorderStyle::PLAIN, "plain", &PLAIN_GLYPHS},
    {BorderStyle::ROUNDED, "rounded", &ROUNDED_GLYPHS},
    {BorderStyle::DOUBLE, "double", &DOUBLE_GLYPHS},
    {BorderStyle::THICK, "thick", &THICK_GLYPHS},
}};

const StyleEntry* findEntry(BorderStyle style) {
    for (const auto& entry : STYLE_TABLE) {
        if (entry.style == style) {
            return &entry;
        }
    }
    return nullptr;
}

} // anonymous namespace

const BorderGlyphs* borderGlyphs(BorderStyle style) {
    const StyleEntry* entry = findEntry(style);
    return entry ? entry->glyphs : nullptr;
}

std::optional<BorderStyle> parseBorderStyle(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto& entry : STYLE_TABLE) {
        if (lower == entry.name) {
            return entry.style;
        }
    }
    return std::nullopt;
}

const char* borderStyleName(BorderStyle style) {
    const StyleEntry* entry = findEntry(style);
    return entry ? entry->name : "unknown";
}

} // namespace finder::screen
