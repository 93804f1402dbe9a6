/**
 * @file theme.cpp
 * @brief 配色解析实现
 */

#include "screen/theme.hpp"
#include "base/config.hpp"
#include "base/logger.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace finder::screen {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

void applyColor(Config& config, const char* key, ftxui::Color& target) {
    auto value = config.find("theme", key);
    if (!value || value->empty()) {
        return;
    }
    auto color = parseColor(*value);
    if (!color) {
        LOG_WARN() << "[Theme] Unknown color for " << key << ": " << *value;
        return;
    }
    target = *color;
}

} // anonymous namespace

std::optional<ftxui::Color> parseColor(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower.size() == 7 && lower[0] == '#') {
        int channels[3];
        for (int i = 0; i < 3; ++i) {
            int hi = hexValue(lower[1 + i * 2]);
            int lo = hexValue(lower[2 + i * 2]);
            if (hi < 0 || lo < 0) {
                return std::nullopt;
            }
            channels[i] = hi * 16 + lo;
        }
        return ftxui::Color::RGB(static_cast<uint8_t>(channels[0]),
                                 static_cast<uint8_t>(channels[1]),
                                 static_cast<uint8_t>(channels[2]));
    }

    static const std::unordered_map<std::string, ftxui::Color> named = {
        {"default", ftxui::Color::Default},
        {"black", ftxui::Color::Black},
        {"red", ftxui::Color::Red},
        {"green", ftxui::Color::Green},
        {"yellow", ftxui::Color::Yellow},
        {"blue", ftxui::Color::Blue},
        {"magenta", ftxui::Color::Magenta},
        {"cyan", ftxui::Color::Cyan},
        {"white", ftxui::Color::White},
        {"gray", ftxui::Color::GrayLight},
        {"graydark", ftxui::Color::GrayDark},
        {"graylight", ftxui::Color::GrayLight},
    };
    auto it = named.find(lower);
    if (it == named.end()) {
        return std::nullopt;
    }
    return it->second;
}

Theme loadTheme(Config& config) {
    Theme theme;
    applyColor(config, "border", theme.border);
    applyColor(config, "background", theme.background);
    applyColor(config, "input", theme.input);
    applyColor(config, "counter", theme.counter);
    applyColor(config, "title", theme.title);
    applyColor(config, "selection", theme.selection);
    applyColor(config, "highlight", theme.highlight);
    return theme;
}

} // namespace finder::screen
