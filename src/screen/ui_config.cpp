/**
 * @file ui_config.cpp
 * @brief 界面配置读取实现
 */

#include "screen/ui_config.hpp"
#include "base/config.hpp"
#include "base/logger.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace finder::screen {

namespace {

constexpr const char* SECTION = "ui";

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::optional<int> parseNonNegative(const std::string& text) {
    std::string digits;
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            digits += c;
        }
    }
    if (digits.empty() || digits.size() > 5) {
        return std::nullopt;
    }
    int value = 0;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        value = value * 10 + (c - '0');
    }
    if (value > MAX_COORD) {
        return std::nullopt;
    }
    return value;
}

void readPanel(Config& config, const std::string& name, PanelConfig& panel) {
    if (auto value = config.find(SECTION, name + "_border")) {
        if (auto style = parseBorderStyle(*value)) {
            panel.border = *style;
        } else {
            LOG_WARN() << "[UiConfig] Unknown border style for " << name << ": " << *value;
        }
    }
    if (auto value = config.find(SECTION, name + "_padding")) {
        if (auto padding = parsePadding(*value)) {
            panel.padding = *padding;
        } else {
            LOG_WARN() << "[UiConfig] Invalid padding for " << name << ": " << *value;
        }
    }
    panel.header = HeaderSpec::fromOptional(config.find(SECTION, name + "_header"));
}

} // anonymous namespace

std::optional<Padding> parsePadding(const std::string& text) {
    std::vector<int> values;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto value = parseNonNegative(item);
        if (!value) {
            return std::nullopt;
        }
        values.push_back(*value);
    }

    if (values.size() == 1) {
        return Padding::uniform(values[0]);
    }
    if (values.size() == 4) {
        return Padding{values[0], values[1], values[2], values[3]};
    }
    return std::nullopt;
}

UiConfig loadUiConfig(Config& config) {
    UiConfig ui;

    if (auto value = config.find(SECTION, "input_position")) {
        const std::string lower = toLower(*value);
        if (lower == "top") {
            ui.inputPosition = InputPosition::TOP;
        } else if (lower == "bottom") {
            ui.inputPosition = InputPosition::BOTTOM;
        } else {
            LOG_WARN() << "[UiConfig] Unknown input_position: " << *value;
        }
    }
    if (auto value = config.find(SECTION, "orientation")) {
        const std::string lower = toLower(*value);
        if (lower == "portrait") {
            ui.orientation = Orientation::PORTRAIT;
        } else if (lower == "landscape") {
            ui.orientation = Orientation::LANDSCAPE;
        } else {
            LOG_WARN() << "[UiConfig] Unknown orientation: " << *value;
        }
    }

    ui.mergeInputAndResults = config.get_bool(SECTION, "merge_input_and_results", ui.mergeInputAndResults);
    ui.fuseBorders = config.get_bool(SECTION, "fuse_borders", ui.fuseBorders);
    ui.previewHidden = config.get_bool(SECTION, "preview_hidden", ui.previewHidden);

    const int preview_size = config.get_int(SECTION, "preview_size", ui.previewSize);
    if (preview_size < 0 || preview_size > 100) {
        LOG_WARN() << "[UiConfig] preview_size out of range: " << preview_size;
    } else {
        ui.previewSize = preview_size;
    }

    readPanel(config, "input", ui.input);
    readPanel(config, "results", ui.results);
    readPanel(config, "preview", ui.preview);

    ui.prompt = config.find(SECTION, "prompt");
    if (ui.prompt && ui.prompt->empty()) {
        ui.prompt.reset();
    }
    ui.channelName = config.get(SECTION, "channel", ui.channelName);
    return ui;
}

} // namespace finder::screen
