/**
 * @file ui_config.hpp
 * @brief 界面配置：从 [ui] 段读取布局、边框、内边距、标题等选项
 */

#pragma once

#include "screen/border.hpp"
#include "screen/geometry.hpp"
#include "screen/header_spec.hpp"
#include "screen/layout.hpp"
#include <optional>
#include <string>

namespace finder {
class Config;
}

namespace finder::screen {

/**
 * @struct PanelConfig
 * @brief 单个面板的外观
 */
struct PanelConfig {
    BorderStyle border = BorderStyle::ROUNDED;
    Padding padding;
    HeaderSpec header;
};

/**
 * @struct UiConfig
 * @brief 整个界面的配置
 */
struct UiConfig {
    InputPosition inputPosition = InputPosition::TOP;
    Orientation orientation = Orientation::PORTRAIT;
    bool mergeInputAndResults = false;
    bool fuseBorders = false;           ///< 输入与结果面板共用相邻边（非合并模式）
    bool previewHidden = false;
    int previewSize = 50;

    PanelConfig input;
    PanelConfig results;
    PanelConfig preview;

    std::optional<std::string> prompt;
    std::string channelName = "files";
};

/**
 * @brief 解析内边距
 *
 * 接受 "t,b,l,r" 或单个数字 n（四边相同），数值不得为负。
 *
 * @return 格式错误时返回 std::nullopt
 */
std::optional<Padding> parsePadding(const std::string& text);

/**
 * @brief 从配置读取界面选项
 *
 * 缺省项使用 UiConfig 的默认值；无法识别的取值记一条警告并保留默认值。
 */
UiConfig loadUiConfig(Config& config);

} // namespace finder::screen
