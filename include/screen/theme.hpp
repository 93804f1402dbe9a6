/**
 * @file theme.hpp
 * @brief 界面配色
 */

#pragma once

#include <ftxui/screen/color.hpp>
#include <optional>
#include <string>

namespace finder {
class Config;
}

namespace finder::screen {

/**
 * @struct Theme
 * @brief 每帧只读的配色表
 */
struct Theme {
    ftxui::Color border = ftxui::Color::GrayDark;       ///< 边框与分隔线
    ftxui::Color background = ftxui::Color::Default;    ///< 面板背景
    ftxui::Color input = ftxui::Color::White;           ///< 提示符与输入文本
    ftxui::Color counter = ftxui::Color::GrayLight;     ///< 结果计数
    ftxui::Color title = ftxui::Color::Cyan;            ///< 面板标题
    ftxui::Color selection = ftxui::Color::Green;       ///< 多选标记
    ftxui::Color highlight = ftxui::Color::Blue;        ///< 光标所在行背景
};

/**
 * @brief 解析颜色名或 #rrggbb
 *
 * 支持 default、black、red、green、yellow、blue、magenta、cyan、white、
 * gray、graydark、graylight 以及 #rrggbb。
 */
std::optional<ftxui::Color> parseColor(const std::string& name);

/**
 * @brief 从配置的 [theme] 节加载配色，未配置或无法解析的项保留默认值
 */
Theme loadTheme(Config& config);

} // namespace finder::screen
