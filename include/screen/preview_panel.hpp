/**
 * @file preview_panel.hpp
 * @brief 预览面板：带框显示调用方提供的预览行
 */

#pragma once

#include "screen/border.hpp"
#include "screen/canvas.hpp"
#include "screen/geometry.hpp"
#include "screen/header_spec.hpp"
#include "screen/theme.hpp"
#include <ftxui/screen/screen.hpp>
#include <string>
#include <vector>

namespace finder::screen {

struct PreviewPanelSpec {
    BorderStyle style = BorderStyle::ROUNDED;
    Padding padding;
    HeaderSpec header;
};

/**
 * @brief 绘制预览面板
 *
 * 标题缺省时使用 fallbackTitle（通常为光标所在条目的名字）；
 * 预览行超出内部区域的部分被裁掉。
 *
 * @return 内部区域
 */
Rect drawPreviewPanel(ftxui::Screen& screen,
                      const Rect& rect,
                      const PreviewPanelSpec& spec,
                      const std::string& fallbackTitle,
                      const std::vector<std::string>& lines,
                      const Theme& theme);

} // namespace finder::screen
