/**
 * @file screen_composer.hpp
 * @brief 整屏合成：计算布局，逐个面板绘制，放置终端光标
 *
 * 每个面板独立绘制：某个面板的数值溢出只会让该面板这一帧失败，
 * 其余面板照常绘制，下一帧重试。
 */

#pragma once

#include "screen/entry.hpp"
#include "screen/geometry.hpp"
#include "screen/input_state.hpp"
#include "screen/layout.hpp"
#include "screen/results_list.hpp"
#include "screen/theme.hpp"
#include "screen/ui_config.hpp"
#include <ftxui/screen/screen.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace finder::screen {

/**
 * @class FrameModel
 * @brief 一帧的只读快照
 *
 * 只持有引用，生命周期不超过一次 draw() 调用。
 */
class FrameModel {
public:
    FrameModel(const InputState& input, const std::vector<Entry>& entries, const SelectionSet& selection)
        : input_(input), entries_(entries), selection_(selection) {}

    const InputState& input() const { return input_; }
    const std::vector<Entry>& entries() const { return entries_; }
    const SelectionSet& selection() const { return selection_; }

    std::uint32_t resultsCount = 0;
    std::uint32_t totalCount = 0;
    bool matcherRunning = false;
    std::string spinnerFrame;

    std::size_t sourceIndex = 0;                ///< 当前数据源
    std::size_t sourceCount = 1;
    std::optional<std::string> cycleKey;        ///< 切换数据源的按键提示

    std::vector<std::string> previewLines;
    std::string previewTitle;                   ///< 预览标题缺省时使用

private:
    const InputState& input_;
    const std::vector<Entry>& entries_;
    const SelectionSet& selection_;
};

/**
 * @struct UiState
 * @brief 跨帧保留、由调用方持有的界面状态
 */
struct UiState {
    ListState list;
    bool previewHidden = false;
};

/**
 * @struct DrawReport
 * @brief 一帧的绘制结果
 */
struct DrawReport {
    std::optional<CursorPosition> cursor;
    int failedPanels = 0;
    ScreenLayout layout;
};

/**
 * @class ScreenComposer
 * @brief 按配置把各个面板画到同一块屏幕上
 */
class ScreenComposer {
public:
    ScreenComposer(UiConfig config, Theme theme, std::shared_ptr<RowFormatter> formatter);

    /**
     * @brief 绘制一帧
     *
     * 产生了光标位置时调用 Screen::SetCursor。
     */
    DrawReport draw(ftxui::Screen& screen, const Rect& area, const FrameModel& model, UiState& state);

    const UiConfig& config() const { return config_; }
    const Theme& theme() const { return theme_; }

    /**
     * @brief 输入面板在当前配置下的高度
     */
    int inputHeight() const;

private:
    InputRowModel inputRowModel(const FrameModel& model) const;
    bool fused() const;

    void drawMerged(ftxui::Screen& screen, const ScreenLayout& layout, const FrameModel& model,
                    UiState& state, DrawReport& report);
    void drawStacked(ftxui::Screen& screen, const ScreenLayout& layout, const FrameModel& model,
                     UiState& state, DrawReport& report);
    void drawPreview(ftxui::Screen& screen, const Rect& rect, const FrameModel& model, DrawReport& report);

    UiConfig config_;
    Theme theme_;
    std::shared_ptr<RowFormatter> formatter_;
};

} // namespace finder::screen
