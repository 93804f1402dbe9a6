/**
 * @file app.hpp
 * @brief finder 主应用
 */

#pragma once

#include "finder/catalog.hpp"
#include "finder/matcher.hpp"
#include "screen/entry.hpp"
#include "screen/input_state.hpp"
#include "screen/screen_composer.hpp"
#include "screen/spinner.hpp"
#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace finder::app {

/**
 * @class FinderApp
 * @brief 交互式查找界面
 *
 * 管理：
 * - 后台扫描的条目目录，变更时通过 Event::Custom 唤醒界面
 * - 查询输入、过滤结果、多选集合
 * - 每帧由 ScreenComposer 把各面板画到 FTXUI 的屏幕上
 */
class FinderApp {
public:
    /**
     * @param root 扫描的根目录
     * @param listFile 指定时改为逐行读取该文件，不再扫描目录
     */
    FinderApp(screen::UiConfig config, screen::Theme theme, std::filesystem::path root,
              std::optional<std::filesystem::path> listFile);

    /**
     * @brief 运行界面（阻塞）
     * @return 确认选择时为 true，按 Esc 放弃时为 false
     */
    bool run();

    /**
     * @brief 确认后的结果：多选集合，或光标所在条目
     */
    const std::vector<std::string>& accepted() const { return accepted_; }

    /**
     * @brief 把当前状态绘制到屏幕的指定区域
     */
    void drawFrame(ftxui::Screen& target, const screen::Rect& area);

private:
    ftxui::Component createMainComponent();
    bool handleEvent(const ftxui::Event& event);

    void refilter();
    void onQueryChanged();
    void cycleSource();
    void startSource();
    void accept();
    void updatePreview();
    std::filesystem::path entryPath(const screen::Entry& entry) const;

    ftxui::ScreenInteractive screen_;
    screen::ScreenComposer composer_;
    std::filesystem::path root_;
    std::optional<std::filesystem::path> listFile_;

    std::vector<SourceKind> sources_;
    std::size_t sourceIndex_ = 0;

    SubstringMatcher matcher_;
    screen::InputState input_;
    screen::SelectionSet selection_;
    screen::UiState uiState_;
    screen::Spinner spinner_;

    std::vector<screen::Entry> filtered_;
    std::uint64_t filteredVersion_ = 0;
    std::string filteredQuery_;

    std::optional<std::string> previewFor_;
    std::vector<std::string> previewLines_;

    std::vector<std::string> accepted_;
    bool acceptedFlag_ = false;

    // 声明在最后、最先析构：扫描线程的回调会访问 screen_
    Catalog catalog_;
};

} // namespace finder::app
