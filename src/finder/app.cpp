/**
 * @file app.cpp
 * @brief finder 主应用实现
 */

#include "finder/app.hpp"
#include "base/logger.hpp"
#include "finder/preview.hpp"
#include <ftxui/dom/node.hpp>
#include <algorithm>
#include <limits>

namespace finder::app {

using namespace ftxui;

namespace {

/// Ctrl-P：显示/隐藏预览
const Event TOGGLE_PREVIEW = Event::Special("\x10");
/// Ctrl-S：切换数据源
const Event CYCLE_SOURCES = Event::Special("\x13");
constexpr const char* CYCLE_SOURCES_KEY = "ctrl-s";

/// 预览最多读取的行数
constexpr std::size_t PREVIEW_LINES = 256;

std::uint32_t clampCount(std::size_t n) {
    return static_cast<std::uint32_t>(std::min<std::size_t>(n, std::numeric_limits<std::uint32_t>::max()));
}

/**
 * @class ComposerNode
 * @brief 把整块区域交给 FinderApp::drawFrame 绘制的 DOM 节点
 */
class ComposerNode : public Node {
public:
    explicit ComposerNode(FinderApp& app) : app_(app) {}

    void ComputeRequirement() override {
        requirement_.min_x = 1;
        requirement_.min_y = 1;
        requirement_.flex_grow_x = 1;
        requirement_.flex_grow_y = 1;
    }

    void Render(Screen& target) override {
        const screen::Rect area{box_.x_min, box_.y_min,
                                box_.x_max - box_.x_min + 1, box_.y_max - box_.y_min + 1};
        app_.drawFrame(target, area);
    }

private:
    FinderApp& app_;
};

} // anonymous namespace

FinderApp::FinderApp(screen::UiConfig config, screen::Theme theme, std::filesystem::path root,
                     std::optional<std::filesystem::path> listFile)
    : screen_(ScreenInteractive::Fullscreen())
    , composer_(std::move(config), std::move(theme), std::make_shared<screen::DefaultRowFormatter>())
    , root_(std::move(root))
    , listFile_(std::move(listFile)) {
    uiState_.previewHidden = composer_.config().previewHidden;
    if (listFile_) {
        sources_ = {SourceKind::LIST_FILE};
    } else {
        sources_ = {SourceKind::FILES, SourceKind::DIRECTORIES};
    }

    catalog_.setOnChange([this] {
        screen_.Post(Event::Custom);
    });
}

bool FinderApp::run() {
    startSource();
    auto mainComponent = createMainComponent();
    screen_.Loop(mainComponent);
    catalog_.stop();
    return acceptedFlag_;
}

void FinderApp::startSource() {
    const SourceKind kind = sources_[sourceIndex_];
    catalog_.start(kind == SourceKind::LIST_FILE ? *listFile_ : root_, kind);
    filteredVersion_ = std::numeric_limits<std::uint64_t>::max();
    uiState_.list = screen::ListState{};
}

void FinderApp::cycleSource() {
    if (sources_.size() <= 1) {
        return;
    }
    sourceIndex_ = (sourceIndex_ + 1) % sources_.size();
    selection_.clear();
    LOG() << "[Finder] Switching source to " << sourceName(sources_[sourceIndex_]);
    startSource();
}

void FinderApp::refilter() {
    const std::uint64_t version = catalog_.version();
    const std::string query = input_.value();
    if (version == filteredVersion_ && query == filteredQuery_) {
        return;
    }
    const bool query_changed = query != filteredQuery_;
    filtered_ = matcher_.match(catalog_.snapshot(), query);
    filteredVersion_ = version;
    filteredQuery_ = query;

    if (filtered_.empty()) {
        uiState_.list = screen::ListState{};
    } else if (query_changed || !uiState_.list.selected) {
        uiState_.list.offset = 0;
        uiState_.list.selected = 0;
    }
}

void FinderApp::onQueryChanged() {
    refilter();
}

std::filesystem::path FinderApp::entryPath(const screen::Entry& entry) const {
    if (sources_[sourceIndex_] == SourceKind::LIST_FILE) {
        return std::filesystem::path(entry.name);
    }
    return root_ / entry.name;
}

void FinderApp::updatePreview() {
    if (uiState_.previewHidden || !uiState_.list.selected || *uiState_.list.selected >= filtered_.size()) {
        previewFor_.reset();
        previewLines_.clear();
        return;
    }
    const screen::Entry& entry = filtered_[*uiState_.list.selected];
    if (previewFor_ && *previewFor_ == entry.name) {
        return;
    }
    previewFor_ = entry.name;
    previewLines_ = loadPreview(entryPath(entry), PREVIEW_LINES);
}

void FinderApp::accept() {
    accepted_.clear();
    if (!selection_.empty()) {
        accepted_.assign(selection_.names().begin(), selection_.names().end());
        std::sort(accepted_.begin(), accepted_.end());
    } else if (uiState_.list.selected && *uiState_.list.selected < filtered_.size()) {
        accepted_.push_back(filtered_[*uiState_.list.selected].name);
    }
    acceptedFlag_ = !accepted_.empty();
    screen_.Exit();
}

void FinderApp::drawFrame(ftxui::Screen& target, const screen::Rect& area) {
    refilter();
    updatePreview();

    screen::FrameModel model(input_, filtered_, selection_);
    model.resultsCount = clampCount(filtered_.size());
    model.totalCount = clampCount(catalog_.size());
    model.matcherRunning = catalog_.scanning();
    model.spinnerFrame = spinner_.frame();
    model.sourceIndex = sourceIndex_;
    model.sourceCount = sources_.size();
    if (sources_.size() > 1) {
        model.cycleKey = CYCLE_SOURCES_KEY;
    }
    model.previewLines = previewLines_;
    model.previewTitle = previewFor_.value_or("");

    const screen::DrawReport report = composer_.draw(target, area, model, uiState_);
    if (report.failedPanels > 0) {
        LOG() << "[Finder] " << report.failedPanels << " panel(s) failed to draw";
    }
}

bool FinderApp::handleEvent(const Event& event) {
    const bool bottom_up = composer_.config().inputPosition == screen::InputPosition::BOTTOM;
    const std::size_t count = filtered_.size();

    if (event == Event::Custom) {
        if (catalog_.scanning()) {
            spinner_.tick();
        }
        return false;
    }
    if (event == Event::Escape) {
        screen_.Exit();
        return true;
    }
    if (event == Event::Return) {
        accept();
        return true;
    }
    // 列表自下而上排列时，向上是排名更低的条目
    if (event == Event::ArrowUp) {
        if (bottom_up) {
            uiState_.list.selectNext(count);
        } else {
            uiState_.list.selectPrevious(count);
        }
        return true;
    }
    if (event == Event::ArrowDown) {
        if (bottom_up) {
            uiState_.list.selectPrevious(count);
        } else {
            uiState_.list.selectNext(count);
        }
        return true;
    }
    if (event == Event::Tab) {
        if (uiState_.list.selected && *uiState_.list.selected < count) {
            selection_.toggle(filtered_[*uiState_.list.selected]);
            uiState_.list.selectNext(count);
        }
        return true;
    }
    if (event == TOGGLE_PREVIEW) {
        uiState_.previewHidden = !uiState_.previewHidden;
        return true;
    }
    if (event == CYCLE_SOURCES) {
        cycleSource();
        return true;
    }

    // 文本编辑
    if (event == Event::Backspace) {
        if (input_.backspace()) onQueryChanged();
        return true;
    }
    if (event == Event::Delete) {
        if (input_.deleteForward()) onQueryChanged();
        return true;
    }
    if (event == Event::ArrowLeft) {
        input_.moveLeft();
        return true;
    }
    if (event == Event::ArrowRight) {
        input_.moveRight();
        return true;
    }
    if (event == Event::Home) {
        input_.moveHome();
        return true;
    }
    if (event == Event::End) {
        input_.moveEnd();
        return true;
    }
    if (event.is_character()) {
        input_.insert(event.character());
        onQueryChanged();
        return true;
    }
    return false;
}

Component FinderApp::createMainComponent() {
    auto body = Renderer([this] {
        return std::make_shared<ComposerNode>(*this);
    });
    return CatchEvent(body, [this](Event event) {
        return handleEvent(event);
    });
}

} // namespace finder::app
