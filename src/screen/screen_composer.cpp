/**
 * @file screen_composer.cpp
 * @brief 整屏合成实现
 */

#include "screen/screen_composer.hpp"
#include "base/logger.hpp"
#include "screen/input_row.hpp"
#include "screen/merged_panel.hpp"
#include "screen/preview_panel.hpp"
#include "screen/shared_border.hpp"
#include <utility>

namespace finder::screen {

namespace {

/**
 * @brief 绘制单个面板，数值溢出只影响该面板
 */
template <typename Fn>
void drawGuarded(const char* panel, DrawReport& report, Fn&& fn) {
    try {
        fn();
    } catch (const NumericConversionError& e) {
        LOG() << "[Screen] " << panel << " panel skipped this frame: " << e.what();
        ++report.failedPanels;
    }
}

} // anonymous namespace

ScreenComposer::ScreenComposer(UiConfig config, Theme theme, std::shared_ptr<RowFormatter> formatter)
    : config_(std::move(config)), theme_(std::move(theme)), formatter_(std::move(formatter)) {
    if (!formatter_) {
        formatter_ = std::make_shared<DefaultRowFormatter>();
    }
}

bool ScreenComposer::fused() const {
    return config_.fuseBorders && !config_.mergeInputAndResults &&
           borderGlyphs(config_.input.border) != nullptr &&
           borderGlyphs(config_.results.border) != nullptr;
}

int ScreenComposer::inputHeight() const {
    InputPanelSpec spec;
    spec.style = config_.input.border;
    spec.padding = config_.input.padding;
    spec.header = config_.input.header;
    spec.channelName = config_.channelName;
    spec.position = config_.inputPosition;
    spec.fusedWithResults = fused();
    return inputPanelHeight(spec);
}

InputRowModel ScreenComposer::inputRowModel(const FrameModel& model) const {
    InputRowModel row;
    row.prompt = config_.prompt;
    row.resultsCount = model.resultsCount;
    row.totalCount = model.totalCount;
    row.matcherRunning = model.matcherRunning;
    row.spinnerFrame = model.spinnerFrame;
    return row;
}

DrawReport ScreenComposer::draw(ftxui::Screen& screen, const Rect& area, const FrameModel& model, UiState& state) {
    LayoutConfig layout_config;
    layout_config.inputPosition = config_.inputPosition;
    layout_config.orientation = config_.orientation;
    layout_config.mergeInputAndResults = config_.mergeInputAndResults;
    layout_config.previewHidden = state.previewHidden;
    layout_config.previewSize = config_.previewSize;
    layout_config.inputHeight = inputHeight();

    DrawReport report;
    report.layout = computeScreenLayout(layout_config, area);

    if (report.layout.merged) {
        drawMerged(screen, report.layout, model, state, report);
    } else {
        drawStacked(screen, report.layout, model, state, report);
    }
    if (report.layout.preview) {
        drawPreview(screen, *report.layout.preview, model, report);
    }

    if (report.cursor) {
        screen.SetCursor(ftxui::Screen::Cursor{report.cursor->x, report.cursor->y,
                                               ftxui::Screen::Cursor::Bar});
    }
    return report;
}

void ScreenComposer::drawMerged(ftxui::Screen& screen, const ScreenLayout& layout, const FrameModel& model,
                                UiState& state, DrawReport& report) {
    MergedPanelSpec spec;
    spec.style = config_.input.border;
    spec.inputHeader = config_.input.header;
    spec.channelName = config_.channelName;
    spec.inputPadding = config_.input.padding;
    spec.resultsPadding = config_.results.padding;
    spec.position = config_.inputPosition;

    drawGuarded("merged", report, [&] {
        report.cursor = drawMergedPanel(screen, layout.input, spec, model.input(), inputRowModel(model),
                                        model.entries(), model.selection(), state.list, *formatter_, theme_);
    });
}

void ScreenComposer::drawStacked(ftxui::Screen& screen, const ScreenLayout& layout, const FrameModel& model,
                                 UiState& state, DrawReport& report) {
    const bool fuse = fused();

    drawGuarded("results", report, [&] {
        ResultsChrome chrome;
        chrome.kind = ResultsChromeKind::FRAMED;
        chrome.style = config_.results.border;
        chrome.padding = config_.results.padding;
        chrome.direction = listDirectionFor(config_.inputPosition);
        if (!fuse) {
            chrome.title = resultsTitle(config_.results.header, model.sourceIndex, model.sourceCount,
                                        model.cycleKey, theme_);
        }
        const Rect inner = drawResultsList(screen, layout.results, model.entries(), model.selection(),
                                           state.list, chrome, *formatter_, theme_);
        // 结果面板未绘制时接合线没有可依附的外框
        if (fuse && !inner.empty()) {
            auto label = resultsLabel(config_.results.header, model.sourceIndex, model.sourceCount,
                                      model.cycleKey, layout.results.width - 2);
            paintSharedBorder(screen, layout.results, config_.inputPosition, config_.results.border,
                              label, theme_);
        }
    });

    drawGuarded("input", report, [&] {
        InputPanelSpec spec;
        spec.style = config_.input.border;
        spec.padding = config_.input.padding;
        spec.header = config_.input.header;
        spec.channelName = config_.channelName;
        spec.position = config_.inputPosition;
        spec.fusedWithResults = fuse;
        report.cursor = drawInputPanel(screen, layout.input, spec, model.input(), inputRowModel(model), theme_);
    });
}

void ScreenComposer::drawPreview(ftxui::Screen& screen, const Rect& rect, const FrameModel& model,
                                 DrawReport& report) {
    PreviewPanelSpec spec;
    spec.style = config_.preview.border;
    spec.padding = config_.preview.padding;
    spec.header = config_.preview.header;

    drawGuarded("preview", report, [&] {
        drawPreviewPanel(screen, rect, spec, model.previewTitle, model.previewLines, theme_);
    });
}

} // namespace finder::screen
