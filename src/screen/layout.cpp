/**
 * @file layout.cpp
 * @brief 屏幕区域规划实现
 */

#include "screen/layout.hpp"
#include <algorithm>

namespace finder::screen {

LayoutPlan planMergedLayout(InputPosition position, bool previewHidden) {
    LayoutPlan plan;
    if (previewHidden) {
        plan.constraints.push_back(Constraint::fill(1));
        plan.resultsIndex = 0;
    } else if (position == InputPosition::TOP) {
        // 合并面板在上，预览在下
        plan.constraints = {Constraint::fill(1), Constraint::fill(1)};
        plan.resultsIndex = 0;
        plan.previewIndex = 1;
    } else {
        plan.constraints = {Constraint::fill(1), Constraint::fill(1)};
        plan.previewIndex = 0;
        plan.resultsIndex = 1;
    }
    plan.inputIndex = plan.resultsIndex;
    return plan;
}

LayoutPlan planStackedLayout(InputPosition position, bool previewHidden, int inputHeight, int previewPercent) {
    LayoutPlan plan;
    const Constraint input = Constraint::fixedLength(std::max(inputHeight, 0));
    const Constraint results = Constraint::fill(1);
    const Constraint preview = Constraint::percentage(std::clamp(previewPercent, 0, 100));

    if (position == InputPosition::TOP) {
        plan.constraints = {input, results};
        plan.inputIndex = 0;
        plan.resultsIndex = 1;
        if (!previewHidden) {
            plan.constraints.push_back(preview);
            plan.previewIndex = 2;
        }
    } else {
        if (!previewHidden) {
            plan.constraints.push_back(preview);
            plan.previewIndex = 0;
        }
        plan.resultsIndex = plan.constraints.size();
        plan.constraints.push_back(results);
        plan.inputIndex = plan.constraints.size();
        plan.constraints.push_back(input);
    }
    return plan;
}

namespace {

/// 在一列内放置输入栏与结果列表（横屏左列，或竖屏无预览时的整屏）
ScreenLayout layoutColumn(const LayoutConfig& config, const Rect& column) {
    ScreenLayout layout;
    if (config.mergeInputAndResults) {
        layout.input = column;
        layout.results = column;
        layout.merged = true;
        return layout;
    }
    LayoutPlan plan = planStackedLayout(config.inputPosition, true, config.inputHeight, 0);
    auto chunks = split(Direction::VERTICAL, plan.constraints, column);
    layout.input = chunks[plan.inputIndex];
    layout.results = chunks[plan.resultsIndex];
    return layout;
}

} // anonymous namespace

ScreenLayout computeScreenLayout(const LayoutConfig& config, const Rect& area) {
    if (config.orientation == Orientation::LANDSCAPE) {
        if (config.previewHidden) {
            return layoutColumn(config, area);
        }
        auto chunks = split(Direction::HORIZONTAL,
                            {Constraint::fill(1), Constraint::percentage(config.previewSize)}, area);
        ScreenLayout layout = layoutColumn(config, chunks[0]);
        layout.preview = chunks[1];
        return layout;
    }

    ScreenLayout layout;
    if (config.mergeInputAndResults) {
        LayoutPlan plan = planMergedLayout(config.inputPosition, config.previewHidden);
        auto chunks = split(Direction::VERTICAL, plan.constraints, area);
        layout.input = chunks[plan.inputIndex];
        layout.results = chunks[plan.resultsIndex];
        if (plan.previewIndex) {
            layout.preview = chunks[*plan.previewIndex];
        }
        layout.merged = true;
        return layout;
    }

    LayoutPlan plan = planStackedLayout(config.inputPosition, config.previewHidden,
                                        config.inputHeight, config.previewSize);
    auto chunks = split(Direction::VERTICAL, plan.constraints, area);
    layout.input = chunks[plan.inputIndex];
    layout.results = chunks[plan.resultsIndex];
    if (plan.previewIndex) {
        layout.preview = chunks[*plan.previewIndex];
    }
    return layout;
}

} // namespace finder::screen
