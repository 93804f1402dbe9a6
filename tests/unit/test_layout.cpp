/**
 * @file test_layout.cpp
 * @brief 整屏布局规划测试
 */

#include <catch2/catch.hpp>
#include <rapidcheck.h>
#include <rapidcheck/catch.h>
#include "screen/layout.hpp"
#include <algorithm>

using namespace finder::screen;

namespace {

/// 按 y 排序后检查区域在竖直方向首尾相接，宽度与所在列一致
bool tilesColumn(std::vector<Rect> rects, const Rect& column) {
    std::sort(rects.begin(), rects.end(), [](const Rect& a, const Rect& b) { return a.y < b.y; });
    int y = column.y;
    for (const auto& r : rects) {
        if (r.y != y || r.x != column.x || r.width != column.width || r.height < 0) {
            return false;
        }
        y += r.height;
    }
    return y == column.bottom();
}

} // anonymous namespace

TEST_CASE("planMergedLayout - input top with preview", "[layout]") {
    LayoutPlan plan = planMergedLayout(InputPosition::TOP, false);
    REQUIRE(plan.constraints.size() == 2);
    REQUIRE(plan.resultsIndex == 0);
    REQUIRE(plan.inputIndex == 0);
    REQUIRE(plan.previewIndex == std::optional<std::size_t>(1));
}

TEST_CASE("planMergedLayout - input bottom puts preview first", "[layout]") {
    LayoutPlan plan = planMergedLayout(InputPosition::BOTTOM, false);
    REQUIRE(plan.previewIndex == std::optional<std::size_t>(0));
    REQUIRE(plan.resultsIndex == 1);
}

TEST_CASE("planMergedLayout - preview hidden", "[layout]") {
    LayoutPlan plan = planMergedLayout(InputPosition::TOP, true);
    REQUIRE(plan.constraints.size() == 1);
    REQUIRE_FALSE(plan.previewIndex.has_value());
}

TEST_CASE("planStackedLayout - input bottom order", "[layout]") {
    LayoutPlan plan = planStackedLayout(InputPosition::BOTTOM, false, 3, 40);
    REQUIRE(plan.constraints.size() == 3);
    REQUIRE(plan.previewIndex == std::optional<std::size_t>(0));
    REQUIRE(plan.resultsIndex == 1);
    REQUIRE(plan.inputIndex == 2);
    REQUIRE(plan.constraints[2] == Constraint::fixedLength(3));
    REQUIRE(plan.constraints[0] == Constraint::percentage(40));
}

TEST_CASE("computeScreenLayout - merged top with preview", "[layout]") {
    LayoutConfig config;
    config.mergeInputAndResults = true;
    ScreenLayout layout = computeScreenLayout(config, Rect{0, 0, 80, 24});

    REQUIRE(layout.merged);
    REQUIRE(layout.input == layout.results);
    REQUIRE(layout.results == Rect{0, 0, 80, 12});
    REQUIRE(layout.preview.has_value());
    REQUIRE(*layout.preview == Rect{0, 12, 80, 12});
}

TEST_CASE("computeScreenLayout - stacked top", "[layout]") {
    LayoutConfig config;
    config.previewHidden = true;
    config.inputHeight = 3;
    ScreenLayout layout = computeScreenLayout(config, Rect{0, 0, 40, 20});

    REQUIRE_FALSE(layout.merged);
    REQUIRE(layout.input == Rect{0, 0, 40, 3});
    REQUIRE(layout.results == Rect{0, 3, 40, 17});
    REQUIRE_FALSE(layout.preview.has_value());
}

TEST_CASE("computeScreenLayout - landscape puts preview on the right", "[layout]") {
    LayoutConfig config;
    config.orientation = Orientation::LANDSCAPE;
    config.previewSize = 25;
    ScreenLayout layout = computeScreenLayout(config, Rect{0, 0, 100, 30});

    REQUIRE(layout.preview.has_value());
    REQUIRE(*layout.preview == Rect{75, 0, 25, 30});
    REQUIRE(layout.input == Rect{0, 0, 75, 3});
    REQUIRE(layout.results == Rect{0, 3, 75, 27});
}

TEST_CASE("computeScreenLayout - regions tile the screen", "[layout][property]") {
    rc::prop("任意配置下各区域无缝隙无重叠地铺满屏幕",
        []() {
            LayoutConfig config;
            config.inputPosition = *rc::gen::element(InputPosition::TOP, InputPosition::BOTTOM);
            config.orientation = *rc::gen::element(Orientation::PORTRAIT, Orientation::LANDSCAPE);
            config.mergeInputAndResults = *rc::gen::arbitrary<bool>();
            config.previewHidden = *rc::gen::arbitrary<bool>();
            config.previewSize = *rc::gen::inRange(0, 101);
            config.inputHeight = *rc::gen::inRange(0, 12);
            const Rect area{*rc::gen::inRange(0, 10), *rc::gen::inRange(0, 10),
                            *rc::gen::inRange(0, 200), *rc::gen::inRange(0, 80)};

            ScreenLayout layout = computeScreenLayout(config, area);
            RC_ASSERT(layout.preview.has_value() == !config.previewHidden);

            std::vector<Rect> column;
            if (layout.merged) {
                RC_ASSERT(layout.input == layout.results);
                column.push_back(layout.results);
            } else {
                column.push_back(layout.input);
                column.push_back(layout.results);
            }

            if (config.orientation == Orientation::LANDSCAPE && layout.preview) {
                const Rect left{area.x, area.y, layout.preview->x - area.x, area.height};
                RC_ASSERT(layout.preview->right() == area.right());
                RC_ASSERT(layout.preview->y == area.y);
                RC_ASSERT(layout.preview->height == area.height);
                RC_ASSERT(tilesColumn(column, left));
            } else {
                if (layout.preview) {
                    column.push_back(*layout.preview);
                }
                RC_ASSERT(tilesColumn(column, area));
            }
        });
}
