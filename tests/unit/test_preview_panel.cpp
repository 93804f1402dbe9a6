/**
 * @file test_preview_panel.cpp
 * @brief 预览面板测试
 */

#include <catch2/catch.hpp>
#include "screen/preview_panel.hpp"

using namespace finder::screen;

TEST_CASE("drawPreviewPanel - title falls back to the highlighted entry", "[preview_panel]") {
    ftxui::Screen screen(14, 4);
    PreviewPanelSpec spec;

    Rect inner = drawPreviewPanel(screen, Rect{0, 0, 14, 4}, spec, "a.txt", {"one", "two", "three"}, Theme());

    REQUIRE(inner == Rect{1, 1, 12, 2});
    REQUIRE(readRow(screen, 0, 0, 14) == "╭── a.txt ───╮");
    REQUIRE(readRow(screen, 1, 1, 3) == "one");
    REQUIRE(readRow(screen, 1, 2, 3) == "two");
    REQUIRE(readRow(screen, 0, 3, 14) == "╰────────────╯");
}

TEST_CASE("drawPreviewPanel - nothing highlighted draws no title", "[preview_panel]") {
    ftxui::Screen screen(12, 3);
    PreviewPanelSpec spec;

    drawPreviewPanel(screen, Rect{0, 0, 12, 3}, spec, "", {}, Theme());

    REQUIRE(readRow(screen, 0, 0, 12) == "╭──────────╮");
}

TEST_CASE("drawPreviewPanel - custom header wins over the entry name", "[preview_panel]") {
    ftxui::Screen screen(12, 3);
    PreviewPanelSpec spec;
    spec.style = BorderStyle::PLAIN;
    spec.header = HeaderSpec::custom("P");

    drawPreviewPanel(screen, Rect{0, 0, 12, 3}, spec, "a.txt", {}, Theme());

    REQUIRE(readRow(screen, 0, 0, 12) == "┌─── P ────┐");
}
