/**
 * @file test_merged_panel.cpp
 * @brief 合并面板测试
 */

#include <catch2/catch.hpp>
#include "screen/merged_panel.hpp"

using namespace finder::screen;

namespace {

std::string repeat(const std::string& glyph, int n) {
    std::string out;
    for (int i = 0; i < n; ++i) {
        out += glyph;
    }
    return out;
}

struct MergedFixture {
    std::vector<Entry> entries{Entry("one"), Entry("two")};
    SelectionSet selection;
    ListState list;
    DefaultRowFormatter formatter;
    Theme theme;
    InputRowModel model;
    MergedPanelSpec spec;

    MergedFixture() {
        spec.style = BorderStyle::ROUNDED;
        spec.channelName = "files";
        list.selected = 0;
        model.resultsCount = 2;
        model.totalCount = 2;
    }
};

} // anonymous namespace

TEST_CASE("layoutMergedPanel - input on top", "[merged_panel]") {
    MergedPanelLayout layout = layoutMergedPanel(Rect{1, 1, 28, 6}, Padding(), InputPosition::TOP);
    REQUIRE(layout.inputRow == Rect{1, 1, 28, 1});
    REQUIRE(layout.separator == Rect{1, 2, 28, 1});
    REQUIRE(layout.results == Rect{1, 3, 28, 4});
}

TEST_CASE("layoutMergedPanel - input at bottom with padding", "[merged_panel]") {
    MergedPanelLayout layout = layoutMergedPanel(Rect{0, 0, 10, 10}, Padding{1, 1, 0, 0},
                                                 InputPosition::BOTTOM);
    REQUIRE(layout.results == Rect{0, 0, 10, 6});
    REQUIRE(layout.separator == Rect{0, 6, 10, 1});
    REQUIRE(layout.inputRow == Rect{0, 7, 10, 3});
}

TEST_CASE("drawMergedPanel - input on top", "[merged_panel]") {
    MergedFixture f;
    ftxui::Screen screen(30, 8);

    auto cursor = drawMergedPanel(screen, Rect{0, 0, 30, 8}, f.spec, InputState(), f.model, f.entries,
                                  f.selection, f.list, f.formatter, f.theme);

    REQUIRE(readRow(screen, 0, 0, 30) == "╭────────── files ───────────╮");
    REQUIRE(readRow(screen, 0, 1, 3) == "│> ");
    REQUIRE(readRow(screen, 0, 2, 30) == "│" + repeat("─", 28) + "│");
    REQUIRE(readRow(screen, 1, 3, 5) == "> one");
    REQUIRE(readRow(screen, 1, 4, 5) == "  two");
    REQUIRE(readRow(screen, 0, 7, 30) == "╰────────────────────────────╯");

    REQUIRE(cursor.has_value());
    REQUIRE(*cursor == CursorPosition{3, 1});
}

TEST_CASE("drawMergedPanel - input at bottom reverses the list", "[merged_panel]") {
    MergedFixture f;
    f.spec.position = InputPosition::BOTTOM;
    ftxui::Screen screen(30, 8);

    auto cursor = drawMergedPanel(screen, Rect{0, 0, 30, 8}, f.spec, InputState("o"), f.model, f.entries,
                                  f.selection, f.list, f.formatter, f.theme);

    REQUIRE(readRow(screen, 0, 7, 30) == "╰────────── files ───────────╯");
    REQUIRE(readRow(screen, 1, 4, 5) == "> one");
    REQUIRE(readRow(screen, 1, 3, 5) == "  two");
    REQUIRE(readRow(screen, 1, 6, 3) == "> o");
    REQUIRE(*cursor == CursorPosition{4, 6});
}

TEST_CASE("drawMergedPanel - custom and hidden header", "[merged_panel]") {
    MergedFixture f;
    ftxui::Screen screen(12, 5);

    f.spec.inputHeader = HeaderSpec::custom("Go");
    drawMergedPanel(screen, Rect{0, 0, 12, 5}, f.spec, InputState(), f.model, f.entries, f.selection,
                    f.list, f.formatter, f.theme);
    REQUIRE(readRow(screen, 0, 0, 12) == "╭─── Go ───╮");

    f.spec.inputHeader = HeaderSpec::hidden();
    drawMergedPanel(screen, Rect{0, 0, 12, 5}, f.spec, InputState(), f.model, f.entries, f.selection,
                    f.list, f.formatter, f.theme);
    REQUIRE(readRow(screen, 0, 0, 12) == "╭──────────╮");
}

TEST_CASE("drawMergedPanel - separator without border style", "[merged_panel]") {
    MergedFixture f;
    f.spec.style = BorderStyle::NONE;
    f.spec.inputHeader = HeaderSpec::hidden();
    ftxui::Screen screen(6, 4);

    drawMergedPanel(screen, Rect{0, 0, 6, 4}, f.spec, InputState(), f.model, f.entries, f.selection,
                    f.list, f.formatter, f.theme);

    REQUIRE(readRow(screen, 0, 1, 6) == "──────");
}

TEST_CASE("drawMergedPanel - degenerate area", "[merged_panel]") {
    MergedFixture f;
    ftxui::Screen screen(4, 4);

    auto cursor = drawMergedPanel(screen, Rect{0, 0, 2, 4}, f.spec, InputState(), f.model, f.entries,
                                  f.selection, f.list, f.formatter, f.theme);

    REQUIRE_FALSE(cursor.has_value());
    REQUIRE(readRow(screen, 0, 0, 4) == "    ");
}

TEST_CASE("drawMergedPanel - input padding swallows the row", "[merged_panel]") {
    MergedFixture f;
    f.spec.inputPadding = Padding{0, 0, 20, 20};
    ftxui::Screen screen(20, 6);

    auto cursor = drawMergedPanel(screen, Rect{0, 0, 20, 6}, f.spec, InputState(), f.model, f.entries,
                                  f.selection, f.list, f.formatter, f.theme);

    REQUIRE_FALSE(cursor.has_value());
    REQUIRE(readRow(screen, 1, 3, 5) == "     ");
}
