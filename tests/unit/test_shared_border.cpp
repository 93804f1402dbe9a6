/**
 * @file test_shared_border.cpp
 * @brief 共享边框测试
 */

#include <catch2/catch.hpp>
#include <rapidcheck.h>
#include <rapidcheck/catch.h>
#include "screen/shared_border.hpp"
#include "screen/panel_frame.hpp"

using namespace finder::screen;

namespace {

std::string join(const SharedBorderLine& line) {
    std::string out;
    for (const auto& cell : line.cells) {
        out += cell;
    }
    return out;
}

} // anonymous namespace

TEST_CASE("composeSharedBorder - centered label", "[shared_border]") {
    auto line = composeSharedBorder(*borderGlyphs(BorderStyle::ROUNDED), 20, std::string("Files"));
    REQUIRE(line.cells.size() == 20);
    REQUIRE(join(line) == "├───── Files ──────┤");
    REQUIRE(line.labelBegin == 6);
    REQUIRE(line.labelEnd == 13);
}

TEST_CASE("composeSharedBorder - label wider than interior falls back to plain rule", "[shared_border]") {
    auto line = composeSharedBorder(*borderGlyphs(BorderStyle::DOUBLE), 8, std::string("Results"));
    REQUIRE(join(line) == "╠══════╣");
    REQUIRE(line.labelBegin == line.labelEnd);
}

TEST_CASE("composeSharedBorder - wide characters are measured in cells", "[shared_border]") {
    auto line = composeSharedBorder(*borderGlyphs(BorderStyle::PLAIN), 20, std::string("文件"));
    REQUIRE(line.cells.size() == 20);
    REQUIRE(line.labelBegin == 7);
    REQUIRE(line.labelEnd == 13);
    REQUIRE(join(line) == "├────── 文件 ──────┤");
}

TEST_CASE("composeSharedBorder - no label", "[shared_border]") {
    auto line = composeSharedBorder(*borderGlyphs(BorderStyle::THICK), 5, std::nullopt);
    REQUIRE(join(line) == "┣━━━┫");
    auto empty_label = composeSharedBorder(*borderGlyphs(BorderStyle::PLAIN), 4, std::string());
    REQUIRE(join(empty_label) == "├──┤");
}

TEST_CASE("composeSharedBorder - too narrow", "[shared_border]") {
    REQUIRE(composeSharedBorder(*borderGlyphs(BorderStyle::PLAIN), 1, std::nullopt).cells.empty());
    REQUIRE(join(composeSharedBorder(*borderGlyphs(BorderStyle::PLAIN), 2, std::string("x"))) == "├┤");
}

TEST_CASE("composeSharedBorder - line width equals target width", "[shared_border][property]") {
    rc::prop("四种有字形的样式下组合行长度恰为目标宽度",
        []() {
            const auto style = *rc::gen::element(BorderStyle::PLAIN, BorderStyle::ROUNDED,
                                                 BorderStyle::DOUBLE, BorderStyle::THICK);
            const int width = *rc::gen::inRange(2, 300);
            const auto label = *rc::gen::container<std::string>(rc::gen::inRange('A', 'z'));

            auto line = composeSharedBorder(*borderGlyphs(style), width, label);
            RC_ASSERT(static_cast<int>(line.cells.size()) == width);
            RC_ASSERT(line.cells.front() == std::string(borderGlyphs(style)->teeLeft));
            RC_ASSERT(line.cells.back() == std::string(borderGlyphs(style)->teeRight));
            RC_ASSERT(line.labelBegin >= 0);
            RC_ASSERT(line.labelEnd <= width - 1);
        });
}

TEST_CASE("sharedBorderRow - edge facing the input", "[shared_border]") {
    Rect frame{0, 3, 10, 5};
    REQUIRE(sharedBorderRow(frame, InputPosition::TOP) == 3);
    REQUIRE(sharedBorderRow(frame, InputPosition::BOTTOM) == 7);
}

TEST_CASE("paintSharedBorder - rewrites the results frame edge", "[shared_border]") {
    ftxui::Screen screen(20, 4);
    Theme theme;
    FrameSpec frame;
    frame.style = BorderStyle::ROUNDED;
    drawPanelFrame(screen, Rect{0, 0, 20, 4}, frame);

    REQUIRE(paintSharedBorder(screen, Rect{0, 0, 20, 4}, InputPosition::TOP, BorderStyle::ROUNDED,
                              std::string("Files"), theme));

    REQUIRE(readRow(screen, 0, 0, 20) == "├───── Files ──────┤");
    REQUIRE(readRow(screen, 0, 3, 20) == "╰──────────────────╯");
    REQUIRE(screen.PixelAt(7, 0).bold);
    REQUIRE(screen.PixelAt(7, 0).foreground_color == theme.title);
    REQUIRE(screen.PixelAt(0, 0).foreground_color == theme.border);
}

TEST_CASE("paintSharedBorder - input at bottom uses the bottom edge", "[shared_border]") {
    ftxui::Screen screen(10, 3);
    REQUIRE(paintSharedBorder(screen, Rect{0, 0, 10, 3}, InputPosition::BOTTOM, BorderStyle::PLAIN,
                              std::nullopt, Theme()));
    REQUIRE(readRow(screen, 0, 2, 10) == "├────────┤");
    REQUIRE(readRow(screen, 0, 0, 10) == "          ");
}

TEST_CASE("paintSharedBorder - identical calls give identical output", "[shared_border]") {
    ftxui::Screen first(16, 2);
    ftxui::Screen second(16, 2);
    for (int i = 0; i < 2; ++i) {
        paintSharedBorder(first, Rect{0, 0, 16, 2}, InputPosition::TOP, BorderStyle::DOUBLE,
                          std::string("Hits"), Theme());
    }
    paintSharedBorder(second, Rect{0, 0, 16, 2}, InputPosition::TOP, BorderStyle::DOUBLE,
                      std::string("Hits"), Theme());
    REQUIRE(readRow(first, 0, 0, 16) == readRow(second, 0, 0, 16));
    REQUIRE(readRow(first, 0, 0, 16) == "╠════ Hits ════╣");
}

TEST_CASE("paintSharedBorder - skipped without glyphs or width", "[shared_border]") {
    ftxui::Screen screen(4, 2);
    REQUIRE_FALSE(paintSharedBorder(screen, Rect{0, 0, 4, 2}, InputPosition::TOP, BorderStyle::NONE,
                                    std::string("x"), Theme()));
    REQUIRE_FALSE(paintSharedBorder(screen, Rect{0, 0, 1, 2}, InputPosition::TOP, BorderStyle::PLAIN,
                                    std::nullopt, Theme()));
    REQUIRE(readRow(screen, 0, 0, 4) == "    ");
}
