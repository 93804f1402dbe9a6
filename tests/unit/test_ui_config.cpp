/**
 * @file test_ui_config.cpp
 * @brief 界面配置与配色读取测试
 */

#include <catch2/catch.hpp>
#include "base/config.hpp"
#include "screen/theme.hpp"
#include "screen/ui_config.hpp"
#include "temp_config_file.hpp"

using namespace finder;
using namespace finder::screen;

TEST_CASE("parsePadding - single value and four sides", "[ui_config]") {
    REQUIRE(parsePadding("2") == std::optional<Padding>(Padding::uniform(2)));
    REQUIRE(parsePadding("1, 2,3 ,4") == std::optional<Padding>(Padding{1, 2, 3, 4}));
    REQUIRE_FALSE(parsePadding("1,2").has_value());
    REQUIRE_FALSE(parsePadding("-1").has_value());
    REQUIRE_FALSE(parsePadding("a").has_value());
    REQUIRE_FALSE(parsePadding("").has_value());
    REQUIRE_FALSE(parsePadding("99999999").has_value());
}

TEST_CASE("loadUiConfig - defaults", "[ui_config]") {
    Config::instance().clear();
    UiConfig ui = loadUiConfig(Config::instance());

    REQUIRE(ui.inputPosition == InputPosition::TOP);
    REQUIRE(ui.orientation == Orientation::PORTRAIT);
    REQUIRE_FALSE(ui.mergeInputAndResults);
    REQUIRE_FALSE(ui.fuseBorders);
    REQUIRE_FALSE(ui.previewHidden);
    REQUIRE(ui.previewSize == 50);
    REQUIRE(ui.input.border == BorderStyle::ROUNDED);
    REQUIRE(ui.results.header.kind() == HeaderSpec::Kind::USE_DEFAULT);
    REQUIRE_FALSE(ui.prompt.has_value());
    REQUIRE(ui.channelName == "files");
}

TEST_CASE("loadUiConfig - reads every key", "[ui_config]") {
    TempConfigFile file(
        "[ui]\n"
        "input_position = bottom\n"
        "orientation = landscape\n"
        "merge_input_and_results = yes\n"
        "fuse_borders = true\n"
        "preview_hidden = on\n"
        "preview_size = 30\n"
        "input_border = double\n"
        "results_border = none\n"
        "preview_border = thick\n"
        "input_padding = 1\n"
        "results_padding = 0,0,2,2\n"
        "prompt = $\n"
        "channel = git-files\n"
    );
    Config::instance().load(file.path());
    UiConfig ui = loadUiConfig(Config::instance());

    REQUIRE(ui.inputPosition == InputPosition::BOTTOM);
    REQUIRE(ui.orientation == Orientation::LANDSCAPE);
    REQUIRE(ui.mergeInputAndResults);
    REQUIRE(ui.fuseBorders);
    REQUIRE(ui.previewHidden);
    REQUIRE(ui.previewSize == 30);
    REQUIRE(ui.input.border == BorderStyle::DOUBLE);
    REQUIRE(ui.results.border == BorderStyle::NONE);
    REQUIRE(ui.preview.border == BorderStyle::THICK);
    REQUIRE(ui.input.padding == Padding::uniform(1));
    REQUIRE(ui.results.padding == Padding{0, 0, 2, 2});
    REQUIRE(ui.prompt == std::optional<std::string>("$"));
    REQUIRE(ui.channelName == "git-files");
}

TEST_CASE("loadUiConfig - header tri-state", "[ui_config]") {
    TempConfigFile file(
        "[ui]\n"
        "input_header = \"\"\n"
        "results_header = Matches\n"
    );
    Config::instance().load(file.path());
    UiConfig ui = loadUiConfig(Config::instance());

    REQUIRE(ui.input.header == HeaderSpec::hidden());
    REQUIRE(ui.results.header == HeaderSpec::custom("Matches"));
    REQUIRE(ui.preview.header == HeaderSpec::useDefault());
}

TEST_CASE("loadUiConfig - unknown values keep defaults", "[ui_config]") {
    TempConfigFile file(
        "[ui]\n"
        "input_position = middle\n"
        "orientation = sideways\n"
        "preview_size = 150\n"
        "input_border = dotted\n"
        "input_padding = 1,2\n"
    );
    Config::instance().load(file.path());
    UiConfig ui = loadUiConfig(Config::instance());

    REQUIRE(ui.inputPosition == InputPosition::TOP);
    REQUIRE(ui.orientation == Orientation::PORTRAIT);
    REQUIRE(ui.previewSize == 50);
    REQUIRE(ui.input.border == BorderStyle::ROUNDED);
    REQUIRE(ui.input.padding.isZero());
}

TEST_CASE("parseColor - names and hex", "[theme]") {
    REQUIRE(parseColor("red") == std::optional<ftxui::Color>(ftxui::Color::Red));
    REQUIRE(parseColor("Cyan") == std::optional<ftxui::Color>(ftxui::Color::Cyan));
    REQUIRE(parseColor("#FF8000") == std::optional<ftxui::Color>(ftxui::Color::RGB(255, 128, 0)));
    REQUIRE_FALSE(parseColor("#12345").has_value());
    REQUIRE_FALSE(parseColor("#zz0000").has_value());
    REQUIRE_FALSE(parseColor("mauve").has_value());
}

TEST_CASE("loadTheme - overrides and fallbacks", "[theme]") {
    TempConfigFile file(
        "[theme]\n"
        "border = blue\n"
        "title = #00ff00\n"
        "highlight = nonsense\n"
    );
    Config::instance().load(file.path());
    Theme theme = loadTheme(Config::instance());

    REQUIRE(theme.border == ftxui::Color(ftxui::Color::Blue));
    REQUIRE(theme.title == ftxui::Color::RGB(0, 255, 0));
    REQUIRE(theme.highlight == Theme().highlight);
    REQUIRE(theme.selection == Theme().selection);
}
