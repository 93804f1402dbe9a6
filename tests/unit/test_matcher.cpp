/**
 * @file test_matcher.cpp
 * @brief 子串匹配器测试
 */

#include <catch2/catch.hpp>
#include <rapidcheck.h>
#include <rapidcheck/catch.h>
#include "finder/matcher.hpp"

using namespace finder::app;
using finder::screen::Entry;

namespace {

std::vector<std::string> names(const std::vector<Entry>& entries) {
    std::vector<std::string> out;
    for (const auto& e : entries) {
        out.push_back(e.name);
    }
    return out;
}

} // anonymous namespace

TEST_CASE("SubstringMatcher - empty query keeps everything in order", "[matcher]") {
    std::vector<Entry> entries{Entry("b"), Entry("a")};
    REQUIRE(names(SubstringMatcher().match(entries, "")) == std::vector<std::string>{"b", "a"});
}

TEST_CASE("SubstringMatcher - smart case", "[matcher]") {
    std::vector<Entry> entries{Entry("src/Main.cpp"), Entry("src/main.hpp")};
    SubstringMatcher matcher;
    REQUIRE(matcher.match(entries, "main").size() == 2);
    REQUIRE(names(matcher.match(entries, "Main")) == std::vector<std::string>{"src/Main.cpp"});
}

TEST_CASE("SubstringMatcher - earlier and shorter matches rank first", "[matcher]") {
    std::vector<Entry> entries{
        Entry("docs/readme.md"),
        Entry("readme.txt.bak"),
        Entry("readme.md"),
        Entry("notes.txt"),
    };
    auto result = SubstringMatcher().match(entries, "readme");
    REQUIRE(names(result) == std::vector<std::string>{"readme.md", "readme.txt.bak", "docs/readme.md"});
}

TEST_CASE("SubstringMatcher - matches against the display label", "[matcher]") {
    std::vector<Entry> entries{Entry("id-1", "Alpha"), Entry("id-2", "Beta")};
    REQUIRE(names(SubstringMatcher().match(entries, "bet")) == std::vector<std::string>{"id-2"});
}

TEST_CASE("SubstringMatcher - every result contains the query", "[matcher][property]") {
    rc::prop("结果是输入的子集且都包含查询串",
        [](const std::vector<std::string>& raw, const std::string& query) {
            std::vector<Entry> entries;
            for (const auto& s : raw) {
                entries.emplace_back(s);
            }
            auto result = SubstringMatcher().match(entries, query);
            RC_ASSERT(result.size() <= entries.size());
            for (const auto& e : result) {
                RC_ASSERT(SubstringMatcher::position(e.label(), query) != std::string::npos);
            }
        });
}
