/**
 * @file matcher.cpp
 * @brief 子串匹配器实现
 */

#include "finder/matcher.hpp"
#include <algorithm>
#include <cctype>

namespace finder::app {

namespace {

bool hasUpper(const std::string& text) {
    return std::any_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isupper(c) != 0; });
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

struct Ranked {
    std::size_t position;
    std::size_t length;
    std::size_t order;
};

} // anonymous namespace

std::size_t SubstringMatcher::position(const std::string& haystack, const std::string& query) {
    if (query.empty()) {
        return 0;
    }
    if (hasUpper(query)) {
        return haystack.find(query);
    }
    return toLower(haystack).find(query);
}

std::vector<screen::Entry> SubstringMatcher::match(const std::vector<screen::Entry>& entries,
                                                   const std::string& query) const {
    if (query.empty()) {
        return entries;
    }

    std::vector<Ranked> ranked;
    for (std::size_t i = 0; i < entries.size(); ++i) {
        const std::size_t pos = position(entries[i].label(), query);
        if (pos != std::string::npos) {
            ranked.push_back(Ranked{pos, entries[i].label().size(), i});
        }
    }
    std::sort(ranked.begin(), ranked.end(), [](const Ranked& a, const Ranked& b) {
        if (a.position != b.position) return a.position < b.position;
        if (a.length != b.length) return a.length < b.length;
        return a.order < b.order;
    });

    std::vector<screen::Entry> result;
    result.reserve(ranked.size());
    for (const auto& r : ranked) {
        result.push_back(entries[r.order]);
    }
    return result;
}

} // namespace finder::app
