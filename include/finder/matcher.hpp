/**
 * @file matcher.hpp
 * @brief 子串匹配器
 *
 * 智能大小写：查询中不含大写字母时忽略大小写，否则区分大小写。
 * 排名：匹配位置越靠前越优先，其次名字越短越优先，再按原顺序。
 */

#pragma once

#include "screen/entry.hpp"
#include <string>
#include <vector>

namespace finder::app {

class SubstringMatcher {
public:
    /**
     * @brief 过滤并排序
     * @param entries 候选条目（保持原顺序）
     * @param query 查询串；为空时返回全部条目
     */
    std::vector<screen::Entry> match(const std::vector<screen::Entry>& entries, const std::string& query) const;

    /**
     * @brief 单个条目的匹配位置
     * @return 未匹配时返回 std::string::npos
     */
    static std::size_t position(const std::string& haystack, const std::string& query);
};

} // namespace finder::app
