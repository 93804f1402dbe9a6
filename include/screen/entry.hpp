/**
 * @file entry.hpp
 * @brief 结果条目与多选集合
 */

#pragma once

#include <cstddef>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace finder::screen {

/**
 * @struct Entry
 * @brief 一条候选结果
 *
 * 对本层而言条目是不透明的，name 是它的身份。
 */
struct Entry {
    std::string name;       ///< 身份（如文件路径）
    std::string display;    ///< 显示文本，为空时显示 name

    Entry() = default;
    explicit Entry(std::string n) : name(std::move(n)) {}
    Entry(std::string n, std::string d) : name(std::move(n)), display(std::move(d)) {}

    const std::string& label() const { return display.empty() ? name : display; }

    bool operator==(const Entry& other) const { return name == other.name; }
};

/**
 * @class SelectionSet
 * @brief 多选集合，O(1) 判断条目是否被选中
 */
class SelectionSet {
public:
    bool contains(const Entry& entry) const { return names_.count(entry.name) > 0; }
    bool empty() const { return names_.empty(); }
    std::size_t size() const { return names_.size(); }

    void insert(const Entry& entry) { names_.insert(entry.name); }
    void erase(const Entry& entry) { names_.erase(entry.name); }
    void clear() { names_.clear(); }

    /**
     * @brief 切换选中状态
     * @return 切换后是否选中
     */
    bool toggle(const Entry& entry) {
        auto it = names_.find(entry.name);
        if (it != names_.end()) {
            names_.erase(it);
            return false;
        }
        names_.insert(entry.name);
        return true;
    }

    const std::unordered_set<std::string>& names() const { return names_; }

private:
    std::unordered_set<std::string> names_;
};

} // namespace finder::screen
