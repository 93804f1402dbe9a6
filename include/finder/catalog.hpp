/**
 * @file catalog.hpp
 * @brief 候选条目目录：后台线程扫描数据源，界面线程取快照
 */

#pragma once

#include "screen/entry.hpp"
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace finder::app {

/**
 * @enum SourceKind
 * @brief 数据源
 */
enum class SourceKind {
    FILES,
    DIRECTORIES,
    LIST_FILE   ///< 从列表文件逐行读取
};

const char* sourceName(SourceKind kind);

/**
 * @class Catalog
 * @brief 线程安全的条目存储
 *
 * start() 启动后台扫描；每扫到一批条目追加一次并触发变更回调。
 * 回调在扫描线程中执行。
 */
class Catalog {
public:
    using ChangeCallback = std::function<void()>;

    /// 每批追加的条目数
    static constexpr std::size_t BATCH_SIZE = 256;

    Catalog() = default;
    ~Catalog();

    Catalog(const Catalog&) = delete;
    Catalog& operator=(const Catalog&) = delete;

    void setOnChange(ChangeCallback callback);

    /**
     * @brief 清空并开始扫描新的数据源
     *
     * 会先停止正在进行的扫描。LIST_FILE 时 root 为列表文件路径。
     */
    void start(const std::filesystem::path& root, SourceKind kind);

    /**
     * @brief 停止扫描并等待扫描线程退出
     */
    void stop();

    std::vector<screen::Entry> snapshot() const;
    std::size_t size() const;
    bool scanning() const { return scanning_.load(); }

    /**
     * @brief 每次内容变更递增
     */
    std::uint64_t version() const { return version_.load(); }

private:
    void scan(std::filesystem::path root, SourceKind kind);
    void scanList(const std::filesystem::path& path);
    void append(std::vector<screen::Entry>& batch);
    void notify();

    mutable std::mutex mutex_;
    std::vector<screen::Entry> entries_;
    ChangeCallback onChange_;

    std::thread worker_;
    std::atomic<bool> stop_{false};
    std::atomic<bool> scanning_{false};
    std::atomic<std::uint64_t> version_{0};
};

} // namespace finder::app
