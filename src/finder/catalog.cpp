/**
 * @file catalog.cpp
 * @brief 候选条目目录实现
 */

#include "finder/catalog.hpp"
#include "base/logger.hpp"
#include <fstream>
#include <system_error>

namespace finder::app {

namespace fs = std::filesystem;

const char* sourceName(SourceKind kind) {
    switch (kind) {
        case SourceKind::FILES: return "files";
        case SourceKind::DIRECTORIES: return "directories";
        case SourceKind::LIST_FILE: return "list";
    }
    return "unknown";
}

Catalog::~Catalog() {
    stop();
}

void Catalog::setOnChange(ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    onChange_ = std::move(callback);
}

void Catalog::start(const fs::path& root, SourceKind kind) {
    stop();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }
    ++version_;
    stop_ = false;
    scanning_ = true;
    worker_ = std::thread([this, root, kind] { scan(root, kind); });
}

void Catalog::stop() {
    stop_ = true;
    if (worker_.joinable()) {
        worker_.join();
    }
    scanning_ = false;
}

std::vector<screen::Entry> Catalog::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

std::size_t Catalog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void Catalog::append(std::vector<screen::Entry>& batch) {
    if (batch.empty()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& entry : batch) {
            entries_.push_back(std::move(entry));
        }
    }
    batch.clear();
    ++version_;
    notify();
}

void Catalog::notify() {
    ChangeCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = onChange_;
    }
    if (callback) {
        callback();
    }
}

void Catalog::scan(fs::path root, SourceKind kind) {
    LOG() << "[Catalog] Scanning " << sourceName(kind) << " under " << root.string();

    if (kind == SourceKind::LIST_FILE) {
        scanList(root);
    } else {
        std::error_code ec;
        fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            LOG_WARN() << "[Catalog] Cannot open " << root.string() << ": " << ec.message();
        }

        std::vector<screen::Entry> batch;
        const fs::recursive_directory_iterator end;
        while (!ec && it != end && !stop_) {
            const fs::directory_entry& item = *it;
            std::error_code type_ec;
            const bool wanted = kind == SourceKind::DIRECTORIES ? item.is_directory(type_ec)
                                                                : item.is_regular_file(type_ec);
            if (wanted) {
                batch.emplace_back(item.path().lexically_relative(root).generic_string());
                if (batch.size() >= BATCH_SIZE) {
                    append(batch);
                }
            }
            it.increment(ec);
            if (ec) {
                LOG_WARN() << "[Catalog] Scan stopped early: " << ec.message();
            }
        }
        append(batch);
    }

    LOG() << "[Catalog] Scan finished, " << size() << " entries";
    scanning_ = false;
    notify();
}

void Catalog::scanList(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN() << "[Catalog] Cannot open list file " << path.string();
        return;
    }
    std::vector<screen::Entry> batch;
    std::string line;
    while (!stop_ && std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }
        batch.emplace_back(line);
        if (batch.size() >= BATCH_SIZE) {
            append(batch);
        }
    }
    append(batch);
}

} // namespace finder::app
