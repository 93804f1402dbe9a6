/**
 * @file preview.cpp
 * @brief 预览内容实现
 */

#include "finder/preview.hpp"
#include <algorithm>
#include <fstream>
#include <system_error>

namespace finder::app {

namespace fs = std::filesystem;

std::string sanitizeLine(const std::string& line) {
    std::string out;
    out.reserve(line.size());
    for (char c : line) {
        if (c == '\t') {
            out.append(TAB_WIDTH, ' ');
        } else if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) {
            continue;
        } else {
            out += c;
        }
    }
    return out;
}

std::vector<std::string> loadPreview(const fs::path& path, std::size_t maxLines) {
    std::vector<std::string> lines;
    std::error_code ec;

    if (fs::is_directory(path, ec)) {
        std::vector<std::string> names;
        for (fs::directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
            std::string name = it->path().filename().string();
            if (it->is_directory(ec)) {
                name += "/";
            }
            names.push_back(name);
        }
        if (ec) {
            return {"<" + ec.message() + ">"};
        }
        std::sort(names.begin(), names.end());
        if (names.size() > maxLines) {
            names.resize(maxLines);
        }
        return names;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return {"<cannot open " + path.filename().string() + ">"};
    }
    std::string line;
    while (lines.size() < maxLines && std::getline(file, line)) {
        if (line.find('\0') != std::string::npos) {
            return {"<binary file>"};
        }
        lines.push_back(sanitizeLine(line));
    }
    return lines;
}

} // namespace finder::app
