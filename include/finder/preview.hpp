/**
 * @file preview.hpp
 * @brief 预览内容：文件取开头若干行，目录列出其直接子项
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace finder::app {

/// 制表符展开宽度
constexpr std::size_t TAB_WIDTH = 4;

/**
 * @brief 读取预览行
 *
 * 含 NUL 字节的文件视为二进制，只返回一行提示；无法读取时返回一行错误提示。
 *
 * @param path 文件或目录
 * @param maxLines 最多返回的行数
 */
std::vector<std::string> loadPreview(const std::filesystem::path& path, std::size_t maxLines);

/**
 * @brief 展开制表符并去掉其他控制字符
 */
std::string sanitizeLine(const std::string& line);

} // namespace finder::app
