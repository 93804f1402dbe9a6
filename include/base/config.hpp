/**
 * @file config.hpp
 * @brief INI 格式配置文件解析器
 *
 * 提供线程安全的单例配置管理器，支持从 INI 文件加载配置，
 * 并按 section/key 方式访问配置项。
 */

#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace finder {

/**
 * @class Config
 * @brief 线程安全的 INI 配置文件解析器（单例模式）
 *
 * 支持标准 INI 格式：
 * - [section] 定义配置节
 * - key = value 定义配置项
 * - ; 或 # 开头的行为注释
 *
 * 与 get() 不同，find() 能区分"没有配置"和"配置为空字符串"，
 * 面板标题的三态（默认 / 隐藏 / 自定义）依赖这一点。
 *
 * @par 使用示例
 * @code
 * Config::instance().load("finder.ini");
 * int size = Config::instance().get_int("ui", "preview_size", 50);
 * auto header = Config::instance().find("ui", "results_header");
 * @endcode
 */
class Config {
public:
    /**
     * @brief 获取 Config 单例实例
     * @return Config& 单例引用
     */
    static Config& instance();

    /**
     * @brief 从文件加载配置
     * @param filename 配置文件路径
     * @return true 加载成功
     * @return false 加载失败（文件不存在或无法打开）
     *
     * @note 调用此方法会清空之前加载的所有配置
     */
    bool load(const std::string& filename);

    /**
     * @brief 清空全部配置项
     */
    void clear();

    /**
     * @brief 查找配置项
     * @return 配置值；配置项不存在时为 std::nullopt（空字符串是合法值）
     */
    std::optional<std::string> find(const std::string& section, const std::string& key);

    /**
     * @brief 获取字符串类型的配置值
     * @param default_value 默认值，当配置项不存在时返回
     */
    std::string get(const std::string& section, const std::string& key, const std::string& default_value = "");

    /**
     * @brief 获取整数类型的配置值
     * @param default_value 默认值，当配置项不存在或转换失败时返回
     */
    int get_int(const std::string& section, const std::string& key, int default_value = 0);

    /**
     * @brief 获取布尔类型的配置值
     *
     * 接受 true/false、yes/no、on/off、1/0（不区分大小写）。
     *
     * @param default_value 默认值，当配置项不存在或无法识别时返回
     */
    bool get_bool(const std::string& section, const std::string& key, bool default_value = false);

private:
    Config() = default;
    ~Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    /**
     * @brief 去除字符串首尾空白字符
     */
    std::string trim(const std::string& str);

    /// 配置数据存储：section -> (key -> value)
    std::unordered_map<std::string, std::unordered_map<std::string, std::string>> data_;
    /// 保护 data_ 的互斥锁
    std::mutex mutex_;
};

} // namespace finder
