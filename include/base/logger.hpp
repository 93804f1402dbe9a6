/**
 * @file logger.hpp
 * @brief 线程安全的日志输出工具
 *
 * 提供简洁的流式日志接口，确保每条日志完整写出。
 * 终端由界面独占，因此日志默认写到标准错误，可通过 open() 重定向到文件。
 */

#pragma once

#include <atomic>
#include <mutex>
#include <sstream>
#include <string>
#include <fcntl.h>
#include <unistd.h>

namespace finder {

/**
 * @class Logger
 * @brief 线程安全的日志输出器（单例模式）
 *
 * 使用 POSIX write() 系统调用保证单条日志的原子性写入。
 *
 * @par 使用示例
 * @code
 * Logger::instance().open("/tmp/finder.log");
 * LOG() << "Scanned " << count << " entries";
 * LOG_WARN() << "Unknown border style: " << name;
 * @endcode
 *
 * @note 日志会自动在末尾添加换行符
 */
class Logger {
public:
    /**
     * @brief 获取 Logger 单例实例
     * @return Logger& 单例引用
     */
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    /**
     * @brief 将日志重定向到文件（追加写入）
     * @param path 日志文件路径
     * @return true 打开成功
     * @return false 打开失败，继续写标准错误
     */
    bool open(const std::string& path) {
        int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
        if (fd < 0) {
            return false;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        closeFile();
        fd_ = fd;
        return true;
    }

    /**
     * @brief 开关日志输出
     *
     * 界面占用终端且日志仍指向标准错误时关闭，避免打乱画面。
     */
    void setEnabled(bool enabled) { enabled_ = enabled; }

    bool isEnabled() const { return enabled_.load(); }

    /**
     * @class LogStream
     * @brief 日志流对象，析构时将缓冲区内容一次性写出
     */
    class LogStream {
    public:
        LogStream(Logger& logger, const char* level) : logger_(logger) {
            if (level != nullptr) {
                buffer_ << level << ' ';
            }
        }

        ~LogStream() {
            buffer_ << '\n';
            logger_.write(buffer_.str());
        }

        LogStream(const LogStream&) = delete;
        LogStream& operator=(const LogStream&) = delete;

        LogStream(LogStream&& other) noexcept
            : logger_(other.logger_), buffer_(std::move(other.buffer_)) {}

        template<typename T>
        LogStream& operator<<(const T& value) {
            buffer_ << value;
            return *this;
        }

    private:
        Logger& logger_;
        std::ostringstream buffer_; ///< 日志缓冲区
    };

    /**
     * @brief 创建日志流对象
     * @param level 级别前缀，nullptr 表示普通信息
     */
    LogStream log(const char* level = nullptr) {
        return LogStream(*this, level);
    }

private:
    Logger() = default;
    ~Logger() { closeFile(); }
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void write(const std::string& line) {
        if (!enabled_) {
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        // 单次 write() 调用是原子的；写失败时没有更好的去处，直接丢弃
        ssize_t written = ::write(fd_, line.c_str(), line.size());
        (void)written;
    }

    void closeFile() {
        if (fd_ != STDERR_FILENO) {
            ::close(fd_);
            fd_ = STDERR_FILENO;
        }
    }

    std::mutex mutex_;         ///< 保护 fd_ 与写入的互斥锁
    int fd_ = STDERR_FILENO;   ///< 当前日志输出目标
    std::atomic<bool> enabled_{true};
};

/**
 * @def LOG()
 * @brief 日志输出宏
 *
 * 使用方式：LOG() << "message" << value;
 */
#define LOG() finder::Logger::instance().log()

/// 警告级别日志
#define LOG_WARN() finder::Logger::instance().log("[WARN]")

} // namespace finder
