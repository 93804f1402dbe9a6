/**
 * @file main.cpp
 * @brief finder 入口点
 *
 * 启动流程：
 * 1. 解析命令行参数
 * 2. 加载配置与配色
 * 3. 运行交互界面，确认后把结果逐行写到标准输出
 */

#include "base/config.hpp"
#include "base/logger.hpp"
#include "finder/app.hpp"
#include "screen/theme.hpp"
#include "screen/ui_config.hpp"

#include <filesystem>
#include <iostream>
#include <optional>

namespace {

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName << " [options] [dir]\n"
              << "Options:\n"
              << "  -c, --config <path>   Path to config.ini\n"
              << "  -l, --log <path>      Write log to file instead of stderr\n"
              << "  -f, --file <path>     Read candidates from a list file\n"
              << "  --help                Show this help message\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::string configPath;
    std::string logPath;
    std::optional<std::filesystem::path> listFile;
    std::filesystem::path root = ".";

    // 解析命令行参数
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            configPath = argv[++i];
        } else if ((arg == "-l" || arg == "--log") && i + 1 < argc) {
            logPath = argv[++i];
        } else if ((arg == "-f" || arg == "--file") && i + 1 < argc) {
            listFile = argv[++i];
        } else if (arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 2;
        } else {
            root = arg;
        }
    }

    if (!logPath.empty() && !finder::Logger::instance().open(logPath)) {
        std::cerr << "Error: Could not open log file " << logPath << std::endl;
        return 2;
    }

    // 加载配置文件（可选）
    auto& config = finder::Config::instance();
    if (!configPath.empty() && std::filesystem::exists(configPath)) {
        config.load(configPath);
    }

    if (!listFile) {
        std::error_code ec;
        if (!std::filesystem::is_directory(root, ec)) {
            std::cerr << "Error: Not a directory: " << root.string() << std::endl;
            return 2;
        }
    }

    try {
        finder::app::FinderApp app(finder::screen::loadUiConfig(config),
                                   finder::screen::loadTheme(config),
                                   root, listFile);
        LOG() << "[Finder] Started";

        // 日志仍写标准错误时，界面运行期间关闭日志
        const bool quiet = logPath.empty();
        if (quiet) {
            finder::Logger::instance().setEnabled(false);
        }
        const bool accepted = app.run();
        if (quiet) {
            finder::Logger::instance().setEnabled(true);
        }
        if (!accepted) {
            return 130;
        }
        for (const auto& name : app.accepted()) {
            std::cout << name << '\n';
        }
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
