/**
 * @file spinner.cpp
 * @brief 转圈指示实现
 */

#include "screen/spinner.hpp"
#include <array>

namespace finder::screen {

namespace {

const std::array<std::string, 10>& frames() {
    static const std::array<std::string, 10> kFrames = {
        "⠋", "⠙", "⠹", "⠸", "⠼", "⠴", "⠦", "⠧", "⠇", "⠏",
    };
    return kFrames;
}

} // anonymous namespace

const std::string& Spinner::frame() const {
    return frames()[index_ % frames().size()];
}

void Spinner::tick() {
    index_ = (index_ + 1) % frames().size();
}

} // namespace finder::screen
