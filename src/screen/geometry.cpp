/**
 * @file geometry.cpp
 * @brief 矩形与约束切分实现
 */

#include "screen/geometry.hpp"
#include <algorithm>

namespace finder::screen {

int toCoord(std::size_t value, const char* what) {
    if (value > static_cast<std::size_t>(MAX_COORD)) {
        throw NumericConversionError(std::string(what) + " out of terminal range: " +
                                     std::to_string(value));
    }
    return static_cast<int>(value);
}

Rect Rect::inner(const Padding& padding) const {
    const int left = std::max(padding.left, 0);
    const int right = std::max(padding.right, 0);
    const int top = std::max(padding.top, 0);
    const int bottom = std::max(padding.bottom, 0);

    Rect r;
    r.x = x + std::min(left, std::max(width, 0));
    r.y = y + std::min(top, std::max(height, 0));
    r.width = std::max(0, width - left - right);
    r.height = std::max(0, height - top - bottom);
    return r;
}

std::vector<Rect> split(Direction direction, const std::vector<Constraint>& constraints, const Rect& area) {
    std::vector<Rect> out;
    if (constraints.empty()) {
        return out;
    }

    Rect source = area;
    source.width = std::max(source.width, 0);
    source.height = std::max(source.height, 0);

    const int total = direction == Direction::VERTICAL ? source.height : source.width;
    std::vector<int> sizes(constraints.size(), 0);
    int remaining = total;
    std::int64_t fill_weight = 0;

    for (size_t i = 0; i < constraints.size(); ++i) {
        const Constraint& c = constraints[i];
        switch (c.kind) {
            case Constraint::Kind::FIXED_LENGTH:
                sizes[i] = std::min(std::max(c.value, 0), remaining);
                remaining -= sizes[i];
                break;
            case Constraint::Kind::PERCENTAGE: {
                const std::int64_t p = std::clamp(c.value, 0, 100);
                const std::int64_t want = static_cast<std::int64_t>(total) * p / 100;
                sizes[i] = static_cast<int>(std::min<std::int64_t>(want, remaining));
                remaining -= sizes[i];
                break;
            }
            case Constraint::Kind::FILL:
                fill_weight += std::max(c.value, 1);
                break;
        }
    }

    if (fill_weight > 0) {
        int handed_out = 0;
        for (size_t i = 0; i < constraints.size(); ++i) {
            if (constraints[i].kind != Constraint::Kind::FILL) continue;
            const std::int64_t weight = std::max(constraints[i].value, 1);
            sizes[i] = static_cast<int>(static_cast<std::int64_t>(remaining) * weight / fill_weight);
            handed_out += sizes[i];
        }
        // 整除余下的格子数一定少于 FILL 的个数，一轮即可分完
        int leftover = remaining - handed_out;
        for (size_t i = 0; i < constraints.size() && leftover > 0; ++i) {
            if (constraints[i].kind != Constraint::Kind::FILL) continue;
            ++sizes[i];
            --leftover;
        }
    } else if (remaining > 0) {
        sizes.back() += remaining;
    }

    out.reserve(constraints.size());
    int offset = direction == Direction::VERTICAL ? source.y : source.x;
    for (int size : sizes) {
        Rect r = source;
        if (direction == Direction::VERTICAL) {
            r.y = offset;
            r.height = size;
        } else {
            r.x = offset;
            r.width = size;
        }
        offset += size;
        out.push_back(r);
    }
    return out;
}

Rect mergeRects(const Rect& a, const Rect& b) {
    const int min_x = std::min(a.x, b.x);
    const int min_y = std::min(a.y, b.y);
    const int max_x = std::max(a.right(), b.right());
    const int max_y = std::max(a.bottom(), b.bottom());
    return Rect{min_x, min_y, std::max(0, max_x - min_x), std::max(0, max_y - min_y)};
}

} // namespace finder::screen
