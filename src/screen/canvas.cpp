/**
 * @file canvas.cpp
 * @brief 帧缓冲基础绘制实现
 */

#include "screen/canvas.hpp"
#include <ftxui/screen/string.hpp>

namespace finder::screen {

std::vector<std::string> toCells(const std::string& text) {
    return ftxui::Utf8ToGlyphs(text);
}

int displayWidth(const std::string& text) {
    return static_cast<int>(toCells(text).size());
}

int lineWidth(const Line& line) {
    int width = 0;
    for (const auto& span : line) {
        width += displayWidth(span.text);
    }
    return width;
}

void fillRect(ftxui::Screen& screen, const Rect& rect, ftxui::Color background) {
    if (rect.empty()) {
        return;
    }
    for (int y = rect.y; y < rect.bottom(); ++y) {
        for (int x = rect.x; x < rect.right(); ++x) {
            ftxui::Pixel& pixel = screen.PixelAt(x, y);
            pixel = ftxui::Pixel();
            pixel.background_color = background;
        }
    }
}

int drawLine(ftxui::Screen& screen, int x, int y, int maxWidth, const Line& line) {
    int written = 0;
    for (const auto& span : line) {
        for (const auto& cell : toCells(span.text)) {
            if (written >= maxWidth) {
                return written;
            }
            ftxui::Pixel& pixel = screen.PixelAt(x + written, y);
            pixel.character = cell;
            pixel.foreground_color = span.foreground;
            pixel.bold = span.bold;
            pixel.italic = span.italic;
            ++written;
        }
    }
    return written;
}

void renderElement(ftxui::Screen& screen, ftxui::Element element, const Rect& rect) {
    if (rect.empty()) {
        return;
    }
    ftxui::Screen offscreen(rect.width, rect.height);
    ftxui::Render(offscreen, element);

    for (int dy = 0; dy < rect.height; ++dy) {
        for (int dx = 0; dx < rect.width; ++dx) {
            ftxui::Pixel& target = screen.PixelAt(rect.x + dx, rect.y + dy);
            ftxui::Pixel pixel = offscreen.PixelAt(dx, dy);
            if (pixel.background_color == ftxui::Color::Default) {
                pixel.background_color = target.background_color;
            }
            target = pixel;
        }
    }
}

std::string readRow(ftxui::Screen& screen, int x, int y, int width) {
    std::string out;
    for (int i = 0; i < width; ++i) {
        out += screen.PixelAt(x + i, y).character;
    }
    return out;
}

} // namespace finder::screen
