#include "terminal/screen_buffer.h"

#include <type_traits>

namespace easel {

Line make_line(const std::string& text) {
    if (text.empty()) {
        return {};
    }
    LineItem item;
    item.lexeme = text;
    item.width = static_cast<int>(text.size());
    return {item};
}

std::string line_text(const Line& line) {
    std::string out;
    for (const auto& item : line) {
        out += item.lexeme;
    }
    return out;
}

void ScreenBuffer::apply(const TerminalEvent& event) {
    std::visit([this](const auto& evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ScreenUpdate>) {
            lines_ = evt.screen;
            cursor_ = evt.cursor;
        } else if constexpr (std::is_same_v<T, NewLines>) {
            lines_.insert(lines_.end(), evt.lines.begin(), evt.lines.end());
        } else if constexpr (std::is_same_v<T, Patch>) {
            if (evt.line >= lines_.size()) {
                lines_.resize(evt.line + 1);
            }
            lines_[evt.line] = evt.items;
        } else if constexpr (std::is_same_v<T, CursorMove>) {
            cursor_ = evt.cursor;
        }
    }, event);
}

void ScreenBuffer::apply_all(const std::vector<TerminalEvent>& events) {
    for (const auto& event : events) {
        apply(event);
    }
}

std::vector<Line> ScreenBuffer::visible_window(size_t height) const {
    size_t start = lines_.size() > height ? lines_.size() - height : 0;
    return std::vector<Line>(lines_.begin() + static_cast<std::ptrdiff_t>(start), lines_.end());
}

std::vector<std::string> ScreenBuffer::visible_text(size_t height) const {
    std::vector<std::string> out;
    for (const auto& line : visible_window(height)) {
        out.push_back(line_text(line));
    }
    return out;
}

void ScreenBuffer::clear() {
    lines_.clear();
    cursor_ = CursorPosition{};
}

}
