#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace easel {

// A run of text sharing one style.
struct LineItem {
    std::string lexeme;
    int width = 0;
    bool is_bold = false;
    bool is_italic = false;
    bool is_underline = false;
    std::optional<uint32_t> fg;
    std::optional<uint32_t> bg;

    bool operator==(const LineItem&) const = default;
};

using Line = std::vector<LineItem>;

struct CursorPosition {
    size_t line = 0;
    size_t col = 0;

    bool operator==(const CursorPosition&) const = default;
};

struct ScreenUpdate {
    std::vector<Line> screen;
    CursorPosition cursor;
};

struct NewLines {
    std::vector<Line> lines;
};

struct Patch {
    size_t line;
    Line items;
};

struct CursorMove {
    CursorPosition cursor;
};

using TerminalEvent = std::variant<ScreenUpdate, NewLines, Patch, CursorMove>;

Line make_line(const std::string& text);
std::string line_text(const Line& line);

// Line grid rebuilt from terminal events, applied in arrival order.
class ScreenBuffer {
public:
    void apply(const TerminalEvent& event);
    void apply_all(const std::vector<TerminalEvent>& events);

    // Last `height` lines, oldest first.
    std::vector<Line> visible_window(size_t height) const;
    std::vector<std::string> visible_text(size_t height) const;

    const std::vector<Line>& lines() const { return lines_; }
    size_t size() const { return lines_.size(); }
    const CursorPosition& cursor() const { return cursor_; }

    void clear();

private:
    std::vector<Line> lines_;
    CursorPosition cursor_;
};

}
