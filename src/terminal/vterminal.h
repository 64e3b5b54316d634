#pragma once

#include "terminal/screen_buffer.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace easel {

constexpr int CELL_MAX_CODEPOINTS = 6;

// One grid cell; colors are unset when the terminal default applies.
struct GridCell {
    uint32_t codepoints[CELL_MAX_CODEPOINTS];
    uint8_t width;
    std::optional<uint32_t> fg;
    std::optional<uint32_t> bg;
    bool bold;
    bool italic;
    bool underline;
};

// Groups a row of cells into styled runs; trailing blanks are dropped.
Line cells_to_line(const std::vector<GridCell>& cells);

struct VTermState;

// libvterm screen that a pty's output is replayed into. Rows that scroll off
// the top are handed to the scroll callback as finished lines.
class VTerminal {
public:
    using ScrollCallback = std::function<void(Line)>;

    VTerminal(int rows, int cols);
    ~VTerminal();

    VTerminal(const VTerminal&) = delete;
    VTerminal& operator=(const VTerminal&) = delete;

    void feed(const std::string& data);
    void resize(int rows, int cols);

    int rows() const { return rows_; }
    int cols() const { return cols_; }

    Line row_line(int row) const;
    CursorPosition cursor() const { return cursor_; }

    // Bytes the emulator wants sent back to the program (query replies).
    std::string take_reply();

    void on_scroll(ScrollCallback callback) { scroll_callback_ = std::move(callback); }

private:
    friend struct VTermState;

    std::unique_ptr<VTermState> state_;
    int rows_;
    int cols_;
    CursorPosition cursor_;
    ScrollCallback scroll_callback_;
};

}
