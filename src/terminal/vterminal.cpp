#include "terminal/vterminal.h"

extern "C" {
#include <vterm.h>
}

namespace easel {

namespace {

std::optional<uint32_t> to_rgb(const VTermScreen* screen, VTermColor color) {
    if (VTERM_COLOR_IS_DEFAULT_FG(&color) || VTERM_COLOR_IS_DEFAULT_BG(&color)) {
        return std::nullopt;
    }
    if (VTERM_COLOR_IS_INDEXED(&color)) {
        vterm_screen_convert_color_to_rgb(screen, &color);
    }
    return (uint32_t{color.rgb.red} << 16) | (uint32_t{color.rgb.green} << 8) | uint32_t{color.rgb.blue};
}

GridCell to_grid_cell(const VTermScreen* screen, const VTermScreenCell& cell) {
    GridCell out{};
    for (int i = 0; i < CELL_MAX_CODEPOINTS && i < VTERM_MAX_CHARS_PER_CELL; ++i) {
        out.codepoints[i] = cell.chars[i];
    }
    out.width = static_cast<uint8_t>(cell.width);
    out.fg = to_rgb(screen, cell.fg);
    out.bg = to_rgb(screen, cell.bg);
    out.bold = cell.attrs.bold;
    out.italic = cell.attrs.italic;
    out.underline = cell.attrs.underline != VTERM_UNDERLINE_OFF;
    return out;
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

bool same_style(const LineItem& item, const GridCell& cell) {
    return item.is_bold == cell.bold && item.is_italic == cell.italic &&
           item.is_underline == cell.underline && item.fg == cell.fg && item.bg == cell.bg;
}

bool is_blank(const GridCell& cell) {
    return (cell.codepoints[0] == 0 || cell.codepoints[0] == ' ') && !cell.bg.has_value();
}

}

Line cells_to_line(const std::vector<GridCell>& cells) {
    size_t end = cells.size();
    while (end > 0 && is_blank(cells[end - 1])) {
        --end;
    }

    Line line;
    for (size_t i = 0; i < end; ++i) {
        const auto& cell = cells[i];
        // The right half of a wide character carries no text of its own.
        if (i > 0 && cells[i - 1].width == 2 && cell.codepoints[0] == 0) {
            continue;
        }

        if (line.empty() || !same_style(line.back(), cell)) {
            LineItem item;
            item.is_bold = cell.bold;
            item.is_italic = cell.italic;
            item.is_underline = cell.underline;
            item.fg = cell.fg;
            item.bg = cell.bg;
            line.push_back(std::move(item));
        }

        auto& item = line.back();
        if (cell.codepoints[0] == 0) {
            item.lexeme.push_back(' ');
        } else {
            for (int c = 0; c < CELL_MAX_CODEPOINTS && cell.codepoints[c]; ++c) {
                append_utf8(item.lexeme, cell.codepoints[c]);
            }
        }
        item.width += cell.width ? cell.width : 1;
    }
    return line;
}

struct VTermState {
    VTerminal* owner;
    VTerm* vt;
    VTermScreen* screen;

    VTermState(VTerminal* terminal, int rows, int cols)
        : owner(terminal)
        , vt(vterm_new(rows, cols))
        , screen(vterm_obtain_screen(vt))
    {
        static const VTermScreenCallbacks callbacks = {
            .damage = nullptr,
            .moverect = nullptr,
            .movecursor = on_cursor,
            .settermprop = nullptr,
            .bell = nullptr,
            .resize = nullptr,
            .sb_pushline = on_scrolled_off,
            .sb_popline = nullptr,
            .sb_clear = nullptr,
        };

        vterm_set_utf8(vt, 1);
        vterm_screen_set_callbacks(screen, &callbacks, this);
        vterm_screen_enable_altscreen(screen, 1);
        vterm_screen_reset(screen, 1);
    }

    ~VTermState() { vterm_free(vt); }

    VTermState(const VTermState&) = delete;
    VTermState& operator=(const VTermState&) = delete;

    static int on_cursor(VTermPos pos, VTermPos, int, void* user) {
        auto* state = static_cast<VTermState*>(user);
        state->owner->cursor_ = CursorPosition{static_cast<size_t>(pos.row), static_cast<size_t>(pos.col)};
        return 1;
    }

    static int on_scrolled_off(int cols, const VTermScreenCell* cells, void* user) {
        auto* state = static_cast<VTermState*>(user);
        if (!state->owner->scroll_callback_) {
            return 1;
        }
        std::vector<GridCell> row;
        row.reserve(static_cast<size_t>(cols));
        for (int i = 0; i < cols; ++i) {
            row.push_back(to_grid_cell(state->screen, cells[i]));
        }
        state->owner->scroll_callback_(cells_to_line(row));
        return 1;
    }
};

VTerminal::VTerminal(int rows, int cols)
    : state_(std::make_unique<VTermState>(this, rows, cols))
    , rows_(rows)
    , cols_(cols)
{
}

VTerminal::~VTerminal() = default;

void VTerminal::feed(const std::string& data) {
    vterm_input_write(state_->vt, data.data(), data.size());
    vterm_screen_flush_damage(state_->screen);
}

void VTerminal::resize(int rows, int cols) {
    if (rows == rows_ && cols == cols_) {
        return;
    }
    rows_ = rows;
    cols_ = cols;
    vterm_set_size(state_->vt, rows, cols);
}

Line VTerminal::row_line(int row) const {
    std::vector<GridCell> cells;
    cells.reserve(static_cast<size_t>(cols_));
    for (int col = 0; col < cols_; ++col) {
        VTermScreenCell cell;
        if (vterm_screen_get_cell(state_->screen, VTermPos{row, col}, &cell)) {
            cells.push_back(to_grid_cell(state_->screen, cell));
        } else {
            cells.push_back(GridCell{});
        }
    }
    return cells_to_line(cells);
}

std::string VTerminal::take_reply() {
    std::string reply;
    size_t pending = vterm_output_get_buffer_current(state_->vt);
    if (pending > 0) {
        reply.resize(pending);
        reply.resize(vterm_output_read(state_->vt, reply.data(), pending));
    }
    return reply;
}

}
