#pragma once

// =============================================================================
// screen_buffer.hpp — Character grid with scrollback, for copy-out
// =============================================================================
// Holds what the remote side printed so keyboard selection has something to
// copy from. Only characters are kept; colours and attributes are the
// renderer's business. Row numbers in a GridRegion are screen rows: 0 is the
// top visible line, negative rows reach back into the scrollback.
// Callers must serialise access (the front end holds a mutex).
// =============================================================================

#include "../core/selection_area.hpp"

#include <deque>
#include <string>
#include <vector>

namespace keybridge
{

    class ScreenBuffer
    {
    public:
        ScreenBuffer(int rows, int cols);

        // --- Grid operations ---
        void resize(int new_rows, int new_cols);
        char32_t get_char(int row, int col) const;
        void clear();
        void erase_line_to_end();
        void scroll_up(int lines = 1);

        // --- Cursor helpers ---
        void move_cursor(int row, int col);
        void newline();
        void carriage_return();
        void backspace();
        void tab();

        /// Write at the cursor and advance, wrapping at the right margin.
        void put_char(char32_t ch);

        // --- Scrollback ---
        int scrollback_size() const { return static_cast<int>(scrollback_.size()); }

        /// Rectangle of text, clamped to what exists. Each row has trailing
        /// blanks removed; rows are joined with '\n'.
        std::string extract_text(const GridRegion &region) const;

        // --- Accessors ---
        int get_rows() const { return rows_; }
        int get_cols() const { return cols_; }

        int cursor_row = 0;
        int cursor_col = 0;

    private:
        int rows_;
        int cols_;
        std::vector<std::u32string> grid_;

        // Lines that scrolled off the top, oldest first
        std::deque<std::u32string> scrollback_;
        static constexpr int MAX_SCROLLBACK = 5000;

        const std::u32string *line_at(int screen_row) const;
        void clamp_cursor();
        std::u32string make_empty_row() const;
    };

} // namespace keybridge
