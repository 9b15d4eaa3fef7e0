// =============================================================================
// screen_buffer.cpp — Character grid with scrollback, for copy-out
// =============================================================================

#include "screen_buffer.hpp"
#include "../core/byte_encoder.hpp"

#include <algorithm>

namespace keybridge
{

    // -------------------------------------------------------------------------
    // Construction
    // -------------------------------------------------------------------------

    ScreenBuffer::ScreenBuffer(int rows, int cols)
        : rows_(std::max(1, rows)), cols_(std::max(1, cols))
    {
        grid_.assign(rows_, make_empty_row());
    }

    // -------------------------------------------------------------------------
    // Grid operations
    // -------------------------------------------------------------------------

    void ScreenBuffer::resize(int new_rows, int new_cols)
    {
        new_rows = std::max(1, new_rows);
        new_cols = std::max(1, new_cols);
        if (new_rows == rows_ && new_cols == cols_)
            return;

        std::vector<std::u32string> new_grid(new_rows, std::u32string(new_cols, U' '));
        for (int r = 0; r < std::min(rows_, new_rows); ++r)
            for (int c = 0; c < std::min(cols_, new_cols); ++c)
                new_grid[r][c] = grid_[r][c];

        grid_ = std::move(new_grid);
        rows_ = new_rows;
        cols_ = new_cols;
        clamp_cursor();
    }

    char32_t ScreenBuffer::get_char(int row, int col) const
    {
        const std::u32string *line = line_at(row);
        if (!line || col < 0 || col >= static_cast<int>(line->size()))
            return U' ';
        return (*line)[col];
    }

    void ScreenBuffer::clear()
    {
        for (auto &row : grid_)
            row = make_empty_row();
        cursor_row = 0;
        cursor_col = 0;
    }

    void ScreenBuffer::erase_line_to_end()
    {
        auto &row = grid_[cursor_row];
        for (int c = cursor_col; c < cols_; ++c)
            row[c] = U' ';
    }

    void ScreenBuffer::scroll_up(int lines)
    {
        for (int i = 0; i < lines; ++i)
        {
            scrollback_.push_back(std::move(grid_[0]));
            if (static_cast<int>(scrollback_.size()) > MAX_SCROLLBACK)
                scrollback_.pop_front();

            for (int r = 0; r < rows_ - 1; ++r)
                grid_[r] = std::move(grid_[r + 1]);

            grid_[rows_ - 1] = make_empty_row();
        }
    }

    // -------------------------------------------------------------------------
    // Cursor movement helpers
    // -------------------------------------------------------------------------

    void ScreenBuffer::move_cursor(int row, int col)
    {
        cursor_row = row;
        cursor_col = col;
        clamp_cursor();
    }

    void ScreenBuffer::newline()
    {
        cursor_row++;
        if (cursor_row >= rows_)
        {
            scroll_up(1);
            cursor_row = rows_ - 1;
        }
    }

    void ScreenBuffer::carriage_return()
    {
        cursor_col = 0;
    }

    void ScreenBuffer::backspace()
    {
        if (cursor_col > 0)
            cursor_col--;
    }

    void ScreenBuffer::tab()
    {
        cursor_col = std::min(((cursor_col / 8) + 1) * 8, cols_ - 1);
    }

    void ScreenBuffer::put_char(char32_t ch)
    {
        if (cursor_col >= cols_)
        {
            carriage_return();
            newline();
        }
        grid_[cursor_row][cursor_col] = ch;
        cursor_col++;
    }

    // -------------------------------------------------------------------------
    // Text extraction (for copy)
    // -------------------------------------------------------------------------

    const std::u32string *ScreenBuffer::line_at(int screen_row) const
    {
        if (screen_row >= 0)
            return screen_row < rows_ ? &grid_[screen_row] : nullptr;

        int sb_idx = scrollback_size() + screen_row; // count from the end
        if (sb_idx < 0)
            return nullptr;
        return &scrollback_[sb_idx];
    }

    std::string ScreenBuffer::extract_text(const GridRegion &region) const
    {
        int top = std::max(region.top, -scrollback_size());
        int bottom = std::min(region.bottom, rows_ - 1);
        int left = std::max(region.left, 0);
        int right = std::min(region.right, cols_ - 1);

        std::string result;
        if (top > bottom || left > right)
            return result;

        for (int row = top; row <= bottom; ++row)
        {
            const std::u32string *line = line_at(row);
            std::string text;
            if (line)
            {
                int end = std::min(right, static_cast<int>(line->size()) - 1);
                for (int c = left; c <= end; ++c)
                    append_utf8(text, (*line)[c]);
            }

            // Trim trailing spaces
            while (!text.empty() && text.back() == ' ')
                text.pop_back();

            if (row > top)
                result += '\n';
            result += text;
        }

        return result;
    }

    void ScreenBuffer::clamp_cursor()
    {
        cursor_row = std::clamp(cursor_row, 0, rows_ - 1);
        cursor_col = std::clamp(cursor_col, 0, cols_ - 1);
    }

    std::u32string ScreenBuffer::make_empty_row() const
    {
        return std::u32string(cols_, U' ');
    }

} // namespace keybridge
