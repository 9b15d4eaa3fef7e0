#pragma once

// =============================================================================
// selection_area.hpp — Keyboard-driven rectangular copy region
// =============================================================================
// In selection mode the directional keys move a cell cursor over the terminal
// grid instead of reaching the remote side. The first confirm press pins the
// origin corner, further moves stretch the extent, the second confirm copies
// the rectangle between the two corners.
//
//   Idle --start()--> SelectingOrigin --finish_origin()--> SelectingExtent
//     ^                                                        |
//     +------------------------ reset() -----------------------+
//
// Moves are not bounds-checked here; the emulation engine clamps the region
// when it extracts text.
// =============================================================================

#include <string>

namespace keybridge
{

    struct GridPoint
    {
        int row = 0;
        int col = 0;

        bool operator==(const GridPoint &o) const
        {
            return row == o.row && col == o.col;
        }
        bool operator!=(const GridPoint &o) const { return !(*this == o); }
    };

    /// Inclusive rectangle, top <= bottom and left <= right.
    struct GridRegion
    {
        int top = 0;
        int left = 0;
        int bottom = 0;
        int right = 0;

        int rows() const { return bottom - top + 1; }
        int cols() const { return right - left + 1; }

        bool contains(int row, int col) const
        {
            return row >= top && row <= bottom && col >= left && col <= right;
        }
    };

    enum class Direction
    {
        Up,
        Down,
        Left,
        Right,
    };

    class SelectionArea
    {
    public:
        enum class Phase
        {
            Idle,
            SelectingOrigin,
            SelectingExtent,
        };

        /// Enter selection mode with the cursor at `at`.
        void start(GridPoint at);

        /// Move the cursor one cell. No-op when Idle.
        void step(Direction dir);

        /// SelectingOrigin -> SelectingExtent, pinning the origin at the
        /// cursor. Returns false (no change) in any other phase.
        bool finish_origin();

        /// Back to Idle, forgetting origin and extent.
        void reset();

        Phase phase() const { return phase_; }
        bool active() const { return phase_ != Phase::Idle; }
        bool selecting_origin() const { return phase_ == Phase::SelectingOrigin; }
        bool has_origin() const { return has_origin_; }

        GridPoint cursor() const { return cursor_; }
        GridPoint origin() const { return has_origin_ ? origin_ : cursor_; }

        /// Ordered rectangle between origin and cursor. While the origin is
        /// still being chosen this is the single cursor cell.
        GridRegion region() const;

    private:
        Phase phase_ = Phase::Idle;
        bool has_origin_ = false;
        GridPoint origin_;
        GridPoint cursor_;
    };

    const char *phase_name(SelectionArea::Phase phase);

} // namespace keybridge
