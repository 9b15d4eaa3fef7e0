// =============================================================================
// selection_area.cpp — Keyboard-driven rectangular copy region
// =============================================================================

#include "selection_area.hpp"

#include <algorithm>

namespace keybridge
{

    void SelectionArea::start(GridPoint at)
    {
        phase_ = Phase::SelectingOrigin;
        has_origin_ = false;
        origin_ = GridPoint{};
        cursor_ = at;
    }

    void SelectionArea::step(Direction dir)
    {
        if (phase_ == Phase::Idle)
            return;

        switch (dir)
        {
        case Direction::Up:
            --cursor_.row;
            break;
        case Direction::Down:
            ++cursor_.row;
            break;
        case Direction::Left:
            --cursor_.col;
            break;
        case Direction::Right:
            ++cursor_.col;
            break;
        }
    }

    bool SelectionArea::finish_origin()
    {
        if (phase_ != Phase::SelectingOrigin)
            return false;

        origin_ = cursor_;
        has_origin_ = true;
        phase_ = Phase::SelectingExtent;
        return true;
    }

    void SelectionArea::reset()
    {
        phase_ = Phase::Idle;
        has_origin_ = false;
        origin_ = GridPoint{};
        cursor_ = GridPoint{};
    }

    GridRegion SelectionArea::region() const
    {
        GridPoint a = origin();
        GridPoint b = cursor_;

        GridRegion r;
        r.top = std::min(a.row, b.row);
        r.bottom = std::max(a.row, b.row);
        r.left = std::min(a.col, b.col);
        r.right = std::max(a.col, b.col);
        return r;
    }

    const char *phase_name(SelectionArea::Phase phase)
    {
        switch (phase)
        {
        case SelectionArea::Phase::Idle:
            return "idle";
        case SelectionArea::Phase::SelectingOrigin:
            return "selecting-origin";
        case SelectionArea::Phase::SelectingExtent:
            return "selecting-extent";
        }
        return "?";
    }

} // namespace keybridge
