// =============================================================================
// vt_key_emulator.cpp — Named terminal keys → xterm escape sequences
// =============================================================================

#include "vt_key_emulator.hpp"
#include "../core/modifier_state.hpp"

#include <algorithm>

namespace keybridge
{

    namespace
    {
        // xterm modifier parameter: 1 + shift(1) + alt(2) + ctrl(4)
        int modifier_param(int modifiers)
        {
            int m = 1;
            if (modifiers & kKeyShift)
                m += 1;
            if (modifiers & kKeyAlt)
                m += 2;
            if (modifiers & kKeyControl)
                m += 4;
            return m;
        }

        std::string cursor_key(char final, int modifiers)
        {
            int m = modifier_param(modifiers);
            if (m == 1)
                return std::string("\033[") + final;
            return "\033[1;" + std::to_string(m) + final;
        }

        // F1-F4 are SS3 P..S, the rest CSI n ~
        std::string function_key(int n, int modifiers)
        {
            static const int tilde_codes[] = {0, 0, 0, 0, 15, 17, 18, 19, 20, 21, 23, 24};
            int m = modifier_param(modifiers);

            if (n <= 4)
            {
                char final = static_cast<char>('P' + (n - 1));
                if (m == 1)
                    return std::string("\033O") + final;
                return "\033[1;" + std::to_string(m) + final;
            }

            std::string seq = "\033[" + std::to_string(tilde_codes[n - 1]);
            if (m != 1)
                seq += ";" + std::to_string(m);
            return seq + "~";
        }
    }

    VtKeyEmulator::VtKeyEmulator(Transport &transport, const ScreenBuffer &screen)
        : transport_(transport), screen_(screen)
    {
    }

    std::string VtKeyEmulator::sequence_for(TerminalKey key, int modifiers)
    {
        bool alt = (modifiers & kKeyAlt) != 0;

        switch (key)
        {
        case TerminalKey::Escape:
            return "\x1b";

        case TerminalKey::Enter:
            return alt ? "\033\r" : "\r";

        case TerminalKey::Backspace:
            if (modifiers & kKeyControl)
                return "\x08";
            return alt ? "\033\x7f" : "\x7f";

        case TerminalKey::Up:
            return cursor_key('A', modifiers);
        case TerminalKey::Down:
            return cursor_key('B', modifiers);
        case TerminalKey::Right:
            return cursor_key('C', modifiers);
        case TerminalKey::Left:
            return cursor_key('D', modifiers);

        default:
            break;
        }

        int n = static_cast<int>(key) - static_cast<int>(TerminalKey::F1) + 1;
        return function_key(n, modifiers);
    }

    void VtKeyEmulator::dispatch_named_key(TerminalKey key, char32_t /*placeholder*/,
                                           int modifiers)
    {
        transport_.write(sequence_for(key, modifiers));
    }

    void VtKeyEmulator::dispatch_typed_key(TerminalKey key, char32_t /*placeholder*/,
                                           int modifiers)
    {
        // A typed key is a single logical keystroke: only Alt survives, as
        // an ESC prefix.
        std::string seq = sequence_for(key, 0);
        if ((modifiers & kKeyAlt) && key != TerminalKey::Escape)
            seq = "\x1b" + seq;
        transport_.write(seq);
    }

    std::string VtKeyEmulator::copy_region(const GridRegion &region) const
    {
        return screen_.extract_text(region);
    }

    GridPoint VtKeyEmulator::cursor_position() const
    {
        GridPoint p;
        p.row = screen_.cursor_row;
        p.col = std::min(screen_.cursor_col, screen_.get_cols() - 1);
        return p;
    }

} // namespace keybridge
