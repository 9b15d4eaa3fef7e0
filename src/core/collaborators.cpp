// =============================================================================
// collaborators.cpp — Names for terminal keys
// =============================================================================

#include "collaborators.hpp"

namespace keybridge
{

    const char *terminal_key_name(TerminalKey key)
    {
        switch (key)
        {
        case TerminalKey::Escape: return "Escape";
        case TerminalKey::Enter: return "Enter";
        case TerminalKey::Backspace: return "Backspace";
        case TerminalKey::Up: return "Up";
        case TerminalKey::Down: return "Down";
        case TerminalKey::Left: return "Left";
        case TerminalKey::Right: return "Right";
        case TerminalKey::F1: return "F1";
        case TerminalKey::F2: return "F2";
        case TerminalKey::F3: return "F3";
        case TerminalKey::F4: return "F4";
        case TerminalKey::F5: return "F5";
        case TerminalKey::F6: return "F6";
        case TerminalKey::F7: return "F7";
        case TerminalKey::F8: return "F8";
        case TerminalKey::F9: return "F9";
        case TerminalKey::F10: return "F10";
        case TerminalKey::F11: return "F11";
        case TerminalKey::F12: return "F12";
        }
        return "?";
    }

} // namespace keybridge
