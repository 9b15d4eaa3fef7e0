// =============================================================================
// key_event.cpp — Key code names and helpers
// =============================================================================

#include "key_event.hpp"

namespace keybridge
{

    const char *key_name(KeyCode code)
    {
        switch (code)
        {
        case KeyCode::Unknown: return "Unknown";
        case KeyCode::Num0: return "0";
        case KeyCode::Num1: return "1";
        case KeyCode::Num2: return "2";
        case KeyCode::Num3: return "3";
        case KeyCode::Num4: return "4";
        case KeyCode::Num5: return "5";
        case KeyCode::Num6: return "6";
        case KeyCode::Num7: return "7";
        case KeyCode::Num8: return "8";
        case KeyCode::Num9: return "9";
        case KeyCode::A: return "A";
        case KeyCode::B: return "B";
        case KeyCode::C: return "C";
        case KeyCode::D: return "D";
        case KeyCode::E: return "E";
        case KeyCode::F: return "F";
        case KeyCode::G: return "G";
        case KeyCode::H: return "H";
        case KeyCode::I: return "I";
        case KeyCode::J: return "J";
        case KeyCode::K: return "K";
        case KeyCode::L: return "L";
        case KeyCode::M: return "M";
        case KeyCode::N: return "N";
        case KeyCode::O: return "O";
        case KeyCode::P: return "P";
        case KeyCode::Q: return "Q";
        case KeyCode::R: return "R";
        case KeyCode::S: return "S";
        case KeyCode::T: return "T";
        case KeyCode::U: return "U";
        case KeyCode::V: return "V";
        case KeyCode::W: return "W";
        case KeyCode::X: return "X";
        case KeyCode::Y: return "Y";
        case KeyCode::Z: return "Z";
        case KeyCode::Space: return "Space";
        case KeyCode::Tab: return "Tab";
        case KeyCode::Comma: return "Comma";
        case KeyCode::Period: return "Period";
        case KeyCode::Minus: return "Minus";
        case KeyCode::Equals: return "Equals";
        case KeyCode::Slash: return "Slash";
        case KeyCode::Backslash: return "Backslash";
        case KeyCode::Semicolon: return "Semicolon";
        case KeyCode::Apostrophe: return "Apostrophe";
        case KeyCode::LeftBracket: return "LeftBracket";
        case KeyCode::RightBracket: return "RightBracket";
        case KeyCode::Grave: return "Grave";
        case KeyCode::Enter: return "Enter";
        case KeyCode::Del: return "Del";
        case KeyCode::DpadUp: return "DpadUp";
        case KeyCode::DpadDown: return "DpadDown";
        case KeyCode::DpadLeft: return "DpadLeft";
        case KeyCode::DpadRight: return "DpadRight";
        case KeyCode::DpadCenter: return "DpadCenter";
        case KeyCode::ShiftLeft: return "ShiftLeft";
        case KeyCode::ShiftRight: return "ShiftRight";
        case KeyCode::AltLeft: return "AltLeft";
        case KeyCode::AltRight: return "AltRight";
        case KeyCode::CtrlLeft: return "CtrlLeft";
        case KeyCode::CtrlRight: return "CtrlRight";
        case KeyCode::Search: return "Search";
        case KeyCode::DeviceShortcut: return "DeviceShortcut";
        case KeyCode::VolumeUp: return "VolumeUp";
        case KeyCode::VolumeDown: return "VolumeDown";
        }
        return "?";
    }

    int digit_value(KeyCode code)
    {
        if (code >= KeyCode::Num0 && code <= KeyCode::Num9)
            return static_cast<int>(code) - static_cast<int>(KeyCode::Num0);
        return -1;
    }

} // namespace keybridge
