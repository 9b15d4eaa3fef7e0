#pragma once

// =============================================================================
// key_event.hpp — Device-neutral key codes and key events
// =============================================================================
// A KeyEvent is what an input source (SDL, a test, a remote keyboard) hands
// to the dispatcher: the key, whether it went down, up, or delivered a batch
// of composed characters, how often it auto-repeated, and the device's own
// modifier flags at the time of the event.
// =============================================================================

#include <cstdint>
#include <string>

namespace keybridge
{

    enum class KeyCode
    {
        Unknown,

        // Digits
        Num0, Num1, Num2, Num3, Num4, Num5, Num6, Num7, Num8, Num9,

        // Letters
        A, B, C, D, E, F, G, H, I, J, K, L, M,
        N, O, P, Q, R, S, T, U, V, W, X, Y, Z,

        // Punctuation
        Space, Tab, Comma, Period, Minus, Equals, Slash, Backslash,
        Semicolon, Apostrophe, LeftBracket, RightBracket, Grave,

        // Editing
        Enter, Del,

        // Directional pad
        DpadUp, DpadDown, DpadLeft, DpadRight, DpadCenter,

        // Modifier keys
        ShiftLeft, ShiftRight, AltLeft, AltRight, CtrlLeft, CtrlRight,

        // Device keys
        Search,
        DeviceShortcut, // camera-style programmable button
        VolumeUp,
        VolumeDown,
    };

    enum class KeyAction
    {
        Down,
        Up,
        Multiple, // composed text batch (input method)
    };

    // -------------------------------------------------------------------------
    // Device-native modifier flags as reported by the input source.
    // Bits above kMetaPrintableMask never affect which glyph a key produces.
    // -------------------------------------------------------------------------
    constexpr int kMetaShiftOn = 0x01;
    constexpr int kMetaAltOn = 0x02;
    constexpr int kMetaCtrlOn = 0x1000;
    constexpr int kMetaCapsLockOn = 0x100000;

    constexpr int kMetaPrintableMask = 0xfff;

    struct KeyEvent
    {
        KeyCode code = KeyCode::Unknown;
        KeyAction action = KeyAction::Down;
        int repeat_count = 0;
        int meta_state = 0;     // kMeta* flags
        std::string characters; // UTF-8, only for KeyAction::Multiple

        static KeyEvent down(KeyCode code, int meta = 0, int repeat = 0)
        {
            KeyEvent e;
            e.code = code;
            e.action = KeyAction::Down;
            e.meta_state = meta;
            e.repeat_count = repeat;
            return e;
        }

        static KeyEvent up(KeyCode code, int meta = 0)
        {
            KeyEvent e;
            e.code = code;
            e.action = KeyAction::Up;
            e.meta_state = meta;
            return e;
        }

        static KeyEvent text(const std::string &utf8)
        {
            KeyEvent e;
            e.code = KeyCode::Unknown;
            e.action = KeyAction::Multiple;
            e.characters = utf8;
            return e;
        }
    };

    /// Human-readable key name ("A", "DpadLeft", ...), used in log lines.
    const char *key_name(KeyCode code);

    /// Num0..Num9 -> 0..9, anything else -> -1.
    int digit_value(KeyCode code);

} // namespace keybridge
