// =============================================================================
// sdl_key_source.cpp — SDL keyboard events → KeyEvent
// =============================================================================

#include "sdl_key_source.hpp"

#include <cstring>

namespace keybridge
{

    KeyCode SdlKeySource::key_code(SDL_Keycode sym)
    {
        if (sym >= SDLK_a && sym <= SDLK_z)
            return static_cast<KeyCode>(static_cast<int>(KeyCode::A) + (sym - SDLK_a));
        if (sym >= SDLK_0 && sym <= SDLK_9)
            return static_cast<KeyCode>(static_cast<int>(KeyCode::Num0) + (sym - SDLK_0));

        switch (sym)
        {
        // ---- Punctuation ----
        case SDLK_SPACE: return KeyCode::Space;
        case SDLK_TAB: return KeyCode::Tab;
        case SDLK_COMMA: return KeyCode::Comma;
        case SDLK_PERIOD: return KeyCode::Period;
        case SDLK_MINUS: return KeyCode::Minus;
        case SDLK_EQUALS: return KeyCode::Equals;
        case SDLK_SLASH: return KeyCode::Slash;
        case SDLK_BACKSLASH: return KeyCode::Backslash;
        case SDLK_SEMICOLON: return KeyCode::Semicolon;
        case SDLK_QUOTE: return KeyCode::Apostrophe;
        case SDLK_LEFTBRACKET: return KeyCode::LeftBracket;
        case SDLK_RIGHTBRACKET: return KeyCode::RightBracket;
        case SDLK_BACKQUOTE: return KeyCode::Grave;

        // ---- Editing ----
        case SDLK_RETURN:
        case SDLK_KP_ENTER:
            return KeyCode::Enter;
        case SDLK_BACKSPACE:
            return KeyCode::Del;

        // ---- Directional pad ----
        case SDLK_UP: return KeyCode::DpadUp;
        case SDLK_DOWN: return KeyCode::DpadDown;
        case SDLK_LEFT: return KeyCode::DpadLeft;
        case SDLK_RIGHT: return KeyCode::DpadRight;
        case SDLK_KP_5:
        case SDLK_SELECT:
            return KeyCode::DpadCenter;

        // ---- Modifiers ----
        case SDLK_LSHIFT: return KeyCode::ShiftLeft;
        case SDLK_RSHIFT: return KeyCode::ShiftRight;
        case SDLK_LALT: return KeyCode::AltLeft;
        case SDLK_RALT: return KeyCode::AltRight;
        case SDLK_LCTRL: return KeyCode::CtrlLeft;
        case SDLK_RCTRL: return KeyCode::CtrlRight;

        // ---- Device keys ----
        // Escape plays the role of the handset's search key: it sends ESC.
        case SDLK_ESCAPE:
        case SDLK_AC_SEARCH:
            return KeyCode::Search;
        case SDLK_APPLICATION:
        case SDLK_MENU:
            return KeyCode::DeviceShortcut;
        case SDLK_VOLUMEUP:
        case SDLK_KP_PLUS:
            return KeyCode::VolumeUp;
        case SDLK_VOLUMEDOWN:
        case SDLK_KP_MINUS:
            return KeyCode::VolumeDown;

        default:
            return KeyCode::Unknown;
        }
    }

    int SdlKeySource::meta_state(Uint16 mod)
    {
        int meta = 0;
        if (mod & KMOD_SHIFT)
            meta |= kMetaShiftOn;
        if (mod & KMOD_ALT)
            meta |= kMetaAltOn;
        if (mod & KMOD_CTRL)
            meta |= kMetaCtrlOn;
        if (mod & KMOD_CAPS)
            meta |= kMetaCapsLockOn;
        return meta;
    }

    bool SdlKeySource::translate(const SDL_Event &event, KeyEvent &out)
    {
        if (event.type == SDL_KEYDOWN || event.type == SDL_KEYUP)
        {
            KeyCode code = key_code(event.key.keysym.sym);
            if (code == KeyCode::Unknown)
                return false;

            out = KeyEvent{};
            out.code = code;
            out.action = event.type == SDL_KEYDOWN ? KeyAction::Down : KeyAction::Up;
            out.repeat_count = event.key.repeat ? 1 : 0;
            out.meta_state = meta_state(event.key.keysym.mod);
            return true;
        }

        if (event.type == SDL_TEXTINPUT)
        {
            const char *text = event.text.text;
            size_t len = std::strlen(text);
            bool plain_ascii = true;
            for (size_t i = 0; i < len; ++i)
                if (static_cast<unsigned char>(text[i]) >= 0x80)
                    plain_ascii = false;

            if (len == 0 || plain_ascii)
                return false;

            out = KeyEvent::text(text);
            return true;
        }

        return false;
    }

} // namespace keybridge
