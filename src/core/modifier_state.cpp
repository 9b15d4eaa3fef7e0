// =============================================================================
// modifier_state.cpp — Momentary / locked modifier machine
// =============================================================================

#include "modifier_state.hpp"

#include <cctype>

namespace keybridge
{

    const char *modifier_name(Modifier m)
    {
        switch (m)
        {
        case Modifier::Ctrl:
            return "ctrl";
        case Modifier::Alt:
            return "alt";
        case Modifier::Shift:
            return "shift";
        case Modifier::RightShift:
            return "rshift";
        }
        return "?";
    }

    void ModifierState::press(Modifier m)
    {
        ModifierBits &b = bits_[index(m)];

        if (b.lock)
        {
            b.lock = false;
            b.on = false;
        }
        else if (b.on)
        {
            b.on = false;
            b.lock = true;
        }
        else
        {
            b.on = true;
        }
    }

    void ModifierState::clear_transient()
    {
        for (auto &b : bits_)
            b.on = false;
    }

    void ModifierState::clear_locks()
    {
        for (auto &b : bits_)
            b.lock = false;
    }

    void ModifierState::clear_all()
    {
        for (auto &b : bits_)
            b = ModifierBits{};
    }

    bool ModifierState::any_active() const
    {
        for (const auto &b : bits_)
            if (b.active())
                return true;
        return false;
    }

    int ModifierState::buffer_state() const
    {
        int state = 0;
        if (is_active(Modifier::Ctrl))
            state |= kKeyControl;
        if (is_active(Modifier::Shift))
            state |= kKeyShift;
        if (is_active(Modifier::Alt))
            state |= kKeyAlt;
        return state;
    }

    std::string ModifierState::describe() const
    {
        std::string out;
        for (int i = 0; i < kModifierCount; ++i)
        {
            const ModifierBits &b = bits_[i];
            if (!b.active())
                continue;

            std::string name = modifier_name(static_cast<Modifier>(i));
            if (b.on)
                for (auto &c : name)
                    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            if (b.lock)
                name += '*';

            if (!out.empty())
                out += ' ';
            out += name;
        }
        return out;
    }

} // namespace keybridge
