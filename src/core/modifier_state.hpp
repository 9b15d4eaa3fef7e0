#pragma once

// =============================================================================
// modifier_state.hpp — Momentary / locked Ctrl, Alt, Shift, right-Shift
// =============================================================================
// Each modifier has two flags: `on` (momentary, consumed by the next
// character) and `lock` (sticky until toggled off). press() cycles
//   off -> on -> lock -> off
// so a modifier key tapped once affects one character, tapped twice stays
// on, tapped three times is released.
// =============================================================================

#include <array>
#include <string>

namespace keybridge
{

    enum class Modifier
    {
        Ctrl = 0,
        Alt = 1,
        Shift = 2,
        RightShift = 3,
    };

    constexpr int kModifierCount = 4;

    const char *modifier_name(Modifier m);

    struct ModifierBits
    {
        bool on = false;
        bool lock = false;

        bool active() const { return on || lock; }

        bool operator==(const ModifierBits &o) const
        {
            return on == o.on && lock == o.lock;
        }
        bool operator!=(const ModifierBits &o) const { return !(*this == o); }
    };

    // -------------------------------------------------------------------------
    // Modifier mask understood by EmulationEngine::dispatch_*_key.
    // -------------------------------------------------------------------------
    constexpr int kKeyControl = 0x01;
    constexpr int kKeyShift = 0x02;
    constexpr int kKeyAlt = 0x04;

    class ModifierState
    {
    public:
        /// 3-stage cycle: off -> on -> lock -> off.
        void press(Modifier m);

        bool is_active(Modifier m) const { return bits_[index(m)].active(); }
        bool is_on(Modifier m) const { return bits_[index(m)].on; }
        bool is_locked(Modifier m) const { return bits_[index(m)].lock; }

        void clear_on(Modifier m) { bits_[index(m)].on = false; }

        /// Drop every momentary flag. Locked modifiers stay active.
        void clear_transient();

        /// Drop every lock flag, leaving momentary flags alone.
        void clear_locks();

        /// Back to all-off.
        void clear_all();

        bool any_active() const;

        /// Ctrl/Shift/Alt folded into kKey* flags for the emulation engine.
        int buffer_state() const;

        /// Status-line text such as "CTRL alt* SHIFT". Upper case is
        /// momentary, a trailing '*' marks a lock. Empty when nothing is set.
        std::string describe() const;

        bool operator==(const ModifierState &o) const { return bits_ == o.bits_; }
        bool operator!=(const ModifierState &o) const { return !(*this == o); }

    private:
        static int index(Modifier m) { return static_cast<int>(m); }

        std::array<ModifierBits, kModifierCount> bits_{};
    };

} // namespace keybridge
