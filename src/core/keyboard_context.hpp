#pragma once

// =============================================================================
// keyboard_context.hpp — Per-event snapshot of keyboard configuration
// =============================================================================

#include "../config/settings.hpp"

#include <string>

namespace keybridge
{

    struct KeyboardContext
    {
        bool hardware_present = false;
        bool hardware_hidden = false;
        KeymapProfile keymap = KeymapProfile::RightSide;
        std::string encoding = "UTF-8";

        /// Physical keys are usable: present and not slid away.
        bool hardware_visible() const { return hardware_present && !hardware_hidden; }

        /// Soft keyboard (or a hidden physical one): no key-up events arrive
        /// to clear momentary modifiers.
        bool soft() const { return !hardware_visible(); }
    };

} // namespace keybridge
