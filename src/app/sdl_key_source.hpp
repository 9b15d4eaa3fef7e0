#pragma once

// =============================================================================
// sdl_key_source.hpp — SDL keyboard events → KeyEvent
// =============================================================================
// Keydown/keyup events become Down/Up KeyEvents with SDL's modifier state
// folded into kMeta* flags. Text-input events carrying anything beyond plain
// ASCII (input-method compositions, dead-key results) become Multiple
// batches; plain ASCII text is ignored because the keydown already carried it.
// =============================================================================

#include "../input/key_event.hpp"

#include <SDL2/SDL.h>

namespace keybridge
{

    class SdlKeySource
    {
    public:
        /// Translate an SDL event. Returns false when it is not key input
        /// the dispatcher understands.
        static bool translate(const SDL_Event &event, KeyEvent &out);

        /// SDL key symbol → KeyCode (KeyCode::Unknown if unmapped).
        static KeyCode key_code(SDL_Keycode sym);

        /// SDL modifier flags → kMeta* flags.
        static int meta_state(Uint16 mod);
    };

} // namespace keybridge
