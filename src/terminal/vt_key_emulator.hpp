#pragma once

// =============================================================================
// vt_key_emulator.hpp — Named terminal keys → xterm escape sequences
// =============================================================================
// The EmulationEngine used by the front end. Keys become the sequences an
// xterm-compatible remote expects and are written straight to the transport;
// copy-out reads the ScreenBuffer that the OutputDecoder keeps current.
// =============================================================================

#include "screen_buffer.hpp"
#include "../core/collaborators.hpp"

#include <string>

namespace keybridge
{

    class VtKeyEmulator : public EmulationEngine
    {
    public:
        VtKeyEmulator(Transport &transport, const ScreenBuffer &screen);

        void dispatch_named_key(TerminalKey key, char32_t placeholder,
                                int modifiers) override;
        void dispatch_typed_key(TerminalKey key, char32_t placeholder,
                                int modifiers) override;

        std::string copy_region(const GridRegion &region) const override;
        GridPoint cursor_position() const override;

        /// Sequence for `key` with kKey* `modifiers` applied the xterm way:
        /// CSI 1;<m> for cursor and function keys, ESC prefix for Alt on
        /// single-byte keys.
        static std::string sequence_for(TerminalKey key, int modifiers);

    private:
        Transport &transport_;
        const ScreenBuffer &screen_;
    };

} // namespace keybridge
