#pragma once

// =============================================================================
// output_decoder.hpp — Remote output bytes → ScreenBuffer text
// =============================================================================
// A small state machine over the byte stream coming back from the remote
// side. It decodes UTF-8, applies the C0 controls that move the cursor, and
// understands just enough CSI (cursor position, erase display / line) to keep
// the copy-out grid in step with a shell prompt. All other escape sequences
// are consumed and dropped.
// =============================================================================

#include "screen_buffer.hpp"

#include <functional>
#include <string>
#include <vector>

namespace keybridge
{

    class OutputDecoder
    {
    public:
        explicit OutputDecoder(ScreenBuffer &buffer);

        /// Feed raw bytes. Partial sequences carry over to the next call.
        void feed(const std::string &data);

        /// Called for BEL.
        std::function<void()> on_bell;

    private:
        enum class State
        {
            Ground,
            Escape,
            Csi,
            Osc,
            Dcs,
        };

        State state_ = State::Ground;
        ScreenBuffer &buffer_;

        std::string csi_params_;

        char32_t utf8_codepoint_ = 0;
        int utf8_remaining_ = 0;

        void handle_ground(unsigned char ch);
        void handle_escape(unsigned char ch);
        void handle_csi(unsigned char ch);
        void dispatch_csi(unsigned char cmd);

        std::vector<int> parse_params() const;
    };

} // namespace keybridge
