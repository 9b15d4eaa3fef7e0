#pragma once

// =============================================================================
// byte_encoder.hpp — Printed character → bytes for the remote side
// =============================================================================
// Two steps:
//   resolve()  folds the modifier machine into the character a key prints:
//              Shift/Alt select the layout glyph, Ctrl maps it into the C0
//              range.
//   encode()   turns the resolved value into bytes: one byte below 0x80,
//              otherwise the character in the configured charset.
// =============================================================================

#include "modifier_state.hpp"
#include "../input/key_character_map.hpp"

#include <SDL2/SDL.h>

#include <string>

namespace keybridge
{

    /// Control-character algebra:
    ///   a..z -> 0x01..0x1A, A..Z [ \ ] ^ _ -> 0x01..0x1F,
    ///   ' ' -> NUL, '?' -> DEL, anything else unchanged.
    char32_t ctrl_map(char32_t key);

    /// Append `cp` to `out` as UTF-8. Values past U+10FFFF are dropped.
    void append_utf8(std::string &out, char32_t cp);

    class ByteEncoder
    {
    public:
        struct Resolved
        {
            char32_t key = 0;
            bool redraw = false; // a modifier was consumed or applied
        };

        /// Throws EncodingError if `charset` cannot be converted to.
        explicit ByteEncoder(const std::string &charset = "UTF-8");
        ~ByteEncoder();

        ByteEncoder(const ByteEncoder &) = delete;
        ByteEncoder &operator=(const ByteEncoder &) = delete;

        /// Throws EncodingError and keeps the previous charset on failure.
        void set_charset(const std::string &charset);
        const std::string &charset() const { return charset_; }

        /// Character printed by `code`. Momentary Shift/Alt/Ctrl are
        /// cleared here when `soft` is set (soft keyboards send no key-up).
        /// `native_meta` with kMetaCtrlOn also triggers the Ctrl algebra.
        Resolved resolve(KeyCode code, int native_meta, ModifierState &mods,
                         bool soft, const KeyCharacterMap &keymap) const;

        /// Bytes for one resolved value.
        std::string encode(char32_t value) const;

        /// Bytes for a UTF-8 text batch, no modifier logic.
        std::string encode_text(const std::string &utf8) const;

    private:
        std::string charset_;
        SDL_iconv_t cd_ = nullptr; // nullptr while the charset is UTF-8

        std::string convert(const std::string &utf8) const;
    };

    bool is_utf8_charset(const std::string &charset);

} // namespace keybridge
