#pragma once

// =============================================================================
// key_character_map.hpp — Key code + modifier flags → printed character
// =============================================================================
// The dispatcher never hard-codes what a key prints. It asks a
// KeyCharacterMap whether a key is a printing key and which character it
// yields for a given set of device-native modifier flags. QwertyKeyMap is the
// built-in US layout; platforms with their own layout tables plug in another.
// =============================================================================

#include "key_event.hpp"

#include <unordered_map>

namespace keybridge
{

    class KeyCharacterMap
    {
    public:
        virtual ~KeyCharacterMap() = default;

        /// Does this key print a character (as opposed to navigation/modifier)?
        virtual bool is_printing_key(KeyCode code) const = 0;

        /// Character for `code` under `meta` (kMeta* flags). 0 if none.
        virtual char32_t get(KeyCode code, int meta) const = 0;
    };

    class QwertyKeyMap : public KeyCharacterMap
    {
    public:
        QwertyKeyMap();

        bool is_printing_key(KeyCode code) const override;
        char32_t get(KeyCode code, int meta) const override;

    private:
        struct Glyphs
        {
            char32_t base;
            char32_t shifted;
            char32_t alt; // 0 = same as the non-alt glyph
        };

        struct KeyCodeHash
        {
            size_t operator()(KeyCode code) const
            {
                return static_cast<size_t>(code);
            }
        };

        std::unordered_map<KeyCode, Glyphs, KeyCodeHash> table_;
    };

} // namespace keybridge
