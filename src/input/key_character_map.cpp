// =============================================================================
// key_character_map.cpp — Built-in US QWERTY character map
// =============================================================================
// The Alt layer follows the handset keyboards this layout was modelled on:
// the top letter row yields digits, the middle row common shell symbols.
// =============================================================================

#include "key_character_map.hpp"

namespace keybridge
{

    QwertyKeyMap::QwertyKeyMap()
    {
        // ---- Letters ----
        static const char32_t top_row_alt[] = {U'1', U'2', U'3', U'4', U'5',
                                               U'6', U'7', U'8', U'9', U'0'};
        static const KeyCode top_row[] = {KeyCode::Q, KeyCode::W, KeyCode::E,
                                          KeyCode::R, KeyCode::T, KeyCode::Y,
                                          KeyCode::U, KeyCode::I, KeyCode::O,
                                          KeyCode::P};

        for (int i = 0; i < 26; ++i)
        {
            KeyCode code = static_cast<KeyCode>(static_cast<int>(KeyCode::A) + i);
            char32_t lower = static_cast<char32_t>(U'a' + i);
            char32_t upper = static_cast<char32_t>(U'A' + i);
            table_[code] = {lower, upper, 0};
        }
        for (int i = 0; i < 10; ++i)
            table_[top_row[i]].alt = top_row_alt[i];

        table_[KeyCode::A].alt = U'@';
        table_[KeyCode::S].alt = U'#';
        table_[KeyCode::D].alt = U'$';
        table_[KeyCode::F].alt = U'%';
        table_[KeyCode::G].alt = U'&';
        table_[KeyCode::H].alt = U'*';
        table_[KeyCode::J].alt = U'|';
        table_[KeyCode::K].alt = U'~';
        table_[KeyCode::L].alt = U'`';

        // ---- Digits ----
        static const char32_t digit_shift[] = {U')', U'!', U'@', U'#', U'$',
                                               U'%', U'^', U'&', U'*', U'('};
        for (int i = 0; i < 10; ++i)
        {
            KeyCode code = static_cast<KeyCode>(static_cast<int>(KeyCode::Num0) + i);
            table_[code] = {static_cast<char32_t>(U'0' + i), digit_shift[i], 0};
        }

        // ---- Punctuation ----
        table_[KeyCode::Space] = {U' ', U' ', 0};
        table_[KeyCode::Tab] = {U'\t', U'\t', 0};
        table_[KeyCode::Comma] = {U',', U'<', 0};
        table_[KeyCode::Period] = {U'.', U'>', 0};
        table_[KeyCode::Minus] = {U'-', U'_', 0};
        table_[KeyCode::Equals] = {U'=', U'+', 0};
        table_[KeyCode::Slash] = {U'/', U'?', 0};
        table_[KeyCode::Backslash] = {U'\\', U'|', 0};
        table_[KeyCode::Semicolon] = {U';', U':', 0};
        table_[KeyCode::Apostrophe] = {U'\'', U'"', 0};
        table_[KeyCode::LeftBracket] = {U'[', U'{', 0};
        table_[KeyCode::RightBracket] = {U']', U'}', 0};
        table_[KeyCode::Grave] = {U'`', U'~', 0};
    }

    bool QwertyKeyMap::is_printing_key(KeyCode code) const
    {
        // Space and Tab are whitespace, not "printing" in the layout sense;
        // the dispatcher adds them itself.
        if (code == KeyCode::Space || code == KeyCode::Tab)
            return false;
        return table_.count(code) != 0;
    }

    char32_t QwertyKeyMap::get(KeyCode code, int meta) const
    {
        auto it = table_.find(code);
        if (it == table_.end())
            return 0;

        const Glyphs &g = it->second;
        if ((meta & kMetaAltOn) && g.alt != 0)
            return g.alt;
        if (meta & kMetaShiftOn)
            return g.shifted;
        return g.base;
    }

} // namespace keybridge
