// =============================================================================
// byte_encoder.cpp — Printed character → bytes for the remote side
// =============================================================================

#include "byte_encoder.hpp"
#include "../lib/errors/error.hpp"

#include <cctype>
#include <cstdint>

namespace keybridge
{

    namespace
    {
        const SDL_iconv_t kBadIconv = reinterpret_cast<SDL_iconv_t>(static_cast<intptr_t>(-1));

        // Length of the UTF-8 sequence introduced by `lead`.
        size_t utf8_length(unsigned char lead)
        {
            if (lead < 0x80)
                return 1;
            if ((lead & 0xE0) == 0xC0)
                return 2;
            if ((lead & 0xF0) == 0xE0)
                return 3;
            if ((lead & 0xF8) == 0xF0)
                return 4;
            return 1;
        }
    }

    char32_t ctrl_map(char32_t key)
    {
        if (key >= 0x61 && key <= 0x7A)
            return key - 0x60;
        if (key >= 0x41 && key <= 0x5F)
            return key - 0x40;
        if (key == 0x20)
            return 0x00;
        if (key == 0x3F)
            return 0x7F;
        return key;
    }

    void append_utf8(std::string &out, char32_t cp)
    {
        if (cp < 0x80)
        {
            out += static_cast<char>(cp);
        }
        else if (cp < 0x800)
        {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
        else if (cp < 0x10000)
        {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
        else if (cp < 0x110000)
        {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    bool is_utf8_charset(const std::string &charset)
    {
        std::string folded;
        for (char c : charset)
            if (c != '-' && c != '_')
                folded += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return folded == "utf8";
    }

    // =========================================================================
    // Construction / charset
    // =========================================================================

    ByteEncoder::ByteEncoder(const std::string &charset)
    {
        set_charset(charset);
    }

    ByteEncoder::~ByteEncoder()
    {
        if (cd_)
            SDL_iconv_close(cd_);
    }

    void ByteEncoder::set_charset(const std::string &charset)
    {
        SDL_iconv_t next = nullptr;
        if (!is_utf8_charset(charset))
        {
            next = SDL_iconv_open(charset.c_str(), "UTF-8");
            if (next == kBadIconv)
                throw EncodingError(charset);
        }

        if (cd_)
            SDL_iconv_close(cd_);
        cd_ = next;
        charset_ = charset;
    }

    // =========================================================================
    // Modifier folding
    // =========================================================================

    ByteEncoder::Resolved ByteEncoder::resolve(KeyCode code, int native_meta,
                                               ModifierState &mods, bool soft,
                                               const KeyCharacterMap &keymap) const
    {
        Resolved out;
        int meta = native_meta;

        if (mods.is_active(Modifier::Shift))
        {
            meta |= kMetaShiftOn;
            if (soft)
                mods.clear_on(Modifier::Shift);
            out.redraw = true;
        }

        if (mods.is_active(Modifier::Alt))
        {
            meta |= kMetaAltOn;
            if (soft)
                mods.clear_on(Modifier::Alt);
            out.redraw = true;
        }

        // Ctrl and friends never select a glyph.
        out.key = keymap.get(code, meta & kMetaPrintableMask);

        bool ctrl = mods.is_active(Modifier::Ctrl);
        if (ctrl)
        {
            if (soft)
                mods.clear_on(Modifier::Ctrl);
            out.redraw = true;
        }
        if (ctrl || (native_meta & kMetaCtrlOn))
            out.key = ctrl_map(out.key);

        return out;
    }

    // =========================================================================
    // Emission
    // =========================================================================

    std::string ByteEncoder::encode(char32_t value) const
    {
        if (value < 0x80)
            return std::string(1, static_cast<char>(value));

        std::string utf8;
        append_utf8(utf8, value);
        return cd_ ? convert(utf8) : utf8;
    }

    std::string ByteEncoder::encode_text(const std::string &utf8) const
    {
        return cd_ ? convert(utf8) : utf8;
    }

    std::string ByteEncoder::convert(const std::string &utf8) const
    {
        // Reset shift state left over from the previous conversion.
        SDL_iconv(cd_, nullptr, nullptr, nullptr, nullptr);

        std::string out;
        char buf[64];

        const char *in = utf8.data();
        size_t in_left = utf8.size();

        while (in_left > 0)
        {
            char *dst = buf;
            size_t dst_left = sizeof(buf);
            size_t rc = SDL_iconv(cd_, &in, &in_left, &dst, &dst_left);
            out.append(buf, sizeof(buf) - dst_left);

            if (rc == SDL_ICONV_E2BIG)
                continue;
            if (rc == SDL_ICONV_EILSEQ)
            {
                // Not representable: substitute and skip the character.
                size_t len = utf8_length(static_cast<unsigned char>(*in));
                if (len > in_left)
                    len = in_left;
                in += len;
                in_left -= len;
                out += '?';
                continue;
            }
            if (rc == SDL_ICONV_EINVAL || rc == SDL_ICONV_ERROR)
                break; // truncated input
        }

        // Flush any trailing shift sequence.
        char *dst = buf;
        size_t dst_left = sizeof(buf);
        SDL_iconv(cd_, nullptr, nullptr, &dst, &dst_left);
        out.append(buf, sizeof(buf) - dst_left);

        return out;
    }

} // namespace keybridge
