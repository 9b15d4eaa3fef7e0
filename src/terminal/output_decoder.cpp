// =============================================================================
// output_decoder.cpp — Remote output bytes → ScreenBuffer text
// =============================================================================

#include "output_decoder.hpp"

#include <cstdlib>

namespace keybridge
{

    OutputDecoder::OutputDecoder(ScreenBuffer &buffer) : buffer_(buffer) {}

    void OutputDecoder::feed(const std::string &data)
    {
        for (char byte : data)
        {
            unsigned char ch = static_cast<unsigned char>(byte);

            switch (state_)
            {
            case State::Ground:
                handle_ground(ch);
                break;
            case State::Escape:
                handle_escape(ch);
                break;
            case State::Csi:
                handle_csi(ch);
                break;
            case State::Osc:
            case State::Dcs:
                // Consume everything until BEL or the ESC of ST
                if (ch == 0x07)
                    state_ = State::Ground;
                else if (ch == 0x1B)
                    state_ = State::Escape;
                break;
            }
        }
    }

    // -------------------------------------------------------------------------
    // Ground: text, C0 controls, UTF-8
    // -------------------------------------------------------------------------

    void OutputDecoder::handle_ground(unsigned char ch)
    {
        if (utf8_remaining_ > 0)
        {
            if ((ch & 0xC0) == 0x80)
            {
                utf8_codepoint_ = (utf8_codepoint_ << 6) | (ch & 0x3F);
                if (--utf8_remaining_ == 0)
                    buffer_.put_char(utf8_codepoint_);
                return;
            }
            // Broken sequence: drop it and look at this byte afresh
            utf8_remaining_ = 0;
            utf8_codepoint_ = 0;
        }

        switch (ch)
        {
        case 0x1B:
            state_ = State::Escape;
            return;
        case '\r':
            buffer_.carriage_return();
            return;
        case '\n':
            buffer_.newline();
            return;
        case '\b':
            buffer_.backspace();
            return;
        case '\t':
            buffer_.tab();
            return;
        case 0x07:
            if (on_bell)
                on_bell();
            return;
        }

        if (ch < 0x20 || ch == 0x7F)
            return;

        if (ch < 0x80)
        {
            buffer_.put_char(static_cast<char32_t>(ch));
        }
        else if ((ch & 0xE0) == 0xC0)
        {
            utf8_codepoint_ = ch & 0x1F;
            utf8_remaining_ = 1;
        }
        else if ((ch & 0xF0) == 0xE0)
        {
            utf8_codepoint_ = ch & 0x0F;
            utf8_remaining_ = 2;
        }
        else if ((ch & 0xF8) == 0xF0)
        {
            utf8_codepoint_ = ch & 0x07;
            utf8_remaining_ = 3;
        }
    }

    // -------------------------------------------------------------------------
    // ESC
    // -------------------------------------------------------------------------

    void OutputDecoder::handle_escape(unsigned char ch)
    {
        switch (ch)
        {
        case '[':
            csi_params_.clear();
            state_ = State::Csi;
            return;
        case ']':
            state_ = State::Osc;
            return;
        case 'P':
            state_ = State::Dcs;
            return;
        default:
            // Two-byte sequences (ESC 7, ESC M, ESC \ ...) carry no text
            state_ = State::Ground;
            return;
        }
    }

    // -------------------------------------------------------------------------
    // CSI
    // -------------------------------------------------------------------------

    void OutputDecoder::handle_csi(unsigned char ch)
    {
        if (ch >= 0x40 && ch <= 0x7E)
        {
            dispatch_csi(ch);
            state_ = State::Ground;
            return;
        }
        if (ch >= 0x20)
            csi_params_ += static_cast<char>(ch);
        else
            state_ = State::Ground; // C0 inside CSI aborts it
    }

    std::vector<int> OutputDecoder::parse_params() const
    {
        std::vector<int> params;
        std::string current;
        for (char c : csi_params_)
        {
            if (c == ';')
            {
                params.push_back(current.empty() ? 0 : std::atoi(current.c_str()));
                current.clear();
            }
            else if (c >= '0' && c <= '9')
            {
                current += c;
            }
        }
        params.push_back(current.empty() ? 0 : std::atoi(current.c_str()));
        return params;
    }

    void OutputDecoder::dispatch_csi(unsigned char cmd)
    {
        // Private-mode sequences (ESC [ ? ...) never move text
        if (!csi_params_.empty() && csi_params_[0] == '?')
            return;

        std::vector<int> p = parse_params();

        switch (cmd)
        {
        case 'H':
        case 'f':
        {
            int row = p.size() > 0 && p[0] > 0 ? p[0] : 1;
            int col = p.size() > 1 && p[1] > 0 ? p[1] : 1;
            buffer_.move_cursor(row - 1, col - 1);
            break;
        }
        case 'J':
            if (p[0] == 2 || p[0] == 3)
                buffer_.clear();
            break;
        case 'K':
            if (p[0] == 0)
                buffer_.erase_line_to_end();
            break;
        default:
            break;
        }
    }

} // namespace keybridge
