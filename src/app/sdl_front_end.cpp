// =============================================================================
// sdl_front_end.cpp — SDL2 window as the key core's UI collaborators
// =============================================================================

#include "sdl_front_end.hpp"
#include "../lib/log/log.hpp"

#include <algorithm>
#include <sstream>

namespace keybridge
{

    static const char *TAG = "ui";

    SdlFrontEnd::SdlFrontEnd(SDL_Window *window, bool hardware_present)
        : window_(window), hardware_present_(hardware_present)
    {
        // Haptics are optional: no device simply means no buzz.
        if (SDL_InitSubSystem(SDL_INIT_HAPTIC) == 0 && SDL_NumHaptics() > 0)
        {
            haptic_ = SDL_HapticOpen(0);
            if (haptic_ && SDL_HapticRumbleInit(haptic_) != 0)
            {
                SDL_HapticClose(haptic_);
                haptic_ = nullptr;
            }
        }
        log::LineBuilder(log::Level::Debug, TAG)
            << "haptic feedback " << (haptic_ ? "available" : "unavailable");
    }

    SdlFrontEnd::~SdlFrontEnd()
    {
        if (haptic_)
            SDL_HapticClose(haptic_);
    }

    void SdlFrontEnd::adjust_font_size(int delta)
    {
        int next = std::clamp(font_size_ + delta, MIN_FONT_SIZE, MAX_FONT_SIZE);
        if (next == font_size_)
            return;
        font_size_ = next;
        log::LineBuilder(log::Level::Info, TAG) << "font size " << font_size_;
        request_redraw();
    }

    void SdlFrontEnd::reset_scroll_position()
    {
        if (scroll_offset_ == 0)
            return;
        scroll_offset_ = 0;
        request_redraw();
    }

    void SdlFrontEnd::scroll_by(int lines, int available)
    {
        int next = std::clamp(scroll_offset_ + lines, 0, std::max(0, available));
        if (next == scroll_offset_)
            return;
        scroll_offset_ = next;
        request_redraw();
    }

    void SdlFrontEnd::trigger_haptic_feedback()
    {
        if (haptic_)
            SDL_HapticRumblePlay(haptic_, 0.25f, 30);
    }

    void SdlFrontEnd::set_text(const std::string &text)
    {
        if (SDL_SetClipboardText(text.c_str()) != 0)
        {
            log::error(TAG, std::string("clipboard: ") + SDL_GetError());
            return;
        }
        log::LineBuilder(log::Level::Info, TAG)
            << "copied " << text.size() << " bytes to the clipboard";
    }

    void SdlFrontEnd::toggle_hardware_hidden()
    {
        hardware_hidden_ = !hardware_hidden_;
        log::LineBuilder(log::Level::Info, TAG)
            << "hardware keyboard " << (hardware_hidden_ ? "hidden" : "visible");
        request_redraw();
    }

    void SdlFrontEnd::refresh(const ModifierState &mods, const SelectionArea &selection)
    {
        if (!dirty_.exchange(false))
            return;

        std::ostringstream title;
        title << "keybridge";
        std::string indicators = mods.describe();
        if (!indicators.empty())
            title << "  [" << indicators << "]";
        if (selection.active())
        {
            GridPoint c = selection.cursor();
            title << "  select(" << phase_name(selection.phase()) << " "
                  << c.row << "," << c.col << ")";
        }
        if (scroll_offset_ > 0)
            title << "  scroll -" << scroll_offset_;
        if (hardware_present_)
            title << (hardware_hidden_ ? "  kbd:hidden" : "  kbd:visible");
        title << "  " << font_size_ << "pt";
        SDL_SetWindowTitle(window_, title.str().c_str());

        SDL_Surface *surface = SDL_GetWindowSurface(window_);
        if (surface)
        {
            Uint32 colour = selection.active()
                                ? SDL_MapRGB(surface->format, 36, 60, 100)
                                : SDL_MapRGB(surface->format, 18, 18, 18);
            SDL_FillRect(surface, nullptr, colour);
            SDL_UpdateWindowSurface(window_);
        }
    }

} // namespace keybridge
