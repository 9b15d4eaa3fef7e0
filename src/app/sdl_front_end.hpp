#pragma once

// =============================================================================
// sdl_front_end.hpp — SDL2 window as the key core's UI collaborators
// =============================================================================
// One object plays the UI, clipboard, and device-state roles for the
// dispatcher. There is no glyph rendering: the window title carries the
// modifier indicators, the font size, the scrollback position, and the
// selection cursor; the window background changes colour while selection
// mode is on.
// =============================================================================

#include "../core/collaborators.hpp"
#include "../core/modifier_state.hpp"

#include <SDL2/SDL.h>

#include <atomic>
#include <string>

namespace keybridge
{

    class SdlFrontEnd : public TerminalUi, public Clipboard, public DeviceState
    {
    public:
        static constexpr int DEFAULT_FONT_SIZE = 15;
        static constexpr int MIN_FONT_SIZE = 6;
        static constexpr int MAX_FONT_SIZE = 48;

        SdlFrontEnd(SDL_Window *window, bool hardware_present);
        ~SdlFrontEnd() override;

        SdlFrontEnd(const SdlFrontEnd &) = delete;
        SdlFrontEnd &operator=(const SdlFrontEnd &) = delete;

        // --- TerminalUi ---
        void request_redraw() override { dirty_.store(true); }
        void adjust_font_size(int delta) override;
        void trigger_haptic_feedback() override;
        void reset_scroll_position() override;

        // --- Clipboard ---
        void set_text(const std::string &text) override;

        // --- DeviceState ---
        bool hardware_keyboard_present() const override { return hardware_present_; }
        bool hardware_keyboard_hidden() const override { return hardware_hidden_; }

        /// Simulate sliding the physical keyboard closed / open.
        void toggle_hardware_hidden();

        int font_size() const { return font_size_; }

        /// Look `lines` further back (negative: forward), limited to
        /// `available` lines of scrollback.
        void scroll_by(int lines, int available);
        int scroll_offset() const { return scroll_offset_; }

        /// Repaint title and background if anything asked for a redraw.
        void refresh(const ModifierState &mods, const SelectionArea &selection);

    private:
        SDL_Window *window_;
        SDL_Haptic *haptic_ = nullptr;

        bool hardware_present_;
        bool hardware_hidden_ = false;
        int font_size_ = DEFAULT_FONT_SIZE;
        int scroll_offset_ = 0;
        std::atomic<bool> dirty_{true};
    };

} // namespace keybridge
