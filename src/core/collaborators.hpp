#pragma once

// =============================================================================
// collaborators.hpp — Interfaces the key core talks to
// =============================================================================
// The core never owns a socket, a screen, or a window. It reaches them
// through these small interfaces so the same dispatcher runs inside the SDL
// front end, behind an SSH transport, or against recording fakes in tests.
// =============================================================================

#include "selection_area.hpp"

#include <string>

namespace keybridge
{

    // -------------------------------------------------------------------------
    // Transport — the byte stream to the remote session
    // -------------------------------------------------------------------------
    class Transport
    {
    public:
        virtual ~Transport() = default;

        /// False before the session connects and after it drops.
        virtual bool is_connected() const = 0;

        /// Send bytes. Throws TransportError on I/O failure.
        virtual void write(const std::string &bytes) = 0;

        /// Push out anything buffered. Throws TransportError on I/O failure.
        virtual void flush() = 0;

        /// The session owner must tear the session down.
        virtual void report_disconnect() = 0;

        void write_byte(unsigned char byte)
        {
            write(std::string(1, static_cast<char>(byte)));
        }
    };

    // -------------------------------------------------------------------------
    // EmulationEngine — turns named keys into terminal protocol
    // -------------------------------------------------------------------------
    enum class TerminalKey
    {
        Escape,
        Enter,
        Backspace,
        Up,
        Down,
        Left,
        Right,
        F1, F2, F3, F4, F5, F6, F7, F8, F9, F10, F11, F12,
    };

    const char *terminal_key_name(TerminalKey key);

    class EmulationEngine
    {
    public:
        virtual ~EmulationEngine() = default;

        /// "Key down" semantics: the key with the kKey* modifier mask applied.
        virtual void dispatch_named_key(TerminalKey key, char32_t placeholder,
                                        int modifiers) = 0;

        /// "One logical keystroke" semantics (Escape, Enter).
        virtual void dispatch_typed_key(TerminalKey key, char32_t placeholder,
                                        int modifiers) = 0;

        /// Text inside `region`, clamped to the grid. Rows end with '\n'
        /// except the last; trailing blanks on each row are dropped.
        virtual std::string copy_region(const GridRegion &region) const = 0;

        /// Where selection mode starts.
        virtual GridPoint cursor_position() const = 0;
    };

    // -------------------------------------------------------------------------
    // UI notifications (fire-and-forget)
    // -------------------------------------------------------------------------
    class TerminalUi
    {
    public:
        virtual ~TerminalUi() = default;

        virtual void request_redraw() = 0;
        virtual void adjust_font_size(int delta) = 0;
        virtual void trigger_haptic_feedback() = 0;
        virtual void reset_scroll_position() = 0;
    };

    class Clipboard
    {
    public:
        virtual ~Clipboard() = default;
        virtual void set_text(const std::string &text) = 0;
    };

    // -------------------------------------------------------------------------
    // DeviceState — physical keyboard presence
    // -------------------------------------------------------------------------
    class DeviceState
    {
    public:
        virtual ~DeviceState() = default;

        virtual bool hardware_keyboard_present() const = 0;

        /// e.g. a slide-out keyboard that is currently closed.
        virtual bool hardware_keyboard_hidden() const = 0;
    };

} // namespace keybridge
