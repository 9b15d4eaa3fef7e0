#pragma once

// =============================================================================
// key_dispatcher.hpp — Key events → terminal bytes and side effects
// =============================================================================
// The single entry point for keyboard input of one terminal session. Each
// event is classified (release, font-size key, printing key, composed text,
// modifier key, special key) and routed either to the byte encoder, to the
// emulation engine, or to the selection cursor when selection mode is on.
//
// Session state (modifiers, selection) lives in a SessionState owned by the
// caller and handed in explicitly, so a dispatcher can be rebuilt against the
// same session and tests can inspect the state directly.
// =============================================================================

#include "byte_encoder.hpp"
#include "collaborators.hpp"
#include "keyboard_context.hpp"
#include "modifier_state.hpp"
#include "selection_area.hpp"
#include "../config/settings.hpp"
#include "../input/key_character_map.hpp"
#include "../input/key_event.hpp"

#include <string>

namespace keybridge
{

    struct SessionState
    {
        ModifierState modifiers;
        SelectionArea selection;

        // Whether the physical keyboard was usable at the previous event.
        // KeyDispatcher seeds it from the device when it is built.
        bool hardware_was_visible = false;
    };

    /// Everything the dispatcher writes to. Null members mean "not there":
    /// no transport = no session, no emulation = session not set up yet,
    /// no ui / clipboard = notifications are skipped.
    struct Collaborators
    {
        Transport *transport = nullptr;
        EmulationEngine *emulation = nullptr;
        TerminalUi *ui = nullptr;
        Clipboard *clipboard = nullptr;
    };

    enum class KeyOutcome
    {
        Consumed,
        NotHandled,
    };

    class KeyDispatcher
    {
    public:
        /// Reads keymode and encoding from `settings` and follows later
        /// changes. Throws EncodingError if the stored encoding is unusable.
        KeyDispatcher(SessionState &session, Collaborators peers,
                      const KeyCharacterMap &keymap, Settings &settings,
                      const DeviceState &device);
        ~KeyDispatcher();

        KeyDispatcher(const KeyDispatcher &) = delete;
        KeyDispatcher &operator=(const KeyDispatcher &) = delete;

        /// Handle one event. Transport failures and input that arrives before
        /// the emulation engine is attached are absorbed here and reported
        /// as Consumed.
        KeyOutcome on_key(const KeyEvent &event);

        /// Modifier tap from an on-screen key (or a physical modifier key).
        void meta_press(Modifier m);

        /// Send the terminal Escape key.
        void send_escape();

        // --- Selection mode ---
        void start_selection();
        void cancel_selection();
        bool selecting() const { return session_.selection.active(); }

        // --- Wiring ---
        void set_charset(const std::string &charset);
        void set_clipboard(Clipboard *clipboard) { peers_.clipboard = clipboard; }
        void attach_transport(Transport *transport) { peers_.transport = transport; }
        void attach_emulation(EmulationEngine *emulation) { peers_.emulation = emulation; }

        const ModifierState &meta_state() const { return session_.modifiers; }
        const SelectionArea &selection() const { return session_.selection; }
        KeymapProfile keymap_profile() const { return profile_; }

        /// Keyboard configuration as the next event will see it.
        KeyboardContext snapshot() const;

    private:
        SessionState &session_;
        Collaborators peers_;
        const KeyCharacterMap &keymap_;
        Settings &settings_;
        const DeviceState &device_;

        ByteEncoder encoder_;
        KeymapProfile profile_ = KeymapProfile::RightSide;
        int settings_subscription_ = 0;

        KeyOutcome handle(const KeyEvent &event, const KeyboardContext &ctx);

        KeyOutcome handle_release(KeyCode code, const KeyboardContext &ctx);
        KeyOutcome handle_printing(const KeyEvent &event, const KeyboardContext &ctx);
        KeyOutcome handle_modifier_key(KeyCode code);
        KeyOutcome handle_special(KeyCode code);

        void send_device_shortcut();
        void navigate(Direction dir, TerminalKey key);
        void confirm();
        bool send_function_key(KeyCode code);

        /// Clear momentary modifiers; redraw when something changed.
        void consume_transient();

        bool connected() const;
        EmulationEngine &emulation() const;

        void redraw();
        void on_setting_changed(const std::string &key);
        void reload_keymode();
    };

} // namespace keybridge
