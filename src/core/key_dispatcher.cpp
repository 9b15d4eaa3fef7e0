// =============================================================================
// key_dispatcher.cpp — Key events → terminal bytes and side effects
// =============================================================================
// Decision order for every event (first match wins):
//   1. physical keyboard visible      -> drop stale locks
//   2. key-up                         -> release momentary modifiers
//   3. volume keys                    -> font size (even without a session)
//   4. no live transport              -> not handled
//   5. printing keys, Space, Tab      -> byte encoder
//   6. composed text batch            -> raw bytes
//   7. modifier keys (hardware)       -> modifier machine
//   8. special keys                   -> emulation engine or selection cursor
// =============================================================================

#include "key_dispatcher.hpp"
#include "../lib/errors/error.hpp"
#include "../lib/log/log.hpp"

#include <cstdint>

namespace keybridge
{

    static const char *TAG = "dispatch";

    KeyDispatcher::KeyDispatcher(SessionState &session, Collaborators peers,
                                 const KeyCharacterMap &keymap, Settings &settings,
                                 const DeviceState &device)
        : session_(session), peers_(peers), keymap_(keymap), settings_(settings),
          device_(device), encoder_(settings.encoding())
    {
        // A keyboard that is already out is not a visibility change.
        session_.hardware_was_visible = snapshot().hardware_visible();

        reload_keymode();
        settings_subscription_ = settings_.subscribe(
            [this](const std::string &key)
            { on_setting_changed(key); });
    }

    KeyDispatcher::~KeyDispatcher()
    {
        settings_.unsubscribe(settings_subscription_);
    }

    KeyboardContext KeyDispatcher::snapshot() const
    {
        KeyboardContext ctx;
        ctx.hardware_present = device_.hardware_keyboard_present();
        ctx.hardware_hidden = device_.hardware_keyboard_hidden();
        ctx.keymap = profile_;
        ctx.encoding = encoder_.charset();
        return ctx;
    }

    // =========================================================================
    // Entry point
    // =========================================================================

    KeyOutcome KeyDispatcher::on_key(const KeyEvent &event)
    {
        const KeyboardContext ctx = snapshot();

        try
        {
            return handle(event, ctx);
        }
        catch (const TransportError &e)
        {
            log::error(TAG, std::string("problem while handling a key event: ") + e.what());
            try
            {
                peers_.transport->flush();
            }
            catch (const TransportError &)
            {
                log::debug(TAG, "transport is closed, dispatching disconnect");
                peers_.transport->report_disconnect();
            }
            return KeyOutcome::Consumed;
        }
        catch (const SessionNotEstablishedError &)
        {
            log::debug(TAG, "input before session established ignored");
            return KeyOutcome::Consumed;
        }
    }

    KeyOutcome KeyDispatcher::handle(const KeyEvent &event, const KeyboardContext &ctx)
    {
        ModifierState &mods = session_.modifiers;
        const KeyCode code = event.code;

        // ---- 1. Keyboard visibility ----
        if (ctx.hardware_visible())
        {
            if (!session_.hardware_was_visible)
                mods.clear_all(); // soft-keyboard state must not leak in
            else
                mods.clear_locks();
        }
        session_.hardware_was_visible = ctx.hardware_visible();

        // ---- 2. Key-up ----
        if (event.action == KeyAction::Up)
            return handle_release(code, ctx);

        // ---- 3. Font size ----
        if (code == KeyCode::VolumeUp || code == KeyCode::VolumeDown)
        {
            if (peers_.ui)
                peers_.ui->adjust_font_size(code == KeyCode::VolumeUp ? 1 : -1);
            return KeyOutcome::Consumed;
        }

        // ---- 4. Connection gate ----
        if (!connected())
            return KeyOutcome::NotHandled;

        if (peers_.ui)
            peers_.ui->reset_scroll_position();

        // ---- 5. Printing keys ----
        bool printing = keymap_.is_printing_key(code) ||
                        code == KeyCode::Space ||
                        code == KeyCode::Tab;
        if (printing)
            return handle_printing(event, ctx);

        // ---- 6. Composed text ----
        if (code == KeyCode::Unknown && event.action == KeyAction::Multiple)
        {
            peers_.transport->write(encoder_.encode_text(event.characters));
            return KeyOutcome::Consumed;
        }

        // ---- 7. Modifier keys on a physical keyboard ----
        if (ctx.hardware_visible() && event.repeat_count == 0)
        {
            KeyOutcome outcome = handle_modifier_key(code);
            if (outcome == KeyOutcome::Consumed)
                return outcome;
        }

        // ---- 8. Special keys ----
        return handle_special(code);
    }

    // =========================================================================
    // 2. Key-up
    // =========================================================================

    KeyOutcome KeyDispatcher::handle_release(KeyCode code, const KeyboardContext &ctx)
    {
        // Soft keyboards send nothing useful on key-up.
        if (!ctx.hardware_visible())
            return KeyOutcome::NotHandled;

        if (!connected())
            return KeyOutcome::NotHandled;

        Modifier released;
        switch (code)
        {
        case KeyCode::AltLeft:
        case KeyCode::AltRight:
            released = Modifier::Alt;
            break;
        case KeyCode::ShiftLeft:
            released = Modifier::Shift;
            break;
        case KeyCode::CtrlLeft:
        case KeyCode::CtrlRight:
            released = Modifier::Ctrl;
            break;
        case KeyCode::ShiftRight:
            released = Modifier::RightShift;
            break;
        default:
            return KeyOutcome::NotHandled;
        }

        log::LineBuilder(log::Level::Debug, TAG) << modifier_name(released) << " up";
        session_.modifiers.clear_on(released);
        redraw();
        return KeyOutcome::Consumed;
    }

    // =========================================================================
    // 5. Printing keys
    // =========================================================================

    KeyOutcome KeyDispatcher::handle_printing(const KeyEvent &event, const KeyboardContext &ctx)
    {
        ModifierState &mods = session_.modifiers;

        ByteEncoder::Resolved r = encoder_.resolve(event.code, event.meta_state,
                                                   mods, ctx.soft(), keymap_);

        log::LineBuilder(log::Level::Debug, TAG)
            << "keymap(" << key_name(event.code) << ", " << event.meta_state
            << ") = " << static_cast<uint32_t>(r.key);

        // Right-Shift + digit on a physical keyboard is a function key.
        if (ctx.hardware_visible() && mods.is_active(Modifier::RightShift) &&
            send_function_key(event.code))
        {
            consume_transient();
            return KeyOutcome::Consumed;
        }

        peers_.transport->write(encoder_.encode(r.key));

        ModifierState before = mods;
        mods.clear_transient();
        if (r.redraw || before != mods)
            redraw();

        return KeyOutcome::Consumed;
    }

    bool KeyDispatcher::send_function_key(KeyCode code)
    {
        int digit = digit_value(code);
        if (digit < 0)
            return false;

        // 1..9 -> F1..F9, 0 -> F10
        int index = digit == 0 ? 9 : digit - 1;
        TerminalKey key = static_cast<TerminalKey>(static_cast<int>(TerminalKey::F1) + index);
        log::LineBuilder(log::Level::Debug, TAG) << "overlay " << key_name(code)
                                                  << " -> " << terminal_key_name(key);
        emulation().dispatch_named_key(key, U' ', 0);
        return true;
    }

    // =========================================================================
    // 7. Modifier keys
    // =========================================================================

    KeyOutcome KeyDispatcher::handle_modifier_key(KeyCode code)
    {
        switch (code)
        {
        case KeyCode::AltLeft:
        case KeyCode::AltRight:
            meta_press(Modifier::Alt);
            return KeyOutcome::Consumed;
        case KeyCode::ShiftLeft:
            meta_press(Modifier::Shift);
            return KeyOutcome::Consumed;
        case KeyCode::CtrlLeft:
        case KeyCode::CtrlRight:
            meta_press(Modifier::Ctrl);
            return KeyOutcome::Consumed;
        case KeyCode::ShiftRight:
            meta_press(Modifier::RightShift);
            return KeyOutcome::Consumed;
        default:
            return KeyOutcome::NotHandled;
        }
    }

    // =========================================================================
    // 8. Special keys
    // =========================================================================

    KeyOutcome KeyDispatcher::handle_special(KeyCode code)
    {
        ModifierState &mods = session_.modifiers;

        switch (code)
        {
        case KeyCode::Search:
            send_escape();
            return KeyOutcome::Consumed;

        case KeyCode::DeviceShortcut:
            send_device_shortcut();
            return KeyOutcome::Consumed;

        case KeyCode::Del:
            emulation().dispatch_named_key(TerminalKey::Backspace, U' ', mods.buffer_state());
            consume_transient();
            return KeyOutcome::Consumed;

        case KeyCode::Enter:
            emulation().dispatch_typed_key(TerminalKey::Enter, U' ', 0);
            consume_transient();
            return KeyOutcome::Consumed;

        case KeyCode::DpadLeft:
            navigate(Direction::Left, TerminalKey::Left);
            return KeyOutcome::Consumed;
        case KeyCode::DpadUp:
            navigate(Direction::Up, TerminalKey::Up);
            return KeyOutcome::Consumed;
        case KeyCode::DpadDown:
            navigate(Direction::Down, TerminalKey::Down);
            return KeyOutcome::Consumed;
        case KeyCode::DpadRight:
            navigate(Direction::Right, TerminalKey::Right);
            return KeyOutcome::Consumed;

        case KeyCode::DpadCenter:
            confirm();
            return KeyOutcome::Consumed;

        default:
            return KeyOutcome::NotHandled;
        }
    }

    void KeyDispatcher::send_device_shortcut()
    {
        DeviceShortcut shortcut = DeviceShortcut::CtrlASpace;
        try
        {
            shortcut = parse_device_shortcut(settings_.device_shortcut());
        }
        catch (const ConfigError &e)
        {
            log::error(TAG, e.what());
        }

        switch (shortcut)
        {
        case DeviceShortcut::CtrlASpace:
            peers_.transport->write_byte(0x01);
            peers_.transport->write_byte(' ');
            break;
        case DeviceShortcut::CtrlA:
            peers_.transport->write_byte(0x01);
            break;
        case DeviceShortcut::Escape:
            send_escape();
            break;
        case DeviceShortcut::EscapeA:
            send_escape();
            peers_.transport->write_byte('a');
            break;
        }
    }

    void KeyDispatcher::navigate(Direction dir, TerminalKey key)
    {
        if (session_.selection.active())
        {
            session_.selection.step(dir);
            redraw();
            return;
        }

        emulation().dispatch_named_key(key, U' ', session_.modifiers.buffer_state());
        consume_transient();
        if (peers_.ui)
            peers_.ui->trigger_haptic_feedback();
    }

    void KeyDispatcher::confirm()
    {
        SelectionArea &sel = session_.selection;
        ModifierState &mods = session_.modifiers;

        if (sel.active())
        {
            if (sel.selecting_origin())
            {
                sel.finish_origin();
            }
            else if (peers_.clipboard)
            {
                std::string text = emulation().copy_region(sel.region());
                peers_.clipboard->set_text(text);
                log::LineBuilder(log::Level::Debug, TAG)
                    << "copied " << text.size() << " bytes to clipboard";
                sel.reset();
            }
        }
        else if (mods.is_on(Modifier::Ctrl))
        {
            send_escape();
            mods.clear_on(Modifier::Ctrl);
        }
        else
        {
            meta_press(Modifier::Ctrl);
        }

        redraw();
    }

    // =========================================================================
    // Public operations
    // =========================================================================

    void KeyDispatcher::meta_press(Modifier m)
    {
        session_.modifiers.press(m);
        log::LineBuilder(log::Level::Debug, TAG)
            << modifier_name(m) << " pressed -> [" << session_.modifiers.describe() << "]";
        redraw();
    }

    void KeyDispatcher::send_escape()
    {
        emulation().dispatch_typed_key(TerminalKey::Escape, U' ', 0);
    }

    void KeyDispatcher::start_selection()
    {
        GridPoint at;
        if (peers_.emulation)
            at = peers_.emulation->cursor_position();
        session_.selection.start(at);
        redraw();
    }

    void KeyDispatcher::cancel_selection()
    {
        session_.selection.reset();
        redraw();
    }

    void KeyDispatcher::set_charset(const std::string &charset)
    {
        encoder_.set_charset(charset);
    }

    // =========================================================================
    // Helpers
    // =========================================================================

    void KeyDispatcher::consume_transient()
    {
        ModifierState before = session_.modifiers;
        session_.modifiers.clear_transient();
        if (before != session_.modifiers)
            redraw();
    }

    bool KeyDispatcher::connected() const
    {
        return peers_.transport && peers_.transport->is_connected();
    }

    EmulationEngine &KeyDispatcher::emulation() const
    {
        if (!peers_.emulation)
            throw SessionNotEstablishedError("emulation engine");
        return *peers_.emulation;
    }

    void KeyDispatcher::redraw()
    {
        if (peers_.ui)
            peers_.ui->request_redraw();
    }

    void KeyDispatcher::on_setting_changed(const std::string &key)
    {
        if (key == prefs::KEYMODE)
        {
            reload_keymode();
        }
        else if (key == prefs::ENCODING)
        {
            try
            {
                encoder_.set_charset(settings_.encoding());
            }
            catch (const EncodingError &e)
            {
                log::error(TAG, std::string(e.what()) + ", keeping " + encoder_.charset());
            }
        }
    }

    void KeyDispatcher::reload_keymode()
    {
        try
        {
            profile_ = parse_keymap_profile(settings_.keymode());
        }
        catch (const ConfigError &e)
        {
            log::error(TAG, e.what());
        }
    }

} // namespace keybridge
