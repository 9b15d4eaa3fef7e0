// =============================================================================
// Key Dispatcher Tests
// =============================================================================
// Drives KeyDispatcher against recording fakes:
//   1. End-to-end scenarios (ctrl on a physical keyboard, soft shift lock,
//      no session, function-key overlay)
//   2. Key-up handling and keyboard visibility
//   3. Printing keys, composed text, font size
//   4. Modifier keys and the keymode preference
//   5. Special keys (search, device shortcut, Del, Enter, d-pad)
//   6. Selection mode
//   7. Failure handling
//   8. Settings changes
//   9. Combinations of {keyboard present, hidden} x modifier states
// =============================================================================

#include "test_harness.hpp"
#include "fakes.hpp"
#include "../src/config/settings.hpp"
#include "../src/core/key_dispatcher.hpp"
#include "../src/input/key_character_map.hpp"

#include <memory>

using namespace keybridge;
using namespace keybridge::testing;

// ---- Fixture ---------------------------------------------------------------

struct Rig
{
    FakeTransport transport;
    FakeEmulation emulation;
    FakeUi ui;
    FakeClipboard clipboard;
    FakeDevice device;
    MemorySettings settings;
    QwertyKeyMap keymap;
    SessionState session;
    std::unique_ptr<KeyDispatcher> dispatcher;

    explicit Rig(bool present = true, bool hidden = false)
    {
        device.present = present;
        device.hidden = hidden;

        Collaborators peers;
        peers.transport = &transport;
        peers.emulation = &emulation;
        peers.ui = &ui;
        peers.clipboard = &clipboard;
        dispatcher = std::make_unique<KeyDispatcher>(session, peers, keymap, settings, device);
    }

    KeyOutcome down(KeyCode code, int meta = 0, int repeat = 0)
    {
        return dispatcher->on_key(KeyEvent::down(code, meta, repeat));
    }

    KeyOutcome up(KeyCode code)
    {
        return dispatcher->on_key(KeyEvent::up(code));
    }

    KeyOutcome text(const std::string &utf8)
    {
        return dispatcher->on_key(KeyEvent::text(utf8));
    }

    ModifierState &mods() { return session.modifiers; }
};

static const bool SOFT = false;

static bool sameCall(const KeyCall &c, bool typed, TerminalKey key, int modifiers)
{
    return c.typed == typed && c.key == key && c.modifiers == modifiers;
}

// ============================================================================
// Section 1: End-to-end scenarios
// ============================================================================

static void testScenarios()
{
    std::cout << "\n===== Scenarios =====\n";

    runTest("physical keyboard: Ctrl then 'a' sends 0x01", []()
            {
        Rig rig;
        XASSERT(rig.down(KeyCode::CtrlLeft) == KeyOutcome::Consumed);
        XASSERT(rig.mods().is_on(Modifier::Ctrl));

        XASSERT(rig.down(KeyCode::A) == KeyOutcome::Consumed);
        XASSERT_EQ(rig.transport.written, std::string("\x01"));
        XASSERT(!rig.mods().is_on(Modifier::Ctrl));
        XASSERT(!rig.mods().is_locked(Modifier::Ctrl)); });

    runTest("soft keyboard: Shift tapped twice locks", []()
            {
        Rig rig(SOFT);
        rig.dispatcher->meta_press(Modifier::Shift);
        rig.dispatcher->meta_press(Modifier::Shift);
        XASSERT(rig.mods().is_locked(Modifier::Shift));
        XASSERT(!rig.mods().is_on(Modifier::Shift));

        rig.down(KeyCode::A);
        rig.down(KeyCode::B);
        XASSERT_EQ(rig.transport.written, std::string("AB"));
        XASSERT(rig.mods().is_locked(Modifier::Shift)); });

    runTest("no live session: nothing handled, nothing touched", []()
            {
        for (bool present : {true, false}) {
            Rig rig(present);
            rig.transport.connected = false;

            const KeyCode keys[] = {KeyCode::A, KeyCode::Num5, KeyCode::Space, KeyCode::Enter,
                                    KeyCode::Del, KeyCode::DpadLeft, KeyCode::DpadCenter,
                                    KeyCode::Search, KeyCode::DeviceShortcut, KeyCode::ShiftLeft,
                                    KeyCode::AltRight, KeyCode::Unknown};
            for (KeyCode k : keys) {
                XASSERT(rig.down(k) == KeyOutcome::NotHandled);
                XASSERT(rig.up(k) == KeyOutcome::NotHandled);
            }
            XASSERT(rig.text("\xc3\xa9") == KeyOutcome::NotHandled);

            XASSERT_EQ(rig.transport.calls(), 0);
            XASSERT(rig.emulation.calls.empty());
            XASSERT_EQ(rig.ui.calls(), 0);
            XASSERT(rig.clipboard.texts.empty());
            XASSERT(!rig.mods().any_active());
        } });

    runTest("no transport at all behaves like a dead one", []()
            {
        Rig rig;
        rig.dispatcher->attach_transport(nullptr);
        XASSERT(rig.down(KeyCode::A) == KeyOutcome::NotHandled);
        XASSERT(rig.down(KeyCode::Enter) == KeyOutcome::NotHandled);
        XASSERT(rig.emulation.calls.empty()); });

    runTest("right shift + 3 on a physical keyboard is F3", []()
            {
        Rig rig;
        rig.down(KeyCode::ShiftRight);
        XASSERT(rig.mods().is_on(Modifier::RightShift));

        XASSERT(rig.down(KeyCode::Num3) == KeyOutcome::Consumed);
        XASSERT_EQ(rig.emulation.calls.size(), static_cast<size_t>(1));
        XASSERT(sameCall(rig.emulation.calls[0], false, TerminalKey::F3, 0));
        XASSERT_EQ(rig.transport.written, std::string());
        XASSERT(!rig.mods().is_active(Modifier::RightShift)); });
}

// ============================================================================
// Section 2: Key-up and visibility
// ============================================================================

static void testReleaseAndVisibility()
{
    std::cout << "\n===== Key-up & Visibility =====\n";

    runTest("modifier key-up clears the momentary flag", []()
            {
        Rig rig;
        struct { KeyCode key; Modifier mod; } cases[] = {
            {KeyCode::ShiftLeft, Modifier::Shift},
            {KeyCode::ShiftRight, Modifier::RightShift},
            {KeyCode::AltLeft, Modifier::Alt},
            {KeyCode::CtrlLeft, Modifier::Ctrl},
            {KeyCode::CtrlRight, Modifier::Ctrl},
        };
        for (auto &c : cases) {
            rig.down(c.key);
            XASSERT(rig.mods().is_on(c.mod));
            int redraws = rig.ui.redraws;
            XASSERT(rig.up(c.key) == KeyOutcome::Consumed);
            XASSERT(!rig.mods().is_active(c.mod));
            XASSERT(rig.ui.redraws > redraws);
        } });

    runTest("right-Alt key-up also releases Alt", []()
            {
        Rig rig;
        rig.dispatcher->meta_press(Modifier::Alt);
        XASSERT(rig.up(KeyCode::AltRight) == KeyOutcome::Consumed);
        XASSERT(!rig.mods().is_on(Modifier::Alt)); });

    runTest("other key-ups are not handled", []()
            {
        Rig rig;
        XASSERT(rig.up(KeyCode::A) == KeyOutcome::NotHandled);
        XASSERT(rig.up(KeyCode::Enter) == KeyOutcome::NotHandled);
        XASSERT(rig.up(KeyCode::VolumeUp) == KeyOutcome::NotHandled); });

    runTest("soft keyboard ignores key-up", []()
            {
        Rig rig(SOFT);
        rig.dispatcher->meta_press(Modifier::Shift);
        XASSERT(rig.up(KeyCode::ShiftLeft) == KeyOutcome::NotHandled);
        XASSERT(rig.mods().is_on(Modifier::Shift)); });

    runTest("hidden physical keyboard ignores key-up", []()
            {
        Rig rig(true, true);
        rig.dispatcher->meta_press(Modifier::Ctrl);
        XASSERT(rig.up(KeyCode::CtrlLeft) == KeyOutcome::NotHandled);
        XASSERT(rig.mods().is_on(Modifier::Ctrl)); });

    runTest("locks do not survive on a visible physical keyboard", []()
            {
        Rig rig;
        rig.down(KeyCode::ShiftLeft);
        rig.down(KeyCode::ShiftLeft);
        XASSERT(rig.mods().is_locked(Modifier::Shift));

        rig.down(KeyCode::B);
        XASSERT_EQ(rig.transport.written, std::string("b"));
        XASSERT(!rig.mods().any_active()); });

    runTest("sliding the keyboard open drops soft-keyboard state", []()
            {
        Rig rig(true, true);
        rig.dispatcher->meta_press(Modifier::Ctrl);
        rig.dispatcher->meta_press(Modifier::Alt);
        rig.dispatcher->meta_press(Modifier::Alt);
        rig.down(KeyCode::DpadUp); // any event while hidden
        XASSERT(rig.mods().is_locked(Modifier::Alt));

        rig.device.hidden = false;
        rig.down(KeyCode::C);
        XASSERT_EQ(rig.transport.written, std::string("c"));
        XASSERT(!rig.mods().any_active()); });

    runTest("momentary flags persist across events while visible", []()
            {
        Rig rig;
        rig.down(KeyCode::CtrlLeft);
        rig.down(KeyCode::VolumeUp);
        XASSERT(rig.mods().is_on(Modifier::Ctrl)); });
}

// ============================================================================
// Section 3: Printing, composed text, font size
// ============================================================================

static void testPrinting()
{
    std::cout << "\n===== Printing =====\n";

    runTest("plain keys and whitespace", []()
            {
        Rig rig;
        rig.down(KeyCode::L);
        rig.down(KeyCode::S);
        rig.down(KeyCode::Space);
        rig.down(KeyCode::Minus);
        rig.down(KeyCode::Tab);
        XASSERT_EQ(rig.transport.written, std::string("ls -\t")); });

    runTest("device modifier flags pick the glyph", []()
            {
        Rig rig;
        rig.down(KeyCode::Num1, kMetaShiftOn);
        rig.down(KeyCode::W, kMetaAltOn);
        rig.down(KeyCode::C, kMetaCtrlOn);
        XASSERT_EQ(rig.transport.written, std::string("!2\x03")); });

    runTest("ctrl space sends NUL, ctrl ? sends DEL", []()
            {
        Rig rig(SOFT);
        rig.dispatcher->meta_press(Modifier::Ctrl);
        rig.down(KeyCode::Space);
        rig.dispatcher->meta_press(Modifier::Ctrl);
        rig.down(KeyCode::Slash, kMetaShiftOn);
        XASSERT_EQ(rig.transport.written, std::string(1, '\0') + "\x7f"); });

    runTest("a consumed modifier requests a redraw", []()
            {
        Rig rig(SOFT);
        rig.dispatcher->meta_press(Modifier::Alt);
        int before = rig.ui.redraws;
        rig.down(KeyCode::Q);
        XASSERT_EQ(rig.transport.written, std::string("1"));
        XASSERT(rig.ui.redraws > before); });

    runTest("plain keys do not redraw", []()
            {
        Rig rig;
        rig.down(KeyCode::X);
        XASSERT_EQ(rig.ui.redraws, 0); });

    runTest("input scrolls the view back to the bottom", []()
            {
        Rig rig;
        rig.down(KeyCode::X);
        rig.down(KeyCode::Enter);
        XASSERT_EQ(rig.ui.scroll_resets, 2); });

    runTest("right shift + 0 is F10, letters still type", []()
            {
        Rig rig;
        rig.down(KeyCode::ShiftRight);
        rig.down(KeyCode::Num0);
        rig.down(KeyCode::ShiftRight);
        rig.down(KeyCode::K);
        XASSERT_EQ(rig.emulation.calls.size(), static_cast<size_t>(1));
        XASSERT(sameCall(rig.emulation.calls[0], false, TerminalKey::F10, 0));
        XASSERT_EQ(rig.transport.written, std::string("k")); });

    runTest("no function-key overlay on a soft keyboard", []()
            {
        Rig rig(SOFT);
        rig.dispatcher->meta_press(Modifier::RightShift);
        rig.down(KeyCode::Num3);
        XASSERT_EQ(rig.transport.written, std::string("3"));
        XASSERT(rig.emulation.calls.empty());
        XASSERT(!rig.mods().is_active(Modifier::RightShift)); });

    runTest("composed text is sent as-is, modifiers untouched", []()
            {
        Rig rig(SOFT);
        rig.dispatcher->meta_press(Modifier::Ctrl);
        XASSERT(rig.text("h\xc3\xa9llo") == KeyOutcome::Consumed);
        XASSERT_EQ(rig.transport.written, std::string("h\xc3\xa9llo"));
        XASSERT(rig.mods().is_on(Modifier::Ctrl)); });

    runTest("non-ASCII keymap output is UTF-8 encoded", []()
            {
        struct AccentMap : QwertyKeyMap {
            char32_t get(KeyCode code, int meta) const override {
                return code == KeyCode::E ? char32_t(0xE9) : QwertyKeyMap::get(code, meta);
            }
        } accents;

        Rig rig;
        Collaborators peers;
        peers.transport = &rig.transport;
        peers.emulation = &rig.emulation;
        SessionState session;
        KeyDispatcher d(session, peers, accents, rig.settings, rig.device);
        d.on_key(KeyEvent::down(KeyCode::E));
        XASSERT_EQ(rig.transport.written, std::string("\xc3\xa9")); });

    runTest("volume keys resize the font even without a session", []()
            {
        Rig rig;
        rig.transport.connected = false;
        rig.dispatcher->attach_emulation(nullptr);
        XASSERT(rig.down(KeyCode::VolumeUp) == KeyOutcome::Consumed);
        XASSERT(rig.down(KeyCode::VolumeUp) == KeyOutcome::Consumed);
        XASSERT(rig.down(KeyCode::VolumeDown) == KeyOutcome::Consumed);
        XASSERT_EQ(rig.ui.font_calls, 3);
        XASSERT_EQ(rig.ui.font_delta, 1);
        XASSERT_EQ(rig.transport.calls(), 0); });

    runTest("unknown keys are not handled", []()
            {
        Rig rig;
        XASSERT(rig.down(KeyCode::Unknown) == KeyOutcome::NotHandled);
        XASSERT_EQ(rig.transport.written, std::string()); });
}

// ============================================================================
// Section 4: Modifier keys
// ============================================================================

static void testModifierKeys()
{
    std::cout << "\n===== Modifier Keys =====\n";

    runTest("both Alt keys cycle Alt under every keymode", []()
            {
        const char *modes[] = {prefs::KEYMODE_RIGHT, prefs::KEYMODE_LEFT, prefs::KEYMODE_NONE};
        for (const char *mode : modes)
        {
            Rig rig;
            rig.settings.set(prefs::KEYMODE, mode);
            XASSERT(rig.down(KeyCode::AltRight) == KeyOutcome::Consumed);
            XASSERT(rig.mods().is_on(Modifier::Alt));
            XASSERT(rig.down(KeyCode::AltLeft) == KeyOutcome::Consumed);
            XASSERT(rig.mods().is_locked(Modifier::Alt));
            XASSERT_EQ(rig.transport.written, std::string());
        }
    });

    runTest("keymode is kept as the reported keymap profile", []()
            {
        Rig rig;
        XASSERT(rig.dispatcher->keymap_profile() == KeymapProfile::RightSide);
        rig.settings.set(prefs::KEYMODE, prefs::KEYMODE_LEFT);
        XASSERT(rig.dispatcher->keymap_profile() == KeymapProfile::LeftSide);
        rig.settings.set(prefs::KEYMODE, prefs::KEYMODE_NONE);
        XASSERT(rig.dispatcher->keymap_profile() == KeymapProfile::None); });

    runTest("a modifier tapped before the first key survives on a visible keyboard", []()
            {
        Rig rig;
        rig.dispatcher->meta_press(Modifier::Ctrl);
        rig.down(KeyCode::A);
        XASSERT_EQ(rig.transport.written, std::string("\x01"));
        XASSERT(!rig.mods().is_active(Modifier::Ctrl)); });

    runTest("auto-repeated modifier keys are ignored", []()
            {
        Rig rig;
        XASSERT(rig.down(KeyCode::ShiftLeft, 0, 1) == KeyOutcome::NotHandled);
        XASSERT(rig.down(KeyCode::AltRight, 0, 3) == KeyOutcome::NotHandled);
        XASSERT(!rig.mods().any_active());
        XASSERT_EQ(rig.transport.written, std::string()); });

    runTest("soft keyboard leaves modifier keys to the caller", []()
            {
        Rig rig(SOFT);
        XASSERT(rig.down(KeyCode::CtrlLeft) == KeyOutcome::NotHandled);
        XASSERT(!rig.mods().any_active()); });

    runTest("meta_press redraws", []()
            {
        Rig rig(SOFT);
        rig.dispatcher->meta_press(Modifier::Shift);
        XASSERT_EQ(rig.ui.redraws, 1);
        XASSERT_EQ(rig.dispatcher->meta_state().describe(), std::string("SHIFT")); });
}

// ============================================================================
// Section 5: Special keys
// ============================================================================

static void testSpecialKeys()
{
    std::cout << "\n===== Special Keys =====\n";

    runTest("search sends Escape", []()
            {
        Rig rig;
        XASSERT(rig.down(KeyCode::Search) == KeyOutcome::Consumed);
        XASSERT_EQ(rig.emulation.calls.size(), static_cast<size_t>(1));
        XASSERT(sameCall(rig.emulation.calls[0], true, TerminalKey::Escape, 0)); });

    runTest("device shortcut profiles", []()
            {
        {
            Rig rig;
            XASSERT(rig.down(KeyCode::DeviceShortcut) == KeyOutcome::Consumed);
            XASSERT_EQ(rig.transport.written, std::string("\x01 "));
        }
        {
            Rig rig;
            rig.settings.set(prefs::DEVICE_SHORTCUT, prefs::SHORTCUT_CTRLA);
            rig.down(KeyCode::DeviceShortcut);
            XASSERT_EQ(rig.transport.written, std::string("\x01"));
        }
        {
            Rig rig;
            rig.settings.set(prefs::DEVICE_SHORTCUT, prefs::SHORTCUT_ESC);
            rig.down(KeyCode::DeviceShortcut);
            XASSERT_EQ(rig.transport.written, std::string());
            XASSERT_EQ(rig.emulation.calls.size(), static_cast<size_t>(1));
            XASSERT(sameCall(rig.emulation.calls[0], true, TerminalKey::Escape, 0));
        }
        {
            Rig rig;
            rig.settings.set(prefs::DEVICE_SHORTCUT, prefs::SHORTCUT_ESC_A);
            rig.down(KeyCode::DeviceShortcut);
            XASSERT_EQ(rig.transport.written, std::string("a"));
            XASSERT(sameCall(rig.emulation.calls[0], true, TerminalKey::Escape, 0));
        } });

    runTest("an unreadable shortcut preference falls back to Ctrl+A Space", []()
            {
        Rig rig;
        rig.settings.set(prefs::DEVICE_SHORTCUT, "Ctrl+Z");
        XASSERT(rig.down(KeyCode::DeviceShortcut) == KeyOutcome::Consumed);
        XASSERT_EQ(rig.transport.written, std::string("\x01 ")); });

    runTest("Del sends Backspace with the modifier mask", []()
            {
        Rig rig;
        rig.down(KeyCode::CtrlLeft);
        XASSERT(rig.down(KeyCode::Del) == KeyOutcome::Consumed);
        XASSERT(sameCall(rig.emulation.calls[0], false, TerminalKey::Backspace, kKeyControl));
        XASSERT(!rig.mods().any_active()); });

    runTest("Enter is one typed keystroke and clears momentary modifiers", []()
            {
        Rig rig(SOFT);
        rig.dispatcher->meta_press(Modifier::Alt);
        rig.dispatcher->meta_press(Modifier::Shift);
        rig.dispatcher->meta_press(Modifier::Shift); // lock
        XASSERT(rig.down(KeyCode::Enter) == KeyOutcome::Consumed);
        XASSERT(sameCall(rig.emulation.calls[0], true, TerminalKey::Enter, 0));
        XASSERT(!rig.mods().is_active(Modifier::Alt));
        XASSERT(rig.mods().is_locked(Modifier::Shift)); });

    runTest("arrows go to the engine with haptic feedback", []()
            {
        Rig rig(SOFT);
        rig.dispatcher->meta_press(Modifier::Shift);
        rig.down(KeyCode::DpadLeft);
        rig.down(KeyCode::DpadUp);
        rig.down(KeyCode::DpadDown);
        rig.down(KeyCode::DpadRight);
        XASSERT_EQ(rig.emulation.calls.size(), static_cast<size_t>(4));
        XASSERT(sameCall(rig.emulation.calls[0], false, TerminalKey::Left, kKeyShift));
        XASSERT(sameCall(rig.emulation.calls[1], false, TerminalKey::Up, 0));
        XASSERT(sameCall(rig.emulation.calls[2], false, TerminalKey::Down, 0));
        XASSERT(sameCall(rig.emulation.calls[3], false, TerminalKey::Right, 0));
        XASSERT_EQ(rig.ui.haptics, 4); });

    runTest("center toggles Ctrl, then sends Escape when Ctrl is on", []()
            {
        Rig rig(SOFT);
        XASSERT(rig.down(KeyCode::DpadCenter) == KeyOutcome::Consumed);
        XASSERT(rig.mods().is_on(Modifier::Ctrl));
        XASSERT(rig.emulation.calls.empty());

        rig.down(KeyCode::DpadCenter);
        XASSERT(!rig.mods().is_active(Modifier::Ctrl));
        XASSERT_EQ(rig.emulation.calls.size(), static_cast<size_t>(1));
        XASSERT(sameCall(rig.emulation.calls[0], true, TerminalKey::Escape, 0)); });

    runTest("center with Ctrl locked releases the lock", []()
            {
        Rig rig(SOFT);
        rig.dispatcher->meta_press(Modifier::Ctrl);
        rig.dispatcher->meta_press(Modifier::Ctrl);
        rig.down(KeyCode::DpadCenter);
        XASSERT(!rig.mods().is_active(Modifier::Ctrl));
        XASSERT(rig.emulation.calls.empty()); });

    runTest("send_escape", []()
            {
        Rig rig;
        rig.dispatcher->send_escape();
        XASSERT(sameCall(rig.emulation.calls[0], true, TerminalKey::Escape, 0)); });
}

// ============================================================================
// Section 6: Selection mode
// ============================================================================

static void testSelection()
{
    std::cout << "\n===== Selection =====\n";

    runTest("start_selection begins at the engine cursor", []()
            {
        Rig rig;
        rig.emulation.cursor = GridPoint{3, 4};
        rig.dispatcher->start_selection();
        XASSERT(rig.dispatcher->selecting());
        XASSERT(rig.dispatcher->selection().cursor() == (GridPoint{3, 4}));
        XASSERT_EQ(rig.ui.redraws, 1); });

    runTest("arrows move the selection cursor instead of the terminal", []()
            {
        Rig rig;
        rig.emulation.cursor = GridPoint{3, 4};
        rig.dispatcher->start_selection();
        rig.down(KeyCode::DpadUp);
        rig.down(KeyCode::DpadLeft);
        XASSERT(rig.dispatcher->selection().cursor() == (GridPoint{2, 3}));
        XASSERT(rig.emulation.calls.empty());
        XASSERT_EQ(rig.ui.haptics, 0);
        XASSERT_EQ(rig.ui.redraws, 3); });

    runTest("two confirms copy the marked rectangle", []()
            {
        Rig rig;
        rig.emulation.cursor = GridPoint{2, 4};
        rig.dispatcher->start_selection();

        rig.down(KeyCode::DpadCenter);
        XASSERT(rig.dispatcher->selection().phase() == SelectionArea::Phase::SelectingExtent);
        XASSERT(rig.clipboard.texts.empty());

        rig.down(KeyCode::DpadRight);
        rig.down(KeyCode::DpadRight);
        rig.down(KeyCode::DpadDown);
        rig.down(KeyCode::DpadCenter);

        XASSERT_EQ(rig.clipboard.texts.size(), static_cast<size_t>(1));
        XASSERT_EQ(rig.clipboard.texts[0], std::string("copied text"));
        XASSERT_EQ(rig.emulation.copied.size(), static_cast<size_t>(1));
        const GridRegion &r = rig.emulation.copied[0];
        XASSERT_EQ(r.top, 2);
        XASSERT_EQ(r.left, 4);
        XASSERT_EQ(r.bottom, 3);
        XASSERT_EQ(r.right, 6);
        XASSERT(!rig.dispatcher->selecting());
        XASSERT(!rig.mods().any_active()); });

    runTest("without a clipboard the selection stays put", []()
            {
        Rig rig;
        rig.dispatcher->set_clipboard(nullptr);
        rig.dispatcher->start_selection();
        rig.down(KeyCode::DpadCenter);
        rig.down(KeyCode::DpadCenter);
        XASSERT(rig.dispatcher->selecting());
        XASSERT(rig.emulation.copied.empty()); });

    runTest("cancel_selection returns to normal input", []()
            {
        Rig rig;
        rig.dispatcher->start_selection();
        rig.dispatcher->cancel_selection();
        XASSERT(!rig.dispatcher->selecting());
        rig.down(KeyCode::DpadLeft);
        XASSERT(sameCall(rig.emulation.calls[0], false, TerminalKey::Left, 0)); });

    runTest("selection starts at the origin when no engine is attached", []()
            {
        Rig rig;
        rig.dispatcher->attach_emulation(nullptr);
        rig.dispatcher->start_selection();
        XASSERT(rig.dispatcher->selection().cursor() == GridPoint{}); });

    runTest("printing keys still type while selecting", []()
            {
        Rig rig;
        rig.dispatcher->start_selection();
        rig.down(KeyCode::Y);
        XASSERT_EQ(rig.transport.written, std::string("y"));
        XASSERT(rig.dispatcher->selecting()); });
}

// ============================================================================
// Section 7: Failure handling
// ============================================================================

static void testFailures()
{
    std::cout << "\n===== Failures =====\n";

    runTest("a failed write falls back to a flush", []()
            {
        Rig rig;
        rig.transport.fail_writes = true;
        XASSERT(rig.down(KeyCode::A) == KeyOutcome::Consumed);
        XASSERT_EQ(rig.transport.flushes, 1);
        XASSERT_EQ(rig.transport.disconnects, 0); });

    runTest("a failed flush reports the disconnect", []()
            {
        Rig rig;
        rig.transport.fail_writes = true;
        rig.transport.fail_flush = true;
        XASSERT(rig.down(KeyCode::DeviceShortcut) == KeyOutcome::Consumed);
        XASSERT_EQ(rig.transport.flushes, 1);
        XASSERT_EQ(rig.transport.disconnects, 1); });

    runTest("engine write failures take the same path", []()
            {
        Rig rig;
        rig.emulation.fail_dispatch = true;
        rig.transport.fail_flush = true;
        XASSERT(rig.down(KeyCode::Enter) == KeyOutcome::Consumed);
        XASSERT_EQ(rig.transport.disconnects, 1); });

    runTest("input before the engine is attached is swallowed", []()
            {
        Rig rig;
        rig.dispatcher->attach_emulation(nullptr);
        XASSERT(rig.down(KeyCode::Enter) == KeyOutcome::Consumed);
        XASSERT(rig.down(KeyCode::Del) == KeyOutcome::Consumed);
        XASSERT(rig.down(KeyCode::Search) == KeyOutcome::Consumed);
        XASSERT(rig.down(KeyCode::DpadLeft) == KeyOutcome::Consumed);
        XASSERT_EQ(rig.transport.flushes, 0);
        XASSERT_EQ(rig.transport.disconnects, 0);

        rig.down(KeyCode::A);
        XASSERT_EQ(rig.transport.written, std::string("a")); });

    runTest("attaching the engine later makes keys work", []()
            {
        Rig rig;
        rig.dispatcher->attach_emulation(nullptr);
        rig.down(KeyCode::Enter);
        rig.dispatcher->attach_emulation(&rig.emulation);
        rig.down(KeyCode::Enter);
        XASSERT_EQ(rig.emulation.calls.size(), static_cast<size_t>(1)); });
}

// ============================================================================
// Section 8: Settings changes
// ============================================================================

static void testSettingsChanges()
{
    std::cout << "\n===== Settings Changes =====\n";

    runTest("encoding follows the preference", []()
            {
        Rig rig;
        rig.settings.set(prefs::ENCODING, "ISO-8859-1");
        XASSERT_EQ(rig.dispatcher->snapshot().encoding, std::string("ISO-8859-1"));
        rig.text("\xc3\xa9\xe2\x82\xac");
        XASSERT_EQ(rig.transport.written, std::string("\xe9?")); });

    runTest("a bad encoding preference keeps the current charset", []()
            {
        Rig rig;
        rig.settings.set(prefs::ENCODING, "ISO-8859-1");
        rig.settings.set(prefs::ENCODING, "NO-SUCH-CHARSET-42");
        XASSERT_EQ(rig.dispatcher->snapshot().encoding, std::string("ISO-8859-1")); });

    runTest("set_charset rejects unknown charsets", []()
            {
        Rig rig;
        XASSERT_THROWS(rig.dispatcher->set_charset("NO-SUCH-CHARSET-42"), EncodingError);
        rig.dispatcher->set_charset("ISO-8859-1");
        XASSERT_EQ(rig.dispatcher->snapshot().encoding, std::string("ISO-8859-1")); });

    runTest("a bad stored encoding fails construction", []()
            {
        Rig rig;
        rig.settings.set(prefs::ENCODING, "NO-SUCH-CHARSET-42");
        SessionState session;
        Collaborators peers;
        XASSERT_THROWS(KeyDispatcher d(session, peers, rig.keymap, rig.settings, rig.device),
                       EncodingError); });

    runTest("an unknown keymode keeps the previous profile", []()
            {
        Rig rig;
        rig.settings.set(prefs::KEYMODE, prefs::KEYMODE_LEFT);
        rig.settings.set(prefs::KEYMODE, "upside-down");
        XASSERT(rig.dispatcher->keymap_profile() == KeymapProfile::LeftSide); });

    runTest("snapshot reflects the device", []()
            {
        Rig rig(true, true);
        KeyboardContext ctx = rig.dispatcher->snapshot();
        XASSERT(ctx.hardware_present);
        XASSERT(ctx.hardware_hidden);
        XASSERT(ctx.soft());
        rig.device.hidden = false;
        XASSERT(rig.dispatcher->snapshot().hardware_visible()); });

    runTest("a destroyed dispatcher stops listening", []()
            {
        Rig rig;
        rig.dispatcher.reset();
        rig.settings.set(prefs::KEYMODE, prefs::KEYMODE_NONE);
        rig.settings.set(prefs::ENCODING, "ISO-8859-1");
        XASSERT_EQ(rig.settings.keymode(), std::string(prefs::KEYMODE_NONE)); });
}

// ============================================================================
// Section 9: Combinations
// ============================================================================
// Every {present, hidden} pair against every off/on/lock state of the four
// modifiers, for a letter and for a digit.
// ============================================================================

struct DeviceCase
{
    bool present;
    bool hidden;
};

static const DeviceCase DEVICES[] = {{true, false}, {true, true}, {false, false}, {false, true}};

// 0 = off, 1 = on, 2 = locked
static void applyPresses(ModifierState &mods, Modifier m, int presses)
{
    for (int i = 0; i < presses; ++i)
        mods.press(m);
}

static void testCombinations()
{
    std::cout << "\n===== Combinations =====\n";

    runTest("letter 'a' under every modifier state", []()
            {
        for (const DeviceCase &dev : DEVICES) {
            bool visible = dev.present && !dev.hidden;
            for (int combo = 0; combo < 81; ++combo) {
                int ctrl = combo % 3, alt = (combo / 3) % 3;
                int shift = (combo / 9) % 3, rshift = (combo / 27) % 3;

                Rig rig(dev.present, dev.hidden);
                rig.session.hardware_was_visible = visible;
                applyPresses(rig.mods(), Modifier::Ctrl, ctrl);
                applyPresses(rig.mods(), Modifier::Alt, alt);
                applyPresses(rig.mods(), Modifier::Shift, shift);
                applyPresses(rig.mods(), Modifier::RightShift, rshift);

                // A visible keyboard drops locks before the key is looked up
                bool ctrl_on = visible ? ctrl == 1 : ctrl > 0;
                bool alt_on = visible ? alt == 1 : alt > 0;
                bool shift_on = visible ? shift == 1 : shift > 0;

                char32_t glyph = alt_on ? U'@' : (shift_on ? U'A' : U'a');
                if (ctrl_on)
                    glyph = ctrl_map(glyph);

                XASSERT(rig.down(KeyCode::A) == KeyOutcome::Consumed);
                XASSERT_EQ(rig.transport.written, std::string(1, static_cast<char>(glyph)));
                XASSERT(rig.emulation.calls.empty());

                // Momentary flags are gone; locks remain only on soft keyboards
                for (Modifier m : {Modifier::Ctrl, Modifier::Alt, Modifier::Shift, Modifier::RightShift})
                    XASSERT(!rig.mods().is_on(m));
                XASSERT_EQ(rig.mods().is_locked(Modifier::Ctrl), !visible && ctrl == 2);
                XASSERT_EQ(rig.mods().is_locked(Modifier::Alt), !visible && alt == 2);
                XASSERT_EQ(rig.mods().is_locked(Modifier::Shift), !visible && shift == 2);
                XASSERT_EQ(rig.mods().is_locked(Modifier::RightShift), !visible && rshift == 2);

                if (ctrl_on || alt_on || shift_on || (visible && rshift == 1))
                    XASSERT(rig.ui.redraws > 0);
            }
        } });

    runTest("digit '3' under every right-shift and shift state", []()
            {
        for (const DeviceCase &dev : DEVICES) {
            bool visible = dev.present && !dev.hidden;
            for (int rshift = 0; rshift < 3; ++rshift) {
                for (int shift = 0; shift < 3; ++shift) {
                    Rig rig(dev.present, dev.hidden);
                    rig.session.hardware_was_visible = visible;
                    applyPresses(rig.mods(), Modifier::RightShift, rshift);
                    applyPresses(rig.mods(), Modifier::Shift, shift);

                    bool rshift_on = visible ? rshift == 1 : rshift > 0;
                    bool shift_on = visible ? shift == 1 : shift > 0;

                    XASSERT(rig.down(KeyCode::Num3) == KeyOutcome::Consumed);
                    if (visible && rshift_on) {
                        XASSERT_EQ(rig.transport.written, std::string());
                        XASSERT_EQ(rig.emulation.calls.size(), static_cast<size_t>(1));
                        XASSERT(sameCall(rig.emulation.calls[0], false, TerminalKey::F3, 0));
                    } else {
                        XASSERT_EQ(rig.transport.written, std::string(shift_on ? "#" : "3"));
                        XASSERT(rig.emulation.calls.empty());
                    }
                    XASSERT(!rig.mods().is_on(Modifier::RightShift));
                    XASSERT(!rig.mods().is_on(Modifier::Shift));
                }
            }
        } });

    runTest("modifier keys per device configuration", []()
            {
        for (const DeviceCase &dev : DEVICES) {
            bool visible = dev.present && !dev.hidden;
            Rig rig(dev.present, dev.hidden);
            KeyOutcome expected = visible ? KeyOutcome::Consumed : KeyOutcome::NotHandled;
            XASSERT(rig.down(KeyCode::CtrlLeft) == expected);
            XASSERT(rig.down(KeyCode::ShiftLeft) == expected);
            XASSERT(rig.down(KeyCode::ShiftRight) == expected);
            XASSERT(rig.down(KeyCode::AltLeft) == expected);
            XASSERT_EQ(rig.mods().is_on(Modifier::Ctrl), visible);
            XASSERT_EQ(rig.mods().is_on(Modifier::Shift), visible);
            XASSERT_EQ(rig.mods().is_on(Modifier::RightShift), visible);
            XASSERT_EQ(rig.mods().is_on(Modifier::Alt), visible);

            XASSERT(rig.up(KeyCode::CtrlLeft) == expected);
            XASSERT(!rig.mods().is_on(Modifier::Ctrl));
        } });
}

int main()
{
    testScenarios();
    testReleaseAndVisibility();
    testPrinting();
    testModifierKeys();
    testSpecialKeys();
    testSelection();
    testFailures();
    testSettingsChanges();
    testCombinations();
    return finish();
}
