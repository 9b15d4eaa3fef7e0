// =============================================================================
// Input Tests
// =============================================================================
// Verifies the QWERTY character map and the SDL event translation that
// feeds the dispatcher.
// =============================================================================

#include "test_harness.hpp"
#include "../src/app/sdl_key_source.hpp"
#include "../src/input/key_character_map.hpp"
#include "../src/input/key_event.hpp"

#include <cstring>

using namespace keybridge;

// ============================================================================
// Section 1: QwertyKeyMap
// ============================================================================

static void testKeyMap()
{
    std::cout << "\n===== QwertyKeyMap =====\n";

    runTest("letters, digits and punctuation are printing keys", []()
            {
        QwertyKeyMap map;
        XASSERT(map.is_printing_key(KeyCode::A));
        XASSERT(map.is_printing_key(KeyCode::Num7));
        XASSERT(map.is_printing_key(KeyCode::Slash)); });

    runTest("space, tab and control keys are not printing keys", []()
            {
        QwertyKeyMap map;
        XASSERT(!map.is_printing_key(KeyCode::Space));
        XASSERT(!map.is_printing_key(KeyCode::Tab));
        XASSERT(!map.is_printing_key(KeyCode::Enter));
        XASSERT(!map.is_printing_key(KeyCode::DpadLeft));
        XASSERT(!map.is_printing_key(KeyCode::ShiftLeft)); });

    runTest("base and shifted glyphs", []()
            {
        QwertyKeyMap map;
        XASSERT_EQ(map.get(KeyCode::G, 0), char32_t(U'g'));
        XASSERT_EQ(map.get(KeyCode::G, kMetaShiftOn), char32_t(U'G'));
        XASSERT_EQ(map.get(KeyCode::Num9, kMetaShiftOn), char32_t(U'('));
        XASSERT_EQ(map.get(KeyCode::Slash, kMetaShiftOn), char32_t(U'?'));
        XASSERT_EQ(map.get(KeyCode::Space, 0), char32_t(U' '));
        XASSERT_EQ(map.get(KeyCode::Tab, 0), char32_t(U'\t')); });

    runTest("alt layer: top row digits, home row symbols", []()
            {
        QwertyKeyMap map;
        XASSERT_EQ(map.get(KeyCode::Q, kMetaAltOn), char32_t(U'1'));
        XASSERT_EQ(map.get(KeyCode::P, kMetaAltOn), char32_t(U'0'));
        XASSERT_EQ(map.get(KeyCode::J, kMetaAltOn), char32_t(U'|'));
        XASSERT_EQ(map.get(KeyCode::Q, kMetaAltOn | kMetaShiftOn), char32_t(U'1')); });

    runTest("alt without an alternate glyph falls back", []()
            {
        QwertyKeyMap map;
        XASSERT_EQ(map.get(KeyCode::Z, kMetaAltOn), char32_t(U'z'));
        XASSERT_EQ(map.get(KeyCode::Z, kMetaAltOn | kMetaShiftOn), char32_t(U'Z')); });

    runTest("unmapped keys yield 0", []()
            {
        QwertyKeyMap map;
        XASSERT_EQ(map.get(KeyCode::DpadUp, 0), char32_t(0));
        XASSERT_EQ(map.get(KeyCode::Unknown, kMetaShiftOn), char32_t(0)); });

    runTest("digit_value", []()
            {
        XASSERT_EQ(digit_value(KeyCode::Num0), 0);
        XASSERT_EQ(digit_value(KeyCode::Num9), 9);
        XASSERT_EQ(digit_value(KeyCode::A), -1); });
}

// ============================================================================
// Section 2: SDL translation
// ============================================================================

static SDL_Event keyEvent(Uint32 type, SDL_Keycode sym, Uint16 mod = KMOD_NONE, Uint8 repeat = 0)
{
    SDL_Event e;
    SDL_zero(e);
    e.type = type;
    e.key.keysym.sym = sym;
    e.key.keysym.mod = mod;
    e.key.repeat = repeat;
    return e;
}

static SDL_Event textEvent(const char *utf8)
{
    SDL_Event e;
    SDL_zero(e);
    e.type = SDL_TEXTINPUT;
    std::strncpy(e.text.text, utf8, sizeof(e.text.text) - 1);
    return e;
}

static void testSdlTranslation()
{
    std::cout << "\n===== SDL Translation =====\n";

    runTest("key codes", []()
            {
        XASSERT(SdlKeySource::key_code(SDLK_a) == KeyCode::A);
        XASSERT(SdlKeySource::key_code(SDLK_3) == KeyCode::Num3);
        XASSERT(SdlKeySource::key_code(SDLK_RETURN) == KeyCode::Enter);
        XASSERT(SdlKeySource::key_code(SDLK_BACKSPACE) == KeyCode::Del);
        XASSERT(SdlKeySource::key_code(SDLK_ESCAPE) == KeyCode::Search);
        XASSERT(SdlKeySource::key_code(SDLK_RSHIFT) == KeyCode::ShiftRight);
        XASSERT(SdlKeySource::key_code(SDLK_KP_PLUS) == KeyCode::VolumeUp);
        XASSERT(SdlKeySource::key_code(SDLK_F5) == KeyCode::Unknown); });

    runTest("modifier flags", []()
            {
        XASSERT_EQ(SdlKeySource::meta_state(KMOD_NONE), 0);
        XASSERT_EQ(SdlKeySource::meta_state(KMOD_LSHIFT), kMetaShiftOn);
        XASSERT_EQ(SdlKeySource::meta_state(KMOD_RALT | KMOD_LCTRL), kMetaAltOn | kMetaCtrlOn);
        XASSERT_EQ(SdlKeySource::meta_state(KMOD_CAPS), kMetaCapsLockOn); });

    runTest("keydown and keyup", []()
            {
        KeyEvent out;
        XASSERT(SdlKeySource::translate(keyEvent(SDL_KEYDOWN, SDLK_b, KMOD_LSHIFT), out));
        XASSERT(out.code == KeyCode::B);
        XASSERT(out.action == KeyAction::Down);
        XASSERT_EQ(out.meta_state, kMetaShiftOn);
        XASSERT_EQ(out.repeat_count, 0);

        XASSERT(SdlKeySource::translate(keyEvent(SDL_KEYUP, SDLK_LCTRL), out));
        XASSERT(out.code == KeyCode::CtrlLeft);
        XASSERT(out.action == KeyAction::Up); });

    runTest("auto-repeat is reported", []()
            {
        KeyEvent out;
        XASSERT(SdlKeySource::translate(keyEvent(SDL_KEYDOWN, SDLK_LSHIFT, KMOD_NONE, 1), out));
        XASSERT_EQ(out.repeat_count, 1); });

    runTest("unmapped keys are skipped", []()
            {
        KeyEvent out;
        XASSERT(!SdlKeySource::translate(keyEvent(SDL_KEYDOWN, SDLK_F7), out)); });

    runTest("non-ASCII text becomes a batch", []()
            {
        KeyEvent out;
        XASSERT(SdlKeySource::translate(textEvent("\xc3\xa9t\xc3\xa9"), out));
        XASSERT(out.action == KeyAction::Multiple);
        XASSERT(out.code == KeyCode::Unknown);
        XASSERT_EQ(out.characters, std::string("\xc3\xa9t\xc3\xa9")); });

    runTest("plain ASCII text is left to the keydown", []()
            {
        KeyEvent out;
        XASSERT(!SdlKeySource::translate(textEvent("a"), out)); });
}

int main()
{
    testKeyMap();
    testSdlTranslation();
    return finish();
}
