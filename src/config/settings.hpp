#pragma once

// =============================================================================
// settings.hpp — Keyboard preferences
// =============================================================================
// Preferences are stored as strings under fixed keys (the way a preference
// store or an environment hands them over) and parsed into enums here.
//
//   keymode          which side's modifier keys double as shortcuts
//   device_shortcut  what the programmable device button sends
//   encoding         charset for characters at or above 0x80
// =============================================================================

#include <functional>
#include <map>
#include <string>

namespace keybridge
{

    namespace prefs
    {
        // Keys
        constexpr const char *KEYMODE = "keymode";
        constexpr const char *DEVICE_SHORTCUT = "device_shortcut";
        constexpr const char *ENCODING = "encoding";

        // keymode values
        constexpr const char *KEYMODE_RIGHT = "Use right-side keys";
        constexpr const char *KEYMODE_LEFT = "Use left-side keys";
        constexpr const char *KEYMODE_NONE = "none";

        // device_shortcut values
        constexpr const char *SHORTCUT_CTRLA_SPACE = "Ctrl+A then Space";
        constexpr const char *SHORTCUT_CTRLA = "Ctrl+A";
        constexpr const char *SHORTCUT_ESC = "Esc";
        constexpr const char *SHORTCUT_ESC_A = "Esc+A";

        constexpr const char *DEFAULT_ENCODING = "UTF-8";
    } // namespace prefs

    enum class KeymapProfile
    {
        RightSide,
        LeftSide,
        None,
    };

    enum class DeviceShortcut
    {
        CtrlASpace,
        CtrlA,
        Escape,
        EscapeA,
    };

    /// Accepts the stored value or a short alias ("right", "left", "none").
    /// Throws ConfigError on anything else.
    KeymapProfile parse_keymap_profile(const std::string &value);

    /// Accepts the stored value or a short alias ("ctrla-space", "ctrla",
    /// "esc", "esc-a"). Throws ConfigError on anything else.
    DeviceShortcut parse_device_shortcut(const std::string &value);

    const char *to_pref_value(KeymapProfile profile);
    const char *to_pref_value(DeviceShortcut shortcut);

    // =========================================================================
    // Settings — read side of the preference store
    // =========================================================================

    class Settings
    {
    public:
        using Listener = std::function<void(const std::string &key)>;

        virtual ~Settings() = default;

        virtual std::string keymode() const = 0;
        virtual std::string device_shortcut() const = 0;
        virtual std::string encoding() const = 0;

        /// Called with the key name after a value changes. Returns an id for
        /// unsubscribe().
        virtual int subscribe(Listener listener) = 0;
        virtual void unsubscribe(int id) = 0;
    };

    // =========================================================================
    // MemorySettings — in-process store
    // =========================================================================

    class MemorySettings : public Settings
    {
    public:
        MemorySettings();

        std::string keymode() const override { return get(prefs::KEYMODE); }
        std::string device_shortcut() const override { return get(prefs::DEVICE_SHORTCUT); }
        std::string encoding() const override { return get(prefs::ENCODING); }

        int subscribe(Listener listener) override;
        void unsubscribe(int id) override;

        /// Store `value` under `key` and notify listeners if it changed.
        void set(const std::string &key, const std::string &value);
        std::string get(const std::string &key) const;

    private:
        std::map<std::string, std::string> values_;
        std::map<int, Listener> listeners_;
        int next_listener_id_ = 1;
    };

    // =========================================================================
    // EnvSettings — MemorySettings seeded from the environment
    // =========================================================================
    //   KEYBRIDGE_KEYMODE   right | left | none | full value
    //   KEYBRIDGE_SHORTCUT  ctrla-space | ctrla | esc | esc-a | full value
    //   KEYBRIDGE_ENCODING  charset name
    // Values are validated on load; a bad value throws ConfigError.
    // =========================================================================

    class EnvSettings : public MemorySettings
    {
    public:
        EnvSettings();
    };

} // namespace keybridge
