// =============================================================================
// settings.cpp — Keyboard preferences
// =============================================================================

#include "settings.hpp"
#include "../lib/errors/error.hpp"

#include <cstdlib>
#include <utility>

namespace keybridge
{

    KeymapProfile parse_keymap_profile(const std::string &value)
    {
        if (value == prefs::KEYMODE_RIGHT || value == "right")
            return KeymapProfile::RightSide;
        if (value == prefs::KEYMODE_LEFT || value == "left")
            return KeymapProfile::LeftSide;
        if (value == prefs::KEYMODE_NONE)
            return KeymapProfile::None;
        throw ConfigError(prefs::KEYMODE, value);
    }

    DeviceShortcut parse_device_shortcut(const std::string &value)
    {
        if (value == prefs::SHORTCUT_CTRLA_SPACE || value == "ctrla-space")
            return DeviceShortcut::CtrlASpace;
        if (value == prefs::SHORTCUT_CTRLA || value == "ctrla")
            return DeviceShortcut::CtrlA;
        if (value == prefs::SHORTCUT_ESC || value == "esc")
            return DeviceShortcut::Escape;
        if (value == prefs::SHORTCUT_ESC_A || value == "esc-a")
            return DeviceShortcut::EscapeA;
        throw ConfigError(prefs::DEVICE_SHORTCUT, value);
    }

    const char *to_pref_value(KeymapProfile profile)
    {
        switch (profile)
        {
        case KeymapProfile::RightSide:
            return prefs::KEYMODE_RIGHT;
        case KeymapProfile::LeftSide:
            return prefs::KEYMODE_LEFT;
        case KeymapProfile::None:
            return prefs::KEYMODE_NONE;
        }
        return prefs::KEYMODE_RIGHT;
    }

    const char *to_pref_value(DeviceShortcut shortcut)
    {
        switch (shortcut)
        {
        case DeviceShortcut::CtrlASpace:
            return prefs::SHORTCUT_CTRLA_SPACE;
        case DeviceShortcut::CtrlA:
            return prefs::SHORTCUT_CTRLA;
        case DeviceShortcut::Escape:
            return prefs::SHORTCUT_ESC;
        case DeviceShortcut::EscapeA:
            return prefs::SHORTCUT_ESC_A;
        }
        return prefs::SHORTCUT_CTRLA_SPACE;
    }

    // =========================================================================
    // MemorySettings
    // =========================================================================

    MemorySettings::MemorySettings()
    {
        values_[prefs::KEYMODE] = prefs::KEYMODE_RIGHT;
        values_[prefs::DEVICE_SHORTCUT] = prefs::SHORTCUT_CTRLA_SPACE;
        values_[prefs::ENCODING] = prefs::DEFAULT_ENCODING;
    }

    int MemorySettings::subscribe(Listener listener)
    {
        int id = next_listener_id_++;
        listeners_[id] = std::move(listener);
        return id;
    }

    void MemorySettings::unsubscribe(int id)
    {
        listeners_.erase(id);
    }

    void MemorySettings::set(const std::string &key, const std::string &value)
    {
        auto it = values_.find(key);
        if (it != values_.end() && it->second == value)
            return;

        values_[key] = value;
        for (auto &entry : listeners_)
            entry.second(key);
    }

    std::string MemorySettings::get(const std::string &key) const
    {
        auto it = values_.find(key);
        return it == values_.end() ? std::string() : it->second;
    }

    // =========================================================================
    // EnvSettings
    // =========================================================================

    static const char *env_or_null(const char *name)
    {
        const char *v = std::getenv(name);
        return (v && *v) ? v : nullptr;
    }

    EnvSettings::EnvSettings()
    {
        if (const char *v = env_or_null("KEYBRIDGE_KEYMODE"))
            set(prefs::KEYMODE, to_pref_value(parse_keymap_profile(v)));

        if (const char *v = env_or_null("KEYBRIDGE_SHORTCUT"))
            set(prefs::DEVICE_SHORTCUT, to_pref_value(parse_device_shortcut(v)));

        if (const char *v = env_or_null("KEYBRIDGE_ENCODING"))
            set(prefs::ENCODING, v);
    }

} // namespace keybridge
