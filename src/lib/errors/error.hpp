#pragma once

// =============================================================================
// Keybridge Error Hierarchy
// =============================================================================
// Every error keybridge can raise lives here. All inherit from KeybridgeError,
// which inherits from std::runtime_error, so a single
// `catch (KeybridgeError&)` catches any keybridge-specific error. Each
// subclass carries its category and a formatted `.what()` message.
// =============================================================================

#include <stdexcept>
#include <string>

namespace keybridge
{

    // ========================================================================
    // Base: KeybridgeError
    // ========================================================================
    // Standardised "[KEYBRIDGE ERROR] Category: message" format.
    // ========================================================================

    class KeybridgeError : public std::runtime_error
    {
    public:
        KeybridgeError(const std::string &category, const std::string &message)
            : std::runtime_error(formatMessage(category, message)),
              category_(category), detail_(message) {}

        const std::string &category() const noexcept { return category_; }
        const std::string &detail() const noexcept { return detail_; }

    private:
        std::string category_;
        std::string detail_;

        static std::string formatMessage(const std::string &category,
                                         const std::string &message)
        {
            return "[KEYBRIDGE ERROR] " + category + ": " + message;
        }
    };

    // ========================================================================
    // 1. Transport errors — the byte stream to the remote side
    // ========================================================================

    /// A write or flush on the transport failed.
    class TransportError : public KeybridgeError
    {
    public:
        explicit TransportError(const std::string &message)
            : KeybridgeError("TransportError", message) {}
    };

    // ========================================================================
    // 2. Session errors
    // ========================================================================

    /// Input needed the emulation engine before a session was attached.
    class SessionNotEstablishedError : public KeybridgeError
    {
    public:
        explicit SessionNotEstablishedError(const std::string &what_needed)
            : KeybridgeError("SessionNotEstablished",
                             what_needed + " is not attached yet") {}
    };

    // ========================================================================
    // 3. Configuration errors
    // ========================================================================

    /// Charset name the encoder cannot convert to.
    class EncodingError : public KeybridgeError
    {
    public:
        explicit EncodingError(const std::string &charset)
            : KeybridgeError("EncodingError",
                             "unsupported character encoding '" + charset + "'"),
              charset_(charset) {}

        const std::string &charset() const noexcept { return charset_; }

    private:
        std::string charset_;
    };

    /// Malformed configuration value (environment or preference store).
    class ConfigError : public KeybridgeError
    {
    public:
        ConfigError(const std::string &key, const std::string &value)
            : KeybridgeError("ConfigError",
                             "invalid value '" + value + "' for " + key) {}
    };

} // namespace keybridge
