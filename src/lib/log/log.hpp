#pragma once

// =============================================================================
// log.hpp — Tagged stream logging to stderr
// =============================================================================
// Lines look like "[keybridge/dispatch] message". The threshold comes from
// KEYBRIDGE_LOG (error | info | debug) the first time anything is logged and
// can be overridden with set_level().
// =============================================================================

#include <sstream>
#include <string>
#include <utility>

namespace keybridge
{
    namespace log
    {

        enum class Level
        {
            Error = 0,
            Info = 1,
            Debug = 2,
        };

        /// Parse a level name; unknown names yield `fallback`.
        Level parse_level(const std::string &name, Level fallback);

        void set_level(Level level);
        Level level();

        bool enabled(Level level);

        /// Write one line if `level` passes the threshold.
        void write(Level level, const std::string &tag, const std::string &message);

        inline void error(const std::string &tag, const std::string &message)
        {
            write(Level::Error, tag, message);
        }

        inline void info(const std::string &tag, const std::string &message)
        {
            write(Level::Info, tag, message);
        }

        inline void debug(const std::string &tag, const std::string &message)
        {
            write(Level::Debug, tag, message);
        }

        /// Build a message with operator<< only when the level is enabled:
        ///   LineBuilder(Level::Debug, "dispatch") << "key " << code;
        class LineBuilder
        {
        public:
            LineBuilder(Level level, std::string tag)
                : level_(level), tag_(std::move(tag)), on_(enabled(level)) {}

            ~LineBuilder()
            {
                if (on_)
                    write(level_, tag_, out_.str());
            }

            LineBuilder(const LineBuilder &) = delete;
            LineBuilder &operator=(const LineBuilder &) = delete;

            template <typename T>
            LineBuilder &operator<<(const T &value)
            {
                if (on_)
                    out_ << value;
                return *this;
            }

        private:
            Level level_;
            std::string tag_;
            bool on_;
            std::ostringstream out_;
        };

    } // namespace log
} // namespace keybridge
