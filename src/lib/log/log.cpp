// =============================================================================
// log.cpp — Tagged stream logging to stderr
// =============================================================================

#include "log.hpp"

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace keybridge
{
    namespace log
    {

        namespace
        {
            std::atomic<int> g_level{-1}; // -1 = not initialised from env yet
            std::mutex g_write_mutex;

            Level from_env()
            {
                const char *env = std::getenv("KEYBRIDGE_LOG");
                if (!env)
                    return Level::Info;
                return parse_level(env, Level::Info);
            }

            const char *level_name(Level level)
            {
                switch (level)
                {
                case Level::Error:
                    return "error";
                case Level::Info:
                    return "info";
                case Level::Debug:
                    return "debug";
                }
                return "?";
            }
        }

        Level parse_level(const std::string &name, Level fallback)
        {
            if (name == "error")
                return Level::Error;
            if (name == "info")
                return Level::Info;
            if (name == "debug")
                return Level::Debug;
            return fallback;
        }

        void set_level(Level level)
        {
            g_level.store(static_cast<int>(level));
        }

        Level level()
        {
            int current = g_level.load();
            if (current < 0)
            {
                Level initial = from_env();
                g_level.compare_exchange_strong(current, static_cast<int>(initial));
                return static_cast<Level>(g_level.load());
            }
            return static_cast<Level>(current);
        }

        bool enabled(Level lvl)
        {
            return static_cast<int>(lvl) <= static_cast<int>(level());
        }

        void write(Level lvl, const std::string &tag, const std::string &message)
        {
            if (!enabled(lvl))
                return;

            std::lock_guard<std::mutex> lock(g_write_mutex);
            std::cerr << "[keybridge/" << tag << "] ";
            if (lvl != Level::Info)
                std::cerr << level_name(lvl) << ": ";
            std::cerr << message << std::endl;
        }

    } // namespace log
} // namespace keybridge
