#pragma once

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>

namespace Lexigraph {

/**
 * @brief Thread-safe logging utility for the pipeline.
 *
 * Messages below the current threshold are dropped. Warnings and errors go
 * to stderr so artifact paths printed on stdout stay clean.
 */
class Logger {
public:
    enum class Level {
        Debug = 0,
        Info,
        Step,
        Success,
        Warning,
        Error,
        Off
    };

    static void set_level(Level level) { threshold().store(level); }
    static Level level() { return threshold().load(); }

    /**
     * @brief Parse "debug", "info", "warn", "error" or "off".
     * @return fallback when the name is unknown
     */
    static Level parse_level(const std::string& name, Level fallback = Level::Info) {
        if (name == "debug") return Level::Debug;
        if (name == "info") return Level::Info;
        if (name == "step") return Level::Step;
        if (name == "success") return Level::Success;
        if (name == "warn" || name == "warning") return Level::Warning;
        if (name == "error") return Level::Error;
        if (name == "off") return Level::Off;
        return fallback;
    }

    /// Apply LEXIGRAPH_LOG_LEVEL if set.
    static void init_from_env() {
        if (const char* env = std::getenv("LEXIGRAPH_LOG_LEVEL")) {
            set_level(parse_level(env, level()));
        }
    }

    static void log(Level level, const std::string& message) {
        if (level < threshold().load() || level == Level::Off) return;

        static std::mutex mutex;
        std::lock_guard<std::mutex> lock(mutex);

        const char* color = "";
        const char* prefix = "";

        switch (level) {
            case Level::Debug:   color = "\033[0;37m"; prefix = "... ";  break; // Grey
            case Level::Info:    color = "\033[0;36m"; prefix = "=== ";  break; // Cyan
            case Level::Step:    color = "\033[1;33m"; prefix = ">>> ";  break; // Yellow
            case Level::Success: color = "\033[0;32m"; prefix = "✓ ";    break; // Green
            case Level::Warning: color = "\033[1;33m"; prefix = "⚠ ";    break; // Yellow
            case Level::Error:   color = "\033[0;31m"; prefix = "✗ ";    break; // Red
            case Level::Off:     break;
        }

        std::ostream& out = (level >= Level::Warning) ? std::cerr : std::cout;
        out << color << prefix << message << "\033[0m" << std::endl;
    }

    static void debug(const std::string& msg)   { log(Level::Debug, msg); }
    static void info(const std::string& msg)    { log(Level::Info, msg); }
    static void step(const std::string& msg)    { log(Level::Step, msg); }
    static void success(const std::string& msg) { log(Level::Success, msg); }
    static void warn(const std::string& msg)    { log(Level::Warning, msg); }
    static void error(const std::string& msg)   { log(Level::Error, msg); }

private:
    static std::atomic<Level>& threshold() {
        static std::atomic<Level> value{Level::Info};
        return value;
    }
};

} // namespace Lexigraph
