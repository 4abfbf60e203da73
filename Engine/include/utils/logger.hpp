#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <string>
#include <mutex>

namespace Repealer {

/**
 * @brief Thread-safe logging utility for the engine and its tools.
 *
 * Output goes to stderr so that tools can keep stdout for JSON results.
 */
class Logger {
public:
    enum class Level {
        Debug,
        Info,
        Step,
        Success,
        Warning,
        Error
    };

    static void log(Level level, const std::string& message) {
        if (static_cast<int>(level) < min_level_ref().load()) return;

        static std::mutex mutex;
        std::lock_guard<std::mutex> lock(mutex);

        const char* color = "";
        const char* prefix = "";

        switch (level) {
            case Level::Debug:   color = "\033[0;90m"; prefix = "... "; break; // Grey
            case Level::Info:    color = "\033[0;36m"; prefix = "=== "; break; // Cyan
            case Level::Step:    color = "\033[1;33m"; prefix = ">>> "; break; // Yellow
            case Level::Success: color = "\033[0;32m"; prefix = "✓ ";   break; // Green
            case Level::Warning: color = "\033[1;33m"; prefix = "⚠ ";   break; // Yellow
            case Level::Error:   color = "\033[0;31m"; prefix = "✗ ";   break; // Red
        }

        std::cerr << color << prefix << message << "\033[0m" << std::endl;
    }

    static void set_level(Level level) { min_level_ref().store(static_cast<int>(level)); }
    static Level level() { return static_cast<Level>(min_level_ref().load()); }

    /**
     * @brief Parse "debug", "info", "warning"/"warn", "error".
     * @return false if the name is not recognized (out unchanged)
     */
    static bool parse_level(std::string name, Level& out) {
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (name == "debug")                          out = Level::Debug;
        else if (name == "info")                      out = Level::Info;
        else if (name == "warning" || name == "warn") out = Level::Warning;
        else if (name == "error")                     out = Level::Error;
        else return false;
        return true;
    }

    static void debug(const std::string& msg)   { log(Level::Debug, msg); }
    static void info(const std::string& msg)    { log(Level::Info, msg); }
    static void step(const std::string& msg)    { log(Level::Step, msg); }
    static void success(const std::string& msg) { log(Level::Success, msg); }
    static void warn(const std::string& msg)    { log(Level::Warning, msg); }
    static void error(const std::string& msg)   { log(Level::Error, msg); }

private:
    static std::atomic<int>& min_level_ref() {
        static std::atomic<int> level{static_cast<int>(Level::Info)};
        return level;
    }
};

} // namespace Repealer
