#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
#include <string>

/**
 * @brief Minimal level-gated console output.
 *
 * Info and debug go to std::cout, warnings and errors to std::cerr.
 * Writes are serialised so lines from concurrent workers do not interleave.
 */
namespace DupFinder::Log
{
    enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3 };

    inline std::atomic<Level>& currentLevel() {
        static std::atomic<Level> level{Level::Info};
        return level;
    }

    inline std::mutex& outputMutex() {
        static std::mutex m;
        return m;
    }

    inline void setLevel(Level level) { currentLevel().store(level); }

    /**
     * @brief Parses "debug", "info", "warn"/"warning" or "error" (case-insensitive).
     * @return false if the name is not recognised; `out` is left untouched.
     */
    inline bool parseLevel(const std::string& name, Level& out) {
        std::string n = name;
        std::transform(n.begin(), n.end(), n.begin(),
            [](unsigned char c){ return std::tolower(c); });
        if (n == "debug") { out = Level::Debug; return true; }
        if (n == "info") { out = Level::Info; return true; }
        if (n == "warn" || n == "warning") { out = Level::Warn; return true; }
        if (n == "error") { out = Level::Error; return true; }
        return false;
    }

    inline bool enabled(Level level) {
        return static_cast<int>(level) >= static_cast<int>(currentLevel().load());
    }

    inline void write(Level level, const std::string& message) {
        if (!enabled(level)) return;
        std::lock_guard<std::mutex> lock(outputMutex());
        switch (level) {
            case Level::Debug: std::cout << "[debug] " << message << std::endl; break;
            case Level::Info:  std::cout << message << std::endl; break;
            case Level::Warn:  std::cerr << "Warning: " << message << std::endl; break;
            case Level::Error: std::cerr << "Error: " << message << std::endl; break;
        }
    }

    inline void debug(const std::string& message) { write(Level::Debug, message); }
    inline void info(const std::string& message)  { write(Level::Info, message); }
    inline void warn(const std::string& message)  { write(Level::Warn, message); }
    inline void error(const std::string& message) { write(Level::Error, message); }

} // namespace DupFinder::Log
