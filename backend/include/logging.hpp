#pragma once

#include <sstream>
#include <string>

/**
 * Minimal leveled logger shared by every engine module
 * Lines go to stderr so they never mix with command output on stdout
 */
namespace Log {
    enum class Level {
        Debug,
        Info,
        Warning,
        Error
    };

    Level getLevel();
    void setLevel(Level lvl);

    /**
     * Parses a level name ("debug", "info", "warning", "error")
     * @param name: Level name, case sensitive
     * @param lvl: Receives the parsed level
     * @return: false if the name is unknown
     */
    bool parseLevel(const std::string& name, Level& lvl);

    // Writes a finished line if lvl passes the current threshold
    void write(Level lvl, const std::string& line);

    template<typename T>
    void append(std::ostringstream& msg, const T& value) {
        msg << value;
    }

    template<typename T, typename... Args>
    void append(std::ostringstream& msg, const T& value, const Args&... args) {
        msg << value;
        append(msg, args...);
    }

    template<typename... Args>
    void write(Level lvl, const Args&... args) {
        if (lvl < getLevel()) return;
        std::ostringstream msg;
        append(msg, args...);
        write(lvl, msg.str());
    }
}

#define LOG_DEBUG(...)    Log::write(Log::Level::Debug,   __VA_ARGS__)
#define LOG_INFO(...)     Log::write(Log::Level::Info,    __VA_ARGS__)
#define LOG_WARNING(...)  Log::write(Log::Level::Warning, __VA_ARGS__)
#define LOG_ERROR(...)    Log::write(Log::Level::Error,   __VA_ARGS__)
