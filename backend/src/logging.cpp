#include "logging.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace {
    std::atomic<Log::Level> g_level{Log::Level::Info};
    std::mutex g_write_mutex;

    const char* levelTag(Log::Level lvl) {
        switch (lvl) {
            case Log::Level::Debug:   return "[debug] ";
            case Log::Level::Info:    return "[info] ";
            case Log::Level::Warning: return "[warning] ";
            case Log::Level::Error:   return "[error] ";
        }
        return "";
    }
}

namespace Log {

Level getLevel() {
    return g_level.load();
}

void setLevel(Level lvl) {
    g_level.store(lvl);
}

bool parseLevel(const std::string& name, Level& lvl) {
    if (name == "debug") lvl = Level::Debug;
    else if (name == "info") lvl = Level::Info;
    else if (name == "warning") lvl = Level::Warning;
    else if (name == "error") lvl = Level::Error;
    else return false;
    return true;
}

void write(Level lvl, const std::string& line) {
    if (lvl < getLevel()) return;

    // Scan and cast workers log concurrently; keep whole lines together
    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::cerr << levelTag(lvl) << line << std::endl;
}

}
