#pragma once

#include <string>
#include <cstdint>

namespace substrate {
namespace utils {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6
};

class Logger {
public:
    // Appends to `path`, rotating it into path.1 .. path.N past the size limit.
    static bool init(const std::string& path);
    static void shutdown();
    static void setLevel(LogLevel level);
    static LogLevel parseLevel(const std::string& name, LogLevel def = LogLevel::INFO);
    static const char* levelName(LogLevel level);
    static void enableConsole(bool enable);
    static void setMaxFileSize(uint64_t bytes);
    static void setMaxFiles(uint32_t count);

    static void log(LogLevel level, const std::string& category, const std::string& msg);
};

}
}
