#include "utils/logger.h"
#include <fstream>
#include <ctime>
#include <iostream>
#include <mutex>
#include <atomic>
#include <sstream>
#include <filesystem>
#include <algorithm>
#include <cctype>

namespace substrate {
namespace utils {

namespace {

std::atomic<LogLevel> currentLevel{LogLevel::INFO};
std::ofstream logFile;
std::string logPath;
std::mutex logMutex;
std::atomic<bool> consoleEnabled{true};
std::atomic<uint64_t> maxFileSize{10 * 1024 * 1024};
std::atomic<uint32_t> maxFiles{5};

void rotateUnlocked() {
    if (logPath.empty()) return;
    if (logFile.is_open()) logFile.close();

    std::error_code ec;
    uint32_t keep = maxFiles.load();
    if (keep > 0) {
        std::filesystem::remove(logPath + "." + std::to_string(keep), ec);
        for (uint32_t i = keep; i > 1; i--) {
            std::string older = logPath + "." + std::to_string(i - 1);
            if (std::filesystem::exists(older, ec)) {
                std::filesystem::rename(older, logPath + "." + std::to_string(i), ec);
            }
        }
        if (std::filesystem::exists(logPath, ec)) {
            std::filesystem::rename(logPath, logPath + ".1", ec);
        }
    }

    logFile.open(logPath, std::ios::app);
}

void writeLog(LogLevel level, const std::string& category, const std::string& msg) {
    if (level < currentLevel.load() || level == LogLevel::OFF) return;

    std::lock_guard<std::mutex> lock(logMutex);

    time_t now = std::time(nullptr);
    char timeBuf[64];
    std::tm tmBuf{};
    localtime_r(&now, &tmBuf);
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", &tmBuf);

    std::ostringstream oss;
    oss << timeBuf << " [" << Logger::levelName(level) << "]";
    if (!category.empty()) oss << " [" << category << "]";
    oss << " " << msg << "\n";
    std::string line = oss.str();

    if (consoleEnabled) {
        if (level >= LogLevel::ERROR) std::cerr << line;
        else std::cout << line;
    }

    if (logFile.is_open()) {
        logFile << line;
        logFile.flush();
        if (logFile.tellp() > static_cast<std::streampos>(maxFileSize.load())) {
            rotateUnlocked();
        }
    }
}

}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "?????";
    }
}

LogLevel Logger::parseLevel(const std::string& name, LogLevel def) {
    std::string v = name;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    if (v == "trace") return LogLevel::TRACE;
    if (v == "debug") return LogLevel::DEBUG;
    if (v == "info") return LogLevel::INFO;
    if (v == "warn" || v == "warning") return LogLevel::WARN;
    if (v == "error") return LogLevel::ERROR;
    if (v == "fatal") return LogLevel::FATAL;
    if (v == "off") return LogLevel::OFF;
    return def;
}

bool Logger::init(const std::string& path) {
    std::lock_guard<std::mutex> lock(logMutex);
    logPath = path;

    std::filesystem::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path(), ec);
    }

    if (logFile.is_open()) logFile.close();
    logFile.open(path, std::ios::app);
    return logFile.is_open();
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile.is_open()) {
        logFile.flush();
        logFile.close();
    }
    logPath.clear();
}

void Logger::setLevel(LogLevel level) {
    currentLevel = level;
}

void Logger::enableConsole(bool enable) {
    consoleEnabled = enable;
}

void Logger::setMaxFileSize(uint64_t bytes) {
    maxFileSize = bytes;
}

void Logger::setMaxFiles(uint32_t count) {
    maxFiles = count;
}

void Logger::log(LogLevel level, const std::string& category, const std::string& msg) {
    writeLog(level, category, msg);
}

}
}
