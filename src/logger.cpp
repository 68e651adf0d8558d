#include "logger.hpp"
#include <atomic>
#include <mutex>

namespace {
    std::atomic<LogLevel> currentLevel{LogLevel::INFO};
    std::mutex writeMutex;
}

void Logger::setLevel(LogLevel newLevel) {
    currentLevel.store(newLevel);
}

void Logger::debug(const std::string& msg) {
    write(LogLevel::DEBUG, ansi::gray, "[DEBUG] ", msg);
}

void Logger::info(const std::string& msg) {
    write(LogLevel::INFO, ansi::white, "[INFO] ", msg);
}

void Logger::warn(const std::string& msg) {
    write(LogLevel::WARN, ansi::yellow, "[WARN] ", msg);
}

void Logger::error(const std::string& msg) {
    write(LogLevel::ERROR, ansi::red, "[ERROR] ", msg);
}

void Logger::write(LogLevel msgLevel, const std::string& color,
                   const char* tag, const std::string& msg) {
    if (currentLevel.load() < msgLevel) {
        return;
    }
    std::lock_guard<std::mutex> lock(writeMutex);
    std::cerr << color << tag << msg << ansi::reset << "\n";
}
