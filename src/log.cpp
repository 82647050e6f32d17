#include "log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace winnow {

namespace {

std::atomic<LogLevel> currentLevel{LogLevel::Info};
std::mutex logMutex;

}  // anonymous namespace

void setLogLevel(LogLevel level) { currentLevel.store(level); }

LogLevel logLevel() { return currentLevel.load(std::memory_order_relaxed); }

void writeLogLine(const std::string& line) {
    std::lock_guard<std::mutex> lock(logMutex);
    std::cerr << line << '\n';
}

}  // namespace winnow
