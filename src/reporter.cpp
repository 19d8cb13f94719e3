#include "reporter.hpp"
#include <fstream>
#include <chrono>
#include <ctime>
#include <format>
#include <print>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto timeT = std::chrono::system_clock::to_time_t(now);
    std::tm tmNow{};
    localtime_r(&timeT, &tmNow);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", &tmNow);
    return timeBuf;
}

} // namespace

LogFileReporter::LogFileReporter(const std::string& logFile, const std::string& errorLogFile)
    : logFile(logFile), errorLogFile(errorLogFile) {}

void LogFileReporter::append(const std::string& path, const std::string& entry) {
    if (path.empty()) {
        return;
    }
    std::error_code ec;
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
    }
    std::ofstream log(path, std::ios::app);
    if (log.is_open()) {
        log << entry << '\n';
        log.flush();
    } else {
        std::println(stderr, "Error: Cannot write to log file: {}", path);
    }
}

void LogFileReporter::info(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex);
    std::string logEntry = std::format("[{}] {}", timestamp(), message);
    std::println("{}", logEntry);
    append(logFile, logEntry);
}

void LogFileReporter::warn(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex);
    std::string logEntry = std::format("[{}] WARNING: {}", timestamp(), message);
    std::println(stderr, "{}", logEntry);
    append(logFile, logEntry);
}

void LogFileReporter::error(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex);
    std::string logEntry = std::format("[{}] ERROR: {}", timestamp(), message);
    std::println(stderr, "{}", logEntry);
    append(logFile, logEntry);
    append(errorLogFile, logEntry);
}
