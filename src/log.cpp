#include "log.hpp"
#include "error.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace cosign {

std::mutex Log::mu_;
LogLevel Log::level_ = LogLevel::Info;
bool Log::quiet_ = false;
std::ofstream Log::fout_;

namespace {

std::string timestamp() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

} // namespace

void Log::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mu_);
    level_ = level;
}

LogLevel Log::level() {
    std::lock_guard<std::mutex> lock(mu_);
    return level_;
}

bool Log::enabled(LogLevel level) {
    std::lock_guard<std::mutex> lock(mu_);
    return static_cast<int>(level) >= static_cast<int>(level_);
}

void Log::set_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(mu_);
    if (fout_.is_open()) {
        fout_.close();
    }
    if (path.empty()) {
        return;
    }
    fout_.open(path, std::ios::app);
    if (!fout_.is_open()) {
        throw CosignError(CosignError::ErrorType::Storage, "Failed to open log file " + path);
    }
}

void Log::set_quiet(bool quiet) {
    std::lock_guard<std::mutex> lock(mu_);
    quiet_ = quiet;
}

void Log::write(LogLevel level, const std::string& message) {
    std::string line = timestamp() + " [" + level_name(level) + "] " + message + "\n";

    std::lock_guard<std::mutex> lock(mu_);
    if (!quiet_) {
        std::cerr << line;
    }
    if (fout_.is_open()) {
        fout_ << line;
        fout_.flush();
    }
}

LogLevel Log::parse_level(std::string_view name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info")  return LogLevel::Info;
    if (name == "warn")  return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    throw CosignError(CosignError::ErrorType::Validation, "Unknown log level: " + std::string(name));
}

const char* Log::level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

} // namespace cosign
