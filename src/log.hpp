#pragma once

#include <fstream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

namespace cosign {

enum class LogLevel {
    Debug = 0,
    Info,
    Warn,
    Error
};

// Process-wide logger. Lines go to stderr and, once a file is opened, to that
// file as well:
//   2026-01-01T12:00:00Z [INFO] message
class Log {
public:
    static void set_level(LogLevel level);
    static LogLevel level();
    static bool enabled(LogLevel level);

    // Appends to `path` in addition to stderr; an empty path closes the file
    static void set_file(const std::string& path);

    // Suppresses stderr output (files still receive lines)
    static void set_quiet(bool quiet);

    static void write(LogLevel level, const std::string& message);

    // Parses "debug", "info", "warn" or "error"; throws ValidationError otherwise
    static LogLevel parse_level(std::string_view name);
    static const char* level_name(LogLevel level);

private:
    Log() = delete;

    static std::mutex mu_;
    static LogLevel level_;
    static bool quiet_;
    static std::ofstream fout_;
};

} // namespace cosign

#define COSIGN_LOG(lvl, msg) \
    do { \
        if (::cosign::Log::enabled(lvl)) { \
            std::ostringstream cosign_log_os_; \
            cosign_log_os_ << msg; \
            ::cosign::Log::write(lvl, cosign_log_os_.str()); \
        } \
    } while (0)

#define LOG_DEBUG(msg) COSIGN_LOG(::cosign::LogLevel::Debug, msg)
#define LOG_INFO(msg)  COSIGN_LOG(::cosign::LogLevel::Info, msg)
#define LOG_WARN(msg)  COSIGN_LOG(::cosign::LogLevel::Warn, msg)
#define LOG_ERROR(msg) COSIGN_LOG(::cosign::LogLevel::Error, msg)
