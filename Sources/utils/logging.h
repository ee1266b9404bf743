#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace sudoku_rounds {

enum class LogLevel : uint8_t {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};

inline const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

inline std::tm local_time_now() {
    const auto now = std::chrono::system_clock::now();
    const auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    return tm;
}

// Process-wide log sink. The file is opened on the first record that passes
// the level filter, so runs that never log leave nothing behind.
class DebugLogger {
public:
    DebugLogger() {
        const std::tm tm = local_time_now();
        std::ostringstream name;
        name << "sudoku_rounds_"
             << std::put_time(&tm, "%Y%m%d_%H%M%S")
             << ".log";
        std::error_code ec;
        const std::filesystem::path cwd = std::filesystem::current_path(ec);
        path_ = ec ? name.str() : (cwd / name.str()).string();
    }

    std::string path() const {
        std::lock_guard<std::mutex> lock(mu_);
        return path_;
    }

    void set_path(const std::string& path) {
        std::lock_guard<std::mutex> lock(mu_);
        if (stream_.is_open()) {
            stream_.close();
        }
        path_ = path;
        open_failed_ = false;
    }

    void set_min_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mu_);
        min_level_ = level;
    }

    LogLevel min_level() const {
        std::lock_guard<std::mutex> lock(mu_);
        return min_level_;
    }

    bool enabled(LogLevel level) const {
        std::lock_guard<std::mutex> lock(mu_);
        return level >= min_level_;
    }

    void write(LogLevel level, const std::string& scope, const std::string& msg) {
        std::lock_guard<std::mutex> lock(mu_);
        if (level < min_level_ || !ensure_open()) {
            return;
        }
        const std::tm tm = local_time_now();
        stream_ << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
                << " [" << log_level_name(level) << "] "
                << "(" << scope << ") "
                << msg
                << "\n";
        stream_.flush();
    }

private:
    bool ensure_open() {
        if (stream_.is_open()) {
            return true;
        }
        if (open_failed_) {
            return false;
        }
        stream_.open(path_, std::ios::out | std::ios::app);
        if (!stream_) {
            open_failed_ = true;
            std::cerr << "Cannot open log file: " << path_ << std::endl;
            return false;
        }
        return true;
    }

    std::string path_;
    std::ofstream stream_;
    LogLevel min_level_ = LogLevel::Info;
    bool open_failed_ = false;
    mutable std::mutex mu_;
};

inline DebugLogger& debug_logger() {
    static DebugLogger logger;
    return logger;
}

inline void log_debug(const std::string& scope, const std::string& msg) {
    debug_logger().write(LogLevel::Debug, scope, msg);
}

inline void log_info(const std::string& scope, const std::string& msg) {
    debug_logger().write(LogLevel::Info, scope, msg);
}

inline void log_warn(const std::string& scope, const std::string& msg) {
    debug_logger().write(LogLevel::Warn, scope, msg);
}

inline void log_error(const std::string& scope, const std::string& msg) {
    debug_logger().write(LogLevel::Error, scope, msg);
}

} // namespace sudoku_rounds
