#pragma once

// ============================================================
// logger.hpp -- Thread-safe logger
// ============================================================

#include "platform.hpp"
#include <string>
#include <mutex>
#include <fstream>
#include <iostream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

enum class LogLevel {
    DEBUG = 0,
    INFO  = 1,
    WARN  = 2,
    ERR   = 3,
};

class Logger {
public:
    static Logger& get() {
        static Logger instance;
        return instance;
    }

    void set_level(LogLevel lvl) {
        std::lock_guard<std::mutex> lk(mutex_);
        level_ = lvl;
    }

    LogLevel level() {
        std::lock_guard<std::mutex> lk(mutex_);
        return level_;
    }

    void set_log_file(const std::string& path) {
        std::lock_guard<std::mutex> lk(mutex_);
        if (file_.is_open()) file_.close();
        file_.open(path, std::ios::app);
        if (!file_.is_open()) {
            throw std::runtime_error("Cannot open log file: " + path);
        }
    }

    // Destination of transfer_error() lines; empty disables the file
    void set_transfer_error_file(const std::string& path) {
        std::lock_guard<std::mutex> lk(mutex_);
        if (transfer_err_file_.is_open()) transfer_err_file_.close();
        transfer_err_path_ = path;
    }

    void log(LogLevel lvl, const std::string& msg) {
        std::lock_guard<std::mutex> lk(mutex_);
        if (lvl < level_) return;
        std::string line = format_line(lvl, msg);
        if (lvl >= LogLevel::WARN) {
            std::cerr << line << "\n";
        } else {
            std::cout << line << "\n";
        }
        if (file_.is_open()) {
            file_ << line << "\n";
            file_.flush();
        }
    }

    void info(const std::string& msg)  { log(LogLevel::INFO, msg); }
    void warn(const std::string& msg)  { log(LogLevel::WARN, msg); }
    void error(const std::string& msg) { log(LogLevel::ERR,  msg); }
    void debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }

    // Log a failed transfer (checksum mismatch, bad gzip stream, aborted
    // session) to stderr and to the dedicated transfer error log
    void transfer_error(const std::string& msg) {
        std::string line = format_line(LogLevel::WARN, "[TRANSFER] " + msg);
        std::lock_guard<std::mutex> lk(mutex_);
        std::cerr << line << "\n";
        if (file_.is_open()) {
            file_ << line << "\n";
            file_.flush();
        }
        if (transfer_err_path_.empty()) return;
        if (!transfer_err_file_.is_open()) {
            transfer_err_file_.open(transfer_err_path_, std::ios::app);
        }
        if (transfer_err_file_.is_open()) {
            transfer_err_file_ << line << "\n";
            transfer_err_file_.flush();
        }
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() : level_(LogLevel::INFO), transfer_err_path_("transfer_errors.log") {}

    static std::string format_line(LogLevel lvl, const std::string& msg) {
        auto now = std::chrono::system_clock::now();
        auto t   = std::chrono::system_clock::to_time_t(now);
        auto ms  = std::chrono::duration_cast<std::chrono::milliseconds>(
                       now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &t);
#else
        localtime_r(&t, &tm_buf);
#endif
        std::ostringstream ss;
        ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        ss << " [" << level_str(lvl) << "] " << msg;
        return ss.str();
    }

    static const char* level_str(LogLevel lvl) {
        switch (lvl) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERR:   return "ERROR";
        }
        return "?????";
    }

    std::mutex    mutex_;
    LogLevel      level_;
    std::ofstream file_;
    std::string   transfer_err_path_;
    std::ofstream transfer_err_file_;
};

// Convenience macros
#define LOG_INFO(msg)  Logger::get().info(msg)
#define LOG_WARN(msg)  Logger::get().warn(msg)
#define LOG_ERROR(msg) Logger::get().error(msg)
#define LOG_DEBUG(msg) Logger::get().debug(msg)
