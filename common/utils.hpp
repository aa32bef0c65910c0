#pragma once

// ============================================================
// utils.hpp -- Utility functions
// ============================================================

#include "platform.hpp"
#include <string>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <sstream>
#include <iomanip>

namespace utils {

// Monotonic milliseconds, for latency measurement only
inline double steady_ms() {
    using namespace std::chrono;
    return duration<double, std::milli>(
        steady_clock::now().time_since_epoch()
    ).count();
}

// Format bytes as human-readable (e.g., "1.23 MB")
inline std::string format_bytes(u64 bytes) {
    if (bytes < 1024ULL) {
        return std::to_string(bytes) + " B";
    } else if (bytes < 1024ULL * 1024) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2) << (double)bytes / 1024.0 << " KB";
        return ss.str();
    } else if (bytes < 1024ULL * 1024 * 1024) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2) << (double)bytes / (1024.0 * 1024) << " MB";
        return ss.str();
    } else {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2) << (double)bytes / (1024.0 * 1024 * 1024) << " GB";
        return ss.str();
    }
}

// Format speed as "X.XX MB/s"
inline std::string format_speed(double bytes_per_sec) {
    std::ostringstream ss;
    if (bytes_per_sec < 1024.0) {
        ss << std::fixed << std::setprecision(1) << bytes_per_sec << " B/s";
    } else if (bytes_per_sec < 1024.0 * 1024) {
        ss << std::fixed << std::setprecision(2) << bytes_per_sec / 1024.0 << " KB/s";
    } else if (bytes_per_sec < 1024.0 * 1024 * 1024) {
        ss << std::fixed << std::setprecision(2) << bytes_per_sec / (1024.0 * 1024) << " MB/s";
    } else {
        ss << std::fixed << std::setprecision(2) << bytes_per_sec / (1024.0 * 1024 * 1024) << " GB/s";
    }
    return ss.str();
}

// Format milliseconds as "12.3 ms"
inline std::string format_ms(double ms) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << ms << " ms";
    return ss.str();
}

// Validate IPv4 address string
inline bool validate_ip(const std::string& ip) {
    int a, b, c, d;
    char tail;
    if (sscanf(ip.c_str(), "%d.%d.%d.%d%c", &a, &b, &c, &d, &tail) != 4) return false;
    return (a >= 0 && a <= 255) && (b >= 0 && b <= 255) &&
           (c >= 0 && c <= 255) && (d >= 0 && d <= 255);
}

// Validate a host name or IPv4 literal (resolved later by getaddrinfo)
inline bool validate_host(const std::string& host) {
    if (host.empty() || host.size() > 253) return false;
    for (char c : host) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '.' || c == '-' || c == '_';
        if (!ok) return false;
    }
    return true;
}

// Validate port number (1-65535)
inline bool validate_port(int port) {
    return port >= 1 && port <= 65535;
}

// Validate that a path is non-empty and doesn't contain null bytes
inline bool validate_path(const std::string& path) {
    if (path.empty()) return false;
    for (char c : path) {
        if (c == '\0') return false;
    }
    return true;
}

} // namespace utils
