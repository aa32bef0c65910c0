// ============================================================
// client/main.cpp -- gzxfer sender entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "../common/hash.hpp"
#include "../common/metrics.hpp"
#include "../common/instrumentation.hpp"
#include "client_app.hpp"
#include <iostream>
#include <string>
#include <vector>
#include <cstdlib>
#include <cstring>
#include <csignal>
#include <filesystem>

static ClientApp* g_app = nullptr;

static void sig_handler(int /*sig*/) {
    if (g_app) g_app->stop();
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " [host port] [file-or-dir...] [options]\n"
        << "\n"
        << "  host            receiver host name or IPv4 address (default: " << DEFAULT_HOST << ")\n"
        << "  port            receiver TCP port (default: " << DEFAULT_PORT << ")\n"
        << "  file-or-dir     files to send; directories are sent recursively\n"
        << "                  (default: " << DEFAULT_INPUT_DIR << ")\n"
        << "\nOptions:\n"
        << "  --parallel N    max concurrent connections, one file each (default: 8)\n"
        << "  --retry N       seconds to retry connecting if the receiver is not ready (default: 0)\n"
        << "  --log-file F    also append log lines to F\n"
        << "  --verbose       enable debug logging and per-stage trace lines\n"
        << "\nExamples:\n"
        << "  " << prog << " localhost 5050 report.pdf photos/\n"
        << "  " << prog << " 192.168.1.1 5050 files2transfer --parallel 4 --retry 30\n";
}

static bool is_number(const char* s) {
    if (!*s) return false;
    for (; *s; ++s) {
        if (*s < '0' || *s > '9') return false;
    }
    return true;
}

int main(int argc, char* argv[]) {
    platform::Guard platform_guard;

#ifndef _WIN32
    // Writes to a reset connection must fail with EPIPE, not kill us
    signal(SIGPIPE, SIG_IGN);
#endif

    ClientConfig cfg;
    std::vector<std::string> positional;
    std::string log_file;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--parallel") == 0 && i + 1 < argc) {
            cfg.max_parallel = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--retry") == 0 && i + 1 < argc) {
            cfg.connect_retry_secs = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
            log_file = argv[++i];
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (std::strncmp(argv[i], "--", 2) == 0) {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        } else {
            positional.push_back(argv[i]);
        }
    }

    // "host port inputs..." when the second word is a port and the first
    // is not an existing path; otherwise every word is an input
    size_t first_input = 0;
    if (positional.size() >= 2 && is_number(positional[1].c_str()) &&
        !std::filesystem::exists(positional[0])) {
        cfg.host = positional[0];
        int port_int = std::atoi(positional[1].c_str());
        if (!utils::validate_port(port_int)) {
            std::cerr << "ERROR: Invalid port: " << positional[1] << "\n";
            return 1;
        }
        cfg.port = (u16)port_int;
        first_input = 2;
    }
    cfg.inputs.assign(positional.begin() + (std::ptrdiff_t)first_input, positional.end());
    if (cfg.inputs.empty()) cfg.inputs.push_back(DEFAULT_INPUT_DIR);

    if (!utils::validate_host(cfg.host)) {
        std::cerr << "ERROR: Invalid host: " << cfg.host << "\n";
        return 1;
    }
    if (cfg.max_parallel < 1) {
        std::cerr << "ERROR: --parallel must be at least 1\n";
        return 1;
    }
    if (cfg.connect_retry_secs < 0) {
        std::cerr << "ERROR: --retry must not be negative\n";
        return 1;
    }
    for (const auto& in : cfg.inputs) {
        if (!utils::validate_path(in)) {
            std::cerr << "ERROR: Invalid input path: " << in << "\n";
            return 1;
        }
    }

    Logger::get().set_level(verbose ? LogLevel::DEBUG : LogLevel::INFO);

    try {
        if (!log_file.empty()) Logger::get().set_log_file(log_file);
        hash::ensure_sha256_available();

        Metrics metrics;
        LogInstrumentation trace;
        ClientApp app(cfg, metrics, verbose ? static_cast<Instrumentation&>(trace)
                                            : noop_instrumentation());
        g_app = &app;

        std::signal(SIGINT,  sig_handler);
        std::signal(SIGTERM, sig_handler);

        int rc = app.run();
        g_app = nullptr;
        return rc;
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
