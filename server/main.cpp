// ============================================================
// server/main.cpp -- gzxfer receiver entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "../common/hash.hpp"
#include "../common/metrics.hpp"
#include "../common/instrumentation.hpp"
#include "server_app.hpp"
#include <atomic>
#include <iostream>
#include <string>
#include <vector>
#include <thread>
#include <cstring>
#include <cstdlib>
#include <csignal>
#ifndef _WIN32
#  include <pthread.h>
#endif

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " [output_dir] [port] [options]\n"
        << "\n"
        << "  output_dir         directory received files are written to (default: "
        << DEFAULT_OUTPUT_DIR << ")\n"
        << "  port               TCP port to listen on (default: " << DEFAULT_PORT << ")\n"
        << "\nOptions:\n"
        << "  --ip A             IPv4 address to listen on (default: 0.0.0.0)\n"
        << "  --idle-timeout-s N drop a connection that sends nothing for N seconds (default: off)\n"
        << "  --max-payload-mb N reject records declaring more than N MiB of payload (default: 4096)\n"
        << "  --max-file-mb N    skip files that decompress to more than N MiB (default: 16384)\n"
        << "  --no-path-lock     do not serialize writers of the same target file\n"
        << "  --log-file F       also append log lines to F\n"
        << "  --error-log F      failed-transfer log (default: transfer_errors.log, \"\" disables)\n"
        << "  --verbose          enable debug logging and per-stage trace lines\n"
        << "\nThe receiver runs until interrupted (SIGINT/SIGTERM) and accepts any\n"
        << "number of concurrent senders.\n"
        << "\nExample:\n"
        << "  " << prog << " /srv/incoming 5050 --idle-timeout-s 60\n";
}

#ifndef _WIN32
// Signals are taken by a dedicated sigwait() thread, so stop() runs in a
// normal thread context rather than inside a signal handler.
class SignalWatcher {
public:
    explicit SignalWatcher(ServerApp& app) : app_(app) {
        sigemptyset(&set_);
        sigaddset(&set_, SIGINT);
        sigaddset(&set_, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &set_, nullptr);
        thread_ = std::thread([this] {
            int sig = 0;
            if (sigwait(&set_, &sig) != 0) return;
            if (exiting_.load()) return;
            LOG_INFO("[Server] Caught signal " + std::to_string(sig) + ", shutting down");
            app_.stop();
        });
    }

    ~SignalWatcher() {
        exiting_.store(true);
        if (thread_.joinable()) {
            // Wake the watcher if no signal arrived
            pthread_kill(thread_.native_handle(), SIGTERM);
            thread_.join();
        }
    }

private:
    ServerApp&        app_;
    sigset_t          set_;
    std::atomic<bool> exiting_{false};
    std::thread       thread_;
};
#else
static ServerApp* g_app = nullptr;

static void sig_handler(int /*sig*/) {
    if (g_app) g_app->stop();
}
#endif

int main(int argc, char* argv[]) {
    platform::Guard platform_guard;

#ifndef _WIN32
    signal(SIGPIPE, SIG_IGN);
#endif

    ServerConfig cfg;
    std::vector<std::string> positional;
    std::string log_file;
    std::string error_log = "transfer_errors.log";
    int  idle_timeout_s = 0;
    long long max_payload_mb = (long long)(DEFAULT_MAX_PAYLOAD_BYTES / (1024 * 1024));
    long long max_file_mb = (long long)(DEFAULT_MAX_FILE_BYTES / (1024 * 1024));
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--ip") == 0 && i + 1 < argc) {
            cfg.listen_ip = argv[++i];
        } else if (std::strcmp(argv[i], "--idle-timeout-s") == 0 && i + 1 < argc) {
            idle_timeout_s = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--max-payload-mb") == 0 && i + 1 < argc) {
            max_payload_mb = std::atoll(argv[++i]);
        } else if (std::strcmp(argv[i], "--max-file-mb") == 0 && i + 1 < argc) {
            max_file_mb = std::atoll(argv[++i]);
        } else if (std::strcmp(argv[i], "--no-path-lock") == 0) {
            cfg.serialize_same_path = false;
        } else if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
            log_file = argv[++i];
        } else if (std::strcmp(argv[i], "--error-log") == 0 && i + 1 < argc) {
            error_log = argv[++i];
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

    if (positional.size() > 2) {
        print_usage(argv[0]);
        return 1;
    }
    if (positional.size() >= 1) cfg.output_dir = positional[0];
    if (positional.size() == 2) {
        int port_int = std::atoi(positional[1].c_str());
        if (!utils::validate_port(port_int)) {
            std::cerr << "ERROR: Invalid port: " << positional[1] << "\n";
            return 1;
        }
        cfg.listen_port = (u16)port_int;
    }

    if (!utils::validate_path(cfg.output_dir)) {
        std::cerr << "ERROR: Invalid output_dir\n";
        return 1;
    }
    if (cfg.listen_ip != "0.0.0.0" && !utils::validate_ip(cfg.listen_ip)) {
        std::cerr << "ERROR: Invalid IP address: " << cfg.listen_ip << "\n";
        return 1;
    }
    if (idle_timeout_s < 0 || idle_timeout_s > 24 * 3600) {
        std::cerr << "ERROR: --idle-timeout-s must be 0-86400\n";
        return 1;
    }
    if (max_payload_mb < 1 || max_payload_mb > 1024LL * 1024) {
        std::cerr << "ERROR: --max-payload-mb must be 1-1048576\n";
        return 1;
    }
    if (max_file_mb < 1 || max_file_mb > 16LL * 1024 * 1024) {
        std::cerr << "ERROR: --max-file-mb must be 1-16777216\n";
        return 1;
    }
    cfg.idle_timeout_ms   = idle_timeout_s * 1000;
    cfg.max_payload_bytes = (u64)max_payload_mb * 1024 * 1024;
    cfg.max_file_bytes    = (u64)max_file_mb * 1024 * 1024;

    Logger::get().set_level(verbose ? LogLevel::DEBUG : LogLevel::INFO);

    try {
        if (!log_file.empty()) Logger::get().set_log_file(log_file);
        Logger::get().set_transfer_error_file(error_log);
        hash::ensure_sha256_available();

        Metrics metrics;
        LogInstrumentation trace;
        ServerApp app(std::move(cfg), metrics,
                      verbose ? static_cast<Instrumentation&>(trace) : noop_instrumentation());
        app.listen();

#ifndef _WIN32
        SignalWatcher watcher(app);
        return app.run();
#else
        g_app = &app;
        std::signal(SIGINT,  sig_handler);
        std::signal(SIGTERM, sig_handler);
        int rc = app.run();
        g_app = nullptr;
        return rc;
#endif
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
