// ============================================================
// client_app.cpp -- gzxfer sender runner implementation
// ============================================================

#include "client_app.hpp"
#include "dir_scanner.hpp"
#include "../common/thread_pool.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <future>

ClientApp::ClientApp(ClientConfig config,
                     Metrics& metrics,
                     Instrumentation& instr)
    : config_(std::move(config))
    , metrics_(metrics)
    , instr_(instr)
{}

void ClientApp::stop() {
    stop_.store(true);
}

// ---------------------------------------------------------------
// run
// ---------------------------------------------------------------

int ClientApp::run() {
    results_.clear();

    DirScanner scanner(config_.inputs);
    std::vector<FileEntry> files = scanner.scan();
    if (files.empty()) {
        LOG_WARN("[Client] No files to send");
        return EXIT_OK;
    }

    u64 total_bytes = 0;
    for (const auto& f : files) total_bytes += f.file_size;

    size_t workers = std::min<size_t>(files.size(), (size_t)std::max(config_.max_parallel, 1));
    LOG_INFO("[Client] Sending " + std::to_string(files.size()) + " file(s), " +
             utils::format_bytes(total_bytes) + ", to " +
             config_.host + ":" + std::to_string(config_.port) + " over up to " +
             std::to_string(workers) + " connection(s)");

    SenderOptions sopts;
    sopts.connect_retry_secs = config_.connect_retry_secs;
    sopts.cancel             = &stop_;

    double t0 = utils::steady_ms();
    std::vector<std::future<TransferResult>> pending;
    pending.reserve(files.size());
    {
        ThreadPool pool(workers);
        for (const auto& fe : files) {
            std::string path = fe.path;
            pending.push_back(pool.enqueue([this, sopts, path]() {
                if (stop_.load()) {
                    TransferResult r;
                    r.status  = TransferStatus::CONNECT_FAILED;
                    r.file    = path;
                    r.message = "cancelled";
                    return r;
                }
                FileSender sender(sopts, metrics_, instr_);
                return sender.send(path, config_.host, config_.port);
            }));
        }
        // Pool destructor runs every queued sender and joins
    }

    results_.reserve(pending.size());
    for (auto& f : pending) {
        results_.push_back(f.get());
    }

    log_summary(utils::steady_ms() - t0);

    bool all_ok = std::all_of(results_.begin(), results_.end(),
                              [](const TransferResult& r) { return r.ok(); });
    return all_ok ? EXIT_OK : EXIT_PARTIAL;
}

void ClientApp::log_summary(double elapsed_ms) const {
    size_t ok = 0;
    u64 orig = 0, wire = 0;
    for (const auto& r : results_) {
        if (!r.ok()) continue;
        ++ok;
        orig += r.original_size;
        wire += r.compressed_size;
    }
    size_t failed = results_.size() - ok;
    double secs = elapsed_ms / 1000.0;

    std::string line = "[Client] Done: " + std::to_string(ok) + " sent, " +
                       std::to_string(failed) + " failed, " +
                       utils::format_bytes(orig) + " -> " + utils::format_bytes(wire) +
                       " on the wire in " + utils::format_ms(elapsed_ms);
    if (secs > 0) line += " (" + utils::format_speed((double)wire / secs) + ")";

    if (failed == 0) {
        LOG_INFO(line);
    } else {
        LOG_WARN(line);
        for (const auto& r : results_) {
            if (!r.ok()) {
                LOG_WARN("[Client]   " + r.file + ": " + transfer_status_str(r.status) +
                         " (" + r.message + ")");
            }
        }
    }
    LOG_DEBUG("[Client] " + metrics_.summary());
}
