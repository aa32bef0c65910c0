#pragma once

// ============================================================
// client_app.hpp -- gzxfer sender process: collects the input
//   files and sends each one on its own connection, several at
//   a time
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "../common/metrics.hpp"
#include "../common/instrumentation.hpp"
#include "file_sender.hpp"
#include <atomic>
#include <string>
#include <vector>

struct ClientConfig {
    std::string              host{DEFAULT_HOST};
    u16                      port{DEFAULT_PORT};
    std::vector<std::string> inputs;                 // files and/or directories
    int                      max_parallel{8};        // concurrent connections
    int                      connect_retry_secs{0};  // 0 = single attempt
};

class ClientApp {
public:
    // Exit codes of run()
    static constexpr int EXIT_OK      = 0;
    static constexpr int EXIT_PARTIAL = 3;

    ClientApp(ClientConfig config,
              Metrics& metrics,
              Instrumentation& instr = noop_instrumentation());

    // Send every input file and wait for all senders.
    // Returns EXIT_OK if every file was sent (or there was nothing to
    // send), EXIT_PARTIAL if any send failed.
    int run();

    // Abort pending connect retries; sends already connected finish
    void stop();

    // One entry per collected file, in collection order (valid after run())
    const std::vector<TransferResult>& results() const { return results_; }

private:
    ClientConfig                config_;
    Metrics&                    metrics_;
    Instrumentation&            instr_;
    std::atomic<bool>           stop_{false};
    std::vector<TransferResult> results_;

    void log_summary(double elapsed_ms) const;
};
