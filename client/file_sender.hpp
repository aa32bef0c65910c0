#pragma once

// ============================================================
// file_sender.hpp -- Single-file, single-connection sender
//
// Pipeline per send():
//   gzip the file -> SHA-256 over the compressed bytes -> connect
//   -> one file record (8 KB chunks, one flush) -> terminator
//   -> half-close.
// A FileSender keeps no state between calls; the runner creates one
// per file and runs many of them concurrently, each on its own socket.
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "../common/socket.hpp"
#include "../common/metrics.hpp"
#include "../common/instrumentation.hpp"
#include <atomic>
#include <string>

enum class TransferStatus {
    OK,
    IO_ERROR,        // file unreadable or name not encodable; nothing sent
    CONNECT_FAILED,  // no connection; no protocol bytes written
    SEND_FAILED,     // connection broke while writing
};

const char* transfer_status_str(TransferStatus s);

struct TransferResult {
    TransferStatus status{TransferStatus::OK};
    std::string    file;
    std::string    message;
    std::string    digest;
    u64            original_size{0};
    u64            compressed_size{0};
    double         latency_ms{0};

    bool ok() const { return status == TransferStatus::OK; }
};

struct SenderOptions {
    int    connect_retry_secs{0};        // 0 = single connect attempt
    size_t chunk_size{CHUNK_SIZE};
    // Optional; when set, a pending connect retry gives up
    const std::atomic<bool>* cancel{nullptr};
};

class FileSender {
public:
    FileSender(SenderOptions options,
               Metrics& metrics,
               Instrumentation& instr = noop_instrumentation());

    // Send one file to host:port. Never throws; every failure is
    // reported through the returned status.
    TransferResult send(const std::string& file_path, const std::string& host, u16 port);

private:
    SenderOptions    opts_;
    Metrics&         metrics_;
    Instrumentation& instr_;

    // Connect, retrying with back-off until connect_retry_secs elapse.
    // Throws the last connect error when giving up.
    TcpSocket connect_with_retry(const std::string& host, u16 port);
};
