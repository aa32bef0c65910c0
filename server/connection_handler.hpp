#pragma once

// ============================================================
// connection_handler.hpp -- Per-connection receive state machine
//
//   AWAITING_HEADER -> READING_PAYLOAD -> VERIFYING -> DECOMPRESSING
//        ^                                   |             |
//        |                         mismatch  |   bad gzip  |
//        +-----------------------------------+-------------+
//        +------------------------------- WRITING <--------+
//
//   AWAITING_HEADER --(empty name)--> DONE
//   any state --(EOF, timeout, unsafe path, socket/disk error)--> FAILED
//
// A checksum mismatch or a bad gzip stream only skips that file;
// the next record on the same connection is processed normally.
// ============================================================

#include "../common/platform.hpp"
#include "../common/socket.hpp"
#include "../common/protocol.hpp"
#include "../common/metrics.hpp"
#include "../common/instrumentation.hpp"
#include "path_lock.hpp"
#include <filesystem>
#include <string>
#include <vector>

class TcpReadBuffer;

enum class HandlerState {
    AWAITING_HEADER,
    READING_PAYLOAD,
    VERIFYING,
    DECOMPRESSING,
    WRITING,
    DONE,
    FAILED,
};

// Why a session ended. Only TERMINATED is a normal end.
enum class SessionEnd {
    TERMINATED,       // termination marker received
    PEER_CLOSED,      // stream ended between records without the marker
    UNEXPECTED_EOF,   // stream ended inside a record
    TIMEOUT,          // idle-read timeout expired
    UNSAFE_PATH,      // a name resolved outside the output directory
    PROTOCOL_ERROR,   // header out of bounds
    IO_ERROR,         // socket reset or disk failure
};

const char* session_end_str(SessionEnd e);

struct SessionResult {
    SessionEnd  end{SessionEnd::IO_ERROR};
    std::string reason;
    u32         files_saved{0};
    u32         checksum_mismatches{0};
    u32         decompress_failures{0};

    bool ok() const { return end == SessionEnd::TERMINATED; }
};

struct HandlerOptions {
    std::filesystem::path output_root;        // from file_io::prepare_output_root()
    u64                   max_payload_bytes{DEFAULT_MAX_PAYLOAD_BYTES};
    u64                   max_file_bytes{DEFAULT_MAX_FILE_BYTES};   // decompressed
    int                   idle_timeout_ms{0}; // 0 = wait forever
    PathLockTable*        path_locks{nullptr}; // null = no per-path serialisation
};

class ConnectionHandler {
public:
    // Payload is read in pieces of this size
    static constexpr size_t PAYLOAD_READ_STEP = 1024 * 1024;

    ConnectionHandler(TcpSocket socket,
                      HandlerOptions options,
                      Metrics& metrics,
                      Instrumentation& instr);

    // Run the receive loop until the session ends (blocking, call in its
    // own thread). Never throws; the outcome is in the result.
    SessionResult run();

    HandlerState state() const { return state_; }
    const std::string& peer() const { return peer_; }

private:
    TcpSocket        sock_;
    HandlerOptions   opts_;
    Metrics&         metrics_;
    Instrumentation& instr_;
    std::string      peer_;
    HandlerState     state_{HandlerState::AWAITING_HEADER};
    SessionResult    result_;

    // Record currently in flight
    FileRecordHeader hdr_;
    std::vector<u8>  payload_;
    std::vector<u8>  data_;
    double           record_start_ms_{0};

    // ---- State handlers; each returns the next state ----
    HandlerState on_awaiting_header(TcpReadBuffer& in);
    HandlerState on_reading_payload(TcpReadBuffer& in);
    HandlerState on_verifying();
    HandlerState on_decompressing();
    HandlerState on_writing();

    void finish(SessionEnd end, const std::string& reason);
    void reset_record();
};
