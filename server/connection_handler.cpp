// ============================================================
// connection_handler.cpp -- Per-connection receive state machine
// ============================================================

#include "connection_handler.hpp"
#include "../common/protocol_io.hpp"
#include "../common/read_buffer.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "../common/file_io.hpp"
#include "../common/hash.hpp"
#include "../common/gzip.hpp"
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

const char* session_end_str(SessionEnd e) {
    switch (e) {
        case SessionEnd::TERMINATED:     return "terminated";
        case SessionEnd::PEER_CLOSED:    return "peer closed without termination marker";
        case SessionEnd::UNEXPECTED_EOF: return "unexpected end of stream";
        case SessionEnd::TIMEOUT:        return "idle timeout";
        case SessionEnd::UNSAFE_PATH:    return "unsafe path";
        case SessionEnd::PROTOCOL_ERROR: return "protocol error";
        case SessionEnd::IO_ERROR:       return "I/O error";
    }
    return "unknown";
}

ConnectionHandler::ConnectionHandler(TcpSocket socket,
                                     HandlerOptions options,
                                     Metrics& metrics,
                                     Instrumentation& instr)
    : sock_(std::move(socket))
    , opts_(std::move(options))
    , metrics_(metrics)
    , instr_(instr)
{
    peer_ = sock_.peer_addr();
    if (opts_.idle_timeout_ms > 0) {
        sock_.set_recv_timeout_ms(opts_.idle_timeout_ms);
    }
}

SessionResult ConnectionHandler::run() {
    instr_.on_connection_established(peer_);
    LOG_INFO("[Server] Client connected: " + peer_);

    TcpReadBuffer in(sock_);
    state_ = HandlerState::AWAITING_HEADER;

    try {
        while (state_ != HandlerState::DONE && state_ != HandlerState::FAILED) {
            switch (state_) {
                case HandlerState::AWAITING_HEADER: state_ = on_awaiting_header(in); break;
                case HandlerState::READING_PAYLOAD: state_ = on_reading_payload(in); break;
                case HandlerState::VERIFYING:       state_ = on_verifying();         break;
                case HandlerState::DECOMPRESSING:   state_ = on_decompressing();     break;
                case HandlerState::WRITING:         state_ = on_writing();           break;
                case HandlerState::DONE:
                case HandlerState::FAILED:
                    break;
            }
        }
    } catch (const UnexpectedEof& e) {
        finish(SessionEnd::UNEXPECTED_EOF, e.what());
    } catch (const ReadTimeout& e) {
        finish(SessionEnd::TIMEOUT, e.what());
    } catch (const UnsafePathError& e) {
        finish(SessionEnd::UNSAFE_PATH, e.what());
    } catch (const ProtocolError& e) {
        finish(SessionEnd::PROTOCOL_ERROR, e.what());
    } catch (const std::exception& e) {
        finish(SessionEnd::IO_ERROR, e.what());
    }

    if (result_.ok()) {
        metrics_.sessions_ok.fetch_add(1, std::memory_order_relaxed);
        LOG_INFO("[Server] Client finished: " + peer_ + " (" +
                 std::to_string(result_.files_saved) + " saved, " +
                 std::to_string(result_.checksum_mismatches) + " checksum mismatches, " +
                 std::to_string(result_.decompress_failures) + " decompress failures)");
    } else {
        metrics_.sessions_aborted.fetch_add(1, std::memory_order_relaxed);
        Logger::get().transfer_error("Session from " + peer_ + " aborted: " +
                                     session_end_str(result_.end) +
                                     (result_.reason.empty() ? "" : " (" + result_.reason + ")"));
    }
    instr_.on_client_disconnected(peer_, session_end_str(result_.end));
    return result_;
}

void ConnectionHandler::finish(SessionEnd end, const std::string& reason) {
    result_.end    = end;
    result_.reason = reason;
    state_ = end == SessionEnd::TERMINATED ? HandlerState::DONE : HandlerState::FAILED;
    reset_record();
}

void ConnectionHandler::reset_record() {
    hdr_ = FileRecordHeader{};
    payload_.clear();
    payload_.shrink_to_fit();
    data_.clear();
    data_.shrink_to_fit();
}

// ---- AWAITING_HEADER ----

HandlerState ConnectionHandler::on_awaiting_header(TcpReadBuffer& in) {
    reset_record();
    proto::HeaderStatus st = proto::read_record_header(in, hdr_, opts_.max_payload_bytes);

    switch (st) {
        case proto::HeaderStatus::TERMINATOR:
            instr_.on_termination_signal(peer_);
            LOG_INFO("[Server] Client " + peer_ + " sent termination signal.");
            finish(SessionEnd::TERMINATED, "");
            return HandlerState::DONE;
        case proto::HeaderStatus::PEER_CLOSED:
            finish(SessionEnd::PEER_CLOSED, "stream ended after " +
                   std::to_string(result_.files_saved) + " saved file(s)");
            return HandlerState::FAILED;
        case proto::HeaderStatus::OK:
            break;
    }

    record_start_ms_ = utils::steady_ms();
    instr_.on_receive_started(peer_, hdr_.name, hdr_.payload_size);
    LOG_DEBUG("[Server] Receiving " + hdr_.name + " (" +
              utils::format_bytes(hdr_.payload_size) + " compressed) from " + peer_);
    return HandlerState::READING_PAYLOAD;
}

// ---- READING_PAYLOAD ----

HandlerState ConnectionHandler::on_reading_payload(TcpReadBuffer& in) {
    // Grow with the bytes that actually arrive; the declared size alone
    // commits no memory.
    payload_.clear();
    payload_.reserve((size_t)std::min<u64>(hdr_.payload_size, PAYLOAD_READ_STEP));
    u64 remaining = hdr_.payload_size;
    while (remaining > 0) {
        size_t piece = (size_t)std::min<u64>(remaining, PAYLOAD_READ_STEP);
        size_t have  = payload_.size();
        payload_.resize(have + piece);
        in.read_exact(payload_.data() + have, piece, "compressed payload");
        remaining -= piece;
    }
    instr_.on_receive_completed(peer_, hdr_.name, utils::steady_ms() - record_start_ms_);
    return HandlerState::VERIFYING;
}

// ---- VERIFYING ----

HandlerState ConnectionHandler::on_verifying() {
    std::string actual = hash::sha256_hex(payload_);
    bool match = actual == hdr_.digest;
    instr_.on_checksum_verified(hdr_.name, hdr_.digest, actual, match);

    if (!match) {
        result_.checksum_mismatches += 1;
        metrics_.checksum_mismatches.fetch_add(1, std::memory_order_relaxed);
        Logger::get().transfer_error("Checksum mismatch for " + hdr_.name + " from " + peer_ +
                                     ", file skipped. expected=" + hdr_.digest +
                                     " actual=" + actual);
        return HandlerState::AWAITING_HEADER;
    }
    LOG_DEBUG("[Server] Checksum verified for " + hdr_.name);
    return HandlerState::DECOMPRESSING;
}

// ---- DECOMPRESSING ----

HandlerState ConnectionHandler::on_decompressing() {
    try {
        data_ = gz::gunzip(payload_, opts_.max_file_bytes);
    } catch (const DecodeError& e) {
        result_.decompress_failures += 1;
        metrics_.decompress_failures.fetch_add(1, std::memory_order_relaxed);
        instr_.on_decompressed(hdr_.name, false, 0, e.what());
        Logger::get().transfer_error("Decompression failed for " + hdr_.name + " from " + peer_ +
                                     " (checksum matched), file skipped: " + e.what());
        return HandlerState::AWAITING_HEADER;
    }
    // Compressed bytes are no longer needed
    payload_.clear();
    payload_.shrink_to_fit();
    instr_.on_decompressed(hdr_.name, true, data_.size(), "");
    return HandlerState::WRITING;
}

// ---- WRITING ----

HandlerState ConnectionHandler::on_writing() {
    double t0 = utils::steady_ms();
    fs::path target;
    try {
        target = file_io::resolve_output_path(opts_.output_root, hdr_.name);
        file_io::ensure_parent_dirs(opts_.output_root, target);

        PathLockTable::Guard guard;
        if (opts_.path_locks) {
            guard = opts_.path_locks->lock(target.string());
        }
        file_io::write_file_atomic(target, data_);
    } catch (const std::exception& e) {
        instr_.on_written(hdr_.name, false, e.what(), utils::steady_ms() - t0);
        throw;
    }
    instr_.on_written(hdr_.name, true, target.string(), utils::steady_ms() - t0);

    result_.files_saved += 1;
    metrics_.files_received.fetch_add(1, std::memory_order_relaxed);
    metrics_.bytes_received.fetch_add(data_.size(), std::memory_order_relaxed);
    LOG_INFO("[Server] Saved " + hdr_.name + " (" + std::to_string(data_.size()) +
             " bytes decompressed) from " + peer_);
    return HandlerState::AWAITING_HEADER;
}
