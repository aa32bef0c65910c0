// ============================================================
// file_sender.cpp -- Single-file sender implementation
// ============================================================

#include "file_sender.hpp"
#include "../common/protocol_io.hpp"
#include "../common/write_buffer.hpp"
#include "../common/gzip.hpp"
#include "../common/hash.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <chrono>
#include <thread>
#include <vector>

const char* transfer_status_str(TransferStatus s) {
    switch (s) {
        case TransferStatus::OK:             return "ok";
        case TransferStatus::IO_ERROR:       return "I/O error";
        case TransferStatus::CONNECT_FAILED: return "connect failed";
        case TransferStatus::SEND_FAILED:    return "send failed";
    }
    return "unknown";
}

FileSender::FileSender(SenderOptions options,
                       Metrics& metrics,
                       Instrumentation& instr)
    : opts_(options)
    , metrics_(metrics)
    , instr_(instr)
{}

// ---------------------------------------------------------------
// connect_with_retry
// ---------------------------------------------------------------

TcpSocket FileSender::connect_with_retry(const std::string& host, u16 port) {
    using clock = std::chrono::steady_clock;
    auto deadline = clock::now() + std::chrono::seconds(std::max(opts_.connect_retry_secs, 0));

    int delay_ms = 500;
    const int max_delay_ms = 8000;

    for (;;) {
        try {
            TcpSocket s;
            s.connect(host, port);
            return s;
        } catch (const std::exception& e) {
            bool cancelled = opts_.cancel && opts_.cancel->load();
            if (cancelled || clock::now() >= deadline) throw;
            LOG_WARN("[Client] receiver " + host + ":" + std::to_string(port) +
                     " not ready (" + e.what() + "), retry in " +
                     utils::format_ms(delay_ms));
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
            delay_ms = std::min(delay_ms * 2, max_delay_ms);
        }
    }
}

// ---------------------------------------------------------------
// send
// ---------------------------------------------------------------

TransferResult FileSender::send(const std::string& file_path, const std::string& host, u16 port) {
    TransferResult res;
    res.file = file_path;
    double t_start = utils::steady_ms();

    // Hooks see the name that goes on the wire, logs the local path
    FileRecordHeader hdr;
    hdr.name = file_io::wire_name(file_path);

    auto fail = [&](TransferStatus st, const std::string& msg) {
        res.status     = st;
        res.message    = msg;
        res.latency_ms = utils::steady_ms() - t_start;
        LOG_ERROR("[Client] " + file_path + ": " + transfer_status_str(st) + ": " + msg);
        instr_.on_send_completed(hdr.name.empty() ? file_path : hdr.name, false, res.latency_ms);
        return res;
    };

    if (hdr.name.empty()) {
        return fail(TransferStatus::IO_ERROR, "path has no file name");
    }
    if (hdr.name.size() > MAX_WIRE_STRING_LEN) {
        return fail(TransferStatus::IO_ERROR, "file name too long for the wire (" +
                    std::to_string(hdr.name.size()) + " bytes)");
    }

    // ---- 1. compress ----
    std::vector<u8> payload;
    try {
        res.original_size = file_io::get_file_size(file_path);
        instr_.on_send_started(hdr.name, res.original_size);
        instr_.on_compress_started(hdr.name);
        double t0 = utils::steady_ms();
        payload = gz::gzip_file(file_path);
        instr_.on_compress_completed(hdr.name, res.original_size, payload.size(),
                                     utils::steady_ms() - t0);
    } catch (const std::exception& e) {
        return fail(TransferStatus::IO_ERROR, e.what());
    }
    res.compressed_size = payload.size();
    hdr.payload_size    = payload.size();

    // ---- 2. digest over the compressed bytes ----
    try {
        instr_.on_checksum_started(hdr.name);
        double t0 = utils::steady_ms();
        hdr.digest = hash::sha256_hex(payload);
        instr_.on_checksum_completed(hdr.name, hdr.digest, utils::steady_ms() - t0);
    } catch (const std::exception& e) {
        return fail(TransferStatus::IO_ERROR, e.what());
    }
    res.digest = hdr.digest;

    // ---- 3. connect ----
    TcpSocket sock;
    try {
        sock = connect_with_retry(host, port);
    } catch (const std::exception& e) {
        return fail(TransferStatus::CONNECT_FAILED, e.what());
    }
    std::string peer = host + ":" + std::to_string(port);
    instr_.on_connection_established(peer);

    // ---- 4+5. record, terminator, half-close ----
    try {
        TcpWriteBuffer out(sock);
        instr_.on_chunk_transfer_started(hdr.name, hdr.payload_size);
        double t0 = utils::steady_ms();
        u64 chunks = proto::write_record(out, hdr, payload.data(), opts_.chunk_size);
        out.flush();
        instr_.on_chunk_transfer_completed(hdr.name, chunks, utils::steady_ms() - t0);

        proto::write_terminator(out);
        out.flush();
        sock.shutdown_write();
    } catch (const std::exception& e) {
        return fail(TransferStatus::SEND_FAILED, e.what());
    }
    sock.close();

    res.latency_ms = utils::steady_ms() - t_start;
    metrics_.files_sent.fetch_add(1, std::memory_order_relaxed);
    metrics_.transfer_latency_ms.record(res.latency_ms);
    instr_.on_send_completed(hdr.name, true, res.latency_ms);

    LOG_INFO("[Client] Sent " + hdr.name + " (" + utils::format_bytes(res.original_size) +
             " -> " + utils::format_bytes(res.compressed_size) + " gzip) to " + peer +
             " in " + utils::format_ms(res.latency_ms));
    return res;
}
