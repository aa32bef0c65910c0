// ============================================================
// instrumentation.cpp -- LogInstrumentation
// ============================================================

#include "instrumentation.hpp"
#include "logger.hpp"
#include "utils.hpp"

void LogInstrumentation::on_connection_established(const std::string& peer) {
    LOG_DEBUG("[trace] connection_established peer=" + peer);
}

void LogInstrumentation::on_send_started(const std::string& file, u64 original_size) {
    LOG_DEBUG("[trace] send_started file=" + file +
              " file.original.size=" + std::to_string(original_size));
}

void LogInstrumentation::on_send_completed(const std::string& file, bool ok, double latency_ms) {
    LOG_DEBUG("[trace] send_completed file=" + file + (ok ? " ok" : " failed") +
              " latency=" + utils::format_ms(latency_ms));
}

void LogInstrumentation::on_compress_started(const std::string& file) {
    LOG_DEBUG("[trace] compress_started file=" + file);
}

void LogInstrumentation::on_compress_completed(const std::string& file, u64 original_size,
                                               u64 compressed_size, double ms) {
    LOG_DEBUG("[trace] compress_completed file=" + file +
              " file.original.size=" + std::to_string(original_size) +
              " file.compressed.size=" + std::to_string(compressed_size) +
              " took=" + utils::format_ms(ms));
}

void LogInstrumentation::on_checksum_started(const std::string& file) {
    LOG_DEBUG("[trace] checksum_started file=" + file);
}

void LogInstrumentation::on_checksum_completed(const std::string& file, const std::string& digest,
                                               double ms) {
    LOG_DEBUG("[trace] checksum_completed file=" + file + " digest=" + digest +
              " took=" + utils::format_ms(ms));
}

void LogInstrumentation::on_chunk_transfer_started(const std::string& file, u64 payload_size) {
    LOG_DEBUG("[trace] chunk_transfer_started file=" + file +
              " file.compressed.size=" + std::to_string(payload_size));
}

void LogInstrumentation::on_chunk_transfer_completed(const std::string& file, u64 chunks,
                                                     double ms) {
    LOG_DEBUG("[trace] chunk_transfer_completed file=" + file +
              " chunks=" + std::to_string(chunks) + " took=" + utils::format_ms(ms));
}

void LogInstrumentation::on_receive_started(const std::string& peer, const std::string& file,
                                            u64 compressed_size) {
    LOG_DEBUG("[trace] receive_started peer=" + peer + " file=" + file +
              " file.compressed.size=" + std::to_string(compressed_size));
}

void LogInstrumentation::on_receive_completed(const std::string& peer, const std::string& file,
                                              double ms) {
    LOG_DEBUG("[trace] receive_completed peer=" + peer + " file=" + file +
              " took=" + utils::format_ms(ms));
}

void LogInstrumentation::on_checksum_verified(const std::string& file, const std::string& expected,
                                              const std::string& actual, bool match) {
    LOG_DEBUG("[trace] checksum_verified file=" + file + " expected=" + expected +
              " actual=" + actual + (match ? " match" : " MISMATCH"));
}

void LogInstrumentation::on_decompressed(const std::string& file, bool ok, u64 decompressed_size,
                                         const std::string& error) {
    if (ok) {
        LOG_DEBUG("[trace] decompressed file=" + file +
                  " file.decompressed.size=" + std::to_string(decompressed_size));
    } else {
        LOG_DEBUG("[trace] decompress_failed file=" + file + " error=" + error);
    }
}

void LogInstrumentation::on_written(const std::string& file, bool ok,
                                    const std::string& path_or_error, double ms) {
    LOG_DEBUG("[trace] write_to_disk file=" + file + (ok ? " path=" : " error=") +
              path_or_error + " took=" + utils::format_ms(ms));
}

void LogInstrumentation::on_termination_signal(const std::string& peer) {
    LOG_DEBUG("[trace] termination_signal_received peer=" + peer);
}

void LogInstrumentation::on_client_disconnected(const std::string& peer, const std::string& reason) {
    LOG_DEBUG("[trace] client_disconnected peer=" + peer + " reason=" + reason);
}
