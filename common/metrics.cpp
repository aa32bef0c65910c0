// ============================================================
// metrics.cpp -- Metrics summary rendering
// ============================================================

#include "metrics.hpp"
#include "utils.hpp"

std::string Metrics::summary() const {
    auto lat = transfer_latency_ms.snapshot();
    std::string s;
    s += "sent=" + std::to_string(files_sent.load());
    s += " received=" + std::to_string(files_received.load());
    s += " mismatches=" + std::to_string(checksum_mismatches.load());
    s += " decompress_failures=" + std::to_string(decompress_failures.load());
    s += " bytes=" + utils::format_bytes(bytes_received.load());
    s += " sessions_ok=" + std::to_string(sessions_ok.load());
    s += " sessions_aborted=" + std::to_string(sessions_aborted.load());
    if (lat.count > 0) {
        s += " latency(n=" + std::to_string(lat.count) +
             " mean=" + utils::format_ms(lat.mean_ms()) +
             " max=" + utils::format_ms(lat.max_ms) + ")";
    }
    return s;
}
