#pragma once

// ============================================================
// metrics.hpp -- Process-wide transfer counters
//
// Updated concurrently by every sender/handler thread. Counters are
// plain atomics; the latency histogram keeps its own mutex.
// ============================================================

#include "platform.hpp"
#include <array>
#include <atomic>
#include <mutex>
#include <string>

// Fixed-bucket latency histogram (milliseconds)
class LatencyHistogram {
public:
    // Upper bounds of each bucket; the last bucket catches everything above
    static constexpr std::array<double, 10> BOUNDS_MS = {
        1, 5, 10, 25, 50, 100, 250, 500, 1000, 5000
    };
    static constexpr size_t NUM_BUCKETS = BOUNDS_MS.size() + 1;

    struct Snapshot {
        u64    count{0};
        double sum_ms{0};
        double min_ms{0};
        double max_ms{0};
        std::array<u64, NUM_BUCKETS> buckets{};

        double mean_ms() const { return count ? sum_ms / (double)count : 0.0; }
    };

    void record(double ms) {
        if (ms < 0) ms = 0;
        size_t idx = BOUNDS_MS.size();
        for (size_t i = 0; i < BOUNDS_MS.size(); ++i) {
            if (ms <= BOUNDS_MS[i]) { idx = i; break; }
        }
        std::lock_guard<std::mutex> lk(mutex_);
        if (snap_.count == 0 || ms < snap_.min_ms) snap_.min_ms = ms;
        if (snap_.count == 0 || ms > snap_.max_ms) snap_.max_ms = ms;
        snap_.count  += 1;
        snap_.sum_ms += ms;
        snap_.buckets[idx] += 1;
    }

    Snapshot snapshot() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return snap_;
    }

private:
    mutable std::mutex mutex_;
    Snapshot           snap_;
};

struct Metrics {
    std::atomic<u64> files_sent{0};
    std::atomic<u64> files_received{0};
    std::atomic<u64> checksum_mismatches{0};
    std::atomic<u64> decompress_failures{0};
    std::atomic<u64> bytes_received{0};     // decompressed bytes written
    std::atomic<u64> sessions_ok{0};        // ended with the termination marker
    std::atomic<u64> sessions_aborted{0};
    LatencyHistogram transfer_latency_ms;

    // e.g. "sent=3 received=0 mismatches=0 ... latency(n=3 mean=4.1 ms max=6.0 ms)"
    std::string summary() const;
};
