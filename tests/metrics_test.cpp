// ============================================================
// metrics_test.cpp -- Counters and latency histogram
// ============================================================

#include "../common/metrics.hpp"
#include <gtest/gtest.h>
#include <thread>
#include <vector>

TEST(LatencyHistogramTest, EmptySnapshot) {
    LatencyHistogram h;
    auto s = h.snapshot();
    EXPECT_EQ(s.count, 0u);
    EXPECT_DOUBLE_EQ(s.mean_ms(), 0.0);
}

TEST(LatencyHistogramTest, BucketsAndStats) {
    LatencyHistogram h;
    h.record(0.5);     // <= 1
    h.record(1.0);     // <= 1 (bounds are inclusive)
    h.record(7.0);     // <= 10
    h.record(6000.0);  // overflow bucket
    h.record(-3.0);    // clamped to 0

    auto s = h.snapshot();
    EXPECT_EQ(s.count, 5u);
    EXPECT_EQ(s.buckets[0], 3u);
    EXPECT_EQ(s.buckets[2], 1u);
    EXPECT_EQ(s.buckets[LatencyHistogram::NUM_BUCKETS - 1], 1u);
    EXPECT_DOUBLE_EQ(s.min_ms, 0.0);
    EXPECT_DOUBLE_EQ(s.max_ms, 6000.0);
    EXPECT_DOUBLE_EQ(s.sum_ms, 6008.5);
}

TEST(MetricsTest, ConcurrentUpdatesAreNotLost) {
    Metrics m;
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&m]() {
            for (int i = 0; i < 1000; ++i) {
                m.files_received.fetch_add(1);
                m.transfer_latency_ms.record(2.0);
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(m.files_received.load(), 8000u);
    EXPECT_EQ(m.transfer_latency_ms.snapshot().count, 8000u);
    EXPECT_EQ(m.transfer_latency_ms.snapshot().buckets[1], 8000u);
}

TEST(MetricsTest, SummaryMentionsCounters) {
    Metrics m;
    m.files_sent = 3;
    m.checksum_mismatches = 1;
    m.transfer_latency_ms.record(4.0);
    std::string s = m.summary();
    EXPECT_NE(s.find("sent=3"), std::string::npos);
    EXPECT_NE(s.find("mismatches=1"), std::string::npos);
    EXPECT_NE(s.find("latency(n=1"), std::string::npos);
}
