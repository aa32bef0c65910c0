// ============================================================
// integration_test.cpp -- Receiver and senders over loopback
// ============================================================

#include "../server/server_app.hpp"
#include "../client/client_app.hpp"
#include "../client/file_sender.hpp"
#include "../common/protocol_io.hpp"
#include "../common/logger.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

class IntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::get().set_transfer_error_file("");

        ServerConfig cfg;
        cfg.output_dir  = (dir_.path() / "server-out").string();
        cfg.listen_ip   = "127.0.0.1";
        cfg.listen_port = 0;
        server_ = std::make_unique<ServerApp>(cfg, server_metrics_);
        server_->listen();
        server_thread_ = std::thread([this]() { server_->run(); });
    }

    void TearDown() override {
        server_->stop();
        if (server_thread_.joinable()) server_thread_.join();
        server_.reset();
    }

    // Poll until pred holds or timeout_ms passes
    static bool wait_for(const std::function<bool()>& pred, int timeout_ms = 10000) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (std::chrono::steady_clock::now() < deadline) {
            if (pred()) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return pred();
    }

    bool wait_received(u64 n) {
        return wait_for([&] { return server_metrics_.files_received.load() >= n; });
    }

    bool wait_sessions(u64 n) {
        return wait_for([&] {
            return server_metrics_.sessions_ok.load() + server_metrics_.sessions_aborted.load() >= n;
        });
    }

    fs::path out_dir() const { return server_->output_root(); }

    fs::path make_input(const std::string& rel, const std::vector<u8>& data) {
        fs::path p = dir_.path() / "files2transfer" / rel;
        test_util::write_file(p, data);
        return p;
    }

    test_util::TempDir          dir_{"integration"};
    Metrics                     server_metrics_;
    Metrics                     client_metrics_;
    std::unique_ptr<ServerApp>  server_;
    std::thread                 server_thread_;
};

/**
 * @test 12-byte "hello-world!" arrives byte-identical; one file received,
 *       no checksum mismatches
 */
TEST_F(IntegrationTest, HelloWorldScenario) {
    auto content = test_util::to_bytes("hello-world!");
    ASSERT_EQ(content.size(), 12u);
    auto path = make_input("hello.txt", content);

    FileSender sender(SenderOptions{}, client_metrics_);
    TransferResult r = sender.send(path.string(), "127.0.0.1", server_->port());
    ASSERT_TRUE(r.ok()) << r.message;

    ASSERT_TRUE(wait_sessions(1));
    EXPECT_EQ(server_metrics_.files_received.load(), 1u);
    EXPECT_EQ(server_metrics_.checksum_mismatches.load(), 0u);
    EXPECT_EQ(server_metrics_.sessions_ok.load(), 1u);
    EXPECT_EQ(client_metrics_.files_sent.load(), 1u);
    EXPECT_EQ(test_util::read_file(out_dir() / "hello.txt"), content);
}

/**
 * @test A compressed payload spanning several 8192-byte chunks is not
 *       truncated at chunk boundaries
 */
TEST_F(IntegrationTest, PayloadLargerThanOneChunk) {
    auto content = test_util::random_bytes(20000, 99);
    auto path = make_input("random.bin", content);

    FileSender sender(SenderOptions{}, client_metrics_);
    TransferResult r = sender.send(path.string(), "127.0.0.1", server_->port());
    ASSERT_TRUE(r.ok()) << r.message;
    ASSERT_GT(r.compressed_size, 2 * CHUNK_SIZE);

    ASSERT_TRUE(wait_received(1));
    EXPECT_EQ(test_util::read_file(out_dir() / "random.bin"), content);
}

TEST_F(IntegrationTest, ManyConcurrentSenders) {
    const int N = 24;
    std::vector<std::vector<u8>> contents;
    for (int i = 0; i < N; ++i) {
        contents.push_back(test_util::random_bytes(1000 + (size_t)i * 997, (unsigned)i));
        make_input("f" + std::to_string(i) + ".bin", contents.back());
    }

    ClientConfig cc;
    cc.host         = "127.0.0.1";
    cc.port         = server_->port();
    cc.inputs       = {(dir_.path() / "files2transfer").string()};
    cc.max_parallel = 8;
    ClientApp client(cc, client_metrics_);

    EXPECT_EQ(client.run(), ClientApp::EXIT_OK);
    EXPECT_EQ(client.results().size(), (size_t)N);
    EXPECT_EQ(client_metrics_.files_sent.load(), (u64)N);

    ASSERT_TRUE(wait_sessions(N));
    EXPECT_EQ(server_metrics_.files_received.load(), (u64)N);
    EXPECT_EQ(server_metrics_.sessions_ok.load(), (u64)N);
    for (int i = 0; i < N; ++i) {
        EXPECT_EQ(test_util::read_file(out_dir() / ("f" + std::to_string(i) + ".bin")), contents[i])
            << "file " << i;
    }
}

/**
 * @test Senders of the same name at once leave one complete copy
 */
TEST_F(IntegrationTest, SameTargetFromManyConnections) {
    const int N = 8;
    std::vector<fs::path> inputs;
    std::vector<std::vector<u8>> contents;
    for (int i = 0; i < N; ++i) {
        contents.push_back(test_util::random_bytes(30000, 100 + (unsigned)i));
        fs::path p = dir_.path() / ("src" + std::to_string(i)) / "shared.bin";
        test_util::write_file(p, contents.back());
        inputs.push_back(p);
    }

    std::vector<std::thread> threads;
    std::atomic<int> ok{0};
    for (int i = 0; i < N; ++i) {
        threads.emplace_back([&, i]() {
            Metrics m;
            FileSender sender(SenderOptions{}, m);
            if (sender.send(inputs[i].string(), "127.0.0.1", server_->port()).ok()) ++ok;
        });
    }
    for (auto& t : threads) t.join();
    ASSERT_EQ(ok.load(), N);
    ASSERT_TRUE(wait_sessions(N));

    auto final_bytes = test_util::read_file(out_dir() / "shared.bin");
    bool matches_one = false;
    for (auto& c : contents) {
        if (c == final_bytes) matches_one = true;
    }
    EXPECT_TRUE(matches_one);

    size_t entries = 0;
    for (auto& e : fs::directory_iterator(out_dir())) {
        (void)e;
        ++entries;
    }
    EXPECT_EQ(entries, 1u);   // no leftover temporaries
}

/**
 * @test An aborted session does not disturb the receiver
 */
TEST_F(IntegrationTest, ReceiverSurvivesAbruptDisconnect) {
    {
        TcpSocket raw;
        raw.connect("127.0.0.1", server_->port());
        FileRecordHeader h;
        h.digest       = std::string(64, 'a');
        h.name         = "partial.bin";
        h.payload_size = 1000;
        auto bytes = proto::encode_record_header(h);
        raw.send_all(bytes.data(), bytes.size());
        raw.send_all("xyz", 3);
    }
    ASSERT_TRUE(wait_sessions(1));
    EXPECT_EQ(server_metrics_.sessions_aborted.load(), 1u);
    EXPECT_FALSE(fs::exists(out_dir() / "partial.bin"));

    auto path = make_input("after.txt", test_util::to_bytes("after"));
    FileSender sender(SenderOptions{}, client_metrics_);
    ASSERT_TRUE(sender.send(path.string(), "127.0.0.1", server_->port()).ok());
    ASSERT_TRUE(wait_received(1));
    EXPECT_EQ(test_util::read_file(out_dir() / "after.txt"), test_util::to_bytes("after"));
}

TEST_F(IntegrationTest, StopWakesIdleConnections) {
    TcpSocket idle;
    idle.connect("127.0.0.1", server_->port());
    ASSERT_TRUE(wait_for([&] { return server_->active_handlers() == 1; }));

    server_->stop();
    server_thread_.join();
    EXPECT_EQ(server_->active_handlers(), 0u);
    EXPECT_EQ(server_metrics_.sessions_aborted.load(), 1u);
}

TEST_F(IntegrationTest, ClientReportsPartialFailure) {
    make_input("good.txt", test_util::to_bytes("good"));

    ClientConfig cc;
    cc.host   = "127.0.0.1";
    cc.port   = server_->port();
    cc.inputs = {(dir_.path() / "files2transfer" / "good.txt").string(),
                 (dir_.path() / "files2transfer" / "good.txt").string() + ".missing-dir/"};
    ClientApp client(cc, client_metrics_);
    EXPECT_EQ(client.run(), ClientApp::EXIT_OK);   // missing input is skipped at collection

    server_->stop();
    server_thread_.join();

    ClientApp offline(cc, client_metrics_);
    EXPECT_EQ(offline.run(), ClientApp::EXIT_PARTIAL);
    ASSERT_EQ(offline.results().size(), 1u);
    EXPECT_EQ(offline.results()[0].status, TransferStatus::CONNECT_FAILED);
}

TEST_F(IntegrationTest, NothingToSendIsSuccess) {
    ClientConfig cc;
    cc.port   = server_->port();
    cc.inputs = {(dir_.path() / "does-not-exist").string()};
    ClientApp client(cc, client_metrics_);
    EXPECT_EQ(client.run(), ClientApp::EXIT_OK);
    EXPECT_TRUE(client.results().empty());
}
