#pragma once

// ============================================================
// test_util.hpp -- Helpers shared by the gzxfer tests
// ============================================================

#include "../common/platform.hpp"
#include "../common/socket.hpp"
#include "../common/instrumentation.hpp"
#include <mutex>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace test_util {

// Fresh directory under the system temp dir, removed on destruction
class TempDir {
public:
    explicit TempDir(const std::string& tag) {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("gzxfer_" + tag + "_" + std::to_string(rd()));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string str() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

// Two ends of a loopback TCP connection: {client, server}
inline std::pair<TcpSocket, TcpSocket> connected_pair() {
    TcpSocket listener;
    listener.bind_and_listen("127.0.0.1", 0, 1);
    TcpSocket client;
    client.connect("127.0.0.1", listener.local_port());
    TcpSocket server = listener.accept();
    return {std::move(client), std::move(server)};
}

inline std::vector<u8> random_bytes(size_t n, unsigned seed = 42) {
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    std::vector<u8> out(n);
    for (auto& b : out) b = (u8)dist(gen);
    return out;
}

inline std::vector<u8> to_bytes(const std::string& s) {
    return std::vector<u8>(s.begin(), s.end());
}

inline void write_file(const std::filesystem::path& p, const std::vector<u8>& data) {
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(data.data()), (std::streamsize)data.size());
}

inline std::vector<u8> read_file(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::binary);
    return std::vector<u8>((std::istreambuf_iterator<char>(in)),
                           std::istreambuf_iterator<char>());
}

// Instrumentation sink that keeps one line per hook call
class RecordingInstrumentation : public Instrumentation {
public:
    std::vector<std::string> events() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return events_;
    }

    size_t count(const std::string& prefix) const {
        std::lock_guard<std::mutex> lk(mutex_);
        size_t n = 0;
        for (const auto& e : events_) {
            if (e.compare(0, prefix.size(), prefix) == 0) ++n;
        }
        return n;
    }

    void on_connection_established(const std::string& peer) override {
        add("connection_established " + peer);
    }
    void on_send_started(const std::string& file, u64) override { add("send_started " + file); }
    void on_send_completed(const std::string& file, bool ok, double) override {
        add(std::string("send_completed ") + (ok ? "ok " : "failed ") + file);
    }
    void on_compress_started(const std::string& file) override { add("compress_started " + file); }
    void on_compress_completed(const std::string& file, u64, u64, double) override {
        add("compress_completed " + file);
    }
    void on_checksum_started(const std::string& file) override { add("checksum_started " + file); }
    void on_checksum_completed(const std::string& file, const std::string&, double) override {
        add("checksum_completed " + file);
    }
    void on_chunk_transfer_started(const std::string& file, u64) override {
        add("chunk_transfer_started " + file);
    }
    void on_chunk_transfer_completed(const std::string& file, u64 chunks, double) override {
        add("chunk_transfer_completed " + file + " chunks=" + std::to_string(chunks));
    }
    void on_receive_started(const std::string&, const std::string& file, u64) override {
        add("receive_started " + file);
    }
    void on_receive_completed(const std::string&, const std::string& file, double) override {
        add("receive_completed " + file);
    }
    void on_checksum_verified(const std::string& file, const std::string& expected,
                              const std::string& actual, bool match) override {
        add(std::string("checksum_verified ") + (match ? "match " : "mismatch ") + file +
            " expected=" + expected + " actual=" + actual);
    }
    void on_decompressed(const std::string& file, bool ok, u64, const std::string&) override {
        add(std::string("decompressed ") + (ok ? "ok " : "failed ") + file);
    }
    void on_written(const std::string& file, bool ok, const std::string&, double) override {
        add(std::string("written ") + (ok ? "ok " : "failed ") + file);
    }
    void on_termination_signal(const std::string&) override { add("termination_signal"); }
    void on_client_disconnected(const std::string&, const std::string& reason) override {
        add("client_disconnected " + reason);
    }

private:
    mutable std::mutex       mutex_;
    std::vector<std::string> events_;

    void add(std::string e) {
        std::lock_guard<std::mutex> lk(mutex_);
        events_.push_back(std::move(e));
    }
};

} // namespace test_util
