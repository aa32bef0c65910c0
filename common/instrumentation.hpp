#pragma once

// ============================================================
// instrumentation.hpp -- Transfer hook points
//
// Sender and ConnectionHandler call these at each pipeline stage.
// Every hook has an empty default body, so a sink only overrides
// what it cares about and NoopInstrumentation is simply the base.
//
// Hooks are called concurrently from many connection threads;
// implementations must be thread-safe.
// ============================================================

#include "platform.hpp"
#include <string>

class Instrumentation {
public:
    virtual ~Instrumentation() = default;

    // ---- Sender side ----
    virtual void on_connection_established(const std::string& /*peer*/) {}
    virtual void on_send_started(const std::string& /*file*/, u64 /*original_size*/) {}
    virtual void on_send_completed(const std::string& /*file*/, bool /*ok*/, double /*latency_ms*/) {}
    virtual void on_compress_started(const std::string& /*file*/) {}
    virtual void on_compress_completed(const std::string& /*file*/, u64 /*original_size*/,
                                       u64 /*compressed_size*/, double /*ms*/) {}
    virtual void on_checksum_started(const std::string& /*file*/) {}
    virtual void on_checksum_completed(const std::string& /*file*/, const std::string& /*digest*/,
                                       double /*ms*/) {}
    virtual void on_chunk_transfer_started(const std::string& /*file*/, u64 /*payload_size*/) {}
    virtual void on_chunk_transfer_completed(const std::string& /*file*/, u64 /*chunks*/,
                                             double /*ms*/) {}

    // ---- Receiver side ----
    virtual void on_receive_started(const std::string& /*peer*/, const std::string& /*file*/,
                                    u64 /*compressed_size*/) {}
    virtual void on_receive_completed(const std::string& /*peer*/, const std::string& /*file*/,
                                      double /*ms*/) {}
    virtual void on_checksum_verified(const std::string& /*file*/, const std::string& /*expected*/,
                                      const std::string& /*actual*/, bool /*match*/) {}
    virtual void on_decompressed(const std::string& /*file*/, bool /*ok*/,
                                 u64 /*decompressed_size*/, const std::string& /*error*/) {}
    virtual void on_written(const std::string& /*file*/, bool /*ok*/,
                            const std::string& /*path_or_error*/, double /*ms*/) {}
    virtual void on_termination_signal(const std::string& /*peer*/) {}
    virtual void on_client_disconnected(const std::string& /*peer*/, const std::string& /*reason*/) {}
};

// Sink that records nothing
class NoopInstrumentation : public Instrumentation {};

// Shared no-op instance for components built without a sink
inline Instrumentation& noop_instrumentation() {
    static NoopInstrumentation inst;
    return inst;
}

// Emits every hook as a DEBUG log line with its attributes
class LogInstrumentation : public Instrumentation {
public:
    void on_connection_established(const std::string& peer) override;
    void on_send_started(const std::string& file, u64 original_size) override;
    void on_send_completed(const std::string& file, bool ok, double latency_ms) override;
    void on_compress_started(const std::string& file) override;
    void on_compress_completed(const std::string& file, u64 original_size,
                               u64 compressed_size, double ms) override;
    void on_checksum_started(const std::string& file) override;
    void on_checksum_completed(const std::string& file, const std::string& digest,
                               double ms) override;
    void on_chunk_transfer_started(const std::string& file, u64 payload_size) override;
    void on_chunk_transfer_completed(const std::string& file, u64 chunks, double ms) override;

    void on_receive_started(const std::string& peer, const std::string& file,
                            u64 compressed_size) override;
    void on_receive_completed(const std::string& peer, const std::string& file,
                              double ms) override;
    void on_checksum_verified(const std::string& file, const std::string& expected,
                              const std::string& actual, bool match) override;
    void on_decompressed(const std::string& file, bool ok, u64 decompressed_size,
                         const std::string& error) override;
    void on_written(const std::string& file, bool ok, const std::string& path_or_error,
                    double ms) override;
    void on_termination_signal(const std::string& peer) override;
    void on_client_disconnected(const std::string& peer, const std::string& reason) override;
};
