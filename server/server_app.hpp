#pragma once

// ============================================================
// server_app.hpp -- gzxfer receiver: persistent daemon
//   Listens on a port and receives files from any number of
//   concurrent senders into one output directory.
//
// Concurrency model:
//   accept_loop()  -> only accept()s and hands each socket to a
//                     new handler thread; it never reads payload.
//   handler threads -> one ConnectionHandler per socket, fully
//                      independent of each other.
//   The output directory (read-only after startup), the path lock
//   table and the metrics are the only things handlers share.
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "../common/socket.hpp"
#include "../common/metrics.hpp"
#include "../common/instrumentation.hpp"
#include "connection_handler.hpp"
#include "path_lock.hpp"
#include <atomic>
#include <filesystem>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

struct ServerConfig {
    std::string output_dir{DEFAULT_OUTPUT_DIR};
    std::string listen_ip{"0.0.0.0"};
    u16         listen_port{DEFAULT_PORT};   // 0 = ephemeral
    int         backlog{128};
    int         idle_timeout_ms{0};          // 0 = no read timeout
    u64         max_payload_bytes{DEFAULT_MAX_PAYLOAD_BYTES};
    u64         max_file_bytes{DEFAULT_MAX_FILE_BYTES};     // decompressed size bound
    bool        serialize_same_path{true};   // per-path write lock
};

class ServerApp {
public:
    ServerApp(ServerConfig config,
              Metrics& metrics,
              Instrumentation& instr = noop_instrumentation());
    ~ServerApp();

    ServerApp(const ServerApp&) = delete;
    ServerApp& operator=(const ServerApp&) = delete;

    // Prepare the output directory, bind and listen. Called by run() if
    // not done before; call it first to learn an ephemeral port.
    void listen();

    // Port the listening socket is bound to (valid after listen())
    u16 port() const { return bound_port_; }

    // Blocks in the accept loop until stop() is called, then waits for
    // every handler thread to finish.
    int run();

    // Stop accepting and shut down the sockets of in-flight sessions.
    // Safe to call from any thread, more than once.
    void stop();

    // Number of handler threads not yet finished
    size_t active_handlers() const;

    const std::filesystem::path& output_root() const { return output_root_; }

private:
    struct HandlerSlot {
        u64                                id{0};
        std::thread                        thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    ServerConfig           config_;
    Metrics&               metrics_;
    Instrumentation&       instr_;
    std::filesystem::path  output_root_;
    PathLockTable          path_locks_;

    TcpSocket              listen_sock_;
    std::atomic<bool>      listening_{false};
    std::atomic<bool>      running_{false};
    std::atomic<bool>      stopping_{false};
    u16                    bound_port_{0};

    // Handler threads, and the descriptors of their live sockets so
    // stop() can wake them. A descriptor is removed before its socket
    // is closed.
    mutable std::mutex                    handlers_mutex_;
    std::list<HandlerSlot>                handlers_;
    std::unordered_map<u64, socket_t>     live_sockets_;
    u64                                   next_handler_id_{1};

    // Accept loop: pure accept() + spawn handler thread per socket
    void accept_loop();

    // Start a handler thread owning this socket
    void launch_handler(TcpSocket sock);

    void unregister_socket(u64 id);

    // Join finished handler threads; with wait_all, join every thread
    void reap_handlers(bool wait_all);
};
