// ============================================================
// server_app.cpp -- gzxfer receiver daemon implementation
// ============================================================

#include "server_app.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include <chrono>
#include <vector>

ServerApp::ServerApp(ServerConfig config,
                     Metrics& metrics,
                     Instrumentation& instr)
    : config_(std::move(config))
    , metrics_(metrics)
    , instr_(instr)
{}

ServerApp::~ServerApp() {
    stop();
    reap_handlers(true);
}

void ServerApp::listen() {
    if (listening_.load()) return;

    output_root_ = file_io::prepare_output_root(config_.output_dir);

    listen_sock_.bind_and_listen(config_.listen_ip, config_.listen_port, config_.backlog);
    bound_port_ = listen_sock_.local_port();
    listening_.store(true);

    LOG_INFO("[Server] Listening on " + config_.listen_ip + ":" + std::to_string(bound_port_) +
             ", writing to " + output_root_.string());
}

int ServerApp::run() {
    listen();
    running_.store(true);

    accept_loop();

    // Wait for in-flight sessions; stop() has already shut their sockets down
    reap_handlers(true);
    listen_sock_.close();
    running_.store(false);

    LOG_INFO("[Server] Stopped. " + metrics_.summary());
    return 0;
}

void ServerApp::stop() {
    if (stopping_.exchange(true)) return;

    // Wakes accept(); the descriptor itself is closed by run()
    platform::shutdown_socket(listen_sock_.native());

    std::lock_guard<std::mutex> lk(handlers_mutex_);
    for (auto& kv : live_sockets_) {
        platform::shutdown_socket(kv.second);
    }
}

size_t ServerApp::active_handlers() const {
    std::lock_guard<std::mutex> lk(handlers_mutex_);
    size_t n = 0;
    for (auto& h : handlers_) {
        if (!h.done->load()) ++n;
    }
    return n;
}

// ---------------------------------------------------------------
// accept_loop
//   Pure accept() loop. Every accepted socket goes to its own
//   handler thread, so a slow sender never delays the next accept.
//   A failed accept is logged and the loop carries on.
// ---------------------------------------------------------------
void ServerApp::accept_loop() {
    while (!stopping_.load()) {
        try {
            TcpSocket sock = listen_sock_.accept();
            if (stopping_.load()) break;
            sock.tune();
            launch_handler(std::move(sock));
        } catch (const std::exception& e) {
            if (stopping_.load()) break;
            LOG_ERROR("[Server] accept_loop: " + std::string(e.what()));
            // Back off briefly on persistent errors such as EMFILE
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }

        // Periodically reap finished handler threads
        reap_handlers(false);
    }
}

void ServerApp::launch_handler(TcpSocket sock) {
    HandlerOptions opts;
    opts.output_root       = output_root_;
    opts.max_payload_bytes = config_.max_payload_bytes;
    opts.max_file_bytes    = config_.max_file_bytes;
    opts.idle_timeout_ms   = config_.idle_timeout_ms;
    opts.path_locks        = config_.serialize_same_path ? &path_locks_ : nullptr;

    auto done = std::make_shared<std::atomic<bool>>(false);

    std::lock_guard<std::mutex> lk(handlers_mutex_);
    u64 id = next_handler_id_++;
    live_sockets_[id] = sock.native();
    if (stopping_.load()) {
        platform::shutdown_socket(sock.native());
    }

    HandlerSlot slot;
    slot.id   = id;
    slot.done = done;
    slot.thread = std::thread(
        [this, id, done, opts = std::move(opts), s = std::move(sock)]() mutable {
            // Declared after the handler so it runs first on every exit:
            // the descriptor leaves live_sockets_ before the socket closes.
            struct Unregister {
                ServerApp* app; u64 id;
                ~Unregister() { app->unregister_socket(id); }
            };
            try {
                ConnectionHandler handler(std::move(s), std::move(opts), metrics_, instr_);
                Unregister unreg{this, id};
                handler.run();
            } catch (const std::exception& e) {
                unregister_socket(id);
                LOG_ERROR("[Server] handler thread: " + std::string(e.what()));
            }
            done->store(true);
        });
    handlers_.push_back(std::move(slot));
}

void ServerApp::unregister_socket(u64 id) {
    std::lock_guard<std::mutex> lk(handlers_mutex_);
    live_sockets_.erase(id);
}

void ServerApp::reap_handlers(bool wait_all) {
    std::list<HandlerSlot> finished;
    {
        std::lock_guard<std::mutex> lk(handlers_mutex_);
        for (auto it = handlers_.begin(); it != handlers_.end(); ) {
            if (wait_all || it->done->load()) {
                auto next = std::next(it);
                finished.splice(finished.end(), handlers_, it);
                it = next;
            } else {
                ++it;
            }
        }
    }
    // Join outside the lock: a finishing handler needs it to unregister
    for (auto& h : finished) {
        if (h.thread.joinable()) h.thread.join();
    }
}
