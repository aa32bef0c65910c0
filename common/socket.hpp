#pragma once

// ============================================================
// socket.hpp -- RAII TCP socket wrapper
// ============================================================

#include "platform.hpp"
#include <string>
#include <stdexcept>

class TcpSocket {
public:
    TcpSocket();
    explicit TcpSocket(socket_t fd);
    ~TcpSocket();

    // Non-copyable
    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    // Movable
    TcpSocket(TcpSocket&& o) noexcept;
    TcpSocket& operator=(TcpSocket&& o) noexcept;

    // Client: connect to remote (host name or IPv4 literal)
    void connect(const std::string& host, u16 port);

    // Server: bind + listen. port 0 picks an ephemeral port (see local_port()).
    void bind_and_listen(const std::string& ip, u16 port, int backlog = 128);

    // Accept one connection (blocking)
    TcpSocket accept();

    // Send exactly 'len' bytes; throws on error
    void send_all(const void* buf, size_t len);

    // Receive up to 'cap' bytes. Returns 0 on clean close by the peer.
    // Throws ReadTimeout when the receive timeout expires and
    // runtime_error on any other socket error.
    size_t recv_some(void* buf, size_t cap);

    // Half-close: tell the peer no more bytes will follow
    void shutdown_write();

    // Apply TCP performance tuning
    void tune();

    bool is_valid() const { return fd_ != INVALID_SOCKET_VAL; }
    socket_t native() const { return fd_; }

    void close();

    // Get peer address as string
    std::string peer_addr() const;

    // Port this socket is bound to (after bind_and_listen)
    u16 local_port() const;

    // Set receive timeout in milliseconds (0 = infinite)
    void set_recv_timeout_ms(int ms);

private:
    socket_t fd_{INVALID_SOCKET_VAL};

    void apply_socket_opts();
};
