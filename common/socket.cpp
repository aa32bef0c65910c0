// ============================================================
// socket.cpp -- TcpSocket implementation
// ============================================================

#include "socket.hpp"
#include "errors.hpp"
#include <climits>
#include <cstring>
#include <stdexcept>
#include <string>
#include <algorithm>

// Buffer size for SO_SNDBUF / SO_RCVBUF = 4 MB
static constexpr int SOCKET_BUF_SIZE = 4 * 1024 * 1024;

TcpSocket::TcpSocket() {
    fd_ = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (fd_ == INVALID_SOCKET_VAL) {
        throw std::runtime_error("socket() failed: " + socket_error_str(last_socket_error()));
    }
    apply_socket_opts();
}

TcpSocket::TcpSocket(socket_t fd) : fd_(fd) {}

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& o) noexcept : fd_(o.fd_) {
    o.fd_ = INVALID_SOCKET_VAL;
}

TcpSocket& TcpSocket::operator=(TcpSocket&& o) noexcept {
    if (this != &o) {
        close();
        fd_ = o.fd_;
        o.fd_ = INVALID_SOCKET_VAL;
    }
    return *this;
}

void TcpSocket::apply_socket_opts() {
    // SO_REUSEADDR
    int on = 1;
#ifdef _WIN32
    setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, (const char*)&on, sizeof(on));
#else
    setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));
#endif
}

void TcpSocket::tune() {
    int nodelay = 1;
    int keepalive = 1;
    int sndbuf = SOCKET_BUF_SIZE;
    int rcvbuf = SOCKET_BUF_SIZE;

#ifdef _WIN32
    setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY,  (const char*)&nodelay,   sizeof(nodelay));
    setsockopt(fd_, SOL_SOCKET,  SO_KEEPALIVE, (const char*)&keepalive, sizeof(keepalive));
    setsockopt(fd_, SOL_SOCKET,  SO_SNDBUF,    (const char*)&sndbuf,    sizeof(sndbuf));
    setsockopt(fd_, SOL_SOCKET,  SO_RCVBUF,    (const char*)&rcvbuf,    sizeof(rcvbuf));
#else
    setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY,  &nodelay,   sizeof(nodelay));
    setsockopt(fd_, SOL_SOCKET,  SO_KEEPALIVE, &keepalive, sizeof(keepalive));
    setsockopt(fd_, SOL_SOCKET,  SO_SNDBUF,    &sndbuf,    sizeof(sndbuf));
    setsockopt(fd_, SOL_SOCKET,  SO_RCVBUF,    &rcvbuf,    sizeof(rcvbuf));
#endif
}

void TcpSocket::connect(const std::string& host, u16 port) {
    addrinfo hints{};
    hints.ai_family   = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* res = nullptr;
    int rc = ::getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res);
    if (rc != 0 || !res) {
        throw std::runtime_error("Cannot resolve host " + host + ": " + gai_strerror(rc));
    }

    int err = 0;
    bool connected = false;
    for (addrinfo* ai = res; ai; ai = ai->ai_next) {
        if (::connect(fd_, ai->ai_addr, (int)ai->ai_addrlen) != SOCKET_ERROR_VAL) {
            connected = true;
            break;
        }
        err = last_socket_error();
    }
    ::freeaddrinfo(res);

    if (!connected) {
        throw std::runtime_error("connect() to " + host + ":" + std::to_string(port) +
                                 " failed: " + socket_error_str(err));
    }
    tune();
}

void TcpSocket::bind_and_listen(const std::string& ip, u16 port, int backlog) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (ip.empty() || ip == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        throw std::runtime_error("Invalid listen address: " + ip);
    }
    if (::bind(fd_, (sockaddr*)&addr, sizeof(addr)) == SOCKET_ERROR_VAL) {
        throw std::runtime_error("bind() failed: " + socket_error_str(last_socket_error()));
    }
    if (::listen(fd_, backlog) == SOCKET_ERROR_VAL) {
        throw std::runtime_error("listen() failed: " + socket_error_str(last_socket_error()));
    }
}

TcpSocket TcpSocket::accept() {
    sockaddr_in peer{};
#ifdef _WIN32
    int peer_len = sizeof(peer);
#else
    socklen_t peer_len = sizeof(peer);
#endif
    socket_t client = ::accept(fd_, (sockaddr*)&peer, &peer_len);
    if (client == INVALID_SOCKET_VAL) {
        throw std::runtime_error("accept() failed: " + socket_error_str(last_socket_error()));
    }
    return TcpSocket(client);
}

void TcpSocket::send_all(const void* buf, size_t len) {
    const char* p = static_cast<const char*>(buf);
    size_t remaining = len;
    while (remaining > 0) {
#ifdef _WIN32
        int sent = ::send(fd_, p, (int)std::min(remaining, (size_t)INT_MAX), 0);
#else
        ssize_t sent = ::send(fd_, p, remaining, MSG_NOSIGNAL);
#endif
        if (sent <= 0) {
            if (sent == 0) {
                throw std::runtime_error("Connection closed during send");
            }
            int err = last_socket_error();
            if (interrupted(err)) continue;
            throw std::runtime_error("send() failed: " + socket_error_str(err));
        }
        p += sent;
        remaining -= static_cast<size_t>(sent);
    }
}

size_t TcpSocket::recv_some(void* buf, size_t cap) {
    for (;;) {
#ifdef _WIN32
        int received = ::recv(fd_, static_cast<char*>(buf), (int)std::min(cap, (size_t)INT_MAX), 0);
#else
        ssize_t received = ::recv(fd_, buf, cap, 0);
#endif
        if (received >= 0) return static_cast<size_t>(received);

        int err = last_socket_error();
        if (interrupted(err)) continue;
        if (would_block(err)) {
            // SO_RCVTIMEO expired
            throw ReadTimeout("recv() idle timeout from " + peer_addr());
        }
        throw std::runtime_error("recv() failed: " + socket_error_str(err));
    }
}

void TcpSocket::shutdown_write() {
    if (::shutdown(fd_, SHUT_WR_VAL) == SOCKET_ERROR_VAL) {
        throw std::runtime_error("shutdown() failed: " + socket_error_str(last_socket_error()));
    }
}

void TcpSocket::close() {
    if (fd_ != INVALID_SOCKET_VAL) {
        CLOSE_SOCKET(fd_);
        fd_ = INVALID_SOCKET_VAL;
    }
}

std::string TcpSocket::peer_addr() const {
    sockaddr_in peer{};
#ifdef _WIN32
    int len = sizeof(peer);
#else
    socklen_t len = sizeof(peer);
#endif
    if (getpeername(fd_, (sockaddr*)&peer, &len) == 0 && peer.sin_family == AF_INET) {
        char buf[INET_ADDRSTRLEN] = {0};
        if (inet_ntop(AF_INET, &peer.sin_addr, buf, sizeof(buf))) {
            return std::string(buf) + ":" + std::to_string(ntohs(peer.sin_port));
        }
    }
    return "unknown";
}

u16 TcpSocket::local_port() const {
    sockaddr_in local{};
#ifdef _WIN32
    int len = sizeof(local);
#else
    socklen_t len = sizeof(local);
#endif
    if (getsockname(fd_, (sockaddr*)&local, &len) != 0) {
        throw std::runtime_error("getsockname() failed: " + socket_error_str(last_socket_error()));
    }
    return ntohs(local.sin_port);
}

void TcpSocket::set_recv_timeout_ms(int ms) {
#ifdef _WIN32
    DWORD timeout = (DWORD)ms;
    setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, (const char*)&timeout, sizeof(timeout));
#else
    struct timeval tv;
    tv.tv_sec  = ms / 1000;
    tv.tv_usec = (ms % 1000) * 1000;
    setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
#endif
}
