#pragma once

// ============================================================
// write_buffer.hpp -- Application-level write buffer for TcpSocket
//
// Coalesces the small header fields and the 8 KB payload chunks of a
// record into a few large send() syscalls.
//
// Usage:
//   {
//       TcpWriteBuffer wbuf(sock);
//       wbuf.write(header.data(), header.size());
//       for (each chunk) wbuf.write(chunk, len);
//       wbuf.flush();
//   }
//
// Thread safety: NOT thread-safe; use one buffer per thread/connection.
// ============================================================

#include "socket.hpp"
#include <vector>

class TcpWriteBuffer {
public:
    // Send when the internal buffer reaches this size.
    static constexpr size_t DEFAULT_THRESHOLD = 64 * 1024;

    explicit TcpWriteBuffer(TcpSocket& sock,
                            size_t threshold = DEFAULT_THRESHOLD)
        : sock_(sock), threshold_(threshold)
    {
        buf_.reserve(threshold);
    }

    // Buffered bytes that were never flushed are dropped: a half-written
    // record is useless to the peer and the caller is already unwinding.
    ~TcpWriteBuffer() = default;

    // Non-copyable, non-movable (holds a reference to TcpSocket)
    TcpWriteBuffer(const TcpWriteBuffer&) = delete;
    TcpWriteBuffer& operator=(const TcpWriteBuffer&) = delete;

    // Append bytes. Sends automatically when the buffer fills up.
    void write(const void* data, size_t len) {
        if (len == 0) return;
        const u8* p = static_cast<const u8*>(data);
        buf_.insert(buf_.end(), p, p + len);
        if (buf_.size() >= threshold_) send_buffered();
    }

    void write(const std::vector<u8>& bytes) {
        write(bytes.data(), bytes.size());
    }

    // Send everything still buffered
    void flush() {
        send_buffered();
    }

private:
    TcpSocket&      sock_;
    size_t          threshold_;
    std::vector<u8> buf_;

    void send_buffered() {
        if (!buf_.empty()) {
            sock_.send_all(buf_.data(), buf_.size());
            buf_.clear();
        }
    }
};
