#pragma once

// ============================================================
// read_buffer.hpp -- Buffered input cursor over a TcpSocket
//
// read_exact() does not return until the requested number of bytes
// has been obtained: short reads from the kernel are retried, and
// the stream ending early is reported, never treated as completion.
//
// Thread safety: NOT thread-safe; one buffer per connection.
// ============================================================

#include "socket.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cstring>
#include <string>
#include <vector>

class TcpReadBuffer {
public:
    static constexpr size_t DEFAULT_CAPACITY = 64 * 1024;

    explicit TcpReadBuffer(TcpSocket& sock,
                           size_t capacity = DEFAULT_CAPACITY)
        : sock_(sock), buf_(capacity > 0 ? capacity : 1)
    {}

    TcpReadBuffer(const TcpReadBuffer&) = delete;
    TcpReadBuffer& operator=(const TcpReadBuffer&) = delete;

    // Fill dst with exactly len bytes.
    // Returns false if the stream was already at its end (zero bytes
    // available). Throws UnexpectedEof if it ends after some but not all
    // of the bytes arrived.
    bool try_read_exact(void* dst, size_t len) {
        if (len == 0) return true;
        u8* out = static_cast<u8*>(dst);
        size_t got = 0;
        while (got < len) {
            if (pos_ == end_ && !fill()) {
                if (got == 0) return false;
                throw UnexpectedEof("Unexpected end of stream: got " + std::to_string(got) +
                                    " of " + std::to_string(len) + " bytes");
            }
            size_t take = std::min(len - got, end_ - pos_);
            std::memcpy(out + got, buf_.data() + pos_, take);
            pos_ += take;
            got  += take;
        }
        return true;
    }

    // Like try_read_exact(), but the stream ending at any point is an error
    void read_exact(void* dst, size_t len, const char* what = "data") {
        if (!try_read_exact(dst, len)) {
            throw UnexpectedEof(std::string("Unexpected end of stream while reading ") + what);
        }
    }

private:
    TcpSocket&      sock_;
    std::vector<u8> buf_;
    size_t          pos_{0};
    size_t          end_{0};

    // Refill from the socket; false on clean close
    bool fill() {
        size_t n = sock_.recv_some(buf_.data(), buf_.size());
        pos_ = 0;
        end_ = n;
        return n > 0;
    }
};
