#pragma once

// ============================================================
// gzip.hpp -- gzip compression wrapper (zlib)
// ============================================================

#include "platform.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cstring>
#include <fstream>
#include <string>
#include <vector>
#include <stdexcept>

#include <zlib.h>

namespace gz {

// Same default as java.util.zip / gzip(1)
static constexpr int GZIP_LEVEL = Z_DEFAULT_COMPRESSION;

// windowBits 15 + 16 selects the gzip wrapper instead of raw zlib
static constexpr int GZIP_WINDOW_BITS = 15 + 16;

// Block size used when draining a source file
static constexpr size_t READ_BLOCK = 64 * 1024;

inline std::string zlib_error(const z_stream& zs, int rc) {
    std::string s = zs.msg ? zs.msg : zError(rc);
    return s + " (rc=" + std::to_string(rc) + ")";
}

// Streaming gzip encoder. feed() any number of times, then finish().
class GzipEncoder {
public:
    explicit GzipEncoder(int level = GZIP_LEVEL) {
        std::memset(&zs_, 0, sizeof(zs_));
        int rc = deflateInit2(&zs_, level, Z_DEFLATED, GZIP_WINDOW_BITS, 8, Z_DEFAULT_STRATEGY);
        if (rc != Z_OK) {
            throw std::runtime_error("deflateInit2 failed: " + zlib_error(zs_, rc));
        }
    }

    ~GzipEncoder() { deflateEnd(&zs_); }

    GzipEncoder(const GzipEncoder&) = delete;
    GzipEncoder& operator=(const GzipEncoder&) = delete;

    void feed(const void* src, size_t len) {
        const u8* p = static_cast<const u8*>(src);
        // avail_in is 32-bit; split huge inputs
        while (len > 0) {
            uInt piece = (uInt)std::min<size_t>(len, 1u << 30);
            run(p, piece, Z_NO_FLUSH);
            p   += piece;
            len -= piece;
        }
    }

    // Flush the final block and the gzip trailer; returns the stream
    std::vector<u8> finish() {
        run(nullptr, 0, Z_FINISH);
        return std::move(out_);
    }

private:
    z_stream        zs_;
    std::vector<u8> out_;

    void run(const u8* src, uInt len, int flush) {
        zs_.next_in  = const_cast<Bytef*>(src);
        zs_.avail_in = len;
        u8 tmp[READ_BLOCK];
        int rc;
        do {
            zs_.next_out  = tmp;
            zs_.avail_out = (uInt)sizeof(tmp);
            rc = deflate(&zs_, flush);
            if (rc == Z_STREAM_ERROR) {
                throw std::runtime_error("deflate failed: " + zlib_error(zs_, rc));
            }
            out_.insert(out_.end(), tmp, tmp + (sizeof(tmp) - zs_.avail_out));
        } while (zs_.avail_out == 0 || (flush == Z_FINISH && rc != Z_STREAM_END));
    }
};

// Compress a memory buffer into a gzip stream
inline std::vector<u8> gzip(const void* src, size_t len, int level = GZIP_LEVEL) {
    GzipEncoder enc(level);
    enc.feed(src, len);
    return enc.finish();
}

inline std::vector<u8> gzip(const std::vector<u8>& src, int level = GZIP_LEVEL) {
    return gzip(src.data(), src.size(), level);
}

// Compress a file, reading it to the end before returning.
// Throws runtime_error if the file cannot be opened or read; no partial
// result is ever returned.
inline std::vector<u8> gzip_file(const std::string& path, int level = GZIP_LEVEL) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot open " + path);
    }
    GzipEncoder enc(level);
    std::vector<char> block(READ_BLOCK);
    while (in) {
        in.read(block.data(), (std::streamsize)block.size());
        std::streamsize n = in.gcount();
        if (n > 0) enc.feed(block.data(), (size_t)n);
    }
    if (in.bad() || !in.eof()) {
        throw std::runtime_error("Read error on " + path);
    }
    return enc.finish();
}

// Inflate a gzip stream (concatenated members allowed).
// Throws DecodeError if the stream is malformed or truncated, or if it
// inflates to more than max_output bytes (0 = no limit).
inline std::vector<u8> gunzip(const void* src, size_t len, u64 max_output = 0) {
    struct Inflater {
        z_stream zs;
        Inflater() {
            std::memset(&zs, 0, sizeof(zs));
            int rc = inflateInit2(&zs, GZIP_WINDOW_BITS);
            if (rc != Z_OK) {
                throw std::runtime_error("inflateInit2 failed: " + zlib_error(zs, rc));
            }
        }
        ~Inflater() { inflateEnd(&zs); }
    } inf;
    z_stream& zs = inf.zs;

    std::vector<u8> out;
    const u8* p = static_cast<const u8*>(src);
    size_t remaining = len;
    u8 tmp[READ_BLOCK];
    bool stream_end = false;

    auto refill = [&]() {
        uInt piece = (uInt)std::min<size_t>(remaining, 1u << 30);
        zs.next_in  = const_cast<Bytef*>(p + (len - remaining));
        zs.avail_in = piece;
        remaining  -= piece;
    };
    refill();

    for (;;) {
        zs.next_out  = tmp;
        zs.avail_out = (uInt)sizeof(tmp);
        int rc = inflate(&zs, Z_NO_FLUSH);
        out.insert(out.end(), tmp, tmp + (sizeof(tmp) - zs.avail_out));
        if (max_output > 0 && out.size() > max_output) {
            throw DecodeError("gzip stream inflates beyond the limit of " +
                              std::to_string(max_output) + " bytes");
        }

        if (rc == Z_STREAM_END) {
            stream_end = true;
            if (zs.avail_in == 0 && remaining == 0) break;
            // Another gzip member follows
            rc = inflateReset(&zs);
            if (rc != Z_OK) {
                throw DecodeError("gzip decode failed: " + zlib_error(zs, rc));
            }
            stream_end = false;
        } else if (rc == Z_BUF_ERROR && zs.avail_in == 0) {
            if (remaining == 0) break;   // input exhausted mid-stream
        } else if (rc != Z_OK) {
            throw DecodeError("gzip decode failed: " + zlib_error(zs, rc));
        }
        if (zs.avail_in == 0 && remaining > 0) refill();
    }

    if (!stream_end) {
        throw DecodeError("gzip stream truncated after " + std::to_string(len) + " input bytes");
    }
    return out;
}

inline std::vector<u8> gunzip(const std::vector<u8>& src, u64 max_output = 0) {
    return gunzip(src.data(), src.size(), max_output);
}

} // namespace gz
