#pragma once

// ============================================================
// hash.hpp -- SHA-256 wrappers (OpenSSL EVP API)
// ============================================================

#include "platform.hpp"
#include "errors.hpp"
#include <array>
#include <cstddef>
#include <string>
#include <vector>

#include <openssl/evp.h>

namespace hash {

static constexpr size_t SHA256_LEN = 32;

using Digest256 = std::array<u8, SHA256_LEN>;

// Lowercase hex, two characters per byte
inline std::string to_hex(const u8* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.resize(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out[2 * i]     = digits[data[i] >> 4];
        out[2 * i + 1] = digits[data[i] & 0x0F];
    }
    return out;
}

inline std::string to_hex(const Digest256& d) {
    return to_hex(d.data(), d.size());
}

// Streaming SHA-256 hasher
class StreamSha256 {
public:
    StreamSha256() {
        ctx_ = EVP_MD_CTX_new();
        if (!ctx_) throw DigestUnavailable("EVP_MD_CTX_new failed");
        reset();
    }

    ~StreamSha256() {
        if (ctx_) EVP_MD_CTX_free(ctx_);
    }

    StreamSha256(const StreamSha256&) = delete;
    StreamSha256& operator=(const StreamSha256&) = delete;

    void reset() {
        if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
            throw DigestUnavailable("SHA-256 is not available from the crypto library");
        }
    }

    void update(const void* data, size_t len) {
        if (len == 0) return;
        if (EVP_DigestUpdate(ctx_, data, len) != 1) {
            throw std::runtime_error("EVP_DigestUpdate failed");
        }
    }

    // Finalises the digest; call reset() before reusing the hasher
    Digest256 digest() {
        Digest256 out{};
        unsigned int out_len = 0;
        if (EVP_DigestFinal_ex(ctx_, out.data(), &out_len) != 1 || out_len != SHA256_LEN) {
            throw std::runtime_error("EVP_DigestFinal_ex failed");
        }
        return out;
    }

    std::string hex_digest() {
        return to_hex(digest());
    }

private:
    EVP_MD_CTX* ctx_;
};

// SHA-256 of a memory buffer as 64 lowercase hex characters
inline std::string sha256_hex(const void* data, size_t len) {
    StreamSha256 h;
    h.update(data, len);
    return h.hex_digest();
}

inline std::string sha256_hex(const std::vector<u8>& data) {
    return sha256_hex(data.data(), data.size());
}

// Startup check: throws DigestUnavailable if SHA-256 cannot be computed.
// Entry points call this before serving so a broken crypto setup fails
// the process instead of every single file.
inline void ensure_sha256_available() {
    static const char abc[] = "abc";
    static const char expected[] =
        "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
    std::string got;
    try {
        got = sha256_hex(abc, 3);
    } catch (const DigestUnavailable&) {
        throw;
    } catch (const std::exception& e) {
        throw DigestUnavailable(std::string("SHA-256 self-test failed: ") + e.what());
    }
    if (got != expected) {
        throw DigestUnavailable("SHA-256 self-test produced " + got);
    }
}

} // namespace hash
