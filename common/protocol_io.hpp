#pragma once

// ============================================================
// protocol_io.hpp -- Record header encode/decode with byte-order handling
// ============================================================

#include "protocol.hpp"
#include "errors.hpp"
#include <cstring>
#include <string>
#include <vector>
#include <stdexcept>

// Linux: htobe16/64 and be16/64toh live in <endian.h>
#ifndef _WIN32
#  include <endian.h>
#endif

class TcpReadBuffer;
class TcpWriteBuffer;

namespace proto {

// ---- Byte-order helpers ----

inline u16 hton16(u16 v) {
#if defined(_WIN32)
    return htons(v);
#else
    return htobe16(v);
#endif
}

inline u64 hton64(u64 v) {
#if defined(_WIN32)
    return (((u64)htonl((u32)(v & 0xFFFFFFFFull))) << 32) | htonl((u32)(v >> 32));
#else
    return htobe64(v);
#endif
}

inline u16 ntoh16(u16 v) {
#if defined(_WIN32)
    return ntohs(v);
#else
    return be16toh(v);
#endif
}

inline u64 ntoh64(u64 v) {
#if defined(_WIN32)
    return (((u64)ntohl((u32)(v & 0xFFFFFFFFull))) << 32) | ntohl((u32)(v >> 32));
#else
    return be64toh(v);
#endif
}

// ---- Field encoders (append to out) ----

// u16 big-endian length followed by the raw bytes.
// Throws if the string does not fit the length prefix.
inline void put_string(std::vector<u8>& out, const std::string& s) {
    if (s.size() > MAX_WIRE_STRING_LEN) {
        throw std::length_error("string too long for wire encoding (" +
                                std::to_string(s.size()) + " bytes)");
    }
    u16 len = hton16((u16)s.size());
    const u8* lp = reinterpret_cast<const u8*>(&len);
    out.insert(out.end(), lp, lp + 2);
    out.insert(out.end(), s.begin(), s.end());
}

inline void put_u64(std::vector<u8>& out, u64 v) {
    u64 be = hton64(v);
    const u8* p = reinterpret_cast<const u8*>(&be);
    out.insert(out.end(), p, p + 8);
}

// Serialise everything that precedes the payload. For the termination
// record only digest and name are emitted.
inline std::vector<u8> encode_record_header(const FileRecordHeader& h) {
    std::vector<u8> out;
    out.reserve(2 + h.digest.size() + 2 + h.name.size() + 8);
    put_string(out, h.digest);
    put_string(out, h.name);
    if (!h.is_terminator()) {
        put_u64(out, h.payload_size);
    }
    return out;
}

inline std::vector<u8> encode_terminator() {
    FileRecordHeader h;
    h.digest = TERMINATOR_DIGEST;
    return encode_record_header(h);
}

// ---- Record writers (to a buffered socket) ----

// Write one file record: header, then the payload in pieces of at most
// chunk_size bytes. Does not flush. Returns the number of chunks.
u64 write_record(TcpWriteBuffer& out, const FileRecordHeader& hdr,
                 const u8* payload, size_t chunk_size = CHUNK_SIZE);

// Write the empty-name record that ends a session. Does not flush.
void write_terminator(TcpWriteBuffer& out);

// ---- Decoders (read from a buffered socket) ----

// Outcome of read_record_header()
enum class HeaderStatus {
    OK,           // hdr holds a file record
    TERMINATOR,   // hdr.name is empty; nothing follows on this record
    PEER_CLOSED,  // stream ended cleanly on a record boundary
};

// Decode digest + name, then payload_size unless name is empty.
// Throws UnexpectedEof if the stream ends inside the header and
// ProtocolError if payload_size exceeds max_payload.
HeaderStatus read_record_header(TcpReadBuffer& in, FileRecordHeader& hdr,
                                u64 max_payload = DEFAULT_MAX_PAYLOAD_BYTES);

// Read one length-prefixed string; throws UnexpectedEof on short input
std::string read_string(TcpReadBuffer& in);

u64 read_u64(TcpReadBuffer& in);

} // namespace proto
