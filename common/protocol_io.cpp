// ============================================================
// protocol_io.cpp -- Record header decoding
// ============================================================

#include "protocol_io.hpp"
#include "read_buffer.hpp"
#include "write_buffer.hpp"
#include <algorithm>

namespace proto {

u64 write_record(TcpWriteBuffer& out, const FileRecordHeader& hdr,
                 const u8* payload, size_t chunk_size) {
    if (hdr.is_terminator()) {
        throw std::invalid_argument("write_record: empty name is reserved for the terminator");
    }
    if (chunk_size == 0) chunk_size = CHUNK_SIZE;

    out.write(encode_record_header(hdr));

    u64 chunks = 0;
    u64 offset = 0;
    while (offset < hdr.payload_size) {
        size_t len = (size_t)std::min<u64>(chunk_size, hdr.payload_size - offset);
        out.write(payload + offset, len);
        offset += len;
        ++chunks;
    }
    return chunks;
}

void write_terminator(TcpWriteBuffer& out) {
    out.write(encode_terminator());
}

std::string read_string(TcpReadBuffer& in) {
    u16 len_be = 0;
    in.read_exact(&len_be, 2, "string length");
    u16 len = ntoh16(len_be);
    std::string s(len, '\0');
    if (len > 0) {
        in.read_exact(&s[0], len, "string bytes");
    }
    return s;
}

u64 read_u64(TcpReadBuffer& in) {
    u64 be = 0;
    in.read_exact(&be, 8, "u64");
    return ntoh64(be);
}

HeaderStatus read_record_header(TcpReadBuffer& in, FileRecordHeader& hdr, u64 max_payload) {
    // A clean close is only acceptable before the first byte of a record
    u16 len_be = 0;
    if (!in.try_read_exact(&len_be, 2)) {
        return HeaderStatus::PEER_CLOSED;
    }
    u16 len = ntoh16(len_be);
    hdr.digest.assign(len, '\0');
    if (len > 0) {
        in.read_exact(&hdr.digest[0], len, "digest");
    }

    hdr.name = read_string(in);
    hdr.payload_size = 0;
    if (hdr.name.empty()) {
        return HeaderStatus::TERMINATOR;
    }

    hdr.payload_size = read_u64(in);
    if (hdr.payload_size > max_payload) {
        throw ProtocolError("Declared payload of " + std::to_string(hdr.payload_size) +
                            " bytes for '" + hdr.name + "' exceeds limit of " +
                            std::to_string(max_payload));
    }
    return HeaderStatus::OK;
}

} // namespace proto
