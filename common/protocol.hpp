#pragma once

// protocol.hpp -- Wire protocol definitions for gzxfer
//
// One connection carries one session, sender -> receiver only:
//
//   repeated per file:
//     digest       u16 length (big-endian) + UTF-8 bytes (SHA-256 hex, 64 chars)
//     name         u16 length (big-endian) + UTF-8 bytes
//     payload_size u64 big-endian
//     payload      payload_size bytes of gzip data
//   terminated by:
//     digest       any string
//     name         "" (no payload_size, no payload)
//
// The sender then closes its write side.

#include "platform.hpp"
#include <string>

static constexpr u16 DEFAULT_PORT = 5050;
static constexpr const char* DEFAULT_HOST = "localhost";
static constexpr const char* DEFAULT_OUTPUT_DIR = "server-out";
static constexpr const char* DEFAULT_INPUT_DIR  = "files2transfer";

// Sender writes the payload in pieces of this size. Chunk boundaries carry
// no meaning on the wire.
static constexpr size_t CHUNK_SIZE = 8192;

// SHA-256 rendered as lowercase hex
static constexpr size_t DIGEST_HEX_LEN = 64;

// Largest string a u16 length prefix can describe
static constexpr size_t MAX_WIRE_STRING_LEN = 0xFFFFu;

// Receiver refuses records that declare more payload than this (4 GiB)
static constexpr u64 DEFAULT_MAX_PAYLOAD_BYTES = 4ull * 1024u * 1024u * 1024u;

// Receiver skips a file whose payload inflates beyond this (16 GiB)
static constexpr u64 DEFAULT_MAX_FILE_BYTES = 4 * DEFAULT_MAX_PAYLOAD_BYTES;

// ---- Record header (everything before the payload) ----
struct FileRecordHeader {
    std::string digest;
    std::string name;           // "" = termination marker
    u64         payload_size{0};

    bool is_terminator() const { return name.empty(); }
};

// Digest value carried by the termination record. Receivers ignore it.
static constexpr const char* TERMINATOR_DIGEST = "";
