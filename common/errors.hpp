#pragma once

// ============================================================
// errors.hpp -- Exception types for transfer failures
//
// Connection-fatal: UnexpectedEof, ReadTimeout, ProtocolError,
//                   UnsafePathError (and plain runtime_error from
//                   socket calls).
// File-local:       DecodeError.
// Process-fatal:    DigestUnavailable.
// ============================================================

#include <stdexcept>
#include <string>

// Stream ended before the requested number of bytes was obtained
class UnexpectedEof : public std::runtime_error {
public:
    explicit UnexpectedEof(const std::string& what)
        : std::runtime_error(what) {}
};

// SO_RCVTIMEO expired while waiting for peer data
class ReadTimeout : public std::runtime_error {
public:
    explicit ReadTimeout(const std::string& what)
        : std::runtime_error(what) {}
};

// A decoded header field is out of bounds
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& what)
        : std::runtime_error(what) {}
};

// A file name from the wire resolves outside the output directory
class UnsafePathError : public std::runtime_error {
public:
    explicit UnsafePathError(const std::string& what)
        : std::runtime_error(what) {}
};

// gzip stream is malformed or truncated
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& what)
        : std::runtime_error(what) {}
};

// SHA-256 cannot be obtained from the crypto library
class DigestUnavailable : public std::runtime_error {
public:
    explicit DigestUnavailable(const std::string& what)
        : std::runtime_error(what) {}
};
