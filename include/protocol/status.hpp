#pragma once

#include <string>

namespace transfer {

enum class ErrorKind {
    NONE,
    FRAMING,
    CHECKSUM_MISMATCH,
    PROTOCOL_VIOLATION,
    IO,
    CONNECTION_LOST
};

const char* to_string(ErrorKind kind);
// Inverse of to_string(); unknown names map to PROTOCOL_VIOLATION.
ErrorKind error_kind_from_string(const std::string& name);

// Outcome of one protocol step. Every step of the state machines returns one
// of these instead of throwing.
struct Status {
    ErrorKind kind = ErrorKind::NONE;
    std::string message;

    bool ok() const { return kind == ErrorKind::NONE; }

    static Status success() { return {}; }
    static Status failure(ErrorKind kind, std::string message) {
        return Status{kind, std::move(message)};
    }
};

} // namespace transfer
