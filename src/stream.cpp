#include "stream.hpp"
#include "protocol/status.hpp"

namespace transfer {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "none";
        case ErrorKind::FRAMING: return "framing_error";
        case ErrorKind::CHECKSUM_MISMATCH: return "checksum_mismatch";
        case ErrorKind::PROTOCOL_VIOLATION: return "protocol_violation";
        case ErrorKind::IO: return "io_error";
        case ErrorKind::CONNECTION_LOST: return "connection_lost";
    }
    return "unknown";
}

ErrorKind error_kind_from_string(const std::string& name) {
    for (ErrorKind kind : {ErrorKind::NONE, ErrorKind::FRAMING, ErrorKind::CHECKSUM_MISMATCH,
                           ErrorKind::PROTOCOL_VIOLATION, ErrorKind::IO, ErrorKind::CONNECTION_LOST}) {
        if (name == to_string(kind)) return kind;
    }
    return ErrorKind::PROTOCOL_VIOLATION;
}

} // namespace transfer

namespace transport {

using transfer::ErrorKind;
using transfer::Status;

Status classify_error(const boost::system::error_code& ec, const char* what) {
    namespace err = boost::asio::error;
    if (ec == err::eof || ec == err::connection_reset || ec == err::connection_aborted ||
        ec == err::broken_pipe || ec == err::bad_descriptor || ec == err::operation_aborted ||
        ec == err::not_connected || ec == err::shut_down) {
        return Status::failure(ErrorKind::CONNECTION_LOST,
                               std::string(what) + ": connection lost (" + ec.message() + ")");
    }
    return Status::failure(ErrorKind::IO, std::string(what) + ": " + ec.message());
}

Status ByteStream::read_exact(uint8_t* data, size_t size) {
    size_t total = 0;
    while (total < size) {
        boost::system::error_code ec;
        size_t n = read_some(data + total, size - total, ec);
        if (ec) {
            return classify_error(ec, "read");
        }
        if (n == 0) {
            return Status::failure(ErrorKind::CONNECTION_LOST, "read: peer closed the stream");
        }
        total += n;
    }
    return Status::success();
}

Status ByteStream::write_all(const uint8_t* data, size_t size) {
    size_t total = 0;
    while (total < size) {
        boost::system::error_code ec;
        size_t n = write_some(data + total, size - total, ec);
        if (ec) {
            return classify_error(ec, "write");
        }
        if (n == 0) {
            return Status::failure(ErrorKind::CONNECTION_LOST, "write: stream closed");
        }
        total += n;
    }
    return Status::success();
}

} // namespace transport
