#include "protocol/frame.hpp"
#include <arpa/inet.h>
#include <cstring>

namespace protocol {

using transfer::ErrorKind;
using transfer::Status;

std::array<uint8_t, FRAME_HEADER_SIZE> serialize_length(uint32_t length) {
    std::array<uint8_t, FRAME_HEADER_SIZE> buffer;
    uint32_t be = htonl(length);
    std::memcpy(buffer.data(), &be, 4);
    return buffer;
}

uint32_t deserialize_length(const std::array<uint8_t, FRAME_HEADER_SIZE>& buffer) {
    uint32_t be;
    std::memcpy(&be, buffer.data(), 4);
    return ntohl(be);
}

std::vector<uint8_t> encode_frame(const nlohmann::json& payload) {
    std::string body = payload.dump();
    auto prefix = serialize_length(static_cast<uint32_t>(body.size()));

    std::vector<uint8_t> frame;
    frame.reserve(FRAME_HEADER_SIZE + body.size());
    frame.insert(frame.end(), prefix.begin(), prefix.end());
    frame.insert(frame.end(), body.begin(), body.end());
    return frame;
}

Status send_message(transport::ByteStream& stream, const nlohmann::json& payload) {
    std::vector<uint8_t> frame;
    try {
        frame = encode_frame(payload);
    } catch (const nlohmann::json::exception& e) {
        // dump() throws on invalid UTF-8 in string values
        return Status::failure(ErrorKind::FRAMING, std::string("encode: ") + e.what());
    }
    if (frame.size() - FRAME_HEADER_SIZE > UINT32_MAX) {
        return Status::failure(ErrorKind::FRAMING, "encode: payload too large");
    }
    return stream.write_all(frame.data(), frame.size());
}

Status receive_message(transport::ByteStream& stream, nlohmann::json& payload, uint32_t max_frame) {
    std::array<uint8_t, FRAME_HEADER_SIZE> prefix;
    Status status = stream.read_exact(prefix.data(), prefix.size());
    if (!status.ok()) {
        return status;
    }

    uint32_t length = deserialize_length(prefix);
    if (length > max_frame) {
        return Status::failure(ErrorKind::FRAMING,
                               "frame length " + std::to_string(length) + " exceeds limit " +
                                   std::to_string(max_frame));
    }

    std::vector<uint8_t> body(length);
    status = stream.read_exact(body.data(), body.size());
    if (!status.ok()) {
        // EOF after the prefix is a torn frame
        if (status.kind == ErrorKind::CONNECTION_LOST) {
            return Status::failure(ErrorKind::FRAMING, "truncated frame (" + status.message + ")");
        }
        return status;
    }

    try {
        payload = nlohmann::json::parse(body.begin(), body.end());
    } catch (const nlohmann::json::parse_error& e) {
        return Status::failure(ErrorKind::FRAMING, std::string("invalid JSON payload: ") + e.what());
    }
    return Status::success();
}

} // namespace protocol
