#pragma once

#include <cstdint>
#include <array>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/status.hpp"
#include "stream.hpp"

namespace protocol {

// 4-byte big-endian length prefix
constexpr size_t FRAME_HEADER_SIZE = 4;
constexpr uint32_t DEFAULT_MAX_FRAME = 16 * 1024 * 1024;

std::array<uint8_t, FRAME_HEADER_SIZE> serialize_length(uint32_t length);
uint32_t deserialize_length(const std::array<uint8_t, FRAME_HEADER_SIZE>& buffer);

// Full frame (prefix + UTF-8 JSON) as it appears on the wire.
std::vector<uint8_t> encode_frame(const nlohmann::json& payload);

// Writes one frame. Prefix and payload go out in a single write so a reader
// never sees a prefix without its payload from a well-behaved writer.
transfer::Status send_message(transport::ByteStream& stream, const nlohmann::json& payload);

// Reads one whole frame into `payload`. EOF anywhere inside the frame is a
// failure, never a truncated message.
transfer::Status receive_message(transport::ByteStream& stream, nlohmann::json& payload,
                                 uint32_t max_frame = DEFAULT_MAX_FRAME);

} // namespace protocol
