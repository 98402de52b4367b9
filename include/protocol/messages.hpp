#pragma once

#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "protocol/status.hpp"

namespace protocol {

constexpr const char* PROTOCOL_VERSION = "1.0";
constexpr const char* STATUS_READY = "ready";
constexpr const char* STATUS_RECEIVED = "received";
constexpr const char* STATUS_ERROR = "error";

struct FileMetadata {
    std::string name;
    uint64_t size = 0;
    std::string checksum;
    uint64_t chunk_size = 0;
};

struct TransferHandshake {
    std::string protocol_version = PROTOCOL_VERSION;
    FileMetadata file_metadata;
    std::string transfer_id;
};

struct ReadyResponse {
    std::string status = STATUS_READY;
    std::string message = "Ready to receive file";
    std::string transfer_id;
};

struct ChunkHeader {
    uint32_t chunk_id = 0;
    uint64_t chunk_size = 0;
    std::string chunk_checksum;
    bool is_last_chunk = false;
};

struct ChunkAck {
    uint32_t chunk_id = 0;
    std::string status = STATUS_RECEIVED;
    std::string message = "Chunk received successfully";
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(FileMetadata, name, size, checksum, chunk_size)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(TransferHandshake, protocol_version, file_metadata, transfer_id)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ChunkHeader, chunk_id, chunk_size, chunk_checksum, is_last_chunk)

// `message` is informational and may be absent on the wire.
void to_json(nlohmann::json& j, const ReadyResponse& r);
void from_json(const nlohmann::json& j, ReadyResponse& r);
void to_json(nlohmann::json& j, const ChunkAck& a);
void from_json(const nlohmann::json& j, ChunkAck& a);

// Terminal record of a transfer. On failure only transfer_complete, error,
// message, total_bytes and checksum_verified are serialized.
struct TransferResult {
    bool transfer_complete = false;
    uint64_t total_bytes = 0;
    uint32_t total_chunks = 0;
    uint64_t transfer_time_ms = 0;
    double average_speed_mbps = 0.0;
    std::string file_checksum;
    bool checksum_verified = false;
    std::string file_path;
    std::string error;
    std::string message;

    static TransferResult failed(const transfer::Status& status);
};

void to_json(nlohmann::json& j, const TransferResult& r);
void from_json(const nlohmann::json& j, TransferResult& r);

// True when `j` looks like a TransferResult rather than the record the
// caller was waiting for.
bool is_transfer_result(const nlohmann::json& j);

// Decodes a record, mapping missing fields or wrong types to PROTOCOL_VIOLATION.
template <typename T>
transfer::Status decode(const nlohmann::json& j, T& out, const char* what) {
    try {
        out = j.get<T>();
    } catch (const nlohmann::json::exception& e) {
        return transfer::Status::failure(transfer::ErrorKind::PROTOCOL_VIOLATION,
                                         std::string("malformed ") + what + ": " + e.what());
    }
    return transfer::Status::success();
}

} // namespace protocol
