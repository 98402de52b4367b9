#include "protocol/messages.hpp"

namespace protocol {

TransferResult TransferResult::failed(const transfer::Status& status) {
    TransferResult r;
    r.transfer_complete = false;
    r.error = transfer::to_string(status.kind);
    r.message = status.message;
    return r;
}

void to_json(nlohmann::json& j, const ReadyResponse& r) {
    j = nlohmann::json{{"status", r.status}, {"message", r.message}, {"transfer_id", r.transfer_id}};
}

void from_json(const nlohmann::json& j, ReadyResponse& r) {
    r.status = j.at("status").get<std::string>();
    r.message = j.value("message", std::string());
    r.transfer_id = j.value("transfer_id", std::string());
}

void to_json(nlohmann::json& j, const ChunkAck& a) {
    j = nlohmann::json{{"chunk_id", a.chunk_id}, {"status", a.status}, {"message", a.message}};
}

void from_json(const nlohmann::json& j, ChunkAck& a) {
    a.chunk_id = j.at("chunk_id").get<uint32_t>();
    a.status = j.at("status").get<std::string>();
    a.message = j.value("message", std::string());
}

void to_json(nlohmann::json& j, const TransferResult& r) {
    if (!r.transfer_complete) {
        j = nlohmann::json{
            {"transfer_complete", false},
            {"error", r.error},
            {"message", r.message},
            {"total_bytes", r.total_bytes},
            {"checksum_verified", r.checksum_verified}
        };
        return;
    }
    j = nlohmann::json{
        {"transfer_complete", true},
        {"total_bytes", r.total_bytes},
        {"transfer_time_ms", r.transfer_time_ms},
        {"average_speed_mbps", r.average_speed_mbps},
        {"file_checksum", r.file_checksum},
        {"checksum_verified", r.checksum_verified}
    };
    if (r.total_chunks > 0) j["total_chunks"] = r.total_chunks;
    if (!r.file_path.empty()) j["file_path"] = r.file_path;
    if (!r.message.empty()) j["message"] = r.message;
}

void from_json(const nlohmann::json& j, TransferResult& r) {
    r.transfer_complete = j.at("transfer_complete").get<bool>();
    r.total_bytes = j.value("total_bytes", uint64_t{0});
    r.total_chunks = j.value("total_chunks", uint32_t{0});
    r.transfer_time_ms = j.value("transfer_time_ms", uint64_t{0});
    r.average_speed_mbps = j.value("average_speed_mbps", 0.0);
    r.file_checksum = j.value("file_checksum", std::string());
    r.checksum_verified = j.value("checksum_verified", false);
    r.file_path = j.value("file_path", std::string());
    r.error = j.value("error", std::string());
    r.message = j.value("message", std::string());
}

bool is_transfer_result(const nlohmann::json& j) {
    return j.is_object() && j.contains("transfer_complete");
}

} // namespace protocol
