#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace protocol {

enum class MessageType {
    COMMAND,
    RESPONSE,
    REQUEST,
    NOTIFICATION
};

enum class ActionType {
    COLOR_CHANGE,
    COLOR_CHANGE_ACK,
    WIFI_HOTSPOT_INFO,
    WIFI_CONNECTION_STATUS,
    FILE_TRANSFER_REQUEST,
    FILE_TRANSFER_RESPONSE,
    ERROR
};

enum class ColorType { RED, YELLOW, GREEN };

enum class ErrorCode {
    E001,  // Bluetooth connection failed
    E002,  // Wi-Fi hotspot creation failed
    E003,  // Wi-Fi connection failed
    E004,  // File transfer initialization failed
    E005,  // File transfer interrupted
    E006,  // Checksum verification failed
    E007,  // Invalid message format
    E008   // Unsupported operation
};

NLOHMANN_JSON_SERIALIZE_ENUM(MessageType, {
    {MessageType::COMMAND, "command"},
    {MessageType::RESPONSE, "response"},
    {MessageType::REQUEST, "request"},
    {MessageType::NOTIFICATION, "notification"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(ActionType, {
    {ActionType::COLOR_CHANGE, "color_change"},
    {ActionType::COLOR_CHANGE_ACK, "color_change_ack"},
    {ActionType::WIFI_HOTSPOT_INFO, "wifi_hotspot_info"},
    {ActionType::WIFI_CONNECTION_STATUS, "wifi_connection_status"},
    {ActionType::FILE_TRANSFER_REQUEST, "file_transfer_request"},
    {ActionType::FILE_TRANSFER_RESPONSE, "file_transfer_response"},
    {ActionType::ERROR, "error"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(ColorType, {
    {ColorType::RED, "RED"},
    {ColorType::YELLOW, "YELLOW"},
    {ColorType::GREEN, "GREEN"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(ErrorCode, {
    {ErrorCode::E001, "E001"},
    {ErrorCode::E002, "E002"},
    {ErrorCode::E003, "E003"},
    {ErrorCode::E004, "E004"},
    {ErrorCode::E005, "E005"},
    {ErrorCode::E006, "E006"},
    {ErrorCode::E007, "E007"},
    {ErrorCode::E008, "E008"},
})

constexpr const char* DEFAULT_SOURCE = "native";
constexpr uint32_t CONTROL_MAX_FRAME = 64 * 1024;

// Envelope for the small command/notification exchange that precedes and
// accompanies a file transfer.
struct ControlMessage {
    std::string message_id;
    MessageType type = MessageType::NOTIFICATION;
    ActionType action = ActionType::ERROR;
    nlohmann::json data = nlohmann::json::object();
    std::string timestamp;
    std::string source = DEFAULT_SOURCE;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ControlMessage, message_id, type, action, data, timestamp, source)

// Random RFC 4122 version 4 id.
std::string generate_message_id();
// ISO 8601, UTC, microsecond precision.
std::string current_timestamp();

ControlMessage make_message(MessageType type, ActionType action, nlohmann::json data,
                            const std::string& source = DEFAULT_SOURCE);

ControlMessage make_color_change_command(ColorType color);
ControlMessage make_wifi_hotspot_info(const std::string& ssid, const std::string& password,
                                      const std::string& ip_address, unsigned short port);
ControlMessage make_file_transfer_request(uint64_t file_size, const std::string& file_name,
                                          const std::string& transfer_direction);
ControlMessage make_file_transfer_response(bool accepted, unsigned short tcp_port,
                                           const std::optional<std::string>& error_message = std::nullopt);
ControlMessage make_error_message(ErrorCode code, const std::string& error_type,
                                  const std::string& error_message,
                                  const std::vector<std::string>& recovery_suggestions);

// All six envelope fields present, type and action known.
bool validate_message(const nlohmann::json& message);

} // namespace protocol
