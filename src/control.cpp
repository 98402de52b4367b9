#include "protocol/control.hpp"
#include "checksum.hpp"
#include <sodium.h>
#include <chrono>
#include <ctime>
#include <cstdio>

namespace protocol {

std::string generate_message_id() {
    integrity::ensure_sodium();
    unsigned char b[16];
    randombytes_buf(b, sizeof(b));
    b[6] = (b[6] & 0x0f) | 0x40;
    b[8] = (b[8] & 0x3f) | 0x80;

    char buf[37];
    snprintf(buf, sizeof(buf),
             "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
             b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7],
             b[8], b[9], b[10], b[11], b[12], b[13], b[14], b[15]);
    return std::string(buf);
}

std::string current_timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t secs = std::chrono::system_clock::to_time_t(now);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1000000;

    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[40];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lld+00:00",
             tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
             static_cast<long long>(micros));
    return std::string(buf);
}

ControlMessage make_message(MessageType type, ActionType action, nlohmann::json data, const std::string& source) {
    ControlMessage m;
    m.message_id = generate_message_id();
    m.type = type;
    m.action = action;
    m.data = std::move(data);
    m.timestamp = current_timestamp();
    m.source = source;
    return m;
}

ControlMessage make_color_change_command(ColorType color) {
    return make_message(MessageType::COMMAND, ActionType::COLOR_CHANGE, {{"color", color}});
}

ControlMessage make_wifi_hotspot_info(const std::string& ssid, const std::string& password,
                                      const std::string& ip_address, unsigned short port) {
    return make_message(MessageType::NOTIFICATION, ActionType::WIFI_HOTSPOT_INFO, {
        {"ssid", ssid},
        {"password", password},
        {"ip_address", ip_address},
        {"port", port},
        {"security_type", "WPA2"}
    });
}

ControlMessage make_file_transfer_request(uint64_t file_size, const std::string& file_name,
                                          const std::string& transfer_direction) {
    return make_message(MessageType::REQUEST, ActionType::FILE_TRANSFER_REQUEST, {
        {"file_size", file_size},
        {"file_name", file_name},
        {"transfer_direction", transfer_direction},
        {"checksum_type", "SHA256"},
        {"compression", false}
    });
}

ControlMessage make_file_transfer_response(bool accepted, unsigned short tcp_port,
                                           const std::optional<std::string>& error_message) {
    nlohmann::json data = {
        {"accepted", accepted},
        {"tcp_port", tcp_port},
        {"ready_for_transfer", accepted},
        {"error_message", nullptr}
    };
    if (error_message) data["error_message"] = *error_message;
    return make_message(MessageType::RESPONSE, ActionType::FILE_TRANSFER_RESPONSE, std::move(data));
}

ControlMessage make_error_message(ErrorCode code, const std::string& error_type,
                                  const std::string& error_message,
                                  const std::vector<std::string>& recovery_suggestions) {
    return make_message(MessageType::RESPONSE, ActionType::ERROR, {
        {"error_code", code},
        {"error_type", error_type},
        {"error_message", error_message},
        {"recovery_suggestions", recovery_suggestions},
        {"timestamp", current_timestamp()}
    });
}

bool validate_message(const nlohmann::json& message) {
    if (!message.is_object()) return false;
    for (const char* field : {"message_id", "type", "action", "data", "timestamp", "source"}) {
        if (!message.contains(field)) return false;
    }

    static const char* const types[] = {"command", "response", "request", "notification"};
    static const char* const actions[] = {
        "color_change", "color_change_ack", "wifi_hotspot_info", "wifi_connection_status",
        "file_transfer_request", "file_transfer_response", "error"
    };

    const auto& type = message["type"];
    const auto& action = message["action"];
    if (!type.is_string() || !action.is_string()) return false;

    bool type_ok = false;
    for (const char* t : types) type_ok = type_ok || type.get<std::string>() == t;
    bool action_ok = false;
    for (const char* a : actions) action_ok = action_ok || action.get<std::string>() == a;
    return type_ok && action_ok;
}

} // namespace protocol
