#include "config.hpp"
#include <fstream>
#include <stdexcept>
#include <limits>
#include <cctype>
#include <nlohmann/json.hpp>

namespace config {

std::string Config::validate() const {
    if (chunk_size == 0) return "chunk_size must be greater than zero";
    if (chunk_size > max_chunk_size) return "chunk_size exceeds max_chunk_size";
    if (receive_dir.empty()) return "receive_dir must not be empty";
    return "";
}

void load_file(Config& cfg, const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Could not open config file: " + path);
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid config file " + path + ": " + e.what());
    }
    if (!j.is_object()) {
        throw std::runtime_error("Config file must hold a JSON object: " + path);
    }

    try {
        cfg.bind_address = j.value("bind_address", cfg.bind_address);
        cfg.port = j.value("port", cfg.port);
        cfg.receive_dir = j.value("receive_dir", cfg.receive_dir);
        cfg.generated_dir = j.value("generated_dir", cfg.generated_dir);
        cfg.chunk_size = j.value("chunk_size", cfg.chunk_size);
        cfg.max_chunk_size = j.value("max_chunk_size", cfg.max_chunk_size);
        cfg.progress_interval_ms = j.value("progress_interval_ms", cfg.progress_interval_ms);
        cfg.connect_timeout_ms = j.value("connect_timeout_ms", cfg.connect_timeout_ms);
    } catch (const nlohmann::json::type_error& e) {
        throw std::runtime_error("Invalid value in config file " + path + ": " + e.what());
    }
}

uint64_t parse_number(const std::string& name, const std::string& value, uint64_t max) {
    // stoull would accept a sign or leading spaces and wrap "-1" around
    if (value.empty() || !std::isdigit(static_cast<unsigned char>(value[0]))) {
        throw std::invalid_argument(name + " expects a number, got '" + value + "'");
    }
    size_t pos = 0;
    unsigned long long n = 0;
    try {
        n = std::stoull(value, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument(name + " expects a number, got '" + value + "'");
    }
    if (pos != value.size() || n > max) {
        throw std::invalid_argument(name + " value out of range: " + value);
    }
    return n;
}

std::vector<std::string> apply_args(Config& cfg, const std::vector<std::string>& args) {
    // --config is applied first so explicit flags override the file.
    for (size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == "--config") {
            load_file(cfg, args[i + 1]);
        }
    }

    std::vector<std::string> positional;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg.rfind("--", 0) != 0) {
            positional.push_back(arg);
            continue;
        }
        if (i + 1 >= args.size()) {
            throw std::invalid_argument("Missing value for " + arg);
        }
        const std::string& value = args[++i];

        if (arg == "--config") {
            continue;
        } else if (arg == "--bind") {
            cfg.bind_address = value;
        } else if (arg == "--port") {
            cfg.port = static_cast<unsigned short>(
                parse_number(arg, value, std::numeric_limits<unsigned short>::max()));
        } else if (arg == "--dir") {
            cfg.receive_dir = value;
        } else if (arg == "--generated-dir") {
            cfg.generated_dir = value;
        } else if (arg == "--chunk-size") {
            cfg.chunk_size = parse_number(arg, value, std::numeric_limits<uint32_t>::max());
        } else if (arg == "--max-chunk-size") {
            cfg.max_chunk_size = parse_number(arg, value, std::numeric_limits<uint32_t>::max());
        } else if (arg == "--interval-ms") {
            cfg.progress_interval_ms = static_cast<unsigned>(
                parse_number(arg, value, std::numeric_limits<unsigned>::max()));
        } else if (arg == "--timeout-ms") {
            cfg.connect_timeout_ms = static_cast<unsigned>(
                parse_number(arg, value, std::numeric_limits<unsigned>::max()));
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }
    return positional;
}

} // namespace config
