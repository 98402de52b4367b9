#pragma once

#include <string>
#include <cstdint>
#include <vector>

namespace config {

constexpr unsigned short DEFAULT_TCP_PORT = 8888;
constexpr uint64_t FILE_CHUNK_SIZE = 1024 * 1024;            // 1MB
constexpr uint64_t MAX_CHUNK_SIZE = 16 * 1024 * 1024;        // 16MB

struct Config {
    std::string bind_address = "0.0.0.0";
    unsigned short port = DEFAULT_TCP_PORT;
    std::string receive_dir = "/tmp/synergy_files/received";
    std::string generated_dir = "/tmp/synergy_files/generated";
    uint64_t chunk_size = FILE_CHUNK_SIZE;
    uint64_t max_chunk_size = MAX_CHUNK_SIZE;
    unsigned progress_interval_ms = 1000;
    unsigned connect_timeout_ms = 30000;

    double progress_interval_seconds() const { return progress_interval_ms / 1000.0; }

    // Empty string when usable, otherwise the first problem found.
    std::string validate() const;
};

// Overlays keys present in a JSON file. Throws std::runtime_error when the
// file is unreadable or not a JSON object.
void load_file(Config& cfg, const std::string& path);

// Parses an unsigned decimal no larger than `max`. Throws
// std::invalid_argument naming `name` otherwise.
uint64_t parse_number(const std::string& name, const std::string& value, uint64_t max);

// Consumes recognised --flags from args (in order, --config first if present)
// and returns the remaining positional arguments. Throws
// std::invalid_argument on a malformed flag.
std::vector<std::string> apply_args(Config& cfg, const std::vector<std::string>& args);

} // namespace config
