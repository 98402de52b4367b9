#pragma once

#include <string>
#include <cstdint>
#include <cstddef>
#include <sodium.h>

namespace integrity {

constexpr size_t FILE_READ_BLOCK = 1024 * 1024;

// Initializes libsodium once. Throws std::runtime_error if that fails.
void ensure_sodium();

// SHA-256 over one buffer, lowercase hex.
std::string sha256_hex(const uint8_t* data, size_t size);
std::string sha256_hex(const std::string& data);

// Case-insensitive hex comparison.
bool checksums_equal(const std::string& a, const std::string& b);

// Streaming SHA-256 for one transfer attempt. Each update() also returns the
// independent digest of that chunk alone.
class ChecksumEngine {
public:
    ChecksumEngine();

    std::string update(const uint8_t* data, size_t size);
    void update_whole(const uint8_t* data, size_t size);

    // Lowercase hex of everything fed so far. Callable once.
    std::string finalize();

    uint64_t bytes_hashed() const { return bytes_; }

private:
    crypto_hash_sha256_state state_;
    uint64_t bytes_ = 0;
    bool finalized_ = false;
};

struct FileInfo {
    std::string path;
    uint64_t size_bytes = 0;
    std::string checksum;
};

// Throw std::runtime_error if the file cannot be read.
std::string file_checksum(const std::string& path);
bool verify_file_checksum(const std::string& path, const std::string& expected);
FileInfo file_info(const std::string& path);

} // namespace integrity
