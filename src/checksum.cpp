#include "checksum.hpp"
#include <sstream>
#include <iomanip>
#include <fstream>
#include <vector>
#include <filesystem>
#include <stdexcept>
#include <cctype>

namespace integrity {

namespace {

std::string to_hex(const unsigned char* bytes, size_t size) {
    std::ostringstream oss;
    for (size_t i = 0; i < size; ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

} // namespace

void ensure_sodium() {
    // sodium_init() is idempotent and thread-safe; 1 means already initialized
    if (sodium_init() < 0) {
        throw std::runtime_error("libsodium initialization failed");
    }
}

std::string sha256_hex(const uint8_t* data, size_t size) {
    ensure_sodium();
    unsigned char hash[crypto_hash_sha256_BYTES];
    crypto_hash_sha256(hash, data, size);
    return to_hex(hash, sizeof(hash));
}

std::string sha256_hex(const std::string& data) {
    return sha256_hex(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

bool checksums_equal(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

ChecksumEngine::ChecksumEngine() {
    ensure_sodium();
    crypto_hash_sha256_init(&state_);
}

std::string ChecksumEngine::update(const uint8_t* data, size_t size) {
    update_whole(data, size);
    return sha256_hex(data, size);
}

void ChecksumEngine::update_whole(const uint8_t* data, size_t size) {
    if (finalized_) {
        throw std::logic_error("ChecksumEngine: update after finalize");
    }
    crypto_hash_sha256_update(&state_, data, size);
    bytes_ += size;
}

std::string ChecksumEngine::finalize() {
    if (finalized_) {
        throw std::logic_error("ChecksumEngine: finalize called twice");
    }
    finalized_ = true;
    unsigned char hash[crypto_hash_sha256_BYTES];
    crypto_hash_sha256_final(&state_, hash);
    return to_hex(hash, sizeof(hash));
}

std::string file_checksum(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file for reading: " + path);
    }

    ChecksumEngine engine;
    std::vector<char> buffer(FILE_READ_BLOCK);
    while (file.read(buffer.data(), buffer.size()) || file.gcount() > 0) {
        engine.update_whole(reinterpret_cast<const uint8_t*>(buffer.data()),
                            static_cast<size_t>(file.gcount()));
    }
    if (file.bad()) {
        throw std::runtime_error("Read error while hashing: " + path);
    }
    return engine.finalize();
}

bool verify_file_checksum(const std::string& path, const std::string& expected) {
    return checksums_equal(file_checksum(path), expected);
}

FileInfo file_info(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw std::runtime_error("File not found: " + path);
    }
    FileInfo info;
    info.path = path;
    info.size_bytes = std::filesystem::file_size(path, ec);
    if (ec) {
        throw std::runtime_error("Could not stat " + path + ": " + ec.message());
    }
    info.checksum = file_checksum(path);
    return info;
}

} // namespace integrity
