#include "file_generator.hpp"
#include "checksum.hpp"
#include <sodium.h>
#include <fstream>
#include <filesystem>
#include <chrono>
#include <map>
#include <stdexcept>
#include <algorithm>

namespace generator {

namespace {

const char TEXT_CHARS[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789 \n\t";
constexpr size_t TEXT_CHARS_LEN = sizeof(TEXT_CHARS) - 1;

const std::map<std::string, uint64_t> PRESET_FILE_SIZES = {
    {"small", 10},
    {"medium", 25},
    {"large", 50},
    {"extra_large", 100}
};

} // namespace

FileGenerator::FileGenerator(std::optional<FillPattern> fixed_pattern) : fixed_pattern_(fixed_pattern) {
    integrity::ensure_sodium();
}

FillPattern FileGenerator::pick_pattern() const {
    if (fixed_pattern_) return *fixed_pattern_;
    return static_cast<FillPattern>(randombytes_uniform(4));
}

void FileGenerator::fill_block(FillPattern pattern, uint64_t offset, std::vector<uint8_t>& block) {
    switch (pattern) {
        case FillPattern::RANDOM:
            randombytes_buf(block.data(), block.size());
            break;
        case FillPattern::TEXT:
            for (auto& b : block) {
                b = static_cast<uint8_t>(TEXT_CHARS[randombytes_uniform(TEXT_CHARS_LEN)]);
            }
            break;
        case FillPattern::REPETITIVE: {
            uint8_t base[256];
            randombytes_buf(base, sizeof(base));
            for (size_t i = 0; i < block.size(); ++i) {
                block[i] = base[i % 256];
                if (randombytes_uniform(100) < 5) {
                    block[i] = static_cast<uint8_t>(randombytes_uniform(256));
                }
            }
            break;
        }
        case FillPattern::POSITIONAL:
            for (size_t i = 0; i < block.size(); ++i) {
                uint64_t pos = offset + i;
                switch (pos % 4) {
                    case 0: block[i] = static_cast<uint8_t>(pos / 4); break;
                    case 1: block[i] = static_cast<uint8_t>((pos / 4) >> 8); break;
                    case 2: block[i] = static_cast<uint8_t>('A' + pos % 26); break;
                    default: block[i] = static_cast<uint8_t>('0' + pos % 10); break;
                }
            }
            break;
    }
}

GeneratedFile FileGenerator::generate(const std::string& path, uint64_t size_bytes,
                                      GenerateProgressCallback progress_cb) {
    auto start_time = std::chrono::steady_clock::now();

    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file for writing: " + path);
    }

    integrity::ChecksumEngine engine;
    std::vector<uint8_t> block;
    uint64_t written = 0;

    try {
        while (written < size_bytes) {
            block.resize(static_cast<size_t>(std::min(GENERATOR_BLOCK_SIZE, size_bytes - written)));
            fill_block(pick_pattern(), written, block);

            file.write(reinterpret_cast<const char*>(block.data()), static_cast<std::streamsize>(block.size()));
            if (!file.good()) {
                throw std::runtime_error("Write failed for " + path);
            }
            engine.update_whole(block.data(), block.size());
            written += block.size();

            if (progress_cb) {
                progress_cb(written, size_bytes);
            }
        }
        file.close();
        if (file.fail()) {
            throw std::runtime_error("Could not flush " + path);
        }
    } catch (...) {
        // Clean up partial file, then let the caller see the original error.
        file.close();
        std::error_code ec;
        std::filesystem::remove(path, ec);
        throw;
    }

    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time).count();

    GeneratedFile out;
    out.file_path = path;
    out.size_bytes = size_bytes;
    out.size_mb = size_bytes / (1024.0 * 1024.0);
    out.checksum = engine.finalize();
    out.generation_time_seconds = elapsed;
    out.generation_speed_mbps = elapsed > 0 ? (out.size_mb * 8) / elapsed : 0.0;
    return out;
}

GeneratedFile FileGenerator::generate_mb(const std::string& path, uint64_t size_mb,
                                         GenerateProgressCallback progress_cb) {
    return generate(path, size_mb * 1024 * 1024, progress_cb);
}

uint64_t preset_size_mb(const std::string& preset) {
    auto it = PRESET_FILE_SIZES.find(preset);
    if (it == PRESET_FILE_SIZES.end()) {
        throw std::invalid_argument("Invalid size preset '" + preset +
                                    "'. Must be one of: small, medium, large, extra_large");
    }
    return it->second;
}

GeneratedFile create_test_file(const std::string& preset, const std::string& file_name,
                               const std::string& dir, GenerateProgressCallback progress_cb) {
    uint64_t size_mb = preset_size_mb(preset);
    std::string name = file_name.empty() ? "test_file_" + std::to_string(size_mb) + "MB.bin" : file_name;

    FileGenerator gen;
    return gen.generate_mb((std::filesystem::path(dir) / name).string(), size_mb, progress_cb);
}

} // namespace generator
