#pragma once

#include <string>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace generator {

constexpr uint64_t GENERATOR_BLOCK_SIZE = 1024 * 1024;

enum class FillPattern {
    RANDOM,      // uniform random bytes
    TEXT,        // printable alphabet plus space, newline, tab
    REPETITIVE,  // 256-byte random base pattern, ~5% of bytes perturbed
    POSITIONAL   // function of the absolute file offset only
};

struct GeneratedFile {
    std::string file_path;
    uint64_t size_bytes = 0;
    double size_mb = 0.0;
    std::string checksum;
    std::string checksum_type = "SHA256";
    double generation_time_seconds = 0.0;
    double generation_speed_mbps = 0.0;
};

// bytes_written, total_bytes
using GenerateProgressCallback = std::function<void(uint64_t, uint64_t)>;

// Writes synthetic payload files. Content differs between runs unless a
// fixed POSITIONAL pattern is requested; the checksum is always computed from
// the bytes actually written.
class FileGenerator {
public:
    // With no fixed pattern each block picks one at random.
    explicit FileGenerator(std::optional<FillPattern> fixed_pattern = std::nullopt);

    GeneratedFile generate(const std::string& path, uint64_t size_bytes,
                           GenerateProgressCallback progress_cb = nullptr);
    GeneratedFile generate_mb(const std::string& path, uint64_t size_mb,
                              GenerateProgressCallback progress_cb = nullptr);

    // Fills `block` (already sized) with `pattern`; `offset` is the block's
    // position in the file.
    static void fill_block(FillPattern pattern, uint64_t offset, std::vector<uint8_t>& block);

private:
    FillPattern pick_pattern() const;

    std::optional<FillPattern> fixed_pattern_;
};

// small=10, medium=25, large=50, extra_large=100 (MiB). Throws
// std::invalid_argument for an unknown preset.
uint64_t preset_size_mb(const std::string& preset);
GeneratedFile create_test_file(const std::string& preset, const std::string& file_name = "",
                               const std::string& dir = "/tmp/synergy_files",
                               GenerateProgressCallback progress_cb = nullptr);

} // namespace generator
