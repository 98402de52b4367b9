#pragma once

#include <string>
#include <cstdint>
#include <atomic>
#include <fstream>
#include <vector>
#include <memory>
#include "stream.hpp"
#include "checksum.hpp"
#include "progress.hpp"
#include "protocol/messages.hpp"
#include "protocol/status.hpp"

namespace transfer {

enum class TransferState {
    IDLE,
    HANDSHAKE_SENT,
    AWAITING_HANDSHAKE,
    TRANSFERRING,
    VERIFYING,
    COMPLETE,
    FAILED
};

const char* to_string(TransferState state);

struct SenderOptions {
    uint64_t chunk_size = 1024 * 1024;
    double progress_interval = 1.0;
    // Defaults to the source file's base name
    std::string file_name;
    // Generated when empty
    std::string transfer_id;
};

struct ReceiverOptions {
    std::string receive_dir = "/tmp/synergy_files/received";
    uint64_t max_chunk_size = 16 * 1024 * 1024;
    double progress_interval = 1.0;
};

// "transfer_<unix seconds>_<8 hex>"
std::string make_transfer_id();

// Accepts only a single, non-special path component.
Status validate_file_name(const std::string& name);

double round_speed(double mbps);
double speed_mbps(uint64_t bytes, double seconds);

// Sender half of the chunk protocol. One instance per transfer attempt; the
// stream stays owned by the caller.
class ChunkSender {
public:
    ChunkSender(transport::ByteStream& stream, SenderOptions options,
                progress::ProgressChannel* progress = nullptr,
                const std::atomic<bool>* cancel_flag = nullptr);

    // Runs handshake, chunk loop and result exchange. Never throws; failures
    // come back as transfer_complete == false.
    protocol::TransferResult send_file(const std::string& filepath);

    TransferState state() const { return state_; }
    const std::string& transfer_id() const { return options_.transfer_id; }

private:
    Status prepare(const std::string& filepath);
    Status send_handshake();
    Status send_chunks();
    Status receive_result(protocol::TransferResult& peer);
    Status expect_ack(uint32_t chunk_id);
    protocol::TransferResult fail(const Status& status);

    transport::ByteStream& stream_;
    SenderOptions options_;
    progress::ProgressChannel* progress_;
    const std::atomic<bool>* cancel_flag_;

    TransferState state_ = TransferState::IDLE;
    integrity::FileInfo info_;
    std::ifstream file_;
    uint64_t bytes_sent_ = 0;
    uint32_t chunks_sent_ = 0;
    double elapsed_ = 0.0;
};

// Receiver half. Owns the destination file for the duration of the
// transfer and removes it on every failure path.
class ChunkReceiver {
public:
    ChunkReceiver(transport::ByteStream& stream, ReceiverOptions options,
                  progress::ProgressChannel* progress = nullptr,
                  const std::atomic<bool>* cancel_flag = nullptr);
    ~ChunkReceiver();

    // Never throws. The returned result has also been sent to the peer when
    // the stream still allowed it.
    protocol::TransferResult receive_file();

    TransferState state() const { return state_; }
    const protocol::TransferHandshake& handshake() const { return handshake_; }

private:
    Status await_handshake();
    Status open_destination();
    Status receive_chunks();
    Status receive_chunk(uint32_t expected_id, std::vector<uint8_t>& buffer);
    Status verify(protocol::TransferResult& result);
    void discard_partial();
    void send_result(const protocol::TransferResult& result);

    transport::ByteStream& stream_;
    ReceiverOptions options_;
    progress::ProgressChannel* progress_;
    const std::atomic<bool>* cancel_flag_;

    TransferState state_ = TransferState::IDLE;
    protocol::TransferHandshake handshake_;
    std::string final_path_;
    std::string part_path_;
    std::ofstream file_;
    std::unique_ptr<integrity::ChecksumEngine> engine_;
    uint64_t bytes_received_ = 0;
    uint32_t chunks_received_ = 0;
    double elapsed_ = 0.0;
};

} // namespace transfer
