#include "transfer.hpp"
#include "protocol/frame.hpp"
#include <iostream>
#include <filesystem>
#include <chrono>
#include <cmath>
#include <ctime>
#include <algorithm>

namespace transfer {

using protocol::TransferResult;
using Clock = std::chrono::steady_clock;

const char* to_string(TransferState state) {
    switch (state) {
        case TransferState::IDLE: return "IDLE";
        case TransferState::HANDSHAKE_SENT: return "HANDSHAKE_SENT";
        case TransferState::AWAITING_HANDSHAKE: return "AWAITING_HANDSHAKE";
        case TransferState::TRANSFERRING: return "TRANSFERRING";
        case TransferState::VERIFYING: return "VERIFYING";
        case TransferState::COMPLETE: return "COMPLETE";
        case TransferState::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

std::string make_transfer_id() {
    integrity::ensure_sodium();
    unsigned char suffix[4];
    randombytes_buf(suffix, sizeof(suffix));
    char hex[sizeof(suffix) * 2 + 1];
    sodium_bin2hex(hex, sizeof(hex), suffix, sizeof(suffix));
    return "transfer_" + std::to_string(static_cast<long long>(std::time(nullptr))) + "_" + hex;
}

Status validate_file_name(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return Status::failure(ErrorKind::PROTOCOL_VIOLATION, "invalid file name: '" + name + "'");
    }
    if (name.find_first_of(std::string("/\\\0", 3)) != std::string::npos) {
        return Status::failure(ErrorKind::PROTOCOL_VIOLATION,
                               "file name must not contain path separators: '" + name + "'");
    }
    return Status::success();
}

double speed_mbps(uint64_t bytes, double seconds) {
    return seconds > 0 ? (bytes * 8.0) / (seconds * 1024 * 1024) : 0.0;
}

double round_speed(double mbps) {
    return std::round(mbps * 100.0) / 100.0;
}

namespace {

bool cancelled(const std::atomic<bool>* flag) {
    return flag && flag->load();
}

// A peer that gives up sends its failure result in place of whatever we were
// waiting for.
Status peer_failure(const nlohmann::json& message) {
    TransferResult peer;
    Status decoded = protocol::decode(message, peer, "transfer result");
    if (!decoded.ok()) return decoded;
    return Status::failure(error_kind_from_string(peer.error), "peer aborted: " + peer.message);
}

} // namespace

// ─── Sender ─────────────────────────────────────────────────────────────────

ChunkSender::ChunkSender(transport::ByteStream& stream, SenderOptions options,
                         progress::ProgressChannel* progress, const std::atomic<bool>* cancel_flag)
    : stream_(stream), options_(std::move(options)), progress_(progress), cancel_flag_(cancel_flag) {}

TransferResult ChunkSender::send_file(const std::string& filepath) {
    try {
        Status status = prepare(filepath);
        if (status.ok()) status = send_handshake();
        if (status.ok()) status = send_chunks();

        TransferResult peer;
        if (status.ok()) status = receive_result(peer);
        if (!status.ok()) return fail(status);

        TransferResult result;
        result.transfer_complete = true;
        result.total_chunks = chunks_sent_;
        result.total_bytes = bytes_sent_;
        result.transfer_time_ms = static_cast<uint64_t>(std::llround(elapsed_ * 1000));
        result.average_speed_mbps = round_speed(speed_mbps(bytes_sent_, elapsed_));
        result.file_checksum = info_.checksum;
        result.checksum_verified = true;

        // The receiver's view of the transfer wins where it has one.
        result.transfer_complete = peer.transfer_complete;
        result.checksum_verified = peer.checksum_verified;
        result.file_path = peer.file_path;
        result.error = peer.error;
        result.message = peer.message;
        if (peer.transfer_complete) {
            result.total_bytes = peer.total_bytes;
            result.transfer_time_ms = peer.transfer_time_ms;
            result.average_speed_mbps = peer.average_speed_mbps;
            if (!peer.file_checksum.empty()) result.file_checksum = peer.file_checksum;
        }

        state_ = result.transfer_complete ? TransferState::COMPLETE : TransferState::FAILED;
        return result;
    } catch (const std::exception& e) {
        return fail(Status::failure(ErrorKind::IO, e.what()));
    }
}

Status ChunkSender::prepare(const std::string& filepath) {
    try {
        info_ = integrity::file_info(filepath);
    } catch (const std::exception& e) {
        return Status::failure(ErrorKind::IO, e.what());
    }

    if (options_.chunk_size == 0) {
        return Status::failure(ErrorKind::PROTOCOL_VIOLATION, "chunk size must be greater than zero");
    }
    if (options_.file_name.empty()) {
        options_.file_name = std::filesystem::path(filepath).filename().string();
    }
    if (options_.transfer_id.empty()) {
        options_.transfer_id = make_transfer_id();
    }

    file_.open(filepath, std::ios::binary);
    if (!file_.is_open()) {
        return Status::failure(ErrorKind::IO, "Could not open file for reading: " + filepath);
    }
    return Status::success();
}

Status ChunkSender::send_handshake() {
    protocol::TransferHandshake handshake;
    handshake.file_metadata = {options_.file_name, info_.size_bytes, info_.checksum, options_.chunk_size};
    handshake.transfer_id = options_.transfer_id;

    Status status = protocol::send_message(stream_, handshake);
    if (!status.ok()) return status;
    state_ = TransferState::HANDSHAKE_SENT;

    nlohmann::json reply;
    status = protocol::receive_message(stream_, reply);
    if (!status.ok()) return status;

    if (protocol::is_transfer_result(reply)) {
        Status refused = peer_failure(reply);
        refused.message = "handshake rejected (" + refused.message + ")";
        return refused;
    }

    protocol::ReadyResponse ready;
    status = protocol::decode(reply, ready, "ready response");
    if (!status.ok()) return status;
    if (ready.status != protocol::STATUS_READY) {
        return Status::failure(ErrorKind::PROTOCOL_VIOLATION,
                               "receiver not ready for file transfer (status '" + ready.status + "')");
    }
    if (!ready.transfer_id.empty() && ready.transfer_id != options_.transfer_id) {
        return Status::failure(ErrorKind::PROTOCOL_VIOLATION,
                               "ready response for unknown transfer " + ready.transfer_id);
    }
    return Status::success();
}

Status ChunkSender::send_chunks() {
    state_ = TransferState::TRANSFERRING;

    integrity::ChecksumEngine engine;
    progress::ProgressTracker tracker(info_.size_bytes, options_.progress_interval);
    auto start_time = Clock::now();

    const uint64_t total = info_.size_bytes;
    std::vector<char> buffer(static_cast<size_t>(std::min(options_.chunk_size, std::max<uint64_t>(total, 1))));

    while (bytes_sent_ < total) {
        if (cancelled(cancel_flag_)) {
            return Status::failure(ErrorKind::IO, "transfer cancelled locally");
        }

        uint64_t want = std::min<uint64_t>(options_.chunk_size, total - bytes_sent_);
        file_.read(buffer.data(), static_cast<std::streamsize>(want));
        std::streamsize got = file_.gcount();
        if (got <= 0) {
            return Status::failure(ErrorKind::IO, "source file ended early at byte " + std::to_string(bytes_sent_));
        }

        const uint8_t* data = reinterpret_cast<const uint8_t*>(buffer.data());
        protocol::ChunkHeader header;
        header.chunk_id = chunks_sent_ + 1;
        header.chunk_size = static_cast<uint64_t>(got);
        header.chunk_checksum = engine.update(data, header.chunk_size);
        header.is_last_chunk = bytes_sent_ + header.chunk_size >= total;

        Status status = protocol::send_message(stream_, header);
        if (!status.ok()) return status;
        // Raw bytes follow the header with no prefix of their own.
        status = stream_.write_all(data, header.chunk_size);
        if (!status.ok()) return status;

        status = expect_ack(header.chunk_id);
        if (!status.ok()) return status;

        chunks_sent_ = header.chunk_id;
        bytes_sent_ += header.chunk_size;

        if (progress_ && tracker.should_update()) {
            progress_->publish(tracker.update(bytes_sent_));
        }
    }
    elapsed_ = std::chrono::duration<double>(Clock::now() - start_time).count();
    if (progress_) {
        progress_->publish(tracker.update(bytes_sent_));
    }

    std::string streamed = engine.finalize();
    if (!integrity::checksums_equal(streamed, info_.checksum)) {
        std::cerr << "ChunkSender: source file changed during transfer " << options_.transfer_id << "\n";
    }
    return Status::success();
}

Status ChunkSender::expect_ack(uint32_t chunk_id) {
    nlohmann::json reply;
    Status status = protocol::receive_message(stream_, reply);
    if (!status.ok()) return status;

    if (protocol::is_transfer_result(reply)) {
        return peer_failure(reply);
    }

    protocol::ChunkAck ack;
    status = protocol::decode(reply, ack, "chunk ack");
    if (!status.ok()) return status;

    if (ack.chunk_id != chunk_id) {
        return Status::failure(ErrorKind::PROTOCOL_VIOLATION,
                               "ack for chunk " + std::to_string(ack.chunk_id) + " while waiting for chunk " +
                                   std::to_string(chunk_id));
    }
    if (ack.status != protocol::STATUS_RECEIVED) {
        return Status::failure(ErrorKind::PROTOCOL_VIOLATION,
                               "Chunk " + std::to_string(chunk_id) + " not acknowledged: " + ack.message);
    }
    return Status::success();
}

Status ChunkSender::receive_result(TransferResult& peer) {
    state_ = TransferState::VERIFYING;
    nlohmann::json reply;
    Status status = protocol::receive_message(stream_, reply);
    if (!status.ok()) {
        if (status.kind == ErrorKind::CONNECTION_LOST) {
            status.message = "no transfer result from receiver: " + status.message;
        }
        return status;
    }
    return protocol::decode(reply, peer, "transfer result");
}

TransferResult ChunkSender::fail(const Status& status) {
    state_ = TransferState::FAILED;
    file_.close();
    std::cerr << "ChunkSender: transfer " << options_.transfer_id << " failed ("
              << to_string(status.kind) << "): " << status.message << "\n";

    TransferResult result = TransferResult::failed(status);
    result.total_bytes = bytes_sent_;
    result.total_chunks = chunks_sent_;
    result.file_checksum = info_.checksum;
    return result;
}

// ─── Receiver ───────────────────────────────────────────────────────────────

ChunkReceiver::ChunkReceiver(transport::ByteStream& stream, ReceiverOptions options,
                             progress::ProgressChannel* progress, const std::atomic<bool>* cancel_flag)
    : stream_(stream), options_(std::move(options)), progress_(progress), cancel_flag_(cancel_flag) {}

ChunkReceiver::~ChunkReceiver() {
    if (state_ != TransferState::COMPLETE) {
        discard_partial();
    }
}

TransferResult ChunkReceiver::receive_file() {
    TransferResult result;
    Status status;
    try {
        engine_ = std::make_unique<integrity::ChecksumEngine>();
        status = await_handshake();
        if (status.ok()) status = open_destination();
        if (status.ok()) {
            protocol::ReadyResponse ready;
            ready.transfer_id = handshake_.transfer_id;
            status = protocol::send_message(stream_, ready);
        }
        if (status.ok()) status = receive_chunks();
        if (status.ok()) status = verify(result);
    } catch (const std::exception& e) {
        status = Status::failure(ErrorKind::IO, e.what());
    }

    if (!status.ok()) {
        state_ = TransferState::FAILED;
        discard_partial();
        std::cerr << "ChunkReceiver: transfer " << handshake_.transfer_id << " failed ("
                  << to_string(status.kind) << "): " << status.message << "\n";

        bool verified = result.checksum_verified;
        result = TransferResult::failed(status);
        result.total_bytes = bytes_received_;
        result.checksum_verified = verified;
    } else {
        state_ = TransferState::COMPLETE;
        std::cout << "ChunkReceiver: received " << handshake_.file_metadata.name << " ("
                  << progress::format_size(bytes_received_) << ") -> " << final_path_ << "\n";
    }

    send_result(result);
    return result;
}

Status ChunkReceiver::await_handshake() {
    state_ = TransferState::AWAITING_HANDSHAKE;

    nlohmann::json message;
    Status status = protocol::receive_message(stream_, message);
    if (!status.ok()) return status;
    status = protocol::decode(message, handshake_, "handshake");
    if (!status.ok()) return status;

    const protocol::FileMetadata& meta = handshake_.file_metadata;
    if (handshake_.protocol_version != protocol::PROTOCOL_VERSION) {
        return Status::failure(ErrorKind::PROTOCOL_VIOLATION,
                               "unsupported protocol version " + handshake_.protocol_version);
    }
    status = validate_file_name(meta.name);
    if (!status.ok()) return status;
    if (meta.chunk_size > options_.max_chunk_size) {
        return Status::failure(ErrorKind::PROTOCOL_VIOLATION,
                               "declared chunk size " + std::to_string(meta.chunk_size) + " exceeds limit " +
                                   std::to_string(options_.max_chunk_size));
    }
    return Status::success();
}

Status ChunkReceiver::open_destination() {
    std::filesystem::path dir(options_.receive_dir);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return Status::failure(ErrorKind::IO, "Could not create " + dir.string() + ": " + ec.message());
    }

    final_path_ = (dir / handshake_.file_metadata.name).string();
    part_path_ = final_path_ + ".part";

    file_.open(part_path_, std::ios::binary | std::ios::trunc);
    if (!file_.is_open()) {
        part_path_.clear();
        return Status::failure(ErrorKind::IO, "Could not open file for writing: " + final_path_);
    }
    return Status::success();
}

Status ChunkReceiver::receive_chunks() {
    state_ = TransferState::TRANSFERRING;

    const uint64_t total = handshake_.file_metadata.size;
    progress::ProgressTracker tracker(total, options_.progress_interval);
    auto start_time = Clock::now();
    std::vector<uint8_t> buffer;
    uint32_t next_id = 1;

    while (bytes_received_ < total) {
        if (cancelled(cancel_flag_)) {
            return Status::failure(ErrorKind::IO, "transfer cancelled locally");
        }

        Status status = receive_chunk(next_id, buffer);
        if (!status.ok()) return status;

        protocol::ChunkAck ack;
        ack.chunk_id = next_id++;
        status = protocol::send_message(stream_, ack);
        if (!status.ok()) return status;
        chunks_received_ = ack.chunk_id;

        if (progress_ && tracker.should_update()) {
            progress_->publish(tracker.update(bytes_received_));
        }
    }
    elapsed_ = std::chrono::duration<double>(Clock::now() - start_time).count();
    if (progress_) {
        progress_->publish(tracker.update(bytes_received_));
    }
    return Status::success();
}

Status ChunkReceiver::receive_chunk(uint32_t expected_id, std::vector<uint8_t>& buffer) {
    nlohmann::json message;
    Status status = protocol::receive_message(stream_, message);
    if (!status.ok()) return status;

    protocol::ChunkHeader header;
    status = protocol::decode(message, header, "chunk header");
    if (!status.ok()) return status;

    const uint64_t total = handshake_.file_metadata.size;
    if (header.chunk_id != expected_id) {
        return Status::failure(ErrorKind::PROTOCOL_VIOLATION,
                               "expected chunk " + std::to_string(expected_id) + ", got " +
                                   std::to_string(header.chunk_id));
    }
    if (header.chunk_size == 0 || header.chunk_size > options_.max_chunk_size) {
        return Status::failure(ErrorKind::PROTOCOL_VIOLATION,
                               "chunk " + std::to_string(header.chunk_id) + " has invalid size " +
                                   std::to_string(header.chunk_size));
    }
    if (header.chunk_size > total - bytes_received_) {
        return Status::failure(ErrorKind::PROTOCOL_VIOLATION,
                               "chunk " + std::to_string(header.chunk_id) + " overruns declared file size");
    }
    bool last = bytes_received_ + header.chunk_size >= total;
    if (header.is_last_chunk != last) {
        return Status::failure(ErrorKind::PROTOCOL_VIOLATION,
                               "chunk " + std::to_string(header.chunk_id) + " has inconsistent is_last_chunk");
    }

    buffer.resize(static_cast<size_t>(header.chunk_size));
    status = stream_.read_exact(buffer.data(), buffer.size());
    if (!status.ok()) return status;

    std::string actual = integrity::sha256_hex(buffer.data(), buffer.size());
    if (!integrity::checksums_equal(actual, header.chunk_checksum)) {
        return Status::failure(ErrorKind::CHECKSUM_MISMATCH,
                               "Chunk " + std::to_string(header.chunk_id) + " checksum mismatch");
    }

    file_.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    if (!file_.good()) {
        return Status::failure(ErrorKind::IO, "write failed for " + part_path_);
    }
    engine_->update_whole(buffer.data(), buffer.size());
    bytes_received_ += header.chunk_size;
    return Status::success();
}

Status ChunkReceiver::verify(TransferResult& result) {
    state_ = TransferState::VERIFYING;

    file_.close();
    if (file_.fail()) {
        return Status::failure(ErrorKind::IO, "could not flush " + part_path_);
    }

    std::string actual = engine_->finalize();
    result.file_checksum = actual;
    result.checksum_verified = integrity::checksums_equal(actual, handshake_.file_metadata.checksum);
    if (!result.checksum_verified) {
        return Status::failure(ErrorKind::CHECKSUM_MISMATCH, "File checksum verification failed");
    }

    std::error_code ec;
    std::filesystem::rename(part_path_, final_path_, ec);
    if (ec) {
        return Status::failure(ErrorKind::IO, "Failed to rename temp file to " + final_path_ + ": " + ec.message());
    }
    part_path_.clear();

    result.transfer_complete = true;
    result.total_bytes = bytes_received_;
    result.total_chunks = chunks_received_;
    result.transfer_time_ms = static_cast<uint64_t>(std::llround(elapsed_ * 1000));
    result.average_speed_mbps = round_speed(speed_mbps(bytes_received_, elapsed_));
    result.file_path = final_path_;
    return Status::success();
}

void ChunkReceiver::discard_partial() {
    if (file_.is_open()) {
        file_.close();
    }
    if (!part_path_.empty()) {
        std::error_code ec;
        std::filesystem::remove(part_path_, ec);
        if (ec) {
            std::cerr << "ChunkReceiver: could not remove " << part_path_ << ": " << ec.message() << "\n";
        }
        part_path_.clear();
    }
}

void ChunkReceiver::send_result(const TransferResult& result) {
    Status status = protocol::send_message(stream_, result);
    if (!status.ok()) {
        std::cerr << "ChunkReceiver: could not deliver transfer result: " << status.message << "\n";
    }
}

} // namespace transfer
