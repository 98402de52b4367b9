#include <gtest/gtest.h>
#include <atomic>
#include <filesystem>
#include <thread>
#include <cctype>
#include "transfer.hpp"
#include "protocol/frame.hpp"
#include "test_util.hpp"

using protocol::TransferResult;
using testing_util::make_stream_pair;
using testing_util::recv_json;
using testing_util::send_json;
using testing_util::StreamPair;
using testing_util::TempDir;
using transfer::ErrorKind;
using transfer::TransferState;

namespace fs = std::filesystem;

namespace {

constexpr uint64_t MIB = 1024 * 1024;

nlohmann::json handshake_json(const std::string& name, uint64_t size, const std::string& checksum,
                              uint64_t chunk_size) {
    return {
        {"protocol_version", "1.0"},
        {"file_metadata", {{"name", name}, {"size", size}, {"checksum", checksum}, {"chunk_size", chunk_size}}},
        {"transfer_id", "transfer_test"}
    };
}

// Sends a header plus raw bytes the way a sender does.
void send_chunk(transport::ByteStream& stream, uint32_t id, const uint8_t* data, size_t size,
                const std::string& checksum, bool last) {
    send_json(stream, {{"chunk_id", id}, {"chunk_size", size}, {"chunk_checksum", checksum}, {"is_last_chunk", last}});
    ASSERT_TRUE(stream.write_all(data, size).ok());
}

} // namespace

class ChunkProtocolTest : public ::testing::Test {
protected:
    void SetUp() override {
        pair_ = make_stream_pair();
        receive_dir_ = (dir_.path() / "received").string();
        receiver_options_.receive_dir = receive_dir_;
        receiver_options_.progress_interval = 0.0;
    }

    // Runs a real receiver on pair_.b in the background.
    void start_receiver() {
        receiver_ = std::make_unique<transfer::ChunkReceiver>(*pair_.b, receiver_options_, &receiver_progress_);
        receiver_thread_ = std::thread([this]() { receiver_result_ = receiver_->receive_file(); });
    }

    TransferResult join_receiver() {
        receiver_thread_.join();
        return receiver_result_;
    }

    void TearDown() override {
        if (receiver_thread_.joinable()) {
            pair_.a->close();
            receiver_thread_.join();
        }
    }

    bool received_exists(const std::string& name) const {
        return fs::exists(fs::path(receive_dir_) / name) || fs::exists(fs::path(receive_dir_) / (name + ".part"));
    }

    TempDir dir_;
    StreamPair pair_;
    std::string receive_dir_;
    transfer::ReceiverOptions receiver_options_;
    progress::ProgressChannel receiver_progress_;
    std::unique_ptr<transfer::ChunkReceiver> receiver_;
    std::thread receiver_thread_;
    TransferResult receiver_result_;
};

TEST_F(ChunkProtocolTest, OneMebibyteInFourChunksCompletesAndVerifies) {
    std::string source = dir_.file("zeros.bin");
    testing_util::write_file(source, std::vector<uint8_t>(MIB, 0));
    start_receiver();

    transfer::SenderOptions options;
    options.chunk_size = 262144;
    options.progress_interval = 0.0;
    progress::ProgressChannel sender_progress;
    transfer::ChunkSender sender(*pair_.a, options, &sender_progress);
    TransferResult result = sender.send_file(source);
    TransferResult received = join_receiver();

    EXPECT_TRUE(result.transfer_complete) << result.message;
    EXPECT_TRUE(result.checksum_verified);
    EXPECT_EQ(result.total_bytes, MIB);
    EXPECT_EQ(result.total_chunks, 4u);
    EXPECT_EQ(result.file_checksum, "30e14955ebf1352266dc2ff8067e68104607e750abb9d3b36582b8af909fcb58");
    EXPECT_EQ(sender.state(), TransferState::COMPLETE);

    EXPECT_TRUE(received.transfer_complete);
    EXPECT_TRUE(received.checksum_verified);
    EXPECT_EQ(received.total_bytes, MIB);
    EXPECT_EQ(received.total_chunks, 4u);
    EXPECT_EQ(receiver_->state(), TransferState::COMPLETE);
    EXPECT_EQ(result.file_path, received.file_path);
    EXPECT_EQ(testing_util::read_file(received.file_path), std::vector<uint8_t>(MIB, 0));
    EXPECT_FALSE(fs::exists(received.file_path + ".part"));

    auto snaps = sender_progress.drain();
    ASSERT_FALSE(snaps.empty());
    for (size_t i = 1; i < snaps.size(); ++i) {
        EXPECT_GE(snaps[i].percentage, snaps[i - 1].percentage);
    }
    EXPECT_DOUBLE_EQ(snaps.back().percentage, 100.0);

    auto receiver_snaps = receiver_progress_.drain();
    ASSERT_FALSE(receiver_snaps.empty());
    EXPECT_DOUBLE_EQ(receiver_snaps.back().percentage, 100.0);
}

TEST_F(ChunkProtocolTest, UnevenFileSizeLeavesShortLastChunk) {
    auto bytes = testing_util::patterned_bytes(1000003);
    std::string source = dir_.file("odd.bin");
    testing_util::write_file(source, bytes);
    start_receiver();

    transfer::SenderOptions options;
    options.chunk_size = 65536;
    transfer::ChunkSender sender(*pair_.a, options);
    TransferResult result = sender.send_file(source);
    TransferResult received = join_receiver();

    ASSERT_TRUE(result.transfer_complete) << result.message;
    EXPECT_EQ(result.total_chunks, 16u);
    EXPECT_EQ(testing_util::read_file(received.file_path), bytes);
}

TEST_F(ChunkProtocolTest, CorruptedChunkChecksumAbortsAndRemovesFile) {
    std::vector<uint8_t> zeros(MIB, 0);
    const size_t chunk = 262144;
    std::string chunk_sum = integrity::sha256_hex(zeros.data(), chunk);
    start_receiver();

    transport::ByteStream& sender = *pair_.a;
    send_json(sender, handshake_json("zeros.bin", MIB, integrity::sha256_hex(zeros.data(), MIB), chunk));
    EXPECT_EQ(recv_json(sender)["status"], "ready");

    for (uint32_t id = 1; id <= 2; ++id) {
        send_chunk(sender, id, zeros.data(), chunk, chunk_sum, false);
        nlohmann::json ack = recv_json(sender);
        EXPECT_EQ(ack["chunk_id"], id);
        EXPECT_EQ(ack["status"], "received");
    }

    std::string altered = chunk_sum;
    altered[10] = altered[10] == '0' ? '1' : '0';
    send_chunk(sender, 3, zeros.data(), chunk, altered, false);

    // No ack for chunk 3: the next frame is the failure result.
    nlohmann::json reply = recv_json(sender);
    EXPECT_FALSE(reply.contains("chunk_id"));
    EXPECT_FALSE(reply["transfer_complete"].get<bool>());
    EXPECT_EQ(reply["error"], "checksum_mismatch");

    TransferResult received = join_receiver();
    EXPECT_FALSE(received.transfer_complete);
    EXPECT_EQ(receiver_->state(), TransferState::FAILED);
    EXPECT_FALSE(received_exists("zeros.bin"));
}

TEST_F(ChunkProtocolTest, ChunkChecksumComparisonIgnoresCase) {
    auto bytes = testing_util::patterned_bytes(5000);
    std::string sum = integrity::sha256_hex(bytes.data(), bytes.size());
    std::string upper = sum;
    for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    start_receiver();

    send_json(*pair_.a, handshake_json("upper.bin", bytes.size(), upper, bytes.size()));
    recv_json(*pair_.a);
    send_chunk(*pair_.a, 1, bytes.data(), bytes.size(), upper, true);
    EXPECT_EQ(recv_json(*pair_.a)["status"], "received");
    nlohmann::json result = recv_json(*pair_.a);
    EXPECT_TRUE(result["transfer_complete"].get<bool>());
    EXPECT_TRUE(result["checksum_verified"].get<bool>());
    join_receiver();
}

TEST_F(ChunkProtocolTest, EmptyFileFinalizesImmediately) {
    std::string source = dir_.file("empty.bin");
    testing_util::write_file(source, {});
    start_receiver();

    transfer::ChunkSender sender(*pair_.a, transfer::SenderOptions{});
    TransferResult result = sender.send_file(source);
    TransferResult received = join_receiver();

    EXPECT_TRUE(result.transfer_complete) << result.message;
    EXPECT_TRUE(result.checksum_verified);
    EXPECT_EQ(result.total_chunks, 0u);
    EXPECT_EQ(received.file_checksum, "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_TRUE(received.checksum_verified);
    EXPECT_TRUE(fs::exists(received.file_path));
    EXPECT_EQ(fs::file_size(received.file_path), 0u);
}

TEST_F(ChunkProtocolTest, SenderSeesConnectionLossWhenReceiverClosesMidChunk) {
    std::string source = dir_.file("big.bin");
    testing_util::write_file(source, testing_util::patterned_bytes(4 * MIB));

    std::thread fake_receiver([this]() {
        transport::ByteStream& rx = *pair_.b;
        nlohmann::json handshake = recv_json(rx);
        send_json(rx, {{"status", "ready"}, {"transfer_id", handshake["transfer_id"]}});
        recv_json(rx);  // chunk header
        std::vector<uint8_t> partial(1000);
        EXPECT_TRUE(rx.read_exact(partial.data(), partial.size()).ok());
        rx.close();
    });

    transfer::SenderOptions options;
    options.chunk_size = 4 * MIB;
    transfer::ChunkSender sender(*pair_.a, options);
    TransferResult result = sender.send_file(source);
    pair_.a->close();
    fake_receiver.join();

    EXPECT_FALSE(result.transfer_complete);
    EXPECT_EQ(result.error, "connection_lost");
    EXPECT_EQ(sender.state(), TransferState::FAILED);
}

TEST_F(ChunkProtocolTest, ReceiverDiscardsPartialFileWhenSenderVanishes) {
    auto bytes = testing_util::patterned_bytes(100000);
    start_receiver();

    send_json(*pair_.a, handshake_json("partial.bin", bytes.size(), integrity::sha256_hex(bytes.data(), bytes.size()),
                                       bytes.size()));
    recv_json(*pair_.a);
    send_json(*pair_.a, {{"chunk_id", 1}, {"chunk_size", bytes.size()},
                         {"chunk_checksum", integrity::sha256_hex(bytes.data(), bytes.size())},
                         {"is_last_chunk", true}});
    ASSERT_TRUE(pair_.a->write_all(bytes.data(), 5000).ok());
    pair_.a->close();

    TransferResult received = join_receiver();
    EXPECT_FALSE(received.transfer_complete);
    EXPECT_EQ(received.error, "connection_lost");
    EXPECT_FALSE(received_exists("partial.bin"));
}

TEST_F(ChunkProtocolTest, WholeFileMismatchReportsUnverifiedAndDeletes) {
    auto bytes = testing_util::patterned_bytes(4096);
    std::string chunk_sum = integrity::sha256_hex(bytes.data(), bytes.size());
    start_receiver();

    send_json(*pair_.a, handshake_json("wrong.bin", bytes.size(), std::string(64, 'f'), bytes.size()));
    recv_json(*pair_.a);
    send_chunk(*pair_.a, 1, bytes.data(), bytes.size(), chunk_sum, true);
    EXPECT_EQ(recv_json(*pair_.a)["status"], "received");

    nlohmann::json result = recv_json(*pair_.a);
    EXPECT_FALSE(result["transfer_complete"].get<bool>());
    EXPECT_FALSE(result["checksum_verified"].get<bool>());
    EXPECT_EQ(result["error"], "checksum_mismatch");

    TransferResult received = join_receiver();
    EXPECT_FALSE(received.checksum_verified);
    EXPECT_FALSE(received_exists("wrong.bin"));
}

TEST_F(ChunkProtocolTest, TraversalFileNameIsRefused) {
    start_receiver();
    send_json(*pair_.a, handshake_json("../escape.bin", 10, std::string(64, '0'), 10));

    nlohmann::json reply = recv_json(*pair_.a);
    EXPECT_FALSE(reply.contains("status"));
    EXPECT_FALSE(reply["transfer_complete"].get<bool>());
    EXPECT_EQ(reply["error"], "protocol_violation");

    join_receiver();
    EXPECT_FALSE(fs::exists(dir_.path() / "escape.bin"));
    EXPECT_FALSE(fs::exists(dir_.path() / "escape.bin.part"));
}

TEST_F(ChunkProtocolTest, OversizedChunkIsRefused) {
    receiver_options_.max_chunk_size = 1024;
    start_receiver();

    send_json(*pair_.a, handshake_json("big.bin", 4096, std::string(64, '0'), 1024));
    recv_json(*pair_.a);
    send_json(*pair_.a, {{"chunk_id", 1}, {"chunk_size", 4096}, {"chunk_checksum", std::string(64, '0')},
                         {"is_last_chunk", true}});

    nlohmann::json reply = recv_json(*pair_.a);
    EXPECT_EQ(reply["error"], "protocol_violation");
    join_receiver();
    EXPECT_FALSE(received_exists("big.bin"));
}

TEST_F(ChunkProtocolTest, OutOfSequenceChunkIdIsRefused) {
    auto bytes = testing_util::patterned_bytes(100);
    start_receiver();

    send_json(*pair_.a, handshake_json("seq.bin", 200, std::string(64, '0'), 100));
    recv_json(*pair_.a);
    send_chunk(*pair_.a, 2, bytes.data(), bytes.size(), integrity::sha256_hex(bytes.data(), bytes.size()), false);

    EXPECT_EQ(recv_json(*pair_.a)["error"], "protocol_violation");
    join_receiver();
}

TEST_F(ChunkProtocolTest, SenderAbortsOnMismatchedAck) {
    std::string source = dir_.file("ack.bin");
    testing_util::write_file(source, testing_util::patterned_bytes(2048));

    std::thread fake_receiver([this]() {
        transport::ByteStream& rx = *pair_.b;
        recv_json(rx);
        send_json(rx, {{"status", "ready"}, {"transfer_id", ""}});
        nlohmann::json header = recv_json(rx);
        std::vector<uint8_t> data(header["chunk_size"].get<size_t>());
        EXPECT_TRUE(rx.read_exact(data.data(), data.size()).ok());
        send_json(rx, {{"chunk_id", 2}, {"status", "received"}, {"message", ""}});
    });

    transfer::SenderOptions options;
    options.chunk_size = 1024;
    transfer::ChunkSender sender(*pair_.a, options);
    TransferResult result = sender.send_file(source);
    pair_.a->close();
    fake_receiver.join();

    EXPECT_FALSE(result.transfer_complete);
    EXPECT_EQ(result.error, "protocol_violation");
    EXPECT_NE(result.message.find("ack for chunk 2"), std::string::npos);
}

TEST_F(ChunkProtocolTest, SenderAcceptsMinimalReadyAndAckRecords) {
    auto bytes = testing_util::patterned_bytes(3000);
    std::string source = dir_.file("minimal.bin");
    testing_util::write_file(source, bytes);
    std::string file_sum = integrity::sha256_hex(bytes.data(), bytes.size());

    // Peer that sends only the required fields of each record.
    std::thread fake_receiver([this, file_sum]() {
        transport::ByteStream& rx = *pair_.b;
        nlohmann::json handshake = recv_json(rx);
        send_json(rx, {{"status", "ready"}, {"transfer_id", handshake["transfer_id"]}});

        uint64_t total = 0;
        bool last = false;
        while (!last) {
            nlohmann::json header = recv_json(rx);
            if (!header.contains("chunk_size")) return;
            std::vector<uint8_t> data(header["chunk_size"].get<size_t>());
            if (!rx.read_exact(data.data(), data.size()).ok()) return;
            total += data.size();
            last = header["is_last_chunk"].get<bool>();
            send_json(rx, {{"chunk_id", header["chunk_id"]}, {"status", "received"}});
        }
        send_json(rx, {{"transfer_complete", true}, {"total_bytes", total}, {"transfer_time_ms", 1},
                       {"average_speed_mbps", 1.5}, {"file_checksum", file_sum},
                       {"checksum_verified", true}, {"file_path", "/received/minimal.bin"}});
    });

    transfer::SenderOptions options;
    options.chunk_size = 1024;
    transfer::ChunkSender sender(*pair_.a, options);
    TransferResult result = sender.send_file(source);
    pair_.a->close();
    fake_receiver.join();

    EXPECT_TRUE(result.transfer_complete) << result.message;
    EXPECT_TRUE(result.checksum_verified);
    EXPECT_EQ(result.total_chunks, 3u);
    EXPECT_EQ(result.total_bytes, 3000u);
    EXPECT_EQ(result.file_path, "/received/minimal.bin");
    EXPECT_EQ(sender.state(), TransferState::COMPLETE);
}

TEST_F(ChunkProtocolTest, SenderFailsWhenReceiverNotReady) {
    std::string source = dir_.file("busy.bin");
    testing_util::write_file(source, testing_util::patterned_bytes(10));

    std::thread fake_receiver([this]() {
        recv_json(*pair_.b);
        send_json(*pair_.b, {{"status", "busy"}, {"transfer_id", ""}, {"message", "try later"}});
    });

    transfer::ChunkSender sender(*pair_.a, transfer::SenderOptions{});
    TransferResult result = sender.send_file(source);
    pair_.a->close();
    fake_receiver.join();

    EXPECT_FALSE(result.transfer_complete);
    EXPECT_EQ(result.error, "protocol_violation");
}

TEST_F(ChunkProtocolTest, SenderReportsMissingSourceFile) {
    transfer::ChunkSender sender(*pair_.a, transfer::SenderOptions{});
    TransferResult result = sender.send_file(dir_.file("does_not_exist.bin"));
    EXPECT_FALSE(result.transfer_complete);
    EXPECT_EQ(result.error, "io_error");
    EXPECT_EQ(sender.state(), TransferState::FAILED);
}

TEST_F(ChunkProtocolTest, CancelledSenderStopsBeforeFirstChunk) {
    std::string source = dir_.file("cancel.bin");
    testing_util::write_file(source, testing_util::patterned_bytes(4096));
    start_receiver();

    std::atomic<bool> cancel{true};
    transfer::ChunkSender sender(*pair_.a, transfer::SenderOptions{}, nullptr, &cancel);
    TransferResult result = sender.send_file(source);
    pair_.a->close();
    TransferResult received = join_receiver();

    EXPECT_FALSE(result.transfer_complete);
    EXPECT_NE(result.message.find("cancelled"), std::string::npos);
    EXPECT_FALSE(received.transfer_complete);
    EXPECT_FALSE(received_exists("cancel.bin"));
}

TEST(FileNameTest, OnlyPlainNamesAreAccepted) {
    EXPECT_TRUE(transfer::validate_file_name("test_file_10MB.bin").ok());
    EXPECT_TRUE(transfer::validate_file_name("..hidden").ok());
    EXPECT_FALSE(transfer::validate_file_name("").ok());
    EXPECT_FALSE(transfer::validate_file_name(".").ok());
    EXPECT_FALSE(transfer::validate_file_name("..").ok());
    EXPECT_FALSE(transfer::validate_file_name("../x").ok());
    EXPECT_FALSE(transfer::validate_file_name("/etc/passwd").ok());
    EXPECT_FALSE(transfer::validate_file_name("a\\b").ok());
    EXPECT_FALSE(transfer::validate_file_name(std::string("a\0b", 3)).ok());
}

TEST(TransferIdTest, IdsAreUnique) {
    std::string a = transfer::make_transfer_id();
    std::string b = transfer::make_transfer_id();
    EXPECT_EQ(a.rfind("transfer_", 0), 0u);
    EXPECT_NE(a, b);
}

TEST(SpeedTest, MegabitsPerSecondFromBytes) {
    EXPECT_DOUBLE_EQ(transfer::speed_mbps(1024 * 1024, 8.0), 1.0);
    EXPECT_DOUBLE_EQ(transfer::speed_mbps(1000, 0.0), 0.0);
    EXPECT_DOUBLE_EQ(transfer::round_speed(1.23456), 1.23);
}
