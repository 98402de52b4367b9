#include <gtest/gtest.h>
#include <chrono>
#include <thread>
#include "protocol/frame.hpp"
#include "test_util.hpp"

using testing_util::make_stream_pair;
using transfer::ErrorKind;

TEST(FrameTest, LengthPrefixIsBigEndian) {
    auto prefix = protocol::serialize_length(0x01020304);
    EXPECT_EQ(prefix[0], 0x01);
    EXPECT_EQ(prefix[1], 0x02);
    EXPECT_EQ(prefix[2], 0x03);
    EXPECT_EQ(prefix[3], 0x04);
    EXPECT_EQ(protocol::deserialize_length(prefix), 0x01020304u);
}

TEST(FrameTest, EncodedFrameCarriesPayloadLength) {
    auto frame = protocol::encode_frame(nlohmann::json{{"a", 1}});
    std::string body = R"({"a":1})";
    ASSERT_EQ(frame.size(), 4 + body.size());
    EXPECT_EQ(frame[0], 0);
    EXPECT_EQ(frame[1], 0);
    EXPECT_EQ(frame[2], 0);
    EXPECT_EQ(frame[3], body.size());
    EXPECT_EQ(std::string(frame.begin() + 4, frame.end()), body);
}

TEST(FrameTest, RoundTripReconstructsPayload) {
    auto pair = make_stream_pair();
    std::vector<nlohmann::json> payloads = {
        nlohmann::json::object(),
        {{"status", "ready"}, {"transfer_id", "transfer_1"}},
        {{"name", "résumé 日本.bin"}, {"size", 123456789012ULL}},
        {{"list", {1, 2, 3}}, {"nested", {{"deep", true}}}},
    };

    for (const auto& p : payloads) {
        ASSERT_TRUE(protocol::send_message(*pair.a, p).ok());
    }
    for (const auto& p : payloads) {
        nlohmann::json got;
        ASSERT_TRUE(protocol::receive_message(*pair.b, got).ok());
        EXPECT_EQ(got, p);
    }
}

TEST(FrameTest, LargeFrameSurvivesPartialReads) {
    auto pair = make_stream_pair();
    nlohmann::json big = {{"blob", std::string(3 * 1024 * 1024, 'x')}};

    std::thread writer([&]() { EXPECT_TRUE(protocol::send_message(*pair.a, big).ok()); });
    nlohmann::json got;
    transfer::Status status = protocol::receive_message(*pair.b, got);
    writer.join();

    ASSERT_TRUE(status.ok()) << status.message;
    EXPECT_EQ(got, big);
}

TEST(FrameTest, EofBeforeFrameIsConnectionLoss) {
    auto pair = make_stream_pair();
    pair.a->close();

    nlohmann::json got;
    transfer::Status status = protocol::receive_message(*pair.b, got);
    EXPECT_EQ(status.kind, ErrorKind::CONNECTION_LOST);
}

TEST(FrameTest, EofMidFrameIsFramingError) {
    auto pair = make_stream_pair();
    auto prefix = protocol::serialize_length(100);
    ASSERT_TRUE(pair.a->write_all(prefix.data(), prefix.size()).ok());
    std::string partial = R"({"chunk_id":)";
    ASSERT_TRUE(pair.a->write_all(reinterpret_cast<const uint8_t*>(partial.data()), partial.size()).ok());
    pair.a->close();

    nlohmann::json got;
    transfer::Status status = protocol::receive_message(*pair.b, got);
    EXPECT_EQ(status.kind, ErrorKind::FRAMING);
}

TEST(FrameTest, InvalidJsonIsFramingError) {
    auto pair = make_stream_pair();
    std::string body = R"({"invalid": json})";
    auto prefix = protocol::serialize_length(static_cast<uint32_t>(body.size()));
    ASSERT_TRUE(pair.a->write_all(prefix.data(), prefix.size()).ok());
    ASSERT_TRUE(pair.a->write_all(reinterpret_cast<const uint8_t*>(body.data()), body.size()).ok());

    nlohmann::json got;
    EXPECT_EQ(protocol::receive_message(*pair.b, got).kind, ErrorKind::FRAMING);
}

TEST(FrameTest, ZeroLengthFrameIsFramingError) {
    auto pair = make_stream_pair();
    auto prefix = protocol::serialize_length(0);
    ASSERT_TRUE(pair.a->write_all(prefix.data(), prefix.size()).ok());

    nlohmann::json got;
    EXPECT_EQ(protocol::receive_message(*pair.b, got).kind, ErrorKind::FRAMING);
}

TEST(FrameTest, LengthAboveLimitIsRejectedBeforeReadingBody) {
    auto pair = make_stream_pair();
    auto prefix = protocol::serialize_length(0xFFFFFFF0u);
    ASSERT_TRUE(pair.a->write_all(prefix.data(), prefix.size()).ok());

    nlohmann::json got;
    transfer::Status status = protocol::receive_message(*pair.b, got, 1024);
    EXPECT_EQ(status.kind, ErrorKind::FRAMING);
    EXPECT_NE(status.message.find("exceeds limit"), std::string::npos);
}

TEST(FrameTest, SendOnClosedStreamFails) {
    auto pair = make_stream_pair();
    pair.a->close();
    transfer::Status status = protocol::send_message(*pair.a, {{"x", 1}});
    EXPECT_FALSE(status.ok());
}

TEST(StreamTest, ShutdownFromAnotherThreadWakesBlockedReader) {
    auto pair = make_stream_pair();
    transfer::Status status;
    std::thread reader([&]() {
        nlohmann::json got;
        status = protocol::receive_message(*pair.b, got);
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    pair.b->shutdown();
    reader.join();

    EXPECT_EQ(status.kind, ErrorKind::CONNECTION_LOST);
    EXPECT_FALSE(pair.b->is_open());
    pair.b->close();
    pair.b->close();
}
