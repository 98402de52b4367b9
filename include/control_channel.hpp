#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>
#include "stream.hpp"
#include "protocol/control.hpp"

namespace networking {

// Framed control-message link over one connected stream. One thread reads
// incoming frames, one drains the outgoing queue.
class ControlChannel {
public:
    explicit ControlChannel(std::unique_ptr<transport::ByteStream> stream);
    ~ControlChannel();

    ControlChannel(const ControlChannel&) = delete;
    ControlChannel& operator=(const ControlChannel&) = delete;

    void start();
    void close();

    // Queues a message. False when the link is down.
    bool send(const protocol::ControlMessage& message);

    std::vector<protocol::ControlMessage> poll();
    std::optional<protocol::ControlMessage> wait_for(std::chrono::milliseconds timeout);

    bool is_connected() const { return connected_; }
    size_t outgoing_size() const;
    size_t inbox_size() const;

private:
    void listener_loop();
    void sender_loop();
    void handle_disconnection();

    std::unique_ptr<transport::ByteStream> stream_;
    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::thread listener_thread_;
    std::thread sender_thread_;

    mutable std::mutex outgoing_mutex_;
    std::condition_variable outgoing_cv_;
    std::deque<protocol::ControlMessage> outgoing_;

    mutable std::mutex inbox_mutex_;
    std::condition_variable inbox_cv_;
    std::deque<protocol::ControlMessage> inbox_;
};

} // namespace networking
