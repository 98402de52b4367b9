#include "control_channel.hpp"
#include "protocol/frame.hpp"
#include <iostream>

namespace networking {

ControlChannel::ControlChannel(std::unique_ptr<transport::ByteStream> stream) : stream_(std::move(stream)) {}

ControlChannel::~ControlChannel() {
    close();
}

void ControlChannel::start() {
    if (running_) return;
    running_ = true;
    connected_ = true;
    listener_thread_ = std::thread([this]() { listener_loop(); });
    sender_thread_ = std::thread([this]() { sender_loop(); });
}

void ControlChannel::close() {
    running_ = false;
    connected_ = false;
    if (stream_) {
        stream_->shutdown();
    }
    outgoing_cv_.notify_all();
    inbox_cv_.notify_all();
    if (listener_thread_.joinable()) listener_thread_.join();
    if (sender_thread_.joinable()) sender_thread_.join();
    if (stream_) {
        stream_->close();
    }
}

bool ControlChannel::send(const protocol::ControlMessage& message) {
    if (!connected_) {
        std::cerr << "Cannot send message: not connected\n";
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(outgoing_mutex_);
        outgoing_.push_back(message);
    }
    outgoing_cv_.notify_one();
    return true;
}

std::vector<protocol::ControlMessage> ControlChannel::poll() {
    std::lock_guard<std::mutex> lock(inbox_mutex_);
    std::vector<protocol::ControlMessage> out(inbox_.begin(), inbox_.end());
    inbox_.clear();
    return out;
}

std::optional<protocol::ControlMessage> ControlChannel::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(inbox_mutex_);
    inbox_cv_.wait_for(lock, timeout, [this]() { return !inbox_.empty() || !connected_; });
    if (inbox_.empty()) return std::nullopt;
    protocol::ControlMessage m = inbox_.front();
    inbox_.pop_front();
    return m;
}

size_t ControlChannel::outgoing_size() const {
    std::lock_guard<std::mutex> lock(outgoing_mutex_);
    return outgoing_.size();
}

size_t ControlChannel::inbox_size() const {
    std::lock_guard<std::mutex> lock(inbox_mutex_);
    return inbox_.size();
}

void ControlChannel::listener_loop() {
    while (running_) {
        nlohmann::json frame;
        transfer::Status status = protocol::receive_message(*stream_, frame, protocol::CONTROL_MAX_FRAME);
        if (!status.ok()) {
            if (running_) {
                std::cerr << "Error reading message: " << status.message << "\n";
            }
            break;
        }

        if (!protocol::validate_message(frame)) {
            std::cerr << "Invalid message format received\n";
            continue;
        }

        protocol::ControlMessage message;
        try {
            message = frame.get<protocol::ControlMessage>();
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "Error processing received message: " << e.what() << "\n";
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(inbox_mutex_);
            inbox_.push_back(std::move(message));
        }
        inbox_cv_.notify_all();
    }
    handle_disconnection();
}

void ControlChannel::sender_loop() {
    while (running_ && connected_) {
        protocol::ControlMessage message;
        {
            std::unique_lock<std::mutex> lock(outgoing_mutex_);
            // Bounded wait so a shutdown is noticed even with an empty queue.
            outgoing_cv_.wait_for(lock, std::chrono::seconds(1),
                                  [this]() { return !outgoing_.empty() || !running_ || !connected_; });
            if (outgoing_.empty()) continue;
            message = std::move(outgoing_.front());
            outgoing_.pop_front();
        }

        transfer::Status status = protocol::send_message(*stream_, message);
        if (!status.ok()) {
            if (running_) {
                std::cerr << "Error sending message: " << status.message << "\n";
            }
            break;
        }
    }
    handle_disconnection();
}

void ControlChannel::handle_disconnection() {
    bool was_connected = connected_.exchange(false);
    if (was_connected && running_) {
        std::cout << "Control connection lost\n";
    }
    // Unblocks whichever loop is still waiting on the stream.
    stream_->shutdown();
    outgoing_cv_.notify_all();
    inbox_cv_.notify_all();
}

} // namespace networking
