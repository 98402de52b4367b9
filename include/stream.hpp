#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <boost/asio.hpp>
#include "protocol/status.hpp"

namespace transport {

// Connected, blocking, bidirectional byte stream. This is the only thing the
// framing and chunk protocol layers know about the transport.
class ByteStream {
public:
    virtual ~ByteStream() = default;

    // Returns 0 with ec set on EOF or failure.
    virtual size_t read_some(uint8_t* data, size_t size, boost::system::error_code& ec) = 0;
    virtual size_t write_some(const uint8_t* data, size_t size, boost::system::error_code& ec) = 0;

    // Shuts down both directions without releasing the socket. Safe to call
    // from a thread other than the one blocked in read_some(), which then
    // returns with an error.
    virtual void shutdown() = 0;
    // Shuts down and releases the socket. Only from the owning thread, once no
    // other thread is using the stream.
    virtual void close() = 0;
    virtual bool is_open() const = 0;

    transfer::Status read_exact(uint8_t* data, size_t size);
    transfer::Status write_all(const uint8_t* data, size_t size);
};

transfer::Status classify_error(const boost::system::error_code& ec, const char* what);

template <typename Socket>
class SocketStream : public ByteStream {
public:
    explicit SocketStream(Socket socket) : socket_(std::move(socket)) {}
    ~SocketStream() override { close(); }

    size_t read_some(uint8_t* data, size_t size, boost::system::error_code& ec) override {
        return socket_.read_some(boost::asio::buffer(data, size), ec);
    }

    size_t write_some(const uint8_t* data, size_t size, boost::system::error_code& ec) override {
        return socket_.write_some(boost::asio::buffer(data, size), ec);
    }

    void shutdown() override {
        std::lock_guard<std::mutex> lock(close_mutex_);
        if (closed_ || shut_down_) return;
        shut_down_ = true;
        boost::system::error_code ec;
        socket_.shutdown(boost::asio::socket_base::shutdown_both, ec);
    }

    void close() override {
        std::lock_guard<std::mutex> lock(close_mutex_);
        if (closed_) return;
        closed_ = true;
        boost::system::error_code ec;
        if (!shut_down_) {
            socket_.shutdown(boost::asio::socket_base::shutdown_both, ec);
        }
        socket_.close(ec);
    }

    bool is_open() const override {
        std::lock_guard<std::mutex> lock(close_mutex_);
        return !closed_ && !shut_down_ && socket_.is_open();
    }

    Socket& socket() { return socket_; }

private:
    Socket socket_;
    mutable std::mutex close_mutex_;
    bool closed_ = false;
    bool shut_down_ = false;
};

using TcpStream = SocketStream<boost::asio::ip::tcp::socket>;
using LocalStream = SocketStream<boost::asio::local::stream_protocol::socket>;

} // namespace transport
