#pragma once

#include <string>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <thread>
#include <atomic>
#include <chrono>
#include <vector>
#include <boost/asio.hpp>
#include "config.hpp"
#include "stream.hpp"
#include "progress.hpp"
#include "protocol/messages.hpp"

namespace networking {

struct ServerStatus {
    bool running = false;
    std::string host;
    unsigned short port = 0;
    uint64_t transfers_handled = 0;
};

// Owns the listening socket and receives one transfer per accepted
// connection, strictly one connection at a time.
class TransferServer {
public:
    explicit TransferServer(config::Config cfg = {});
    ~TransferServer();

    TransferServer(const TransferServer&) = delete;
    TransferServer& operator=(const TransferServer&) = delete;

    // Binds and starts the accept loop. Returns false (and logs) when the
    // socket cannot be opened or the server is already running.
    bool start();
    bool start(const std::string& bind_address, unsigned short port);

    // Stops accepting and aborts an in-flight transfer by closing its stream.
    void stop();

    ServerStatus get_status() const;

    // Finished transfers, oldest first.
    std::vector<protocol::TransferResult> poll_results();
    std::optional<protocol::TransferResult> wait_for_result(std::chrono::milliseconds timeout);

    progress::ProgressChannel& progress() { return progress_; }

private:
    void accept_loop();
    void handle_connection(boost::asio::ip::tcp::socket socket);

    config::Config cfg_;
    boost::asio::io_context io_context_;
    std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    unsigned short bound_port_ = 0;

    mutable std::mutex mutex_;
    std::condition_variable results_cv_;
    std::deque<protocol::TransferResult> results_;
    std::shared_ptr<transport::TcpStream> active_stream_;
    uint64_t transfers_handled_ = 0;

    progress::ProgressChannel progress_;
};

struct GenerateAndSendResult {
    std::string file_path;
    uint64_t size_bytes = 0;
    std::string checksum;
    double generation_time_seconds = 0.0;
    std::string target_host;
    unsigned short target_port = 0;
    protocol::TransferResult transfer;
};

class TransferClient {
public:
    explicit TransferClient(config::Config cfg = {});

    TransferClient(const TransferClient&) = delete;
    TransferClient& operator=(const TransferClient&) = delete;

    // Connects, sends one file and returns the merged result. Never throws.
    protocol::TransferResult send_file(const std::string& host, unsigned short port,
                                       const std::string& filepath,
                                       progress::ProgressChannel* progress = nullptr,
                                       const std::atomic<bool>* cancel_flag = nullptr);

    // Generates a synthetic file under generated_dir, then sends it.
    GenerateAndSendResult generate_and_send(const std::string& host, unsigned short port, uint64_t size_mb,
                                            progress::ProgressChannel* progress = nullptr);

private:
    // The returned stream's socket lives on io_context_ and must not outlive
    // this client.
    std::unique_ptr<transport::TcpStream> connect(const std::string& host, unsigned short port,
                                                  std::string& error);

    config::Config cfg_;
    boost::asio::io_context io_context_;
};

} // namespace networking
