#include "networking.hpp"
#include "transfer.hpp"
#include "file_generator.hpp"
#include <iostream>
#include <filesystem>

using boost::asio::ip::tcp;

namespace networking {

// ─── TransferServer ─────────────────────────────────────────────────────────

TransferServer::TransferServer(config::Config cfg) : cfg_(std::move(cfg)) {}

TransferServer::~TransferServer() {
    stop();
}

bool TransferServer::start(const std::string& bind_address, unsigned short port) {
    if (running_) {
        std::cerr << "TransferServer: already running\n";
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cfg_.bind_address = bind_address;
        cfg_.port = port;
    }
    return start();
}

bool TransferServer::start() {
    if (running_) {
        std::cerr << "TransferServer: already running\n";
        return false;
    }
    if (thread_.joinable()) {
        thread_.join();
    }

    try {
        tcp::endpoint endpoint(boost::asio::ip::make_address(cfg_.bind_address), cfg_.port);
        io_context_.restart();
        acceptor_ = std::make_unique<tcp::acceptor>(io_context_);
        acceptor_->open(endpoint.protocol());
        acceptor_->set_option(boost::asio::socket_base::reuse_address(true));
        acceptor_->bind(endpoint);
        acceptor_->listen(1);
        bound_port_ = acceptor_->local_endpoint().port();
    } catch (std::exception& e) {
        std::cerr << "Failed to start server: " << e.what() << "\n";
        acceptor_.reset();
        return false;
    }

    stop_requested_ = false;
    running_ = true;
    std::cout << "File transfer server started on " << cfg_.bind_address << ":" << bound_port_ << std::endl;

    thread_ = std::thread([this]() { accept_loop(); });
    return true;
}

void TransferServer::stop() {
    stop_requested_ = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_stream_) {
            // The connection thread owns the socket and closes it after the
            // receiver returns.
            active_stream_->shutdown();
        }
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    if (acceptor_) {
        boost::system::error_code ec;
        acceptor_->close(ec);
        acceptor_.reset();
        std::cout << "File transfer server stopped\n";
    }
    running_ = false;
}

ServerStatus TransferServer::get_status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ServerStatus status;
    status.running = running_;
    status.host = cfg_.bind_address;
    status.port = running_ ? bound_port_ : cfg_.port;
    status.transfers_handled = transfers_handled_;
    return status;
}

std::vector<protocol::TransferResult> TransferServer::poll_results() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<protocol::TransferResult> out(results_.begin(), results_.end());
    results_.clear();
    return out;
}

std::optional<protocol::TransferResult> TransferServer::wait_for_result(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!results_cv_.wait_for(lock, timeout, [this]() { return !results_.empty(); })) {
        return std::nullopt;
    }
    protocol::TransferResult result = results_.front();
    results_.pop_front();
    return result;
}

void TransferServer::accept_loop() {
    try {
        while (!stop_requested_) {
            tcp::socket socket(io_context_);
            bool done = false;
            boost::system::error_code accept_ec;

            acceptor_->async_accept(socket, [&done, &accept_ec](const boost::system::error_code& ec) {
                accept_ec = ec;
                done = true;
            });

            // Poll until connected or stopped
            while (!done && !stop_requested_) {
                io_context_.poll();
                io_context_.restart();
                if (!done) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(200));
                }
            }

            if (!done) {
                // Let the aborted handler run before `socket` goes out of scope.
                boost::system::error_code ec;
                acceptor_->cancel(ec);
                io_context_.restart();
                io_context_.run();
                break;
            }
            if (accept_ec) {
                std::cerr << "Socket error in server: " << accept_ec.message() << "\n";
                continue;
            }

            handle_connection(std::move(socket));
        }
    } catch (std::exception& e) {
        std::cerr << "TransferServer Exception: " << e.what() << "\n";
    }
    running_ = false;
}

void TransferServer::handle_connection(tcp::socket socket) {
    boost::system::error_code ec;
    auto remote = socket.remote_endpoint(ec);
    std::cout << "Client connected from " << (ec ? std::string("unknown") : remote.address().to_string()) << "\n";

    auto stream = std::make_shared<transport::TcpStream>(std::move(socket));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_stream_ = stream;
    }
    // stop() may have fired between accept and registration
    if (stop_requested_) {
        stream->shutdown();
    }

    transfer::ReceiverOptions options;
    options.receive_dir = cfg_.receive_dir;
    options.max_chunk_size = cfg_.max_chunk_size;
    options.progress_interval = cfg_.progress_interval_seconds();

    protocol::TransferResult result;
    {
        transfer::ChunkReceiver receiver(*stream, options, &progress_, &stop_requested_);
        result = receiver.receive_file();
    }
    stream->close();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_stream_.reset();
        results_.push_back(result);
        ++transfers_handled_;
    }
    results_cv_.notify_all();
}

// ─── TransferClient ─────────────────────────────────────────────────────────

TransferClient::TransferClient(config::Config cfg) : cfg_(std::move(cfg)) {}

std::unique_ptr<transport::TcpStream> TransferClient::connect(const std::string& host, unsigned short port,
                                                              std::string& error) {
    io_context_.restart();
    tcp::resolver resolver(io_context_);
    boost::system::error_code ec;
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        error = "resolve " + host + ": " + ec.message();
        return nullptr;
    }

    tcp::socket socket(io_context_);
    boost::system::error_code connect_ec = boost::asio::error::would_block;
    boost::asio::async_connect(socket, endpoints,
                               [&connect_ec](const boost::system::error_code& e, const tcp::endpoint&) {
                                   connect_ec = e;
                               });
    io_context_.run_for(std::chrono::milliseconds(cfg_.connect_timeout_ms));

    if (connect_ec == boost::asio::error::would_block) {
        socket.close(ec);
        io_context_.restart();
        io_context_.run();
        error = "connection to " + host + ":" + std::to_string(port) + " timed out";
        return nullptr;
    }
    if (connect_ec) {
        error = "connect " + host + ":" + std::to_string(port) + ": " + connect_ec.message();
        return nullptr;
    }
    return std::make_unique<transport::TcpStream>(std::move(socket));
}

protocol::TransferResult TransferClient::send_file(const std::string& host, unsigned short port,
                                                   const std::string& filepath,
                                                   progress::ProgressChannel* progress,
                                                   const std::atomic<bool>* cancel_flag) {
    try {
        std::string error;
        auto stream = connect(host, port, error);
        if (!stream) {
            std::cerr << "TransferClient: " << error << "\n";
            return protocol::TransferResult::failed(
                transfer::Status::failure(transfer::ErrorKind::CONNECTION_LOST, error));
        }
        std::cout << "Connected to " << host << ":" << port << " for file transfer\n";

        transfer::SenderOptions options;
        options.chunk_size = cfg_.chunk_size;
        options.progress_interval = cfg_.progress_interval_seconds();

        transfer::ChunkSender sender(*stream, options, progress, cancel_flag);
        protocol::TransferResult result = sender.send_file(filepath);
        stream->close();
        return result;
    } catch (std::exception& e) {
        std::cerr << "TransferClient Exception: " << e.what() << "\n";
        return protocol::TransferResult::failed(transfer::Status::failure(transfer::ErrorKind::IO, e.what()));
    }
}

GenerateAndSendResult TransferClient::generate_and_send(const std::string& host, unsigned short port,
                                                        uint64_t size_mb, progress::ProgressChannel* progress) {
    GenerateAndSendResult out;
    out.target_host = host;
    out.target_port = port;

    std::string name = "test_file_" + std::to_string(size_mb) + "MB.bin";
    std::string path = (std::filesystem::path(cfg_.generated_dir) / name).string();

    try {
        std::cout << "Generating " << size_mb << "MB file for transfer\n";
        generator::FileGenerator gen;
        generator::GeneratedFile file = gen.generate_mb(path, size_mb);
        out.file_path = file.file_path;
        out.size_bytes = file.size_bytes;
        out.checksum = file.checksum;
        out.generation_time_seconds = file.generation_time_seconds;
    } catch (std::exception& e) {
        std::cerr << "Error in generate and send: " << e.what() << "\n";
        out.transfer = protocol::TransferResult::failed(
            transfer::Status::failure(transfer::ErrorKind::IO, std::string("generation failed: ") + e.what()));
        return out;
    }

    std::cout << "Sending file to " << host << ":" << port << "\n";
    out.transfer = send_file(host, port, path, progress);
    return out;
}

} // namespace networking
