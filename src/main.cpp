#include <iostream>
#include <string>
#include <vector>
#include <csignal>
#include <stdexcept>
#include <limits>
#include <atomic>
#include <thread>
#include <chrono>
#include "config.hpp"
#include "checksum.hpp"
#include "file_generator.hpp"
#include "networking.hpp"
#include "progress.hpp"

namespace {

std::atomic<bool> g_interrupted{false};

void on_signal(int) {
    g_interrupted = true;
}

void print_usage() {
    std::cerr << "Usage:\n"
              << "  synergy serve [--config file] [--bind addr] [--port n] [--dir path]\n"
              << "  synergy send <host> <port> <file> [--chunk-size n]\n"
              << "  synergy send-generated <host> <port> <size_mb>\n"
              << "  synergy generate <path> <size_mb>\n"
              << "  synergy checksum <file>\n";
}

void print_result(const protocol::TransferResult& r) {
    nlohmann::json j = r;
    std::cout << j.dump(2) << "\n";
}

void print_progress(progress::ProgressChannel& channel) {
    for (const auto& snap : channel.drain()) {
        std::cout << "\r" << progress::format_snapshot(snap) << "    " << std::flush;
    }
}

constexpr uint64_t MAX_SIZE_MB = std::numeric_limits<uint64_t>::max() / (1024 * 1024);

unsigned short parse_port(const std::string& s) {
    return static_cast<unsigned short>(config::parse_number("port", s, std::numeric_limits<unsigned short>::max()));
}

uint64_t parse_size_mb(const std::string& s) {
    return config::parse_number("size_mb", s, MAX_SIZE_MB);
}

int run_serve(const config::Config& cfg) {
    networking::TransferServer server(cfg);
    if (!server.start()) {
        return 1;
    }
    std::cout << "Receiving into " << cfg.receive_dir << ". Press Ctrl+C to stop.\n";

    while (!g_interrupted) {
        auto result = server.wait_for_result(std::chrono::milliseconds(200));
        print_progress(server.progress());
        if (result) {
            std::cout << "\n";
            print_result(*result);
        }
    }
    server.stop();
    return 0;
}

int run_send(const config::Config& cfg, const std::string& host, unsigned short port, const std::string& path) {
    networking::TransferClient client(cfg);
    progress::ProgressChannel channel;
    protocol::TransferResult result;

    std::atomic<bool> done{false};

    std::thread worker([&]() {
        result = client.send_file(host, port, path, &channel, &g_interrupted);
        done = true;
    });
    while (!done) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        print_progress(channel);
    }
    worker.join();
    print_progress(channel);
    std::cout << "\n";
    print_result(result);
    return result.transfer_complete ? 0 : 1;
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    std::signal(SIGPIPE, SIG_IGN);

    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];
    config::Config cfg;
    std::vector<std::string> args;

    try {
        args = config::apply_args(cfg, std::vector<std::string>(argv + 2, argv + argc));
        std::string problem = cfg.validate();
        if (!problem.empty()) {
            std::cerr << "Invalid configuration: " << problem << "\n";
            return 1;
        }

        if (command == "serve") {
            return run_serve(cfg);
        } else if (command == "send" && args.size() >= 3) {
            return run_send(cfg, args[0], parse_port(args[1]), args[2]);
        } else if (command == "send-generated" && args.size() >= 3) {
            networking::TransferClient client(cfg);
            auto out = client.generate_and_send(args[0], parse_port(args[1]), parse_size_mb(args[2]));
            std::cout << "Generated " << out.file_path << " (" << progress::format_size(out.size_bytes)
                      << ") in " << progress::format_time(out.generation_time_seconds) << "\n";
            print_result(out.transfer);
            return out.transfer.transfer_complete ? 0 : 1;
        } else if (command == "generate" && args.size() >= 2) {
            generator::FileGenerator gen;
            auto file = gen.generate_mb(args[0], parse_size_mb(args[1]), [](uint64_t done, uint64_t total) {
                std::cout << "\rGenerating: " << progress::format_size(done) << " / "
                          << progress::format_size(total) << std::flush;
            });
            std::cout << "\n" << file.file_path << " " << file.checksum << " ("
                      << progress::format_time(file.generation_time_seconds) << ")\n";
            return 0;
        } else if (command == "checksum" && args.size() >= 1) {
            std::cout << integrity::file_checksum(args[0]) << "  " << args[0] << "\n";
            return 0;
        }
    } catch (std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    print_usage();
    return 1;
}
