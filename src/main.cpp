#include <chrono>
#include <cstdint>
#include <future>
#include <iostream>
#include <mutex>
#include <string>
#include "config.hpp"
#include "engine.hpp"
#include "errors.hpp"
#include "log.hpp"

namespace {

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <file> <save_dir> --password <password>\n"
              << "       [--port N] [--host H] [--log-level trace|debug|info|warn|error] [--log-file PATH]\n"
              << "\n"
              << "Runs a sender and a receiver in one process: the file is compressed when\n"
              << "large, encrypted, and delivered to <save_dir> through a rendezvous code.\n";
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 2;
    }

    std::string file_path = argv[1];
    std::string save_dir = argv[2];
    std::string password;
    std::string log_file;
    spdlog::level::level_enum log_level = spdlog::level::warn;
    config::Options options;

    for (int i = 3; i < argc; ++i) {
        std::string arg = argv[i];
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << "\n";
            return 2;
        }
        std::string value = argv[++i];
        try {
            if (arg == "--password") {
                password = value;
            } else if (arg == "--port") {
                options.port = static_cast<uint16_t>(std::stoul(value));
            } else if (arg == "--host") {
                options.connect_host = value;
            } else if (arg == "--log-level") {
                log_level = spdlog::level::from_str(value);
            } else if (arg == "--log-file") {
                log_file = value;
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                print_usage(argv[0]);
                return 2;
            }
        } catch (const std::logic_error&) {
            std::cerr << "Invalid value for " << arg << ": " << value << "\n";
            return 2;
        }
    }
    if (password.empty()) {
        std::cerr << "A password is required (--password)\n";
        return 2;
    }

    try {
        logging::init(log_level, log_file);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Cannot set up logging: " << e.what() << "\n";
        return 2;
    }

    std::mutex out_mutex;
    auto printer = [&out_mutex](const char* side) {
        return [&out_mutex, side](const events::TransferEvent& event) {
            std::lock_guard<std::mutex> lock(out_mutex);
            switch (event.kind) {
                case events::EventKind::CodeIssued:
                    std::cout << "┌──────────────────────────┐\n";
                    std::cout << "│  Transfer Code: " << event.code << "   │\n";
                    std::cout << "└──────────────────────────┘\n";
                    break;
                case events::EventKind::Progress:
                    std::cout << "\r[" << side << "] Progress: " << event.percent << "%" << std::flush;
                    if (event.percent == 100) std::cout << "\n";
                    break;
                case events::EventKind::StatusChanged:
                    std::cout << "[" << side << "] " << event.message << "\n";
                    break;
                case events::EventKind::Error:
                    std::cerr << "\n[" << side << "] Error: " << event.message << "\n";
                    break;
            }
        };
    };

    // Declared ahead of the engine so they outlive its worker threads
    std::promise<std::string> code_promise;
    std::future<std::string> code_future = code_promise.get_future();
    bool code_published = false;     // touched only on the sender's worker thread
    auto send_printer = printer("send");

    try {
        transfer::Engine engine(options);

        std::string send_id = engine.send(file_path, password,
            [&code_promise, &code_published, send_printer](const events::TransferEvent& event) {
                send_printer(event);
                if (code_published) return;
                if (event.kind == events::EventKind::CodeIssued) {
                    code_published = true;
                    code_promise.set_value(event.code);
                } else if (event.kind == events::EventKind::Error) {
                    // Sender failed before a code existed; the receiver never starts
                    code_published = true;
                    code_promise.set_value("");
                }
            });

        std::string code = code_future.get();
        if (code.empty()) {
            engine.wait(send_id, std::chrono::seconds(5));
            return 1;
        }

        transfer::ReceiveHandle handle = engine.receive(save_dir, password, code, printer("receive"));

        auto received = engine.wait(handle.transfer_id(), std::chrono::hours(24));
        auto sent = engine.wait(send_id, std::chrono::minutes(1));

        if (received && received->status == session::TransferStatus::Completed) {
            std::cout << "Saved to: " << received->file_path << "\n";
            return 0;
        }
        if (sent && sent->status == session::TransferStatus::Failed) {
            std::cerr << "Send failed: " << sent->error_message << "\n";
        }
        return 1;
    } catch (const errors::TransferError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << "\n";
        return 1;
    }
}
