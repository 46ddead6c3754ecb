#include "networking.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <algorithm>
#include <cstdio>
#include <thread>

using boost::asio::ip::tcp;

namespace networking {

namespace {

// Drive io_context until the pending operation completes. On cancel or deadline,
// `abort` closes the socket/acceptor so the handler fires with operation_aborted.
void run_until_done(boost::asio::io_context& io_context, std::chrono::milliseconds timeout,
                    std::chrono::milliseconds tick, const std::atomic<bool>* cancel_flag,
                    const std::function<void()>& abort, const std::string& what) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    io_context.restart();

    while (true) {
        auto remaining = deadline - std::chrono::steady_clock::now();
        if (remaining > std::chrono::steady_clock::duration::zero()) {
            io_context.run_for(std::min<std::chrono::steady_clock::duration>(tick, remaining));
        }
        if (io_context.stopped()) return;

        if (cancel_flag && cancel_flag->load()) {
            abort();
            io_context.run();
            throw errors::CancelledError();
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            abort();
            io_context.run();
            throw errors::NetworkError(what + " timed out after " + std::to_string(timeout.count()) + "ms");
        }
    }
}

std::string describe(const boost::system::error_code& ec) {
    if (ec == boost::asio::error::eof || ec == boost::asio::error::connection_reset ||
        ec == boost::asio::error::broken_pipe) {
        return "Connection closed unexpectedly";
    }
    return ec.message();
}

} // namespace

std::string get_local_ip(boost::asio::io_context& io_context) {
    try {
        boost::asio::ip::udp::socket socket(io_context);
        socket.connect(boost::asio::ip::udp::endpoint(boost::asio::ip::make_address("8.8.8.8"), 53));
        return socket.local_endpoint().address().to_string();
    } catch (const boost::system::system_error&) {
        return "127.0.0.1";
    }
}

std::string format_size(uint64_t bytes) {
    double size = bytes;
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int i = 0;
    while (size >= 1024 && i < 4) {
        size /= 1024;
        i++;
    }
    char buf[32];
    snprintf(buf, sizeof(buf), "%.1f%s", size, units[i]);
    return std::string(buf);
}

void sleep_cancellable(std::chrono::milliseconds duration, std::chrono::milliseconds tick,
                       const std::atomic<bool>* cancel_flag) {
    const auto deadline = std::chrono::steady_clock::now() + duration;
    while (true) {
        if (cancel_flag && cancel_flag->load()) {
            throw errors::CancelledError();
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return;
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(tick, deadline - now));
    }
}

// ─── Connection ─────────────────────────────────────────────────────────────

Connection::Connection(boost::asio::io_context& io_context, std::chrono::milliseconds tick)
    : io_context_(io_context), socket_(io_context), inbound_(config::MAX_METADATA_SIZE), tick_(tick) {}

void Connection::run(std::chrono::milliseconds timeout, const std::atomic<bool>* cancel_flag,
                     const std::string& what) {
    run_until_done(io_context_, timeout, tick_, cancel_flag, [this] { close(); }, what);
}

void Connection::connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout,
                         const std::atomic<bool>* cancel_flag) {
    tcp::resolver resolver(io_context_);
    boost::system::error_code ec;
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        throw errors::NetworkError("Could not resolve " + host + ": " + ec.message());
    }

    boost::system::error_code result = boost::asio::error::would_block;
    boost::asio::async_connect(socket_, endpoints,
        [&result](const boost::system::error_code& error, const tcp::endpoint&) {
            result = error;
        });
    run(timeout, cancel_flag, "Connect to " + host + ":" + std::to_string(port));

    if (result) {
        close();
        throw errors::NetworkError("Connect to " + host + ":" + std::to_string(port) + " failed: " + result.message());
    }
}

void Connection::write_all(const void* data, size_t size, std::chrono::milliseconds timeout,
                           const std::atomic<bool>* cancel_flag) {
    boost::system::error_code result = boost::asio::error::would_block;
    boost::asio::async_write(socket_, boost::asio::buffer(data, size),
        [&result](const boost::system::error_code& error, size_t) {
            result = error;
        });
    run(timeout, cancel_flag, "Write");

    if (result) {
        close();
        throw errors::NetworkError("Write failed: " + describe(result));
    }
}

void Connection::read_exact(void* data, size_t size, std::chrono::milliseconds timeout,
                            const std::atomic<bool>* cancel_flag) {
    auto* out = static_cast<uint8_t*>(data);

    // Drain bytes left over from read_line first
    const size_t buffered = std::min(size, inbound_.size());
    if (buffered > 0) {
        boost::asio::buffer_copy(boost::asio::buffer(out, buffered), inbound_.data());
        inbound_.consume(buffered);
    }
    if (buffered == size) return;

    boost::system::error_code result = boost::asio::error::would_block;
    boost::asio::async_read(socket_, boost::asio::buffer(out + buffered, size - buffered),
        [&result](const boost::system::error_code& error, size_t) {
            result = error;
        });
    run(timeout, cancel_flag, "Read");

    if (result) {
        close();
        throw errors::NetworkError("Read failed: " + describe(result));
    }
}

std::string Connection::read_line(std::chrono::milliseconds timeout, const std::atomic<bool>* cancel_flag) {
    boost::system::error_code result = boost::asio::error::would_block;
    size_t length = 0;
    boost::asio::async_read_until(socket_, inbound_, '\n',
        [&result, &length](const boost::system::error_code& error, size_t n) {
            result = error;
            length = n;
        });
    run(timeout, cancel_flag, "Metadata read");

    if (result == boost::asio::error::not_found) {
        close();
        throw errors::NetworkError("Metadata record exceeds " + std::to_string(config::MAX_METADATA_SIZE) + " bytes");
    }
    if (result) {
        close();
        throw errors::NetworkError("Metadata read failed: " + describe(result));
    }

    auto begin = boost::asio::buffers_begin(inbound_.data());
    std::string line(begin, begin + static_cast<std::ptrdiff_t>(length - 1));
    inbound_.consume(length);
    return line;
}

std::string Connection::remote_address() const {
    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    if (ec) return "unknown";
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

void Connection::close() {
    boost::system::error_code ignored;
    if (socket_.is_open()) {
        socket_.shutdown(tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
    }
}

void connect_with_retry(Connection& connection, const std::string& host, uint16_t port,
                        int attempts, std::chrono::milliseconds backoff,
                        std::chrono::milliseconds timeout, std::chrono::milliseconds tick,
                        const std::atomic<bool>* cancel_flag, const RetryCallback& on_retry) {
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        try {
            connection.connect(host, port, timeout, cancel_flag);
            return;
        } catch (const errors::NetworkError& e) {
            if (attempt == attempts) {
                throw errors::NetworkError("Failed to connect after " + std::to_string(attempts) +
                                           " attempts: " + e.what());
            }
            logging::get()->warn("Connection attempt {} to {}:{} failed: {}", attempt, host, port, e.what());
            if (on_retry) on_retry(attempt, e.what());
            sleep_cancellable(backoff, tick, cancel_flag);
        }
    }
}

// ─── Listener ───────────────────────────────────────────────────────────────

Listener::Listener(boost::asio::io_context& io_context, std::chrono::milliseconds tick)
    : io_context_(io_context), acceptor_(io_context), tick_(tick) {}

Listener::~Listener() {
    close();
}

uint16_t Listener::bind(uint16_t port, int attempts, std::chrono::milliseconds backoff,
                        const std::atomic<bool>* cancel_flag, const RetryCallback& on_retry) {
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        try {
            acceptor_.open(tcp::v4());
            acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
            acceptor_.bind(tcp::endpoint(tcp::v4(), port));
            acceptor_.listen(1);
            return acceptor_.local_endpoint().port();
        } catch (const boost::system::system_error& e) {
            close();
            if (attempt == attempts) {
                throw errors::NetworkError("Failed to bind socket after " + std::to_string(attempts) +
                                           " attempts: " + e.what());
            }
            logging::get()->warn("Bind attempt {} on port {} failed: {}", attempt, port, e.what());
            if (on_retry) on_retry(attempt, e.what());
            sleep_cancellable(backoff, tick_, cancel_flag);
        }
    }
    throw errors::NetworkError("Failed to bind socket: no attempts configured");
}

void Listener::accept(Connection& connection, std::chrono::milliseconds timeout,
                      const std::atomic<bool>* cancel_flag) {
    boost::system::error_code result = boost::asio::error::would_block;
    acceptor_.async_accept(connection.socket(), [&result](const boost::system::error_code& error) {
        result = error;
    });
    run_until_done(io_context_, timeout, tick_, cancel_flag, [this] { close(); }, "Waiting for sender");

    if (result) {
        throw errors::NetworkError("Accept failed: " + result.message());
    }
}

void Listener::close() {
    boost::system::error_code ignored;
    if (acceptor_.is_open()) {
        acceptor_.close(ignored);
    }
}

} // namespace networking
