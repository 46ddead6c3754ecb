#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <boost/asio.hpp>

namespace networking {

// Called before each retry with the failed attempt number (1-based) and the error text
using RetryCallback = std::function<void(int, const std::string&)>;

std::string get_local_ip(boost::asio::io_context& io_context);

std::string format_size(uint64_t bytes);

// Sleep for `duration`, waking every `tick` to check `cancel_flag`.
// Throws errors::CancelledError when the flag is raised.
void sleep_cancellable(std::chrono::milliseconds duration, std::chrono::milliseconds tick,
                       const std::atomic<bool>* cancel_flag);

// Blocking TCP stream on top of asynchronous Boost.Asio operations. Every call
// takes a deadline and polls the cancel flag once per tick while it waits.
// Timeouts and disconnects raise errors::NetworkError, cancellation raises
// errors::CancelledError; either leaves the connection closed.
class Connection {
public:
    Connection(boost::asio::io_context& io_context, std::chrono::milliseconds tick);

    boost::asio::ip::tcp::socket& socket() { return socket_; }

    void connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout,
                 const std::atomic<bool>* cancel_flag);

    void write_all(const void* data, size_t size, std::chrono::milliseconds timeout,
                   const std::atomic<bool>* cancel_flag);

    void read_exact(void* data, size_t size, std::chrono::milliseconds timeout,
                    const std::atomic<bool>* cancel_flag);

    // Reads through the next '\n' (bounded by MAX_METADATA_SIZE) and returns the
    // line without it. Bytes already read past the terminator are kept for read_exact.
    std::string read_line(std::chrono::milliseconds timeout, const std::atomic<bool>* cancel_flag);

    std::string remote_address() const;
    bool is_open() const { return socket_.is_open(); }
    void close();

private:
    void run(std::chrono::milliseconds timeout, const std::atomic<bool>* cancel_flag, const std::string& what);

    boost::asio::io_context& io_context_;
    boost::asio::ip::tcp::socket socket_;
    boost::asio::streambuf inbound_;
    std::chrono::milliseconds tick_;
};

// Connect with a fixed number of attempts and a fixed backoff between them
void connect_with_retry(Connection& connection, const std::string& host, uint16_t port,
                        int attempts, std::chrono::milliseconds backoff,
                        std::chrono::milliseconds timeout, std::chrono::milliseconds tick,
                        const std::atomic<bool>* cancel_flag, const RetryCallback& on_retry);

// Single-use listening socket
class Listener {
public:
    Listener(boost::asio::io_context& io_context, std::chrono::milliseconds tick);
    ~Listener();

    // Bind 0.0.0.0:port (SO_REUSEADDR) and listen, retrying with a fixed backoff.
    // Returns the bound port. Throws errors::NetworkError once attempts are exhausted.
    uint16_t bind(uint16_t port, int attempts, std::chrono::milliseconds backoff,
                  const std::atomic<bool>* cancel_flag, const RetryCallback& on_retry);

    // Accept exactly one peer into `connection`
    void accept(Connection& connection, std::chrono::milliseconds timeout,
                const std::atomic<bool>* cancel_flag);

    void close();

private:
    boost::asio::io_context& io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::chrono::milliseconds tick_;
};

} // namespace networking
