#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace session {

enum class SessionStatus {
    Waiting,
    Connected,
    Completed,
    Failed,
    Cancelled,
    Expired
};

const char* to_string(SessionStatus status);

struct TransferSession {
    std::string code;
    std::string transfer_id;
    SessionStatus status = SessionStatus::Waiting;
    std::chrono::steady_clock::time_point created_at;
    std::optional<uint16_t> listen_port;   // set once the receiver has bound its listener
};

// Directory of live rendezvous codes. Every operation is serialized on one mutex;
// expired sessions are evicted lazily on lookup and in bulk by sweep_expired().
class SessionRegistry {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit SessionRegistry(std::chrono::seconds ttl = std::chrono::seconds(600),
                             Clock clock = nullptr);

    // Fresh code not currently live, reserved for transfer_id
    std::string issue_code(const std::string& transfer_id);

    // Fresh code not currently live, not reserved
    std::string issue_code() const;

    // False if the code is malformed or already live
    bool register_session(const std::string& code, const std::string& transfer_id);

    // None for unknown or malformed codes; expired sessions are removed first
    std::optional<TransferSession> lookup(const std::string& code);

    // False unless the session is live and still waiting for a receiver
    bool mark_connected(const std::string& code, uint16_t listen_port);

    void release(const std::string& code);

    // Drops the session only while no receiver has claimed it
    bool release_if_waiting(const std::string& code);

    // Removes every expired session. Returns how many were dropped.
    size_t sweep_expired();

    size_t size() const;

    std::chrono::seconds ttl() const { return ttl_; }

private:
    bool is_expired(const TransferSession& s, std::chrono::steady_clock::time_point now) const;
    std::string unused_code_locked() const;

    std::chrono::seconds ttl_;
    Clock clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, TransferSession> sessions_;
};

} // namespace session
