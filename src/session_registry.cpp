#include "session_registry.hpp"
#include "log.hpp"
#include "security.hpp"

namespace session {

const char* to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::Waiting:   return "waiting";
        case SessionStatus::Connected: return "connected";
        case SessionStatus::Completed: return "completed";
        case SessionStatus::Failed:    return "failed";
        case SessionStatus::Cancelled: return "cancelled";
        case SessionStatus::Expired:   return "expired";
    }
    return "unknown";
}

SessionRegistry::SessionRegistry(std::chrono::seconds ttl, Clock clock)
    : ttl_(ttl), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::steady_clock::now(); };
    }
}

bool SessionRegistry::is_expired(const TransferSession& s, std::chrono::steady_clock::time_point now) const {
    return now - s.created_at > ttl_;
}

std::string SessionRegistry::unused_code_locked() const {
    // An expired session still occupies its code until evicted; skipping it is harmless
    std::string code;
    do {
        code = security::generate_code();
    } while (sessions_.count(code) != 0);
    return code;
}

std::string SessionRegistry::issue_code(const std::string& transfer_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string code = unused_code_locked();
    TransferSession s;
    s.code = code;
    s.transfer_id = transfer_id;
    s.created_at = clock_();
    sessions_.emplace(code, std::move(s));
    logging::get()->debug("Registered code {} for transfer {}", code, transfer_id);
    return code;
}

std::string SessionRegistry::issue_code() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return unused_code_locked();
}

bool SessionRegistry::register_session(const std::string& code, const std::string& transfer_id) {
    if (!security::is_valid_code(code)) return false;

    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_();
    auto it = sessions_.find(code);
    if (it != sessions_.end()) {
        if (!is_expired(it->second, now)) return false;
        sessions_.erase(it);
    }
    TransferSession s;
    s.code = code;
    s.transfer_id = transfer_id;
    s.created_at = now;
    sessions_.emplace(code, std::move(s));
    return true;
}

std::optional<TransferSession> SessionRegistry::lookup(const std::string& code) {
    if (!security::is_valid_code(code)) return std::nullopt;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(code);
    if (it == sessions_.end()) return std::nullopt;

    if (is_expired(it->second, clock_())) {
        logging::get()->info("Rendezvous code {} expired", code);
        sessions_.erase(it);
        return std::nullopt;
    }
    return it->second;
}

bool SessionRegistry::mark_connected(const std::string& code, uint16_t listen_port) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(code);
    if (it == sessions_.end() || is_expired(it->second, clock_())) return false;
    if (it->second.status != SessionStatus::Waiting) return false;
    it->second.status = SessionStatus::Connected;
    it->second.listen_port = listen_port;
    return true;
}

void SessionRegistry::release(const std::string& code) {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.erase(code);
}

bool SessionRegistry::release_if_waiting(const std::string& code) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(code);
    if (it == sessions_.end() || it->second.status != SessionStatus::Waiting) return false;
    sessions_.erase(it);
    return true;
}

size_t SessionRegistry::sweep_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_();
    size_t removed = 0;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (is_expired(it->second, now)) {
            it = sessions_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        logging::get()->debug("Swept {} expired rendezvous code(s)", removed);
    }
    return removed;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

} // namespace session
