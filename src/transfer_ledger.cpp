#include "transfer_ledger.hpp"
#include <algorithm>

namespace session {

const char* to_string(TransferStatus status) {
    switch (status) {
        case TransferStatus::Waiting:    return "waiting";
        case TransferStatus::Connecting: return "connecting";
        case TransferStatus::Connected:  return "connected";
        case TransferStatus::Sending:    return "sending";
        case TransferStatus::Receiving:  return "receiving";
        case TransferStatus::Completed:  return "completed";
        case TransferStatus::Failed:     return "failed";
        case TransferStatus::Cancelled:  return "cancelled";
        case TransferStatus::Expired:    return "expired";
    }
    return "unknown";
}

bool is_terminal(TransferStatus status) {
    return status == TransferStatus::Completed || status == TransferStatus::Failed ||
           status == TransferStatus::Cancelled || status == TransferStatus::Expired;
}

bool TransferLedger::create(TransferRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (records_.count(record.id) != 0) return false;
    if (record.started_at == std::chrono::system_clock::time_point{}) {
        record.started_at = std::chrono::system_clock::now();
    }
    std::string id = record.id;
    records_.emplace(std::move(id), std::move(record));
    changed_.notify_all();
    return true;
}

bool TransferLedger::set_status(const std::string& id, TransferStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end() || is_terminal(it->second.status) || is_terminal(status)) return false;
    it->second.status = status;
    changed_.notify_all();
    return true;
}

bool TransferLedger::set_file(const std::string& id, const std::string& file_name,
                              uint64_t original_size, uint64_t compressed_size) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) return false;
    it->second.file_name = file_name;
    it->second.original_size = original_size;
    it->second.compressed_size = compressed_size;
    return true;
}

bool TransferLedger::set_code(const std::string& id, const std::string& code) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) return false;
    it->second.transfer_code = code;
    return true;
}

int TransferLedger::update_progress(const std::string& id, uint64_t bytes_transferred, int percent) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) return 0;
    TransferRecord& r = it->second;
    r.bytes_transferred = std::max(r.bytes_transferred, bytes_transferred);
    r.progress = std::max(r.progress, std::clamp(percent, 0, 100));
    return r.progress;
}

bool TransferLedger::complete(const std::string& id, const std::string& file_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end() || is_terminal(it->second.status)) return false;
    TransferRecord& r = it->second;
    r.status = TransferStatus::Completed;
    r.progress = 100;
    if (!file_path.empty()) r.file_path = file_path;
    changed_.notify_all();
    return true;
}

bool TransferLedger::fail(const std::string& id, errors::ErrorKind kind, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end() || is_terminal(it->second.status)) return false;
    TransferRecord& r = it->second;
    r.status = (kind == errors::ErrorKind::Cancelled) ? TransferStatus::Cancelled : TransferStatus::Failed;
    r.error_kind = kind;
    r.error_message = message;
    changed_.notify_all();
    return true;
}

std::optional<TransferRecord> TransferLedger::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

std::vector<TransferRecord> TransferLedger::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TransferRecord> out;
    out.reserve(records_.size());
    for (const auto& entry : records_) {
        out.push_back(entry.second);
    }
    std::sort(out.begin(), out.end(), [](const TransferRecord& a, const TransferRecord& b) {
        return a.started_at < b.started_at;
    });
    return out;
}

bool TransferLedger::erase(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.erase(id) != 0;
}

std::optional<TransferRecord> TransferLedger::wait_terminal(const std::string& id,
                                                            std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    changed_.wait_for(lock, timeout, [&] {
        auto it = records_.find(id);
        return it != records_.end() && is_terminal(it->second.status);
    });
    auto it = records_.find(id);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

} // namespace session
