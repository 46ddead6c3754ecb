#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "errors.hpp"

namespace session {

enum class TransferRole {
    Send,
    Receive
};

enum class TransferStatus {
    Waiting,
    Connecting,
    Connected,
    Sending,
    Receiving,
    Completed,
    Failed,
    Cancelled,
    Expired
};

const char* to_string(TransferStatus status);
bool is_terminal(TransferStatus status);

struct TransferRecord {
    std::string id;
    TransferRole role = TransferRole::Send;
    std::string file_name;
    uint64_t original_size = 0;
    uint64_t compressed_size = 0;
    uint64_t bytes_transferred = 0;
    int progress = 0;                       // 0..100, never decreases
    TransferStatus status = TransferStatus::Waiting;
    std::optional<errors::ErrorKind> error_kind;
    std::string error_message;
    std::string transfer_code;
    std::string file_path;                  // receiver: final path once completed
    std::chrono::system_clock::time_point started_at;
};

// Table of transfer records shared by all pipeline workers
class TransferLedger {
public:
    // False if a record with the same id already exists
    bool create(TransferRecord record);

    // Moves to a non-terminal status; ignored once the record is terminal
    bool set_status(const std::string& id, TransferStatus status);

    bool set_file(const std::string& id, const std::string& file_name,
                  uint64_t original_size, uint64_t compressed_size);

    bool set_code(const std::string& id, const std::string& code);

    // Returns the stored progress. Lower values than the current one are ignored.
    int update_progress(const std::string& id, uint64_t bytes_transferred, int percent);

    bool complete(const std::string& id, const std::string& file_path = "");

    // Cancelled errors land in TransferStatus::Cancelled, everything else in Failed
    bool fail(const std::string& id, errors::ErrorKind kind, const std::string& message);

    std::optional<TransferRecord> get(const std::string& id) const;
    std::vector<TransferRecord> list() const;
    bool erase(const std::string& id);

    // Blocks until the record is terminal or the timeout elapses
    std::optional<TransferRecord> wait_terminal(const std::string& id, std::chrono::milliseconds timeout) const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable changed_;
    std::unordered_map<std::string, TransferRecord> records_;
};

} // namespace session
