#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include "errors.hpp"
#include "transfer_ledger.hpp"

namespace events {

enum class EventKind {
    CodeIssued,
    Progress,
    StatusChanged,
    Error
};

const char* to_string(EventKind kind);

struct TransferEvent {
    std::string transfer_id;
    EventKind kind = EventKind::StatusChanged;
    int percent = 0;
    std::string message;
    session::TransferStatus status = session::TransferStatus::Waiting;
    std::string code;                                   // CodeIssued only
    std::optional<errors::ErrorKind> error;             // Error only
};

// Invoked on the worker thread; must return quickly
using EventCallback = std::function<void(const TransferEvent&)>;

// Narrow form: transfer id, percent, message
using ProgressCallback = std::function<void(const std::string&, int, const std::string&)>;

EventCallback adapt(ProgressCallback callback);

// Fan-out of every event to any number of subscribers
class EventStream {
public:
    using SubscriptionId = uint64_t;

    SubscriptionId subscribe(EventCallback callback);
    void unsubscribe(SubscriptionId id);
    void publish(const TransferEvent& event) const;

private:
    mutable std::mutex mutex_;
    SubscriptionId next_id_ = 1;
    std::map<SubscriptionId, EventCallback> subscribers_;
};

} // namespace events
