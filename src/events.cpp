#include "events.hpp"
#include "log.hpp"
#include <vector>

namespace events {

const char* to_string(EventKind kind) {
    switch (kind) {
        case EventKind::CodeIssued:    return "code-issued";
        case EventKind::Progress:      return "progress";
        case EventKind::StatusChanged: return "status-changed";
        case EventKind::Error:         return "error";
    }
    return "unknown";
}

EventCallback adapt(ProgressCallback callback) {
    if (!callback) return nullptr;
    return [callback = std::move(callback)](const TransferEvent& event) {
        callback(event.transfer_id, event.percent, event.message);
    };
}

EventStream::SubscriptionId EventStream::subscribe(EventCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    subscribers_.emplace(id, std::move(callback));
    return id;
}

void EventStream::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.erase(id);
}

void EventStream::publish(const TransferEvent& event) const {
    // Callbacks run without the lock so they may subscribe, unsubscribe or cancel
    std::vector<EventCallback> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets.reserve(subscribers_.size());
        for (const auto& entry : subscribers_) {
            targets.push_back(entry.second);
        }
    }
    for (const auto& cb : targets) {
        try {
            cb(event);
        } catch (const std::exception& e) {
            logging::get()->warn("Event subscriber threw: {}", e.what());
        }
    }
}

} // namespace events
