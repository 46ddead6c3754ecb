#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include "config.hpp"
#include "events.hpp"
#include "session_registry.hpp"
#include "transfer_ledger.hpp"

namespace transfer {

// Everything a pipeline worker shares with the engine
struct PipelineContext {
    config::Options options;
    std::shared_ptr<session::SessionRegistry> registry;
    std::shared_ptr<session::TransferLedger> ledger;
    events::EventCallback sink;
    const std::atomic<bool>* cancel_flag = nullptr;
};

// Writes pipeline state to the ledger and mirrors it as events
class Reporter {
public:
    Reporter(std::string transfer_id, std::shared_ptr<session::TransferLedger> ledger,
             events::EventCallback sink);

    const std::string& transfer_id() const { return transfer_id_; }

    void code_issued(const std::string& code, const std::string& message);

    // Moves the record to `status` and announces it
    void status(session::TransferStatus status, const std::string& message);

    // Status text without a state change (retries, decompression)
    void notice(const std::string& message);

    // Emits a Progress event only when the percentage goes up
    void progress(uint64_t bytes, uint64_t total);

    void completed(const std::string& file_path);
    void failed(errors::ErrorKind kind, const std::string& message);

private:
    void emit(events::TransferEvent event);

    std::string transfer_id_;
    std::shared_ptr<session::TransferLedger> ledger_;
    events::EventCallback sink_;
    session::TransferStatus status_ = session::TransferStatus::Waiting;
    int last_percent_ = -1;
};

// Releases a rendezvous code when the pipeline leaves scope. A guard that does
// not own the code leaves it alone once another receiver has claimed it.
class CodeGuard {
public:
    CodeGuard(std::shared_ptr<session::SessionRegistry> registry, std::string code, bool owned = true)
        : registry_(std::move(registry)), code_(std::move(code)), owned_(owned) {}
    ~CodeGuard() {
        if (owned_) {
            registry_->release(code_);
        } else {
            registry_->release_if_waiting(code_);
        }
    }

    CodeGuard(const CodeGuard&) = delete;
    CodeGuard& operator=(const CodeGuard&) = delete;

    void take_ownership() { owned_ = true; }

private:
    std::shared_ptr<session::SessionRegistry> registry_;
    std::string code_;
    bool owned_;
};

} // namespace transfer
