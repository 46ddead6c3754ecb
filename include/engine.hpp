#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "config.hpp"
#include "events.hpp"
#include "session_registry.hpp"
#include "transfer_ledger.hpp"

namespace transfer {

// Returned by Engine::receive. close() cancels the listener.
class ReceiveHandle {
public:
    ReceiveHandle(std::string transfer_id, std::shared_ptr<std::atomic<bool>> cancel_flag)
        : transfer_id_(std::move(transfer_id)), cancel_flag_(std::move(cancel_flag)) {}

    const std::string& transfer_id() const { return transfer_id_; }
    void close() { cancel_flag_->store(true); }

private:
    std::string transfer_id_;
    std::shared_ptr<std::atomic<bool>> cancel_flag_;
};

// Entry point for collaborators. Each send/receive runs its pipeline on a
// dedicated worker thread and returns at once; progress and outcome arrive
// as events and in the ledger.
class Engine {
public:
    // Throws errors::InputError when `options` fail validation
    explicit Engine(config::Options options = config::Options(),
                    std::shared_ptr<session::SessionRegistry> registry = nullptr,
                    std::shared_ptr<session::TransferLedger> ledger = nullptr);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    std::string send(const std::string& file_path, const std::string& password,
                     events::EventCallback on_event = nullptr);

    ReceiveHandle receive(const std::string& save_dir, const std::string& password,
                          const std::string& code, events::EventCallback on_event = nullptr);

    // False when the transfer is unknown or already finished
    bool cancel(const std::string& transfer_id);

    std::optional<session::TransferRecord> status(const std::string& transfer_id) const;
    std::vector<session::TransferRecord> transfers() const;

    // Blocks until the transfer is terminal or `timeout` passes; returns the latest record
    std::optional<session::TransferRecord> wait(const std::string& transfer_id,
                                                std::chrono::milliseconds timeout) const;

    // Workers still running. Finished ones are joined first.
    size_t active_workers();

    events::EventStream& events() { return events_; }
    session::SessionRegistry& registry() { return *registry_; }
    const config::Options& options() const { return options_; }

    // Cancels and joins every worker and stops the sweeper. Idempotent.
    void shutdown();

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> cancel_flag;
        std::shared_ptr<std::atomic<bool>> done;
    };

    std::string new_transfer_id() const;
    events::EventCallback make_sink(events::EventCallback on_event);
    void reap_finished_locked();
    void sweep_loop();

    config::Options options_;
    std::shared_ptr<session::SessionRegistry> registry_;
    std::shared_ptr<session::TransferLedger> ledger_;
    events::EventStream events_;

    std::mutex workers_mutex_;
    std::unordered_map<std::string, Worker> workers_;

    std::mutex sweep_mutex_;
    std::condition_variable sweep_cv_;
    bool stopping_ = false;
    std::thread sweeper_;
};

} // namespace transfer
