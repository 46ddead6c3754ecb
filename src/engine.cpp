#include "engine.hpp"
#include "log.hpp"
#include "receiver.hpp"
#include "sender.hpp"
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <filesystem>

namespace transfer {

Engine::Engine(config::Options options, std::shared_ptr<session::SessionRegistry> registry,
               std::shared_ptr<session::TransferLedger> ledger)
    : options_(std::move(options)), registry_(std::move(registry)), ledger_(std::move(ledger)) {
    options_.validate();
    if (!registry_) {
        registry_ = std::make_shared<session::SessionRegistry>(options_.session_ttl);
    }
    if (!ledger_) {
        ledger_ = std::make_shared<session::TransferLedger>();
    }
    if (options_.sweep_interval.count() > 0) {
        sweeper_ = std::thread(&Engine::sweep_loop, this);
    }
}

Engine::~Engine() {
    shutdown();
}

std::string Engine::new_transfer_id() const {
    boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

events::EventCallback Engine::make_sink(events::EventCallback on_event) {
    return [this, on_event = std::move(on_event)](const events::TransferEvent& event) {
        if (on_event) {
            try {
                on_event(event);
            } catch (const std::exception& e) {
                logging::get()->warn("Event callback for {} ({}) threw: {}", event.transfer_id,
                                     events::to_string(event.kind), e.what());
            }
        }
        events_.publish(event);
    };
}

std::string Engine::send(const std::string& file_path, const std::string& password,
                         events::EventCallback on_event) {
    const std::string id = new_transfer_id();

    session::TransferRecord record;
    record.id = id;
    record.role = session::TransferRole::Send;
    record.file_name = std::filesystem::path(file_path).filename().string();
    ledger_->create(record);

    std::lock_guard<std::mutex> lock(workers_mutex_);
    reap_finished_locked();

    Worker& worker = workers_[id];
    worker.cancel_flag = std::make_shared<std::atomic<bool>>(false);
    worker.done = std::make_shared<std::atomic<bool>>(false);

    // The thread holds its own reference to the flag the context points at
    PipelineContext context{options_, registry_, ledger_, make_sink(std::move(on_event)), worker.cancel_flag.get()};
    worker.thread = std::thread(
        [context = std::move(context), id, file_path, password = std::string(password),
         cancel_flag = worker.cancel_flag, done = worker.done]() mutable {
            SenderPipeline pipeline(std::move(context), id);
            pipeline.run(file_path, std::move(password));
            done->store(true);
        });
    return id;
}

ReceiveHandle Engine::receive(const std::string& save_dir, const std::string& password,
                              const std::string& code, events::EventCallback on_event) {
    const std::string id = new_transfer_id();

    session::TransferRecord record;
    record.id = id;
    record.role = session::TransferRole::Receive;
    record.transfer_code = code;
    ledger_->create(record);

    std::lock_guard<std::mutex> lock(workers_mutex_);
    reap_finished_locked();

    Worker& worker = workers_[id];
    worker.cancel_flag = std::make_shared<std::atomic<bool>>(false);
    worker.done = std::make_shared<std::atomic<bool>>(false);

    PipelineContext context{options_, registry_, ledger_, make_sink(std::move(on_event)), worker.cancel_flag.get()};
    worker.thread = std::thread(
        [context = std::move(context), id, save_dir, password = std::string(password), code,
         cancel_flag = worker.cancel_flag, done = worker.done]() mutable {
            ReceiverListener listener(std::move(context), id);
            listener.run(save_dir, std::move(password), code);
            done->store(true);
        });
    return ReceiveHandle(id, worker.cancel_flag);
}

bool Engine::cancel(const std::string& transfer_id) {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    auto it = workers_.find(transfer_id);
    if (it == workers_.end() || it->second.done->load()) return false;
    logging::get()->info("[{}] Cancellation requested", transfer_id);
    it->second.cancel_flag->store(true);
    return true;
}

std::optional<session::TransferRecord> Engine::status(const std::string& transfer_id) const {
    return ledger_->get(transfer_id);
}

std::vector<session::TransferRecord> Engine::transfers() const {
    return ledger_->list();
}

std::optional<session::TransferRecord> Engine::wait(const std::string& transfer_id,
                                                    std::chrono::milliseconds timeout) const {
    return ledger_->wait_terminal(transfer_id, timeout);
}

size_t Engine::active_workers() {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    reap_finished_locked();
    return workers_.size();
}

void Engine::reap_finished_locked() {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->second.done->load()) {
            if (it->second.thread.joinable()) it->second.thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void Engine::shutdown() {
    {
        std::lock_guard<std::mutex> lock(sweep_mutex_);
        stopping_ = true;
    }
    sweep_cv_.notify_all();
    if (sweeper_.joinable()) sweeper_.join();

    std::unordered_map<std::string, Worker> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers.swap(workers_);
    }
    for (auto& entry : workers) {
        entry.second.cancel_flag->store(true);
    }
    for (auto& entry : workers) {
        if (entry.second.thread.joinable()) entry.second.thread.join();
    }
}

void Engine::sweep_loop() {
    std::unique_lock<std::mutex> lock(sweep_mutex_);
    while (!stopping_) {
        if (sweep_cv_.wait_for(lock, options_.sweep_interval, [this] { return stopping_; })) break;
        lock.unlock();
        size_t removed = registry_->sweep_expired();
        if (removed > 0) {
            logging::get()->info("Expired {} unused transfer code(s)", removed);
        }
        lock.lock();
    }
}

} // namespace transfer
