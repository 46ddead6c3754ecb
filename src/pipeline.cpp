#include "pipeline.hpp"
#include "log.hpp"

namespace transfer {

Reporter::Reporter(std::string transfer_id, std::shared_ptr<session::TransferLedger> ledger,
                   events::EventCallback sink)
    : transfer_id_(std::move(transfer_id)), ledger_(std::move(ledger)), sink_(std::move(sink)) {}

void Reporter::emit(events::TransferEvent event) {
    if (!sink_) return;
    event.transfer_id = transfer_id_;
    event.status = status_;
    if (event.kind != events::EventKind::Progress) {
        event.percent = last_percent_ < 0 ? 0 : last_percent_;
    }
    sink_(event);
}

void Reporter::code_issued(const std::string& code, const std::string& message) {
    ledger_->set_code(transfer_id_, code);
    events::TransferEvent event;
    event.kind = events::EventKind::CodeIssued;
    event.code = code;
    event.message = message;
    emit(std::move(event));
}

void Reporter::status(session::TransferStatus status, const std::string& message) {
    ledger_->set_status(transfer_id_, status);
    status_ = status;
    logging::get()->info("[{}] {}: {}", transfer_id_, session::to_string(status), message);

    events::TransferEvent event;
    event.kind = events::EventKind::StatusChanged;
    event.message = message;
    emit(std::move(event));
}

void Reporter::notice(const std::string& message) {
    events::TransferEvent event;
    event.kind = events::EventKind::StatusChanged;
    event.message = message;
    emit(std::move(event));
}

void Reporter::progress(uint64_t bytes, uint64_t total) {
    int percent = 100;
    if (total > 0) {
        percent = static_cast<int>(bytes * 100 / total);
    }
    percent = ledger_->update_progress(transfer_id_, bytes, percent);
    if (percent <= last_percent_) return;
    last_percent_ = percent;

    events::TransferEvent event;
    event.kind = events::EventKind::Progress;
    event.percent = percent;
    event.message = std::to_string(percent) + "%";
    emit(std::move(event));
}

void Reporter::completed(const std::string& file_path) {
    if (last_percent_ < 100) {
        last_percent_ = 100;
        ledger_->update_progress(transfer_id_, 0, 100);
        events::TransferEvent event;
        event.kind = events::EventKind::Progress;
        event.percent = 100;
        event.message = "100%";
        emit(std::move(event));
    }

    status_ = session::TransferStatus::Completed;
    logging::get()->info("[{}] Transfer complete{}", transfer_id_,
                         file_path.empty() ? std::string() : ": " + file_path);

    // Observers hear about the outcome before waiters on the ledger wake up
    events::TransferEvent event;
    event.kind = events::EventKind::StatusChanged;
    event.message = file_path.empty() ? "Transfer complete" : "Saved to " + file_path;
    emit(std::move(event));

    ledger_->complete(transfer_id_, file_path);
}

void Reporter::failed(errors::ErrorKind kind, const std::string& message) {
    if (kind == errors::ErrorKind::Cancelled) {
        status_ = session::TransferStatus::Cancelled;
        logging::get()->info("[{}] {}", transfer_id_, message);
    } else {
        status_ = session::TransferStatus::Failed;
        logging::get()->error("[{}] {} error: {}", transfer_id_, errors::to_string(kind), message);
    }

    events::TransferEvent event;
    event.kind = events::EventKind::Error;
    event.message = message;
    event.error = kind;
    emit(std::move(event));

    ledger_->fail(transfer_id_, kind, message);
}

} // namespace transfer
