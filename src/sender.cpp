#include "sender.hpp"
#include "compression.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "networking.hpp"
#include "security.hpp"
#include "transfer.hpp"
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace transfer {

PreparedPayload prepare_payload(const std::string& file_path, const std::string& transfer_id) {
    std::error_code ec;
    if (!fs::is_regular_file(file_path, ec)) {
        throw errors::InputError("File not found or not a regular file: " + file_path);
    }
    const uint64_t size = fs::file_size(file_path, ec);
    if (ec) {
        throw errors::InputError("Cannot read size of " + file_path + ": " + ec.message());
    }

    PreparedPayload payload;
    payload.original_size = size;

    if (!compression::should_compress(size)) {
        payload.payload_path = file_path;
        payload.compressed_size = size;
        return payload;
    }

    std::string compressed_path = file_path + "." + transfer_id + config::COMPRESSED_SUFFIX;
    payload.artifact.reset(compressed_path);
    payload.compressed_size = compression::compress_file(file_path, compressed_path);
    payload.payload_path = compressed_path;
    payload.is_compressed = true;
    logging::get()->debug("Compressed {} from {} to {} bytes", file_path, size, payload.compressed_size);
    return payload;
}

SenderPipeline::SenderPipeline(PipelineContext context, std::string transfer_id)
    : context_(std::move(context)),
      reporter_(std::move(transfer_id), context_.ledger, context_.sink) {}

void SenderPipeline::run(const std::string& file_path, std::string password) {
    try {
        execute(file_path, password);
        reporter_.completed("");
    } catch (const errors::TransferError& e) {
        reporter_.failed(e.kind(), e.what());
    } catch (const std::exception& e) {
        reporter_.failed(errors::ErrorKind::Internal, e.what());
    }
    security::wipe(password);
}

void SenderPipeline::execute(const std::string& file_path, std::string& password) {
    const config::Options& opts = context_.options;
    const std::atomic<bool>* cancel = context_.cancel_flag;
    const std::string& id = reporter_.transfer_id();

    // ─── PREPARING ──────────────────────────────────────────────────────
    logging::get()->info("[{}] Preparing {}", id, file_path);
    PreparedPayload payload = prepare_payload(file_path, id);
    const std::string file_name = fs::path(file_path).filename().string();
    context_.ledger->set_file(id, file_name, payload.original_size, payload.compressed_size);

    security::Salt salt = security::generate_salt();
    security::Key key = security::derive_key(password, salt);
    security::wipe(password);

    const std::string code = context_.registry->issue_code(id);
    CodeGuard code_guard(context_.registry, code);
    reporter_.code_issued(code, "Waiting for receiver... Transfer Code: " + code);

    // ─── WAITING_FOR_PEER ───────────────────────────────────────────────
    const uint16_t port = wait_for_peer(code);

    // ─── CONNECTING ─────────────────────────────────────────────────────
    reporter_.status(session::TransferStatus::Connecting,
                     "Connecting to " + opts.connect_host + ":" + std::to_string(port));

    boost::asio::io_context io_context;
    networking::Connection connection(io_context, opts.poll_interval);
    networking::connect_with_retry(connection, opts.connect_host, port,
        opts.connect_attempts, opts.retry_backoff, opts.connect_timeout, opts.poll_interval, cancel,
        [this](int attempt, const std::string&) {
            reporter_.notice("Connection attempt " + std::to_string(attempt) + " failed, retrying...");
        });
    reporter_.status(session::TransferStatus::Connected, "Connected to " + connection.remote_address());

    // ─── SENDING ────────────────────────────────────────────────────────
    protocol::FileMeta meta;
    meta.transfer_id = id;
    meta.file_name = file_name;
    meta.original_size = payload.original_size;
    meta.compressed_size = payload.compressed_size;
    meta.salt = security::encode_salt(salt);
    meta.is_compressed = payload.is_compressed;
    meta.transfer_code = code;

    reporter_.status(session::TransferStatus::Sending,
                     "Sending " + file_name + " (" + networking::format_size(payload.compressed_size) + ")");
    MessageSender::send_file_meta(connection, meta, opts.write_timeout, cancel);

    const uint64_t total = payload.compressed_size;
    MessageSender::send_file(connection, payload.payload_path, key, total, opts.write_timeout,
        [this, total](uint64_t sent) { reporter_.progress(sent, total); }, cancel);

    connection.close();
}

uint16_t SenderPipeline::wait_for_peer(const std::string& code) {
    const config::Options& opts = context_.options;
    const auto deadline = std::chrono::steady_clock::now() + opts.peer_wait_timeout;

    while (true) {
        if (context_.cancel_flag && context_.cancel_flag->load()) {
            throw errors::CancelledError();
        }

        auto session = context_.registry->lookup(code);
        if (!session) {
            throw errors::RendezvousError("Transfer code " + code + " expired or was released");
        }
        if (session->status == session::SessionStatus::Connected && session->listen_port) {
            return *session->listen_port;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            throw errors::NetworkError("No receiver joined within " +
                                       std::to_string(opts.peer_wait_timeout.count()) + "ms");
        }
        networking::sleep_cancellable(opts.poll_interval, opts.poll_interval, context_.cancel_flag);
    }
}

} // namespace transfer
