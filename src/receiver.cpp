#include "receiver.hpp"
#include "atomic_file.hpp"
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

ReceiverListener::ReceiverListener(PipelineContext context, std::string transfer_id)
    : context_(std::move(context)),
      reporter_(std::move(transfer_id), context_.ledger, context_.sink) {}

void ReceiverListener::run(const std::string& save_dir, std::string password, const std::string& code) {
    try {
        std::string final_path = execute(save_dir, password, code);
        reporter_.completed(final_path);
    } catch (const errors::TransferError& e) {
        reporter_.failed(e.kind(), e.what());
    } catch (const std::exception& e) {
        reporter_.failed(errors::ErrorKind::Internal, e.what());
    }
    security::wipe(password);
}

std::string ReceiverListener::execute(const std::string& save_dir, std::string& password,
                                      const std::string& code) {
    const config::Options& opts = context_.options;
    const std::atomic<bool>* cancel = context_.cancel_flag;
    const std::string& id = reporter_.transfer_id();

    if (!security::is_valid_code(code)) {
        throw errors::InputError("Invalid transfer code '" + code + "': expected 6 digits");
    }
    context_.ledger->set_code(id, code);

    std::error_code ec;
    fs::create_directories(save_dir, ec);
    if (ec) {
        throw errors::StorageError("Cannot create directory " + save_dir + ": " + ec.message());
    }

    if (!context_.registry->lookup(code)) {
        throw errors::RendezvousError("Transfer code " + code + " not found or expired");
    }
    CodeGuard code_guard(context_.registry, code, false);

    // ─── BINDING ────────────────────────────────────────────────────────
    boost::asio::io_context io_context;
    networking::Listener listener(io_context, opts.poll_interval);
    const uint16_t port = listener.bind(opts.port, opts.bind_attempts, opts.retry_backoff, cancel,
        [this](int attempt, const std::string&) {
            reporter_.notice("Bind attempt " + std::to_string(attempt) + " failed, retrying...");
        });

    if (!context_.registry->mark_connected(code, port)) {
        throw errors::RendezvousError("Transfer code " + code + " expired or is already in use");
    }
    code_guard.take_ownership();

    // ─── LISTENING / ACCEPTING ──────────────────────────────────────────
    logging::get()->info("[{}] Listening on {}:{}", id, networking::get_local_ip(io_context), port);
    reporter_.status(session::TransferStatus::Connecting,
                     "Waiting for sender to connect... (port " + std::to_string(port) + ")");
    networking::Connection connection(io_context, opts.poll_interval);
    listener.accept(connection, opts.accept_timeout, cancel);
    listener.close();
    reporter_.status(session::TransferStatus::Connected, "Sender connected from " + connection.remote_address());

    protocol::FileMeta meta = MessageReceiver::receive_file_meta(connection, opts.metadata_timeout, cancel);
    if (meta.transfer_code != code) {
        throw errors::RendezvousError("Sender presented transfer code " + meta.transfer_code +
                                      ", expected " + code);
    }

    const std::string file_name = protocol::sanitize_file_name(meta.file_name);
    if (file_name.empty()) {
        throw errors::NetworkError("Sender supplied an unusable file name");
    }
    context_.ledger->set_file(id, file_name, meta.original_size, meta.compressed_size);

    const storage::AtomicFilePaths paths = storage::compute_atomic_paths(fs::path(save_dir) / file_name);

    const uint64_t needed = storage::required_space(meta.compressed_size, meta.original_size,
                                                    meta.is_compressed);
    const uint64_t available = storage::available_space(save_dir);
    if (available != 0 && available < needed) {
        throw errors::StorageError("Not enough disk space: need " + networking::format_size(needed) +
                                   ", have " + networking::format_size(available));
    }

    security::Key key = security::derive_key(password, security::decode_salt(meta.salt));
    security::wipe(password);

    // ─── RECEIVING ──────────────────────────────────────────────────────
    storage::TempFile part(paths.part_path);
    reporter_.status(session::TransferStatus::Receiving,
                     "Receiving " + file_name + " (" + networking::format_size(meta.original_size) + ")");

    const uint64_t total = meta.compressed_size;
    MessageReceiver::receive_file(connection, paths.part_path.string(), key, total, opts.read_timeout,
        [this, total](uint64_t received) { reporter_.progress(received, total); }, cancel);
    connection.close();

    // ─── FINALIZING ─────────────────────────────────────────────────────
    if (meta.is_compressed) {
        reporter_.notice("Decompressing file...");
        storage::TempFile inflated(paths.decompress_path);
        const uint64_t written = compression::decompress_file(paths.part_path.string(),
                                                              paths.decompress_path.string());
        if (written != meta.original_size) {
            throw errors::CompressionError("Decompressed size " + std::to_string(written) +
                                           " does not match announced " + std::to_string(meta.original_size));
        }
        storage::atomic_rename(paths.decompress_path, paths.final_path);
        inflated.release();
    } else {
        storage::atomic_rename(paths.part_path, paths.final_path);
        part.release();
    }

    return paths.final_path.string();
}

} // namespace transfer
