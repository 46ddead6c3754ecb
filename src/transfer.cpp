#include "transfer.hpp"
#include "config.hpp"
#include "errors.hpp"
#include <fstream>

namespace transfer {

void MessageSender::send_file_meta(networking::Connection& connection, const protocol::FileMeta& meta,
                                   std::chrono::milliseconds timeout, const std::atomic<bool>* cancel_flag) {
    const std::string payload = protocol::encode_file_meta(meta);
    connection.write_all(payload.data(), payload.size(), timeout, cancel_flag);
}

void MessageSender::send_frame(networking::Connection& connection, const std::vector<uint8_t>& sealed,
                               std::chrono::milliseconds timeout, const std::atomic<bool>* cancel_flag) {
    auto header = protocol::serialize_frame_header(protocol::FrameHeader{static_cast<uint32_t>(sealed.size())});
    std::vector<uint8_t> frame;
    frame.reserve(header.size() + sealed.size());
    frame.insert(frame.end(), header.begin(), header.end());
    frame.insert(frame.end(), sealed.begin(), sealed.end());
    connection.write_all(frame.data(), frame.size(), timeout, cancel_flag);
}

uint64_t MessageSender::send_file(networking::Connection& connection, const std::string& filepath,
                                  const security::Key& key, uint64_t expected_size,
                                  std::chrono::milliseconds timeout, ChunkProgressCallback progress_cb,
                                  const std::atomic<bool>* cancel_flag) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        throw errors::StorageError("Could not open file for reading: " + filepath);
    }

    uint64_t total_sent = 0;
    std::vector<char> buffer(config::CHUNK_SIZE);
    while (true) {
        if (cancel_flag && cancel_flag->load()) {
            throw errors::CancelledError();
        }
        file.read(buffer.data(), buffer.size());
        const std::streamsize bytes_read = file.gcount();
        if (bytes_read <= 0) break;

        auto sealed = security::seal_chunk(key, reinterpret_cast<const uint8_t*>(buffer.data()),
                                           static_cast<size_t>(bytes_read));
        send_frame(connection, sealed, timeout, cancel_flag);
        total_sent += static_cast<uint64_t>(bytes_read);

        if (progress_cb) progress_cb(total_sent);
    }
    if (file.bad()) {
        throw errors::StorageError("Read error on " + filepath);
    }
    if (total_sent != expected_size) {
        throw errors::StorageError("File changed during transfer: sent " + std::to_string(total_sent) +
                                   " of " + std::to_string(expected_size) + " bytes");
    }
    return total_sent;
}

protocol::FileMeta MessageReceiver::receive_file_meta(networking::Connection& connection,
                                                      std::chrono::milliseconds timeout,
                                                      const std::atomic<bool>* cancel_flag) {
    const std::string line = connection.read_line(timeout, cancel_flag);
    return protocol::decode_file_meta(line);
}

std::vector<uint8_t> MessageReceiver::receive_frame(networking::Connection& connection,
                                                    std::chrono::milliseconds timeout,
                                                    const std::atomic<bool>* cancel_flag) {
    std::array<uint8_t, protocol::FRAME_HEADER_SIZE> header_buf;
    connection.read_exact(header_buf.data(), header_buf.size(), timeout, cancel_flag);
    protocol::FrameHeader header = protocol::deserialize_frame_header(header_buf);
    protocol::validate_frame_header(header);

    std::vector<uint8_t> sealed(header.sealed_size);
    connection.read_exact(sealed.data(), sealed.size(), timeout, cancel_flag);
    return sealed;
}

uint64_t MessageReceiver::receive_file(networking::Connection& connection, const std::string& filepath,
                                       const security::Key& key, uint64_t expected_size,
                                       std::chrono::milliseconds timeout, ChunkProgressCallback progress_cb,
                                       const std::atomic<bool>* cancel_flag) {
    std::ofstream file(filepath, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw errors::StorageError("Could not open file for writing: " + filepath);
    }

    uint64_t total_received = 0;
    while (total_received < expected_size) {
        if (cancel_flag && cancel_flag->load()) {
            throw errors::CancelledError();
        }

        std::vector<uint8_t> sealed = receive_frame(connection, timeout, cancel_flag);
        std::vector<uint8_t> plaintext = security::open_chunk(key, sealed);
        if (total_received + plaintext.size() > expected_size) {
            throw errors::NetworkError("Peer sent more data than announced");
        }

        file.write(reinterpret_cast<const char*>(plaintext.data()), static_cast<std::streamsize>(plaintext.size()));
        if (!file) {
            throw errors::StorageError("Write error on " + filepath);
        }
        total_received += plaintext.size();

        if (progress_cb) progress_cb(total_received);
    }

    file.close();
    if (!file) {
        throw errors::StorageError("Write error on " + filepath);
    }
    return total_received;
}

} // namespace transfer
