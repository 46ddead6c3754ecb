#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "networking.hpp"
#include "protocol/file_meta.hpp"
#include "protocol/packet.hpp"
#include "security.hpp"

namespace transfer {

// Called after each frame with the plaintext bytes moved so far
using ChunkProgressCallback = std::function<void(uint64_t)>;

class MessageSender {
public:
    static void send_file_meta(networking::Connection& connection, const protocol::FileMeta& meta,
                               std::chrono::milliseconds timeout, const std::atomic<bool>* cancel_flag);

    // Length prefix and sealed bytes in one write
    static void send_frame(networking::Connection& connection, const std::vector<uint8_t>& sealed,
                           std::chrono::milliseconds timeout, const std::atomic<bool>* cancel_flag);

    // Stream `filepath` in CHUNK_SIZE pieces, each sealed under `key`. The cancel flag
    // is checked before every chunk. Returns the plaintext bytes sent, which must
    // equal `expected_size` (errors::StorageError otherwise).
    static uint64_t send_file(networking::Connection& connection, const std::string& filepath,
                              const security::Key& key, uint64_t expected_size,
                              std::chrono::milliseconds timeout, ChunkProgressCallback progress_cb,
                              const std::atomic<bool>* cancel_flag);
};

class MessageReceiver {
public:
    static protocol::FileMeta receive_file_meta(networking::Connection& connection,
                                                std::chrono::milliseconds timeout,
                                                const std::atomic<bool>* cancel_flag);

    static std::vector<uint8_t> receive_frame(networking::Connection& connection,
                                              std::chrono::milliseconds timeout,
                                              const std::atomic<bool>* cancel_flag);

    // Read frames until `expected_size` plaintext bytes are written to `filepath`.
    // Any frame failing authentication raises errors::CryptoError.
    static uint64_t receive_file(networking::Connection& connection, const std::string& filepath,
                                 const security::Key& key, uint64_t expected_size,
                                 std::chrono::milliseconds timeout, ChunkProgressCallback progress_cb,
                                 const std::atomic<bool>* cancel_flag);
};

} // namespace transfer
