#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace config {

// ─── Protocol constants ─────────────────────────────────────────────────────

constexpr uint16_t SERVER_PORT = 5555;
constexpr size_t CHUNK_SIZE = 4096;            // plaintext bytes per sealed frame
constexpr size_t CODE_LENGTH = 6;

constexpr size_t SALT_SIZE = 16;
constexpr size_t KEY_SIZE = 32;
constexpr size_t NONCE_SIZE = 16;
constexpr size_t TAG_SIZE = 16;
constexpr size_t SEALED_OVERHEAD = NONCE_SIZE + TAG_SIZE;
constexpr int KDF_ITERATIONS = 100000;

constexpr uint64_t COMPRESSION_THRESHOLD = 10ULL * 1024 * 1024;  // 10 MiB, strictly greater compresses
constexpr int COMPRESSION_LEVEL = 6;

// Upper bound for the newline-terminated metadata record.
constexpr size_t MAX_METADATA_SIZE = 64 * 1024;

// Temporary artifact suffixes
constexpr const char* COMPRESSED_SUFFIX = ".fluxgz";
constexpr const char* PART_SUFFIX = ".fluxpart";
constexpr const char* DECOMPRESS_SUFFIX = ".fluxtmp";

// ─── Runtime options ────────────────────────────────────────────────────────

struct Options {
    uint16_t port = SERVER_PORT;                // 0 lets the OS choose; the registry records the bound port
    std::string connect_host = "127.0.0.1";

    std::chrono::milliseconds poll_interval{500};
    std::chrono::milliseconds peer_wait_timeout{300000};
    std::chrono::milliseconds connect_timeout{30000};
    std::chrono::milliseconds accept_timeout{60000};
    std::chrono::milliseconds metadata_timeout{30000};
    std::chrono::milliseconds read_timeout{60000};
    std::chrono::milliseconds write_timeout{60000};

    int connect_attempts = 3;
    int bind_attempts = 3;
    std::chrono::milliseconds retry_backoff{2000};

    std::chrono::seconds session_ttl{600};
    std::chrono::seconds sweep_interval{60};    // zero disables the periodic registry sweep

    // Throws errors::InputError when a value is out of range.
    void validate() const;
};

} // namespace config
