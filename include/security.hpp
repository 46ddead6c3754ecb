#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>
#include "config.hpp"

namespace security {

using Salt = std::array<uint8_t, config::SALT_SIZE>;

// 32-byte symmetric key, wiped on destruction.
class Key {
public:
    Key() = default;
    ~Key();
    Key(const Key& other) = default;
    Key& operator=(const Key& other) = default;

    uint8_t* data() { return bytes_.data(); }
    const uint8_t* data() const { return bytes_.data(); }
    static constexpr size_t size() { return config::KEY_SIZE; }

    bool operator==(const Key& other) const;
    bool operator!=(const Key& other) const { return !(*this == other); }

private:
    std::array<uint8_t, config::KEY_SIZE> bytes_{};
};

// Generate a random 6-digit rendezvous code ("000000"-"999999")
std::string generate_code();

// True for exactly CODE_LENGTH ASCII digits
bool is_valid_code(const std::string& code);

Salt generate_salt();

// Standard (padded) base64, as carried in the metadata record
std::string encode_salt(const Salt& salt);

// Throws errors::InputError unless the text decodes to exactly SALT_SIZE bytes
Salt decode_salt(const std::string& text);

// PBKDF2-HMAC-SHA256, KDF_ITERATIONS rounds
Key derive_key(const std::string& password, const Salt& salt);

// Seal one chunk with AES-256-GCM under a fresh random nonce.
// Output layout: nonce(16) || tag(16) || ciphertext
std::vector<uint8_t> seal_chunk(const Key& key, const uint8_t* data, size_t size);

// Inverse of seal_chunk. Throws errors::CryptoError when the tag does not verify.
std::vector<uint8_t> open_chunk(const Key& key, const uint8_t* sealed, size_t size);

inline std::vector<uint8_t> seal_chunk(const Key& key, const std::vector<uint8_t>& data) {
    return seal_chunk(key, data.data(), data.size());
}

inline std::vector<uint8_t> open_chunk(const Key& key, const std::vector<uint8_t>& sealed) {
    return open_chunk(key, sealed.data(), sealed.size());
}

// Zero a password or other secret held in a std::string
void wipe(std::string& secret);

} // namespace security
