#include "security.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <sodium.h>
#include <openssl/evp.h>
#include <cstdio>
#include <memory>

namespace security {

namespace {

void ensure_sodium() {
    if (sodium_init() < 0) {
        throw errors::TransferError(errors::ErrorKind::Internal, "libsodium initialization failed");
    }
}

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

CipherCtx new_cipher_ctx() {
    CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx) {
        throw errors::TransferError(errors::ErrorKind::Internal, "Failed to create cipher context");
    }
    return ctx;
}

} // namespace

Key::~Key() {
    sodium_memzero(bytes_.data(), bytes_.size());
}

bool Key::operator==(const Key& other) const {
    return sodium_memcmp(bytes_.data(), other.bytes_.data(), bytes_.size()) == 0;
}

std::string generate_code() {
    ensure_sodium();
    uint32_t value = randombytes_uniform(1000000); // 000000–999999
    char buf[config::CODE_LENGTH + 1];
    std::snprintf(buf, sizeof(buf), "%06u", value);
    return std::string(buf, config::CODE_LENGTH);
}

bool is_valid_code(const std::string& code) {
    if (code.size() != config::CODE_LENGTH) return false;
    for (char c : code) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

Salt generate_salt() {
    ensure_sodium();
    Salt salt;
    randombytes_buf(salt.data(), salt.size());
    return salt;
}

std::string encode_salt(const Salt& salt) {
    ensure_sodium();
    const size_t encoded_len = sodium_base64_ENCODED_LEN(salt.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string out(encoded_len, '\0');
    sodium_bin2base64(&out[0], out.size(), salt.data(), salt.size(), sodium_base64_VARIANT_ORIGINAL);
    out.resize(encoded_len - 1); // drop the terminating NUL
    return out;
}

Salt decode_salt(const std::string& text) {
    ensure_sodium();
    // Room for one extra byte so an overlong salt is detected rather than truncated
    std::array<uint8_t, config::SALT_SIZE + 1> buf{};
    size_t bin_len = 0;
    if (sodium_base642bin(buf.data(), buf.size(), text.data(), text.size(),
                          nullptr, &bin_len, nullptr, sodium_base64_VARIANT_ORIGINAL) != 0 ||
        bin_len != config::SALT_SIZE) {
        throw errors::InputError("Salt is not valid base64 of " + std::to_string(config::SALT_SIZE) + " bytes");
    }
    Salt salt;
    std::copy(buf.begin(), buf.begin() + config::SALT_SIZE, salt.begin());
    return salt;
}

Key derive_key(const std::string& password, const Salt& salt) {
    Key key;
    if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                          salt.data(), static_cast<int>(salt.size()),
                          config::KDF_ITERATIONS, EVP_sha256(),
                          static_cast<int>(Key::size()), key.data()) != 1) {
        throw errors::TransferError(errors::ErrorKind::Internal, "PBKDF2 key derivation failed");
    }
    logging::get()->debug("Derived {}-byte key ({} PBKDF2 rounds)", Key::size(), config::KDF_ITERATIONS);
    return key;
}

std::vector<uint8_t> seal_chunk(const Key& key, const uint8_t* data, size_t size) {
    ensure_sodium();
    std::vector<uint8_t> sealed(config::SEALED_OVERHEAD + size);
    uint8_t* nonce = sealed.data();
    uint8_t* tag = sealed.data() + config::NONCE_SIZE;
    uint8_t* ciphertext = sealed.data() + config::SEALED_OVERHEAD;
    randombytes_buf(nonce, config::NONCE_SIZE);

    CipherCtx ctx = new_cipher_ctx();
    int len = 0;
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(config::NONCE_SIZE), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce) != 1) {
        throw errors::TransferError(errors::ErrorKind::Internal, "Failed to initialize encryption");
    }
    if (size > 0 && EVP_EncryptUpdate(ctx.get(), ciphertext, &len, data, static_cast<int>(size)) != 1) {
        throw errors::TransferError(errors::ErrorKind::Internal, "Encryption failed");
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext + len, &final_len) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(config::TAG_SIZE), tag) != 1) {
        throw errors::TransferError(errors::ErrorKind::Internal, "Encryption finalization failed");
    }
    return sealed;
}

std::vector<uint8_t> open_chunk(const Key& key, const uint8_t* sealed, size_t size) {
    if (size < config::SEALED_OVERHEAD) {
        throw errors::CryptoError("Sealed chunk shorter than nonce and tag");
    }
    const uint8_t* nonce = sealed;
    const uint8_t* tag = sealed + config::NONCE_SIZE;
    const uint8_t* ciphertext = sealed + config::SEALED_OVERHEAD;
    const size_t ciphertext_len = size - config::SEALED_OVERHEAD;

    std::vector<uint8_t> plaintext(ciphertext_len);
    CipherCtx ctx = new_cipher_ctx();
    int len = 0;
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(config::NONCE_SIZE), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce) != 1) {
        throw errors::TransferError(errors::ErrorKind::Internal, "Failed to initialize decryption");
    }
    if (ciphertext_len > 0 &&
        EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, ciphertext, static_cast<int>(ciphertext_len)) != 1) {
        throw errors::CryptoError("Decryption failed");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(config::TAG_SIZE),
                            const_cast<uint8_t*>(tag)) != 1) {
        throw errors::TransferError(errors::ErrorKind::Internal, "Failed to set authentication tag");
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + len, &final_len) <= 0) {
        sodium_memzero(plaintext.data(), plaintext.size());
        throw errors::CryptoError("Authentication failed: wrong password or tampered data");
    }
    return plaintext;
}

void wipe(std::string& secret) {
    if (!secret.empty()) {
        sodium_memzero(&secret[0], secret.size());
    }
    secret.clear();
}

} // namespace security
