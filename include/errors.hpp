#pragma once

#include <stdexcept>
#include <string>

namespace errors {

// Stable error kinds recorded in the transfer ledger and carried by events.
enum class ErrorKind {
    Input,
    Rendezvous,
    Network,
    Crypto,
    Compression,
    Cancelled,
    Storage,
    Internal
};

const char* to_string(ErrorKind kind);

class TransferError : public std::runtime_error {
public:
    TransferError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// Missing source file, malformed code, invalid options.
class InputError : public TransferError {
public:
    explicit InputError(const std::string& message) : TransferError(ErrorKind::Input, message) {}
};

// Unknown, expired or already consumed rendezvous code.
class RendezvousError : public TransferError {
public:
    explicit RendezvousError(const std::string& message) : TransferError(ErrorKind::Rendezvous, message) {}
};

// Bind/connect/accept exhaustion, timeouts, disconnects, malformed wire data.
class NetworkError : public TransferError {
public:
    explicit NetworkError(const std::string& message) : TransferError(ErrorKind::Network, message) {}
};

// Authentication tag mismatch: wrong password or tampering.
class CryptoError : public TransferError {
public:
    explicit CryptoError(const std::string& message) : TransferError(ErrorKind::Crypto, message) {}
};

class CompressionError : public TransferError {
public:
    explicit CompressionError(const std::string& message) : TransferError(ErrorKind::Compression, message) {}
};

class CancelledError : public TransferError {
public:
    CancelledError() : TransferError(ErrorKind::Cancelled, "Transfer cancelled by user") {}
};

// Local disk problems: open, write, rename, free space.
class StorageError : public TransferError {
public:
    explicit StorageError(const std::string& message) : TransferError(ErrorKind::Storage, message) {}
};

} // namespace errors
