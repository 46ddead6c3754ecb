#pragma once

#include <array>
#include <cstdint>
#include "config.hpp"

namespace protocol {

// Every sealed chunk on the wire is preceded by its length:
//   uint32 big-endian sealed_size || nonce(16) || tag(16) || ciphertext
struct FrameHeader {
    uint32_t sealed_size;
};

constexpr size_t FRAME_HEADER_SIZE = 4;

// Largest sealed frame a conforming sender produces
constexpr uint32_t MAX_SEALED_SIZE = static_cast<uint32_t>(config::SEALED_OVERHEAD + config::CHUNK_SIZE);

std::array<uint8_t, FRAME_HEADER_SIZE> serialize_frame_header(const FrameHeader& header);
FrameHeader deserialize_frame_header(const std::array<uint8_t, FRAME_HEADER_SIZE>& buffer);

// Throws errors::NetworkError for lengths outside (SEALED_OVERHEAD, MAX_SEALED_SIZE]
void validate_frame_header(const FrameHeader& header);

} // namespace protocol
