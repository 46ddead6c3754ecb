#include "protocol/packet.hpp"
#include "errors.hpp"
#include <arpa/inet.h>
#include <cstring>
#include <string>

namespace protocol {

std::array<uint8_t, FRAME_HEADER_SIZE> serialize_frame_header(const FrameHeader& header) {
    std::array<uint8_t, FRAME_HEADER_SIZE> buffer;
    uint32_t size = htonl(header.sealed_size);
    std::memcpy(buffer.data(), &size, 4);
    return buffer;
}

FrameHeader deserialize_frame_header(const std::array<uint8_t, FRAME_HEADER_SIZE>& buffer) {
    uint32_t size;
    std::memcpy(&size, buffer.data(), 4);
    return FrameHeader{ntohl(size)};
}

void validate_frame_header(const FrameHeader& header) {
    if (header.sealed_size <= config::SEALED_OVERHEAD || header.sealed_size > MAX_SEALED_SIZE) {
        throw errors::NetworkError("Malformed frame: sealed length " + std::to_string(header.sealed_size));
    }
}

} // namespace protocol
