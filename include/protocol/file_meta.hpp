#pragma once

#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace protocol {

// First record on every connection, sent as one JSON line
struct FileMeta {
    std::string transfer_id;
    std::string file_name;
    uint64_t original_size = 0;
    uint64_t compressed_size = 0;
    std::string salt;               // base64, 16 bytes decoded
    bool is_compressed = false;
    std::string transfer_code;
};

// Map JSON parsing automatically using nlohmann
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(FileMeta, transfer_id, file_name, original_size,
                                   compressed_size, salt, is_compressed, transfer_code)

// JSON object followed by '\n'
std::string encode_file_meta(const FileMeta& meta);

// Parse one record (without its terminator) and check it is self-consistent:
// plain file name, decodable salt, valid code, original == compressed size when
// not compressed. Throws errors::NetworkError for malformed records.
FileMeta decode_file_meta(const std::string& line);

// Reduce a peer-supplied name to a bare file name. Empty when nothing usable remains.
std::string sanitize_file_name(const std::string& name);

} // namespace protocol
