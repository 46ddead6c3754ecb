#include "protocol/file_meta.hpp"
#include "errors.hpp"
#include "security.hpp"
#include <filesystem>

namespace protocol {

std::string encode_file_meta(const FileMeta& meta) {
    nlohmann::json j = meta;
    return j.dump() + "\n";
}

std::string sanitize_file_name(const std::string& name) {
    std::string base = std::filesystem::path(name).filename().string();
    if (base == "." || base == "..") return "";
    for (char c : base) {
        if (c == '\0' || c == '/' || c == '\\') return "";
    }
    return base;
}

FileMeta decode_file_meta(const std::string& line) {
    FileMeta meta;
    try {
        nlohmann::json j = nlohmann::json::parse(line);
        meta = j.get<FileMeta>();
    } catch (const nlohmann::json::exception& e) {
        throw errors::NetworkError(std::string("Malformed metadata record: ") + e.what());
    }

    if (meta.transfer_id.empty()) {
        throw errors::NetworkError("Malformed metadata record: empty transfer_id");
    }
    const std::string clean_name = sanitize_file_name(meta.file_name);
    if (clean_name.empty() || clean_name != meta.file_name) {
        throw errors::NetworkError("Malformed metadata record: unsafe file name '" + meta.file_name + "'");
    }
    if (!meta.is_compressed && meta.compressed_size != meta.original_size) {
        throw errors::NetworkError("Malformed metadata record: uncompressed payload size mismatch");
    }
    if (!security::is_valid_code(meta.transfer_code)) {
        throw errors::NetworkError("Malformed metadata record: invalid transfer code");
    }
    try {
        security::decode_salt(meta.salt);
    } catch (const errors::InputError& e) {
        throw errors::NetworkError(std::string("Malformed metadata record: ") + e.what());
    }
    return meta;
}

} // namespace protocol
