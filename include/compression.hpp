#pragma once

#include <cstdint>
#include <string>

namespace compression {

// Files strictly larger than COMPRESSION_THRESHOLD are compressed before sending
bool should_compress(uint64_t size);

// Stream `source` into a gzip file at `destination`. Returns the compressed size.
// Throws errors::CompressionError / errors::StorageError.
uint64_t compress_file(const std::string& source, const std::string& destination);

// Inflate `source` into `destination`. Input that is not gzip is copied through
// unchanged, so both compressed and pass-through payloads are accepted.
// Returns the number of bytes written. Throws errors::CompressionError on a corrupt stream.
uint64_t decompress_file(const std::string& source, const std::string& destination);

} // namespace compression
