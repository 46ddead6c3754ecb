#include "compression.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <zlib.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <vector>

namespace compression {

namespace {

constexpr size_t IO_BUFFER_SIZE = 64 * 1024;

struct GzCloser {
    void operator()(gzFile_s* file) const {
        if (file) gzclose(file);
    }
};
using GzFile = std::unique_ptr<gzFile_s, GzCloser>;

std::string gz_error_message(gzFile file) {
    int errnum = Z_OK;
    const char* msg = gzerror(file, &errnum);
    return (msg && *msg) ? msg : "unknown zlib error";
}

} // namespace

bool should_compress(uint64_t size) {
    return size > config::COMPRESSION_THRESHOLD;
}

uint64_t compress_file(const std::string& source, const std::string& destination) {
    std::ifstream in(source, std::ios::binary);
    if (!in.is_open()) {
        throw errors::StorageError("Could not open file for reading: " + source);
    }

    const std::string mode = "wb" + std::to_string(config::COMPRESSION_LEVEL);
    GzFile out(gzopen(destination.c_str(), mode.c_str()));
    if (!out) {
        throw errors::StorageError("Could not open file for writing: " + destination);
    }
    gzbuffer(out.get(), IO_BUFFER_SIZE);

    std::vector<char> buffer(IO_BUFFER_SIZE);
    uint64_t total_in = 0;
    while (in.read(buffer.data(), buffer.size()) || in.gcount() > 0) {
        const auto bytes_read = static_cast<unsigned>(in.gcount());
        if (gzwrite(out.get(), buffer.data(), bytes_read) != static_cast<int>(bytes_read)) {
            throw errors::CompressionError("Compression failed: " + gz_error_message(out.get()));
        }
        total_in += bytes_read;
    }
    if (in.bad()) {
        throw errors::StorageError("Read error on " + source);
    }

    const int rc = gzclose(out.release());
    if (rc != Z_OK) {
        throw errors::CompressionError("Compression finalization failed (zlib code " + std::to_string(rc) + ")");
    }

    std::error_code ec;
    const auto compressed_size = std::filesystem::file_size(destination, ec);
    if (ec) {
        throw errors::StorageError("Could not stat " + destination + ": " + ec.message());
    }
    logging::get()->debug("Compressed {} -> {} bytes ({})", total_in, compressed_size, source);
    return compressed_size;
}

uint64_t decompress_file(const std::string& source, const std::string& destination) {
    GzFile in(gzopen(source.c_str(), "rb"));
    if (!in) {
        throw errors::StorageError("Could not open file for reading: " + source);
    }
    gzbuffer(in.get(), IO_BUFFER_SIZE);

    std::ofstream out(destination, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw errors::StorageError("Could not open file for writing: " + destination);
    }

    std::vector<char> buffer(IO_BUFFER_SIZE);
    uint64_t total_out = 0;
    while (true) {
        const int n = gzread(in.get(), buffer.data(), static_cast<unsigned>(buffer.size()));
        if (n < 0) {
            throw errors::CompressionError("Corrupt compressed stream: " + gz_error_message(in.get()));
        }
        if (n == 0) break;
        out.write(buffer.data(), n);
        if (!out) {
            throw errors::StorageError("Write error on " + destination);
        }
        total_out += static_cast<uint64_t>(n);
    }

    // gzread reports a truncated stream as end of input; gzclose_r surfaces it
    const int rc = gzclose_r(in.release());
    if (rc != Z_OK) {
        throw errors::CompressionError("Corrupt compressed stream (zlib code " + std::to_string(rc) + ")");
    }
    out.close();
    if (!out) {
        throw errors::StorageError("Write error on " + destination);
    }
    return total_out;
}

} // namespace compression
