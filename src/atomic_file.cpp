#include "atomic_file.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <limits>
#include <system_error>

namespace storage {

AtomicFilePaths compute_atomic_paths(const std::filesystem::path& final_path) {
    AtomicFilePaths paths;
    paths.final_path = final_path;
    paths.part_path = final_path;
    paths.part_path += config::PART_SUFFIX;
    paths.decompress_path = final_path;
    paths.decompress_path += config::DECOMPRESS_SUFFIX;
    return paths;
}

void atomic_rename(const std::filesystem::path& temp, const std::filesystem::path& final_path) {
    // rename(2) replaces an existing destination atomically on POSIX filesystems
    std::error_code ec;
    std::filesystem::rename(temp, final_path, ec);
    if (ec) {
        throw errors::StorageError("Failed to rename " + temp.string() + " to " +
                                   final_path.string() + ": " + ec.message());
    }
}

uint64_t available_space(const std::filesystem::path& dir) {
    std::error_code ec;
    auto info = std::filesystem::space(dir, ec);
    if (ec) return 0;
    return static_cast<uint64_t>(info.available);
}

uint64_t required_space(uint64_t compressed_size, uint64_t original_size, bool is_compressed) {
    if (!is_compressed) return compressed_size;
    if (original_size > std::numeric_limits<uint64_t>::max() - compressed_size) {
        return std::numeric_limits<uint64_t>::max();
    }
    return compressed_size + original_size;
}

void TempFile::reset(std::filesystem::path path) {
    remove();
    path_ = std::move(path);
}

void TempFile::remove() {
    if (path_.empty()) return;
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        logging::get()->warn("Could not remove temporary file {}: {}", path_.string(), ec.message());
    }
    path_.clear();
}

} // namespace storage
