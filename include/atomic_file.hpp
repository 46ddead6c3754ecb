#pragma once

#include <cstdint>
#include <filesystem>
#include <utility>

namespace storage {

// Temporary paths a receiver uses next to its final destination
struct AtomicFilePaths {
    std::filesystem::path final_path;
    std::filesystem::path part_path;        // received payload, possibly compressed
    std::filesystem::path decompress_path;  // decompressed output awaiting rename
};

AtomicFilePaths compute_atomic_paths(const std::filesystem::path& final_path);

// Rename `temp` over `final_path` in one step. Throws errors::StorageError.
void atomic_rename(const std::filesystem::path& temp, const std::filesystem::path& final_path);

// Free bytes on the filesystem holding `dir`; 0 when unknown
uint64_t available_space(const std::filesystem::path& dir);

// Bytes a receive needs on disk: the payload, plus the inflated copy while both
// exist. Saturates at UINT64_MAX for sizes that would overflow.
uint64_t required_space(uint64_t compressed_size, uint64_t original_size, bool is_compressed);

// Removes the file on destruction unless release() was called
class TempFile {
public:
    TempFile() = default;
    explicit TempFile(std::filesystem::path path) : path_(std::move(path)) {}
    ~TempFile() { remove(); }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
    TempFile(TempFile&& other) noexcept : path_(std::move(other.path_)) { other.path_.clear(); }

    const std::filesystem::path& path() const { return path_; }
    bool armed() const { return !path_.empty(); }

    void reset(std::filesystem::path path);
    void release() { path_.clear(); }
    void remove();

private:
    std::filesystem::path path_;
};

} // namespace storage
