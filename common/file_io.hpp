#pragma once

// ============================================================
// file_io.hpp -- Whole-file reads via mmap, result writing,
//                scratch directories
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>
#include <stdexcept>
#include <cstdint>
#include <filesystem>
#include <functional>

namespace fs = std::filesystem;

namespace file_io {

// ---- MmapReader: zero-copy read via mmap ----
class MmapReader {
public:
    explicit MmapReader(const std::string& path);
    ~MmapReader();

    MmapReader(const MmapReader&) = delete;
    MmapReader& operator=(const MmapReader&) = delete;

    const char* data() const { return data_; }
    u64 size() const { return size_; }

    // Bytes available from offset, clamped to max_len
    u64 chunk_len(u64 offset, u64 max_len) const {
        if (offset >= size_) return 0;
        u64 remaining = size_ - offset;
        return remaining < max_len ? remaining : max_len;
    }

    void close();

private:
    const char* data_{nullptr};
    u64 size_{0};
    int fd_{-1};
};

// Scratch directory removed (recursively) on destruction
class TempDir {
public:
    // Creates <system temp>/<prefix>XXXXXX
    explicit TempDir(const std::string& prefix);
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

// ---- Utility functions ----

// Read a whole file; throws std::runtime_error if it cannot be opened.
// progress(done, total) is called after every block when given.
std::vector<u8> read_file(const std::string& path,
                          const std::function<void(u64, u64)>& progress = nullptr);

// Create or truncate path and write data
void write_file(const std::string& path, const std::vector<u8>& data);

// Join a peer-supplied file name onto root_dir.
// Throws if the name is absolute or escapes root_dir.
fs::path safe_join(const fs::path& root_dir, const std::string& relative_path);

// Create parent directories if they don't exist
void ensure_parent_dirs(const std::string& path);

} // namespace file_io
