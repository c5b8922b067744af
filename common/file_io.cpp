// ============================================================
// file_io.cpp -- File helpers implementation
// ============================================================

#include "file_io.hpp"
#include <vector>
#include <fstream>
#include <cstring>
#include <stdexcept>
#include <string>
#include <algorithm>
#include <filesystem>
#include <functional>

#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <cstdlib>

namespace fs = std::filesystem;
using namespace file_io;

// Progress is reported once per block of this many bytes
static constexpr u64 READ_BLOCK = 4ull * 1024 * 1024;

// ============================================================
// MmapReader
// ============================================================

MmapReader::MmapReader(const std::string& path) {
    fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) {
        throw std::runtime_error("Cannot open file: " + path + ": " + strerror(errno));
    }

    struct stat st{};
    if (fstat(fd_, &st) != 0) {
        ::close(fd_);
        throw std::runtime_error("fstat failed: " + path);
    }
    if (!S_ISREG(st.st_mode)) {
        ::close(fd_);
        throw std::runtime_error("Not a regular file: " + path);
    }
    size_ = (u64)st.st_size;

    if (size_ == 0) {
        data_ = nullptr;
        return;
    }

    void* p = mmap(nullptr, (size_t)size_, PROT_READ, MAP_SHARED, fd_, 0);
    if (p == MAP_FAILED) {
        ::close(fd_);
        throw std::runtime_error("mmap failed: " + path);
    }
    madvise(p, (size_t)size_, MADV_SEQUENTIAL);
    data_ = static_cast<const char*>(p);
}

MmapReader::~MmapReader() {
    close();
}

void MmapReader::close() {
    if (data_ && size_ > 0) { munmap((void*)data_, (size_t)size_); data_ = nullptr; }
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
    size_ = 0;
}

// ============================================================
// TempDir
// ============================================================

TempDir::TempDir(const std::string& prefix) {
    std::string tmpl = (fs::temp_directory_path() / (prefix + "XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (!::mkdtemp(buf.data())) {
        throw std::runtime_error("mkdtemp failed: " + tmpl + ": " + strerror(errno));
    }
    path_ = fs::path(buf.data());
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

// ============================================================
// Utility functions
// ============================================================

std::vector<u8> file_io::read_file(const std::string& path,
                                   const std::function<void(u64, u64)>& progress) {
    MmapReader reader(path);
    std::vector<u8> out;
    out.reserve((size_t)reader.size());
    u64 offset = 0;
    while (offset < reader.size()) {
        u64 n = reader.chunk_len(offset, READ_BLOCK);
        const u8* p = reinterpret_cast<const u8*>(reader.data() + offset);
        out.insert(out.end(), p, p + n);
        offset += n;
        if (progress) progress(offset, reader.size());
    }
    return out;
}

void file_io::write_file(const std::string& path, const std::vector<u8>& data) {
    ensure_parent_dirs(path);
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) {
        throw std::runtime_error("Cannot create file: " + path);
    }
    f.write(reinterpret_cast<const char*>(data.data()), (std::streamsize)data.size());
    if (!f) {
        throw std::runtime_error("Write failed: " + path);
    }
}

fs::path file_io::safe_join(const fs::path& root_dir, const std::string& relative_path) {
    // Security: reject absolute paths and path traversal
    if (relative_path.empty()) {
        throw std::runtime_error("Empty relative path");
    }
    if (relative_path[0] == '/' || relative_path[0] == '\\') {
        throw std::runtime_error("Absolute path rejected: " + relative_path);
    }

    fs::path full = (root_dir / fs::path(relative_path)).lexically_normal();
    fs::path rel  = full.lexically_relative(root_dir.lexically_normal());
    if (rel.empty() || *rel.begin() == ".." || rel == ".") {
        throw std::runtime_error("Path escapes root directory: " + relative_path);
    }
    return full;
}

void file_io::ensure_parent_dirs(const std::string& path) {
    fs::path p(path);
    auto parent = p.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent);
    }
}
