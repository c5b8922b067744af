#pragma once

// ============================================================
// archive.hpp -- Archive reader seen from the worker:
//                raw bytes in, named lazy entries out
// ============================================================

#include "../common/platform.hpp"
#include <string>
#include <vector>
#include <functional>
#include <memory>

struct ArchiveEntry {
    std::string name;   // path inside the archive
    bool        is_dir{false};
    // Produces the entry's bytes on demand; throws RelayError(ENGINE_FAILURE)
    std::function<std::vector<u8>()> read;
};

// An opened archive; entries stay readable while it is alive
class OpenArchive {
public:
    virtual ~OpenArchive() = default;
    virtual const std::vector<ArchiveEntry>& entries() const = 0;
};

class ArchiveReader {
public:
    virtual ~ArchiveReader() = default;

    // Throws RelayError(ENGINE_FAILURE) when the bytes are not a readable archive
    virtual std::unique_ptr<OpenArchive> open(std::vector<u8> bytes) = 0;
};
