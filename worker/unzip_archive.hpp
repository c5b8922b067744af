#pragma once

// ============================================================
// unzip_archive.hpp -- ArchiveReader backed by the unzip CLI
//   entries listed with "unzip -Z1", read with "unzip -p"
// ============================================================

#include "archive.hpp"

class UnzipArchiveReader : public ArchiveReader {
public:
    explicit UnzipArchiveReader(std::string unzip_path);

    std::unique_ptr<OpenArchive> open(std::vector<u8> bytes) override;

private:
    std::string unzip_path_;
};
