// ============================================================
// unzip_archive.cpp
// ============================================================

#include "unzip_archive.hpp"
#include "subprocess.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"

namespace {

// Archive bytes live in a scratch file for the lifetime of the handle
class UnzipOpenArchive : public OpenArchive {
public:
    UnzipOpenArchive(const std::string& unzip_path, const std::vector<u8>& bytes)
        : scratch_("vidbridge-zip-")
    {
        zip_path_ = (scratch_.path() / "archive.zip").string();
        file_io::write_file(zip_path_, bytes);

        std::vector<u8> listing;
        try {
            listing = subprocess::capture({unzip_path, "-Z1", zip_path_});
        } catch (const std::runtime_error& e) {
            throw RelayError(ErrorKind::ENGINE_FAILURE,
                             std::string("Cannot read archive: ") + e.what());
        }

        std::string text(listing.begin(), listing.end());
        size_t start = 0;
        while (start < text.size()) {
            size_t eol = text.find('\n', start);
            if (eol == std::string::npos) eol = text.size();
            std::string name = text.substr(start, eol - start);
            start = eol + 1;
            if (!name.empty() && name.back() == '\r') name.pop_back();
            if (name.empty()) continue;

            ArchiveEntry entry;
            entry.name   = name;
            entry.is_dir = name.back() == '/';
            std::string exe = unzip_path;
            std::string zip = zip_path_;
            entry.read = [exe, zip, name]() {
                try {
                    // "-p" pipes one member to stdout; names are matched as
                    // wildcards, so escape the pattern characters.
                    std::string pattern;
                    for (char c : name) {
                        if (c == '[' || c == ']' || c == '*' || c == '?' || c == '\\') {
                            pattern += '\\';
                        }
                        pattern += c;
                    }
                    return subprocess::capture({exe, "-p", "-qq", zip, pattern});
                } catch (const std::runtime_error& e) {
                    throw RelayError(ErrorKind::ENGINE_FAILURE,
                                     "Cannot extract " + name + ": " + e.what());
                }
            };
            entries_.push_back(std::move(entry));
        }
        LOG_DEBUG("Archive lists " + std::to_string(entries_.size()) + " entries");
    }

    const std::vector<ArchiveEntry>& entries() const override { return entries_; }

private:
    file_io::TempDir          scratch_;
    std::string               zip_path_;
    std::vector<ArchiveEntry> entries_;
};

} // namespace

UnzipArchiveReader::UnzipArchiveReader(std::string unzip_path)
    : unzip_path_(std::move(unzip_path))
{}

std::unique_ptr<OpenArchive> UnzipArchiveReader::open(std::vector<u8> bytes) {
    return std::make_unique<UnzipOpenArchive>(unzip_path_, bytes);
}
