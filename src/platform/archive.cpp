#include "archive.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <memory>
#include <vector>

namespace fs = std::filesystem;

namespace platform {

static std::string archive_error(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown error";
}

Result<void> verify_archive(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec) || fs::file_size(path, ec) == 0) {
        return Result<void>::Err("missing or empty: " + path.string());
    }

    std::unique_ptr<struct archive, decltype(&archive_read_free)> a(archive_read_new(),
                                                                    archive_read_free);
    if (!a) return Result<void>::Err("Failed to create archive reader");

    archive_read_support_format_all(a.get());
    archive_read_support_filter_all(a.get());

    if (archive_read_open_filename(a.get(), path.string().c_str(), 65536) != ARCHIVE_OK) {
        return Result<void>::Err(std::string("cannot open archive: ") +
                                 archive_error(a.get()));
    }

    std::vector<char> buf(65536);
    struct archive_entry* entry = nullptr;
    int entries = 0;
    while (true) {
        int rc = archive_read_next_header(a.get(), &entry);
        if (rc == ARCHIVE_EOF) break;
        if (rc != ARCHIVE_OK && rc != ARCHIVE_WARN) {
            return Result<void>::Err(std::string("corrupt header: ") + archive_error(a.get()));
        }
        ++entries;

        // Reading the data is what triggers the per-member CRC check
        la_ssize_t n;
        while ((n = archive_read_data(a.get(), buf.data(), buf.size())) > 0) {}
        if (n < 0) {
            return Result<void>::Err(std::string("corrupt entry ") +
                                     archive_entry_pathname(entry) + ": " +
                                     archive_error(a.get()));
        }
    }

    if (entries == 0) return Result<void>::Err("archive has no entries: " + path.string());
    return Result<void>::Ok();
}

} // namespace platform
