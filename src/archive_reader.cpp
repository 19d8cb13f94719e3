#include "archive_reader.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <format>
#include <memory>
#include <vector>
#include <cctype>

namespace {

struct ReadArchiveDeleter {
    void operator()(struct archive* a) const { archive_read_free(a); }
};

bool hasSqlExtension(const std::string& name) {
    if (name.size() < 4) {
        return false;
    }
    std::string ext = name.substr(name.size() - 4);
    for (auto& c : ext) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return ext == ".sql";
}

} // namespace

std::expected<ArchiveContents, std::string> readSqlEntry(const fs::path& path, const ByteSink& sink) {
    std::unique_ptr<struct archive, ReadArchiveDeleter> a(archive_read_new());
    if (!a) {
        return std::unexpected("Failed to allocate archive reader");
    }
    archive_read_support_format_zip(a.get());
    if (archive_read_open_filename(a.get(), path.c_str(), 10240) != ARCHIVE_OK) {
        return std::unexpected(std::format("Failed to open archive: {} (error: {})", path.string(), archive_error_string(a.get())));
    }

    ArchiveContents contents;
    std::vector<char> buf(kStreamChunkSize);
    struct archive_entry* entry;
    int rc;
    while ((rc = archive_read_next_header(a.get(), &entry)) == ARCHIVE_OK) {
        ++contents.entryCount;
        const char* rawName = archive_entry_pathname(entry);
        std::string name = rawName ? rawName : "";
        if (!contents.sqlEntry.empty() || !hasSqlExtension(name)) {
            if (archive_read_data_skip(a.get()) != ARCHIVE_OK) {
                return std::unexpected(std::format("Failed to skip {} in {}: {}", name, path.string(), archive_error_string(a.get())));
            }
            continue;
        }

        contents.sqlEntry = name;
        la_ssize_t count;
        while ((count = archive_read_data(a.get(), buf.data(), buf.size())) > 0) {
            contents.sqlBytes += static_cast<std::uintmax_t>(count);
            if (sink) {
                if (auto result = sink(std::string_view(buf.data(), static_cast<std::size_t>(count))); !result) {
                    return std::unexpected(result.error());
                }
            }
        }
        if (count < 0) {
            return std::unexpected(std::format("Failed to read {} from {}: {}", name, path.string(), archive_error_string(a.get())));
        }
    }
    if (rc != ARCHIVE_EOF) {
        return std::unexpected(std::format("Corrupt archive {}: {}", path.string(), archive_error_string(a.get())));
    }
    return contents;
}
