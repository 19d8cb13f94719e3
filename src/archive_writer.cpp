#include "archive_writer.hpp"
#include "artifact.hpp"
#include "reporter.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <format>
#include <ctime>
#include <system_error>
#include <vector>

ArchiveWriter::ArchiveWriter(fs::path targetPath, std::string entryName, Reporter& reporter)
    : target(std::move(targetPath)), sidecar(sidecarPathFor(target)), entryName(std::move(entryName)), reporter(reporter) {}

ArchiveWriter::~ArchiveWriter() {
    if (writeState == WriteState::Staged || writeState == WriteState::Writing) {
        rollback();
    }
}

std::expected<void, std::string> ArchiveWriter::fail(std::string message) {
    rollback();
    return std::unexpected(std::move(message));
}

std::expected<void, std::string> ArchiveWriter::open() {
    if (writeState != WriteState::Clean) {
        return std::unexpected(std::format("Archive writer for {} was already used", target.string()));
    }

    std::error_code ec;
    if (fs::exists(sidecar, ec)) {
        return std::unexpected(std::format("Unresolved recovery file {} is in the way", sidecar.string()));
    }
    if (fs::exists(target, ec)) {
        fs::rename(target, sidecar, ec);
        if (ec) {
            return std::unexpected(std::format("Failed to move {} to {}: {}", target.string(), sidecar.string(), ec.message()));
        }
        movedToSidecar = true;
    }
    writeState = WriteState::Staged;

    handle = archive_write_new();
    if (!handle) {
        return fail("Failed to allocate archive writer");
    }
    archive_write_set_format_zip(handle);
    archive_write_zip_set_compression_deflate(handle);
    if (archive_write_open_filename(handle, target.c_str()) != ARCHIVE_OK) {
        return fail(std::format("Failed to create archive file: {} (error: {})", target.string(), archive_error_string(handle)));
    }

    // Size is left unset so the entry is streamed with a trailing data descriptor.
    struct archive_entry* entry = archive_entry_new();
    archive_entry_set_pathname(entry, entryName.c_str());
    archive_entry_set_filetype(entry, AE_IFREG);
    archive_entry_set_perm(entry, 0644);
    archive_entry_set_mtime(entry, std::time(nullptr), 0);
    int result = archive_write_header(handle, entry);
    archive_entry_free(entry);
    if (result != ARCHIVE_OK) {
        return fail(std::format("Failed to write archive header for {}: {}", entryName, archive_error_string(handle)));
    }
    writeState = WriteState::Writing;
    return {};
}

std::expected<void, std::string> ArchiveWriter::write(std::string_view data) {
    if (writeState != WriteState::Writing) {
        return std::unexpected(std::format("Archive {} is not open for writing", target.string()));
    }
    if (data.empty()) {
        return {};
    }
    la_ssize_t written = archive_write_data(handle, data.data(), data.size());
    if (written < 0 || static_cast<std::size_t>(written) != data.size()) {
        return fail(std::format("Failed to write to archive {}: {}", target.string(), archive_error_string(handle)));
    }
    return {};
}

std::expected<void, std::string> ArchiveWriter::commit() {
    if (writeState != WriteState::Writing) {
        return std::unexpected(std::format("Archive {} is not open for writing", target.string()));
    }
    if (archive_write_finish_entry(handle) != ARCHIVE_OK || archive_write_close(handle) != ARCHIVE_OK) {
        return fail(std::format("Failed to finalize archive {}: {}", target.string(), archive_error_string(handle)));
    }
    archive_write_free(handle);
    handle = nullptr;
    writeState = WriteState::Committed;

    if (movedToSidecar) {
        std::error_code ec;
        fs::remove(sidecar, ec);
        if (ec) {
            reporter.warn(std::format("Failed to remove recovery file {}: {}", sidecar.string(), ec.message()));
        }
    }
    return {};
}

void ArchiveWriter::rollback() {
    if (writeState != WriteState::Staged && writeState != WriteState::Writing) {
        return;
    }
    if (handle) {
        archive_write_free(handle);
        handle = nullptr;
    }

    std::error_code ec;
    fs::remove(target, ec);
    if (ec) {
        reporter.error(std::format("Failed to remove partial archive {}: {}", target.string(), ec.message()));
    }
    if (movedToSidecar) {
        fs::rename(sidecar, target, ec);
        if (ec) {
            reporter.error(std::format("Failed to restore {} from {}: {}", target.string(), sidecar.string(), ec.message()));
        } else {
            reporter.warn(std::format("Restored previous backup {}", target.filename().string()));
        }
    }
    writeState = WriteState::RolledBack;
}

std::expected<void, std::string> writeArtifact(const fs::path& targetPath,
                                               const std::string& database,
                                               const ByteProducer& dump,
                                               const std::string& grantFragment,
                                               Reporter& reporter) {
    ArchiveWriter writer(targetPath, database + ".sql", reporter);
    if (auto result = writer.open(); !result) {
        return result;
    }

    auto sink = [&writer](std::string_view chunk) { return writer.write(chunk); };
    if (auto result = dump(sink); !result) {
        writer.rollback();
        return std::unexpected(std::format("Dump of database {} failed: {}", database, result.error()));
    }

    if (!grantFragment.empty()) {
        std::string trailer = std::format("\n\n{}\n\nFLUSH PRIVILEGES;\n", grantFragment);
        if (auto result = writer.write(trailer); !result) {
            return result;
        }
    }
    return writer.commit();
}

int recoverSidecars(const fs::path& dir, Reporter& reporter) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return 0;
    }

    // Collected first; resolving renames entries of the directory being scanned.
    std::vector<fs::path> sidecars;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code typeError;
        if (it->is_regular_file(typeError) && it->path().extension() == kSidecarExtension) {
            sidecars.push_back(it->path());
        }
    }
    if (ec) {
        reporter.warn(std::format("Failed to scan {} for recovery files: {}", dir.string(), ec.message()));
    }

    int resolved = 0;
    for (const auto& sidecar : sidecars) {
        fs::path archivePath = sidecar;
        archivePath.replace_extension(kArtifactExtension);
        if (!isArtifactName(archivePath.filename().string())) {
            continue;
        }

        std::error_code opError;
        if (!fs::exists(archivePath, opError)) {
            fs::rename(sidecar, archivePath, opError);
            if (opError) {
                reporter.warn(std::format("Failed to recover {}: {}", sidecar.filename().string(), opError.message()));
                continue;
            }
            reporter.info(std::format("Recovered backup {} from interrupted cycle", archivePath.filename().string()));
            ++resolved;
            continue;
        }

        std::uintmax_t sidecarSize = fs::file_size(sidecar, opError);
        std::uintmax_t archiveSize = opError ? 0 : fs::file_size(archivePath, opError);
        if (opError) {
            reporter.warn(std::format("Failed to compare {} with its recovery file: {}", archivePath.filename().string(), opError.message()));
            continue;
        }

        if (sidecarSize >= archiveSize) {
            fs::remove(archivePath, opError);
            if (!opError) {
                fs::rename(sidecar, archivePath, opError);
            }
            if (opError) {
                reporter.warn(std::format("Failed to restore {} from recovery file: {}", archivePath.filename().string(), opError.message()));
                continue;
            }
            reporter.info(std::format("Restored {} from recovery file ({} >= {} bytes)", archivePath.filename().string(), sidecarSize, archiveSize));
        } else {
            fs::remove(sidecar, opError);
            if (opError) {
                reporter.warn(std::format("Failed to remove recovery file {}: {}", sidecar.filename().string(), opError.message()));
                continue;
            }
            reporter.info(std::format("Kept newer {} and removed its recovery file", archivePath.filename().string()));
        }
        ++resolved;
    }
    return resolved;
}
