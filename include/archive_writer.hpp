/**
 * @file archive_writer.hpp
 * @brief Atomic single-entry ZIP writer with sidecar rollback.
 *
 * Before an existing artifact is overwritten it is renamed to its .sav sidecar. The sidecar is
 * deleted only after the new archive has been fully written and closed; on any failure the
 * partial archive is removed and the sidecar is renamed back, so the previous artifact
 * survives byte-identical. Sidecars left behind by a crash are resolved by recoverSidecars()
 * at the start of the next cycle.
 *
 * @note Requires libarchive.
 */

#ifndef ARCHIVE_WRITER_HPP
#define ARCHIVE_WRITER_HPP

#include <string>
#include <string_view>
#include <expected>
#include <filesystem>
#include "byte_stream.hpp"

namespace fs = std::filesystem;

class Reporter;
struct archive;

/**
 * @brief Lifecycle of one artifact write.
 */
enum class WriteState {
    Clean,       ///< Nothing touched yet.
    Staged,      ///< Previous artifact (if any) moved to its sidecar.
    Writing,     ///< Archive created, entry open.
    Committed,   ///< Archive closed, sidecar removed.
    RolledBack   ///< Partial archive removed, previous artifact restored.
};

/**
 * @brief Streams one SQL entry into a new ZIP archive, replacing the target atomically.
 *
 * An ArchiveWriter that is destroyed before commit() rolls back.
 */
class ArchiveWriter {
public:
    /**
     * @brief Constructs a writer; nothing is touched until open().
     *
     * @param targetPath Final artifact path.
     * @param entryName Name of the single entry inside the archive (e.g. "shop.sql").
     * @param reporter Sink for rollback and cleanup messages.
     */
    ArchiveWriter(fs::path targetPath, std::string entryName, Reporter& reporter);
    ~ArchiveWriter();

    ArchiveWriter(const ArchiveWriter&) = delete;
    ArchiveWriter& operator=(const ArchiveWriter&) = delete;

    /**
     * @brief Moves an existing target to its sidecar, creates the archive and opens the entry.
     *
     * Fails without touching anything if an unresolved sidecar is already present.
     */
    std::expected<void, std::string> open();

    /**
     * @brief Appends data to the entry; rolls back on failure.
     */
    std::expected<void, std::string> write(std::string_view data);

    /**
     * @brief Finishes and closes the archive, then deletes the sidecar; rolls back on failure.
     */
    std::expected<void, std::string> commit();

    /**
     * @brief Deletes the partial archive and restores the sidecar. No-op once committed.
     */
    void rollback();

    WriteState state() const { return writeState; }
    const fs::path& targetPath() const { return target; }

private:
    std::expected<void, std::string> fail(std::string message);

    fs::path target;
    fs::path sidecar;
    std::string entryName;
    Reporter& reporter;
    struct archive* handle = nullptr;
    bool movedToSidecar = false;
    WriteState writeState = WriteState::Clean;
};

/**
 * @brief Writes one database artifact.
 *
 * The entry contains the dump bytes, then, if @p grantFragment is not empty, two newlines,
 * the fragment, two newlines and "FLUSH PRIVILEGES;". If the dump producer or the archive
 * fails, the write is rolled back and the error is returned.
 *
 * @param targetPath Final artifact path.
 * @param database Database name; the entry is named "<database>.sql".
 * @param dump Streams the dump bytes into the writer.
 * @param grantFragment Redistributed grants for this database, possibly empty.
 * @param reporter Sink for progress and rollback messages.
 */
std::expected<void, std::string> writeArtifact(const fs::path& targetPath,
                                               const std::string& database,
                                               const ByteProducer& dump,
                                               const std::string& grantFragment,
                                               Reporter& reporter);

/**
 * @brief Resolves every leftover sidecar in @p dir.
 *
 * A sidecar without an archive is renamed back. When both exist, the larger file is kept;
 * the sidecar wins ties. Running it twice changes nothing the second time.
 *
 * @return int Number of sidecars resolved.
 */
int recoverSidecars(const fs::path& dir, Reporter& reporter);

#endif // ARCHIVE_WRITER_HPP
