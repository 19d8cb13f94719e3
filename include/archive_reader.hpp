/**
 * @file archive_reader.hpp
 * @brief Streams the SQL entry out of a backup artifact.
 *
 * @note Requires libarchive.
 */

#ifndef ARCHIVE_READER_HPP
#define ARCHIVE_READER_HPP

#include <string>
#include <expected>
#include <cstdint>
#include <filesystem>
#include "byte_stream.hpp"

namespace fs = std::filesystem;

/**
 * @brief What a full pass over an artifact found.
 */
struct ArchiveContents {
    std::string sqlEntry;            ///< Name of the first ".sql" entry; empty if there is none.
    int entryCount = 0;              ///< Number of entries in the archive.
    std::uintmax_t sqlBytes = 0;     ///< Uncompressed size of the SQL entry.
};

/**
 * @brief Reads every entry of a ZIP artifact, streaming the first ".sql" entry into @p sink.
 *
 * Other entries are skipped. The match on the extension ignores case.
 *
 * @param path Artifact path.
 * @param sink Receives the SQL text in chunks; may be empty to only check readability.
 * @return std::expected<ArchiveContents, std::string> Entry summary, or an error if the archive
 * cannot be read to the end or the sink fails.
 */
std::expected<ArchiveContents, std::string> readSqlEntry(const fs::path& path, const ByteSink& sink);

#endif // ARCHIVE_READER_HPP
