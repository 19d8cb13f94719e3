/**
 * @file remote_sync.hpp
 * @brief Converges a remote store with the local artifact set, and retrieves artifacts from it.
 *
 * The remote directory mirrors the local one: local artifacts that are missing remotely, newer
 * than their remote copy or (with encryption) of the wrong remote size are uploaded; remote
 * artifacts without a local counterpart are deleted. Re-running with unchanged inputs does
 * nothing.
 */

#ifndef REMOTE_SYNC_HPP
#define REMOTE_SYNC_HPP

#include <string>
#include <string_view>
#include <vector>
#include <expected>
#include <chrono>
#include <filesystem>
#include "artifact.hpp"
#include "remote_transfer.hpp"
#include "retention.hpp"

namespace fs = std::filesystem;

class Reporter;

/**
 * @brief Uploads and deletions decided for one sync run.
 */
struct SyncPlan {
    std::vector<BackupArtifact> uploads;  ///< Local artifacts to upload.
    std::vector<RemoteEntry> deletions;   ///< Remote artifacts to delete.
};

/**
 * @brief What a sync run changed.
 */
struct SyncReport {
    std::vector<std::string> uploaded;
    std::vector<std::string> deleted;
};

/**
 * @brief Decides uploads and deletions; touches nothing.
 *
 * Remote entries whose names are not artifact names are ignored. Modification times are
 * compared at whole-second resolution, the resolution SFTP reports.
 *
 * @param local Local artifacts.
 * @param remote Remote directory listing.
 * @param encrypted True if remote copies are encrypted; adds the size check.
 */
SyncPlan planSync(const std::vector<BackupArtifact>& local, const std::vector<RemoteEntry>& remote, bool encrypted);

/**
 * @brief Converts the artifact entries of a remote listing, skipping every other name.
 */
std::vector<BackupArtifact> remoteArtifacts(const std::vector<RemoteEntry>& entries, const std::string& remoteDir);

/**
 * @brief Uploads one artifact, encrypting it if @p passphrase is not empty.
 *
 * A partially written remote file is removed again on failure.
 */
std::expected<void, std::string> uploadArtifact(const BackupArtifact& artifact,
                                                 RemoteTransport& transport,
                                                 const std::string& remotePath,
                                                 const std::string& passphrase,
                                                 Reporter& reporter);

/**
 * @brief Runs one sync of @p local against @p remoteDir.
 *
 * Listing or upload failures abort the run; deletion failures are reported and skipped.
 *
 * @param local Local artifacts, already pruned.
 * @param transport Remote store.
 * @param remoteDir Remote directory; created if missing.
 * @param passphrase Encryption passphrase; empty = plain copies.
 * @param reporter Sink for progress and skipped deletions.
 * @return std::expected<SyncReport, std::string> What changed, or the error that aborted the run.
 */
std::expected<SyncReport, std::string> syncRemote(const std::vector<BackupArtifact>& local,
                                                  RemoteTransport& transport,
                                                  const std::string& remoteDir,
                                                  const std::string& passphrase,
                                                  Reporter& reporter);

/**
 * @brief Applies the retention windows to the remote directory.
 */
std::expected<std::vector<std::string>, std::string> pruneRemote(RemoteTransport& transport,
                                                                 const std::string& remoteDir,
                                                                 const RetentionPolicy& policy,
                                                                 std::chrono::year_month_day today,
                                                                 Reporter& reporter);

/**
 * @brief Returns true if @p pattern is a bare file name (no separators, no "..").
 */
bool isValidFetchPattern(std::string_view pattern);

/**
 * @brief Downloads the artifacts matching @p pattern into @p destDir.
 *
 * The pattern is either a literal artifact name or contains '*' / '?' wildcards matched against
 * the remote listing. A payload that does not start with the ZIP signature is decrypted when a
 * passphrase is given. An existing local file is never overwritten; the download is saved as
 * "<name>.local" instead.
 *
 * @return std::expected<std::vector<fs::path>, std::string> Saved paths, or an error message.
 */
std::expected<std::vector<fs::path>, std::string> fetchRemote(const std::string& pattern,
                                                              const fs::path& destDir,
                                                              RemoteTransport& transport,
                                                              const std::string& remoteDir,
                                                              const std::string& passphrase,
                                                              Reporter& reporter);

#endif // REMOTE_SYNC_HPP
