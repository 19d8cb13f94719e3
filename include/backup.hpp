/**
 * @file backup.hpp
 * @brief Defines the backup orchestration class for DumpVault.
 *
 * A backup cycle checks free disk space, resolves leftover recovery files, dumps every user
 * database into its own artifact with the database's accounts and grants appended, prunes the
 * local and remote directories and finally mirrors the local artifacts to the remote store.
 * Failures are logged and, when configured, mailed.
 *
 * @note Cycles must not overlap; the backup and remote directories are owned by one running
 * cycle at a time.
 */

#ifndef BACKUP_HPP
#define BACKUP_HPP

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <expected>
#include <filesystem>
#include <chrono>
#include <cstdint>
#include "backup_config.hpp"
#include "database_backup.hpp"
#include "notification.hpp"
#include "remote_sync.hpp"
#include "reporter.hpp"
#include "artifact.hpp"
#include "retention.hpp"

namespace fs = std::filesystem;

/**
 * @brief What one backup cycle did.
 */
struct CycleSummary {
    std::vector<std::string> written;   ///< Artifacts written in this cycle.
    std::vector<std::string> pruned;    ///< Local artifacts deleted by retention.
    std::optional<SyncReport> sync;     ///< Remote changes; empty if no remote is configured.
};

/**
 * @brief One line of the status listing.
 */
struct ArtifactStatus {
    BackupArtifact artifact;
    RetentionClass retentionClass;
};

/**
 * @brief Main backup orchestration class.
 *
 * Coordinates the database strategy, the archive writer, retention, remote sync and
 * notifications based on the provided configuration.
 */
/**
 * @brief Fails if @p dir has less than @p minFreeBytes available.
 *
 * A file system that cannot be queried is only warned about.
 */
std::expected<void, std::string> checkFreeSpace(const fs::path& dir, std::uintmax_t minFreeBytes, Reporter& reporter);

class Backup {
public:
    /**
     * @brief Constructs a backup instance.
     *
     * Loads the configuration and sets up the log reporter, the MySQL strategy and, if
     * configured, email notifications.
     *
     * @param configFile Path to the JSON configuration file.
     * @throws std::runtime_error If the configuration is invalid.
     */
    explicit Backup(const std::string& configFile);

    /**
     * @brief Constructs a backup instance from explicit collaborators.
     *
     * @param config Configuration.
     * @param reporter Log sink.
     * @param dbStrategy Database server access.
     * @param notificationStrategy Failure notifications; may be null.
     */
    Backup(BackupConfig config,
           std::unique_ptr<Reporter> reporter,
           std::unique_ptr<DatabaseBackupStrategy> dbStrategy,
           std::unique_ptr<NotificationStrategy> notificationStrategy = nullptr);

    /**
     * @brief Runs one complete backup cycle.
     *
     * A database whose artifact cannot be written is rolled back and reported; the remaining
     * databases are still backed up, but pruning and sync are skipped for that cycle.
     *
     * @return std::expected<CycleSummary, std::string> What the cycle did, or the first error.
     */
    std::expected<CycleSummary, std::string> runCycle();

    /**
     * @brief Verifies the integrity of a backup artifact.
     *
     * The archive must hold exactly one ".sql" entry that can be read to the end.
     *
     * @param artifactPath Path to the artifact.
     * @return std::expected<void, std::string> Success or a description of the defect.
     */
    static std::expected<void, std::string> verifyArchive(const fs::path& artifactPath);

    /**
     * @brief Replays every artifact of the latest backup day into the server.
     *
     * @param before If set, the latest backup day strictly before this date is used.
     * @return std::expected<std::vector<std::string>, std::string> Restored artifact names or an error message.
     */
    std::expected<std::vector<std::string>, std::string> restore(std::optional<std::chrono::year_month_day> before = std::nullopt);

    /**
     * @brief Lists the local artifacts with their retention class.
     */
    std::expected<std::vector<ArtifactStatus>, std::string> status() const;

    /**
     * @brief Downloads remote artifacts matching @p pattern into @p destDir.
     */
    std::expected<std::vector<fs::path>, std::string> fetch(const std::string& pattern, const fs::path& destDir);

    /**
     * @brief Calculates the next scheduled backup time.
     *
     * @return std::chrono::system_clock::time_point Today's schedule time if still ahead, else tomorrow's.
     */
    std::chrono::system_clock::time_point getNextBackupTime() const;

    /**
     * @brief Runs the backup system in daemon mode.
     *
     * Executes one cycle per day at the schedule time until SIGINT or SIGTERM.
     */
    void runDaemon();

    const BackupConfig& configuration() const { return config; }

private:
    std::expected<std::optional<SyncReport>, std::string> syncToRemote(std::chrono::year_month_day today);
    void notifyFailure(const std::string& subject, const std::string& message);

    BackupConfig config; ///< Backup configuration.
    std::unique_ptr<Reporter> reporter; ///< Log sink.
    std::unique_ptr<DatabaseBackupStrategy> dbStrategy; ///< Database backup strategy.
    std::unique_ptr<NotificationStrategy> notificationStrategy; ///< Notification strategy.
};

#endif // BACKUP_HPP
