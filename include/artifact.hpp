/**
 * @file artifact.hpp
 * @brief Backup artifact naming and discovery.
 *
 * An artifact is one archive per (date, host, database), named
 * mysql_backup_<YYYYMMDD>_<host>_<database>.zip. The date in the name is the backup date and
 * the only date used for retention. Files whose names do not match the pattern are ignored.
 */

#ifndef ARTIFACT_HPP
#define ARTIFACT_HPP

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <expected>
#include <chrono>
#include <cstdint>
#include <filesystem>

namespace fs = std::filesystem;

inline constexpr std::string_view kArtifactPrefix = "mysql_backup_";
inline constexpr std::string_view kArtifactExtension = ".zip";
inline constexpr std::string_view kSidecarExtension = ".sav";

/**
 * @brief One archive file, local or remote.
 */
struct BackupArtifact {
    std::string name;                               ///< File name; the identity across local and remote.
    fs::path path;                                  ///< Full path of the file.
    std::chrono::year_month_day date;               ///< Backup date encoded in the name.
    std::chrono::system_clock::time_point modTime;  ///< Observed modification time (sync only).
    std::uintmax_t size = 0;                        ///< Observed size in bytes (sync only).
};

/**
 * @brief Builds the artifact file name for one database backup.
 *
 * @param date Backup date.
 * @param hostToken Host part, already passed through hostTokenForFile().
 * @param database Logical database name.
 */
std::string makeArtifactName(std::chrono::year_month_day date, const std::string& hostToken, const std::string& database);

/**
 * @brief Makes a host name safe for file names.
 *
 * Empty hosts become "localhost"; every character other than ASCII letters, digits, '_', '-'
 * and '.' becomes '_'.
 */
std::string hostTokenForFile(const std::string& host);

/**
 * @brief Extracts the backup date from an artifact name.
 *
 * @return std::optional<std::chrono::year_month_day> The date, or no value if @p name is not
 * an artifact name or its eight digits are not a valid calendar date.
 */
std::optional<std::chrono::year_month_day> parseArtifactDate(std::string_view name);

bool isArtifactName(std::string_view name);

/// Formats a date as YYYYMMDD.
std::string formatCompactDate(std::chrono::year_month_day date);

/// Parses a YYYYMMDD string.
std::optional<std::chrono::year_month_day> parseCompactDate(std::string_view text);

/// Returns the recovery sidecar path (.sav) for an artifact path.
fs::path sidecarPathFor(const fs::path& artifactPath);

/// Today's date in the local time zone.
std::chrono::year_month_day localToday();

/**
 * @brief Lists the artifacts in a local directory.
 *
 * A missing directory yields an empty list. The result is sorted by date, then by name.
 *
 * @param dir Directory to scan.
 * @return std::expected<std::vector<BackupArtifact>, std::string> Artifacts or an error message.
 */
std::expected<std::vector<BackupArtifact>, std::string> listLocalArtifacts(const fs::path& dir);

/**
 * @brief Selects every artifact of the most recent backup day.
 *
 * @param artifacts Artifacts sorted by date.
 * @param before If set, only days strictly before this date are considered.
 */
std::vector<BackupArtifact> artifactsOfLatestDay(const std::vector<BackupArtifact>& artifacts,
                                                 std::optional<std::chrono::year_month_day> before = std::nullopt);

#endif // ARTIFACT_HPP
