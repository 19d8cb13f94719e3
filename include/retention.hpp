/**
 * @file retention.hpp
 * @brief Calendar classification of backup dates and window-based pruning.
 *
 * Retention is decided by the backup date in the artifact name, never by file timestamps.
 * Several artifacts share a date when several databases are backed up per cycle; all of them
 * are kept or deleted together.
 */

#ifndef RETENTION_HPP
#define RETENTION_HPP

#include <string>
#include <vector>
#include <set>
#include <functional>
#include <expected>
#include <chrono>
#include "artifact.hpp"

class Reporter;

/**
 * @brief Calendar bucket of a backup date.
 *
 * Precedence: Yearly (Dec 31) > Monthly (last day of month) > Weekly (Sunday) > Daily.
 */
enum class RetentionClass {
    Daily,
    Weekly,
    Monthly,
    Yearly
};

std::string toString(RetentionClass retentionClass);

/**
 * @brief Classifies a date into exactly one retention class.
 */
RetentionClass classify(std::chrono::year_month_day date);

bool isLastDayOfMonth(std::chrono::year_month_day date);

/**
 * @brief Retention counts for the four calendar buckets.
 */
struct RetentionPolicy {
    int retainDaily = 14;    ///< Calendar days kept, counted back from today.
    int retainWeekly = 3;    ///< Most recent Sundays kept.
    int retainMonthly = 3;   ///< Most recent month ends kept, the current month's end included.
    int retainYearly = 3;    ///< Most recent Dec 31 dates kept, never before year 2000.
};

/**
 * @brief Dates protected from deletion for one pruning run.
 */
struct KeepSets {
    std::chrono::sys_days dailyCutoff;          ///< Dates on or after this day are kept.
    std::set<std::chrono::sys_days> sundays;
    std::set<std::chrono::sys_days> monthEnds;
    std::set<std::chrono::sys_days> yearEnds;
};

/**
 * @brief Computes the keep-sets for @p policy as seen from @p today.
 */
KeepSets computeKeepSets(std::chrono::year_month_day today, const RetentionPolicy& policy);

/**
 * @brief Returns true if @p date is inside the daily window or a member of any other keep-set.
 *
 * Membership is a union: a date is kept by any rule that covers it, regardless of its own class.
 */
bool isRetained(std::chrono::year_month_day date, const KeepSets& keepSets);

/// Deletes one artifact; returns an error message on failure.
using ArtifactDeleter = std::function<std::expected<void, std::string>(const BackupArtifact&)>;

/**
 * @brief Deletes every artifact outside the retention windows.
 *
 * Deletion failures are reported as warnings and skipped.
 *
 * @param artifacts Candidate artifacts.
 * @param policy Retention counts.
 * @param today Reference date.
 * @param deleter Deletes one artifact from its store.
 * @param reporter Sink for deletions and failures.
 * @return std::vector<std::string> Names of the artifacts that were deleted.
 */
std::vector<std::string> pruneArtifacts(const std::vector<BackupArtifact>& artifacts,
                                        const RetentionPolicy& policy,
                                        std::chrono::year_month_day today,
                                        const ArtifactDeleter& deleter,
                                        Reporter& reporter);

/**
 * @brief Prunes the artifacts of a local directory.
 *
 * A missing or empty directory is not an error.
 *
 * @return std::expected<std::vector<std::string>, std::string> Deleted names, or an error if the
 * directory cannot be listed.
 */
std::expected<std::vector<std::string>, std::string> pruneLocalDirectory(const fs::path& dir,
                                                                         const RetentionPolicy& policy,
                                                                         std::chrono::year_month_day today,
                                                                         Reporter& reporter);

#endif // RETENTION_HPP
