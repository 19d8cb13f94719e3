/**
 * @file backup_api.hpp
 * @brief High-level API for interacting with the DumpVault backup system.
 *
 * Provides a simplified interface for running backups, restoring, fetching from the remote
 * store and listing artifacts, abstracting the underlying backup orchestration. Configuration
 * errors are reported as error values instead of exceptions.
 */

#ifndef BACKUP_API_HPP
#define BACKUP_API_HPP

#include <string>
#include <vector>
#include <optional>
#include <expected>
#include <chrono>
#include <filesystem>
#include "backup.hpp"

namespace fs = std::filesystem;

/**
 * @brief API for managing backups in DumpVault.
 *
 * Every call loads the configuration file afresh and serves as the primary entry point for
 * external applications.
 */
class BackupAPI {
public:
    /**
     * @brief Runs one backup cycle.
     *
     * @param configFile Path to the JSON configuration file.
     * @return std::expected<CycleSummary, std::string> What the cycle did, or an error message.
     */
    static std::expected<CycleSummary, std::string> runBackup(const std::string& configFile);

    /**
     * @brief Restores the latest backup day, or the latest day before @p before.
     */
    static std::expected<std::vector<std::string>, std::string> restore(const std::string& configFile,
                                                                        std::optional<std::chrono::year_month_day> before = std::nullopt);

    /**
     * @brief Downloads remote artifacts matching a name or wildcard pattern.
     */
    static std::expected<std::vector<fs::path>, std::string> fetch(const std::string& configFile,
                                                                   const std::string& pattern,
                                                                   const fs::path& destDir);

    /**
     * @brief Lists local artifacts with their retention class.
     */
    static std::expected<std::vector<ArtifactStatus>, std::string> status(const std::string& configFile);
};

#endif // BACKUP_API_HPP
