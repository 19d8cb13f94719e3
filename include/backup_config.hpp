/**
 * @file backup_config.hpp
 * @brief Configuration management for the DumpVault backup system.
 *
 * Defines the configuration class for the server connection, backup directory, retention
 * windows, remote store, notifications and daily schedule.
 *
 * @note Configuration is loaded from a JSON file. Missing keys take their defaults; present
 * keys with invalid values are configuration errors.
 */

#ifndef BACKUP_CONFIG_HPP
#define BACKUP_CONFIG_HPP

#include <string>
#include <chrono>
#include <cstdint>
#include <json/json.h>
#include "database_backup.hpp"
#include "remote_transfer.hpp"
#include "retention.hpp"

/**
 * @brief SMTP settings for failure notifications.
 */
struct EmailSettings {
    std::string to;        ///< Recipient; empty disables notifications.
    std::string smtpUrl;   ///< e.g. "smtps://mail.example.com:465" or "smtp://mail.example.com:587".
    std::string user;      ///< SMTP login; empty = recipient address.
    std::string password;  ///< SMTP password.
    std::string from;      ///< Sender; empty = recipient address.

    bool enabled() const { return !to.empty() && !smtpUrl.empty(); }
};

/**
 * @brief Configuration class for the backup system.
 *
 * Loads and manages settings from a JSON configuration file, providing defaults and validation.
 */
class BackupConfig {
public:
    /**
     * @brief Constructs a configuration instance from a JSON file.
     *
     * @param configFile Path to the JSON configuration file.
     * @throws std::runtime_error If the file is unreadable, not valid JSON, or holds invalid values.
     */
    explicit BackupConfig(const std::string& configFile);

    /**
     * @brief Constructs a configuration instance from parsed JSON.
     *
     * @param configJson Root object of the configuration.
     * @throws std::runtime_error If a value is invalid.
     */
    explicit BackupConfig(const Json::Value& configJson);

    /**
     * @brief Host name used in artifact names.
     *
     * For a local server (localhost or 127.0.0.1) mysql_hostname is used when set.
     */
    std::string hostForArtifacts() const;

    MySQLConnection mysql;                  ///< Server connection for the client tools.
    std::string mysqlHostname;              ///< Artifact host name for local servers.
    std::string backupDir;                  ///< Local artifact directory.
    std::string logFile;                    ///< Path to the log file.
    std::string errorLogFile;               ///< Path to the error log file.
    RetentionPolicy retention;              ///< Retention window counts.
    std::uintmax_t minFreeBytes = 100ull * 1024 * 1024; ///< Free space required before a cycle starts.
    RemoteSettings remote;                  ///< Remote store; disabled if remote.backupDir is empty.
    EmailSettings email;                    ///< Failure notifications.
    std::string scheduleTime;               ///< Daily start time "HH:MM" or "HH:MM:SS".
    std::chrono::seconds scheduleOffset{0}; ///< scheduleTime as an offset from local midnight.

private:
    void load(const Json::Value& configJson);
};

/**
 * @brief Parses "HH:MM" or "HH:MM:SS" into an offset from midnight.
 *
 * @throws std::runtime_error If the text is not a valid time of day.
 */
std::chrono::seconds parseTimeOfDay(const std::string& text);

#endif // BACKUP_CONFIG_HPP
