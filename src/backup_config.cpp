#include "backup_config.hpp"
#include <fstream>
#include <format>
#include <stdexcept>
#include <cstdio>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

int readInt(const Json::Value& object, const char* key, int fallback) {
    const Json::Value& value = object[key];
    if (value.isNull()) {
        return fallback;
    }
    if (!value.isInt()) {
        throw std::runtime_error(std::format("Config value '{}' must be an integer", key));
    }
    return value.asInt();
}

std::string readString(const Json::Value& object, const char* key, const std::string& fallback) {
    const Json::Value& value = object[key];
    if (value.isNull()) {
        return fallback;
    }
    if (!value.isString()) {
        throw std::runtime_error(std::format("Config value '{}' must be a string", key));
    }
    return value.asString();
}

int readRetention(const Json::Value& object, const char* key, int fallback) {
    int count = readInt(object, key, fallback);
    if (count < 0) {
        throw std::runtime_error(std::format("Config value '{}' must not be negative: {}", key, count));
    }
    return count;
}

int readPort(const Json::Value& object, const char* key, int fallback) {
    int port = readInt(object, key, fallback);
    if (port < 1 || port > 65535) {
        throw std::runtime_error(std::format("Config value '{}' is not a valid port: {}", key, port));
    }
    return port;
}

} // namespace

std::chrono::seconds parseTimeOfDay(const std::string& text) {
    int hours = 0;
    int minutes = 0;
    int seconds = 0;
    char trailing = '\0';
    int fields = std::sscanf(text.c_str(), "%2d:%2d:%2d%c", &hours, &minutes, &seconds, &trailing);
    bool shapeOk = (fields == 2 && text.size() == 5) || (fields == 3 && text.size() == 8);
    if (!shapeOk || hours < 0 || hours > 23 || minutes < 0 || minutes > 59 || seconds < 0 || seconds > 59) {
        throw std::runtime_error(std::format("Invalid schedule time '{}': expected HH:MM or HH:MM:SS", text));
    }
    return std::chrono::hours{hours} + std::chrono::minutes{minutes} + std::chrono::seconds{seconds};
}

BackupConfig::BackupConfig(const std::string& configFile) {
    std::ifstream file(configFile);
    if (!file.is_open()) {
        throw std::runtime_error(std::format("Failed to open config file: {}", configFile));
    }
    Json::Value configJson;
    Json::Reader reader;
    if (!reader.parse(file, configJson)) {
        throw std::runtime_error(std::format("Failed to parse config file: {}: {}", configFile, reader.getFormattedErrorMessages()));
    }
    if (!configJson.isObject()) {
        throw std::runtime_error(std::format("Config file {} must contain a JSON object", configFile));
    }
    load(configJson);
}

BackupConfig::BackupConfig(const Json::Value& configJson) {
    if (!configJson.isObject()) {
        throw std::runtime_error("Configuration must be a JSON object");
    }
    load(configJson);
}

void BackupConfig::load(const Json::Value& configJson) {
    mysql.host = readString(configJson, "mysql_host", "localhost");
    mysqlHostname = readString(configJson, "mysql_hostname", "");
    mysql.port = readPort(configJson, "mysql_port", 3306);
    mysql.user = readString(configJson, "mysql_user", "root");
    mysql.password = readString(configJson, "mysql_password", "");
    mysql.binDir = readString(configJson, "mysql_bin", "");

    backupDir = readString(configJson, "backup_dir", "./backups");
    if (backupDir.empty()) {
        throw std::runtime_error("Config value 'backup_dir' must not be empty");
    }
    logFile = readString(configJson, "log_file", (fs::path(backupDir) / "dumpvault.log").string());
    errorLogFile = readString(configJson, "error_log_file", (fs::path(backupDir) / "dumpvault-errors.log").string());

    retention.retainDaily = readRetention(configJson, "retain_daily", 14);
    retention.retainWeekly = readRetention(configJson, "retain_weekly", 3);
    retention.retainMonthly = readRetention(configJson, "retain_monthly", 3);
    retention.retainYearly = readRetention(configJson, "retain_yearly", 3);

    const Json::Value& minFree = configJson["min_free_bytes"];
    if (!minFree.isNull()) {
        if (!minFree.isIntegral() || (minFree.isInt64() && minFree.asInt64() < 0)) {
            throw std::runtime_error("Config value 'min_free_bytes' must be a non-negative integer");
        }
        minFreeBytes = static_cast<std::uintmax_t>(minFree.asUInt64());
    }

    const Json::Value& remoteJson = configJson["remote"];
    if (!remoteJson.isNull()) {
        if (!remoteJson.isObject()) {
            throw std::runtime_error("Config value 'remote' must be an object");
        }
        remote.backupDir = readString(remoteJson, "backup_dir", "");
        remote.sshHost = readString(remoteJson, "ssh_host", "");
        remote.sshPort = readPort(remoteJson, "ssh_port", 22);
        remote.sshUser = readString(remoteJson, "ssh_user", "");
        remote.sshPassword = readString(remoteJson, "ssh_password", "");
        remote.sshKeyFile = readString(remoteJson, "ssh_key_file", "");
        remote.timeoutSeconds = readInt(remoteJson, "timeout_seconds", 30);
        if (remote.timeoutSeconds <= 0) {
            throw std::runtime_error(std::format("Config value 'timeout_seconds' must be positive: {}", remote.timeoutSeconds));
        }
        remote.encryptionPassword = readString(remoteJson, "encryption_password", "");
    }

    const Json::Value& emailJson = configJson["email"];
    if (!emailJson.isNull()) {
        if (!emailJson.isObject()) {
            throw std::runtime_error("Config value 'email' must be an object");
        }
        email.to = readString(emailJson, "to", "");
        email.smtpUrl = readString(emailJson, "smtp_url", "");
        email.user = readString(emailJson, "user", "");
        email.password = readString(emailJson, "password", "");
        email.from = readString(emailJson, "from", "");
    }

    const Json::Value& schedule = configJson["schedule"];
    scheduleTime = schedule.isObject() ? readString(schedule, "time", "22:00:00") : "22:00:00";
    scheduleOffset = parseTimeOfDay(scheduleTime);
}

std::string BackupConfig::hostForArtifacts() const {
    if ((mysql.host == "localhost" || mysql.host == "127.0.0.1") && !mysqlHostname.empty()) {
        return mysqlHostname;
    }
    if (mysql.host.empty()) {
        return "localhost";
    }
    return mysql.host;
}
