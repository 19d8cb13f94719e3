#include "backup_api.hpp"
#include <format>

std::expected<CycleSummary, std::string> BackupAPI::runBackup(const std::string& configFile) {
    try {
        Backup backup(configFile);
        return backup.runCycle();
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to start backup: {}", e.what()));
    }
}

std::expected<std::vector<std::string>, std::string> BackupAPI::restore(const std::string& configFile,
                                                                        std::optional<std::chrono::year_month_day> before) {
    try {
        Backup backup(configFile);
        return backup.restore(before);
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to start restore: {}", e.what()));
    }
}

std::expected<std::vector<fs::path>, std::string> BackupAPI::fetch(const std::string& configFile,
                                                                   const std::string& pattern,
                                                                   const fs::path& destDir) {
    try {
        Backup backup(configFile);
        return backup.fetch(pattern, destDir);
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to start fetch: {}", e.what()));
    }
}

std::expected<std::vector<ArtifactStatus>, std::string> BackupAPI::status(const std::string& configFile) {
    try {
        Backup backup(configFile);
        return backup.status();
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to read status: {}", e.what()));
    }
}
