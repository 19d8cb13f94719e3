#include "backup.hpp"
#include "archive_reader.hpp"
#include "archive_writer.hpp"
#include "user_grants.hpp"
#include <thread>
#include <sstream>
#include <iomanip>
#include <csignal>
#include <ctime>
#include <format>
#include <system_error>

namespace {

volatile std::sig_atomic_t gShutdownFlag = 0;

void signalHandler(int /*sig*/) {
    gShutdownFlag = 1;
}

std::string formatLocalTime(std::chrono::system_clock::time_point tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::stringstream ss;
    ss << std::put_time(std::localtime(&t), "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

} // namespace

Backup::Backup(const std::string& configFile) : config(configFile) {
    reporter = std::make_unique<LogFileReporter>(config.logFile, config.errorLogFile);
    dbStrategy = std::make_unique<MySQLBackupStrategy>(config.mysql, *reporter);
    if (config.email.enabled()) {
        notificationStrategy = std::make_unique<EmailNotificationStrategy>(config.email);
    }
}

Backup::Backup(BackupConfig config,
               std::unique_ptr<Reporter> reporter,
               std::unique_ptr<DatabaseBackupStrategy> dbStrategy,
               std::unique_ptr<NotificationStrategy> notificationStrategy)
    : config(std::move(config)),
      reporter(std::move(reporter)),
      dbStrategy(std::move(dbStrategy)),
      notificationStrategy(std::move(notificationStrategy)) {}

void Backup::notifyFailure(const std::string& subject, const std::string& message) {
    if (!notificationStrategy) {
        return;
    }
    auto host = config.hostForArtifacts();
    auto result = notificationStrategy->notify(std::format("[DumpVault] {} on {}", subject, host), message);
    if (!result) {
        reporter->warn(result.error());
    }
}

std::expected<void, std::string> checkFreeSpace(const fs::path& dir, std::uintmax_t minFreeBytes, Reporter& reporter) {
    std::error_code ec;
    auto info = fs::space(dir, ec);
    if (ec) {
        reporter.warn(std::format("Failed to query free space of {}: {}", dir.string(), ec.message()));
        return {};
    }
    if (info.available < minFreeBytes) {
        return std::unexpected(std::format("Not enough free space in {}: {} MiB available, {} MiB required",
                                           dir.string(), info.available / (1024 * 1024), minFreeBytes / (1024 * 1024)));
    }
    return {};
}

std::expected<std::optional<SyncReport>, std::string> Backup::syncToRemote(std::chrono::year_month_day today) {
    if (!config.remote.enabled()) {
        return std::optional<SyncReport>{};
    }
    auto transport = makeRemoteTransport(config.remote, *reporter);
    if (!transport) {
        return std::unexpected(transport.error());
    }

    auto pruned = pruneRemote(**transport, config.remote.backupDir, config.retention, today, *reporter);
    if (!pruned) {
        reporter->warn(std::format("Remote retention failed: {}", pruned.error()));
    }

    auto local = listLocalArtifacts(config.backupDir);
    if (!local) {
        return std::unexpected(local.error());
    }
    auto report = syncRemote(*local, **transport, config.remote.backupDir, config.remote.encryptionPassword, *reporter);
    if (!report) {
        return std::unexpected(report.error());
    }
    return std::optional<SyncReport>{std::move(*report)};
}

std::expected<CycleSummary, std::string> Backup::runCycle() {
    std::error_code ec;
    fs::create_directories(config.backupDir, ec);
    if (ec) {
        auto errorMsg = std::format("Failed to create backup directory {}: {}", config.backupDir, ec.message());
        reporter->error(errorMsg);
        notifyFailure("Backup failed", errorMsg);
        return std::unexpected(errorMsg);
    }

    if (auto space = checkFreeSpace(config.backupDir, config.minFreeBytes, *reporter); !space) {
        reporter->error(space.error());
        notifyFailure("Backup failed", space.error());
        return std::unexpected(space.error());
    }

    if (int recovered = recoverSidecars(config.backupDir, *reporter); recovered > 0) {
        reporter->info(std::format("Recovered {} interrupted artifact(s)", recovered));
    }

    auto isMariaDB = dbStrategy->serverIsMariaDB();
    if (!isMariaDB) {
        auto errorMsg = std::format("Failed to query server version: {}", isMariaDB.error());
        reporter->error(errorMsg);
        notifyFailure("Backup failed", errorMsg);
        return std::unexpected(errorMsg);
    }

    auto databases = dbStrategy->listDatabases();
    if (!databases) {
        auto errorMsg = std::format("Failed to list databases: {}", databases.error());
        reporter->error(errorMsg);
        notifyFailure("Backup failed", errorMsg);
        return std::unexpected(errorMsg);
    }

    CycleSummary summary;
    if (databases->empty()) {
        reporter->info("No databases to back up");
        return summary;
    }

    std::string exportSql;
    if (auto users = dbStrategy->exportUsers(*isMariaDB); users) {
        exportSql = std::move(*users);
    } else {
        reporter->warn(std::format("User export failed, artifacts will not carry accounts: {}", users.error()));
    }
    auto grants = redistributeGrants(exportSql, reporter.get());
    reporter->info(std::format("Exported {} account(s)", grants.accounts.size()));

    const auto today = localToday();
    const auto hostToken = hostTokenForFile(config.hostForArtifacts());
    std::vector<std::string> failures;
    for (const auto& database : *databases) {
        auto name = makeArtifactName(today, hostToken, database);
        auto target = fs::path(config.backupDir) / name;
        std::string fragment;
        if (auto it = grants.fragmentsByDatabase.find(database); it != grants.fragmentsByDatabase.end()) {
            fragment = it->second;
        }

        const bool mariaDB = *isMariaDB;
        ByteProducer producer = [this, &database, mariaDB](const ByteSink& sink) {
            return dbStrategy->dump(database, mariaDB, sink);
        };
        auto written = writeArtifact(target, database, producer, fragment, *reporter);
        if (!written) {
            reporter->error(std::format("Failed to write {}: {}", name, written.error()));
            failures.push_back(std::format("{}: {}", name, written.error()));
            continue;
        }
        reporter->info(std::format("Wrote {}", name));
        summary.written.push_back(name);
    }

    if (!failures.empty()) {
        std::string errorMsg = std::format("{} of {} artifact(s) failed", failures.size(), databases->size());
        std::string body = errorMsg;
        for (const auto& failure : failures) {
            body += "\n" + failure;
        }
        notifyFailure("Backup failed", body);
        return std::unexpected(body);
    }

    auto pruned = pruneLocalDirectory(config.backupDir, config.retention, today, *reporter);
    if (pruned) {
        summary.pruned = std::move(*pruned);
    } else {
        reporter->warn(std::format("Local retention failed: {}", pruned.error()));
    }

    auto synced = syncToRemote(today);
    if (!synced) {
        auto errorMsg = std::format("Remote sync failed: {}", synced.error());
        reporter->error(errorMsg);
        notifyFailure("Remote sync failed", errorMsg);
        return std::unexpected(errorMsg);
    }
    summary.sync = std::move(*synced);

    reporter->info(std::format("Backup cycle completed: {} written, {} pruned", summary.written.size(), summary.pruned.size()));
    return summary;
}

std::expected<void, std::string> Backup::verifyArchive(const fs::path& artifactPath) {
    auto contents = readSqlEntry(artifactPath, ByteSink{});
    if (!contents) {
        return std::unexpected(contents.error());
    }
    if (contents->sqlEntry.empty()) {
        return std::unexpected(std::format("No .sql entry in {}", artifactPath.string()));
    }
    if (contents->entryCount != 1) {
        return std::unexpected(std::format("Expected one entry in {}, found {}", artifactPath.string(), contents->entryCount));
    }
    return {};
}

std::expected<std::vector<std::string>, std::string> Backup::restore(std::optional<std::chrono::year_month_day> before) {
    auto artifacts = listLocalArtifacts(config.backupDir);
    if (!artifacts) {
        return std::unexpected(artifacts.error());
    }
    auto selected = artifactsOfLatestDay(*artifacts, before);
    if (selected.empty()) {
        return std::unexpected(before ? std::format("No backups before {} in {}", formatCompactDate(*before), config.backupDir)
                                      : std::format("No backups in {}", config.backupDir));
    }

    std::vector<std::string> restored;
    for (const auto& artifact : selected) {
        if (auto valid = verifyArchive(artifact.path); !valid) {
            return std::unexpected(std::format("Refusing to restore {}: {}", artifact.name, valid.error()));
        }
        reporter->info(std::format("Restoring {}", artifact.name));
        ByteProducer source = [&artifact](const ByteSink& sink) -> std::expected<void, std::string> {
            auto contents = readSqlEntry(artifact.path, sink);
            if (!contents) {
                return std::unexpected(contents.error());
            }
            return {};
        };
        if (auto result = dbStrategy->restore(source); !result) {
            auto errorMsg = std::format("Restore of {} failed: {}", artifact.name, result.error());
            reporter->error(errorMsg);
            return std::unexpected(errorMsg);
        }
        restored.push_back(artifact.name);
    }
    reporter->info(std::format("Restored {} artifact(s)", restored.size()));
    return restored;
}

std::expected<std::vector<ArtifactStatus>, std::string> Backup::status() const {
    auto artifacts = listLocalArtifacts(config.backupDir);
    if (!artifacts) {
        return std::unexpected(artifacts.error());
    }
    std::vector<ArtifactStatus> statuses;
    statuses.reserve(artifacts->size());
    for (auto& artifact : *artifacts) {
        auto retentionClass = classify(artifact.date);
        statuses.push_back({std::move(artifact), retentionClass});
    }
    return statuses;
}

std::expected<std::vector<fs::path>, std::string> Backup::fetch(const std::string& pattern, const fs::path& destDir) {
    if (!config.remote.enabled()) {
        return std::unexpected("No remote backup directory is configured");
    }
    auto transport = makeRemoteTransport(config.remote, *reporter);
    if (!transport) {
        return std::unexpected(transport.error());
    }
    return fetchRemote(pattern, destDir, **transport, config.remote.backupDir, config.remote.encryptionPassword, *reporter);
}

std::chrono::system_clock::time_point Backup::getNextBackupTime() const {
    auto now = std::chrono::system_clock::now();
    auto nowT = std::chrono::system_clock::to_time_t(now);
    std::tm tmNext = *std::localtime(&nowT);

    const auto offset = config.scheduleOffset.count();
    tmNext.tm_hour = static_cast<int>(offset / 3600);
    tmNext.tm_min = static_cast<int>((offset / 60) % 60);
    tmNext.tm_sec = static_cast<int>(offset % 60);
    tmNext.tm_isdst = -1;

    auto nextTime = std::chrono::system_clock::from_time_t(std::mktime(&tmNext));
    if (nextTime <= now) {
        tmNext.tm_mday += 1;
        tmNext.tm_isdst = -1;
        nextTime = std::chrono::system_clock::from_time_t(std::mktime(&tmNext));
    }
    return nextTime;
}

void Backup::runDaemon() {
    gShutdownFlag = 0;
    struct sigaction sa{};
    sa.sa_handler = signalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    reporter->info(std::format("Daemon mode started, daily backup at {}", config.scheduleTime));

    while (!gShutdownFlag) {
        auto nextBackup = getNextBackupTime();
        reporter->info(std::format("Next backup scheduled at {}", formatLocalTime(nextBackup)));

        while (!gShutdownFlag && std::chrono::system_clock::now() < nextBackup) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
        if (gShutdownFlag) {
            break;
        }

        // runCycle has already logged and mailed its failure.
        if (auto result = runCycle(); !result) {
            reporter->warn("Backup cycle ended with errors, waiting for the next schedule");
        }
    }
    reporter->info("Daemon shutting down gracefully");
}
