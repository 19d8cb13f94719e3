#include <gtest/gtest.h>
#include "backup.hpp"
#include "test_support.hpp"

#include <limits>
#include <map>
#include <set>

namespace {

class FakeDatabase : public DatabaseBackupStrategy {
public:
    std::expected<std::vector<std::string>, std::string> listDatabases() override { return databases; }

    std::expected<bool, std::string> serverIsMariaDB() override { return true; }

    std::expected<std::string, std::string> exportUsers(bool) override {
        if (exportFails) {
            return std::unexpected("mysqlpump: unknown option");
        }
        return std::string("CREATE USER 'app'@'%' IDENTIFIED BY PASSWORD '*HASH';\n"
                           "GRANT SELECT ON `shop`.* TO 'app'@'%';\n");
    }

    std::expected<void, std::string> dump(const std::string& database, bool, const ByteSink& sink) override {
        if (failing.contains(database)) {
            return std::unexpected("Lost connection to server during query");
        }
        return sink("-- dump of " + database + "\n");
    }

    std::expected<void, std::string> restore(const ByteProducer& source) override {
        std::string sql;
        auto result = source([&sql](std::string_view chunk) -> std::expected<void, std::string> {
            sql.append(chunk);
            return {};
        });
        if (!result) {
            return result;
        }
        restored.push_back(sql);
        return {};
    }

    std::vector<std::string> databases{"shop", "blog"};
    std::set<std::string> failing;
    bool exportFails = false;
    std::vector<std::string> restored;
};

class RecordingNotifier : public NotificationStrategy {
public:
    std::expected<void, std::string> notify(const std::string& subject, const std::string& message) override {
        sent.emplace_back(subject, message);
        return {};
    }

    std::vector<std::pair<std::string, std::string>> sent;
};

} // namespace

class BackupCycleTest : public TempDirTest {
protected:
    Backup makeBackup(bool withRemote = true) {
        Json::Value root(Json::objectValue);
        root["backup_dir"] = (dir / "local").string();
        root["mysql_hostname"] = "db-primary";
        root["min_free_bytes"] = 0;
        if (withRemote) {
            root["remote"]["backup_dir"] = (dir / "remote").string();
        }
        auto fake = std::make_unique<FakeDatabase>();
        database = fake.get();
        auto notifierPtr = std::make_unique<RecordingNotifier>();
        notifier = notifierPtr.get();
        auto reporterPtr = std::make_unique<RecordingReporter>();
        reporter = reporterPtr.get();
        return Backup(BackupConfig(root), std::move(reporterPtr), std::move(fake), std::move(notifierPtr));
    }

    std::string artifactName(const std::string& database) const {
        return makeArtifactName(localToday(), "db-primary", database);
    }

    FakeDatabase* database = nullptr;
    RecordingNotifier* notifier = nullptr;
    RecordingReporter* reporter = nullptr;
};

TEST_F(BackupCycleTest, WritesOneArtifactPerDatabaseAndSyncs) {
    Backup backup = makeBackup();
    auto summary = backup.runCycle();
    ASSERT_TRUE(summary) << summary.error();

    EXPECT_EQ(summary->written.size(), 2u);
    ASSERT_TRUE(summary->sync);
    EXPECT_EQ(summary->sync->uploaded.size(), 2u);
    EXPECT_TRUE(fs::exists(dir / "remote" / artifactName("shop")));
    EXPECT_TRUE(notifier->sent.empty());

    for (const auto& name : {artifactName("shop"), artifactName("blog")}) {
        EXPECT_TRUE(Backup::verifyArchive(dir / "local" / name)) << name;
    }
}

TEST_F(BackupCycleTest, RestoreReplaysLatestDay) {
    Backup backup = makeBackup(false);
    ASSERT_TRUE(backup.runCycle());

    auto restored = backup.restore();
    ASSERT_TRUE(restored) << restored.error();
    EXPECT_EQ(restored->size(), 2u);
    ASSERT_EQ(database->restored.size(), 2u);

    // Sorted by name: blog before shop. Only shop carries the account.
    EXPECT_EQ(database->restored[0], "-- dump of blog\n");
    EXPECT_EQ(database->restored[1],
              "-- dump of shop\n\n\nCREATE USER IF NOT EXISTS 'app'@'%' IDENTIFIED BY PASSWORD '*HASH';\n"
              "GRANT SELECT ON `shop`.* TO 'app'@'%';\n\nFLUSH PRIVILEGES;\n");
}

TEST_F(BackupCycleTest, FailedDatabaseIsReportedOthersStillWritten) {
    Backup backup = makeBackup();
    database->failing.insert("blog");

    auto summary = backup.runCycle();
    ASSERT_FALSE(summary);
    EXPECT_NE(summary.error().find(artifactName("blog")), std::string::npos);
    EXPECT_TRUE(fs::exists(dir / "local" / artifactName("shop")));
    EXPECT_FALSE(fs::exists(dir / "local" / artifactName("blog")));
    ASSERT_EQ(notifier->sent.size(), 1u);
    EXPECT_NE(notifier->sent[0].first.find("db-primary"), std::string::npos);
    // Sync is skipped for a failed cycle.
    EXPECT_FALSE(fs::exists(dir / "remote" / artifactName("shop")));
}

TEST_F(BackupCycleTest, UserExportFailureOnlyWarns) {
    Backup backup = makeBackup(false);
    database->exportFails = true;

    ASSERT_TRUE(backup.runCycle());
    EXPECT_TRUE(reporter->warned("User export failed"));
    ASSERT_TRUE(backup.restore());
    EXPECT_EQ(database->restored[1], "-- dump of shop\n");
}

TEST_F(BackupCycleTest, NoDatabasesIsNotAnError) {
    Backup backup = makeBackup();
    database->databases.clear();
    auto summary = backup.runCycle();
    ASSERT_TRUE(summary);
    EXPECT_TRUE(summary->written.empty());
    EXPECT_FALSE(summary->sync);
}

TEST_F(BackupCycleTest, StatusClassifiesArtifacts) {
    Backup backup = makeBackup(false);
    fs::create_directories(dir / "local");
    writeFile(dir / "local" / "mysql_backup_20241231_db-primary_shop.zip", "x");
    writeFile(dir / "local" / "mysql_backup_20250115_db-primary_shop.zip", "x");

    auto status = backup.status();
    ASSERT_TRUE(status);
    ASSERT_EQ(status->size(), 2u);
    EXPECT_EQ((*status)[0].retentionClass, RetentionClass::Yearly);
    EXPECT_EQ((*status)[1].retentionClass, RetentionClass::Daily);
}

TEST_F(BackupCycleTest, VerifyRejectsNonArchives) {
    fs::create_directories(dir / "local");
    writeFile(dir / "local" / "broken.zip", "not a zip file at all");
    EXPECT_FALSE(Backup::verifyArchive(dir / "local" / "broken.zip"));
    EXPECT_FALSE(Backup::verifyArchive(dir / "local" / "missing.zip"));
}

TEST_F(BackupCycleTest, RestoreWithoutBackupsFails) {
    Backup backup = makeBackup(false);
    EXPECT_FALSE(backup.restore());
}

TEST_F(BackupCycleTest, NextBackupTimeIsWithinOneDay) {
    Backup backup = makeBackup(false);
    auto now = std::chrono::system_clock::now();
    auto next = backup.getNextBackupTime();
    EXPECT_GT(next, now);
    EXPECT_LE(next - now, std::chrono::hours{25});
}

TEST_F(BackupCycleTest, UnreadableFreeSpaceOnlyWarns) {
    RecordingReporter recorder;
    EXPECT_TRUE(checkFreeSpace(dir / "no-such-directory", 1024, recorder));
    EXPECT_TRUE(recorder.warned("Failed to query free space"));
}

TEST_F(BackupCycleTest, InsufficientFreeSpaceFails) {
    RecordingReporter recorder;
    auto result = checkFreeSpace(dir, std::numeric_limits<std::uintmax_t>::max(), recorder);
    ASSERT_FALSE(result);
    EXPECT_NE(result.error().find("Not enough free space"), std::string::npos);
}
