#include <gtest/gtest.h>
#include "backup_config.hpp"
#include "test_support.hpp"

#include <stdexcept>

namespace {

Json::Value parse(const std::string& text) {
    Json::Value root;
    Json::Reader reader;
    EXPECT_TRUE(reader.parse(text, root)) << reader.getFormattedErrorMessages();
    return root;
}

} // namespace

TEST(BackupConfigTest, DefaultsForEmptyObject) {
    BackupConfig config{Json::Value(Json::objectValue)};
    EXPECT_EQ(config.mysql.host, "localhost");
    EXPECT_EQ(config.mysql.port, 3306);
    EXPECT_EQ(config.mysql.user, "root");
    EXPECT_EQ(config.backupDir, "./backups");
    EXPECT_EQ(config.logFile, (fs::path("./backups") / "dumpvault.log").string());
    EXPECT_EQ(config.retention.retainDaily, 14);
    EXPECT_EQ(config.retention.retainWeekly, 3);
    EXPECT_EQ(config.retention.retainMonthly, 3);
    EXPECT_EQ(config.retention.retainYearly, 3);
    EXPECT_EQ(config.minFreeBytes, 104857600u);
    EXPECT_FALSE(config.remote.enabled());
    EXPECT_FALSE(config.email.enabled());
    EXPECT_EQ(config.scheduleTime, "22:00:00");
    EXPECT_EQ(config.scheduleOffset, std::chrono::hours{22});
}

TEST(BackupConfigTest, ReadsNestedSections) {
    BackupConfig config(parse(R"({
        "mysql_host": "127.0.0.1",
        "mysql_hostname": "db-primary",
        "backup_dir": "/var/backups/mysql",
        "retain_daily": 7,
        "remote": {"backup_dir": "/srv/offsite", "ssh_host": "vault.example.com", "ssh_port": 2222,
                   "encryption_password": "pw"},
        "email": {"to": "ops@example.com", "smtp_url": "smtps://mail.example.com:465"},
        "schedule": {"time": "03:30"}
    })"));
    EXPECT_EQ(config.hostForArtifacts(), "db-primary");
    EXPECT_EQ(config.retention.retainDaily, 7);
    EXPECT_EQ(config.errorLogFile, "/var/backups/mysql/dumpvault-errors.log");
    EXPECT_TRUE(config.remote.enabled());
    EXPECT_TRUE(config.remote.usesSftp());
    EXPECT_EQ(config.remote.sshPort, 2222);
    EXPECT_EQ(config.remote.timeoutSeconds, 30);
    EXPECT_TRUE(config.email.enabled());
    EXPECT_EQ(config.scheduleOffset, std::chrono::hours{3} + std::chrono::minutes{30});
}

TEST(BackupConfigTest, RemoteHostIsUsedForArtifacts) {
    BackupConfig config(parse(R"({"mysql_host": "db.internal", "mysql_hostname": "ignored"})"));
    EXPECT_EQ(config.hostForArtifacts(), "db.internal");
}

TEST(BackupConfigTest, InvalidValuesThrow) {
    EXPECT_THROW(BackupConfig(parse(R"({"retain_weekly": -1})")), std::runtime_error);
    EXPECT_THROW(BackupConfig(parse(R"({"mysql_port": 70000})")), std::runtime_error);
    EXPECT_THROW(BackupConfig(parse(R"({"remote": {"ssh_port": 0}})")), std::runtime_error);
    EXPECT_THROW(BackupConfig(parse(R"({"remote": {"timeout_seconds": 0}})")), std::runtime_error);
    EXPECT_THROW(BackupConfig(parse(R"({"mysql_port": "3306"})")), std::runtime_error);
    EXPECT_THROW(BackupConfig(parse(R"({"backup_dir": ""})")), std::runtime_error);
    EXPECT_THROW(BackupConfig(parse(R"({"schedule": {"time": "25:00"}})")), std::runtime_error);
    EXPECT_THROW(BackupConfig(parse("[1, 2]")), std::runtime_error);
}

class BackupConfigFileTest : public TempDirTest {};

TEST_F(BackupConfigFileTest, LoadsFromFile) {
    writeFile(dir / "dumpvault.json", R"({"backup_dir": "/tmp/dv", "mysql_user": "backup"})");
    BackupConfig config((dir / "dumpvault.json").string());
    EXPECT_EQ(config.mysql.user, "backup");
    EXPECT_EQ(config.backupDir, "/tmp/dv");
}

TEST_F(BackupConfigFileTest, MissingOrBrokenFileThrows) {
    EXPECT_THROW(BackupConfig((dir / "absent.json").string()), std::runtime_error);
    writeFile(dir / "broken.json", "{ not json");
    EXPECT_THROW(BackupConfig((dir / "broken.json").string()), std::runtime_error);
}

TEST(ParseTimeOfDayTest, AcceptsBothForms) {
    EXPECT_EQ(parseTimeOfDay("00:00"), std::chrono::seconds{0});
    EXPECT_EQ(parseTimeOfDay("23:59:59"), std::chrono::seconds{86399});
    EXPECT_THROW(parseTimeOfDay("7:30"), std::runtime_error);
    EXPECT_THROW(parseTimeOfDay("12:60"), std::runtime_error);
    EXPECT_THROW(parseTimeOfDay("12:00:00pm"), std::runtime_error);
    EXPECT_THROW(parseTimeOfDay(""), std::runtime_error);
}
