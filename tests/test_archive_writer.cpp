#include <gtest/gtest.h>
#include "archive_writer.hpp"
#include "archive_reader.hpp"
#include "test_support.hpp"

namespace {

const std::string kArtifact = "mysql_backup_20250301_localhost_shop.zip";
const std::string kSidecar = "mysql_backup_20250301_localhost_shop.sav";

ByteProducer produce(std::vector<std::string> chunks) {
    return [chunks = std::move(chunks)](const ByteSink& sink) -> std::expected<void, std::string> {
        for (const auto& chunk : chunks) {
            if (auto result = sink(chunk); !result) {
                return result;
            }
        }
        return {};
    };
}

std::string readEntry(const fs::path& path) {
    std::string content;
    auto contents = readSqlEntry(path, [&content](std::string_view chunk) -> std::expected<void, std::string> {
        content.append(chunk);
        return {};
    });
    EXPECT_TRUE(contents) << (contents ? "" : contents.error());
    return content;
}

} // namespace

class ArchiveWriterTest : public TempDirTest {
protected:
    RecordingReporter reporter;
};

TEST_F(ArchiveWriterTest, WritesDumpAndGrantTrailer) {
    auto result = writeArtifact(dir / kArtifact, "shop", produce({"CREATE TABLE t (id INT);\n", "INSERT INTO t VALUES (1);"}),
                                "CREATE USER IF NOT EXISTS 'u'@'%';", reporter);
    ASSERT_TRUE(result) << result.error();

    auto contents = readSqlEntry(dir / kArtifact, ByteSink{});
    ASSERT_TRUE(contents);
    EXPECT_EQ(contents->entryCount, 1);
    EXPECT_EQ(contents->sqlEntry, "shop.sql");
    EXPECT_EQ(readEntry(dir / kArtifact),
              "CREATE TABLE t (id INT);\nINSERT INTO t VALUES (1);\n\nCREATE USER IF NOT EXISTS 'u'@'%';\n\nFLUSH PRIVILEGES;\n");
    EXPECT_FALSE(fs::exists(dir / kSidecar));
}

TEST_F(ArchiveWriterTest, NoTrailerWithoutGrants) {
    ASSERT_TRUE(writeArtifact(dir / kArtifact, "shop", produce({"SELECT 1;"}), "", reporter));
    EXPECT_EQ(readEntry(dir / kArtifact), "SELECT 1;");
}

TEST_F(ArchiveWriterTest, ReplacesExistingArtifactOnCommit) {
    ASSERT_TRUE(writeArtifact(dir / kArtifact, "shop", produce({"old"}), "", reporter));
    ASSERT_TRUE(writeArtifact(dir / kArtifact, "shop", produce({"new"}), "", reporter));
    EXPECT_EQ(readEntry(dir / kArtifact), "new");
    EXPECT_FALSE(fs::exists(dir / kSidecar));
}

TEST_F(ArchiveWriterTest, FailedDumpRestoresOriginalByteForByte) {
    ASSERT_TRUE(writeArtifact(dir / kArtifact, "shop", produce({"original dump"}), "", reporter));
    const std::string before = readFile(dir / kArtifact);

    ByteProducer failing = [](const ByteSink& sink) -> std::expected<void, std::string> {
        if (auto result = sink("partial output"); !result) {
            return result;
        }
        return std::unexpected("mysqldump exited with status 2");
    };
    auto result = writeArtifact(dir / kArtifact, "shop", failing, "", reporter);
    ASSERT_FALSE(result);
    EXPECT_NE(result.error().find("Dump of database shop failed"), std::string::npos);
    EXPECT_NE(result.error().find("status 2"), std::string::npos);

    EXPECT_EQ(readFile(dir / kArtifact), before);
    EXPECT_FALSE(fs::exists(dir / kSidecar));
    EXPECT_TRUE(reporter.warned("Restored previous backup"));
}

TEST_F(ArchiveWriterTest, FailedDumpWithoutPreviousLeavesNothing) {
    ByteProducer failing = [](const ByteSink&) -> std::expected<void, std::string> {
        return std::unexpected("connection refused");
    };
    ASSERT_FALSE(writeArtifact(dir / kArtifact, "shop", failing, "", reporter));
    EXPECT_FALSE(fs::exists(dir / kArtifact));
    EXPECT_FALSE(fs::exists(dir / kSidecar));
}

TEST_F(ArchiveWriterTest, DestructorRollsBackUncommittedWrite) {
    writeFile(dir / kArtifact, "previous artifact bytes");
    {
        ArchiveWriter writer(dir / kArtifact, "shop.sql", reporter);
        ASSERT_TRUE(writer.open());
        EXPECT_EQ(writer.state(), WriteState::Writing);
        EXPECT_TRUE(fs::exists(dir / kSidecar));
        ASSERT_TRUE(writer.write("half a dump"));
    }
    EXPECT_EQ(readFile(dir / kArtifact), "previous artifact bytes");
    EXPECT_FALSE(fs::exists(dir / kSidecar));
}

TEST_F(ArchiveWriterTest, OpenRefusesUnresolvedSidecar) {
    writeFile(dir / kSidecar, "left over");
    ArchiveWriter writer(dir / kArtifact, "shop.sql", reporter);
    EXPECT_FALSE(writer.open());
    EXPECT_EQ(writer.state(), WriteState::Clean);
    EXPECT_EQ(readFile(dir / kSidecar), "left over");
}

TEST_F(ArchiveWriterTest, WriteAfterCommitIsRejected) {
    ArchiveWriter writer(dir / kArtifact, "shop.sql", reporter);
    ASSERT_TRUE(writer.open());
    ASSERT_TRUE(writer.commit());
    EXPECT_EQ(writer.state(), WriteState::Committed);
    EXPECT_FALSE(writer.write("late"));
}

class SidecarRecoveryTest : public TempDirTest {
protected:
    RecordingReporter reporter;
};

TEST_F(SidecarRecoveryTest, OrphanSidecarBecomesArtifact) {
    writeFile(dir / kSidecar, "saved");
    EXPECT_EQ(recoverSidecars(dir, reporter), 1);
    EXPECT_EQ(readFile(dir / kArtifact), "saved");
    EXPECT_FALSE(fs::exists(dir / kSidecar));
}

TEST_F(SidecarRecoveryTest, LargerSidecarWins) {
    writeFile(dir / kArtifact, "tiny");
    writeFile(dir / kSidecar, "complete previous artifact");
    EXPECT_EQ(recoverSidecars(dir, reporter), 1);
    EXPECT_EQ(readFile(dir / kArtifact), "complete previous artifact");
    EXPECT_FALSE(fs::exists(dir / kSidecar));
}

TEST_F(SidecarRecoveryTest, EqualSizeKeepsSidecar) {
    writeFile(dir / kArtifact, "aaaa");
    writeFile(dir / kSidecar, "bbbb");
    EXPECT_EQ(recoverSidecars(dir, reporter), 1);
    EXPECT_EQ(readFile(dir / kArtifact), "bbbb");
}

TEST_F(SidecarRecoveryTest, LargerArtifactWins) {
    writeFile(dir / kArtifact, "a much larger new artifact");
    writeFile(dir / kSidecar, "old");
    EXPECT_EQ(recoverSidecars(dir, reporter), 1);
    EXPECT_EQ(readFile(dir / kArtifact), "a much larger new artifact");
    EXPECT_FALSE(fs::exists(dir / kSidecar));
}

TEST_F(SidecarRecoveryTest, ForeignSavFilesAreIgnored) {
    writeFile(dir / "settings.sav", "game state");
    EXPECT_EQ(recoverSidecars(dir, reporter), 0);
    EXPECT_TRUE(fs::exists(dir / "settings.sav"));
    EXPECT_EQ(recoverSidecars(dir / "absent", reporter), 0);
}

TEST_F(SidecarRecoveryTest, SidecarNamedDirectoriesAreSkipped) {
    fs::create_directories(dir / kSidecar);
    EXPECT_EQ(recoverSidecars(dir, reporter), 0);
    EXPECT_TRUE(fs::is_directory(dir / kSidecar));
    EXPECT_TRUE(reporter.warnings.empty());
}
