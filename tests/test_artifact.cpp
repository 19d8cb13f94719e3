#include <gtest/gtest.h>
#include "artifact.hpp"
#include "test_support.hpp"

using namespace std::chrono;

TEST(ArtifactNameTest, BuildsConventionalName) {
    EXPECT_EQ(makeArtifactName(2025y / March / 7, "db01.example.com", "shop"),
              "mysql_backup_20250307_db01.example.com_shop.zip");
}

TEST(ArtifactNameTest, HostTokenReplacesUnsafeCharacters) {
    EXPECT_EQ(hostTokenForFile(""), "localhost");
    EXPECT_EQ(hostTokenForFile("db:3306/x"), "db_3306_x");
    EXPECT_EQ(hostTokenForFile("h\xC3\xA9st"), "h_st");
}

TEST(ArtifactNameTest, ParsesOnlyValidNames) {
    auto date = parseArtifactDate("mysql_backup_20250228_host_db.zip");
    ASSERT_TRUE(date);
    EXPECT_EQ(*date, 2025y / February / 28);

    EXPECT_FALSE(parseArtifactDate("mysql_backup_20250230_host_db.zip"));
    EXPECT_FALSE(parseArtifactDate("mysql_backup_2025022_host_db.zip"));
    EXPECT_FALSE(parseArtifactDate("mysql_backup_20250228_host_db.sav"));
    EXPECT_FALSE(parseArtifactDate("pg_backup_20250228_host_db.zip"));
    EXPECT_FALSE(isArtifactName("mysql_backup_20250228.zip"));
}

TEST(ArtifactNameTest, CompactDateRoundTrip) {
    EXPECT_EQ(formatCompactDate(2024y / January / 5), "20240105");
    EXPECT_EQ(parseCompactDate("20240229"), std::optional<year_month_day>(2024y / February / 29));
    EXPECT_FALSE(parseCompactDate("20230229"));
    EXPECT_FALSE(parseCompactDate("2024-1-5"));
}

TEST(ArtifactNameTest, SidecarPath) {
    EXPECT_EQ(sidecarPathFor("/b/mysql_backup_20250101_h_d.zip"), fs::path("/b/mysql_backup_20250101_h_d.sav"));
}

class LocalArtifactsTest : public TempDirTest {};

TEST_F(LocalArtifactsTest, MissingDirectoryIsEmpty) {
    auto artifacts = listLocalArtifacts(dir / "absent");
    ASSERT_TRUE(artifacts);
    EXPECT_TRUE(artifacts->empty());
}

TEST_F(LocalArtifactsTest, UnreadableDirectoryIsAnError) {
    writeFile(dir / "not-a-directory", "x");
    auto artifacts = listLocalArtifacts(dir / "not-a-directory");
    ASSERT_FALSE(artifacts);
    EXPECT_NE(artifacts.error().find("Failed to read backup directory"), std::string::npos);
}

TEST_F(LocalArtifactsTest, SubdirectoriesAreSkipped) {
    fs::create_directories(dir / "mysql_backup_20250101_h_a.zip");
    writeFile(dir / "mysql_backup_20250102_h_a.zip", "a");
    auto artifacts = listLocalArtifacts(dir);
    ASSERT_TRUE(artifacts) << artifacts.error();
    ASSERT_EQ(artifacts->size(), 1u);
    EXPECT_EQ((*artifacts)[0].name, "mysql_backup_20250102_h_a.zip");
}

TEST_F(LocalArtifactsTest, ListsSortedAndIgnoresForeignFiles) {
    writeFile(dir / "mysql_backup_20250102_h_b.zip", "bb");
    writeFile(dir / "mysql_backup_20250101_h_z.zip", "z");
    writeFile(dir / "mysql_backup_20250102_h_a.zip", "a");
    writeFile(dir / "mysql_backup_20250102_h_a.sav", "old");
    writeFile(dir / "notes.txt", "x");

    auto artifacts = listLocalArtifacts(dir);
    ASSERT_TRUE(artifacts);
    ASSERT_EQ(artifacts->size(), 3u);
    EXPECT_EQ((*artifacts)[0].name, "mysql_backup_20250101_h_z.zip");
    EXPECT_EQ((*artifacts)[1].name, "mysql_backup_20250102_h_a.zip");
    EXPECT_EQ((*artifacts)[2].name, "mysql_backup_20250102_h_b.zip");
    EXPECT_EQ((*artifacts)[2].size, 2u);
}

TEST_F(LocalArtifactsTest, LatestDaySelection) {
    writeFile(dir / "mysql_backup_20250101_h_a.zip", "");
    writeFile(dir / "mysql_backup_20250103_h_a.zip", "");
    writeFile(dir / "mysql_backup_20250103_h_b.zip", "");
    auto artifacts = listLocalArtifacts(dir);
    ASSERT_TRUE(artifacts);

    auto latest = artifactsOfLatestDay(*artifacts);
    ASSERT_EQ(latest.size(), 2u);
    EXPECT_EQ(latest[0].date, 2025y / January / 3);

    auto earlier = artifactsOfLatestDay(*artifacts, 2025y / January / 3);
    ASSERT_EQ(earlier.size(), 1u);
    EXPECT_EQ(earlier[0].name, "mysql_backup_20250101_h_a.zip");

    EXPECT_TRUE(artifactsOfLatestDay(*artifacts, 2025y / January / 1).empty());
}
