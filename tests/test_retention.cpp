#include <gtest/gtest.h>
#include "retention.hpp"
#include "test_support.hpp"

using namespace std::chrono;

namespace {

BackupArtifact artifactOn(year_month_day date) {
    std::string name = makeArtifactName(date, "h", "db");
    return BackupArtifact{name, fs::path(name), date, {}, 0};
}

std::vector<BackupArtifact> everyDay(year_month_day from, year_month_day to) {
    std::vector<BackupArtifact> artifacts;
    for (sys_days d{from}; d <= sys_days{to}; d += days{1}) {
        artifacts.push_back(artifactOn(year_month_day{d}));
    }
    return artifacts;
}

} // namespace

TEST(ClassifyTest, CalendarScenarios) {
    EXPECT_EQ(classify(2025y / December / 31), RetentionClass::Yearly);
    EXPECT_EQ(classify(2025y / January / 31), RetentionClass::Monthly);
    EXPECT_EQ(classify(2025y / February / 28), RetentionClass::Monthly);
    EXPECT_EQ(classify(2025y / February / 2), RetentionClass::Weekly);
    EXPECT_EQ(classify(2025y / January / 15), RetentionClass::Daily);
}

TEST(ClassifyTest, YearEndWinsOverSundayAndMonthEnd) {
    // 2028-12-31 is a Sunday.
    EXPECT_EQ(weekday{sys_days{2028y / December / 31}}, Sunday);
    EXPECT_EQ(classify(2028y / December / 31), RetentionClass::Yearly);
    EXPECT_EQ(classify(2024y / February / 29), RetentionClass::Monthly);
    EXPECT_EQ(toString(RetentionClass::Weekly), "weekly");
}

TEST(KeepSetsTest, WindowsCountBackFromToday) {
    RetentionPolicy policy;
    auto keep = computeKeepSets(2025y / March / 12, policy);

    EXPECT_EQ(keep.dailyCutoff, sys_days{2025y / February / 26});
    EXPECT_EQ(keep.sundays, (std::set<sys_days>{sys_days{2025y / March / 9}, sys_days{2025y / March / 2}, sys_days{2025y / February / 23}}));
    EXPECT_EQ(keep.monthEnds, (std::set<sys_days>{sys_days{2025y / March / 31}, sys_days{2025y / February / 28}, sys_days{2025y / January / 31}}));
    EXPECT_EQ(keep.yearEnds, (std::set<sys_days>{sys_days{2025y / December / 31}, sys_days{2024y / December / 31}, sys_days{2023y / December / 31}}));
}

TEST(KeepSetsTest, YearEndsStopAtSanityFloor) {
    RetentionPolicy policy;
    policy.retainYearly = 10;
    auto keep = computeKeepSets(2001y / June / 1, policy);
    EXPECT_EQ(keep.yearEnds.size(), 2u);
}

TEST(KeepSetsTest, RecentArtifactAlwaysKept) {
    RetentionPolicy policy{14, 0, 0, 0};
    auto today = 2025y / March / 12;
    auto keep = computeKeepSets(today, policy);
    EXPECT_TRUE(isRetained(year_month_day{sys_days{today} - days{3}}, keep));
    EXPECT_FALSE(isRetained(year_month_day{sys_days{today} - days{15}}, keep));
}

TEST(KeepSetsTest, OverlappingBucketsKeepUnion) {
    // Weekly count zero, yet a Sunday inside the daily window is kept by the daily bucket and a
    // month end outside it by the monthly bucket.
    RetentionPolicy policy{30, 0, 3, 0};
    auto today = 2025y / March / 12;
    auto keep = computeKeepSets(today, policy);
    EXPECT_TRUE(keep.sundays.empty());
    EXPECT_TRUE(isRetained(2025y / March / 2, keep));
    EXPECT_TRUE(isRetained(2025y / January / 31, keep));
    EXPECT_FALSE(isRetained(2025y / February / 9, keep));
    EXPECT_FALSE(isRetained(2024y / December / 31, keep));
}

TEST(PruneArtifactsTest, DeletesOnlyOutsideWindows) {
    RecordingReporter reporter;
    auto artifacts = everyDay(2024y / December / 1, 2025y / March / 12);
    std::vector<std::string> deletedNames;
    auto deleter = [&](const BackupArtifact& a) -> std::expected<void, std::string> {
        deletedNames.push_back(a.name);
        return {};
    };

    auto deleted = pruneArtifacts(artifacts, RetentionPolicy{}, 2025y / March / 12, deleter, reporter);
    EXPECT_EQ(deleted, deletedNames);

    std::set<std::string> survivors;
    for (const auto& a : artifacts) {
        if (std::ranges::find(deleted, a.name) == deleted.end()) {
            survivors.insert(a.name);
        }
    }
    // 15 daily, Sunday Feb 23, month end Jan 31, year end Dec 31.
    EXPECT_EQ(survivors.size(), 15u + 1u + 1u + 1u);
    EXPECT_TRUE(survivors.contains(makeArtifactName(2024y / December / 31, "h", "db")));
    EXPECT_TRUE(survivors.contains(makeArtifactName(2025y / January / 31, "h", "db")));
    EXPECT_TRUE(survivors.contains(makeArtifactName(2025y / February / 23, "h", "db")));
    EXPECT_FALSE(survivors.contains(makeArtifactName(2024y / December / 30, "h", "db")));
}

TEST(PruneArtifactsTest, FailedDeletionIsReportedAndSkipped) {
    RecordingReporter reporter;
    std::vector<BackupArtifact> artifacts{artifactOn(2020y / January / 7), artifactOn(2020y / January / 8)};
    auto deleter = [](const BackupArtifact& a) -> std::expected<void, std::string> {
        if (a.date == 2020y / January / 7) {
            return std::unexpected("permission denied");
        }
        return {};
    };
    auto deleted = pruneArtifacts(artifacts, RetentionPolicy{}, 2025y / March / 12, deleter, reporter);
    ASSERT_EQ(deleted.size(), 1u);
    EXPECT_EQ(deleted[0], artifacts[1].name);
    EXPECT_TRUE(reporter.warned("permission denied"));
}

class PruneDirectoryTest : public TempDirTest {};

TEST_F(PruneDirectoryTest, SecondRunDeletesNothing) {
    RecordingReporter reporter;
    for (const auto& a : everyDay(2025y / January / 1, 2025y / March / 12)) {
        writeFile(dir / a.name, "x");
    }
    writeFile(dir / "unrelated.zip", "keep me");

    auto first = pruneLocalDirectory(dir, RetentionPolicy{}, 2025y / March / 12, reporter);
    ASSERT_TRUE(first);
    EXPECT_FALSE(first->empty());

    auto second = pruneLocalDirectory(dir, RetentionPolicy{}, 2025y / March / 12, reporter);
    ASSERT_TRUE(second);
    EXPECT_TRUE(second->empty());
    EXPECT_TRUE(fs::exists(dir / "unrelated.zip"));
}
