#include "retention.hpp"
#include "reporter.hpp"
#include <format>
#include <algorithm>

using namespace std::chrono;

namespace {

// Keep-sets never reach back before this year.
constexpr year kSanityFloor{2000};

} // namespace

std::string toString(RetentionClass retentionClass) {
    switch (retentionClass) {
        case RetentionClass::Yearly:
            return "yearly";
        case RetentionClass::Monthly:
            return "monthly";
        case RetentionClass::Weekly:
            return "weekly";
        case RetentionClass::Daily:
        default:
            return "daily";
    }
}

bool isLastDayOfMonth(year_month_day date) {
    return date.day() == year_month_day_last{date.year(), month_day_last{date.month()}}.day();
}

RetentionClass classify(year_month_day date) {
    if (date.month() == December && date.day() == day{31}) {
        return RetentionClass::Yearly;
    }
    if (isLastDayOfMonth(date)) {
        return RetentionClass::Monthly;
    }
    if (weekday{sys_days{date}} == Sunday) {
        return RetentionClass::Weekly;
    }
    return RetentionClass::Daily;
}

KeepSets computeKeepSets(year_month_day today, const RetentionPolicy& policy) {
    const sys_days todayDays{today};
    KeepSets keepSets;
    keepSets.dailyCutoff = todayDays - days{std::max(policy.retainDaily, 0)};

    // Most recent Sunday, today included.
    const sys_days lastSunday = todayDays - (weekday{todayDays} - Sunday);
    for (int i = 0; i < policy.retainWeekly; ++i) {
        sys_days sunday = lastSunday - weeks{i};
        if (year_month_day{sunday}.year() < kSanityFloor) {
            break;
        }
        keepSets.sundays.insert(sunday);
    }

    year_month current = today.year() / today.month();
    for (int i = 0; i < policy.retainMonthly; ++i, current -= months{1}) {
        sys_days monthEnd{current / last};
        if (current.year() < kSanityFloor) {
            break;
        }
        keepSets.monthEnds.insert(monthEnd);
    }

    year y = today.year();
    for (int i = 0; i < policy.retainYearly && y >= kSanityFloor; ++i, --y) {
        keepSets.yearEnds.insert(sys_days{y / December / 31});
    }
    return keepSets;
}

bool isRetained(year_month_day date, const KeepSets& keepSets) {
    const sys_days backupDay{date};
    return backupDay >= keepSets.dailyCutoff ||
           keepSets.sundays.contains(backupDay) ||
           keepSets.monthEnds.contains(backupDay) ||
           keepSets.yearEnds.contains(backupDay);
}

std::vector<std::string> pruneArtifacts(const std::vector<BackupArtifact>& artifacts,
                                        const RetentionPolicy& policy,
                                        year_month_day today,
                                        const ArtifactDeleter& deleter,
                                        Reporter& reporter) {
    const KeepSets keepSets = computeKeepSets(today, policy);
    std::vector<std::string> deleted;

    for (const auto& artifact : artifacts) {
        if (isRetained(artifact.date, keepSets)) {
            continue;
        }
        if (auto result = deleter(artifact); !result) {
            reporter.warn(std::format("Failed to delete old backup {}: {}", artifact.name, result.error()));
            continue;
        }
        reporter.info(std::format("Deleted old {} backup: {}", toString(classify(artifact.date)), artifact.name));
        deleted.push_back(artifact.name);
    }
    return deleted;
}

std::expected<std::vector<std::string>, std::string> pruneLocalDirectory(const fs::path& dir,
                                                                         const RetentionPolicy& policy,
                                                                         year_month_day today,
                                                                         Reporter& reporter) {
    auto artifacts = listLocalArtifacts(dir);
    if (!artifacts) {
        return std::unexpected(artifacts.error());
    }

    auto deleteFile = [](const BackupArtifact& artifact) -> std::expected<void, std::string> {
        std::error_code ec;
        if (!fs::remove(artifact.path, ec)) {
            return std::unexpected(ec ? ec.message() : std::string("file no longer exists"));
        }
        return {};
    };
    return pruneArtifacts(*artifacts, policy, today, deleteFile, reporter);
}
