#include "artifact.hpp"
#include <algorithm>
#include <iterator>
#include <format>
#include <ctime>

using namespace std::chrono;

std::string formatCompactDate(year_month_day date) {
    return std::format("{:04}{:02}{:02}", static_cast<int>(date.year()),
                       static_cast<unsigned>(date.month()), static_cast<unsigned>(date.day()));
}

std::optional<year_month_day> parseCompactDate(std::string_view text) {
    if (text.size() != 8 || !std::ranges::all_of(text, [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }
    auto number = [text](std::size_t pos, std::size_t count) {
        int value = 0;
        for (std::size_t i = pos; i < pos + count; ++i) {
            value = value * 10 + (text[i] - '0');
        }
        return value;
    };
    year_month_day date{year{number(0, 4)}, month{static_cast<unsigned>(number(4, 2))},
                        day{static_cast<unsigned>(number(6, 2))}};
    if (!date.ok()) {
        return std::nullopt;
    }
    return date;
}

std::string makeArtifactName(year_month_day date, const std::string& hostToken, const std::string& database) {
    return std::format("{}{}_{}_{}{}", kArtifactPrefix, formatCompactDate(date), hostToken, database, kArtifactExtension);
}

std::string hostTokenForFile(const std::string& host) {
    if (host.empty()) {
        return "localhost";
    }
    std::string token;
    token.reserve(host.size());
    for (char c : host) {
        auto byte = static_cast<unsigned char>(c);
        bool allowed = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                       c == '_' || c == '-' || c == '.';
        if (allowed) {
            token += c;
        } else if ((byte & 0xC0) != 0x80) {
            // One replacement per code point; UTF-8 continuation bytes are dropped.
            token += '_';
        }
    }
    return token;
}

std::optional<year_month_day> parseArtifactDate(std::string_view name) {
    const std::size_t minimum = kArtifactPrefix.size() + 8 + 1 + kArtifactExtension.size();
    if (name.size() < minimum || !name.starts_with(kArtifactPrefix) || !name.ends_with(kArtifactExtension)) {
        return std::nullopt;
    }
    if (name[kArtifactPrefix.size() + 8] != '_') {
        return std::nullopt;
    }
    return parseCompactDate(name.substr(kArtifactPrefix.size(), 8));
}

bool isArtifactName(std::string_view name) {
    return parseArtifactDate(name).has_value();
}

fs::path sidecarPathFor(const fs::path& artifactPath) {
    fs::path sidecar = artifactPath;
    sidecar.replace_extension(kSidecarExtension);
    return sidecar;
}

year_month_day localToday() {
    auto timeT = system_clock::to_time_t(system_clock::now());
    std::tm tmNow{};
    localtime_r(&timeT, &tmNow);
    return year_month_day{year{tmNow.tm_year + 1900}, month{static_cast<unsigned>(tmNow.tm_mon + 1)},
                          day{static_cast<unsigned>(tmNow.tm_mday)}};
}

std::expected<std::vector<BackupArtifact>, std::string> listLocalArtifacts(const fs::path& dir) {
    std::vector<BackupArtifact> artifacts;
    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        return artifacts;
    }

    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code typeError;
        if (it->is_directory(typeError)) {
            continue;
        }
        std::string name = it->path().filename().string();
        auto date = parseArtifactDate(name);
        if (!date) {
            continue;
        }

        BackupArtifact artifact{name, it->path(), *date, {}, 0};
        std::error_code statError;
        auto lastWrite = fs::last_write_time(it->path(), statError);
        if (!statError) {
            artifact.modTime = time_point_cast<system_clock::duration>(file_clock::to_sys(lastWrite));
        }
        auto size = fs::file_size(it->path(), statError);
        if (!statError) {
            artifact.size = size;
        }
        artifacts.push_back(std::move(artifact));
    }
    if (ec) {
        return std::unexpected(std::format("Failed to read backup directory {}: {}", dir.string(), ec.message()));
    }

    std::ranges::sort(artifacts, [](const BackupArtifact& a, const BackupArtifact& b) {
        if (a.date != b.date) {
            return sys_days{a.date} < sys_days{b.date};
        }
        return a.name < b.name;
    });
    return artifacts;
}

std::vector<BackupArtifact> artifactsOfLatestDay(const std::vector<BackupArtifact>& artifacts,
                                                 std::optional<year_month_day> before) {
    std::optional<year_month_day> target;
    for (auto it = artifacts.rbegin(); it != artifacts.rend(); ++it) {
        if (!before || sys_days{it->date} < sys_days{*before}) {
            target = it->date;
            break;
        }
    }
    if (!target) {
        return {};
    }

    std::vector<BackupArtifact> selected;
    std::ranges::copy_if(artifacts, std::back_inserter(selected),
                         [&target](const BackupArtifact& artifact) { return artifact.date == *target; });
    return selected;
}
