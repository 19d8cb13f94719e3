#include "remote_sync.hpp"
#include "crypto_stream.hpp"
#include "reporter.hpp"
#include <fnmatch.h>
#include <fstream>
#include <format>
#include <map>
#include <set>
#include <vector>
#include <optional>
#include <algorithm>

using namespace std::chrono;

namespace {

bool hasWildcard(std::string_view pattern) {
    return pattern.find_first_of("*?") != std::string_view::npos;
}

std::expected<void, std::string> streamToRemote(std::ifstream& source, RemoteWriter& writer, const std::string& passphrase) {
    auto sink = [&writer](std::string_view chunk) { return writer.write(chunk); };
    if (!passphrase.empty()) {
        return encryptStream(source, sink, passphrase);
    }
    std::vector<char> buf(kStreamChunkSize);
    while (source) {
        source.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        std::streamsize count = source.gcount();
        if (count <= 0) {
            break;
        }
        if (auto result = sink(std::string_view(buf.data(), static_cast<std::size_t>(count))); !result) {
            return result;
        }
    }
    if (source.bad()) {
        return std::unexpected("Failed to read local file");
    }
    return {};
}

std::expected<void, std::string> download(RemoteReader& reader, const fs::path& localPath,
                                          const std::string& name, const std::string& passphrase, Reporter& reporter) {
    std::string header;
    std::vector<char> buf(kStreamChunkSize);
    while (header.size() < kEncryptionOverhead) {
        auto count = reader.read(buf.data(), kEncryptionOverhead - header.size());
        if (!count) {
            return std::unexpected(count.error());
        }
        if (*count == 0) {
            break;
        }
        header.append(buf.data(), *count);
    }

    std::ofstream out(localPath, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(std::format("Failed to create {}", localPath.string()));
    }

    std::optional<StreamCipher> cipher;
    if (looksEncrypted(header)) {
        if (passphrase.empty()) {
            reporter.warn(std::format("{} looks encrypted but no passphrase is configured; saving it as is", name));
        } else {
            reporter.info(std::format("Decrypting {}", name));
            auto created = StreamCipher::fromHeader(passphrase, header);
            if (!created) {
                return std::unexpected(created.error());
            }
            cipher.emplace(std::move(*created));
            header.clear();
        }
    }
    out.write(header.data(), static_cast<std::streamsize>(header.size()));

    while (out) {
        auto count = reader.read(buf.data(), buf.size());
        if (!count) {
            return std::unexpected(count.error());
        }
        if (*count == 0) {
            break;
        }
        std::string_view chunk(buf.data(), *count);
        if (cipher) {
            auto plain = cipher->apply(chunk);
            if (!plain) {
                return std::unexpected(plain.error());
            }
            out.write(plain->data(), static_cast<std::streamsize>(plain->size()));
        } else {
            out.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        }
    }
    out.close();
    if (out.fail()) {
        return std::unexpected(std::format("Failed to write {}", localPath.string()));
    }
    return {};
}

} // namespace

SyncPlan planSync(const std::vector<BackupArtifact>& local, const std::vector<RemoteEntry>& remote, bool encrypted) {
    std::map<std::string, const RemoteEntry*> remoteByName;
    for (const auto& entry : remote) {
        if (isArtifactName(entry.name)) {
            remoteByName[entry.name] = &entry;
        }
    }

    SyncPlan plan;
    std::set<std::string> localNames;
    for (const auto& artifact : local) {
        localNames.insert(artifact.name);
        auto it = remoteByName.find(artifact.name);
        if (it == remoteByName.end()) {
            plan.uploads.push_back(artifact);
            continue;
        }
        const RemoteEntry& entry = *it->second;
        bool upload = floor<seconds>(artifact.modTime) > floor<seconds>(entry.modTime);
        if (encrypted && entry.size != artifact.size + kEncryptionOverhead) {
            upload = true;
        }
        if (upload) {
            plan.uploads.push_back(artifact);
        }
    }

    for (const auto& [name, entry] : remoteByName) {
        if (!localNames.contains(name)) {
            plan.deletions.push_back(*entry);
        }
    }
    return plan;
}

std::vector<BackupArtifact> remoteArtifacts(const std::vector<RemoteEntry>& entries, const std::string& remoteDir) {
    std::vector<BackupArtifact> artifacts;
    for (const auto& entry : entries) {
        auto date = parseArtifactDate(entry.name);
        if (!date) {
            continue;
        }
        artifacts.push_back({entry.name, fs::path(joinRemotePath(remoteDir, entry.name)), *date, entry.modTime, entry.size});
    }
    return artifacts;
}

std::expected<void, std::string> uploadArtifact(const BackupArtifact& artifact,
                                                 RemoteTransport& transport,
                                                 const std::string& remotePath,
                                                 const std::string& passphrase,
                                                 Reporter& reporter) {
    std::ifstream source(artifact.path, std::ios::binary);
    if (!source) {
        return std::unexpected(std::format("Failed to open {}", artifact.path.string()));
    }
    auto writer = transport.create(remotePath);
    if (!writer) {
        return std::unexpected(writer.error());
    }

    auto result = streamToRemote(source, **writer, passphrase);
    if (result) {
        result = (*writer)->close();
    }
    if (!result) {
        writer->reset();
        if (auto removed = transport.remove(remotePath); !removed) {
            reporter.warn(std::format("Failed to remove partial upload {}: {}", remotePath, removed.error()));
        }
        return result;
    }
    return {};
}

std::expected<SyncReport, std::string> syncRemote(const std::vector<BackupArtifact>& local,
                                                  RemoteTransport& transport,
                                                  const std::string& remoteDir,
                                                  const std::string& passphrase,
                                                  Reporter& reporter) {
    if (auto created = transport.makeDirectories(remoteDir); !created) {
        reporter.warn(created.error());
    }
    auto remote = transport.list(remoteDir);
    if (!remote) {
        return std::unexpected(std::format("Failed to list remote directory {}: {}", remoteDir, remote.error()));
    }

    const bool encrypted = !passphrase.empty();
    reporter.info(encrypted ? "Remote copies are encrypted (AES-256-CTR)" : "Remote copies are not encrypted");

    SyncPlan plan = planSync(local, *remote, encrypted);
    SyncReport report;
    for (const auto& artifact : plan.uploads) {
        const std::string remotePath = joinRemotePath(remoteDir, artifact.name);
        if (auto result = uploadArtifact(artifact, transport, remotePath, passphrase, reporter); !result) {
            return std::unexpected(std::format("Upload of {} failed: {}", artifact.name, result.error()));
        }
        reporter.info(std::format("Uploaded {}", artifact.name));
        report.uploaded.push_back(artifact.name);
    }

    for (const auto& entry : plan.deletions) {
        if (auto result = transport.remove(joinRemotePath(remoteDir, entry.name)); !result) {
            reporter.warn(std::format("Failed to delete remote {}: {}", entry.name, result.error()));
            continue;
        }
        reporter.info(std::format("Deleted remote {}", entry.name));
        report.deleted.push_back(entry.name);
    }
    return report;
}

std::expected<std::vector<std::string>, std::string> pruneRemote(RemoteTransport& transport,
                                                                 const std::string& remoteDir,
                                                                 const RetentionPolicy& policy,
                                                                 year_month_day today,
                                                                 Reporter& reporter) {
    auto entries = transport.list(remoteDir);
    if (!entries) {
        return std::unexpected(std::format("Failed to list remote directory {}: {}", remoteDir, entries.error()));
    }
    auto deleteRemote = [&transport](const BackupArtifact& artifact) {
        return transport.remove(artifact.path.generic_string());
    };
    return pruneArtifacts(remoteArtifacts(*entries, remoteDir), policy, today, deleteRemote, reporter);
}

bool isValidFetchPattern(std::string_view pattern) {
    return !pattern.empty() && pattern.find("..") == std::string_view::npos &&
           pattern.find_first_of("/\\") == std::string_view::npos;
}

std::expected<std::vector<fs::path>, std::string> fetchRemote(const std::string& pattern,
                                                              const fs::path& destDir,
                                                              RemoteTransport& transport,
                                                              const std::string& remoteDir,
                                                              const std::string& passphrase,
                                                              Reporter& reporter) {
    if (!isValidFetchPattern(pattern)) {
        return std::unexpected(std::format("Invalid file pattern '{}': only a file name without path is allowed", pattern));
    }

    std::vector<std::string> names;
    if (hasWildcard(pattern)) {
        auto entries = transport.list(remoteDir);
        if (!entries) {
            return std::unexpected(std::format("Failed to list remote directory {}: {}", remoteDir, entries.error()));
        }
        for (const auto& entry : *entries) {
            if (isArtifactName(entry.name) && ::fnmatch(pattern.c_str(), entry.name.c_str(), 0) == 0) {
                names.push_back(entry.name);
            }
        }
        if (names.empty()) {
            return std::unexpected(std::format("No remote backup matches '{}'", pattern));
        }
        std::sort(names.begin(), names.end());
    } else {
        if (!isArtifactName(pattern)) {
            return std::unexpected(std::format("'{}' is not a backup archive name (mysql_backup_YYYYMMDD_*.zip)", pattern));
        }
        names.push_back(pattern);
    }

    std::error_code ec;
    fs::create_directories(destDir, ec);
    if (ec) {
        return std::unexpected(std::format("Failed to create {}: {}", destDir.string(), ec.message()));
    }

    std::vector<fs::path> saved;
    for (const auto& name : names) {
        fs::path localPath = destDir / name;
        if (fs::exists(localPath, ec)) {
            localPath = destDir / (name + ".local");
        }

        auto reader = transport.open(joinRemotePath(remoteDir, name));
        if (!reader) {
            return std::unexpected(std::format("Fetching {} failed: {}", name, reader.error()));
        }
        if (auto result = download(**reader, localPath, name, passphrase, reporter); !result) {
            fs::remove(localPath, ec);
            return std::unexpected(std::format("Fetching {} failed: {}", name, result.error()));
        }
        reporter.info(std::format("Fetched {} to {}", name, localPath.string()));
        saved.push_back(localPath);
    }
    return saved;
}
