#include "backup.hpp"
#include "backup_api.hpp"
#include <print>
#include <cstdio>
#include <string>
#include <vector>

namespace {

void printUsage(const char* program) {
    std::println(stderr, "Usage: {} [--config <path>] {{backup|status|restore [YYYYMMDD]|fetch <pattern> [dir]|daemon}}", program);
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configFile = "dumpvault.json";
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    const std::string& command = args[0];
    if (command == "backup" && args.size() == 1) {
        auto result = BackupAPI::runBackup(configFile);
        if (!result) {
            std::println(stderr, "Error: {}", result.error());
            return 1;
        }
        std::println("Backup completed: {} written, {} pruned", result->written.size(), result->pruned.size());
        if (result->sync) {
            std::println("Remote: {} uploaded, {} deleted", result->sync->uploaded.size(), result->sync->deleted.size());
        }
        return 0;
    }

    if (command == "status" && args.size() == 1) {
        auto result = BackupAPI::status(configFile);
        if (!result) {
            std::println(stderr, "Error: {}", result.error());
            return 1;
        }
        if (result->empty()) {
            std::println("No backups found.");
        }
        for (const auto& entry : *result) {
            std::println("{:<8} {:>12} {}", toString(entry.retentionClass), entry.artifact.size, entry.artifact.name);
        }
        return 0;
    }

    if (command == "restore" && args.size() <= 2) {
        std::optional<std::chrono::year_month_day> before;
        if (args.size() == 2) {
            before = parseCompactDate(args[1]);
            if (!before) {
                std::println(stderr, "Error: Invalid date '{}', expected YYYYMMDD", args[1]);
                return 1;
            }
        }
        auto result = BackupAPI::restore(configFile, before);
        if (!result) {
            std::println(stderr, "Error: {}", result.error());
            return 1;
        }
        for (const auto& name : *result) {
            std::println("Restored {}", name);
        }
        return 0;
    }

    if (command == "fetch" && (args.size() == 2 || args.size() == 3)) {
        fs::path destDir = args.size() == 3 ? fs::path(args[2]) : fs::current_path();
        auto result = BackupAPI::fetch(configFile, args[1], destDir);
        if (!result) {
            std::println(stderr, "Error: {}", result.error());
            return 1;
        }
        for (const auto& path : *result) {
            std::println("Fetched {}", path.string());
        }
        return 0;
    }

    if (command == "daemon" && args.size() == 1) {
        try {
            Backup backup(configFile);
            std::println("Daemon mode started. Check {} for logs.", backup.configuration().logFile);
            backup.runDaemon();
        } catch (const std::exception& e) {
            std::println(stderr, "Error: Daemon failed to start: {}", e.what());
            return 1;
        }
        return 0;
    }

    printUsage(argv[0]);
    return 1;
}
