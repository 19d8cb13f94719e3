#include "database_backup.hpp"
#include "subprocess.hpp"
#include "user_grants.hpp"
#include "reporter.hpp"
#include <format>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

std::string toLower(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

std::string trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(first, last - first + 1));
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(line);
    }
    return lines;
}

std::string toolFailure(const std::string& tool, const ProcessResult& result) {
    return std::format("{} exited with code {}: {}", tool, result.exitCode, trim(result.errorOutput));
}

} // namespace

bool isSystemSchema(std::string_view database) {
    return database == "information_schema" || database == "performance_schema" ||
           database == "mysql" || database == "sys";
}

MySQLBackupStrategy::MySQLBackupStrategy(MySQLConnection connection, Reporter& reporter)
    : connection(std::move(connection)), reporter(reporter) {}

std::string MySQLBackupStrategy::toolPath(const std::string& tool) const {
    if (trim(connection.binDir).empty()) {
        return tool;
    }
    return (fs::path(connection.binDir) / tool).string();
}

std::vector<std::string> MySQLBackupStrategy::command(const std::string& tool) const {
    return {toolPath(tool),
            "-h", connection.host,
            "-P", std::to_string(connection.port),
            "-u", connection.user};
}

std::expected<std::string, std::string> MySQLBackupStrategy::query(const std::string& sql, bool skipColumnNames) {
    auto argv = command("mysql");
    if (skipColumnNames) {
        argv.push_back("-N");
    }
    argv.push_back("-e");
    argv.push_back(sql);

    std::string output;
    ProcessOptions options;
    options.output = [&output](std::string_view chunk) -> std::expected<void, std::string> {
        output.append(chunk);
        return {};
    };
    options.environment = {{"MYSQL_PWD", connection.password}};

    auto result = runProcess(argv, options);
    if (!result) {
        return std::unexpected(std::format("mysql failed: {}", result.error()));
    }
    if (result->exitCode != 0) {
        return std::unexpected(toolFailure("mysql", *result));
    }
    return output;
}

std::expected<std::vector<std::string>, std::string> MySQLBackupStrategy::listDatabases() {
    auto output = query("SHOW DATABASES", true);
    if (!output) {
        return std::unexpected(std::format("Failed to list databases: {}", output.error()));
    }
    std::vector<std::string> databases;
    for (const auto& line : splitLines(*output)) {
        std::string name = trim(line);
        if (name.empty() || name == "Database" || isSystemSchema(name)) {
            continue;
        }
        databases.push_back(name);
    }
    return databases;
}

std::expected<bool, std::string> MySQLBackupStrategy::serverIsMariaDB() {
    auto output = query("SELECT @@version", true);
    if (!output) {
        return std::unexpected(std::format("Failed to query server version: {}", output.error()));
    }
    return toLower(*output).find("mariadb") != std::string::npos;
}

std::expected<std::string, std::string> MySQLBackupStrategy::exportUsers(bool isMariaDB) {
    if (isMariaDB) {
        return exportUsersMariaDB();
    }

    auto argv = command("mysqlpump");
    argv.push_back("--exclude-databases=%");
    argv.push_back("--users");

    std::string output;
    ProcessOptions options;
    options.output = [&output](std::string_view chunk) -> std::expected<void, std::string> {
        output.append(chunk);
        return {};
    };
    options.environment = {{"MYSQL_PWD", connection.password}};

    auto result = runProcess(argv, options);
    if (!result) {
        return std::unexpected(std::format("mysqlpump failed: {}", result.error()));
    }
    if (result->exitCode != 0) {
        return std::unexpected(toolFailure("mysqlpump", *result));
    }
    return output;
}

std::expected<std::string, std::string> MySQLBackupStrategy::exportUsersMariaDB() {
    auto argv = command("mysqldump");
    argv.push_back("--system=users");

    std::string output;
    ProcessOptions options;
    options.output = [&output](std::string_view chunk) -> std::expected<void, std::string> {
        output.append(chunk);
        return {};
    };
    options.environment = {{"MYSQL_PWD", connection.password}};

    auto result = runProcess(argv, options);
    if (!result) {
        return std::unexpected(std::format("mysqldump failed: {}", result.error()));
    }
    if (result->exitCode == 0) {
        return output;
    }

    const std::string errors = toLower(result->errorOutput);
    if (errors.find("unknown") != std::string::npos || errors.find("unrecognized") != std::string::npos ||
        errors.find("invalid") != std::string::npos) {
        reporter.warn("mysqldump does not support --system=users; exporting users from grant tables");
        return exportUsersFromGrantTables();
    }
    return std::unexpected(toolFailure("mysqldump --system=users", *result));
}

std::expected<std::string, std::string> MySQLBackupStrategy::exportUsersFromGrantTables() {
    auto users = query("SELECT user, host, plugin, COALESCE(authentication_string,'') FROM mysql.user "
                       "WHERE user != '' AND user NOT IN ('root','mysql.sys','mysql.session','mariadb.sys')",
                       true);
    if (!users) {
        return std::unexpected(std::format("Failed to list users: {}", users.error()));
    }

    std::string sql;
    for (const auto& line : splitLines(*users)) {
        std::vector<std::string> fields;
        std::size_t start = 0;
        while (fields.size() < 3) {
            std::size_t tab = line.find('\t', start);
            if (tab == std::string::npos) {
                break;
            }
            fields.push_back(line.substr(start, tab - start));
            start = tab + 1;
        }
        if (fields.size() < 3) {
            continue;
        }
        fields.push_back(line.substr(start));

        const std::string user = escapeSqlLiteral(fields[0]);
        const std::string host = escapeSqlLiteral(fields[1]);
        const std::string plugin = trim(fields[2]);
        const std::string& auth = fields[3];

        if (!plugin.empty() && plugin != "mysql_native_password") {
            sql += std::format("CREATE USER '{}'@'{}' IDENTIFIED WITH {} AS '{}';\n", user, host, plugin, escapeSqlLiteral(auth));
        } else if (!auth.empty()) {
            sql += std::format("CREATE USER '{}'@'{}' IDENTIFIED BY PASSWORD '{}';\n", user, host, escapeSqlLiteral(auth));
        } else {
            sql += std::format("CREATE USER '{}'@'{}';\n", user, host);
        }

        auto grants = query(std::format("SHOW GRANTS FOR '{}'@'{}'", user, host), true);
        if (!grants) {
            reporter.warn(std::format("Failed to read grants of {}@{}: {}", fields[0], fields[1], grants.error()));
            continue;
        }
        for (const auto& grantLine : splitLines(*grants)) {
            std::string grant = trim(grantLine);
            if (grant.empty()) {
                continue;
            }
            sql += grant;
            if (!grant.ends_with(';')) {
                sql += ';';
            }
            sql += '\n';
        }
    }
    return sql;
}

std::expected<void, std::string> MySQLBackupStrategy::dump(const std::string& database, bool isMariaDB, const ByteSink& sink) {
    auto argv = command("mysqldump");
    argv.insert(argv.end(), {"--single-transaction", "--routines", "--triggers", "--events"});
    if (!isMariaDB) {
        argv.push_back("--set-gtid-purged=OFF");
    }
    argv.push_back("--databases");
    argv.push_back(database);

    ProcessOptions options;
    options.output = sink;
    options.environment = {{"MYSQL_PWD", connection.password}};

    auto result = runProcess(argv, options);
    if (!result) {
        return std::unexpected(result.error());
    }
    if (result->exitCode != 0) {
        return std::unexpected(toolFailure("mysqldump", *result));
    }
    return {};
}

std::expected<void, std::string> MySQLBackupStrategy::restore(const ByteProducer& source) {
    ProcessOptions options;
    options.input = source;
    options.environment = {{"MYSQL_PWD", connection.password}};

    auto result = runProcess(command("mysql"), options);
    if (!result) {
        return std::unexpected(std::format("SQL import failed: {}", result.error()));
    }
    if (result->exitCode != 0) {
        return std::unexpected(toolFailure("mysql", *result));
    }
    return {};
}
