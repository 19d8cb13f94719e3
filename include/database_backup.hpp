/**
 * @file database_backup.hpp
 * @brief Defines database backup strategies for DumpVault.
 *
 * Provides the interface the backup cycle uses to talk to the database server, and its MySQL /
 * MariaDB implementation on top of the mysql, mysqldump and mysqlpump client tools.
 *
 * @note Requires the MySQL or MariaDB client tools in the system PATH or in the configured
 * mysql_bin directory.
 */

#ifndef DATABASE_BACKUP_HPP
#define DATABASE_BACKUP_HPP

#include <string>
#include <string_view>
#include <vector>
#include <expected>
#include "byte_stream.hpp"

class Reporter;

/**
 * @brief Interface for database backup strategies.
 *
 * Defines the contract between the backup cycle and the database server.
 */
class DatabaseBackupStrategy {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~DatabaseBackupStrategy() = default;

    /**
     * @brief Lists the user databases; system schemas are excluded.
     */
    virtual std::expected<std::vector<std::string>, std::string> listDatabases() = 0;

    /**
     * @brief Returns true if the server identifies itself as MariaDB.
     */
    virtual std::expected<bool, std::string> serverIsMariaDB() = 0;

    /**
     * @brief Exports all accounts and their grants as SQL text.
     *
     * @param isMariaDB Selects the export tool.
     */
    virtual std::expected<std::string, std::string> exportUsers(bool isMariaDB) = 0;

    /**
     * @brief Streams the SQL dump of one database into @p sink.
     *
     * @param database Database to dump.
     * @param isMariaDB Selects dialect-specific dump options.
     * @param sink Receives the dump in chunks; an error stops the dump.
     */
    virtual std::expected<void, std::string> dump(const std::string& database, bool isMariaDB, const ByteSink& sink) = 0;

    /**
     * @brief Replays SQL text produced by @p source into the server.
     */
    virtual std::expected<void, std::string> restore(const ByteProducer& source) = 0;
};

/**
 * @brief Connection parameters passed to the client tools.
 */
struct MySQLConnection {
    std::string host = "localhost";
    int port = 3306;
    std::string user = "root";
    std::string password;  ///< Passed through the MYSQL_PWD environment variable, never on the command line.
    std::string binDir;    ///< Directory of the client tools; empty = PATH lookup.
};

/// Returns true for information_schema, performance_schema, mysql and sys.
bool isSystemSchema(std::string_view database);

/**
 * @brief MySQL / MariaDB backup strategy using the command-line client tools.
 */
class MySQLBackupStrategy : public DatabaseBackupStrategy {
public:
    /**
     * @brief Constructs a MySQL backup strategy.
     *
     * @param connection Server address and credentials.
     * @param reporter Sink for degraded-mode warnings.
     */
    MySQLBackupStrategy(MySQLConnection connection, Reporter& reporter);

    std::expected<std::vector<std::string>, std::string> listDatabases() override;
    std::expected<bool, std::string> serverIsMariaDB() override;

    /**
     * @brief Exports accounts with mysqlpump (MySQL) or mysqldump --system=users (MariaDB).
     *
     * Older MariaDB servers without --system=users fall back to reading mysql.user and
     * running SHOW GRANTS for every account.
     */
    std::expected<std::string, std::string> exportUsers(bool isMariaDB) override;

    /**
     * @brief Runs mysqldump with --single-transaction, routines, triggers and events.
     *
     * On MySQL --set-gtid-purged=OFF is added; MariaDB does not know the option.
     */
    std::expected<void, std::string> dump(const std::string& database, bool isMariaDB, const ByteSink& sink) override;

    std::expected<void, std::string> restore(const ByteProducer& source) override;

private:
    std::string toolPath(const std::string& tool) const;
    std::vector<std::string> command(const std::string& tool) const;
    std::expected<std::string, std::string> query(const std::string& sql, bool skipColumnNames);
    std::expected<std::string, std::string> exportUsersMariaDB();
    std::expected<std::string, std::string> exportUsersFromGrantTables();

    MySQLConnection connection; ///< Server address and credentials.
    Reporter& reporter;         ///< Sink for warnings.
};

#endif // DATABASE_BACKUP_HPP
