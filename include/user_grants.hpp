/**
 * @file user_grants.hpp
 * @brief Parsing of MySQL/MariaDB account exports and per-database grant redistribution.
 *
 * A user export (mysqlpump --users, mysqldump --system=users or SHOW GRANTS output) holds
 * CREATE USER and GRANT statements for every account on the server. Each backup artifact only
 * needs the accounts that hold privileges on its own database, so the export is split into one
 * idempotent SQL fragment per database.
 *
 * Identifiers may be written as `name`, "name", 'name' or bare. Bare identifiers consist of
 * ASCII letters, digits, '$', '_' and any code point in U+0080..U+FFFF.
 */

#ifndef USER_GRANTS_HPP
#define USER_GRANTS_HPP

#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <set>
#include <optional>
#include <expected>
#include <cstddef>

class Reporter;

/**
 * @brief Lexical form an identifier was written in.
 */
enum class QuoteStyle {
    Backtick,
    DoubleQuote,
    SingleQuote,
    Bare
};

/**
 * @brief One identifier recognized by the tokenizer.
 */
struct IdentifierToken {
    std::string value;     ///< Identifier text without delimiters.
    QuoteStyle style;      ///< Lexical form.
    std::size_t begin;     ///< Byte offset of the first character (opening delimiter for quoted forms).
    std::size_t end;       ///< Byte offset one past the last character (closing delimiter included).
};

/**
 * @brief Reads one identifier starting exactly at @p pos.
 *
 * Quoted forms require a non-empty body and the same closing delimiter as the opening one.
 *
 * @param text Statement text.
 * @param pos Byte offset to start reading at.
 * @return std::optional<IdentifierToken> The token, or no value if no identifier starts at @p pos.
 */
std::optional<IdentifierToken> readIdentifier(std::string_view text, std::size_t pos);

/**
 * @brief Returns true if @p codePoint may appear in an unquoted identifier.
 */
bool isBareIdentifierCodePoint(char32_t codePoint);

/**
 * @brief An account name and host pattern, as in 'user'@'host'.
 */
struct AccountHost {
    std::string user;
    std::string host;
};

/**
 * @brief Finds the first user@host pair in a statement.
 */
std::optional<AccountHost> findAccountHost(std::string_view line);

/**
 * @brief Location and value of an IDENTIFIED BY PASSWORD '<hash>' clause.
 */
struct CredentialClause {
    std::size_t begin;     ///< Offset of the IDENTIFIED keyword.
    std::size_t end;       ///< Offset one past the closing quote of the hash.
    std::string hash;      ///< Hash literal without quotes.
};

/**
 * @brief Finds the first credential clause at or after @p from (keywords are case-insensitive).
 */
std::optional<CredentialClause> findCredentialClause(std::string_view line, std::size_t from = 0);

/**
 * @brief Removes every credential clause, together with the whitespace in front of it.
 */
std::string stripCredentialClauses(std::string_view line);

/**
 * @brief Extracts the database of an "ON <db>.*" scope clause.
 *
 * @return std::string Database name; empty for global (*.*) or table-level scopes.
 */
std::string findGrantDatabase(std::string_view line);

/**
 * @brief Escapes a value for use inside a single-quoted SQL literal.
 */
std::string escapeSqlLiteral(std::string_view value);

/**
 * @brief One GRANT statement and the database it targets.
 */
struct GrantLine {
    std::string raw;        ///< Statement exactly as it appeared in the export.
    std::string database;   ///< Target database; empty for global-only grants.
};

/**
 * @brief Aggregated view of one account name across all of its hosts.
 */
struct UserRecord {
    std::string name;
    std::vector<std::string> hosts;                   ///< Host patterns in first-seen order.
    std::map<std::string, std::string> passwordByHost;
    std::string password;                             ///< First hash seen for any host.
    std::vector<GrantLine> grants;
    std::set<std::string> databases;                  ///< Databases with a database-scoped grant.

    void addHost(const std::string& host);

    /**
     * @brief Records the credential hash for @p host.
     *
     * The first hash seen for a host is kept. A different hash for the same host is a conflict.
     *
     * @return std::expected<void, std::string> Success, or a description of the conflict.
     */
    std::expected<void, std::string> setPassword(const std::string& host, const std::string& hash);

    bool hasDifferentPasswords() const;
};

/**
 * @brief Parses a user export into one record per account name.
 *
 * Only lines starting with CREATE USER or GRANT are considered; anything else is skipped.
 * Credential conflicts are reported as warnings when @p reporter is set.
 */
std::map<std::string, UserRecord> parseUserRecords(std::string_view exportSql, Reporter* reporter = nullptr);

/**
 * @brief Per-database SQL fragments derived from a user export.
 */
struct RedistributedGrants {
    std::map<std::string, std::string> fragmentsByDatabase;  ///< Database name to SQL fragment.
    std::vector<std::string> accounts;                       ///< Every "user@host" found in the export.
};

/**
 * @brief Splits a user export into idempotent per-database fragments.
 *
 * For every account with at least one grant on a database, the fragment for that database holds
 * a CREATE USER IF NOT EXISTS statement per host (carrying the account's first-seen hash) followed
 * by the account's GRANT statements for that database with credential clauses removed. Accounts
 * with only global grants are omitted.
 *
 * @param exportSql Raw export text. Empty input yields empty output.
 * @param reporter Optional sink for conflict warnings.
 */
RedistributedGrants redistributeGrants(std::string_view exportSql, Reporter* reporter = nullptr);

#endif // USER_GRANTS_HPP
