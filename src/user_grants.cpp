#include "user_grants.hpp"
#include "reporter.hpp"
#include <format>
#include <algorithm>

namespace {

constexpr char32_t kReplacementCharacter = 0xFFFD;

struct DecodedCodePoint {
    char32_t value;
    std::size_t length;
};

// Malformed sequences decode as U+FFFD with a length of one byte.
DecodedCodePoint decodeUtf8(std::string_view text, std::size_t pos) {
    const auto lead = static_cast<unsigned char>(text[pos]);
    if (lead < 0x80) {
        return {lead, 1};
    }

    std::size_t length = 0;
    char32_t value = 0;
    if ((lead & 0xE0) == 0xC0) {
        length = 2;
        value = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        value = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        value = lead & 0x07;
    } else {
        return {kReplacementCharacter, 1};
    }
    if (pos + length > text.size()) {
        return {kReplacementCharacter, 1};
    }
    for (std::size_t i = 1; i < length; ++i) {
        const auto next = static_cast<unsigned char>(text[pos + i]);
        if ((next & 0xC0) != 0x80) {
            return {kReplacementCharacter, 1};
        }
        value = (value << 6) | (next & 0x3F);
    }

    static constexpr char32_t kMinimumForLength[] = {0, 0, 0x80, 0x800, 0x10000};
    if (value < kMinimumForLength[length] || (value >= 0xD800 && value <= 0xDFFF) || value > 0x10FFFF) {
        return {kReplacementCharacter, 1};
    }
    return {value, length};
}

bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

std::size_t skipSpaces(std::string_view text, std::size_t pos) {
    while (pos < text.size() && isSpace(text[pos])) {
        ++pos;
    }
    return pos;
}

// Like skipSpaces, but at least one space is required.
bool skipRequiredSpaces(std::string_view text, std::size_t& pos) {
    std::size_t next = skipSpaces(text, pos);
    if (next == pos) {
        return false;
    }
    pos = next;
    return true;
}

char asciiUpper(char c) {
    return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
}

bool matchKeyword(std::string_view text, std::size_t pos, std::string_view keyword) {
    if (pos + keyword.size() > text.size()) {
        return false;
    }
    for (std::size_t i = 0; i < keyword.size(); ++i) {
        if (asciiUpper(text[pos + i]) != keyword[i]) {
            return false;
        }
    }
    return true;
}

std::string_view trimSpace(std::string_view text) {
    std::size_t first = 0;
    while (first < text.size() && (isSpace(text[first]) || text[first] == '\v')) {
        ++first;
    }
    std::size_t last = text.size();
    while (last > first && (isSpace(text[last - 1]) || text[last - 1] == '\v')) {
        --last;
    }
    return text.substr(first, last - first);
}

bool isQuote(char c) {
    return c == '`' || c == '"' || c == '\'';
}

QuoteStyle styleFor(char delimiter) {
    switch (delimiter) {
        case '`':
            return QuoteStyle::Backtick;
        case '"':
            return QuoteStyle::DoubleQuote;
        default:
            return QuoteStyle::SingleQuote;
    }
}

// Quoted literal whose body may be empty; returns the body and the offset past the closing quote.
std::optional<std::pair<std::string, std::size_t>> readQuotedLiteral(std::string_view text, std::size_t pos) {
    if (pos >= text.size() || !isQuote(text[pos])) {
        return std::nullopt;
    }
    std::size_t close = text.find(text[pos], pos + 1);
    if (close == std::string_view::npos) {
        return std::nullopt;
    }
    return std::make_pair(std::string(text.substr(pos + 1, close - pos - 1)), close + 1);
}

} // namespace

bool isBareIdentifierCodePoint(char32_t codePoint) {
    if (codePoint >= 0x80) {
        return codePoint <= 0xFFFF;
    }
    return (codePoint >= '0' && codePoint <= '9') ||
           (codePoint >= 'a' && codePoint <= 'z') ||
           (codePoint >= 'A' && codePoint <= 'Z') ||
           codePoint == '$' || codePoint == '_';
}

std::optional<IdentifierToken> readIdentifier(std::string_view text, std::size_t pos) {
    if (pos >= text.size()) {
        return std::nullopt;
    }

    const char first = text[pos];
    if (isQuote(first)) {
        std::size_t close = text.find(first, pos + 1);
        if (close == std::string_view::npos || close == pos + 1) {
            return std::nullopt;
        }
        return IdentifierToken{std::string(text.substr(pos + 1, close - pos - 1)), styleFor(first), pos, close + 1};
    }

    std::size_t end = pos;
    while (end < text.size()) {
        auto codePoint = decodeUtf8(text, end);
        if (!isBareIdentifierCodePoint(codePoint.value)) {
            break;
        }
        end += codePoint.length;
    }
    if (end == pos) {
        return std::nullopt;
    }
    return IdentifierToken{std::string(text.substr(pos, end - pos)), QuoteStyle::Bare, pos, end};
}

std::optional<AccountHost> findAccountHost(std::string_view line) {
    for (std::size_t pos = 0; pos < line.size(); pos += decodeUtf8(line, pos).length) {
        auto user = readIdentifier(line, pos);
        if (!user) {
            continue;
        }
        std::size_t at = skipSpaces(line, user->end);
        if (at >= line.size() || line[at] != '@') {
            continue;
        }
        auto host = readIdentifier(line, skipSpaces(line, at + 1));
        if (!host) {
            continue;
        }
        return AccountHost{std::string(trimSpace(user->value)), std::string(trimSpace(host->value))};
    }
    return std::nullopt;
}

std::optional<CredentialClause> findCredentialClause(std::string_view line, std::size_t from) {
    for (std::size_t pos = from; pos < line.size(); ++pos) {
        if (!matchKeyword(line, pos, "IDENTIFIED")) {
            continue;
        }
        std::size_t cursor = pos + 10;
        if (!skipRequiredSpaces(line, cursor) || !matchKeyword(line, cursor, "BY")) {
            continue;
        }
        cursor += 2;
        if (!skipRequiredSpaces(line, cursor) || !matchKeyword(line, cursor, "PASSWORD")) {
            continue;
        }
        cursor += 8;
        if (!skipRequiredSpaces(line, cursor)) {
            continue;
        }
        auto literal = readQuotedLiteral(line, cursor);
        if (!literal) {
            continue;
        }
        return CredentialClause{pos, literal->second, std::string(trimSpace(literal->first))};
    }
    return std::nullopt;
}

std::string stripCredentialClauses(std::string_view line) {
    std::string result;
    std::size_t cursor = 0;
    while (auto clause = findCredentialClause(line, cursor)) {
        std::size_t cutFrom = clause->begin;
        while (cutFrom > cursor && isSpace(line[cutFrom - 1])) {
            --cutFrom;
        }
        result.append(line.substr(cursor, cutFrom - cursor));
        cursor = clause->end;
    }
    result.append(line.substr(cursor));
    return result;
}

std::string findGrantDatabase(std::string_view line) {
    for (std::size_t pos = 0; pos < line.size(); ++pos) {
        if (!matchKeyword(line, pos, "ON")) {
            continue;
        }
        std::size_t cursor = pos + 2;
        if (!skipRequiredSpaces(line, cursor)) {
            continue;
        }
        auto database = readIdentifier(line, cursor);
        if (!database) {
            continue;
        }
        cursor = skipSpaces(line, database->end);
        if (cursor >= line.size() || line[cursor] != '.') {
            continue;
        }
        cursor = skipSpaces(line, cursor + 1);
        if (cursor >= line.size() || line[cursor] != '*') {
            continue;
        }
        std::string name(trimSpace(database->value));
        return name == "*" ? std::string() : name;
    }
    return {};
}

std::string escapeSqlLiteral(std::string_view value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (char c : value) {
        if (c == '\\') {
            escaped += "\\\\";
        } else if (c == '\'') {
            escaped += "''";
        } else {
            escaped += c;
        }
    }
    return escaped;
}

void UserRecord::addHost(const std::string& host) {
    if (std::ranges::find(hosts, host) != hosts.end()) {
        return;
    }
    hosts.push_back(host);
}

std::expected<void, std::string> UserRecord::setPassword(const std::string& host, const std::string& hash) {
    if (hash.empty()) {
        return {};
    }
    auto it = passwordByHost.find(host);
    if (it != passwordByHost.end()) {
        if (it->second != hash) {
            return std::unexpected(std::format("Account '{}'@'{}' has differing password hashes, keeping the first one", name, host));
        }
        return {};
    }
    passwordByHost.emplace(host, hash);
    if (password.empty()) {
        password = hash;
    }
    return {};
}

bool UserRecord::hasDifferentPasswords() const {
    std::set<std::string> distinct;
    for (const auto& [host, hash] : passwordByHost) {
        distinct.insert(hash);
    }
    return distinct.size() > 1;
}

std::map<std::string, UserRecord> parseUserRecords(std::string_view exportSql, Reporter* reporter) {
    std::map<std::string, UserRecord> users;

    auto recordFor = [&users](const std::string& name) -> UserRecord& {
        auto [it, inserted] = users.try_emplace(name);
        if (inserted) {
            it->second.name = name;
        }
        return it->second;
    };
    auto recordCredential = [reporter](UserRecord& user, const std::string& host, std::string_view statement) {
        auto clause = findCredentialClause(statement);
        if (!clause || clause->hash.empty()) {
            return;
        }
        if (auto result = user.setPassword(host, clause->hash); !result && reporter) {
            reporter->warn(result.error());
        }
    };

    std::size_t start = 0;
    while (start < exportSql.size()) {
        std::size_t newline = exportSql.find('\n', start);
        std::string_view line = newline == std::string_view::npos
            ? exportSql.substr(start)
            : exportSql.substr(start, newline - start);
        start = newline == std::string_view::npos ? exportSql.size() : newline + 1;
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        std::string_view trimmed = trimSpace(line);
        if (trimmed.empty()) {
            continue;
        }

        if (matchKeyword(trimmed, 0, "CREATE USER ")) {
            auto account = findAccountHost(trimmed);
            if (!account || account->user.empty() || account->host.empty()) {
                continue;
            }
            UserRecord& user = recordFor(account->user);
            user.addHost(account->host);
            recordCredential(user, account->host, trimmed);
        } else if (matchKeyword(trimmed, 0, "GRANT ")) {
            auto account = findAccountHost(trimmed);
            if (!account || account->user.empty() || account->host.empty()) {
                continue;
            }
            UserRecord& user = recordFor(account->user);
            user.addHost(account->host);
            recordCredential(user, account->host, trimmed);

            std::string database = findGrantDatabase(trimmed);
            if (!database.empty()) {
                user.databases.insert(database);
            }
            user.grants.push_back(GrantLine{std::string(line), database});
        }
    }
    return users;
}

RedistributedGrants redistributeGrants(std::string_view exportSql, Reporter* reporter) {
    RedistributedGrants result;
    if (exportSql.empty()) {
        return result;
    }

    auto users = parseUserRecords(exportSql, reporter);
    for (const auto& [name, user] : users) {
        for (const auto& host : user.hosts) {
            result.accounts.push_back(std::format("{}@{}", name, host));
        }
    }

    for (const auto& [name, user] : users) {
        if (user.databases.empty()) {
            continue;
        }
        if (user.hasDifferentPasswords() && reporter) {
            reporter->warn(std::format("Account '{}' uses different password hashes per host, the first one is used for all hosts", name));
        }

        for (const auto& database : user.databases) {
            std::string block;
            for (const auto& host : user.hosts) {
                block += std::format("CREATE USER IF NOT EXISTS '{}'@'{}'", escapeSqlLiteral(name), escapeSqlLiteral(host));
                if (!user.password.empty()) {
                    block += std::format(" IDENTIFIED BY PASSWORD '{}'", escapeSqlLiteral(user.password));
                }
                block += ";\n";
            }
            for (const auto& grant : user.grants) {
                if (grant.database != database) {
                    continue;
                }
                std::string statement(trimSpace(stripCredentialClauses(grant.raw)));
                if (statement.empty()) {
                    continue;
                }
                if (statement.back() != ';') {
                    statement += ';';
                }
                block += statement;
                block += '\n';
            }

            while (!block.empty() && block.back() == '\n') {
                block.pop_back();
            }
            std::string& fragment = result.fragmentsByDatabase[database];
            if (!fragment.empty()) {
                fragment += "\n\n";
            }
            fragment += block;
        }
    }
    return result;
}
