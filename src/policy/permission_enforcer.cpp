#include "policy/permission_enforcer.hpp"
#include "core/utils.hpp"
#include <cctype>
#include <format>
#include <initializer_list>
#include <unordered_set>

namespace sqlgateway {

namespace {

using Dialect = PermissionEnforcer::Dialect;
using Token = PermissionEnforcer::Token;
using TokenKind = PermissionEnforcer::TokenKind;
using KeywordSet = std::unordered_set<std::string_view>;

const KeywordSet READ_HEADS = {
    "SELECT", "WITH", "SHOW", "DESCRIBE", "DESC", "EXPLAIN", "VALUES", "TABLE",
};

// Heads allowed directly after a leading '('
const KeywordSet PAREN_READ_HEADS = {
    "SELECT", "WITH", "VALUES", "TABLE",
};

const KeywordSet EXPLAIN_HEADS = {
    "EXPLAIN", "DESCRIBE", "DESC",
};

// Words that may sit between EXPLAIN and the statement it wraps
const KeywordSet EXPLAIN_OPTIONS = {
    "ANALYZE", "ANALYSE", "VERBOSE", "EXTENDED", "PARTITIONS", "FORMAT",
    "TREE", "JSON", "TRADITIONAL", "TEXT", "XML", "YAML",
};

// Verbs that start a mutating statement
const KeywordSet STATEMENT_VERBS = {
    "INSERT", "UPDATE", "DELETE", "MERGE", "CREATE", "ALTER", "DROP", "TRUNCATE",
    "GRANT", "REVOKE", "EXEC", "EXECUTE", "CALL", "INTO", "REPLACE", "UPSERT",
    "COPY", "LOAD", "LOCK", "RENAME", "COMMENT", "SET", "USE", "BEGIN", "START",
    "COMMIT", "ROLLBACK", "SAVEPOINT", "RELEASE", "DECLARE", "VACUUM", "ANALYZE",
    "REINDEX", "CLUSTER", "REFRESH", "BACKUP", "RESTORE", "DBCC", "KILL",
    "SHUTDOWN", "HANDLER", "DO", "NOTIFY", "LISTEN", "PREPARE", "DEALLOCATE",
    "IMPORT", "SECURITY",
};

// Clauses that write wherever they appear in a statement
const KeywordSet DML_CLAUSES = {
    "INSERT", "UPDATE", "DELETE", "MERGE", "INTO",
};

const KeywordSet MYSQL_CLAUSES = {
    "INSERT", "UPDATE", "DELETE", "INTO", "REPLACE", "LOCK",
};

// T-SQL runs "SELECT 1 DROP TABLE t" as two statements
const KeywordSet MSSQL_CLAUSES = {
    "INSERT", "UPDATE", "DELETE", "MERGE", "INTO", "CREATE", "ALTER", "DROP",
    "TRUNCATE", "GRANT", "REVOKE", "DENY", "EXEC", "EXECUTE", "SET", "USE",
    "BEGIN", "COMMIT", "ROLLBACK", "SAVE", "DECLARE", "DBCC", "KILL", "SHUTDOWN",
    "BACKUP", "RESTORE", "BULK", "RECONFIGURE", "CHECKPOINT", "OPENQUERY",
    "OPENROWSET", "OPENDATASOURCE", "WRITETEXT", "UPDATETEXT", "ENABLE",
    "DISABLE", "SETUSER", "SEND", "RECEIVE", "LOAD", "DUMP",
};

// FOR UPDATE, FOR NO KEY UPDATE, FOR SHARE, FOR KEY SHARE
const KeywordSet LOCK_STRENGTHS = {
    "UPDATE", "SHARE", "KEY", "NO",
};

// Verbs that are also built-in function names
const KeywordSet COMMON_FUNCTIONS = {
    "REPLACE",
};

const KeywordSet MYSQL_FUNCTIONS = {
    "REPLACE", "INSERT", "TRUNCATE",
};

const KeywordSet& clause_verbs(Dialect dialect) {
    switch (dialect) {
        case Dialect::MYSQL:
        case Dialect::MYSQL_ANSI_QUOTES:
        case Dialect::MYSQL_NO_BACKSLASH_ESCAPES:
            return MYSQL_CLAUSES;
        case Dialect::MSSQL:
            return MSSQL_CLAUSES;
        default:
            return DML_CLAUSES;
    }
}

const KeywordSet& function_verbs(Dialect dialect) {
    switch (dialect) {
        case Dialect::MYSQL:
        case Dialect::MYSQL_ANSI_QUOTES:
        case Dialect::MYSQL_NO_BACKSLASH_ESCAPES:
            return MYSQL_FUNCTIONS;
        default:
            return COMMON_FUNCTIONS;
    }
}

/**
 * @brief Lexical rules that decide where literals and comments end
 */
struct LexRules {
    bool quote_escapes = false;         // Backslash escapes inside '...'
    bool double_quote_escapes = false;  // Backslash escapes inside "..."
    bool escape_strings = false;        // E'...' honours backslash escapes
    bool dollar_quotes = false;         // $tag$...$tag$
    bool bracket_identifiers = false;   // [name]
    bool backtick_identifiers = false;  // `name`
    bool hash_comments = false;         // # to end of line
    bool spaced_dash_comments = false;  // "--" needs a following space or control char
    bool executable_comments = false;   // /*! */, /*M! */ and /*+ */ bodies are code
    bool nested_comments = false;
    bool variables = false;             // @x, @@x
    bool hash_names = false;            // #temp, ##global
};

LexRules rules_for(Dialect dialect) {
    LexRules rules;
    switch (dialect) {
        case Dialect::POSTGRESQL:
            rules.escape_strings = true;
            rules.dollar_quotes = true;
            rules.nested_comments = true;
            break;
        case Dialect::MYSQL:
        case Dialect::MYSQL_ANSI_QUOTES:
        case Dialect::MYSQL_NO_BACKSLASH_ESCAPES:
            rules.quote_escapes = (dialect != Dialect::MYSQL_NO_BACKSLASH_ESCAPES);
            rules.double_quote_escapes = (dialect == Dialect::MYSQL);
            rules.backtick_identifiers = true;
            rules.hash_comments = true;
            rules.spaced_dash_comments = true;
            rules.executable_comments = true;
            rules.variables = true;
            break;
        case Dialect::MSSQL:
            rules.bracket_identifiers = true;
            rules.nested_comments = true;
            rules.variables = true;
            rules.hash_names = true;
            break;
    }
    return rules;
}

constexpr size_t UNTERMINATED = std::string_view::npos;

inline bool is_space(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

inline bool is_control(unsigned char c) {
    return c < 0x20 || c == 0x7f;
}

inline bool is_digit(unsigned char c) {
    return c >= '0' && c <= '9';
}

inline bool is_word_start(unsigned char c, const LexRules& rules) {
    return std::isalpha(c) || c == '_' || c >= 0x80 || (rules.hash_names && c == '#');
}

inline bool is_word_cont(unsigned char c, const LexRules& rules) {
    return std::isalnum(c) || c == '_' || c == '$' || c >= 0x80 ||
           (rules.hash_names && (c == '#' || c == '@'));
}

inline unsigned char at(std::string_view sql, size_t i) {
    return i < sql.size() ? static_cast<unsigned char>(sql[i]) : '\0';
}

/**
 * @brief Skip a quoted run opened at sql[i]
 * @return Index just past the closing quote, or UNTERMINATED
 */
size_t skip_quoted(std::string_view sql, size_t i, char close, bool backslash_escapes) {
    for (size_t j = i + 1; j < sql.size(); ++j) {
        const char c = sql[j];
        if (backslash_escapes && c == '\\') {
            ++j;
            continue;
        }
        if (c == close) {
            // Doubled closing quote is an escaped quote
            if (j + 1 < sql.size() && sql[j + 1] == close) {
                ++j;
                continue;
            }
            return j + 1;
        }
    }
    return UNTERMINATED;
}

/**
 * @brief PostgreSQL dollar-quoted string ($$...$$ or $tag$...$tag$)
 * @return Index past the closing tag, 0 if sql[i] opens none, or UNTERMINATED
 */
size_t skip_dollar_quoted(std::string_view sql, size_t i) {
    size_t j = i + 1;
    if (is_digit(at(sql, j))) {
        return 0;   // $1 parameter
    }
    while (j < sql.size()) {
        const auto c = static_cast<unsigned char>(sql[j]);
        if (!(std::isalnum(c) || c == '_' || c >= 0x80)) break;
        ++j;
    }
    if (at(sql, j) != '$') {
        return 0;
    }
    const std::string_view tag = sql.substr(i, j - i + 1);
    const size_t end = sql.find(tag, j + 1);
    return end == std::string_view::npos ? UNTERMINATED : end + tag.size();
}

/**
 * @return Index past the comment opened at sql[i], or UNTERMINATED
 */
size_t skip_block_comment(std::string_view sql, size_t i, bool nested) {
    int depth = 1;
    size_t j = i + 2;
    while (j < sql.size()) {
        if (sql[j] == '*' && at(sql, j + 1) == '/') {
            j += 2;
            if (--depth == 0) return j;
            continue;
        }
        if (nested && sql[j] == '/' && at(sql, j + 1) == '*') {
            ++depth;
            j += 2;
            continue;
        }
        ++j;
    }
    return UNTERMINATED;
}

/**
 * @brief Length of a MySQL executable comment opener at sql[i], 0 if none
 *
 * The comment opener followed by '!' (optionally version gated, e.g. !50700),
 * 'M!' (MariaDB) or '+' (optimizer hints).
 */
size_t executable_comment_opener(std::string_view sql, size_t i) {
    size_t j = i + 2;
    if (at(sql, j) == 'M' && at(sql, j + 1) == '!') {
        j += 2;
    } else if (at(sql, j) == '!' || at(sql, j) == '+') {
        j += 1;
    } else {
        return 0;
    }
    while (is_digit(at(sql, j))) ++j;
    return j - i;
}

/**
 * @return Index past a numeric literal starting at sql[i]
 */
size_t skip_number(std::string_view sql, size_t i) {
    size_t j = i;
    if (at(sql, j) == '0' && (at(sql, j + 1) == 'x' || at(sql, j + 1) == 'X')) {
        j += 2;
        while (std::isxdigit(at(sql, j))) ++j;
        return j;
    }
    while (is_digit(at(sql, j))) ++j;
    if (at(sql, j) == '.') {
        ++j;
        while (is_digit(at(sql, j))) ++j;
    }
    if (at(sql, j) == 'e' || at(sql, j) == 'E') {
        size_t k = j + 1;
        if (at(sql, k) == '+' || at(sql, k) == '-') ++k;
        if (is_digit(at(sql, k))) {
            j = k;
            while (is_digit(at(sql, j))) ++j;
        }
    }
    return j;
}

/**
 * @brief First word of the statement wrapped by EXPLAIN/DESCRIBE, or nullptr
 */
const Token* explained_head(const std::vector<Token>& tokens, size_t from) {
    size_t k = from;
    // PostgreSQL option list: EXPLAIN (ANALYZE, FORMAT JSON) ...
    if (k < tokens.size() && tokens[k].kind == TokenKind::OPEN_PAREN) {
        int depth = 0;
        for (; k < tokens.size(); ++k) {
            if (tokens[k].kind == TokenKind::OPEN_PAREN) ++depth;
            if (tokens[k].kind == TokenKind::CLOSE_PAREN && --depth == 0) {
                ++k;
                break;
            }
        }
    }
    for (; k < tokens.size(); ++k) {
        const Token& token = tokens[k];
        if (token.kind == TokenKind::WORD && !EXPLAIN_OPTIONS.contains(token.text)) {
            return &token;
        }
        if (token.kind == TokenKind::OPEN_PAREN) {
            return nullptr;
        }
    }
    return nullptr;
}

} // anonymous namespace

PermissionEnforcer::Lexed PermissionEnforcer::tokenize(std::string_view sql, Dialect dialect) {
    const LexRules rules = rules_for(dialect);
    const size_t len = sql.size();

    Lexed lexed;
    Statement current;
    bool after_dot = false;
    int open_code_comments = 0;

    auto push = [&](TokenKind kind, std::string text = {}) {
        current.tokens.push_back(Token{kind, std::move(text), after_dot && kind == TokenKind::WORD});
        after_dot = false;
    };

    auto finish_statement = [&] {
        if (!current.tokens.empty()) {
            lexed.statements.push_back(std::move(current));
        }
        current = Statement{};
        after_dot = false;
    };

    auto unterminated = [&] {
        lexed.complete = false;
        finish_statement();
        return lexed;
    };

    size_t i = 0;
    while (i < len) {
        const auto c = static_cast<unsigned char>(sql[i]);
        const unsigned char next_c = at(sql, i + 1);

        if (is_space(c)) {
            ++i;
            continue;
        }

        // Line comments
        const bool dash_comment = c == '-' && next_c == '-' &&
            (!rules.spaced_dash_comments || i + 2 >= len ||
             is_space(at(sql, i + 2)) || is_control(at(sql, i + 2)));
        if (dash_comment || (rules.hash_comments && c == '#')) {
            const size_t nl = sql.find_first_of("\r\n", i);
            i = (nl == std::string_view::npos) ? len : nl + 1;
            continue;
        }

        // Block comments, and MySQL comments whose body runs as code
        if (c == '/' && next_c == '*') {
            if (rules.executable_comments) {
                if (const size_t opener = executable_comment_opener(sql, i); opener != 0) {
                    ++open_code_comments;
                    i += opener;
                    continue;
                }
            }
            const size_t end = skip_block_comment(sql, i, rules.nested_comments);
            if (end == UNTERMINATED) return unterminated();
            i = end;
            continue;
        }
        if (open_code_comments > 0 && c == '*' && next_c == '/') {
            --open_code_comments;
            i += 2;
            continue;
        }

        // Literals and quoted identifiers
        size_t quoted_end = 0;
        if (c == '\'') {
            quoted_end = skip_quoted(sql, i, '\'', rules.quote_escapes);
        } else if (c == '"') {
            quoted_end = skip_quoted(sql, i, '"', rules.double_quote_escapes);
        } else if (c == '`' && rules.backtick_identifiers) {
            quoted_end = skip_quoted(sql, i, '`', false);
        } else if (c == '[' && rules.bracket_identifiers) {
            quoted_end = skip_quoted(sql, i, ']', false);
        } else if (c == '$' && rules.dollar_quotes) {
            quoted_end = skip_dollar_quoted(sql, i);
        }
        if (quoted_end == UNTERMINATED) return unterminated();
        if (quoted_end != 0) {
            push(TokenKind::QUOTED);
            i = quoted_end;
            continue;
        }

        if (c == ';') {
            finish_statement();
            ++i;
            continue;
        }

        // Variables (@x, @@x) are never keywords
        if (c == '@' && rules.variables) {
            ++i;
            while (i < len && (sql[i] == '@' || is_word_cont(static_cast<unsigned char>(sql[i]), rules))) ++i;
            push(TokenKind::QUOTED);
            continue;
        }

        if (is_digit(c) || (c == '.' && is_digit(next_c))) {
            i = skip_number(sql, i);
            push(TokenKind::QUOTED);
            continue;
        }

        if (is_word_start(c, rules)) {
            const size_t start = i;
            while (i < len && is_word_cont(static_cast<unsigned char>(sql[i]), rules)) ++i;
            const std::string_view word = sql.substr(start, i - start);

            // PostgreSQL escape string E'...'
            if (rules.escape_strings && (word == "E" || word == "e") && at(sql, i) == '\'') {
                const size_t end = skip_quoted(sql, i, '\'', true);
                if (end == UNTERMINATED) return unterminated();
                push(TokenKind::QUOTED);
                i = end;
                continue;
            }
            push(TokenKind::WORD, utils::to_upper(word));
            continue;
        }

        if (c == '(') {
            push(TokenKind::OPEN_PAREN, "(");
        } else if (c == ')') {
            push(TokenKind::CLOSE_PAREN, ")");
        } else {
            push(TokenKind::SYMBOL, std::string(1, static_cast<char>(c)));
            after_dot = (c == '.');
        }
        ++i;
    }

    if (open_code_comments > 0) {
        return unterminated();
    }
    finish_statement();
    return lexed;
}

bool PermissionEnforcer::is_read_statement(const Statement& statement, Dialect dialect) {
    const auto& tokens = statement.tokens;

    size_t i = 0;
    while (i < tokens.size() && tokens[i].kind == TokenKind::OPEN_PAREN) ++i;
    if (i >= tokens.size() || tokens[i].kind != TokenKind::WORD) {
        return false;
    }

    const std::string& head = tokens[i].text;
    if (!(i > 0 ? PAREN_READ_HEADS : READ_HEADS).contains(head)) {
        return false;
    }

    if (EXPLAIN_HEADS.contains(head)) {
        const Token* wrapped = explained_head(tokens, i + 1);
        if (wrapped != nullptr && STATEMENT_VERBS.contains(wrapped->text)) {
            return false;
        }
    }

    const KeywordSet& clauses = clause_verbs(dialect);
    const KeywordSet& functions = function_verbs(dialect);

    for (size_t k = i + 1; k < tokens.size(); ++k) {
        const Token& token = tokens[k];
        if (token.kind != TokenKind::WORD || token.qualified) {
            continue;
        }
        const Token* next = (k + 1 < tokens.size()) ? &tokens[k + 1] : nullptr;

        if (next != nullptr && next->kind == TokenKind::OPEN_PAREN && functions.contains(token.text)) {
            continue;
        }
        if (clauses.contains(token.text)) {
            return false;
        }
        if (token.text == "FOR" && next != nullptr && next->kind == TokenKind::WORD &&
            LOCK_STRENGTHS.contains(next->text)) {
            return false;
        }
    }
    return true;
}

StatementClass PermissionEnforcer::classify(std::string_view sql, DatabaseType type) {
    auto classify_as = [&](std::initializer_list<Dialect> dialects) {
        for (const Dialect dialect : dialects) {
            const Lexed lexed = tokenize(sql, dialect);
            if (!lexed.complete || lexed.statements.empty()) {
                return StatementClass::WRITE;
            }
            for (const auto& statement : lexed.statements) {
                if (!is_read_statement(statement, dialect)) {
                    return StatementClass::WRITE;
                }
            }
        }
        return StatementClass::READ;
    };

    switch (type) {
        case DatabaseType::POSTGRESQL:
            return classify_as({Dialect::POSTGRESQL});
        case DatabaseType::MYSQL:
            return classify_as({Dialect::MYSQL, Dialect::MYSQL_ANSI_QUOTES,
                                Dialect::MYSQL_NO_BACKSLASH_ESCAPES});
        case DatabaseType::MSSQL:
            return classify_as({Dialect::MSSQL});
        default:
            return StatementClass::WRITE;
    }
}

std::string PermissionEnforcer::read_only_reason(const std::string& server_name) {
    return std::format("Access denied: Server '{}' is READ-ONLY. Only SELECT queries allowed.",
                       server_name);
}

PermissionDecision PermissionEnforcer::check(const ServerProfile& profile, std::string_view sql) {
    const StatementClass cls = classify(sql, profile.type);
    if (cls == StatementClass::WRITE && profile.read_only) {
        utils::log::warn(std::format("Denied {} statement against read-only server '{}'",
                                     statement_class_to_string(cls), profile.name));
        return PermissionDecision::deny(cls, read_only_reason(profile.name));
    }
    return PermissionDecision::allow(cls);
}

} // namespace sqlgateway
