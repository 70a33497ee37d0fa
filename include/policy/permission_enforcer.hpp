#pragma once

#include "core/types.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace sqlgateway {

/**
 * @brief Outcome of a read-only policy check
 */
struct PermissionDecision {
    bool allowed = true;
    StatementClass statement_class = StatementClass::READ;
    std::string reason;     // Set when denied

    static PermissionDecision allow(StatementClass cls) {
        return PermissionDecision{true, cls, {}};
    }

    static PermissionDecision deny(StatementClass cls, std::string reason) {
        return PermissionDecision{false, cls, std::move(reason)};
    }
};

/**
 * @brief Lexical read/write classifier and read-only policy gate
 *
 * Fail-closed: a batch is READ only when every statement starts with a
 * read keyword and contains no write clause outside literals and comments.
 * Anything else, including input with an unterminated quote, bracket or
 * comment, is WRITE.
 *
 * The SQL is lexed with the rules of the profile's own backend. MySQL text
 * is lexed once per quoting mode the server may run under (default,
 * ANSI_QUOTES, NO_BACKSLASH_ESCAPES) and every lexing must classify it as
 * READ.
 *
 * Write clauses are recognised where they take effect:
 * - the statement head (allow-list of read keywords);
 * - the statement an EXPLAIN/DESCRIBE wraps;
 * - DML anywhere (INSERT, UPDATE, DELETE, MERGE, INTO), which also covers
 *   data-modifying CTEs and SELECT ... INTO;
 * - row locks (FOR UPDATE, FOR SHARE, LOCK IN SHARE MODE);
 * - any statement verb on SQL Server, where statements need no separator.
 *
 * A verb that doubles as a function name (REPLACE, and INSERT/TRUNCATE on
 * MySQL) directly followed by '(' is a function call.
 */
class PermissionEnforcer {
public:
    enum class Dialect {
        POSTGRESQL,                 // E'' escapes, $tag$ strings, nested comments
        MYSQL,                      // backslash escapes, '#' and "-- " comments, /*! */ code
        MYSQL_ANSI_QUOTES,          // "" quotes an identifier
        MYSQL_NO_BACKSLASH_ESCAPES,
        MSSQL                       // [bracket] identifiers, nested comments, #temp names
    };

    enum class TokenKind {
        WORD,           // Bare keyword or identifier, uppercased
        QUOTED,         // String, number, quoted identifier or variable
        OPEN_PAREN,
        CLOSE_PAREN,
        SYMBOL
    };

    struct Token {
        TokenKind kind = TokenKind::SYMBOL;
        std::string text;
        bool qualified = false;     // WORD preceded by '.' (schema.table, t.column)
    };

    /**
     * @brief One statement of a batch as its significant tokens
     */
    struct Statement {
        std::vector<Token> tokens;
    };

    struct Lexed {
        std::vector<Statement> statements;
        bool complete = true;       // false: unterminated quote, bracket or comment
    };

    /**
     * @brief Classify a batch with the lexing rules of `type`
     */
    [[nodiscard]] static StatementClass classify(std::string_view sql, DatabaseType type);

    /**
     * @brief Deny a WRITE batch against a read-only profile
     */
    [[nodiscard]] static PermissionDecision check(const ServerProfile& profile, std::string_view sql);

    /**
     * @brief The denial reason for a read-only server, verbatim
     */
    [[nodiscard]] static std::string read_only_reason(const std::string& server_name);

    /**
     * @brief Split SQL into statements of tokens using one dialect's lexing rules
     */
    [[nodiscard]] static Lexed tokenize(std::string_view sql, Dialect dialect);

private:
    [[nodiscard]] static bool is_read_statement(const Statement& statement, Dialect dialect);
};

} // namespace sqlgateway
