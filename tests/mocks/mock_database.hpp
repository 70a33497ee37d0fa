#pragma once

#include "db/backend_registry.hpp"
#include "db/iconnection_factory.hpp"
#include "db/idb_backend.hpp"
#include "db/idb_connection.hpp"
#include "core/utils.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace sqlgateway::testing {

// ============================================================================
// Result builders
// ============================================================================

inline DbResultSet ok_rows(std::vector<std::string> columns,
                           std::vector<ColumnTypeInfo> types,
                           std::vector<std::vector<std::optional<std::string>>> rows) {
    DbResultSet rs;
    rs.success = true;
    rs.has_rows = true;
    rs.column_names = std::move(columns);
    rs.column_types = std::move(types);
    rs.rows = std::move(rows);
    rs.affected_rows = rs.rows.size();
    return rs;
}

inline DbResultSet ok_command(uint64_t affected = 0) {
    DbResultSet rs;
    rs.success = true;
    rs.has_rows = false;
    rs.affected_rows = affected;
    return rs;
}

// ============================================================================
// MockScript - behaviour and call log shared by every connection of a factory
// ============================================================================

struct MockScript {
    using Handler = std::function<DbResultSet(const std::string& sql)>;

    mutable std::mutex mutex;
    Handler handler;                        // Unset = every statement succeeds with no rows
    std::vector<std::string> executed;      // Every statement, in order, across connections
    std::vector<uint32_t> timeouts;         // Every set_query_timeout() value
    std::vector<std::string> switches;      // Every switch_database() target, resolved
    std::vector<std::vector<QueryParam>> bound;  // Parameters of every execute_with_params()
    std::string switch_error;               // Non-empty = switch_database() fails with it
    std::string login_database;             // Database a session opens on when none is requested
    std::atomic<bool> healthy{true};
    std::atomic<int> closed{0};
    std::chrono::milliseconds execute_delay{0};

    void set_handler(Handler h) {
        std::lock_guard lock(mutex);
        handler = std::move(h);
    }

    [[nodiscard]] std::vector<std::string> statements() const {
        std::lock_guard lock(mutex);
        return executed;
    }

    [[nodiscard]] std::vector<std::string> switched_to() const {
        std::lock_guard lock(mutex);
        return switches;
    }

    [[nodiscard]] std::vector<std::vector<QueryParam>> bound_params() const {
        std::lock_guard lock(mutex);
        return bound;
    }

    [[nodiscard]] size_t count(const std::string& sql) const {
        std::lock_guard lock(mutex);
        size_t n = 0;
        for (const auto& s : executed) {
            if (s == sql) ++n;
        }
        return n;
    }
};

// ============================================================================
// MockDbConnection
// ============================================================================

class MockDbConnection : public IDbConnection {
public:
    MockDbConnection(std::shared_ptr<MockScript> script, std::string database)
        : script_(std::move(script)),
          database_(database.empty() ? script_->login_database : std::move(database)),
          home_(database_) {}

    /**
     * Emulates the session state a server keeps: BEGIN opens a transaction,
     * COMMIT and ROLLBACK close it, USE <db> changes the current database.
     */
    DbResultSet execute(const std::string& sql, size_t max_rows = 0) override {
        if (script_->execute_delay.count() > 0) {
            std::this_thread::sleep_for(script_->execute_delay);
        }

        MockScript::Handler handler;
        {
            std::lock_guard lock(script_->mutex);
            script_->executed.push_back(sql);
            handler = script_->handler;
        }

        DbResultSet rs = handler ? handler(sql) : ok_command();
        if (!rs.success && rs.error_kind == DbErrorKind::CONNECTION) {
            connected_ = false;
        }
        if (rs.success) {
            if (sql == "BEGIN") {
                in_transaction_ = true;
            } else if (sql == "COMMIT" || sql == "ROLLBACK") {
                in_transaction_ = false;
            } else if (sql.size() > 4 && utils::iequals(sql.substr(0, 4), "USE ")) {
                database_ = sql.substr(4);
            }
        }
        if (rs.success && max_rows > 0 && rs.rows.size() > max_rows) {
            rs.rows.resize(max_rows);
            rs.truncated = true;
        }
        return rs;
    }

    DbResultSet execute_with_params(const std::string& sql, const std::vector<QueryParam>& params,
                                    size_t max_rows = 0) override {
        {
            std::lock_guard lock(script_->mutex);
            script_->bound.push_back(params);
        }
        return execute(sql, max_rows);
    }

    bool is_healthy(const std::string&) override {
        return connected_ && script_->healthy.load();
    }

    bool is_connected() const override { return connected_; }

    bool set_query_timeout(uint32_t timeout_ms) override {
        std::lock_guard lock(script_->mutex);
        script_->timeouts.push_back(timeout_ms);
        return true;
    }

    std::string switch_database(const std::string& database) override {
        const std::string target = database.empty() ? home_ : database;
        {
            std::lock_guard lock(script_->mutex);
            script_->switches.push_back(target);
            if (!script_->switch_error.empty()) {
                return script_->switch_error;
            }
        }
        database_ = target;
        return "";
    }

    const std::string& current_database() const override { return database_; }
    const std::string& home_database() const override { return home_; }
    bool in_transaction() override { return in_transaction_; }

    void close() override {
        if (connected_) {
            connected_ = false;
            script_->closed.fetch_add(1);
        }
    }

private:
    std::shared_ptr<MockScript> script_;
    std::string database_;
    std::string home_;
    bool connected_ = true;
    bool in_transaction_ = false;
};

// ============================================================================
// MockConnectionFactory - counts every create() call
// ============================================================================

class MockConnectionFactory : public IConnectionFactory {
public:
    explicit MockConnectionFactory(std::shared_ptr<MockScript> script = std::make_shared<MockScript>())
        : script_(std::move(script)) {}

    Result<std::unique_ptr<IDbConnection>> create(
        const ServerProfile& /*profile*/, const std::string& database) override {
        creates_.fetch_add(1);
        {
            std::lock_guard lock(mutex_);
            if (!fail_reason_.empty()) {
                return Result<std::unique_ptr<IDbConnection>>::error(
                    ErrorCategory::CONNECTION_ERROR, fail_reason_);
            }
        }
        return Result<std::unique_ptr<IDbConnection>>::ok(
            std::make_unique<MockDbConnection>(script_, database));
    }

    /** @brief Make every following create() fail with `reason` (empty = succeed) */
    void fail_with(std::string reason) {
        std::lock_guard lock(mutex_);
        fail_reason_ = std::move(reason);
    }

    [[nodiscard]] int creates() const { return creates_.load(); }
    [[nodiscard]] const std::shared_ptr<MockScript>& script() const { return script_; }

private:
    std::shared_ptr<MockScript> script_;
    std::mutex mutex_;
    std::string fail_reason_;
    std::atomic<int> creates_{0};
};

// ============================================================================
// MockBackend
// ============================================================================

class MockBackend : public IDbBackend {
public:
    static constexpr const char* kListDatabasesSql = "LIST DATABASES";

    MockBackend(DatabaseType type, std::shared_ptr<MockConnectionFactory> factory)
        : type_(type), factory_(std::move(factory)) {}

    DatabaseType type() const override { return type_; }
    std::shared_ptr<IConnectionFactory> create_connection_factory() override { return factory_; }
    std::string list_databases_sql() const override { return kListDatabasesSql; }
    std::string begin_transaction_sql() const override { return "BEGIN"; }

private:
    DatabaseType type_;
    std::shared_ptr<MockConnectionFactory> factory_;
};

/**
 * @brief Registers a MockBackend for a database type for the scope's lifetime
 */
class ScopedMockBackend {
public:
    explicit ScopedMockBackend(DatabaseType type,
                               std::shared_ptr<MockConnectionFactory> factory =
                                   std::make_shared<MockConnectionFactory>())
        : type_(type), factory_(std::move(factory)) {
        BackendRegistry::instance().register_backend(type_, [type = type_, factory = factory_] {
            return std::make_unique<MockBackend>(type, factory);
        });
    }

    ~ScopedMockBackend() {
        BackendRegistry::instance().unregister_backend(type_);
    }

    ScopedMockBackend(const ScopedMockBackend&) = delete;
    ScopedMockBackend& operator=(const ScopedMockBackend&) = delete;

    [[nodiscard]] MockConnectionFactory& factory() const { return *factory_; }
    [[nodiscard]] MockScript& script() const { return *factory_->script(); }

private:
    DatabaseType type_;
    std::shared_ptr<MockConnectionFactory> factory_;
};

// ============================================================================
// Profile builder
// ============================================================================

inline ServerProfile make_profile(std::string name, bool read_only = false,
                                  DatabaseType type = DatabaseType::POSTGRESQL) {
    ServerProfile p;
    p.name = std::move(name);
    p.type = type;
    p.host = "db.test";
    p.port = default_port(type);
    p.user = "tester";
    p.read_only = read_only;
    p.acquire_timeout = std::chrono::milliseconds{200};
    return p;
}

} // namespace sqlgateway::testing
