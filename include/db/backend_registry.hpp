#pragma once

#include "db/idb_backend.hpp"
#include "core/database_type.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace sqlgateway {

/**
 * @brief Registry for database backends
 *
 * Backends are registered at startup (main.cpp register_backends(), or a
 * static registrar in the backend's translation unit). The registry is
 * queried by DatabaseType to instantiate the right backend.
 *
 * Usage:
 *   BackendRegistry::instance().register_backend(
 *       DatabaseType::POSTGRESQL, []{ return std::make_unique<PgBackend>(); });
 *
 *   auto backend = BackendRegistry::instance().create(DatabaseType::POSTGRESQL);
 */
class BackendRegistry {
public:
    using Factory = std::function<std::unique_ptr<IDbBackend>()>;

    static BackendRegistry& instance() {
        static BackendRegistry registry;
        return registry;
    }

    void register_backend(DatabaseType type, Factory factory) {
        std::lock_guard lock(mutex_);
        factories_[type] = std::move(factory);
    }

    void unregister_backend(DatabaseType type) {
        std::lock_guard lock(mutex_);
        factories_.erase(type);
    }

    /**
     * @throws std::runtime_error when no backend is registered for the type
     */
    [[nodiscard]] std::unique_ptr<IDbBackend> create(DatabaseType type) const {
        Factory factory;
        {
            std::lock_guard lock(mutex_);
            const auto it = factories_.find(type);
            if (it == factories_.end()) {
                throw std::runtime_error(
                    std::string("No backend registered for database type: ") +
                    std::string(database_type_to_string(type)));
            }
            factory = it->second;
        }
        return factory();
    }

    [[nodiscard]] bool has_backend(DatabaseType type) const {
        std::lock_guard lock(mutex_);
        return factories_.contains(type);
    }

private:
    BackendRegistry() = default;

    struct DatabaseTypeHash {
        size_t operator()(DatabaseType t) const {
            return std::hash<int>()(static_cast<int>(t));
        }
    };

    mutable std::mutex mutex_;
    std::unordered_map<DatabaseType, Factory, DatabaseTypeHash> factories_;
};

} // namespace sqlgateway
