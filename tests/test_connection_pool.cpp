#include <catch2/catch_test_macros.hpp>
#include "db/generic_connection_pool.hpp"
#include "mocks/mock_database.hpp"

#include <atomic>
#include <thread>

using namespace sqlgateway;
using namespace sqlgateway::testing;
using namespace std::chrono_literals;

namespace {

PoolConfig pool_config(size_t max_connections, size_t max_waiters = 64) {
    PoolConfig cfg;
    cfg.max_connections = max_connections;
    cfg.max_waiters = max_waiters;
    return cfg;
}

} // anonymous namespace

TEST_CASE("GenericConnectionPool: sessions are created lazily and reused", "[pool]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    GenericConnectionPool pool(make_profile("A"), pool_config(2), factory);

    CHECK(factory->creates() == 0);
    CHECK(pool.name() == "A");

    {
        auto r = pool.acquire(100ms);
        REQUIRE(r.is_ok());
        CHECK(factory->creates() == 1);
        CHECK(pool.get_stats().active_connections == 1);
    }

    CHECK(pool.get_stats().idle_connections == 1);

    {
        auto r = pool.acquire(100ms);
        REQUIRE(r.is_ok());
    }
    CHECK(factory->creates() == 1);
    CHECK(pool.get_stats().total_acquires == 2);
    CHECK(pool.get_stats().total_releases == 2);
}

TEST_CASE("GenericConnectionPool: new sessions open in the profile's default database", "[pool]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    auto profile = make_profile("A");
    profile.default_database = "sales";
    GenericConnectionPool pool(profile, pool_config(1), factory);

    auto r = pool.acquire(100ms);
    REQUIRE(r.is_ok());
    CHECK(r.value()->get()->current_database() == "sales");
}

TEST_CASE("GenericConnectionPool: acquire times out when every session is busy", "[pool]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    GenericConnectionPool pool(make_profile("A"), pool_config(1), factory);

    auto held = pool.acquire(100ms);
    REQUIRE(held.is_ok());

    const auto start = std::chrono::steady_clock::now();
    auto second = pool.acquire(50ms);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(second.is_error());
    CHECK(second.error_category() == ErrorCategory::POOL_EXHAUSTED);
    CHECK(elapsed >= 40ms);
    CHECK(pool.get_stats().failed_acquires == 1);
}

TEST_CASE("GenericConnectionPool: released session wakes a waiter", "[pool]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    GenericConnectionPool pool(make_profile("A"), pool_config(1), factory);

    auto held = pool.acquire(100ms);
    REQUIRE(held.is_ok());

    std::atomic<bool> acquired{false};
    std::thread waiter([&] {
        auto r = pool.acquire(2000ms);
        acquired = r.is_ok();
    });

    std::this_thread::sleep_for(50ms);
    CHECK_FALSE(acquired.load());

    held.value().reset();
    waiter.join();

    CHECK(acquired.load());
    CHECK(factory->creates() == 1);
}

TEST_CASE("GenericConnectionPool: bounded queue rejects excess waiters immediately", "[pool]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    GenericConnectionPool pool(make_profile("A"), pool_config(1, 1), factory);

    auto held = pool.acquire(100ms);
    REQUIRE(held.is_ok());

    std::atomic<bool> waiter_ok{false};
    std::thread waiter([&] {
        auto r = pool.acquire(2000ms);
        waiter_ok = r.is_ok();
    });

    // Let the waiter occupy the only queue slot
    std::this_thread::sleep_for(100ms);

    const auto start = std::chrono::steady_clock::now();
    auto rejected = pool.acquire(1000ms);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(rejected.is_error());
    CHECK(rejected.error_category() == ErrorCategory::POOL_EXHAUSTED);
    CHECK(rejected.error_message().find("queue full") != std::string::npos);
    CHECK(elapsed < 500ms);

    held.value().reset();
    waiter.join();
    CHECK(waiter_ok.load());
}

TEST_CASE("GenericConnectionPool: factory failure is a connection error and frees the slot", "[pool]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    factory->fail_with("connection refused");
    GenericConnectionPool pool(make_profile("A"), pool_config(1), factory);

    auto r = pool.acquire(100ms);
    REQUIRE(r.is_error());
    CHECK(r.error_category() == ErrorCategory::CONNECTION_ERROR);
    CHECK(r.error_message() == "connection refused");

    factory->fail_with("");
    auto retry = pool.acquire(100ms);
    CHECK(retry.is_ok());
}

TEST_CASE("GenericConnectionPool: suspect unhealthy session is discarded on return", "[pool]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    GenericConnectionPool pool(make_profile("A"), pool_config(1), factory);

    {
        auto r = pool.acquire(100ms);
        REQUIRE(r.is_ok());
        factory->script()->healthy = false;
        r.value()->mark_suspect();
    }

    CHECK(factory->script()->closed.load() == 1);
    CHECK(pool.get_stats().connections_discarded == 1);
    CHECK(pool.get_stats().idle_connections == 0);

    factory->script()->healthy = true;
    auto next = pool.acquire(100ms);
    REQUIRE(next.is_ok());
    CHECK(factory->creates() == 2);
}

TEST_CASE("GenericConnectionPool: suspect session that still answers is kept", "[pool]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    GenericConnectionPool pool(make_profile("A"), pool_config(1), factory);

    {
        auto r = pool.acquire(100ms);
        REQUIRE(r.is_ok());
        r.value()->mark_suspect();
    }

    CHECK(pool.get_stats().idle_connections == 1);
    CHECK(pool.get_stats().connections_discarded == 0);
}

TEST_CASE("GenericConnectionPool: disconnected session is never returned to idle", "[pool]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    factory->script()->set_handler([](const std::string&) {
        return DbResultSet::failure("server closed the connection", DbErrorKind::CONNECTION);
    });
    GenericConnectionPool pool(make_profile("A"), pool_config(1), factory);

    {
        auto r = pool.acquire(100ms);
        REQUIRE(r.is_ok());
        auto rs = r.value()->get()->execute("SELECT 1");
        CHECK_FALSE(rs.success);
    }

    CHECK(pool.get_stats().idle_connections == 0);
    CHECK(pool.get_stats().total_connections == 0);
}

TEST_CASE("GenericConnectionPool: session returned inside a transaction is discarded", "[pool]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    GenericConnectionPool pool(make_profile("A"), pool_config(1), factory);

    {
        auto r = pool.acquire(100ms);
        REQUIRE(r.is_ok());
        REQUIRE(r.value()->get()->execute("BEGIN").success);
        CHECK(r.value()->get()->in_transaction());
    }

    CHECK(factory->script()->closed.load() == 1);
    CHECK(pool.get_stats().connections_discarded == 1);
    CHECK(pool.get_stats().idle_connections == 0);

    auto next = pool.acquire(100ms);
    REQUIRE(next.is_ok());
    CHECK(factory->creates() == 2);
    CHECK_FALSE(next.value()->get()->in_transaction());
}

TEST_CASE("GenericConnectionPool: session whose transaction ended is kept", "[pool]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    GenericConnectionPool pool(make_profile("A"), pool_config(1), factory);

    {
        auto r = pool.acquire(100ms);
        REQUIRE(r.is_ok());
        REQUIRE(r.value()->get()->execute("BEGIN").success);
        REQUIRE(r.value()->get()->execute("COMMIT").success);
    }

    CHECK(pool.get_stats().idle_connections == 1);
    CHECK(pool.get_stats().connections_discarded == 0);
}

TEST_CASE("GenericConnectionPool: sessions record the database they opened on", "[pool]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    factory->script()->login_database = "postgres";
    GenericConnectionPool pool(make_profile("A"), pool_config(1), factory);

    auto r = pool.acquire(100ms);
    REQUIRE(r.is_ok());
    CHECK(r.value()->get()->home_database() == "postgres");
    CHECK(r.value()->get()->current_database() == "postgres");
}

TEST_CASE("GenericConnectionPool: idle session past idle_timeout is validated", "[pool]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    auto cfg = pool_config(1);
    cfg.idle_timeout = 10ms;
    GenericConnectionPool pool(make_profile("A"), cfg, factory);

    {
        auto r = pool.acquire(100ms);
        REQUIRE(r.is_ok());
    }

    std::this_thread::sleep_for(30ms);
    factory->script()->healthy = false;

    auto r = pool.acquire(100ms);
    REQUIRE(r.is_ok());
    CHECK(factory->creates() == 2);
    CHECK(pool.get_stats().health_check_failures == 1);
}

TEST_CASE("GenericConnectionPool: drain refuses further acquires", "[pool]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    GenericConnectionPool pool(make_profile("A"), pool_config(2), factory);

    {
        auto r = pool.acquire(100ms);
        REQUIRE(r.is_ok());
    }

    pool.drain();
    CHECK(factory->script()->closed.load() == 1);

    auto r = pool.acquire(100ms);
    REQUIRE(r.is_error());
    CHECK(r.error_category() == ErrorCategory::POOL_EXHAUSTED);
}

TEST_CASE("GenericConnectionPool: concurrent load never exceeds max sessions", "[pool]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    GenericConnectionPool pool(make_profile("A"), pool_config(3), factory);

    std::atomic<int> in_use{0};
    std::atomic<int> peak{0};
    std::atomic<int> ok{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 20; ++i) {
                auto r = pool.acquire(2000ms);
                if (r.is_error()) continue;
                const int now = ++in_use;
                int prev = peak.load();
                while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
                std::this_thread::sleep_for(1ms);
                --in_use;
                ++ok;
            }
        });
    }
    for (auto& th : threads) th.join();

    CHECK(peak.load() <= 3);
    CHECK(ok.load() == 160);
    CHECK(factory->creates() <= 3);
}
