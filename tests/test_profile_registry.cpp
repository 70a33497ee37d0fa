#include <catch2/catch_test_macros.hpp>
#include "db/profile_registry.hpp"
#include "mocks/mock_database.hpp"

#include <cstdlib>
#include <thread>

using namespace sqlgateway;
using sqlgateway::testing::make_profile;

TEST_CASE("ProfileRegistry: names are stored uppercase and resolved case-insensitively", "[registry]") {
    ProfileRegistry registry({make_profile("server_profile_1"), make_profile("Analytics", true)}, "");

    const auto list = registry.list();
    REQUIRE(list.size() == 2);
    CHECK(list[0].name == "SERVER_PROFILE_1");
    CHECK(list[1].name == "ANALYTICS");

    auto r = registry.resolve(std::string("analytics"));
    REQUIRE(r.is_ok());
    CHECK(r.value().name == "ANALYTICS");
    CHECK(r.value().read_only);
}

TEST_CASE("ProfileRegistry: absent name resolves to the default", "[registry]") {
    ProfileRegistry registry({make_profile("A"), make_profile("B")}, "b");

    CHECK(registry.default_name() == std::optional<std::string>("B"));

    auto r = registry.resolve(std::nullopt);
    REQUIRE(r.is_ok());
    CHECK(r.value().name == "B");

    auto empty = registry.resolve(std::string(""));
    REQUIRE(empty.is_ok());
    CHECK(empty.value().name == "B");
}

TEST_CASE("ProfileRegistry: first profile is the default when none is configured", "[registry]") {
    ::unsetenv("DB_PROFILE");
    ProfileRegistry registry({make_profile("FIRST"), make_profile("SECOND")}, "");
    CHECK(registry.default_name() == std::optional<std::string>("FIRST"));
}

TEST_CASE("ProfileRegistry: DB_PROFILE supplies the default", "[registry]") {
    ::setenv("DB_PROFILE", "second", 1);
    ProfileRegistry registry({make_profile("FIRST"), make_profile("SECOND")}, "");
    ::unsetenv("DB_PROFILE");
    CHECK(registry.default_name() == std::optional<std::string>("SECOND"));
}

TEST_CASE("ProfileRegistry: unknown name reports the available profiles", "[registry]") {
    ProfileRegistry registry({make_profile("A"), make_profile("B")}, "A");

    auto r = registry.resolve(std::string("nope"));
    REQUIRE(r.is_error());
    CHECK(r.error_category() == ErrorCategory::PROFILE_NOT_FOUND);
    CHECK(r.error_message() == "Server profile 'NOPE' not found. Available: A, B");
}

TEST_CASE("ProfileRegistry: empty registry has no default", "[registry]") {
    ::unsetenv("DB_PROFILE");
    ProfileRegistry registry;
    CHECK(registry.size() == 0);
    CHECK_FALSE(registry.default_name().has_value());

    auto r = registry.resolve(std::nullopt);
    REQUIRE(r.is_error());
    CHECK(r.error_category() == ErrorCategory::PROFILE_NOT_FOUND);
}

TEST_CASE("ProfileRegistry: reload swaps the snapshot atomically", "[registry]") {
    ProfileRegistry registry({make_profile("OLD")}, "OLD");
    const auto before = registry.snapshot();

    registry.reload({make_profile("NEW1"), make_profile("NEW2")}, "NEW2");

    // A reader holding the old snapshot still sees a consistent view
    REQUIRE(before->profiles.size() == 1);
    CHECK(before->profiles[0].name == "OLD");

    CHECK(registry.size() == 2);
    CHECK(registry.default_name() == std::optional<std::string>("NEW2"));
    CHECK(registry.resolve(std::string("OLD")).is_error());
}

TEST_CASE("ProfileRegistry: concurrent readers during reload", "[registry]") {
    ProfileRegistry registry({make_profile("A")}, "A");

    std::atomic<bool> stop{false};
    std::atomic<int> inconsistent{0};
    std::thread reader([&] {
        while (!stop.load()) {
            const auto snap = registry.snapshot();
            if (!snap->default_name) {
                ++inconsistent;
                continue;
            }
            bool found = false;
            for (const auto& p : snap->profiles) {
                if (p.name == *snap->default_name) found = true;
            }
            if (!found) ++inconsistent;
        }
    });

    for (int i = 0; i < 200; ++i) {
        const std::string name = "P" + std::to_string(i);
        registry.reload({make_profile(name)}, name);
    }
    stop = true;
    reader.join();

    CHECK(inconsistent.load() == 0);
}
