#include <catch2/catch_test_macros.hpp>
#include "warden/severity.hpp"

using namespace warden;
using namespace std::chrono_literals;

TEST_CASE("Event names are classified into tiers", "[severity]")
{
    REQUIRE(classify("resource.read") == Severity::Noise);
    REQUIRE(classify("authz.granted") == Severity::Noise);
    REQUIRE(classify("task.viewed") == Severity::Noise);
    REQUIRE(classify("resource.read.batch") == Severity::Noise);

    REQUIRE(classify("ledger.purged") == Severity::Critical);
    REQUIRE(classify("ledger.integrity_violation") == Severity::Critical);

    REQUIRE(classify("auth.login") == Severity::Important);
    REQUIRE(classify("authz.denied") == Severity::Important);
    REQUIRE(classify("role.permission_granted") == Severity::Important);
    REQUIRE(classify("something.unheard_of") == Severity::Important);
    REQUIRE(classify("resource.reader") == Severity::Important);
}

TEST_CASE("Severity names", "[severity]")
{
    REQUIRE(to_string(Severity::Noise) == "noise");
    REQUIRE(severity_from_string("critical") == Severity::Critical);

    auto bad = severity_from_string("Noise");
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code == ErrorCode::InvalidInput);
}

TEST_CASE("Retention windows decide staleness", "[severity]")
{
    RetentionPolicy policy;
    const Timestamp now{std::chrono::milliseconds(1'765'440'000'000)};

    REQUIRE(policy.window(Severity::Noise) == std::chrono::milliseconds(std::chrono::days(7)));
    REQUIRE_FALSE(policy.window(Severity::Critical).has_value());

    SECTION("Noise expires after seven days")
    {
        REQUIRE_FALSE(policy.is_stale(Severity::Noise, now - std::chrono::days(7), now));
        REQUIRE(policy.is_stale(Severity::Noise, now - std::chrono::days(7) - 1ms, now));
    }

    SECTION("Important expires after ninety days")
    {
        REQUIRE_FALSE(policy.is_stale(Severity::Important, now - std::chrono::days(30), now));
        REQUIRE(policy.is_stale(Severity::Important, now - std::chrono::days(91), now));
    }

    SECTION("Critical never expires")
    {
        REQUIRE_FALSE(policy.is_stale(Severity::Critical, now - std::chrono::years(10), now));
        REQUIRE_FALSE(policy.stale_cutoff(Severity::Critical, now).has_value());
    }

    SECTION("Windows are configurable")
    {
        RetentionPolicy short_policy{std::chrono::days(1), std::chrono::days(2)};
        REQUIRE(short_policy.is_stale(Severity::Important, now - std::chrono::days(3), now));
        REQUIRE(short_policy.stale_cutoff(Severity::Noise, now) == now - std::chrono::days(1));
    }
}
