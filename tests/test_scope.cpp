#include <catch2/catch_test_macros.hpp>
#include "warden/scope.hpp"

using namespace warden;

TEST_CASE("Scopes parse from JSON objects", "[scope]")
{
    auto scope = Scope::parse({{"project_id", "p1"}, {"level", "3"}});
    REQUIRE(scope.has_value());
    REQUIRE(scope->entries().at("project_id") == "p1");
    REQUIRE(scope->entries().at("level") == "3");

    REQUIRE(Scope::parse(nullptr)->empty());
    REQUIRE(Scope::parse(nlohmann::json::object())->empty());

    SECTION("Other shapes are InvalidScope")
    {
        for (const auto &bad : {nlohmann::json::array({1}),
                                nlohmann::json("p1"),
                                nlohmann::json{{"ratio", 0.5}},
                                nlohmann::json{{"project_id", 1}},
                                nlohmann::json{{"archived", true}},
                                nlohmann::json{{"project_id", "\xff"}},
                                nlohmann::json{{"\xc3", "p1"}},
                                nlohmann::json{{"nested", {{"a", 1}}}},
                                nlohmann::json{{"", "x"}}})
        {
            auto parsed = Scope::parse(bad);
            REQUIRE_FALSE(parsed.has_value());
            REQUIRE(parsed.error().code == ErrorCode::InvalidScope);
        }
    }

    SECTION("Numbers never stand in for their text")
    {
        auto text = Scope::parse_text(R"({"project_id": 1})");
        REQUIRE_FALSE(text.has_value());
        REQUIRE(text.error().code == ErrorCode::InvalidScope);
    }

    SECTION("Text input")
    {
        auto text = Scope::parse_text(R"({"project_id": "p1"})");
        REQUIRE(text.has_value());
        REQUIRE(*text == Scope({{"project_id", "p1"}}));

        auto garbage = Scope::parse_text("project_id=p1");
        REQUIRE_FALSE(garbage.has_value());
        REQUIRE(garbage.error().code == ErrorCode::InvalidScope);
    }
}

TEST_CASE("A grant scope matches requests that contain it", "[scope]")
{
    Scope grant({{"project_id", "p1"}});

    REQUIRE(grant.matches(Scope({{"project_id", "p1"}})));
    REQUIRE(grant.matches(Scope({{"project_id", "p1"}, {"task_id", "t7"}})));
    REQUIRE_FALSE(grant.matches(Scope({{"project_id", "p2"}})));
    REQUIRE_FALSE(grant.matches(Scope({{"task_id", "t7"}})));
    REQUIRE_FALSE(grant.matches(Scope{}));

    REQUIRE(Scope{}.matches(Scope{}));
    REQUIRE(Scope{}.matches(Scope({{"project_id", "p9"}})));
}

TEST_CASE("Scopes serialize back to JSON", "[scope]")
{
    Scope scope({{"b", "2"}, {"a", "1"}});
    REQUIRE(scope.to_json() == nlohmann::json{{"a", "1"}, {"b", "2"}});
    REQUIRE(Scope{}.to_json() == nlohmann::json::object());
    REQUIRE(Scope::parse(scope.to_json()) == scope);
}
