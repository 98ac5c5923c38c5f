#include <catch2/catch_test_macros.hpp>
#include "warden/canonical_json.hpp"
#include <limits>

using warden::ErrorCode;
using namespace warden::json;
using json = nlohmann::json;

namespace
{
    std::string canonical(const json &value)
    {
        auto out = Canonicalizer::canonicalize(value);
        REQUIRE(out.has_value());
        return *out;
    }
}

TEST_CASE("Object keys are sorted at every depth", "[json]")
{
    json obj = {
        {"z", 1},
        {"a", 2},
        {"nested", {{"y", 3}, {"b", 4}}},
        {"array", {9, 8, 7}}};

    REQUIRE(canonical(obj) == R"({"a":2,"array":[9,8,7],"nested":{"b":4,"y":3},"z":1})");
    REQUIRE(canonical(obj) == canonical(json::parse(obj.dump(4))));
}

TEST_CASE("Keys compare by code point", "[json]")
{
    json obj = {{"b", 1}, {"B", 2}, {"\xc3\xa9", 3}, {"a", 4}};
    REQUIRE(canonical(obj) == "{\"B\":2,\"a\":4,\"b\":1,\"\xc3\xa9\":3}");
}

TEST_CASE("Scalars", "[json]")
{
    json obj = {
        {"bool_true", true},
        {"bool_false", false},
        {"null_val", nullptr},
        {"int", 42},
        {"negative", -17},
        {"big", std::numeric_limits<std::uint64_t>::max()}};

    REQUIRE(canonical(obj) ==
            R"({"big":18446744073709551615,"bool_false":false,"bool_true":true,"int":42,"negative":-17,"null_val":null})");
    REQUIRE(canonical(json::object()) == "{}");
    REQUIRE(canonical(json::array()) == "[]");
}

TEST_CASE("Strings escape only what JSON requires", "[json]")
{
    json obj = {
        {"quote", "He said \"hello\""},
        {"newline", "line1\nline2"},
        {"ctrl", std::string("x\x01\x1f")},
        {"slash", "a/b"},
        {"unicode", "caf\xc3\xa9"}};

    REQUIRE(canonical(obj) ==
            "{\"ctrl\":\"x\\u0001\\u001f\",\"newline\":\"line1\\nline2\","
            "\"quote\":\"He said \\\"hello\\\"\",\"slash\":\"a/b\",\"unicode\":\"caf\xc3\xa9\"}");
}

TEST_CASE("Doubles use the shortest round-trip form", "[json]")
{
    REQUIRE(Canonicalizer::format_double(1.5) == "1.5");
    REQUIRE(Canonicalizer::format_double(100.0) == "100");
    REQUIRE(Canonicalizer::format_double(-0.0) == "0");
    REQUIRE(Canonicalizer::format_double(0.000001) == "0.000001");
    REQUIRE(Canonicalizer::format_double(1e-7) == "1e-7");
    REQUIRE(Canonicalizer::format_double(1e21) == "1e+21");
    REQUIRE(Canonicalizer::format_double(1e20) == "100000000000000000000");
    REQUIRE(Canonicalizer::format_double(-2.5e-3) == "-0.0025");
    REQUIRE(Canonicalizer::format_double(0.1 + 0.2) == "0.30000000000000004");
}

TEST_CASE("Values without a canonical form are rejected", "[json]")
{
    auto nan = Canonicalizer::canonicalize(json{{"x", std::numeric_limits<double>::quiet_NaN()}});
    REQUIRE_FALSE(nan.has_value());
    REQUIRE(nan.error().code == ErrorCode::InvalidInput);

    auto inf = Canonicalizer::canonicalize(json::array({1, std::numeric_limits<double>::infinity()}));
    REQUIRE_FALSE(inf.has_value());

    auto binary = Canonicalizer::canonicalize(json::binary({0x01, 0x02}));
    REQUIRE_FALSE(binary.has_value());
}

TEST_CASE("Strings must be well-formed UTF-8", "[json]")
{
    REQUIRE(is_valid_utf8("plain ascii"));
    REQUIRE(is_valid_utf8("caf\xc3\xa9"));
    REQUIRE(is_valid_utf8("\xe2\x82\xac"));
    REQUIRE(is_valid_utf8("\xf0\x9f\x98\x80"));

    REQUIRE_FALSE(is_valid_utf8("\xff"));
    REQUIRE_FALSE(is_valid_utf8("\xc3"));
    REQUIRE_FALSE(is_valid_utf8("\xc0\xaf"));
    REQUIRE_FALSE(is_valid_utf8("\xed\xa0\x80"));
    REQUIRE_FALSE(is_valid_utf8("\xf4\x90\x80\x80"));

    auto value = Canonicalizer::canonicalize(json{{"r", "\xff"}});
    REQUIRE_FALSE(value.has_value());
    REQUIRE(value.error().code == ErrorCode::InvalidInput);

    auto key = Canonicalizer::canonicalize(json{{"\xc3", 1}});
    REQUIRE_FALSE(key.has_value());
    REQUIRE(key.error().code == ErrorCode::InvalidInput);
}
