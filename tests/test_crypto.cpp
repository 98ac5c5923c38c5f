#include <catch2/catch_test_macros.hpp>
#include "warden/crypto.hpp"
#include <set>
#include <string>

using namespace warden::crypto;

TEST_CASE("SHA-256 known answers", "[crypto]")
{
    REQUIRE(SHA256::to_hex(SHA256::hash(std::string_view(""))) ==
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    REQUIRE(SHA256::to_hex(SHA256::hash(std::string_view("abc"))) ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("Concatenated hashing matches hashing the joined input", "[crypto]")
{
    REQUIRE(SHA256::hash_concat("ab", "c") == SHA256::hash(std::string_view("abc")));
    REQUIRE(SHA256::hash_concat("", "abc") == SHA256::hash(std::string_view("abc")));
}

TEST_CASE("Hex digests", "[crypto]")
{
    std::string hex = SHA256::to_hex(SHA256::hash(std::string_view("test data")));
    REQUIRE(hex.length() == 64);
    REQUIRE(hex.find_first_not_of("0123456789abcdef") == std::string::npos);
}

TEST_CASE("Digest comparison", "[crypto]")
{
    auto a = SHA256::to_hex(SHA256::hash(std::string_view("a")));
    auto b = SHA256::to_hex(SHA256::hash(std::string_view("b")));
    REQUIRE(digest_equals(a, a));
    REQUIRE_FALSE(digest_equals(a, b));
    REQUIRE_FALSE(digest_equals(a, a.substr(0, 63)));
}

TEST_CASE("Random UUIDs", "[crypto]")
{
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i)
    {
        auto id = uuid_v4();
        REQUIRE(id.size() == 36);
        REQUIRE(id[8] == '-');
        REQUIRE(id[13] == '-');
        REQUIRE(id[14] == '4');
        REQUIRE(std::string("89ab").find(id[19]) != std::string::npos);
        seen.insert(id);
    }
    REQUIRE(seen.size() == 100);
}
