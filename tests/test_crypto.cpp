#include <catch2/catch_test_macros.hpp>
#include "warden/crypto.hpp"
#include <algorithm>
#include <cctype>
#include <string>

using namespace warden::crypto;

namespace
{
    bool is_lower_hex(const std::string &s)
    {
        return std::all_of(s.begin(), s.end(), [](unsigned char c)
                           { return std::isdigit(c) || (c >= 'a' && c <= 'f'); });
    }
}

TEST_CASE("SHA-256 known vector", "[crypto]")
{
    auto hex = SHA256::to_hex(SHA256::hash(std::string_view{"abc"}));
    REQUIRE(hex == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("HMAC-SHA-256 known vector", "[crypto]")
{
    // RFC 4231 test case 2
    auto mac = HmacSHA256::mac("Jefe", "what do ya want for nothing?");
    REQUIRE(SHA256::to_hex(mac) == "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST_CASE("IdentityHasher requires a salt", "[crypto]")
{
    auto hasher = IdentityHasher::create("");
    REQUIRE_FALSE(hasher.has_value());
    REQUIRE(hasher.error().code == warden::ErrorCode::ConfigurationError);
}

TEST_CASE("IdentityHasher network digests", "[crypto]")
{
    auto hasher = IdentityHasher::create("pepper").value();

    auto h = hasher.hash_network("198.51.100.4");
    REQUIRE(h.size() == IdentityHasher::kNetworkDigestChars);
    REQUIRE(is_lower_hex(h));
    REQUIRE(h == hasher.hash_network("198.51.100.4"));
    REQUIRE(h != hasher.hash_network("198.51.100.5"));
    REQUIRE(h.find("198") == std::string::npos);

    SECTION("empty address hashes as unknown")
    {
        REQUIRE(hasher.hash_network("") == hasher.hash_network("unknown"));
    }

    SECTION("salt changes the digest")
    {
        auto other = IdentityHasher::create("salt-b").value();
        REQUIRE(other.hash_network("198.51.100.4") != h);
    }
}

TEST_CASE("IdentityHasher account digests ignore case", "[crypto]")
{
    auto hasher = IdentityHasher::create("pepper").value();
    auto h = hasher.hash_account("Alice@Example.com");
    REQUIRE(h.size() == IdentityHasher::kAccountDigestChars);
    REQUIRE(h == hasher.hash_account("alice@example.com"));
    REQUIRE(h != hasher.hash_account("bob@example.com"));
}

TEST_CASE("SecureRandom ids", "[crypto]")
{
    auto id = SecureRandom::generate_id("evt");
    REQUIRE(id.size() == 4 + 16);
    REQUIRE(id.rfind("evt_", 0) == 0);
    REQUIRE(is_lower_hex(id.substr(4)));
    REQUIRE(id != SecureRandom::generate_id("evt"));

    REQUIRE(SecureRandom::generate_bytes(24).size() == 24);
}
