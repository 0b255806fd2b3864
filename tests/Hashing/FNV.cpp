/// @file FNV.cpp
/// @brief Tests for Tandem::Hashing FNV-1a helpers.

#include <Tandem/Hashing/FNV.hpp>
#include <Tandem/Primitives.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

using namespace Tandem;
using namespace Tandem::Hashing;

TEST_CASE("FNV1a64 matches the reference vectors", "[Hashing][FNV]")
{
    STATIC_CHECK(FNV1a64(std::string_view {}) == 0xcbf29ce484222325ull);
    STATIC_CHECK(FNV1a64("a") == 0xaf63dc4c8601ec8cull);
    STATIC_CHECK(FNV1a64("foobar") == 0x85944171f73967e8ull);
}

TEST_CASE("FNV1a64 overloads produce consistent results", "[Hashing][FNV]")
{
    constexpr std::string_view value = "test";
    const UInt64 hashFromView        = FNV1a64(value);
    const UInt64 hashFromData        = FNV1a64(reinterpret_cast<const UInt8*>(value.data()), value.size());
    CHECK(hashFromView == hashFromData);

    // Continuing from a partial hash equals hashing the whole input at once.
    constexpr UInt64 head = FNV1a64("te");
    CHECK(FNV1a64<head>("st") == hashFromView);
}

TEST_CASE("FnvHasher hashes strings by content", "[Hashing][FNV]")
{
    const FnvHasher hasher;
    const std::string owned = "alpha";

    CHECK(hasher(owned) == hasher(std::string_view("alpha")));
    CHECK(hasher(owned) == hasher("alpha"));
    CHECK(hasher(owned) != hasher("beta"));
}

TEST_CASE("FnvHasher hashes integers in little-endian order", "[Hashing][FNV]")
{
    const FnvHasher hasher;
    const UInt8     bytes[] = {0x04, 0x03, 0x02, 0x01};

    CHECK(hasher(UInt32 {0x01020304u}) == static_cast<std::size_t>(FNV1a64(bytes, 4)));
    CHECK(hasher(std::int32_t {-1}) == hasher(UInt32 {0xFFFFFFFFu}));
    CHECK(hasher(std::uint16_t {1}) != hasher(UInt32 {1}));
}

TEST_CASE("TransparentEqual compares mixed string types", "[Hashing][FNV]")
{
    const TransparentEqual equal;
    CHECK(equal(std::string("key"), std::string_view("key")));
    CHECK(equal(std::string_view("key"), "key"));
    CHECK_FALSE(equal(std::string("key"), "other"));
}
