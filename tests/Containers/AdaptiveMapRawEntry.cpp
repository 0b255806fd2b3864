/// @file AdaptiveMapRawEntry.cpp
/// @brief Tests for the raw entry API of Tandem::Containers::AdaptiveMap.

#include <Tandem/Containers/AdaptiveMap.hpp>
#include <Tandem/Exceptions/EntryStateException.hpp>
#include <Tandem/Exceptions/InvalidatedHandleException.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <string>
#include <utility>

using Tandem::Containers::AdaptiveMap;

namespace
{
    using Map = AdaptiveMap<std::string, int>;

    Map MakeMap(bool hashed)
    {
        Map map = hashed ? Map::WithCapacity(64) : Map();
        map.Insert("one", 1);
        map.Insert("two", 2);
        return map;
    }
}// namespace

TEST_CASE("AdaptiveMap raw entry lookups", "[Containers][AdaptiveMap][RawEntry]")
{
    const bool hashed = GENERATE(false, true);
    Map        map    = MakeMap(hashed);
    REQUIRE(map.IsMap() == hashed);

    SECTION("FromKey")
    {
        auto entry = map.RawEntryMut().FromKey("one");
        REQUIRE(entry.IsOccupied());
        CHECK(entry.Occupied().GetKey() == "one");
        CHECK(entry.Occupied().Get() == 1);
    }

    SECTION("FromKeyHashed")
    {
        const auto hash  = map.HashKey(std::string("two"));
        auto       entry = map.RawEntryMut().FromKeyHashed(hash, std::string("two"));
        REQUIRE(entry.IsOccupied());
        CHECK(entry.Occupied().Get() == 2);
    }

    SECTION("FromHash")
    {
        const auto hash  = map.HashKey(std::string("two"));
        auto       entry = map.RawEntryMut().FromHash(hash, [](const std::string& key) { return key == "two"; });
        REQUIRE(entry.IsOccupied());
        auto kv = entry.Occupied().GetKeyValue();
        CHECK(kv.key == "two");
        CHECK(kv.value == 2);
    }

    SECTION("Miss")
    {
        auto entry = map.RawEntryMut().FromKey("three");
        CHECK(entry.IsVacant());
        CHECK_THROWS_AS(entry.Occupied(), Tandem::Exceptions::EntryStateException);
    }
}

TEST_CASE("AdaptiveMap raw entry insertion", "[Containers][AdaptiveMap][RawEntry]")
{
    const bool hashed = GENERATE(false, true);
    Map        map    = MakeMap(hashed);

    SECTION("Vacant insert")
    {
        auto entry    = map.RawEntryMut().FromKey("three");
        auto inserted = entry.Vacant().Insert("three", 3);
        CHECK(inserted.key == "three");
        inserted.value += 30;
        CHECK(map.Get("three") == 33);
    }

    SECTION("Vacant insert with a precomputed hash")
    {
        const auto hash = map.HashKey(std::string("four"));
        auto entry = map.RawEntryMut().FromHash(hash, [](const std::string& key) { return key == "four"; });
        entry.Vacant().InsertHashedNoCheck(hash, "four", 4);
        CHECK(map.Get("four") == 4);
        CHECK(map.Size() == 3U);
    }

    SECTION("OrInsert")
    {
        auto existing = map.RawEntryMut().FromKey("one").OrInsert("one", 100);
        CHECK(existing.value == 1);

        auto fresh = map.RawEntryMut().FromKey("five").OrInsert("five", 5);
        CHECK(fresh.key == "five");
        CHECK(map.Get("five") == 5);
    }

    SECTION("OrInsertWith")
    {
        int  calls = 0;
        auto make  = [&calls] {
            ++calls;
            return std::pair<std::string, int>("six", 6);
        };
        map.RawEntryMut().FromKey("six").OrInsertWith(make);
        map.RawEntryMut().FromKey("six").OrInsertWith(make);
        CHECK(calls == 1);
        CHECK(map.Get("six") == 6);
    }

    SECTION("AndModify")
    {
        auto bump = [](std::string&, int& value) { value += 10; };
        map.RawEntryMut().FromKey("two").AndModify(bump).OrInsert("two", 0);
        map.RawEntryMut().FromKey("ten").AndModify(bump).OrInsert("ten", 0);
        CHECK(map.Get("two") == 12);
        CHECK(map.Get("ten") == 0);
    }
}

TEST_CASE("AdaptiveMap raw occupied entry", "[Containers][AdaptiveMap][RawEntry]")
{
    const bool hashed = GENERATE(false, true);
    Map        map    = MakeMap(hashed);

    SECTION("Insert and InsertKey")
    {
        auto  entry    = map.RawEntryMut().FromKey("one");
        auto& occupied = entry.Occupied();
        CHECK(occupied.Insert(11) == 1);
        CHECK(occupied.InsertKey("one") == "one");
        occupied.GetMut() += 1;
        auto kv = occupied.GetKeyValueMut();
        kv.value += 1;
        CHECK(map.Get("one") == 13);
    }

    SECTION("KeyMut keeps an equivalent key")
    {
        auto entry = map.RawEntryMut().FromKey("two");
        entry.Occupied().KeyMut().shrink_to_fit();
        CHECK(map.Contains("two"));
    }

    SECTION("IntoKeyValue")
    {
        auto entry = map.RawEntryMut().FromKey("one");
        auto kv    = entry.Occupied().IntoKeyValue();
        kv.value   = 7;
        CHECK(map.Get("one") == 7);
    }

    SECTION("IntoMut")
    {
        auto entry = map.RawEntryMut().FromKey("one");
        int& value = entry.Occupied().IntoMut();
        value      = 8;
        CHECK(map.Get("one") == 8);
    }

    SECTION("Remove")
    {
        auto entry = map.RawEntryMut().FromKey("one");
        CHECK(entry.Occupied().Remove() == 1);
        CHECK(map.Size() == 1U);
    }

    SECTION("RemoveEntry")
    {
        auto entry   = map.RawEntryMut().FromKey("two");
        auto removed = entry.Occupied().RemoveEntry();
        CHECK(removed.first == "two");
        CHECK(removed.second == 2);
        CHECK_FALSE(map.Contains("two"));
    }

    SECTION("Consumed handles are invalid")
    {
        auto  entry    = map.RawEntryMut().FromKey("one");
        auto& occupied = entry.Occupied();
        (void) occupied.IntoMut();
        CHECK_THROWS_AS(occupied.Get(), Tandem::Exceptions::InvalidatedHandleException);
    }

    SECTION("Builders are invalidated by mutation")
    {
        auto builder = map.RawEntryMut();
        map.Insert("three", 3);
        CHECK_THROWS_AS(builder.FromKey("one"), Tandem::Exceptions::InvalidatedHandleException);
    }
}

TEST_CASE("AdaptiveMap linear raw entries ignore the hash", "[Containers][AdaptiveMap][RawEntry]")
{
    Map map = MakeMap(false);
    REQUIRE(map.IsVec());

    auto entry = map.RawEntryMut().FromHash(0xDEADBEEFu, [](const std::string& key) { return key == "two"; });
    REQUIRE(entry.IsOccupied());
    CHECK(entry.Occupied().Get() == 2);

    const Map& view = map;
    auto       hit  = view.RawEntry().FromKeyHashed(12345, "one");
    REQUIRE(hit.has_value());
    CHECK(hit->value == 1);
}

TEST_CASE("AdaptiveMap read-only raw entry", "[Containers][AdaptiveMap][RawEntry]")
{
    const bool hashed = GENERATE(false, true);
    const Map  map    = MakeMap(hashed);

    auto byKey = map.RawEntry().FromKey("one");
    REQUIRE(byKey.has_value());
    CHECK(byKey->key == "one");
    CHECK(byKey->value == 1);

    const auto hash   = map.HashKey(std::string("two"));
    auto       byHash = map.RawEntry().FromHash(hash, [](const std::string& key) { return key == "two"; });
    REQUIRE(byHash.has_value());
    CHECK(byHash->value == 2);

    CHECK_FALSE(map.RawEntry().FromKey("missing").has_value());
    CHECK_FALSE(map.RawEntry().FromKeyHashed(map.HashKey(std::string("missing")), std::string("missing")).has_value());
}
