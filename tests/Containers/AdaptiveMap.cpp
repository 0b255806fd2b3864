/// @file AdaptiveMap.cpp
/// @brief Tests for Tandem::Containers::AdaptiveMap using Catch2.

#include <Tandem/Containers/AdaptiveMap.hpp>
#include <Tandem/Hashing/FNV.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <iterator>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using Tandem::Containers::AdaptiveMap;

namespace
{
    /// Key whose equality ignores `tag`, so tests can see which of two equal keys is stored.
    struct TaggedKey
    {
        int id;
        int tag;

        bool operator==(const TaggedKey& other) const noexcept { return id == other.id; }
    };

    struct TaggedKeyHash
    {
        std::size_t operator()(const TaggedKey& key) const noexcept { return static_cast<std::size_t>(key.id); }
    };

    /// Deterministic generator for the model test.
    struct Lcg
    {
        unsigned state;

        unsigned Next()
        {
            state = state * 1664525u + 1013904223u;
            return state >> 8;
        }
    };

    template<class Map>
    std::map<int, int> Snapshot(const Map& map)
    {
        std::map<int, int> out;
        for (auto kv: map)
            out.emplace(kv.key, kv.value);
        return out;
    }
}// namespace

TEST_CASE("AdaptiveMap starts linear and empty", "[Containers][AdaptiveMap]")
{
    AdaptiveMap<int, int> map;
    CHECK(map.IsVec());
    CHECK_FALSE(map.IsMap());
    CHECK(map.Size() == 0U);
    CHECK(map.IsEmpty());
    CHECK(map.GetPtr(1) == nullptr);
}

TEST_CASE("AdaptiveMap migrates on the insert past the linear limit", "[Containers][AdaptiveMap]")
{
    AdaptiveMap<int, int> map;
    for (int i = 1; i <= 32; ++i)
        map.Insert(i, i * 10);
    CHECK(map.IsVec());
    CHECK(map.Size() == 32U);

    map.Insert(33, 330);
    CHECK(map.IsMap());
    CHECK(map.Size() == 33U);
    for (int i = 1; i <= 33; ++i)
    {
        const int* value = map.GetPtr(i);
        REQUIRE(value != nullptr);
        CHECK(*value == i * 10);
    }

    for (int i = 1; i <= 33; ++i)
        CHECK(map.Remove(i) == i * 10);
    CHECK(map.IsEmpty());
    CHECK(map.IsMap());

    map.Clear();
    map.ShrinkToFit();
    CHECK(map.IsMap());
}

TEST_CASE("AdaptiveMap insert at the limit migrates even for an existing key", "[Containers][AdaptiveMap]")
{
    AdaptiveMap<int, int> map;
    for (int i = 0; i < 32; ++i)
        map.Insert(i, i);
    REQUIRE(map.IsVec());

    CHECK(map.Insert(5, 50) == 5);
    CHECK(map.IsMap());
    CHECK(map.Size() == 32U);
    CHECK(map.Get(5) == 50);
}

TEST_CASE("AdaptiveMap insert returns the previous value", "[Containers][AdaptiveMap]")
{
    AdaptiveMap<int, std::string> map;
    CHECK_FALSE(map.Insert(37, "a").has_value());
    CHECK(map.Insert(37, "b") == std::optional<std::string>("a"));
    CHECK(map.Insert(37, "c") == std::optional<std::string>("b"));
    CHECK(map.Get(37) == "c");
    CHECK(map.Size() == 1U);
}

TEST_CASE("AdaptiveMap insert keeps the original key", "[Containers][AdaptiveMap]")
{
    SECTION("Linear")
    {
        AdaptiveMap<TaggedKey, int, TaggedKeyHash> map;
        map.Insert(TaggedKey {1, 100}, 1);
        map.Insert(TaggedKey {1, 200}, 2);
        auto kv = map.GetKeyValue(TaggedKey {1, 0});
        REQUIRE(kv.has_value());
        CHECK(kv->key.tag == 100);
        CHECK(kv->value == 2);
    }

    SECTION("Hashed")
    {
        auto map = AdaptiveMap<TaggedKey, int, TaggedKeyHash>::WithCapacity(64);
        REQUIRE(map.IsMap());
        map.Insert(TaggedKey {1, 100}, 1);
        map.Insert(TaggedKey {1, 200}, 2);
        auto kv = map.GetKeyValue(TaggedKey {1, 0});
        REQUIRE(kv.has_value());
        CHECK(kv->key.tag == 100);
        CHECK(kv->value == 2);
    }
}

TEST_CASE("AdaptiveMap factory constructors pick the representation", "[Containers][AdaptiveMap]")
{
    auto small = AdaptiveMap<int, int>::WithCapacity(8);
    CHECK(small.IsVec());
    CHECK(small.Capacity() >= 8U);

    auto atLimit = AdaptiveMap<int, int>::WithCapacity(32);
    CHECK(atLimit.IsVec());

    auto large = AdaptiveMap<int, int>::WithCapacity(33);
    CHECK(large.IsMap());
    CHECK(large.Capacity() >= 33U);

    auto forced = AdaptiveMap<int, int>::VecWithCapacity(1000);
    CHECK(forced.IsVec());
    CHECK(forced.Capacity() >= 1000U);

    using FnvMap = AdaptiveMap<std::string, int, Tandem::Hashing::FnvHasher, Tandem::Hashing::TransparentEqual>;
    auto hashed  = FnvMap::WithHasher(Tandem::Hashing::FnvHasher {});
    CHECK(hashed.IsMap());
    CHECK(hashed.IsEmpty());

    auto sized = FnvMap::WithCapacityAndHasher(100, Tandem::Hashing::FnvHasher {});
    CHECK(sized.IsMap());
    CHECK(sized.Capacity() >= 100U);
}

TEST_CASE("AdaptiveMap bulk build with VecWithCapacity and InsertNoCheck", "[Containers][AdaptiveMap]")
{
    auto map = AdaptiveMap<int, int>::VecWithCapacity(100);
    for (int i = 0; i < 100; ++i)
        map.InsertNoCheck(i, i + 1);
    CHECK(map.IsVec());
    CHECK(map.Size() == 100U);
    CHECK(map.Get(99) == 100);

    // The next checked insert migrates the oversized linear map.
    map.Insert(100, 101);
    CHECK(map.IsMap());
    CHECK(map.Size() == 101U);
    CHECK(map.Get(0) == 1);
}

TEST_CASE("AdaptiveMap matches an ordered map model", "[Containers][AdaptiveMap]")
{
    AdaptiveMap<int, int> map;
    std::map<int, int>    model;
    Lcg                   rng {12345u};

    for (int step = 0; step < 4000; ++step)
    {
        const int key = static_cast<int>(rng.Next() % 96);
        if (rng.Next() % 3 == 0)
        {
            auto removed  = map.Remove(key);
            auto expected = model.find(key);
            if (expected == model.end())
            {
                CHECK_FALSE(removed.has_value());
            }
            else
            {
                CHECK(removed == expected->second);
                model.erase(expected);
            }
        }
        else
        {
            const int value    = static_cast<int>(rng.Next() % 1000);
            auto      previous = map.Insert(key, value);
            auto      expected = model.find(key);
            CHECK(previous.has_value() == (expected != model.end()));
            model[key] = value;
        }
        REQUIRE(map.Size() == model.size());
    }

    CHECK(Snapshot(map) == model);
}

TEST_CASE("AdaptiveMap equality ignores the representation and the hasher", "[Containers][AdaptiveMap]")
{
    AdaptiveMap<int, int> linear;
    for (int i = 0; i < 10; ++i)
        linear.Insert(i, i * i);

    AdaptiveMap<int, int> hashed;
    for (int i = 0; i < 40; ++i)
        hashed.Insert(i, i * i);
    REQUIRE(hashed.IsMap());
    for (int i = 10; i < 40; ++i)
        hashed.Remove(i);

    CHECK(linear.IsVec());
    CHECK(linear == hashed);
    CHECK(hashed == linear);

    hashed.Insert(3, 0);
    CHECK_FALSE(linear == hashed);
    hashed.Insert(3, 9);
    hashed.Insert(50, 1);
    CHECK(linear != hashed);

    auto fnv = AdaptiveMap<int, int, Tandem::Hashing::FnvHasher>::WithHasher(Tandem::Hashing::FnvHasher {});
    for (int i = 9; i >= 0; --i)
        fnv.Insert(i, i * i);
    CHECK(linear == fnv);
}

TEST_CASE("AdaptiveMap retain", "[Containers][AdaptiveMap]")
{
    SECTION("Linear")
    {
        AdaptiveMap<int, int> map;
        for (int i = 0; i < 8; ++i)
            map.Insert(i, i);
        map.Retain([](const int& key, int&) { return key % 2 == 0; });
        CHECK(map.Size() == 4U);
        CHECK(Snapshot(map) == std::map<int, int> {{0, 0}, {2, 2}, {4, 4}, {6, 6}});
    }

    SECTION("Hashed")
    {
        AdaptiveMap<int, int> map;
        for (int i = 0; i < 64; ++i)
            map.Insert(i, i);
        REQUIRE(map.IsMap());
        map.Retain([](const int& key, int& value) {
            value = -value;
            return key < 8 && key % 2 == 0;
        });
        CHECK(map.Size() == 4U);
        CHECK(Snapshot(map) == std::map<int, int> {{0, 0}, {2, -2}, {4, -4}, {6, -6}});
        CHECK(map.IsMap());
    }
}

TEST_CASE("AdaptiveMap clear keeps the representation", "[Containers][AdaptiveMap]")
{
    AdaptiveMap<int, int> linear {{1, 1}, {2, 2}};
    linear.Clear();
    CHECK(linear.IsEmpty());
    CHECK(linear.IsVec());

    auto hashed = AdaptiveMap<int, int>::WithCapacity(100);
    hashed.Insert(1, 1);
    const auto capacity = hashed.Capacity();
    hashed.Clear();
    CHECK(hashed.IsEmpty());
    CHECK(hashed.IsMap());
    CHECK(hashed.Capacity() == capacity);
}

TEST_CASE("AdaptiveMap checked access throws on absent keys", "[Containers][AdaptiveMap]")
{
    AdaptiveMap<std::string, int> map {{"one", 1}};

    CHECK(map.Get("one") == 1);
    CHECK(map.At("one") == 1);
    map.At("one") = 11;

    const auto& view = map;
    CHECK(view["one"] == 11);
    CHECK(view.At("one") == 11);

    CHECK_THROWS_AS(map.Get("two"), std::out_of_range);
    CHECK_THROWS_AS(map.At("two"), std::out_of_range);
    CHECK_THROWS_AS(view["two"], std::out_of_range);
    CHECK_FALSE(map.Contains("two"));
    CHECK(map.Size() == 1U);
}

TEST_CASE("AdaptiveMap remove entry", "[Containers][AdaptiveMap]")
{
    AdaptiveMap<TaggedKey, int, TaggedKeyHash> map;
    map.Insert(TaggedKey {4, 1}, 40);

    auto removed = map.RemoveEntry(TaggedKey {4, 2});
    REQUIRE(removed.has_value());
    CHECK(removed->first.tag == 1);
    CHECK(removed->second == 40);
    CHECK_FALSE(map.RemoveEntry(TaggedKey {4, 2}).has_value());
    CHECK_FALSE(map.Remove(TaggedKey {4, 2}).has_value());
}

TEST_CASE("AdaptiveMap reserve and try reserve", "[Containers][AdaptiveMap]")
{
    AdaptiveMap<int, int> map;
    map.Reserve(16);
    CHECK(map.IsVec());
    CHECK(map.Capacity() >= 16U);

    auto ok = map.TryReserve(4);
    CHECK(ok.has_value());

    auto overflow = map.TryReserve(static_cast<Tandem::UIntSize>(-1));
    REQUIRE_FALSE(overflow.has_value());
    CHECK(overflow.error().IsCapacityOverflow());
    CHECK_THROWS_AS(map.Reserve(static_cast<Tandem::UIntSize>(-1)), std::length_error);

    auto hashed = AdaptiveMap<int, int>::WithCapacity(64);
    auto hashedOverflow = hashed.TryReserve(static_cast<Tandem::UIntSize>(-1));
    REQUIRE_FALSE(hashedOverflow.has_value());
    CHECK(hashedOverflow.error().IsCapacityOverflow());
}

TEST_CASE("AdaptiveMap copy and move", "[Containers][AdaptiveMap]")
{
    AdaptiveMap<int, std::string> linear {{1, "a"}, {2, "b"}};
    AdaptiveMap<int, std::string> hashed;
    for (int i = 0; i < 40; ++i)
        hashed.Insert(i, std::to_string(i));

    AdaptiveMap<int, std::string> linearCopy(linear);
    AdaptiveMap<int, std::string> hashedCopy(hashed);
    CHECK(linearCopy.IsVec());
    CHECK(hashedCopy.IsMap());
    CHECK(linearCopy == linear);
    CHECK(hashedCopy == hashed);

    linearCopy = hashed;
    CHECK(linearCopy.IsMap());
    CHECK(linearCopy.Size() == 40U);

    AdaptiveMap<int, std::string> moved(std::move(hashed));
    CHECK(moved.IsMap());
    CHECK(moved.Size() == 40U);
    CHECK(moved.Get(39) == "39");

    hashedCopy = std::move(linear);
    CHECK(hashedCopy.IsVec());
    CHECK(hashedCopy.Get(2) == "b");
}

TEST_CASE("AdaptiveMap builds from pairs", "[Containers][AdaptiveMap]")
{
    std::vector<std::pair<int, int>> pairs;
    for (int i = 0; i < 50; ++i)
        pairs.emplace_back(i, i * 2);

    AdaptiveMap<int, int> fromRange(pairs.begin(), pairs.end());
    CHECK(fromRange.IsMap());
    CHECK(fromRange.Size() == 50U);
    CHECK(fromRange.Get(49) == 98);

    AdaptiveMap<int, int> rebuilt;
    rebuilt.Extend(fromRange);
    CHECK(rebuilt == fromRange);

    AdaptiveMap<int, int> small {{1, 2}, {3, 4}};
    small.Extend(std::vector<std::pair<int, int>> {{5, 6}, {1, 7}});
    CHECK(small.Size() == 3U);
    CHECK(small.Get(1) == 7);
}

TEST_CASE("AdaptiveMap supports heterogeneous lookup", "[Containers][AdaptiveMap]")
{
    using Map = AdaptiveMap<std::string, int, Tandem::Hashing::FnvHasher, Tandem::Hashing::TransparentEqual>;

    Map linear;
    linear.Insert("alpha", 1);
    CHECK(linear.Contains(std::string_view("alpha")));
    CHECK(*linear.GetPtr("alpha") == 1);

    Map hashed = Map::WithHasher(Tandem::Hashing::FnvHasher {});
    hashed.Insert("alpha", 1);
    hashed.Insert("beta", 2);
    CHECK(hashed.Contains(std::string_view("beta")));
    CHECK(hashed.Remove(std::string_view("alpha")) == 1);
    CHECK(hashed.HashKey(std::string_view("beta")) == hashed.HashKey(std::string("beta")));
}

TEST_CASE("AdaptiveMap extend moves pairs out of move iterators", "[Containers][AdaptiveMap]")
{
    std::vector<std::pair<int, std::unique_ptr<int>>> source;
    for (int i = 0; i < 40; ++i)
        source.emplace_back(i, std::make_unique<int>(i * 2));

    AdaptiveMap<int, std::unique_ptr<int>> map;
    map.Extend(std::make_move_iterator(source.begin()), std::make_move_iterator(source.end()));

    CHECK(map.IsMap());
    CHECK(map.Size() == 40U);
    for (int i = 0; i < 40; ++i)
    {
        REQUIRE(map.At(i) != nullptr);
        CHECK(*map.At(i) == i * 2);
        CHECK(source[static_cast<std::size_t>(i)].second == nullptr);
    }
}
