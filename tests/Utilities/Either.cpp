/// @file Either.cpp
/// @brief Tests for Tandem::Utilities::Either.

#include <Tandem/Utilities/Either.hpp>

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>
#include <type_traits>
#include <utility>

using Tandem::Utilities::Either;
using Tandem::Utilities::EitherSide;

namespace
{
    struct CountingType
    {
        inline static int s_dtorCount = 0;

        explicit CountingType(int v) noexcept : value {v} {}
        CountingType(const CountingType&)     = default;
        CountingType(CountingType&&) noexcept = default;
        ~CountingType() { ++s_dtorCount; }

        int value {0};
    };
}// namespace

TEST_CASE("Either holds exactly one side", "[Utilities][Either]")
{
    Either<int, std::string> first(7);
    CHECK(first.IsFirst());
    CHECK_FALSE(first.IsSecond());
    CHECK(first.Side() == EitherSide::First);
    CHECK(first.First() == 7);

    Either<int, std::string> second(std::string("seven"));
    CHECK(second.IsSecond());
    CHECK(second.Second() == "seven");
}

TEST_CASE("Either Visit dispatches to the alive side", "[Utilities][Either]")
{
    Either<int, std::string> value(std::string("abc"));

    const auto size = value.Visit([](const auto& v) -> std::size_t {
        if constexpr (std::is_same_v<std::remove_cvref_t<decltype(v)>, int>)
            return 1;
        else
            return v.size();
    });
    CHECK(size == 3U);

    value.Visit([](auto& v) {
        if constexpr (std::is_same_v<std::remove_cvref_t<decltype(v)>, std::string>)
            v += "d";
    });
    CHECK(value.Second() == "abcd");
}

TEST_CASE("Either copy and move", "[Utilities][Either]")
{
    Either<int, std::string> original(std::string("text"));

    Either<int, std::string> copy(original);
    CHECK(copy.Second() == "text");

    Either<int, std::string> moved(std::move(copy));
    CHECK(moved.Second() == "text");

    Either<int, std::string> target(1);
    target = original;
    CHECK(target.IsSecond());
    CHECK(target.Second() == "text");

    target = Either<int, std::string>(5);
    CHECK(target.IsFirst());
    CHECK(target.First() == 5);

    using MoveOnly = Either<std::unique_ptr<int>, int>;
    STATIC_CHECK_FALSE(std::is_copy_constructible_v<MoveOnly>);
    MoveOnly owner(std::make_unique<int>(3));
    MoveOnly taken(std::move(owner));
    CHECK(*taken.First() == 3);
}

TEST_CASE("Either destroys the alive side exactly once", "[Utilities][Either]")
{
    CountingType::s_dtorCount = 0;
    {
        Either<CountingType, int> value(CountingType {1});
        CHECK(CountingType::s_dtorCount == 1);// the temporary
        value = Either<CountingType, int>(2);
        CHECK(CountingType::s_dtorCount == 2);
    }
    CHECK(CountingType::s_dtorCount == 2);
}
