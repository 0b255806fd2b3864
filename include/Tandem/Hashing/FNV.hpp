// FNV.hpp
// FNV-1a 64-bit hashing and a map hasher built on it, in Tandem::Hashing
#pragma once

#include <Tandem/Primitives.hpp>

#include <concepts>
#include <cstddef>
#include <string_view>
#include <type_traits>

namespace Tandem::Hashing
{
    inline constexpr UInt64 kFnv64OffsetBasis = 14695981039346656037ull;
    inline constexpr UInt64 kFnv64Prime       = 1099511628211ull;

    /// @brief Compute FNV-1a 64-bit hash (byte buffer).
    /// @tparam Offset Initial offset basis; pass a previous result to continue a hash.
    template<UInt64 Offset = kFnv64OffsetBasis>
    constexpr UInt64 FNV1a64(const UInt8* data, UIntSize len) noexcept
    {
        UInt64 hash = Offset;
        for (UIntSize i = 0; i < len; ++i)
            hash = (hash ^ data[i]) * kFnv64Prime;
        return hash;
    }

    /// @brief Compute FNV-1a 64-bit hash for a string_view.
    template<UInt64 Offset = kFnv64OffsetBasis>
    constexpr UInt64 FNV1a64(std::string_view sv) noexcept
    {
        UInt64 hash = Offset;
        for (const char c: sv)
            hash = (hash ^ static_cast<UInt8>(c)) * kFnv64Prime;
        return hash;
    }

    /// @brief Transparent FNV-1a hasher for map keys.
    ///
    /// @details
    /// Anything convertible to `std::string_view` hashes by its characters, so a map keyed by
    /// `std::string` can be queried with `const char*` or `std::string_view` without allocating.
    /// Integers hash their value in little-endian byte order, independent of the host.
    struct FnvHasher
    {
        using is_transparent = void;

        template<class T>
            requires std::convertible_to<const T&, std::string_view>
        constexpr std::size_t operator()(const T& text) const noexcept
        {
            return static_cast<std::size_t>(FNV1a64(std::string_view(text)));
        }

        template<std::integral T>
            requires(!std::same_as<T, bool>)
        constexpr std::size_t operator()(T value) const noexcept
        {
            using Unsigned = std::make_unsigned_t<T>;
            auto   bits    = static_cast<Unsigned>(value);
            UInt64 hash    = kFnv64OffsetBasis;
            for (UIntSize i = 0; i < sizeof(T); ++i)
            {
                hash = (hash ^ static_cast<UInt8>(bits & 0xFFu)) * kFnv64Prime;
                if constexpr (sizeof(T) > 1)
                    bits = static_cast<Unsigned>(bits >> 8);
            }
            return static_cast<std::size_t>(hash);
        }
    };

    /// @brief Transparent equality matching `FnvHasher`'s heterogeneous lookups.
    struct TransparentEqual
    {
        using is_transparent = void;

        template<class A, class B>
        constexpr bool operator()(const A& lhs, const B& rhs) const noexcept(noexcept(lhs == rhs))
        {
            return lhs == rhs;
        }
    };
}// namespace Tandem::Hashing
