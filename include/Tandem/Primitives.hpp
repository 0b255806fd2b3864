// Fundamental type aliases shared by every Tandem module.
#pragma once
#include <cstddef>
#include <cstdint>

namespace Tandem
{
    /// @brief Represents a 64-bit unsigned integer.
    using UInt64 = std::uint64_t;
    /// @brief Represents a 32-bit unsigned integer.
    using UInt32 = std::uint32_t;
    /// @brief Represents an 8-bit unsigned integer.
    using UInt8 = std::uint8_t;

    /// @brief Represents a byte.
    using Byte = std::byte;

    using UIntSize = std::size_t;
    using IntSize  = std::ptrdiff_t;
}// namespace Tandem
