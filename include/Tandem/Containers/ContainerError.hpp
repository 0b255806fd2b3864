/// @file ContainerError.hpp
/// @brief Error codes and expected type for fallible container capacity operations.
#pragma once

#include <expected>
#include <new>
#include <stdexcept>

#include <Tandem/Primitives.hpp>

namespace Tandem::Containers
{
    enum class ContainerErrorCode : UInt8
    {
        CapacityOverflow,///< Requested element count does not fit in the address space.
        AllocationFailed,///< The allocator returned nullptr.
    };

    struct ContainerError final
    {
        ContainerErrorCode code {ContainerErrorCode::AllocationFailed};

        [[nodiscard]] constexpr bool IsCapacityOverflow() const noexcept { return code == ContainerErrorCode::CapacityOverflow; }
    };

    template<typename T>
    using ContainerExpected = std::expected<T, ContainerError>;

    [[nodiscard]] constexpr ContainerError MakeContainerError(ContainerErrorCode code) noexcept
    {
        return ContainerError {code};
    }

    /// @brief Converts a capacity error into the exception the throwing API reports.
    [[noreturn]] inline void ThrowContainerError(const ContainerError& error, const char* context)
    {
        if (error.IsCapacityOverflow())
            throw std::length_error(context);
        throw std::bad_alloc();
    }
}// namespace Tandem::Containers
