/// @file AllocatorConcept.hpp
/// @brief Allocator concept and traits used by every Tandem container.
#pragma once

#include <concepts>
#include <cstddef>
#include <limits>
#include <type_traits>

namespace Tandem::Memory
{
    // -------------------------------------------------------------------------
    // Core allocator concept
    // -------------------------------------------------------------------------
    //
    // Only Allocate/Deallocate are required. Allocate may return nullptr on failure;
    // containers translate that into std::bad_alloc or an AllocationFailed error.

    template<class A>
    concept AllocatorConcept =
            requires(A a, std::size_t n, std::size_t align, void* p) {
                { a.Allocate(n, align) } -> std::same_as<void*>;
                { a.Deallocate(p, n, align) } noexcept;
            };

    template<class A>
    concept AllocatorReportsMaxSize =
            requires(const A a) {
                { a.MaxSize() } -> std::same_as<std::size_t>;
            };

    template<class A>
    struct AllocatorTraits
    {
        static constexpr bool HasMaxSizeCapability = AllocatorReportsMaxSize<A>;

        /// @brief Largest single request the allocator can serve, in bytes.
        static std::size_t MaxSize(const A& allocator) noexcept
        {
            if constexpr (HasMaxSizeCapability)
            {
                return allocator.MaxSize();
            }
            else
            {
                return std::numeric_limits<std::size_t>::max();
            }
        }
    };

    // -------------------------------------------------------------------------
    // Propagation traits
    // -------------------------------------------------------------------------
    //
    // An allocator may opt in by declaring the matching `static constexpr bool` members.
    // Stateless (empty) allocators are always treated as interchangeable.

    template<class A>
    struct AllocatorPropagationTraits
    {
    private:
        template<class T>
        static constexpr bool ReadOnCopy() noexcept
        {
            if constexpr (requires { T::PropagateOnCopyAssignment; })
                return T::PropagateOnCopyAssignment;
            else
                return false;
        }

        template<class T>
        static constexpr bool ReadOnMove() noexcept
        {
            if constexpr (requires { T::PropagateOnMoveAssignment; })
                return T::PropagateOnMoveAssignment;
            else
                return true;
        }

    public:
        static constexpr bool PropagateOnCopyAssignment = ReadOnCopy<A>();
        static constexpr bool PropagateOnMoveAssignment = ReadOnMove<A>();
        static constexpr bool IsAlwaysEqual             = std::is_empty_v<A>;
    };

}// namespace Tandem::Memory
