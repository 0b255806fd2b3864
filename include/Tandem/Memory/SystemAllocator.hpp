/// @file SystemAllocator.hpp
/// @brief Stateless system allocation wrapper providing aligned allocations.
#pragma once

#include <cstddef>
#include <cstdlib>

#include <Tandem/Primitives.hpp>

namespace Tandem::Memory
{
    struct SystemAllocator
    {
        [[nodiscard]] static bool IsPowerOfTwo(UIntSize v) noexcept
        {
            return v && ((v & (v - 1)) == 0);
        }

        [[nodiscard]] void* Allocate(UIntSize size, UIntSize alignment) noexcept
        {
            if (size == 0)
                return nullptr;
            if (!IsPowerOfTwo(alignment))
                alignment = alignof(std::max_align_t);

#if defined(_WIN32) || defined(_WIN64)
            return _aligned_malloc(size, alignment);
#else
            void* p = nullptr;
            if (alignment < sizeof(void*))
                alignment = sizeof(void*);
            if (posix_memalign(&p, alignment, size) != 0)
                return nullptr;
            return p;
#endif
        }

        void Deallocate(void* ptr, UIntSize, UIntSize) noexcept
        {
            if (!ptr)
                return;
#if defined(_WIN32) || defined(_WIN64)
            _aligned_free(ptr);
#else
            std::free(ptr);
#endif
        }

        [[nodiscard]] constexpr UIntSize MaxSize() const noexcept
        {
            return static_cast<UIntSize>(-1) >> 1;
        }

        friend constexpr bool operator==(const SystemAllocator&, const SystemAllocator&) noexcept { return true; }
    };
}// namespace Tandem::Memory
