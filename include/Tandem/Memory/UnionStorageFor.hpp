/// @file UnionStorageFor.hpp
/// @brief Raw aligned storage able to hold exactly one object out of a closed set of types.
#pragma once

#include <algorithm>
#include <cstddef>
#include <new>
#include <type_traits>
#include <utility>

namespace Tandem::Memory
{
    namespace detail
    {
        template<class U, class... Ts>
        inline constexpr bool UnionStorageContains = (std::is_same_v<U, Ts> || ...);
    }

    /// @brief One-of-N inline storage without lifetime tracking.
    ///
    /// @details
    /// The owner records which member (if any) is alive and must call `Destroy<U>()` for it
    /// before the storage goes away or is reused. Copying raw storage is meaningless, so the
    /// type is neither copyable nor movable; owners copy or move the active member explicitly.
    template<class... Ts>
    class UnionStorageFor
    {
        static_assert(sizeof...(Ts) > 0, "UnionStorageFor<Ts...> requires at least one type.");
        static_assert((!std::is_reference_v<Ts> && ...), "UnionStorageFor<T&> is not supported.");

    public:
        UnionStorageFor() noexcept = default;

        UnionStorageFor(const UnionStorageFor&)            = delete;
        UnionStorageFor& operator=(const UnionStorageFor&) = delete;

        ~UnionStorageFor() = default;

        template<class U>
        [[nodiscard]] U* Ptr() noexcept
        {
            static_assert(detail::UnionStorageContains<U, Ts...>, "Type not supported by this UnionStorageFor.");
            return std::launder(reinterpret_cast<U*>(m_data));
        }

        template<class U>
        [[nodiscard]] const U* Ptr() const noexcept
        {
            static_assert(detail::UnionStorageContains<U, Ts...>, "Type not supported by this UnionStorageFor.");
            return std::launder(reinterpret_cast<const U*>(m_data));
        }

        template<class U>
        [[nodiscard]] U& Ref() noexcept
        {
            return *Ptr<U>();
        }

        template<class U>
        [[nodiscard]] const U& Ref() const noexcept
        {
            return *Ptr<U>();
        }

        /// @warning Undefined behavior if another member is still alive.
        template<class U, class... Args>
        U& Construct(Args&&... args) noexcept(std::is_nothrow_constructible_v<U, Args...>)
        {
            static_assert(detail::UnionStorageContains<U, Ts...>, "Type not supported by this UnionStorageFor.");
            ::new (static_cast<void*>(m_data)) U(std::forward<Args>(args)...);
            return Ref<U>();
        }

        /// @warning Undefined behavior if `U` is not the alive member.
        template<class U>
        void Destroy() noexcept
        {
            if constexpr (!std::is_trivially_destructible_v<U>)
            {
                Ref<U>().~U();
            }
        }

        static constexpr std::size_t Size() noexcept { return kSize; }
        static constexpr std::size_t Alignment() noexcept { return kAlign; }

    private:
        static constexpr std::size_t kSize  = (std::max)({sizeof(Ts)...});
        static constexpr std::size_t kAlign = (std::max)({alignof(Ts)...});

        alignas(kAlign) std::byte m_data[kSize];
    };
}// namespace Tandem::Memory
