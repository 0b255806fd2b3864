/// @file Either.hpp
/// @brief `Tandem::Utilities::Either<A, B>`: an object that is exactly one of two types.
#pragma once

#include <Tandem/Defines.hpp>
#include <Tandem/Memory/UnionStorageFor.hpp>
#include <Tandem/Primitives.hpp>

#include <type_traits>
#include <utility>

namespace Tandem::Utilities
{
    enum class EitherSide : UInt8
    {
        First,
        Second,
    };

    /// @brief Closed two-way sum type with inline storage.
    ///
    /// @details
    /// - Always holds exactly one alive member; there is no empty state.
    /// - `Visit()` is the exhaustive match: it calls `f(A&)` or `f(B&)`, and both calls must
    ///   produce the same type.
    /// - `First()`/`Second()` are contract-checked: asking for the inactive side aborts.
    /// - Copyable only when both alternatives are copyable. Moving requires nothrow moves.
    template<class A, class B>
    class Either
    {
        static_assert(!std::is_same_v<A, B>, "Either<A, B> requires two distinct types.");
        static_assert(std::is_nothrow_move_constructible_v<A> && std::is_nothrow_move_constructible_v<B>,
                      "Either<A, B> requires nothrow move constructible alternatives.");

    public:
        using FirstType  = A;
        using SecondType = B;

        Either(A&& first) noexcept
            : m_side(EitherSide::First)
        {
            m_storage.template Construct<A>(std::move(first));
        }

        Either(B&& second) noexcept
            : m_side(EitherSide::Second)
        {
            m_storage.template Construct<B>(std::move(second));
        }

        Either(const A& first)
            requires std::is_copy_constructible_v<A>
            : m_side(EitherSide::First)
        {
            m_storage.template Construct<A>(first);
        }

        Either(const B& second)
            requires std::is_copy_constructible_v<B>
            : m_side(EitherSide::Second)
        {
            m_storage.template Construct<B>(second);
        }

        Either(const Either& other)
            requires(std::is_copy_constructible_v<A> && std::is_copy_constructible_v<B>)
            : m_side(other.m_side)
        {
            if (m_side == EitherSide::First)
                m_storage.template Construct<A>(other.m_storage.template Ref<A>());
            else
                m_storage.template Construct<B>(other.m_storage.template Ref<B>());
        }

        Either(Either&& other) noexcept
            : m_side(other.m_side)
        {
            MoveFrom_(other);
        }

        Either& operator=(const Either& other)
            requires(std::is_copy_constructible_v<A> && std::is_copy_constructible_v<B>)
        {
            if (this != &other)
            {
                Either copy(other);
                *this = std::move(copy);
            }
            return *this;
        }

        Either& operator=(Either&& other) noexcept
        {
            if (this != &other)
            {
                Destroy_();
                m_side = other.m_side;
                MoveFrom_(other);
            }
            return *this;
        }

        ~Either() { Destroy_(); }

        [[nodiscard]] EitherSide Side() const noexcept { return m_side; }
        [[nodiscard]] bool IsFirst() const noexcept { return m_side == EitherSide::First; }
        [[nodiscard]] bool IsSecond() const noexcept { return m_side == EitherSide::Second; }

        [[nodiscard]] A& First() noexcept
        {
            if (!IsFirst())
                TANDEM_CONTRACT_FAIL("Either::First called while holding the second alternative");
            return m_storage.template Ref<A>();
        }

        [[nodiscard]] const A& First() const noexcept
        {
            if (!IsFirst())
                TANDEM_CONTRACT_FAIL("Either::First called while holding the second alternative");
            return m_storage.template Ref<A>();
        }

        [[nodiscard]] B& Second() noexcept
        {
            if (!IsSecond())
                TANDEM_CONTRACT_FAIL("Either::Second called while holding the first alternative");
            return m_storage.template Ref<B>();
        }

        [[nodiscard]] const B& Second() const noexcept
        {
            if (!IsSecond())
                TANDEM_CONTRACT_FAIL("Either::Second called while holding the first alternative");
            return m_storage.template Ref<B>();
        }

        template<class F>
        decltype(auto) Visit(F&& f)
        {
            switch (m_side)
            {
                case EitherSide::First:
                    return std::forward<F>(f)(m_storage.template Ref<A>());
                case EitherSide::Second:
                    return std::forward<F>(f)(m_storage.template Ref<B>());
            }
            Unreachable();
        }

        template<class F>
        decltype(auto) Visit(F&& f) const
        {
            switch (m_side)
            {
                case EitherSide::First:
                    return std::forward<F>(f)(m_storage.template Ref<A>());
                case EitherSide::Second:
                    return std::forward<F>(f)(m_storage.template Ref<B>());
            }
            Unreachable();
        }

    private:
        void MoveFrom_(Either& other) noexcept
        {
            if (m_side == EitherSide::First)
                m_storage.template Construct<A>(std::move(other.m_storage.template Ref<A>()));
            else
                m_storage.template Construct<B>(std::move(other.m_storage.template Ref<B>()));
        }

        void Destroy_() noexcept
        {
            if (m_side == EitherSide::First)
                m_storage.template Destroy<A>();
            else
                m_storage.template Destroy<B>();
        }

        Memory::UnionStorageFor<A, B> m_storage;
        EitherSide                    m_side;
    };
}// namespace Tandem::Utilities
