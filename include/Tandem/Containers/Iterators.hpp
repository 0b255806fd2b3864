/// @file Iterators.hpp
/// @brief Iteration family of `AdaptiveMap`: pair iterators, key/value projections and the draining range.
#pragma once

#include <Tandem/Containers/FlatHashMap.hpp>
#include <Tandem/Containers/KeyValue.hpp>
#include <Tandem/Containers/LinearMap.hpp>
#include <Tandem/Memory/AllocatorConcept.hpp>
#include <Tandem/Primitives.hpp>
#include <Tandem/Utilities/Either.hpp>

#include <cstddef>
#include <iterator>
#include <optional>
#include <type_traits>
#include <utility>

namespace Tandem::Containers
{
    namespace detail
    {
        /// @brief Forward iterator over one of two backend iterator types.
        ///
        /// Two iterators are equal only when they wrap the same backend kind and the wrapped
        /// iterators compare equal.
        template<class LinearIterator, class HashedIterator, class Reference>
        class EitherIterator
        {
        public:
            using difference_type   = std::ptrdiff_t;
            using value_type        = Reference;
            using reference         = Reference;
            using pointer           = void;
            using iterator_category = std::forward_iterator_tag;

            EitherIterator(LinearIterator it) noexcept : m_it(std::move(it)) {}
            EitherIterator(HashedIterator it) noexcept : m_it(std::move(it)) {}

            reference operator*() const
            {
                return m_it.Visit([](const auto& it) -> reference { return *it; });
            }

            EitherIterator& operator++()
            {
                m_it.Visit([](auto& it) { ++it; });
                return *this;
            }

            EitherIterator operator++(int)
            {
                EitherIterator copy = *this;
                ++*this;
                return copy;
            }

            bool operator==(const EitherIterator& other) const
            {
                if (m_it.Side() != other.m_it.Side())
                    return false;
                if (m_it.IsFirst())
                    return m_it.First() == other.m_it.First();
                return m_it.Second() == other.m_it.Second();
            }

            bool operator!=(const EitherIterator& other) const { return !(*this == other); }

        private:
            Utilities::Either<LinearIterator, HashedIterator> m_it;
        };

        struct ProjectKey
        {
            template<class Ref>
            decltype(auto) operator()(const Ref& ref) const noexcept
            {
                return ref.key;
            }
        };

        struct ProjectValue
        {
            template<class Ref>
            decltype(auto) operator()(const Ref& ref) const noexcept
            {
                return ref.value;
            }
        };

        /// @brief Iterator adaptor yielding one half of each pair.
        template<class Inner, class Projection>
        class ProjectedIterator
        {
        public:
            using difference_type   = std::ptrdiff_t;
            using reference         = decltype(Projection {}(*std::declval<const Inner&>()));
            using value_type        = std::remove_cvref_t<reference>;
            using pointer           = std::add_pointer_t<reference>;
            using iterator_category = std::forward_iterator_tag;

            explicit ProjectedIterator(Inner inner) noexcept : m_inner(std::move(inner)) {}

            reference operator*() const { return Projection {}(*m_inner); }

            ProjectedIterator& operator++()
            {
                ++m_inner;
                return *this;
            }

            ProjectedIterator operator++(int)
            {
                ProjectedIterator copy = *this;
                ++m_inner;
                return copy;
            }

            bool operator==(const ProjectedIterator& other) const { return m_inner == other.m_inner; }
            bool operator!=(const ProjectedIterator& other) const { return !(*this == other); }

        private:
            Inner m_inner;
        };

        template<class Inner, class Projection>
        class ProjectedRange
        {
        public:
            using iterator = ProjectedIterator<Inner, Projection>;

            ProjectedRange(Inner first, Inner last) noexcept : m_first(std::move(first)), m_last(std::move(last)) {}

            iterator begin() const { return iterator(m_first); }
            iterator end() const { return iterator(m_last); }

        private:
            Inner m_first;
            Inner m_last;
        };
    }// namespace detail

    template<typename Key, typename Value, typename Hash, typename KeyEqual, Memory::AllocatorConcept AllocatorType>
    using MapIterator = detail::EitherIterator<typename LinearMap<Key, Value, Hash, KeyEqual, AllocatorType>::Iterator,
                                               typename FlatHashMap<Key, Value, Hash, KeyEqual, AllocatorType>::Iterator,
                                               KeyValueRef<Key, Value>>;

    template<typename Key, typename Value, typename Hash, typename KeyEqual, Memory::AllocatorConcept AllocatorType>
    using MapConstIterator = detail::EitherIterator<typename LinearMap<Key, Value, Hash, KeyEqual, AllocatorType>::ConstIterator,
                                                    typename FlatHashMap<Key, Value, Hash, KeyEqual, AllocatorType>::ConstIterator,
                                                    KeyValueConstRef<Key, Value>>;

    /// @brief Owning, single-pass removal of every pair of a map.
    ///
    /// @details
    /// Pairs are handed out by value through `Next()` or a range-for loop. Pairs never taken
    /// are destroyed together with the drain, so the map is empty once the drain is gone
    /// regardless of how much of it was consumed.
    template<typename Key, typename Value, typename Hash, typename KeyEqual, Memory::AllocatorConcept AllocatorType>
    class Drain
    {
    public:
        using LinearDrain = typename LinearMap<Key, Value, Hash, KeyEqual, AllocatorType>::Drain;
        using HashedDrain = typename FlatHashMap<Key, Value, Hash, KeyEqual, AllocatorType>::Drain;
        using ItemType    = std::pair<Key, Value>;

        explicit Drain(LinearDrain drain) noexcept : m_drain(std::move(drain)) {}
        explicit Drain(HashedDrain drain) noexcept : m_drain(std::move(drain)) {}

        Drain(Drain&&) noexcept = default;
        Drain(const Drain&)            = delete;
        Drain& operator=(const Drain&) = delete;
        Drain& operator=(Drain&&)      = delete;
        ~Drain()                       = default;

        /// @brief Take the next pair, or std::nullopt once the map is exhausted.
        std::optional<ItemType> Next()
        {
            if (m_front)
            {
                std::optional<ItemType> front = std::move(m_front);
                m_front.reset();
                return front;
            }
            return Pull_();
        }

        /// @brief Number of pairs not yet handed out.
        [[nodiscard]] UIntSize Remaining() const noexcept
        {
            const UIntSize pending = m_drain.Visit([](const auto& d) { return d.Remaining(); });
            return pending + (m_front ? 1 : 0);
        }

        /// @brief Input iterator; dereferencing yields the current pair, which may be moved from.
        class Iterator
        {
        public:
            using difference_type   = std::ptrdiff_t;
            using value_type        = ItemType;
            using reference         = ItemType&;
            using pointer           = ItemType*;
            using iterator_category = std::input_iterator_tag;

            Iterator() = default;
            explicit Iterator(Drain* drain) noexcept : m_drain(drain) {}

            reference operator*() const { return *m_drain->m_front; }
            pointer operator->() const { return &*m_drain->m_front; }

            Iterator& operator++()
            {
                m_drain->m_front = m_drain->Pull_();
                if (!m_drain->m_front)
                    m_drain = nullptr;
                return *this;
            }

            void operator++(int) { ++*this; }

            bool operator==(const Iterator& other) const { return m_drain == other.m_drain; }
            bool operator!=(const Iterator& other) const { return !(*this == other); }

        private:
            Drain* m_drain {nullptr};
        };

        Iterator begin()
        {
            if (!m_front)
                m_front = Pull_();
            return m_front ? Iterator(this) : Iterator();
        }

        Iterator end() noexcept { return Iterator(); }

    private:
        std::optional<ItemType> Pull_()
        {
            return m_drain.Visit([](auto& d) { return d.Next(); });
        }

        Utilities::Either<LinearDrain, HashedDrain> m_drain;
        std::optional<ItemType>                     m_front;
    };
}// namespace Tandem::Containers
