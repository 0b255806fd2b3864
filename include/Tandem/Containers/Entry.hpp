/// @file Entry.hpp
/// @brief Backend-independent entry handles returned by `AdaptiveMap::Entry()`.
///
/// An entry is an occupied or vacant view of one key, wrapping the handle of whichever
/// backend the map was using when the entry was created. Handles are single-use views:
/// - any later mutation of the map invalidates them;
/// - consuming operations (`IntoMut`, `Remove`, vacant `Insert`, `OrInsert`, ...) retire them.
/// With `TANDEM_CHECK_HANDLES` enabled, using an invalid handle throws
/// `Exceptions::InvalidatedHandleException`.
#pragma once

#include <Tandem/Containers/Config.hpp>
#include <Tandem/Containers/FlatHashMap.hpp>
#include <Tandem/Containers/LinearMap.hpp>
#include <Tandem/Exceptions/EntryStateException.hpp>
#include <Tandem/Exceptions/InvalidatedHandleException.hpp>
#include <Tandem/Memory/AllocatorConcept.hpp>
#include <Tandem/Primitives.hpp>
#include <Tandem/Utilities/Either.hpp>

#include <concepts>
#include <utility>

namespace Tandem::Containers
{
    namespace detail
    {
        /// @brief Snapshot of a map's mutation counter, owned by one handle.
        ///
        /// @details
        /// `Check()` fails once the counter has moved on or the guard was retired or moved from.
        /// `Retire()` advances the counter, so every other handle of the same map becomes stale too.
        class HandleGuard
        {
        public:
            explicit HandleGuard(UInt64& generation) noexcept
                : m_generation(&generation), m_snapshot(generation)
            {
            }

            HandleGuard(HandleGuard&& other) noexcept
                : m_generation(std::exchange(other.m_generation, nullptr)), m_snapshot(other.m_snapshot)
            {
            }

            HandleGuard& operator=(HandleGuard&& other) noexcept
            {
                if (this != &other)
                {
                    m_generation = std::exchange(other.m_generation, nullptr);
                    m_snapshot   = other.m_snapshot;
                }
                return *this;
            }

            HandleGuard(const HandleGuard&)            = delete;
            HandleGuard& operator=(const HandleGuard&) = delete;

            void Check(const char* operation) const
            {
#if TANDEM_CHECK_HANDLES
                if (!m_generation || *m_generation != m_snapshot)
                    throw Exceptions::InvalidatedHandleException(operation);
#else
                (void) operation;
#endif
            }

            void Retire() noexcept
            {
                if (m_generation)
                    ++*m_generation;
                m_generation = nullptr;
            }

        private:
            UInt64* m_generation;
            UInt64  m_snapshot;
        };
    }// namespace detail

    /// @brief Entry for a key that is present in the map.
    template<typename Key, typename Value, typename Hash, typename KeyEqual, Memory::AllocatorConcept AllocatorType>
    class OccupiedEntry
    {
    public:
        using LinearHandle = typename LinearMap<Key, Value, Hash, KeyEqual, AllocatorType>::OccupiedEntry;
        using HashedHandle = typename FlatHashMap<Key, Value, Hash, KeyEqual, AllocatorType>::OccupiedEntry;
        using HandleType   = Utilities::Either<LinearHandle, HashedHandle>;

        OccupiedEntry(HandleType handle, detail::HandleGuard guard) noexcept
            : m_handle(std::move(handle)), m_guard(std::move(guard))
        {
        }

        [[nodiscard]] const Key& GetKey() const
        {
            m_guard.Check("OccupiedEntry::GetKey");
            return m_handle.Visit([](const auto& h) -> const Key& { return h.GetKey(); });
        }

        [[nodiscard]] const Value& Get() const
        {
            m_guard.Check("OccupiedEntry::Get");
            return m_handle.Visit([](const auto& h) -> const Value& { return h.Get(); });
        }

        [[nodiscard]] Value& GetMut()
        {
            m_guard.Check("OccupiedEntry::GetMut");
            return m_handle.Visit([](auto& h) -> Value& { return h.GetMut(); });
        }

        /// @brief Consume the entry, keeping a reference to the stored value.
        [[nodiscard]] Value& IntoMut()
        {
            m_guard.Check("OccupiedEntry::IntoMut");
            Value& value = m_handle.Visit([](auto& h) -> Value& { return h.IntoMut(); });
            m_guard.Retire();
            return value;
        }

        /// @brief Replace the value; the stored key is kept.
        /// @return The previous value.
        Value Insert(Value value)
        {
            m_guard.Check("OccupiedEntry::Insert");
            return m_handle.Visit([&value](auto& h) { return h.Insert(std::move(value)); });
        }

        Value Remove()
        {
            m_guard.Check("OccupiedEntry::Remove");
            Value removed = m_handle.Visit([](auto& h) { return h.Remove(); });
            m_guard.Retire();
            return removed;
        }

        std::pair<Key, Value> RemoveEntry()
        {
            m_guard.Check("OccupiedEntry::RemoveEntry");
            std::pair<Key, Value> removed = m_handle.Visit([](auto& h) { return h.RemoveEntry(); });
            m_guard.Retire();
            return removed;
        }

        /// @brief Swap in the key the entry was created with, and `value`.
        /// @return The previously stored key and value.
        std::pair<Key, Value> ReplaceEntry(Value value)
        {
            m_guard.Check("OccupiedEntry::ReplaceEntry");
            std::pair<Key, Value> old = m_handle.Visit([&value](auto& h) { return h.ReplaceEntry(std::move(value)); });
            m_guard.Retire();
            return old;
        }

        /// @brief Swap in the key the entry was created with.
        /// @return The previously stored key.
        Key ReplaceKey()
        {
            m_guard.Check("OccupiedEntry::ReplaceKey");
            Key old = m_handle.Visit([](auto& h) { return h.ReplaceKey(); });
            m_guard.Retire();
            return old;
        }

    private:
        HandleType          m_handle;
        detail::HandleGuard m_guard;
    };

    /// @brief Entry for a key that is absent; owns the key until it is inserted or taken back.
    template<typename Key, typename Value, typename Hash, typename KeyEqual, Memory::AllocatorConcept AllocatorType>
    class VacantEntry
    {
    public:
        using LinearHandle = typename LinearMap<Key, Value, Hash, KeyEqual, AllocatorType>::VacantEntry;
        using HashedHandle = typename FlatHashMap<Key, Value, Hash, KeyEqual, AllocatorType>::VacantEntry;
        using HandleType   = Utilities::Either<LinearHandle, HashedHandle>;

        VacantEntry(HandleType handle, detail::HandleGuard guard) noexcept
            : m_handle(std::move(handle)), m_guard(std::move(guard))
        {
        }

        [[nodiscard]] const Key& GetKey() const
        {
            m_guard.Check("VacantEntry::GetKey");
            return m_handle.Visit([](const auto& h) -> const Key& { return h.GetKey(); });
        }

        /// @brief Give the key back without touching the map.
        [[nodiscard]] Key IntoKey()
        {
            m_guard.Check("VacantEntry::IntoKey");
            Key key = m_handle.Visit([](auto& h) { return h.IntoKey(); });
            m_guard.Retire();
            return key;
        }

        /// @brief Store the entry's key with `value`.
        /// @details A linear map appends without migrating, even at its size limit.
        Value& Insert(Value value)
        {
            m_guard.Check("VacantEntry::Insert");
            Value& stored = m_handle.Visit([&value](auto& h) -> Value& { return h.Insert(std::move(value)); });
            m_guard.Retire();
            return stored;
        }

    private:
        HandleType          m_handle;
        detail::HandleGuard m_guard;
    };

    /// @brief Result of `AdaptiveMap::Entry()`: either an occupied or a vacant entry.
    template<typename Key, typename Value, typename Hash, typename KeyEqual, Memory::AllocatorConcept AllocatorType>
    class Entry
    {
    public:
        using OccupiedType = OccupiedEntry<Key, Value, Hash, KeyEqual, AllocatorType>;
        using VacantType   = VacantEntry<Key, Value, Hash, KeyEqual, AllocatorType>;

        Entry(OccupiedType occupied) noexcept : m_state(std::move(occupied)) {}
        Entry(VacantType vacant) noexcept : m_state(std::move(vacant)) {}

        /// @brief Wrap a backend `Entry()` result.
        template<class BackendEntry>
        static Entry FromBackend(BackendEntry&& backend, detail::HandleGuard guard)
        {
            if (backend.IsFirst())
                return Entry(OccupiedType(typename OccupiedType::HandleType(std::move(backend.First())), std::move(guard)));
            return Entry(VacantType(typename VacantType::HandleType(std::move(backend.Second())), std::move(guard)));
        }

        [[nodiscard]] bool IsOccupied() const noexcept { return m_state.IsFirst(); }
        [[nodiscard]] bool IsVacant() const noexcept { return m_state.IsSecond(); }

        /// @throws Exceptions::EntryStateException if the entry is vacant.
        [[nodiscard]] OccupiedType& Occupied()
        {
            if (!IsOccupied())
                throw Exceptions::EntryStateException("Entry::Occupied called on a vacant entry");
            return m_state.First();
        }

        /// @throws Exceptions::EntryStateException if the entry is occupied.
        [[nodiscard]] VacantType& Vacant()
        {
            if (!IsVacant())
                throw Exceptions::EntryStateException("Entry::Vacant called on an occupied entry");
            return m_state.Second();
        }

        [[nodiscard]] const Key& GetKey() const
        {
            return m_state.Visit([](const auto& e) -> const Key& { return e.GetKey(); });
        }

        /// @brief Value for the key, inserting `defaultValue` if absent.
        Value& OrInsert(Value defaultValue)
        {
            if (IsOccupied())
                return m_state.First().IntoMut();
            return m_state.Second().Insert(std::move(defaultValue));
        }

        /// @brief Value for the key, inserting `make()` if absent. `make` runs only for a vacant entry.
        template<class F>
            requires std::invocable<F&>
        Value& OrInsertWith(F&& make)
        {
            if (IsOccupied())
                return m_state.First().IntoMut();
            return m_state.Second().Insert(Value(make()));
        }

        Value& OrDefault()
            requires std::default_initializable<Value>
        {
            return OrInsertWith([] { return Value {}; });
        }

        /// @brief Apply `f` to the stored value if occupied; pass the entry on either way.
        template<class F>
            requires std::invocable<F&, Value&>
        Entry&& AndModify(F&& f)
        {
            if (IsOccupied())
                f(m_state.First().GetMut());
            return std::move(*this);
        }

    private:
        Utilities::Either<OccupiedType, VacantType> m_state;
    };
}// namespace Tandem::Containers
