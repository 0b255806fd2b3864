/// @file RawEntry.hpp
/// @brief Hash-driven entry API returned by `AdaptiveMap::RawEntryMut()` and `AdaptiveMap::RawEntry()`.
///
/// Raw entries search by an explicit hash plus a key predicate, so no owned key is needed
/// until a vacant entry is filled. The hash must be the map's hash of the key being looked
/// for (`AdaptiveMap::HashKey()`); an inconsistent hash makes lookups miss or insertions
/// land in the wrong chain, but never touches memory it should not. While the map is linear
/// the hash is ignored and only the predicate is used.
#pragma once

#include <Tandem/Containers/Entry.hpp>
#include <Tandem/Containers/FlatHashMap.hpp>
#include <Tandem/Containers/KeyValue.hpp>
#include <Tandem/Containers/LinearMap.hpp>
#include <Tandem/Exceptions/EntryStateException.hpp>
#include <Tandem/Memory/AllocatorConcept.hpp>
#include <Tandem/Utilities/Either.hpp>

#include <concepts>
#include <cstddef>
#include <optional>
#include <utility>

namespace Tandem::Containers
{
    /// @brief Raw entry for a stored pair. Unlike `OccupiedEntry` it also exposes the stored key mutably.
    template<typename Key, typename Value, typename Hash, typename KeyEqual, Memory::AllocatorConcept AllocatorType>
    class RawOccupiedEntryMut
    {
    public:
        using LinearHandle = typename LinearMap<Key, Value, Hash, KeyEqual, AllocatorType>::OccupiedEntry;
        using HashedHandle = typename FlatHashMap<Key, Value, Hash, KeyEqual, AllocatorType>::OccupiedEntry;
        using HandleType   = Utilities::Either<LinearHandle, HashedHandle>;

        RawOccupiedEntryMut(HandleType handle, detail::HandleGuard guard) noexcept
            : m_handle(std::move(handle)), m_guard(std::move(guard))
        {
        }

        [[nodiscard]] const Key& GetKey() const
        {
            m_guard.Check("RawOccupiedEntryMut::GetKey");
            return m_handle.Visit([](const auto& h) -> const Key& { return h.GetKey(); });
        }

        /// @warning Changing the key so that it hashes or compares differently breaks later lookups.
        [[nodiscard]] Key& KeyMut()
        {
            m_guard.Check("RawOccupiedEntryMut::KeyMut");
            return m_handle.Visit([](auto& h) -> Key& { return h.KeyMut(); });
        }

        [[nodiscard]] const Value& Get() const
        {
            m_guard.Check("RawOccupiedEntryMut::Get");
            return m_handle.Visit([](const auto& h) -> const Value& { return h.Get(); });
        }

        [[nodiscard]] Value& GetMut()
        {
            m_guard.Check("RawOccupiedEntryMut::GetMut");
            return m_handle.Visit([](auto& h) -> Value& { return h.GetMut(); });
        }

        [[nodiscard]] KeyValueConstRef<Key, Value> GetKeyValue() const
        {
            m_guard.Check("RawOccupiedEntryMut::GetKeyValue");
            return m_handle.Visit([](const auto& h) { return KeyValueConstRef<Key, Value> {h.GetKey(), h.Get()}; });
        }

        [[nodiscard]] KeyValueMutRef<Key, Value> GetKeyValueMut()
        {
            m_guard.Check("RawOccupiedEntryMut::GetKeyValueMut");
            return m_handle.Visit([](auto& h) { return h.KeyValueMut(); });
        }

        [[nodiscard]] Value& IntoMut()
        {
            m_guard.Check("RawOccupiedEntryMut::IntoMut");
            Value& value = m_handle.Visit([](auto& h) -> Value& { return h.IntoMut(); });
            m_guard.Retire();
            return value;
        }

        [[nodiscard]] KeyValueMutRef<Key, Value> IntoKeyValue()
        {
            m_guard.Check("RawOccupiedEntryMut::IntoKeyValue");
            KeyValueMutRef<Key, Value> pair = m_handle.Visit([](auto& h) { return h.KeyValueMut(); });
            m_guard.Retire();
            return pair;
        }

        /// @return The previous value.
        Value Insert(Value value)
        {
            m_guard.Check("RawOccupiedEntryMut::Insert");
            return m_handle.Visit([&value](auto& h) { return h.Insert(std::move(value)); });
        }

        /// @brief Replace the stored key object. `key` must be equal to it.
        /// @return The previous key object.
        Key InsertKey(Key key)
        {
            m_guard.Check("RawOccupiedEntryMut::InsertKey");
            return m_handle.Visit([&key](auto& h) { return h.InsertKey(std::move(key)); });
        }

        Value Remove()
        {
            m_guard.Check("RawOccupiedEntryMut::Remove");
            Value removed = m_handle.Visit([](auto& h) { return h.Remove(); });
            m_guard.Retire();
            return removed;
        }

        std::pair<Key, Value> RemoveEntry()
        {
            m_guard.Check("RawOccupiedEntryMut::RemoveEntry");
            std::pair<Key, Value> removed = m_handle.Visit([](auto& h) { return h.RemoveEntry(); });
            m_guard.Retire();
            return removed;
        }

    private:
        HandleType          m_handle;
        detail::HandleGuard m_guard;
    };

    /// @brief Raw entry for an absent key. Holds no key; the caller supplies it on insertion.
    template<typename Key, typename Value, typename Hash, typename KeyEqual, Memory::AllocatorConcept AllocatorType>
    class RawVacantEntryMut
    {
    public:
        using LinearHandle = typename LinearMap<Key, Value, Hash, KeyEqual, AllocatorType>::RawVacantEntry;
        using HashedHandle = typename FlatHashMap<Key, Value, Hash, KeyEqual, AllocatorType>::RawVacantEntry;
        using HandleType   = Utilities::Either<LinearHandle, HashedHandle>;

        RawVacantEntryMut(HandleType handle, detail::HandleGuard guard) noexcept
            : m_handle(std::move(handle)), m_guard(std::move(guard))
        {
        }

        /// @brief Hash `key` with the map's hasher and store the pair.
        /// @warning `key` must be absent and must match the predicate the entry was looked up with.
        KeyValueMutRef<Key, Value> Insert(Key key, Value value)
        {
            m_guard.Check("RawVacantEntryMut::Insert");
            KeyValueMutRef<Key, Value> stored =
                    m_handle.Visit([&key, &value](auto& h) { return h.Insert(std::move(key), std::move(value)); });
            m_guard.Retire();
            return stored;
        }

        /// @brief Store the pair under a caller-computed hash, without hashing `key` again.
        KeyValueMutRef<Key, Value> InsertHashedNoCheck(std::size_t hash, Key key, Value value)
        {
            m_guard.Check("RawVacantEntryMut::InsertHashedNoCheck");
            KeyValueMutRef<Key, Value> stored = m_handle.Visit([hash, &key, &value](auto& h) {
                return h.InsertHashedNoCheck(hash, std::move(key), std::move(value));
            });
            m_guard.Retire();
            return stored;
        }

    private:
        HandleType          m_handle;
        detail::HandleGuard m_guard;
    };

    /// @brief Result of a `RawEntryBuilderMut` search.
    template<typename Key, typename Value, typename Hash, typename KeyEqual, Memory::AllocatorConcept AllocatorType>
    class RawEntryMut
    {
    public:
        using OccupiedType = RawOccupiedEntryMut<Key, Value, Hash, KeyEqual, AllocatorType>;
        using VacantType   = RawVacantEntryMut<Key, Value, Hash, KeyEqual, AllocatorType>;

        RawEntryMut(OccupiedType occupied) noexcept : m_state(std::move(occupied)) {}
        RawEntryMut(VacantType vacant) noexcept : m_state(std::move(vacant)) {}

        /// @brief Wrap a backend `RawEntryMut()` result.
        template<class BackendEntry>
        static RawEntryMut FromBackend(BackendEntry&& backend, detail::HandleGuard guard)
        {
            if (backend.IsFirst())
                return RawEntryMut(OccupiedType(typename OccupiedType::HandleType(std::move(backend.First())), std::move(guard)));
            return RawEntryMut(VacantType(typename VacantType::HandleType(std::move(backend.Second())), std::move(guard)));
        }

        [[nodiscard]] bool IsOccupied() const noexcept { return m_state.IsFirst(); }
        [[nodiscard]] bool IsVacant() const noexcept { return m_state.IsSecond(); }

        /// @throws Exceptions::EntryStateException if the entry is vacant.
        [[nodiscard]] OccupiedType& Occupied()
        {
            if (!IsOccupied())
                throw Exceptions::EntryStateException("RawEntryMut::Occupied called on a vacant entry");
            return m_state.First();
        }

        /// @throws Exceptions::EntryStateException if the entry is occupied.
        [[nodiscard]] VacantType& Vacant()
        {
            if (!IsVacant())
                throw Exceptions::EntryStateException("RawEntryMut::Vacant called on an occupied entry");
            return m_state.Second();
        }

        /// @brief The stored pair, inserting `(defaultKey, defaultValue)` if absent.
        KeyValueMutRef<Key, Value> OrInsert(Key defaultKey, Value defaultValue)
        {
            if (IsOccupied())
                return m_state.First().IntoKeyValue();
            return m_state.Second().Insert(std::move(defaultKey), std::move(defaultValue));
        }

        /// @brief The stored pair, inserting the `std::pair` returned by `make()` if absent.
        template<class F>
            requires std::invocable<F&>
        KeyValueMutRef<Key, Value> OrInsertWith(F&& make)
        {
            if (IsOccupied())
                return m_state.First().IntoKeyValue();
            auto [key, value] = make();
            return m_state.Second().Insert(Key(std::move(key)), Value(std::move(value)));
        }

        /// @brief Apply `f(key, value)` to the stored pair if occupied; pass the entry on either way.
        template<class F>
            requires std::invocable<F&, Key&, Value&>
        RawEntryMut&& AndModify(F&& f)
        {
            if (IsOccupied())
            {
                KeyValueMutRef<Key, Value> pair = m_state.First().GetKeyValueMut();
                f(pair.key, pair.value);
            }
            return std::move(*this);
        }

    private:
        Utilities::Either<OccupiedType, VacantType> m_state;
    };

    /// @brief Search front-end returned by `AdaptiveMap::RawEntryMut()`. Each search consumes the builder.
    template<typename Key, typename Value, typename Hash, typename KeyEqual, Memory::AllocatorConcept AllocatorType>
    class RawEntryBuilderMut
    {
    public:
        using LinearBackend = LinearMap<Key, Value, Hash, KeyEqual, AllocatorType>;
        using HashedBackend = FlatHashMap<Key, Value, Hash, KeyEqual, AllocatorType>;
        using ResultType    = RawEntryMut<Key, Value, Hash, KeyEqual, AllocatorType>;
        using TargetType    = Utilities::Either<LinearBackend*, HashedBackend*>;

        RawEntryBuilderMut(TargetType target, detail::HandleGuard guard) noexcept
            : m_target(std::move(target)), m_guard(std::move(guard))
        {
        }

        /// @brief Look up `key`, hashing it only if the map is hashed.
        template<class Q>
            requires LookupKeyFor<Q, Key, Hash, KeyEqual>
        ResultType FromKey(const Q& key)
        {
            m_guard.Check("RawEntryBuilderMut::FromKey");
            if (m_target.IsFirst())
                return Search_(0, key);
            return Search_(m_target.Second()->HashOf(key), key);
        }

        /// @brief Look up `key` under a precomputed hash.
        template<class Q>
            requires LookupKeyFor<Q, Key, Hash, KeyEqual>
        ResultType FromKeyHashed(std::size_t hash, const Q& key)
        {
            m_guard.Check("RawEntryBuilderMut::FromKeyHashed");
            return Search_(hash, key);
        }

        /// @brief Look up the stored key for which `isMatch(key)` holds, under `hash`.
        template<class Predicate>
            requires std::predicate<Predicate&, const Key&>
        ResultType FromHash(std::size_t hash, Predicate&& isMatch)
        {
            m_guard.Check("RawEntryBuilderMut::FromHash");
            return m_target.Visit([&](auto* backend) {
                return ResultType::FromBackend(backend->RawEntryMut(hash, isMatch), std::move(m_guard));
            });
        }

    private:
        template<class Q>
        ResultType Search_(std::size_t hash, const Q& key)
        {
            return m_target.Visit([&](auto* backend) {
                const KeyEqual& equal = backend->KeyEq();
                return ResultType::FromBackend(
                        backend->RawEntryMut(hash, [&](const Key& stored) { return static_cast<bool>(equal(stored, key)); }),
                        std::move(m_guard));
            });
        }

        TargetType          m_target;
        detail::HandleGuard m_guard;
    };

    /// @brief Read-only raw lookups returned by `AdaptiveMap::RawEntry()`.
    template<typename Key, typename Value, typename Hash, typename KeyEqual, Memory::AllocatorConcept AllocatorType>
    class RawEntryBuilder
    {
    public:
        using LinearBackend = LinearMap<Key, Value, Hash, KeyEqual, AllocatorType>;
        using HashedBackend = FlatHashMap<Key, Value, Hash, KeyEqual, AllocatorType>;
        using ResultType    = std::optional<KeyValueConstRef<Key, Value>>;
        using TargetType    = Utilities::Either<const LinearBackend*, const HashedBackend*>;

        explicit RawEntryBuilder(TargetType target) noexcept : m_target(std::move(target)) {}

        template<class Q>
            requires LookupKeyFor<Q, Key, Hash, KeyEqual>
        [[nodiscard]] ResultType FromKey(const Q& key) const
        {
            if (m_target.IsFirst())
                return Search_(0, key);
            return Search_(m_target.Second()->HashOf(key), key);
        }

        template<class Q>
            requires LookupKeyFor<Q, Key, Hash, KeyEqual>
        [[nodiscard]] ResultType FromKeyHashed(std::size_t hash, const Q& key) const
        {
            return Search_(hash, key);
        }

        template<class Predicate>
            requires std::predicate<Predicate&, const Key&>
        [[nodiscard]] ResultType FromHash(std::size_t hash, Predicate&& isMatch) const
        {
            return m_target.Visit([&](const auto* backend) { return backend->RawGet(hash, isMatch); });
        }

    private:
        template<class Q>
        ResultType Search_(std::size_t hash, const Q& key) const
        {
            return m_target.Visit([&](const auto* backend) {
                const KeyEqual& equal = backend->KeyEq();
                return backend->RawGet(hash, [&](const Key& stored) { return static_cast<bool>(equal(stored, key)); });
            });
        }

        TargetType m_target;
    };
}// namespace Tandem::Containers
