/// @file AdaptiveMap.hpp
/// @brief Associative container that scans a small vector while it is small and hashes once it is not.
///
/// Semantics / constraints:
/// - A map starts linear (`IsVec()`): pairs live in a `LinearMap` and lookups compare keys
///   front to back without hashing.
/// - The `Insert()` that finds `TANDEM_LINEAR_LIMIT` pairs already stored migrates every pair
///   into a `FlatHashMap` (`IsMap()`) before inserting. Migration happens once and never reverses.
/// - Only `Insert()` migrates. Entry insertion, raw-entry insertion and `InsertNoCheck()` append
///   to a linear map even when it is at the limit; the next `Insert()` migrates it.
/// - Every mutation invalidates outstanding entry handles, iterators and references, exactly as
///   the active backend documents.

#pragma once

#include <Tandem/Containers/Config.hpp>
#include <Tandem/Containers/ContainerError.hpp>
#include <Tandem/Containers/Entry.hpp>
#include <Tandem/Containers/FlatHashMap.hpp>
#include <Tandem/Containers/Iterators.hpp>
#include <Tandem/Containers/KeyValue.hpp>
#include <Tandem/Containers/LinearMap.hpp>
#include <Tandem/Containers/RawEntry.hpp>
#include <Tandem/Containers/Vector.hpp>
#include <Tandem/Defines.hpp>
#include <Tandem/Memory/AllocatorConcept.hpp>
#include <Tandem/Memory/SystemAllocator.hpp>
#include <Tandem/Memory/UnionStorageFor.hpp>
#include <Tandem/Primitives.hpp>

#include <concepts>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace Tandem::Containers
{
    /// @brief Which backend an `AdaptiveMap` currently owns.
    enum class Representation : UInt8
    {
        Linear,
        Hashed,
        Transitional,///< Only exists inside a migrating `Insert()`; observing it is a contract failure.
    };

    template<typename Key,
             typename Value,
             typename Hash                            = std::hash<Key>,
             typename KeyEqual                        = std::equal_to<Key>,
             Memory::AllocatorConcept AllocatorType = Memory::SystemAllocator>
    class AdaptiveMap
    {
    public:
        using key_type       = Key;
        using mapped_type    = Value;
        using hash_type      = Hash;
        using key_equal      = KeyEqual;
        using allocator_type = AllocatorType;
        using size_type      = UIntSize;

        using LinearStore = LinearMap<Key, Value, Hash, KeyEqual, AllocatorType>;
        using HashedStore = FlatHashMap<Key, Value, Hash, KeyEqual, AllocatorType>;

        using EntryType             = Containers::Entry<Key, Value, Hash, KeyEqual, AllocatorType>;
        using OccupiedEntryType     = Containers::OccupiedEntry<Key, Value, Hash, KeyEqual, AllocatorType>;
        using VacantEntryType       = Containers::VacantEntry<Key, Value, Hash, KeyEqual, AllocatorType>;
        using RawEntryMutType       = Containers::RawEntryMut<Key, Value, Hash, KeyEqual, AllocatorType>;
        using RawEntryBuilderMutType = Containers::RawEntryBuilderMut<Key, Value, Hash, KeyEqual, AllocatorType>;
        using RawEntryBuilderType   = Containers::RawEntryBuilder<Key, Value, Hash, KeyEqual, AllocatorType>;

        using Iterator      = MapIterator<Key, Value, Hash, KeyEqual, AllocatorType>;
        using ConstIterator = MapConstIterator<Key, Value, Hash, KeyEqual, AllocatorType>;
        using KeysRange     = detail::ProjectedRange<ConstIterator, detail::ProjectKey>;
        using ValuesRange   = detail::ProjectedRange<ConstIterator, detail::ProjectValue>;
        using ValuesMutRange = detail::ProjectedRange<Iterator, detail::ProjectValue>;
        using DrainType     = Containers::Drain<Key, Value, Hash, KeyEqual, AllocatorType>;

        static constexpr UIntSize kLinearLimit = TANDEM_LINEAR_LIMIT;

        //--------------------------------------------------------------------------
        // Construction
        //--------------------------------------------------------------------------

        AdaptiveMap() : m_representation(Representation::Linear)
        {
            m_storage.template Construct<LinearStore>();
        }

        explicit AdaptiveMap(const AllocatorType& allocator) : m_representation(Representation::Linear)
        {
            m_storage.template Construct<LinearStore>(0, Hash {}, KeyEqual {}, allocator);
        }

        /// @brief Build from a range of pairs (`first`/`second` or `key`/`value` members).
        /// @details Later duplicates overwrite earlier values.
        template<class InputIt>
            requires requires(InputIt it) {
                *it;
                ++it;
                it != it;
            }
        AdaptiveMap(InputIt first, InputIt last) : AdaptiveMap()
        {
            Extend(std::move(first), std::move(last));
        }

        AdaptiveMap(std::initializer_list<std::pair<Key, Value>> init) : AdaptiveMap()
        {
            Extend(init.begin(), init.end());
        }

        /// @brief Empty map able to hold `capacity` pairs; hashed right away if that exceeds the linear limit.
        [[nodiscard]] static AdaptiveMap WithCapacity(UIntSize capacity)
        {
            if (capacity <= kLinearLimit)
                return AdaptiveMap(LinearStore(capacity));
            return AdaptiveMap(HashedStore(capacity));
        }

        /// @brief Empty linear map able to hold `capacity` pairs, whatever `capacity` is.
        [[nodiscard]] static AdaptiveMap VecWithCapacity(UIntSize capacity)
        {
            return AdaptiveMap(LinearStore(capacity));
        }

        /// @brief Empty map using `hash`. The map starts hashed.
        [[nodiscard]] static AdaptiveMap WithHasher(const Hash& hash)
        {
            return AdaptiveMap(HashedStore(0, hash));
        }

        /// @brief Empty hashed map using `hash`, able to hold `capacity` pairs.
        [[nodiscard]] static AdaptiveMap WithCapacityAndHasher(UIntSize capacity, const Hash& hash)
        {
            return AdaptiveMap(HashedStore(capacity, hash));
        }

        AdaptiveMap(const AdaptiveMap& other) : m_representation(other.m_representation)
        {
            other.Dispatch_([this](const auto& store) {
                using StoreType = std::remove_cvref_t<decltype(store)>;
                m_storage.template Construct<StoreType>(store);
            });
        }

        AdaptiveMap(AdaptiveMap&& other) noexcept : m_representation(other.m_representation)
        {
            other.Dispatch_([this](auto& store) {
                using StoreType = std::remove_cvref_t<decltype(store)>;
                m_storage.template Construct<StoreType>(std::move(store));
            });
            ++other.m_generation;
        }

        AdaptiveMap& operator=(const AdaptiveMap& other)
        {
            if (this != &other)
            {
                AdaptiveMap copy(other);
                *this = std::move(copy);
            }
            return *this;
        }

        AdaptiveMap& operator=(AdaptiveMap&& other) noexcept
        {
            if (this == &other)
                return *this;

            DestroyActive_();
            m_representation = other.m_representation;
            other.Dispatch_([this](auto& store) {
                using StoreType = std::remove_cvref_t<decltype(store)>;
                m_storage.template Construct<StoreType>(std::move(store));
            });
            ++m_generation;
            ++other.m_generation;
            return *this;
        }

        ~AdaptiveMap() { DestroyActive_(); }

        //--------------------------------------------------------------------------
        // Introspection
        //--------------------------------------------------------------------------

        [[nodiscard]] bool IsVec() const noexcept { return m_representation == Representation::Linear; }
        [[nodiscard]] bool IsMap() const noexcept { return m_representation == Representation::Hashed; }

        [[nodiscard]] UIntSize Size() const
        {
            return Dispatch_([](const auto& store) { return store.Size(); });
        }

        [[nodiscard]] bool IsEmpty() const
        {
            return Dispatch_([](const auto& store) { return store.IsEmpty(); });
        }

        /// @brief Pairs the active backend holds before it has to grow.
        [[nodiscard]] UIntSize Capacity() const
        {
            return Dispatch_([](const auto& store) { return store.Capacity(); });
        }

        [[nodiscard]] const Hash& Hasher() const
        {
            return Dispatch_([](const auto& store) -> const Hash& { return store.HashFunction(); });
        }

        [[nodiscard]] const AllocatorType& GetAllocator() const
        {
            return Dispatch_([](const auto& store) -> const AllocatorType& { return store.GetAllocator(); });
        }

        /// @brief The map's hash of `key`, for use with `RawEntryMut().FromKeyHashed()` and `FromHash()`.
        template<class Q>
            requires LookupKeyFor<Q, Key, Hash, KeyEqual>
        [[nodiscard]] std::size_t HashKey(const Q& key) const
        {
            return static_cast<std::size_t>(Hasher()(key));
        }

        //--------------------------------------------------------------------------
        // Lookup
        //--------------------------------------------------------------------------

        template<class Q>
            requires LookupKeyFor<Q, Key, Hash, KeyEqual>
        [[nodiscard]] Value* GetPtr(const Q& key)
        {
            return Dispatch_([&key](auto& store) { return store.GetPtr(key); });
        }

        template<class Q>
            requires LookupKeyFor<Q, Key, Hash, KeyEqual>
        [[nodiscard]] const Value* GetPtr(const Q& key) const
        {
            return Dispatch_([&key](const auto& store) { return store.GetPtr(key); });
        }

        /// @brief The stored key and value for `key`, if present.
        template<class Q>
            requires LookupKeyFor<Q, Key, Hash, KeyEqual>
        [[nodiscard]] std::optional<KeyValueConstRef<Key, Value>> GetKeyValue(const Q& key) const
        {
            return Dispatch_([&key](const auto& store) { return store.GetKeyValue(key); });
        }

        template<class Q>
            requires LookupKeyFor<Q, Key, Hash, KeyEqual>
        [[nodiscard]] bool Contains(const Q& key) const
        {
            return GetPtr(key) != nullptr;
        }

        /// @throws std::out_of_range if `key` is absent.
        template<class Q>
            requires LookupKeyFor<Q, Key, Hash, KeyEqual>
        [[nodiscard]] Value Get(const Q& key) const
        {
            return At(key);
        }

        /// @throws std::out_of_range if `key` is absent.
        template<class Q>
            requires LookupKeyFor<Q, Key, Hash, KeyEqual>
        [[nodiscard]] Value& At(const Q& key)
        {
            Value* p = GetPtr(key);
            if (!p)
                throw std::out_of_range("Key not found in map");
            return *p;
        }

        template<class Q>
            requires LookupKeyFor<Q, Key, Hash, KeyEqual>
        [[nodiscard]] const Value& At(const Q& key) const
        {
            const Value* p = GetPtr(key);
            if (!p)
                throw std::out_of_range("Key not found in map");
            return *p;
        }

        /// @brief Read-only indexing. Never inserts.
        /// @throws std::out_of_range if `key` is absent.
        template<class Q>
            requires LookupKeyFor<Q, Key, Hash, KeyEqual>
        const Value& operator[](const Q& key) const
        {
            return At(key);
        }

        //--------------------------------------------------------------------------
        // Modification
        //--------------------------------------------------------------------------

        /// @brief Insert or overwrite; an existing key keeps its stored key object.
        /// @return The previous value, or std::nullopt if `key` was new.
        std::optional<Value> Insert(Key key, Value value)
        {
            ++m_generation;
            if (m_representation == Representation::Linear)
            {
                LinearStore& linear = LinearRef_();
                if (linear.Size() < kLinearLimit)
                    return linear.Insert(std::move(key), std::move(value));
                MigrateToHashed_();
            }
            return HashedRef_().Insert(std::move(key), std::move(value));
        }

        /// @brief Insert a key the caller knows to be absent.
        /// @details A linear map appends without scanning. A hashed map performs a regular insert.
        /// @warning Inserting a present key into a linear map leaves a duplicate that lookups never see.
        void InsertNoCheck(Key key, Value value)
        {
            ++m_generation;
            if (m_representation == Representation::Linear)
                LinearRef_().InsertNoCheck(std::move(key), std::move(value));
            else
                HashedRef_().Insert(std::move(key), std::move(value));
        }

        /// @return The removed value, or std::nullopt if `key` was absent.
        template<class Q>
            requires LookupKeyFor<Q, Key, Hash, KeyEqual>
        std::optional<Value> Remove(const Q& key)
        {
            ++m_generation;
            return Dispatch_([&key](auto& store) { return store.Remove(key); });
        }

        /// @return The stored key and value, or std::nullopt if `key` was absent.
        template<class Q>
            requires LookupKeyFor<Q, Key, Hash, KeyEqual>
        std::optional<std::pair<Key, Value>> RemoveEntry(const Q& key)
        {
            ++m_generation;
            return Dispatch_([&key](auto& store) { return store.RemoveEntry(key); });
        }

        /// @brief Remove every pair for which `keep(const Key&, Value&)` returns false.
        template<class Predicate>
            requires std::predicate<Predicate&, const Key&, Value&>
        void Retain(Predicate&& keep)
        {
            ++m_generation;
            Dispatch_([&keep](auto& store) { store.Retain(keep); });
        }

        /// @brief Remove every pair. The representation and the reserved capacity are kept.
        void Clear()
        {
            ++m_generation;
            Dispatch_([](auto& store) { store.Clear(); });
        }

        /// @brief Make room for `additional` more pairs in the active backend.
        /// @throws std::length_error on size overflow, std::bad_alloc on allocation failure.
        void Reserve(UIntSize additional)
        {
            ++m_generation;
            Dispatch_([additional](auto& store) { store.Reserve(additional); });
        }

        ContainerExpected<void> TryReserve(UIntSize additional)
        {
            ++m_generation;
            return Dispatch_([additional](auto& store) { return store.TryReserve(additional); });
        }

        void ShrinkToFit()
        {
            ++m_generation;
            Dispatch_([](auto& store) { store.ShrinkToFit(); });
        }

        /// @brief Insert every pair of `[first, last)` with `Insert()` semantics.
        template<class InputIt>
        void Extend(InputIt first, InputIt last)
        {
            for (; first != last; ++first)
                InsertItem_(*first);
        }

        template<class Range>
        void Extend(Range&& range)
        {
            for (auto&& item: range)
                InsertItem_(std::forward<decltype(item)>(item));
        }

        /// @brief Occupied or vacant entry for `key`, found with a single lookup.
        [[nodiscard]] EntryType Entry(Key key)
        {
            ++m_generation;
            return Dispatch_([&](auto& store) {
                return EntryType::FromBackend(store.Entry(std::move(key)), detail::HandleGuard(m_generation));
            });
        }

        /// @brief Builder for hash-driven lookups that can insert without an owned key up front.
        [[nodiscard]] RawEntryBuilderMutType RawEntryMut()
        {
            ++m_generation;
            return Dispatch_([this](auto& store) {
                return RawEntryBuilderMutType(typename RawEntryBuilderMutType::TargetType(&store),
                                              detail::HandleGuard(m_generation));
            });
        }

        [[nodiscard]] RawEntryBuilderType RawEntry() const
        {
            return Dispatch_([](const auto& store) {
                return RawEntryBuilderType(typename RawEntryBuilderType::TargetType(&store));
            });
        }

        //--------------------------------------------------------------------------
        // Iteration
        //--------------------------------------------------------------------------

        Iterator begin()
        {
            return Dispatch_([](auto& store) { return Iterator(store.begin()); });
        }

        Iterator end()
        {
            return Dispatch_([](auto& store) { return Iterator(store.end()); });
        }

        ConstIterator begin() const
        {
            return Dispatch_([](const auto& store) { return ConstIterator(store.begin()); });
        }

        ConstIterator end() const
        {
            return Dispatch_([](const auto& store) { return ConstIterator(store.end()); });
        }

        [[nodiscard]] KeysRange Keys() const { return KeysRange(begin(), end()); }
        [[nodiscard]] ValuesRange Values() const { return ValuesRange(begin(), end()); }
        [[nodiscard]] ValuesMutRange ValuesMut() { return ValuesMutRange(begin(), end()); }

        /// @brief Remove and hand out every pair. The map is empty once the returned drain is destroyed.
        [[nodiscard]] DrainType Drain()
        {
            ++m_generation;
            return Dispatch_([](auto& store) { return DrainType(store.DrainAll()); });
        }

        //--------------------------------------------------------------------------
        // Comparison
        //--------------------------------------------------------------------------

        /// @brief Same size, and every pair of this map is found with an equal value in `other`.
        /// @details Independent of representation and of the hasher each map uses.
        template<class OtherHash, class OtherEqual, Memory::AllocatorConcept OtherAllocator>
            requires std::equality_comparable<Value>
        bool operator==(const AdaptiveMap<Key, Value, OtherHash, OtherEqual, OtherAllocator>& other) const
        {
            if (Size() != other.Size())
                return false;
            for (const auto pair: *this)
            {
                const Value* found = other.GetPtr(pair.key);
                if (!found || !(*found == pair.value))
                    return false;
            }
            return true;
        }

    private:
        explicit AdaptiveMap(LinearStore&& store) noexcept : m_representation(Representation::Linear)
        {
            m_storage.template Construct<LinearStore>(std::move(store));
        }

        explicit AdaptiveMap(HashedStore&& store) noexcept : m_representation(Representation::Hashed)
        {
            m_storage.template Construct<HashedStore>(std::move(store));
        }

        [[nodiscard]] LinearStore& LinearRef_() noexcept { return m_storage.template Ref<LinearStore>(); }
        [[nodiscard]] HashedStore& HashedRef_() noexcept { return m_storage.template Ref<HashedStore>(); }

        template<class F>
        decltype(auto) Dispatch_(F&& f)
        {
            switch (m_representation)
            {
                case Representation::Linear:
                    return std::forward<F>(f)(m_storage.template Ref<LinearStore>());
                case Representation::Hashed:
                    return std::forward<F>(f)(m_storage.template Ref<HashedStore>());
                case Representation::Transitional:
                    break;
            }
            TANDEM_CONTRACT_FAIL("AdaptiveMap used while migrating to the hashed representation");
        }

        template<class F>
        decltype(auto) Dispatch_(F&& f) const
        {
            switch (m_representation)
            {
                case Representation::Linear:
                    return std::forward<F>(f)(m_storage.template Ref<LinearStore>());
                case Representation::Hashed:
                    return std::forward<F>(f)(m_storage.template Ref<HashedStore>());
                case Representation::Transitional:
                    break;
            }
            TANDEM_CONTRACT_FAIL("AdaptiveMap used while migrating to the hashed representation");
        }

        void DestroyActive_() noexcept
        {
            switch (m_representation)
            {
                case Representation::Linear:
                    m_storage.template Destroy<LinearStore>();
                    break;
                case Representation::Hashed:
                    m_storage.template Destroy<HashedStore>();
                    break;
                case Representation::Transitional:
                    break;
            }
        }

        /// Moves every pair of the linear store into a hashed store sized for one more pair.
        /// Hashes are computed before anything moves, so a throwing hasher or allocator leaves
        /// the linear store in place. The replay itself does not throw.
        void MigrateToHashed_()
        {
            LinearStore& current = LinearRef_();
            Vector<std::size_t, AllocatorType> hashes(current.Size(), current.GetAllocator());
            for (auto kv: std::as_const(current))
                hashes.PushBack(static_cast<std::size_t>(current.HashFunction()(kv.key)));

            LinearStore linear(std::move(current));
            m_storage.template Destroy<LinearStore>();
            m_representation = Representation::Transitional;

            try
            {
                m_storage.template Construct<HashedStore>(linear.Size() + 1, linear.HashFunction(), linear.KeyEq(),
                                                          linear.GetAllocator());
            }
            catch (...)
            {
                m_storage.template Construct<LinearStore>(std::move(linear));
                m_representation = Representation::Linear;
                throw;
            }

            HashedStore& hashed = HashedRef_();
            m_representation    = Representation::Hashed;

            // The drain hands pairs out back to front.
            UIntSize index = hashes.Size();
            auto     drain = linear.DrainAll();
            while (auto pair = drain.Next())
                hashed.InsertHashedNoCheck(hashes[--index], std::move(pair->first), std::move(pair->second));
        }

        template<class Item>
        void InsertItem_(Item&& item)
        {
            if constexpr (requires { item.key; item.value; })
                Insert(Key(std::forward<Item>(item).key), Value(std::forward<Item>(item).value));
            else
                Insert(Key(std::forward<Item>(item).first), Value(std::forward<Item>(item).second));
        }

        Memory::UnionStorageFor<LinearStore, HashedStore> m_storage;
        Representation                                    m_representation;
        UInt64                                            m_generation {0};
    };

}// namespace Tandem::Containers
