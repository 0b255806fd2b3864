/// @file LinearMap.hpp
/// @brief Small-map backend: unique key/value pairs in a contiguous Vector, found by equality scan.
///
/// Semantics / constraints:
/// - Lookups compare keys with `KeyEqual` front to back; the hasher is never invoked. The
///   hasher is stored only so a map can hand it over when it migrates to a hashed table.
/// - Iteration order is insertion order until the first removal; `Remove()` swap-removes.
/// - `InsertNoCheck()` and vacant-entry insertion append without scanning; the caller
///   guarantees the key is absent.
/// - Any removal or growth invalidates iterators, pointers and references.

#pragma once

#include <Tandem/Containers/ContainerError.hpp>
#include <Tandem/Containers/KeyValue.hpp>
#include <Tandem/Containers/Vector.hpp>
#include <Tandem/Defines.hpp>
#include <Tandem/Memory/AllocatorConcept.hpp>
#include <Tandem/Memory/SystemAllocator.hpp>
#include <Tandem/Primitives.hpp>
#include <Tandem/Utilities/Either.hpp>

#include <cstddef>
#include <functional>
#include <iterator>
#include <limits>
#include <optional>
#include <utility>

namespace Tandem::Containers
{
    template<typename Key,
             typename Value,
             typename Hash                            = std::hash<Key>,
             typename KeyEqual                        = std::equal_to<Key>,
             Memory::AllocatorConcept AllocatorType = Memory::SystemAllocator>
    class LinearMap
    {
    public:
        using key_type       = Key;
        using mapped_type    = Value;
        using hash_type      = Hash;
        using key_equal      = KeyEqual;
        using allocator_type = AllocatorType;
        using size_type      = UIntSize;
        using SlotType       = KeyValuePair<Key, Value>;
        using StorageType    = Vector<SlotType, AllocatorType>;

        static constexpr size_type kNotFound = static_cast<size_type>(-1);

        LinearMap() = default;

        explicit LinearMap(size_type initialCapacity,
                           const Hash& hash               = Hash {},
                           const KeyEqual& equal          = KeyEqual {},
                           const AllocatorType& allocator = AllocatorType {})
            : m_entries(initialCapacity, allocator), m_hash(hash), m_equal(equal)
        {
        }

        LinearMap(const LinearMap&)                = default;
        LinearMap(LinearMap&&) noexcept            = default;
        LinearMap& operator=(const LinearMap&)     = default;
        LinearMap& operator=(LinearMap&&) noexcept = default;
        ~LinearMap()                               = default;

        //--------------------------------------------------------------------------
        // Entry handles
        //--------------------------------------------------------------------------

        /// @brief Handle to a stored pair, addressed by its slot index.
        ///
        /// Carries the key passed to `Entry()` (if any) so `ReplaceKey`/`ReplaceEntry` can swap it in.
        class OccupiedEntry
        {
        public:
            OccupiedEntry(LinearMap& map, size_type index, std::optional<Key> key) noexcept
                : m_map(&map), m_index(index), m_key(std::move(key))
            {
            }

            [[nodiscard]] const Key& GetKey() const noexcept { return Slot_().key; }
            [[nodiscard]] Key& KeyMut() noexcept { return Slot_().key; }
            [[nodiscard]] const Value& Get() const noexcept { return Slot_().value; }
            [[nodiscard]] Value& GetMut() noexcept { return Slot_().value; }
            [[nodiscard]] Value& IntoMut() noexcept { return Slot_().value; }
            [[nodiscard]] KeyValueMutRef<Key, Value> KeyValueMut() noexcept { return {Slot_().key, Slot_().value}; }

            Value Insert(Value value) { return std::exchange(Slot_().value, std::move(value)); }
            Key InsertKey(Key key) { return std::exchange(Slot_().key, std::move(key)); }

            Value Remove() { return m_map->m_entries.SwapRemove(m_index).value; }

            std::pair<Key, Value> RemoveEntry()
            {
                SlotType slot = m_map->m_entries.SwapRemove(m_index);
                return {std::move(slot.key), std::move(slot.value)};
            }

            std::pair<Key, Value> ReplaceEntry(Value value)
            {
                SlotType& slot = Slot_();
                Key oldKey     = std::exchange(slot.key, TakeKey_());
                Value oldValue = std::exchange(slot.value, std::move(value));
                return {std::move(oldKey), std::move(oldValue)};
            }

            Key ReplaceKey() { return std::exchange(Slot_().key, TakeKey_()); }

        private:
            [[nodiscard]] SlotType& Slot_() const noexcept { return m_map->m_entries[m_index]; }

            Key TakeKey_()
            {
                if (!m_key)
                    TANDEM_CONTRACT_FAIL("LinearMap::OccupiedEntry has no key to replace with");
                Key key = std::move(*m_key);
                m_key.reset();
                return key;
            }

            LinearMap*         m_map;
            size_type          m_index;
            std::optional<Key> m_key;
        };

        /// @brief Handle for an absent key; `Insert` appends without scanning again.
        class VacantEntry
        {
        public:
            VacantEntry(LinearMap& map, Key key) noexcept
                : m_map(&map), m_key(std::move(key))
            {
            }

            [[nodiscard]] const Key& GetKey() const noexcept { return m_key; }
            [[nodiscard]] Key IntoKey() noexcept { return std::move(m_key); }

            Value& Insert(Value value)
            {
                return m_map->m_entries.EmplaceBack(SlotType {std::move(m_key), std::move(value)}).value;
            }

        private:
            LinearMap* m_map;
            Key        m_key;
        };

        /// @brief Raw vacant handle. The key is supplied at insertion; hashes are accepted and ignored.
        class RawVacantEntry
        {
        public:
            explicit RawVacantEntry(LinearMap& map) noexcept : m_map(&map) {}

            KeyValueMutRef<Key, Value> Insert(Key key, Value value)
            {
                SlotType& slot = m_map->m_entries.EmplaceBack(SlotType {std::move(key), std::move(value)});
                return {slot.key, slot.value};
            }

            KeyValueMutRef<Key, Value> InsertHashedNoCheck(std::size_t, Key key, Value value)
            {
                return Insert(std::move(key), std::move(value));
            }

        private:
            LinearMap* m_map;
        };

        using EntryType    = Utilities::Either<OccupiedEntry, VacantEntry>;
        using RawEntryType = Utilities::Either<OccupiedEntry, RawVacantEntry>;

        //--------------------------------------------------------------------------
        // Core ops
        //--------------------------------------------------------------------------

        /// @brief Insert or overwrite. An existing key keeps its stored key object.
        /// @return The previous value, or std::nullopt if the key was new.
        std::optional<Value> Insert(Key key, Value value)
        {
            const size_type idx = FindIndex(key);
            if (idx != kNotFound)
                return std::optional<Value>(std::exchange(m_entries[idx].value, std::move(value)));
            m_entries.EmplaceBack(SlotType {std::move(key), std::move(value)});
            return std::nullopt;
        }

        /// @brief Append without checking for an existing equal key.
        /// @warning A duplicate key leaves two pairs for that key; lookups then see only the first.
        Value& InsertNoCheck(Key key, Value value)
        {
            return m_entries.EmplaceBack(SlotType {std::move(key), std::move(value)}).value;
        }

        template<class Q>
            requires LookupKeyFor<Q, Key, Hash, KeyEqual>
        std::optional<Value> Remove(const Q& key)
        {
            const size_type idx = FindIndex(key);
            if (idx == kNotFound)
                return std::nullopt;
            return std::optional<Value>(m_entries.SwapRemove(idx).value);
        }

        template<class Q>
            requires LookupKeyFor<Q, Key, Hash, KeyEqual>
        std::optional<std::pair<Key, Value>> RemoveEntry(const Q& key)
        {
            const size_type idx = FindIndex(key);
            if (idx == kNotFound)
                return std::nullopt;
            SlotType slot = m_entries.SwapRemove(idx);
            return std::optional<std::pair<Key, Value>>(std::in_place, std::move(slot.key), std::move(slot.value));
        }

        /// @brief Keep only pairs for which `keep(key, value)` returns true. Order is preserved.
        template<class Predicate>
        void Retain(Predicate&& keep)
        {
            m_entries.RetainIf([&keep](SlotType& slot) { return static_cast<bool>(keep(std::as_const(slot.key), slot.value)); });
        }

        template<class Q>
            requires LookupKeyFor<Q, Key, Hash, KeyEqual>
        [[nodiscard]] Value* GetPtr(const Q& key) noexcept
        {
            const size_type idx = FindIndex(key);
            return idx == kNotFound ? nullptr : &m_entries[idx].value;
        }

        template<class Q>
            requires LookupKeyFor<Q, Key, Hash, KeyEqual>
        [[nodiscard]] const Value* GetPtr(const Q& key) const noexcept
        {
            const size_type idx = FindIndex(key);
            return idx == kNotFound ? nullptr : &m_entries[idx].value;
        }

        template<class Q>
            requires LookupKeyFor<Q, Key, Hash, KeyEqual>
        [[nodiscard]] std::optional<KeyValueConstRef<Key, Value>> GetKeyValue(const Q& key) const noexcept
        {
            const size_type idx = FindIndex(key);
            if (idx == kNotFound)
                return std::nullopt;
            return KeyValueConstRef<Key, Value> {m_entries[idx].key, m_entries[idx].value};
        }

        template<class Q>
            requires LookupKeyFor<Q, Key, Hash, KeyEqual>
        [[nodiscard]] bool Contains(const Q& key) const noexcept
        {
            return FindIndex(key) != kNotFound;
        }

        /// @brief Scan once; occupied over the matching slot, otherwise vacant holding `key`.
        EntryType Entry(Key key)
        {
            const size_type idx = FindIndex(key);
            if (idx != kNotFound)
                return EntryType(OccupiedEntry(*this, idx, std::optional<Key>(std::move(key))));
            return EntryType(VacantEntry(*this, std::move(key)));
        }

        /// @brief Raw lookup by predicate. The hash is part of the shared raw-entry signature and is unused here.
        template<class Predicate>
        RawEntryType RawEntryMut(std::size_t, Predicate&& isMatch)
        {
            const size_type idx = FindIndexBy(isMatch);
            if (idx != kNotFound)
                return RawEntryType(OccupiedEntry(*this, idx, std::nullopt));
            return RawEntryType(RawVacantEntry(*this));
        }

        template<class Predicate>
        [[nodiscard]] std::optional<KeyValueConstRef<Key, Value>> RawGet(std::size_t, Predicate&& isMatch) const
        {
            const size_type idx = FindIndexBy(isMatch);
            if (idx == kNotFound)
                return std::nullopt;
            return KeyValueConstRef<Key, Value> {m_entries[idx].key, m_entries[idx].value};
        }

        template<class Q>
            requires LookupKeyFor<Q, Key, Hash, KeyEqual>
        [[nodiscard]] size_type FindIndex(const Q& key) const noexcept
        {
            return FindIndexBy([this, &key](const Key& stored) { return static_cast<bool>(m_equal(stored, key)); });
        }

        template<class Predicate>
        [[nodiscard]] size_type FindIndexBy(Predicate&& isMatch) const
        {
            const size_type count = m_entries.Size();
            for (size_type i = 0; i < count; ++i)
            {
                if (isMatch(m_entries[i].key))
                    return i;
            }
            return kNotFound;
        }

        void Clear() noexcept { m_entries.Clear(); }

        //--------------------------------------------------------------------------
        // Capacity
        //--------------------------------------------------------------------------

        [[nodiscard]] TANDEM_ALWAYS_INLINE UIntSize Size() const noexcept { return m_entries.Size(); }
        [[nodiscard]] TANDEM_ALWAYS_INLINE bool IsEmpty() const noexcept { return m_entries.IsEmpty(); }
        [[nodiscard]] TANDEM_ALWAYS_INLINE UIntSize Capacity() const noexcept { return m_entries.Capacity(); }

        /// @brief Make room for at least `additional` more pairs.
        void Reserve(UIntSize additional)
        {
            if (auto result = TryReserve(additional); !result)
                ThrowContainerError(result.error(), "LinearMap::Reserve: capacity overflow");
        }

        ContainerExpected<void> TryReserve(UIntSize additional)
        {
            if (additional > std::numeric_limits<UIntSize>::max() - Size())
                return std::unexpected(MakeContainerError(ContainerErrorCode::CapacityOverflow));
            return m_entries.TryReserve(Size() + additional);
        }

        void ShrinkToFit() { m_entries.ShrinkToFit(); }

        [[nodiscard]] const Hash& HashFunction() const noexcept { return m_hash; }
        [[nodiscard]] const KeyEqual& KeyEq() const noexcept { return m_equal; }
        [[nodiscard]] const AllocatorType& GetAllocator() const noexcept { return m_entries.GetAllocator(); }

        //--------------------------------------------------------------------------
        // Iteration
        //--------------------------------------------------------------------------

        class Iterator
        {
        public:
            using difference_type   = std::ptrdiff_t;
            using value_type        = KeyValueRef<Key, Value>;
            using reference         = KeyValueRef<Key, Value>;
            using pointer           = void;
            using iterator_category = std::forward_iterator_tag;

            Iterator() = default;
            explicit Iterator(SlotType* slot) noexcept : m_slot(slot) {}

            reference operator*() const { return {m_slot->key, m_slot->value}; }

            Iterator& operator++()
            {
                ++m_slot;
                return *this;
            }

            bool operator==(const Iterator& other) const { return m_slot == other.m_slot; }
            bool operator!=(const Iterator& other) const { return !(*this == other); }

        private:
            SlotType* m_slot {nullptr};
        };

        class ConstIterator
        {
        public:
            using difference_type   = std::ptrdiff_t;
            using value_type        = KeyValueConstRef<Key, Value>;
            using reference         = KeyValueConstRef<Key, Value>;
            using pointer           = void;
            using iterator_category = std::forward_iterator_tag;

            ConstIterator() = default;
            explicit ConstIterator(const SlotType* slot) noexcept : m_slot(slot) {}

            reference operator*() const { return {m_slot->key, m_slot->value}; }

            ConstIterator& operator++()
            {
                ++m_slot;
                return *this;
            }

            bool operator==(const ConstIterator& other) const { return m_slot == other.m_slot; }
            bool operator!=(const ConstIterator& other) const { return !(*this == other); }

        private:
            const SlotType* m_slot {nullptr};
        };

        Iterator      begin() noexcept { return Iterator(m_entries.begin()); }
        Iterator      end() noexcept { return Iterator(m_entries.end()); }
        ConstIterator begin() const noexcept { return ConstIterator(m_entries.begin()); }
        ConstIterator end() const noexcept { return ConstIterator(m_entries.end()); }

        /// @brief Moves pairs out back to front, removing each one as it is taken.
        /// Whatever was not taken is destroyed with the drain.
        class Drain
        {
        public:
            explicit Drain(LinearMap& map) noexcept : m_map(&map) {}

            Drain(Drain&& other) noexcept : m_map(std::exchange(other.m_map, nullptr)) {}

            Drain(const Drain&)            = delete;
            Drain& operator=(const Drain&) = delete;
            Drain& operator=(Drain&&)      = delete;

            ~Drain()
            {
                if (m_map)
                    m_map->m_entries.Clear();
            }

            std::optional<std::pair<Key, Value>> Next()
            {
                if (!m_map || m_map->m_entries.IsEmpty())
                    return std::nullopt;
                SlotType slot = m_map->m_entries.PopBack();
                return std::optional<std::pair<Key, Value>>(std::in_place, std::move(slot.key), std::move(slot.value));
            }

            [[nodiscard]] UIntSize Remaining() const noexcept
            {
                return m_map ? m_map->m_entries.Size() : 0;
            }

        private:
            LinearMap* m_map;
        };

        [[nodiscard]] Drain DrainAll() noexcept { return Drain(*this); }

    private:
        StorageType                    m_entries {};
        [[no_unique_address]] Hash     m_hash {};
        [[no_unique_address]] KeyEqual m_equal {};
    };

}// namespace Tandem::Containers
