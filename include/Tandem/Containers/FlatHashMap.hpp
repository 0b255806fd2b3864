/// @file FlatHashMap.hpp
/// @brief Header-only flat open-addressing hash map with allocator support and explicit lifetime management.
///
/// Semantics / constraints:
/// - Bucket count is always a power-of-two (>= 16); probing uses `hash & (bucketCount - 1)`.
/// - `Capacity()` counts elements: the table grows before its load would exceed 3/4.
/// - Deletion uses backward-shift (no tombstones). This can relocate entries, so:
///   - Any `Remove()` may invalidate iterators, pointers, and references (not just to the erased element).
/// - `Key` and `Value` must be nothrow-move-constructible.
/// - Any growth, `Retain()` or `ShrinkToFit()` invalidates all iterators, pointers, and references.
/// - Raw entry lookups trust the caller's hash; a hash inconsistent with `Hash` only produces misses.

#pragma once

#include <Tandem/Containers/ContainerError.hpp>
#include <Tandem/Containers/KeyValue.hpp>
#include <Tandem/Defines.hpp>
#include <Tandem/Memory/AllocatorConcept.hpp>
#include <Tandem/Memory/SystemAllocator.hpp>
#include <Tandem/Primitives.hpp>
#include <Tandem/Utilities/Either.hpp>

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstring>
#include <functional>
#include <iterator>
#include <limits>
#include <new>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace Tandem::Containers
{
    namespace detail
    {
        constexpr std::size_t NextPow2(std::size_t value) noexcept
        {
            if (value <= 1)
                return 1;
            return std::bit_ceil(value);
        }

        constexpr std::size_t Distance(std::size_t from, std::size_t to, std::size_t mask) noexcept
        {
            return (to - from) & mask;
        }
    }// namespace detail

    /// @brief Flat open-addressing hash map.
    ///
    /// Design notes:
    /// - Linear probing over buckets that remember the full hash of their key.
    /// - Backward-shift deletion (no tombstones).
    /// - Explicit lifetime storage: buckets do not default-construct keys/values.
    template<typename Key,
             typename Value,
             typename Hash                            = std::hash<Key>,
             typename KeyEqual                        = std::equal_to<Key>,
             Memory::AllocatorConcept AllocatorType = Memory::SystemAllocator>
    class FlatHashMap
    {
    public:
        using key_type       = Key;
        using mapped_type    = Value;
        using hash_type      = Hash;
        using key_equal      = KeyEqual;
        using allocator_type = AllocatorType;
        using size_type      = std::size_t;

        static constexpr size_type kInitialBucketCount = 16;
        static constexpr size_type kNotFound           = static_cast<size_type>(-1);

        static_assert(std::is_nothrow_move_constructible_v<Key> && std::is_nothrow_move_constructible_v<Value>,
                      "FlatHashMap requires nothrow move constructible Key and Value (backward-shift deletion).");

        FlatHashMap() { Initialize_(kInitialBucketCount); }

        /// @param initialCapacity Number of elements the table must hold without growing.
        explicit FlatHashMap(size_type initialCapacity,
                             const Hash& hash               = Hash {},
                             const KeyEqual& equal          = KeyEqual {},
                             const AllocatorType& allocator = AllocatorType {})
            : m_hash(hash), m_equal(equal), m_allocator(allocator)
        {
            const auto buckets = BucketsFor_(initialCapacity);
            if (!buckets)
                ThrowContainerError(buckets.error(), "FlatHashMap: capacity overflow");
            Initialize_(*buckets);
        }

        FlatHashMap(const FlatHashMap& other)
            : m_hash(other.m_hash), m_equal(other.m_equal), m_allocator(other.m_allocator)
        {
            Initialize_((std::max)(other.m_bucketCount, kInitialBucketCount));
            CopyElementsFrom_(other);
        }

        FlatHashMap& operator=(const FlatHashMap& other)
        {
            if (this == &other)
                return *this;

            ClearAndRelease_();

            if constexpr (Memory::AllocatorPropagationTraits<AllocatorType>::PropagateOnCopyAssignment)
            {
                m_allocator = other.m_allocator;
            }

            m_hash  = other.m_hash;
            m_equal = other.m_equal;

            Initialize_((std::max)(other.m_bucketCount, kInitialBucketCount));
            CopyElementsFrom_(other);
            return *this;
        }

        FlatHashMap(FlatHashMap&& other) noexcept
            : m_hash(std::move(other.m_hash)),
              m_equal(std::move(other.m_equal)),
              m_allocator(std::move(other.m_allocator))
        {
            AdoptBuckets_(other);
        }

        FlatHashMap& operator=(FlatHashMap&& other) noexcept
        {
            if (this == &other)
                return *this;

            if constexpr (Memory::AllocatorPropagationTraits<AllocatorType>::PropagateOnMoveAssignment)
            {
                ClearAndRelease_();
                m_hash      = std::move(other.m_hash);
                m_equal     = std::move(other.m_equal);
                m_allocator = std::move(other.m_allocator);
                AdoptBuckets_(other);
            }
            else if constexpr (Memory::AllocatorPropagationTraits<AllocatorType>::IsAlwaysEqual)
            {
                ClearAndRelease_();
                m_hash  = std::move(other.m_hash);
                m_equal = std::move(other.m_equal);
                AdoptBuckets_(other);
            }
            else
            {
                Clear();
                Reserve(other.m_size);
                for (size_type i = 0; i < other.m_bucketCount; ++i)
                {
                    if (!other.m_buckets[i].occupied)
                        continue;
                    InsertNew_(other.m_buckets[i].hash, std::move(other.KeyRef_(i)), std::move(other.ValueRef_(i)));
                }
                other.Clear();
            }

            return *this;
        }

        ~FlatHashMap() { ClearAndRelease_(); }

        //--------------------------------------------------------------------------
        // Entry handles
        //--------------------------------------------------------------------------

        /// @brief Handle to an occupied bucket.
        ///
        /// The handle addresses the bucket by index; it is valid until the table is next modified
        /// through any other path.
        class OccupiedEntry
        {
        public:
            OccupiedEntry(FlatHashMap& map, size_type index, std::optional<Key> key) noexcept
                : m_map(&map), m_index(index), m_key(std::move(key))
            {
            }

            [[nodiscard]] const Key& GetKey() const noexcept { return m_map->KeyRef_(m_index); }
            [[nodiscard]] Key& KeyMut() noexcept { return m_map->KeyRef_(m_index); }
            [[nodiscard]] const Value& Get() const noexcept { return m_map->ValueRef_(m_index); }
            [[nodiscard]] Value& GetMut() noexcept { return m_map->ValueRef_(m_index); }
            [[nodiscard]] Value& IntoMut() noexcept { return m_map->ValueRef_(m_index); }

            [[nodiscard]] KeyValueMutRef<Key, Value> KeyValueMut() noexcept
            {
                return {m_map->KeyRef_(m_index), m_map->ValueRef_(m_index)};
            }

            Value Insert(Value value) { return std::exchange(m_map->ValueRef_(m_index), std::move(value)); }

            /// @warning The replacement must hash and compare equal to the stored key.
            Key InsertKey(Key key) { return std::exchange(m_map->KeyRef_(m_index), std::move(key)); }

            Value Remove() { return m_map->RemoveAt_(m_index).second; }

            std::pair<Key, Value> RemoveEntry() { return m_map->RemoveAt_(m_index); }

            std::pair<Key, Value> ReplaceEntry(Value value)
            {
                Key oldKey     = std::exchange(m_map->KeyRef_(m_index), TakeKey_());
                Value oldValue = std::exchange(m_map->ValueRef_(m_index), std::move(value));
                return {std::move(oldKey), std::move(oldValue)};
            }

            Key ReplaceKey() { return std::exchange(m_map->KeyRef_(m_index), TakeKey_()); }

        private:
            Key TakeKey_()
            {
                if (!m_key)
                    TANDEM_CONTRACT_FAIL("FlatHashMap::OccupiedEntry has no key to replace with");
                Key key = std::move(*m_key);
                m_key.reset();
                return key;
            }

            FlatHashMap*       m_map;
            size_type          m_index;
            std::optional<Key> m_key;
        };

        /// @brief Handle for an absent key, carrying the hash computed during lookup.
        class VacantEntry
        {
        public:
            VacantEntry(FlatHashMap& map, std::size_t hash, Key key) noexcept
                : m_map(&map), m_hash(hash), m_key(std::move(key))
            {
            }

            [[nodiscard]] const Key& GetKey() const noexcept { return m_key; }
            [[nodiscard]] Key IntoKey() noexcept { return std::move(m_key); }

            Value& Insert(Value value)
            {
                const size_type idx = m_map->InsertNew_(m_hash, std::move(m_key), std::move(value));
                return m_map->ValueRef_(idx);
            }

        private:
            FlatHashMap* m_map;
            std::size_t  m_hash;
            Key          m_key;
        };

        /// @brief Raw vacant handle: only the table is captured; the key arrives at insertion.
        class RawVacantEntry
        {
        public:
            explicit RawVacantEntry(FlatHashMap& map) noexcept : m_map(&map) {}

            KeyValueMutRef<Key, Value> Insert(Key key, Value value)
            {
                const std::size_t h = m_map->HashOf(key);
                return InsertHashedNoCheck(h, std::move(key), std::move(value));
            }

            /// @warning `hash` must equal the table's hash of `key`, and `key` must be absent.
            KeyValueMutRef<Key, Value> InsertHashedNoCheck(std::size_t hash, Key key, Value value)
            {
                const size_type idx = m_map->InsertNew_(hash, std::move(key), std::move(value));
                return {m_map->KeyRef_(idx), m_map->ValueRef_(idx)};
            }

        private:
            FlatHashMap* m_map;
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
            const std::size_t h   = HashOf(key);
            const size_type   idx = FindIndex_(key, h);
            if (idx != kNotFound)
                return std::optional<Value>(std::exchange(ValueRef_(idx), std::move(value)));
            InsertNew_(h, std::move(key), std::move(value));
            return std::nullopt;
        }

        /// @brief Insert a key known to be absent, skipping the equality lookup.
        Value& InsertNoCheck(Key key, Value value)
        {
            const std::size_t h   = HashOf(key);
            const size_type   idx = InsertNew_(h, std::move(key), std::move(value));
            return ValueRef_(idx);
        }

        /// @brief Insert a key known to be absent under a hash the caller already computed.
        /// @details The hasher is not invoked. Nothrow while `Size() < Capacity()`.
        Value& InsertHashedNoCheck(std::size_t hash, Key key, Value value)
        {
            const size_type idx = InsertNew_(hash, std::move(key), std::move(value));
            return ValueRef_(idx);
        }

        template<class Q>
            requires LookupKeyFor<Q, Key, Hash, KeyEqual>
        std::optional<Value> Remove(const Q& key)
        {
            const size_type idx = FindIndex_(key, HashOf(key));
            if (idx == kNotFound)
                return std::nullopt;
            return std::optional<Value>(RemoveAt_(idx).second);
        }

        template<class Q>
            requires LookupKeyFor<Q, Key, Hash, KeyEqual>
        std::optional<std::pair<Key, Value>> RemoveEntry(const Q& key)
        {
            const size_type idx = FindIndex_(key, HashOf(key));
            if (idx == kNotFound)
                return std::nullopt;
            return std::optional<std::pair<Key, Value>>(RemoveAt_(idx));
        }

        /// @brief Keep only pairs for which `keep(key, value)` returns true.
        ///
        /// Survivors are relocated into a fresh bucket array of the same size. `keep` is called
        /// exactly once per element; if it throws, every element not yet rejected is kept.
        template<class Predicate>
        void Retain(Predicate&& keep)
        {
            if (!m_buckets)
                return;

            Bucket*         old   = m_buckets;
            const size_type count = m_bucketCount;
            m_buckets             = AllocateBuckets_(count);
            m_size                = 0;

            size_type i = 0;
            try
            {
                for (; i < count; ++i)
                {
                    if (!old[i].occupied)
                        continue;
                    if (keep(std::as_const(KeyRef_(old, i)), ValueRef_(old, i)))
                        RelocateFrom_(old, i);
                    DestroyAt_(old, i);
                }
            }
            catch (...)
            {
                for (; i < count; ++i)
                {
                    if (!old[i].occupied)
                        continue;
                    RelocateFrom_(old, i);
                    DestroyAt_(old, i);
                }
                DeallocateBuckets_(old, count);
                throw;
            }
            DeallocateBuckets_(old, count);
        }

        template<class Q>
            requires LookupKeyFor<Q, Key, Hash, KeyEqual>
        [[nodiscard]] Value* GetPtr(const Q& key) noexcept
        {
            const size_type idx = FindIndex_(key, HashOf(key));
            return idx == kNotFound ? nullptr : &ValueRef_(idx);
        }

        template<class Q>
            requires LookupKeyFor<Q, Key, Hash, KeyEqual>
        [[nodiscard]] const Value* GetPtr(const Q& key) const noexcept
        {
            const size_type idx = FindIndex_(key, HashOf(key));
            return idx == kNotFound ? nullptr : &ValueRef_(idx);
        }

        template<class Q>
            requires LookupKeyFor<Q, Key, Hash, KeyEqual>
        [[nodiscard]] std::optional<KeyValueConstRef<Key, Value>> GetKeyValue(const Q& key) const noexcept
        {
            const size_type idx = FindIndex_(key, HashOf(key));
            if (idx == kNotFound)
                return std::nullopt;
            return KeyValueConstRef<Key, Value> {KeyRef_(idx), ValueRef_(idx)};
        }

        template<class Q>
            requires LookupKeyFor<Q, Key, Hash, KeyEqual>
        [[nodiscard]] bool Contains(const Q& key) const noexcept
        {
            return FindIndex_(key, HashOf(key)) != kNotFound;
        }

        /// @brief Hash once, search once; the vacant handle keeps the hash for insertion.
        EntryType Entry(Key key)
        {
            const std::size_t h   = HashOf(key);
            const size_type   idx = FindIndex_(key, h);
            if (idx != kNotFound)
                return EntryType(OccupiedEntry(*this, idx, std::optional<Key>(std::move(key))));
            return EntryType(VacantEntry(*this, h, std::move(key)));
        }

        /// @brief Search the chain of `hash`, matching stored keys with `isMatch`.
        template<class Predicate>
        RawEntryType RawEntryMut(std::size_t hash, Predicate&& isMatch)
        {
            const size_type idx = FindIndexBy_(hash, isMatch);
            if (idx != kNotFound)
                return RawEntryType(OccupiedEntry(*this, idx, std::nullopt));
            return RawEntryType(RawVacantEntry(*this));
        }

        template<class Predicate>
        [[nodiscard]] std::optional<KeyValueConstRef<Key, Value>> RawGet(std::size_t hash, Predicate&& isMatch) const
        {
            const size_type idx = FindIndexBy_(hash, isMatch);
            if (idx == kNotFound)
                return std::nullopt;
            return KeyValueConstRef<Key, Value> {KeyRef_(idx), ValueRef_(idx)};
        }

        template<class Q>
        [[nodiscard]] std::size_t HashOf(const Q& key) const
        {
            return static_cast<std::size_t>(m_hash(key));
        }

        void Clear() noexcept
        {
            if (!m_buckets)
                return;
            for (size_type i = 0; i < m_bucketCount; ++i)
            {
                if (m_buckets[i].occupied)
                    DestroyAt_(i);
            }
            m_size = 0;
        }

        //--------------------------------------------------------------------------
        // Capacity
        //--------------------------------------------------------------------------

        [[nodiscard]] TANDEM_ALWAYS_INLINE UIntSize Size() const noexcept { return static_cast<UIntSize>(m_size); }
        [[nodiscard]] TANDEM_ALWAYS_INLINE bool IsEmpty() const noexcept { return m_size == 0; }

        /// @brief Number of elements the table holds before it grows.
        [[nodiscard]] TANDEM_ALWAYS_INLINE UIntSize Capacity() const noexcept
        {
            return static_cast<UIntSize>(m_bucketCount / 4 * 3);
        }

        [[nodiscard]] TANDEM_ALWAYS_INLINE UIntSize BucketCount() const noexcept
        {
            return static_cast<UIntSize>(m_bucketCount);
        }

        /// @brief Make room for at least `additional` more elements.
        /// @throws std::length_error on size overflow, std::bad_alloc on allocation failure.
        void Reserve(UIntSize additional)
        {
            if (auto result = TryReserve(additional); !result)
                ThrowContainerError(result.error(), "FlatHashMap::Reserve: capacity overflow");
        }

        ContainerExpected<void> TryReserve(UIntSize additional)
        {
            if (additional > std::numeric_limits<size_type>::max() - m_size)
                return std::unexpected(MakeContainerError(ContainerErrorCode::CapacityOverflow));
            const auto buckets = BucketsFor_(m_size + additional);
            if (!buckets)
                return std::unexpected(buckets.error());
            if (*buckets <= m_bucketCount)
                return {};
            return TryRehash_(*buckets);
        }

        /// @brief Shrink the bucket array to the smallest size that holds the current elements.
        void ShrinkToFit()
        {
            const auto buckets = BucketsFor_(m_size);
            if (!buckets || *buckets >= m_bucketCount)
                return;
            if (auto result = TryRehash_(*buckets); !result)
                ThrowContainerError(result.error(), "FlatHashMap::ShrinkToFit");
        }

        [[nodiscard]] const Hash& HashFunction() const noexcept { return m_hash; }
        [[nodiscard]] const KeyEqual& KeyEq() const noexcept { return m_equal; }
        [[nodiscard]] const AllocatorType& GetAllocator() const noexcept { return m_allocator; }

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
            Iterator(FlatHashMap* map, size_type idx) : m_map(map), m_index(idx) { Advance_(); }

            reference operator*() const { return {m_map->KeyRef_(m_index), m_map->ValueRef_(m_index)}; }

            Iterator& operator++()
            {
                ++m_index;
                Advance_();
                return *this;
            }

            bool operator==(const Iterator& other) const { return m_map == other.m_map && m_index == other.m_index; }
            bool operator!=(const Iterator& other) const { return !(*this == other); }

        private:
            void Advance_()
            {
                if (!m_map)
                    return;
                while (m_index < m_map->m_bucketCount && !m_map->m_buckets[m_index].occupied)
                    ++m_index;
            }

            FlatHashMap* m_map {nullptr};
            size_type    m_index {0};
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
            ConstIterator(const FlatHashMap* map, size_type idx) : m_map(map), m_index(idx) { Advance_(); }

            reference operator*() const { return {m_map->KeyRef_(m_index), m_map->ValueRef_(m_index)}; }

            ConstIterator& operator++()
            {
                ++m_index;
                Advance_();
                return *this;
            }

            bool operator==(const ConstIterator& other) const { return m_map == other.m_map && m_index == other.m_index; }
            bool operator!=(const ConstIterator& other) const { return !(*this == other); }

        private:
            void Advance_()
            {
                if (!m_map)
                    return;
                while (m_index < m_map->m_bucketCount && !m_map->m_buckets[m_index].occupied)
                    ++m_index;
            }

            const FlatHashMap* m_map {nullptr};
            size_type          m_index {0};
        };

        Iterator      begin() { return Iterator(this, 0); }
        Iterator      end() { return Iterator(this, m_bucketCount); }
        ConstIterator begin() const { return ConstIterator(this, 0); }
        ConstIterator end() const { return ConstIterator(this, m_bucketCount); }

        /// @brief Moves pairs out from the last bucket down; whatever was not taken is destroyed with the drain.
        ///
        /// Each pair is removed with a backward shift as it is taken, so lookups stay valid while the
        /// drain is alive. Buckets above the cursor are always empty; only the wrap-around shift out of
        /// the last bucket can refill the bucket under the cursor, which is why it is re-checked.
        class Drain
        {
        public:
            explicit Drain(FlatHashMap& map) noexcept : m_map(&map), m_cursor(map.m_bucketCount) {}

            Drain(Drain&& other) noexcept
                : m_map(std::exchange(other.m_map, nullptr)), m_cursor(other.m_cursor)
            {
            }

            Drain(const Drain&)            = delete;
            Drain& operator=(const Drain&) = delete;
            Drain& operator=(Drain&&)      = delete;

            ~Drain()
            {
                if (m_map)
                    m_map->Clear();
            }

            std::optional<std::pair<Key, Value>> Next()
            {
                if (!m_map)
                    return std::nullopt;
                while (m_cursor > 0 && !m_map->m_buckets[m_cursor - 1].occupied)
                    --m_cursor;
                if (m_cursor == 0)
                    return std::nullopt;
                return std::optional<std::pair<Key, Value>>(m_map->RemoveAt_(m_cursor - 1));
            }

            [[nodiscard]] UIntSize Remaining() const noexcept { return m_map ? m_map->Size() : 0; }

        private:
            FlatHashMap* m_map;
            size_type    m_cursor;///< One past the highest bucket that may still be occupied.
        };

        [[nodiscard]] Drain DrainAll() noexcept { return Drain(*this); }

    private:
        struct Bucket
        {
            std::size_t hash;
            bool        occupied;

            alignas(Key) std::byte keyStorage[sizeof(Key)];
            alignas(Value) std::byte valueStorage[sizeof(Value)];
        };

        static_assert(std::is_trivially_default_constructible_v<Bucket>);

        [[nodiscard]] static Key& KeyRef_(Bucket* buckets, size_type idx) noexcept
        {
            return *std::launder(reinterpret_cast<Key*>(buckets[idx].keyStorage));
        }

        [[nodiscard]] static const Key& KeyRef_(const Bucket* buckets, size_type idx) noexcept
        {
            return *std::launder(reinterpret_cast<const Key*>(buckets[idx].keyStorage));
        }

        [[nodiscard]] static Value& ValueRef_(Bucket* buckets, size_type idx) noexcept
        {
            return *std::launder(reinterpret_cast<Value*>(buckets[idx].valueStorage));
        }

        [[nodiscard]] static const Value& ValueRef_(const Bucket* buckets, size_type idx) noexcept
        {
            return *std::launder(reinterpret_cast<const Value*>(buckets[idx].valueStorage));
        }

        [[nodiscard]] Key& KeyRef_(size_type idx) noexcept { return KeyRef_(m_buckets, idx); }
        [[nodiscard]] const Key& KeyRef_(size_type idx) const noexcept { return KeyRef_(m_buckets, idx); }
        [[nodiscard]] Value& ValueRef_(size_type idx) noexcept { return ValueRef_(m_buckets, idx); }
        [[nodiscard]] const Value& ValueRef_(size_type idx) const noexcept { return ValueRef_(m_buckets, idx); }

        static void DestroyAt_(Bucket* buckets, size_type idx) noexcept
        {
            if constexpr (!std::is_trivially_destructible_v<Value>)
            {
                ValueRef_(buckets, idx).~Value();
            }
            if constexpr (!std::is_trivially_destructible_v<Key>)
            {
                KeyRef_(buckets, idx).~Key();
            }
            buckets[idx].hash     = 0;
            buckets[idx].occupied = false;
        }

        void DestroyAt_(size_type idx) noexcept { DestroyAt_(m_buckets, idx); }

        void ClearAndRelease_() noexcept
        {
            if (!m_buckets)
                return;
            Clear();
            DeallocateBuckets_(m_buckets, m_bucketCount);
            m_buckets     = nullptr;
            m_bucketCount = 0;
            m_mask        = 0;
        }

        void AdoptBuckets_(FlatHashMap& other) noexcept
        {
            m_buckets     = std::exchange(other.m_buckets, nullptr);
            m_bucketCount = std::exchange(other.m_bucketCount, 0);
            m_mask        = std::exchange(other.m_mask, 0);
            m_size        = std::exchange(other.m_size, 0);
        }

        [[nodiscard]] size_type MaxBuckets_() const noexcept
        {
            return Memory::AllocatorTraits<AllocatorType>::MaxSize(m_allocator) / sizeof(Bucket);
        }

        /// Smallest power-of-two bucket count (>= 16) whose 3/4 load holds `count` elements.
        [[nodiscard]] ContainerExpected<size_type> BucketsFor_(size_type count) const noexcept
        {
            if (count > (std::numeric_limits<size_type>::max() >> 3))
                return std::unexpected(MakeContainerError(ContainerErrorCode::CapacityOverflow));
            const size_type buckets = detail::NextPow2((std::max)(kInitialBucketCount, (count * 4 + 2) / 3));
            if (buckets > MaxBuckets_())
                return std::unexpected(MakeContainerError(ContainerErrorCode::CapacityOverflow));
            return buckets;
        }

        [[nodiscard]] Bucket* TryAllocateBuckets_(size_type count) noexcept
        {
            const auto bytes = count * sizeof(Bucket);
            void*      mem   = m_allocator.Allocate(bytes, alignof(Bucket));
            if (mem)
                std::memset(mem, 0, bytes);
            return static_cast<Bucket*>(mem);
        }

        [[nodiscard]] Bucket* AllocateBuckets_(size_type count)
        {
            Bucket* buckets = TryAllocateBuckets_(count);
            if (!buckets)
                throw std::bad_alloc();
            return buckets;
        }

        void DeallocateBuckets_(Bucket* buckets, size_type count) noexcept
        {
            m_allocator.Deallocate(buckets, count * sizeof(Bucket), alignof(Bucket));
        }

        void Initialize_(size_type bucketCount)
        {
            m_buckets     = AllocateBuckets_(bucketCount);
            m_bucketCount = bucketCount;
            m_mask        = bucketCount - 1;
            m_size        = 0;
        }

        /// Moves every element into a fresh array of `bucketCount` buckets. The table is untouched on failure.
        ContainerExpected<void> TryRehash_(size_type bucketCount) noexcept
        {
            Bucket* fresh = TryAllocateBuckets_(bucketCount);
            if (!fresh)
                return std::unexpected(MakeContainerError(ContainerErrorCode::AllocationFailed));

            Bucket*         old      = m_buckets;
            const size_type oldCount = m_bucketCount;

            m_buckets     = fresh;
            m_bucketCount = bucketCount;
            m_mask        = bucketCount - 1;
            m_size        = 0;

            if (old)
            {
                for (size_type i = 0; i < oldCount; ++i)
                {
                    if (!old[i].occupied)
                        continue;
                    RelocateFrom_(old, i);
                    DestroyAt_(old, i);
                }
                DeallocateBuckets_(old, oldCount);
            }
            return {};
        }

        void GrowIfNeeded_()
        {
            if ((m_size + 1) * 4 <= m_bucketCount * 3)
                return;
            const size_type target = (std::max)(kInitialBucketCount, m_bucketCount * 2);
            if (target > MaxBuckets_())
                throw std::length_error("FlatHashMap: capacity overflow");
            if (auto result = TryRehash_(target); !result)
                ThrowContainerError(result.error(), "FlatHashMap: capacity overflow");
        }

        template<class Q>
        [[nodiscard]] size_type FindIndex_(const Q& key, std::size_t h) const noexcept
        {
            return FindIndexBy_(h, [this, &key](const Key& stored) { return static_cast<bool>(m_equal(stored, key)); });
        }

        template<class Predicate>
        [[nodiscard]] size_type FindIndexBy_(std::size_t h, Predicate&& isMatch) const
        {
            if (!m_buckets || m_bucketCount == 0)
                return kNotFound;
            size_type index = h & m_mask;
            for (size_type visited = 0; visited < m_bucketCount; ++visited)
            {
                const Bucket& b = m_buckets[index];
                if (!b.occupied)
                    return kNotFound;
                if (b.hash == h && isMatch(KeyRef_(index)))
                    return index;
                index = (index + 1) & m_mask;
            }
            return kNotFound;
        }

        /// First free bucket on the collision chain of `h`. The load bound guarantees one exists.
        [[nodiscard]] size_type FindEmptySlot_(std::size_t h) const noexcept
        {
            size_type index = h & m_mask;
            while (m_buckets[index].occupied)
                index = (index + 1) & m_mask;
            return index;
        }

        /// Places a key known to be absent. Grows first if needed; returns the bucket index.
        size_type InsertNew_(std::size_t h, Key&& key, Value&& value)
        {
            GrowIfNeeded_();

            const size_type idx = FindEmptySlot_(h);
            Bucket&         b   = m_buckets[idx];
            ::new (static_cast<void*>(b.keyStorage)) Key(std::move(key));
            ::new (static_cast<void*>(b.valueStorage)) Value(std::move(value));
            b.hash     = h;
            b.occupied = true;
            ++m_size;
            return idx;
        }

        /// Moves the element of `old[idx]` into this table. Does not destroy the source.
        void RelocateFrom_(Bucket* old, size_type idx) noexcept
        {
            const size_type dst = FindEmptySlot_(old[idx].hash);
            Bucket&         b   = m_buckets[dst];
            ::new (static_cast<void*>(b.keyStorage)) Key(std::move(KeyRef_(old, idx)));
            ::new (static_cast<void*>(b.valueStorage)) Value(std::move(ValueRef_(old, idx)));
            b.hash     = old[idx].hash;
            b.occupied = true;
            ++m_size;
        }

        void CopyElementsFrom_(const FlatHashMap& other)
        {
            try
            {
                for (size_type i = 0; i < other.m_bucketCount; ++i)
                {
                    if (!other.m_buckets[i].occupied)
                        continue;
                    const size_type idx = FindEmptySlot_(other.m_buckets[i].hash);
                    Bucket&         b   = m_buckets[idx];
                    ::new (static_cast<void*>(b.keyStorage)) Key(other.KeyRef_(i));
                    try
                    {
                        ::new (static_cast<void*>(b.valueStorage)) Value(other.ValueRef_(i));
                    }
                    catch (...)
                    {
                        KeyRef_(idx).~Key();
                        throw;
                    }
                    b.hash     = other.m_buckets[i].hash;
                    b.occupied = true;
                    ++m_size;
                }
            }
            catch (...)
            {
                ClearAndRelease_();
                throw;
            }
        }

        /// Moves the pair out of bucket `idx` and closes the hole by backward shifting.
        std::pair<Key, Value> RemoveAt_(size_type idx) noexcept
        {
            std::pair<Key, Value> removed(std::move(KeyRef_(idx)), std::move(ValueRef_(idx)));
            DestroyAt_(idx);
            --m_size;
            BackwardShiftFrom_(idx);
            return removed;
        }

        void BackwardShiftFrom_(size_type holeIndex) noexcept
        {
            size_type hole = holeIndex;
            size_type next = (hole + 1) & m_mask;

            while (m_buckets[next].occupied)
            {
                const size_type home           = m_buckets[next].hash & m_mask;
                const auto      distHomeToNext = detail::Distance(home, next, m_mask);
                const auto      distHomeToHole = detail::Distance(home, hole, m_mask);

                if (distHomeToHole < distHomeToNext)
                {
                    MoveBucket_(hole, next);
                    hole = next;
                }
                next = (next + 1) & m_mask;
            }
        }

        void MoveBucket_(size_type dst, size_type src) noexcept
        {
            Bucket& d = m_buckets[dst];
            Bucket& s = m_buckets[src];

            d.hash     = s.hash;
            d.occupied = true;

            ::new (static_cast<void*>(d.keyStorage)) Key(std::move(KeyRef_(src)));
            ::new (static_cast<void*>(d.valueStorage)) Value(std::move(ValueRef_(src)));

            DestroyAt_(src);
        }

        [[no_unique_address]] Hash          m_hash {};
        [[no_unique_address]] KeyEqual      m_equal {};
        [[no_unique_address]] AllocatorType m_allocator {};

        Bucket*   m_buckets {nullptr};
        size_type m_bucketCount {0};
        size_type m_mask {0};
        size_type m_size {0};
    };

}// namespace Tandem::Containers
