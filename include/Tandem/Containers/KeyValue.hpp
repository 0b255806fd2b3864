/// @file KeyValue.hpp
/// @brief Key/value views and lookup-key concept shared by the map containers.
#pragma once

#include <concepts>

namespace Tandem::Containers
{
    /// @brief Owning key/value slot used by contiguous containers.
    template<class Key, class Value>
    struct KeyValuePair
    {
        Key   key;
        Value value;
    };

    /// @brief Element view produced by mutable map iteration.
    template<class Key, class Value>
    struct KeyValueRef
    {
        const Key& key;
        Value&     value;
    };

    /// @brief Element view produced by const map iteration and read-only lookups.
    template<class Key, class Value>
    struct KeyValueConstRef
    {
        const Key&   key;
        const Value& value;
    };

    /// @brief Mutable view of both halves of a stored element, as handed out by raw entries.
    template<class Key, class Value>
    struct KeyValueMutRef
    {
        Key&   key;
        Value& value;
    };

    /// @brief A type usable to look up `Key` in a map with the given hash and equality functors.
    ///
    /// @details
    /// `Q` must hash and compare equivalently to the `Key` it stands for. This is a
    /// documentation contract; a `Q` that hashes differently produces failed lookups.
    template<class Q, class Key, class Hash, class KeyEqual>
    concept LookupKeyFor = requires(const Hash& hash, const KeyEqual& equal, const Q& query, const Key& key) {
        hash(query);
        { equal(key, query) } -> std::convertible_to<bool>;
    };
}// namespace Tandem::Containers
