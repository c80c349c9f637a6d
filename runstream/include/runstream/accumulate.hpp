#ifndef RUNSTREAM_ACCUMULATE_HPP
#define RUNSTREAM_ACCUMULATE_HPP

#include <runstream/channel.hpp>
#include <runstream/value.hpp>
#include <optional>
#include <utility>
#include <vector>

namespace runstream {

/**
 * Natural combine of two values: numbers add, strings and lists
 * concatenate, objects merge key-wise through combine().
 * Throws TypeError for any other pairing, null included.
 */
Value add_values(const Value& left, const Value& right);

/**
 * Total combine used to fold incremental chunks.
 * Null on either side yields the other side; when the natural combine
 * fails the right-hand value wins.
 */
Value combine(const Value& left, const Value& right);

// Key-wise merge: union of keys, shared keys combined recursively
ValueObject merge_objects(const ValueObject& left, const ValueObject& right);

// Left fold with combine(); null for an empty range
template<typename Iterator>
Value accumulate(Iterator begin, Iterator end) {
    Value total;
    for (auto it = begin; it != end; ++it) {
        total = combine(total, *it);
    }
    return total;
}

Value accumulate(const std::vector<Value>& values);

// Drains the source; null when it yields nothing
Value accumulate(Source<Value>& source);

/**
 * Generic fold for other addable types with an explicit combine functor.
 * The first item seeds the total; nullopt for an empty range.
 */
template<typename Iterator, typename Combine>
auto accumulate_with(Iterator begin, Iterator end, Combine&& op)
    -> std::optional<std::decay_t<decltype(*begin)>> {
    std::optional<std::decay_t<decltype(*begin)>> total;
    for (auto it = begin; it != end; ++it) {
        if (!total) {
            total = *it;
        } else {
            total = op(*total, *it);
        }
    }
    return total;
}

template<typename T, typename Combine>
std::optional<T> accumulate_with(Source<T>& source, Combine&& op) {
    std::optional<T> total;
    while (auto item = source.next()) {
        if (!total) {
            total = std::move(*item);
        } else {
            total = op(*total, *item);
        }
    }
    return total;
}

} // namespace runstream

#endif // RUNSTREAM_ACCUMULATE_HPP
