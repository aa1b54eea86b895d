// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file map_diff.h
/// @brief Rename-aware diff between two key/value mappings.
///
/// The engine runs in two passes:
///
/// 1. classify()  - walks the union of both key sets in ascending key order.
///                  Keys on both sides become Unchanged or ValueModified.
///                  Keys on one side only go to a candidate pool.
/// 2. reconcile() - pairs each removed candidate with the first still-unmatched
///                  added candidate (ascending key order) whose value is equal,
///                  emitting KeyModified. Leftovers become EntryRemoved and
///                  EntryAdded.
///
/// map_diff() runs both. Output order is fixed:
///   - Unchanged / ValueModified, ascending by key
///   - KeyModified / EntryRemoved, ascending by old key
///   - EntryAdded, ascending by key
///
/// Values are compared opaquely through the equality contract (default
/// std::equal_to<V>, i.e. operator==). Nested containers are never diffed;
/// an unequal nested value is one ValueModified.
///
/// Works with any MappingLike container with string keys:
/// @code
///   std::map<std::string, std::string> a{{"k1", "v1"}, {"k3", "v3"}};
///   std::map<std::string, std::string> b{{"k1", "v1"}, {"k3.0", "v3"}};
///   auto records = map_diff(a, b);
///   // -> Unchanged{k1}, KeyModified{k3 -> k3.0}
///
///   ValueMap left = ..., right = ...;           // immer::box values are unwrapped
///   std::vector<DiffRecord> diffs = map_diff(left, right);
/// @endcode

#pragma once

#include <keydiff/keydiff_config.h>
#include <keydiff/api.h>
#include <keydiff/concepts.h>
#include <keydiff/diff_record.h>
#include <keydiff/log.h>
#include <keydiff/value.h>

#include <immer/box.hpp>

#include <algorithm>
#include <functional>
#include <iterator>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace keydiff {

namespace detail {

template <typename T>
const T& unbox(const T& v) noexcept { return v; }

template <typename T, typename MemoryPolicy>
const T& unbox(const immer::box<T, MemoryPolicy>& b) noexcept { return b.get(); }

} // namespace detail

/// Value type stored in the records of a diff over Mapping (immer::box unwrapped)
template <MappingLike Mapping>
using mapped_value_t =
    std::decay_t<decltype(detail::unbox((*std::declval<const Mapping&>().begin()).second))>;

// ============================================================
// Classification - output of the first pass
// ============================================================

/// A key present on one side only, waiting for the rename pass
template <typename V>
struct Candidate {
    std::string key;
    V value;

    bool operator==(const Candidate&) const = default;
};

template <typename V>
struct CandidatePools {
    std::vector<Candidate<V>> removed;  ///< keys only in the left mapping, ascending
    std::vector<Candidate<V>> added;    ///< keys only in the right mapping, ascending
};

template <typename V>
struct Classification {
    std::vector<BasicDiffRecord<V>> records;  ///< Unchanged / ValueModified, ascending by key
    CandidatePools<V> pools;
};

namespace detail {

/// Non-owning view of one mapping entry, valid while the mapping is alive
template <typename V>
struct EntryView {
    std::string_view key;
    const V* value;
};

template <typename V, typename Mapping>
std::vector<EntryView<V>> sorted_view(const Mapping& mapping)
{
    std::vector<EntryView<V>> entries;
    entries.reserve(mapping.size());
    for (const auto& kv : mapping) {
        entries.push_back(EntryView<V>{std::string_view{kv.first}, &unbox(kv.second)});
    }
    std::ranges::sort(entries, {}, &EntryView<V>::key);
    return entries;
}

template <typename V>
const V* find_sorted(const std::vector<EntryView<V>>& entries, std::string_view key) noexcept
{
    auto it = std::ranges::lower_bound(entries, key, {}, &EntryView<V>::key);
    if (it != entries.end() && it->key == key) {
        return it->value;
    }
    return nullptr;
}

template <typename V>
void sort_by_key(std::vector<Candidate<V>>& pool)
{
    std::ranges::stable_sort(pool, {}, &Candidate<V>::key);
}

} // namespace detail

// ============================================================
// Classifier
// ============================================================

/// Partition the union of both key sets into Unchanged / ValueModified records
/// and the removed / added candidate pools.
///
/// @pre keys are unique within each mapping
/// @throws std::logic_error if a key of the union is found in neither mapping
///         (internal invariant; unreachable for well-formed mappings)
template <MappingLike LeftMapping, MappingLike RightMapping,
          typename Equal = std::equal_to<mapped_value_t<LeftMapping>>>
[[nodiscard]] Classification<mapped_value_t<LeftMapping>>
classify(const LeftMapping& left, const RightMapping& right, Equal equal = {})
    requires std::same_as<mapped_value_t<LeftMapping>, mapped_value_t<RightMapping>> &&
             ValueEquality<Equal, mapped_value_t<LeftMapping>>
{
    using V = mapped_value_t<LeftMapping>;
    using Record = BasicDiffRecord<V>;

    const auto left_entries = detail::sorted_view<V>(left);
    const auto right_entries = detail::sorted_view<V>(right);

    // Key union in ascending order; equal keys are emitted once
    std::vector<detail::EntryView<V>> all_keys;
    all_keys.reserve(left_entries.size() + right_entries.size());
    std::ranges::set_union(left_entries, right_entries, std::back_inserter(all_keys), {},
                           &detail::EntryView<V>::key, &detail::EntryView<V>::key);

    Classification<V> result;
    result.records.reserve(all_keys.size());

    for (const auto& entry : all_keys) {
        const std::string_view key = entry.key;
        const V* left_value = detail::find_sorted(left_entries, key);
        const V* right_value = detail::find_sorted(right_entries, key);

        if (left_value && right_value) {
            if (std::invoke(equal, *left_value, *right_value)) {
                result.records.emplace_back(typename Record::Unchanged{std::string{key}, *left_value});
            } else {
                result.records.emplace_back(
                    typename Record::ValueModified{std::string{key}, *left_value, *right_value});
            }
        } else if (left_value) {
            result.pools.removed.push_back(Candidate<V>{std::string{key}, *left_value});
        } else if (right_value) {
            result.pools.added.push_back(Candidate<V>{std::string{key}, *right_value});
        } else {
            detail::log_invariant_violation("classify", "key '" + std::string{key} + "' is in neither mapping");
            throw std::logic_error("keydiff::classify: key '" + std::string{key} +
                                   "' enumerated from the key union is in neither mapping");
        }
    }

    return result;
}

// ============================================================
// Rename Reconciler
// ============================================================

/// Turn the candidate pools into KeyModified / EntryRemoved / EntryAdded records
/// and append them to the classified records.
///
/// Matching is one-to-one and first-match-wins: removed candidates are taken
/// in ascending key order, and each scans the unmatched added candidates in
/// ascending key order. A candidate pair with identical keys never matches.
template <typename V, typename Equal = std::equal_to<V>>
[[nodiscard]] std::vector<BasicDiffRecord<V>> reconcile(Classification<V> classification, Equal equal = {})
    requires ValueEquality<Equal, V>
{
    using Record = BasicDiffRecord<V>;

    auto records = std::move(classification.records);
    auto& removed = classification.pools.removed;
    auto& added = classification.pools.added;

    // classify() already yields sorted pools; hand-built pools are sorted here
    detail::sort_by_key(removed);
    detail::sort_by_key(added);

    records.reserve(records.size() + removed.size() + added.size());
    std::vector<bool> consumed(added.size(), false);

    for (auto& candidate : removed) {
        std::size_t match = added.size();
        for (std::size_t i = 0; i < added.size(); ++i) {
            if (consumed[i] || added[i].key == candidate.key) {
                continue;
            }
            if (std::invoke(equal, candidate.value, added[i].value)) {
                match = i;
                break;
            }
        }

        if (match < added.size()) {
            consumed[match] = true;
            records.emplace_back(typename Record::KeyModified{
                std::move(candidate.key), added[match].key, std::move(candidate.value)});
        } else {
            records.emplace_back(typename Record::EntryRemoved{std::move(candidate.key), std::move(candidate.value)});
        }
    }

    for (std::size_t i = 0; i < added.size(); ++i) {
        if (!consumed[i]) {
            records.emplace_back(typename Record::EntryAdded{std::move(added[i].key), std::move(added[i].value)});
        }
    }

    return records;
}

// ============================================================
// Entry point
// ============================================================

/// Diff two mappings: classify() followed by reconcile() with the same equality contract
template <MappingLike LeftMapping, MappingLike RightMapping,
          typename Equal = std::equal_to<mapped_value_t<LeftMapping>>>
[[nodiscard]] std::vector<BasicDiffRecord<mapped_value_t<LeftMapping>>>
map_diff(const LeftMapping& left, const RightMapping& right, Equal equal = {})
    requires std::same_as<mapped_value_t<LeftMapping>, mapped_value_t<RightMapping>> &&
             ValueEquality<Equal, mapped_value_t<LeftMapping>>
{
    return reconcile(classify(left, right, equal), equal);
}

/// Diff two document values whose roots are JSON objects
/// @throws std::invalid_argument if either root is not a map
[[nodiscard]] KEYDIFF_API std::vector<DiffRecord> diff_documents(const Value& left, const Value& right);

} // namespace keydiff
