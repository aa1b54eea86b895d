// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file concepts.h
/// @brief C++20 Concepts for the type constraints of the diff engine.
///
/// The engine is generic over two things:
/// - the mapping type (anything iterable as (key, mapped) pairs with string keys)
/// - the value-equality contract (a binary predicate over the mapped values)
///
/// @note Requires C++20 or later.

#pragma once

#include <concepts>
#include <cstddef>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace keydiff {

// ============================================================
// Key Concepts
// ============================================================

/// Concept for types that can be used as mapping keys
template<typename T>
concept KeyType = std::is_same_v<std::decay_t<T>, std::string> ||
                  std::is_convertible_v<const T&, std::string_view>;

// ============================================================
// Value Concepts
// ============================================================

/// Concept for values the engine can store in a DiffRecord
template<typename T>
concept RecordValue = std::copy_constructible<T> && std::equality_comparable<T>;

/// Concept for equality contracts over values of type V
///
/// The predicate must be callable on two const references and yield
/// something convertible to bool. std::equal_to<V> is the default.
template<typename Fn, typename V>
concept ValueEquality = std::copy_constructible<Fn> &&
                        std::invocable<const Fn&, const V&, const V&> &&
                        std::convertible_to<std::invoke_result_t<const Fn&, const V&, const V&>, bool>;

// ============================================================
// Container Concepts
// ============================================================

/// Concept for containers with size() method
template<typename T>
concept SizedContainer = requires(const T& t) {
    { t.size() } -> std::convertible_to<std::size_t>;
};

/// Concept for map-like containers iterable as (key, mapped) pairs
///
/// Satisfied by std::map, std::unordered_map and immer::map.
template<typename T>
concept MappingLike = SizedContainer<T> && requires(const T& t) {
    { t.begin() };
    { t.end() };
    { (*t.begin()).first } -> KeyType;
    { (*t.begin()).second };
};

} // namespace keydiff
