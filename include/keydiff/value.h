// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Document Value type for JSON-like dynamic data.
///
/// This file defines the Value type that can represent:
/// - Primitive types: int32, int64, double, bool, string
/// - Container types: map, vector (using immer's persistent containers)
/// - Null (std::monostate)
///
/// The Value type is templated on a memory policy, allowing users to
/// choose between single-threaded and thread-safe reference counting
/// for the underlying immer containers.
///
/// Equality (operator==) is deep structural equality and is the default
/// equality contract of the diff engine (see map_diff.h).

#pragma once

#include <keydiff/keydiff_config.h>
#include <keydiff/api.h>
#include <keydiff/log.h>
#include <keydiff/value_fwd.h>

#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/memory_policy.hpp>
#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <cstdint>
#include <initializer_list>
#include <iostream>
#include <string>
#include <utility>
#include <variant>

namespace keydiff {

template <typename MemoryPolicy>
using BasicValueBox = immer::box<BasicValue<MemoryPolicy>, MemoryPolicy>;

template <typename MemoryPolicy>
using BasicValueMap = immer::map<std::string,
                                  BasicValueBox<MemoryPolicy>,
                                  std::hash<std::string>,
                                  std::equal_to<std::string>,
                                  MemoryPolicy>;

template <typename MemoryPolicy>
using BasicValueVector = immer::vector<BasicValueBox<MemoryPolicy>,
                                        MemoryPolicy>;

template <typename MemoryPolicy = unsafe_memory_policy>
struct BasicValue
{
    using memory_policy = MemoryPolicy;
    using value_box     = BasicValueBox<MemoryPolicy>;
    using value_map     = BasicValueMap<MemoryPolicy>;
    using value_vector  = BasicValueVector<MemoryPolicy>;

    std::variant<int32_t,
                 int64_t,
                 double,
                 bool,
                 std::string,
                 value_map,
                 value_vector,
                 std::monostate>
        data;

    BasicValue() noexcept : data(std::monostate{}) {}
    BasicValue(int32_t v) noexcept : data(v) {}
    BasicValue(int64_t v) noexcept : data(v) {}
    BasicValue(double v) noexcept : data(v) {}
    BasicValue(bool v) noexcept : data(v) {}
    BasicValue(const std::string& v) : data(v) {}
    BasicValue(std::string&& v) noexcept : data(std::move(v)) {}
    BasicValue(const char* v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(value_map v) : data(std::move(v)) {}
    BasicValue(value_vector v) : data(std::move(v)) {}

    // Factory functions for container types
    static BasicValue map(std::initializer_list<std::pair<std::string, BasicValue>> init) {
        auto t = value_map{}.transient();
        for (const auto& [key, val] : init) {
            t.set(key, value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    static BasicValue vector(std::initializer_list<BasicValue> init) {
        auto t = value_vector{}.transient();
        for (const auto& val : init) {
            t.push_back(value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data); }
    [[nodiscard]] bool is_map() const noexcept { return is<value_map>(); }
    [[nodiscard]] bool is_vector() const noexcept { return is<value_vector>(); }
    [[nodiscard]] bool is_string() const noexcept { return is<std::string>(); }

    [[nodiscard]] BasicValue at(const std::string& key) const {
        if (auto* m = get_if<value_map>()) {
            if (auto* found = m->find(key)) return found->get();
        }
        detail::log_key_error("Value::at", key, "not found or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] BasicValue at(std::size_t index) const {
        if (auto* v = get_if<value_vector>()) {
            if (index < v->size()) return (*v)[index].get();
        }
        detail::log_index_error("Value::at", index, "out of range or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] BasicValue at_or(const std::string& key, BasicValue default_val) const {
        if (auto* m = get_if<value_map>()) {
            if (auto* found = m->find(key)) return found->get();
        }
        return default_val;
    }

    template<typename T>
    [[nodiscard]] T get_or(T default_val = T{}) const {
        if (auto* ptr = get_if<T>()) return *ptr;
        return default_val;
    }

    [[nodiscard]] int32_t as_int(int32_t default_val = 0) const {
        if (auto* p = get_if<int32_t>()) return *p;
        return default_val;
    }

    [[nodiscard]] int64_t as_int64(int64_t default_val = 0) const {
        if (auto* p = get_if<int64_t>()) return *p;
        if (auto* p = get_if<int32_t>()) return *p;
        return default_val;
    }

    [[nodiscard]] double as_double(double default_val = 0.0) const {
        if (auto* p = get_if<double>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    [[nodiscard]] double as_number(double default_val = 0.0) const {
        if (auto* p = get_if<double>()) return *p;
        if (auto* p = get_if<int64_t>()) return static_cast<double>(*p);
        if (auto* p = get_if<int32_t>()) return static_cast<double>(*p);
        return default_val;
    }

    [[nodiscard]] value_map as_map(value_map default_val = {}) const {
        if (auto* p = get_if<value_map>()) return *p;
        return default_val;
    }

    [[nodiscard]] bool contains(const std::string& key) const { return count(key) > 0; }

    [[nodiscard]] std::size_t count(const std::string& key) const {
        if (auto* m = get_if<value_map>()) return m->count(key);
        return 0;
    }

    [[nodiscard]] BasicValue set(const std::string& key, BasicValue val) const {
        if (auto* m = get_if<value_map>()) return m->set(key, value_box{std::move(val)});
        detail::log_key_error("Value::set", key, "cannot set on non-map type");
        return *this;
    }

    [[nodiscard]] std::size_t size() const {
        if (auto* m = get_if<value_map>()) return m->size();
        if (auto* v = get_if<value_vector>()) return v->size();
        return 0;
    }

    using size_type = std::size_t;
};

// ============================================================
// Memory Policy Usage
//
// unsafe_memory_policy      : non-atomic refcount + no locks (Value)
// thread_safe_memory_policy : atomic refcount + spinlock (SyncValue)
//
// Both are declared in value_fwd.h.
// ============================================================

// Value = single-threaded, the default document type
using ValueBox    = BasicValueBox<unsafe_memory_policy>;
using ValueMap    = BasicValueMap<unsafe_memory_policy>;
using ValueVector = BasicValueVector<unsafe_memory_policy>;

// SyncValue (declared in value_fwd.h) = document trees shared across threads
using SyncValueBox    = BasicValueBox<thread_safe_memory_policy>;
using SyncValueMap    = BasicValueMap<thread_safe_memory_policy>;
using SyncValueVector = BasicValueVector<thread_safe_memory_policy>;

// ============================================================
// Equality
//
// Deep structural equality: same alternative and equal payload.
// immer::box compares by pointer first, so shared subtrees are O(1).
// Maps compare independent of insertion order.
// ============================================================

template <typename MemoryPolicy>
bool operator==(const BasicValue<MemoryPolicy>& a, const BasicValue<MemoryPolicy>& b)
{
    return a.data == b.data;
}

// ============================================================
// Utility functions
// ============================================================

// Convert Value to short human-readable string ("text", 42, {map:3}, ...)
[[nodiscard]] KEYDIFF_API std::string value_to_string(const Value& val);

// Print Value with indentation (map keys in ascending order)
KEYDIFF_API void print_value(const Value& val, std::ostream& os = std::cout,
                             const std::string& prefix = "", std::size_t depth = 0);

// ============================================================
// Extern Template Declarations
//
// The instantiations live in value.cpp.
// ============================================================

extern template struct BasicValue<unsafe_memory_policy>;
extern template struct BasicValue<thread_safe_memory_policy>;

} // namespace keydiff
