// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file diff_record.h
/// @brief One classified outcome of a mapping diff.
///
/// A BasicDiffRecord<V> holds exactly one of:
///
/// | Alternative   | Meaning                                               |
/// |---------------|-------------------------------------------------------|
/// | Unchanged     | key on both sides, equal values                       |
/// | EntryAdded    | key only on the right side                            |
/// | EntryRemoved  | key only on the left side                             |
/// | ValueModified | key on both sides, unequal values                     |
/// | KeyModified   | left-only key and right-only key with equal values    |
///
/// Records are immutable value objects. Two records are equal iff they hold
/// the same alternative with equal fields; std::vector of records therefore
/// compares element-for-element in order.

#pragma once

#include <keydiff/concepts.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace keydiff {

/// Discriminator of BasicDiffRecord (same order as the variant alternatives)
enum class DiffKind : uint8_t {
    Unchanged,
    EntryAdded,
    EntryRemoved,
    ValueModified,
    KeyModified
};

[[nodiscard]] constexpr std::string_view to_string(DiffKind kind) noexcept
{
    switch (kind) {
        case DiffKind::Unchanged:     return "Unchanged";
        case DiffKind::EntryAdded:    return "EntryAdded";
        case DiffKind::EntryRemoved:  return "EntryRemoved";
        case DiffKind::ValueModified: return "ValueModified";
        case DiffKind::KeyModified:   return "KeyModified";
    }
    return "Unknown";
}

template <typename V>
class BasicDiffRecord
{
    static_assert(RecordValue<V>, "DiffRecord values must be copyable and equality comparable");

public:
    using value_type = V;

    struct Unchanged {
        std::string key;
        V value;

        bool operator==(const Unchanged&) const = default;
    };

    struct EntryAdded {
        std::string key;
        V value;

        bool operator==(const EntryAdded&) const = default;
    };

    struct EntryRemoved {
        std::string key;
        V value;

        bool operator==(const EntryRemoved&) const = default;
    };

    struct ValueModified {
        std::string key;
        V old_value;
        V new_value;

        bool operator==(const ValueModified&) const = default;
    };

    /// old_key is absent from the right mapping, new_key absent from the left,
    /// and value is the (equal) value found under both.
    struct KeyModified {
        std::string old_key;
        std::string new_key;
        V value;

        bool operator==(const KeyModified&) const = default;
    };

    using variant_type = std::variant<Unchanged, EntryAdded, EntryRemoved, ValueModified, KeyModified>;

    BasicDiffRecord(Unchanged r) : data_(std::move(r)) {}
    BasicDiffRecord(EntryAdded r) : data_(std::move(r)) {}
    BasicDiffRecord(EntryRemoved r) : data_(std::move(r)) {}
    BasicDiffRecord(ValueModified r) : data_(std::move(r)) {}
    BasicDiffRecord(KeyModified r) : data_(std::move(r)) {}

    [[nodiscard]] DiffKind kind() const noexcept { return static_cast<DiffKind>(data_.index()); }

    /// True for every alternative except Unchanged
    [[nodiscard]] bool is_change() const noexcept { return !is<Unchanged>(); }

    template <typename T>
    [[nodiscard]] bool is() const noexcept { return std::holds_alternative<T>(data_); }

    template <typename T>
    [[nodiscard]] const T* get_if() const noexcept { return std::get_if<T>(&data_); }

    [[nodiscard]] const variant_type& data() const noexcept { return data_; }

    /// The key the record is ordered by: old_key for KeyModified, key otherwise
    [[nodiscard]] const std::string& key() const noexcept {
        return std::visit([](const auto& r) -> const std::string& {
            if constexpr (std::is_same_v<std::decay_t<decltype(r)>, KeyModified>) {
                return r.old_key;
            } else {
                return r.key;
            }
        }, data_);
    }

    friend bool operator==(const BasicDiffRecord&, const BasicDiffRecord&) = default;

private:
    variant_type data_;
};

/// True if any record in the list is a change
template <typename V>
[[nodiscard]] bool has_changes(const std::vector<BasicDiffRecord<V>>& records) noexcept
{
    for (const auto& r : records) {
        if (r.is_change()) return true;
    }
    return false;
}

} // namespace keydiff
