// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value_fwd.h
/// @brief Forward declarations for Value and DiffRecord types
///
/// Lets headers declare functions taking Value / DiffRecord without pulling
/// in immer or the full value.h.
///
/// Usage:
/// @code
///   // In header file:
///   #include <keydiff/value_fwd.h>
///   Value load_baseline();                    // Forward declaration is enough
///
///   // In implementation file:
///   #include <keydiff/value.h>
///   Value load_baseline() { return Value::map({}); }
/// @endcode

#pragma once

#include <keydiff/keydiff_config.h>

#include <immer/memory_policy.hpp>

namespace keydiff {

// ============================================================
// Memory Policy Forward Declarations (must match value.h)
// ============================================================

using unsafe_memory_policy = immer::memory_policy<immer::unsafe_free_list_heap_policy<immer::cpp_heap>,
                                                  immer::unsafe_refcount_policy, immer::no_lock_policy>;

using thread_safe_memory_policy = immer::memory_policy<immer::free_list_heap_policy<immer::cpp_heap>,
                                                       immer::refcount_policy, immer::spinlock_policy>;

// ============================================================
// Value Type Forward Declarations
// ============================================================

template <typename MemoryPolicy>
struct BasicValue;

using Value = BasicValue<unsafe_memory_policy>;

using SyncValue = BasicValue<thread_safe_memory_policy>;

// ============================================================
// DiffRecord Forward Declarations
// ============================================================

template <typename V>
class BasicDiffRecord;

using DiffRecord = BasicDiffRecord<Value>;

} // namespace keydiff
