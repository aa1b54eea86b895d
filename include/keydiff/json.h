// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file json.h
/// @brief JSON text <-> Value conversion.
///
/// Usage:
/// @code
///   #include <keydiff/json.h>
///
///   std::string error;
///   Value doc = from_json(R"({"name": "Alice", "age": 30})", &error);
///   if (!error.empty()) { ... }
///
///   std::string text = to_json(doc);        // pretty-printed
///   std::string line = to_json(doc, true);  // compact
/// @endcode
///
/// Number mapping:
///   - integers that fit in int32_t  -> int32_t
///   - other integers within int64_t -> int64_t
///   - everything else               -> double
///
/// Object keys are written in ascending order so that output is stable.

#pragma once

#include <keydiff/api.h>
#include <keydiff/value.h>

#include <string>

namespace keydiff {

/// Convert Value to JSON string
/// @param val The Value to convert
/// @param compact If true, produce minimal output; if false, pretty-print with 2-space indentation
/// @return JSON string representation
KEYDIFF_API std::string to_json(const Value& val, bool compact = false);

/// Parse JSON string to Value
/// @param json_str The JSON string to parse
/// @param error_out If provided, receives error message on failure (left untouched on success)
/// @return Parsed Value, or null Value on parse error
///
/// Whitespace may surround the document; any other trailing content is an error.
/// Duplicate object keys: the last occurrence wins.
KEYDIFF_API Value from_json(const std::string& json_str, std::string* error_out = nullptr);

} // namespace keydiff
