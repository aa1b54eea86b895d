// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file document_loader.h
/// @brief Load JSON documents from files or strings before diffing.
///
/// Loading fails in two distinct ways, both derived from LoadError:
/// - ReadError:  the file cannot be opened or read, or is not valid UTF-8
/// - ParseError: the content is not valid JSON, or (for the *_mapping
///               variants) the document root is not a JSON object
///
/// @code
///   try {
///       ValueMap left = load_json_mapping("before.json");
///       ValueMap right = load_json_mapping("after.json");
///       print_diffs(map_diff(left, right));
///   } catch (const ReadError& e) {
///       ...   // e.path()
///   } catch (const ParseError& e) {
///       ...   // e.source(), e.what()
///   }
/// @endcode

#pragma once

#include <keydiff/api.h>
#include <keydiff/value.h>

#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

namespace keydiff {

/// Base class of every loader failure
class KEYDIFF_API LoadError : public std::runtime_error {
public:
    LoadError(std::string source, const std::string& message)
        : std::runtime_error(message), source_(std::move(source)) {}

    /// File path, or "<string>" for in-memory input
    const std::string& source() const noexcept { return source_; }

private:
    std::string source_;
};

/// The source could not be opened or read
class KEYDIFF_API ReadError : public LoadError {
public:
    ReadError(const std::filesystem::path& path, const std::string& reason)
        : LoadError(path.string(), "Failed to read file '" + path.string() + "': " + reason),
          path_(path) {}

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

/// The content is not a valid JSON document (of the expected shape)
class KEYDIFF_API ParseError : public LoadError {
public:
    ParseError(std::string source, const std::string& reason)
        : LoadError(source, "Failed to parse JSON from '" + source + "': " + reason),
          reason_(reason) {}

    /// Parser message without the source prefix
    const std::string& reason() const noexcept { return reason_; }

private:
    std::string reason_;
};

/// Read a file and parse it as JSON
/// @throws ReadError, ParseError
[[nodiscard]] KEYDIFF_API Value load_json_file(const std::filesystem::path& path);

/// Read a file whose root must be a JSON object
/// @throws ReadError, ParseError (also when the root is not an object)
[[nodiscard]] KEYDIFF_API ValueMap load_json_mapping(const std::filesystem::path& path);

/// Parse in-memory JSON text whose root must be a JSON object
/// @param source Name used in error messages
/// @throws ParseError
[[nodiscard]] KEYDIFF_API ValueMap parse_json_mapping(const std::string& json_text,
                                                      const std::string& source = "<string>");

} // namespace keydiff
