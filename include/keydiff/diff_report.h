// diff_report.h - Human-readable rendering of DiffRecord lists

#pragma once

#include <keydiff/api.h>
#include <keydiff/diff_record.h>
#include <keydiff/value.h>

#include <iostream>
#include <string>
#include <vector>

namespace keydiff {

/// One line per record. Keys are quoted, with '"' and backslash escaped:
///   UNCHANGED "key": value
///   ADDED     "key": value
///   REMOVED   "key": value
///   MODIFIED  "key": old -> new
///   RENAMED   "old_key" -> "new_key": value
[[nodiscard]] KEYDIFF_API std::string to_string(const DiffRecord& record);

/// Print records (changes only by default), or "(no changes)"
KEYDIFF_API void print_diffs(const std::vector<DiffRecord>& records,
                             std::ostream& os = std::cout,
                             bool changes_only = true);

} // namespace keydiff
