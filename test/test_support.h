// test_support.h - Shared helpers for keydiff tests

#pragma once

#include <catch2/catch_all.hpp>
#include <keydiff/diff_record.h>
#include <keydiff/diff_report.h>
#include <keydiff/value.h>

#include <algorithm>
#include <initializer_list>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

// Readable failure messages for Value and DiffRecord
namespace Catch {

template <>
struct StringMaker<keydiff::Value> {
    static std::string convert(const keydiff::Value& v) { return keydiff::value_to_string(v); }
};

template <>
struct StringMaker<keydiff::DiffRecord> {
    static std::string convert(const keydiff::DiffRecord& r) { return keydiff::to_string(r); }
};

} // namespace Catch

namespace keydiff::test {

inline ValueMap make_map(std::initializer_list<std::pair<std::string, Value>> init)
{
    return Value::map(init).as_map();
}

/// Records that are changes, in input order
template <typename V>
std::vector<BasicDiffRecord<V>> changes_of(const std::vector<BasicDiffRecord<V>>& records)
{
    std::vector<BasicDiffRecord<V>> out;
    std::ranges::copy_if(records, std::back_inserter(out),
                         [](const BasicDiffRecord<V>& r) { return r.is_change(); });
    return out;
}

} // namespace keydiff::test
