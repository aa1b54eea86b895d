// diff_report.cpp - DiffRecord printing

#include <keydiff/diff_report.h>

namespace keydiff {

namespace {

// Keys are quoted so separators inside a key stay unambiguous
std::string quote_key(const std::string& key)
{
    std::string out;
    out.reserve(key.size() + 2);
    out += '"';
    for (char c : key) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

} // anonymous namespace

std::string to_string(const DiffRecord& record)
{
    return std::visit([](const auto& r) -> std::string {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, DiffRecord::Unchanged>) {
            return "UNCHANGED " + quote_key(r.key) + ": " + value_to_string(r.value);
        } else if constexpr (std::is_same_v<T, DiffRecord::EntryAdded>) {
            return "ADDED     " + quote_key(r.key) + ": " + value_to_string(r.value);
        } else if constexpr (std::is_same_v<T, DiffRecord::EntryRemoved>) {
            return "REMOVED   " + quote_key(r.key) + ": " + value_to_string(r.value);
        } else if constexpr (std::is_same_v<T, DiffRecord::ValueModified>) {
            return "MODIFIED  " + quote_key(r.key) + ": " + value_to_string(r.old_value) +
                   " -> " + value_to_string(r.new_value);
        } else {
            return "RENAMED   " + quote_key(r.old_key) + " -> " + quote_key(r.new_key) + ": " + value_to_string(r.value);
        }
    }, record.data());
}

void print_diffs(const std::vector<DiffRecord>& records, std::ostream& os, bool changes_only)
{
    bool printed = false;
    for (const auto& r : records) {
        if (changes_only && !r.is_change()) {
            continue;
        }
        os << "  " << to_string(r) << "\n";
        printed = true;
    }
    if (!printed) {
        os << "  (no changes)\n";
    }
}

} // namespace keydiff
