// value.cpp - Value type utilities

#include <keydiff/value.h>

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <vector>

namespace keydiff {

namespace {

// immer::map iterates in hash order; sort so output is stable across runs
std::vector<std::pair<std::string, const Value*>> sorted_entries(const ValueMap& m)
{
    std::vector<std::pair<std::string, const Value*>> entries;
    entries.reserve(m.size());
    for (const auto& [k, v] : m) {
        entries.emplace_back(k, &v.get());
    }
    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    return entries;
}

} // anonymous namespace

std::string value_to_string(const Value& val)
{
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + arg + "\"";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int32_t>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(arg) + "L";
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << std::setprecision(15) << arg;
            return oss.str();
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            return "{map:" + std::to_string(arg.size()) + "}";
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            return "[vector:" + std::to_string(arg.size()) + "]";
        } else {
            return "null";
        }
    }, val.data);
}

void print_value(const Value& val, std::ostream& os, const std::string& prefix, std::size_t depth)
{
    const std::string indent(depth * 2, ' ');

    std::visit(
        [&](auto&& arg) {
            using T = std::decay_t<decltype(arg)>;

            if constexpr (std::is_same_v<T, ValueMap>) {
                for (const auto& [k, v] : sorted_entries(arg)) {
                    os << indent << prefix << k << ":\n";
                    print_value(*v, os, "", depth + 1);
                }
            } else if constexpr (std::is_same_v<T, ValueVector>) {
                for (std::size_t i = 0; i < arg.size(); ++i) {
                    os << indent << prefix << "[" << i << "]:\n";
                    print_value(*arg[i], os, "", depth + 1);
                }
            } else if constexpr (std::is_same_v<T, std::string>) {
                os << indent << prefix << arg << "\n";
            } else {
                os << indent << prefix << value_to_string(val) << "\n";
            }
        },
        val.data);
}

// ============================================================
// Explicit Template Instantiations
//
// Declared with 'extern template' in value.h so that every translation
// unit does not instantiate the full BasicValue again.
// ============================================================

template struct BasicValue<unsafe_memory_policy>;
template struct BasicValue<thread_safe_memory_policy>;

} // namespace keydiff
