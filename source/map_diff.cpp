// map_diff.cpp - Document-level entry point of the map diff engine

#include <keydiff/map_diff.h>

#include <stdexcept>

namespace keydiff {

std::vector<DiffRecord> diff_documents(const Value& left, const Value& right)
{
    const auto* left_map = left.get_if<ValueMap>();
    const auto* right_map = right.get_if<ValueMap>();

    if (!left_map || !right_map) {
        const std::string side = !left_map ? "left" : "right";
        const Value& offending = !left_map ? left : right;
        detail::log_access_error("diff_documents", side + " document root is " + value_to_string(offending));
        throw std::invalid_argument("keydiff::diff_documents: " + side + " document root is not an object");
    }

    // Fast path: both sides share the same map storage
    if (left_map->impl().root == right_map->impl().root &&
        left_map->impl().size == right_map->impl().size) {
        std::vector<DiffRecord> records;
        records.reserve(left_map->size());
        for (const auto& [key, box] : *left_map) {
            records.emplace_back(DiffRecord::Unchanged{key, box.get()});
        }
        std::ranges::sort(records, {}, [](const DiffRecord& r) -> const std::string& { return r.key(); });
        return records;
    }

    return map_diff(*left_map, *right_map);
}

} // namespace keydiff
