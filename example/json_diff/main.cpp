// main.cpp
// json_diff - compare two JSON object documents key by key
//
// Usage: json_diff <left.json> <right.json>
//
// Prints one line per changed key. Keys that disappear on the left and
// reappear under a new name on the right with the same value are reported
// as a rename instead of a removal plus an addition.
//
// Exit status: 0 no changes, 1 documents differ, 2 usage or load error

#include <keydiff/diff_report.h>
#include <keydiff/document_loader.h>
#include <keydiff/map_diff.h>

#include <iostream>

using namespace keydiff;

int main(int argc, char** argv)
{
    if (argc != 3) {
        std::cerr << "usage: " << (argc > 0 ? argv[0] : "json_diff") << " <left.json> <right.json>\n";
        return 2;
    }

    ValueMap left;
    ValueMap right;
    try {
        left = load_json_mapping(argv[1]);
        right = load_json_mapping(argv[2]);
    } catch (const ReadError& e) {
        std::cerr << "read error: " << e.what() << "\n";
        return 2;
    } catch (const ParseError& e) {
        std::cerr << "parse error: " << e.what() << "\n";
        return 2;
    }

    const auto records = map_diff(left, right);

    std::cout << argv[1] << " -> " << argv[2] << "\n";
    print_diffs(records);

    return has_changes(records) ? 1 : 0;
}
