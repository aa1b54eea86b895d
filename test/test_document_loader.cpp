// test_document_loader.cpp - Tests for loading JSON documents
// File / string sources, ReadError vs ParseError, object-root requirement

#include "test_support.h"

#include <catch2/catch_all.hpp>
#include <keydiff/document_loader.h>
#include <keydiff/map_diff.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <string>

using namespace keydiff;
using keydiff::test::changes_of;

namespace fs = std::filesystem;

namespace {

// Scratch directory removed at scope exit
class ScratchDir {
public:
    ScratchDir() {
        std::random_device rd;
        path_ = fs::temp_directory_path() / ("keydiff_test_" + std::to_string(rd()));
        fs::create_directories(path_);
    }

    ~ScratchDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const fs::path& path() const { return path_; }

    fs::path write(const std::string& name, const std::string& content) const {
        const auto file = path_ / name;
        std::ofstream out(file, std::ios::binary);
        out << content;
        return file;
    }

private:
    fs::path path_;
};

} // anonymous namespace

// ============================================================
// Successful loads
// ============================================================

TEST_CASE("load_json_file", "[loader][file]") {
    ScratchDir dir;

    SECTION("object document") {
        auto file = dir.write("doc.json", R"({"key_1": "value_1", "n": 2})");
        auto doc = load_json_file(file);
        REQUIRE(doc == Value::map({{"key_1", Value{"value_1"}}, {"n", Value{2}}}));
    }

    SECTION("non-object roots are accepted") {
        auto file = dir.write("list.json", "[1, 2]");
        REQUIRE(load_json_file(file) == Value::vector({Value{1}, Value{2}}));
    }
}

TEST_CASE("load_json_mapping", "[loader][file]") {
    ScratchDir dir;

    SECTION("object document") {
        auto file = dir.write("doc.json", "{\n  \"a\": {\"b\": [true]}\n}\n");
        auto m = load_json_mapping(file);
        REQUIRE(m.size() == 1);
        REQUIRE(m.find("a")->get() == Value::map({{"b", Value::vector({Value{true}})}}));
    }

    SECTION("empty object") {
        auto file = dir.write("empty.json", "{}");
        REQUIRE(load_json_mapping(file).size() == 0);
    }
}

// ============================================================
// Failures
// ============================================================

TEST_CASE("load_json_file read errors", "[loader][error]") {
    ScratchDir dir;

    SECTION("missing file") {
        const auto missing = dir.path() / "does_not_exist.json";
        REQUIRE_THROWS_AS(load_json_file(missing), ReadError);

        try {
            (void)load_json_file(missing);
            FAIL("expected ReadError");
        } catch (const ReadError& e) {
            REQUIRE(e.path().string() == missing.string());
            REQUIRE(e.source() == missing.string());
            REQUIRE(std::string(e.what()).find("does_not_exist.json") != std::string::npos);
        }
    }

    SECTION("directory") {
        REQUIRE_THROWS_AS(load_json_file(dir.path()), ReadError);
        REQUIRE_THROWS_AS(load_json_mapping(dir.path()), ReadError);
    }

    SECTION("invalid UTF-8") {
        auto lone_byte = dir.write("latin1.json", "{\"caf\xE9\": 1}");
        REQUIRE_THROWS_AS(load_json_file(lone_byte), ReadError);

        auto truncated = dir.write("truncated.json", "{\"k\": \"\xE2\x82\"}");
        REQUIRE_THROWS_AS(load_json_mapping(truncated), ReadError);

        auto surrogate = dir.write("surrogate.json", "{\"k\": \"\xED\xA0\x80\"}");
        REQUIRE_THROWS_AS(load_json_file(surrogate), ReadError);

        auto overlong = dir.write("overlong.json", "{\"k\": \"\xC0\xAF\"}");
        REQUIRE_THROWS_AS(load_json_file(overlong), ReadError);
    }

    SECTION("valid multi-byte UTF-8") {
        auto file = dir.write("utf8.json", "{\"caf\xC3\xA9\": \"\xF0\x9F\x98\x80\"}");
        auto m = load_json_mapping(file);
        REQUIRE(m.find("caf\xC3\xA9")->get() == Value{"\xF0\x9F\x98\x80"});
    }

    SECTION("read errors are load errors") {
        const auto missing = dir.path() / "nope.json";
        REQUIRE_THROWS_AS(load_json_mapping(missing), LoadError);
        REQUIRE_THROWS_AS(load_json_mapping(missing), ReadError);
    }
}

TEST_CASE("load_json_file parse errors", "[loader][error]") {
    ScratchDir dir;

    SECTION("malformed content") {
        auto file = dir.write("bad.json", R"({"a": 1,)");
        REQUIRE_THROWS_AS(load_json_file(file), ParseError);
    }

    SECTION("empty file") {
        auto file = dir.write("empty.json", "");
        try {
            (void)load_json_file(file);
            FAIL("expected ParseError");
        } catch (const ParseError& e) {
            REQUIRE(e.reason() == "Empty JSON input");
            REQUIRE(e.source() == file.string());
        }
    }

    SECTION("trailing content") {
        auto file = dir.write("trailing.json", "{} {}");
        REQUIRE_THROWS_AS(load_json_file(file), ParseError);
    }

    SECTION("nesting too deep") {
        auto file = dir.write("deep.json", "{\"k\": " + std::string(100'000, '[') + "}");
        try {
            (void)load_json_mapping(file);
            FAIL("expected ParseError");
        } catch (const ParseError& e) {
            REQUIRE(e.reason().find("Nesting too deep") != std::string::npos);
        }
    }

    SECTION("number underflow is valid content") {
        auto file = dir.write("tiny.json", R"({"eps": 4.9e-324})");
        REQUIRE(load_json_mapping(file).find("eps")->get().as_double() > 0.0);
    }

    SECTION("non-object root for a mapping") {
        auto file = dir.write("list.json", "[1, 2]");
        REQUIRE_THROWS_AS(load_json_mapping(file), ParseError);

        auto scalar = dir.write("scalar.json", "\"text\"");
        REQUIRE_THROWS_AS(load_json_mapping(scalar), ParseError);
    }
}

// ============================================================
// In-memory sources
// ============================================================

TEST_CASE("parse_json_mapping", "[loader][string]") {
    SECTION("object") {
        auto m = parse_json_mapping(R"({"k": null})");
        REQUIRE(m.size() == 1);
        REQUIRE(m.find("k")->get().is_null());
    }

    SECTION("errors carry the source name") {
        try {
            (void)parse_json_mapping("[]", "inline");
            FAIL("expected ParseError");
        } catch (const ParseError& e) {
            REQUIRE(e.source() == "inline");
            REQUIRE(std::string(e.what()).find("'inline'") != std::string::npos);
            REQUIRE(e.reason().find("not a JSON object") != std::string::npos);
        }
    }

    SECTION("default source name") {
        try {
            (void)parse_json_mapping("nope");
            FAIL("expected ParseError");
        } catch (const ParseError& e) {
            REQUIRE(e.source() == "<string>");
        }
    }
}

// ============================================================
// End to end
// ============================================================

TEST_CASE("loaded documents diff with renames", "[loader][map_diff]") {
    ScratchDir dir;
    auto before = dir.write("before.json",
                            R"({"key_1": "value_1", "key_2": "value_2", "key_3": "value_3"})");
    auto after = dir.write("after.json",
                           R"({"key_1": "value_1", "key_2": "value_2.0", "key_3.0": "value_3"})");

    auto records = map_diff(load_json_mapping(before), load_json_mapping(after));

    REQUIRE(changes_of(records) == std::vector<DiffRecord>{
        DiffRecord::ValueModified{"key_2", Value{"value_2"}, Value{"value_2.0"}},
        DiffRecord::KeyModified{"key_3", "key_3.0", Value{"value_3"}}
    });
}
