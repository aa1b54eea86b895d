// test_value.cpp - Tests for the Value document type
// Construction, accessors, deep equality, printing

#include "test_support.h"

#include <catch2/catch_all.hpp>
#include <keydiff/value.h>

#include <sstream>
#include <string>
#include <type_traits>

using namespace keydiff;

// ============================================================
// Construction
// ============================================================

TEST_CASE("Value construction", "[value][construction]") {
    SECTION("default is null") {
        Value v;
        REQUIRE(v.is_null());
        REQUIRE(v.size() == 0);
    }

    SECTION("scalars") {
        REQUIRE(Value{42}.is<int32_t>());
        REQUIRE(Value{int64_t{5000000000}}.is<int64_t>());
        REQUIRE(Value{2.5}.is<double>());
        REQUIRE(Value{true}.is<bool>());
        REQUIRE(Value{"text"}.is_string());
        REQUIRE(Value{std::string{"text"}}.is_string());
    }

    SECTION("containers") {
        auto m = Value::map({{"a", Value{1}}, {"b", Value{"x"}}});
        REQUIRE(m.is_map());
        REQUIRE(m.size() == 2);

        auto v = Value::vector({Value{1}, Value{2}, Value{3}});
        REQUIRE(v.is_vector());
        REQUIRE(v.size() == 3);
    }
}

TEST_CASE("Value aliases", "[value][construction]") {
    STATIC_REQUIRE(std::is_same_v<Value, BasicValue<unsafe_memory_policy>>);
    STATIC_REQUIRE(std::is_same_v<SyncValue, BasicValue<thread_safe_memory_policy>>);
    STATIC_REQUIRE(std::is_same_v<SyncValueMap, SyncValue::value_map>);

    auto shared = SyncValue::map({{"k", SyncValue{1}}});
    REQUIRE(shared.at("k") == SyncValue{1});
}

// ============================================================
// Accessors
// ============================================================

TEST_CASE("Value accessors", "[value][access]") {
    auto doc = Value::map({
        {"name", Value{"Alice"}},
        {"age", Value{30}},
        {"big", Value{int64_t{5000000000}}},
        {"ratio", Value{0.5}},
        {"tags", Value::vector({Value{"a"}, Value{"b"}})}
    });

    SECTION("by key") {
        REQUIRE(doc.at("name").as_string() == "Alice");
        REQUIRE(doc.at("age").as_int() == 30);
        REQUIRE(doc.at("big").as_int64() == 5000000000);
        REQUIRE(doc.at("age").as_int64() == 30);
        REQUIRE(doc.at("ratio").as_double() == 0.5);
        REQUIRE(doc.at("age").as_number() == 30.0);
    }

    SECTION("missing key yields null") {
        REQUIRE(doc.at("missing").is_null());
        REQUIRE(doc.at_or("missing", Value{7}) == Value{7});
        REQUIRE_FALSE(doc.contains("missing"));
        REQUIRE(doc.contains("name"));
    }

    SECTION("by index") {
        auto tags = doc.at("tags");
        REQUIRE(tags.at(1).as_string() == "b");
        REQUIRE(tags.at(5).is_null());
    }

    SECTION("type mismatch falls back to defaults") {
        REQUIRE(doc.at("name").as_int(-1) == -1);
        REQUIRE(doc.at("age").as_string("none") == "none");
        REQUIRE(doc.at("age").get_or<bool>(true) == true);
        REQUIRE(Value{"x"}.at("k").is_null());
    }

    SECTION("set returns a new value") {
        auto updated = doc.set("age", Value{31});
        REQUIRE(updated.at("age").as_int() == 31);
        REQUIRE(doc.at("age").as_int() == 30);
    }
}

// ============================================================
// Equality
// ============================================================

TEST_CASE("Value equality", "[value][equality]") {
    SECTION("scalars") {
        REQUIRE(Value{1} == Value{1});
        REQUIRE(Value{"a"} == Value{"a"});
        REQUIRE(Value{} == Value{});
        REQUIRE_FALSE(Value{1} == Value{2});
    }

    SECTION("number kinds are distinct") {
        REQUIRE_FALSE(Value{1} == Value{1.0});
        REQUIRE_FALSE(Value{1} == Value{int64_t{1}});
        REQUIRE_FALSE(Value{0} == Value{false});
    }

    SECTION("maps compare by content, not insertion order") {
        auto a = Value::map({{"x", Value{1}}, {"y", Value{2}}});
        auto b = Value::map({{"y", Value{2}}, {"x", Value{1}}});
        REQUIRE(a == b);
        REQUIRE_FALSE(a == Value::map({{"x", Value{1}}}));
    }

    SECTION("nested containers compare deeply") {
        auto a = Value::map({{"list", Value::vector({Value{1}, Value::map({{"k", Value{"v"}}})})}});
        auto b = Value::map({{"list", Value::vector({Value{1}, Value::map({{"k", Value{"v"}}})})}});
        auto c = Value::map({{"list", Value::vector({Value{1}, Value::map({{"k", Value{"w"}}})})}});
        REQUIRE(a == b);
        REQUIRE_FALSE(a == c);
    }

    SECTION("vector order matters") {
        REQUIRE_FALSE(Value::vector({Value{1}, Value{2}}) == Value::vector({Value{2}, Value{1}}));
    }
}

// ============================================================
// Printing
// ============================================================

TEST_CASE("value_to_string", "[value][print]") {
    REQUIRE(value_to_string(Value{}) == "null");
    REQUIRE(value_to_string(Value{42}) == "42");
    REQUIRE(value_to_string(Value{int64_t{42}}) == "42L");
    REQUIRE(value_to_string(Value{2.5}) == "2.5");
    REQUIRE(value_to_string(Value{true}) == "true");
    REQUIRE(value_to_string(Value{"hi"}) == "\"hi\"");
    REQUIRE(value_to_string(Value::map({{"a", Value{1}}})) == "{map:1}");
    REQUIRE(value_to_string(Value::vector({Value{1}, Value{2}})) == "[vector:2]");
}

TEST_CASE("print_value lists map keys in order", "[value][print]") {
    auto doc = Value::map({
        {"b", Value{2}},
        {"a", Value::vector({Value{"x"}})}
    });

    std::ostringstream oss;
    print_value(doc, oss);

    REQUIRE(oss.str() ==
            "a:\n"
            "  [0]:\n"
            "    x\n"
            "b:\n"
            "  2\n");
}
