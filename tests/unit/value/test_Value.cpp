#include <doctest/doctest.h>

#include <nodememo/value/Value.hpp>

#include <cmath>
#include <limits>
#include <stdexcept>

using namespace NM;

TEST_SUITE("value.model") {

TEST_CASE("scalars compare by value under same()") {
    CHECK(Value::same(Value{}, Value{}));
    CHECK(Value::same(Value{nullptr}, Value{nullptr}));
    CHECK_FALSE(Value::same(Value{}, Value{nullptr}));
    CHECK(Value::same(Value{16}, Value{16.0}));
    CHECK(Value::same(Value{"16px"}, Value{std::string{"16px"}}));
    CHECK_FALSE(Value::same(Value{"1"}, Value{1}));
    CHECK(Value::same(Value{makeDate(5)}, Value{makeDate(5)}));
    CHECK(Value::same(Value{RegExp{"a", "g"}}, Value{RegExp{"a", "g"}}));
}

TEST_CASE("reference kinds compare by identity") {
    auto first  = makeObject({{"a", 1}});
    auto second = makeObject({{"a", 1}});

    CHECK(Value::same(Value{first}, Value{first}));
    CHECK_FALSE(Value::same(Value{first}, Value{second}));
    CHECK(Value{first}.identity() == first.get());
    CHECK(Value{1}.identity() == nullptr);

    auto token = makeSymbol("token");
    CHECK_FALSE(Value::same(Value{token}, Value{makeSymbol("token")}));
    CHECK_FALSE(Value::same(Value{ObjectRef{}}, Value{first}));
}

TEST_CASE("objects keep insertion order and replace in place") {
    auto object = makeObject({{"b", 1}, {"a", 2}});
    object->set("c", 3);
    object->set("b", 4);

    REQUIRE(object->size() == 3);
    CHECK(object->entries[0].first == "b");
    CHECK(object->entries[0].second.asNumber() == 4);
    CHECK(object->entries[2].first == "c");

    CHECK(object->erase("a"));
    CHECK_FALSE(object->erase("a"));
    CHECK(object->get("a").isUndefined());
    CHECK_FALSE(object->contains("a"));
}

TEST_CASE("accessors reject the wrong kind") {
    Value number{3};
    CHECK(number.kind() == ValueKind::Number);
    CHECK_THROWS_AS((void)number.asString(), std::logic_error);
    CHECK_THROWS_AS((void)Value{"x"}.asObject(), std::logic_error);
    CHECK(Value{true}.asBool());
    CHECK(Value{makeArray({1, 2})}.isContainer());
    CHECK_FALSE(Value{makeMap()}.isContainer());
}

TEST_CASE("functions invoke their callable") {
    auto twice = makeFunction("twice", [](Value const& v) { return Value{v.asNumber() * 2}; });
    CHECK(twice->invoke(Value{4}).asNumber() == 8);

    auto unbound = makeFunction("unbound", {});
    CHECK_THROWS_AS(unbound->invoke(Value{}), std::bad_function_call);
}

TEST_CASE("formatNumber uses the shortest round-trip text") {
    CHECK(formatNumber(16) == "16");
    CHECK(formatNumber(0.1) == "0.1");
    CHECK(formatNumber(-2.5) == "-2.5");
    CHECK(formatNumber(-0.0) == "0");
    CHECK(formatNumber(std::nan("")) == "NaN");
    CHECK(formatNumber(std::numeric_limits<double>::infinity()) == "Infinity");
    CHECK(formatNumber(-std::numeric_limits<double>::infinity()) == "-Infinity");
}

TEST_CASE("kind names") {
    CHECK(kindName(ValueKind::Map) == "map");
    CHECK(kindName(Value{makeOpaque("Widget")}.kind()) == "opaque");
}

} // TEST_SUITE
