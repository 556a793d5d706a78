// test_serialization.cpp - Round trips of plain value graphs
// Module 5: encoder and decoder without registered types

#include <catch2/catch_all.hpp>
#include <graphser/errors.h>
#include <graphser/serialization.h>
#include <graphser/value_compare.h>

#include <cmath>
#include <string>
#include <vector>

using namespace graphser;

namespace {

/// Wrap a list into one table so the whole list, sharing between its
/// elements included, is compared by a single deep_equal call
TablePtr as_list(const std::vector<Value>& values) {
    auto list = Table::make();
    for (const auto& v : values) {
        list->push_back(v);
    }
    list->set("n", static_cast<double>(values.size()));
    return list;
}

std::vector<Value> round_trip(const std::vector<Value>& values) {
    ByteBuffer buffer = encode(values);
    return decode(buffer);
}

void check_round_trip(const std::vector<Value>& values) {
    auto results = round_trip(values);
    REQUIRE(results.size() == values.size());
    REQUIRE(deep_equal(as_list(values), as_list(results)));
}

} // namespace

// ============================================================
// Primitive Round Trips
// ============================================================

TEST_CASE("Serializes numbers", "[serialization][primitive]") {
    check_round_trip({1, 2, 4, 809, -1290, HUGE_VAL, -HUGE_VAL, 0});
}

TEST_CASE("Serializes numbers with no precision loss", "[serialization][primitive]") {
    std::vector<Value> values{std::ldexp(0.985, 1023), std::ldexp(0.781231231, -1023),
                              std::ldexp(0.5, -1021), std::ldexp(0.5, -1022)};
    auto results = round_trip(values);
    REQUIRE(results.size() == values.size());
    for (std::size_t i = 0; i < values.size(); ++i) {
        REQUIRE(results[i].as<double>() == values[i].as<double>());
    }
}

TEST_CASE("Serializes NaN", "[serialization][primitive]") {
    auto results = round_trip({std::nan("")});
    REQUIRE(results.size() == 1);
    REQUIRE(std::isnan(results[0].as<double>()));
}

TEST_CASE("Serializes strings", "[serialization][primitive]") {
    check_round_trip({"Hello, World!", "1231", "jojo", "binser", "\xF5" "897", "#####",
                      "#|||||###|#|#|#!@|#|@|!||2121|2", "", std::string("\0\x34\x67\x56", 4),
                      std::string("\0\xFF", 2)});
}

TEST_CASE("Serializes booleans", "[serialization][primitive]") {
    check_round_trip({true, false, false, true});
}

TEST_CASE("Serializes nil", "[serialization][primitive]") {
    auto buffer = serialize(nil, nil, true, nil, nil, true, nil);
    auto results = deserialize(buffer);
    REQUIRE(results.size() == 7);
    REQUIRE(results[0].is_nil());
    REQUIRE(results[1].is_nil());
    REQUIRE(results[2] == Value{true});
    REQUIRE(results[3].is_nil());
    REQUIRE(results[4].is_nil());
    REQUIRE(results[5] == Value{true});
    REQUIRE(results[6].is_nil());
}

// ============================================================
// Table Round Trips
// ============================================================

TEST_CASE("Serializes simple tables", "[serialization][table]") {
    check_round_trip({Table::make({0, 1, 2, 3}), Table::make({}, {{"a", 1}, {"b", 2}, {"c", 3}})});
}

TEST_CASE("Serializes tables with holes and odd keys", "[serialization][table]") {
    auto t = Table::make({0, 1, 2, 3, "a", true});
    t->set(std::string("ran\xC3\x8E\xC3\x98M\0\xFF", 10), "koi");
    t->set(-7, "negative");
    t->set(0.5, "fraction");
    t->set(false, "false key");
    check_round_trip({t, Table::make()});
}

TEST_CASE("Serializes tables as keys", "[serialization][table]") {
    auto key = Table::make({"key"});
    auto t = Table::make({}, {{key, "value"}});
    t->set("again", key);

    auto results = round_trip({t});
    auto* out = results[0].as_table();
    REQUIRE(out != nullptr);

    Value decoded_key = out->get("again");
    REQUIRE(decoded_key.is_table());
    REQUIRE(out->get(decoded_key) == Value{"value"});
}

TEST_CASE("Serializes cyclic tables", "[serialization][table]") {
    auto tab = Table::make({}, {{"a", 90}, {"b", 89}, {"zz", "binser"}});
    tab->set("cycle", tab);

    auto results = round_trip({tab, tab});
    REQUIRE(results.size() == 2);
    REQUIRE(results[0] == results[1]);

    auto* out = results[0].as_table();
    REQUIRE(out->get("cycle") == results[0]);
    REQUIRE(out->get("zz") == Value{"binser"});
    REQUIRE(deep_equal(tab, results[0]));

    tab->clear();
    out->clear();
}

TEST_CASE("Serializes serpent's benchmark data", "[serialization][table]") {
    auto b = Table::make({}, {{"text", "ha'ns"}, {"co\nl or", "bl\"ue"}, {"str", "\"\n'\\\001"}});

    auto list = Table::make({"a", nil, nil});
    list->set(9, "i");
    list->set(4, "f");
    list->set(5, "g");
    list->set(7, Table::make());

    auto a = Table::make({}, {{"x", 1}, {"y", 2}, {"z", 3}});
    a->set("function", b);
    a->set("list", list);
    a->set("label 2", b);
    a->set(HUGE_VAL, -HUGE_VAL);
    a->set("c", a);

    auto c = Table::make();
    for (int i = 1; i <= 500; ++i) {
        c->set(i, i);
    }
    a->set("d", c);

    auto results = round_trip({a});
    REQUIRE(deep_equal(a, results[0]));

    auto* out = results[0].as_table();
    REQUIRE(out->get("function") == out->get("label 2"));
    REQUIRE(out->get("c") == results[0]);
    REQUIRE(out->get("d").as_table()->array_size() == 500);
    REQUIRE(out->get(HUGE_VAL).as_number() == -HUGE_VAL);

    a->clear();
    out->clear();
}

// ============================================================
// Identity Tests
// ============================================================

TEST_CASE("Sharing is preserved across top-level values", "[serialization][identity]") {
    auto shared = Table::make({1, 2});
    auto holder = Table::make({shared, shared});

    auto results = round_trip({shared, holder, shared});
    REQUIRE(results[0] == results[2]);
    REQUIRE(results[1].as_table()->get(1) == results[0]);
    REQUIRE(results[1].as_table()->get(2) == results[0]);
}

TEST_CASE("Distinct but equal tables stay distinct", "[serialization][identity]") {
    auto results = round_trip({Table::make({1}), Table::make({1})});
    REQUIRE_FALSE(results[0] == results[1]);
    REQUIRE(deep_equal(results[0], results[1]));
}

TEST_CASE("Deep chains round trip", "[serialization][depth]") {
    auto root = Table::make();
    auto node = root;
    for (int i = 0; i < 1000; ++i) {
        auto next = Table::make();
        node->set("next", next);
        node = next;
    }
    node->set("leaf", true);

    auto results = round_trip({root});
    REQUIRE(deep_equal(root, results[0]));
}

TEST_CASE("Encoding refuses excessive nesting", "[serialization][depth]") {
    auto root = Table::make();
    auto node = root;
    for (int i = 0; i < 3000; ++i) {
        auto next = Table::make();
        node->set(1, next);
        node = next;
    }
    REQUIRE_THROWS_AS(serialize(root), NestingTooDeep);
}

// ============================================================
// Partial Decoding
// ============================================================

TEST_CASE("decode_n reads leading values only", "[serialization][decode_n]") {
    auto shared = Table::make({"x"});
    auto buffer = serialize(1, shared, shared, "tail");

    auto result = decode_n(buffer.data(), buffer.size(), 2);
    REQUIRE(result.values.size() == 2);
    REQUIRE(result.values[0] == Value{1});
    REQUIRE(deep_equal(result.values[1], shared));
    REQUIRE(result.bytes_read < buffer.size());

    SECTION("asking for more values than present") {
        auto all = decode_n(buffer.data(), buffer.size(), 10);
        REQUIRE(all.values.size() == 4);
        REQUIRE(all.bytes_read == buffer.size());
        REQUIRE(all.values[1] == all.values[2]);
    }
}
