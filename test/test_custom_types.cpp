// test_custom_types.cpp - Tests for registered types: plain, hooks and templates
// Module 6: typed tables through a local Registry

#include <catch2/catch_all.hpp>
#include <graphser/errors.h>
#include <graphser/serialization.h>
#include <graphser/value_compare.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace graphser;

namespace {

std::vector<Value> round_trip(const Registry& registry, const std::vector<Value>& values) {
    ByteBuffer buffer = encode(values, registry);
    return decode(buffer, registry);
}

} // namespace

// ============================================================
// Plain Typed Tables
// ============================================================

TEST_CASE("Serializes typed tables", "[custom][plain]") {
    Registry registry;
    registry.register_type(TypeDescriptor::plain("MyCoolType"));

    auto empty = Table::make_typed("MyCoolType");
    auto filled = Table::make_typed("MyCoolType");
    filled->set("a", "a").set("b", "b").set("c", "c");

    auto results = round_trip(registry, {empty, filled});
    REQUIRE(results.size() == 2);
    REQUIRE(results[0].as_table()->type_name() == "MyCoolType");
    REQUIRE(results[0].as_table()->empty());
    REQUIRE(deep_equal(filled, results[1]));
}

TEST_CASE("Serializes typed table references", "[custom][plain]") {
    Registry registry;
    registry.register_type(TypeDescriptor::plain("MyCoolType"));

    auto a = Table::make_typed("MyCoolType");
    auto results = round_trip(registry, {a, a, a});
    REQUIRE(results[0] == results[1]);
    REQUIRE(results[1] == results[2]);
}

TEST_CASE("Unregistered type names are rejected", "[custom][plain]") {
    Registry registry;
    auto a = Table::make_typed("Nobody");

    SECTION("on encode") {
        try {
            (void)encode(std::vector<Value>{a}, registry);
            FAIL("expected UnknownType");
        } catch (const UnknownType& e) {
            REQUIRE(e.name() == "Nobody");
            REQUIRE(e.code() == ErrorCode::UnknownType);
        }
    }

    SECTION("on decode") {
        Registry writer;
        writer.register_type(TypeDescriptor::plain("Nobody"));
        auto buffer = encode(std::vector<Value>{a}, writer);
        REQUIRE_THROWS_AS(decode(buffer, registry), UnknownType);
    }
}

// ============================================================
// Hook Pairs
// ============================================================

TEST_CASE("Serializes cyclic tables in constructors", "[custom][hooks]") {
    Registry registry;
    registry.register_type(TypeDescriptor::with_hooks(
        "MyCoolType",
        [](const Value& x) {
            auto a = Table::make({}, {{"value", x.as_table()->get("value")}});
            a->set(a, a); // self-cycle inside the constructor
            return Value{a};
        },
        [](const Value& a) {
            auto object = Table::make_typed("MyCoolType");
            object->set("value", a.as_table()->get("value"));
            return Value{object};
        }));

    auto a = Table::make_typed("MyCoolType");
    a->set("value", 30);
    auto b = Table::make_typed("MyCoolType");
    b->set("value", 40);
    auto c = Table::make({}, {{"a", a}, {"b", b}});

    auto results = round_trip(registry, {a, c, b});
    REQUIRE(results.size() == 3);
    REQUIRE(deep_equal(a, results[0]));
    REQUIRE(deep_equal(c, results[1]));
    REQUIRE(deep_equal(b, results[2]));

    auto* out_c = results[1].as_table();
    REQUIRE(out_c->get("a") == results[0]);
    REQUIRE(out_c->get("b") == results[2]);
}

TEST_CASE("Constructor may be any value", "[custom][hooks]") {
    Registry registry;
    registry.register_type(TypeDescriptor::with_hooks(
        "Vec",
        [](const Value& v) {
            const Table* t = v.as_table();
            return Value{std::to_string(t->get("x").as_number()) + "," +
                         std::to_string(t->get("y").as_number())};
        },
        [](const Value& text) {
            const std::string s{text.as_string_view()};
            const auto comma = s.find(',');
            auto vec = Table::make_typed("Vec");
            vec->set("x", std::stod(s.substr(0, comma)));
            vec->set("y", std::stod(s.substr(comma + 1)));
            return Value{vec};
        }));

    auto v = Table::make_typed("Vec");
    v->set("x", 1.5).set("y", -2);

    auto results = round_trip(registry, {v, v});
    REQUIRE(deep_equal(v, results[0]));
    REQUIRE(results[0] == results[1]);
}

TEST_CASE("Constructor may be a table reachable elsewhere", "[custom][hooks]") {
    Registry registry;
    registry.register_type(TypeDescriptor::with_hooks(
        "Box",
        [](const Value& box) { return box.as_table()->get("inner"); },
        [](const Value& inner) {
            auto box = Table::make_typed("Box");
            box->set("inner", inner);
            return Value{box};
        }));

    auto inner = Table::make({}, {{"k", 1}});
    auto box = Table::make_typed("Box");
    box->set("inner", inner);

    auto results = round_trip(registry, {box, inner});
    REQUIRE(results.size() == 2);

    const Table* out_inner = results[1].as_table();
    REQUIRE(out_inner != nullptr);
    REQUIRE_FALSE(out_inner->is_typed());
    REQUIRE(deep_equal(inner, results[1]));

    const Table* out_box = results[0].as_table();
    REQUIRE(out_box->type_name() == "Box");
    REQUIRE(out_box->get("inner") == results[1]);
}

TEST_CASE("Two objects may share one constructor table", "[custom][hooks]") {
    auto cache = Table::make({}, {{"mode", "fast"}});
    std::vector<Value> received;

    Registry registry;
    registry.register_type(TypeDescriptor::with_hooks(
        "Cfg",
        [cache](const Value&) { return Value{cache}; },
        [&received](const Value& source) {
            received.push_back(source);
            auto cfg = Table::make_typed("Cfg");
            cfg->set("source", source);
            return Value{cfg};
        }));

    auto first = Table::make_typed("Cfg");
    auto second = Table::make_typed("Cfg");

    auto results = round_trip(registry, {first, second});
    REQUIRE(results.size() == 2);
    REQUIRE(results[0] != results[1]);

    REQUIRE(received.size() == 2);
    REQUIRE(received[0] == received[1]);
    REQUIRE_FALSE(received[0].as_table()->is_typed());
    REQUIRE(deep_equal(cache, received[0]));

    REQUIRE(results[0].as_table()->type_name() == "Cfg");
    REQUIRE(results[1].as_table()->type_name() == "Cfg");
    REQUIRE(results[0].as_table()->get("source") == results[1].as_table()->get("source"));
}

TEST_CASE("Fails gracefully on impossible constructors", "[custom][hooks]") {
    Registry registry;
    registry.register_type(TypeDescriptor::with_hooks(
        "MyCoolType", [](const Value& x) { return x; }, [](const Value& x) { return x; }));

    auto a = Table::make_typed("MyCoolType");
    try {
        (void)encode(std::vector<Value>{a, a, a}, registry);
        FAIL("expected ConstructorCycle");
    } catch (const ConstructorCycle& e) {
        REQUIRE(e.code() == ErrorCode::ConstructorCycle);
        REQUIRE(e.type_name() == "MyCoolType");
        REQUIRE(std::string(e.what()).find("infinite loop in constructor") != std::string::npos);
    }
}

TEST_CASE("Hook descriptors need both hooks", "[custom][hooks]") {
    REQUIRE_THROWS_AS(TypeDescriptor::with_hooks("Half", [](const Value& x) { return x; }, nullptr),
                      std::invalid_argument);
}

// ============================================================
// Templates
// ============================================================

TEST_CASE("Templates serialize fields positionally", "[custom][template]") {
    Registry registry;
    registry.register_type(TypeDescriptor::with_template("marshalledtype", Template{"cat", "dog", 0, false}));

    auto a = Table::make_typed("marshalledtype");
    a->set("cat", "meow").set("dog", "woof").set(0, "something").set(false, 1);

    auto results = round_trip(registry, {a});
    REQUIRE(deep_equal(a, results[0]));

    SECTION("template keys are not written") {
        auto buffer = encode(std::vector<Value>{a}, registry);
        const std::string raw(buffer.begin(), buffer.end());
        REQUIRE(raw.find("cat") == std::string::npos);
        REQUIRE(raw.find("meow") != std::string::npos);
    }
}

TEST_CASE("Templates write missing fields as nil", "[custom][template]") {
    Registry registry;
    registry.register_type(TypeDescriptor::with_template("Pair", Template{"first", "second"}));

    auto p = Table::make_typed("Pair");
    p->set("second", 2);

    auto results = round_trip(registry, {p});
    auto* out = results[0].as_table();
    REQUIRE_FALSE(out->contains("first"));
    REQUIRE(out->get("second") == Value{2});
}

TEST_CASE("Templates carry entries they do not cover", "[custom][template]") {
    Registry registry;
    registry.register_type(TypeDescriptor::with_template("Pair", Template{"first", "second"}));

    auto p = Table::make_typed("Pair");
    p->set("first", 1).set("second", 2).set("extra", "kept").set(1, "array");

    auto results = round_trip(registry, {p});
    REQUIRE(deep_equal(p, results[0]));
}

TEST_CASE("Can use nested templates", "[custom][template]") {
    Registry registry;
    registry.register_type(TypeDescriptor::with_template(
        "mtype", Template{"movie", {"joe", Template{"age", "width", "height"}}, "yolo"}));

    auto joe = Table::make({}, {{"age", 25}, {"width", "kinda wide"}, {"height", "not so tall"}});
    auto a = Table::make_typed("mtype");
    a->set("movie", "Die Hard").set("joe", joe).set("yolo", "bolo");

    auto results = round_trip(registry, {a});
    REQUIRE(deep_equal(a, results[0]));

    SECTION("nested field shared elsewhere keeps its identity") {
        auto out = round_trip(registry, {a, joe});
        REQUIRE(out[0].as_table()->get("joe") == out[1]);
    }

    SECTION("nested field holding a non-table is written as a value") {
        a->set("joe", "not a table");
        auto out = round_trip(registry, {a});
        REQUIRE(out[0].as_table()->get("joe") == Value{"not a table"});
    }
}

TEST_CASE("Template layouts reject bad keys", "[custom][template]") {
    REQUIRE_THROWS_AS(Template({"a", "a"}), InvalidKey);
    REQUIRE_THROWS_AS(Template({"a", Value{}}), InvalidKey);
}

TEST_CASE("Stream kind must match the registered kind", "[custom][template]") {
    Registry writer;
    writer.register_type(TypeDescriptor::plain("Shape"));
    Registry reader;
    reader.register_type(TypeDescriptor::with_template("Shape", Template{"w", "h"}));

    auto shape = Table::make_typed("Shape");
    auto buffer = encode(std::vector<Value>{shape}, writer);
    REQUIRE_THROWS_AS(decode(buffer, reader), MalformedStream);
}
