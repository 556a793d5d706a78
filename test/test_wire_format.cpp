// test_wire_format.cpp - Tests for the byte-level stream layout
// Module 4: varints, numbers, strings and the smallest complete streams

#include <catch2/catch_all.hpp>
#include <graphser/errors.h>
#include <graphser/serialization.h>
#include <graphser/wire_format.h>

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

using namespace graphser;

namespace {

ByteBuffer bytes(std::initializer_list<int> list) {
    ByteBuffer out;
    for (int b : list) {
        out.push_back(static_cast<uint8_t>(b));
    }
    return out;
}

} // namespace

// ============================================================
// Varint Tests
// ============================================================

TEST_CASE("Varint encoding", "[wire][varint]") {
    ByteWriter writer;

    SECTION("single byte values") {
        writer.write_varint(0);
        writer.write_varint(127);
        REQUIRE(writer.buffer == bytes({0x00, 0x7F}));
    }

    SECTION("multi byte values") {
        writer.write_varint(128);
        writer.write_varint(300);
        REQUIRE(writer.buffer == bytes({0x80, 0x01, 0xAC, 0x02}));
    }

    SECTION("largest value takes ten bytes") {
        writer.write_varint(std::numeric_limits<uint64_t>::max());
        REQUIRE(writer.size() == max_varint_bytes);
        REQUIRE(writer.buffer.back() == 0x01);

        ByteReader reader(writer.buffer.data(), writer.buffer.size());
        REQUIRE(reader.read_varint() == std::numeric_limits<uint64_t>::max());
        REQUIRE(reader.at_end());
    }
}

TEST_CASE("Varint decoding errors", "[wire][varint]") {
    SECTION("truncated continuation") {
        auto buf = bytes({0x80, 0x80});
        ByteReader reader(buf.data(), buf.size());
        REQUIRE_THROWS_AS(reader.read_varint(), MalformedStream);
    }

    SECTION("more than 64 bits") {
        auto buf = bytes({0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0x02});
        ByteReader reader(buf.data(), buf.size());
        REQUIRE_THROWS_AS(reader.read_varint(), MalformedStream);
    }

    SECTION("eleven byte varint") {
        auto buf = bytes({0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x00});
        ByteReader reader(buf.data(), buf.size());
        REQUIRE_THROWS_AS(reader.read_varint(), MalformedStream);
    }
}

// ============================================================
// Primitive Tests
// ============================================================

TEST_CASE("Numbers are little-endian doubles", "[wire][number]") {
    ByteWriter writer;
    writer.write_f64(1.0);
    REQUIRE(writer.buffer == bytes({0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xF0, 0x3F}));

    ByteReader reader(writer.buffer.data(), writer.buffer.size());
    REQUIRE(reader.read_f64() == 1.0);
}

TEST_CASE("Strings are length-prefixed raw bytes", "[wire][string]") {
    ByteWriter writer;
    writer.write_string(std::string("\0\xFF", 2));
    REQUIRE(writer.buffer == bytes({0x02, 0x00, 0xFF}));

    SECTION("length past the end of input") {
        auto buf = bytes({0x05, 'a', 'b'});
        ByteReader reader(buf.data(), buf.size());
        REQUIRE_THROWS_AS(reader.read_string(), MalformedStream);
    }
}

TEST_CASE("Tag validation", "[wire][tag]") {
    auto buf = bytes({0x0D});
    ByteReader reader(buf.data(), buf.size());

    try {
        (void)reader.read_tag();
        FAIL("expected MalformedStream");
    } catch (const MalformedStream& e) {
        REQUIRE(e.code() == ErrorCode::MalformedStream);
        REQUIRE(e.offset() == 0);
    }

    REQUIRE(to_string(Tag::TemplateBody) == "template-body");
}

TEST_CASE("Counts are bounded by the remaining input", "[wire][count]") {
    auto buf = bytes({0x64, 0x00, 0x00});
    ByteReader reader(buf.data(), buf.size());
    REQUIRE_THROWS_AS(reader.read_count(), MalformedStream);
}

// ============================================================
// Whole Stream Layout Tests
// ============================================================

TEST_CASE("Stream layout of primitives", "[wire][stream]") {
    SECTION("nil and booleans") {
        REQUIRE(serialize(nil, true) == bytes({0x02, 0x00, 0x01}));
    }

    SECTION("empty stream") {
        REQUIRE(encode({}) == bytes({0x00}));
        REQUIRE(decode(bytes({0x00})).empty());
    }

    SECTION("string") {
        REQUIRE(serialize("hi") == bytes({0x01, 0x04, 0x02, 'h', 'i'}));
    }
}

TEST_CASE("Stream layout of a shared table", "[wire][stream]") {
    auto tab = Table::make();
    REQUIRE(serialize(tab, tab) == bytes({0x02, 0x05, 0x00, 0x00, 0x06, 0x00}));
}

TEST_CASE("Stream layout of a table body", "[wire][stream]") {
    auto t = Table::make({true});
    t->set("k", false);
    REQUIRE(serialize(t) == bytes({0x01, 0x05, 0x01, 0x01, 0x01, 0x04, 0x01, 'k', 0x02}));
}
