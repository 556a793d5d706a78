// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file wire_format.h
/// @brief Byte-level conventions of the graphser stream.
///
/// Stream layout:
///   varint N, then N encoded values
///
/// Value Type Tags (1 byte):
///   0x00 = nil
///   0x01 = true
///   0x02 = false
///   0x03 = number (8 bytes, IEEE 754 binary64, little-endian)
///   0x04 = string (varint length + raw bytes)
///   0x05 = table (body)
///   0x06 = back-reference (varint slot index)
///   0x07 = typed table, plain descriptor (name string + body)
///   0x08 = constructor, hook-pair descriptor (name string + constructor value)
///   0x09 = template instance (name string + positional values + remainder)
///   0x0A = template body, nested sub-table (positional values + remainder)
///   0x0B = resource (name string)
///   0x0C = function (codec payload string)
///
/// Table body:
///   varint array length, elements, varint keyed count, key/value pairs
/// Template remainder:
///   varint count, key/value pairs for entries the template does not cover
///
/// Varints are unsigned LEB128, at most 10 bytes.

#pragma once

#include <graphser/api.h>
#include <graphser/value_fwd.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace graphser {

enum class Tag : uint8_t {
    Nil          = 0x00,
    True         = 0x01,
    False        = 0x02,
    Number       = 0x03,
    String       = 0x04,
    Table        = 0x05,
    Reference    = 0x06,
    TypedTable   = 0x07,
    Constructor  = 0x08,
    Template     = 0x09,
    TemplateBody = 0x0A,
    Resource     = 0x0B,
    Function     = 0x0C,
};

inline constexpr uint8_t max_tag = static_cast<uint8_t>(Tag::Function);
inline constexpr std::size_t max_varint_bytes = 10;

[[nodiscard]] GRAPHSER_API std::string_view to_string(Tag tag) noexcept;

// ============================================================
// ByteWriter
// ============================================================

class GRAPHSER_API ByteWriter {
public:
    ByteBuffer buffer;

    void write_u8(uint8_t v) { buffer.push_back(v); }
    void write_tag(Tag tag) { buffer.push_back(static_cast<uint8_t>(tag)); }

    void write_varint(uint64_t v);
    void write_f64(double v);
    void write_string(std::string_view s);

    [[nodiscard]] std::size_t size() const noexcept { return buffer.size(); }
};

// ============================================================
// ByteReader
// ============================================================

/// Bounds-checked reader; every failure throws MalformedStream
class GRAPHSER_API ByteReader {
public:
    ByteReader(const uint8_t* data, std::size_t size) : data_(data), size_(size) {}

    [[nodiscard]] bool has_bytes(std::size_t n) const noexcept { return n <= size_ - pos_; }
    [[nodiscard]] std::size_t remaining() const noexcept { return size_ - pos_; }
    [[nodiscard]] std::size_t position() const noexcept { return pos_; }
    [[nodiscard]] bool at_end() const noexcept { return pos_ == size_; }

    uint8_t read_u8();
    Tag read_tag();
    uint64_t read_varint();
    double read_f64();
    std::string read_string();

    /// Read a count and reject it if the input cannot hold that many items
    /// of at least min_item_bytes each
    std::size_t read_count(std::size_t min_item_bytes = 1);

    [[noreturn]] void fail(const std::string& message) const;

private:
    const uint8_t* data_;
    std::size_t size_;
    std::size_t pos_ = 0;
};

} // namespace graphser
