// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// wire_format.cpp - primitive reads and writes of the stream

#include <graphser/diagnostics.h>
#include <graphser/errors.h>
#include <graphser/wire_format.h>

#include <bit>
#include <cstring>

namespace graphser {

std::string_view to_string(Tag tag) noexcept {
    switch (tag) {
        case Tag::Nil:          return "nil";
        case Tag::True:         return "true";
        case Tag::False:        return "false";
        case Tag::Number:       return "number";
        case Tag::String:       return "string";
        case Tag::Table:        return "table";
        case Tag::Reference:    return "reference";
        case Tag::TypedTable:   return "typed-table";
        case Tag::Constructor:  return "constructor";
        case Tag::Template:     return "template";
        case Tag::TemplateBody: return "template-body";
        case Tag::Resource:     return "resource";
        case Tag::Function:     return "function";
    }
    return "unknown";
}

// ============================================================
// ByteWriter
// ============================================================

void ByteWriter::write_varint(uint64_t v) {
    while (v >= 0x80) {
        buffer.push_back(static_cast<uint8_t>(v | 0x80));
        v >>= 7;
    }
    buffer.push_back(static_cast<uint8_t>(v));
}

// Explicit little-endian byte order, independent of the host
void ByteWriter::write_f64(double v) {
    const uint64_t bits = std::bit_cast<uint64_t>(v);
    for (int shift = 0; shift < 64; shift += 8) {
        buffer.push_back(static_cast<uint8_t>(bits >> shift));
    }
}

void ByteWriter::write_string(std::string_view s) {
    write_varint(s.size());
    std::size_t old_size = buffer.size();
    buffer.resize(old_size + s.size());
    if (!s.empty()) {
        std::memcpy(buffer.data() + old_size, s.data(), s.size());
    }
}

// ============================================================
// ByteReader
// ============================================================

void ByteReader::fail(const std::string& message) const {
    detail::log_codec_error("ByteReader", message, pos_);
    throw MalformedStream(message, pos_);
}

uint8_t ByteReader::read_u8() {
    if (!has_bytes(1)) fail("unexpected end of buffer");
    return data_[pos_++];
}

Tag ByteReader::read_tag() {
    uint8_t raw = read_u8();
    if (raw > max_tag) {
        --pos_;
        fail("unknown type tag " + std::to_string(static_cast<int>(raw)));
    }
    return static_cast<Tag>(raw);
}

uint64_t ByteReader::read_varint() {
    uint64_t result = 0;
    for (std::size_t i = 0; i < max_varint_bytes; ++i) {
        uint8_t byte = read_u8();
        // the 10th byte may only contribute the top bit
        if (i == max_varint_bytes - 1 && byte > 0x01) {
            fail("varint overflows 64 bits");
        }
        result |= static_cast<uint64_t>(byte & 0x7F) << (7 * i);
        if ((byte & 0x80) == 0) {
            return result;
        }
    }
    fail("varint overflows 64 bits");
}

double ByteReader::read_f64() {
    if (!has_bytes(sizeof(double))) fail("unexpected end of buffer");
    uint64_t bits = 0;
    for (int i = 0; i < 8; ++i) {
        bits |= static_cast<uint64_t>(data_[pos_ + i]) << (8 * i);
    }
    pos_ += sizeof(double);
    return std::bit_cast<double>(bits);
}

std::string ByteReader::read_string() {
    uint64_t len = read_varint();
    if (len > remaining()) fail("string length " + std::to_string(len) + " exceeds input");
    std::string s(reinterpret_cast<const char*>(data_ + pos_), static_cast<std::size_t>(len));
    pos_ += static_cast<std::size_t>(len);
    return s;
}

std::size_t ByteReader::read_count(std::size_t min_item_bytes) {
    uint64_t count = read_varint();
    if (count > remaining() / min_item_bytes) {
        fail("count " + std::to_string(count) + " exceeds input");
    }
    return static_cast<std::size_t>(count);
}

} // namespace graphser
