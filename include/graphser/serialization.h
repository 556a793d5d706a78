// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file serialization.h
/// @brief Encode and decode value graphs.
///
/// A stream holds an explicit count N followed by N values, so nil is a
/// first-class value rather than an end marker. Shared tables, cycles and
/// functions are written once; later sightings become back-references to the
/// slot assigned on first sight. Decoding allocates objects in the same order
/// and therefore restores identity, not just equality.
///
/// Usage:
/// @code
///   #include <graphser/serialization.h>
///
///   auto tab = Table::make({}, {{"a", 90}, {"zz", "binser"}});
///   tab->set("cycle", tab);
///
///   ByteBuffer buffer = serialize(tab, tab, nil);
///   std::vector<Value> out = decode(buffer);
///   // out[0].as_table() == out[1].as_table()
///   // out[0].as_table()->get("cycle") == out[0]
///   // out[2].is_nil()
/// @endcode
///
/// Errors are thrown (see errors.h): MalformedStream, UnknownType,
/// UnknownResource, ConstructorCycle, UnsupportedValue, NestingTooDeep.

#pragma once

#include <graphser/api.h>
#include <graphser/registry.h>
#include <graphser/value.h>

#include <array>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace graphser {

/// Spelled-out nil for variadic calls
inline const Value nil{};

// ============================================================
// Encoding
// ============================================================

/// Encode values in order using the given registry state
[[nodiscard]] GRAPHSER_API ByteBuffer encode(std::span<const Value> values, const RegistrySnapshot& registry);

[[nodiscard]] GRAPHSER_API ByteBuffer encode(std::span<const Value> values,
                                             const Registry& registry = default_registry());

/// Variadic convenience: serialize(1, "two", table, Value{})
template <typename... Args>
[[nodiscard]] ByteBuffer serialize(Args&&... args) {
    const std::array<Value, sizeof...(Args)> values{Value(std::forward<Args>(args))...};
    return encode(std::span<const Value>(values.data(), values.size()));
}

// ============================================================
// Decoding
// ============================================================

/// Decode every value of the stream; trailing bytes are an error
[[nodiscard]] GRAPHSER_API std::vector<Value> decode(const uint8_t* data, std::size_t size,
                                                     const RegistrySnapshot& registry);

[[nodiscard]] GRAPHSER_API std::vector<Value> decode(const uint8_t* data, std::size_t size,
                                                     const Registry& registry = default_registry());

[[nodiscard]] GRAPHSER_API std::vector<Value> decode(const ByteBuffer& buffer,
                                                     const Registry& registry = default_registry());

struct DecodeResult {
    std::vector<Value> values;
    std::size_t bytes_read = 0; ///< position just past the last decoded value
};

/// Decode at most max_values leading values of the stream
[[nodiscard]] GRAPHSER_API DecodeResult decode_n(const uint8_t* data, std::size_t size, std::size_t max_values,
                                                 const Registry& registry = default_registry());

[[nodiscard]] inline std::vector<Value> deserialize(const ByteBuffer& buffer) {
    return decode(buffer);
}

} // namespace graphser
