// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Dynamic value graph: Value variant and identity-bearing Table.
///
/// Value represents:
/// - nil (std::monostate), boolean, number (always double), string (raw bytes)
/// - Table: shared, mutable container with a 1-based array part and a keyed part
/// - Function: shared, named native callable (see function.h)
///
/// Tables and functions have identity: copying a Value copies the reference,
/// not the referent. Sharing and cycles are therefore expressible, and the
/// codec (serialization.h) reproduces them.
///
/// ## Usage Example
/// ```cpp
/// auto player = Table::make({"sword", "shield"}, {{"name", "Ayla"}, {"hp", 100}});
/// player->set("self", player);              // cycle
/// Value hp = player->get("hp");             // 100.0
/// Value first = player->get(1);             // "sword"
/// ```
///
/// ## Ownership
/// Values own their referents through std::shared_ptr. A cycle keeps its
/// tables alive until one edge is cut, e.g. with Table::clear().

#pragma once

#include <graphser/api.h>
#include <graphser/value_fwd.h>

#include <tsl/robin_map.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace graphser {

// ============================================================
// Value
// ============================================================

struct GRAPHSER_API Value {
    using DataVariant = std::variant<std::monostate, // nil
                                     bool,
                                     double,
                                     std::string,
                                     TablePtr,
                                     FunctionPtr>;

    DataVariant data;

    // ============================================================
    // Constructors
    // ============================================================
    // Not explicit, so tables can be filled with plain literals:
    //   t->set("name", "Ayla");
    //   t->set(1, true);

    /// Default constructor - creates nil
    Value() noexcept : data(std::monostate{}) {}

    Value(bool v) noexcept : data(v) {}

    /// All arithmetic types are stored as double
    template <typename T>
        requires(std::is_arithmetic_v<T> && !std::is_same_v<T, bool>)
    Value(T v) noexcept : data(static_cast<double>(v)) {}

    Value(std::string v) : data(std::move(v)) {}
    Value(const char* v) : data(std::string(v)) {}
    Value(std::string_view v) : data(std::string(v)) {}

    /// A null TablePtr/FunctionPtr yields nil
    Value(TablePtr v);
    Value(FunctionPtr v);

    // ============================================================
    // Type Checking
    // ============================================================

    template <typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(data);
    }

    [[nodiscard]] bool is_nil() const { return is<std::monostate>(); }
    [[nodiscard]] bool is_bool() const { return is<bool>(); }
    [[nodiscard]] bool is_number() const { return is<double>(); }
    [[nodiscard]] bool is_string() const { return is<std::string>(); }
    [[nodiscard]] bool is_table() const { return is<TablePtr>(); }
    [[nodiscard]] bool is_function() const { return is<FunctionPtr>(); }

    /// True for kinds compared and tracked by identity (tables, functions)
    [[nodiscard]] bool has_identity() const { return is_table() || is_function(); }

    // ============================================================
    // Value Access
    // ============================================================

    /// Get value as specific type (throws std::bad_variant_access if wrong type)
    template <typename T>
    [[nodiscard]] const T& as() const {
        return std::get<T>(data);
    }

    template <typename T>
    [[nodiscard]] T* get_if() {
        return std::get_if<T>(&data);
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const {
        return std::get_if<T>(&data);
    }

    [[nodiscard]] double as_number(double default_val = 0.0) const {
        if (auto* p = get_if<double>())
            return *p;
        return default_val;
    }

    [[nodiscard]] bool as_bool(bool default_val = false) const {
        if (auto* p = get_if<bool>())
            return *p;
        return default_val;
    }

    /// Zero-copy view of a string value; empty if not a string
    [[nodiscard]] std::string_view as_string_view() const noexcept {
        if (auto* p = get_if<std::string>())
            return *p;
        return {};
    }

    /// The referenced table, or nullptr if this is not a table
    [[nodiscard]] Table* as_table() const noexcept {
        if (auto* p = get_if<TablePtr>())
            return p->get();
        return nullptr;
    }

    /// The referenced function, or nullptr if this is not a function
    [[nodiscard]] Function* as_function() const noexcept {
        if (auto* p = get_if<FunctionPtr>())
            return p->get();
        return nullptr;
    }

    /// Address of the referent for tables and functions, nullptr otherwise
    [[nodiscard]] const void* identity() const noexcept;

    /// Raw equality: plain values by content, tables and functions by identity.
    /// Use deep_equal() (value_compare.h) for structural comparison.
    [[nodiscard]] bool operator==(const Value& other) const = default;
};

/// "nil", "boolean", "number", "string", "table" or "function"
[[nodiscard]] GRAPHSER_API std::string_view type_name_of(const Value& value) noexcept;

/// Debug rendering, e.g. `{1, 2, name = "x", self = <cycle>}`
[[nodiscard]] GRAPHSER_API std::string to_string(const Value& value);

/// True if the value may be used as a table key (not nil, not NaN)
[[nodiscard]] GRAPHSER_API bool is_valid_key(const Value& key) noexcept;

// ============================================================
// Key Hash/Equal for the keyed part
// ============================================================

struct GRAPHSER_API KeyHash {
    [[nodiscard]] std::size_t operator()(const Value& key) const noexcept;
};

struct KeyEqual {
    [[nodiscard]] bool operator()(const Value& a, const Value& b) const noexcept { return a == b; }
};

// ============================================================
// Table
// ============================================================

/// @brief Mutable container with identity.
///
/// Integral keys 1..n live in the array part, everything else in the keyed
/// part. The array part may contain nil holes; setting the last element to
/// nil trims trailing nils.
class GRAPHSER_API Table {
public:
    using ArrayPart = std::vector<Value>;
    using KeyedPart = tsl::robin_map<Value, Value, KeyHash, KeyEqual>;

    Table() = default;
    explicit Table(std::string type_name) : type_name_(std::move(type_name)) {}

    Table(const Table&) = delete;
    Table& operator=(const Table&) = delete;

    // ============================================================
    // Factory Methods
    // ============================================================

    [[nodiscard]] static TablePtr make() { return std::make_shared<Table>(); }

    [[nodiscard]] static TablePtr make_typed(std::string type_name) {
        return std::make_shared<Table>(std::move(type_name));
    }

    /// Array elements are stored verbatim (nil holes included); fields go through set()
    [[nodiscard]] static TablePtr make(std::initializer_list<Value> array,
                                       std::initializer_list<std::pair<Value, Value>> fields = {});

    // ============================================================
    // Access
    // ============================================================

    /// Value stored under key, nil if absent
    [[nodiscard]] Value get(const Value& key) const;

    /// Store value under key; nil removes the entry.
    /// @throws InvalidKey if key is nil or NaN
    Table& set(const Value& key, Value value);

    [[nodiscard]] bool contains(const Value& key) const { return !get(key).is_nil(); }

    /// Remove key (returns true if a non-nil value was removed)
    bool erase(const Value& key);

    /// Append at position array_size() + 1; nil is kept as a hole
    void push_back(Value value) { array_.push_back(std::move(value)); }

    [[nodiscard]] const ArrayPart& array() const noexcept { return array_; }
    [[nodiscard]] const KeyedPart& fields() const noexcept { return fields_; }

    [[nodiscard]] std::size_t array_size() const noexcept { return array_.size(); }
    [[nodiscard]] std::size_t field_count() const noexcept { return fields_.size(); }

    /// Number of non-nil entries across both parts
    [[nodiscard]] std::size_t entry_count() const noexcept;

    [[nodiscard]] bool empty() const noexcept { return entry_count() == 0; }

    /// Visit every non-nil entry: array part first (keys 1..n), then keyed part
    template <typename F>
    void for_each_entry(F&& fn) const {
        for (std::size_t i = 0; i < array_.size(); ++i) {
            if (!array_[i].is_nil())
                fn(Value{static_cast<double>(i + 1)}, array_[i]);
        }
        for (const auto& [key, value] : fields_) {
            fn(key, value);
        }
    }

    /// Drop all entries; the type tag is kept
    void clear() noexcept;

    // ============================================================
    // Type Tag
    // ============================================================

    [[nodiscard]] const std::string& type_name() const noexcept { return type_name_; }
    void set_type_name(std::string name) { type_name_ = std::move(name); }
    [[nodiscard]] bool is_typed() const noexcept { return !type_name_.empty(); }

private:
    /// Index into array_ for integral keys in [1, limit], or npos
    [[nodiscard]] static std::size_t array_index(const Value& key, std::size_t limit) noexcept;

    /// Move keys n+1, n+2, ... from the keyed part into the array part
    void migrate_from_fields();

    ArrayPart array_;
    KeyedPart fields_;
    std::string type_name_;
};

inline Value::Value(TablePtr v) {
    if (v)
        data = std::move(v);
}

inline Value::Value(FunctionPtr v) {
    if (v)
        data = std::move(v);
}

} // namespace graphser
