// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file type_template.h
/// @brief Field templates for compact, positional encoding of typed tables.
///
/// A Template is an ordered list of field keys known to both encoder and
/// decoder through the registry. Instances of a templated type are written as
/// their field values in template order, without the keys. A field may carry
/// a nested template, which is applied to the sub-table stored under that key.
///
/// @code
///   Template person{
///       "name",
///       {"size", Template{"width", "height"}},
///       0, false,                              // any valid key works
///   };
/// @endcode

#pragma once

#include <graphser/api.h>
#include <graphser/value.h>

#include <tsl/robin_set.h>

#include <concepts>
#include <initializer_list>
#include <memory>
#include <utility>
#include <vector>

namespace graphser {

class Template;

struct GRAPHSER_API TemplateField {
    Value key;
    std::shared_ptr<const Template> nested;

    template <typename K>
        requires std::constructible_from<Value, K>
    TemplateField(K&& k) : key(std::forward<K>(k)) {}

    TemplateField(Value k, Template sub);

    [[nodiscard]] bool is_nested() const noexcept { return nested != nullptr; }
};

class GRAPHSER_API Template {
public:
    Template() = default;

    /// @throws InvalidKey on nil/NaN or duplicate keys
    Template(std::initializer_list<TemplateField> fields);
    explicit Template(std::vector<TemplateField> fields);

    [[nodiscard]] const std::vector<TemplateField>& fields() const noexcept { return fields_; }
    [[nodiscard]] std::size_t size() const noexcept { return fields_.size(); }

    /// Whether key is one of this template's top-level fields
    [[nodiscard]] bool covers(const Value& key) const { return keys_.find(key) != keys_.end(); }

private:
    void index_keys();

    std::vector<TemplateField> fields_;
    tsl::robin_set<Value, KeyHash, KeyEqual> keys_;
};

} // namespace graphser
