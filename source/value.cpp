// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// value.cpp - Value helpers and Table operations

#include <graphser/errors.h>
#include <graphser/function.h>
#include <graphser/value.h>

#include <bit>
#include <cmath>
#include <cstdio>
#include <functional>
#include <limits>
#include <unordered_set>

namespace graphser {

namespace {

constexpr std::size_t npos = static_cast<std::size_t>(-1);

// boost::hash_combine constant
inline std::size_t mix(std::size_t seed, std::size_t h) noexcept {
    return seed ^ (h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

void append_quoted(std::string& out, std::string_view s) {
    out += '"';
    for (unsigned char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20 || c >= 0x7F) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\x%02X", c);
                    out += buf;
                } else {
                    out += static_cast<char>(c);
                }
        }
    }
    out += '"';
}

void append_number(std::string& out, double d) {
    if (std::isinf(d)) {
        out += d > 0 ? "inf" : "-inf";
        return;
    }
    if (std::isnan(d)) {
        out += "nan";
        return;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.17g", d);
    out += buf;
}

void append_value(std::string& out, const Value& value, std::unordered_set<const Table*>& open) {
    std::visit([&](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            out += "nil";
        } else if constexpr (std::is_same_v<T, bool>) {
            out += arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, double>) {
            append_number(out, arg);
        } else if constexpr (std::is_same_v<T, std::string>) {
            append_quoted(out, arg);
        } else if constexpr (std::is_same_v<T, FunctionPtr>) {
            out += "function<" + arg->name() + ">";
        } else if constexpr (std::is_same_v<T, TablePtr>) {
            const Table* table = arg.get();
            if (open.contains(table)) {
                out += "<cycle>";
                return;
            }
            open.insert(table);
            out += table->type_name();
            out += '{';
            bool first = true;
            for (const auto& element : table->array()) {
                if (!first) out += ", ";
                first = false;
                append_value(out, element, open);
            }
            for (const auto& [key, field] : table->fields()) {
                if (!first) out += ", ";
                first = false;
                if (key.is_string()) {
                    out += key.as_string_view();
                } else {
                    out += '[';
                    append_value(out, key, open);
                    out += ']';
                }
                out += " = ";
                append_value(out, field, open);
            }
            out += '}';
            open.erase(table);
        }
    }, value.data);
}

} // anonymous namespace

// ============================================================
// Value
// ============================================================

const void* Value::identity() const noexcept {
    if (auto* t = get_if<TablePtr>())
        return t->get();
    if (auto* f = get_if<FunctionPtr>())
        return f->get();
    return nullptr;
}

std::string_view type_name_of(const Value& value) noexcept {
    switch (value.data.index()) {
        case 0: return "nil";
        case 1: return "boolean";
        case 2: return "number";
        case 3: return "string";
        case 4: return "table";
        case 5: return "function";
        default: return "unknown";
    }
}

std::string to_string(const Value& value) {
    std::string out;
    std::unordered_set<const Table*> open;
    append_value(out, value, open);
    return out;
}

bool is_valid_key(const Value& key) noexcept {
    if (key.is_nil())
        return false;
    if (auto* d = key.get_if<double>())
        return !std::isnan(*d);
    return true;
}

std::size_t KeyHash::operator()(const Value& key) const noexcept {
    const std::size_t seed = key.data.index();
    return std::visit([seed](const auto& arg) -> std::size_t {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            return seed;
        } else if constexpr (std::is_same_v<T, bool>) {
            return mix(seed, arg ? 1 : 0);
        } else if constexpr (std::is_same_v<T, double>) {
            // -0.0 and 0.0 compare equal and must hash equal
            const double normalized = arg == 0.0 ? 0.0 : arg;
            return mix(seed, std::hash<std::uint64_t>{}(std::bit_cast<std::uint64_t>(normalized)));
        } else if constexpr (std::is_same_v<T, std::string>) {
            return mix(seed, std::hash<std::string_view>{}(arg));
        } else {
            return mix(seed, std::hash<const void*>{}(arg.get()));
        }
    }, key.data);
}

// ============================================================
// Table
// ============================================================

TablePtr Table::make(std::initializer_list<Value> array,
                     std::initializer_list<std::pair<Value, Value>> fields)
{
    auto table = make();
    table->array_.assign(array.begin(), array.end());
    for (const auto& [key, value] : fields) {
        table->set(key, value);
    }
    return table;
}

std::size_t Table::array_index(const Value& key, std::size_t limit) noexcept
{
    auto* d = key.get_if<double>();
    if (!d || *d < 1.0 || *d > static_cast<double>(limit))
        return npos;
    const double integral = std::floor(*d);
    if (integral != *d)
        return npos;
    return static_cast<std::size_t>(integral) - 1;
}

Value Table::get(const Value& key) const
{
    if (auto index = array_index(key, array_.size()); index != npos)
        return array_[index];

    auto it = fields_.find(key);
    if (it == fields_.end())
        return Value{};
    return it->second;
}

Table& Table::set(const Value& key, Value value)
{
    if (!is_valid_key(key)) {
        throw InvalidKey(std::string("table key cannot be ") +
                         (key.is_nil() ? "nil" : "NaN"));
    }

    // Existing array slot
    if (auto index = array_index(key, array_.size()); index != npos) {
        array_[index] = std::move(value);
        while (!array_.empty() && array_.back().is_nil()) {
            array_.pop_back();
        }
        return *this;
    }

    // Growing the array part by one
    if (array_index(key, array_.size() + 1) == array_.size() && !value.is_nil()) {
        fields_.erase(key);
        array_.push_back(std::move(value));
        migrate_from_fields();
        return *this;
    }

    if (value.is_nil()) {
        fields_.erase(key);
        return *this;
    }

    auto it = fields_.find(key);
    if (it != fields_.end()) {
        it.value() = std::move(value);
    } else {
        fields_.emplace(key, std::move(value));
    }
    return *this;
}

bool Table::erase(const Value& key)
{
    if (!is_valid_key(key) || !contains(key))
        return false;
    set(key, Value{});
    return true;
}

std::size_t Table::entry_count() const noexcept
{
    std::size_t count = fields_.size();
    for (const auto& element : array_) {
        if (!element.is_nil())
            ++count;
    }
    return count;
}

void Table::clear() noexcept
{
    array_.clear();
    fields_.clear();
}

void Table::migrate_from_fields()
{
    while (!fields_.empty()) {
        auto it = fields_.find(Value{static_cast<double>(array_.size() + 1)});
        if (it == fields_.end())
            break;
        Value moved = std::move(it.value());
        fields_.erase(it);
        array_.push_back(std::move(moved));
    }
}

} // namespace graphser
