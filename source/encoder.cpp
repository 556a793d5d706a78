// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file encoder.cpp
/// @brief Single-pass graph encoder.
///
/// Every table or function gets a slot the first time it is seen, before its
/// content is written. Any later sighting, including one nested inside its
/// own content, is written as a back-reference to that slot. The decoder
/// allocates objects in the same order, so slot N on both sides names the
/// same object.

#include <graphser/errors.h>
#include <graphser/function.h>
#include <graphser/serialization.h>
#include <graphser/wire_format.h>

#include <tsl/robin_map.h>

namespace graphser {

namespace {

class Encoder {
public:
    explicit Encoder(const RegistrySnapshot& registry) : registry_(registry) {}

    ByteBuffer encode(std::span<const Value> values) {
        writer_.write_varint(values.size());
        for (const auto& value : values) {
            write_value(value);
        }
        return std::move(writer_.buffer);
    }

private:
    class DepthGuard {
    public:
        explicit DepthGuard(std::size_t& depth) : depth_(depth) {
            if (++depth_ > GRAPHSER_MAX_DEPTH) {
                --depth_;
                throw NestingTooDeep(GRAPHSER_MAX_DEPTH);
            }
        }
        ~DepthGuard() { --depth_; }

        DepthGuard(const DepthGuard&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;

    private:
        std::size_t& depth_;
    };

    void write_value(const Value& value) {
        std::visit([this, &value](const auto& arg) {
            using T = std::decay_t<decltype(arg)>;

            if constexpr (std::is_same_v<T, std::monostate>) {
                writer_.write_tag(Tag::Nil);
            } else if constexpr (std::is_same_v<T, bool>) {
                writer_.write_tag(arg ? Tag::True : Tag::False);
            } else if constexpr (std::is_same_v<T, double>) {
                writer_.write_tag(Tag::Number);
                writer_.write_f64(arg);
            } else if constexpr (std::is_same_v<T, std::string>) {
                writer_.write_tag(Tag::String);
                writer_.write_string(arg);
            } else {
                write_object(value);
            }
        }, value.data);
    }

    /// Tables and functions: back-reference, resource name, or full content
    void write_object(const Value& value) {
        const void* identity = value.identity();

        if (auto it = slots_.find(identity); it != slots_.end()) {
            writer_.write_tag(Tag::Reference);
            writer_.write_varint(it->second);
            return;
        }

        assign_slot(identity);

        if (const std::string* name = registry_.resource_name_of(identity)) {
            writer_.write_tag(Tag::Resource);
            writer_.write_string(*name);
            return;
        }

        if (const Function* fn = value.as_function()) {
            std::string payload = registry_.function_codec().encode(*fn);
            writer_.write_tag(Tag::Function);
            writer_.write_string(payload);
            return;
        }

        write_table(*value.as<TablePtr>(), value);
    }

    void write_table(const Table& table, const Value& value) {
        DepthGuard guard(depth_);

        if (!table.is_typed()) {
            writer_.write_tag(Tag::Table);
            write_table_body(table);
            return;
        }

        const TypeDescriptor* descriptor = registry_.find_type(table.type_name());
        if (!descriptor) {
            throw UnknownType(table.type_name());
        }

        switch (descriptor->kind) {
            case TypeDescriptor::Kind::Plain:
                writer_.write_tag(Tag::TypedTable);
                writer_.write_string(descriptor->name);
                write_table_body(table);
                break;

            case TypeDescriptor::Kind::Hooks:
                write_constructor(*descriptor, value);
                break;

            case TypeDescriptor::Kind::Template:
                writer_.write_tag(Tag::Template);
                writer_.write_string(descriptor->name);
                write_template_values(table, *descriptor->layout);
                break;
        }
    }

    void write_table_body(const Table& table) {
        writer_.write_varint(table.array_size());
        for (const auto& element : table.array()) {
            write_value(element);
        }
        writer_.write_varint(table.field_count());
        for (const auto& [key, field] : table.fields()) {
            write_value(key);
            write_value(field);
        }
    }

    void write_constructor(const TypeDescriptor& descriptor, const Value& object) {
        Value constructor = descriptor.serialize(object);

        if (constructor.identity() == object.identity()) {
            throw ConstructorCycle(descriptor.name);
        }

        writer_.write_tag(Tag::Constructor);
        writer_.write_string(descriptor.name);

        // The hook result may be a temporary; keep it alive so its address
        // cannot be reused by another object later in this pass.
        retained_.push_back(constructor);

        // The constructor is an ordinary value with a slot of its own
        write_value(constructor);
    }

    void write_template_values(const Table& table, const Template& layout) {
        for (const auto& field : layout.fields()) {
            Value field_value = table.get(field.key);

            if (field.is_nested() && is_fresh_plain_table(field_value)) {
                assign_slot(field_value.identity());
                DepthGuard guard(depth_);
                writer_.write_tag(Tag::TemplateBody);
                write_template_values(*field_value.as_table(), *field.nested);
            } else {
                write_value(field_value);
            }
        }

        std::size_t remainder = 0;
        table.for_each_entry([&](const Value& key, const Value&) {
            if (!layout.covers(key)) ++remainder;
        });
        writer_.write_varint(remainder);
        table.for_each_entry([&](const Value& key, const Value& entry) {
            if (layout.covers(key)) return;
            write_value(key);
            write_value(entry);
        });
    }

    /// Untyped table not yet seen and not a resource
    [[nodiscard]] bool is_fresh_plain_table(const Value& value) const {
        const Table* table = value.as_table();
        return table && !table->is_typed() && slots_.count(table) == 0 &&
               !registry_.resource_name_of(table);
    }

    std::size_t assign_slot(const void* identity) {
        const std::size_t slot = next_slot_++;
        slots_.emplace(identity, slot);
        return slot;
    }

    const RegistrySnapshot& registry_;
    ByteWriter writer_;
    tsl::robin_map<const void*, std::size_t> slots_;
    std::vector<Value> retained_;
    std::size_t next_slot_ = 0;
    std::size_t depth_ = 0;
};

} // anonymous namespace

ByteBuffer encode(std::span<const Value> values, const RegistrySnapshot& registry) {
    Encoder encoder(registry);
    return encoder.encode(values);
}

ByteBuffer encode(std::span<const Value> values, const Registry& registry) {
    const RegistrySnapshot snapshot = registry.snapshot();
    return encode(values, snapshot);
}

} // namespace graphser
