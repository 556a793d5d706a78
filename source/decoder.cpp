// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file decoder.cpp
/// @brief Single-pass graph decoder.
///
/// Mirrors encoder.cpp: each table, resource or function is appended to the
/// slot list when it is allocated and before its content is read, so
/// back-references nested in that content resolve to it.

#include <graphser/diagnostics.h>
#include <graphser/errors.h>
#include <graphser/function.h>
#include <graphser/serialization.h>
#include <graphser/wire_format.h>

#include <algorithm>
#include <optional>

namespace graphser {

namespace {

class Decoder {
public:
    Decoder(const RegistrySnapshot& registry, const uint8_t* data, std::size_t size)
        : registry_(registry), reader_(data, size) {}

    /// Read the header and up to limit values (all values if limit is empty)
    std::vector<Value> read_stream(std::optional<std::size_t> limit) {
        const std::size_t count = reader_.read_count();
        const std::size_t wanted = limit ? std::min(*limit, count) : count;

        std::vector<Value> values;
        values.reserve(wanted);
        for (std::size_t i = 0; i < wanted; ++i) {
            values.push_back(read_value());
        }

        if (!limit && !reader_.at_end()) {
            reader_.fail(std::to_string(reader_.remaining()) + " trailing bytes after " +
                         std::to_string(count) + " values");
        }
        return values;
    }

    [[nodiscard]] std::size_t position() const noexcept { return reader_.position(); }

private:
    class DepthGuard {
    public:
        DepthGuard(std::size_t& depth, const ByteReader& reader) : depth_(depth) {
            if (++depth_ > GRAPHSER_MAX_DEPTH) {
                --depth_;
                reader.fail("nesting exceeds " + std::to_string(GRAPHSER_MAX_DEPTH) + " levels");
            }
        }
        ~DepthGuard() { --depth_; }

        DepthGuard(const DepthGuard&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;

    private:
        std::size_t& depth_;
    };

    Value read_value() { return read_tagged(reader_.read_tag()); }

    Value read_tagged(Tag tag) {
        switch (tag) {
            case Tag::Nil:
                return Value{};
            case Tag::True:
                return Value{true};
            case Tag::False:
                return Value{false};
            case Tag::Number:
                return Value{reader_.read_f64()};
            case Tag::String:
                return Value{reader_.read_string()};

            case Tag::Reference: {
                const uint64_t index = reader_.read_varint();
                if (index >= slots_.size()) {
                    reader_.fail("back-reference to unassigned slot " + std::to_string(index));
                }
                return slots_[static_cast<std::size_t>(index)];
            }

            case Tag::Table: {
                auto table = Table::make();
                reserve_slot(table);
                DepthGuard guard(depth_, reader_);
                read_table_body(*table);
                return table;
            }

            case Tag::TypedTable: {
                const TypeDescriptor& descriptor = lookup_type(TypeDescriptor::Kind::Plain);
                auto table = Table::make_typed(descriptor.name);
                reserve_slot(table);
                DepthGuard guard(depth_, reader_);
                read_table_body(*table);
                return table;
            }

            case Tag::Constructor:
                return read_constructor();

            case Tag::Template: {
                const TypeDescriptor& descriptor = lookup_type(TypeDescriptor::Kind::Template);
                auto table = Table::make_typed(descriptor.name);
                reserve_slot(table);
                DepthGuard guard(depth_, reader_);
                read_template_values(*table, *descriptor.layout);
                return table;
            }

            case Tag::TemplateBody:
                reader_.fail("template body outside of a nested template field");

            case Tag::Resource: {
                std::string name = reader_.read_string();
                const Value* resource = registry_.find_resource(name);
                if (!resource) {
                    detail::log_codec_error("decode", "unknown resource '" + name + "'", reader_.position());
                    throw UnknownResource(std::move(name));
                }
                reserve_slot(*resource);
                return *resource;
            }

            case Tag::Function: {
                const std::string payload = reader_.read_string();
                Value fn{registry_.function_codec().decode(payload)};
                if (fn.is_nil()) {
                    reader_.fail("function codec returned no function");
                }
                reserve_slot(fn);
                return fn;
            }
        }
        reader_.fail("unknown type tag " + std::to_string(static_cast<int>(tag)));
    }

    void read_table_body(Table& table) {
        const std::size_t array_size = reader_.read_count();
        for (std::size_t i = 0; i < array_size; ++i) {
            table.push_back(read_value());
        }
        const std::size_t field_count = reader_.read_count(2);
        read_pairs(table, field_count);
    }

    void read_pairs(Table& table, std::size_t count) {
        for (std::size_t i = 0; i < count; ++i) {
            Value key = read_value();
            if (!is_valid_key(key)) {
                reader_.fail("invalid table key of type " + std::string(type_name_of(key)));
            }
            table.set(key, read_value());
        }
    }

    Value read_constructor() {
        const TypeDescriptor& descriptor = lookup_type(TypeDescriptor::Kind::Hooks);

        // References to the object from inside its own constructor see this
        // empty placeholder; later ones see the deserialize hook's result.
        const std::size_t slot = reserve_slot(Table::make());

        Value constructor;
        {
            DepthGuard guard(depth_, reader_);
            constructor = read_value();
        }

        Value object = descriptor.deserialize(constructor);
        slots_[slot] = object;
        return object;
    }

    void read_template_values(Table& table, const Template& layout) {
        for (const auto& field : layout.fields()) {
            const Tag tag = reader_.read_tag();

            if (field.is_nested() && tag == Tag::TemplateBody) {
                auto sub = Table::make();
                reserve_slot(sub);
                DepthGuard guard(depth_, reader_);
                read_template_values(*sub, *field.nested);
                table.set(field.key, sub);
            } else {
                table.set(field.key, read_tagged(tag));
            }
        }

        const std::size_t remainder = reader_.read_count(2);
        read_pairs(table, remainder);
    }

    /// Read a type name and resolve it to a descriptor of the expected kind
    const TypeDescriptor& lookup_type(TypeDescriptor::Kind expected) {
        std::string name = reader_.read_string();
        const TypeDescriptor* descriptor = registry_.find_type(name);
        if (!descriptor) {
            detail::log_codec_error("decode", "unknown type '" + name + "'", reader_.position());
            throw UnknownType(std::move(name));
        }
        if (descriptor->kind != expected) {
            reader_.fail("type '" + name + "' was encoded as " + std::string(to_string(expected)) +
                         " but is registered as " + std::string(to_string(descriptor->kind)));
        }
        return *descriptor;
    }

    std::size_t reserve_slot(Value object) {
        slots_.push_back(std::move(object));
        return slots_.size() - 1;
    }

    const RegistrySnapshot& registry_;
    ByteReader reader_;
    std::vector<Value> slots_;
    std::size_t depth_ = 0;
};

} // anonymous namespace

std::vector<Value> decode(const uint8_t* data, std::size_t size, const RegistrySnapshot& registry) {
    Decoder decoder(registry, data, size);
    return decoder.read_stream(std::nullopt);
}

std::vector<Value> decode(const uint8_t* data, std::size_t size, const Registry& registry) {
    const RegistrySnapshot snapshot = registry.snapshot();
    return decode(data, size, snapshot);
}

std::vector<Value> decode(const ByteBuffer& buffer, const Registry& registry) {
    return decode(buffer.data(), buffer.size(), registry);
}

DecodeResult decode_n(const uint8_t* data, std::size_t size, std::size_t max_values, const Registry& registry) {
    const RegistrySnapshot snapshot = registry.snapshot();
    Decoder decoder(snapshot, data, size);
    DecodeResult result;
    result.values = decoder.read_stream(max_values);
    result.bytes_read = decoder.position();
    return result;
}

} // namespace graphser
