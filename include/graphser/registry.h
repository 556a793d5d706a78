// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file registry.h
/// @brief Type and resource registry consulted by the encoder and decoder.
///
/// The registry maps:
/// - type names to TypeDescriptors (plain, hook pair or template encoding)
/// - resource names to live objects, and those objects back to their names
/// - plus the FunctionCodec used for function values
///
/// State is held in persistent immer maps. Every mutation produces a new
/// state; snapshot() is O(1) and each encode/decode pass works on the
/// snapshot taken when it started.
///
/// The registry is NOT internally synchronized. When passes run on several
/// threads concurrently with register/unregister calls, guard the registry
/// externally (e.g. a shared lock held while taking a snapshot, exclusive
/// while mutating).
///
/// Usage:
/// @code
///   auto& reg = default_registry();
///   reg.register_type(TypeDescriptor::with_hooks("Vec",
///       [](const Value& v) { ... return constructor; },
///       [](const Value& c) { ... return object; }));
///   reg.register_resource(Value{atlas}, "texture-atlas");
/// @endcode

#pragma once

#include <graphser/graphser_config.h>

#include <graphser/api.h>
#include <graphser/function.h>
#include <graphser/type_template.h>
#include <graphser/value.h>

#include <immer/map.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace graphser {

// ============================================================
// TypeDescriptor
// ============================================================

struct GRAPHSER_API TypeDescriptor {
    enum class Kind {
        Plain,    ///< table encoded verbatim, type tag restored on decode
        Hooks,    ///< serialize hook produces a constructor, deserialize hook rebuilds
        Template, ///< field values written positionally
    };

    /// object -> constructor value
    using SerializeHook = std::function<Value(const Value&)>;
    /// constructor value -> object
    using DeserializeHook = std::function<Value(const Value&)>;

    std::string name;
    Kind kind = Kind::Plain;
    SerializeHook serialize;
    DeserializeHook deserialize;
    std::shared_ptr<const Template> layout;

    [[nodiscard]] static std::shared_ptr<const TypeDescriptor> plain(std::string name);

    /// @throws std::invalid_argument if either hook is empty
    [[nodiscard]] static std::shared_ptr<const TypeDescriptor> with_hooks(std::string name,
                                                                          SerializeHook serialize,
                                                                          DeserializeHook deserialize);

    [[nodiscard]] static std::shared_ptr<const TypeDescriptor> with_template(std::string name,
                                                                             Template layout);
};

using TypeDescriptorPtr = std::shared_ptr<const TypeDescriptor>;

[[nodiscard]] GRAPHSER_API std::string_view to_string(TypeDescriptor::Kind kind) noexcept;

// ============================================================
// RegistrySnapshot
// ============================================================

/// Immutable view of the registry used for the duration of one pass
class GRAPHSER_API RegistrySnapshot {
public:
    using TypeMap = immer::map<std::string, TypeDescriptorPtr, std::hash<std::string>,
                               std::equal_to<std::string>, unsafe_memory_policy>;
    using ResourceMap = immer::map<std::string, Value, std::hash<std::string>,
                                   std::equal_to<std::string>, unsafe_memory_policy>;
    using ResourceNameMap = immer::map<const void*, std::string, std::hash<const void*>,
                                       std::equal_to<const void*>, unsafe_memory_policy>;

    RegistrySnapshot();

    /// nullptr if name is not registered
    [[nodiscard]] const TypeDescriptor* find_type(const std::string& name) const;

    /// nullptr if name is not registered
    [[nodiscard]] const Value* find_resource(const std::string& name) const;

    /// Name under which the object at identity is registered, or nullptr
    [[nodiscard]] const std::string* resource_name_of(const void* identity) const;

    [[nodiscard]] const FunctionCodec& function_codec() const noexcept { return *function_codec_; }

    [[nodiscard]] std::size_t type_count() const noexcept { return types_.size(); }
    [[nodiscard]] std::size_t resource_count() const noexcept { return resources_.size(); }

private:
    friend class Registry;

    TypeMap types_;
    ResourceMap resources_;
    ResourceNameMap resource_names_;
    std::shared_ptr<const FunctionCodec> function_codec_;
};

// ============================================================
// Registry
// ============================================================

class GRAPHSER_API Registry {
public:
    Registry() = default;

    /// Register a type. Re-registering the same descriptor object is a no-op.
    /// @throws NameCollision if the name is bound to a different descriptor
    /// @throws std::invalid_argument if descriptor is null or unnamed
    void register_type(TypeDescriptorPtr descriptor);

    /// Returns false if name was not registered
    bool unregister_type(std::string_view name);

    [[nodiscard]] TypeDescriptorPtr find_type(std::string_view name) const;

    /// Bind a table or function to name. Re-binding the same pair is a no-op.
    /// @throws NameCollision if name or object is already bound elsewhere
    /// @throws UnsupportedValue if object has no identity
    void register_resource(const Value& object, std::string name);

    /// Returns false if name was not registered
    bool unregister_resource(std::string_view name);

    [[nodiscard]] std::optional<Value> find_resource(std::string_view name) const;

    /// Name the object is registered under, if it is a resource
    [[nodiscard]] std::optional<std::string> resource_name_of(const Value& object) const;

    /// nullptr restores the default codec (UnsupportedFunctionCodec)
    void set_function_codec(std::shared_ptr<const FunctionCodec> codec);

    [[nodiscard]] RegistrySnapshot snapshot() const { return state_; }

private:
    RegistrySnapshot state_;
};

/// Process-wide registry used by the codec entry points by default
[[nodiscard]] GRAPHSER_API Registry& default_registry();

} // namespace graphser
