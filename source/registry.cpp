// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file registry.cpp
/// @brief Type and resource registry

#include <graphser/diagnostics.h>
#include <graphser/errors.h>
#include <graphser/registry.h>

#include <stdexcept>

namespace graphser {

// ============================================================
// TypeDescriptor
// ============================================================

TypeDescriptorPtr TypeDescriptor::plain(std::string name)
{
    auto descriptor = std::make_shared<TypeDescriptor>();
    descriptor->name = std::move(name);
    descriptor->kind = Kind::Plain;
    return descriptor;
}

TypeDescriptorPtr TypeDescriptor::with_hooks(std::string name, SerializeHook serialize,
                                             DeserializeHook deserialize)
{
    if (!serialize || !deserialize) {
        throw std::invalid_argument("TypeDescriptor::with_hooks: both hooks are required for '" + name + "'");
    }
    auto descriptor = std::make_shared<TypeDescriptor>();
    descriptor->name = std::move(name);
    descriptor->kind = Kind::Hooks;
    descriptor->serialize = std::move(serialize);
    descriptor->deserialize = std::move(deserialize);
    return descriptor;
}

TypeDescriptorPtr TypeDescriptor::with_template(std::string name, Template layout)
{
    auto descriptor = std::make_shared<TypeDescriptor>();
    descriptor->name = std::move(name);
    descriptor->kind = Kind::Template;
    descriptor->layout = std::make_shared<const Template>(std::move(layout));
    return descriptor;
}

std::string_view to_string(TypeDescriptor::Kind kind) noexcept
{
    switch (kind) {
        case TypeDescriptor::Kind::Plain:    return "plain";
        case TypeDescriptor::Kind::Hooks:    return "hooks";
        case TypeDescriptor::Kind::Template: return "template";
    }
    return "unknown";
}

// ============================================================
// RegistrySnapshot
// ============================================================

RegistrySnapshot::RegistrySnapshot()
    : function_codec_(std::make_shared<UnsupportedFunctionCodec>())
{
}

const TypeDescriptor* RegistrySnapshot::find_type(const std::string& name) const
{
    if (auto* found = types_.find(name))
        return found->get();
    return nullptr;
}

const Value* RegistrySnapshot::find_resource(const std::string& name) const
{
    return resources_.find(name);
}

const std::string* RegistrySnapshot::resource_name_of(const void* identity) const
{
    if (!identity)
        return nullptr;
    return resource_names_.find(identity);
}

// ============================================================
// Registry
// ============================================================

void Registry::register_type(TypeDescriptorPtr descriptor)
{
    if (!descriptor || descriptor->name.empty()) {
        throw std::invalid_argument("Registry::register_type: descriptor must be non-null and named");
    }

    if (auto* existing = state_.types_.find(descriptor->name)) {
        if (existing->get() == descriptor.get())
            return;
        detail::log_registry_error("register_type", descriptor->name, "is already registered");
        throw NameCollision(descriptor->name,
                            "type '" + descriptor->name + "' is already registered");
    }

    auto name = descriptor->name;
    state_.types_ = std::move(state_.types_).set(std::move(name), std::move(descriptor));
}

bool Registry::unregister_type(std::string_view name)
{
    std::string key{name};
    if (!state_.types_.count(key)) {
        detail::log_registry_error("unregister_type", name, "is not registered");
        return false;
    }
    state_.types_ = std::move(state_.types_).erase(key);
    return true;
}

TypeDescriptorPtr Registry::find_type(std::string_view name) const
{
    if (auto* found = state_.types_.find(std::string{name}))
        return *found;
    return nullptr;
}

void Registry::register_resource(const Value& object, std::string name)
{
    const void* identity = object.identity();
    if (!identity) {
        throw UnsupportedValue("resource '" + name + "' must be a table or function, got " +
                               std::string(type_name_of(object)));
    }

    const Value* bound = state_.resources_.find(name);
    const std::string* bound_name = state_.resource_names_.find(identity);

    if (bound && bound->identity() == identity)
        return;
    if (bound) {
        detail::log_registry_error("register_resource", name, "is bound to another object");
        throw NameCollision(name, "resource '" + name + "' is already registered");
    }
    if (bound_name) {
        detail::log_registry_error("register_resource", name, "names an object already registered as '" + *bound_name + "'");
        throw NameCollision(name, "object is already registered as resource '" + *bound_name + "'");
    }

    state_.resource_names_ = std::move(state_.resource_names_).set(identity, name);
    state_.resources_ = std::move(state_.resources_).set(std::move(name), object);
}

bool Registry::unregister_resource(std::string_view name)
{
    std::string key{name};
    const Value* bound = state_.resources_.find(key);
    if (!bound) {
        detail::log_registry_error("unregister_resource", name, "is not registered");
        return false;
    }
    state_.resource_names_ = std::move(state_.resource_names_).erase(bound->identity());
    state_.resources_ = std::move(state_.resources_).erase(key);
    return true;
}

std::optional<Value> Registry::find_resource(std::string_view name) const
{
    if (auto* found = state_.resources_.find(std::string{name}))
        return *found;
    return std::nullopt;
}

std::optional<std::string> Registry::resource_name_of(const Value& object) const
{
    if (const std::string* name = state_.resource_name_of(object.identity()))
        return *name;
    return std::nullopt;
}

void Registry::set_function_codec(std::shared_ptr<const FunctionCodec> codec)
{
    if (!codec)
        codec = std::make_shared<UnsupportedFunctionCodec>();
    state_.function_codec_ = std::move(codec);
}

Registry& default_registry()
{
    static Registry registry;
    return registry;
}

} // namespace graphser
