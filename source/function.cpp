// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file function.cpp
/// @brief Function codecs

#include <graphser/errors.h>
#include <graphser/function.h>

namespace graphser {

// ============================================================
// UnsupportedFunctionCodec
// ============================================================

std::string UnsupportedFunctionCodec::encode(const Function& fn) const {
    throw UnsupportedValue("cannot encode function '" + fn.name() + "': no function codec installed");
}

FunctionPtr UnsupportedFunctionCodec::decode(std::string_view /*payload*/) const {
    throw UnsupportedValue("cannot decode function: no function codec installed");
}

// ============================================================
// NamedFunctionCodec
// ============================================================

void NamedFunctionCodec::add(std::string name, Function::Body body) {
    auto it = bodies_.find(name);
    if (it != bodies_.end()) {
        it.value() = std::move(body);
    } else {
        bodies_.emplace(std::move(name), std::move(body));
    }
}

bool NamedFunctionCodec::remove(std::string_view name) {
    auto it = bodies_.find(name);
    if (it == bodies_.end()) return false;
    bodies_.erase(it);
    return true;
}

bool NamedFunctionCodec::contains(std::string_view name) const {
    return bodies_.find(name) != bodies_.end();
}

FunctionPtr NamedFunctionCodec::make(std::string_view name) const {
    auto it = bodies_.find(name);
    if (it == bodies_.end()) {
        throw UnsupportedValue("function '" + std::string(name) + "' is not in the function table");
    }
    return Function::make(std::string(name), it->second);
}

std::string NamedFunctionCodec::encode(const Function& fn) const {
    if (!contains(fn.name())) {
        throw UnsupportedValue("function '" + fn.name() + "' is not in the function table");
    }
    return fn.name();
}

FunctionPtr NamedFunctionCodec::decode(std::string_view payload) const {
    return make(payload);
}

} // namespace graphser
