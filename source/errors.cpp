// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <graphser/errors.h>

namespace graphser {

std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::MalformedStream:  return "MalformedStream";
        case ErrorCode::UnknownType:      return "UnknownType";
        case ErrorCode::UnknownResource:  return "UnknownResource";
        case ErrorCode::NameCollision:    return "NameCollision";
        case ErrorCode::ConstructorCycle: return "ConstructorCycle";
        case ErrorCode::UnsupportedValue: return "UnsupportedValue";
        case ErrorCode::InvalidKey:       return "InvalidKey";
        case ErrorCode::NestingTooDeep:   return "NestingTooDeep";
    }
    return "Unknown";
}

Error::Error(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

MalformedStream::MalformedStream(const std::string& message, std::size_t offset)
    : Error(ErrorCode::MalformedStream,
            "malformed stream at byte " + std::to_string(offset) + ": " + message),
      offset_(offset) {}

UnknownType::UnknownType(std::string name)
    : Error(ErrorCode::UnknownType, "type '" + name + "' is not registered"),
      name_(std::move(name)) {}

UnknownResource::UnknownResource(std::string name)
    : Error(ErrorCode::UnknownResource, "resource '" + name + "' is not registered"),
      name_(std::move(name)) {}

NameCollision::NameCollision(std::string name, const std::string& message)
    : Error(ErrorCode::NameCollision, message), name_(std::move(name)) {}

ConstructorCycle::ConstructorCycle(std::string type_name)
    : Error(ErrorCode::ConstructorCycle,
            "infinite loop in constructor: serialize hook of type '" + type_name +
                "' returned the object being serialized"),
      type_name_(std::move(type_name)) {}

UnsupportedValue::UnsupportedValue(const std::string& message)
    : Error(ErrorCode::UnsupportedValue, message) {}

InvalidKey::InvalidKey(const std::string& message)
    : Error(ErrorCode::InvalidKey, message) {}

NestingTooDeep::NestingTooDeep(std::size_t limit)
    : Error(ErrorCode::NestingTooDeep,
            "value graph nests deeper than " + std::to_string(limit) + " levels") {}

} // namespace graphser
