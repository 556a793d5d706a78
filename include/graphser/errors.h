// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file errors.h
/// @brief Exception types raised by the codec and the registry.
///
/// Every failure is reported synchronously by throwing one of the classes
/// below. All derive from graphser::Error (itself a std::runtime_error), so
/// callers can either catch a specific kind or catch Error and inspect code().
///
/// @code
///   try {
///       auto values = graphser::decode(buffer);
///   } catch (const graphser::UnknownType& e) {
///       // a type name in the stream is not registered
///   } catch (const graphser::Error& e) {
///       std::cerr << graphser::to_string(e.code()) << ": " << e.what() << "\n";
///   }
/// @endcode

#pragma once

#include <graphser/api.h>

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace graphser {

enum class ErrorCode {
    MalformedStream,  ///< truncated input, invalid tag, length or back-reference
    UnknownType,      ///< type name absent from the registry
    UnknownResource,  ///< resource name absent from the registry
    NameCollision,    ///< name already bound to a different descriptor/object
    ConstructorCycle, ///< serialize hook returned the object being encoded
    UnsupportedValue, ///< value kind the current configuration cannot encode
    InvalidKey,       ///< nil or NaN used as a table key
    NestingTooDeep,   ///< encode recursion exceeded GRAPHSER_MAX_DEPTH
};

/// Human-readable name of an error code ("MalformedStream", ...)
[[nodiscard]] GRAPHSER_API std::string_view to_string(ErrorCode code) noexcept;

class GRAPHSER_API Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& message);

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

class GRAPHSER_API MalformedStream : public Error {
public:
    explicit MalformedStream(const std::string& message, std::size_t offset);

    /// Byte offset in the input where decoding stopped
    [[nodiscard]] std::size_t offset() const noexcept { return offset_; }

private:
    std::size_t offset_;
};

class GRAPHSER_API UnknownType : public Error {
public:
    explicit UnknownType(std::string name);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
};

class GRAPHSER_API UnknownResource : public Error {
public:
    explicit UnknownResource(std::string name);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
};

class GRAPHSER_API NameCollision : public Error {
public:
    NameCollision(std::string name, const std::string& message);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
};

class GRAPHSER_API ConstructorCycle : public Error {
public:
    explicit ConstructorCycle(std::string type_name);

    [[nodiscard]] const std::string& type_name() const noexcept { return type_name_; }

private:
    std::string type_name_;
};

class GRAPHSER_API UnsupportedValue : public Error {
public:
    explicit UnsupportedValue(const std::string& message);
};

class GRAPHSER_API InvalidKey : public Error {
public:
    explicit InvalidKey(const std::string& message);
};

class GRAPHSER_API NestingTooDeep : public Error {
public:
    explicit NestingTooDeep(std::size_t limit);
};

} // namespace graphser
