// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file function.h
/// @brief Function values and the pluggable function codec.
///
/// Functions are opaque to the engine. When a function is encoded, the
/// registry's FunctionCodec turns it into a byte payload, and on decode the
/// same codec turns the payload back into a Function. Only functions that
/// capture no state round-trip meaningfully.
///
/// The default codec refuses to encode anything. NamedFunctionCodec
/// serializes a function by its name and rebuilds it from a table of known
/// bodies:
///
/// @code
///   auto codec = std::make_shared<NamedFunctionCodec>();
///   codec->add("scale", [](const std::vector<Value>& args) {
///       return Value{args.at(0).as_number() * 2};
///   });
///   default_registry().set_function_codec(codec);
///
///   auto fn = codec->make("scale");
///   auto copy = decode(serialize(fn)).at(0);
///   copy.as_function()->call(21);   // 42
/// @endcode

#pragma once

#include <graphser/api.h>
#include <graphser/value.h>

#include <tsl/robin_map.h>

#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace graphser {

class GRAPHSER_API Function {
public:
    using Body = std::function<Value(const std::vector<Value>&)>;

    Function(std::string name, Body body) : name_(std::move(name)), body_(std::move(body)) {}

    [[nodiscard]] static FunctionPtr make(std::string name, Body body) {
        return std::make_shared<Function>(std::move(name), std::move(body));
    }

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    /// @throws std::bad_function_call if the function has no body
    Value operator()(const std::vector<Value>& args) const { return body_(args); }

    template <typename... Args>
    Value call(Args&&... args) const {
        return body_(std::vector<Value>{Value(std::forward<Args>(args))...});
    }

private:
    std::string name_;
    Body body_;
};

// ============================================================
// Function Codec
// ============================================================

class GRAPHSER_API FunctionCodec {
public:
    virtual ~FunctionCodec() = default;

    /// Produce the byte payload embedded in the stream
    [[nodiscard]] virtual std::string encode(const Function& fn) const = 0;

    /// Rebuild a function from a payload produced by encode()
    [[nodiscard]] virtual FunctionPtr decode(std::string_view payload) const = 0;
};

/// Default codec: every call throws UnsupportedValue
class GRAPHSER_API UnsupportedFunctionCodec final : public FunctionCodec {
public:
    [[nodiscard]] std::string encode(const Function& fn) const override;
    [[nodiscard]] FunctionPtr decode(std::string_view payload) const override;
};

/// Transparent string hash for heterogeneous lookup in the function table
struct FunctionNameHash {
    using is_transparent = void;

    [[nodiscard]] std::size_t operator()(std::string_view sv) const noexcept {
        return std::hash<std::string_view>{}(sv);
    }
};

struct FunctionNameEqual {
    using is_transparent = void;

    [[nodiscard]] bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
};

/// Codec for global functions known by name on both ends
class GRAPHSER_API NamedFunctionCodec final : public FunctionCodec {
public:
    /// Register (or replace) the body for name
    void add(std::string name, Function::Body body);

    /// Returns true if name was known
    bool remove(std::string_view name);

    [[nodiscard]] bool contains(std::string_view name) const;

    /// New Function bound to the registered body
    /// @throws UnsupportedValue if name is unknown
    [[nodiscard]] FunctionPtr make(std::string_view name) const;

    [[nodiscard]] std::string encode(const Function& fn) const override;
    [[nodiscard]] FunctionPtr decode(std::string_view payload) const override;

private:
    tsl::robin_map<std::string, Function::Body, FunctionNameHash, FunctionNameEqual> bodies_;
};

} // namespace graphser
