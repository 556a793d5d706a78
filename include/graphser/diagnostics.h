// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file diagnostics.h
/// @brief stderr diagnostics for codec and registry failures.
///
/// When GRAPHSER_VERBOSE_LOG is 1 (see graphser_config.h) the helpers below
/// print the failing operation, a message and the call site. Otherwise they
/// compile to nothing. They never throw.

#pragma once

#include <graphser/graphser_config.h>

#include <cstddef>
#include <iostream>
#include <source_location>
#include <string_view>

namespace graphser::detail {

inline void log_codec_error(
    std::string_view func,
    std::string_view message,
    std::size_t offset,
    std::source_location loc = std::source_location::current()) noexcept
{
#if GRAPHSER_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message << " at byte " << offset
              << " (" << loc.file_name() << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)offset;
    (void)loc;
#endif
}

inline void log_registry_error(
    std::string_view func,
    std::string_view name,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if GRAPHSER_VERBOSE_LOG
    std::cerr << "[" << func << "] name '" << name << "' " << reason
              << " (" << loc.file_name() << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)name;
    (void)reason;
    (void)loc;
#endif
}

} // namespace graphser::detail
