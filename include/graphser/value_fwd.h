// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value_fwd.h
/// @brief Forward declarations for Value, Table and Function types
///
/// Lets headers declare functions taking these types without pulling in the
/// full value.h (and tsl::robin_map with it).

#pragma once

#include <graphser/graphser_config.h>

#include <immer/memory_policy.hpp>

#include <cstdint>
#include <memory>
#include <vector>

namespace graphser {

// ============================================================
// Memory Policy
// ============================================================

/// Memory policy for the registry's persistent maps
using unsafe_memory_policy = immer::memory_policy<immer::unsafe_free_list_heap_policy<immer::cpp_heap>,
                                                  immer::unsafe_refcount_policy, immer::no_lock_policy>;

// ============================================================
// Value Type Forward Declarations
// ============================================================

struct Value;
class Table;
class Function;

using TablePtr    = std::shared_ptr<Table>;
using FunctionPtr = std::shared_ptr<Function>;

/// @brief Byte buffer type for binary serialization
using ByteBuffer  = std::vector<uint8_t>;

class Template;
struct TypeDescriptor;
class Registry;
class RegistrySnapshot;

} // namespace graphser
