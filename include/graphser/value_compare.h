// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// value_compare.h - Structural comparison of value graphs

#pragma once

#include <graphser/api.h>
#include <graphser/value.h>

namespace graphser {

/// Deep structural equality of two value graphs.
///
/// Tables are equal when they carry the same type tag and the same non-nil
/// entries. Beyond content, the sharing pattern must match: each table or
/// function of `a` is paired with exactly one of `b`, so a table reached
/// twice on one side must be the same table on the other side. Cycles
/// therefore terminate, and a cyclic graph never equals an unrolled copy.
///
/// Functions compare by name. Numbers compare with ==, so NaN != NaN.
[[nodiscard]] GRAPHSER_API bool deep_equal(const Value& a, const Value& b);

} // namespace graphser
