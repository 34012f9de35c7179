// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file serialization.h
/// @brief JSON rendering of values and node graphs.
///
/// Objects render their properties in declaration order, dictionaries
/// their keys in sorted order. Drafts render their effective contents.

#pragma once

#include <draftcow/value.h>

#include <cstddef>
#include <string>

namespace draftcow {

class Heap;

/// Escape a string for use inside a JSON string literal (no quotes added)
[[nodiscard]] DRAFTCOW_API std::string json_escape_string(const std::string& s);

/// Render @p value as JSON.
/// @param compact If true, no whitespace; otherwise indented output
/// @throws CircularReferenceException when nesting exceeds @p max_depth
[[nodiscard]] DRAFTCOW_API std::string to_json(const Heap& heap,
                                               const Value& value,
                                               bool compact = false,
                                               std::size_t max_depth = DRAFTCOW_DEFAULT_MAX_DEPTH);

} // namespace draftcow
