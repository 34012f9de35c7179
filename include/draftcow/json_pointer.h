// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file json_pointer.h
/// @brief JSON Pointer (RFC 6901) helpers used for patch paths.
///
///   "/Cars/0/Make"  ->  ["Cars", "0", "Make"]
///   ""              ->  []  (whole document)
///   "/"             ->  [""]  (key is empty string)
///
/// Escape sequences: "~0" -> "~", "~1" -> "/". "-" addresses the slot
/// past the end of a list.

#pragma once

#include <draftcow/draftcow_config.h>

#include "api.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace draftcow {

// ============================================================
// Segment escaping
// ============================================================

/// Escape a segment: ~ -> ~0, / -> ~1
[[nodiscard]] DRAFTCOW_API std::string escape_pointer_segment(std::string_view segment);

/// Unescape a segment: ~1 -> /, ~0 -> ~
[[nodiscard]] DRAFTCOW_API std::string unescape_pointer_segment(std::string_view segment);

/// Parse a segment as a list index ("-", non-digits and indices that do
/// not fit std::size_t yield nullopt)
[[nodiscard]] DRAFTCOW_API std::optional<std::size_t> parse_array_index(std::string_view segment);

// ============================================================
// Pointer parsing and joining
// ============================================================

/// Split a pointer into unescaped segments.
/// @throws std::invalid_argument when a non-empty pointer does not start with '/'
[[nodiscard]] DRAFTCOW_API std::vector<std::string> parse_json_pointer(std::string_view pointer);

/// Build a pointer from unescaped segments
[[nodiscard]] DRAFTCOW_API std::string to_json_pointer(const std::vector<std::string>& segments);

/// Trim whitespace and make sure the path starts with exactly one '/'.
/// An empty base becomes "/".
[[nodiscard]] DRAFTCOW_API std::string normalize_base_path(std::string_view base_path);

/// Join a base path and one unescaped segment: "/Cars/" + "0" -> "/Cars/0"
[[nodiscard]] DRAFTCOW_API std::string path_join(std::string_view base_path, std::string_view segment);

} // namespace draftcow
