// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path_segment.h
/// @brief Immutable linked path from a draft root to a nested draft.
///
/// Each draft created while patches are collected carries a PathSegment.
/// Children share their parent's chain, so building a path is O(1) and the
/// JSON pointer is only rendered when a patch generator needs it.

#pragma once

#include <draftcow/draftcow_config.h>

#include "api.h"

#include <memory>
#include <string>

namespace draftcow {

class DRAFTCOW_API PathSegment {
public:
    explicit PathSegment(std::string value);
    PathSegment(std::shared_ptr<const PathSegment> parent, std::string value);

    [[nodiscard]] const std::shared_ptr<const PathSegment>& parent() const noexcept { return parent_; }
    [[nodiscard]] const std::string& value() const noexcept { return value_; }

    /// Render the chain as a JSON pointer. An empty root segment renders as
    /// "", so root() -> "" and root()/"Cars"/"0" -> "/Cars/0".
    [[nodiscard]] std::string to_string() const;

    /// Number of segments including this one
    [[nodiscard]] std::size_t depth() const noexcept;

    /// The empty root segment used for the root draft of a scope
    [[nodiscard]] static std::shared_ptr<const PathSegment> root();

    /// Append one child segment to @p parent
    [[nodiscard]] static std::shared_ptr<const PathSegment> child(std::shared_ptr<const PathSegment> parent,
                                                                  std::string value);

private:
    std::shared_ptr<const PathSegment> parent_;
    std::string value_;
};

} // namespace draftcow
