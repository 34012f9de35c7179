// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file exceptions.h
/// @brief Exceptions raised by drafting, finishing and patching.
///
/// All of them signal programming errors and are never retried. They
/// propagate out of produce()/finish_draft() after the scope has revoked
/// its drafts.

#pragma once

#include <draftcow/value.h>

#include <stdexcept>
#include <string>

namespace draftcow {

/// Operation invalid on a draft (not draftable, drafted twice, bad state).
class DRAFTCOW_API DraftException : public std::runtime_error {
public:
    DraftException(Value draft, const std::string& message)
        : std::runtime_error(message), draft_(std::move(draft)) {}

    /// The draft (or source value) the error refers to; may be null.
    [[nodiscard]] const Value& draft() const noexcept { return draft_; }

private:
    Value draft_;
};

/// Access to a draft whose scope has been closed.
class DRAFTCOW_API DraftRevokedException : public DraftException {
public:
    using DraftException::DraftException;
};

/// Mutation of a locked (finished) value.
class DRAFTCOW_API ImmutableException : public DraftException {
public:
    using DraftException::DraftException;
};

/// A graph nests deeper than ProducerOptions::max_depth.
class DRAFTCOW_API CircularReferenceException : public DraftException {
public:
    using DraftException::DraftException;
};

/// Invariant violated while generating patches.
class DRAFTCOW_API PatchGenerationException : public DraftException {
public:
    using DraftException::DraftException;
};

/// A patch document could not be applied to a value.
class DRAFTCOW_API PatchApplicationException : public DraftException {
public:
    using DraftException::DraftException;
};

} // namespace draftcow
