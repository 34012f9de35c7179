// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file clone_provider.h
/// @brief Copy-on-write hook used the first time a draft is written.

#pragma once

#include <draftcow/value.h>

namespace draftcow {

class Heap;

/// Copies the effective contents of an original node into its draft.
///
/// Implementations must not overwrite a slot of @p destination that already
/// holds a child draft: reading a property before writing another one
/// records the child in the draft's own storage, and that child must win.
class DRAFTCOW_API CloneProvider {
public:
    virtual ~CloneProvider() = default;

    virtual void clone(Heap& heap, NodeRef source, NodeRef destination) const = 0;
};

/// Default provider: copies object slots, list items or dictionary entries.
/// Thanks to immer structural sharing, collections copy in O(1).
class DRAFTCOW_API SlotCloneProvider final : public CloneProvider {
public:
    void clone(Heap& heap, NodeRef source, NodeRef destination) const override;
};

} // namespace draftcow
