// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file object_proxy.h
/// @brief Property access to object nodes, drafting on read.
///
/// An ObjectProxy is a cheap handle (heap, node, draft state). On a draft
/// it implements the copy-on-write protocol: reads draft nested immutable
/// values lazily, the first write copies the original. On a plain node it
/// reads and writes directly, and on a locked node every write throws
/// ImmutableException.
///
/// The draft state is captured when the handle is created, so a handle
/// that outlives its scope throws DraftRevokedException on use.

#pragma once

#include <draftcow/heap.h>
#include <draftcow/proxy_dictionary.h>
#include <draftcow/proxy_list.h>
#include <draftcow/value.h>

#include <memory>
#include <string_view>

namespace draftcow {

class ObjectDraftState;

class DRAFTCOW_API ObjectProxy {
public:
    /// @throws DraftException when @p value is not an object node
    ObjectProxy(Heap& heap, const Value& value);

    /// @throws std::out_of_range for an unknown property
    /// @throws DraftRevokedException when the draft was revoked
    [[nodiscard]] Value get(std::string_view property) const;

    /// @throws ImmutableException when the object is locked
    /// @throws DraftRevokedException when the draft was revoked
    void set(std::string_view property, Value value) const;

    /// Typed access to a node-valued property.
    /// @throws DraftException when the property is null or of another kind
    [[nodiscard]] ObjectProxy get_object(std::string_view property) const;
    [[nodiscard]] ProxyList get_list(std::string_view property) const;
    [[nodiscard]] ProxyDictionary get_dictionary(std::string_view property) const;

    [[nodiscard]] bool is_draft() const noexcept { return state_ != nullptr; }

    /// Locked, or a draft that has been revoked
    [[nodiscard]] bool is_read_only() const;

    /// The draft's original, or the object itself when it is not a draft
    [[nodiscard]] Value original() const;

    [[nodiscard]] Value value() const noexcept { return Value{node_}; }
    [[nodiscard]] NodeRef node() const noexcept { return node_; }
    [[nodiscard]] Heap& heap() const noexcept { return *heap_; }
    [[nodiscard]] const TypeDescriptor& type() const noexcept { return *type_; }

private:
    Heap* heap_;
    NodeRef node_;
    const TypeDescriptor* type_ = nullptr;
    std::shared_ptr<ObjectDraftState> state_;
};

} // namespace draftcow
