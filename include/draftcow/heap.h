// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file heap.h
/// @brief Arena of object, list and dictionary nodes addressed by NodeRef.
///
/// Object graphs live in a Heap and reference each other through NodeRef
/// handles, so cycles ("parent -> child -> parent") are plain data and need
/// no reference-counted back pointers.
///
/// A node is either:
/// - plain: freshly built, mutable, not yet finished
/// - locked: finished and immutable; every write through a proxy throws
/// - a draft: a private node with a DraftState attached, owned by a scope
///
/// Reads through the Heap always see a draft's effective contents: an
/// unchanged object draft reads through to its original for properties it
/// has not drafted yet, and a collection draft that has not copied its
/// storage reads the original's storage.

#pragma once

#include <draftcow/type_registry.h>
#include <draftcow/value.h>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace draftcow {

class DraftState;

struct Node {
    const TypeDescriptor* type = nullptr;
    ValueSlots slots;       ///< object properties, by declaration index
    ValueList items;        ///< list elements
    ValueMap entries;       ///< dictionary entries
    bool locked = false;
    std::shared_ptr<DraftState> draft_state;
    std::uint32_t generation = 0;   ///< bumped when the slot is released

    [[nodiscard]] NodeKind kind() const noexcept { return type->kind; }
};

class DRAFTCOW_API Heap {
public:
    Heap();
    explicit Heap(std::shared_ptr<TypeRegistry> types);
    ~Heap();

    Heap(const Heap&) = delete;
    Heap& operator=(const Heap&) = delete;

    [[nodiscard]] TypeRegistry& types() noexcept { return *types_; }
    [[nodiscard]] const TypeRegistry& types() const noexcept { return *types_; }

    // ===== Factories (plain, unlocked nodes) =====

    /// @throws std::invalid_argument when @p type is not an object type
    /// @throws std::out_of_range for an unknown property name
    Value make_object(const TypeDescriptor& type,
                      std::initializer_list<std::pair<std::string_view, Value>> properties = {});
    Value make_object(std::string_view type_name,
                      std::initializer_list<std::pair<std::string_view, Value>> properties = {});

    Value make_list(std::initializer_list<Value> items = {});
    Value make_list(ValueList items);
    Value make_list(const std::vector<Value>& items);

    Value make_dictionary(std::initializer_list<std::pair<std::string, Value>> entries = {});
    Value make_dictionary(ValueMap entries);

    /// Allocate an empty node of @p type (object slots sized to the type).
    /// Reuses a released slot when one is available.
    NodeRef allocate(const TypeDescriptor& type);

    /// Return the slot of @p ref to the arena. Every handle to the node is
    /// rejected afterwards, even once the slot holds a new node.
    /// @throws std::out_of_range for an invalid or already released handle
    void release(NodeRef ref);

    // ===== Node access =====

    /// @throws std::out_of_range for an invalid handle
    [[nodiscard]] Node& node(NodeRef ref);
    [[nodiscard]] const Node& node(NodeRef ref) const;

    /// Node behind @p value, or nullptr for scalars
    [[nodiscard]] Node* find_node(const Value& value);
    [[nodiscard]] const Node* find_node(const Value& value) const;

    /// True when @p ref names a live node
    [[nodiscard]] bool contains(NodeRef ref) const noexcept
    {
        return ref.valid() && ref.id < nodes_.size() && nodes_[ref.id].type != nullptr &&
               nodes_[ref.id].generation == ref.generation;
    }

    /// Live nodes
    [[nodiscard]] std::size_t node_count() const noexcept { return nodes_.size() - free_.size(); }

    /// Allocated slots, live or released
    [[nodiscard]] std::size_t slot_count() const noexcept { return nodes_.size(); }

    [[nodiscard]] NodeKind kind(NodeRef ref) const { return node(ref).kind(); }
    [[nodiscard]] const TypeDescriptor& type_of(NodeRef ref) const { return *node(ref).type; }

    [[nodiscard]] bool is_locked(const Value& value) const;

    /// Live draft state of @p value, or nullptr (also for released nodes)
    [[nodiscard]] DraftState* draft_state(const Value& value) const;

    // ===== Effective reads =====

    /// Object property by index / name
    [[nodiscard]] Value get(NodeRef object, std::size_t index) const;
    [[nodiscard]] Value get(NodeRef object, std::string_view property) const;

    /// All property values of an object, in declaration order
    [[nodiscard]] ValueSlots slots(NodeRef object) const;

    /// List element; @throws std::out_of_range
    [[nodiscard]] Value at(NodeRef list, std::size_t index) const;
    [[nodiscard]] ValueList items(NodeRef list) const;

    /// Dictionary entry or nullptr
    [[nodiscard]] const Value* find(NodeRef dictionary, const std::string& key) const;
    [[nodiscard]] ValueMap entries(NodeRef dictionary) const;

    /// Dictionary keys in sorted order
    [[nodiscard]] std::vector<std::string> sorted_keys(NodeRef dictionary) const;

    /// Element count of a list or dictionary, property count of an object
    [[nodiscard]] std::size_t size(NodeRef ref) const;

    // ===== Structural comparison =====

    /// Compare two graphs by content. Nodes already under comparison are
    /// assumed equal, so cyclic graphs terminate.
    /// @throws CircularReferenceException when nesting exceeds @p max_depth
    [[nodiscard]] bool deep_equals(const Value& a, const Value& b,
                                   std::size_t max_depth = DRAFTCOW_DEFAULT_MAX_DEPTH) const;

private:
    const Node& effective_collection(NodeRef ref) const;

    std::shared_ptr<TypeRegistry> types_;
    std::deque<Node> nodes_;
    std::vector<NodeId> free_;
};

} // namespace draftcow
