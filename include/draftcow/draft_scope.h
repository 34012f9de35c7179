// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file draft_scope.h
/// @brief Lifetime container for the drafts of one produce() call.
///
/// A DraftScope creates drafts, and on finish reconciles them into an
/// immutable result:
/// - unchanged drafts collapse back to their originals (same identity)
/// - changed drafts are locked and become the new nodes
/// - plain nodes reachable from the result are locked
/// - per-draft patches are generated and flushed to the configured sinks
///
/// Every draft is revoked when the scope is disposed, whether the recipe
/// completed or threw. After a successful finish the drafts that did not
/// become part of the result are released back to the Heap; a scope that
/// did not finish keeps its drafts as read-only snapshots.
///
/// Scopes nest: drafting a draft of another scope makes that scope the
/// parent. Patches of the nested scope are then merged into the parent's
/// buffers, using the outer draft's path as the nested root path.
///
/// Usage:
/// @code
///   DraftScope scope{heap};
///   Value draft = scope.create_draft(person);
///   ObjectProxy{heap, draft}.set("FirstName", "Jane");
///   Value next = scope.finish_draft(draft);
/// @endcode

#pragma once

#include <draftcow/patch.h>
#include <draftcow/path_segment.h>
#include <draftcow/producer_options.h>
#include <draftcow/value.h>

#include <tsl/robin_map.h>
#include <tsl/robin_set.h>

#include <cstddef>
#include <memory>
#include <vector>

namespace draftcow {

class DraftState;
class Heap;
struct Node;

class DRAFTCOW_API DraftScope {
public:
    explicit DraftScope(Heap& heap, ProducerOptions options = ProducerOptions::defaults());

    /// Disposes the scope, revoking all drafts
    ~DraftScope();

    DraftScope(const DraftScope&) = delete;
    DraftScope& operator=(const DraftScope&) = delete;
    DraftScope(DraftScope&&) = delete;
    DraftScope& operator=(DraftScope&&) = delete;

    [[nodiscard]] Heap& heap() const noexcept { return *heap_; }
    [[nodiscard]] const ProducerOptions& options() const noexcept { return options_; }

    /// Scope owning the value this scope's root was drafted from, if any
    [[nodiscard]] DraftScope* parent() const noexcept { return parent_; }

    [[nodiscard]] bool is_finishing() const noexcept { return finishing_; }
    [[nodiscard]] bool is_disposed() const noexcept { return disposed_; }

    /// True when this scope, or a scope it is nested in, collects patches
    [[nodiscard]] bool collects_patches() const noexcept;

    /// Every draft created so far
    [[nodiscard]] const std::vector<NodeRef>& drafts() const noexcept { return drafts_; }

    /// Draft @p initial as the root of this scope.
    ///
    /// A plain @p initial is locked first. A draft of another scope makes
    /// that scope the parent of this one.
    /// @throws DraftException when @p initial is not a draftable node, is a
    ///         draft of this scope, or the scope already has a root
    Value create_draft(const Value& initial);

    /// Create a draft of @p source with the given path.
    /// @throws DraftException when @p source is not draftable or already a
    ///         draft of this scope
    Value create_proxy(const Value& source, std::shared_ptr<const PathSegment> path = nullptr);

    /// True when @p value is a live draft created by this scope
    [[nodiscard]] bool owns_draft(const Value& value) const;

    /// Reconcile @p draft (the root draft or a replacement value) into an
    /// immutable result, emit patches and dispose the scope.
    /// @throws std::invalid_argument when @p draft is null
    /// @throws CircularReferenceException when the result nests deeper
    ///         than ProducerOptions::max_depth
    Value finish_draft(const Value& draft);

    /// Revoke every draft. Safe to call more than once.
    void dispose() noexcept;

private:
    struct ReconcileContext {
        std::size_t depth = 0;

        [[nodiscard]] ReconcileContext deeper() const noexcept { return ReconcileContext{depth + 1}; }
    };

    struct PendingWrite {
        std::size_t index = 0;     ///< slot or item index
        std::string key;           ///< dictionary key
        Value value;
    };

    Value reconcile(const Value& value, ReconcileContext ctx);
    Value reconcile_draft(NodeRef ref, DraftState& state, ReconcileContext ctx);
    Value finish_object(NodeRef ref, DraftState& state, ReconcileContext ctx);
    Value finish_list(NodeRef ref, DraftState& state, ReconcileContext ctx);
    Value finish_dictionary(NodeRef ref, DraftState& state, ReconcileContext ctx);
    Value complete_draft(NodeRef ref, DraftState& state);

    /// Lock @p ref and reconcile every node it references
    Value freeze(NodeRef ref, ReconcileContext ctx);

    void generate_patches(DraftState& state);
    void finalize_patches();

    /// Equality used while generating patches: identity, a draft of the
    /// compared value, or the result of a nested scope derived from it
    [[nodiscard]] bool same_value(const Value& original_value, const Value& current_value) const;

    [[nodiscard]] Value resolve(const Value& value) const;

    /// True when the finished result kept @p ref as a new node
    [[nodiscard]] bool is_result_node(NodeRef ref) const;

    Heap* heap_;
    ProducerOptions options_;
    DraftScope* parent_ = nullptr;
    std::vector<NodeRef> drafts_;
    NodeRef root_{};
    std::shared_ptr<const PathSegment> root_path_;
    bool finishing_ = false;
    bool finished_ = false;
    bool disposed_ = false;

    PatchDocument patches_;
    PatchDocument inverse_patches_;

    /// Draft id -> reconciled value
    tsl::robin_map<NodeId, Value> resolved_;

    /// Drafts currently being reconciled (cycle detection)
    tsl::robin_set<NodeId> in_progress_;

    /// Result node of a nested scope -> the value it was derived from
    tsl::robin_map<NodeId, NodeRef> derived_;
};

} // namespace draftcow
