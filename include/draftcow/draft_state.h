// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file draft_state.h
/// @brief Per-draft bookkeeping: original, path, changed and revoked flags.
///
/// Every draft node carries a DraftState. The state decides, for each read,
/// whether the value must be wrapped in a child draft, and for each write,
/// whether the draft must first copy its original (copy-on-write, once).
///
/// Proxies supply small callables for the actual storage access:
/// - getter: read the draft's own storage
/// - original_getter: read the original's effective storage
/// - setter: store a freshly created child draft
/// - copy_on_write: copy the original's contents into the draft
///
/// This keeps the state independent of the node kind it decorates.

#pragma once

#include <draftcow/path_segment.h>
#include <draftcow/type_registry.h>
#include <draftcow/value.h>

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace draftcow {

class CloneProvider;
class DraftScope;
class Heap;

// ============================================================
// DraftState
// ============================================================

class DRAFTCOW_API DraftState {
public:
    DraftState(DraftScope& scope,
               NodeRef self,
               NodeRef original,
               std::shared_ptr<const PathSegment> path);
    virtual ~DraftState();

    DraftState(const DraftState&) = delete;
    DraftState& operator=(const DraftState&) = delete;

    /// Owning scope. Only valid while the state is not revoked.
    [[nodiscard]] DraftScope& scope() const noexcept { return *scope_; }

    [[nodiscard]] NodeRef self() const noexcept { return self_; }
    [[nodiscard]] NodeRef original() const noexcept { return original_; }

    /// Location of this draft below the root draft; null when the scope
    /// does not collect patches or the draft cannot be addressed
    [[nodiscard]] const std::shared_ptr<const PathSegment>& path() const noexcept { return path_; }

    [[nodiscard]] bool changed() const noexcept { return changed_; }
    [[nodiscard]] bool revoked() const noexcept { return revoked_; }

    [[nodiscard]] virtual NodeKind kind() const noexcept = 0;

    /// Flag the draft as changed without copying (reconciliation adopts
    /// the already copied storage)
    void mark_changed() noexcept { changed_ = true; }

    /// Invalidate the state; later reads and writes throw DraftRevokedException
    virtual void revoke() noexcept;

    /// Run the scope's clone provider from the original into this draft
    void copy_original() const;

protected:
    [[nodiscard]] Heap& heap() const;
    [[nodiscard]] const CloneProvider& clone_provider() const;

    /// Scalars, null and configured pass-through types are never drafted
    [[nodiscard]] bool passes_through(const Value& value) const;

    /// True when @p value is an immutable node that this scope has not
    /// drafted yet. Own drafts and new (plain) state are used as they are,
    /// and nothing is drafted once the scope is finishing.
    [[nodiscard]] bool needs_child_draft(const Value& value) const;

    /// Create a child draft of @p source in the owning scope
    [[nodiscard]] Value make_child_draft(const Value& source,
                                         std::shared_ptr<const PathSegment> path) const;

    /// Path of a child reached through @p segment; null when this draft has no path
    [[nodiscard]] std::shared_ptr<const PathSegment> child_path(std::string_view segment) const;

    [[noreturn]] void throw_revoked(std::string_view action) const;

    DraftScope* scope_;
    NodeRef self_;
    NodeRef original_;
    std::shared_ptr<const PathSegment> path_;
    bool changed_ = false;
    bool revoked_ = false;
};

// ============================================================
// ObjectDraftState
// ============================================================

class DRAFTCOW_API ObjectDraftState final : public DraftState {
public:
    struct Child {
        NodeRef node;
        std::weak_ptr<DraftState> state;
    };

    using DraftState::DraftState;

    [[nodiscard]] NodeKind kind() const noexcept override { return NodeKind::object; }

    /// Read property @p index.
    ///
    /// Unchanged drafts read through @p original_getter unless the property
    /// already holds a child draft in the draft's own slot. A value that
    /// still needs drafting becomes a child draft, is recorded as a child
    /// and stored through @p setter.
    template <typename Getter, typename OriginalGetter, typename Setter>
    Value get(std::size_t index,
              std::string_view property,
              Getter&& getter,
              OriginalGetter&& original_getter,
              Setter&& setter)
    {
        if (revoked_) {
            throw_revoked("getting property " + std::string(property));
        }

        Value result = changed_ ? getter() : original_getter();
        if (passes_through(result)) {
            return result;
        }

        if (!changed_) {
            Value memo = getter();
            if (!memo.is_null()) {
                result = std::move(memo);
            }
        }

        if (!needs_child_draft(result)) {
            return result;
        }

        result = make_child_draft(result, child_path(property));
        remember_child(index, result);
        setter(result);
        return result;
    }

    /// Write a property. The first write marks the draft changed and runs
    /// @p copy_on_write before @p setter.
    template <typename Setter, typename CopyOnWrite>
    void set(std::string_view property, Setter&& setter, CopyOnWrite&& copy_on_write)
    {
        if (revoked_) {
            throw_revoked("setting property " + std::string(property));
        }
        if (!changed_) {
            changed_ = true;
            copy_on_write();
        }
        setter();
    }

    /// Child drafts created by get(), keyed by property index
    [[nodiscard]] const std::map<std::size_t, Child>& children() const noexcept { return children_; }

    void revoke() noexcept override;

private:
    void remember_child(std::size_t index, const Value& child);

    std::map<std::size_t, Child> children_;
};

// ============================================================
// CollectionDraftState
// ============================================================

/// State shared by list and dictionary drafts. The draft's own storage is
/// empty until the first element is drafted or the first mutation happens;
/// until then reads go to the original.
class DRAFTCOW_API CollectionDraftState final : public DraftState {
public:
    CollectionDraftState(DraftScope& scope,
                         NodeRef self,
                         NodeRef original,
                         std::shared_ptr<const PathSegment> path,
                         NodeKind kind);

    [[nodiscard]] NodeKind kind() const noexcept override { return kind_; }

    /// True once the original's elements were copied into the draft
    [[nodiscard]] bool copied() const noexcept { return copied_; }

    /// Read an element. A value that needs drafting becomes a child draft,
    /// the storage is copied if needed, and the draft is stored through
    /// @p setter. Drafting an element does not mark the collection changed.
    ///
    /// @p segment yields the element's path segment, or nullopt when the
    /// element cannot be addressed relative to the original. It is only
    /// called when a child draft is created and this draft has a path.
    template <typename Segment, typename Getter, typename Setter, typename CopyOnWrite>
    Value get(std::string_view action,
              Segment&& segment,
              Getter&& getter,
              Setter&& setter,
              CopyOnWrite&& copy_on_write)
    {
        if (revoked_) {
            throw_revoked(action);
        }

        Value result = getter();
        if (passes_through(result) || !needs_child_draft(result)) {
            return result;
        }

        std::shared_ptr<const PathSegment> path;
        if (path_) {
            if (std::optional<std::string> name = segment()) {
                path = child_path(*name);
            }
        }
        result = make_child_draft(result, std::move(path));
        ensure_copy(copy_on_write);
        setter(result);
        return result;
    }

    /// Mutate the collection. Outside of finishing, marks the draft changed
    /// and copies the original once before running @p modify.
    template <typename Modify, typename CopyOnWrite>
    void modify(std::string_view action, Modify&& modify, CopyOnWrite&& copy_on_write)
    {
        if (revoked_) {
            throw_revoked(action);
        }
        if (!scope_finishing()) {
            changed_ = true;
            ensure_copy(copy_on_write);
        }
        modify();
    }

    /// Copy the original's elements into the draft if not done yet
    template <typename CopyOnWrite>
    void ensure_copy(CopyOnWrite&& copy_on_write)
    {
        if (!copied_) {
            copy_on_write();
            copied_ = true;
        }
    }

    /// Check revocation for operations that neither draft nor mutate
    void check_revoked(std::string_view action) const
    {
        if (revoked_) {
            throw_revoked(action);
        }
    }

private:
    [[nodiscard]] bool scope_finishing() const;

    NodeKind kind_;
    bool copied_ = false;
};

} // namespace draftcow
