// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file patch_generator.h
/// @brief Compute forward and inverse patches for one changed draft.
///
/// Each generator compares a draft against its original and appends
/// operations for that single level only; changes inside child drafts are
/// reported by the child's own generator run. Equality between an original
/// value and a current value is pluggable: by default a draft compares
/// equal to its original, so drafting a child alone produces no patch.
///
/// Inverse operations are appended in forward order. The caller reverses
/// the whole inverse document once, after every generator has run.

#pragma once

#include <draftcow/lcs.h>
#include <draftcow/patch.h>
#include <draftcow/value.h>

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace draftcow {

class DraftState;
class Heap;

/// Predicate deciding whether @p original_value and @p current_value denote
/// the same value for patching purposes
using ValueEquality = std::function<bool(const Value& original_value, const Value& current_value)>;

class DRAFTCOW_API PatchGenerator {
public:
    virtual ~PatchGenerator() = default;

    /// Append the operations turning the draft's original into @p draft.
    /// Nothing is appended when the draft is unchanged.
    ///
    /// @param base_path JSON pointer of the draft; normalized to a single
    ///        leading '/' ("" and "/" both mean the document root)
    /// @param equals Equality override; default_equality() when empty
    /// @throws std::invalid_argument when @p draft is not a node
    /// @throws PatchGenerationException when @p draft has no draft state or
    ///         is not of the kind this generator handles
    void generate(const Heap& heap,
                  const Value& draft,
                  std::string_view base_path,
                  PatchDocument& patches,
                  PatchDocument& inverse_patches,
                  const ValueEquality& equals = {}) const;

    /// Identity, or a live draft whose original is the compared value
    [[nodiscard]] static ValueEquality default_equality(const Heap& heap);

protected:
    [[nodiscard]] virtual NodeKind handled_kind() const noexcept = 0;

    virtual void generate_changes(const Heap& heap,
                                  const DraftState& state,
                                  const std::string& base_path,
                                  PatchDocument& patches,
                                  PatchDocument& inverse_patches,
                                  const ValueEquality& equals) const = 0;
};

/// Property-level add/remove/replace, in declaration order.
/// A null value counts as an absent property.
class DRAFTCOW_API ObjectPatchGenerator final : public PatchGenerator {
protected:
    [[nodiscard]] NodeKind handled_kind() const noexcept override { return NodeKind::object; }

    void generate_changes(const Heap& heap,
                          const DraftState& state,
                          const std::string& base_path,
                          PatchDocument& patches,
                          PatchDocument& inverse_patches,
                          const ValueEquality& equals) const override;
};

/// Key-level add/remove/replace, keys in sorted order.
class DRAFTCOW_API DictionaryPatchGenerator final : public PatchGenerator {
protected:
    [[nodiscard]] NodeKind handled_kind() const noexcept override { return NodeKind::dictionary; }

    void generate_changes(const Heap& heap,
                          const DraftState& state,
                          const std::string& base_path,
                          PatchDocument& patches,
                          PatchDocument& inverse_patches,
                          const ValueEquality& equals) const override;
};

/// Index-level add/remove for lists.
///
/// Strips the common head and tail, handles pure removal and pure
/// insertion directly, and otherwise keeps the longest common subsequence
/// of the middle: elements outside it are removed back to front, then the
/// new elements are added front to back. An add past the last kept element
/// uses the "-" append index.
class DRAFTCOW_API CollectionPatchGenerator final : public PatchGenerator {
public:
    CollectionPatchGenerator();
    explicit CollectionPatchGenerator(std::shared_ptr<const LongestCommonSubsequence> lcs);

protected:
    [[nodiscard]] NodeKind handled_kind() const noexcept override { return NodeKind::list; }

    void generate_changes(const Heap& heap,
                          const DraftState& state,
                          const std::string& base_path,
                          PatchDocument& patches,
                          PatchDocument& inverse_patches,
                          const ValueEquality& equals) const override;

private:
    std::shared_ptr<const LongestCommonSubsequence> lcs_;
};

/// Shared generator instance for @p kind
[[nodiscard]] DRAFTCOW_API const PatchGenerator& patch_generator_for(NodeKind kind);

} // namespace draftcow
