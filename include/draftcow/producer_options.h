// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file producer_options.h
/// @brief Options controlling a drafting scope.

#pragma once

#include <draftcow/clone_provider.h>
#include <draftcow/type_registry.h>

#include <tsl/robin_set.h>

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>

namespace draftcow {

class PatchDocument;

struct DRAFTCOW_API ProducerOptions {
    /// Copy-on-write provider; SlotCloneProvider when null
    std::shared_ptr<const CloneProvider> clone_provider;

    /// Node type names that are never drafted (pass-through types)
    tsl::robin_set<std::string, StringHash, StringEqual> immutable_types;

    /// Reconciliation depth ceiling
    std::size_t max_depth = DRAFTCOW_DEFAULT_MAX_DEPTH;

    /// Patch sinks; both null unless patches are collected.
    /// Not owned: they must outlive the scope.
    PatchDocument* patches = nullptr;
    PatchDocument* inverse_patches = nullptr;

    /// Shared defaults (SlotCloneProvider, no pass-through types, no patches)
    [[nodiscard]] static const ProducerOptions& defaults();

    [[nodiscard]] ProducerOptions with_patches(PatchDocument& patches, PatchDocument& inverse_patches) const;
    [[nodiscard]] ProducerOptions with_immutable_types(std::initializer_list<std::string_view> type_names) const;
    [[nodiscard]] ProducerOptions with_max_depth(std::size_t depth) const;
    [[nodiscard]] ProducerOptions with_clone_provider(std::shared_ptr<const CloneProvider> provider) const;

    [[nodiscard]] bool collects_patches() const noexcept { return patches && inverse_patches; }

    [[nodiscard]] bool is_immutable_type(std::string_view type_name) const
    {
        return immutable_types.find(type_name) != immutable_types.end();
    }

    /// The configured provider, or the shared SlotCloneProvider
    [[nodiscard]] const CloneProvider& effective_clone_provider() const;
};

} // namespace draftcow
