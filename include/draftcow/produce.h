// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file produce.h
/// @brief produce()/producer() entry points.
///
/// produce() opens a DraftScope, drafts the initial value, runs the recipe
/// against a proxy over the root draft and finishes the scope:
///
/// @code
///   Value next = produce(heap, person, [](ObjectProxy p) {
///       p.set("FirstName", "Jane");
///   });
///
///   Value cars = produce<ProxyList>(heap, list, [](ProxyList l) {
///       l.push_back(car);
///   });
/// @endcode
///
/// A recipe either returns nothing, or a replacement Value that becomes the
/// result (a null replacement keeps the draft). If the recipe throws, the
/// scope is disposed and every draft is revoked.

#pragma once

#include <draftcow/draft_scope.h>
#include <draftcow/heap.h>
#include <draftcow/object_proxy.h>
#include <draftcow/patch.h>
#include <draftcow/producer_options.h>
#include <draftcow/proxy_dictionary.h>
#include <draftcow/proxy_list.h>

#include <concepts>
#include <memory>
#include <type_traits>
#include <utility>

namespace draftcow {

// ============================================================
// produce
// ============================================================

/// Lock @p initial (if plain) and return it unchanged
DRAFTCOW_API Value produce(Heap& heap,
                           const Value& initial,
                           const ProducerOptions& options = ProducerOptions::defaults());

template <typename Proxy = ObjectProxy, typename Recipe>
    requires std::invocable<Recipe&, Proxy&>
Value produce(Heap& heap,
              const Value& initial,
              Recipe&& recipe,
              const ProducerOptions& options = ProducerOptions::defaults())
{
    DraftScope scope{heap, options};
    const Value draft = scope.create_draft(initial);
    Proxy proxy{heap, draft};

    if constexpr (std::is_void_v<std::invoke_result_t<Recipe&, Proxy&>>) {
        recipe(proxy);
        return scope.finish_draft(draft);
    } else {
        Value replacement = recipe(proxy);
        return scope.finish_draft(replacement.is_null() ? draft : replacement);
    }
}

/// Curried produce: returns a callable `Value(const Value& base, args...)`
/// that runs `recipe(proxy, args...)`. With one extra argument the callable
/// converts to Store::Reducer.
template <typename Proxy = ObjectProxy, typename Recipe>
auto producer(Heap& heap, Recipe recipe, ProducerOptions options = ProducerOptions::defaults())
{
    return [&heap, recipe = std::move(recipe), options = std::move(options)](const Value& base,
                                                                          const auto&... args) -> Value {
        return produce<Proxy>(
            heap, base, [&](Proxy& draft) { return recipe(draft, args...); }, options);
    };
}

struct ProduceResult {
    Value result;
    PatchDocument patches;
    PatchDocument inverse_patches;
};

/// produce() that also returns the forward and inverse patches
template <typename Proxy = ObjectProxy, typename Recipe>
ProduceResult produce_with_patches(Heap& heap,
                                   const Value& initial,
                                   Recipe&& recipe,
                                   const ProducerOptions& options = ProducerOptions::defaults())
{
    ProduceResult out;
    out.result = produce<Proxy>(heap, initial, std::forward<Recipe>(recipe),
                                options.with_patches(out.patches, out.inverse_patches));
    return out;
}

// ============================================================
// Manual drafting
// ============================================================

/// A scope with its root draft, for edits spread over several calls
struct DraftSession {
    std::unique_ptr<DraftScope> scope;
    Value draft;

    /// Reconcile the root draft and dispose the scope
    Value finish() { return scope->finish_draft(draft); }
};

[[nodiscard]] DRAFTCOW_API DraftSession create_draft(Heap& heap,
                                                     const Value& initial,
                                                     const ProducerOptions& options = ProducerOptions::defaults());

// ============================================================
// Queries
// ============================================================

/// True when @p value is a live draft
[[nodiscard]] DRAFTCOW_API bool is_draft(const Heap& heap, const Value& value);

/// True when @p value is a node whose type can be drafted
[[nodiscard]] DRAFTCOW_API bool is_draftable(const Heap& heap, const Value& value);

/// The original of a live draft, or @p value itself
[[nodiscard]] DRAFTCOW_API Value original(const Heap& heap, const Value& value);

// ============================================================
// Patch application
// ============================================================

/// Apply @p patches to @p base through a produce call.
/// @throws PatchApplicationException for a malformed path, a missing
///         target or an operation the target does not support
[[nodiscard]] DRAFTCOW_API Value apply_patches(Heap& heap,
                                               const Value& base,
                                               const PatchDocument& patches,
                                               const ProducerOptions& options = ProducerOptions::defaults());

} // namespace draftcow
