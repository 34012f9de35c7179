// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file store.h
/// @brief Single-reducer state container backed by a lager store.
///
/// Reducers are meant to be producers:
///
/// @code
///   Store store{heap.make_object("Counter", {{"Value", 0}}),
///               producer(heap, [](ObjectProxy draft, const Value& action) {
///                   if (action.as_string_view() == "increment")
///                       draft.set("Value", draft.get("Value").as_int() + 1);
///               })};
///   auto unsubscribe = store.subscribe([](const Value& state) { ... });
///   store.dispatch("increment");
/// @endcode
///
/// A reducer must not touch the store: dispatching, reading the state or
/// changing subscriptions while a reducer runs throws DispatchException.

#pragma once

#include <draftcow/value.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string_view>

namespace draftcow {

/// Store access from inside a running reducer
class DRAFTCOW_API DispatchException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class DRAFTCOW_API Store {
public:
    using Reducer = std::function<Value(const Value& state, const Value& action)>;
    using Observer = std::function<void(const Value& state)>;

    /// Dispatched once on construction so the reducer can initialize state
    static constexpr std::string_view init_action = "draftcow.store.init";

    /// @throws std::invalid_argument when @p reducer is empty
    Store(Value initial_state, Reducer reducer);
    ~Store();

    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;

    /// Run the reducer, then notify every observer with the new state.
    /// Exceptions thrown by the reducer propagate; the state is unchanged.
    void dispatch(Value action);

    [[nodiscard]] Value state() const;

    /// @return Function that removes the observer again; a no-op once the
    ///         store has been destroyed
    [[nodiscard]] std::function<void()> subscribe(Observer observer);

    [[nodiscard]] std::size_t observer_count() const noexcept;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace draftcow
