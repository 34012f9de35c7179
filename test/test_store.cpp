// test_store.cpp - Tests for the lager-backed Store

#include <catch2/catch_all.hpp>
#include "test_model.h"

using namespace draftcow;
using namespace draftcow::test;

namespace {

Store::Reducer counter_reducer(Heap& heap)
{
    return producer(heap, [](ObjectProxy draft, const Value& action) {
        if (action.as_string_view() == "increment") {
            draft.set("Value", draft.get("Value").as_int() + 1);
        } else if (action.as_string_view() == "reset") {
            draft.set("Value", 0);
        }
    });
}

} // namespace

TEST_CASE("Store runs the reducer on construction", "[store]") {
    TestHeap heap;
    std::vector<std::string> actions;

    Store store{heap.person("John", "Doe"), [&](const Value& state, const Value& action) {
                    actions.push_back(action.as_string());
                    return state;
                }};

    REQUIRE(actions == std::vector<std::string>{std::string(Store::init_action)});
    store.dispatch("noop");
    REQUIRE(actions.size() == 2);
}

TEST_CASE("Store dispatches to a producer reducer", "[store]") {
    TestHeap heap;
    heap.types().register_object("Counter", {"Value"});
    Store store{heap.make_object("Counter", {{"Value", 0}}), counter_reducer(heap)};

    Value initial = store.state();
    REQUIRE(heap.is_locked(initial));

    store.dispatch("increment");
    store.dispatch("increment");
    REQUIRE(heap.value_at(store.state(), "Value") == Value{2});
    REQUIRE(heap.value_at(initial, "Value") == Value{0});

    SECTION("unknown actions keep the state") {
        Value before = store.state();
        store.dispatch("unknown");
        REQUIRE(store.state() == before);
    }
}

TEST_CASE("Store observers", "[store]") {
    TestHeap heap;
    heap.types().register_object("Counter", {"Value"});
    Store store{heap.make_object("Counter", {{"Value", 0}}), counter_reducer(heap)};

    std::vector<int> seen;
    auto unsubscribe = store.subscribe([&](const Value& state) { seen.push_back(heap.value_at(state, "Value").as_int()); });
    REQUIRE(store.observer_count() == 1);

    store.dispatch("increment");
    store.dispatch("increment");
    REQUIRE(seen == std::vector<int>{1, 2});

    unsubscribe();
    REQUIRE(store.observer_count() == 0);
    store.dispatch("increment");
    REQUIRE(seen.size() == 2);

    SECTION("observers may unsubscribe while notified") {
        std::function<void()> self_remove;
        int calls = 0;
        self_remove = store.subscribe([&](const Value&) {
            ++calls;
            self_remove();
        });
        store.dispatch("increment");
        store.dispatch("increment");
        REQUIRE(calls == 1);
    }

    SECTION("empty callbacks are rejected") {
        REQUIRE_THROWS_AS(store.subscribe(Store::Observer{}), std::invalid_argument);
        REQUIRE_THROWS_AS(Store(Value{}, Store::Reducer{}), std::invalid_argument);
    }
}

TEST_CASE("Unsubscribing after the store is gone does nothing", "[store]") {
    TestHeap heap;
    heap.types().register_object("Counter", {"Value"});

    int calls = 0;
    std::function<void()> unsubscribe;
    {
        Store store{heap.make_object("Counter", {{"Value", 0}}), counter_reducer(heap)};
        unsubscribe = store.subscribe([&](const Value&) { ++calls; });
        store.dispatch("increment");
    }

    REQUIRE(calls == 1);
    REQUIRE_NOTHROW(unsubscribe());
    REQUIRE_NOTHROW(unsubscribe());
}

TEST_CASE("Store rejects access from reducers", "[store]") {
    TestHeap heap;
    Store* self = nullptr;
    Store store{Value{0}, [&](const Value& state, const Value& action) {
                    const auto name = action.as_string_view();
                    if (name == "dispatch") {
                        self->dispatch("nested");
                    } else if (name == "state") {
                        (void)self->state();
                    } else if (name == "subscribe") {
                        (void)self->subscribe([](const Value&) {});
                    }
                    return Value{state.as_int() + 1};
                }};
    self = &store;
    REQUIRE(store.state() == Value{1});

    REQUIRE_THROWS_AS(store.dispatch("dispatch"), DispatchException);
    REQUIRE_THROWS_WITH(store.dispatch("state"), "Cannot get the State while dispatching.");
    REQUIRE_THROWS_AS(store.dispatch("subscribe"), DispatchException);

    // Failed dispatches leave the state alone and the store usable
    REQUIRE(store.state() == Value{1});
    store.dispatch("ok");
    REQUIRE(store.state() == Value{2});
}

TEST_CASE("Reducer exceptions propagate", "[store]") {
    TestHeap heap;
    Store store{Value{"idle"}, [](const Value& state, const Value& action) {
                    if (action.as_string_view() == "boom") {
                        throw std::runtime_error("reducer failed");
                    }
                    return Value{action.as_string()};
                }};

    REQUIRE_THROWS_WITH(store.dispatch("boom"), "reducer failed");
    REQUIRE(store.state() == Value{std::string(Store::init_action)});

    store.dispatch("running");
    REQUIRE(store.state() == Value{"running"});
}
