// test_nested.cpp - Tests for nested produce calls, cycles and depth limits

#include <catch2/catch_all.hpp>
#include "test_model.h"

using namespace draftcow;
using namespace draftcow::test;

// ============================================================
// Nested scopes
// ============================================================

TEST_CASE("Nested produce on a draft element", "[nested]") {
    TestHeap heap;
    Value john = heap.john_with_cars();
    Value cars = heap.value_at(john, "Cars");
    Value mercedes = heap.at(cars.as_node(), 1);

    auto crasher = producer(heap, [](ObjectProxy car) { car.set("Crashed", true); });

    Value result = produce(heap, john, [&](ObjectProxy p) {
        auto list = p.get_list("Cars");
        Value crashed = crasher(list.at(0));
        REQUIRE(heap.is_locked(crashed));
        list.set(0, crashed);
    });

    Value new_cars = heap.value_at(result, "Cars");
    REQUIRE(new_cars != cars);
    REQUIRE(heap.value_at(heap.at(new_cars.as_node(), 0), "Crashed") == Value{true});
    REQUIRE(heap.at(new_cars.as_node(), 1) == mercedes);
    REQUIRE(heap.value_at(heap.at(cars.as_node(), 0), "Crashed") == Value{false});
}

TEST_CASE("Nested produce on the root draft", "[nested]") {
    TestHeap heap;
    Value john = heap.john_with_cars();

    Value result = produce(heap, john, [&heap](ObjectProxy p) {
        return produce(heap, p.value(), [](ObjectProxy inner) {
            REQUIRE(inner.get("FirstName") == Value{"John"});
            inner.set("LastName", "Roe");
        });
    });

    REQUIRE(result != john);
    REQUIRE(heap.string_at(result, "FirstName") == "John");
    REQUIRE(heap.string_at(result, "LastName") == "Roe");
    REQUIRE(heap.value_at(result, "Cars") == heap.value_at(john, "Cars"));
    REQUIRE(heap.string_at(john, "LastName") == "Doe");
}

TEST_CASE("Nested produce sees the outer draft's edits", "[nested]") {
    TestHeap heap;
    Value john = heap.john_with_cars();

    Value result = produce(heap, john, [&heap](ObjectProxy p) {
        p.set("FirstName", "Jane");
        Value inner = produce(heap, p.value(), [](ObjectProxy q) {
            REQUIRE(q.get("FirstName") == Value{"Jane"});
            q.set("LastName", "Roe");
        });
        REQUIRE(heap.string_at(inner, "FirstName") == "Jane");
        return inner;
    });

    REQUIRE(heap.string_at(result, "FirstName") == "Jane");
    REQUIRE(heap.string_at(result, "LastName") == "Roe");
}

TEST_CASE("Unchanged nested produce returns the outer draft", "[nested]") {
    TestHeap heap;
    Value john = heap.john_with_cars();

    Value result = produce(heap, john, [&heap](ObjectProxy p) {
        Value inner = produce(heap, p.value(), [](ObjectProxy) {});
        REQUIRE(inner == p.value());
        REQUIRE(is_draft(heap, inner));
    });

    REQUIRE(result == john);
}

// ============================================================
// Cycles
// ============================================================

TEST_CASE("A draft referencing itself keeps the cycle", "[nested][cycle]") {
    TestHeap heap;
    Value john = heap.john_with_cars();

    Value result = produce(heap, john, [](ObjectProxy p) { p.set("FirstChild", p.value()); });

    REQUIRE(result != john);
    REQUIRE(heap.value_at(result, "FirstChild") == result);
    REQUIRE(heap.is_locked(result));
}

TEST_CASE("An unchanged draft in a cycle unrolls to its original", "[nested][cycle]") {
    TestHeap heap;
    Value child = heap.person("Jim", "Doe", false);
    Value john = heap.person("John", "Doe");
    ObjectProxy{heap, john}.set("FirstChild", child);
    john = produce(heap, john);

    Value result = produce(heap, john, [](ObjectProxy p) {
        p.get_object("FirstChild").set("FirstChild", p.value());
    });

    REQUIRE(result != john);
    Value new_child = heap.value_at(result, "FirstChild");
    REQUIRE(new_child != child);
    REQUIRE(heap.value_at(new_child, "FirstChild") == john);
    REQUIRE(heap.value_at(child, "FirstChild").is_null());
}

TEST_CASE("Cyclic new state is frozen", "[nested][cycle]") {
    TestHeap heap;
    Value a = heap.person("A", "Doe");
    Value b = heap.person("B", "Doe");
    ObjectProxy{heap, a}.set("FirstChild", b);
    ObjectProxy{heap, b}.set("FirstChild", a);

    REQUIRE(produce(heap, a) == a);
    REQUIRE(heap.is_locked(a));
    REQUIRE(heap.is_locked(b));
}

// ============================================================
// Depth limits
// ============================================================

TEST_CASE("Reconciliation enforces the maximum depth", "[nested][depth]") {
    TestHeap heap;

    Value head = heap.person("Child", "0");
    for (int i = 1; i < 10; ++i) {
        Value parent = heap.person("Parent", std::to_string(i));
        ObjectProxy{heap, parent}.set("FirstChild", head);
        head = parent;
    }

    SECTION("a shallow ceiling throws") {
        auto options = ProducerOptions::defaults().with_max_depth(5);
        REQUIRE_THROWS_AS(produce(heap, head, options), CircularReferenceException);
    }

    SECTION("the default ceiling accepts the chain") {
        REQUIRE(produce(heap, head) == head);
    }

    SECTION("new state added by a recipe is checked too") {
        Value john = heap.john_with_cars();
        auto options = ProducerOptions::defaults().with_max_depth(5);
        REQUIRE_THROWS_AS(produce(heap, john, [&](ObjectProxy p) { p.set("FirstChild", head); }, options),
                          CircularReferenceException);
    }
}
