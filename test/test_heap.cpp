// test_heap.cpp - Tests for the node arena, effective reads and deep comparison

#include <catch2/catch_all.hpp>
#include "test_model.h"

using namespace draftcow;
using namespace draftcow::test;

// ============================================================
// Factories and reads
// ============================================================

TEST_CASE("Heap object factory", "[heap]") {
    TestHeap heap;

    SECTION("unset properties are null") {
        Value john = heap.person("John", "Doe");
        REQUIRE(heap.string_at(john, "FirstName") == "John");
        REQUIRE(heap.value_at(john, "IsAdult") == Value{true});
        REQUIRE(heap.value_at(john, "Cars").is_null());
        REQUIRE(heap.size(john.as_node()) == 6);
        REQUIRE(heap.slots(john.as_node()).size() == 6);
        REQUIRE_FALSE(heap.is_locked(john));
    }

    SECTION("unknown property names are rejected") {
        auto count = heap.node_count();
        REQUIRE_THROWS_AS(heap.make_object("Car", {{"Wheels", 4}}), std::out_of_range);
        REQUIRE(heap.node_count() == count);
    }

    SECTION("collection types are not objects") {
        REQUIRE_THROWS_AS(heap.make_object("list"), std::invalid_argument);
        REQUIRE_THROWS_AS(heap.make_object("Spaceship"), std::out_of_range);
    }

    SECTION("reads check the node kind and index") {
        Value car = heap.car("Ferrari", "250 LM");
        REQUIRE(heap.get(car.as_node(), std::size_t{1}) == Value{"250 LM"});
        REQUIRE_THROWS_AS(heap.get(car.as_node(), std::size_t{3}), std::out_of_range);
        REQUIRE_THROWS_AS(heap.at(car.as_node(), 0), std::invalid_argument);
        REQUIRE_THROWS_AS(heap.node(NodeRef{}), std::out_of_range);
    }
}

TEST_CASE("Heap list and dictionary factories", "[heap]") {
    TestHeap heap;

    SECTION("lists") {
        Value list = heap.make_list({1, 2, 3});
        REQUIRE(heap.kind(list.as_node()) == NodeKind::list);
        REQUIRE(heap.size(list.as_node()) == 3);
        REQUIRE(heap.at(list.as_node(), 2) == Value{3});
        REQUIRE_THROWS_AS(heap.at(list.as_node(), 3), std::out_of_range);

        Value from_vector = heap.make_list(std::vector<Value>{Value{"a"}, Value{"b"}});
        REQUIRE(heap.items(from_vector.as_node()).size() == 2);
    }

    SECTION("dictionaries enumerate sorted keys") {
        Value dictionary = heap.make_dictionary({{"b", 2}, {"c", 3}, {"a", 1}});
        REQUIRE(heap.sorted_keys(dictionary.as_node()) == std::vector<std::string>{"a", "b", "c"});
        REQUIRE(*heap.find(dictionary.as_node(), "b") == Value{2});
        REQUIRE(heap.find(dictionary.as_node(), "z") == nullptr);
        REQUIRE(heap.size(dictionary.as_node()) == 3);
    }

    SECTION("scalars have no node") {
        REQUIRE(heap.find_node(Value{42}) == nullptr);
        REQUIRE(heap.draft_state(Value{"text"}) == nullptr);
        REQUIRE_FALSE(heap.is_locked(Value{}));
    }
}

TEST_CASE("Heap reuses released slots", "[heap][release]") {
    TestHeap heap;
    Value first = heap.make_list({1});
    const NodeRef ref = first.as_node();
    const std::size_t live = heap.node_count();

    heap.release(ref);
    REQUIRE(heap.node_count() == live - 1);
    REQUIRE_FALSE(heap.contains(ref));
    REQUIRE_THROWS_AS(heap.node(ref), std::out_of_range);
    REQUIRE_THROWS_AS(heap.release(ref), std::out_of_range);
    REQUIRE(heap.draft_state(first) == nullptr);

    SECTION("a new node takes the slot under a new generation") {
        const std::size_t slots = heap.slot_count();
        Value second = heap.make_list({2});
        REQUIRE(heap.slot_count() == slots);
        REQUIRE(second.as_node().id == ref.id);
        REQUIRE(second != first);
        REQUIRE(heap.at(second.as_node(), 0) == Value{2});
        REQUIRE_THROWS_AS(heap.items(ref), std::out_of_range);
    }

    SECTION("invalid handles cannot be released") {
        REQUIRE_THROWS_AS(heap.release(NodeRef{}), std::out_of_range);
    }
}

TEST_CASE("Heap requires a type registry", "[heap]") {
    REQUIRE_THROWS_AS(Heap{std::shared_ptr<TypeRegistry>{}}, std::invalid_argument);

    auto types = std::make_shared<TypeRegistry>();
    types->register_object("Point", {"X", "Y"});
    Heap first{types};
    Heap second{types};
    REQUIRE(&first.types() == &second.types());
    REQUIRE(first.make_object("Point", {{"X", 1}}).is_node());
}

// ============================================================
// Deep comparison
// ============================================================

TEST_CASE("Heap deep_equals", "[heap][equality]") {
    TestHeap heap;

    SECTION("same content in distinct nodes") {
        Value a = heap.john_with_cars();
        Value b = heap.john_with_cars();
        REQUIRE(a != b);
        REQUIRE(heap.deep_equals(a, b));
    }

    SECTION("different content") {
        Value a = heap.person("John", "Doe");
        Value b = heap.person("John", "Roe");
        REQUIRE_FALSE(heap.deep_equals(a, b));
        REQUIRE_FALSE(heap.deep_equals(a, heap.car("John", "Doe")));
        REQUIRE_FALSE(heap.deep_equals(heap.make_list({1}), heap.make_list({1, 2})));
        REQUIRE_FALSE(heap.deep_equals(heap.make_dictionary({{"a", 1}}), heap.make_dictionary({{"b", 1}})));
    }

    SECTION("scalars compare by value") {
        REQUIRE(heap.deep_equals(Value{"x"}, Value{"x"}));
        REQUIRE_FALSE(heap.deep_equals(Value{1}, Value{int64_t{1}}));
    }

    SECTION("cyclic graphs terminate") {
        Value a = heap.person("Narcissus", "Doe");
        Value b = heap.person("Narcissus", "Doe");
        ObjectProxy{heap, a}.set("FirstChild", a);
        ObjectProxy{heap, b}.set("FirstChild", b);
        REQUIRE(heap.deep_equals(a, b));
    }

    SECTION("depth ceiling") {
        auto chain = [&heap] {
            Value head = heap.person("Child", "0");
            for (int i = 1; i < 8; ++i) {
                Value parent = heap.person("Parent", std::to_string(i));
                ObjectProxy{heap, parent}.set("FirstChild", head);
                head = parent;
            }
            return head;
        };
        Value a = chain();
        Value b = chain();
        REQUIRE(heap.deep_equals(a, b));
        REQUIRE_THROWS_AS(heap.deep_equals(a, b, 3), CircularReferenceException);
    }
}
