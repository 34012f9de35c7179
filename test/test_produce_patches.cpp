// test_produce_patches.cpp - Tests for patches collected by produce()

#include <catch2/catch_all.hpp>
#include "test_model.h"

using namespace draftcow;
using namespace draftcow::test;

using Ops = std::vector<std::string>;

TEST_CASE("produce_with_patches reports nested and root changes", "[patches][produce]") {
    TestHeap heap;
    Value john = heap.john_with_cars();

    auto out = produce_with_patches(heap, john, [](ObjectProxy p) {
        p.get_list("Cars").object_at(0).set("Crashed", true);
        p.set("LastName", "Smith");
    });

    REQUIRE(describe(out.patches) == Ops{"replace /Cars/0/Crashed", "replace /LastName"});
    REQUIRE(out.patches[0].value == Value{true});
    REQUIRE(out.patches[1].value == Value{"Smith"});

    REQUIRE(describe(out.inverse_patches) == Ops{"replace /LastName", "replace /Cars/0/Crashed"});
    REQUIRE(out.inverse_patches[0].value == Value{"Doe"});
    REQUIRE(out.inverse_patches[1].value == Value{false});

    REQUIRE(heap.string_at(out.result, "LastName") == "Smith");
}

TEST_CASE("Nested producers merge their patches", "[patches][nested]") {
    TestHeap heap;
    Value john = heap.john_with_cars();
    auto crasher = producer(heap, [](ObjectProxy car) { car.set("Crashed", true); });

    auto out = produce_with_patches(heap, john, [&](ObjectProxy p) {
        auto cars = p.get_list("Cars");
        for (std::size_t i = 0; i < cars.size(); ++i) {
            cars.set(i, crasher(cars.at(i)));
        }
        p.set("LastName", "Smith");
    });

    REQUIRE(describe(out.patches) ==
            Ops{"replace /Cars/0/Crashed", "replace /Cars/1/Crashed", "replace /LastName"});
    REQUIRE(describe(out.inverse_patches) ==
            Ops{"replace /LastName", "replace /Cars/1/Crashed", "replace /Cars/0/Crashed"});
    REQUIRE(out.inverse_patches[1].value == Value{false});
}

TEST_CASE("Patches for structural changes", "[patches][produce]") {
    TestHeap heap;
    Value john = heap.john_with_cars();

    SECTION("no changes, no patches") {
        auto out = produce_with_patches(heap, john, [](ObjectProxy p) { (void)p.get_list("Cars").at(1); });
        REQUIRE(out.result == john);
        REQUIRE(out.patches.empty());
        REQUIRE(out.inverse_patches.empty());
    }

    SECTION("new state is reported as a whole value") {
        Value baby = heap.person("Baby", "Doe", false);
        auto out = produce_with_patches(heap, john, [&](ObjectProxy p) {
            p.set("FirstChild", baby);
            p.get_object("FirstChild").set("FirstName", "Babette");
        });
        REQUIRE(describe(out.patches) == Ops{"add /FirstChild"});
        REQUIRE(out.patches[0].value == baby);
        REQUIRE(describe(out.inverse_patches) == Ops{"remove /FirstChild"});
    }

    SECTION("a replacement result replaces the document root") {
        Value jane = heap.person("Jane", "Doe");
        auto out = produce_with_patches(heap, john, [&](ObjectProxy) { return jane; });
        REQUIRE(out.result == jane);
        REQUIRE(out.patches.size() == 1);
        REQUIRE(out.patches[0].op == PatchOp::replace);
        REQUIRE(out.patches[0].path.empty());
        REQUIRE(out.patches[0].value == jane);
        REQUIRE(out.inverse_patches.size() == 1);
        REQUIRE(out.inverse_patches[0].value == john);
    }

    SECTION("list roots") {
        Value cars = heap.value_at(john, "Cars");
        auto out = produce_with_patches<ProxyList>(heap, cars, [&heap](ProxyList l) {
            l.push_back(heap.car("Porsche", "911"));
        });
        REQUIRE(describe(out.patches) == Ops{"add /-"});
        REQUIRE(describe(out.inverse_patches) == Ops{"remove /2"});
    }

    SECTION("moving a drafted element") {
        Value cars = heap.value_at(john, "Cars");
        Value ferrari = heap.at(cars.as_node(), 0);
        Value mercedes = heap.at(cars.as_node(), 1);
        auto out = produce_with_patches<ProxyList>(heap, cars, [](ProxyList l) {
            Value first = l.at(0);
            l.remove_at(0);
            l.push_back(first);
        });
        REQUIRE(describe(out.patches) == Ops{"remove /1", "add /0"});
        REQUIRE(out.patches[1].value == mercedes);
        REQUIRE(describe(out.inverse_patches) == Ops{"remove /0", "add /-"});
        REQUIRE(heap.at(out.result.as_node(), 1) == ferrari);
    }
}

TEST_CASE("Patch values never reference drafts", "[patches][dictionary]") {
    TestHeap heap;
    Value book = heap.phone_book();
    Value john = *heap.find(heap.value_at(book, "Entries").as_node(), "0800JOHNDOE");

    SECTION("a drafted entry stored under a new key") {
        auto out = produce_with_patches(heap, book, [](ObjectProxy p) {
            auto entries = p.get_dictionary("Entries");
            entries.set("0800JOHNNY", entries.at("0800JOHNDOE"));
        });
        REQUIRE(describe(out.patches) == Ops{"add /Entries/0800JOHNNY"});
        REQUIRE(out.patches[0].value == john);
        REQUIRE_FALSE(is_draft(heap, out.patches[0].value));
    }

    SECTION("drafting an entry alone emits nothing") {
        auto out = produce_with_patches(heap, book, [](ObjectProxy p) {
            (void)p.get_dictionary("Entries").at("0800JOHNDOE");
        });
        REQUIRE(out.result != book);
        REQUIRE(out.patches.empty());
        REQUIRE(out.inverse_patches.empty());
    }
}

TEST_CASE("Patch sinks accumulate across produce calls", "[patches][options]") {
    TestHeap heap;
    Value john = heap.john_with_cars();
    PatchDocument patches;
    PatchDocument inverse;
    auto options = ProducerOptions::defaults().with_patches(patches, inverse);
    REQUIRE(options.collects_patches());
    REQUIRE_FALSE(ProducerOptions::defaults().collects_patches());

    Value jane = produce(heap, john, [](ObjectProxy p) { p.set("FirstName", "Jane"); }, options);
    produce(heap, jane, [](ObjectProxy p) { p.set("LastName", "Roe"); }, options);

    REQUIRE(describe(patches) == Ops{"replace /FirstName", "replace /LastName"});
    REQUIRE(describe(inverse) == Ops{"replace /FirstName", "replace /LastName"});
}
