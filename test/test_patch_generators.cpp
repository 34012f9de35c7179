// test_patch_generators.cpp - Tests for object, dictionary and list patch generators

#include <catch2/catch_all.hpp>
#include "test_model.h"

#include <cctype>

using namespace draftcow;
using namespace draftcow::test;

using Ops = std::vector<std::string>;

// ============================================================
// ObjectPatchGenerator
// ============================================================

TEST_CASE("ObjectPatchGenerator", "[patches][object]") {
    TestHeap heap;
    Value john = heap.john_with_cars();
    ObjectPatchGenerator generator;
    PatchDocument patches;
    PatchDocument inverse;

    DraftScope scope{heap};
    Value draft = scope.create_draft(john);
    ObjectProxy proxy{heap, draft};

    SECTION("add, remove and replace properties") {
        Value baby = heap.person("Baby", "Doe", false);
        proxy.set("FirstName", "Jane");
        proxy.set("LastName", Value{});
        proxy.set("FirstChild", baby);

        generator.generate(heap, draft, "", patches, inverse);

        REQUIRE(describe(patches) == Ops{"replace /FirstName", "remove /LastName", "add /FirstChild"});
        REQUIRE(patches[0].value == Value{"Jane"});
        REQUIRE(patches[1].value.is_null());
        REQUIRE(patches[2].value == baby);

        inverse.reverse();
        REQUIRE(describe(inverse) == Ops{"remove /FirstChild", "add /LastName", "replace /FirstName"});
        REQUIRE(inverse[1].value == Value{"Doe"});
        REQUIRE(inverse[2].value == Value{"John"});
    }

    SECTION("base paths are normalized") {
        proxy.set("IsAdult", false);

        generator.generate(heap, draft, "  People/0 ", patches, inverse);
        generator.generate(heap, draft, "/", patches, inverse);

        REQUIRE(describe(patches) == Ops{"replace /People/0/IsAdult", "replace /IsAdult"});
    }

    SECTION("drafted children compare equal to their originals") {
        (void)proxy.get_list("Cars");
        proxy.set("FirstName", "Jane");

        generator.generate(heap, draft, "", patches, inverse);

        REQUIRE(describe(patches) == Ops{"replace /FirstName"});
    }

    SECTION("unchanged drafts produce nothing") {
        (void)proxy.get_list("Cars");

        generator.generate(heap, draft, "", patches, inverse);

        REQUIRE(patches.empty());
        REQUIRE(inverse.empty());
    }

    SECTION("custom equality") {
        proxy.set("FirstName", "JOHN");
        auto case_blind = [](const Value& a, const Value& b) {
            auto upper = [](std::string s) {
                for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
                return s;
            };
            return upper(a.as_string()) == upper(b.as_string());
        };

        generator.generate(heap, draft, "", patches, inverse, case_blind);

        REQUIRE(patches.empty());
    }

    SECTION("invalid inputs") {
        REQUIRE_THROWS_AS(generator.generate(heap, Value{1}, "", patches, inverse), std::invalid_argument);
        REQUIRE_THROWS_AS(generator.generate(heap, john, "", patches, inverse), PatchGenerationException);

        Value cars = proxy.get("Cars");
        REQUIRE_THROWS_AS(generator.generate(heap, cars, "", patches, inverse), PatchGenerationException);
    }
}

// ============================================================
// DictionaryPatchGenerator
// ============================================================

TEST_CASE("DictionaryPatchGenerator", "[patches][dictionary]") {
    TestHeap heap;
    Value book = heap.phone_book();
    Value entries = heap.value_at(book, "Entries");
    Value jane = *heap.find(entries.as_node(), "0800JANEDOE");
    Value john = *heap.find(entries.as_node(), "0800JOHNDOE");

    DictionaryPatchGenerator generator;
    PatchDocument patches;
    PatchDocument inverse;

    DraftScope scope{heap};
    Value draft = scope.create_draft(entries);
    ProxyDictionary proxy{heap, draft};

    SECTION("remove and add keys") {
        Value baby = heap.person("Baby", "Doe", false);
        proxy.remove("0800JANEDOE");
        proxy.add("0800BABYDOE", baby);

        generator.generate(heap, draft, "/Entries", patches, inverse);

        REQUIRE(describe(patches) == Ops{"remove /Entries/0800JANEDOE", "add /Entries/0800BABYDOE"});
        REQUIRE(patches[1].value == baby);

        inverse.reverse();
        REQUIRE(describe(inverse) == Ops{"remove /Entries/0800BABYDOE", "add /Entries/0800JANEDOE"});
        REQUIRE(inverse[1].value == jane);
    }

    SECTION("replace a value") {
        Value johnny = heap.person("Johnny", "Doe");
        proxy.set("0800JOHNDOE", johnny);

        generator.generate(heap, draft, "/Entries", patches, inverse);

        REQUIRE(describe(patches) == Ops{"replace /Entries/0800JOHNDOE"});
        REQUIRE(patches[0].value == johnny);
        REQUIRE(inverse[0].value == john);
    }

    SECTION("keys are escaped") {
        proxy.set("a/b", 1);

        generator.generate(heap, draft, "", patches, inverse);

        REQUIRE(describe(patches) == Ops{"add /a~1b"});
    }
}

// ============================================================
// CollectionPatchGenerator
// ============================================================

TEST_CASE("CollectionPatchGenerator", "[patches][list]") {
    TestHeap heap;
    CollectionPatchGenerator generator;
    PatchDocument patches;
    PatchDocument inverse;

    auto list_of = [&heap](std::initializer_list<Value> items) { return produce(heap, heap.make_list(items)); };

    SECTION("appending") {
        Value cars = heap.value_at(heap.john_with_cars(), "Cars");
        DraftScope scope{heap};
        Value draft = scope.create_draft(cars);
        ProxyList proxy{heap, draft};
        proxy.push_back(heap.car("Porsche", "911"));
        proxy.push_back(heap.car("Jaguar", "E-Type"));

        generator.generate(heap, draft, "/Cars", patches, inverse);

        REQUIRE(describe(patches) == Ops{"add /Cars/-", "add /Cars/-"});
        inverse.reverse();
        REQUIRE(describe(inverse) == Ops{"remove /Cars/3", "remove /Cars/2"});
    }

    SECTION("inserting at the front") {
        Value cars = heap.value_at(heap.john_with_cars(), "Cars");
        DraftScope scope{heap};
        Value draft = scope.create_draft(cars);
        ProxyList proxy{heap, draft};
        proxy.insert(0, heap.car("Porsche", "911"));
        proxy.insert(1, heap.car("Jaguar", "E-Type"));

        generator.generate(heap, draft, "/Cars", patches, inverse);

        REQUIRE(describe(patches) == Ops{"add /Cars/0", "add /Cars/1"});
        inverse.reverse();
        REQUIRE(describe(inverse) == Ops{"remove /Cars/1", "remove /Cars/0"});
    }

    SECTION("removing a tail") {
        Value list = list_of({0, 1, 2, 3, 4});
        DraftScope scope{heap};
        Value draft = scope.create_draft(list);
        ProxyList proxy{heap, draft};
        proxy.remove_at(4);
        proxy.remove_at(3);
        proxy.remove_at(2);

        generator.generate(heap, draft, "", patches, inverse);

        REQUIRE(describe(patches) == Ops{"remove /4", "remove /3", "remove /2"});
        inverse.reverse();
        REQUIRE(describe(inverse) == Ops{"add /-", "add /-", "add /-"});
        REQUIRE(inverse[0].value == Value{2});
        REQUIRE(inverse[2].value == Value{4});
    }

    SECTION("removing from the middle") {
        Value list = list_of({0, 1, 2, 3});
        DraftScope scope{heap};
        Value draft = scope.create_draft(list);
        ProxyList{heap, draft}.remove_at(1);

        generator.generate(heap, draft, "", patches, inverse);

        REQUIRE(describe(patches) == Ops{"remove /1"});
        REQUIRE(describe(inverse) == Ops{"add /1"});
        REQUIRE(inverse[0].value == Value{1});
    }

    SECTION("mixed edits keep the longest common subsequence") {
        Value list = list_of({"F", "S", "R", "M"});
        DraftScope scope{heap};
        Value draft = scope.create_draft(list);
        ProxyList proxy{heap, draft};
        proxy.remove_at(0);
        proxy.remove_at(2);
        proxy.push_back("B");

        generator.generate(heap, draft, "", patches, inverse);

        REQUIRE(describe(patches) == Ops{"remove /3", "remove /0", "add /-"});
        REQUIRE(patches[2].value == Value{"B"});

        inverse.reverse();
        REQUIRE(describe(inverse) == Ops{"remove /2", "add /0", "add /-"});
        REQUIRE(inverse[1].value == Value{"F"});
        REQUIRE(inverse[2].value == Value{"M"});
    }

    SECTION("drafted elements are not reported") {
        Value cars = heap.value_at(heap.john_with_cars(), "Cars");
        DraftScope scope{heap};
        Value draft = scope.create_draft(cars);
        ProxyList proxy{heap, draft};
        (void)proxy.object_at(0);
        (void)proxy.object_at(1);
        proxy.remove_at(1);

        generator.generate(heap, draft, "/Cars", patches, inverse);

        REQUIRE(describe(patches) == Ops{"remove /Cars/1"});
    }

    SECTION("a custom LCS is required") {
        REQUIRE_THROWS_AS(CollectionPatchGenerator(nullptr), std::invalid_argument);
    }
}

TEST_CASE("patch_generator_for selects by node kind", "[patches]") {
    REQUIRE(dynamic_cast<const ObjectPatchGenerator*>(&patch_generator_for(NodeKind::object)) != nullptr);
    REQUIRE(dynamic_cast<const DictionaryPatchGenerator*>(&patch_generator_for(NodeKind::dictionary)) != nullptr);
    REQUIRE(dynamic_cast<const CollectionPatchGenerator*>(&patch_generator_for(NodeKind::list)) != nullptr);
}
