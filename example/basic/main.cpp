// main.cpp
// Garage Example - copy-on-write drafts, patches and undo/redo
//
// A person owns a list of cars. Every edit runs through produce_with_patches:
// the forward patches are printed, the inverse patches are kept on an undo
// stack, and undo/redo are dispatched as actions that apply the recorded
// documents.
//
// Edits are dispatched to a draftcow::Store whose reducer is a producer, so
// the same state also feeds an observer that prints it after each change.

#include <draftcow/draftcow.h>

#include <iostream>
#include <string>
#include <utility>
#include <vector>

using namespace draftcow;

// ============================================================
// Model
// ============================================================

void register_types(Heap& heap)
{
    heap.types().register_object("Person", {"FirstName", "LastName", "Cars"});
    heap.types().register_object("Car", {"Make", "Model", "Crashed"});
    heap.types().register_object("Edit", {"Kind", "Text", "Index"});
}

Value create_initial_state(Heap& heap)
{
    auto car = [&heap](const char* make, const char* model) {
        return heap.make_object("Car", {{"Make", make}, {"Model", model}, {"Crashed", false}});
    };

    auto cars = heap.make_list({car("Ferrari", "250 LM"), car("Mercedes", "300 SL")});
    return heap.make_object("Person", {{"FirstName", "John"}, {"LastName", "Doe"}, {"Cars", cars}});
}

// ============================================================
// History
// ============================================================

struct Change
{
    PatchDocument patches;
    PatchDocument inverse_patches;
};

struct History
{
    std::vector<Change> undo;
    std::vector<Change> redo;
};

void print_patches(const Heap& heap, const char* title, const PatchDocument& patches)
{
    std::cout << title << ": " << to_json(heap, patches) << "\n";
}

// ============================================================
// Reducer
// ============================================================

/// Applies one Edit object to the person draft, recording its patches.
/// The string actions "undo" and "redo" walk the recorded history.
auto make_reducer(Heap& heap, History& history)
{
    return [&heap, &history](const Value& state, const Value& action) -> Value {
        // Undo and redo replay a recorded document on the current state
        if (action == Value{"undo"}) {
            if (history.undo.empty()) {
                std::cout << "Nothing to undo\n";
                return state;
            }
            Value previous = apply_patches(heap, state, history.undo.back().inverse_patches);
            history.redo.push_back(std::move(history.undo.back()));
            history.undo.pop_back();
            return previous;
        }
        if (action == Value{"redo"}) {
            if (history.redo.empty()) {
                std::cout << "Nothing to redo\n";
                return state;
            }
            Value next = apply_patches(heap, state, history.redo.back().patches);
            history.undo.push_back(std::move(history.redo.back()));
            history.redo.pop_back();
            return next;
        }
        if (!action.is_node()) {
            return produce(heap, state);
        }

        ObjectProxy edit{heap, action};
        const std::string kind = edit.get("Kind").as_string();

        auto result = produce_with_patches(heap, state, [&](ObjectProxy person) {
            if (kind == "rename") {
                person.set("FirstName", edit.get("Text"));
            } else if (kind == "add_car") {
                person.get_list("Cars").push_back(
                    heap.make_object("Car", {{"Make", edit.get("Text")}, {"Model", "?"}, {"Crashed", false}}));
            } else if (kind == "crash") {
                auto cars = person.get_list("Cars");
                const auto index = static_cast<std::size_t>(edit.get("Index").as_int());
                if (index < cars.size()) {
                    cars.object_at(index).set("Crashed", true);
                }
            } else if (kind == "sell_first") {
                auto cars = person.get_list("Cars");
                if (!cars.empty()) {
                    cars.remove_at(0);
                }
            }
        });

        if (!result.patches.empty()) {
            print_patches(heap, "patches", result.patches);
            print_patches(heap, "inverse", result.inverse_patches);
            history.undo.push_back(Change{result.patches, result.inverse_patches});
            history.redo.clear();
        }
        return result.result;
    };
}

Value make_edit(Heap& heap, const char* kind, const std::string& text = {}, int index = 0)
{
    return produce(heap, heap.make_object("Edit", {{"Kind", kind}, {"Text", text}, {"Index", index}}));
}

// ============================================================
// Main Application
// ============================================================

int main()
{
    Heap heap;
    register_types(heap);

    History history;
    Store store{create_initial_state(heap), make_reducer(heap, history)};

    Value current = store.state();
    auto unsubscribe = store.subscribe([&current](const Value& state) { current = state; });

    std::cout << "=== Garage Example ===\n";
    std::cout << "Copy-on-write drafts with forward and inverse patches\n\n";

    while (true) {
        std::cout << "Current state:\n" << to_json(heap, current) << "\n";

        std::cout << "\n=== Operations ===\n";
        std::cout << "1. Rename\n";
        std::cout << "2. Add car\n";
        std::cout << "3. Crash car\n";
        std::cout << "4. Sell first car\n";
        std::cout << "U. Undo\n";
        std::cout << "R. Redo\n";
        std::cout << "\nQ. Quit\n";
        std::cout << "\nChoice: ";

        char choice;
        if (!(std::cin >> choice)) {
            break;
        }
        std::cin.ignore();

        try {
            switch (choice) {
            case '1': {
                std::cout << "Enter first name: ";
                std::string name;
                std::getline(std::cin, name);
                store.dispatch(make_edit(heap, "rename", name));
                break;
            }
            case '2': {
                std::cout << "Enter make: ";
                std::string make;
                std::getline(std::cin, make);
                store.dispatch(make_edit(heap, "add_car", make));
                break;
            }
            case '3': {
                std::cout << "Enter car index: ";
                int index = 0;
                std::cin >> index;
                std::cin.ignore();
                store.dispatch(make_edit(heap, "crash", {}, index));
                break;
            }
            case '4':
                store.dispatch(make_edit(heap, "sell_first"));
                break;
            case 'U':
            case 'u':
                store.dispatch("undo");
                break;
            case 'R':
            case 'r':
                store.dispatch("redo");
                break;
            case 'Q':
            case 'q':
                unsubscribe();
                std::cout << "Goodbye!\n";
                return 0;
            default:
                std::cout << "Invalid choice!\n";
            }
        } catch (const DraftException& e) {
            std::cout << "Edit failed: " << e.what() << "\n";
        }

        std::cout << "\n";
    }

    unsubscribe();
    return 0;
}
