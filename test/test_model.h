// test_model.h - Person/Car/PhoneBook model shared by the draftcow tests

#pragma once

#include <draftcow/draftcow.h>

#include <string>
#include <vector>

namespace draftcow::test {

/// Heap with the test types registered
class TestHeap : public Heap {
public:
    TestHeap()
    {
        types().register_object("Person", {"FirstName", "LastName", "IsAdult", "FirstChild", "SecondChild", "Cars"});
        types().register_object("Car", {"Make", "Model", "Crashed"});
        types().register_object("PhoneBook", {"Entries"});
    }

    Value person(const std::string& first_name, const std::string& last_name, bool adult = true)
    {
        return make_object("Person", {{"FirstName", first_name}, {"LastName", last_name}, {"IsAdult", adult}});
    }

    Value car(const std::string& make, const std::string& model, bool crashed = false)
    {
        return make_object("Car", {{"Make", make}, {"Model", model}, {"Crashed", crashed}});
    }

    /// John Doe owning a Ferrari and a Mercedes, frozen
    Value john_with_cars()
    {
        Value cars = make_list({car("Ferrari", "250 LM"), car("Mercedes", "300 SL")});
        Value john = make_object("Person", {{"FirstName", "John"},
                                            {"LastName", "Doe"},
                                            {"IsAdult", true},
                                            {"Cars", cars}});
        return produce(*this, john);
    }

    /// Phone book with John and Jane Doe, frozen
    Value phone_book()
    {
        Value entries = make_dictionary({{"0800JOHNDOE", person("John", "Doe")},
                                         {"0800JANEDOE", person("Jane", "Doe")}});
        return produce(*this, make_object("PhoneBook", {{"Entries", entries}}));
    }

    [[nodiscard]] std::string string_at(const Value& object, std::string_view property) const
    {
        return get(object.as_node(), property).as_string();
    }

    [[nodiscard]] Value value_at(const Value& object, std::string_view property) const
    {
        return get(object.as_node(), property);
    }
};

/// Flatten a patch document to "op path" strings
inline std::vector<std::string> describe(const PatchDocument& patches)
{
    std::vector<std::string> result;
    for (const auto& patch : patches) {
        result.push_back(std::string(to_string(patch.op)) + " " + patch.path);
    }
    return result;
}

} // namespace draftcow::test
