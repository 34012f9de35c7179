// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file type_registry.h
/// @brief Registry of node types and their draftable shapes.
///
/// Every heap node points at a TypeDescriptor. The descriptor's kind selects
/// the draft variant (object, list or dictionary); object descriptors also
/// carry the ordered property list that drives slot indices, cloning and
/// object patch generation.
///
/// The built-in "list" and "dictionary" types always exist. Object types are
/// registered by name; a type registered as non-draftable can only be stored
/// in a draft when its name is listed in ProducerOptions::immutable_types.

#pragma once

#include <draftcow/draftcow_config.h>

#include "api.h"

#include <tsl/robin_map.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace draftcow {

enum class NodeKind : std::uint8_t {
    object,
    list,
    dictionary
};

[[nodiscard]] DRAFTCOW_API std::string_view to_string(NodeKind kind) noexcept;

// ============================================================
// Transparent hash/equal for robin_map heterogeneous lookup
// ============================================================

struct StringHash {
    using is_transparent = void;

    [[nodiscard]] std::size_t operator()(std::string_view sv) const noexcept {
        return std::hash<std::string_view>{}(sv);
    }
    [[nodiscard]] std::size_t operator()(const std::string& s) const noexcept {
        return std::hash<std::string_view>{}(s);
    }
};

struct StringEqual {
    using is_transparent = void;

    [[nodiscard]] bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
};

// ============================================================
// TypeDescriptor
// ============================================================

struct DRAFTCOW_API TypeDescriptor {
    std::string name;
    NodeKind kind = NodeKind::object;
    std::vector<std::string> properties;   ///< declaration order (objects only)
    bool draftable = true;

    [[nodiscard]] std::optional<std::size_t> find_property(std::string_view property) const;

    /// @throws std::out_of_range when the type has no such property
    [[nodiscard]] std::size_t property_index(std::string_view property) const;

    [[nodiscard]] std::size_t property_count() const noexcept { return properties.size(); }

private:
    friend class TypeRegistry;
    tsl::robin_map<std::string, std::size_t, StringHash, StringEqual> index_;
};

// ============================================================
// TypeRegistry
// ============================================================

class DRAFTCOW_API TypeRegistry {
public:
    static constexpr std::string_view list_type_name = "list";
    static constexpr std::string_view dictionary_type_name = "dictionary";

    TypeRegistry();
    ~TypeRegistry();

    TypeRegistry(const TypeRegistry&) = delete;
    TypeRegistry& operator=(const TypeRegistry&) = delete;

    /// Register an object type.
    /// Registering the same name again with the same shape returns the
    /// existing descriptor.
    /// @throws std::invalid_argument for a duplicate property, a clash with
    ///         an existing type of a different shape, or an empty name
    const TypeDescriptor& register_object(std::string name,
                                          std::vector<std::string> properties,
                                          bool draftable = true);

    const TypeDescriptor& register_object(std::string name,
                                          std::initializer_list<std::string_view> properties,
                                          bool draftable = true);

    [[nodiscard]] const TypeDescriptor* find(std::string_view name) const;

    /// @throws std::out_of_range for an unknown type name
    [[nodiscard]] const TypeDescriptor& at(std::string_view name) const;

    [[nodiscard]] const TypeDescriptor& list_type() const noexcept { return *list_; }
    [[nodiscard]] const TypeDescriptor& dictionary_type() const noexcept { return *dictionary_; }

    [[nodiscard]] std::size_t size() const noexcept { return types_.size(); }

private:
    tsl::robin_map<std::string, std::unique_ptr<TypeDescriptor>, StringHash, StringEqual> types_;
    const TypeDescriptor* list_ = nullptr;
    const TypeDescriptor* dictionary_ = nullptr;
};

} // namespace draftcow
