// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Value type stored in draftcow heaps.
///
/// A Value is either a scalar (null, bool, int32, int64, double, string)
/// or a NodeRef handle to an object, list or dictionary node living in a
/// Heap. Scalars compare by value, NodeRefs by identity: two NodeRefs are
/// equal only when they address the same node.
///
/// Node storage uses immer's persistent containers with the single-threaded
/// memory policy, so copying a node's slots, items or entries is O(1) and
/// copy-on-write never deep-copies.

#pragma once

#include <draftcow/draftcow_config.h>

#include "api.h"

#include <immer/flex_vector.hpp>
#include <immer/map.hpp>
#include <immer/memory_policy.hpp>
#include <immer/vector.hpp>

#include <cstdint>
#include <functional>
#include <limits>
#include <string>
#include <string_view>
#include <variant>

namespace draftcow {

// ============================================================
// Node handles
// ============================================================

using NodeId = std::uint32_t;

inline constexpr NodeId invalid_node_id = std::numeric_limits<NodeId>::max();

/// Handle to a node in a Heap. Equality is identity.
///
/// Slots of released nodes are reused; the generation tells a handle to the
/// old node apart from one to the node now living in the slot.
struct NodeRef {
    NodeId id = invalid_node_id;
    std::uint32_t generation = 0;

    [[nodiscard]] constexpr bool valid() const noexcept { return id != invalid_node_id; }

    bool operator==(const NodeRef&) const = default;
};

// ============================================================
// Value
// ============================================================

struct Value
{
    std::variant<std::monostate,
                 bool,
                 int32_t,
                 int64_t,
                 double,
                 std::string,
                 NodeRef>
        data;

    constexpr Value() noexcept : data(std::monostate{}) {}
    constexpr Value(bool v) noexcept : data(v) {}
    constexpr Value(int32_t v) noexcept : data(v) {}
    constexpr Value(int64_t v) noexcept : data(v) {}
    constexpr Value(double v) noexcept : data(v) {}
    Value(const std::string& v) : data(v) {}
    Value(std::string&& v) noexcept : data(std::move(v)) {}
    Value(const char* v) : data(std::in_place_type<std::string>, v) {}
    Value(std::string_view v) : data(std::in_place_type<std::string>, v) {}
    constexpr Value(NodeRef v) noexcept : data(v) {}

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data); }
    [[nodiscard]] bool is_node() const noexcept { return std::holds_alternative<NodeRef>(data); }
    [[nodiscard]] bool is_string() const noexcept { return std::holds_alternative<std::string>(data); }

    /// True for everything that is not a node handle (null included).
    [[nodiscard]] bool is_scalar() const noexcept { return !is_node(); }

    [[nodiscard]] NodeRef as_node(NodeRef default_val = {}) const {
        if (auto* p = get_if<NodeRef>()) return *p;
        return default_val;
    }

    [[nodiscard]] bool as_bool(bool default_val = false) const {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    [[nodiscard]] int32_t as_int(int32_t default_val = 0) const {
        if (auto* p = get_if<int32_t>()) return *p;
        return default_val;
    }

    [[nodiscard]] int64_t as_int64(int64_t default_val = 0) const {
        if (auto* p = get_if<int64_t>()) return *p;
        if (auto* p = get_if<int32_t>()) return *p;
        return default_val;
    }

    [[nodiscard]] double as_double(double default_val = 0.0) const {
        if (auto* p = get_if<double>()) return *p;
        if (auto* p = get_if<int64_t>()) return static_cast<double>(*p);
        if (auto* p = get_if<int32_t>()) return static_cast<double>(*p);
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string_view as_string_view() const noexcept {
        if (auto* p = get_if<std::string>()) return *p;
        return {};
    }

    bool operator==(const Value& other) const = default;
};

// ============================================================
// Memory Policy and Container Aliases
// ============================================================

/// Single-threaded memory policy: non-atomic refcount + no locks
using unsafe_memory_policy = immer::memory_policy<
    immer::unsafe_free_list_heap_policy<immer::cpp_heap>,
    immer::unsafe_refcount_policy,
    immer::no_lock_policy
>;

/// Object property slots, indexed by the property's declaration index
using ValueSlots = immer::vector<Value, unsafe_memory_policy>;

/// List items; flex_vector gives O(log n) insert and erase
using ValueList = immer::flex_vector<Value, unsafe_memory_policy>;

/// Dictionary entries (string keys)
using ValueMap = immer::map<std::string,
                            Value,
                            std::hash<std::string>,
                            std::equal_to<std::string>,
                            unsafe_memory_policy>;

} // namespace draftcow
