// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file proxy_list.h
/// @brief Index-based access to list nodes, drafting elements on read.
///
/// Reading an element of a list draft drafts it (and copies the list's
/// storage once) without marking the list changed. Every mutation marks
/// the list changed and copies the original first.
///
/// Element drafts are addressed by their index in the original list, so
/// their patches stay valid after insertions and removals. An element that
/// is not part of the original cannot be addressed; its own patches are
/// not emitted and the list reports it as a whole value instead.

#pragma once

#include <draftcow/heap.h>
#include <draftcow/value.h>

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace draftcow {

class CollectionDraftState;
class ObjectProxy;

class DRAFTCOW_API ProxyList {
public:
    /// @throws DraftException when @p value is not a list node
    ProxyList(Heap& heap, const Value& value);

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool empty() const { return size() == 0; }

    /// @throws std::out_of_range for an invalid index
    [[nodiscard]] Value at(std::size_t index) const;
    [[nodiscard]] Value operator[](std::size_t index) const { return at(index); }

    /// Element @p index as an object
    [[nodiscard]] ObjectProxy object_at(std::size_t index) const;

    // ===== Mutation (throws ImmutableException when read-only) =====

    void set(std::size_t index, Value value) const;
    void push_back(Value value) const;

    /// @throws std::out_of_range when @p index > size()
    void insert(std::size_t index, Value value) const;
    void remove_at(std::size_t index) const;

    /// Remove the first element equal to @p value; false when absent
    bool remove(const Value& value) const;
    void clear() const;

    // ===== Queries (compare stored values, never draft) =====

    [[nodiscard]] bool contains(const Value& value) const { return index_of(value).has_value(); }
    [[nodiscard]] std::optional<std::size_t> index_of(const Value& value) const;

    [[nodiscard]] bool is_draft() const noexcept { return state_ != nullptr; }
    [[nodiscard]] bool is_read_only() const;
    [[nodiscard]] Value original() const;
    [[nodiscard]] Value value() const noexcept { return Value{node_}; }
    [[nodiscard]] NodeRef node() const noexcept { return node_; }

    // ===== Iteration (drafts each element on access) =====

    /// Iterators hold their own copy of the handle
    class const_iterator;

    [[nodiscard]] const_iterator begin() const;
    [[nodiscard]] const_iterator end() const;

private:
    void check_writable(std::string_view action) const;
    void check_index(std::size_t index, std::size_t limit, std::string_view func) const;

    /// Replace the stored items; goes through the draft's copy-on-write
    template <typename Fn>
    void modify(std::string_view action, Fn&& fn) const;

    /// Path segment of element @p index, relative to the original list
    [[nodiscard]] std::optional<std::string> element_segment(std::size_t index) const;

    ProxyList() = default;

    Heap* heap_ = nullptr;
    NodeRef node_;
    std::shared_ptr<CollectionDraftState> state_;
};

class DRAFTCOW_API ProxyList::const_iterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Value;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = Value;

    const_iterator() = default;
    const_iterator(ProxyList list, std::size_t index) : list_(std::move(list)), index_(index) {}

    Value operator*() const { return list_.at(index_); }
    const_iterator& operator++() { ++index_; return *this; }
    const_iterator operator++(int) { auto copy = *this; ++index_; return copy; }

    bool operator==(const const_iterator& other) const { return index_ == other.index_; }
    bool operator!=(const const_iterator& other) const { return index_ != other.index_; }

private:
    ProxyList list_;
    std::size_t index_ = 0;
};

inline ProxyList::const_iterator ProxyList::end() const
{
    return const_iterator{*this, size()};
}

} // namespace draftcow
