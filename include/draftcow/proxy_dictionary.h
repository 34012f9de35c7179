// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file proxy_dictionary.h
/// @brief Keyed access to dictionary nodes, drafting values on read.
///
/// Same copy-on-write protocol as ProxyList; entry drafts are addressed by
/// their key. Keys are always enumerated in sorted order.

#pragma once

#include <draftcow/heap.h>
#include <draftcow/value.h>

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace draftcow {

class CollectionDraftState;
class ObjectProxy;

class DRAFTCOW_API ProxyDictionary {
public:
    /// @throws DraftException when @p value is not a dictionary node
    ProxyDictionary(Heap& heap, const Value& value);

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool empty() const { return size() == 0; }

    /// @throws std::out_of_range when the key is absent
    [[nodiscard]] Value at(const std::string& key) const;
    [[nodiscard]] Value operator[](const std::string& key) const { return at(key); }
    [[nodiscard]] ObjectProxy object_at(const std::string& key) const;

    /// Value for @p key (drafted like at()), or nullopt
    [[nodiscard]] std::optional<Value> try_get(const std::string& key) const;

    [[nodiscard]] bool contains_key(const std::string& key) const;

    /// Keys in sorted order
    [[nodiscard]] std::vector<std::string> keys() const;

    // ===== Mutation (throws ImmutableException when read-only) =====

    /// Insert or overwrite
    void set(const std::string& key, Value value) const;

    /// @throws std::invalid_argument when the key already exists
    void add(const std::string& key, Value value) const;

    /// False when the key was absent
    bool remove(const std::string& key) const;
    void clear() const;

    [[nodiscard]] bool is_draft() const noexcept { return state_ != nullptr; }
    [[nodiscard]] bool is_read_only() const;
    [[nodiscard]] Value original() const;
    [[nodiscard]] Value value() const noexcept { return Value{node_}; }
    [[nodiscard]] NodeRef node() const noexcept { return node_; }

    // ===== Iteration over (key, value) pairs in key order =====

    /// Iterators and value views hold their own copy of the handle
    class const_iterator;
    class ValueCollection;

    /// Snapshot of the keys at the time begin() is called
    [[nodiscard]] const_iterator begin() const;
    [[nodiscard]] const_iterator end() const;

    /// Read-only view over the values, in key order
    [[nodiscard]] ValueCollection values() const;

private:
    void check_writable(std::string_view action) const;

    template <typename Fn>
    void modify(std::string_view action, Fn&& fn) const;

    ProxyDictionary() = default;

    Heap* heap_ = nullptr;
    NodeRef node_;
    std::shared_ptr<CollectionDraftState> state_;
};

class DRAFTCOW_API ProxyDictionary::const_iterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = std::pair<std::string, Value>;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = value_type;

    const_iterator() = default;
    const_iterator(ProxyDictionary dictionary,
                   std::shared_ptr<const std::vector<std::string>> keys,
                   std::size_t index)
        : dictionary_(std::move(dictionary)), keys_(std::move(keys)), index_(index) {}

    value_type operator*() const;
    const_iterator& operator++() { ++index_; return *this; }
    const_iterator operator++(int) { auto copy = *this; ++index_; return copy; }

    bool operator==(const const_iterator& other) const { return index_ == other.index_; }
    bool operator!=(const const_iterator& other) const { return index_ != other.index_; }

private:
    ProxyDictionary dictionary_;
    std::shared_ptr<const std::vector<std::string>> keys_;
    std::size_t index_ = 0;
};

class DRAFTCOW_API ProxyDictionary::ValueCollection {
public:
    class const_iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Value;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = Value;

        const_iterator() = default;
        explicit const_iterator(ProxyDictionary::const_iterator it) : it_(std::move(it)) {}

        Value operator*() const { return (*it_).second; }
        const_iterator& operator++() { ++it_; return *this; }
        const_iterator operator++(int) { auto copy = *this; ++it_; return copy; }

        bool operator==(const const_iterator& other) const { return it_ == other.it_; }
        bool operator!=(const const_iterator& other) const { return it_ != other.it_; }

    private:
        ProxyDictionary::const_iterator it_;
    };

    explicit ValueCollection(ProxyDictionary dictionary) : dictionary_(std::move(dictionary)) {}

    [[nodiscard]] std::size_t size() const { return dictionary_.size(); }

    /// Compares stored values, never drafts; a draft matches its original
    [[nodiscard]] bool contains(const Value& value) const;

    /// Append every (drafted) value to @p out
    void copy_to(std::vector<Value>& out) const;

    [[nodiscard]] const_iterator begin() const { return const_iterator{dictionary_.begin()}; }
    [[nodiscard]] const_iterator end() const { return const_iterator{dictionary_.end()}; }

private:
    ProxyDictionary dictionary_;
};

inline ProxyDictionary::const_iterator ProxyDictionary::end() const
{
    return const_iterator{*this, nullptr, size()};
}

inline ProxyDictionary::ValueCollection ProxyDictionary::values() const
{
    return ValueCollection{*this};
}

} // namespace draftcow
