// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file patch.h
/// @brief JSON-Patch style operations produced while finishing drafts.
///
/// A PatchDocument is an ordered list of add/remove/replace operations whose
/// paths are RFC 6901 JSON pointers ("-" appends to a list). Forward
/// documents turn the original into the result; inverse documents turn the
/// result back into the original.

#pragma once

#include <draftcow/value.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace draftcow {

class Heap;

enum class PatchOp : std::uint8_t {
    add,
    remove,
    replace
};

[[nodiscard]] DRAFTCOW_API std::string_view to_string(PatchOp op) noexcept;

struct Patch {
    PatchOp op = PatchOp::add;
    std::string path;
    Value value;   ///< null for remove

    bool operator==(const Patch&) const = default;
};

class DRAFTCOW_API PatchDocument {
public:
    using value_type = Patch;
    using const_iterator = std::vector<Patch>::const_iterator;

    PatchDocument() = default;
    PatchDocument(std::initializer_list<Patch> operations) : operations_(operations) {}

    PatchDocument& add(std::string path, Value value);
    PatchDocument& remove(std::string path);
    PatchDocument& replace(std::string path, Value value);

    /// Append all operations of @p other, keeping their order
    void append(const PatchDocument& other);

    /// Reverse operation order in place (inverse documents are built in
    /// forward-application order and reversed once before use)
    void reverse();

    void clear() noexcept { operations_.clear(); }

    [[nodiscard]] std::size_t size() const noexcept { return operations_.size(); }
    [[nodiscard]] bool empty() const noexcept { return operations_.empty(); }
    [[nodiscard]] const Patch& operator[](std::size_t index) const { return operations_[index]; }
    [[nodiscard]] const std::vector<Patch>& operations() const noexcept { return operations_; }

    [[nodiscard]] const_iterator begin() const noexcept { return operations_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return operations_.end(); }

    bool operator==(const PatchDocument&) const = default;

private:
    friend class DraftScope;

    std::vector<Patch> operations_;
};

/// Render a document as a JSON array of {"op","path","value"} objects.
/// Node values are rendered through @p heap.
[[nodiscard]] DRAFTCOW_API std::string to_json(const Heap& heap, const PatchDocument& patches, bool compact = true);

} // namespace draftcow
