// proxy_list.cpp
// Index-based access for list nodes and list drafts

#include <draftcow/proxy_list.h>

#include <draftcow/draft_state.h>
#include <draftcow/exceptions.h>
#include <draftcow/log.h>
#include <draftcow/object_proxy.h>

#include <stdexcept>

namespace draftcow {

ProxyList::ProxyList(Heap& heap, const Value& value)
    : heap_(&heap)
{
    const Node* node = heap.find_node(value);
    if (node == nullptr || node->kind() != NodeKind::list) {
        throw DraftException(value, "The value is not a list.");
    }
    node_ = value.as_node();
    state_ = std::static_pointer_cast<CollectionDraftState>(node->draft_state);
}

std::size_t ProxyList::size() const
{
    if (state_) {
        state_->check_revoked("getting the element count");
    }
    return heap_->size(node_);
}

void ProxyList::check_index(std::size_t index, std::size_t limit, std::string_view func) const
{
    if (index >= limit) {
        detail::log_index_error(func, index, "is out of range");
        throw std::out_of_range("Index " + std::to_string(index) + " is out of range (size " +
                                std::to_string(size()) + ")");
    }
}

void ProxyList::check_writable(std::string_view action) const
{
    if (state_) {
        state_->check_revoked(action);
    }
    if (heap_->node(node_).locked) {
        throw ImmutableException(value(), "Exception while " + std::string(action) + ": the list is immutable.");
    }
}

std::optional<std::string> ProxyList::element_segment(std::size_t index) const
{
    if (!state_->copied()) {
        return std::to_string(index);
    }

    const Value current = heap_->at(node_, index);
    const ValueList original = heap_->items(state_->original());
    if (index < original.size() && original[index] == current) {
        return std::to_string(index);
    }
    for (std::size_t i = 0; i < original.size(); ++i) {
        if (original[i] == current) {
            return std::to_string(i);
        }
    }
    return std::nullopt;
}

Value ProxyList::at(std::size_t index) const
{
    const std::string action = "getting element " + std::to_string(index);
    if (state_) {
        state_->check_revoked(action);
    }
    check_index(index, heap_->size(node_), "ProxyList::at");
    if (!state_) {
        return heap_->at(node_, index);
    }

    Heap& heap = *heap_;
    const NodeRef self = node_;
    return state_->get(
        action,
        [&] { return element_segment(index); },
        [&] { return heap.at(self, index); },
        [&](const Value& draft) {
            Node& node = heap.node(self);
            node.items = node.items.set(index, draft);
        },
        [&] { state_->copy_original(); });
}

ObjectProxy ProxyList::object_at(std::size_t index) const
{
    return ObjectProxy{*heap_, at(index)};
}

template <typename Fn>
void ProxyList::modify(std::string_view action, Fn&& fn) const
{
    check_writable(action);
    auto apply = [&] {
        Node& node = heap_->node(node_);
        node.items = fn(node.items);
    };
    if (!state_) {
        apply();
        return;
    }
    state_->modify(action, apply, [&] { state_->copy_original(); });
}

void ProxyList::set(std::size_t index, Value value) const
{
    check_writable("setting an element");
    check_index(index, size(), "ProxyList::set");
    modify("setting an element", [&](const ValueList& items) { return items.set(index, std::move(value)); });
}

void ProxyList::push_back(Value value) const
{
    modify("adding an element", [&](const ValueList& items) { return items.push_back(std::move(value)); });
}

void ProxyList::insert(std::size_t index, Value value) const
{
    check_writable("inserting an element");
    check_index(index, size() + 1, "ProxyList::insert");
    modify("inserting an element", [&](const ValueList& items) { return items.insert(index, std::move(value)); });
}

void ProxyList::remove_at(std::size_t index) const
{
    check_writable("removing an element");
    check_index(index, size(), "ProxyList::remove_at");
    modify("removing an element", [&](const ValueList& items) { return items.erase(index); });
}

bool ProxyList::remove(const Value& value) const
{
    check_writable("removing an element");
    const auto index = index_of(value);
    if (!index) {
        return false;
    }
    remove_at(*index);
    return true;
}

void ProxyList::clear() const
{
    modify("clearing the list", [](const ValueList&) { return ValueList{}; });
}

std::optional<std::size_t> ProxyList::index_of(const Value& value) const
{
    if (state_) {
        state_->check_revoked("searching the list");
    }
    const ValueList items = heap_->items(node_);
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (items[i] == value) {
            return i;
        }
        // An element drafted in place still matches its original
        const DraftState* draft = heap_->draft_state(items[i]);
        if (draft != nullptr && state_ && &draft->scope() == &state_->scope() &&
            Value{draft->original()} == value) {
            return i;
        }
    }
    return std::nullopt;
}

bool ProxyList::is_read_only() const
{
    return (state_ && state_->revoked()) || heap_->node(node_).locked;
}

Value ProxyList::original() const
{
    return state_ ? Value{state_->original()} : value();
}

ProxyList::const_iterator ProxyList::begin() const
{
    if (state_) {
        state_->check_revoked("enumerating the list");
    }
    return const_iterator{*this, 0};
}

} // namespace draftcow
