// object_proxy.cpp
// Property access for object nodes and object drafts

#include <draftcow/object_proxy.h>

#include <draftcow/draft_state.h>
#include <draftcow/exceptions.h>
#include <draftcow/log.h>

namespace draftcow {

ObjectProxy::ObjectProxy(Heap& heap, const Value& value)
    : heap_(&heap)
{
    const Node* node = heap.find_node(value);
    if (node == nullptr || node->kind() != NodeKind::object) {
        throw DraftException(value, "The value is not an object.");
    }
    node_ = value.as_node();
    type_ = node->type;
    state_ = std::static_pointer_cast<ObjectDraftState>(node->draft_state);
}

Value ObjectProxy::get(std::string_view property) const
{
    const std::size_t index = type().property_index(property);
    if (!state_) {
        return heap_->get(node_, index);
    }

    Heap& heap = *heap_;
    const NodeRef self = node_;
    const NodeRef original = state_->original();
    return state_->get(
        index, property,
        [&] { return heap.node(self).slots[index]; },
        // The original may itself be a draft of an enclosing scope
        [&] { return ObjectProxy{heap, Value{original}}.get(property); },
        [&](const Value& draft) {
            Node& node = heap.node(self);
            node.slots = node.slots.set(index, draft);
        });
}

void ObjectProxy::set(std::string_view property, Value new_value) const
{
    const std::size_t index = type().property_index(property);
    if (!state_) {
        Node& node = heap_->node(node_);
        if (node.locked) {
            detail::log_draft_event("ObjectProxy::set", "write to an immutable object");
            throw ImmutableException(value(), "Cannot set property " + std::string(property) +
                                                  ": the object is immutable.");
        }
        node.slots = node.slots.set(index, std::move(new_value));
        return;
    }

    state_->set(
        property,
        [&] {
            Node& node = heap_->node(node_);
            node.slots = node.slots.set(index, std::move(new_value));
        },
        [&] { state_->copy_original(); });
}

ObjectProxy ObjectProxy::get_object(std::string_view property) const
{
    return ObjectProxy{*heap_, get(property)};
}

ProxyList ObjectProxy::get_list(std::string_view property) const
{
    return ProxyList{*heap_, get(property)};
}

ProxyDictionary ObjectProxy::get_dictionary(std::string_view property) const
{
    return ProxyDictionary{*heap_, get(property)};
}

bool ObjectProxy::is_read_only() const
{
    return (state_ && state_->revoked()) || heap_->node(node_).locked;
}

Value ObjectProxy::original() const
{
    return state_ ? Value{state_->original()} : value();
}

} // namespace draftcow
