// heap.cpp
// Node arena, factories and effective reads through draft states

#include <draftcow/heap.h>

#include <draftcow/draft_state.h>
#include <draftcow/exceptions.h>
#include <draftcow/log.h>

#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>

namespace draftcow {

Heap::Heap()
    : Heap(std::make_shared<TypeRegistry>())
{
}

Heap::Heap(std::shared_ptr<TypeRegistry> types)
    : types_(std::move(types))
{
    if (!types_) {
        throw std::invalid_argument("Heap requires a type registry");
    }
}

Heap::~Heap() = default;

// ============================================================
// Factories
// ============================================================

NodeRef Heap::allocate(const TypeDescriptor& type)
{
    Node node;
    node.type = &type;
    if (type.kind == NodeKind::object) {
        node.slots = ValueSlots(type.property_count(), Value{});
    }

    if (!free_.empty()) {
        const NodeId id = free_.back();
        free_.pop_back();
        node.generation = nodes_[id].generation;
        nodes_[id] = std::move(node);
        return NodeRef{id, nodes_[id].generation};
    }

    if (nodes_.size() >= invalid_node_id) {
        throw std::length_error("Heap node capacity exhausted");
    }
    nodes_.push_back(std::move(node));
    return NodeRef{static_cast<NodeId>(nodes_.size() - 1), 0};
}

void Heap::release(NodeRef ref)
{
    if (!contains(ref)) {
        throw std::out_of_range("Invalid node handle");
    }
    Node& slot = nodes_[ref.id];
    const std::uint32_t next_generation = slot.generation + 1;
    slot = Node{};
    slot.generation = next_generation;
    free_.push_back(ref.id);
}

Value Heap::make_object(const TypeDescriptor& type,
                        std::initializer_list<std::pair<std::string_view, Value>> properties)
{
    if (type.kind != NodeKind::object) {
        throw std::invalid_argument("make_object: '" + type.name + "' is not an object type");
    }

    // Resolve names before allocating so a bad name leaves no orphan node
    ValueSlots slots(type.property_count(), Value{});
    for (const auto& [name, value] : properties) {
        slots = slots.set(type.property_index(name), value);
    }

    NodeRef ref = allocate(type);
    nodes_[ref.id].slots = std::move(slots);
    return Value{ref};
}

Value Heap::make_object(std::string_view type_name,
                        std::initializer_list<std::pair<std::string_view, Value>> properties)
{
    return make_object(types_->at(type_name), properties);
}

Value Heap::make_list(std::initializer_list<Value> items)
{
    return make_list(ValueList(items));
}

Value Heap::make_list(ValueList items)
{
    NodeRef ref = allocate(types_->list_type());
    nodes_[ref.id].items = std::move(items);
    return Value{ref};
}

Value Heap::make_list(const std::vector<Value>& items)
{
    return make_list(ValueList(items.begin(), items.end()));
}

Value Heap::make_dictionary(std::initializer_list<std::pair<std::string, Value>> entries)
{
    ValueMap map;
    for (const auto& [key, value] : entries) {
        map = map.set(key, value);
    }
    return make_dictionary(std::move(map));
}

Value Heap::make_dictionary(ValueMap entries)
{
    NodeRef ref = allocate(types_->dictionary_type());
    nodes_[ref.id].entries = std::move(entries);
    return Value{ref};
}

// ============================================================
// Node access
// ============================================================

Node& Heap::node(NodeRef ref)
{
    if (!contains(ref)) {
        throw std::out_of_range("Invalid node handle");
    }
    return nodes_[ref.id];
}

const Node& Heap::node(NodeRef ref) const
{
    if (!contains(ref)) {
        throw std::out_of_range("Invalid node handle");
    }
    return nodes_[ref.id];
}

Node* Heap::find_node(const Value& value)
{
    auto* ref = value.get_if<NodeRef>();
    return ref ? &node(*ref) : nullptr;
}

const Node* Heap::find_node(const Value& value) const
{
    auto* ref = value.get_if<NodeRef>();
    return ref ? &node(*ref) : nullptr;
}

bool Heap::is_locked(const Value& value) const
{
    const Node* n = find_node(value);
    return n && n->locked;
}

DraftState* Heap::draft_state(const Value& value) const
{
    auto* ref = value.get_if<NodeRef>();
    if (ref == nullptr || !contains(*ref)) {
        return nullptr;
    }
    return nodes_[ref->id].draft_state.get();
}

// ============================================================
// Effective reads
// ============================================================

Value Heap::get(NodeRef object, std::size_t index) const
{
    const Node& n = node(object);
    if (n.kind() != NodeKind::object) {
        throw std::invalid_argument("get: node is a " + std::string(to_string(n.kind())) + ", not an object");
    }
    if (index >= n.slots.size()) {
        detail::log_index_error("Heap::get", index, "is out of range");
        throw std::out_of_range("Property index out of range");
    }

    const Value& own = n.slots[index];
    if (!n.draft_state || n.draft_state->changed() || !own.is_null()) {
        return own;
    }
    // Unchanged object drafts hold only drafted children in their slots
    return get(n.draft_state->original(), index);
}

Value Heap::get(NodeRef object, std::string_view property) const
{
    return get(object, type_of(object).property_index(property));
}

ValueSlots Heap::slots(NodeRef object) const
{
    const Node& n = node(object);
    if (!n.draft_state) {
        return n.slots;
    }
    auto result = ValueSlots{}.transient();
    for (std::size_t i = 0; i < n.slots.size(); ++i) {
        result.push_back(get(object, i));
    }
    return result.persistent();
}

const Node& Heap::effective_collection(NodeRef ref) const
{
    const Node* n = &node(ref);
    while (n->draft_state) {
        const auto* state = static_cast<const CollectionDraftState*>(n->draft_state.get());
        if (state->copied()) {
            break;
        }
        n = &node(state->original());
    }
    return *n;
}

Value Heap::at(NodeRef list, std::size_t index) const
{
    const Node& n = effective_collection(list);
    if (n.kind() != NodeKind::list) {
        throw std::invalid_argument("at: node is not a list");
    }
    if (index >= n.items.size()) {
        detail::log_index_error("Heap::at", index, "is out of range");
        throw std::out_of_range("List index out of range");
    }
    return n.items[index];
}

ValueList Heap::items(NodeRef list) const
{
    const Node& n = effective_collection(list);
    if (n.kind() != NodeKind::list) {
        throw std::invalid_argument("items: node is not a list");
    }
    return n.items;
}

const Value* Heap::find(NodeRef dictionary, const std::string& key) const
{
    const Node& n = effective_collection(dictionary);
    if (n.kind() != NodeKind::dictionary) {
        throw std::invalid_argument("find: node is not a dictionary");
    }
    return n.entries.find(key);
}

ValueMap Heap::entries(NodeRef dictionary) const
{
    const Node& n = effective_collection(dictionary);
    if (n.kind() != NodeKind::dictionary) {
        throw std::invalid_argument("entries: node is not a dictionary");
    }
    return n.entries;
}

std::vector<std::string> Heap::sorted_keys(NodeRef dictionary) const
{
    const ValueMap map = entries(dictionary);
    std::vector<std::string> keys;
    keys.reserve(map.size());
    for (const auto& [key, value] : map) {
        keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

std::size_t Heap::size(NodeRef ref) const
{
    const Node& n = node(ref);
    switch (n.kind()) {
        case NodeKind::object:     return n.slots.size();
        case NodeKind::list:       return effective_collection(ref).items.size();
        case NodeKind::dictionary: return effective_collection(ref).entries.size();
    }
    return 0;
}

// ============================================================
// Structural comparison
// ============================================================

namespace {

struct DeepEquals {
    const Heap& heap;
    std::size_t max_depth;
    std::set<std::pair<NodeId, NodeId>> in_progress;

    bool operator()(const Value& a, const Value& b, std::size_t depth)
    {
        if (!a.is_node() || !b.is_node()) {
            return a == b;
        }
        const NodeRef ra = a.as_node();
        const NodeRef rb = b.as_node();
        if (ra == rb) {
            return true;
        }
        if (depth > max_depth) {
            throw CircularReferenceException(a, "Comparison exceeds the maximum depth of " +
                                                    std::to_string(max_depth) +
                                                    "; the graph is probably circular.");
        }

        const TypeDescriptor& type = heap.type_of(ra);
        if (&type != &heap.type_of(rb)) {
            return false;
        }
        if (!in_progress.emplace(ra.id, rb.id).second) {
            return true;
        }

        bool equal = true;
        switch (type.kind) {
            case NodeKind::object:
                for (std::size_t i = 0; equal && i < type.property_count(); ++i) {
                    equal = (*this)(heap.get(ra, i), heap.get(rb, i), depth + 1);
                }
                break;
            case NodeKind::list: {
                const ValueList la = heap.items(ra);
                const ValueList lb = heap.items(rb);
                equal = la.size() == lb.size();
                for (std::size_t i = 0; equal && i < la.size(); ++i) {
                    equal = (*this)(la[i], lb[i], depth + 1);
                }
                break;
            }
            case NodeKind::dictionary: {
                const ValueMap ma = heap.entries(ra);
                const ValueMap mb = heap.entries(rb);
                equal = ma.size() == mb.size();
                for (auto it = ma.begin(); equal && it != ma.end(); ++it) {
                    const Value* other = mb.find(it->first);
                    equal = other && (*this)(it->second, *other, depth + 1);
                }
                break;
            }
        }

        in_progress.erase({ra.id, rb.id});
        return equal;
    }
};

} // namespace

bool Heap::deep_equals(const Value& a, const Value& b, std::size_t max_depth) const
{
    DeepEquals compare{*this, max_depth, {}};
    return compare(a, b, 0);
}

} // namespace draftcow
