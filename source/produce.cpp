// produce.cpp
// Non-template entry points and JSON patch application

#include <draftcow/produce.h>

#include <draftcow/draft_state.h>
#include <draftcow/exceptions.h>
#include <draftcow/json_pointer.h>
#include <draftcow/log.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace draftcow {

Value produce(Heap& heap, const Value& initial, const ProducerOptions& options)
{
    DraftScope scope{heap, options};
    const Value draft = scope.create_draft(initial);
    return scope.finish_draft(draft);
}

DraftSession create_draft(Heap& heap, const Value& initial, const ProducerOptions& options)
{
    DraftSession session;
    session.scope = std::make_unique<DraftScope>(heap, options);
    session.draft = session.scope->create_draft(initial);
    return session;
}

bool is_draft(const Heap& heap, const Value& value)
{
    const DraftState* state = heap.draft_state(value);
    return state != nullptr && !state->revoked();
}

bool is_draftable(const Heap& heap, const Value& value)
{
    const Node* node = heap.find_node(value);
    return node != nullptr && node->type->draftable;
}

Value original(const Heap& heap, const Value& value)
{
    const DraftState* state = heap.draft_state(value);
    return state != nullptr ? Value{state->original()} : value;
}

// ============================================================
// Patch application
// ============================================================

namespace {

[[noreturn]] void fail(const Value& target, const Patch& patch, const std::string& reason)
{
    detail::log_draft_event("apply_patches", reason);
    throw PatchApplicationException(target, "Cannot apply '" + std::string(to_string(patch.op)) + "' at '" +
                                                patch.path + "': " + reason + ".");
}

std::size_t list_index(const Value& list, const Patch& patch, const std::string& segment, std::size_t limit)
{
    auto index = parse_array_index(segment);
    if (!index || *index >= limit) {
        fail(list, patch, "invalid list index '" + segment + "'");
    }
    return *index;
}

void require_property(const Node& node, const Value& target, const Patch& patch, const std::string& segment)
{
    if (!node.type->find_property(segment)) {
        fail(target, patch, "type '" + node.type->name + "' has no property '" + segment + "'");
    }
}

Value child_of(Heap& heap, const Value& container, const std::string& segment, const Patch& patch)
{
    const Node* node = heap.find_node(container);
    if (node == nullptr) {
        fail(container, patch, "the path traverses a scalar");
    }

    switch (node->kind()) {
        case NodeKind::object:
            require_property(*node, container, patch, segment);
            return ObjectProxy{heap, container}.get(segment);
        case NodeKind::list: {
            ProxyList list{heap, container};
            return list.at(list_index(container, patch, segment, list.size()));
        }
        case NodeKind::dictionary: {
            auto value = ProxyDictionary{heap, container}.try_get(segment);
            if (!value) {
                fail(container, patch, "missing key '" + segment + "'");
            }
            return *value;
        }
    }
    fail(container, patch, "unknown node kind");
}

void apply_to_object(Heap& heap, const Value& target, const Patch& patch, const std::string& name)
{
    require_property(heap.node(target.as_node()), target, patch, name);
    ObjectProxy object{heap, target};
    object.set(name, patch.op == PatchOp::remove ? Value{} : patch.value);
}

void apply_to_list(Heap& heap, const Value& target, const Patch& patch, const std::string& segment)
{
    ProxyList list{heap, target};
    switch (patch.op) {
        case PatchOp::add:
            if (segment == "-") {
                list.push_back(patch.value);
            } else {
                list.insert(list_index(target, patch, segment, list.size() + 1), patch.value);
            }
            return;
        case PatchOp::remove:
            list.remove_at(list_index(target, patch, segment, list.size()));
            return;
        case PatchOp::replace:
            list.set(list_index(target, patch, segment, list.size()), patch.value);
            return;
    }
}

void apply_to_dictionary(Heap& heap, const Value& target, const Patch& patch, const std::string& key)
{
    ProxyDictionary dictionary{heap, target};
    switch (patch.op) {
        case PatchOp::add:
            dictionary.set(key, patch.value);
            return;
        case PatchOp::remove:
            if (!dictionary.remove(key)) {
                fail(target, patch, "missing key '" + key + "'");
            }
            return;
        case PatchOp::replace:
            if (!dictionary.contains_key(key)) {
                fail(target, patch, "missing key '" + key + "'");
            }
            dictionary.set(key, patch.value);
            return;
    }
}

void apply_one(Heap& heap, Value& root, const Patch& patch)
{
    std::vector<std::string> segments;
    try {
        segments = parse_json_pointer(patch.path);
    } catch (const std::invalid_argument& e) {
        fail(root, patch, e.what());
    }

    if (segments.empty()) {
        if (patch.op == PatchOp::remove) {
            fail(root, patch, "the document root cannot be removed");
        }
        root = patch.value;
        return;
    }

    Value target = root;
    for (std::size_t i = 0; i + 1 < segments.size(); ++i) {
        target = child_of(heap, target, segments[i], patch);
    }

    const Node* node = heap.find_node(target);
    if (node == nullptr) {
        fail(target, patch, "the target is a scalar");
    }

    const std::string& last = segments.back();
    switch (node->kind()) {
        case NodeKind::object:     apply_to_object(heap, target, patch, last); break;
        case NodeKind::list:       apply_to_list(heap, target, patch, last); break;
        case NodeKind::dictionary: apply_to_dictionary(heap, target, patch, last); break;
    }
}

} // namespace

Value apply_patches(Heap& heap, const Value& base, const PatchDocument& patches, const ProducerOptions& options)
{
    DraftScope scope{heap, options};
    Value root = scope.create_draft(base);
    for (const auto& patch : patches) {
        apply_one(heap, root, patch);
    }
    return scope.finish_draft(root);
}

} // namespace draftcow
