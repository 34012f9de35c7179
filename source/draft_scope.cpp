// draft_scope.cpp
// Draft creation, reconciliation and patch collection

#include <draftcow/draft_scope.h>

#include <draftcow/draft_state.h>
#include <draftcow/exceptions.h>
#include <draftcow/heap.h>
#include <draftcow/log.h>
#include <draftcow/patch_generator.h>

#include <stdexcept>
#include <utility>

namespace draftcow {

namespace {

std::string not_draftable_message(const TypeDescriptor& type)
{
    return "Type '" + type.name + "' is not draftable.";
}

} // namespace

DraftScope::DraftScope(Heap& heap, ProducerOptions options)
    : heap_(&heap)
    , options_(std::move(options))
{
}

DraftScope::~DraftScope()
{
    dispose();
}

bool DraftScope::collects_patches() const noexcept
{
    return options_.collects_patches() || (parent_ != nullptr && parent_->collects_patches());
}

// ============================================================
// Draft creation
// ============================================================

Value DraftScope::create_draft(const Value& initial)
{
    if (disposed_) {
        throw DraftException(initial, "The scope has been disposed.");
    }
    if (root_.valid()) {
        throw DraftException(initial, "The scope already has a root draft.");
    }

    const Node* node = heap_->find_node(initial);
    if (node == nullptr) {
        throw DraftException(initial, "Only objects, lists and dictionaries can be drafted.");
    }
    if (!node->type->draftable || options_.is_immutable_type(node->type->name)) {
        detail::log_draft_event("DraftScope::create_draft", not_draftable_message(*node->type));
        throw DraftException(initial, not_draftable_message(*node->type));
    }

    std::shared_ptr<const PathSegment> path;
    if (DraftState* outer = node->draft_state.get()) {
        if (&outer->scope() == this) {
            throw DraftException(initial, "The value is already a draft of this scope.");
        }
        parent_ = &outer->scope();
        if (parent_->collects_patches()) {
            path = outer->path();
        }
    } else if (!node->locked) {
        freeze(initial.as_node(), ReconcileContext{});
    }

    if (!path && options_.collects_patches() && !(parent_ && parent_->collects_patches())) {
        path = PathSegment::root();
    }

    Value draft = create_proxy(initial, path);
    root_ = draft.as_node();
    root_path_ = std::move(path);
    return draft;
}

Value DraftScope::create_proxy(const Value& source, std::shared_ptr<const PathSegment> path)
{
    if (disposed_) {
        throw DraftException(source, "The scope has been disposed.");
    }
    if (finishing_) {
        throw DraftException(source, "Drafts cannot be created while the scope is finishing.");
    }

    const Node* node = heap_->find_node(source);
    if (node == nullptr) {
        throw DraftException(source, "Only objects, lists and dictionaries can be drafted.");
    }
    if (node->draft_state && &node->draft_state->scope() == this) {
        throw DraftException(source, "The value is already a draft of this scope.");
    }

    const TypeDescriptor& type = *node->type;
    if (!type.draftable) {
        detail::log_draft_event("DraftScope::create_proxy", not_draftable_message(type));
        throw DraftException(source, not_draftable_message(type));
    }

    const NodeRef original = source.as_node();
    const NodeRef proxy = heap_->allocate(type);

    std::shared_ptr<DraftState> state;
    if (type.kind == NodeKind::object) {
        state = std::make_shared<ObjectDraftState>(*this, proxy, original, std::move(path));
    } else {
        state = std::make_shared<CollectionDraftState>(*this, proxy, original, std::move(path), type.kind);
    }
    heap_->node(proxy).draft_state = std::move(state);
    drafts_.push_back(proxy);
    return Value{proxy};
}

bool DraftScope::owns_draft(const Value& value) const
{
    const DraftState* state = heap_->draft_state(value);
    return state != nullptr && &state->scope() == this;
}

// ============================================================
// Finishing
// ============================================================

Value DraftScope::finish_draft(const Value& draft)
{
    if (draft.is_null()) {
        throw std::invalid_argument("draft");
    }
    if (disposed_) {
        throw DraftException(draft, "The scope has been disposed.");
    }

    struct DisposeOnExit {
        DraftScope& scope;
        ~DisposeOnExit() { scope.dispose(); }
    } dispose_on_exit{*this};

    finishing_ = true;
    Value result = reconcile(draft, ReconcileContext{});

    // A replacement returned by the recipe replaces the whole root
    if (root_.valid() && root_path_ && draft != Value{root_}) {
        const Value original{heap_->draft_state(Value{root_})->original()};
        if (result != original) {
            const std::string path = root_path_->to_string();
            patches_.replace(path, result);
            inverse_patches_.replace(path, original);
        }
    }

    finalize_patches();
    finished_ = true;
    return result;
}

Value DraftScope::reconcile(const Value& value, ReconcileContext ctx)
{
    const Node* node = heap_->find_node(value);
    if (node == nullptr) {
        return value;
    }

    const NodeRef ref = value.as_node();
    if (auto it = resolved_.find(ref.id); it != resolved_.end()) {
        return it->second;
    }

    if (ctx.depth > options_.max_depth) {
        detail::log_draft_event("DraftScope::reconcile", "maximum depth exceeded");
        throw CircularReferenceException(value,
                                         "The object graph exceeds the maximum depth of " +
                                             std::to_string(options_.max_depth) +
                                             "; it probably contains a circular reference.");
    }

    if (options_.is_immutable_type(node->type->name)) {
        return value;
    }

    if (DraftState* state = node->draft_state.get()) {
        if (&state->scope() != this) {
            // Resolved by the scope that owns it
            return value;
        }
        return reconcile_draft(ref, *state, ctx);
    }

    if (node->locked) {
        if (derived_.find(ref.id) == derived_.end()) {
            return value;
        }
        // Result of a nested scope; may still reference drafts of this scope
        resolved_[ref.id] = value;
        return freeze(ref, ctx);
    }

    if (!node->type->draftable) {
        throw DraftException(value, not_draftable_message(*node->type) + " It cannot be made immutable.");
    }
    return freeze(ref, ctx);
}

Value DraftScope::reconcile_draft(NodeRef ref, DraftState& state, ReconcileContext ctx)
{
    if (in_progress_.find(ref.id) != in_progress_.end()) {
        // Back-reference into a draft being reconciled: an edited draft
        // closes the cycle onto its new identity, otherwise it unrolls onto
        // the original
        return state.changed() ? Value{ref} : Value{state.original()};
    }

    in_progress_.insert(ref.id);
    Value result;
    switch (state.kind()) {
        case NodeKind::object:     result = finish_object(ref, state, ctx); break;
        case NodeKind::list:       result = finish_list(ref, state, ctx); break;
        case NodeKind::dictionary: result = finish_dictionary(ref, state, ctx); break;
    }
    in_progress_.erase(ref.id);

    resolved_[ref.id] = result;
    return result;
}

Value DraftScope::finish_object(NodeRef ref, DraftState& state, ReconcileContext ctx)
{
    const std::size_t count = heap_->node(ref).slots.size();
    std::vector<PendingWrite> writes;
    bool adopt = false;

    for (std::size_t i = 0; i < count; ++i) {
        // Unchanged drafts hold only their drafted children
        const Value current = heap_->node(ref).slots[i];
        if (!current.is_node()) {
            continue;
        }
        Value next = reconcile(current, ctx.deeper());
        if (state.changed()) {
            if (next != current) {
                writes.push_back({i, {}, std::move(next)});
            }
        } else if (next != heap_->get(state.original(), i)) {
            adopt = true;
            writes.push_back({i, {}, std::move(next)});
        }
    }

    if (adopt) {
        state.mark_changed();
        options_.effective_clone_provider().clone(*heap_, state.original(), ref);
    }

    generate_patches(state);

    Node& node = heap_->node(ref);
    for (auto& write : writes) {
        node.slots = node.slots.set(write.index, std::move(write.value));
    }
    return complete_draft(ref, state);
}

Value DraftScope::finish_list(NodeRef ref, DraftState& state, ReconcileContext ctx)
{
    if (!static_cast<CollectionDraftState&>(state).copied()) {
        return complete_draft(ref, state);
    }

    const ValueList items = heap_->node(ref).items;
    std::vector<PendingWrite> writes;

    for (std::size_t i = 0; i < items.size(); ++i) {
        const Value& current = items[i];
        if (!current.is_node()) {
            continue;
        }
        Value next = reconcile(current, ctx.deeper());
        if (state.changed()) {
            if (next != current) {
                writes.push_back({i, {}, std::move(next)});
            }
        } else if (next != heap_->at(state.original(), i)) {
            // A child changed: the list adopts the new element
            state.mark_changed();
            writes.push_back({i, {}, std::move(next)});
        }
    }

    generate_patches(state);

    Node& node = heap_->node(ref);
    for (auto& write : writes) {
        node.items = node.items.set(write.index, std::move(write.value));
    }
    return complete_draft(ref, state);
}

Value DraftScope::finish_dictionary(NodeRef ref, DraftState& state, ReconcileContext ctx)
{
    if (!static_cast<CollectionDraftState&>(state).copied()) {
        return complete_draft(ref, state);
    }

    const ValueMap entries = heap_->node(ref).entries;
    std::vector<PendingWrite> writes;

    for (const auto& key : heap_->sorted_keys(ref)) {
        const Value current = *entries.find(key);
        if (!current.is_node()) {
            continue;
        }
        // Any entry drafted in this scope marks the dictionary changed,
        // even when the entry itself round-trips unchanged
        if (owns_draft(current)) {
            state.mark_changed();
        }
        Value next = reconcile(current, ctx.deeper());
        if (next != current) {
            writes.push_back({0, key, std::move(next)});
        }
    }

    generate_patches(state);

    Node& node = heap_->node(ref);
    for (auto& write : writes) {
        node.entries = node.entries.set(write.key, std::move(write.value));
    }
    return complete_draft(ref, state);
}

Value DraftScope::complete_draft(NodeRef ref, DraftState& state)
{
    if (!state.changed()) {
        return Value{state.original()};
    }

    heap_->node(ref).locked = true;
    if (parent_ != nullptr) {
        parent_->derived_[ref.id] = state.original();
    }
    return Value{ref};
}

Value DraftScope::freeze(NodeRef ref, ReconcileContext ctx)
{
    // Lock before descending so cycles among new nodes terminate
    heap_->node(ref).locked = true;

    switch (heap_->kind(ref)) {
        case NodeKind::object: {
            const ValueSlots slots = heap_->node(ref).slots;
            for (std::size_t i = 0; i < slots.size(); ++i) {
                if (!slots[i].is_node()) {
                    continue;
                }
                Value next = reconcile(slots[i], ctx.deeper());
                if (next != slots[i]) {
                    Node& node = heap_->node(ref);
                    node.slots = node.slots.set(i, std::move(next));
                }
            }
            break;
        }
        case NodeKind::list: {
            const ValueList items = heap_->node(ref).items;
            for (std::size_t i = 0; i < items.size(); ++i) {
                if (!items[i].is_node()) {
                    continue;
                }
                Value next = reconcile(items[i], ctx.deeper());
                if (next != items[i]) {
                    Node& node = heap_->node(ref);
                    node.items = node.items.set(i, std::move(next));
                }
            }
            break;
        }
        case NodeKind::dictionary: {
            const ValueMap entries = heap_->node(ref).entries;
            for (const auto& [key, value] : entries) {
                if (!value.is_node()) {
                    continue;
                }
                Value next = reconcile(value, ctx.deeper());
                if (next != value) {
                    Node& node = heap_->node(ref);
                    node.entries = node.entries.set(key, std::move(next));
                }
            }
            break;
        }
    }
    return Value{ref};
}

// ============================================================
// Patches
// ============================================================

void DraftScope::generate_patches(DraftState& state)
{
    if (!state.changed() || !state.path() || !collects_patches()) {
        return;
    }

    patch_generator_for(state.kind())
        .generate(*heap_,
                  Value{state.self()},
                  state.path()->to_string(),
                  patches_,
                  inverse_patches_,
                  [this](const Value& original_value, const Value& current_value) {
                      return same_value(original_value, current_value);
                  });
}

bool DraftScope::same_value(const Value& original_value, const Value& current_value) const
{
    if (original_value == current_value) {
        return true;
    }
    if (const DraftState* state = heap_->draft_state(current_value)) {
        return Value{state->original()} == original_value;
    }
    if (!current_value.is_node()) {
        return false;
    }

    auto it = derived_.find(current_value.as_node().id);
    if (it == derived_.end()) {
        return false;
    }
    const Value origin{it->second};
    if (origin == original_value) {
        return true;
    }
    const DraftState* origin_state = heap_->draft_state(origin);
    return origin_state != nullptr && Value{origin_state->original()} == original_value;
}

bool DraftScope::is_result_node(NodeRef ref) const
{
    auto it = resolved_.find(ref.id);
    return it != resolved_.end() && it->second == Value{ref};
}

Value DraftScope::resolve(const Value& value) const
{
    if (!value.is_node()) {
        return value;
    }
    auto it = resolved_.find(value.as_node().id);
    return it != resolved_.end() ? it->second : value;
}

void DraftScope::finalize_patches()
{
    if (!collects_patches()) {
        return;
    }

    for (auto& patch : patches_.operations_) {
        patch.value = resolve(patch.value);
    }
    for (auto& patch : inverse_patches_.operations_) {
        patch.value = resolve(patch.value);
    }

    if (parent_ != nullptr && parent_->collects_patches()) {
        // Merged unreversed; the outermost scope reverses once
        parent_->patches_.append(patches_);
        parent_->inverse_patches_.append(inverse_patches_);
    } else {
        inverse_patches_.reverse();
        options_.patches->append(patches_);
        options_.inverse_patches->append(inverse_patches_);
    }
    patches_.clear();
    inverse_patches_.clear();
}

// ============================================================
// Disposal
// ============================================================

void DraftScope::dispose() noexcept
{
    if (disposed_) {
        return;
    }
    disposed_ = true;

    if (!finishing_ && !drafts_.empty()) {
        detail::log_draft_event("DraftScope::dispose", "scope closed without finishing; drafts revoked");
    }

    for (NodeRef ref : drafts_) {
        Node& node = heap_->node(ref);
        if (!node.draft_state) {
            continue;
        }
        // Discarded drafts keep their effective contents and become read-only
        const auto* state = node.draft_state.get();
        if (!node.locked && !finished_) {
            switch (node.kind()) {
                case NodeKind::object:
                    if (!state->changed()) {
                        node.slots = heap_->slots(ref);
                    }
                    break;
                case NodeKind::list:
                    node.items = heap_->items(ref);
                    break;
                case NodeKind::dictionary:
                    node.entries = heap_->entries(ref);
                    break;
            }
        }
        node.draft_state->revoke();
        node.locked = true;
    }
    for (NodeRef ref : drafts_) {
        heap_->node(ref).draft_state.reset();
    }

    if (finished_) {
        // Nothing in the result references a draft that collapsed onto its
        // original or was never reached
        for (NodeRef ref : drafts_) {
            if (!is_result_node(ref)) {
                heap_->release(ref);
            }
        }
    }
}

} // namespace draftcow
