// draft_state.cpp
// Draft bookkeeping shared by object and collection drafts

#include <draftcow/draft_state.h>

#include <draftcow/clone_provider.h>
#include <draftcow/draft_scope.h>
#include <draftcow/exceptions.h>
#include <draftcow/heap.h>

namespace draftcow {

// ============================================================
// DraftState
// ============================================================

DraftState::DraftState(DraftScope& scope,
                       NodeRef self,
                       NodeRef original,
                       std::shared_ptr<const PathSegment> path)
    : scope_(&scope)
    , self_(self)
    , original_(original)
    , path_(std::move(path))
{
}

DraftState::~DraftState() = default;

void DraftState::revoke() noexcept
{
    revoked_ = true;
}

void DraftState::copy_original() const
{
    clone_provider().clone(heap(), original_, self_);
}

Heap& DraftState::heap() const
{
    return scope_->heap();
}

const CloneProvider& DraftState::clone_provider() const
{
    return scope_->options().effective_clone_provider();
}

bool DraftState::passes_through(const Value& value) const
{
    const Node* node = heap().find_node(value);
    return node == nullptr || scope_->options().is_immutable_type(node->type->name);
}

bool DraftState::needs_child_draft(const Value& value) const
{
    if (scope_->is_finishing()) {
        return false;
    }
    const Node* node = heap().find_node(value);
    if (node == nullptr) {
        return false;
    }
    if (node->draft_state) {
        // Drafts of an enclosing scope are drafted again in this one
        return &node->draft_state->scope() != scope_;
    }
    return node->locked;
}

Value DraftState::make_child_draft(const Value& source, std::shared_ptr<const PathSegment> path) const
{
    return scope_->create_proxy(source, std::move(path));
}

std::shared_ptr<const PathSegment> DraftState::child_path(std::string_view segment) const
{
    if (!path_) {
        return nullptr;
    }
    return PathSegment::child(path_, std::string(segment));
}

void DraftState::throw_revoked(std::string_view action) const
{
    throw DraftRevokedException(Value{self_},
                                "Exception while " + std::string(action) +
                                    ": The draft is out of scope and has been revoked.");
}

// ============================================================
// ObjectDraftState
// ============================================================

void ObjectDraftState::remember_child(std::size_t index, const Value& child)
{
    children_[index] = Child{child.as_node(), heap().node(child.as_node()).draft_state};
}

void ObjectDraftState::revoke() noexcept
{
    if (revoked_) {
        return;
    }
    DraftState::revoke();
    for (auto& [index, child] : children_) {
        if (auto state = child.state.lock()) {
            state->revoke();
        }
    }
}

// ============================================================
// CollectionDraftState
// ============================================================

CollectionDraftState::CollectionDraftState(DraftScope& scope,
                                           NodeRef self,
                                           NodeRef original,
                                           std::shared_ptr<const PathSegment> path,
                                           NodeKind kind)
    : DraftState(scope, self, original, std::move(path))
    , kind_(kind)
{
}

bool CollectionDraftState::scope_finishing() const
{
    return scope_->is_finishing();
}

} // namespace draftcow
