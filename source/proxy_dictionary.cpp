// proxy_dictionary.cpp
// Keyed access for dictionary nodes and dictionary drafts

#include <draftcow/proxy_dictionary.h>

#include <draftcow/draft_state.h>
#include <draftcow/exceptions.h>
#include <draftcow/log.h>
#include <draftcow/object_proxy.h>

#include <stdexcept>

namespace draftcow {

ProxyDictionary::ProxyDictionary(Heap& heap, const Value& value)
    : heap_(&heap)
{
    const Node* node = heap.find_node(value);
    if (node == nullptr || node->kind() != NodeKind::dictionary) {
        throw DraftException(value, "The value is not a dictionary.");
    }
    node_ = value.as_node();
    state_ = std::static_pointer_cast<CollectionDraftState>(node->draft_state);
}

std::size_t ProxyDictionary::size() const
{
    if (state_) {
        state_->check_revoked("getting the entry count");
    }
    return heap_->size(node_);
}

std::optional<Value> ProxyDictionary::try_get(const std::string& key) const
{
    const std::string action = "getting entry " + key;
    if (state_) {
        state_->check_revoked(action);
    }
    if (heap_->find(node_, key) == nullptr) {
        return std::nullopt;
    }
    if (!state_) {
        return *heap_->find(node_, key);
    }

    Heap& heap = *heap_;
    const NodeRef self = node_;
    return state_->get(
        action,
        [&] { return std::optional<std::string>{key}; },
        [&] { return *heap.find(self, key); },
        [&](const Value& draft) {
            Node& node = heap.node(self);
            node.entries = node.entries.set(key, draft);
        },
        [&] { state_->copy_original(); });
}

Value ProxyDictionary::at(const std::string& key) const
{
    auto result = try_get(key);
    if (!result) {
        detail::log_key_error("ProxyDictionary::at", key, "not found");
        throw std::out_of_range("Key '" + key + "' not found");
    }
    return *result;
}

ObjectProxy ProxyDictionary::object_at(const std::string& key) const
{
    return ObjectProxy{*heap_, at(key)};
}

bool ProxyDictionary::contains_key(const std::string& key) const
{
    if (state_) {
        state_->check_revoked("searching the dictionary");
    }
    return heap_->find(node_, key) != nullptr;
}

std::vector<std::string> ProxyDictionary::keys() const
{
    if (state_) {
        state_->check_revoked("enumerating the keys");
    }
    return heap_->sorted_keys(node_);
}

void ProxyDictionary::check_writable(std::string_view action) const
{
    if (state_) {
        state_->check_revoked(action);
    }
    if (heap_->node(node_).locked) {
        throw ImmutableException(value(), "Exception while " + std::string(action) +
                                              ": the dictionary is immutable.");
    }
}

template <typename Fn>
void ProxyDictionary::modify(std::string_view action, Fn&& fn) const
{
    check_writable(action);
    auto apply = [&] {
        Node& node = heap_->node(node_);
        node.entries = fn(node.entries);
    };
    if (!state_) {
        apply();
        return;
    }
    state_->modify(action, apply, [&] { state_->copy_original(); });
}

void ProxyDictionary::set(const std::string& key, Value value) const
{
    modify("setting entry " + key, [&](const ValueMap& entries) { return entries.set(key, std::move(value)); });
}

void ProxyDictionary::add(const std::string& key, Value value) const
{
    check_writable("adding entry " + key);
    if (contains_key(key)) {
        detail::log_key_error("ProxyDictionary::add", key, "already exists");
        throw std::invalid_argument("An entry with key '" + key + "' already exists");
    }
    set(key, std::move(value));
}

bool ProxyDictionary::remove(const std::string& key) const
{
    check_writable("removing entry " + key);
    if (!contains_key(key)) {
        return false;
    }
    modify("removing entry " + key, [&](const ValueMap& entries) { return entries.erase(key); });
    return true;
}

void ProxyDictionary::clear() const
{
    modify("clearing the dictionary", [](const ValueMap&) { return ValueMap{}; });
}

bool ProxyDictionary::is_read_only() const
{
    return (state_ && state_->revoked()) || heap_->node(node_).locked;
}

Value ProxyDictionary::original() const
{
    return state_ ? Value{state_->original()} : value();
}

// ============================================================
// Iteration
// ============================================================

ProxyDictionary::const_iterator ProxyDictionary::begin() const
{
    auto snapshot = std::make_shared<const std::vector<std::string>>(keys());
    return const_iterator{*this, std::move(snapshot), 0};
}

ProxyDictionary::const_iterator::value_type ProxyDictionary::const_iterator::operator*() const
{
    const std::string& key = (*keys_)[index_];
    return {key, dictionary_.at(key)};
}

bool ProxyDictionary::ValueCollection::contains(const Value& value) const
{
    const auto& state = dictionary_.state_;
    if (state) {
        state->check_revoked("searching the values");
    }
    const Heap& heap = *dictionary_.heap_;
    for (const auto& [key, stored] : heap.entries(dictionary_.node_)) {
        if (stored == value) {
            return true;
        }
        // An entry drafted in place still matches its original
        const DraftState* draft = heap.draft_state(stored);
        if (draft != nullptr && state && &draft->scope() == &state->scope() &&
            Value{draft->original()} == value) {
            return true;
        }
    }
    return false;
}

void ProxyDictionary::ValueCollection::copy_to(std::vector<Value>& out) const
{
    for (const auto& value : *this) {
        out.push_back(value);
    }
}

} // namespace draftcow
