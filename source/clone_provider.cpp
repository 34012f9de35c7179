// clone_provider.cpp
// Default copy-on-write provider and producer options

#include <draftcow/clone_provider.h>
#include <draftcow/heap.h>
#include <draftcow/producer_options.h>

namespace draftcow {

void SlotCloneProvider::clone(Heap& heap, NodeRef source, NodeRef destination) const
{
    switch (heap.kind(destination)) {
        case NodeKind::object: {
            ValueSlots slots = heap.node(destination).slots;
            for (std::size_t i = 0; i < slots.size(); ++i) {
                if (heap.draft_state(slots[i]) == nullptr) {
                    slots = slots.set(i, heap.get(source, i));
                }
            }
            heap.node(destination).slots = std::move(slots);
            break;
        }
        case NodeKind::list:
            heap.node(destination).items = heap.items(source);
            break;
        case NodeKind::dictionary:
            heap.node(destination).entries = heap.entries(source);
            break;
    }
}

// ============================================================
// ProducerOptions
// ============================================================

const ProducerOptions& ProducerOptions::defaults()
{
    static const ProducerOptions options = [] {
        ProducerOptions o;
        o.clone_provider = std::make_shared<SlotCloneProvider>();
        return o;
    }();
    return options;
}

ProducerOptions ProducerOptions::with_patches(PatchDocument& patch_sink, PatchDocument& inverse_sink) const
{
    ProducerOptions copy = *this;
    copy.patches = &patch_sink;
    copy.inverse_patches = &inverse_sink;
    return copy;
}

ProducerOptions ProducerOptions::with_immutable_types(std::initializer_list<std::string_view> type_names) const
{
    ProducerOptions copy = *this;
    for (auto name : type_names) {
        copy.immutable_types.insert(std::string(name));
    }
    return copy;
}

ProducerOptions ProducerOptions::with_max_depth(std::size_t depth) const
{
    ProducerOptions copy = *this;
    copy.max_depth = depth;
    return copy;
}

ProducerOptions ProducerOptions::with_clone_provider(std::shared_ptr<const CloneProvider> provider) const
{
    ProducerOptions copy = *this;
    copy.clone_provider = std::move(provider);
    return copy;
}

const CloneProvider& ProducerOptions::effective_clone_provider() const
{
    if (clone_provider) {
        return *clone_provider;
    }
    return *defaults().clone_provider;
}

} // namespace draftcow
