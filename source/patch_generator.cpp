// patch_generator.cpp
// Object, dictionary and list patch generators

#include <draftcow/patch_generator.h>

#include <draftcow/draft_state.h>
#include <draftcow/exceptions.h>
#include <draftcow/heap.h>
#include <draftcow/json_pointer.h>
#include <draftcow/log.h>

#include <stdexcept>
#include <vector>

namespace draftcow {

// ============================================================
// PatchGenerator
// ============================================================

void PatchGenerator::generate(const Heap& heap,
                              const Value& draft,
                              std::string_view base_path,
                              PatchDocument& patches,
                              PatchDocument& inverse_patches,
                              const ValueEquality& equals) const
{
    if (!draft.is_node()) {
        throw std::invalid_argument("draft");
    }

    const DraftState* state = heap.draft_state(draft);
    if (state == nullptr) {
        detail::log_draft_event("PatchGenerator::generate", "value has no draft state");
        throw PatchGenerationException(draft, "The value is not a draft and has no draft state.");
    }
    if (state->kind() != handled_kind()) {
        throw PatchGenerationException(draft, "The draft is a " + std::string(to_string(state->kind())) +
                                                  ", but this generator handles " +
                                                  std::string(to_string(handled_kind())) + " drafts.");
    }
    if (!state->changed()) {
        return;
    }

    const std::string path = normalize_base_path(base_path);
    if (equals) {
        generate_changes(heap, *state, path, patches, inverse_patches, equals);
    } else {
        generate_changes(heap, *state, path, patches, inverse_patches, default_equality(heap));
    }
}

ValueEquality PatchGenerator::default_equality(const Heap& heap)
{
    return [&heap](const Value& original_value, const Value& current_value) {
        if (original_value == current_value) {
            return true;
        }
        const DraftState* state = heap.draft_state(current_value);
        return state != nullptr && Value{state->original()} == original_value;
    };
}

// ============================================================
// ObjectPatchGenerator
// ============================================================

void ObjectPatchGenerator::generate_changes(const Heap& heap,
                                            const DraftState& state,
                                            const std::string& base_path,
                                            PatchDocument& patches,
                                            PatchDocument& inverse_patches,
                                            const ValueEquality& equals) const
{
    const TypeDescriptor& type = heap.type_of(state.self());

    for (std::size_t i = 0; i < type.property_count(); ++i) {
        const Value old_value = heap.get(state.original(), i);
        const Value new_value = heap.get(state.self(), i);
        if (equals(old_value, new_value)) {
            continue;
        }

        std::string path = path_join(base_path, type.properties[i]);
        if (old_value.is_null()) {
            patches.add(path, new_value);
            inverse_patches.remove(std::move(path));
        } else if (new_value.is_null()) {
            patches.remove(path);
            inverse_patches.add(std::move(path), old_value);
        } else {
            patches.replace(path, new_value);
            inverse_patches.replace(std::move(path), old_value);
        }
    }
}

// ============================================================
// DictionaryPatchGenerator
// ============================================================

void DictionaryPatchGenerator::generate_changes(const Heap& heap,
                                                const DraftState& state,
                                                const std::string& base_path,
                                                PatchDocument& patches,
                                                PatchDocument& inverse_patches,
                                                const ValueEquality& equals) const
{
    const NodeRef original = state.original();
    const NodeRef draft = state.self();

    for (const auto& key : heap.sorted_keys(original)) {
        const Value* old_value = heap.find(original, key);
        const Value* new_value = heap.find(draft, key);
        std::string path = path_join(base_path, key);

        if (new_value == nullptr) {
            patches.remove(path);
            inverse_patches.add(std::move(path), *old_value);
        } else if (!equals(*old_value, *new_value)) {
            patches.replace(path, *new_value);
            inverse_patches.replace(std::move(path), *old_value);
        }
    }

    for (const auto& key : heap.sorted_keys(draft)) {
        if (heap.find(original, key) != nullptr) {
            continue;
        }
        std::string path = path_join(base_path, key);
        patches.add(path, *heap.find(draft, key));
        inverse_patches.remove(std::move(path));
    }
}

// ============================================================
// CollectionPatchGenerator
// ============================================================

CollectionPatchGenerator::CollectionPatchGenerator()
    : lcs_(std::make_shared<DynamicLongestCommonSubsequence>())
{
}

CollectionPatchGenerator::CollectionPatchGenerator(std::shared_ptr<const LongestCommonSubsequence> lcs)
    : lcs_(std::move(lcs))
{
    if (!lcs_) {
        throw std::invalid_argument("lcs");
    }
}

void CollectionPatchGenerator::generate_changes(const Heap& heap,
                                                const DraftState& state,
                                                const std::string& base_path,
                                                PatchDocument& patches,
                                                PatchDocument& inverse_patches,
                                                const ValueEquality& equals) const
{
    const ValueList source = heap.items(state.original());
    const ValueList target = heap.items(state.self());
    const std::size_t source_size = source.size();
    const std::size_t target_size = target.size();

    std::size_t head = 0;
    while (head < source_size && head < target_size && equals(source[head], target[head])) {
        ++head;
    }

    std::size_t tail = 0;
    while (head + tail < source_size && head + tail < target_size &&
           equals(source[source_size - 1 - tail], target[target_size - 1 - tail])) {
        ++tail;
    }

    // Index of the last element that survives, counted in the original
    // (for inverse adds) and in the draft (for forward adds); -1 for none
    const auto last_index = [](std::size_t size) { return static_cast<std::ptrdiff_t>(size) - 1; };
    auto add_path = [&](std::size_t index, std::ptrdiff_t last_kept) {
        return static_cast<std::ptrdiff_t>(index) > last_kept ? path_join(base_path, "-")
                                                               : path_join(base_path, std::to_string(index));
    };
    auto index_path = [&](std::size_t index) { return path_join(base_path, std::to_string(index)); };

    if (head + tail == target_size) {
        // Only removals
        const std::ptrdiff_t last_kept_source = tail > 0 ? last_index(source_size) : last_index(head);
        for (std::size_t index = source_size - tail; index-- > head;) {
            patches.remove(index_path(index));
            inverse_patches.add(add_path(index, last_kept_source), source[index]);
        }
        return;
    }

    if (head + tail == source_size) {
        // Only insertions
        const std::ptrdiff_t last_kept_target = tail > 0 ? last_index(target_size) : last_index(head);
        for (std::size_t index = head; index < target_size - tail; ++index) {
            patches.add(add_path(index, last_kept_target), target[index]);
            inverse_patches.remove(index_path(index));
        }
        return;
    }

    const auto matches = lcs_->get(source, target,
                                   head, source_size - tail - head,
                                   head, target_size - tail - head,
                                   equals);

    std::vector<bool> kept_source(source_size, false);
    std::vector<bool> kept_target(target_size, false);
    for (const auto& match : matches) {
        kept_source[match.left] = true;
        kept_target[match.right] = true;
    }

    std::ptrdiff_t last_kept_source = last_index(head);
    std::ptrdiff_t last_kept_target = last_index(head);
    if (tail > 0) {
        last_kept_source = last_index(source_size);
        last_kept_target = last_index(target_size);
    } else if (!matches.empty()) {
        last_kept_source = static_cast<std::ptrdiff_t>(matches.back().left);
        last_kept_target = static_cast<std::ptrdiff_t>(matches.back().right);
    }

    for (std::size_t index = source_size - tail; index-- > head;) {
        if (kept_source[index]) {
            continue;
        }
        patches.remove(index_path(index));
        inverse_patches.add(add_path(index, last_kept_source), source[index]);
    }

    for (std::size_t index = head; index < target_size - tail; ++index) {
        if (kept_target[index]) {
            continue;
        }
        patches.add(add_path(index, last_kept_target), target[index]);
        inverse_patches.remove(index_path(index));
    }
}

// ============================================================
// Shared instances
// ============================================================

const PatchGenerator& patch_generator_for(NodeKind kind)
{
    static const ObjectPatchGenerator object_generator;
    static const DictionaryPatchGenerator dictionary_generator;
    static const CollectionPatchGenerator collection_generator;

    switch (kind) {
        case NodeKind::object:     return object_generator;
        case NodeKind::dictionary: return dictionary_generator;
        case NodeKind::list:       return collection_generator;
    }
    throw std::invalid_argument("Unknown node kind");
}

} // namespace draftcow
