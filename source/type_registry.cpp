// type_registry.cpp
// Node type descriptors and their registry

#include <draftcow/type_registry.h>

#include <stdexcept>

namespace draftcow {

std::string_view to_string(NodeKind kind) noexcept
{
    switch (kind) {
        case NodeKind::object:     return "object";
        case NodeKind::list:       return "list";
        case NodeKind::dictionary: return "dictionary";
    }
    return "unknown";
}

// ============================================================
// TypeDescriptor
// ============================================================

std::optional<std::size_t> TypeDescriptor::find_property(std::string_view property) const
{
    auto it = index_.find(property);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t TypeDescriptor::property_index(std::string_view property) const
{
    if (auto index = find_property(property)) {
        return *index;
    }
    throw std::out_of_range("Type '" + name + "' has no property '" + std::string(property) + "'");
}

// ============================================================
// TypeRegistry
// ============================================================

namespace {

std::unique_ptr<TypeDescriptor> make_builtin(std::string_view name, NodeKind kind)
{
    auto descriptor = std::make_unique<TypeDescriptor>();
    descriptor->name = std::string(name);
    descriptor->kind = kind;
    return descriptor;
}

} // anonymous namespace

TypeRegistry::TypeRegistry()
{
    auto list = make_builtin(list_type_name, NodeKind::list);
    auto dictionary = make_builtin(dictionary_type_name, NodeKind::dictionary);
    list_ = list.get();
    dictionary_ = dictionary.get();
    types_.emplace(std::string(list_type_name), std::move(list));
    types_.emplace(std::string(dictionary_type_name), std::move(dictionary));
}

TypeRegistry::~TypeRegistry() = default;

const TypeDescriptor& TypeRegistry::register_object(std::string name,
                                                    std::vector<std::string> properties,
                                                    bool draftable)
{
    if (name.empty()) {
        throw std::invalid_argument("Type name must not be empty");
    }

    if (auto it = types_.find(name); it != types_.end()) {
        const TypeDescriptor& existing = *it->second;
        if (existing.kind == NodeKind::object && existing.properties == properties &&
            existing.draftable == draftable) {
            return existing;
        }
        throw std::invalid_argument("Type '" + name + "' is already registered with a different shape");
    }

    auto descriptor = std::make_unique<TypeDescriptor>();
    descriptor->name = name;
    descriptor->kind = NodeKind::object;
    descriptor->draftable = draftable;
    descriptor->index_.reserve(properties.size());
    for (std::size_t i = 0; i < properties.size(); ++i) {
        if (!descriptor->index_.emplace(properties[i], i).second) {
            throw std::invalid_argument("Type '" + name + "' declares property '" + properties[i] + "' twice");
        }
    }
    descriptor->properties = std::move(properties);

    const TypeDescriptor& result = *descriptor;
    types_.emplace(std::move(name), std::move(descriptor));
    return result;
}

const TypeDescriptor& TypeRegistry::register_object(std::string name,
                                                    std::initializer_list<std::string_view> properties,
                                                    bool draftable)
{
    std::vector<std::string> names;
    names.reserve(properties.size());
    for (auto property : properties) {
        names.emplace_back(property);
    }
    return register_object(std::move(name), std::move(names), draftable);
}

const TypeDescriptor* TypeRegistry::find(std::string_view name) const
{
    auto it = types_.find(name);
    return it == types_.end() ? nullptr : it->second.get();
}

const TypeDescriptor& TypeRegistry::at(std::string_view name) const
{
    if (auto* descriptor = find(name)) {
        return *descriptor;
    }
    throw std::out_of_range("Unknown type '" + std::string(name) + "'");
}

} // namespace draftcow
