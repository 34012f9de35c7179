// patch.cpp
// PatchDocument building and JSON rendering

#include <draftcow/patch.h>

#include <draftcow/serialization.h>

#include <algorithm>
#include <sstream>

namespace draftcow {

std::string_view to_string(PatchOp op) noexcept
{
    switch (op) {
        case PatchOp::add:     return "add";
        case PatchOp::remove:  return "remove";
        case PatchOp::replace: return "replace";
    }
    return "unknown";
}

PatchDocument& PatchDocument::add(std::string path, Value value)
{
    operations_.push_back(Patch{PatchOp::add, std::move(path), std::move(value)});
    return *this;
}

PatchDocument& PatchDocument::remove(std::string path)
{
    operations_.push_back(Patch{PatchOp::remove, std::move(path), Value{}});
    return *this;
}

PatchDocument& PatchDocument::replace(std::string path, Value value)
{
    operations_.push_back(Patch{PatchOp::replace, std::move(path), std::move(value)});
    return *this;
}

void PatchDocument::append(const PatchDocument& other)
{
    operations_.insert(operations_.end(), other.operations_.begin(), other.operations_.end());
}

void PatchDocument::reverse()
{
    std::reverse(operations_.begin(), operations_.end());
}

std::string to_json(const Heap& heap, const PatchDocument& patches, bool compact)
{
    std::ostringstream oss;
    const char* newline = compact ? "" : "\n";
    const char* indent = compact ? "" : "  ";

    oss << "[" << newline;
    bool first = true;
    for (const auto& patch : patches) {
        if (!first) {
            oss << "," << newline;
        }
        first = false;
        oss << indent << "{\"op\":\"" << to_string(patch.op) << "\",\"path\":\""
            << json_escape_string(patch.path) << "\"";
        if (patch.op != PatchOp::remove) {
            oss << ",\"value\":" << to_json(heap, patch.value, true);
        }
        oss << "}";
    }
    oss << newline << "]";
    return oss.str();
}

} // namespace draftcow
