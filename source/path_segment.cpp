// path_segment.cpp
// Linked draft paths rendered as JSON pointers

#include <draftcow/json_pointer.h>
#include <draftcow/path_segment.h>

#include <vector>

namespace draftcow {

PathSegment::PathSegment(std::string value)
    : value_(std::move(value))
{
}

PathSegment::PathSegment(std::shared_ptr<const PathSegment> parent, std::string value)
    : parent_(std::move(parent)), value_(std::move(value))
{
}

std::string PathSegment::to_string() const
{
    std::vector<const PathSegment*> chain;
    for (const PathSegment* segment = this; segment != nullptr; segment = segment->parent_.get()) {
        chain.push_back(segment);
    }

    std::string result;
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        // the empty root-most segment stands for the document itself
        if (it == chain.rbegin() && (*it)->value_.empty()) {
            continue;
        }
        result += '/';
        result += escape_pointer_segment((*it)->value_);
    }
    return result;
}

std::size_t PathSegment::depth() const noexcept
{
    std::size_t result = 0;
    for (const PathSegment* segment = this; segment != nullptr; segment = segment->parent_.get()) {
        ++result;
    }
    return result;
}

std::shared_ptr<const PathSegment> PathSegment::root()
{
    return std::make_shared<const PathSegment>(std::string{});
}

std::shared_ptr<const PathSegment> PathSegment::child(std::shared_ptr<const PathSegment> parent, std::string value)
{
    return std::make_shared<const PathSegment>(std::move(parent), std::move(value));
}

} // namespace draftcow
