// json_pointer.cpp
// JSON Pointer (RFC 6901) helpers for patch paths

#include <draftcow/json_pointer.h>
#include <draftcow/log.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>
#include <stdexcept>

namespace draftcow {

// ============================================================
// Segment escaping
// ============================================================

std::string escape_pointer_segment(std::string_view segment)
{
    std::string result;
    result.reserve(segment.size());
    for (char c : segment) {
        if (c == '~') {
            result += "~0";
        } else if (c == '/') {
            result += "~1";
        } else {
            result += c;
        }
    }
    return result;
}

std::string unescape_pointer_segment(std::string_view segment)
{
    std::string result;
    result.reserve(segment.size());

    for (size_t i = 0; i < segment.size(); ++i) {
        if (segment[i] == '~' && i + 1 < segment.size()) {
            if (segment[i + 1] == '1') {
                result += '/';
                ++i;
                continue;
            } else if (segment[i + 1] == '0') {
                result += '~';
                ++i;
                continue;
            }
        }
        result += segment[i];
    }

    return result;
}

std::optional<std::size_t> parse_array_index(std::string_view segment)
{
    if (segment.empty() || segment == "-") {
        return std::nullopt;
    }
    if (!std::ranges::all_of(segment, [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    // RFC 6901: no leading zeros except "0" itself
    if (segment.size() > 1 && segment[0] == '0') {
        return std::nullopt;
    }
    std::size_t index = 0;
    const auto [end, error] = std::from_chars(segment.data(), segment.data() + segment.size(), index);
    if (error != std::errc{} || end != segment.data() + segment.size()) {
        return std::nullopt;  // overflow
    }
    return index;
}

// ============================================================
// Pointer parsing and joining
// ============================================================

std::vector<std::string> parse_json_pointer(std::string_view pointer)
{
    std::vector<std::string> segments;

    // Empty pointer refers to root
    if (pointer.empty()) {
        return segments;
    }

    if (pointer[0] != '/') {
        detail::log_key_error("parse_json_pointer", pointer, "must start with '/'");
        throw std::invalid_argument("Invalid JSON pointer '" + std::string(pointer) + "'");
    }

    pointer = pointer.substr(1);
    while (true) {
        auto pos = pointer.find('/');
        std::string_view segment = (pos == std::string_view::npos) ? pointer : pointer.substr(0, pos);
        segments.push_back(unescape_pointer_segment(segment));

        if (pos == std::string_view::npos) {
            break;
        }
        pointer = pointer.substr(pos + 1);
    }

    return segments;
}

std::string to_json_pointer(const std::vector<std::string>& segments)
{
    std::string result;
    for (const auto& segment : segments) {
        result += '/';
        result += escape_pointer_segment(segment);
    }
    return result;
}

std::string normalize_base_path(std::string_view base_path)
{
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!base_path.empty() && is_space(base_path.front())) {
        base_path.remove_prefix(1);
    }
    while (!base_path.empty() && is_space(base_path.back())) {
        base_path.remove_suffix(1);
    }

    std::string result;
    result.reserve(base_path.size() + 1);
    if (base_path.empty() || base_path.front() != '/') {
        result += '/';
    }
    result += base_path;
    return result;
}

std::string path_join(std::string_view base_path, std::string_view segment)
{
    while (!base_path.empty() && base_path.back() == '/') {
        base_path.remove_suffix(1);
    }

    std::string result;
    result.reserve(base_path.size() + segment.size() + 1);
    result += base_path;
    result += '/';
    result += escape_pointer_segment(segment);
    return result;
}

} // namespace draftcow
