// serialization.cpp
// JSON rendering of heap values

#include <draftcow/serialization.h>

#include <draftcow/exceptions.h>
#include <draftcow/heap.h>

#include <cstdio>
#include <iomanip>    // for std::setprecision
#include <sstream>
#include <type_traits>
#include <variant>

namespace draftcow {

std::string json_escape_string(const std::string& s)
{
    std::string result;
    result.reserve(s.size() + 16);

    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned int>(static_cast<unsigned char>(c)));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

namespace {

struct JsonWriter {
    const Heap& heap;
    std::ostringstream& oss;
    bool compact;
    std::size_t max_depth;

    void write(const Value& val, std::size_t level)
    {
        std::visit([&](const auto& arg) {
            using T = std::decay_t<decltype(arg)>;

            if constexpr (std::is_same_v<T, std::monostate>) {
                oss << "null";
            } else if constexpr (std::is_same_v<T, bool>) {
                oss << (arg ? "true" : "false");
            } else if constexpr (std::is_same_v<T, int32_t> || std::is_same_v<T, int64_t>) {
                oss << arg;
            } else if constexpr (std::is_same_v<T, double>) {
                oss << std::setprecision(15) << arg;
            } else if constexpr (std::is_same_v<T, std::string>) {
                oss << "\"" << json_escape_string(arg) << "\"";
            } else if constexpr (std::is_same_v<T, NodeRef>) {
                write_node(val, arg, level);
            }
        }, val.data);
    }

    void write_node(const Value& val, NodeRef ref, std::size_t level)
    {
        if (level > max_depth) {
            throw CircularReferenceException(val, "JSON rendering exceeds the maximum depth of " +
                                                      std::to_string(max_depth) + ".");
        }

        const std::string indent = compact ? "" : std::string(level * 2, ' ');
        const std::string child_indent = compact ? "" : std::string((level + 1) * 2, ' ');
        const char* newline = compact ? "" : "\n";
        const char* space_after_colon = compact ? "" : " ";

        const TypeDescriptor& type = heap.type_of(ref);
        switch (type.kind) {
            case NodeKind::object: {
                if (type.property_count() == 0) {
                    oss << "{}";
                    return;
                }
                oss << "{" << newline;
                for (std::size_t i = 0; i < type.property_count(); ++i) {
                    if (i > 0) oss << "," << newline;
                    oss << child_indent << "\"" << json_escape_string(type.properties[i]) << "\":"
                        << space_after_colon;
                    write(heap.get(ref, i), level + 1);
                }
                oss << newline << indent << "}";
                return;
            }
            case NodeKind::list: {
                const ValueList items = heap.items(ref);
                if (items.empty()) {
                    oss << "[]";
                    return;
                }
                oss << "[" << newline;
                bool first = true;
                for (const auto& item : items) {
                    if (!first) oss << "," << newline;
                    first = false;
                    oss << child_indent;
                    write(item, level + 1);
                }
                oss << newline << indent << "]";
                return;
            }
            case NodeKind::dictionary: {
                const auto keys = heap.sorted_keys(ref);
                if (keys.empty()) {
                    oss << "{}";
                    return;
                }
                oss << "{" << newline;
                bool first = true;
                for (const auto& key : keys) {
                    if (!first) oss << "," << newline;
                    first = false;
                    oss << child_indent << "\"" << json_escape_string(key) << "\":" << space_after_colon;
                    write(*heap.find(ref, key), level + 1);
                }
                oss << newline << indent << "}";
                return;
            }
        }
    }
};

} // namespace

std::string to_json(const Heap& heap, const Value& value, bool compact, std::size_t max_depth)
{
    std::ostringstream oss;
    JsonWriter writer{heap, oss, compact, max_depth};
    writer.write(value, 0);
    return oss.str();
}

} // namespace draftcow
