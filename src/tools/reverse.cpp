#include "mcpstub/tools/builtin.hpp"
#include <vector>

namespace mcpstub {
namespace tools {

namespace {

// Length of the UTF-8 sequence starting at s[i], or 1 if it is not well formed.
size_t sequence_length(const std::string& s, size_t i) {
    auto lead = static_cast<unsigned char>(s[i]);
    size_t len = 1;
    if      ((lead & 0xE0) == 0xC0) len = 2;
    else if ((lead & 0xF0) == 0xE0) len = 3;
    else if ((lead & 0xF8) == 0xF0) len = 4;
    if (len == 1 || i + len > s.size()) return 1;
    for (size_t k = 1; k < len; ++k) {
        if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) return 1;
    }
    return len;
}

} // anonymous namespace

std::string reverse_utf8(const std::string& s) {
    std::vector<std::pair<size_t, size_t>> units;
    units.reserve(s.size());
    for (size_t i = 0; i < s.size(); ) {
        size_t len = sequence_length(s, i);
        units.emplace_back(i, len);
        i += len;
    }
    std::string out;
    out.reserve(s.size());
    for (auto it = units.rbegin(); it != units.rend(); ++it) {
        out.append(s, it->first, it->second);
    }
    return out;
}

ToolDefinition ReverseTool::describe() const {
    ToolDefinition def;
    def.name = "reverse";
    def.description = "Reverse a string";
    def.input_schema = {
        {"type", "object"},
        {"properties", {
            {"text", {{"type", "string"}, {"description", "Text to reverse"}}}
        }},
        {"required", {"text"}}
    };
    return def;
}

CallToolResult ReverseTool::invoke(const nlohmann::json& arguments) {
    const auto* text = args::find(arguments, "text");
    return CallToolResult::text(text ? reverse_utf8(args::to_text(*text)) : std::string());
}

} // namespace tools
} // namespace mcpstub
