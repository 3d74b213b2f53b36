#include "mcpstub/tools/builtin.hpp"

namespace mcpstub {
namespace tools {

ToolDefinition EchoTool::describe() const {
    ToolDefinition def;
    def.name = "echo";
    def.description = "Echo back the input text";
    def.input_schema = {
        {"type", "object"},
        {"properties", {
            {"text", {{"type", "string"}, {"description", "Text to echo back"}}}
        }},
        {"required", {"text"}}
    };
    return def;
}

CallToolResult EchoTool::invoke(const nlohmann::json& arguments) {
    const auto* text = args::find(arguments, "text");
    return CallToolResult::text(text ? args::to_text(*text) : "empty");
}

} // namespace tools
} // namespace mcpstub
