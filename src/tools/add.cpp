#include "mcpstub/tools/builtin.hpp"
#include <limits>

namespace mcpstub {
namespace tools {

namespace {

int64_t operand(const nlohmann::json& arguments, const char* key) {
    const auto* v = args::find(arguments, key);
    if (!v) return 0;
    return args::to_integer(*v).value_or(0);
}

} // anonymous namespace

ToolDefinition AddTool::describe() const {
    ToolDefinition def;
    def.name = "add";
    def.description = "Add two numbers together";
    def.input_schema = {
        {"type", "object"},
        {"properties", {
            {"a", {{"type", "number"}, {"description", "First number"}}},
            {"b", {{"type", "number"}, {"description", "Second number"}}}
        }},
        {"required", {"a", "b"}}
    };
    return def;
}

CallToolResult AddTool::invoke(const nlohmann::json& arguments) {
    int64_t a = operand(arguments, "a");
    int64_t b = operand(arguments, "b");
    if ((b > 0 && a > std::numeric_limits<int64_t>::max() - b) ||
        (b < 0 && a < std::numeric_limits<int64_t>::min() - b)) {
        throw args::invalid("add", "sum overflows a 64-bit integer");
    }
    return CallToolResult::text(std::to_string(a + b));
}

} // namespace tools
} // namespace mcpstub
