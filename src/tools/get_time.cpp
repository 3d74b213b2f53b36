#include "mcpstub/tools/builtin.hpp"
#include <chrono>

namespace mcpstub {
namespace tools {

GetTimeTool::GetTimeTool()
    : clock_([] {
          return static_cast<int64_t>(std::chrono::duration_cast<std::chrono::seconds>(
              std::chrono::system_clock::now().time_since_epoch()).count());
      }) {
}

GetTimeTool::GetTimeTool(Clock clock) : clock_(std::move(clock)) {
    if (!clock_) {
        throw std::invalid_argument("GetTimeTool requires a clock");
    }
}

ToolDefinition GetTimeTool::describe() const {
    ToolDefinition def;
    def.name = "get_time";
    def.description = "Get current Unix timestamp";
    def.input_schema = {
        {"type", "object"},
        {"properties", nlohmann::json::object()}
    };
    return def;
}

CallToolResult GetTimeTool::invoke(const nlohmann::json&) {
    return CallToolResult::text(std::to_string(clock_()));
}

} // namespace tools
} // namespace mcpstub
