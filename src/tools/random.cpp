#include "mcpstub/tools/builtin.hpp"

namespace mcpstub {
namespace tools {

namespace {

uint64_t make_seed(std::optional<uint64_t> seed) {
    if (seed) return *seed;
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) ^ rd();
}

} // anonymous namespace

RandomTool::RandomTool(std::optional<uint64_t> seed) : engine_(make_seed(seed)) {}

ToolDefinition RandomTool::describe() const {
    ToolDefinition def;
    def.name = "random";
    def.description = "Generate a random number";
    def.input_schema = {
        {"type", "object"},
        {"properties", {
            {"max", {{"type", "number"}, {"description", "Maximum value (default: 100)"}}}
        }}
    };
    return def;
}

CallToolResult RandomTool::invoke(const nlohmann::json& arguments) {
    int64_t max = DEFAULT_MAX;
    if (const auto* v = args::find(arguments, "max")) {
        auto n = args::to_integer(*v);
        if (!n) {
            throw args::invalid("random", "max must be a number, got " + v->dump());
        }
        max = *n;
    }
    if (max <= 0) {
        throw args::invalid("random", "max must be positive, got " + std::to_string(max));
    }
    std::uniform_int_distribution<int64_t> dist(0, max - 1);
    int64_t value;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        value = dist(engine_);
    }
    return CallToolResult::text(std::to_string(value));
}

} // namespace tools
} // namespace mcpstub
