#include "mcpstub/tools/builtin.hpp"
#include <memory>

namespace mcpstub {
namespace tools {

void register_builtin_tools(ToolRegistry& registry, std::optional<uint64_t> random_seed) {
    registry.add(std::make_unique<EchoTool>());
    registry.add(std::make_unique<AddTool>());
    registry.add(std::make_unique<GetTimeTool>());
    registry.add(std::make_unique<RandomTool>(random_seed));
    registry.add(std::make_unique<ReverseTool>());
}

} // namespace tools
} // namespace mcpstub
