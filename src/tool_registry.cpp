#include "mcpstub/tool_registry.hpp"
#include "mcpstub/error.hpp"
#include <algorithm>
#include <stdexcept>

namespace mcpstub {

void ToolRegistry::add(std::unique_ptr<Tool> tool) {
    if (!tool) {
        throw std::invalid_argument("Cannot register a null tool");
    }
    ToolDefinition def = tool->describe();
    if (def.name.empty()) {
        throw std::invalid_argument("Tool name must not be empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    // Remove existing tool with same name
    definitions_.erase(std::remove_if(definitions_.begin(), definitions_.end(),
        [&def](const ToolDefinition& d) { return d.name == def.name; }), definitions_.end());
    tools_[def.name] = std::move(tool);
    definitions_.push_back(std::move(def));
}

bool ToolRegistry::remove(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (tools_.erase(name) == 0) return false;
    definitions_.erase(std::remove_if(definitions_.begin(), definitions_.end(),
        [&name](const ToolDefinition& d) { return d.name == name; }), definitions_.end());
    return true;
}

bool ToolRegistry::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_.count(name) > 0;
}

size_t ToolRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return definitions_.size();
}

std::vector<ToolDefinition> ToolRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return definitions_;
}

CallToolResult ToolRegistry::call(const std::string& name, const nlohmann::json& arguments) {
    std::shared_ptr<Tool> tool;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tools_.find(name);
        if (it != tools_.end()) tool = it->second;
    }
    if (!tool) {
        throw ProtocolError(error::MethodNotFound, "Tool not found: " + name);
    }
    // Invoke without holding the lock; tools may be slow
    return tool->invoke(arguments);
}

} // namespace mcpstub
