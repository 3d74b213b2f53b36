#pragma once
#include "tool.hpp"
#include "types.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace mcpstub {

/// Ordered catalog of tools. Listing order is registration order.
class ToolRegistry {
public:
    ToolRegistry() = default;
    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    /// Register a tool. A tool with the same name is replaced and moves to the end.
    void add(std::unique_ptr<Tool> tool);

    /// Returns false if no tool had that name.
    bool remove(const std::string& name);

    [[nodiscard]] bool contains(const std::string& name) const;
    [[nodiscard]] size_t size() const;

    /// Definitions in listing order.
    [[nodiscard]] std::vector<ToolDefinition> list() const;

    /// Run a tool. Throws ProtocolError(MethodNotFound, "Tool not found: <name>")
    /// for an unknown name; tool faults propagate unchanged. The tool stays alive
    /// until the call returns even if it is removed meanwhile.
    CallToolResult call(const std::string& name, const nlohmann::json& arguments);

private:
    mutable std::mutex mutex_;
    std::vector<ToolDefinition> definitions_;
    // Shared: a running call() keeps its tool alive
    std::unordered_map<std::string, std::shared_ptr<Tool>> tools_;
};

} // namespace mcpstub
