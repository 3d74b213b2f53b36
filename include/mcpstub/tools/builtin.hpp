#pragma once
#include "../tool.hpp"
#include "../tool_registry.hpp"
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <random>

namespace mcpstub {
namespace tools {

/// Returns `text`, or "empty" when it is absent.
class EchoTool : public Tool {
public:
    ToolDefinition describe() const override;
    CallToolResult invoke(const nlohmann::json& arguments) override;
};

/// Integer sum of `a` and `b`; each defaults to 0.
class AddTool : public Tool {
public:
    ToolDefinition describe() const override;
    CallToolResult invoke(const nlohmann::json& arguments) override;
};

/// Current Unix time in whole seconds.
class GetTimeTool : public Tool {
public:
    using Clock = std::function<int64_t()>;

    GetTimeTool();
    explicit GetTimeTool(Clock clock);

    ToolDefinition describe() const override;
    CallToolResult invoke(const nlohmann::json& arguments) override;

private:
    Clock clock_;
};

/// Uniform integer in [0, max), max defaulting to 100.
class RandomTool : public Tool {
public:
    static constexpr int64_t DEFAULT_MAX = 100;

    /// Seeded from std::random_device unless `seed` is given.
    explicit RandomTool(std::optional<uint64_t> seed = std::nullopt);

    ToolDefinition describe() const override;
    CallToolResult invoke(const nlohmann::json& arguments) override;

private:
    std::mutex mutex_;
    std::mt19937_64 engine_;
};

/// `text` reversed by code point.
class ReverseTool : public Tool {
public:
    ToolDefinition describe() const override;
    CallToolResult invoke(const nlohmann::json& arguments) override;
};

/// Reverse a UTF-8 string by code point. Bytes that do not form a valid
/// sequence are kept as single units.
std::string reverse_utf8(const std::string& s);

/// Register echo, add, get_time, random and reverse, in that order.
void register_builtin_tools(ToolRegistry& registry,
                            std::optional<uint64_t> random_seed = std::nullopt);

} // namespace tools
} // namespace mcpstub
