#pragma once
#include "error.hpp"
#include "types.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace mcpstub {

/// A callable tool. describe() must return the same definition on every call.
/// invoke() reports bad input by throwing ProtocolError (usually InvalidParams).
class Tool {
public:
    virtual ~Tool() = default;

    [[nodiscard]] virtual ToolDefinition describe() const = 0;
    virtual CallToolResult invoke(const nlohmann::json& arguments) = 0;
};

using ToolHandler = std::function<CallToolResult(const nlohmann::json& arguments)>;

/// Adapts a definition plus a callable into a Tool.
class FunctionTool : public Tool {
public:
    FunctionTool(ToolDefinition def, ToolHandler handler);

    ToolDefinition describe() const override { return def_; }
    CallToolResult invoke(const nlohmann::json& arguments) override;

private:
    ToolDefinition def_;
    ToolHandler handler_;
};

namespace args {

/// Look up an argument. Missing, null and false all count as absent.
[[nodiscard]] const nlohmann::json* find(const nlohmann::json& arguments, const std::string& key);

/// Integer view of a value: integers as-is, floats truncated toward zero,
/// strings holding a complete integer literal. Anything else yields nullopt.
[[nodiscard]] std::optional<int64_t> to_integer(const nlohmann::json& value);

/// Strings as-is, everything else as its JSON text.
[[nodiscard]] std::string to_text(const nlohmann::json& value);

/// ProtocolError(InvalidParams) with the standard message for `tool`.
[[nodiscard]] ProtocolError invalid(const std::string& tool, const std::string& reason);

} // namespace args

} // namespace mcpstub
