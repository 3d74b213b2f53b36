#include "mcpstub/tool.hpp"
#include "mcpstub/error.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace mcpstub {

FunctionTool::FunctionTool(ToolDefinition def, ToolHandler handler)
    : def_(std::move(def)), handler_(std::move(handler)) {
    if (!handler_) {
        throw std::invalid_argument("FunctionTool requires a handler: " + def_.name);
    }
}

CallToolResult FunctionTool::invoke(const nlohmann::json& arguments) {
    return handler_(arguments);
}

namespace args {

const nlohmann::json* find(const nlohmann::json& arguments, const std::string& key) {
    if (!arguments.is_object()) return nullptr;
    auto it = arguments.find(key);
    if (it == arguments.end()) return nullptr;
    if (it->is_null()) return nullptr;
    if (it->is_boolean() && !it->get<bool>()) return nullptr;
    return &*it;
}

std::optional<int64_t> to_integer(const nlohmann::json& value) {
    if (value.is_number_integer() && !value.is_number_unsigned()) {
        return value.get<int64_t>();
    }
    if (value.is_number_unsigned()) {
        auto u = value.get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) return std::nullopt;
        return static_cast<int64_t>(u);
    }
    if (value.is_number_float()) {
        double d = value.get<double>();
        if (!std::isfinite(d)) return std::nullopt;
        d = std::trunc(d);
        // 2^63 is exactly representable; anything at or beyond it overflows int64
        if (d >= 9223372036854775808.0 || d < -9223372036854775808.0) return std::nullopt;
        return static_cast<int64_t>(d);
    }
    if (value.is_string()) {
        const std::string& s = value.get_ref<const std::string&>();
        if (s.empty()) return std::nullopt;
        errno = 0;
        char* end = nullptr;
        long long n = std::strtoll(s.c_str(), &end, 10);
        if (errno == ERANGE || end == s.c_str() || *end != '\0') return std::nullopt;
        return static_cast<int64_t>(n);
    }
    return std::nullopt;
}

std::string to_text(const nlohmann::json& value) {
    if (value.is_string()) return value.get<std::string>();
    return value.dump();
}

ProtocolError invalid(const std::string& tool, const std::string& reason) {
    return ProtocolError(error::InvalidParams,
                         "Invalid arguments for '" + tool + "': " + reason);
}

} // namespace args

} // namespace mcpstub
