#pragma once
#include "json_rpc.hpp"
#include "session.hpp"
#include "tool_registry.hpp"
#include "types.hpp"
#include <optional>
#include <string_view>

namespace mcpstub {

enum class Method {
    Initialize,
    ToolsList,
    ToolsCall,
    Ping,
    Initialized,   // notifications/initialized
    Unknown        // anything else, including an empty method
};

[[nodiscard]] Method classify(std::string_view method);

/// Wire name of a known method; "" for Method::Unknown.
[[nodiscard]] std::string_view method_name(Method m);

/// Routes one request to its handler and builds the response, drawing
/// response ids from the session.
class Dispatcher {
public:
    struct Options {
        Implementation server_info;
        // Reject requests whose "jsonrpc" member is missing or not "2.0"
        bool strict_jsonrpc = false;
    };

    Dispatcher(Options opts, ToolRegistry& tools, Session& session);

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /// Handle one request. Returns nullopt when nothing must be written
    /// (notifications/initialized); otherwise exactly one response.
    [[nodiscard]] std::optional<Response> dispatch(const Request& req);

private:
    nlohmann::json handle_initialize(const nlohmann::json& params);
    nlohmann::json handle_tools_list();
    nlohmann::json handle_tools_call(const nlohmann::json& params);
    void handle_initialized();

    Options opts_;
    ToolRegistry& tools_;
    Session& session_;
};

} // namespace mcpstub
