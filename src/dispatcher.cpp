#include "mcpstub/dispatcher.hpp"
#include "mcpstub/error.hpp"
#include "mcpstub/log.hpp"
#include "mcpstub/version.hpp"

namespace mcpstub {

namespace {

// Fixed ids reported under IdPolicy::Reference
constexpr int64_t kReferenceInitializeId = 1;
constexpr int64_t kReferenceToolsListId  = 2;

} // anonymous namespace

Method classify(std::string_view method) {
    if (method == "initialize")                return Method::Initialize;
    if (method == "tools/list")                return Method::ToolsList;
    if (method == "tools/call")                return Method::ToolsCall;
    if (method == "ping")                      return Method::Ping;
    if (method == "notifications/initialized") return Method::Initialized;
    return Method::Unknown;
}

std::string_view method_name(Method m) {
    switch (m) {
        case Method::Initialize:  return "initialize";
        case Method::ToolsList:   return "tools/list";
        case Method::ToolsCall:   return "tools/call";
        case Method::Ping:        return "ping";
        case Method::Initialized: return "notifications/initialized";
        case Method::Unknown:     return "";
    }
    return "";
}

Dispatcher::Dispatcher(Options opts, ToolRegistry& tools, Session& session)
    : opts_(std::move(opts)), tools_(tools), session_(session) {}

std::optional<Response> Dispatcher::dispatch(const Request& req) {
    const Method method = classify(req.method);

    // One-way notification: never answered, counter untouched
    if (method == Method::Initialized) {
        handle_initialized();
        return std::nullopt;
    }

    std::optional<int64_t> literal;
    if (method == Method::Initialize) literal = kReferenceInitializeId;
    if (method == Method::ToolsList)  literal = kReferenceToolsListId;
    const int64_t id = session_.next_id(literal);

    MCPSTUB_LOG_DEBUG("-> {} (response id {})",
                      req.method.empty() ? "<no method>" : req.method, id);

    if (opts_.strict_jsonrpc && (!req.jsonrpc || *req.jsonrpc != JSONRPC_VERSION)) {
        MCPSTUB_LOG_WARN("Rejecting request without jsonrpc \"2.0\": {}", req.method);
        return Response::failure(id, error::InvalidRequest,
                                 "Invalid Request: jsonrpc must be \"2.0\"");
    }

    const nlohmann::json params = (req.params && req.params->is_object())
        ? *req.params : nlohmann::json::object();

    try {
        switch (method) {
            case Method::Initialize:
                return Response::success(id, handle_initialize(params));
            case Method::ToolsList:
                return Response::success(id, handle_tools_list());
            case Method::ToolsCall:
                return Response::success(id, handle_tools_call(params));
            case Method::Ping:
                return Response::success(id, nlohmann::json::object());
            case Method::Initialized:
            case Method::Unknown:
                break;
        }
        MCPSTUB_LOG_WARN("Method not found: {}", req.method);
        return Response::failure(id, error::MethodNotFound, "Method not found: " + req.method);
    } catch (const ProtocolError& e) {
        MCPSTUB_LOG_WARN("{} failed ({}): {}", req.method, e.code, e.what());
        return Response::failure(id, e.code, e.what());
    } catch (const std::exception& e) {
        MCPSTUB_LOG_ERROR("{} raised: {}", req.method, e.what());
        return Response::failure(id, error::InternalError, e.what());
    }
}

nlohmann::json Dispatcher::handle_initialize(const nlohmann::json& params) {
    if (params.contains("clientInfo")) {
        try {
            session_.set_client_info(params.at("clientInfo").get<Implementation>());
        } catch (const nlohmann::json::exception& e) {
            MCPSTUB_LOG_DEBUG("Ignoring malformed clientInfo: {}", e.what());
        }
    }
    if (params.contains("protocolVersion") && params.at("protocolVersion").is_string()) {
        session_.set_client_protocol_version(params.at("protocolVersion").get<std::string>());
    }

    auto client = session_.client_info();
    MCPSTUB_LOG_INFO("Initialize from {} {} (requested protocol {})",
                     client ? client->name : "<unknown client>",
                     client ? client->version : "",
                     session_.client_protocol_version().value_or("<none>"));
    session_.set_state(SessionState::Initializing);

    InitializeResult result;
    result.protocol_version = std::string(PROTOCOL_VERSION);
    result.capabilities.tools = nlohmann::json::object();
    result.server_info = opts_.server_info;

    nlohmann::json j;
    to_json(j, result);
    return j;
}

nlohmann::json Dispatcher::handle_tools_list() {
    return nlohmann::json{{"tools", tools_.list()}};
}

nlohmann::json Dispatcher::handle_tools_call(const nlohmann::json& params) {
    std::string name;
    if (params.contains("name") && params.at("name").is_string()) {
        name = params.at("name").get<std::string>();
    }
    nlohmann::json arguments = nlohmann::json::object();
    if (params.contains("arguments") && params.at("arguments").is_object()) {
        arguments = params.at("arguments");
    }

    auto result = tools_.call(name, arguments);
    nlohmann::json j;
    to_json(j, result);
    return j;
}

void Dispatcher::handle_initialized() {
    if (session_.state() == SessionState::Uninitialized) {
        MCPSTUB_LOG_WARN("notifications/initialized received before initialize");
    }
    session_.set_state(SessionState::Ready);
    MCPSTUB_LOG_INFO("Client initialized");
}

} // namespace mcpstub
