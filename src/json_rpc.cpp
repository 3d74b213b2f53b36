#include "mcpstub/json_rpc.hpp"
#include "mcpstub/version.hpp"

namespace mcpstub {

Response Response::success(int64_t id, nlohmann::json result) {
    Response r;
    r.id = id;
    r.result = std::move(result);
    return r;
}

Response Response::failure(int64_t id, int code, std::string message) {
    Response r;
    r.id = id;
    r.error = JsonRpcError{code, std::move(message)};
    return r;
}

void to_json(nlohmann::json& j, const Request& r) {
    j = nlohmann::json::object();
    j["jsonrpc"] = r.jsonrpc ? *r.jsonrpc : std::string(JSONRPC_VERSION);
    if (r.id) {
        nlohmann::json id_j;
        to_json(id_j, *r.id);
        j["id"] = id_j;
    }
    j["method"] = r.method;
    if (r.params) j["params"] = *r.params;
}

void from_json(const nlohmann::json& j, Request& r) {
    r.method = j.at("method").get<std::string>();
    if (j.contains("id") && !j.at("id").is_null()) {
        RequestId id;
        from_json(j.at("id"), id);
        r.id = std::move(id);
    }
    if (j.contains("params")) r.params = j.at("params");
    if (j.contains("jsonrpc") && j.at("jsonrpc").is_string()) {
        r.jsonrpc = j.at("jsonrpc").get<std::string>();
    }
}

void to_json(nlohmann::json& j, const Response& r) {
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["id"] = r.id;
    if (r.error) {
        j["error"] = *r.error;
    } else {
        j["result"] = r.result ? *r.result : nlohmann::json::object();
    }
}

void from_json(const nlohmann::json& j, Response& r) {
    r.id = j.at("id").get<int64_t>();
    if (j.contains("result")) r.result = j.at("result");
    if (j.contains("error")) r.error = j.at("error").get<JsonRpcError>();
}

} // namespace mcpstub
