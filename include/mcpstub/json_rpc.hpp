#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace mcpstub {

/// Client-supplied request id. Only its presence matters to the dispatcher.
using RequestId = std::variant<int64_t, std::string>;

inline void to_json(nlohmann::json& j, const RequestId& id) {
    std::visit([&j](const auto& v) { j = v; }, id);
}

inline void from_json(const nlohmann::json& j, RequestId& id) {
    if (j.is_number_integer()) {
        id = j.get<int64_t>();
    } else if (j.is_string()) {
        id = j.get<std::string>();
    } else {
        throw std::invalid_argument("RequestId must be integer or string");
    }
}

struct JsonRpcError {
    int code;
    std::string message;

    bool operator==(const JsonRpcError& o) const {
        return code == o.code && message == o.message;
    }
};

inline void to_json(nlohmann::json& j, const JsonRpcError& e) {
    j = nlohmann::json{{"code", e.code}, {"message", e.message}};
}

inline void from_json(const nlohmann::json& j, JsonRpcError& e) {
    e.code = j.at("code").get<int>();
    e.message = j.at("message").get<std::string>();
}

/// One decoded input line. A missing id marks a notification.
struct Request {
    std::string method;
    std::optional<RequestId> id;
    std::optional<nlohmann::json> params;
    // Value of the "jsonrpc" member as received, if it was a string
    std::optional<std::string> jsonrpc;

    bool is_notification() const { return !id.has_value(); }

    bool operator==(const Request& o) const {
        return method == o.method && id == o.id && params == o.params && jsonrpc == o.jsonrpc;
    }
};

/// Exactly one of result/error is set. The id comes from the session counter.
struct Response {
    int64_t id = 0;
    std::optional<nlohmann::json> result;
    std::optional<JsonRpcError> error;

    static Response success(int64_t id, nlohmann::json result);
    static Response failure(int64_t id, int code, std::string message);

    bool is_error() const { return error.has_value(); }

    bool operator==(const Response& o) const {
        return id == o.id && result == o.result && error == o.error;
    }
};

void to_json(nlohmann::json& j, const Request& r);
void from_json(const nlohmann::json& j, Request& r);

void to_json(nlohmann::json& j, const Response& r);
void from_json(const nlohmann::json& j, Response& r);

} // namespace mcpstub
