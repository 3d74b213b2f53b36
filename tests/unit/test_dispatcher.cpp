#include <gtest/gtest.h>
#include "mcpstub/dispatcher.hpp"
#include "mcpstub/error.hpp"
#include "mcpstub/tools/builtin.hpp"

using namespace mcpstub;
using json = nlohmann::json;

namespace {

Request make_request(const std::string& method, std::optional<json> params = std::nullopt,
                     std::optional<RequestId> id = RequestId{int64_t(1)}) {
    Request req;
    req.method = method;
    req.id = std::move(id);
    req.params = std::move(params);
    req.jsonrpc = "2.0";
    return req;
}

class DispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        tools::register_builtin_tools(registry_, 42);
    }

    Dispatcher make(IdPolicy policy = IdPolicy::Sequential, bool strict = false) {
        session_ = std::make_unique<Session>(policy);
        Dispatcher::Options opts;
        opts.server_info = {"test-mcp-server", "0.1.0"};
        opts.strict_jsonrpc = strict;
        return Dispatcher(opts, registry_, *session_);
    }

    Response call(Dispatcher& d, const Request& req) {
        auto resp = d.dispatch(req);
        if (!resp) throw std::runtime_error("expected a response for " + req.method);
        return *resp;
    }

    ToolRegistry registry_;
    std::unique_ptr<Session> session_;
};

} // anonymous namespace

TEST(Method, Classify) {
    EXPECT_EQ(classify("initialize"), Method::Initialize);
    EXPECT_EQ(classify("tools/list"), Method::ToolsList);
    EXPECT_EQ(classify("tools/call"), Method::ToolsCall);
    EXPECT_EQ(classify("ping"), Method::Ping);
    EXPECT_EQ(classify("notifications/initialized"), Method::Initialized);
    EXPECT_EQ(classify(""), Method::Unknown);
    EXPECT_EQ(classify("Ping"), Method::Unknown);
    EXPECT_EQ(classify("resources/list"), Method::Unknown);
}

TEST(Method, NameRoundTrips) {
    for (auto m : {Method::Initialize, Method::ToolsList, Method::ToolsCall,
                   Method::Ping, Method::Initialized}) {
        EXPECT_EQ(classify(method_name(m)), m);
    }
    EXPECT_EQ(method_name(Method::Unknown), "");
}

TEST_F(DispatcherTest, InitializeResult) {
    auto d = make();
    json params = {{"protocolVersion", "2024-11-05"},
                   {"capabilities", json::object()},
                   {"clientInfo", {{"name", "inspector"}, {"version", "1.0"}}}};
    auto resp = call(d, make_request("initialize", params));

    EXPECT_EQ(resp.id, 1);
    ASSERT_FALSE(resp.is_error());
    EXPECT_EQ(*resp.result, json::parse(
        R"({"protocolVersion":"2024-11-05","capabilities":{"tools":{}},"serverInfo":{"name":"test-mcp-server","version":"0.1.0"}})"));
    EXPECT_EQ(session_->state(), SessionState::Initializing);
    ASSERT_TRUE(session_->client_info().has_value());
    EXPECT_EQ(session_->client_info()->name, "inspector");
}

TEST_F(DispatcherTest, InitializeIgnoresRequestIdAndParams) {
    auto d = make();
    auto resp = call(d, make_request("initialize", json("not an object"), RequestId{std::string("abc")}));
    EXPECT_EQ(resp.id, 1);
    EXPECT_FALSE(resp.is_error());
    EXPECT_FALSE(session_->client_info().has_value());
}

TEST_F(DispatcherTest, SequentialIdsAcrossMethods) {
    auto d = make();
    EXPECT_EQ(call(d, make_request("initialize")).id, 1);
    EXPECT_EQ(call(d, make_request("ping")).id, 2);
    EXPECT_EQ(call(d, make_request("tools/list")).id, 3);
    EXPECT_EQ(call(d, make_request("nope")).id, 4);
    EXPECT_EQ(session_->responses(), 4u);
}

TEST_F(DispatcherTest, ReferencePolicyUsesLiteralIds) {
    auto d = make(IdPolicy::Reference);
    EXPECT_EQ(call(d, make_request("ping")).id, 1);
    EXPECT_EQ(call(d, make_request("initialize")).id, 1);
    EXPECT_EQ(call(d, make_request("tools/list")).id, 2);
    EXPECT_EQ(call(d, make_request("ping")).id, 4);
}

TEST_F(DispatcherTest, InitializedNotificationHasNoResponse) {
    auto d = make();
    call(d, make_request("initialize"));
    auto resp = d.dispatch(make_request("notifications/initialized", std::nullopt, std::nullopt));
    EXPECT_FALSE(resp.has_value());
    EXPECT_EQ(session_->state(), SessionState::Ready);
    EXPECT_EQ(session_->current_id(), 2);
    EXPECT_EQ(call(d, make_request("ping")).id, 2);
}

TEST_F(DispatcherTest, InitializedBeforeInitializeStillSilent) {
    auto d = make();
    EXPECT_FALSE(d.dispatch(make_request("notifications/initialized")).has_value());
    EXPECT_EQ(session_->responses(), 0u);
}

TEST_F(DispatcherTest, PingReturnsEmptyObject) {
    auto d = make();
    auto resp = call(d, make_request("ping"));
    ASSERT_TRUE(resp.result.has_value());
    EXPECT_EQ(*resp.result, json::object());
}

TEST_F(DispatcherTest, ToolsListInRegistrationOrder) {
    auto d = make();
    auto resp = call(d, make_request("tools/list"));
    const auto& list = (*resp.result)["tools"];
    ASSERT_EQ(list.size(), 5u);
    EXPECT_EQ(list[0]["name"], "echo");
    EXPECT_EQ(list[1]["name"], "add");
    EXPECT_EQ(list[2]["name"], "get_time");
    EXPECT_EQ(list[3]["name"], "random");
    EXPECT_EQ(list[4]["name"], "reverse");
    EXPECT_EQ(list[0]["inputSchema"]["required"], json::array({"text"}));
    EXPECT_EQ(list[2]["inputSchema"]["properties"], json::object());
    EXPECT_FALSE(list[3]["inputSchema"].contains("required"));
}

TEST_F(DispatcherTest, ToolsCallEcho) {
    auto d = make();
    auto resp = call(d, make_request("tools/call",
        json{{"name", "echo"}, {"arguments", {{"text", "hello"}}}}));
    EXPECT_EQ(*resp.result, json::parse(R"({"content":[{"type":"text","text":"hello"}]})"));
}

TEST_F(DispatcherTest, ToolsCallWithoutArguments) {
    auto d = make();
    auto resp = call(d, make_request("tools/call", json{{"name", "add"}}));
    EXPECT_EQ((*resp.result)["content"][0]["text"], "0");
}

TEST_F(DispatcherTest, UnknownTool) {
    auto d = make();
    auto resp = call(d, make_request("tools/call", json{{"name", "nope"}}));
    ASSERT_TRUE(resp.is_error());
    EXPECT_EQ(resp.error->code, error::MethodNotFound);
    EXPECT_EQ(resp.error->message, "Tool not found: nope");
}

TEST_F(DispatcherTest, MissingToolName) {
    auto d = make();
    auto resp = call(d, make_request("tools/call"));
    ASSERT_TRUE(resp.is_error());
    EXPECT_EQ(resp.error->message, "Tool not found: ");
}

TEST_F(DispatcherTest, UnknownMethod) {
    auto d = make();
    auto resp = call(d, make_request("resources/list"));
    ASSERT_TRUE(resp.is_error());
    EXPECT_EQ(resp.error->code, -32601);
    EXPECT_EQ(resp.error->message, "Method not found: resources/list");
}

TEST_F(DispatcherTest, EmptyMethod) {
    auto d = make();
    auto resp = call(d, Request{});
    ASSERT_TRUE(resp.is_error());
    EXPECT_EQ(resp.error->message, "Method not found: ");
    EXPECT_EQ(resp.id, 1);
}

TEST_F(DispatcherTest, InvalidToolArguments) {
    auto d = make();
    auto resp = call(d, make_request("tools/call",
        json{{"name", "random"}, {"arguments", {{"max", 0}}}}));
    ASSERT_TRUE(resp.is_error());
    EXPECT_EQ(resp.error->code, error::InvalidParams);
    EXPECT_EQ(resp.error->message, "Invalid arguments for 'random': max must be positive, got 0");
}

TEST_F(DispatcherTest, ThrowingToolBecomesInternalError) {
    ToolDefinition def;
    def.name = "explode";
    def.input_schema = {{"type", "object"}};
    registry_.add(std::make_unique<FunctionTool>(def, [](const json&) -> CallToolResult {
        throw std::runtime_error("kaboom");
    }));

    auto d = make();
    auto resp = call(d, make_request("tools/call", json{{"name", "explode"}}));
    ASSERT_TRUE(resp.is_error());
    EXPECT_EQ(resp.error->code, error::InternalError);
    EXPECT_EQ(resp.error->message, "kaboom");
}

TEST_F(DispatcherTest, StrictModeRejectsMissingVersion) {
    auto d = make(IdPolicy::Sequential, true);
    auto req = make_request("ping");
    req.jsonrpc.reset();
    auto resp = call(d, req);
    ASSERT_TRUE(resp.is_error());
    EXPECT_EQ(resp.error->code, error::InvalidRequest);
    EXPECT_EQ(resp.id, 1);

    req.jsonrpc = "1.0";
    EXPECT_TRUE(call(d, req).is_error());

    req.jsonrpc = "2.0";
    auto ok = call(d, req);
    EXPECT_FALSE(ok.is_error());
    EXPECT_EQ(ok.id, 3);
}

TEST_F(DispatcherTest, LenientModeIgnoresVersion) {
    auto d = make();
    auto req = make_request("ping");
    req.jsonrpc = "1.0";
    EXPECT_FALSE(call(d, req).is_error());
}
