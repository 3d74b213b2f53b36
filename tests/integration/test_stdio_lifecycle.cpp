#include <gtest/gtest.h>
#include "mcpstub/server.hpp"
#include "mcpstub/transport/stdio_transport.hpp"
#include "support/pipes.hpp"
#include <chrono>
#include <thread>

using namespace mcpstub;
using mcpstub::test::Pipe;
using mcpstub::test::split_lines;
using json = nlohmann::json;

namespace {

// Runs a server over a pair of pipes, playing the client side by hand.
class StdioSession {
public:
    explicit StdioSession(Server::Options opts = Server::Options{}) : server_(std::move(opts)) {
        auto transport = std::make_unique<StdioTransport>(c2s_.release_read(), s2c_.release_write());
        thread_ = std::thread([this, t = std::move(transport)]() mutable {
            server_.serve(std::move(t));
        });
    }

    ~StdioSession() {
        finish();
    }

    void send(const std::string& line) { c2s_.write_all(line + "\n"); }
    void send_raw(const std::string& data) { c2s_.write_all(data); }
    json receive() { return json::parse(s2c_.read_line()); }

    /// Close the client's input side, wait for the server and return what it wrote since.
    std::vector<std::string> finish() {
        c2s_.close_write();
        if (thread_.joinable()) thread_.join();
        std::vector<std::string> rest;
        if (!drained_) {
            rest = split_lines(s2c_.read_all());
            drained_ = true;
        }
        return rest;
    }

    Server& server() { return server_; }

private:
    Pipe c2s_, s2c_;
    Server server_;
    std::thread thread_;
    bool drained_ = false;
};

Server::Options seeded(IdPolicy policy = IdPolicy::Sequential) {
    Server::Options opts;
    opts.id_policy = policy;
    opts.random_seed = 99;
    return opts;
}

} // anonymous namespace

TEST(StdioLifecycle, FullSession) {
    StdioSession s{seeded()};

    s.send(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2024-11-05","capabilities":{},"clientInfo":{"name":"inspector","version":"1.0"}}})");
    auto init = s.receive();
    EXPECT_EQ(init["jsonrpc"], "2.0");
    EXPECT_EQ(init["id"], 1);
    EXPECT_EQ(init["result"]["protocolVersion"], "2024-11-05");
    EXPECT_EQ(init["result"]["serverInfo"]["name"], "test-mcp-server");
    EXPECT_EQ(init["result"]["capabilities"]["tools"], json::object());

    s.send(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");

    s.send(R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})");
    auto list = s.receive();
    EXPECT_EQ(list["id"], 2);
    EXPECT_EQ(list["result"]["tools"].size(), 5u);

    s.send(R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"add","arguments":{"a":2,"b":3}}})");
    auto sum = s.receive();
    EXPECT_EQ(sum["id"], 3);
    EXPECT_EQ(sum["result"]["content"][0]["text"], "5");

    s.send(R"({"jsonrpc":"2.0","id":4,"method":"ping"})");
    auto pong = s.receive();
    EXPECT_EQ(pong["id"], 4);
    EXPECT_EQ(pong["result"], json::object());

    EXPECT_TRUE(s.finish().empty());
    EXPECT_EQ(s.server().session().state(), SessionState::Ready);
    EXPECT_EQ(s.server().session().responses(), 4u);
}

TEST(StdioLifecycle, ResponseIdsIgnoreRequestIds) {
    StdioSession s;
    s.send(R"({"jsonrpc":"2.0","id":"first","method":"ping"})");
    s.send(R"({"jsonrpc":"2.0","id":77,"method":"ping"})");
    s.send(R"({"jsonrpc":"2.0","method":"ping"})");

    auto lines = s.finish();
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(json::parse(lines[0])["id"], 1);
    EXPECT_EQ(json::parse(lines[1])["id"], 2);
    EXPECT_EQ(json::parse(lines[2])["id"], 3);
}

TEST(StdioLifecycle, OddIdTypesStillRouteByMethod) {
    StdioSession s;
    s.send(R"({"jsonrpc":"2.0","id":1.5,"method":"ping"})");
    s.send(R"({"jsonrpc":"2.0","id":true,"method":"tools/list"})");
    s.send(R"({"jsonrpc":"2.0","id":{"n":1},"method":"tools/call","params":{"name":"add","arguments":{"a":2,"b":3}}})");

    auto lines = s.finish();
    ASSERT_EQ(lines.size(), 3u);
    auto ping = json::parse(lines[0]);
    EXPECT_EQ(ping["id"], 1);
    EXPECT_EQ(ping["result"], json::object());
    auto list = json::parse(lines[1]);
    EXPECT_EQ(list["id"], 2);
    EXPECT_EQ(list["result"]["tools"].size(), 5u);
    auto sum = json::parse(lines[2]);
    EXPECT_EQ(sum["id"], 3);
    EXPECT_EQ(sum["result"]["content"][0]["text"], "5");
}

TEST(StdioLifecycle, ReferenceIdPolicy) {
    StdioSession s{seeded(IdPolicy::Reference)};
    s.send(R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    s.send(R"({"jsonrpc":"2.0","id":2,"method":"initialize","params":{}})");
    s.send(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    s.send(R"({"jsonrpc":"2.0","id":3,"method":"tools/list"})");
    s.send(R"({"jsonrpc":"2.0","id":4,"method":"ping"})");

    auto lines = s.finish();
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(json::parse(lines[0])["id"], 1);
    EXPECT_EQ(json::parse(lines[1])["id"], 1);
    EXPECT_EQ(json::parse(lines[2])["id"], 2);
    EXPECT_EQ(json::parse(lines[3])["id"], 4);
}

TEST(StdioLifecycle, MalformedAndBlankLines) {
    StdioSession s;
    s.send("");
    s.send("   ");
    s.send("{not json");
    s.send(R"({"jsonrpc":"2.0","id":1,"method":"ping"})");

    auto lines = s.finish();
    ASSERT_EQ(lines.size(), 2u);
    auto bad = json::parse(lines[0]);
    EXPECT_EQ(bad["id"], 1);
    EXPECT_EQ(bad["error"]["code"], -32601);
    EXPECT_EQ(bad["error"]["message"], "Method not found: ");
    EXPECT_EQ(json::parse(lines[1])["id"], 2);
}

TEST(StdioLifecycle, FinalLineWithoutNewlineIsAnswered) {
    StdioSession s;
    s.send_raw(R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    auto lines = s.finish();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(json::parse(lines[0])["result"], json::object());
}

TEST(StdioLifecycle, EveryResponseIsOneLine) {
    StdioSession s;
    s.send(R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"echo","arguments":{"text":"line1\nline2"}}})");
    auto lines = s.finish();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(json::parse(lines[0])["result"]["content"][0]["text"], "line1\nline2");
}

TEST(StdioLifecycle, ShutdownFromAnotherThread) {
    Pipe c2s, s2c;
    Server server{Server::Options{}};
    auto transport = std::make_unique<StdioTransport>(c2s.release_read(), s2c.release_write());
    std::thread t([&server, tr = std::move(transport)]() mutable {
        server.serve(std::move(tr));
    });

    c2s.write_all("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\n");
    EXPECT_EQ(json::parse(s2c.read_line())["id"], 1);
    EXPECT_TRUE(server.is_running());

    server.shutdown();
    t.join();
    EXPECT_FALSE(server.is_running());
}

TEST(StdioLifecycle, ServeRejectsNullTransport) {
    Server server{Server::Options{}};
    EXPECT_THROW(server.serve(nullptr), TransportError);
}
