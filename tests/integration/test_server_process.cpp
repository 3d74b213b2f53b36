#include <gtest/gtest.h>
#include "support/pipes.hpp"
#include <nlohmann/json.hpp>
#include <sys/wait.h>
#include <unistd.h>
#include <cstdlib>
#include <string>
#include <vector>

using mcpstub::test::Pipe;
using mcpstub::test::split_lines;
using json = nlohmann::json;

namespace {

struct RunResult {
    int exit_code = -1;
    std::string out;
    std::string err;
};

// Run the server binary with `args`, feeding `input` on stdin until end of file.
RunResult run_server(const std::vector<std::string>& args, const std::string& input) {
    Pipe in, out, err;
    pid_t pid = ::fork();
    if (pid < 0) throw std::runtime_error("fork failed");

    if (pid == 0) {
        ::dup2(in.read_fd(), STDIN_FILENO);
        ::dup2(out.write_fd(), STDOUT_FILENO);
        ::dup2(err.write_fd(), STDERR_FILENO);
        in.close_read(); in.close_write();
        out.close_read(); out.close_write();
        err.close_read(); err.close_write();

        std::vector<char*> argv;
        argv.push_back(const_cast<char*>(MCPSTUB_SERVER_BINARY));
        for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
        argv.push_back(nullptr);
        ::execv(MCPSTUB_SERVER_BINARY, argv.data());
        ::_exit(127);
    }

    in.close_read();
    out.close_write();
    err.close_write();
    in.write_all(input);
    in.close_write();

    RunResult r;
    r.out = out.read_all();
    r.err = err.read_all();
    int status = 0;
    ::waitpid(pid, &status, 0);
    if (WIFEXITED(status)) r.exit_code = WEXITSTATUS(status);
    return r;
}

} // anonymous namespace

TEST(ServerProcess, ConformanceSession) {
    std::string input =
        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2024-11-05","capabilities":{},"clientInfo":{"name":"t","version":"1"}}})" "\n"
        R"({"jsonrpc":"2.0","method":"notifications/initialized"})" "\n"
        R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})" "\n"
        R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"echo","arguments":{"text":"hi"}}})" "\n"
        R"({"jsonrpc":"2.0","id":4,"method":"bogus"})" "\n";

    auto r = run_server({"--seed", "1"}, input);
    EXPECT_EQ(r.exit_code, 0) << r.err;

    auto lines = split_lines(r.out);
    ASSERT_EQ(lines.size(), 4u) << r.out;
    for (size_t i = 0; i < lines.size(); ++i) {
        auto j = json::parse(lines[i]);
        EXPECT_EQ(j["jsonrpc"], "2.0");
        EXPECT_EQ(j["id"], static_cast<int64_t>(i + 1));
    }
    EXPECT_EQ(json::parse(lines[2])["result"]["content"][0]["text"], "hi");
    EXPECT_EQ(json::parse(lines[3])["error"]["code"], -32601);

    EXPECT_NE(r.err.find("Client initialized"), std::string::npos);
}

TEST(ServerProcess, ServerNameFlag) {
    auto r = run_server({"--name", "renamed", "--server-version", "3.1"},
                        R"({"jsonrpc":"2.0","id":1,"method":"initialize"})" "\n");
    EXPECT_EQ(r.exit_code, 0);
    auto lines = split_lines(r.out);
    ASSERT_EQ(lines.size(), 1u);
    auto info = json::parse(lines[0])["result"]["serverInfo"];
    EXPECT_EQ(info["name"], "renamed");
    EXPECT_EQ(info["version"], "3.1");
}

TEST(ServerProcess, EmptyInputExitsCleanly) {
    auto r = run_server({}, "");
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_TRUE(r.out.empty());
}

TEST(ServerProcess, LogLevelOffKeepsStderrQuiet) {
    auto r = run_server({"--log-level", "off"}, R"({"jsonrpc":"2.0","id":1,"method":"ping"})" "\n");
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_TRUE(r.err.empty()) << r.err;
    EXPECT_EQ(split_lines(r.out).size(), 1u);
}

TEST(ServerProcess, UnknownFlagExitsWithUsage) {
    auto r = run_server({"--bogus"}, "");
    EXPECT_EQ(r.exit_code, 2);
    EXPECT_TRUE(r.out.empty());
    EXPECT_NE(r.err.find("Unknown argument: --bogus"), std::string::npos);
    EXPECT_NE(r.err.find("Usage"), std::string::npos);
}

TEST(ServerProcess, Help) {
    auto r = run_server({"--help"}, "");
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_NE(r.out.find("Usage"), std::string::npos);
}

TEST(ServerProcess, Version) {
    auto r = run_server({"--version"}, "");
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_NE(r.out.find("0.1.0"), std::string::npos);
}
