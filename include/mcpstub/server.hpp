#pragma once
#include "json_rpc.hpp"
#include "session.hpp"
#include "tool.hpp"
#include "types.hpp"
#include "version.hpp"
#include "transport/transport.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpstub {

class Server {
public:
    struct Options {
        Implementation server_info{std::string(DEFAULT_SERVER_NAME),
                                   std::string(DEFAULT_SERVER_VERSION)};
        IdPolicy id_policy = IdPolicy::Sequential;
        bool strict_jsonrpc = false;
        // Seed for the random tool; nondeterministic when unset
        std::optional<uint64_t> random_seed;
        // Register echo, add, get_time, random and reverse at construction
        bool builtin_tools = true;
    };

    explicit Server(Options opts);
    ~Server();

    // Non-copyable, non-movable
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // ---- Tool registration ----
    void add_tool(ToolDefinition def, ToolHandler handler);
    void add_tool(std::unique_ptr<Tool> tool);
    bool remove_tool(const std::string& name);
    [[nodiscard]] std::vector<ToolDefinition> tools() const;

    // ---- Direct dispatch ----
    /// Dispatch one decoded request. nullopt means nothing is written.
    [[nodiscard]] std::optional<Response> handle(const Request& req);

    /// Decode, dispatch and encode one input line. Blank lines yield nullopt.
    [[nodiscard]] std::optional<std::string> handle_line(std::string_view line);

    [[nodiscard]] const Session& session() const;

    // ---- Transport ----
    /// Serve until the transport reaches end of input or shutdown() is called.
    void serve(std::unique_ptr<ITransport> transport);
    void serve_stdio();
    void shutdown();

    bool is_running() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mcpstub
