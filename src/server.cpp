#include "mcpstub/server.hpp"
#include "mcpstub/codec.hpp"
#include "mcpstub/dispatcher.hpp"
#include "mcpstub/error.hpp"
#include "mcpstub/log.hpp"
#include "mcpstub/tool_registry.hpp"
#include "mcpstub/tools/builtin.hpp"
#include "mcpstub/transport/stdio_transport.hpp"

#include <atomic>
#include <mutex>

namespace mcpstub {

// ----------- Server::Impl -----------

struct Server::Impl {
    Options opts;
    ToolRegistry tools;
    Session session;
    Dispatcher dispatcher;

    // Transport reference for shutdown()
    ITransport* transport{nullptr};
    std::mutex transport_mutex;

    std::atomic<bool> running{false};

    explicit Impl(Options o)
        : opts(std::move(o)),
          session(opts.id_policy),
          dispatcher(Dispatcher::Options{opts.server_info, opts.strict_jsonrpc}, tools, session) {
        if (opts.builtin_tools) {
            mcpstub::tools::register_builtin_tools(tools, opts.random_seed);
        }
    }

    void on_message(ITransport& t, const Request& req) {
        auto response = dispatcher.dispatch(req);
        if (!response) return;
        try {
            t.send(*response);
        } catch (const TransportError& e) {
            MCPSTUB_LOG_ERROR("Dropping connection: {}", e.what());
            t.shutdown();
        }
    }
};

// ----------- Server -----------

Server::Server(Options opts)
    : impl_(std::make_unique<Impl>(std::move(opts))) {
}

Server::~Server() = default;

void Server::add_tool(ToolDefinition def, ToolHandler handler) {
    impl_->tools.add(std::make_unique<FunctionTool>(std::move(def), std::move(handler)));
}

void Server::add_tool(std::unique_ptr<Tool> tool) {
    impl_->tools.add(std::move(tool));
}

bool Server::remove_tool(const std::string& name) {
    return impl_->tools.remove(name);
}

std::vector<ToolDefinition> Server::tools() const {
    return impl_->tools.list();
}

std::optional<Response> Server::handle(const Request& req) {
    return impl_->dispatcher.dispatch(req);
}

std::optional<std::string> Server::handle_line(std::string_view line) {
    if (line.find_first_not_of(" \t\r\n\f\v") == std::string_view::npos) {
        return std::nullopt;
    }
    auto response = handle(Codec::decode(line));
    if (!response) return std::nullopt;
    return Codec::encode(*response);
}

const Session& Server::session() const {
    return impl_->session;
}

void Server::serve(std::unique_ptr<ITransport> transport) {
    if (!transport) {
        throw TransportError("serve() requires a transport");
    }
    if (impl_->running.exchange(true)) {
        throw Error("Server is already serving");
    }

    auto* t = transport.get();
    {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->transport = t;
    }

    MCPSTUB_LOG_INFO("{} {} listening (protocol {}, id policy {})",
                     impl_->opts.server_info.name, impl_->opts.server_info.version,
                     PROTOCOL_VERSION, to_string(impl_->opts.id_policy));

    try {
        t->start(
            [this, t](Request req) { impl_->on_message(*t, req); },
            [](std::exception_ptr ep) {
                try {
                    if (ep) std::rethrow_exception(ep);
                } catch (const std::exception& e) {
                    MCPSTUB_LOG_ERROR("Transport error: {}", e.what());
                }
            });
    } catch (...) {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->transport = nullptr;
        impl_->running = false;
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->transport = nullptr;
    }
    impl_->running = false;
    MCPSTUB_LOG_INFO("Session ended after {} responses", impl_->session.responses());
}

void Server::serve_stdio() {
    serve(std::make_unique<StdioTransport>());
}

void Server::shutdown() {
    std::lock_guard<std::mutex> lock(impl_->transport_mutex);
    if (impl_->transport) {
        impl_->transport->shutdown();
    }
}

bool Server::is_running() const {
    return impl_->running;
}

} // namespace mcpstub
