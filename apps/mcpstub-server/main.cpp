/// mcpstub-server: MCP conformance test endpoint.
/// Usage: ./mcpstub-server [options]
/// Communicates over stdio (newline-delimited JSON-RPC); diagnostics go to stderr.

#include <mcpstub/mcpstub.hpp>
#include <csignal>
#include <iostream>

int main(int argc, char** argv) {
    mcpstub::Config config;
    try {
        config = mcpstub::Config::from_args(argc, argv, mcpstub::Config::from_env());
    } catch (const mcpstub::ConfigError& e) {
        std::cerr << "mcpstub-server: " << e.what() << "\n\n" << mcpstub::usage(argv[0]);
        return 2;
    }

    if (config.show_help) {
        std::cout << mcpstub::usage(argv[0]);
        return 0;
    }
    if (config.show_version) {
        std::cout << "mcpstub-server " << mcpstub::LIBRARY_VERSION
                  << " (MCP protocol " << mcpstub::PROTOCOL_VERSION << ")\n";
        return 0;
    }

    mcpstub::log::init(config.log_level);

    // A vanished client must surface as a write error, not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    try {
        mcpstub::Codec::self_check();
    } catch (const mcpstub::DependencyError& e) {
        MCPSTUB_LOG_CRITICAL("JSON backend unavailable: {}", e.what());
        return 1;
    }

    MCPSTUB_LOG_INFO("MCP test server starting...");
    MCPSTUB_LOG_INFO("Listening for JSON-RPC requests on stdin...");

    try {
        mcpstub::Server server{std::move(config.server)};
        server.serve_stdio();
    } catch (const mcpstub::Error& e) {
        MCPSTUB_LOG_CRITICAL("Server stopped: {}", e.what());
        return 1;
    }
    return 0;
}
