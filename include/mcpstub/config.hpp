#pragma once
#include "server.hpp"
#include <string>
#include <string_view>

namespace mcpstub {

/// Settings for the mcpstub-server executable.
/// Precedence: defaults < environment < command line.
struct Config {
    Server::Options server;
    std::string log_level = "info";
    bool show_help = false;
    bool show_version = false;

    /// Defaults overridden by MCPSTUB_* environment variables.
    /// Throws ConfigError on an invalid value.
    static Config from_env();

    /// Apply command-line flags on top of `base`. Throws ConfigError on an
    /// unknown flag, a missing value or an invalid value.
    static Config from_args(int argc, const char* const* argv, Config base);

    /// Flags over the built-in defaults.
    static Config from_args(int argc, const char* const* argv);
};

[[nodiscard]] std::string usage(std::string_view program);

} // namespace mcpstub
