#include "mcpstub/config.hpp"
#include "mcpstub/error.hpp"
#include "mcpstub/log.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <sstream>

namespace mcpstub {

namespace {

const char* getenv_or_null(const char* key) {
    const char* v = std::getenv(key);
    return (v && *v) ? v : nullptr;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool parse_bool(const std::string& key, const std::string& value) {
    auto v = lower(value);
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw ConfigError(key + ": expected a boolean, got '" + value + "'");
}

uint64_t parse_seed(const std::string& key, const std::string& value) {
    if (value.empty() || value[0] == '-') {
        throw ConfigError(key + ": expected a non-negative integer, got '" + value + "'");
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long n = std::strtoull(value.c_str(), &end, 10);
    if (errno == ERANGE || end == value.c_str() || *end != '\0') {
        throw ConfigError(key + ": expected a non-negative integer, got '" + value + "'");
    }
    return static_cast<uint64_t>(n);
}

IdPolicy parse_policy(const std::string& key, const std::string& value) {
    auto p = parse_id_policy(lower(value));
    if (!p) {
        throw ConfigError(key + ": expected 'sequential' or 'reference', got '" + value + "'");
    }
    return *p;
}

std::string parse_level(const std::string& key, const std::string& value) {
    auto v = lower(value);
    if (!log::is_valid_level(v)) {
        throw ConfigError(key + ": unknown log level '" + value + "'");
    }
    return v;
}

} // anonymous namespace

Config Config::from_env() {
    Config c;
    if (const char* v = getenv_or_null("MCPSTUB_SERVER_NAME")) c.server.server_info.name = v;
    if (const char* v = getenv_or_null("MCPSTUB_SERVER_VERSION")) c.server.server_info.version = v;
    if (const char* v = getenv_or_null("MCPSTUB_ID_POLICY")) {
        c.server.id_policy = parse_policy("MCPSTUB_ID_POLICY", v);
    }
    if (const char* v = getenv_or_null("MCPSTUB_STRICT_JSONRPC")) {
        c.server.strict_jsonrpc = parse_bool("MCPSTUB_STRICT_JSONRPC", v);
    }
    if (const char* v = getenv_or_null("MCPSTUB_SEED")) {
        c.server.random_seed = parse_seed("MCPSTUB_SEED", v);
    }
    if (const char* v = getenv_or_null("MCPSTUB_LOG_LEVEL")) {
        c.log_level = parse_level("MCPSTUB_LOG_LEVEL", v);
    }
    return c;
}

Config Config::from_args(int argc, const char* const* argv, Config base) {
    Config c = std::move(base);
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        auto value = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw ConfigError(flag + " requires a value");
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            c.show_help = true;
        } else if (arg == "-V" || arg == "--version") {
            c.show_version = true;
        } else if (arg == "--name") {
            c.server.server_info.name = value(arg);
            if (c.server.server_info.name.empty()) throw ConfigError("--name must not be empty");
        } else if (arg == "--server-version") {
            c.server.server_info.version = value(arg);
        } else if (arg == "--id-policy") {
            c.server.id_policy = parse_policy(arg, value(arg));
        } else if (arg == "--strict") {
            c.server.strict_jsonrpc = true;
        } else if (arg == "--seed") {
            c.server.random_seed = parse_seed(arg, value(arg));
        } else if (arg == "--log-level") {
            c.log_level = parse_level(arg, value(arg));
        } else {
            throw ConfigError("Unknown argument: " + arg);
        }
    }
    return c;
}

Config Config::from_args(int argc, const char* const* argv) {
    return from_args(argc, argv, Config{});
}

std::string usage(std::string_view program) {
    std::ostringstream os;
    os << "Usage: " << program << " [options]\n"
       << "\n"
       << "MCP test server speaking newline-delimited JSON-RPC 2.0 on stdin/stdout.\n"
       << "\n"
       << "Options:\n"
       << "  --name <name>               serverInfo.name (default: test-mcp-server)\n"
       << "  --server-version <version>  serverInfo.version (default: 0.1.0)\n"
       << "  --id-policy <policy>        sequential (default) or reference\n"
       << "  --strict                    reject requests without jsonrpc \"2.0\"\n"
       << "  --seed <n>                  seed the random tool\n"
       << "  --log-level <level>         trace|debug|info|warn|error|critical|off\n"
       << "  -V, --version               print version and exit\n"
       << "  -h, --help                  print this help and exit\n"
       << "\n"
       << "Environment: MCPSTUB_SERVER_NAME, MCPSTUB_SERVER_VERSION, MCPSTUB_ID_POLICY,\n"
       << "MCPSTUB_STRICT_JSONRPC, MCPSTUB_SEED, MCPSTUB_LOG_LEVEL.\n";
    return os.str();
}

} // namespace mcpstub
