#pragma once

/// Umbrella header for the mcpstub MCP test-server library.

#include "version.hpp"
#include "error.hpp"
#include "log.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "tool.hpp"
#include "tool_registry.hpp"
#include "tools/builtin.hpp"
#include "session.hpp"
#include "dispatcher.hpp"
#include "server.hpp"
#include "config.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
