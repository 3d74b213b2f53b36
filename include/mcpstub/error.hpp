#pragma once
#include <stdexcept>
#include <string>

namespace mcpstub {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ParseError : public Error {
public:
    using Error::Error;
};

/// Raised by handlers and tools; converted into a JSON-RPC error response.
class ProtocolError : public Error {
public:
    int code;
    ProtocolError(int code, const std::string& msg)
        : Error(msg), code(code) {}
};

class TransportError : public Error {
public:
    using Error::Error;
};

class ConfigError : public Error {
public:
    using Error::Error;
};

/// A runtime dependency (the JSON backend) is unusable.
class DependencyError : public Error {
public:
    using Error::Error;
};

namespace error {
    constexpr int ParseError       = -32700;
    constexpr int InvalidRequest   = -32600;
    constexpr int MethodNotFound   = -32601;
    constexpr int InvalidParams    = -32602;
    constexpr int InternalError    = -32603;
} // namespace error

} // namespace mcpstub
