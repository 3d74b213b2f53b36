#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string>
#include <string_view>

namespace mcpstub {

class Codec {
public:
    /// Parse one line into a request.
    /// Throws ParseError on invalid JSON, a non-object document, or mistyped members.
    /// A missing "method" yields an empty method name.
    [[nodiscard]] static Request parse(std::string_view raw);

    /// Lenient form of parse(): malformed input degrades to a request with an
    /// empty method and no id/params. Never throws ParseError.
    [[nodiscard]] static Request decode(std::string_view raw);

    /// Serialize a response to a single line (no trailing newline).
    [[nodiscard]] static std::string encode(const Response& resp);

    /// Verify the JSON backend is usable. Throws DependencyError otherwise.
    static void self_check();

private:
    static Request parse_object(const nlohmann::json& j);
};

} // namespace mcpstub
