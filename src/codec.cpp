#include "mcpstub/codec.hpp"
#include "mcpstub/error.hpp"
#include "mcpstub/log.hpp"
#include "mcpstub/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <cstdint>
#include <limits>
#include <string>

namespace mcpstub {

namespace {

// Convert simdjson value to nlohmann::json recursively
nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            for (auto field : val.get_object()) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            switch (val.get_number_type()) {
                case simdjson::ondemand::number_type::signed_integer:
                    return nlohmann::json(int64_t(val.get_int64()));
                case simdjson::ondemand::number_type::unsigned_integer:
                    return nlohmann::json(uint64_t(val.get_uint64()));
                default:
                    return nlohmann::json(double(val.get_double()));
            }
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(bool(val.get_bool()));
        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);
        default:
            return nlohmann::json(nullptr);
    }
}

nlohmann::json parse_document(std::string_view raw) {
    simdjson::ondemand::parser parser;
    // simdjson requires padded input
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw ParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    // Scalar documents cannot be viewed as a value; they are not messages either.
    simdjson::ondemand::json_type root_type;
    if (doc.type().get(root_type) || root_type != simdjson::ondemand::json_type::object) {
        throw ParseError("Message must be a JSON object");
    }

    nlohmann::json j;
    try {
        simdjson::ondemand::value root;
        if (doc.get_value().get(root)) {
            throw ParseError("Failed to get document value");
        }
        j = simdjson_to_nlohmann(root);
    } catch (const simdjson::simdjson_error& e) {
        throw ParseError(std::string("JSON parse error: ") + e.what());
    }

    if (!doc.at_end()) {
        throw ParseError("Trailing content after JSON object");
    }
    return j;
}

} // anonymous namespace

Request Codec::parse_object(const nlohmann::json& j) {
    Request req;

    if (j.contains("method")) {
        const auto& method = j.at("method");
        if (!method.is_string()) {
            throw ParseError("'method' must be a string");
        }
        req.method = method.get<std::string>();
    }

    // Other id types are dropped; routing never depends on the id
    if (j.contains("id") && !j.at("id").is_null()) {
        const auto& id = j.at("id");
        const bool fits_int64 = id.is_number_integer()
            && !(id.is_number_unsigned()
                 && id.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()));
        if (id.is_string() || fits_int64) {
            RequestId rid;
            from_json(id, rid);
            req.id = std::move(rid);
        } else {
            MCPSTUB_LOG_DEBUG("Ignoring request id of unsupported type: {}", id.dump());
        }
    }

    if (j.contains("params")) req.params = j.at("params");

    if (j.contains("jsonrpc") && j.at("jsonrpc").is_string()) {
        req.jsonrpc = j.at("jsonrpc").get<std::string>();
    }
    return req;
}

Request Codec::parse(std::string_view raw) {
    if (raw.empty()) {
        throw ParseError("Empty input");
    }
    return parse_object(parse_document(raw));
}

Request Codec::decode(std::string_view raw) {
    try {
        return parse(raw);
    } catch (const ParseError& e) {
        MCPSTUB_LOG_WARN("Malformed message ({}): {}", e.what(), std::string(raw.substr(0, 200)));
        return Request{};
    }
}

std::string Codec::encode(const Response& resp) {
    nlohmann::json j;
    to_json(j, resp);
    return j.dump();
}

void Codec::self_check() {
    const simdjson::implementation* impl = simdjson::get_active_implementation();
    if (impl == nullptr || impl->name() == "unsupported") {
        throw DependencyError("No usable simdjson implementation for this CPU");
    }

    constexpr std::string_view probe =
        R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"echo","arguments":{"text":"a\"b\\c"}}})";
    Request req;
    try {
        req = parse(probe);
    } catch (const ParseError& e) {
        throw DependencyError(std::string("JSON backend failed to parse probe: ") + e.what());
    }
    if (req.method != "tools/call" || !req.params
        || req.params->at("arguments").at("text") != "a\"b\\c") {
        throw DependencyError("JSON backend decoded probe incorrectly");
    }

    auto line = encode(Response::success(7, nlohmann::json{{"text", "a\"b\\c"}}));
    auto back = nlohmann::json::parse(line, nullptr, false);
    if (back.is_discarded() || back.at("result").at("text") != "a\"b\\c") {
        throw DependencyError("JSON backend encoded probe incorrectly");
    }
    MCPSTUB_LOG_DEBUG("JSON backend ok (simdjson implementation: {})", impl->name());
}

} // namespace mcpstub
