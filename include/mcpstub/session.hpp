#pragma once
#include "types.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace mcpstub {

/// How response ids are chosen.
enum class IdPolicy {
    /// Every response carries the counter value, then the counter advances.
    Sequential,
    /// As Sequential, except initialize and tools/list report the fixed
    /// literals 1 and 2 (the counter still advances).
    Reference
};

[[nodiscard]] const char* to_string(IdPolicy p);
[[nodiscard]] std::optional<IdPolicy> parse_id_policy(std::string_view s);

/// Diagnostic only; never gates a method.
enum class SessionState {
    Uninitialized,
    Initializing,
    Ready
};

/// Per-stream state: the response id counter and what the client told us.
class Session {
public:
    explicit Session(IdPolicy policy = IdPolicy::Sequential);

    SessionState state() const;
    void set_state(SessionState s);

    IdPolicy id_policy() const;

    /// Value the counter holds now.
    int64_t current_id() const;

    /// Claim an id for one response and advance the counter by one.
    /// Under IdPolicy::Reference, `reference_literal` is reported instead of the
    /// counter value when given.
    int64_t next_id(std::optional<int64_t> reference_literal = std::nullopt);

    /// Number of responses issued so far.
    uint64_t responses() const;

    std::optional<Implementation> client_info() const;
    void set_client_info(Implementation info);

    std::optional<std::string> client_protocol_version() const;
    void set_client_protocol_version(std::string v);

private:
    mutable std::mutex mutex_;
    const IdPolicy policy_;
    SessionState state_{SessionState::Uninitialized};
    int64_t next_id_{1};
    uint64_t responses_{0};
    std::optional<Implementation> client_info_;
    std::optional<std::string> client_protocol_version_;
};

} // namespace mcpstub
