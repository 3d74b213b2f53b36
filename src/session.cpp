#include "mcpstub/session.hpp"

namespace mcpstub {

const char* to_string(IdPolicy p) {
    switch (p) {
        case IdPolicy::Sequential: return "sequential";
        case IdPolicy::Reference:  return "reference";
    }
    return "sequential";
}

std::optional<IdPolicy> parse_id_policy(std::string_view s) {
    if (s == "sequential") return IdPolicy::Sequential;
    if (s == "reference")  return IdPolicy::Reference;
    return std::nullopt;
}

Session::Session(IdPolicy policy) : policy_(policy) {}

SessionState Session::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void Session::set_state(SessionState s) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = s;
}

IdPolicy Session::id_policy() const {
    return policy_;
}

int64_t Session::current_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_id_;
}

int64_t Session::next_id(std::optional<int64_t> reference_literal) {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t id = next_id_++;
    ++responses_;
    if (policy_ == IdPolicy::Reference && reference_literal) {
        return *reference_literal;
    }
    return id;
}

uint64_t Session::responses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return responses_;
}

std::optional<Implementation> Session::client_info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_info_;
}

void Session::set_client_info(Implementation info) {
    std::lock_guard<std::mutex> lock(mutex_);
    client_info_ = std::move(info);
}

std::optional<std::string> Session::client_protocol_version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_protocol_version_;
}

void Session::set_client_protocol_version(std::string v) {
    std::lock_guard<std::mutex> lock(mutex_);
    client_protocol_version_ = std::move(v);
}

} // namespace mcpstub
