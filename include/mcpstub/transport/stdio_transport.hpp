#pragma once
#include "transport.hpp"
#include "../codec.hpp"
#include <atomic>
#include <mutex>

namespace mcpstub {

/// StdioTransport reads newline-delimited JSON from stdin and writes to stdout.
/// Requests are delivered and answered on the calling thread, one at a time,
/// so every response is written before the next line is read.
class StdioTransport : public ITransport {
public:
    /// Create transport using system stdin/stdout.
    StdioTransport();

    /// Create transport using specified file descriptors (for testing).
    /// The descriptors are closed on destruction.
    StdioTransport(int read_fd, int write_fd);

    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    void start(MessageCallback on_message, ErrorCallback on_error = nullptr) override;
    void send(const Response& resp) override;
    void shutdown() override;
    bool is_connected() const override;

private:
    void read_loop(const MessageCallback& on_message, const ErrorCallback& on_error);
    void write_all(const std::string& data);

    int read_fd_;
    int write_fd_;
    bool owns_fds_;

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<bool> shutdown_requested_{false};

    std::mutex write_mutex_;

    int wakeup_pipe_[2]{-1, -1};  // pipe for interrupting poll()
};

} // namespace mcpstub
