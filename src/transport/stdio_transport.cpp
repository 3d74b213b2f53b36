#include "mcpstub/transport/stdio_transport.hpp"
#include "mcpstub/error.hpp"
#include "mcpstub/log.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <string>

namespace mcpstub {

namespace {

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r\f\v") == std::string::npos;
}

void report(const ErrorCallback& on_error, const std::string& what) {
    if (!on_error) return;
    try {
        throw TransportError(what);
    } catch (const TransportError&) {
        on_error(std::current_exception());
    }
}

} // anonymous namespace

StdioTransport::StdioTransport()
    : read_fd_(STDIN_FILENO), write_fd_(STDOUT_FILENO), owns_fds_(false) {
}

StdioTransport::StdioTransport(int read_fd, int write_fd)
    : read_fd_(read_fd), write_fd_(write_fd), owns_fds_(true) {
}

StdioTransport::~StdioTransport() {
    shutdown();
    if (owns_fds_) {
        if (read_fd_ >= 0)  ::close(read_fd_);
        if (write_fd_ >= 0) ::close(write_fd_);
    }
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

void StdioTransport::start(MessageCallback on_message, ErrorCallback on_error) {
    // shutdown() before start(): return without blocking
    if (shutdown_requested_.load()) return;

    // The pipe must exist before running_ is set so shutdown() can always signal it
    if (wakeup_pipe_[0] < 0) {
        if (::pipe(wakeup_pipe_) < 0) {
            throw TransportError(std::string("Failed to create wakeup pipe: ") + std::strerror(errno));
        }
        // Set non-blocking on write end of wakeup pipe
        int flags = ::fcntl(wakeup_pipe_[1], F_GETFL, 0);
        ::fcntl(wakeup_pipe_[1], F_SETFL, flags | O_NONBLOCK);
    }

    if (running_.exchange(true)) {
        return; // already running
    }
    // shutdown() may have run between the first check and the exchange
    if (shutdown_requested_.load()) {
        running_ = false;
        return;
    }

    connected_ = true;
    read_loop(on_message, on_error);
    connected_ = false;
    running_ = false;
}

void StdioTransport::read_loop(const MessageCallback& on_message, const ErrorCallback& on_error) {
    std::string buffer;
    buffer.reserve(4096);

    char chunk[4096];
    bool eof = false;

    while (running_ && !eof) {
        // Use poll() so that shutdown() can interrupt the blocking read
        // via the wakeup pipe.
        struct pollfd fds[2];
        fds[0].fd = read_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            report(on_error, std::string("poll failed: ") + std::strerror(errno));
            break;
        }

        // Wakeup pipe has data → shutdown() was called, exit cleanly
        if (fds[1].revents & POLLIN) break;

        if (fds[0].revents & POLLNVAL) {
            report(on_error, "Input descriptor is not open");
            break;
        }
        // POLLHUP without POLLIN still needs a read() to observe EOF
        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            if (!running_) break;
            report(on_error, std::string("Read error: ") + std::strerror(errno));
            break;
        }
        if (n == 0) {
            eof = true;
        } else {
            buffer.append(chunk, static_cast<size_t>(n));
        }

        // A final line without a trailing newline still counts at end of input
        if (eof && !buffer.empty() && buffer.back() != '\n') {
            buffer.push_back('\n');
        }

        // Process complete lines
        size_t pos = 0;
        while (running_) {
            size_t nl = buffer.find('\n', pos);
            if (nl == std::string::npos) break;

            std::string line = buffer.substr(pos, nl - pos);
            pos = nl + 1;

            // Remove trailing \r if present (CRLF)
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (is_blank(line)) continue;

            on_message(Codec::decode(line));
        }

        if (pos > 0) {
            buffer.erase(0, pos);
        }
    }

    if (eof) {
        MCPSTUB_LOG_DEBUG("End of input");
    }
}

void StdioTransport::write_all(const std::string& data) {
    const char* p = data.data();
    size_t remaining = data.size();

    while (remaining > 0) {
        ssize_t written = ::write(write_fd_, p, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            connected_ = false;
            throw TransportError(std::string("Write error: ") + std::strerror(errno));
        }
        p += written;
        remaining -= static_cast<size_t>(written);
    }
}

void StdioTransport::send(const Response& resp) {
    if (shutdown_requested_.load()) {
        throw TransportError("Transport shut down");
    }
    std::string line = Codec::encode(resp);
    line += '\n';

    std::lock_guard<std::mutex> lock(write_mutex_);
    write_all(line);
}

void StdioTransport::shutdown() {
    shutdown_requested_ = true;
    if (!running_.exchange(false)) {
        return;
    }
    connected_ = false;
    // Write to wakeup pipe to interrupt poll() in read_loop().
    if (wakeup_pipe_[1] >= 0) {
        char b = 1;
        if (::write(wakeup_pipe_[1], &b, 1) < 0 && errno != EAGAIN) {
            MCPSTUB_LOG_WARN("Failed to signal reader: {}", std::strerror(errno));
        }
    }
}

bool StdioTransport::is_connected() const {
    return connected_;
}

} // namespace mcpstub
