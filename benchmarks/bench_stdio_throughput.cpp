#include <benchmark/benchmark.h>
#include "mcpstub/log.hpp"
#include "mcpstub/server.hpp"
#include "mcpstub/transport/stdio_transport.hpp"
#include <unistd.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

using namespace mcpstub;

namespace {

void write_all(int fd, const std::string& data) {
    const char* p = data.data();
    size_t remaining = data.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd, p, remaining);
        if (n <= 0) return;
        p += n;
        remaining -= static_cast<size_t>(n);
    }
}

// Reads newline-terminated responses from the server side of the pipe.
class LineCounter {
public:
    explicit LineCounter(int fd) : fd_(fd) {}

    // Block until `n` more lines have arrived; false at end of file.
    bool wait_for(int n) {
        while (n > 0) {
            if (pos_ == len_) {
                ssize_t r = ::read(fd_, buf_, sizeof(buf_));
                if (r <= 0) return false;
                pos_ = 0;
                len_ = static_cast<size_t>(r);
            }
            for (; pos_ < len_ && n > 0; ++pos_) {
                if (buf_[pos_] == '\n') --n;
            }
        }
        return true;
    }

private:
    int fd_;
    char buf_[65536];
    size_t pos_ = 0;
    size_t len_ = 0;
};

// Server running on its own thread behind a pair of pipes.
class PipeServer {
public:
    PipeServer() {
        log::set_level("off");
        if (::pipe(c2s_) < 0 || ::pipe(s2c_) < 0) throw std::runtime_error("pipe failed");
        Server::Options opts;
        opts.random_seed = 1;
        server_ = std::make_unique<Server>(opts);
        auto transport = std::make_unique<StdioTransport>(c2s_[0], s2c_[1]);
        thread_ = std::thread([this, t = std::move(transport)]() mutable {
            server_->serve(std::move(t));
        });
    }

    ~PipeServer() {
        ::close(c2s_[1]);
        thread_.join();
        ::close(s2c_[0]);
    }

    int input() const { return c2s_[1]; }
    int output() const { return s2c_[0]; }

private:
    int c2s_[2]{-1, -1};
    int s2c_[2]{-1, -1};
    std::unique_ptr<Server> server_;
    std::thread thread_;
};

const std::string kPing = "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\n";
const std::string kEcho =
    "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"tools/call\",\"params\":{\"name\":\"echo\",\"arguments\":{\"text\":\"hello\"}}}\n";

} // anonymous namespace

static void BM_StdioRoundTrip(benchmark::State& state) {
    PipeServer server;
    LineCounter lines(server.output());
    for (auto _ : state) {
        write_all(server.input(), kPing);
        if (!lines.wait_for(1)) {
            state.SkipWithError("server closed its output");
            break;
        }
    }
}
BENCHMARK(BM_StdioRoundTrip);

static void BM_StdioThroughput(benchmark::State& state) {
    const int n = static_cast<int>(state.range(0));
    std::string batch;
    for (int i = 0; i < n; ++i) batch += kEcho;

    PipeServer server;
    LineCounter lines(server.output());
    for (auto _ : state) {
        // Write from another thread so neither pipe can fill up and stall both sides
        std::thread writer([&] { write_all(server.input(), batch); });
        bool ok = lines.wait_for(n);
        writer.join();
        if (!ok) {
            state.SkipWithError("server closed its output");
            break;
        }
    }
    state.SetItemsProcessed(state.iterations() * n);
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(batch.size()));
}
BENCHMARK(BM_StdioThroughput)->Arg(100)->Arg(1000)->Arg(10000);
