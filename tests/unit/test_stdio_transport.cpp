#include <gtest/gtest.h>
#include "mcpfs/transport/stdio_transport.hpp"
#include "mcpfs/error.hpp"
#include <unistd.h>
#include <csignal>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace mcpfs;

namespace {

// Pipes around a transport: the test writes to `in`, the transport writes to `out`.
class PipeHarness {
public:
    PipeHarness() {
        int in[2], out[2];
        if (::pipe(in) < 0 || ::pipe(out) < 0) {
            throw std::runtime_error("pipe failed");
        }
        in_write_ = in[1];
        out_read_ = out[0];
        transport_ = std::make_unique<StdioTransport>(in[0], out[1]);
    }

    ~PipeHarness() {
        transport_.reset();
        close_input();
        if (out_read_ >= 0) ::close(out_read_);
    }

    void feed(const std::string& data) {
        ASSERT_EQ(::write(in_write_, data.data(), data.size()), static_cast<ssize_t>(data.size()));
    }

    void close_input() {
        if (in_write_ >= 0) ::close(in_write_);
        in_write_ = -1;
    }

    void close_output_reader() {
        if (out_read_ >= 0) ::close(out_read_);
        out_read_ = -1;
    }

    /// Everything the transport wrote, once it is destroyed.
    std::string drain_output() {
        transport_.reset();
        std::string out;
        char buf[4096];
        ssize_t n;
        while ((n = ::read(out_read_, buf, sizeof(buf))) > 0) out.append(buf, static_cast<size_t>(n));
        return out;
    }

    StdioTransport& transport() { return *transport_; }

private:
    int in_write_ = -1;
    int out_read_ = -1;
    std::unique_ptr<StdioTransport> transport_;
};

std::vector<std::string> read_all_frames(IConnection& conn) {
    std::vector<std::string> frames;
    while (auto f = conn.read_frame()) frames.push_back(*f);
    return frames;
}

} // namespace

TEST(StdioTransport, SplitsFramesOnNewlines) {
    PipeHarness h;
    h.feed("first\r\n\n{\"b\":1}\n\r\nlast-without-newline");
    h.close_input();

    std::vector<std::string> frames;
    h.transport().start([&](IConnection& conn) { frames = read_all_frames(conn); });
    EXPECT_EQ(frames, (std::vector<std::string>{"first", "{\"b\":1}", "last-without-newline"}));
    EXPECT_FALSE(h.transport().is_running());
}

TEST(StdioTransport, LargeFrameSpansReads) {
    PipeHarness h;
    std::string big(20000, 'x');
    h.feed(big + "\nsmall\n");
    h.close_input();

    std::vector<std::string> frames;
    h.transport().start([&](IConnection& conn) { frames = read_all_frames(conn); });
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0], big);
    EXPECT_EQ(frames[1], "small");
}

TEST(StdioTransport, WriteAppendsNewline) {
    PipeHarness h;
    h.close_input();
    h.transport().start([](IConnection& conn) {
        conn.write_frame("{\"a\":1}");
        conn.write_frame("two");
    });
    EXPECT_EQ(h.drain_output(), "{\"a\":1}\ntwo\n");
}

TEST(StdioTransport, ShutdownUnblocksRead) {
    PipeHarness h;
    bool saw_end = false;
    std::thread runner([&] {
        h.transport().start([&](IConnection& conn) { saw_end = !conn.read_frame().has_value(); });
    });
    for (int i = 0; i < 200 && !h.transport().is_running(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_TRUE(h.transport().is_running());
    h.transport().shutdown();
    runner.join();
    EXPECT_TRUE(saw_end);
    EXPECT_FALSE(h.transport().is_running());
}

TEST(StdioTransport, ShutdownBeforeStartSkipsHandler) {
    PipeHarness h;
    h.transport().shutdown();
    bool called = false;
    h.transport().start([&](IConnection&) { called = true; });
    EXPECT_FALSE(called);
}

TEST(StdioTransport, HandlerExceptionPropagates) {
    PipeHarness h;
    h.close_input();
    EXPECT_THROW(h.transport().start([](IConnection&) { throw McpTransportError("boom"); }),
                 McpTransportError);
    EXPECT_FALSE(h.transport().is_running());
}

TEST(StdioTransport, WriteToClosedPipeThrows) {
    std::signal(SIGPIPE, SIG_IGN);
    PipeHarness h;
    h.close_input();
    h.close_output_reader();
    EXPECT_THROW(h.transport().start([](IConnection& conn) { conn.write_frame("lost"); }),
                 McpTransportError);
}
