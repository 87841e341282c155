#include <gtest/gtest.h>
#include <mcpbridge/transport/transport.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

using namespace mcpbridge;
using namespace mcpbridge::transport;
using namespace std::chrono_literals;
using protocol::ProtocolMessage;
using protocol::Request;
using protocol::Response;

namespace {

process::ServerDescriptor mockServer(std::vector<std::string> args = {}) {
    process::ServerDescriptor d;
    d.name = "mock";
    d.command = MCPBRIDGE_MOCK_SERVER;
    d.args = std::move(args);
    return d;
}

// Collects what the reader thread delivers
struct Inbox {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<ProtocolMessage> messages;
    std::vector<Error> closures;

    MessageHandler messageHandler() {
        return [this](ProtocolMessage m) {
            std::lock_guard<std::mutex> lock(mutex);
            messages.push_back(std::move(m));
            cv.notify_all();
        };
    }

    ClosedHandler closedHandler() {
        return [this](const Error& e) {
            std::lock_guard<std::mutex> lock(mutex);
            closures.push_back(e);
            cv.notify_all();
        };
    }

    bool waitForMessages(size_t n, std::chrono::milliseconds limit = 5s) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, limit, [&] { return messages.size() >= n; });
    }

    bool waitForClose(std::chrono::milliseconds limit = 5s) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, limit, [&] { return !closures.empty(); });
    }
};

std::unique_ptr<ITransport> openMock(std::vector<std::string> args = {},
                                 StdioTransportOptions options = {}) {
    auto factory = makeStdioTransportFactory(options);
    auto created = factory(mockServer(std::move(args)));
    if (!created) {
        ADD_FAILURE() << created.error().message;
        return nullptr;
    }
    return std::move(created).value();
}

Request initialize(RequestId id) {
    return Request{id, "initialize", nlohmann::json{{"protocolVersion", "2024-11-05"}}};
}

} // namespace

TEST(StdioTransport, RoundTripWithHelper) {
    Inbox inbox;
    auto t = openMock();
    ASSERT_TRUE(t);
    ASSERT_TRUE(t->start(inbox.messageHandler(), inbox.closedHandler()));
    EXPECT_TRUE(t->isOpen());
    EXPECT_TRUE(t->pid().has_value());

    ASSERT_TRUE(t->write(initialize(1)));
    ASSERT_TRUE(inbox.waitForMessages(1));
    {
        std::lock_guard<std::mutex> lock(inbox.mutex);
        const auto* resp = std::get_if<Response>(&inbox.messages[0]);
        ASSERT_NE(resp, nullptr);
        EXPECT_EQ(resp->id, 1);
        EXPECT_EQ((*resp->result)["serverInfo"]["name"], "mock-mcp");
    }

    t->close(1s);
    EXPECT_FALSE(t->isOpen());
    // A local close is not reported as a peer loss
    std::lock_guard<std::mutex> lock(inbox.mutex);
    EXPECT_TRUE(inbox.closures.empty());
}

TEST(StdioTransport, MalformedLinesAreDroppedNotFatal) {
    Inbox inbox;
    auto t = openMock({"--garbage"});
    ASSERT_TRUE(t);
    ASSERT_TRUE(t->start(inbox.messageHandler(), inbox.closedHandler()));

    ASSERT_TRUE(t->write(initialize(1)));
    ASSERT_TRUE(t->write(Request{2, "tools/list", nlohmann::json::object()}));
    ASSERT_TRUE(inbox.waitForMessages(2));

    auto* stdio = dynamic_cast<StdioTransport*>(t.get());
    ASSERT_NE(stdio, nullptr);
    EXPECT_EQ(stdio->droppedFrames(), 2u);
    EXPECT_TRUE(t->isOpen());
}

TEST(StdioTransport, WronglyTypedErrorFrameDoesNotStopReader) {
    process::ServerDescriptor d;
    d.name = "shell";
    d.command = "/bin/sh";
    d.args = {"-c", "printf '%s\\n' "
                    "'{\"jsonrpc\":\"2.0\",\"id\":1,\"error\":{\"code\":1,\"message\":5}}' "
                    "'{\"jsonrpc\":\"2.0\",\"id\":2,\"result\":{\"ok\":true}}'; "
                    "exec cat >/dev/null"};
    auto created = makeStdioTransportFactory({})(d);
    ASSERT_TRUE(created) << created.error().message;
    auto t = std::move(created).value();

    Inbox inbox;
    ASSERT_TRUE(t->start(inbox.messageHandler(), inbox.closedHandler()));
    ASSERT_TRUE(inbox.waitForMessages(1));
    {
        std::lock_guard<std::mutex> lock(inbox.mutex);
        ASSERT_EQ(inbox.messages.size(), 1u);
        const auto* resp = std::get_if<Response>(&inbox.messages[0]);
        ASSERT_NE(resp, nullptr);
        EXPECT_EQ(resp->id, 2);
        EXPECT_EQ((*resp->result)["ok"], true);
    }

    auto* stdio = dynamic_cast<StdioTransport*>(t.get());
    ASSERT_NE(stdio, nullptr);
    EXPECT_EQ(stdio->droppedFrames(), 1u);
    EXPECT_TRUE(t->isOpen());
    t->close(1s);
}

TEST(StdioTransport, HelperExitFiresClosedOnce) {
    Inbox inbox;
    auto t = openMock();
    ASSERT_TRUE(t);
    ASSERT_TRUE(t->start(inbox.messageHandler(), inbox.closedHandler()));

    ASSERT_TRUE(t->write(initialize(1)));
    ASSERT_TRUE(inbox.waitForMessages(1));
    ASSERT_TRUE(t->write(Request{2, "tools/call", {{"name", "crash"}}}));

    ASSERT_TRUE(inbox.waitForClose());
    {
        std::lock_guard<std::mutex> lock(inbox.mutex);
        ASSERT_EQ(inbox.closures.size(), 1u);
        EXPECT_EQ(inbox.closures[0].code, ErrorCode::TransportClosed);
        EXPECT_NE(inbox.closures[0].message.find("exit code 3"), std::string::npos);
    }
    EXPECT_FALSE(t->isOpen());

    auto w = t->write(initialize(3));
    ASSERT_FALSE(w);
    EXPECT_EQ(w.error().code, ErrorCode::TransportClosed);

    t->close(100ms);
    std::lock_guard<std::mutex> lock(inbox.mutex);
    EXPECT_EQ(inbox.closures.size(), 1u);
}

TEST(StdioTransport, StderrNoiseDoesNotDisturbStdout) {
    Inbox inbox;
    auto t = openMock({"--stderr-noise"});
    ASSERT_TRUE(t);
    ASSERT_TRUE(t->start(inbox.messageHandler(), inbox.closedHandler()));

    for (RequestId id = 1; id <= 5; ++id) {
        ASSERT_TRUE(t->write(id == 1 ? initialize(id)
                                     : Request{id, "tools/list", nlohmann::json::object()}));
    }
    ASSERT_TRUE(inbox.waitForMessages(5));
    std::lock_guard<std::mutex> lock(inbox.mutex);
    for (size_t i = 0; i < inbox.messages.size(); ++i) {
        const auto* resp = std::get_if<Response>(&inbox.messages[i]);
        ASSERT_NE(resp, nullptr);
        EXPECT_EQ(resp->id, static_cast<RequestId>(i + 1));
    }
}

TEST(StdioTransport, OversizedFrameIsDropped) {
    StdioTransportOptions opts;
    opts.maxFrameBytes = 1024;
    Inbox inbox;
    auto t = openMock({}, opts);
    ASSERT_TRUE(t);
    ASSERT_TRUE(t->start(inbox.messageHandler(), inbox.closedHandler()));

    ASSERT_TRUE(t->write(initialize(1)));
    ASSERT_TRUE(inbox.waitForMessages(1));
    ASSERT_TRUE(t->write(Request{2, "tools/call",
                                 {{"name", "echo"}, {"arguments", {{"text", std::string(4096, 'x')}}}}}));
    ASSERT_TRUE(t->write(Request{3, "tools/call",
                                 {{"name", "echo"}, {"arguments", {{"text", "small"}}}}}));
    ASSERT_TRUE(inbox.waitForMessages(2));

    std::lock_guard<std::mutex> lock(inbox.mutex);
    const auto* resp = std::get_if<Response>(&inbox.messages[1]);
    ASSERT_NE(resp, nullptr);
    EXPECT_EQ(resp->id, 3);
    EXPECT_EQ(dynamic_cast<StdioTransport*>(t.get())->droppedFrames(), 1u);
}

TEST(StdioTransport, CloseKillsStubbornHelper) {
    Inbox inbox;
    auto t = openMock({"--ignore-sigterm"});
    ASSERT_TRUE(t);
    ASSERT_TRUE(t->start(inbox.messageHandler(), inbox.closedHandler()));
    ASSERT_TRUE(t->write(initialize(1)));
    ASSERT_TRUE(inbox.waitForMessages(1));

    auto started = std::chrono::steady_clock::now();
    t->close(200ms);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 3s);
    EXPECT_FALSE(t->isOpen());
    EXPECT_FALSE(t->pid().has_value());
}
