#pragma once

#include <mcpbridge/core/types.h>
#include <mcpbridge/process/process_launcher.h>
#include <mcpbridge/protocol/message.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace mcpbridge::transport {

using MessageHandler = std::function<void(protocol::ProtocolMessage)>;
using ClosedHandler = std::function<void(const Error&)>;

/**
 * @brief Bidirectional message channel to one helper.
 *
 * Implementations deliver decoded messages to the message handler from a
 * single reader thread, in arrival order, and invoke the closed handler at
 * most once when the peer goes away on its own. A locally requested close()
 * does not fire the closed handler. Handlers must not call close().
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    virtual Result<void> start(MessageHandler onMessage, ClosedHandler onClosed) = 0;

    /**
     * @brief Write one message as a single frame. Concurrent writers never interleave.
     */
    virtual Result<void> write(const protocol::ProtocolMessage& message) = 0;

    /**
     * @brief Stop reading and release the peer. Blocks for at most @p grace plus a kill.
     */
    virtual void close(std::chrono::milliseconds grace) = 0;

    virtual bool isOpen() const = 0;

    virtual std::optional<int64_t> pid() const { return std::nullopt; }
};

using TransportFactory =
    std::function<Result<std::unique_ptr<ITransport>>(const process::ServerDescriptor&)>;

struct StdioTransportOptions {
    size_t maxFrameBytes{10 * 1024 * 1024};
    std::chrono::milliseconds pollInterval{50};
};

/**
 * @brief Transport over a spawned helper's stdin/stdout, with stderr drained to the log.
 */
class StdioTransport final : public ITransport {
public:
    StdioTransport(std::unique_ptr<process::ProcessHandle> process,
                   StdioTransportOptions options = {});
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    Result<void> start(MessageHandler onMessage, ClosedHandler onClosed) override;
    Result<void> write(const protocol::ProtocolMessage& message) override;
    void close(std::chrono::milliseconds grace) override;
    bool isOpen() const override;
    std::optional<int64_t> pid() const override;

    /**
     * @brief Frames dropped because they failed to decode or exceeded the size limit.
     */
    uint64_t droppedFrames() const noexcept { return droppedFrames_.load(); }

private:
    void readLoop(std::stop_token token);
    void stderrLoop(std::stop_token token);
    void joinThread(std::jthread& t);

    std::unique_ptr<process::ProcessHandle> process_;
    StdioTransportOptions options_;
    std::string name_;

    MessageHandler onMessage_;
    ClosedHandler onClosed_;

    std::mutex writeMutex_;
    std::mutex closeMutex_;
    std::atomic<bool> open_{false};
    std::atomic<bool> closing_{false};
    std::atomic<bool> closedNotified_{false};
    std::atomic<uint64_t> droppedFrames_{0};

    std::jthread readerThread_;
    std::jthread stderrThread_;
};

/**
 * @brief Default factory: launch the descriptor's process and wrap it in a StdioTransport.
 */
TransportFactory makeStdioTransportFactory(StdioTransportOptions options = {});

} // namespace mcpbridge::transport
