#pragma once

#include <mcpbridge/core/types.h>
#include <mcpbridge/process/process_launcher.h>
#include <mcpbridge/protocol/message.h>
#include <mcpbridge/session/connection_fsm.h>
#include <mcpbridge/session/readiness_probe.h>
#include <mcpbridge/session/request_correlator.h>
#include <mcpbridge/session/timer_service.h>
#include <mcpbridge/transport/transport.h>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace mcpbridge::session {

struct ClientInfo {
    std::string name{"LedgerPro"};
    std::string version{"1.0.0"};
};

struct SessionOptions {
    std::chrono::milliseconds handshakeTimeout{30'000};
    std::chrono::milliseconds defaultCallTimeout{30'000};
    RetryPolicy probe{5, std::chrono::milliseconds{1000}, 1.0, std::chrono::milliseconds{30'000}};
    std::chrono::milliseconds probeAttemptTimeout{5'000};
    std::chrono::milliseconds terminateGrace{5'000};
    std::string protocolVersion{protocol::DEFAULT_PROTOCOL_VERSION};
    ClientInfo clientInfo;
};

struct SessionMetrics {
    uint64_t requestCount{0};
    uint64_t successCount{0};
    uint64_t errorCount{0};
    uint64_t timeoutCount{0};
    double averageResponseMs{0.0}; ///< Exponential moving average, alpha 0.1
    std::optional<TimePoint> lastRequest;

    double successRate() const noexcept {
        return requestCount == 0 ? 0.0
                                 : static_cast<double>(successCount) /
                                       static_cast<double>(requestCount);
    }
};

struct ToolInfo {
    std::string name;
    std::string description;
    json inputSchema = json::object();
};

struct HealthReport {
    bool healthy{false};
    ConnectionState state{ConnectionState::Disconnected};
    std::optional<int64_t> pid;
    std::chrono::milliseconds uptime{0};
    std::string detail;
};

/**
 * @brief One helper connection: process, transport, handshake and correlated calls.
 *
 * connect() drives the handshake state machine to Ready or Failed and blocks
 * until one of them is reached. Until the initialize response has arrived
 * and the initialized notification has been written, nothing but the
 * initialize request is ever sent. Public calls are only accepted in Ready.
 */
class ProtocolSession {
public:
    using NotificationHandler = std::function<void(const protocol::Notification&)>;

    ProtocolSession(process::ServerDescriptor descriptor, SessionOptions options,
                    TimerService& timers, transport::TransportFactory factory);
    ~ProtocolSession();

    ProtocolSession(const ProtocolSession&) = delete;
    ProtocolSession& operator=(const ProtocolSession&) = delete;

    /**
     * @brief Launch, handshake and probe. A Failed session is torn down first.
     *
     * Returns LaunchFailed, HandshakeTimeout, HandshakeRejected, NotReady,
     * TransportClosed or OperationCancelled (disconnect() during connect).
     * Calling connect() on a Ready session is a no-op.
     */
    Result<void> connect();

    /**
     * @brief Terminate the helper and fail every pending call with Disconnected.
     *
     * Safe to call from any thread, also while connect() is running on another one.
     */
    void disconnect();

    /**
     * @brief Send @p method and wait for its response. NotReady unless the session is Ready.
     */
    Result<json> call(const std::string& method, json params = json::object(),
                      std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    Result<json> callTool(const std::string& tool, json arguments = json::object(),
                          std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /**
     * @brief tools/list, following nextCursor pagination. Refreshes the cached tool names.
     */
    Result<std::vector<ToolInfo>>
    listTools(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    ConnectionSnapshot snapshot() const { return fsm_.snapshot(); }
    ConnectionState state() const { return fsm_.state(); }
    const process::ServerDescriptor& descriptor() const noexcept { return descriptor_; }
    const std::string& name() const noexcept { return descriptor_.name; }

    SessionMetrics metrics() const;

    /**
     * @brief Connection-based health: Ready and the helper process still alive. Sends nothing.
     */
    HealthReport healthCheck() const;

    std::optional<int64_t> pid() const;

    /**
     * @brief Time since the session last became Ready; zero when not Ready.
     */
    std::chrono::milliseconds uptime() const;

    /**
     * @brief Result object of the last successful initialize (server capabilities and info).
     */
    json serverInfo() const;
    std::vector<std::string> cachedToolNames() const;
    size_t pendingCalls() const { return correlator_->pending(); }

    void setStateListener(ConnectionFsm::Listener listener);
    void setNotificationHandler(NotificationHandler handler);

private:
    Result<json> rawCall(const std::string& method, json params,
                         std::chrono::milliseconds timeout);
    Result<void> writeMessage(const protocol::ProtocolMessage& message);
    json initializeParams() const;
    void onMessage(protocol::ProtocolMessage message);
    void onTransportClosed(const Error& error);
    void closeTransport();
    void teardownLocked();
    Error failureFromSnapshot(const std::string& fallback) const;
    void recordCall(std::chrono::steady_clock::time_point started, const Result<json>& result);
    void cacheTools(const json& toolsListResult);

    process::ServerDescriptor descriptor_;
    SessionOptions options_;
    transport::TransportFactory factory_;

    ConnectionFsm fsm_;
    std::unique_ptr<RequestCorrelator> correlator_;

    std::mutex lifecycleMutex_;

    mutable std::mutex transportMutex_;
    std::shared_ptr<transport::ITransport> transport_;

    std::mutex stopMutex_;
    std::stop_source connectStop_;

    mutable std::mutex dataMutex_;
    json serverInfo_ = json::object();
    std::vector<std::string> toolNames_;
    std::optional<std::chrono::steady_clock::time_point> readySince_;
    SessionMetrics metrics_;
    NotificationHandler notificationHandler_;
};

/**
 * @brief Text of the first text content block of a tools/call result.
 *
 * ToolError when the result is flagged isError (message is the tool's text),
 * InvalidArgument when the result carries no text content.
 */
Result<std::string> toolResultText(const json& toolCallResult);

} // namespace mcpbridge::session
