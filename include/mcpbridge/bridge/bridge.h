#pragma once

#include <mcpbridge/config/bridge_config.h>
#include <mcpbridge/core/types.h>
#include <mcpbridge/process/process_launcher.h>
#include <mcpbridge/session/protocol_session.h>
#include <mcpbridge/session/timer_service.h>
#include <mcpbridge/transport/transport.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace mcpbridge::bridge {

using json = nlohmann::json;

enum class FleetStatus {
    Offline,  ///< no server Ready (also: empty fleet)
    Degraded, ///< some but not all servers Ready
    Ready,    ///< every server Ready
};

const char* toString(FleetStatus status) noexcept;

struct ConnectReport {
    std::string server;
    Result<void> outcome;
    session::ConnectionSnapshot snapshot;
    std::chrono::milliseconds elapsed{0};
};

struct ServerStatus {
    std::string name;
    std::string description;
    session::ConnectionSnapshot snapshot;
    std::optional<int64_t> pid;
    std::chrono::milliseconds uptime{0};
    std::vector<std::string> tools;
    std::vector<std::string> capabilities; ///< as declared by the descriptor
    json serverInfo = json::object();
    session::SessionMetrics metrics;
    bool healthy{false};
};

struct FleetSnapshot {
    FleetStatus status{FleetStatus::Offline};
    size_t readyServers{0};
    size_t totalServers{0};
    std::string summary; ///< e.g. "Degraded (1/2 servers)"
    std::vector<ServerStatus> servers;
};

struct BridgeMetrics {
    session::SessionMetrics aggregate;
    size_t readyServers{0};
    size_t totalServers{0};
};

struct FleetEvent {
    std::string server;
    session::ConnectionState from;
    session::ConnectionState to;
    session::ConnectionSnapshot snapshot;
    FleetStatus fleetStatus;
};

using FleetListener = std::function<void(const FleetEvent&)>;
using SubscriptionId = uint64_t;

/**
 * @brief Owns the helper fleet and routes calls to individual servers.
 *
 * The set of servers is fixed at construction. Failures stay partitioned per
 * server: one server failing to launch, handshake or answer never affects the
 * others. Destruction stops the health monitor and disconnects every server.
 */
class Bridge {
public:
    Bridge(config::BridgeConfig config, std::vector<process::ServerDescriptor> servers,
           transport::TransportFactory factory = {});
    ~Bridge();

    Bridge(const Bridge&) = delete;
    Bridge& operator=(const Bridge&) = delete;

    /**
     * @brief Connect every server concurrently and wait for all attempts to settle.
     *
     * Reports come back in configuration order.
     */
    std::vector<ConnectReport> connectAll();

    Result<void> connect(const std::string& server);

    /**
     * @brief Tear down every server concurrently; pending calls fail with Disconnected.
     */
    void disconnectAll();

    Result<void> disconnect(const std::string& server);

    /**
     * @brief Derived from live session states; never blocks on I/O.
     */
    FleetStatus status() const;
    std::string statusDescription() const;

    /**
     * @brief tools/call on the named server.
     *
     * NotFound for an unknown server, NotReady when it is not Ready. There is
     * no fallback to another server.
     */
    Result<json> callTool(const std::string& server, const std::string& tool,
                          json arguments = json::object(),
                          std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /**
     * @brief callTool, retried with backoff while it fails with RequestTimeout.
     */
    Result<json> callToolWithRetry(const std::string& server, const std::string& tool,
                                   json arguments = json::object(),
                                   std::optional<session::RetryPolicy> policy = std::nullopt);

    Result<json> call(const std::string& server, const std::string& method,
                      json params = json::object(),
                      std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    Result<std::vector<session::ToolInfo>> listTools(const std::string& server);

    /**
     * @brief Send the same call to every Ready server concurrently.
     */
    std::map<std::string, Result<json>>
    broadcast(const std::string& method, json params = json::object(),
              std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /**
     * @brief Poll the server's state until it is Ready.
     *
     * Defaults come from the waitReady policy. NotFound for an unknown
     * server, NotReady naming the last state when the budget runs out.
     */
    Result<void> waitUntilReady(const std::string& server,
                                std::optional<int> maxAttempts = std::nullopt,
                                std::optional<std::chrono::milliseconds> interval = std::nullopt);

    Result<void>
    waitUntilFleetReady(std::optional<int> maxAttempts = std::nullopt,
                        std::optional<std::chrono::milliseconds> interval = std::nullopt);

    /**
     * @brief True when every named server exists and is Ready.
     *
     * An empty list is trivially available.
     */
    bool areServersAvailable(const std::vector<std::string>& servers) const;

    Result<std::vector<std::string>> serverCapabilities(const std::string& server) const;

    /**
     * @brief Start the periodic health pass on a background thread.
     *
     * Uses config.healthMonitor.interval. The constructor calls this when
     * config.healthMonitor.enabled is set. No-op when already running.
     */
    void startHealthMonitor();
    void stopHealthMonitor();
    bool healthMonitorRunning() const;

    /**
     * @brief One health pass over the fleet.
     *
     * Checks every server and, when autoReconnect is set, reconnects servers
     * that are Failed because their transport closed. Servers that failed for
     * any other reason are left alone. Returns the number of reconnect attempts.
     */
    size_t performHealthChecks(std::stop_token stop = {});

    Result<ServerStatus> serverStatus(const std::string& server) const;
    Result<session::ConnectionState> serverState(const std::string& server) const;
    Result<session::HealthReport> healthCheck(const std::string& server) const;
    FleetSnapshot snapshot() const;
    BridgeMetrics metrics() const;
    std::vector<std::string> serverNames() const { return order_; }

    /**
     * @brief Observe per-server transitions.
     *
     * Listeners run on the thread that caused the transition and must not
     * call connect or disconnect operations.
     */
    SubscriptionId subscribe(FleetListener listener);
    bool unsubscribe(SubscriptionId id);

private:
    Result<session::ProtocolSession*> findSession(const std::string& server) const;
    ServerStatus statusOf(const session::ProtocolSession& s) const;
    void publish(const std::string& server, const session::ConnectionTransition& t);

    config::BridgeConfig config_;
    // Declared before the sessions so it outlives their expiry timers
    std::unique_ptr<session::TimerService> timers_;
    std::map<std::string, std::unique_ptr<session::ProtocolSession>> sessions_;
    std::vector<std::string> order_;

    mutable std::mutex listenersMutex_;
    std::map<SubscriptionId, FleetListener> listeners_;
    std::atomic<SubscriptionId> nextSubscription_{1};

    mutable std::mutex monitorMutex_;
    std::jthread healthMonitor_;
};

} // namespace mcpbridge::bridge
