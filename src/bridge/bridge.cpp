#include <mcpbridge/bridge/bridge.h>

#include <spdlog/spdlog.h>

#include <mcpbridge/session/readiness_probe.h>

#include <algorithm>
#include <future>
#include <thread>

namespace mcpbridge::bridge {

using session::ConnectionState;

const char* toString(FleetStatus status) noexcept {
    switch (status) {
        case FleetStatus::Offline: return "offline";
        case FleetStatus::Degraded: return "degraded";
        case FleetStatus::Ready: return "ready";
    }
    return "unknown";
}

Bridge::Bridge(config::BridgeConfig config, std::vector<process::ServerDescriptor> servers,
               transport::TransportFactory factory)
    : config_(std::move(config)), timers_(std::make_unique<session::TimerService>()) {
    if (!factory) {
        transport::StdioTransportOptions opts;
        opts.maxFrameBytes = config_.maxFrameBytes;
        factory = transport::makeStdioTransportFactory(opts);
    }

    for (auto& descriptor : servers) {
        if (sessions_.count(descriptor.name) != 0) {
            spdlog::error("Bridge: duplicate server name '{}' ignored", descriptor.name);
            continue;
        }
        std::string name = descriptor.name;
        auto s = std::make_unique<session::ProtocolSession>(std::move(descriptor), config_.session,
                                                            *timers_, factory);
        s->setStateListener(
            [this, name](const session::ConnectionTransition& t) { publish(name, t); });
        order_.push_back(name);
        sessions_.emplace(name, std::move(s));
    }
    spdlog::info("Bridge: configured {} server(s)", order_.size());

    if (config_.healthMonitor.enabled) {
        startHealthMonitor();
    }
}

Bridge::~Bridge() {
    stopHealthMonitor();
    disconnectAll();
    for (auto& [name, s] : sessions_) {
        s->setStateListener({});
    }
}

Result<session::ProtocolSession*> Bridge::findSession(const std::string& server) const {
    auto it = sessions_.find(server);
    if (it == sessions_.end()) {
        return Error{ErrorCode::NotFound, "Unknown server '" + server + "'"};
    }
    return it->second.get();
}

std::vector<ConnectReport> Bridge::connectAll() {
    spdlog::info("Bridge: connecting {} server(s)", order_.size());

    std::vector<std::future<ConnectReport>> futures;
    futures.reserve(order_.size());
    for (const auto& name : order_) {
        auto* s = sessions_.at(name).get();
        futures.push_back(std::async(std::launch::async, [s, name]() {
            auto started = std::chrono::steady_clock::now();
            auto outcome = s->connect();
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started);
            return ConnectReport{name, std::move(outcome), s->snapshot(), elapsed};
        }));
    }

    std::vector<ConnectReport> reports;
    reports.reserve(futures.size());
    for (auto& f : futures) {
        reports.push_back(f.get());
    }

    for (const auto& r : reports) {
        if (r.outcome) {
            spdlog::info("Bridge: '{}' ready in {}ms", r.server, r.elapsed.count());
        } else {
            spdlog::warn("Bridge: '{}' failed to connect: {}", r.server, r.outcome.error().message);
        }
    }
    spdlog::info("Bridge: {}", statusDescription());
    return reports;
}

Result<void> Bridge::connect(const std::string& server) {
    auto s = findSession(server);
    if (!s) {
        return s.error();
    }
    return s.value()->connect();
}

void Bridge::disconnectAll() {
    std::vector<std::future<void>> futures;
    futures.reserve(sessions_.size());
    for (auto& [name, s] : sessions_) {
        auto* ptr = s.get();
        futures.push_back(std::async(std::launch::async, [ptr]() { ptr->disconnect(); }));
    }
    for (auto& f : futures) {
        f.get();
    }
    spdlog::debug("Bridge: all servers disconnected");
}

Result<void> Bridge::disconnect(const std::string& server) {
    auto s = findSession(server);
    if (!s) {
        return s.error();
    }
    s.value()->disconnect();
    return {};
}

FleetStatus Bridge::status() const {
    size_t ready = 0;
    for (const auto& [name, s] : sessions_) {
        if (s->state() == ConnectionState::Ready) {
            ++ready;
        }
    }
    if (ready == 0) {
        return FleetStatus::Offline;
    }
    return ready == sessions_.size() ? FleetStatus::Ready : FleetStatus::Degraded;
}

std::string Bridge::statusDescription() const {
    size_t ready = 0;
    bool connecting = false;
    for (const auto& [name, s] : sessions_) {
        auto st = s->state();
        if (st == ConnectionState::Ready) {
            ++ready;
        } else if (session::ConnectionFsm::isTransient(st)) {
            connecting = true;
        }
    }
    std::string counts = "(" + std::to_string(ready) + "/" + std::to_string(sessions_.size()) +
                         " servers)";
    if (ready > 0 && ready == sessions_.size()) {
        return "Connected " + counts;
    }
    if (ready > 0) {
        return "Degraded " + counts;
    }
    return connecting ? "Connecting..." : "Disconnected";
}

Result<json> Bridge::callTool(const std::string& server, const std::string& tool, json arguments,
                              std::optional<std::chrono::milliseconds> timeout) {
    auto s = findSession(server);
    if (!s) {
        return s.error();
    }
    return s.value()->callTool(tool, std::move(arguments), timeout);
}

Result<json> Bridge::callToolWithRetry(const std::string& server, const std::string& tool,
                                       json arguments,
                                       std::optional<session::RetryPolicy> policy) {
    auto outcome = session::retryWithBudget<json>(
        policy.value_or(config_.toolRetry),
        [&](int attempt) {
            if (attempt > 1) {
                spdlog::info("Bridge: retrying '{}' on '{}' (attempt {})", tool, server, attempt);
            }
            return callTool(server, tool, arguments);
        },
        [](const Error& e) { return e.code == ErrorCode::RequestTimeout; });
    return std::move(outcome.result);
}

Result<json> Bridge::call(const std::string& server, const std::string& method, json params,
                          std::optional<std::chrono::milliseconds> timeout) {
    auto s = findSession(server);
    if (!s) {
        return s.error();
    }
    return s.value()->call(method, std::move(params), timeout);
}

Result<std::vector<session::ToolInfo>> Bridge::listTools(const std::string& server) {
    auto s = findSession(server);
    if (!s) {
        return s.error();
    }
    return s.value()->listTools();
}

std::map<std::string, Result<json>>
Bridge::broadcast(const std::string& method, json params,
                  std::optional<std::chrono::milliseconds> timeout) {
    std::vector<std::pair<std::string, std::future<Result<json>>>> futures;
    for (const auto& name : order_) {
        auto* s = sessions_.at(name).get();
        if (s->state() != ConnectionState::Ready) {
            continue;
        }
        futures.emplace_back(name, std::async(std::launch::async, [s, method, params, timeout]() {
                                 return s->call(method, params, timeout);
                             }));
    }

    std::map<std::string, Result<json>> results;
    for (auto& [name, f] : futures) {
        results.emplace(name, f.get());
    }
    spdlog::debug("Bridge: broadcast '{}' to {} server(s)", method, results.size());
    return results;
}

Result<void> Bridge::waitUntilReady(const std::string& server, std::optional<int> maxAttempts,
                                    std::optional<std::chrono::milliseconds> interval) {
    auto s = findSession(server);
    if (!s) {
        return s.error();
    }
    auto* sess = s.value();

    const int attempts = std::max(1, maxAttempts.value_or(config_.waitReady.maxAttempts));
    const auto wait = interval.value_or(config_.waitReady.interval);

    for (int n = 1; n <= attempts; ++n) {
        if (sess->state() == ConnectionState::Ready) {
            return {};
        }
        spdlog::debug("Bridge: waiting for '{}' ({}/{}), state {}", server, n, attempts,
                      session::toString(sess->state()));
        if (n < attempts) {
            std::this_thread::sleep_for(wait);
        }
    }
    if (sess->state() == ConnectionState::Ready) {
        return {};
    }
    return Error{ErrorCode::NotReady, "Server '" + server + "' not ready after " +
                                          std::to_string(attempts) + " check(s) (state " +
                                          session::toString(sess->state()) + ")"};
}

Result<void> Bridge::waitUntilFleetReady(std::optional<int> maxAttempts,
                                         std::optional<std::chrono::milliseconds> interval) {
    const int attempts = std::max(1, maxAttempts.value_or(config_.waitReady.maxAttempts));
    const auto wait = interval.value_or(config_.waitReady.interval);

    for (int n = 1; n <= attempts; ++n) {
        if (status() == FleetStatus::Ready) {
            return {};
        }
        if (n < attempts) {
            std::this_thread::sleep_for(wait);
        }
    }
    if (status() == FleetStatus::Ready) {
        return {};
    }
    return Error{ErrorCode::NotReady, "Fleet not ready: " + statusDescription()};
}

ServerStatus Bridge::statusOf(const session::ProtocolSession& s) const {
    ServerStatus out;
    out.name = s.name();
    out.description = s.descriptor().description;
    out.snapshot = s.snapshot();
    out.pid = s.pid();
    out.uptime = s.uptime();
    out.tools = s.cachedToolNames();
    out.capabilities = s.descriptor().capabilities;
    out.serverInfo = s.serverInfo();
    out.metrics = s.metrics();
    out.healthy = s.healthCheck().healthy;
    return out;
}

bool Bridge::areServersAvailable(const std::vector<std::string>& servers) const {
    return std::all_of(servers.begin(), servers.end(), [this](const std::string& name) {
        auto it = sessions_.find(name);
        return it != sessions_.end() && it->second->state() == ConnectionState::Ready;
    });
}

Result<std::vector<std::string>> Bridge::serverCapabilities(const std::string& server) const {
    auto s = findSession(server);
    if (!s) {
        return s.error();
    }
    return s.value()->descriptor().capabilities;
}

void Bridge::startHealthMonitor() {
    std::lock_guard<std::mutex> lock(monitorMutex_);
    if (healthMonitor_.joinable()) {
        return;
    }
    const auto interval = std::max(config_.healthMonitor.interval, std::chrono::milliseconds{1});
    spdlog::info("Bridge: health monitor every {}ms (auto-reconnect {})", interval.count(),
                 config_.healthMonitor.autoReconnect ? "on" : "off");
    healthMonitor_ = std::jthread([this, interval](std::stop_token stop) {
        while (session::interruptibleSleep(interval, stop)) {
            performHealthChecks(stop);
        }
        spdlog::debug("Bridge: health monitor stopped");
    });
}

void Bridge::stopHealthMonitor() {
    std::jthread monitor;
    {
        std::lock_guard<std::mutex> lock(monitorMutex_);
        monitor = std::move(healthMonitor_);
    }
    if (monitor.joinable()) {
        monitor.request_stop();
        monitor.join();
    }
}

bool Bridge::healthMonitorRunning() const {
    std::lock_guard<std::mutex> lock(monitorMutex_);
    return healthMonitor_.joinable();
}

size_t Bridge::performHealthChecks(std::stop_token stop) {
    auto countReady = [this] {
        return std::count_if(sessions_.begin(), sessions_.end(), [](const auto& entry) {
            return entry.second->state() == ConnectionState::Ready;
        });
    };
    const auto readyBefore = countReady();

    size_t reconnects = 0;
    for (const auto& name : order_) {
        if (stop.stop_requested()) {
            break;
        }
        auto* s = sessions_.at(name).get();
        auto report = s->healthCheck();
        if (report.healthy) {
            continue;
        }
        auto snap = s->snapshot();
        if (snap.state == ConnectionState::Ready) {
            spdlog::warn("Bridge: health check failed for '{}': {}", name, report.detail);
            continue;
        }
        if (snap.state != ConnectionState::Failed ||
            snap.reason != session::FailureReason::TransportClosed ||
            !config_.healthMonitor.autoReconnect) {
            continue;
        }

        spdlog::info("Bridge: attempting to reconnect '{}'", name);
        ++reconnects;
        // A stop request while reconnecting cancels the connect
        std::stop_callback cancel(stop, [s] { s->disconnect(); });
        if (stop.stop_requested()) {
            break;
        }
        auto r = s->connect();
        if (r) {
            spdlog::info("Bridge: reconnected '{}'", name);
        } else {
            spdlog::error("Bridge: reconnection failed for '{}': {}", name, r.error().message);
        }
    }

    const auto readyAfter = countReady();
    if (readyAfter != readyBefore) {
        spdlog::info("Bridge: connection status changed: {}", statusDescription());
    }
    return reconnects;
}

Result<ServerStatus> Bridge::serverStatus(const std::string& server) const {
    auto s = findSession(server);
    if (!s) {
        return s.error();
    }
    return statusOf(*s.value());
}

Result<session::ConnectionState> Bridge::serverState(const std::string& server) const {
    auto s = findSession(server);
    if (!s) {
        return s.error();
    }
    return s.value()->state();
}

Result<session::HealthReport> Bridge::healthCheck(const std::string& server) const {
    auto s = findSession(server);
    if (!s) {
        return s.error();
    }
    auto report = s.value()->healthCheck();
    spdlog::debug("Bridge: health of '{}': {} (uptime {}s)", server, report.detail,
                  report.uptime.count() / 1000);
    return report;
}

FleetSnapshot Bridge::snapshot() const {
    FleetSnapshot out;
    out.totalServers = order_.size();
    for (const auto& name : order_) {
        auto st = statusOf(*sessions_.at(name));
        if (st.snapshot.state == ConnectionState::Ready) {
            ++out.readyServers;
        }
        out.servers.push_back(std::move(st));
    }
    if (out.readyServers == 0) {
        out.status = FleetStatus::Offline;
    } else {
        out.status = out.readyServers == out.totalServers ? FleetStatus::Ready
                                                          : FleetStatus::Degraded;
    }
    out.summary = statusDescription();
    return out;
}

BridgeMetrics Bridge::metrics() const {
    BridgeMetrics out;
    out.totalServers = sessions_.size();
    double weighted = 0.0;
    for (const auto& [name, s] : sessions_) {
        auto m = s->metrics();
        out.aggregate.requestCount += m.requestCount;
        out.aggregate.successCount += m.successCount;
        out.aggregate.errorCount += m.errorCount;
        out.aggregate.timeoutCount += m.timeoutCount;
        weighted += m.averageResponseMs * static_cast<double>(m.requestCount);
        if (m.lastRequest &&
            (!out.aggregate.lastRequest || *m.lastRequest > *out.aggregate.lastRequest)) {
            out.aggregate.lastRequest = m.lastRequest;
        }
        if (s->state() == ConnectionState::Ready) {
            ++out.readyServers;
        }
    }
    if (out.aggregate.requestCount > 0) {
        out.aggregate.averageResponseMs =
            weighted / static_cast<double>(out.aggregate.requestCount);
    }
    return out;
}

SubscriptionId Bridge::subscribe(FleetListener listener) {
    auto id = nextSubscription_.fetch_add(1);
    std::lock_guard<std::mutex> lock(listenersMutex_);
    listeners_.emplace(id, std::move(listener));
    return id;
}

bool Bridge::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(listenersMutex_);
    return listeners_.erase(id) > 0;
}

void Bridge::publish(const std::string& server, const session::ConnectionTransition& t) {
    std::vector<FleetListener> targets;
    {
        std::lock_guard<std::mutex> lock(listenersMutex_);
        targets.reserve(listeners_.size());
        for (const auto& [id, l] : listeners_) {
            targets.push_back(l);
        }
    }
    if (targets.empty()) {
        return;
    }

    FleetEvent event{server, t.from, t.to, t.snapshot, status()};
    for (const auto& l : targets) {
        l(event);
    }
}

} // namespace mcpbridge::bridge
