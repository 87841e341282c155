#include <mcpbridge/session/protocol_session.h>

#include <spdlog/spdlog.h>

namespace mcpbridge::session {

namespace {

constexpr int kMaxToolPages = 64;
constexpr double kResponseTimeAlpha = 0.1;
// Backstop on top of the expiry timer in case the timer service is already stopped
constexpr std::chrono::milliseconds kWaitSlack{2000};

bool isTransportLoss(const Error& e) {
    return e.code == ErrorCode::TransportClosed || e.code == ErrorCode::Disconnected ||
           e.code == ErrorCode::OperationCancelled;
}

} // namespace

ProtocolSession::ProtocolSession(process::ServerDescriptor descriptor, SessionOptions options,
                                 TimerService& timers, transport::TransportFactory factory)
    : descriptor_(std::move(descriptor)), options_(std::move(options)),
      factory_(std::move(factory)), fsm_(descriptor_.name),
      correlator_(std::make_unique<RequestCorrelator>(timers.context(), descriptor_.name)) {}

ProtocolSession::~ProtocolSession() {
    disconnect();
}

json ProtocolSession::initializeParams() const {
    return json{
        {"protocolVersion", options_.protocolVersion},
        {"capabilities",
         {{"roots", {{"listChanged", false}}},
          {"sampling", json::object()},
          {"prompts", {{"listChanged", false}}},
          {"resources", {{"subscribe", false}, {"listChanged", false}}},
          {"tools", {{"listChanged", false}}}}},
        {"clientInfo",
         {{"name", options_.clientInfo.name}, {"version", options_.clientInfo.version}}}};
}

Result<void> ProtocolSession::connect() {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);

    auto current = fsm_.state();
    if (current == ConnectionState::Ready) {
        return {};
    }
    if (current == ConnectionState::Failed) {
        spdlog::info("Session[{}]: reconnecting after failure", descriptor_.name);
        teardownLocked();
    }

    std::stop_token stop;
    {
        std::lock_guard<std::mutex> lock(stopMutex_);
        connectStop_ = std::stop_source{};
        stop = connectStop_.get_token();
    }

    if (!fsm_.dispatch(ConnectRequestedEvent{})) {
        return Error{ErrorCode::InvalidState, "Session '" + descriptor_.name +
                                                  "' cannot connect from state " +
                                                  toString(fsm_.state())};
    }

    auto cancelled = [this]() -> Result<void> {
        fsm_.dispatch(CancelEvent{});
        return failureFromSnapshot("Connect interrupted");
    };

    // Launching
    auto created = factory_(descriptor_);
    if (!created) {
        fsm_.dispatch(LaunchFailedEvent{created.error().message});
        return Error{ErrorCode::LaunchFailed, created.error().message};
    }
    std::shared_ptr<transport::ITransport> transport = std::move(created).value();
    {
        std::lock_guard<std::mutex> lock(transportMutex_);
        transport_ = transport;
    }

    auto started = transport->start(
        [this](protocol::ProtocolMessage message) { onMessage(std::move(message)); },
        [this](const Error& error) { onTransportClosed(error); });
    if (!started) {
        fsm_.dispatch(LaunchFailedEvent{started.error().message});
        closeTransport();
        return Error{ErrorCode::LaunchFailed, started.error().message};
    }
    if (!fsm_.dispatch(TransportStartedEvent{})) {
        return failureFromSnapshot("Connect interrupted");
    }

    // HandshakeInFlight: initialize is the only request on the wire until the notification is out
    auto init = rawCall(std::string(protocol::METHOD_INITIALIZE), initializeParams(),
                        options_.handshakeTimeout);
    if (!init) {
        const auto& err = init.error();
        if (stop.stop_requested()) {
            return cancelled();
        }
        if (err.code == ErrorCode::RequestTimeout) {
            std::string msg = "No initialize response from '" + descriptor_.name + "' within " +
                              std::to_string(options_.handshakeTimeout.count()) + "ms";
            fsm_.dispatch(HandshakeTimedOutEvent{msg});
            closeTransport();
            return Error{ErrorCode::HandshakeTimeout, msg};
        }
        if (err.code == ErrorCode::RemoteError) {
            fsm_.dispatch(HandshakeRejectedEvent{err.message});
            closeTransport();
            return Error{ErrorCode::HandshakeRejected,
                         "Server '" + descriptor_.name + "' rejected initialize: " + err.message};
        }
        fsm_.dispatch(TransportClosedEvent{err.message});
        return failureFromSnapshot(err.message);
    }
    {
        std::lock_guard<std::mutex> lock(dataMutex_);
        serverInfo_ = init.value();
    }
    if (!fsm_.dispatch(HandshakeCompletedEvent{})) {
        return failureFromSnapshot("Connect interrupted");
    }

    // Initialized
    auto notified =
        writeMessage(protocol::Notification{std::string(protocol::METHOD_INITIALIZED), json::object()});
    if (!notified) {
        fsm_.dispatch(TransportClosedEvent{notified.error().message});
        return failureFromSnapshot(notified.error().message);
    }
    if (!fsm_.dispatch(InitializedNotifiedEvent{})) {
        return failureFromSnapshot("Connect interrupted");
    }

    // ProbingReadiness
    ReadinessProbe probe{options_.probe};
    auto outcome = probe.run(
        [this](int) {
            return rawCall(std::string(protocol::METHOD_TOOLS_LIST), json::object(),
                           options_.probeAttemptTimeout);
        },
        stop);

    if (!outcome.ready) {
        if (stop.stop_requested()) {
            return cancelled();
        }
        if (isTransportLoss(outcome.lastError)) {
            fsm_.dispatch(TransportClosedEvent{outcome.lastError.message});
            return failureFromSnapshot(outcome.lastError.message);
        }
        std::string msg = "Server '" + descriptor_.name + "' not ready after " +
                          std::to_string(outcome.attempts) + " probe attempt(s): " +
                          outcome.lastError.message;
        fsm_.dispatch(ProbeExhaustedEvent{msg});
        closeTransport();
        return Error{ErrorCode::NotReady, msg};
    }

    cacheTools(outcome.result);
    {
        std::lock_guard<std::mutex> lock(dataMutex_);
        readySince_ = std::chrono::steady_clock::now();
    }
    if (!fsm_.dispatch(ProbeSucceededEvent{})) {
        return failureFromSnapshot("Connect interrupted");
    }
    spdlog::info("Session[{}]: ready after {} probe attempt(s)", descriptor_.name,
                 outcome.attempts);
    return {};
}

void ProtocolSession::disconnect() {
    {
        std::lock_guard<std::mutex> lock(stopMutex_);
        connectStop_.request_stop();
    }
    // Wake a connect() blocked on the handshake or a probe before waiting for it
    (void)correlator_->failAll(
        Error{ErrorCode::Disconnected, "Session '" + descriptor_.name + "' disconnected"});
    fsm_.dispatch(CancelEvent{});

    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
    teardownLocked();
}

void ProtocolSession::teardownLocked() {
    closeTransport();
    (void)correlator_->failAll(
        Error{ErrorCode::Disconnected, "Session '" + descriptor_.name + "' disconnected"});
    fsm_.dispatch(CancelEvent{});
    fsm_.dispatch(TeardownEvent{});
    std::lock_guard<std::mutex> lock(dataMutex_);
    readySince_.reset();
}

void ProtocolSession::closeTransport() {
    std::shared_ptr<transport::ITransport> transport;
    {
        std::lock_guard<std::mutex> lock(transportMutex_);
        transport = std::move(transport_);
        transport_.reset();
    }
    if (transport) {
        transport->close(options_.terminateGrace);
    }
}

Error ProtocolSession::failureFromSnapshot(const std::string& fallback) const {
    auto snap = fsm_.snapshot();
    if (snap.state == ConnectionState::Failed) {
        switch (snap.reason) {
            case FailureReason::Cancelled:
                return Error{ErrorCode::OperationCancelled,
                             "Connect to '" + descriptor_.name + "' cancelled"};
            case FailureReason::TransportClosed:
                return Error{ErrorCode::TransportClosed, snap.lastError.empty() ? fallback
                                                                                : snap.lastError};
            default:
                break;
        }
    }
    if (snap.state == ConnectionState::Disconnected) {
        return Error{ErrorCode::OperationCancelled,
                     "Connect to '" + descriptor_.name + "' cancelled"};
    }
    return Error{ErrorCode::TransportClosed, fallback};
}

Result<void> ProtocolSession::writeMessage(const protocol::ProtocolMessage& message) {
    std::shared_ptr<transport::ITransport> transport;
    {
        std::lock_guard<std::mutex> lock(transportMutex_);
        transport = transport_;
    }
    if (!transport) {
        return Error{ErrorCode::TransportClosed, "No transport to '" + descriptor_.name + "'"};
    }
    return transport->write(message);
}

Result<json> ProtocolSession::rawCall(const std::string& method, json params,
                                      std::chrono::milliseconds timeout) {
    auto ticket = correlator_->submit(method, timeout);

    bool cancelled = false;
    {
        std::lock_guard<std::mutex> lock(stopMutex_);
        cancelled = connectStop_.stop_requested() && fsm_.state() != ConnectionState::Ready;
    }
    if (cancelled) {
        (void)correlator_->fail(ticket.id,
                                Error{ErrorCode::Disconnected,
                                      "Session '" + descriptor_.name + "' disconnected"});
    } else {
        auto written = writeMessage(protocol::Request{ticket.id, method, std::move(params)});
        if (!written) {
            (void)correlator_->fail(ticket.id, written.error());
        }
    }

    if (ticket.future.wait_for(timeout + kWaitSlack) != std::future_status::ready) {
        (void)correlator_->expire(ticket.id);
    }
    return ticket.future.get();
}

Result<json> ProtocolSession::call(const std::string& method, json params,
                                   std::optional<std::chrono::milliseconds> timeout) {
    auto snap = fsm_.snapshot();
    if (snap.state != ConnectionState::Ready) {
        return Error{ErrorCode::NotReady, "Server '" + descriptor_.name + "' is not ready (" +
                                              toString(snap.state) + ")"};
    }

    auto started = std::chrono::steady_clock::now();
    auto result = rawCall(method, std::move(params), timeout.value_or(options_.defaultCallTimeout));
    recordCall(started, result);
    return result;
}

Result<json> ProtocolSession::callTool(const std::string& tool, json arguments,
                                       std::optional<std::chrono::milliseconds> timeout) {
    if (tool.empty()) {
        return Error{ErrorCode::InvalidArgument, "Tool name must not be empty"};
    }
    if (arguments.is_null()) {
        arguments = json::object();
    }
    return call(std::string(protocol::METHOD_TOOLS_CALL),
                json{{"name", tool}, {"arguments", std::move(arguments)}}, timeout);
}

Result<std::vector<ToolInfo>>
ProtocolSession::listTools(std::optional<std::chrono::milliseconds> timeout) {
    std::vector<ToolInfo> tools;
    json allTools = json::array();
    std::string cursor;

    for (int page = 0; page < kMaxToolPages; ++page) {
        json params = json::object();
        if (!cursor.empty()) {
            params["cursor"] = cursor;
        }
        auto res = call(std::string(protocol::METHOD_TOOLS_LIST), std::move(params), timeout);
        if (!res) {
            return res.error();
        }
        const auto& body = res.value();
        if (body.contains("tools") && body["tools"].is_array()) {
            for (const auto& t : body["tools"]) {
                if (!t.is_object() || !t.contains("name") || !t["name"].is_string() ||
                    (t.contains("description") && !t["description"].is_string()) ||
                    (t.contains("inputSchema") && !t["inputSchema"].is_object())) {
                    spdlog::warn("Session[{}]: skipping malformed tool entry {}", descriptor_.name,
                                 t.dump(-1, ' ', false, json::error_handler_t::replace));
                    continue;
                }
                ToolInfo info;
                info.name = t["name"].get<std::string>();
                if (t.contains("description")) {
                    info.description = t["description"].get<std::string>();
                }
                if (t.contains("inputSchema")) {
                    info.inputSchema = t["inputSchema"];
                }
                tools.push_back(std::move(info));
                allTools.push_back(t);
            }
        }

        cursor.clear();
        if (body.contains("nextCursor") && body["nextCursor"].is_string()) {
            cursor = body["nextCursor"].get<std::string>();
        }
        if (cursor.empty()) {
            break;
        }
    }

    cacheTools(json{{"tools", std::move(allTools)}});
    return tools;
}

void ProtocolSession::cacheTools(const json& toolsListResult) {
    std::vector<std::string> names;
    if (toolsListResult.contains("tools") && toolsListResult["tools"].is_array()) {
        for (const auto& t : toolsListResult["tools"]) {
            if (t.is_object() && t.contains("name") && t["name"].is_string()) {
                names.push_back(t["name"].get<std::string>());
            }
        }
    }
    std::lock_guard<std::mutex> lock(dataMutex_);
    toolNames_ = std::move(names);
}

void ProtocolSession::recordCall(std::chrono::steady_clock::time_point started,
                                 const Result<json>& result) {
    auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() -
                                                             started)
                       .count();
    std::lock_guard<std::mutex> lock(dataMutex_);
    metrics_.requestCount++;
    metrics_.lastRequest = std::chrono::system_clock::now();
    if (result) {
        metrics_.successCount++;
    } else {
        metrics_.errorCount++;
        if (result.error().code == ErrorCode::RequestTimeout) {
            metrics_.timeoutCount++;
        }
    }
    if (metrics_.requestCount == 1) {
        metrics_.averageResponseMs = elapsed;
    } else {
        metrics_.averageResponseMs = kResponseTimeAlpha * elapsed +
                                     (1.0 - kResponseTimeAlpha) * metrics_.averageResponseMs;
    }
}

void ProtocolSession::onMessage(protocol::ProtocolMessage message) {
    if (auto* response = std::get_if<protocol::Response>(&message)) {
        if (!correlator_->resolve(*response)) {
            spdlog::warn("Session[{}]: {}: no pending request #{} (late or unknown), dropped",
                         descriptor_.name, errorToString(ErrorCode::ProtocolViolation),
                         response->id);
        }
        return;
    }

    if (auto* note = std::get_if<protocol::Notification>(&message)) {
        NotificationHandler handler;
        {
            std::lock_guard<std::mutex> lock(dataMutex_);
            handler = notificationHandler_;
        }
        if (handler) {
            handler(*note);
        } else {
            spdlog::debug("Session[{}]: notification {}", descriptor_.name, note->method);
        }
        return;
    }

    // Server-initiated request: always answer so the server never blocks on us
    const auto& request = std::get<protocol::Request>(message);
    protocol::Response reply;
    if (request.method == protocol::METHOD_PING) {
        reply = protocol::makeResult(request.id, json::object());
    } else {
        spdlog::debug("Session[{}]: rejecting server request '{}'", descriptor_.name,
                      request.method);
        reply = protocol::makeError(request.id, protocol::METHOD_NOT_FOUND,
                                    "Method not found: " + request.method);
    }
    auto written = writeMessage(reply);
    if (!written) {
        spdlog::debug("Session[{}]: could not answer server request: {}", descriptor_.name,
                      written.error().message);
    }
}

void ProtocolSession::onTransportClosed(const Error& error) {
    fsm_.dispatch(TransportClosedEvent{error.message});
    auto failed =
        correlator_->failAll(Error{ErrorCode::TransportClosed, error.message});
    spdlog::warn("Session[{}]: transport closed, {} pending call(s) failed", descriptor_.name,
                 failed);
    std::lock_guard<std::mutex> lock(dataMutex_);
    readySince_.reset();
}

SessionMetrics ProtocolSession::metrics() const {
    std::lock_guard<std::mutex> lock(dataMutex_);
    return metrics_;
}

std::optional<int64_t> ProtocolSession::pid() const {
    std::lock_guard<std::mutex> lock(transportMutex_);
    if (!transport_) {
        return std::nullopt;
    }
    return transport_->pid();
}

std::chrono::milliseconds ProtocolSession::uptime() const {
    std::lock_guard<std::mutex> lock(dataMutex_);
    if (!readySince_ || fsm_.state() != ConnectionState::Ready) {
        return std::chrono::milliseconds{0};
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                 *readySince_);
}

HealthReport ProtocolSession::healthCheck() const {
    HealthReport report;
    report.state = fsm_.state();
    report.pid = pid();
    report.uptime = uptime();

    bool transportOpen = false;
    {
        std::lock_guard<std::mutex> lock(transportMutex_);
        transportOpen = transport_ && transport_->isOpen();
    }

    if (report.state != ConnectionState::Ready) {
        report.detail = std::string("state ") + toString(report.state);
    } else if (!transportOpen) {
        report.detail = "helper process is not running";
    } else {
        report.healthy = true;
        report.detail = "ok";
    }
    return report;
}

json ProtocolSession::serverInfo() const {
    std::lock_guard<std::mutex> lock(dataMutex_);
    return serverInfo_;
}

std::vector<std::string> ProtocolSession::cachedToolNames() const {
    std::lock_guard<std::mutex> lock(dataMutex_);
    return toolNames_;
}

void ProtocolSession::setStateListener(ConnectionFsm::Listener listener) {
    fsm_.setListener(std::move(listener));
}

void ProtocolSession::setNotificationHandler(NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(dataMutex_);
    notificationHandler_ = std::move(handler);
}

Result<std::string> toolResultText(const json& toolCallResult) {
    if (!toolCallResult.is_object()) {
        return Error{ErrorCode::InvalidArgument, "tools/call result must be an object"};
    }

    std::optional<std::string> text;
    if (toolCallResult.contains("content") && toolCallResult["content"].is_array()) {
        for (const auto& block : toolCallResult["content"]) {
            if (!block.is_object()) {
                continue;
            }
            auto type = block.find("type");
            auto body = block.find("text");
            if (type != block.end() && type->is_string() && *type == "text" &&
                body != block.end() && body->is_string()) {
                text = body->get<std::string>();
                break;
            }
        }
    }

    bool isError = false;
    if (auto flag = toolCallResult.find("isError"); flag != toolCallResult.end()) {
        if (!flag->is_boolean()) {
            return Error{ErrorCode::InvalidArgument, "tools/call 'isError' must be a boolean"};
        }
        isError = flag->get<bool>();
    }
    if (isError) {
        return Error{ErrorCode::ToolError, text.value_or("Tool reported an error")};
    }
    if (!text) {
        return Error{ErrorCode::InvalidArgument, "tools/call result has no text content"};
    }
    return *text;
}

} // namespace mcpbridge::session
