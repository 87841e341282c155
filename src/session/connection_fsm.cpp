#include <mcpbridge/session/connection_fsm.h>

#include <spdlog/spdlog.h>

namespace mcpbridge::session {

const char* toString(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Launching: return "Launching";
        case ConnectionState::HandshakeInFlight: return "HandshakeInFlight";
        case ConnectionState::Initialized: return "Initialized";
        case ConnectionState::ProbingReadiness: return "ProbingReadiness";
        case ConnectionState::Ready: return "Ready";
        case ConnectionState::Failed: return "Failed";
    }
    return "Unknown";
}

const char* toString(FailureReason reason) noexcept {
    switch (reason) {
        case FailureReason::None: return "none";
        case FailureReason::Launch: return "launch";
        case FailureReason::HandshakeTimeout: return "handshakeTimeout";
        case FailureReason::HandshakeRejected: return "handshakeRejected";
        case FailureReason::NotReady: return "notReady";
        case FailureReason::TransportClosed: return "transportClosed";
        case FailureReason::Cancelled: return "cancelled";
    }
    return "unknown";
}

template <typename Guard>
bool ConnectionFsm::transitionIf(Guard&& allowed, ConnectionState next, FailureReason reason,
                                 std::string err) {
    ConnectionTransition transition{};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!allowed(snapshot_.state)) {
            spdlog::debug("Connection[{}]: ignoring -> {} in state {}", name_, toString(next),
                          toString(snapshot_.state));
            return false;
        }
        transition.from = snapshot_.state;
        snapshot_.state = next;
        snapshot_.reason = next == ConnectionState::Failed ? reason : FailureReason::None;
        if (next == ConnectionState::Failed || next == ConnectionState::Launching) {
            snapshot_.lastError = std::move(err);
        }
        snapshot_.lastTransition = std::chrono::steady_clock::now();
        transition.to = next;
        transition.snapshot = snapshot_;
    }

    if (next == ConnectionState::Failed) {
        spdlog::warn("Connection[{}] transition: {} -> Failed({}){}", name_,
                     toString(transition.from), toString(reason),
                     transition.snapshot.lastError.empty()
                         ? ""
                         : (std::string{" error="} + transition.snapshot.lastError));
    } else {
        spdlog::info("Connection[{}] transition: {} -> {}", name_, toString(transition.from),
                     toString(next));
    }

    std::lock_guard<std::mutex> lock(listenerMutex_);
    if (listener_) {
        listener_(transition);
    }
    return true;
}

bool ConnectionFsm::dispatch(const ConnectRequestedEvent&) {
    return transitionIf([](ConnectionState s) { return s == ConnectionState::Disconnected; },
                        ConnectionState::Launching);
}

bool ConnectionFsm::dispatch(const LaunchFailedEvent& ev) {
    return transitionIf([](ConnectionState s) { return s == ConnectionState::Launching; },
                        ConnectionState::Failed, FailureReason::Launch, ev.error);
}

bool ConnectionFsm::dispatch(const TransportStartedEvent&) {
    return transitionIf([](ConnectionState s) { return s == ConnectionState::Launching; },
                        ConnectionState::HandshakeInFlight);
}

bool ConnectionFsm::dispatch(const HandshakeCompletedEvent&) {
    return transitionIf([](ConnectionState s) { return s == ConnectionState::HandshakeInFlight; },
                        ConnectionState::Initialized);
}

bool ConnectionFsm::dispatch(const HandshakeTimedOutEvent& ev) {
    return transitionIf([](ConnectionState s) { return s == ConnectionState::HandshakeInFlight; },
                        ConnectionState::Failed, FailureReason::HandshakeTimeout, ev.error);
}

bool ConnectionFsm::dispatch(const HandshakeRejectedEvent& ev) {
    return transitionIf([](ConnectionState s) { return s == ConnectionState::HandshakeInFlight; },
                        ConnectionState::Failed, FailureReason::HandshakeRejected, ev.error);
}

bool ConnectionFsm::dispatch(const InitializedNotifiedEvent&) {
    return transitionIf([](ConnectionState s) { return s == ConnectionState::Initialized; },
                        ConnectionState::ProbingReadiness);
}

bool ConnectionFsm::dispatch(const ProbeSucceededEvent&) {
    return transitionIf([](ConnectionState s) { return s == ConnectionState::ProbingReadiness; },
                        ConnectionState::Ready);
}

bool ConnectionFsm::dispatch(const ProbeExhaustedEvent& ev) {
    return transitionIf([](ConnectionState s) { return s == ConnectionState::ProbingReadiness; },
                        ConnectionState::Failed, FailureReason::NotReady, ev.error);
}

bool ConnectionFsm::dispatch(const TransportClosedEvent& ev) {
    return transitionIf(
        [](ConnectionState s) { return isTransient(s) || s == ConnectionState::Ready; },
        ConnectionState::Failed, FailureReason::TransportClosed, ev.error);
}

bool ConnectionFsm::dispatch(const CancelEvent&) {
    return transitionIf([](ConnectionState s) { return isTransient(s); }, ConnectionState::Failed,
                        FailureReason::Cancelled, "Connect cancelled by teardown");
}

bool ConnectionFsm::dispatch(const TeardownEvent&) {
    return transitionIf(
        [](ConnectionState s) {
            return s == ConnectionState::Ready || s == ConnectionState::Failed;
        },
        ConnectionState::Disconnected);
}

void ConnectionFsm::setListener(Listener listener) {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    listener_ = std::move(listener);
}

} // namespace mcpbridge::session
