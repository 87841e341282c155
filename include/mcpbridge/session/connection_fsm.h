#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace mcpbridge::session {

// Connection lifecycle of one helper session.
//
//   Disconnected -> Launching -> HandshakeInFlight -> Initialized -> ProbingReadiness -> Ready
//
// Failed is reachable from every state between Launching and Ready; Disconnected is
// re-entered from Ready or Failed on explicit teardown.

enum class ConnectionState {
    Disconnected = 0,
    Launching,
    HandshakeInFlight,
    Initialized,
    ProbingReadiness,
    Ready,
    Failed,
};

enum class FailureReason {
    None = 0,
    Launch,
    HandshakeTimeout,
    HandshakeRejected,
    NotReady,
    TransportClosed,
    Cancelled,
};

const char* toString(ConnectionState state) noexcept;
const char* toString(FailureReason reason) noexcept;

struct ConnectionSnapshot {
    ConnectionState state{ConnectionState::Disconnected};
    FailureReason reason{FailureReason::None}; // None unless state == Failed
    std::string lastError;                     // empty when no error
    std::chrono::steady_clock::time_point lastTransition{};
};

struct ConnectionTransition {
    ConnectionState from;
    ConnectionState to;
    ConnectionSnapshot snapshot;
};

// Events that can be dispatched to the FSM
struct ConnectRequestedEvent {};
struct LaunchFailedEvent {
    std::string error;
};
struct TransportStartedEvent {};
struct HandshakeCompletedEvent {};
struct HandshakeTimedOutEvent {
    std::string error;
};
struct HandshakeRejectedEvent {
    std::string error;
};
struct InitializedNotifiedEvent {};
struct ProbeSucceededEvent {};
struct ProbeExhaustedEvent {
    std::string error;
};
struct TransportClosedEvent {
    std::string error;
};
struct CancelEvent {};
struct TeardownEvent {};

class ConnectionFsm {
public:
    using Listener = std::function<void(const ConnectionTransition&)>;

    explicit ConnectionFsm(std::string name = {}) : name_(std::move(name)) {}

    ConnectionSnapshot snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return snapshot_;
    }

    ConnectionState state() const { return snapshot().state; }

    // Each dispatch returns true when it caused a transition; events that are
    // not legal in the current state are ignored.
    bool dispatch(const ConnectRequestedEvent&);
    bool dispatch(const LaunchFailedEvent&);
    bool dispatch(const TransportStartedEvent&);
    bool dispatch(const HandshakeCompletedEvent&);
    bool dispatch(const HandshakeTimedOutEvent&);
    bool dispatch(const HandshakeRejectedEvent&);
    bool dispatch(const InitializedNotifiedEvent&);
    bool dispatch(const ProbeSucceededEvent&);
    bool dispatch(const ProbeExhaustedEvent&);
    bool dispatch(const TransportClosedEvent&);
    bool dispatch(const CancelEvent&);
    bool dispatch(const TeardownEvent&);

    // Invoked after every transition, outside the state lock, one at a time.
    void setListener(Listener listener);

    static bool isTransient(ConnectionState state) noexcept {
        return state == ConnectionState::Launching || state == ConnectionState::HandshakeInFlight ||
               state == ConnectionState::Initialized ||
               state == ConnectionState::ProbingReadiness;
    }

private:
    template <typename Guard>
    bool transitionIf(Guard&& allowed, ConnectionState next, FailureReason reason = FailureReason::None,
                      std::string err = {});

    std::string name_;
    ConnectionSnapshot snapshot_{};
    mutable std::mutex mutex_;
    std::mutex listenerMutex_;
    Listener listener_;
};

} // namespace mcpbridge::session
