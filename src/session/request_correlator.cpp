#include <mcpbridge/session/request_correlator.h>

#include <spdlog/spdlog.h>

#include <mutex>
#include <unordered_map>
#include <vector>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

namespace mcpbridge::session {

namespace {

struct PendingCall {
    std::string method;
    std::chrono::steady_clock::time_point submitted;
    std::chrono::steady_clock::time_point deadline;
    std::promise<CallResult> promise;
    std::shared_ptr<boost::asio::steady_timer> timer;
};

} // namespace

struct RequestCorrelator::State {
    mutable std::mutex mutex;
    std::unordered_map<RequestId, PendingCall> calls;
    std::atomic<RequestId> nextId{1};
    std::atomic<RequestId> lastIssued{0};
};

RequestCorrelator::RequestCorrelator(boost::asio::io_context& io, std::string ownerName)
    : io_(io), ownerName_(std::move(ownerName)), state_(std::make_shared<State>()) {}

RequestCorrelator::~RequestCorrelator() {
    (void)failAll(Error{ErrorCode::Disconnected, "Session destroyed"});
}

RequestCorrelator::Ticket RequestCorrelator::submit(std::string method,
                                                    std::chrono::milliseconds timeout) {
    const RequestId id = state_->nextId.fetch_add(1);
    state_->lastIssued.store(id);

    auto now = std::chrono::steady_clock::now();
    PendingCall call;
    call.method = std::move(method);
    call.submitted = now;
    call.deadline = now + timeout;
    call.timer = std::make_shared<boost::asio::steady_timer>(io_, timeout);
    auto future = call.promise.get_future();
    auto timer = call.timer;

    {
        std::lock_guard lock{state_->mutex};
        state_->calls.emplace(id, std::move(call));
    }

    std::weak_ptr<State> weak = state_;
    std::string owner = ownerName_;
    timer->async_wait([weak, timer, id, owner](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        auto state = weak.lock();
        if (!state) {
            return;
        }
        PendingCall expired;
        {
            std::lock_guard lock{state->mutex};
            auto it = state->calls.find(id);
            if (it == state->calls.end()) {
                return;
            }
            expired = std::move(it->second);
            state->calls.erase(it);
        }
        auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - expired.submitted);
        spdlog::warn("RequestCorrelator[{}]: request #{} '{}' timed out after {}ms", owner, id,
                     expired.method, waited.count());
        expired.promise.set_value(Error{ErrorCode::RequestTimeout,
                                        "Request '" + expired.method + "' to '" + owner +
                                            "' timed out after " + std::to_string(waited.count()) +
                                            "ms"});
    });

    return Ticket{id, std::move(future)};
}

bool RequestCorrelator::complete(RequestId id, CallResult outcome) {
    PendingCall call;
    {
        std::lock_guard lock{state_->mutex};
        auto it = state_->calls.find(id);
        if (it == state_->calls.end()) {
            return false;
        }
        call = std::move(it->second);
        state_->calls.erase(it);
    }

    if (call.timer) {
        auto timer = call.timer;
        boost::asio::post(io_, [timer]() { timer->cancel(); });
    }
    call.promise.set_value(std::move(outcome));
    return true;
}

bool RequestCorrelator::resolve(RequestId id, CallResult outcome) {
    return complete(id, std::move(outcome));
}

bool RequestCorrelator::resolve(const protocol::Response& response) {
    if (response.error) {
        const auto& err = *response.error;
        std::string message = "Remote error " + std::to_string(err.code) + ": " + err.message;
        return complete(response.id, Error{ErrorCode::RemoteError, std::move(message)});
    }
    return complete(response.id, response.result.value_or(json::object()));
}

bool RequestCorrelator::expire(RequestId id) {
    return complete(id, Error{ErrorCode::RequestTimeout, "Request #" + std::to_string(id) + " to '" +
                                                             ownerName_ + "' timed out"});
}

bool RequestCorrelator::fail(RequestId id, Error error) {
    return complete(id, std::move(error));
}

size_t RequestCorrelator::failAll(const Error& error) {
    std::vector<RequestId> ids;
    {
        std::lock_guard lock{state_->mutex};
        ids.reserve(state_->calls.size());
        for (const auto& [id, call] : state_->calls) {
            ids.push_back(id);
        }
    }

    size_t failed = 0;
    for (auto id : ids) {
        if (complete(id, error)) {
            ++failed;
        }
    }
    if (failed > 0) {
        spdlog::debug("RequestCorrelator[{}]: failed {} pending call(s): {}", ownerName_, failed,
                      error.message);
    }
    return failed;
}

size_t RequestCorrelator::pending() const {
    std::lock_guard lock{state_->mutex};
    return state_->calls.size();
}

RequestId RequestCorrelator::lastIssuedId() const noexcept {
    return state_->lastIssued.load();
}

} // namespace mcpbridge::session
