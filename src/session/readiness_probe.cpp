#include <mcpbridge/session/readiness_probe.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace mcpbridge::session {

std::chrono::milliseconds RetryPolicy::delayAfter(int attempt) const {
    if (attempt < 1) {
        attempt = 1;
    }
    double factor = std::pow(std::max(backoffMultiplier, 1.0), attempt - 1);
    double ms = static_cast<double>(interval.count()) * factor;
    double cap = static_cast<double>(std::max(maxInterval, interval).count());
    return std::chrono::milliseconds{static_cast<int64_t>(std::min(ms, cap))};
}

bool interruptibleSleep(std::chrono::milliseconds delay, std::stop_token stop) {
    if (delay.count() <= 0) {
        return !stop.stop_requested();
    }
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lock(m);
    // Predicate only becomes true through a stop request
    (void)cv.wait_for(lock, stop, delay, [] { return false; });
    return !stop.stop_requested();
}

ProbeOutcome ReadinessProbe::run(const Attempt& attempt, std::stop_token stop) const {
    auto fatal = [](const Error& e) {
        return e.code == ErrorCode::TransportClosed || e.code == ErrorCode::Disconnected ||
               e.code == ErrorCode::OperationCancelled;
    };

    auto outcome = retryWithBudget<nlohmann::json>(
        policy_,
        [&](int n) {
            auto r = attempt(n);
            if (!r) {
                spdlog::debug("ReadinessProbe: attempt {}/{} failed: {}", n, policy_.maxAttempts,
                              r.error().message);
            }
            return r;
        },
        [&](const Error& e) { return !fatal(e); }, stop);

    ProbeOutcome out;
    out.attempts = outcome.attempts;
    if (outcome.result) {
        out.ready = true;
        out.result = std::move(outcome.result).value();
    } else {
        out.lastError = outcome.result.error();
    }
    return out;
}

} // namespace mcpbridge::session
