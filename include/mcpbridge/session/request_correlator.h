#pragma once

#include <mcpbridge/core/types.h>
#include <mcpbridge/protocol/message.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <boost/asio/io_context.hpp>

namespace mcpbridge::session {

using json = nlohmann::json;
using CallResult = Result<json>;

/**
 * @brief Table of outstanding requests for one session.
 *
 * Ids come from a monotonic counter and are never reused for the lifetime of
 * the correlator. Each submitted call is completed exactly once: by a
 * response, by its expiry timer, or by fail/failAll. Every later completion
 * attempt for the same id is a no-op that returns false.
 */
class RequestCorrelator {
public:
    struct Ticket {
        RequestId id;
        std::future<CallResult> future;
    };

    RequestCorrelator(boost::asio::io_context& io, std::string ownerName);
    ~RequestCorrelator();

    RequestCorrelator(const RequestCorrelator&) = delete;
    RequestCorrelator& operator=(const RequestCorrelator&) = delete;

    /**
     * @brief Register a pending call and arm its expiry timer.
     *
     * The entry exists before the caller writes the request frame, so a
     * response can never race ahead of its registration.
     */
    Ticket submit(std::string method, std::chrono::milliseconds timeout);

    /**
     * @brief Complete the pending call @p id with @p outcome.
     * @return false when the id is unknown (already completed, expired or never issued)
     */
    bool resolve(RequestId id, CallResult outcome);

    /**
     * @brief Complete from a decoded response; JSON-RPC errors become RemoteError.
     */
    bool resolve(const protocol::Response& response);

    /**
     * @brief Timer path: fail the call with RequestTimeout if it is still pending.
     */
    bool expire(RequestId id);

    bool fail(RequestId id, Error error);

    /**
     * @brief Fail every pending call with @p error. Returns how many were pending.
     */
    size_t failAll(const Error& error);

    size_t pending() const;
    RequestId lastIssuedId() const noexcept;

private:
    struct State;
    bool complete(RequestId id, CallResult outcome);

    boost::asio::io_context& io_;
    std::string ownerName_;
    std::shared_ptr<State> state_;
};

} // namespace mcpbridge::session
