#pragma once

#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

namespace mcpbridge::session {

/**
 * @brief Owns the io_context that drives per-call expiry timers.
 *
 * Constructed explicitly by whoever owns the sessions (normally the Bridge)
 * and shared by reference. Stopping joins the worker threads; timers still
 * pending at that point are abandoned without running their handlers.
 */
class TimerService {
public:
    explicit TimerService(unsigned int threads = 1);
    ~TimerService() noexcept;

    TimerService(const TimerService&) = delete;
    TimerService& operator=(const TimerService&) = delete;

    boost::asio::io_context& context() noexcept { return *io_context_; }

    void stop() noexcept;
    bool running() const noexcept;

private:
    using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

    std::unique_ptr<boost::asio::io_context> io_context_;
    std::unique_ptr<WorkGuard> work_guard_;
    std::vector<std::thread> io_threads_;
    mutable std::mutex mutex_;
};

} // namespace mcpbridge::session
