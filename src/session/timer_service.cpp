#include <mcpbridge/session/timer_service.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace mcpbridge::session {

TimerService::TimerService(unsigned int threads)
    : io_context_(std::make_unique<boost::asio::io_context>()),
      work_guard_(std::make_unique<WorkGuard>(io_context_->get_executor())) {
    threads = std::clamp(threads, 1u, 16u);
    io_threads_.reserve(threads);
    for (unsigned int i = 0; i < threads; ++i) {
        io_threads_.emplace_back([this]() {
            try {
                io_context_->run();
            } catch (const std::exception& e) {
                spdlog::error("TimerService worker exited with exception: {}", e.what());
            }
        });
    }
    spdlog::debug("TimerService: started {} worker thread(s)", threads);
}

TimerService::~TimerService() noexcept {
    stop();
}

void TimerService::stop() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!work_guard_) {
        return;
    }
    work_guard_->reset();
    work_guard_.reset();
    io_context_->stop();

    for (auto& t : io_threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
    io_threads_.clear();
    spdlog::debug("TimerService: stopped");
}

bool TimerService::running() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return work_guard_ != nullptr;
}

} // namespace mcpbridge::session
