#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace mcpbridge::transport {

/**
 * @brief Splits a byte stream into newline-delimited frames.
 *
 * Trailing '\r' is stripped and blank lines are skipped. A line that grows
 * past the frame limit is discarded up to its terminating newline and counted
 * in oversizedDropped().
 */
class LineFramer {
public:
    explicit LineFramer(size_t maxFrameBytes = 10 * 1024 * 1024) : maxFrameBytes_(maxFrameBytes) {}

    void append(std::string_view bytes);

    /**
     * @brief Pop the next complete line, or nullopt if none is buffered.
     */
    std::optional<std::string> next();

    size_t buffered() const noexcept { return buffer_.size() - consumed_; }
    size_t oversizedDropped() const noexcept { return oversizedDropped_; }

private:
    std::string buffer_;
    size_t consumed_{0};
    size_t maxFrameBytes_;
    bool discarding_{false};
    size_t oversizedDropped_{0};
};

} // namespace mcpbridge::transport
