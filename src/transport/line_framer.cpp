#include <mcpbridge/transport/line_framer.h>

#include <spdlog/spdlog.h>

namespace mcpbridge::transport {

void LineFramer::append(std::string_view bytes) {
    if (consumed_ > 0 && consumed_ >= buffer_.size() / 2) {
        buffer_.erase(0, consumed_);
        consumed_ = 0;
    }

    if (!discarding_) {
        buffer_.append(bytes);
    } else {
        // Skip the remainder of an oversized line
        auto nl = bytes.find('\n');
        if (nl == std::string_view::npos) {
            return;
        }
        discarding_ = false;
        buffer_.append(bytes.substr(nl + 1));
    }

    // A partial line that already exceeds the limit can never become a valid frame
    if (buffer_.find('\n', consumed_) == std::string::npos && buffered() > maxFrameBytes_) {
        spdlog::warn("LineFramer: dropping frame larger than {} bytes", maxFrameBytes_);
        ++oversizedDropped_;
        buffer_.clear();
        consumed_ = 0;
        discarding_ = true;
    }
}

std::optional<std::string> LineFramer::next() {
    while (true) {
        auto nl = buffer_.find('\n', consumed_);
        if (nl == std::string::npos) {
            return std::nullopt;
        }

        std::string_view line{buffer_.data() + consumed_, nl - consumed_};
        consumed_ = nl + 1;

        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (line.size() > maxFrameBytes_) {
            spdlog::warn("LineFramer: dropping frame of {} bytes (limit {})", line.size(),
                         maxFrameBytes_);
            ++oversizedDropped_;
            continue;
        }
        if (line.find_first_not_of(" \t") == std::string_view::npos) {
            continue;
        }
        return std::string(line);
    }
}

} // namespace mcpbridge::transport
