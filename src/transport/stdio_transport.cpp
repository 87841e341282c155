#include <mcpbridge/transport/line_framer.h>
#include <mcpbridge/transport/transport.h>

#include <spdlog/spdlog.h>

namespace mcpbridge::transport {

StdioTransport::StdioTransport(std::unique_ptr<process::ProcessHandle> process,
                               StdioTransportOptions options)
    : process_(std::move(process)), options_(options), name_(process_->name()) {}

StdioTransport::~StdioTransport() {
    close(std::chrono::seconds{5});
}

Result<void> StdioTransport::start(MessageHandler onMessage, ClosedHandler onClosed) {
    if (open_.load() || closing_.load()) {
        return Error{ErrorCode::InvalidState, "Transport already started"};
    }
    onMessage_ = std::move(onMessage);
    onClosed_ = std::move(onClosed);
    open_.store(true);

    readerThread_ = std::jthread([this](std::stop_token token) { readLoop(token); });
    stderrThread_ = std::jthread([this](std::stop_token token) { stderrLoop(token); });
    spdlog::debug("StdioTransport[{}]: started (pid={})", name_, process_->pid());
    return {};
}

Result<void> StdioTransport::write(const protocol::ProtocolMessage& message) {
    auto frame = protocol::encodeFrame(message);

    std::lock_guard lock{writeMutex_};
    if (!open_.load()) {
        return Error{ErrorCode::TransportClosed, "Transport to '" + name_ + "' is closed"};
    }
    spdlog::trace("StdioTransport[{}] >> {}", name_, frame.substr(0, frame.size() - 1));
    return process_->writeStdin(frame);
}

void StdioTransport::readLoop(std::stop_token token) {
    LineFramer framer{options_.maxFrameBytes};
    std::string reason = "stdout closed";
    size_t oversizedSeen = 0;

    while (!token.stop_requested()) {
        auto io = process_->readStdout(options_.pollInterval);
        if (io.status == process::IoStatus::Timeout) {
            continue;
        }
        if (io.status == process::IoStatus::Eof) {
            break;
        }
        if (io.status == process::IoStatus::Error) {
            reason = "stdout read failed: " + io.bytes;
            break;
        }

        framer.append(io.bytes);
        while (auto line = framer.next()) {
            auto decoded = protocol::decodeMessage(*line);
            if (!decoded) {
                droppedFrames_.fetch_add(1);
                spdlog::warn("StdioTransport[{}]: dropping malformed frame: {}", name_,
                             decoded.error().message);
                continue;
            }
            spdlog::trace("StdioTransport[{}] << {}", name_, *line);
            if (onMessage_) {
                onMessage_(std::move(decoded).value());
            }
        }
        if (framer.oversizedDropped() != oversizedSeen) {
            droppedFrames_.fetch_add(framer.oversizedDropped() - oversizedSeen);
            oversizedSeen = framer.oversizedDropped();
        }
    }

    open_.store(false);
    if (token.stop_requested() || closing_.load()) {
        return;
    }

    (void)process_->waitForExit(std::chrono::milliseconds{200});
    if (auto code = process_->exitCode()) {
        reason += " (exit code " + std::to_string(*code) + ")";
    }
    spdlog::warn("StdioTransport[{}]: peer closed: {}", name_, reason);

    if (!closedNotified_.exchange(true) && onClosed_) {
        onClosed_(Error{ErrorCode::TransportClosed, "Helper '" + name_ + "' " + reason});
    }
}

void StdioTransport::stderrLoop(std::stop_token token) {
    LineFramer framer{64 * 1024};
    while (!token.stop_requested()) {
        auto io = process_->readStderr(options_.pollInterval);
        if (io.status == process::IoStatus::Timeout) {
            continue;
        }
        if (io.status != process::IoStatus::Data) {
            break;
        }
        framer.append(io.bytes);
        while (auto line = framer.next()) {
            spdlog::debug("[{}] stderr: {}", name_, *line);
        }
    }
}

void StdioTransport::joinThread(std::jthread& t) {
    if (!t.joinable()) {
        return;
    }
    t.request_stop();
    if (t.get_id() == std::this_thread::get_id()) {
        // Closing from a handler; the owner's destructor joins once the loop sees the stop
        return;
    }
    t.join();
}

void StdioTransport::close(std::chrono::milliseconds grace) {
    std::lock_guard lock{closeMutex_};
    if (closing_.exchange(true)) {
        return;
    }
    {
        std::lock_guard writeLock{writeMutex_};
        open_.store(false);
    }

    readerThread_.request_stop();
    stderrThread_.request_stop();
    process_->terminate(grace);
    joinThread(readerThread_);
    joinThread(stderrThread_);
    spdlog::debug("StdioTransport[{}]: closed", name_);
}

bool StdioTransport::isOpen() const {
    return open_.load() && process_->isAlive();
}

std::optional<int64_t> StdioTransport::pid() const {
    if (!process_->isAlive()) {
        return std::nullopt;
    }
    return process_->pid();
}

TransportFactory makeStdioTransportFactory(StdioTransportOptions options) {
    return [options](const process::ServerDescriptor& descriptor)
               -> Result<std::unique_ptr<ITransport>> {
        auto proc = process::launch(descriptor);
        if (!proc) {
            return proc.error();
        }
        return std::unique_ptr<ITransport>(
            std::make_unique<StdioTransport>(std::move(proc).value(), options));
    };
}

} // namespace mcpbridge::transport
