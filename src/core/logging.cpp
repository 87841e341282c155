#include <mcpbridge/core/logging.h>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace mcpbridge::logging {

Result<spdlog::level::level_enum> parse_level(const std::string& level) {
    std::string lower = level;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace")
        return spdlog::level::trace;
    if (lower == "debug")
        return spdlog::level::debug;
    if (lower == "info")
        return spdlog::level::info;
    if (lower == "warn" || lower == "warning")
        return spdlog::level::warn;
    if (lower == "error" || lower == "err")
        return spdlog::level::err;
    if (lower == "critical")
        return spdlog::level::critical;
    if (lower == "off")
        return spdlog::level::off;
    return Error{ErrorCode::InvalidArgument, "Unknown log level: " + level};
}

Result<void> configure_logging(const LoggingConfig& config) {
    auto level = parse_level(config.level);
    if (!level) {
        return level.error();
    }

    try {
        std::shared_ptr<spdlog::logger> logger;
        if (config.file.empty()) {
            // stdout belongs to whoever embeds us; keep diagnostics on stderr
            auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            logger = std::make_shared<spdlog::logger>("mcpbridge", sink);
        } else {
            std::filesystem::path path{config.file};
            if (path.has_parent_path()) {
                std::error_code ec;
                std::filesystem::create_directories(path.parent_path(), ec);
                if (ec) {
                    return Error{ErrorCode::IOError, "Cannot create log directory " +
                                                         path.parent_path().string() + ": " +
                                                         ec.message()};
                }
            }
            auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file, config.maxFileBytes, config.maxFiles);
            logger = std::make_shared<spdlog::logger>("mcpbridge", sink);
        }
        logger->set_level(level.value());
        spdlog::set_default_logger(logger);
        spdlog::set_level(level.value());
        spdlog::flush_on(spdlog::level::warn);
    } catch (const spdlog::spdlog_ex& e) {
        return Error{ErrorCode::IOError, std::string("Failed to configure logging: ") + e.what()};
    }

    if (!config.file.empty()) {
        spdlog::info("Log rotation enabled: {} (max {}MB x {} files)", config.file,
                     config.maxFileBytes / (1024 * 1024), config.maxFiles);
    }
    return {};
}

} // namespace mcpbridge::logging
