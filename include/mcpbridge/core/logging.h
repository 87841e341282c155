#pragma once

#include <mcpbridge/core/types.h>

#include <spdlog/common.h>

#include <cstddef>
#include <string>

namespace mcpbridge::logging {

struct LoggingConfig {
    std::string level{"info"}; ///< trace | debug | info | warn | error | off
    std::string file;          ///< empty: colored stderr sink
    size_t maxFileBytes{5 * 1024 * 1024};
    size_t maxFiles{3};
};

Result<spdlog::level::level_enum> parse_level(const std::string& level);

/**
 * @brief Install the default spdlog logger described by @p config.
 *
 * Logging always goes to stderr or a file, never stdout. On error the
 * previous default logger stays in place.
 */
Result<void> configure_logging(const LoggingConfig& config);

} // namespace mcpbridge::logging
