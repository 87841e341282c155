#pragma once

#include <mcpbridge/core/logging.h>
#include <mcpbridge/core/types.h>
#include <mcpbridge/process/process_launcher.h>
#include <mcpbridge/session/protocol_session.h>
#include <mcpbridge/session/readiness_probe.h>

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace mcpbridge::config {

/**
 * @brief Every tunable of the bridge, with the defaults the application ships with.
 */
struct BridgeConfig {
    session::SessionOptions session;

    /// Polling budget of Bridge::waitUntilReady / waitUntilFleetReady
    session::RetryPolicy waitReady{30, std::chrono::milliseconds{1000}, 1.0,
                                   std::chrono::milliseconds{1000}};

    /// Default policy of Bridge::callToolWithRetry
    session::RetryPolicy toolRetry{3, std::chrono::milliseconds{1000}, 2.0,
                                   std::chrono::milliseconds{30'000}};

    /// Periodic health pass over the fleet; off unless enabled
    struct HealthMonitor {
        bool enabled{false};
        std::chrono::milliseconds interval{30'000};
        bool autoReconnect{true}; ///< reconnect servers whose helper went away
    } healthMonitor;

    size_t maxFrameBytes{10 * 1024 * 1024};
    logging::LoggingConfig logging;
};

struct FileConfig {
    BridgeConfig bridge;
    std::vector<process::ServerDescriptor> servers;
};

// Minimums applied to values coming from files and the environment
inline constexpr std::chrono::milliseconds kMinTimeout{50};
inline constexpr size_t kMinFrameBytes = 1024;

/**
 * @brief Apply one [bridge] setting given as a raw string.
 *
 * Used for both file keys and environment overrides. Unknown keys and
 * unparsable values are InvalidArgument; out-of-range values are clamped.
 */
Result<void> apply_setting(BridgeConfig& config, const std::string& key, const std::string& value);

/**
 * @brief Override settings from MCPBRIDGE_<KEY> environment variables.
 *
 * Invalid values are logged and ignored so a bad environment never prevents startup.
 * Returns the number of settings applied.
 */
size_t apply_env_overrides(BridgeConfig& config);

/**
 * @brief Load [bridge] settings and [server.<name>] descriptors from a TOML-style file.
 *
 * Server sections accept command, args, working_dir, description,
 * capabilities and env.<KEY> entries. Servers come back ordered by name. A
 * server without a command is InvalidArgument.
 */
Result<FileConfig> load_config(const std::filesystem::path& path);

/**
 * @brief load_config followed by apply_env_overrides.
 */
Result<FileConfig> resolve_config(const std::filesystem::path& path);

} // namespace mcpbridge::config
