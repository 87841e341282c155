#include <mcpbridge/config/bridge_config.h>
#include <mcpbridge/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <functional>
#include <map>

namespace mcpbridge::config {

namespace {

using Setter = std::function<Result<void>(BridgeConfig&, const std::string&)>;

Result<void> invalid(const std::string& key, const std::string& value) {
    return Error{ErrorCode::InvalidArgument, "Invalid value for " + key + ": '" + value + "'"};
}

template <typename Apply> Setter msSetter(std::string key, Apply apply) {
    return [key, apply](BridgeConfig& c, const std::string& v) -> Result<void> {
        auto ms = parse_ms(v);
        if (!ms) {
            return invalid(key, v);
        }
        apply(c, std::max(*ms, kMinTimeout));
        return {};
    };
}

template <typename Apply> Setter countSetter(std::string key, Apply apply) {
    return [key, apply](BridgeConfig& c, const std::string& v) -> Result<void> {
        auto n = parse_int(v);
        if (!n) {
            return invalid(key, v);
        }
        apply(c, static_cast<int>(std::clamp<long long>(*n, 1, 10'000)));
        return {};
    };
}

template <typename Apply> Setter stringSetter(Apply apply) {
    return [apply](BridgeConfig& c, const std::string& v) -> Result<void> {
        apply(c, v);
        return {};
    };
}

template <typename Apply> Setter boolSetter(std::string key, Apply apply) {
    return [key, apply](BridgeConfig& c, const std::string& v) -> Result<void> {
        auto b = parse_bool(v);
        if (!b) {
            return invalid(key, v);
        }
        apply(c, *b);
        return {};
    };
}

const std::map<std::string, Setter>& setters() {
    using ms = std::chrono::milliseconds;
    static const std::map<std::string, Setter> table = {
        {"handshake_timeout_ms",
         msSetter("handshake_timeout_ms",
                  [](BridgeConfig& c, ms v) { c.session.handshakeTimeout = v; })},
        {"call_timeout_ms", msSetter("call_timeout_ms", [](BridgeConfig& c, ms v) {
             c.session.defaultCallTimeout = v;
         })},
        {"probe_max_attempts", countSetter("probe_max_attempts", [](BridgeConfig& c, int v) {
             c.session.probe.maxAttempts = v;
         })},
        {"probe_interval_ms",
         msSetter("probe_interval_ms", [](BridgeConfig& c, ms v) { c.session.probe.interval = v; })},
        {"probe_attempt_timeout_ms",
         msSetter("probe_attempt_timeout_ms",
                  [](BridgeConfig& c, ms v) { c.session.probeAttemptTimeout = v; })},
        {"terminate_grace_ms",
         msSetter("terminate_grace_ms", [](BridgeConfig& c, ms v) { c.session.terminateGrace = v; })},
        {"wait_ready_max_attempts",
         countSetter("wait_ready_max_attempts",
                     [](BridgeConfig& c, int v) { c.waitReady.maxAttempts = v; })},
        {"wait_ready_interval_ms", msSetter("wait_ready_interval_ms", [](BridgeConfig& c, ms v) {
             c.waitReady.interval = v;
             c.waitReady.maxInterval = v;
         })},
        {"retry_max_attempts", countSetter("retry_max_attempts", [](BridgeConfig& c, int v) {
             c.toolRetry.maxAttempts = v;
         })},
        {"retry_initial_delay_ms",
         msSetter("retry_initial_delay_ms", [](BridgeConfig& c, ms v) { c.toolRetry.interval = v; })},
        {"retry_max_delay_ms",
         msSetter("retry_max_delay_ms", [](BridgeConfig& c, ms v) { c.toolRetry.maxInterval = v; })},
        {"health_monitor", boolSetter("health_monitor", [](BridgeConfig& c, bool v) {
             c.healthMonitor.enabled = v;
         })},
        {"health_interval_ms", msSetter("health_interval_ms", [](BridgeConfig& c, ms v) {
             c.healthMonitor.interval = v;
         })},
        {"health_auto_reconnect", boolSetter("health_auto_reconnect", [](BridgeConfig& c, bool v) {
             c.healthMonitor.autoReconnect = v;
         })},
        {"max_frame_bytes",
         [](BridgeConfig& c, const std::string& v) -> Result<void> {
             auto n = parse_int(v);
             if (!n || *n <= 0) {
                 return invalid("max_frame_bytes", v);
             }
             c.maxFrameBytes = std::max(static_cast<size_t>(*n), kMinFrameBytes);
             return {};
         }},
        {"protocol_version", stringSetter([](BridgeConfig& c, const std::string& v) {
             c.session.protocolVersion = v;
         })},
        {"client_name", stringSetter([](BridgeConfig& c, const std::string& v) {
             c.session.clientInfo.name = v;
         })},
        {"client_version", stringSetter([](BridgeConfig& c, const std::string& v) {
             c.session.clientInfo.version = v;
         })},
        {"log_level",
         [](BridgeConfig& c, const std::string& v) -> Result<void> {
             if (!logging::parse_level(v)) {
                 return invalid("log_level", v);
             }
             c.logging.level = v;
             return {};
         }},
        {"log_file", stringSetter([](BridgeConfig& c, const std::string& v) {
             c.logging.file = v.empty() ? v : expand_tilde(v).string();
         })},
    };
    return table;
}

std::string envNameFor(const std::string& key) {
    std::string name = "MCPBRIDGE_";
    for (char c : key) {
        name.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return name;
}

Result<process::ServerDescriptor> parseServer(const std::string& name,
                                              const std::map<std::string, std::string>& kv) {
    process::ServerDescriptor d;
    d.name = name;

    for (const auto& [key, value] : kv) {
        if (key == "command") {
            d.command = value;
        } else if (key == "args") {
            d.args = parse_string_list(value);
        } else if (key == "working_dir") {
            if (!value.empty())
                d.in_directory(expand_tilde(value));
        } else if (key == "description") {
            d.description = value;
        } else if (key == "capabilities") {
            d.capabilities = parse_string_list(value);
        } else if (key.rfind("env.", 0) == 0 && key.size() > 4) {
            d.with_env(key.substr(4), value);
        } else {
            return Error{ErrorCode::InvalidArgument,
                         "Unknown key '" + key + "' in [server." + name + "]"};
        }
    }

    if (d.command.empty()) {
        return Error{ErrorCode::InvalidArgument, "[server." + name + "] has no command"};
    }
    if (d.description.empty()) {
        d.description = name;
    }
    return d;
}

} // namespace

Result<void> apply_setting(BridgeConfig& config, const std::string& key, const std::string& value) {
    const auto& table = setters();
    auto it = table.find(key);
    if (it == table.end()) {
        return Error{ErrorCode::InvalidArgument, "Unknown bridge setting: " + key};
    }
    return it->second(config, value);
}

size_t apply_env_overrides(BridgeConfig& config) {
    size_t applied = 0;
    for (const auto& [key, setter] : setters()) {
        const char* raw = std::getenv(envNameFor(key).c_str());
        if (!raw) {
            continue;
        }
        auto r = setter(config, raw);
        if (!r) {
            spdlog::warn("Config: ignoring {}: {}", envNameFor(key), r.error().message);
            continue;
        }
        spdlog::debug("Config: {} overridden from environment", key);
        ++applied;
    }
    return applied;
}

Result<FileConfig> load_config(const std::filesystem::path& path) {
    auto parsed = parse_config_file(path);
    if (!parsed) {
        return parsed.error();
    }

    FileConfig out;
    for (const auto& [section, kv] : parsed.value()) {
        if (section == "bridge") {
            for (const auto& [key, value] : kv) {
                auto r = apply_setting(out.bridge, key, value);
                if (!r) {
                    return Error{r.error().code, path.string() + ": " + r.error().message};
                }
            }
        } else if (section.rfind("server.", 0) == 0) {
            std::string name = section.substr(7);
            trim(name);
            name = unquote(name);
            if (name.empty()) {
                return Error{ErrorCode::InvalidArgument,
                             path.string() + ": server section without a name"};
            }
            auto server = parseServer(name, kv);
            if (!server) {
                return Error{server.error().code, path.string() + ": " + server.error().message};
            }
            out.servers.push_back(std::move(server).value());
        } else if (!section.empty() || !kv.empty()) {
            spdlog::warn("Config: ignoring unknown section [{}] in {}", section, path.string());
        }
    }

    spdlog::debug("Config: loaded {} server(s) from {}", out.servers.size(), path.string());
    return out;
}

Result<FileConfig> resolve_config(const std::filesystem::path& path) {
    auto loaded = load_config(path);
    if (!loaded) {
        return loaded.error();
    }
    auto config = std::move(loaded).value();
    apply_env_overrides(config.bridge);
    return config;
}

} // namespace mcpbridge::config
