#ifndef MCPLINK_CLIENT_CONFIG_HPP
#define MCPLINK_CLIENT_CONFIG_HPP

// Runtime options read from the environment once at startup.
//   MCPLINK_HTTP_TIMEOUT      per-call deadline (default 20s)
//   MCPLINK_PROTOCOL_VERSION  MCP-Protocol-Version sent to services (default 2025-06-18)
//   MCPLINK_TOOL_CACHE_TTL    tool registry cache lifetime (default 30s)
//   MCPLINK_SETTINGS          settings file (default mcplink_settings.json)
// Durations accept "<n>ms", "<n>s", "<n>m" or a bare number of seconds.

#include <chrono>
#include <functional>
#include <string>

namespace client_config {

constexpr const char DEFAULT_SETTINGS_PATH[] = "mcplink_settings.json";

struct ClientConfig {
    std::chrono::milliseconds http_timeout = std::chrono::seconds(20);
    std::string protocol_version = "2025-06-18";
    std::chrono::milliseconds tool_cache_ttl = std::chrono::seconds(30);
    std::string settings_path = DEFAULT_SETTINGS_PATH;
};

// Returns the variable's value, or nullptr when unset.
using EnvironmentLookup = std::function<const char *(const char *)>;

// Reads the process environment.
ClientConfig load_from_environment();

// Same, with an injectable lookup. Malformed or non-positive values keep the default.
ClientConfig load(const EnvironmentLookup &lookup);

// Parses a positive duration. Returns false for anything else.
bool parse_duration(const std::string &text, std::chrono::milliseconds &output_duration);

} // namespace client_config

#endif // MCPLINK_CLIENT_CONFIG_HPP
