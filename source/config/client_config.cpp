#include "config/client_config.hpp"
#include "utils/debug_log.hpp"
#include "utils/text.hpp"

#include <cstdlib>

namespace client_config {

bool parse_duration(const std::string &text, std::chrono::milliseconds &output_duration) {
    std::string trimmed = text::to_lower(text::trim(text));
    if (trimmed.empty()) {
        return false;
    }

    size_t digit_count = 0;
    while (digit_count < trimmed.size() && trimmed[digit_count] >= '0' && trimmed[digit_count] <= '9') {
        digit_count++;
    }
    if (digit_count == 0 || digit_count > 9) {
        return false;
    }

    long long amount = std::stoll(trimmed.substr(0, digit_count));
    std::string unit = trimmed.substr(digit_count);
    long long milliseconds = 0;
    if (unit.empty() || unit == "s") {
        milliseconds = amount * 1000;
    } else if (unit == "ms") {
        milliseconds = amount;
    } else if (unit == "m") {
        milliseconds = amount * 60 * 1000;
    } else {
        return false;
    }

    if (milliseconds <= 0) {
        return false;
    }
    output_duration = std::chrono::milliseconds(milliseconds);
    return true;
}

static void read_duration(const EnvironmentLookup &lookup, const char *name, std::chrono::milliseconds &target) {
    const char *value = lookup(name);
    if (value == nullptr || text::trim(value).empty()) {
        return;
    }
    if (!parse_duration(value, target)) {
        debug_log::notice(std::string("ignoring invalid ") + name + "=" + value);
    }
}

ClientConfig load(const EnvironmentLookup &lookup) {
    ClientConfig config;

    read_duration(lookup, "MCPLINK_HTTP_TIMEOUT", config.http_timeout);
    read_duration(lookup, "MCPLINK_TOOL_CACHE_TTL", config.tool_cache_ttl);

    const char *protocol_version = lookup("MCPLINK_PROTOCOL_VERSION");
    if (protocol_version != nullptr && !text::trim(protocol_version).empty()) {
        config.protocol_version = text::trim(protocol_version);
    }

    const char *settings_path = lookup("MCPLINK_SETTINGS");
    if (settings_path != nullptr && !text::trim(settings_path).empty()) {
        config.settings_path = text::trim(settings_path);
    }

    return config;
}

ClientConfig load_from_environment() {
    return load([](const char *name) { return std::getenv(name); });
}

} // namespace client_config
