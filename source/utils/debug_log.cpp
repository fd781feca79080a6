#include "utils/debug_log.hpp"
#include "utils/text.hpp"

#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>

namespace debug_log {

// Concurrent callers (registry refreshes, gateway requests) share stderr.
static std::mutex output_mutex;

static void write_line(const std::string &message) {
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cerr << "[mcplink] " << message << std::endl;
}

bool is_debug_enabled() {
    const char *value = std::getenv("MCPLINK_DEBUG");
    if (value == nullptr || value[0] == '\0') {
        return false;
    }
    std::string normalized = text::to_lower(text::trim(value));
    return (normalized == "1" || normalized == "true" || normalized == "yes");
}

void log(const std::string &message) {
    if (!is_debug_enabled()) {
        return;
    }
    write_line(message);
}

void notice(const std::string &message) {
    write_line(message);
}

} // namespace debug_log
