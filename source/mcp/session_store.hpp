#ifndef MCPLINK_SESSION_STORE_HPP
#define MCPLINK_SESSION_STORE_HPP

// Per-service MCP session ids. Memory only.
// The map itself is guarded by one mutex; in addition every service has its own
// mutex that callers hold across check -> clear -> reinitialize, so those steps
// never interleave with another caller on the same service while independent
// services proceed concurrently.

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace mcp {

class SessionStore {
public:
    // Empty when no session is cached.
    std::string get(const std::string &service_id) const;

    void set(const std::string &service_id, const std::string &session_id);

    void clear(const std::string &service_id);

    // Clears the cached id only if it still equals expected_session_id.
    // Returns the id that remains cached afterwards (empty if cleared).
    std::string clear_if_matches(const std::string &service_id, const std::string &expected_session_id);

    // The mutex serializing session establishment for one service.
    std::shared_ptr<std::mutex> service_lock(const std::string &service_id);

private:
    mutable std::mutex map_mutex_;
    std::map<std::string, std::string> sessions_;
    std::map<std::string, std::shared_ptr<std::mutex>> service_locks_;
};

} // namespace mcp

#endif // MCPLINK_SESSION_STORE_HPP
