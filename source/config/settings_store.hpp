#ifndef MCPLINK_SETTINGS_STORE_HPP
#define MCPLINK_SETTINGS_STORE_HPP

// JSON settings file holding the configured MCP services:
//
//   {"mcp": {"services": [ {id, name, endpoint, transport, command, args,
//                           auth_token, enabled, tool_states, updated_at}, ... ]}}
//
// Keys other than mcp.services are kept as read and written back untouched.
// Every mutation rewrites the file atomically. All methods are thread-safe.

#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "registry/service_directory.hpp"

namespace settings {

using json = nlohmann::json;

struct StoreResult {
    bool success = false;
    std::string error_message;
};

struct UpsertResult {
    bool success = false;
    std::string service_id; // the id the service was stored under
    std::string error_message;
};

class SettingsStore;

struct OpenResult {
    bool success = false;
    std::shared_ptr<SettingsStore> store;
    std::string error_message;
};

class SettingsStore : public registry::ServiceDirectory {
public:
    // Loads the file, creating an empty one when it does not exist. Fails on
    // unreadable or malformed files and on the first invalid service.
    static OpenResult open(const std::string &file_path);

    std::vector<mcp::Service> list_services() const override;
    std::vector<mcp::Service> list_enabled_services() const override;
    bool find_service(const std::string &service_id, mcp::Service &output_service) const override;
    bool is_tool_enabled(const std::string &service_id, const std::string &tool_name) const override;

    // Insert or replace. Without an id, an existing service with the same
    // endpoint is updated, otherwise a unique id is derived from the name or
    // endpoint. An omitted credential or override list keeps the stored one.
    UpsertResult upsert_service(mcp::Service service);

    StoreResult delete_service(const std::string &service_id);

    StoreResult set_enabled(const std::string &service_id, bool enabled);

    // Disabling records an override; enabling removes it.
    StoreResult set_tool_enabled(const std::string &service_id, const std::string &tool_name, bool enabled);

    const std::string &file_path() const { return file_path_; }

private:
    explicit SettingsStore(std::string file_path);

    StoreResult load();
    StoreResult persist_locked();
    std::string find_id_by_endpoint_locked(const std::string &endpoint) const;

    std::string file_path_;
    mutable std::mutex mutex_;
    json document_;
    std::vector<mcp::Service> services_;
};

// Checks a normalized service. Returns an empty string when it is valid.
std::string validate_service(const mcp::Service &service);

// Lower-case, runs of characters outside [a-z0-9] collapse to one '-', and
// leading/trailing '-' are dropped.
std::string sanitize_identifier(const std::string &input);

// Drops blank names and enabled entries, keeps one entry per name, sorted by name.
std::vector<mcp::ToolOverride> normalize_tool_states(const std::vector<mcp::ToolOverride> &states);

json service_to_json(const mcp::Service &service);

// Reads one service record; type mismatches are reported in error_message.
bool service_from_json(const json &record, mcp::Service &output_service, std::string &error_message);

// Current time as RFC 3339 in UTC, e.g. 2024-05-01T12:00:00Z.
std::string utc_timestamp_now();

} // namespace settings

#endif // MCPLINK_SETTINGS_STORE_HPP
