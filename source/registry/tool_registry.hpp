#ifndef MCPLINK_TOOL_REGISTRY_HPP
#define MCPLINK_TOOL_REGISTRY_HPP

// Tool registry: discovers the tools of every enabled service, exposes them
// under stable collision-free names, caches the result for a TTL and routes
// calls by exposed name back to the owning service.
//
// The cached definitions, the binding table and the TTL deadline share one
// mutex. A refresh performs all network I/O without it and only locks to swap
// the new snapshot in.

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "mcp/tool_client.hpp"
#include "registry/service_directory.hpp"

namespace registry {

using json = nlohmann::json;
using Clock = std::chrono::steady_clock;

// A tool as advertised to the planner.
struct ToolDefinition {
    std::string name;
    std::string description;
    json input_schema;
};

// Exposed name -> origin.
struct ToolBinding {
    std::string service_id;
    std::string tool_name;
};

// An invocation request. arguments is JSON text, as produced by the planner.
struct ToolCall {
    std::string name;
    std::string arguments;
};

enum class CallErrorKind {
    None,
    UnknownTool,
    ServiceNotFound,
    ServiceDisabled,
    ToolDisabled,
    InvalidArguments,
    ToolReportedError, // the service answered with isError
    ClientError,       // protocol client failure; see client_error_kind
};

struct ToolCallOutcome {
    bool success = false;
    std::string output;
    CallErrorKind error_kind = CallErrorKind::None;
    mcp::ErrorKind client_error_kind = mcp::ErrorKind::None;
    std::string error_message;
};

struct ToolStatus {
    std::string name;
    std::string description; // trimmed
    bool enabled = false;
};

struct ServiceStatus {
    mcp::Service service;
    bool connected = false;
    int enabled_tool_count = 0;
    std::vector<ToolStatus> tools; // sorted by name
    std::string last_error;
};

struct RegistryOptions {
    std::chrono::milliseconds cache_ttl = std::chrono::seconds(30);
    std::chrono::milliseconds call_timeout = std::chrono::seconds(20);
};

class ToolRegistry {
public:
    using NowFunction = std::function<Clock::time_point()>;

    // now defaults to the steady clock; tests inject a manual one.
    ToolRegistry(std::shared_ptr<ServiceDirectory> directory, std::shared_ptr<mcp::ToolClient> client,
                 RegistryOptions options, NowFunction now = nullptr);

    // Cached definitions while the cache is non-empty and fresh, otherwise a refresh.
    std::vector<ToolDefinition> list_tools(const call_context::CallContext &context);

    // Rediscover every enabled service and swap in the new snapshot.
    // Services that fail discovery are skipped.
    std::vector<ToolDefinition> refresh_tools(const call_context::CallContext &context);

    // Resolve, re-validate and invoke. Never throws; failures come back in the outcome.
    ToolCallOutcome call_tool(const ToolCall &call, const call_context::CallContext &context);

    // One entry per configured service, sorted by id. Built fresh every time.
    std::vector<ServiceStatus> list_service_statuses(const call_context::CallContext &context);

    // The next list_tools() refreshes.
    void invalidate_cache();

    // Per-call context: the caller's context narrowed to the configured timeout.
    call_context::CallContext call_context_for(const call_context::CallContext &context) const;

private:
    bool lookup_binding(const std::string &exposed_name, ToolBinding &output_binding) const;

    std::shared_ptr<ServiceDirectory> directory_;
    std::shared_ptr<mcp::ToolClient> client_;
    RegistryOptions options_;
    NowFunction now_;

    mutable std::mutex mutex_;
    std::vector<ToolDefinition> cached_tools_;
    std::map<std::string, ToolBinding> bindings_;
    Clock::time_point cache_deadline_;
};

// Trimmed; [A-Za-z0-9_-] kept, every other character (a whole UTF-8 sequence
// counts as one) becomes '_'; leading and trailing '_' stripped; "tool" if
// nothing is left.
std::string sanitize_name(const std::string &raw_name);

// Blank text and JSON null become {}. Anything else must be a JSON object.
bool parse_tool_arguments(const std::string &arguments_text, json &output_arguments, std::string &error_message);

// Non-blank text parts joined with '\n', else the structured content as JSON,
// else the raw result as JSON.
std::string render_tool_result(const mcp::ToolCallResult &result);

const char *call_error_kind_name(CallErrorKind kind);

} // namespace registry

#endif // MCPLINK_TOOL_REGISTRY_HPP
