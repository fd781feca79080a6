#ifndef MCPLINK_GATEWAY_DISPATCH_HPP
#define MCPLINK_GATEWAY_DISPATCH_HPP

// MCP JSON-RPC method dispatch for the stdio gateway.
// Publishes the tool registry as an MCP server: tools/list and tools/call are
// answered from the registry, mcplink/services and mcplink/invalidate expose
// service status and cache control.

#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "registry/tool_registry.hpp"

namespace gateway_dispatch {

using json = nlohmann::json;

struct DispatcherOptions {
    std::string protocol_version = "2025-06-18";
    // Upper bound for one gateway request. Each service call is additionally
    // bounded by the registry's call timeout.
    std::chrono::milliseconds request_timeout = std::chrono::minutes(5);
};

class Dispatcher {
public:
    Dispatcher(std::shared_ptr<registry::ToolRegistry> registry, DispatcherOptions options);

    // Dispatch a single JSON-RPC message. Returns the response JSON, or a null
    // json value for notifications (which require no response).
    json dispatch_message(const json &message);

private:
    json handle_initialize(const json &request_id, const json &params);
    json handle_tools_list(const json &request_id);
    json handle_tools_call(const json &request_id, const json &params);
    json handle_services(const json &request_id);
    json handle_invalidate(const json &request_id);

    std::shared_ptr<registry::ToolRegistry> registry_;
    DispatcherOptions options_;
};

// Definitions in MCP tools/list shape: {name, description, inputSchema}.
json tool_definitions_to_json(const std::vector<registry::ToolDefinition> &definitions);

// Service statuses as a JSON array. Credentials are never included.
json service_statuses_to_json(const std::vector<registry::ServiceStatus> &statuses);

// An MCP tools/call result carrying one text part.
json build_text_result(const std::string &text, bool is_error);

} // namespace gateway_dispatch

#endif // MCPLINK_GATEWAY_DISPATCH_HPP
