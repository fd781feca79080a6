#include "gateway/gateway_dispatch.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"
#include "utils/text.hpp"

#include <utility>

namespace gateway_dispatch {

// Server info.
static const std::string SERVER_NAME = "mcplink";
static const std::string SERVER_VERSION = "0.1.0";
static const std::string SERVER_DESCRIPTION =
    "MCP gateway: aggregates the tools of the configured MCP services (HTTP, SSE "
    "and stdio) under one tool list. Tool names are <service>__<tool>.";

json tool_definitions_to_json(const std::vector<registry::ToolDefinition> &definitions) {
    json tools = json::array();
    for (const auto &definition : definitions) {
        json tool;
        tool["name"] = definition.name;
        tool["description"] = text::sanitize_utf8(definition.description);
        tool["inputSchema"] = definition.input_schema;
        tools.push_back(tool);
    }
    return tools;
}

json service_statuses_to_json(const std::vector<registry::ServiceStatus> &statuses) {
    json services = json::array();
    for (const auto &status : statuses) {
        json entry;
        entry["id"] = status.service.id;
        entry["name"] = status.service.name;
        entry["transport"] = status.service.transport;
        entry["enabled"] = status.service.enabled;
        entry["connected"] = status.connected;
        entry["enabled_tool_count"] = status.enabled_tool_count;

        json tools = json::array();
        for (const auto &tool : status.tools) {
            json tool_entry;
            tool_entry["name"] = text::sanitize_utf8(tool.name);
            tool_entry["description"] = text::sanitize_utf8(tool.description);
            tool_entry["enabled"] = tool.enabled;
            tools.push_back(tool_entry);
        }
        entry["tools"] = tools;
        if (!status.last_error.empty()) {
            entry["error"] = text::sanitize_utf8(status.last_error);
        }
        services.push_back(entry);
    }
    return services;
}

json build_text_result(const std::string &text, bool is_error) {
    json content_item;
    content_item["type"] = "text";
    content_item["text"] = text::sanitize_utf8(text);

    json result;
    result["content"] = json::array({content_item});
    result["isError"] = is_error;
    return result;
}

Dispatcher::Dispatcher(std::shared_ptr<registry::ToolRegistry> registry, DispatcherOptions options)
    : registry_(std::move(registry)), options_(std::move(options)) {}

// Handle the "initialize" request.
json Dispatcher::handle_initialize(const json &request_id, const json &params) {
    (void)params; // Any client capabilities are accepted.

    json capabilities;
    capabilities["tools"] = json::object();

    json server_info;
    server_info["name"] = SERVER_NAME;
    server_info["version"] = SERVER_VERSION;
    server_info["description"] = SERVER_DESCRIPTION;

    json result;
    result["protocolVersion"] = options_.protocol_version;
    result["capabilities"] = capabilities;
    result["serverInfo"] = server_info;

    return json_rpc::build_response(request_id, result);
}

json Dispatcher::handle_tools_list(const json &request_id) {
    auto context = call_context::CallContext::with_timeout(options_.request_timeout);
    json result;
    result["tools"] = tool_definitions_to_json(registry_->list_tools(context));
    return json_rpc::build_response(request_id, result);
}

// Tool failures are reported in the result (isError), never as JSON-RPC errors.
json Dispatcher::handle_tools_call(const json &request_id, const json &params) {
    if (!params.contains("name") || !params["name"].is_string()) {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                              "Missing or invalid 'name' in tools/call");
    }

    registry::ToolCall call;
    call.name = params["name"].get<std::string>();
    if (params.contains("arguments")) {
        const json &arguments = params["arguments"];
        call.arguments = arguments.is_string() ? arguments.get<std::string>() : arguments.dump();
    }

    auto context = call_context::CallContext::with_timeout(options_.request_timeout);
    registry::ToolCallOutcome outcome = registry_->call_tool(call, context);
    if (!outcome.success) {
        debug_log::log("tools/call " + call.name + " failed (" + registry::call_error_kind_name(outcome.error_kind) +
                       "): " + outcome.error_message);
        return json_rpc::build_response(request_id, build_text_result(outcome.error_message, true));
    }
    return json_rpc::build_response(request_id, build_text_result(outcome.output, false));
}

json Dispatcher::handle_services(const json &request_id) {
    auto context = call_context::CallContext::with_timeout(options_.request_timeout);
    json result;
    result["services"] = service_statuses_to_json(registry_->list_service_statuses(context));
    return json_rpc::build_response(request_id, result);
}

json Dispatcher::handle_invalidate(const json &request_id) {
    registry_->invalidate_cache();
    return json_rpc::build_response(request_id, json::object());
}

json Dispatcher::dispatch_message(const json &message) {
    std::string method = json_rpc::get_method(message);
    json request_id = json_rpc::get_id(message);
    json params = json_rpc::get_params(message);

    // Notifications ("notifications/initialized", cancellations) need no response.
    if (json_rpc::is_notification(message)) {
        return nullptr;
    }

    if (method == "initialize") {
        return handle_initialize(request_id, params);
    }
    if (method == "tools/list") {
        return handle_tools_list(request_id);
    }
    if (method == "tools/call") {
        return handle_tools_call(request_id, params);
    }
    if (method == "mcplink/services") {
        return handle_services(request_id);
    }
    if (method == "mcplink/invalidate") {
        return handle_invalidate(request_id);
    }
    if (method == "ping") {
        return json_rpc::build_response(request_id, json::object());
    }

    return json_rpc::build_error_response(request_id, json_rpc::METHOD_NOT_FOUND, "Unknown method: " + method);
}

} // namespace gateway_dispatch
