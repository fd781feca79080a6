#include "mcp/protocol_client.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"
#include "utils/text.hpp"

#include <utility>

namespace mcp {

static std::string resolved_protocol_version(const ClientOptions &options) {
    std::string version = text::trim(options.protocol_version);
    return version.empty() ? DEFAULT_PROTOCOL_VERSION : version;
}

static RpcError wrap_error(const Service &service, const std::string &method, const RpcError &error) {
    RpcError wrapped = error;
    wrapped.message = "mcp service \"" + service.id + "\" " + method + " via " +
                      normalize_transport(service.transport) + ": " + error.message;
    return wrapped;
}

static bool decode_tools(const json &result, std::vector<RemoteTool> &output_tools, std::string &error_message) {
    output_tools.clear();
    if (result.is_null()) {
        return true;
    }
    if (!result.is_object()) {
        error_message = "decode tools/list result: result is not an object";
        return false;
    }
    if (!result.contains("tools") || result["tools"].is_null()) {
        return true;
    }
    if (!result["tools"].is_array()) {
        error_message = "decode tools/list result: tools is not an array";
        return false;
    }

    for (const auto &entry : result["tools"]) {
        if (!entry.is_object()) {
            error_message = "decode tools/list result: tool entry is not an object";
            return false;
        }
        RemoteTool tool;
        if (entry.contains("name") && entry["name"].is_string()) {
            tool.name = entry["name"].get<std::string>();
        }
        if (entry.contains("description") && entry["description"].is_string()) {
            tool.description = entry["description"].get<std::string>();
        }
        if (entry.contains("inputSchema")) {
            tool.input_schema = entry["inputSchema"];
        }
        output_tools.push_back(std::move(tool));
    }
    return true;
}

static bool decode_call_result(const json &result, ToolCallResult &output_result, std::string &error_message) {
    output_result = ToolCallResult();
    output_result.raw = result;
    if (result.is_null()) {
        return true;
    }
    if (!result.is_object()) {
        error_message = "decode tools/call result: result is not an object";
        return false;
    }

    if (result.contains("content") && result["content"].is_array()) {
        for (const auto &entry : result["content"]) {
            if (!entry.is_object()) {
                continue;
            }
            ContentPart part;
            if (entry.contains("type") && entry["type"].is_string()) {
                part.type = entry["type"].get<std::string>();
            }
            if (entry.contains("text") && entry["text"].is_string()) {
                part.text = entry["text"].get<std::string>();
            }
            output_result.content.push_back(std::move(part));
        }
    }
    if (result.contains("structuredContent")) {
        output_result.structured_content = result["structuredContent"];
    }
    if (result.contains("isError") && result["isError"].is_boolean()) {
        output_result.is_error = result["isError"].get<bool>();
    }
    return true;
}

ProtocolClient::ProtocolClient(ClientOptions options, std::shared_ptr<http_client::HttpClient> http)
    : options_(std::move(options)),
      streamable_http_(http, resolved_protocol_version(options_)),
      sse_(http, resolved_protocol_version(options_)) {
    options_.protocol_version = resolved_protocol_version(options_);
}

ListToolsResult ProtocolClient::list_tools(const Service &service, const call_context::CallContext &context) {
    ListToolsResult list_result;

    RpcExchange exchange = call_rpc(service, "tools/list", json::object(), context);
    if (!exchange.success) {
        list_result.error = wrap_error(service, "tools/list", exchange.error);
        return list_result;
    }

    std::string decode_error;
    if (!decode_tools(exchange.result, list_result.tools, decode_error)) {
        list_result.error = wrap_error(service, "tools/list", make_error(ErrorKind::Decode, decode_error));
        return list_result;
    }

    list_result.success = true;
    return list_result;
}

CallToolResult ProtocolClient::call_tool(const Service &service, const std::string &tool_name, const json &arguments,
                                         const call_context::CallContext &context) {
    CallToolResult call_result;

    json params;
    params["name"] = tool_name;
    params["arguments"] = arguments.is_object() ? arguments : json::object();

    RpcExchange exchange = call_rpc(service, "tools/call", params, context);
    if (!exchange.success) {
        call_result.error = wrap_error(service, "tools/call", exchange.error);
        return call_result;
    }

    std::string decode_error;
    if (!decode_call_result(exchange.result, call_result.result, decode_error)) {
        call_result.error = wrap_error(service, "tools/call", make_error(ErrorKind::Decode, decode_error));
        return call_result;
    }

    call_result.success = true;
    return call_result;
}

RpcExchange ProtocolClient::call_rpc(const Service &service, const std::string &method, const json &params,
                                     const call_context::CallContext &context) {
    TransportKind kind = service.transport_kind();
    if (kind == TransportKind::Stdio) {
        return call_stdio(service, method, params, context);
    }

    RpcTransport *transport = transport_for(kind);
    if (transport == nullptr) {
        RpcExchange exchange;
        exchange.error = make_error(ErrorKind::InvalidService, "unsupported transport \"" + service.transport + "\"");
        return exchange;
    }

    // First attempt.
    SessionAcquire acquired = ensure_session(*transport, service, context);
    if (!acquired.success) {
        RpcExchange exchange;
        exchange.error = acquired.error;
        return exchange;
    }

    RpcExchange exchange =
        transport->send(service, acquired.session_id, json_rpc::build_request(next_request_id(), method, params),
                        true, context);
    if (exchange.success) {
        sessions_.set(service.id, exchange.session_id);
        return exchange;
    }
    if (acquired.session_id.empty()) {
        return exchange;
    }

    // One bounded retry with a fresh session.
    debug_log::log("session " + acquired.session_id + " of \"" + service.id + "\" failed " + method + " (" +
                   exchange.error.message + "), reinitializing");
    SessionAcquire reacquired = reinitialize_session(*transport, service, acquired.session_id, context);
    if (!reacquired.success) {
        RpcExchange combined;
        combined.error = make_error(ErrorKind::Session, "rpc failed: " + exchange.error.message +
                                                            "; reinitialize failed: " + reacquired.error.message);
        return combined;
    }

    RpcExchange retried =
        transport->send(service, reacquired.session_id, json_rpc::build_request(next_request_id(), method, params),
                        true, context);
    if (!retried.success) {
        retried.error.message = "rpc failed after session retry: " + retried.error.message;
        return retried;
    }
    sessions_.set(service.id, retried.session_id);
    return retried;
}

std::string ProtocolClient::cached_session(const std::string &service_id) const {
    return sessions_.get(service_id);
}

int64_t ProtocolClient::next_request_id() {
    return ++request_counter_;
}

json ProtocolClient::initialize_params() const {
    json params;
    params["protocolVersion"] = options_.protocol_version;
    params["capabilities"]["tools"] = json::object();
    params["clientInfo"]["name"] = options_.client_name;
    params["clientInfo"]["version"] = options_.client_version;
    return params;
}

RpcTransport *ProtocolClient::transport_for(TransportKind kind) {
    switch (kind) {
    case TransportKind::StreamableHttp:
        return &streamable_http_;
    case TransportKind::Sse:
        return &sse_;
    case TransportKind::Stdio:
    case TransportKind::Unknown:
        break;
    }
    return nullptr;
}

ProtocolClient::SessionAcquire ProtocolClient::ensure_session(RpcTransport &transport, const Service &service,
                                                              const call_context::CallContext &context) {
    std::shared_ptr<std::mutex> service_mutex = sessions_.service_lock(service.id);
    std::lock_guard<std::mutex> guard(*service_mutex);

    std::string cached = sessions_.get(service.id);
    if (!cached.empty()) {
        SessionAcquire acquired;
        acquired.success = true;
        acquired.session_id = cached;
        return acquired;
    }
    return initialize_session(transport, service, context);
}

ProtocolClient::SessionAcquire ProtocolClient::reinitialize_session(RpcTransport &transport, const Service &service,
                                                                    const std::string &failed_session_id,
                                                                    const call_context::CallContext &context) {
    std::shared_ptr<std::mutex> service_mutex = sessions_.service_lock(service.id);
    std::lock_guard<std::mutex> guard(*service_mutex);

    std::string replacement = sessions_.clear_if_matches(service.id, failed_session_id);
    if (!replacement.empty()) {
        debug_log::log("session of \"" + service.id + "\" was already replaced, reusing it");
        SessionAcquire acquired;
        acquired.success = true;
        acquired.session_id = replacement;
        return acquired;
    }
    return initialize_session(transport, service, context);
}

ProtocolClient::SessionAcquire ProtocolClient::initialize_session(RpcTransport &transport, const Service &service,
                                                                  const call_context::CallContext &context) {
    SessionAcquire acquired;

    RpcExchange initialized =
        transport.send(service, "", json_rpc::build_request(next_request_id(), "initialize", initialize_params()),
                       true, context);
    if (!initialized.success) {
        acquired.error = initialized.error;
        acquired.error.message = "initialize: " + initialized.error.message;
        return acquired;
    }

    std::string session_id = text::trim(initialized.session_id);
    sessions_.set(service.id, session_id);

    RpcExchange notified = transport.send(
        service, session_id, json_rpc::build_notification("notifications/initialized", json::object()), false,
        context);
    if (!notified.success) {
        sessions_.clear(service.id);
        acquired.error = notified.error;
        acquired.error.message = "send initialized notification: " + notified.error.message;
        return acquired;
    }

    debug_log::log("initialized \"" + service.id + "\"" +
                   (session_id.empty() ? std::string(" without session") : " with session " + session_id));
    acquired.success = true;
    acquired.session_id = session_id;
    return acquired;
}

RpcExchange ProtocolClient::call_stdio(const Service &service, const std::string &method, const json &params,
                                       const call_context::CallContext &context) {
    StdioExchangePlan plan;
    plan.initialize_request = json_rpc::build_request(next_request_id(), "initialize", initialize_params());
    plan.initialized_notification = json_rpc::build_notification("notifications/initialized", json::object());
    plan.request = json_rpc::build_request(next_request_id(), method, params);
    return stdio_.execute(service, plan, context);
}

} // namespace mcp
