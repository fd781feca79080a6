#ifndef MCPLINK_MCP_TYPES_HPP
#define MCPLINK_MCP_TYPES_HPP

// Data model shared by the protocol client, the transports and the registry.

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace mcp {

using json = nlohmann::json;

// Canonical transport names as stored in the settings file.
constexpr const char TRANSPORT_STREAMABLE_HTTP[] = "streamable_http";
constexpr const char TRANSPORT_SSE[] = "sse";
constexpr const char TRANSPORT_STDIO[] = "stdio";

enum class TransportKind {
    StreamableHttp, // one POST per message, JSON or single-event SSE reply
    Sse,            // GET event stream + POST to the announced endpoint
    Stdio,          // subprocess speaking newline-delimited JSON-RPC
    Unknown,
};

// Maps accepted spellings ("", "streamableHttp", "streamable-http", "SSE", ...)
// to a transport kind. Anything else is Unknown.
TransportKind parse_transport_kind(const std::string &raw_transport);

// Canonical name for known spellings; unknown values are returned verbatim so
// validation can report them.
std::string normalize_transport(const std::string &raw_transport);

const char *transport_name(TransportKind kind);

// Explicit per-tool override. Only the non-default (disabled) state is stored.
struct ToolOverride {
    std::string name;
    bool enabled = false;
    std::string updated_at;
};

// One configured MCP service.
struct Service {
    std::string id;
    std::string name;
    std::string endpoint;               // http(s) URL for streamable_http / sse
    std::string transport;              // see normalize_transport()
    std::string command;                // stdio only
    std::vector<std::string> args;      // stdio only
    std::string auth_token;             // optional bearer credential
    bool enabled = false;
    std::vector<ToolOverride> tool_states;
    std::string updated_at;             // RFC 3339, UTC

    TransportKind transport_kind() const { return parse_transport_kind(transport); }
};

// A tool is enabled unless an override for its exact (trimmed) name says otherwise.
bool service_tool_enabled(const Service &service, const std::string &tool_name);

// A tool as reported by a service's tools/list.
struct RemoteTool {
    std::string name;
    std::string description;
    json input_schema; // null when the service supplied none
};

struct ContentPart {
    std::string type;
    std::string text;
};

// Normalized tools/call result.
struct ToolCallResult {
    std::vector<ContentPart> content;
    json structured_content; // null when absent
    bool is_error = false;
    json raw;                // the untouched result object
};

enum class ErrorKind {
    None,
    Transport,       // connection or process failure before any response
    Status,          // non-success HTTP status; code + body
    Rpc,             // JSON-RPC error object; code + message
    Decode,          // malformed or empty response body
    StreamExhausted, // stream ended before the matching response id arrived
    Session,         // reinitialize after a session failure also failed
    InvalidService,  // configuration cannot be used (unknown transport, no command)
};

const char *error_kind_name(ErrorKind kind);

struct RpcError {
    ErrorKind kind = ErrorKind::None;
    int code = 0; // HTTP status for Status, JSON-RPC code for Rpc
    std::string message;
};

struct ListToolsResult {
    bool success = false;
    std::vector<RemoteTool> tools;
    RpcError error;
};

struct CallToolResult {
    bool success = false;
    ToolCallResult result;
    RpcError error;
};

} // namespace mcp

#endif // MCPLINK_MCP_TYPES_HPP
