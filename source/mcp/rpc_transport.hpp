#ifndef MCPLINK_RPC_TRANSPORT_HPP
#define MCPLINK_RPC_TRANSPORT_HPP

// Uniform contract of the HTTP-based transports: send one JSON-RPC message,
// optionally wait for its reply. The subprocess transport has no persistent
// session and is driven separately (see stdio_transport.hpp).

#include <nlohmann/json.hpp>
#include <string>

#include "http/http_client.hpp"
#include "mcp/mcp_types.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/call_context.hpp"

namespace mcp {

// Outcome of one message exchange.
struct RpcExchange {
    bool success = false;
    json result;            // the "result" member of the reply
    std::string session_id; // Mcp-Session-Id reported by the service, if any
    RpcError error;
};

class RpcTransport {
public:
    virtual ~RpcTransport() = default;

    // Send message (a request or a notification) to the service. When
    // expect_response is false only the delivery is checked.
    virtual RpcExchange send(const Service &service, const std::string &session_id, const json &message,
                             bool expect_response, const call_context::CallContext &context) = 0;
};

constexpr const char HEADER_PROTOCOL_VERSION[] = "MCP-Protocol-Version";
constexpr const char HEADER_SESSION_ID[] = "Mcp-Session-Id";

// Adds the protocol version, the bearer credential and the session id (when
// known) to an outbound request.
void apply_service_headers(http_client::HttpRequest &request, const Service &service,
                           const std::string &session_id, const std::string &protocol_version);

// "mcp status <code>: <trimmed body>"
RpcError status_error(int status_code, const std::string &body);

RpcError make_error(ErrorKind kind, const std::string &message, int code = 0);

// Turns a decoded reply into an exchange: JSON-RPC error objects become Rpc errors.
RpcExchange exchange_from_response(const json_rpc::Response &response, const std::string &session_id);

} // namespace mcp

#endif // MCPLINK_RPC_TRANSPORT_HPP
