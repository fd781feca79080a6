#ifndef MCPLINK_PROTOCOL_CLIENT_HPP
#define MCPLINK_PROTOCOL_CLIENT_HPP

// MCP protocol client: tools/list and tools/call over the transport a service
// declares, with lazy session establishment and a single reinitialize-and-retry
// when an RPC attributed to a cached session fails.

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "http/http_client.hpp"
#include "mcp/session_store.hpp"
#include "mcp/sse_transport.hpp"
#include "mcp/stdio_transport.hpp"
#include "mcp/streamable_http_transport.hpp"
#include "mcp/tool_client.hpp"

namespace mcp {

constexpr const char DEFAULT_PROTOCOL_VERSION[] = "2025-06-18";

struct ClientOptions {
    std::string protocol_version = DEFAULT_PROTOCOL_VERSION;
    std::string client_name = "mcplink";
    std::string client_version = "0.1.0";
};

class ProtocolClient : public ToolClient {
public:
    ProtocolClient(ClientOptions options, std::shared_ptr<http_client::HttpClient> http);

    ListToolsResult list_tools(const Service &service, const call_context::CallContext &context) override;

    CallToolResult call_tool(const Service &service, const std::string &tool_name, const json &arguments,
                             const call_context::CallContext &context) override;

    // One RPC with session handling; the error is not yet wrapped with the
    // service context.
    RpcExchange call_rpc(const Service &service, const std::string &method, const json &params,
                         const call_context::CallContext &context);

    // Cached session id for a service, empty if none.
    std::string cached_session(const std::string &service_id) const;

    const ClientOptions &options() const { return options_; }

private:
    struct SessionAcquire {
        bool success = false;
        std::string session_id;
        RpcError error;
    };

    int64_t next_request_id();
    json initialize_params() const;
    RpcTransport *transport_for(TransportKind kind);

    // Returns the cached session or establishes a new one.
    SessionAcquire ensure_session(RpcTransport &transport, const Service &service,
                                  const call_context::CallContext &context);

    // Drops failed_session_id (unless another caller already replaced it, in
    // which case the replacement is returned) and establishes a new session.
    SessionAcquire reinitialize_session(RpcTransport &transport, const Service &service,
                                        const std::string &failed_session_id,
                                        const call_context::CallContext &context);

    // initialize + notifications/initialized; caller holds the service lock.
    SessionAcquire initialize_session(RpcTransport &transport, const Service &service,
                                      const call_context::CallContext &context);

    RpcExchange call_stdio(const Service &service, const std::string &method, const json &params,
                           const call_context::CallContext &context);

    ClientOptions options_;
    StreamableHttpTransport streamable_http_;
    SseTransport sse_;
    StdioTransport stdio_;
    SessionStore sessions_;
    std::atomic<int64_t> request_counter_{0};
};

} // namespace mcp

#endif // MCPLINK_PROTOCOL_CLIENT_HPP
