#ifndef MCPLINK_STREAMABLE_HTTP_TRANSPORT_HPP
#define MCPLINK_STREAMABLE_HTTP_TRANSPORT_HPP

// Direct request/response transport: every message is one POST; the reply is
// a JSON body or an event stream carrying a single JSON-RPC message.

#include <memory>
#include <string>

#include "mcp/rpc_transport.hpp"

namespace mcp {

class StreamableHttpTransport : public RpcTransport {
public:
    StreamableHttpTransport(std::shared_ptr<http_client::HttpClient> http, std::string protocol_version);

    RpcExchange send(const Service &service, const std::string &session_id, const json &message,
                     bool expect_response, const call_context::CallContext &context) override;

private:
    std::shared_ptr<http_client::HttpClient> http_;
    std::string protocol_version_;
};

} // namespace mcp

#endif // MCPLINK_STREAMABLE_HTTP_TRANSPORT_HPP
