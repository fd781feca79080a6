#ifndef MCPLINK_SSE_TRANSPORT_HPP
#define MCPLINK_SSE_TRANSPORT_HPP

// Event-stream transport. For every message:
//   1. GET the service URL with Accept: text/event-stream.
//   2. Wait for an "endpoint" event naming the POST address (relative to the
//      service URL). If the stream ends first, POST to the service URL.
//   3. POST the message. A reply in the POST body wins; otherwise keep
//      reading the stream until the reply with the request id shows up.

#include <memory>
#include <string>

#include "mcp/rpc_transport.hpp"

namespace mcp {

class SseTransport : public RpcTransport {
public:
    SseTransport(std::shared_ptr<http_client::HttpClient> http, std::string protocol_version);

    RpcExchange send(const Service &service, const std::string &session_id, const json &message,
                     bool expect_response, const call_context::CallContext &context) override;

private:
    std::shared_ptr<http_client::HttpClient> http_;
    std::string protocol_version_;
};

} // namespace mcp

#endif // MCPLINK_SSE_TRANSPORT_HPP
