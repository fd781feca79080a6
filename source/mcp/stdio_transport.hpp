#ifndef MCPLINK_STDIO_TRANSPORT_HPP
#define MCPLINK_STDIO_TRANSPORT_HPP

// Subprocess transport. Every call spawns the configured command, runs the
// initialize / notifications/initialized / request sequence over its stdin and
// stdout as newline-delimited JSON, then terminates and reaps the child.

#include <nlohmann/json.hpp>

#include "mcp/rpc_transport.hpp"

namespace mcp {

// The three messages written to the child, in order.
struct StdioExchangePlan {
    json initialize_request;
    json initialized_notification;
    json request;
};

class StdioTransport {
public:
    // Runs the plan against a fresh child. The exchange carries the result of
    // plan.request; failures include the child's trimmed stderr.
    RpcExchange execute(const Service &service, const StdioExchangePlan &plan,
                        const call_context::CallContext &context);
};

} // namespace mcp

#endif // MCPLINK_STDIO_TRANSPORT_HPP
