#ifndef MCPLINK_TOOL_CLIENT_HPP
#define MCPLINK_TOOL_CLIENT_HPP

// What the tool registry needs from an MCP client.

#include <nlohmann/json.hpp>
#include <string>

#include "mcp/mcp_types.hpp"
#include "utils/call_context.hpp"

namespace mcp {

class ToolClient {
public:
    virtual ~ToolClient() = default;

    // tools/list with empty params.
    virtual ListToolsResult list_tools(const Service &service, const call_context::CallContext &context) = 0;

    // tools/call with {name, arguments}.
    virtual CallToolResult call_tool(const Service &service, const std::string &tool_name, const json &arguments,
                                     const call_context::CallContext &context) = 0;
};

} // namespace mcp

#endif // MCPLINK_TOOL_CLIENT_HPP
