#ifndef MCPLINK_SERVICE_DIRECTORY_HPP
#define MCPLINK_SERVICE_DIRECTORY_HPP

// Read side of the service configuration as seen by the tool registry.
// Implementations must be safe to call from several threads.

#include <string>
#include <vector>

#include "mcp/mcp_types.hpp"

namespace registry {

class ServiceDirectory {
public:
    virtual ~ServiceDirectory() = default;

    // All configured services.
    virtual std::vector<mcp::Service> list_services() const = 0;

    virtual std::vector<mcp::Service> list_enabled_services() const = 0;

    // Returns false when no service has this id.
    virtual bool find_service(const std::string &service_id, mcp::Service &output_service) const = 0;

    // True unless the tool is explicitly disabled for the service. Unknown
    // services report false.
    virtual bool is_tool_enabled(const std::string &service_id, const std::string &tool_name) const = 0;
};

} // namespace registry

#endif // MCPLINK_SERVICE_DIRECTORY_HPP
