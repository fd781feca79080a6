#ifndef MCPLINK_GATEWAY_STDIO_HPP
#define MCPLINK_GATEWAY_STDIO_HPP

// Gateway side of the stdio MCP transport: JSON messages are read from stdin
// and written to stdout, one per line. Logs go to stderr.

#include <istream>
#include <ostream>
#include <string>

namespace gateway_stdio {

// Read a single complete JSON object from input.
// Returns the raw JSON string, or empty string on EOF.
std::string read_message(std::istream &input);

// Write a JSON message followed by a newline and flush.
void write_message(std::ostream &output, const std::string &json_string);

} // namespace gateway_stdio

#endif // MCPLINK_GATEWAY_STDIO_HPP
