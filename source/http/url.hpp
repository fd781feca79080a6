#ifndef MCPLINK_URL_HPP
#define MCPLINK_URL_HPP

// URL splitting and relative-reference resolution for HTTP endpoints.

#include <string>

namespace url {

// Pieces of an absolute http(s) URL, ready for a client connection.
struct Endpoint {
    std::string scheme;   // "http" or "https"
    std::string host;
    int port = 0;
    std::string path;     // always starts with '/', includes the query string
    bool secure = false;
};

// Parse an absolute http:// or https:// URL. Returns false and fills
// error_message for anything else.
bool parse_endpoint(const std::string &text, Endpoint &output_endpoint, std::string &error_message);

// Resolve reference against base_url following RFC 3986 section 5.2: absolute
// references are returned as-is, "//host/..." inherits the scheme, "/path"
// replaces the path, relative paths are merged with the base directory, and a
// bare "?query" keeps the base path. Dot segments are removed. Fragments are dropped.
std::string resolve_reference(const std::string &base_url, const std::string &reference);

} // namespace url

#endif // MCPLINK_URL_HPP
