#ifndef MCPLINK_HTTP_CLIENT_HPP
#define MCPLINK_HTTP_CLIENT_HPP

// HTTP client abstraction interface.
// The MCP transports talk to services only through these types, which keeps
// them decoupled from the network library. The production implementation lives
// in http/lws_http_client.*; tests provide scripted implementations.

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "utils/call_context.hpp"

namespace http_client {

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    // Replaces an existing header of the same (case-insensitive) name.
    void set_header(const std::string &name, const std::string &value);

    // Returns the header value, or empty if absent.
    std::string header(const std::string &name) const;
};

// Result of a complete request/response exchange.
// success means a status line was received; status_code may still be >= 400.
struct HttpResponse {
    bool success = false;
    int status_code = 0;
    std::map<std::string, std::string> headers; // names lower-cased
    std::string body;
    std::string error_message;

    std::string header(const std::string &name) const;
};

enum class StreamReadStatus {
    Data,
    EndOfStream,
    Failed,
};

// A response whose body is consumed incrementally (text/event-stream).
// Closing the stream (destroying the object) tears down the connection.
class ResponseStream {
public:
    virtual ~ResponseStream() = default;

    virtual int status_code() const = 0;

    // Returns the response header value, or empty if absent.
    virtual std::string header(const std::string &name) const = 0;

    // Blocks until body bytes arrive, the body ends, or the context is done.
    virtual StreamReadStatus read_some(std::string &output_chunk,
                                       const call_context::CallContext &context,
                                       std::string &error_message) = 0;
};

// Result of opening a streaming request.
struct StreamOpenResult {
    bool success = false;
    std::unique_ptr<ResponseStream> stream;
    std::string error_message;
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Perform one request and read the whole response body.
    virtual HttpResponse send(const HttpRequest &request, const call_context::CallContext &context) = 0;

    // Perform a request and return as soon as the response headers arrived.
    virtual StreamOpenResult open_stream(const HttpRequest &request, const call_context::CallContext &context) = 0;
};

// Drains the remaining body of a stream (used for error diagnostics), bounded
// by the context.
std::string read_remaining_body(ResponseStream &stream, const call_context::CallContext &context);

} // namespace http_client

#endif // MCPLINK_HTTP_CLIENT_HPP
