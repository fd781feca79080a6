#ifndef MCPLINK_LWS_HTTP_CLIENT_HPP
#define MCPLINK_LWS_HTTP_CLIENT_HPP

// libwebsockets-backed implementation of http_client::HttpClient.
// Every exchange runs on its own lws context, so concurrent callers on
// different threads never share event-loop state.

#include <memory>

#include "http/http_client.hpp"

namespace lws_http_client {

std::shared_ptr<http_client::HttpClient> create();

} // namespace lws_http_client

#endif // MCPLINK_LWS_HTTP_CLIENT_HPP
