#include "mcp/streamable_http_transport.hpp"
#include "protocol/reply_decoder.hpp"
#include "utils/debug_log.hpp"
#include "utils/text.hpp"

#include <utility>

namespace mcp {

StreamableHttpTransport::StreamableHttpTransport(std::shared_ptr<http_client::HttpClient> http,
                                                 std::string protocol_version)
    : http_(std::move(http)), protocol_version_(std::move(protocol_version)) {}

RpcExchange StreamableHttpTransport::send(const Service &service, const std::string &session_id,
                                          const json &message, bool expect_response,
                                          const call_context::CallContext &context) {
    RpcExchange exchange;

    http_client::HttpRequest request;
    request.method = "POST";
    request.url = text::trim(service.endpoint);
    request.body = message.dump();
    request.set_header("Content-Type", "application/json");
    request.set_header("Accept", "application/json, text/event-stream");
    apply_service_headers(request, service, session_id, protocol_version_);

    http_client::HttpResponse response = http_->send(request, context);
    if (!response.success) {
        exchange.error = make_error(ErrorKind::Transport, "send rpc request: " + response.error_message);
        return exchange;
    }
    if (response.status_code >= 400) {
        exchange.error = status_error(response.status_code, response.body);
        return exchange;
    }

    std::string response_session = text::trim(response.header(HEADER_SESSION_ID));
    if (!expect_response) {
        exchange.success = true;
        exchange.session_id = response_session;
        return exchange;
    }

    json_rpc::Response decoded;
    std::string decode_error;
    if (!reply_decoder::decode_body(response.body, response.header("Content-Type"), nullptr, decoded,
                                    decode_error)) {
        debug_log::log("streamable_http: " + decode_error);
        exchange.error = make_error(ErrorKind::Decode, decode_error);
        return exchange;
    }
    return exchange_from_response(decoded, response_session);
}

} // namespace mcp
