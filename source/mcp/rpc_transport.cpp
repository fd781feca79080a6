#include "mcp/rpc_transport.hpp"
#include "utils/text.hpp"

namespace mcp {

void apply_service_headers(http_client::HttpRequest &request, const Service &service,
                           const std::string &session_id, const std::string &protocol_version) {
    request.set_header(HEADER_PROTOCOL_VERSION, protocol_version);

    std::string token = text::trim(service.auth_token);
    if (!token.empty()) {
        request.set_header("Authorization", "Bearer " + token);
    }

    std::string trimmed_session = text::trim(session_id);
    if (!trimmed_session.empty()) {
        request.set_header(HEADER_SESSION_ID, trimmed_session);
    }
}

RpcError make_error(ErrorKind kind, const std::string &message, int code) {
    RpcError error;
    error.kind = kind;
    error.code = code;
    error.message = message;
    return error;
}

RpcError status_error(int status_code, const std::string &body) {
    return make_error(ErrorKind::Status,
                      "mcp status " + std::to_string(status_code) + ": " + text::sanitize_utf8(text::trim(body)),
                      status_code);
}

RpcExchange exchange_from_response(const json_rpc::Response &response, const std::string &session_id) {
    RpcExchange exchange;
    exchange.session_id = text::trim(session_id);
    if (response.has_error) {
        exchange.error = make_error(ErrorKind::Rpc,
                                    "rpc error " + std::to_string(response.error_code) + ": " +
                                        response.error_message,
                                    response.error_code);
        return exchange;
    }
    exchange.success = true;
    exchange.result = response.result;
    return exchange;
}

} // namespace mcp
