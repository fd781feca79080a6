#include "protocol/reply_decoder.hpp"
#include "protocol/event_stream.hpp"
#include "utils/text.hpp"

namespace reply_decoder {

static const std::string DECODE_PREFIX = "decode rpc response: ";

static bool accepts_id(const json &expected_id, const json_rpc::Response &response) {
    if (expected_id.is_null()) {
        return true;
    }
    return json_rpc::ids_match(expected_id, response.id);
}

bool decode_event_data(const std::string &event_data, const json &expected_id,
                       json_rpc::Response &output_response) {
    std::string payload = text::trim(event_data);
    if (payload.empty()) {
        return false;
    }

    json message = json::parse(payload, nullptr, false);
    if (message.is_discarded() || json_rpc::is_peer_initiated(message)) {
        return false;
    }

    json_rpc::Response response;
    if (!json_rpc::parse_response(message, response) || !accepts_id(expected_id, response)) {
        return false;
    }

    output_response = response;
    return true;
}

bool decode_body(const std::string &body, const std::string &content_type, const json &expected_id,
                 json_rpc::Response &output_response, std::string &error_message) {
    std::string trimmed_body = text::trim(body);
    if (trimmed_body.empty()) {
        error_message = DECODE_PREFIX + "empty response";
        return false;
    }

    if (event_stream::looks_like_event_stream(trimmed_body, content_type)) {
        for (const auto &event : event_stream::parse_all(trimmed_body)) {
            if (decode_event_data(event.data, expected_id, output_response)) {
                return true;
            }
        }
        error_message = DECODE_PREFIX + "no rpc message in sse stream";
        return false;
    }

    json message;
    try {
        message = json::parse(trimmed_body);
    } catch (const json::parse_error &error) {
        error_message = DECODE_PREFIX + error.what();
        return false;
    }

    json_rpc::Response response;
    if (!json_rpc::parse_response(message, response)) {
        error_message = DECODE_PREFIX + "body is not a json-rpc message";
        return false;
    }
    if (!accepts_id(expected_id, response)) {
        error_message = DECODE_PREFIX + "response id " + json_rpc::id_to_string(response.id) +
                        " does not match request id " + json_rpc::id_to_string(expected_id);
        return false;
    }

    output_response = response;
    return true;
}

} // namespace reply_decoder
