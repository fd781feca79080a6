#ifndef MCPLINK_REPLY_DECODER_HPP
#define MCPLINK_REPLY_DECODER_HPP

// Decoding of JSON-RPC replies carried in HTTP bodies and event-stream records.
// A reply body is either a plain JSON document or an event stream carrying the
// message in a "data:" record; both shapes are handled here.

#include <nlohmann/json.hpp>
#include <string>

#include "protocol/json_rpc.hpp"

namespace reply_decoder {

using json = nlohmann::json;

// Decode an HTTP reply body. The event-stream form is chosen by content type or
// by the body starting with "event:" / "data:". When expected_id is not null,
// only a message whose id matches is accepted.
// On failure error_message starts with "decode rpc response: ".
bool decode_body(const std::string &body, const std::string &content_type, const json &expected_id,
                 json_rpc::Response &output_response, std::string &error_message);

// Try to read a single event-stream "data:" payload as the reply to
// expected_id. Returns false for blank data, non-JSON data, requests or
// notifications from the peer, and mismatching ids.
bool decode_event_data(const std::string &event_data, const json &expected_id,
                       json_rpc::Response &output_response);

} // namespace reply_decoder

#endif // MCPLINK_REPLY_DECODER_HPP
