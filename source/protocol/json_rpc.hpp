#ifndef MCPLINK_JSON_RPC_HPP
#define MCPLINK_JSON_RPC_HPP

// JSON-RPC 2.0 helpers for MCP protocol communication, both directions:
// the client side builds requests and reads replies, the gateway builds replies.
// Uses nlohmann/json for parsing and serialization.

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace json_rpc {

using json = nlohmann::json;

// Standard JSON-RPC error codes.
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

// Build a JSON-RPC 2.0 request carrying a numeric id.
json build_request(int64_t request_id, const std::string &method, const json &params);

// Build a JSON-RPC 2.0 notification (no id, no reply expected).
json build_notification(const std::string &method, const json &params);

// Build a JSON-RPC 2.0 success response.
json build_response(const json &request_id, const json &result_payload);

// Build a JSON-RPC 2.0 error response.
json build_error_response(const json &request_id, int error_code, const std::string &error_message);

// Extract method name from a JSON-RPC message. Returns empty if missing.
std::string get_method(const json &message);

// Extract the id from a JSON-RPC message. Returns nullptr json if missing (notification).
json get_id(const json &message);

// Extract params from a JSON-RPC message. Returns empty object if missing.
json get_params(const json &message);

// Check if a message is a notification (no id field).
bool is_notification(const json &message);

// True when the message carries a non-blank "method" string, i.e. it was
// initiated by the peer rather than being a reply to us.
bool is_peer_initiated(const json &message);

// Renders an id the way it is compared: strings verbatim, numbers in decimal,
// everything else through dump(). Surrounding whitespace is removed.
std::string id_to_string(const json &id);

// Ids match when their string forms are equal, so 7 and "7" correlate.
bool ids_match(const json &expected_id, const json &actual_id);

// A decoded JSON-RPC reply.
struct Response {
    json id;
    json result;
    bool has_error = false;
    int error_code = 0;
    std::string error_message;
};

// Interpret an already-parsed object as a reply. Returns false when the value is
// not an object or carries neither "result" nor "error" nor "id".
bool parse_response(const json &message, Response &output_response);

} // namespace json_rpc

#endif // MCPLINK_JSON_RPC_HPP
