#include "protocol/json_rpc.hpp"
#include "utils/text.hpp"

#include <cmath>

namespace json_rpc {

json build_request(int64_t request_id, const std::string &method, const json &params) {
    json request;
    request["jsonrpc"] = "2.0";
    request["id"] = request_id;
    request["method"] = method;
    request["params"] = params.is_null() ? json::object() : params;
    return request;
}

json build_notification(const std::string &method, const json &params) {
    json notification;
    notification["jsonrpc"] = "2.0";
    notification["method"] = method;
    notification["params"] = params.is_null() ? json::object() : params;
    return notification;
}

json build_response(const json &request_id, const json &result_payload) {
    json response;
    response["jsonrpc"] = "2.0";
    response["id"] = request_id;
    response["result"] = result_payload;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message) {
    json response;
    response["jsonrpc"] = "2.0";
    response["id"] = request_id;
    response["error"]["code"] = error_code;
    response["error"]["message"] = error_message;
    return response;
}

std::string get_method(const json &message) {
    if (message.is_object() && message.contains("method") && message["method"].is_string()) {
        return message["method"].get<std::string>();
    }
    return "";
}

json get_id(const json &message) {
    if (message.is_object() && message.contains("id")) {
        return message["id"];
    }
    return nullptr;
}

json get_params(const json &message) {
    if (message.is_object() && message.contains("params") && message["params"].is_object()) {
        return message["params"];
    }
    return json::object();
}

bool is_notification(const json &message) {
    return !message.contains("id");
}

bool is_peer_initiated(const json &message) {
    return !text::trim(get_method(message)).empty();
}

std::string id_to_string(const json &id) {
    if (id.is_string()) {
        return text::trim(id.get<std::string>());
    }
    if (id.is_number_integer()) {
        return std::to_string(id.get<int64_t>());
    }
    if (id.is_number_unsigned()) {
        return std::to_string(id.get<uint64_t>());
    }
    if (id.is_number_float()) {
        // Some servers echo integral ids back as 7.0.
        double value = id.get<double>();
        if (std::isfinite(value) && value >= -9.2e18 && value <= 9.2e18) {
            int64_t integral = static_cast<int64_t>(value);
            if (static_cast<double>(integral) == value) {
                return std::to_string(integral);
            }
        }
    }
    return text::trim(id.dump());
}

bool ids_match(const json &expected_id, const json &actual_id) {
    return id_to_string(expected_id) == id_to_string(actual_id);
}

bool parse_response(const json &message, Response &output_response) {
    if (!message.is_object()) {
        return false;
    }
    if (!message.contains("result") && !message.contains("error") && !message.contains("id")) {
        return false;
    }

    output_response = Response();
    output_response.id = get_id(message);

    if (message.contains("result")) {
        output_response.result = message["result"];
    }

    if (message.contains("error") && message["error"].is_object()) {
        const json &error_object = message["error"];
        output_response.has_error = true;
        if (error_object.contains("code") && error_object["code"].is_number_integer()) {
            output_response.error_code = error_object["code"].get<int>();
        }
        if (error_object.contains("message") && error_object["message"].is_string()) {
            output_response.error_message = error_object["message"].get<std::string>();
        }
    }

    return true;
}

} // namespace json_rpc
