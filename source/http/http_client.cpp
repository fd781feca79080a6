#include "http/http_client.hpp"
#include "utils/text.hpp"

namespace http_client {

void HttpRequest::set_header(const std::string &name, const std::string &value) {
    for (auto &existing : headers) {
        if (text::equals_ignore_case(existing.first, name)) {
            existing.second = value;
            return;
        }
    }
    headers.emplace_back(name, value);
}

std::string HttpRequest::header(const std::string &name) const {
    for (const auto &existing : headers) {
        if (text::equals_ignore_case(existing.first, name)) {
            return existing.second;
        }
    }
    return "";
}

std::string HttpResponse::header(const std::string &name) const {
    auto header_iterator = headers.find(text::to_lower(name));
    if (header_iterator == headers.end()) {
        return "";
    }
    return header_iterator->second;
}

std::string read_remaining_body(ResponseStream &stream, const call_context::CallContext &context) {
    std::string body;
    std::string chunk;
    std::string error_message;
    while (stream.read_some(chunk, context, error_message) == StreamReadStatus::Data) {
        body += chunk;
        chunk.clear();
    }
    return body;
}

} // namespace http_client
