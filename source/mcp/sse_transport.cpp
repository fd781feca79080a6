#include "mcp/sse_transport.hpp"
#include "http/url.hpp"
#include "protocol/event_stream.hpp"
#include "protocol/reply_decoder.hpp"
#include "utils/debug_log.hpp"
#include "utils/text.hpp"

#include <utility>

namespace mcp {

namespace {

enum class EventReadStatus {
    Event,
    EndOfStream,
    Failed,
};

// Pulls parsed events out of an open response stream.
class StreamEventReader {
public:
    explicit StreamEventReader(http_client::ResponseStream &stream) : stream_(stream) {}

    EventReadStatus next(event_stream::Event &output_event, const call_context::CallContext &context,
                         std::string &error_message) {
        while (true) {
            if (parser_.next_event(output_event)) {
                return EventReadStatus::Event;
            }
            if (ended_) {
                return parser_.finish(output_event) ? EventReadStatus::Event : EventReadStatus::EndOfStream;
            }

            std::string chunk;
            http_client::StreamReadStatus status = stream_.read_some(chunk, context, error_message);
            if (status == http_client::StreamReadStatus::Failed) {
                return EventReadStatus::Failed;
            }
            if (status == http_client::StreamReadStatus::EndOfStream) {
                ended_ = true;
                continue;
            }
            parser_.feed(chunk);
        }
    }

private:
    http_client::ResponseStream &stream_;
    event_stream::Parser parser_;
    bool ended_ = false;
};

} // namespace

SseTransport::SseTransport(std::shared_ptr<http_client::HttpClient> http, std::string protocol_version)
    : http_(std::move(http)), protocol_version_(std::move(protocol_version)) {}

RpcExchange SseTransport::send(const Service &service, const std::string &session_id, const json &message,
                               bool expect_response, const call_context::CallContext &context) {
    RpcExchange exchange;
    std::string service_url = text::trim(service.endpoint);

    http_client::HttpRequest stream_request;
    stream_request.method = "GET";
    stream_request.url = service_url;
    stream_request.set_header("Accept", "text/event-stream");
    apply_service_headers(stream_request, service, session_id, protocol_version_);

    http_client::StreamOpenResult opened = http_->open_stream(stream_request, context);
    if (!opened.success) {
        exchange.error = make_error(ErrorKind::Transport, "open sse stream: " + opened.error_message);
        return exchange;
    }
    http_client::ResponseStream &stream = *opened.stream;
    if (stream.status_code() >= 400) {
        exchange.error = status_error(stream.status_code(), http_client::read_remaining_body(stream, context));
        return exchange;
    }

    StreamEventReader reader(stream);
    event_stream::Event event;
    std::string read_error;
    std::string post_url = service_url;

    while (true) {
        EventReadStatus status = reader.next(event, context, read_error);
        if (status == EventReadStatus::Failed) {
            exchange.error = make_error(ErrorKind::Transport, "read sse endpoint: " + read_error);
            return exchange;
        }
        if (status == EventReadStatus::EndOfStream) {
            debug_log::log("sse: stream ended without endpoint event, posting to " + service_url);
            break;
        }
        if (!text::equals_ignore_case(text::trim(event.name), "endpoint")) {
            continue;
        }
        std::string announced = text::trim(event.data);
        if (announced.empty()) {
            exchange.error = make_error(ErrorKind::Decode, "decode rpc response: empty sse endpoint event");
            return exchange;
        }
        post_url = url::resolve_reference(service_url, announced);
        break;
    }

    http_client::HttpRequest post_request;
    post_request.method = "POST";
    post_request.url = post_url;
    post_request.body = message.dump();
    post_request.set_header("Content-Type", "application/json");
    post_request.set_header("Accept", "application/json, text/event-stream");
    apply_service_headers(post_request, service, session_id, protocol_version_);

    http_client::HttpResponse post_response = http_->send(post_request, context);
    if (!post_response.success) {
        exchange.error = make_error(ErrorKind::Transport, "send rpc request: " + post_response.error_message);
        return exchange;
    }
    if (post_response.status_code >= 400) {
        exchange.error = status_error(post_response.status_code, post_response.body);
        return exchange;
    }

    std::string response_session = text::trim(post_response.header(HEADER_SESSION_ID));
    if (response_session.empty()) {
        response_session = text::trim(stream.header(HEADER_SESSION_ID));
    }

    if (!expect_response) {
        exchange.success = true;
        exchange.session_id = response_session;
        return exchange;
    }

    json request_id = json_rpc::get_id(message);

    json_rpc::Response decoded;
    std::string decode_error;
    if (!text::trim(post_response.body).empty() &&
        reply_decoder::decode_body(post_response.body, post_response.header("Content-Type"), request_id, decoded,
                                   decode_error)) {
        return exchange_from_response(decoded, response_session);
    }

    while (true) {
        EventReadStatus status = reader.next(event, context, read_error);
        if (status == EventReadStatus::Failed) {
            exchange.error = make_error(ErrorKind::Transport, "read sse event: " + read_error);
            return exchange;
        }
        if (status == EventReadStatus::EndOfStream) {
            exchange.error = make_error(ErrorKind::StreamExhausted,
                                        "decode rpc response: sse stream ended before response id " +
                                            json_rpc::id_to_string(request_id));
            return exchange;
        }
        if (reply_decoder::decode_event_data(event.data, request_id, decoded)) {
            return exchange_from_response(decoded, response_session);
        }
    }
}

} // namespace mcp
