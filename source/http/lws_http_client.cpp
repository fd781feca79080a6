#include "http/lws_http_client.hpp"
#include "http/url.hpp"
#include "utils/debug_log.hpp"
#include "utils/text.hpp"

#include <libwebsockets.h>
#include <cstring>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace lws_http_client {

namespace {

// Upper bound for a single lws_service() slice, so deadlines and cancellation
// are noticed promptly.
constexpr int SERVICE_SLICE_MILLISECONDS = 50;

// Response headers this client reads back. Custom (non-token) headers are
// looked up by lower-case name with the trailing colon lws expects.
const char SESSION_HEADER_LOOKUP[] = "mcp-session-id:";

// Per-exchange state, reachable from the lws callback through the connection user pointer.
struct ExchangeState {
    // Request.
    std::string method;
    url::Endpoint endpoint;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    bool body_written = false;

    // Progress.
    struct lws *connection = nullptr;
    bool established = false;
    bool completed = false;
    bool closed = false;
    bool failed = false;
    std::string error_message;

    // Response.
    int status_code = 0;
    std::map<std::string, std::string> response_headers;
    std::string received;
};

std::string copy_token_header(struct lws *connection, enum lws_token_indexes token) {
    int length = lws_hdr_total_length(connection, token);
    if (length <= 0) {
        return "";
    }
    std::vector<char> buffer(static_cast<size_t>(length) + 1);
    if (lws_hdr_copy(connection, buffer.data(), static_cast<int>(buffer.size()), token) < 0) {
        return "";
    }
    return std::string(buffer.data());
}

std::string copy_custom_header(struct lws *connection, const char *lookup_name) {
    int name_length = static_cast<int>(std::strlen(lookup_name));
    int length = lws_hdr_custom_length(connection, lookup_name, name_length);
    if (length <= 0) {
        return "";
    }
    std::vector<char> buffer(static_cast<size_t>(length) + 1);
    if (lws_hdr_custom_copy(connection, buffer.data(), static_cast<int>(buffer.size()), lookup_name, name_length) < 0) {
        return "";
    }
    return std::string(buffer.data());
}

int http_callback(struct lws *connection, enum lws_callback_reasons reason,
                  void *user_data, void *incoming_data, size_t incoming_length) {
    ExchangeState *state = static_cast<ExchangeState *>(user_data);
    if (state == nullptr) {
        return lws_callback_http_dummy(connection, reason, user_data, incoming_data, incoming_length);
    }

    switch (reason) {
    case LWS_CALLBACK_CLIENT_CONNECTION_ERROR: {
        const char *error_text = incoming_data ? static_cast<const char *>(incoming_data) : "unknown";
        state->failed = true;
        state->error_message = "connection error: " + std::string(error_text);
        state->connection = nullptr;
        break;
    }

    case LWS_CALLBACK_CLIENT_APPEND_HANDSHAKE_HEADER: {
        unsigned char **position = reinterpret_cast<unsigned char **>(incoming_data);
        unsigned char *end = (*position) + incoming_length;

        for (const auto &header : state->headers) {
            std::string name = text::to_lower(header.first) + ":";
            if (lws_add_http_header_by_name(connection,
                                            reinterpret_cast<const unsigned char *>(name.c_str()),
                                            reinterpret_cast<const unsigned char *>(header.second.c_str()),
                                            static_cast<int>(header.second.size()), position, end)) {
                state->failed = true;
                state->error_message = "request headers do not fit the lws buffer";
                return -1;
            }
        }

        if (!state->body.empty()) {
            std::string content_length = std::to_string(state->body.size());
            if (lws_add_http_header_by_name(connection,
                                            reinterpret_cast<const unsigned char *>("content-length:"),
                                            reinterpret_cast<const unsigned char *>(content_length.c_str()),
                                            static_cast<int>(content_length.size()), position, end)) {
                state->failed = true;
                state->error_message = "request headers do not fit the lws buffer";
                return -1;
            }
            lws_client_http_body_pending(connection, 1);
            lws_callback_on_writable(connection);
        }
        break;
    }

    case LWS_CALLBACK_CLIENT_HTTP_WRITEABLE: {
        if (state->body_written || state->body.empty()) {
            break;
        }
        // libwebsockets requires LWS_PRE bytes of padding before the data.
        std::vector<unsigned char> send_buffer(LWS_PRE + state->body.size());
        std::memcpy(send_buffer.data() + LWS_PRE, state->body.data(), state->body.size());
        int bytes_written = lws_write(connection, send_buffer.data() + LWS_PRE,
                                      state->body.size(), LWS_WRITE_HTTP_FINAL);
        if (bytes_written < static_cast<int>(state->body.size())) {
            state->failed = true;
            state->error_message = "failed to write request body";
            return -1;
        }
        state->body_written = true;
        lws_client_http_body_pending(connection, 0);
        break;
    }

    case LWS_CALLBACK_ESTABLISHED_CLIENT_HTTP: {
        state->status_code = static_cast<int>(lws_http_client_http_response(connection));
        std::string content_type = copy_token_header(connection, WSI_TOKEN_HTTP_CONTENT_TYPE);
        if (!content_type.empty()) {
            state->response_headers["content-type"] = content_type;
        }
        std::string session_id = copy_custom_header(connection, SESSION_HEADER_LOOKUP);
        if (!session_id.empty()) {
            state->response_headers["mcp-session-id"] = session_id;
        }
        state->established = true;
        break;
    }

    case LWS_CALLBACK_RECEIVE_CLIENT_HTTP_READ:
        state->received.append(static_cast<const char *>(incoming_data), incoming_length);
        break;

    case LWS_CALLBACK_RECEIVE_CLIENT_HTTP: {
        char read_buffer[4096 + LWS_PRE];
        char *read_pointer = read_buffer + LWS_PRE;
        int read_length = static_cast<int>(sizeof(read_buffer) - LWS_PRE);
        if (lws_http_client_read(connection, &read_pointer, &read_length) < 0) {
            return -1;
        }
        return 0;
    }

    case LWS_CALLBACK_COMPLETED_CLIENT_HTTP:
        state->completed = true;
        break;

    case LWS_CALLBACK_CLOSED_CLIENT_HTTP:
        state->closed = true;
        state->connection = nullptr;
        break;

    default:
        break;
    }

    return 0;
}

const struct lws_protocols http_protocols[] = {
    {
        "mcplink-http",
        http_callback,
        0,    // per-session data size; the exchange state is passed as userdata
        4096, // rx buffer size
    },
    {nullptr, nullptr, 0, 0} // sentinel
};

struct ContextDeleter {
    void operator()(struct lws_context *context) const {
        if (context != nullptr) {
            lws_context_destroy(context);
        }
    }
};
using ContextHandle = std::unique_ptr<struct lws_context, ContextDeleter>;

void quiet_library_logging() {
    static std::once_flag once;
    std::call_once(once, []() {
        lws_set_log_level(LLL_ERR, nullptr);
    });
}

// Creates a context and starts the connection. On failure the state carries the reason.
ContextHandle start_exchange(ExchangeState &state) {
    quiet_library_logging();

    struct lws_context_creation_info context_info;
    std::memset(&context_info, 0, sizeof(context_info));
    context_info.port = CONTEXT_PORT_NO_LISTEN; // Client mode, no listening.
    context_info.protocols = http_protocols;
    context_info.gid = -1;
    context_info.uid = -1;
    context_info.options = LWS_SERVER_OPTION_DO_SSL_GLOBAL_INIT;

    ContextHandle context(lws_create_context(&context_info));
    if (!context) {
        state.failed = true;
        state.error_message = "failed to create libwebsockets context";
        return context;
    }

    struct lws_client_connect_info connect_info;
    std::memset(&connect_info, 0, sizeof(connect_info));
    connect_info.context = context.get();
    connect_info.address = state.endpoint.host.c_str();
    connect_info.port = state.endpoint.port;
    connect_info.path = state.endpoint.path.c_str();
    connect_info.host = state.endpoint.host.c_str();
    connect_info.method = state.method.c_str();
    connect_info.protocol = http_protocols[0].name;
    connect_info.alpn = "http/1.1";
    connect_info.ssl_connection = state.endpoint.secure ? LCCSCF_USE_SSL : 0;
    connect_info.userdata = &state;
    connect_info.pwsi = &state.connection;

    debug_log::log("http " + state.method + " " + state.endpoint.scheme + "://" + state.endpoint.host + ":" +
                   std::to_string(state.endpoint.port) + state.endpoint.path);

    if (lws_client_connect_via_info(&connect_info) == nullptr && !state.failed) {
        state.failed = true;
        state.error_message = "lws_client_connect_via_info failed for " + state.endpoint.host;
    }
    return context;
}

bool prepare_state(const http_client::HttpRequest &request, ExchangeState &state) {
    std::string parse_error;
    if (!url::parse_endpoint(request.url, state.endpoint, parse_error)) {
        state.failed = true;
        state.error_message = parse_error;
        return false;
    }
    state.method = text::to_lower(request.method) == "post" ? "POST" : "GET";
    state.headers = request.headers;
    state.body = request.body;
    return true;
}

// Services the context until predicate() holds, the exchange fails, or the call context is done.
template <typename Predicate>
void service_until(struct lws_context *context, ExchangeState &state,
                   const call_context::CallContext &call, Predicate predicate) {
    while (!predicate() && !state.failed) {
        if (call.is_done()) {
            state.failed = true;
            state.error_message = call.done_reason();
            return;
        }
        lws_service(context, call.next_slice_milliseconds(SERVICE_SLICE_MILLISECONDS));
    }
}

class LwsResponseStream : public http_client::ResponseStream {
public:
    LwsResponseStream(std::unique_ptr<ExchangeState> state, ContextHandle context)
        : state_(std::move(state)), context_(std::move(context)) {}

    int status_code() const override {
        return state_->status_code;
    }

    std::string header(const std::string &name) const override {
        auto header_iterator = state_->response_headers.find(text::to_lower(name));
        if (header_iterator == state_->response_headers.end()) {
            return "";
        }
        return header_iterator->second;
    }

    http_client::StreamReadStatus read_some(std::string &output_chunk,
                                            const call_context::CallContext &context,
                                            std::string &error_message) override {
        while (true) {
            if (!state_->received.empty()) {
                output_chunk = std::move(state_->received);
                state_->received.clear();
                return http_client::StreamReadStatus::Data;
            }
            if (state_->completed || state_->closed) {
                return http_client::StreamReadStatus::EndOfStream;
            }
            if (state_->failed) {
                error_message = state_->error_message;
                return http_client::StreamReadStatus::Failed;
            }
            if (context.is_done()) {
                error_message = context.done_reason();
                return http_client::StreamReadStatus::Failed;
            }
            lws_service(context_.get(), context.next_slice_milliseconds(SERVICE_SLICE_MILLISECONDS));
        }
    }

private:
    // Declared before context_ so the context (whose teardown fires callbacks
    // into the state) is destroyed first.
    std::unique_ptr<ExchangeState> state_;
    ContextHandle context_;
};

class LwsHttpClient : public http_client::HttpClient {
public:
    http_client::HttpResponse send(const http_client::HttpRequest &request,
                                   const call_context::CallContext &context) override {
        http_client::HttpResponse response;
        ExchangeState state;
        if (!prepare_state(request, state)) {
            response.error_message = state.error_message;
            return response;
        }

        ContextHandle lws_context = start_exchange(state);
        if (lws_context) {
            service_until(lws_context.get(), state, context,
                          [&state]() { return state.completed || state.closed; });
        }

        if (!state.established) {
            response.error_message = state.failed ? state.error_message
                                                  : "connection closed before a response was received";
            return response;
        }
        if (state.failed && !state.completed) {
            // Headers arrived but the body did not finish.
            response.error_message = "read response body: " + state.error_message;
            return response;
        }

        response.success = true;
        response.status_code = state.status_code;
        response.headers = state.response_headers;
        response.body = std::move(state.received);
        return response;
    }

    http_client::StreamOpenResult open_stream(const http_client::HttpRequest &request,
                                              const call_context::CallContext &context) override {
        http_client::StreamOpenResult result;
        std::unique_ptr<ExchangeState> state(new ExchangeState());
        if (!prepare_state(request, *state)) {
            result.error_message = state->error_message;
            return result;
        }

        ContextHandle lws_context = start_exchange(*state);
        if (!lws_context) {
            result.error_message = state->error_message;
            return result;
        }

        ExchangeState &state_reference = *state;
        service_until(lws_context.get(), state_reference, context,
                      [&state_reference]() { return state_reference.established || state_reference.closed; });

        if (!state->established) {
            result.error_message = state->failed ? state->error_message
                                                 : "connection closed before a response was received";
            return result;
        }

        result.success = true;
        result.stream.reset(new LwsResponseStream(std::move(state), std::move(lws_context)));
        return result;
    }
};

} // namespace

std::shared_ptr<http_client::HttpClient> create() {
    return std::make_shared<LwsHttpClient>();
}

} // namespace lws_http_client
