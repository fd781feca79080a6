#include "mcp/mcp_types.hpp"
#include "utils/text.hpp"

namespace mcp {

TransportKind parse_transport_kind(const std::string &raw_transport) {
    std::string normalized = text::to_lower(text::trim(raw_transport));
    if (normalized.empty() || normalized == "streamablehttp" || normalized == "streamable_http" ||
        normalized == "streamable-http") {
        return TransportKind::StreamableHttp;
    }
    if (normalized == TRANSPORT_SSE) {
        return TransportKind::Sse;
    }
    if (normalized == TRANSPORT_STDIO) {
        return TransportKind::Stdio;
    }
    return TransportKind::Unknown;
}

std::string normalize_transport(const std::string &raw_transport) {
    TransportKind kind = parse_transport_kind(raw_transport);
    if (kind == TransportKind::Unknown) {
        return raw_transport;
    }
    return transport_name(kind);
}

const char *transport_name(TransportKind kind) {
    switch (kind) {
    case TransportKind::StreamableHttp:
        return TRANSPORT_STREAMABLE_HTTP;
    case TransportKind::Sse:
        return TRANSPORT_SSE;
    case TransportKind::Stdio:
        return TRANSPORT_STDIO;
    case TransportKind::Unknown:
        break;
    }
    return "unknown";
}

bool service_tool_enabled(const Service &service, const std::string &tool_name) {
    std::string trimmed_name = text::trim(tool_name);
    if (trimmed_name.empty()) {
        return false;
    }
    for (const auto &state : service.tool_states) {
        if (text::trim(state.name) == trimmed_name) {
            return state.enabled;
        }
    }
    return true;
}

const char *error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return "none";
    case ErrorKind::Transport:
        return "transport";
    case ErrorKind::Status:
        return "status";
    case ErrorKind::Rpc:
        return "rpc";
    case ErrorKind::Decode:
        return "decode";
    case ErrorKind::StreamExhausted:
        return "stream_exhausted";
    case ErrorKind::Session:
        return "session";
    case ErrorKind::InvalidService:
        return "invalid_service";
    }
    return "unknown";
}

} // namespace mcp
