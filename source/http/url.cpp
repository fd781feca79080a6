#include "http/url.hpp"
#include "utils/text.hpp"

#include <stdexcept>
#include <vector>

namespace url {

namespace {

// Generic RFC 3986 components; has_* flags distinguish "absent" from "empty".
struct Components {
    std::string scheme;
    bool has_authority = false;
    std::string authority;
    std::string path;
    bool has_query = false;
    std::string query;
};

Components split_components(const std::string &text) {
    Components components;
    std::string rest = text;

    size_t fragment_position = rest.find('#');
    if (fragment_position != std::string::npos) {
        rest.erase(fragment_position);
    }

    size_t colon_position = rest.find(':');
    size_t first_delimiter = rest.find_first_of("/?");
    if (colon_position != std::string::npos && colon_position > 0 &&
        (first_delimiter == std::string::npos || colon_position < first_delimiter)) {
        components.scheme = text::to_lower(rest.substr(0, colon_position));
        rest.erase(0, colon_position + 1);
    }

    if (text::starts_with(rest, "//")) {
        rest.erase(0, 2);
        size_t authority_end = rest.find_first_of("/?");
        components.has_authority = true;
        components.authority = rest.substr(0, authority_end);
        rest = (authority_end == std::string::npos) ? "" : rest.substr(authority_end);
    }

    size_t query_position = rest.find('?');
    if (query_position != std::string::npos) {
        components.has_query = true;
        components.query = rest.substr(query_position + 1);
        rest.erase(query_position);
    }
    components.path = rest;
    return components;
}

std::string remove_dot_segments(const std::string &path) {
    std::vector<std::string> segments;
    size_t start = 0;
    bool absolute = !path.empty() && path[0] == '/';
    if (absolute) {
        start = 1;
    }

    std::string last_segment;
    bool trailing_slash = false;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        std::string segment = path.substr(start, end == std::string::npos ? std::string::npos : end - start);
        bool is_last = (end == std::string::npos);

        if (segment == ".") {
            trailing_slash = is_last;
        } else if (segment == "..") {
            if (!segments.empty()) {
                segments.pop_back();
            }
            trailing_slash = is_last;
        } else {
            segments.push_back(segment);
            trailing_slash = false;
        }

        if (is_last) {
            break;
        }
        start = end + 1;
    }

    std::string output = absolute ? "/" : "";
    for (size_t index = 0; index < segments.size(); ++index) {
        if (index > 0) {
            output += "/";
        }
        output += segments[index];
    }
    if (trailing_slash && !segments.empty()) {
        output += "/";
    }
    return output;
}

std::string merge_paths(const Components &base, const std::string &reference_path) {
    if (base.has_authority && base.path.empty()) {
        return "/" + reference_path;
    }
    size_t last_slash = base.path.rfind('/');
    if (last_slash == std::string::npos) {
        return reference_path;
    }
    return base.path.substr(0, last_slash + 1) + reference_path;
}

std::string recompose(const Components &components) {
    std::string output;
    if (!components.scheme.empty()) {
        output += components.scheme + ":";
    }
    if (components.has_authority) {
        output += "//" + components.authority;
    }
    output += components.path;
    if (components.has_query) {
        output += "?" + components.query;
    }
    return output;
}

} // namespace

bool parse_endpoint(const std::string &text, Endpoint &output_endpoint, std::string &error_message) {
    Components components = split_components(text::trim(text));
    if (components.scheme != "http" && components.scheme != "https") {
        error_message = "unsupported url scheme in '" + text + "' (expected http or https)";
        return false;
    }
    if (!components.has_authority || components.authority.empty()) {
        error_message = "url '" + text + "' has no host";
        return false;
    }

    Endpoint endpoint;
    endpoint.scheme = components.scheme;
    endpoint.secure = (components.scheme == "https");
    endpoint.port = endpoint.secure ? 443 : 80;

    std::string host_and_port = components.authority;
    size_t at_position = host_and_port.rfind('@');
    if (at_position != std::string::npos) {
        host_and_port.erase(0, at_position + 1);
    }

    size_t colon_position = std::string::npos;
    if (!host_and_port.empty() && host_and_port[0] == '[') {
        // IPv6 literal: [::1]:8080
        size_t bracket_end = host_and_port.find(']');
        if (bracket_end == std::string::npos) {
            error_message = "url '" + text + "' has an unterminated IPv6 host";
            return false;
        }
        endpoint.host = host_and_port.substr(1, bracket_end - 1);
        if (bracket_end + 1 < host_and_port.size() && host_and_port[bracket_end + 1] == ':') {
            colon_position = bracket_end + 1;
        }
    } else {
        colon_position = host_and_port.find(':');
        endpoint.host = host_and_port.substr(0, colon_position);
    }

    if (colon_position != std::string::npos) {
        std::string port_text = host_and_port.substr(colon_position + 1);
        try {
            size_t consumed = 0;
            int port = std::stoi(port_text, &consumed);
            if (consumed != port_text.size() || port <= 0 || port > 65535) {
                error_message = "url '" + text + "' has an invalid port";
                return false;
            }
            endpoint.port = port;
        } catch (const std::exception &) {
            error_message = "url '" + text + "' has an invalid port";
            return false;
        }
    }

    if (endpoint.host.empty()) {
        error_message = "url '" + text + "' has no host";
        return false;
    }

    endpoint.path = components.path.empty() ? "/" : components.path;
    if (components.has_query) {
        endpoint.path += "?" + components.query;
    }

    output_endpoint = endpoint;
    return true;
}

std::string resolve_reference(const std::string &base_url, const std::string &reference) {
    Components base = split_components(text::trim(base_url));
    Components relative = split_components(text::trim(reference));
    Components target;

    if (!relative.scheme.empty()) {
        target = relative;
        target.path = remove_dot_segments(relative.path);
        return recompose(target);
    }

    target.scheme = base.scheme;
    if (relative.has_authority) {
        target.has_authority = true;
        target.authority = relative.authority;
        target.path = remove_dot_segments(relative.path);
        target.has_query = relative.has_query;
        target.query = relative.query;
        return recompose(target);
    }

    target.has_authority = base.has_authority;
    target.authority = base.authority;

    if (relative.path.empty()) {
        target.path = base.path;
        target.has_query = relative.has_query ? true : base.has_query;
        target.query = relative.has_query ? relative.query : base.query;
    } else {
        if (relative.path[0] == '/') {
            target.path = remove_dot_segments(relative.path);
        } else {
            target.path = remove_dot_segments(merge_paths(base, relative.path));
        }
        target.has_query = relative.has_query;
        target.query = relative.query;
    }
    return recompose(target);
}

} // namespace url
