#include "registry/tool_registry.hpp"
#include "utils/debug_log.hpp"
#include "utils/text.hpp"

#include <algorithm>
#include <utility>

namespace registry {

static bool is_name_character(unsigned char character) {
    return (character >= 'a' && character <= 'z') || (character >= 'A' && character <= 'Z') ||
           (character >= '0' && character <= '9') || character == '-' || character == '_';
}

std::string sanitize_name(const std::string &raw_name) {
    std::string trimmed = text::trim(raw_name);
    std::string sanitized;
    sanitized.reserve(trimmed.size());

    size_t position = 0;
    while (position < trimmed.size()) {
        unsigned char character = static_cast<unsigned char>(trimmed[position]);
        if (character < 0x80) {
            sanitized += is_name_character(character) ? static_cast<char>(character) : '_';
            position++;
            continue;
        }
        size_t sequence_length = text::utf8_sequence_length(character);
        if (sequence_length == 0 || position + sequence_length > trimmed.size()) {
            sequence_length = 1;
        }
        sanitized += '_';
        position += sequence_length;
    }

    size_t first = sanitized.find_first_not_of('_');
    if (first == std::string::npos) {
        return "tool";
    }
    size_t last = sanitized.find_last_not_of('_');
    return sanitized.substr(first, last - first + 1);
}

bool parse_tool_arguments(const std::string &arguments_text, json &output_arguments, std::string &error_message) {
    std::string trimmed = text::trim(arguments_text);
    if (trimmed.empty()) {
        output_arguments = json::object();
        return true;
    }

    json parsed;
    try {
        parsed = json::parse(trimmed);
    } catch (const json::parse_error &error) {
        error_message = error.what();
        return false;
    }

    if (parsed.is_null()) {
        output_arguments = json::object();
        return true;
    }
    if (!parsed.is_object()) {
        error_message = "arguments must be a JSON object";
        return false;
    }
    output_arguments = std::move(parsed);
    return true;
}

std::string render_tool_result(const mcp::ToolCallResult &result) {
    std::string rendered;
    bool has_text = false;
    for (const auto &part : result.content) {
        if (!text::equals_ignore_case(part.type, "text") || text::trim(part.text).empty()) {
            continue;
        }
        if (has_text) {
            rendered += "\n";
        }
        rendered += part.text;
        has_text = true;
    }
    if (has_text) {
        return rendered;
    }

    if (!result.structured_content.is_null()) {
        return result.structured_content.dump(-1, ' ', false, json::error_handler_t::replace);
    }
    if (result.raw.is_null()) {
        return "{}";
    }
    return result.raw.dump(-1, ' ', false, json::error_handler_t::replace);
}

const char *call_error_kind_name(CallErrorKind kind) {
    switch (kind) {
    case CallErrorKind::None:
        return "none";
    case CallErrorKind::UnknownTool:
        return "unknown_tool";
    case CallErrorKind::ServiceNotFound:
        return "service_not_found";
    case CallErrorKind::ServiceDisabled:
        return "service_disabled";
    case CallErrorKind::ToolDisabled:
        return "tool_disabled";
    case CallErrorKind::InvalidArguments:
        return "invalid_arguments";
    case CallErrorKind::ToolReportedError:
        return "tool_error";
    case CallErrorKind::ClientError:
        return "client_error";
    }
    return "unknown";
}

static ToolDefinition to_tool_definition(const mcp::Service &service, const mcp::RemoteTool &tool) {
    ToolDefinition definition;
    definition.name = sanitize_name(service.id) + "__" + sanitize_name(tool.name);

    std::string description = text::trim(tool.description);
    if (description.empty()) {
        description = "MCP tool";
    }
    definition.description = "[MCP " + service.name + "] " + description;

    if (tool.input_schema.is_null()) {
        definition.input_schema = {{"type", "object"}, {"properties", json::object()}};
    } else {
        definition.input_schema = tool.input_schema;
    }
    return definition;
}

static ToolCallOutcome call_failure(CallErrorKind kind, const std::string &message) {
    ToolCallOutcome outcome;
    outcome.error_kind = kind;
    outcome.error_message = message;
    return outcome;
}

ToolRegistry::ToolRegistry(std::shared_ptr<ServiceDirectory> directory, std::shared_ptr<mcp::ToolClient> client,
                           RegistryOptions options, NowFunction now)
    : directory_(std::move(directory)), client_(std::move(client)), options_(options), now_(std::move(now)) {
    if (!now_) {
        now_ = [] { return Clock::now(); };
    }
    if (options_.cache_ttl <= std::chrono::milliseconds::zero()) {
        options_.cache_ttl = std::chrono::seconds(30);
    }
    if (options_.call_timeout <= std::chrono::milliseconds::zero()) {
        options_.call_timeout = std::chrono::seconds(20);
    }
    cache_deadline_ = Clock::time_point();
}

std::vector<ToolDefinition> ToolRegistry::list_tools(const call_context::CallContext &context) {
    {
        std::lock_guard<std::mutex> guard(mutex_);
        if (!cached_tools_.empty() && now_() < cache_deadline_) {
            return cached_tools_;
        }
    }
    return refresh_tools(context);
}

std::vector<ToolDefinition> ToolRegistry::refresh_tools(const call_context::CallContext &context) {
    std::vector<ToolDefinition> definitions;
    std::map<std::string, ToolBinding> bindings;

    for (const auto &service : directory_->list_enabled_services()) {
        mcp::ListToolsResult listed = client_->list_tools(service, call_context_for(context));
        if (!listed.success) {
            debug_log::log("refresh: skipping service \"" + service.id + "\": " + listed.error.message);
            continue;
        }

        for (const auto &tool : listed.tools) {
            if (!directory_->is_tool_enabled(service.id, tool.name)) {
                continue;
            }
            ToolDefinition definition = to_tool_definition(service, tool);
            std::string exposed_name = definition.name;
            for (int suffix = 2; bindings.count(exposed_name) != 0; suffix++) {
                exposed_name = definition.name + "_" + std::to_string(suffix);
            }
            definition.name = exposed_name;

            ToolBinding binding;
            binding.service_id = service.id;
            binding.tool_name = tool.name;
            bindings[exposed_name] = binding;
            definitions.push_back(std::move(definition));
        }
    }

    std::sort(definitions.begin(), definitions.end(),
              [](const ToolDefinition &left, const ToolDefinition &right) { return left.name < right.name; });

    debug_log::log("refresh: " + std::to_string(definitions.size()) + " tools exposed");

    std::lock_guard<std::mutex> guard(mutex_);
    cached_tools_ = definitions;
    bindings_ = std::move(bindings);
    cache_deadline_ = now_() + options_.cache_ttl;
    return definitions;
}

ToolCallOutcome ToolRegistry::call_tool(const ToolCall &call, const call_context::CallContext &context) {
    ToolBinding binding;
    if (!lookup_binding(call.name, binding)) {
        refresh_tools(context);
        if (!lookup_binding(call.name, binding)) {
            return call_failure(CallErrorKind::UnknownTool, "unknown tool \"" + call.name + "\"");
        }
    }

    mcp::Service service;
    if (!directory_->find_service(binding.service_id, service)) {
        return call_failure(CallErrorKind::ServiceNotFound, "mcp service \"" + binding.service_id + "\" not found");
    }
    if (!service.enabled) {
        return call_failure(CallErrorKind::ServiceDisabled, "mcp service \"" + binding.service_id + "\" is disabled");
    }
    if (!directory_->is_tool_enabled(binding.service_id, binding.tool_name)) {
        return call_failure(CallErrorKind::ToolDisabled, "mcp service \"" + binding.service_id + "\" tool \"" +
                                                             binding.tool_name + "\" is disabled");
    }

    json arguments;
    std::string argument_error;
    if (!parse_tool_arguments(call.arguments, arguments, argument_error)) {
        return call_failure(CallErrorKind::InvalidArguments,
                            "invalid tool arguments for \"" + call.name + "\": " + argument_error);
    }

    mcp::CallToolResult called = client_->call_tool(service, binding.tool_name, arguments, call_context_for(context));
    if (!called.success) {
        ToolCallOutcome outcome = call_failure(CallErrorKind::ClientError, called.error.message);
        outcome.client_error_kind = called.error.kind;
        return outcome;
    }

    std::string rendered = render_tool_result(called.result);
    if (called.result.is_error) {
        return call_failure(CallErrorKind::ToolReportedError, text::trim(rendered));
    }

    ToolCallOutcome outcome;
    outcome.success = true;
    outcome.output = rendered;
    return outcome;
}

std::vector<ServiceStatus> ToolRegistry::list_service_statuses(const call_context::CallContext &context) {
    std::vector<ServiceStatus> statuses;

    for (const auto &service : directory_->list_services()) {
        ServiceStatus status;
        status.service = service;

        if (!service.enabled) {
            status.last_error = "disabled";
            statuses.push_back(std::move(status));
            continue;
        }

        mcp::ListToolsResult listed = client_->list_tools(service, call_context_for(context));
        if (!listed.success) {
            status.last_error = listed.error.message;
            statuses.push_back(std::move(status));
            continue;
        }

        status.connected = true;
        for (const auto &tool : listed.tools) {
            ToolStatus tool_status;
            tool_status.name = tool.name;
            tool_status.description = text::trim(tool.description);
            tool_status.enabled = directory_->is_tool_enabled(service.id, tool.name);
            if (tool_status.enabled) {
                status.enabled_tool_count++;
            }
            status.tools.push_back(std::move(tool_status));
        }
        std::sort(status.tools.begin(), status.tools.end(),
                  [](const ToolStatus &left, const ToolStatus &right) { return left.name < right.name; });
        statuses.push_back(std::move(status));
    }

    std::sort(statuses.begin(), statuses.end(), [](const ServiceStatus &left, const ServiceStatus &right) {
        return left.service.id < right.service.id;
    });
    return statuses;
}

void ToolRegistry::invalidate_cache() {
    std::lock_guard<std::mutex> guard(mutex_);
    cache_deadline_ = Clock::time_point();
}

call_context::CallContext ToolRegistry::call_context_for(const call_context::CallContext &context) const {
    return context.narrowed(options_.call_timeout);
}

bool ToolRegistry::lookup_binding(const std::string &exposed_name, ToolBinding &output_binding) const {
    std::lock_guard<std::mutex> guard(mutex_);
    auto binding_iterator = bindings_.find(exposed_name);
    if (binding_iterator == bindings_.end()) {
        return false;
    }
    output_binding = binding_iterator->second;
    return true;
}

} // namespace registry
