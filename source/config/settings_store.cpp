#include "config/settings_store.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"
#include "utils/text.hpp"

#include <algorithm>
#include <ctime>
#include <map>
#include <set>
#include <utility>

namespace settings {

static bool is_identifier_character(char character) {
    return (character >= 'a' && character <= 'z') || (character >= 'A' && character <= 'Z') ||
           (character >= '0' && character <= '9') || character == '_' || character == '-';
}

std::string sanitize_identifier(const std::string &input) {
    std::string trimmed = text::trim(input);
    std::string identifier;
    bool last_was_dash = false;

    for (char character : trimmed) {
        if (character >= 'A' && character <= 'Z') {
            identifier += static_cast<char>(character - 'A' + 'a');
            last_was_dash = false;
        } else if ((character >= 'a' && character <= 'z') || (character >= '0' && character <= '9')) {
            identifier += character;
            last_was_dash = false;
        } else if (!identifier.empty() && !last_was_dash) {
            identifier += '-';
            last_was_dash = true;
        }
    }

    while (!identifier.empty() && identifier.back() == '-') {
        identifier.pop_back();
    }
    return identifier;
}

static std::string generate_unique_id(const std::vector<mcp::Service> &existing, const std::string &name,
                                      const std::string &endpoint) {
    std::set<std::string> used_ids;
    for (const auto &service : existing) {
        used_ids.insert(service.id);
    }

    std::string base = sanitize_identifier(name);
    if (base.empty()) {
        base = sanitize_identifier(endpoint);
    }
    if (base.empty()) {
        base = "service";
    }
    if (used_ids.count(base) == 0) {
        return base;
    }
    for (int suffix = 2;; suffix++) {
        std::string candidate = base + "-" + std::to_string(suffix);
        if (used_ids.count(candidate) == 0) {
            return candidate;
        }
    }
}

std::vector<mcp::ToolOverride> normalize_tool_states(const std::vector<mcp::ToolOverride> &states) {
    std::map<std::string, mcp::ToolOverride> by_name;
    for (const auto &state : states) {
        std::string name = text::trim(state.name);
        if (name.empty()) {
            continue;
        }
        if (state.enabled) {
            by_name.erase(name);
            continue;
        }
        mcp::ToolOverride normalized = state;
        normalized.name = name;
        normalized.enabled = false;
        by_name[name] = normalized;
    }

    std::vector<mcp::ToolOverride> normalized_states;
    for (const auto &entry : by_name) {
        normalized_states.push_back(entry.second);
    }
    return normalized_states;
}

std::string validate_service(const mcp::Service &service) {
    if (service.id.empty()) {
        return "service id is required";
    }
    if (!std::all_of(service.id.begin(), service.id.end(), is_identifier_character)) {
        return "service id must match [a-zA-Z0-9_-]+";
    }

    switch (mcp::parse_transport_kind(service.transport)) {
    case mcp::TransportKind::StreamableHttp:
    case mcp::TransportKind::Sse:
        if (service.endpoint.empty()) {
            return "service endpoint is required";
        }
        if (!text::starts_with(service.endpoint, "http://") && !text::starts_with(service.endpoint, "https://")) {
            return "service endpoint must start with http:// or https://";
        }
        break;
    case mcp::TransportKind::Stdio:
        if (text::trim(service.command).empty()) {
            return "stdio service command is required";
        }
        break;
    case mcp::TransportKind::Unknown:
        return "service transport must be streamable_http, sse or stdio";
    }

    for (const auto &state : service.tool_states) {
        if (text::trim(state.name).empty()) {
            return "service tool state name is required";
        }
    }
    return "";
}

std::string utc_timestamp_now() {
    std::time_t now = std::time(nullptr);
    std::tm utc_time{};
    gmtime_r(&now, &utc_time);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc_time);
    return buffer;
}

json service_to_json(const mcp::Service &service) {
    json record;
    record["id"] = service.id;
    record["name"] = service.name;
    record["endpoint"] = service.endpoint;
    record["transport"] = service.transport;
    if (!service.command.empty()) {
        record["command"] = service.command;
    }
    if (!service.args.empty()) {
        record["args"] = service.args;
    }
    if (!service.auth_token.empty()) {
        record["auth_token"] = service.auth_token;
    }
    record["enabled"] = service.enabled;
    if (!service.tool_states.empty()) {
        json states = json::array();
        for (const auto &state : service.tool_states) {
            json state_record;
            state_record["name"] = state.name;
            state_record["enabled"] = state.enabled;
            if (!state.updated_at.empty()) {
                state_record["updated_at"] = state.updated_at;
            }
            states.push_back(state_record);
        }
        record["tool_states"] = states;
    }
    record["updated_at"] = service.updated_at;
    return record;
}

static bool read_string_field(const json &record, const char *key, std::string &output, std::string &error_message) {
    if (!record.contains(key) || record[key].is_null()) {
        return true;
    }
    if (!record[key].is_string()) {
        error_message = std::string("field '") + key + "' must be a string";
        return false;
    }
    output = record[key].get<std::string>();
    return true;
}

static bool read_bool_field(const json &record, const char *key, bool &output, std::string &error_message) {
    if (!record.contains(key) || record[key].is_null()) {
        return true;
    }
    if (!record[key].is_boolean()) {
        error_message = std::string("field '") + key + "' must be a boolean";
        return false;
    }
    output = record[key].get<bool>();
    return true;
}

bool service_from_json(const json &record, mcp::Service &output_service, std::string &error_message) {
    if (!record.is_object()) {
        error_message = "service record must be an object";
        return false;
    }

    mcp::Service service;
    if (!read_string_field(record, "id", service.id, error_message) ||
        !read_string_field(record, "name", service.name, error_message) ||
        !read_string_field(record, "endpoint", service.endpoint, error_message) ||
        !read_string_field(record, "transport", service.transport, error_message) ||
        !read_string_field(record, "command", service.command, error_message) ||
        !read_string_field(record, "auth_token", service.auth_token, error_message) ||
        !read_bool_field(record, "enabled", service.enabled, error_message) ||
        !read_string_field(record, "updated_at", service.updated_at, error_message)) {
        return false;
    }

    if (record.contains("args") && !record["args"].is_null()) {
        if (!record["args"].is_array()) {
            error_message = "field 'args' must be an array of strings";
            return false;
        }
        for (const auto &argument : record["args"]) {
            if (!argument.is_string()) {
                error_message = "field 'args' must be an array of strings";
                return false;
            }
            service.args.push_back(argument.get<std::string>());
        }
    }

    if (record.contains("tool_states") && !record["tool_states"].is_null()) {
        if (!record["tool_states"].is_array()) {
            error_message = "field 'tool_states' must be an array";
            return false;
        }
        for (const auto &state_record : record["tool_states"]) {
            if (!state_record.is_object()) {
                error_message = "tool state must be an object";
                return false;
            }
            mcp::ToolOverride state;
            if (!read_string_field(state_record, "name", state.name, error_message) ||
                !read_bool_field(state_record, "enabled", state.enabled, error_message) ||
                !read_string_field(state_record, "updated_at", state.updated_at, error_message)) {
                return false;
            }
            service.tool_states.push_back(state);
        }
    }

    output_service = std::move(service);
    return true;
}

OpenResult SettingsStore::open(const std::string &file_path) {
    OpenResult result;
    if (text::trim(file_path).empty()) {
        result.error_message = "settings file path is required";
        return result;
    }

    std::shared_ptr<SettingsStore> store(new SettingsStore(file_path));
    StoreResult loaded = store->load();
    if (!loaded.success) {
        result.error_message = loaded.error_message;
        return result;
    }

    result.success = true;
    result.store = store;
    return result;
}

SettingsStore::SettingsStore(std::string file_path) : file_path_(std::move(file_path)) {}

StoreResult SettingsStore::load() {
    std::lock_guard<std::mutex> guard(mutex_);
    StoreResult result;

    std::string contents;
    if (!platform::read_file_contents(file_path_, contents)) {
        if (platform::file_exists(file_path_)) {
            result.error_message = "read settings file: cannot read " + file_path_;
            return result;
        }
        debug_log::log("settings: creating " + file_path_);
        document_ = json::object();
        services_.clear();
        return persist_locked();
    }

    json document = json::object();
    if (!text::trim(contents).empty()) {
        try {
            document = json::parse(contents);
        } catch (const json::parse_error &error) {
            result.error_message = std::string("decode settings file: ") + error.what();
            return result;
        }
    }
    if (!document.is_object()) {
        result.error_message = "decode settings file: top-level value must be an object";
        return result;
    }

    std::vector<mcp::Service> services;
    if (document.contains("mcp") && document["mcp"].is_object() && document["mcp"].contains("services") &&
        !document["mcp"]["services"].is_null()) {
        const json &records = document["mcp"]["services"];
        if (!records.is_array()) {
            result.error_message = "decode settings file: mcp.services must be an array";
            return result;
        }
        for (const auto &record : records) {
            mcp::Service service;
            std::string record_error;
            if (!service_from_json(record, service, record_error)) {
                result.error_message = "decode settings file: " + record_error;
                return result;
            }
            service.transport = mcp::normalize_transport(service.transport);
            service.tool_states = normalize_tool_states(service.tool_states);
            std::string validation_error = validate_service(service);
            if (!validation_error.empty()) {
                result.error_message = "invalid mcp service \"" + service.id + "\": " + validation_error;
                return result;
            }
            services.push_back(std::move(service));
        }
    } else if (document.contains("mcp") && !document["mcp"].is_null() && !document["mcp"].is_object()) {
        result.error_message = "decode settings file: mcp must be an object";
        return result;
    }

    document_ = std::move(document);
    services_ = std::move(services);
    debug_log::log("settings: loaded " + std::to_string(services_.size()) + " services from " + file_path_);
    result.success = true;
    return result;
}

StoreResult SettingsStore::persist_locked() {
    StoreResult result;

    json records = json::array();
    for (const auto &service : services_) {
        records.push_back(service_to_json(service));
    }
    if (!document_.contains("mcp") || !document_["mcp"].is_object()) {
        document_["mcp"] = json::object();
    }
    document_["mcp"]["services"] = records;

    std::string write_error;
    std::string contents = document_.dump(2, ' ', false, json::error_handler_t::replace) + "\n";
    if (!platform::write_file_atomically(file_path_, contents, write_error)) {
        result.error_message = "write settings file: " + write_error;
        return result;
    }
    result.success = true;
    return result;
}

std::vector<mcp::Service> SettingsStore::list_services() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return services_;
}

std::vector<mcp::Service> SettingsStore::list_enabled_services() const {
    std::lock_guard<std::mutex> guard(mutex_);
    std::vector<mcp::Service> enabled_services;
    for (const auto &service : services_) {
        if (service.enabled) {
            enabled_services.push_back(service);
        }
    }
    return enabled_services;
}

bool SettingsStore::find_service(const std::string &service_id, mcp::Service &output_service) const {
    std::string trimmed_id = text::trim(service_id);
    std::lock_guard<std::mutex> guard(mutex_);
    for (const auto &service : services_) {
        if (service.id == trimmed_id) {
            output_service = service;
            return true;
        }
    }
    return false;
}

bool SettingsStore::is_tool_enabled(const std::string &service_id, const std::string &tool_name) const {
    std::string trimmed_id = text::trim(service_id);
    if (trimmed_id.empty() || text::trim(tool_name).empty()) {
        return false;
    }
    std::lock_guard<std::mutex> guard(mutex_);
    for (const auto &service : services_) {
        if (service.id == trimmed_id) {
            return mcp::service_tool_enabled(service, tool_name);
        }
    }
    return false;
}

std::string SettingsStore::find_id_by_endpoint_locked(const std::string &endpoint) const {
    if (endpoint.empty()) {
        return "";
    }
    for (const auto &existing : services_) {
        if (text::trim(existing.endpoint) == endpoint) {
            return existing.id;
        }
    }
    return "";
}

UpsertResult SettingsStore::upsert_service(mcp::Service service) {
    UpsertResult result;

    service.id = text::trim(service.id);
    service.name = text::trim(service.name);
    service.endpoint = text::trim(service.endpoint);
    service.transport = mcp::normalize_transport(text::trim(service.transport));
    service.command = text::trim(service.command);
    service.auth_token = text::trim(service.auth_token);
    service.tool_states = normalize_tool_states(service.tool_states);

    std::lock_guard<std::mutex> guard(mutex_);

    if (service.id.empty()) {
        service.id = find_id_by_endpoint_locked(service.endpoint);
    }
    if (service.id.empty()) {
        service.id = generate_unique_id(services_, service.name, service.endpoint);
    }
    if (service.name.empty()) {
        service.name = service.id;
    }

    std::string validation_error = validate_service(service);
    if (!validation_error.empty()) {
        result.error_message = validation_error;
        return result;
    }
    service.updated_at = utc_timestamp_now();

    std::vector<mcp::Service> previous_services = services_;
    bool updated = false;
    for (auto &existing : services_) {
        if (existing.id != service.id) {
            continue;
        }
        if (service.auth_token.empty()) {
            service.auth_token = existing.auth_token;
        }
        if (service.tool_states.empty()) {
            service.tool_states = existing.tool_states;
        }
        existing = service;
        updated = true;
        break;
    }
    if (!updated) {
        services_.push_back(service);
    }

    StoreResult persisted = persist_locked();
    if (!persisted.success) {
        services_ = std::move(previous_services);
        result.error_message = persisted.error_message;
        return result;
    }

    result.success = true;
    result.service_id = service.id;
    return result;
}

StoreResult SettingsStore::delete_service(const std::string &service_id) {
    StoreResult result;
    std::string trimmed_id = text::trim(service_id);
    if (trimmed_id.empty()) {
        result.error_message = "service id is required";
        return result;
    }

    std::lock_guard<std::mutex> guard(mutex_);
    services_.erase(std::remove_if(services_.begin(), services_.end(),
                                   [&trimmed_id](const mcp::Service &service) { return service.id == trimmed_id; }),
                    services_.end());
    return persist_locked();
}

StoreResult SettingsStore::set_enabled(const std::string &service_id, bool enabled) {
    StoreResult result;
    std::string trimmed_id = text::trim(service_id);
    if (trimmed_id.empty()) {
        result.error_message = "service id is required";
        return result;
    }

    std::lock_guard<std::mutex> guard(mutex_);
    for (auto &service : services_) {
        if (service.id == trimmed_id) {
            service.enabled = enabled;
            service.updated_at = utc_timestamp_now();
            return persist_locked();
        }
    }
    result.error_message = "service \"" + trimmed_id + "\" not found";
    return result;
}

StoreResult SettingsStore::set_tool_enabled(const std::string &service_id, const std::string &tool_name,
                                            bool enabled) {
    StoreResult result;
    std::string trimmed_id = text::trim(service_id);
    std::string trimmed_tool = text::trim(tool_name);
    if (trimmed_id.empty()) {
        result.error_message = "service id is required";
        return result;
    }
    if (trimmed_tool.empty()) {
        result.error_message = "tool name is required";
        return result;
    }

    std::lock_guard<std::mutex> guard(mutex_);
    for (auto &service : services_) {
        if (service.id != trimmed_id) {
            continue;
        }

        std::string now = utc_timestamp_now();
        std::vector<mcp::ToolOverride> states;
        for (const auto &state : service.tool_states) {
            if (state.name != trimmed_tool) {
                states.push_back(state);
            }
        }
        if (!enabled) {
            mcp::ToolOverride disabled_state;
            disabled_state.name = trimmed_tool;
            disabled_state.enabled = false;
            disabled_state.updated_at = now;
            states.push_back(disabled_state);
        }

        service.tool_states = normalize_tool_states(states);
        service.updated_at = now;
        return persist_locked();
    }

    result.error_message = "service \"" + trimmed_id + "\" not found";
    return result;
}

} // namespace settings
