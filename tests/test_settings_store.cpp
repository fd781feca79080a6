// Tests for the JSON settings store and the environment configuration.
// Each test works on its own file under the system temp directory.

#include <nlohmann/json.hpp>
#include <unistd.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <string>

#include "config/client_config.hpp"
#include "config/settings_store.hpp"
#include "platform/platform_abi.hpp"

using json = nlohmann::json;

namespace test_settings_store {

// Fresh settings path; the file itself does not exist yet.
static std::string fresh_settings_path(const std::string &name) {
    std::filesystem::path directory =
        std::filesystem::temp_directory_path() / ("mcplink_test_" + std::to_string(getpid()));
    std::filesystem::create_directories(directory);
    std::filesystem::path file_path = directory / (name + ".json");
    std::filesystem::remove(file_path);
    return file_path.string();
}

static void write_text(const std::string &file_path, const std::string &contents) {
    std::ofstream file_stream(file_path, std::ios::trunc);
    file_stream << contents;
}

static json read_json(const std::string &file_path) {
    std::string contents;
    if (!platform::read_file_contents(file_path, contents)) {
        return nullptr;
    }
    return json::parse(contents, nullptr, false);
}

static mcp::Service http_service(const std::string &name, const std::string &endpoint) {
    mcp::Service service;
    service.name = name;
    service.endpoint = endpoint;
    service.enabled = true;
    return service;
}

// Test: a missing file is created with an empty service list.
static bool test_open_creates_missing_file() {
    std::string file_path = fresh_settings_path("create");
    settings::OpenResult opened = settings::SettingsStore::open(file_path);

    json document = read_json(file_path);
    bool success = opened.success && opened.store->list_services().empty() && document.is_object() &&
                   document["mcp"]["services"] == json::array();

    if (success) {
        std::cout << "  OK: Missing settings file created empty" << std::endl;
    } else {
        std::cout << "  FAIL: Could not create settings file: " << opened.error_message << std::endl;
    }
    return success;
}

// Test: ids derived from names, upsert by endpoint, credential kept, round trip through the file.
static bool test_upsert_round_trip() {
    std::string file_path = fresh_settings_path("upsert");
    settings::OpenResult opened = settings::SettingsStore::open(file_path);
    if (!opened.success) {
        std::cout << "  FAIL: open failed: " << opened.error_message << std::endl;
        return false;
    }

    mcp::Service first = http_service("  My Server! ", "https://one.test/mcp");
    first.auth_token = " token-1 ";
    first.transport = "Streamable-HTTP";
    settings::UpsertResult inserted = opened.store->upsert_service(first);
    settings::UpsertResult second =
        opened.store->upsert_service(http_service("My Server", "https://two.test/mcp"));

    bool success = inserted.success && inserted.service_id == "my-server" && second.success &&
                   second.service_id == "my-server-2";

    // Same endpoint, no id, no credential: updates the first service and keeps its token.
    mcp::Service update = http_service("Renamed", "https://one.test/mcp");
    update.transport = "sse";
    settings::UpsertResult updated = opened.store->upsert_service(update);
    success = success && updated.success && updated.service_id == "my-server";

    settings::OpenResult reopened = settings::SettingsStore::open(file_path);
    mcp::Service stored;
    success = success && reopened.success && reopened.store->list_services().size() == 2 &&
              reopened.store->find_service("my-server", stored) && stored.name == "Renamed" &&
              stored.transport == "sse" && stored.auth_token == "token-1" && !stored.updated_at.empty() &&
              stored.updated_at.back() == 'Z';

    mcp::Service second_stored;
    success = success && reopened.store->find_service("my-server-2", second_stored) &&
              second_stored.transport == "streamable_http" && second_stored.name == "My Server";

    if (success) {
        std::cout << "  OK: Upsert derives ids, matches endpoints, keeps credentials across reopen" << std::endl;
    } else {
        std::cout << "  FAIL: Upsert round trip mismatch: " << updated.error_message << std::endl;
    }
    return success;
}

// Test: invalid services are rejected and leave the file unchanged.
static bool test_invalid_services_rejected() {
    std::string file_path = fresh_settings_path("invalid");
    settings::OpenResult opened = settings::SettingsStore::open(file_path);
    if (!opened.success) {
        std::cout << "  FAIL: open failed: " << opened.error_message << std::endl;
        return false;
    }

    mcp::Service bad_id = http_service("x", "https://x.test");
    bad_id.id = "bad id";
    mcp::Service bad_endpoint = http_service("y", "ftp://y.test");
    mcp::Service no_command = http_service("z", "");
    no_command.transport = "stdio";
    mcp::Service bad_transport = http_service("w", "https://w.test");
    bad_transport.transport = "websocket";

    settings::UpsertResult bad_id_result = opened.store->upsert_service(bad_id);
    settings::UpsertResult bad_endpoint_result = opened.store->upsert_service(bad_endpoint);
    settings::UpsertResult no_command_result = opened.store->upsert_service(no_command);
    settings::UpsertResult bad_transport_result = opened.store->upsert_service(bad_transport);

    bool success = !bad_id_result.success && bad_id_result.error_message == "service id must match [a-zA-Z0-9_-]+";
    success = success && !bad_endpoint_result.success &&
              bad_endpoint_result.error_message == "service endpoint must start with http:// or https://";
    success = success && !no_command_result.success && !bad_transport_result.success;
    success = success && opened.store->list_services().empty() &&
              read_json(file_path)["mcp"]["services"] == json::array();

    mcp::Service stdio_service = http_service("Local Tool", "");
    stdio_service.transport = "STDIO";
    stdio_service.command = "/usr/bin/mcp-local";
    stdio_service.args = {"--verbose"};
    settings::UpsertResult stdio_result = opened.store->upsert_service(stdio_service);
    success = success && stdio_result.success && stdio_result.service_id == "local-tool";

    if (success) {
        std::cout << "  OK: Invalid ids, endpoints, commands and transports rejected" << std::endl;
    } else {
        std::cout << "  FAIL: Validation mismatch: " << bad_id_result.error_message << " / "
                  << stdio_result.error_message << std::endl;
    }
    return success;
}

// Test: top-level keys other than mcp.services survive a rewrite.
static bool test_unrelated_keys_preserved() {
    std::string file_path = fresh_settings_path("preserve");
    write_text(file_path, R"({"skills":{"items":[{"id":"s1"}]},"agent":{"prompts":{"system_prompt":"hi"}},)"
                          R"("mcp":{"services":[]}})");

    settings::OpenResult opened = settings::SettingsStore::open(file_path);
    bool success = opened.success && opened.store->upsert_service(http_service("svc", "http://svc.test")).success;

    json document = read_json(file_path);
    success = success && document["skills"]["items"][0]["id"] == "s1" &&
              document["agent"]["prompts"]["system_prompt"] == "hi" && document["mcp"]["services"].size() == 1;

    if (success) {
        std::cout << "  OK: Unrelated settings kept on rewrite" << std::endl;
    } else {
        std::cout << "  FAIL: Unrelated keys lost: " << document.dump() << std::endl;
    }
    return success;
}

// Test: per-tool overrides are stored only while disabled.
static bool test_tool_overrides() {
    std::string file_path = fresh_settings_path("tools");
    settings::OpenResult opened = settings::SettingsStore::open(file_path);
    if (!opened.success) {
        std::cout << "  FAIL: open failed: " << opened.error_message << std::endl;
        return false;
    }
    settings::UpsertResult inserted = opened.store->upsert_service(http_service("svc", "http://svc.test"));

    bool success = inserted.success && opened.store->is_tool_enabled("svc", "query");
    success = success && opened.store->set_tool_enabled("svc", " query ", false).success &&
              !opened.store->is_tool_enabled("svc", "query");
    success = success && read_json(file_path)["mcp"]["services"][0]["tool_states"][0]["name"] == "query";

    // An update without overrides keeps the stored ones.
    success = success && opened.store->upsert_service(http_service("svc", "http://svc.test")).success &&
              !opened.store->is_tool_enabled("svc", "query");

    success = success && opened.store->set_tool_enabled("svc", "query", true).success &&
              opened.store->is_tool_enabled("svc", "query") &&
              !read_json(file_path)["mcp"]["services"][0].contains("tool_states");

    success = success && !opened.store->set_tool_enabled("missing", "query", false).success;
    success = success && !opened.store->is_tool_enabled("missing", "query");
    success = success && opened.store->set_enabled("svc", false).success &&
              opened.store->list_enabled_services().empty();
    success = success && opened.store->delete_service("svc").success && opened.store->list_services().empty();

    if (success) {
        std::cout << "  OK: Overrides recorded when disabled and removed when enabled" << std::endl;
    } else {
        std::cout << "  FAIL: Tool override mismatch" << std::endl;
    }
    return success;
}

// Test: malformed files and invalid stored services fail to open.
static bool test_open_rejects_bad_files() {
    std::string malformed_path = fresh_settings_path("malformed");
    write_text(malformed_path, "{not json");
    settings::OpenResult malformed = settings::SettingsStore::open(malformed_path);

    std::string invalid_path = fresh_settings_path("invalid_service");
    write_text(invalid_path, R"({"mcp":{"services":[{"id":"svc","endpoint":"mailto:x","enabled":true}]}})");
    settings::OpenResult invalid = settings::SettingsStore::open(invalid_path);

    bool success = !malformed.success && malformed.error_message.find("decode settings file") == 0;
    success = success && !invalid.success && invalid.error_message.find("invalid mcp service \"svc\"") == 0;

    if (success) {
        std::cout << "  OK: Malformed file and invalid service refused at open" << std::endl;
    } else {
        std::cout << "  FAIL: Bad files accepted: " << malformed.error_message << " / " << invalid.error_message
                  << std::endl;
    }
    return success;
}

// Test: identifier derivation.
static bool test_sanitize_identifier() {
    bool success = settings::sanitize_identifier("  My Server! ") == "my-server";
    success = success && settings::sanitize_identifier("https://api.example.com/mcp") == "https-api-example-com-mcp";
    success = success && settings::sanitize_identifier("__a__b__") == "a-b";
    success = success && settings::sanitize_identifier("!!!").empty();

    if (success) {
        std::cout << "  OK: Identifiers lower-cased with collapsed dashes" << std::endl;
    } else {
        std::cout << "  FAIL: sanitize_identifier mismatch" << std::endl;
    }
    return success;
}

// Test: environment configuration with defaults and overrides.
static bool test_client_config() {
    std::map<std::string, std::string> environment = {
        {"MCPLINK_HTTP_TIMEOUT", "1500ms"},
        {"MCPLINK_TOOL_CACHE_TTL", "bogus"},
        {"MCPLINK_PROTOCOL_VERSION", " 2025-03-26 "},
        {"MCPLINK_SETTINGS", "/tmp/x.json"},
    };
    client_config::ClientConfig config = client_config::load([&environment](const char *name) -> const char * {
        auto iterator = environment.find(name);
        return iterator == environment.end() ? nullptr : iterator->second.c_str();
    });

    bool success = config.http_timeout == std::chrono::milliseconds(1500) &&
                   config.tool_cache_ttl == std::chrono::seconds(30) && config.protocol_version == "2025-03-26" &&
                   config.settings_path == "/tmp/x.json";

    std::chrono::milliseconds duration(0);
    success = success && client_config::parse_duration("45", duration) && duration == std::chrono::seconds(45);
    success = success && client_config::parse_duration("2m", duration) && duration == std::chrono::minutes(2);
    success = success && !client_config::parse_duration("0s", duration) &&
              !client_config::parse_duration("-5s", duration) && !client_config::parse_duration("5h", duration);

    client_config::ClientConfig defaults = client_config::load([](const char *name) -> const char * {
        (void)name;
        return nullptr;
    });
    success = success && defaults.http_timeout == std::chrono::seconds(20) &&
              defaults.protocol_version == "2025-06-18" &&
              defaults.settings_path == client_config::DEFAULT_SETTINGS_PATH;

    if (success) {
        std::cout << "  OK: Environment overrides parsed, invalid values fall back" << std::endl;
    } else {
        std::cout << "  FAIL: Client configuration mismatch" << std::endl;
    }
    return success;
}

// Test: invalid UTF-8 in a service name is replaced on write instead of failing the save.
static bool test_invalid_utf8_is_persisted() {
    std::string file_path = fresh_settings_path("utf8");
    settings::OpenResult opened = settings::SettingsStore::open(file_path);
    if (!opened.success) {
        std::cout << "  FAIL: open failed: " << opened.error_message << std::endl;
        return false;
    }

    settings::UpsertResult inserted =
        opened.store->upsert_service(http_service("Caf\xff Tools", "https://cafe.test/mcp"));
    settings::StoreResult toggled = opened.store->set_tool_enabled(inserted.service_id, "br\xc3" "ew", false);

    json document = read_json(file_path);
    settings::OpenResult reopened = settings::SettingsStore::open(file_path);
    mcp::Service stored;
    bool success = inserted.success && toggled.success && document.is_object() && reopened.success &&
                   reopened.store->find_service(inserted.service_id, stored) &&
                   stored.name == "Caf\xef\xbf\xbd Tools";

    if (success) {
        std::cout << "  OK: Invalid UTF-8 replaced when the settings file is written" << std::endl;
    } else {
        std::cout << "  FAIL: Invalid UTF-8 not persisted: " << inserted.error_message << toggled.error_message
                  << std::endl;
    }
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_open_creates_missing_file();
    all_passed &= test_upsert_round_trip();
    all_passed &= test_invalid_services_rejected();
    all_passed &= test_unrelated_keys_preserved();
    all_passed &= test_tool_overrides();
    all_passed &= test_open_rejects_bad_files();
    all_passed &= test_sanitize_identifier();
    all_passed &= test_client_config();
    all_passed &= test_invalid_utf8_is_persisted();
    return all_passed;
}

} // namespace test_settings_store
