// mcplink – MCP client gateway
// Entry point: stdio MCP server loop publishing the tools of the configured MCP services.
//
// Reads JSON-RPC 2.0 messages from stdin, dispatches them, writes responses to stdout.
// Logs go to stderr; stdout carries only protocol messages.
//
// Usage: mcplink [--settings <path>] [--status]

#include <nlohmann/json.hpp>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

#include "config/client_config.hpp"
#include "config/settings_store.hpp"
#include "gateway/gateway_dispatch.hpp"
#include "gateway/gateway_stdio.hpp"
#include "http/lws_http_client.hpp"
#include "mcp/protocol_client.hpp"
#include "platform/platform_abi.hpp"
#include "protocol/json_rpc.hpp"
#include "registry/tool_registry.hpp"
#include "utils/debug_log.hpp"

using json = nlohmann::json;

// Global flag for graceful shutdown.
static volatile std::sig_atomic_t shutdown_requested = 0;

static void signal_handler(int signal_number) {
    (void)signal_number;
    shutdown_requested = 1;
}

static void print_usage() {
    std::cerr << "usage: mcplink [--settings <path>] [--status]" << std::endl;
}

int main(int argc, char **argv) {
    client_config::ClientConfig config = client_config::load_from_environment();
    bool status_only = false;

    for (int index = 1; index < argc; ++index) {
        std::string argument = argv[index];
        if (argument == "--settings" && index + 1 < argc) {
            config.settings_path = argv[++index];
        } else if (argument == "--status") {
            status_only = true;
        } else if (argument == "--help" || argument == "-h") {
            print_usage();
            return 0;
        } else {
            print_usage();
            return 2;
        }
    }

    debug_log::notice("mcplink – MCP client gateway, build " + std::string(__DATE__) + " " + __TIME__);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    platform::ignore_broken_pipe_signal();

    settings::OpenResult opened = settings::SettingsStore::open(config.settings_path);
    if (!opened.success) {
        debug_log::notice("Cannot open settings " + config.settings_path + ": " + opened.error_message);
        return 1;
    }

    mcp::ClientOptions client_options;
    client_options.protocol_version = config.protocol_version;
    auto client = std::make_shared<mcp::ProtocolClient>(client_options, lws_http_client::create());

    registry::RegistryOptions registry_options;
    registry_options.cache_ttl = config.tool_cache_ttl;
    registry_options.call_timeout = config.http_timeout;
    auto tool_registry = std::make_shared<registry::ToolRegistry>(opened.store, client, registry_options);

    if (status_only) {
        auto context = call_context::CallContext::with_timeout(std::chrono::minutes(5));
        json services = gateway_dispatch::service_statuses_to_json(tool_registry->list_service_statuses(context));
        std::cout << services.dump(2) << std::endl;
        return 0;
    }

    gateway_dispatch::DispatcherOptions dispatcher_options;
    dispatcher_options.protocol_version = client_options.protocol_version;
    gateway_dispatch::Dispatcher dispatcher(tool_registry, dispatcher_options);

    debug_log::notice("Gateway started with " + std::to_string(opened.store->list_services().size()) +
                      " configured services. Waiting for MCP messages on stdin.");

    // Main message loop: read from stdin, dispatch, write to stdout.
    while (!shutdown_requested) {
        std::string raw_message = gateway_stdio::read_message(std::cin);

        if (raw_message.empty()) {
            // EOF on stdin means the client disconnected.
            debug_log::log("EOF on stdin. Shutting down.");
            break;
        }

        // Parse the JSON message.
        json parsed_message;
        try {
            parsed_message = json::parse(raw_message);
        } catch (const json::parse_error &error) {
            debug_log::notice("Failed to parse incoming JSON: " + std::string(error.what()));
            // Send a parse error response (no request id available).
            json error_response = json_rpc::build_error_response(nullptr, json_rpc::PARSE_ERROR, "Parse error");
            gateway_stdio::write_message(std::cout, error_response.dump());
            continue;
        }

        // Notifications return null (no response needed).
        json response = dispatcher.dispatch_message(parsed_message);
        if (response.is_null()) {
            continue;
        }

        gateway_stdio::write_message(std::cout, response.dump());
    }

    debug_log::notice("Gateway shut down.");
    return 0;
}
