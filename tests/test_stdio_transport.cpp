// Tests for the subprocess transport. Each test runs a small /bin/sh script as
// the MCP service, so these exercise real pipes, polling and process cleanup.

#include <nlohmann/json.hpp>
#include <sys/wait.h>
#include <cerrno>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

#include "mcp/protocol_client.hpp"

using json = nlohmann::json;

namespace test_stdio_transport {

// Extracts the numeric id of the line just read. nlohmann/json writes keys in
// sorted order, so "id" is the first key of every request.
static const std::string READ_ID =
    "id=$(printf '%s' \"$line\" | sed -n 's/^{\"id\":\\([0-9]*\\),.*/\\1/p'); ";

static const std::string ANSWER_INITIALIZE =
    "read -r line; " + READ_ID +
    "printf '{\"jsonrpc\":\"2.0\",\"id\":%s,\"result\":{\"protocolVersion\":\"2025-06-18\"}}\\n' \"$id\"; "
    "read -r line; ";

static mcp::Service shell_service(const std::string &script) {
    mcp::Service service;
    service.id = "local";
    service.name = "Local";
    service.transport = "stdio";
    service.command = "/bin/sh";
    service.args = {"-c", script};
    service.enabled = true;
    return service;
}

static call_context::CallContext test_context() {
    return call_context::CallContext::with_timeout(std::chrono::seconds(10));
}

static bool no_children_left() {
    int status = 0;
    return waitpid(-1, &status, WNOHANG) == -1 && errno == ECHILD;
}

// Test: full handshake; peer-initiated messages and foreign ids are skipped.
static bool test_stdio_list_tools() {
    std::string script = ANSWER_INITIALIZE + "read -r line; " + READ_ID +
                         "printf '{\"jsonrpc\":\"2.0\",\"method\":\"notifications/message\",\"params\":{}}\\n'; "
                         "printf '{\"jsonrpc\":\"2.0\",\"id\":999999,\"result\":{}}\\n'; "
                         "printf '{\"jsonrpc\":\"2.0\",\"id\":%s,\"result\":{\"tools\":[{\"name\":\"echo\","
                         "\"description\":\"Echo text\"}]}}\\n' \"$id\"";

    mcp::ProtocolClient client(mcp::ClientOptions(), nullptr);
    mcp::ListToolsResult listed = client.list_tools(shell_service(script), test_context());

    bool success = listed.success && listed.tools.size() == 1 && listed.tools[0].name == "echo" &&
                   listed.tools[0].description == "Echo text";
    success = success && no_children_left();

    if (success) {
        std::cout << "  OK: stdio handshake and tools/list, child reaped" << std::endl;
    } else {
        std::cout << "  FAIL: stdio tools/list failed: " << listed.error.message << std::endl;
    }
    return success;
}

// Test: a child that exits early reports its stderr.
static bool test_stdio_failure_includes_stderr() {
    mcp::ProtocolClient client(mcp::ClientOptions(), nullptr);
    mcp::ListToolsResult listed =
        client.list_tools(shell_service("read -r line; echo 'fatal: missing config' >&2; exit 3"), test_context());

    bool success = !listed.success && listed.error.kind == mcp::ErrorKind::StreamExhausted &&
                   listed.error.message.find("stderr: fatal: missing config") != std::string::npos;
    success = success && no_children_left();

    if (success) {
        std::cout << "  OK: Early exit reported with captured stderr" << std::endl;
    } else {
        std::cout << "  FAIL: Unexpected stdio failure: " << listed.error.message << std::endl;
    }
    return success;
}

// Test: a command that cannot start reports the spawn failure and leaves no child.
static bool test_stdio_spawn_failure() {
    mcp::Service service = shell_service("");
    service.command = "/nonexistent/mcplink-test-server";
    service.args.clear();

    mcp::ProtocolClient client(mcp::ClientOptions(), nullptr);
    mcp::ListToolsResult listed = client.list_tools(service, test_context());

    bool success = !listed.success && listed.error.kind == mcp::ErrorKind::Transport &&
                   listed.error.message.find("start stdio command") != std::string::npos &&
                   listed.error.message.find("/nonexistent/mcplink-test-server") != std::string::npos;
    success = success && no_children_left();

    if (success) {
        std::cout << "  OK: Spawn failure reported, no child left running" << std::endl;
    } else {
        std::cout << "  FAIL: Spawn failure mismatch: " << listed.error.message << std::endl;
    }
    return success;
}

// Test: cancellation stops a child stuck in the handshake.
static bool test_stdio_cancellation_mid_handshake() {
    auto context = test_context();
    std::thread canceller([context] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        context.cancel();
    });

    auto start_time = std::chrono::steady_clock::now();
    mcp::ProtocolClient client(mcp::ClientOptions(), nullptr);
    mcp::ListToolsResult listed = client.list_tools(shell_service("exec sleep 30"), context);
    auto elapsed = std::chrono::steady_clock::now() - start_time;
    canceller.join();

    bool success = !listed.success && listed.error.kind == mcp::ErrorKind::Transport &&
                   listed.error.message.find("cancelled") != std::string::npos;
    success = success && elapsed < std::chrono::seconds(5) && no_children_left();

    if (success) {
        std::cout << "  OK: Cancelled handshake killed and reaped the child" << std::endl;
    } else {
        std::cout << "  FAIL: Cancellation mismatch: " << listed.error.message << std::endl;
    }
    return success;
}

// Test: a deadline bounds the whole exchange.
static bool test_stdio_deadline() {
    auto context = call_context::CallContext::with_timeout(std::chrono::milliseconds(300));
    mcp::ProtocolClient client(mcp::ClientOptions(), nullptr);
    mcp::CallToolResult called =
        client.call_tool(shell_service(ANSWER_INITIALIZE + "exec sleep 30"), "echo", json::object(), context);

    bool success = !called.success && called.error.message.find("deadline exceeded") != std::string::npos &&
                   no_children_left();

    if (success) {
        std::cout << "  OK: Deadline exceeded while waiting for the tool reply" << std::endl;
    } else {
        std::cout << "  FAIL: Deadline mismatch: " << called.error.message << std::endl;
    }
    return success;
}

// Test: JSON-RPC errors from the child and a missing command.
static bool test_stdio_rpc_error_and_missing_command() {
    std::string script = ANSWER_INITIALIZE + "read -r line; " + READ_ID +
                         "printf '{\"jsonrpc\":\"2.0\",\"id\":%s,\"error\":{\"code\":-32601,\"message\":\"no such "
                         "tool\"}}\\n' \"$id\"";

    mcp::ProtocolClient client(mcp::ClientOptions(), nullptr);
    mcp::CallToolResult called = client.call_tool(shell_service(script), "missing", json::object(), test_context());
    bool success = !called.success && called.error.kind == mcp::ErrorKind::Rpc && called.error.code == -32601;

    mcp::Service no_command = shell_service("");
    no_command.command = "   ";
    mcp::ListToolsResult listed = client.list_tools(no_command, test_context());
    success = success && !listed.success && listed.error.kind == mcp::ErrorKind::InvalidService;

    if (success) {
        std::cout << "  OK: Child RPC error and missing command classified" << std::endl;
    } else {
        std::cout << "  FAIL: stdio error mismatch: " << called.error.message << " / " << listed.error.message
                  << std::endl;
    }
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_stdio_list_tools();
    all_passed &= test_stdio_failure_includes_stderr();
    all_passed &= test_stdio_spawn_failure();
    all_passed &= test_stdio_cancellation_mid_handshake();
    all_passed &= test_stdio_deadline();
    all_passed &= test_stdio_rpc_error_and_missing_command();
    return all_passed;
}

} // namespace test_stdio_transport
