// Tests for the libwebsockets HTTP client against a loopback server that
// records the raw request it receives.

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

#include "http/lws_http_client.hpp"
#include "utils/text.hpp"

namespace test_http_client {

namespace {

// Accepts one connection, captures the request (headers and body) and answers
// with a fixed JSON body.
class LoopbackServer {
public:
    LoopbackServer() {
        listen_descriptor_ = socket(AF_INET, SOCK_STREAM, 0);
        if (listen_descriptor_ < 0) {
            return;
        }
        sockaddr_in address{};
        address.sin_family = AF_INET;
        address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        address.sin_port = 0;
        socklen_t address_length = sizeof(address);
        if (bind(listen_descriptor_, reinterpret_cast<sockaddr *>(&address), sizeof(address)) != 0 ||
            listen(listen_descriptor_, 1) != 0 ||
            getsockname(listen_descriptor_, reinterpret_cast<sockaddr *>(&address), &address_length) != 0) {
            close(listen_descriptor_);
            listen_descriptor_ = -1;
            return;
        }
        port_ = ntohs(address.sin_port);
        worker_ = std::thread([this] { serve_once(); });
    }

    ~LoopbackServer() {
        if (worker_.joinable()) {
            worker_.join();
        }
        if (listen_descriptor_ >= 0) {
            close(listen_descriptor_);
        }
    }

    bool ready() const { return port_ != 0; }
    int port() const { return port_; }

    // Valid once the client call returned.
    std::string captured_request() {
        if (worker_.joinable()) {
            worker_.join();
        }
        return request_;
    }

private:
    void serve_once() {
        pollfd listen_poll{listen_descriptor_, POLLIN, 0};
        if (poll(&listen_poll, 1, 5000) <= 0) {
            return;
        }
        int connection = accept(listen_descriptor_, nullptr, nullptr);
        if (connection < 0) {
            return;
        }

        while (!request_complete()) {
            pollfd read_poll{connection, POLLIN, 0};
            if (poll(&read_poll, 1, 5000) <= 0) {
                break;
            }
            char buffer[4096];
            ssize_t received = read(connection, buffer, sizeof(buffer));
            if (received <= 0) {
                break;
            }
            request_.append(buffer, static_cast<size_t>(received));
        }

        const std::string reply = "HTTP/1.1 200 OK\r\n"
                                  "Content-Type: application/json\r\n"
                                  "Mcp-Session-Id: loop-1\r\n"
                                  "Content-Length: 11\r\n"
                                  "Connection: close\r\n"
                                  "\r\n"
                                  "{\"ok\":true}";
        ssize_t written = write(connection, reply.data(), reply.size());
        (void)written;
        close(connection);
    }

    bool request_complete() const {
        size_t header_end = request_.find("\r\n\r\n");
        if (header_end == std::string::npos) {
            return false;
        }
        std::string headers = text::to_lower(request_.substr(0, header_end));
        size_t length_position = headers.find("content-length:");
        if (length_position == std::string::npos) {
            return true;
        }
        size_t body_length = std::stoul(headers.substr(length_position + 15));
        return request_.size() >= header_end + 4 + body_length;
    }

    int listen_descriptor_ = -1;
    int port_ = 0;
    std::thread worker_;
    std::string request_;
};

} // namespace

// Test: a POST reaches the server with its headers and body, without an Origin
// header, and the reply status, headers and body come back.
static bool test_post_round_trip_without_origin() {
    LoopbackServer server;
    if (!server.ready()) {
        std::cout << "  FAIL: Could not bind a loopback listener" << std::endl;
        return false;
    }

    http_client::HttpRequest request;
    request.method = "POST";
    request.url = "http://127.0.0.1:" + std::to_string(server.port()) + "/mcp";
    request.set_header("Content-Type", "application/json");
    request.set_header("MCP-Protocol-Version", "2025-06-18");
    request.body = "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}";

    auto client = lws_http_client::create();
    http_client::HttpResponse response =
        client->send(request, call_context::CallContext::with_timeout(std::chrono::seconds(5)));
    std::string captured = text::to_lower(server.captured_request());

    bool success = response.success && response.status_code == 200 && response.body == "{\"ok\":true}" &&
                   response.header("Mcp-Session-Id") == "loop-1";
    success = success && captured.find("post /mcp http/1.1") == 0 &&
              captured.find("\r\nmcp-protocol-version:") != std::string::npos &&
              captured.find("2025-06-18") != std::string::npos &&
              captured.find("\"method\":\"ping\"") != std::string::npos;
    success = success && captured.find("\r\norigin:") == std::string::npos;

    if (success) {
        std::cout << "  OK: POST delivered without an Origin header and the reply decoded" << std::endl;
    } else {
        std::cout << "  FAIL: Loopback exchange mismatch (" << response.error_message << "), request: " << captured
                  << std::endl;
    }
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_post_round_trip_without_origin();
    return all_passed;
}

} // namespace test_http_client
