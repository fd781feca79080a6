#include "mcp/stdio_transport.hpp"
#include "platform/platform_abi.hpp"
#include "protocol/message_reader.hpp"
#include "utils/debug_log.hpp"
#include "utils/text.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>

namespace mcp {

namespace {

constexpr int POLL_SLICE_MILLISECONDS = 50;
constexpr size_t READ_CHUNK_SIZE = 4096;
constexpr size_t STDERR_LIMIT = 64 * 1024;

// Owns a spawned child and its pipes. Destruction closes stdin, kills the
// process, reaps it and closes the remaining descriptors.
class ChildProcess {
public:
    explicit ChildProcess(const platform::SpawnResult &spawned)
        : process_id_(spawned.process_id),
          stdin_descriptor_(spawned.stdin_descriptor),
          stdout_descriptor_(spawned.stdout_descriptor),
          stderr_descriptor_(spawned.stderr_descriptor) {}

    ~ChildProcess() {
        platform::close_descriptor(stdin_descriptor_);
        if (process_id_ > 0) {
            platform::kill_process(process_id_);
            if (!platform::reap_process(process_id_)) {
                debug_log::log("stdio: failed to reap child " + std::to_string(process_id_));
            }
        }
        platform::close_descriptor(stdout_descriptor_);
        platform::close_descriptor(stderr_descriptor_);
    }

    ChildProcess(const ChildProcess &) = delete;
    ChildProcess &operator=(const ChildProcess &) = delete;

    bool write_message(const json &message, const call_context::CallContext &context, RpcError &error) {
        std::string framed = message_reader::frame_line(message.dump());
        size_t written_total = 0;

        while (written_total < framed.size()) {
            if (context.is_done()) {
                error = make_error(ErrorKind::Transport, context.done_reason());
                return false;
            }

            pollfd descriptor_poll{};
            descriptor_poll.fd = stdin_descriptor_;
            descriptor_poll.events = POLLOUT;
            int ready = ::poll(&descriptor_poll, 1, context.next_slice_milliseconds(POLL_SLICE_MILLISECONDS));
            if (ready < 0) {
                if (errno == EINTR) {
                    continue;
                }
                error = make_error(ErrorKind::Transport, std::string("poll stdin: ") + std::strerror(errno));
                return false;
            }
            if (ready == 0) {
                continue;
            }

            ssize_t written = ::write(stdin_descriptor_, framed.data() + written_total, framed.size() - written_total);
            if (written < 0) {
                if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                    continue;
                }
                error = make_error(ErrorKind::Transport, std::string("write stdin: ") + std::strerror(errno));
                return false;
            }
            written_total += static_cast<size_t>(written);
        }
        return true;
    }

    // Reads stdout until the reply carrying expected_id arrives. Messages that
    // carry a method and replies with other ids are skipped.
    bool read_reply(const json &expected_id, const call_context::CallContext &context,
                    json_rpc::Response &output_response, RpcError &error) {
        while (true) {
            std::string raw_message;
            while (reader_.next_message(raw_message)) {
                json message = json::parse(raw_message, nullptr, false);
                if (message.is_discarded()) {
                    error = make_error(ErrorKind::Decode, "decode rpc response: malformed json from child");
                    return false;
                }
                if (json_rpc::is_peer_initiated(message)) {
                    debug_log::log("stdio: skipping message from child: " + json_rpc::get_method(message));
                    continue;
                }
                json_rpc::Response response;
                if (!json_rpc::parse_response(message, response) || !json_rpc::ids_match(expected_id, response.id)) {
                    continue;
                }
                output_response = response;
                return true;
            }

            if (stdout_closed_) {
                error = make_error(ErrorKind::StreamExhausted,
                                   "decode rpc response: child closed stdout before response id " +
                                       json_rpc::id_to_string(expected_id));
                return false;
            }
            if (context.is_done()) {
                error = make_error(ErrorKind::Transport, context.done_reason());
                return false;
            }
            if (!pump_output(context, error)) {
                return false;
            }
        }
    }

    // Collects whatever stderr is still buffered in the pipe.
    void drain_stderr() {
        while (stderr_descriptor_ >= 0) {
            char buffer[READ_CHUNK_SIZE];
            ssize_t read_count = ::read(stderr_descriptor_, buffer, sizeof(buffer));
            if (read_count <= 0) {
                if (read_count < 0 && errno == EINTR) {
                    continue;
                }
                if (read_count == 0) {
                    platform::close_descriptor(stderr_descriptor_);
                }
                return;
            }
            append_stderr(buffer, static_cast<size_t>(read_count));
        }
    }

    std::string stderr_text() const { return text::trim(text::sanitize_utf8(stderr_text_)); }

private:
    bool pump_output(const call_context::CallContext &context, RpcError &error) {
        pollfd descriptor_polls[2]{};
        nfds_t poll_count = 0;
        descriptor_polls[poll_count].fd = stdout_descriptor_;
        descriptor_polls[poll_count].events = POLLIN;
        poll_count++;
        if (stderr_descriptor_ >= 0) {
            descriptor_polls[poll_count].fd = stderr_descriptor_;
            descriptor_polls[poll_count].events = POLLIN;
            poll_count++;
        }

        int ready = ::poll(descriptor_polls, poll_count, context.next_slice_milliseconds(POLL_SLICE_MILLISECONDS));
        if (ready < 0) {
            if (errno == EINTR) {
                return true;
            }
            error = make_error(ErrorKind::Transport, std::string("poll stdout: ") + std::strerror(errno));
            return false;
        }
        if (ready == 0) {
            return true;
        }

        if (poll_count > 1 && descriptor_polls[1].revents != 0) {
            drain_stderr();
        }

        if (descriptor_polls[0].revents != 0) {
            char buffer[READ_CHUNK_SIZE];
            ssize_t read_count = ::read(stdout_descriptor_, buffer, sizeof(buffer));
            if (read_count > 0) {
                reader_.feed(buffer, static_cast<size_t>(read_count));
            } else if (read_count == 0) {
                stdout_closed_ = true;
            } else if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
                error = make_error(ErrorKind::Transport, std::string("read stdout: ") + std::strerror(errno));
                return false;
            }
        }
        return true;
    }

    void append_stderr(const char *data, size_t length) {
        if (stderr_text_.size() >= STDERR_LIMIT) {
            return;
        }
        stderr_text_.append(data, std::min(length, STDERR_LIMIT - stderr_text_.size()));
    }

    int process_id_;
    int stdin_descriptor_;
    int stdout_descriptor_;
    int stderr_descriptor_;
    bool stdout_closed_ = false;
    message_reader::JsonMessageReader reader_;
    std::string stderr_text_;
};

RpcExchange fail_with_stderr(ChildProcess &child, const std::string &step, RpcError error) {
    child.drain_stderr();
    error.message = step + ": " + error.message;
    std::string child_stderr = child.stderr_text();
    if (!child_stderr.empty()) {
        error.message += "; stderr: " + child_stderr;
    }
    RpcExchange exchange;
    exchange.error = error;
    return exchange;
}

} // namespace

RpcExchange StdioTransport::execute(const Service &service, const StdioExchangePlan &plan,
                                    const call_context::CallContext &context) {
    RpcExchange exchange;

    std::string command = text::trim(service.command);
    if (command.empty()) {
        exchange.error = make_error(ErrorKind::InvalidService, "stdio command is required");
        return exchange;
    }
    if (context.is_done()) {
        exchange.error = make_error(ErrorKind::Transport, context.done_reason());
        return exchange;
    }

    platform::ignore_broken_pipe_signal();
    platform::SpawnResult spawned = platform::spawn_piped_process(command, service.args);
    if (!spawned.success) {
        exchange.error = make_error(ErrorKind::Transport, "start stdio command: " + spawned.error_message);
        return exchange;
    }
    debug_log::log("stdio: started '" + command + "' as pid " + std::to_string(spawned.process_id));

    ChildProcess child(spawned);
    RpcError error;
    json_rpc::Response response;

    if (!child.write_message(plan.initialize_request, context, error)) {
        return fail_with_stderr(child, "write initialize request", error);
    }
    if (!child.read_reply(json_rpc::get_id(plan.initialize_request), context, response, error)) {
        return fail_with_stderr(child, "read initialize response", error);
    }
    if (response.has_error) {
        return fail_with_stderr(child, "initialize",
                                make_error(ErrorKind::Rpc,
                                           "rpc error " + std::to_string(response.error_code) + ": " +
                                               response.error_message,
                                           response.error_code));
    }

    if (!child.write_message(plan.initialized_notification, context, error)) {
        return fail_with_stderr(child, "write initialized notification", error);
    }
    if (!child.write_message(plan.request, context, error)) {
        return fail_with_stderr(child, "write request", error);
    }
    if (!child.read_reply(json_rpc::get_id(plan.request), context, response, error)) {
        return fail_with_stderr(child, "read response", error);
    }

    exchange = exchange_from_response(response, "");
    if (!exchange.success) {
        child.drain_stderr();
        std::string child_stderr = child.stderr_text();
        if (!child_stderr.empty()) {
            exchange.error.message += "; stderr: " + child_stderr;
        }
    }
    return exchange;
}

} // namespace mcp
