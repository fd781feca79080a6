#include "platform/platform_abi.hpp"

#include <unistd.h>
#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>

extern char **environ;

namespace platform {

static bool create_pipe(int descriptors[2], std::string &error_message) {
    if (pipe2(descriptors, O_CLOEXEC) != 0) {
        error_message = "pipe2 failed: " + std::string(strerror(errno));
        return false;
    }
    return true;
}

static void set_nonblocking(int descriptor) {
    int flags = fcntl(descriptor, F_GETFL, 0);
    if (flags >= 0) {
        fcntl(descriptor, F_SETFL, flags | O_NONBLOCK);
    }
}

SpawnResult spawn_piped_process(const std::string &command,
                                const std::vector<std::string> &arguments) {
    SpawnResult result;

    if (command.empty()) {
        result.error_message = "command is empty";
        return result;
    }

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (!create_pipe(stdin_pipe, result.error_message)) {
        return result;
    }
    if (!create_pipe(stdout_pipe, result.error_message)) {
        close_descriptor(stdin_pipe[0]);
        close_descriptor(stdin_pipe[1]);
        return result;
    }
    if (!create_pipe(stderr_pipe, result.error_message)) {
        close_descriptor(stdin_pipe[0]);
        close_descriptor(stdin_pipe[1]);
        close_descriptor(stdout_pipe[0]);
        close_descriptor(stdout_pipe[1]);
        return result;
    }

    // Build argv array: [command, arg1, arg2, ..., nullptr]
    std::vector<std::string> argv_strings;
    argv_strings.push_back(command);
    for (const auto &argument : arguments) {
        argv_strings.push_back(argument);
    }
    std::vector<char *> argv_pointers;
    for (auto &argument_string : argv_strings) {
        argv_pointers.push_back(&argument_string[0]);
    }
    argv_pointers.push_back(nullptr);

    // The child sees the pipe ends as fds 0/1/2; dup2 clears close-on-exec on them.
    posix_spawn_file_actions_t file_actions;
    posix_spawn_file_actions_init(&file_actions);
    posix_spawn_file_actions_adddup2(&file_actions, stdin_pipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&file_actions, stdout_pipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&file_actions, stderr_pipe[1], STDERR_FILENO);

    pid_t child_pid = 0;
    int spawn_status = posix_spawnp(&child_pid, command.c_str(), &file_actions, nullptr,
                                    argv_pointers.data(), environ);
    posix_spawn_file_actions_destroy(&file_actions);

    // Child-side ends belong to the child now (or to nobody on failure).
    close_descriptor(stdin_pipe[0]);
    close_descriptor(stdout_pipe[1]);
    close_descriptor(stderr_pipe[1]);

    if (spawn_status != 0) {
        close_descriptor(stdin_pipe[1]);
        close_descriptor(stdout_pipe[0]);
        close_descriptor(stderr_pipe[0]);
        result.error_message = "posix_spawnp '" + command + "' failed: " + std::string(strerror(spawn_status));
        return result;
    }

    set_nonblocking(stdin_pipe[1]);
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    result.success = true;
    result.process_id = static_cast<int>(child_pid);
    result.stdin_descriptor = stdin_pipe[1];
    result.stdout_descriptor = stdout_pipe[0];
    result.stderr_descriptor = stderr_pipe[0];
    return result;
}

bool kill_process(int process_id) {
    if (process_id <= 0) {
        return false;
    }
    int kill_result = kill(static_cast<pid_t>(process_id), SIGKILL);
    return (kill_result == 0);
}

bool reap_process(int process_id) {
    if (process_id <= 0) {
        return false;
    }
    int status = 0;
    while (true) {
        pid_t wait_result = waitpid(static_cast<pid_t>(process_id), &status, 0);
        if (wait_result == static_cast<pid_t>(process_id)) {
            return true;
        }
        if (wait_result < 0 && errno == EINTR) {
            continue;
        }
        return false;
    }
}

void close_descriptor(int &descriptor) {
    if (descriptor >= 0) {
        close(descriptor);
        descriptor = -1;
    }
}

void ignore_broken_pipe_signal() {
    static std::once_flag once;
    std::call_once(once, []() {
        signal(SIGPIPE, SIG_IGN);
    });
}

bool read_file_contents(const std::string &file_path, std::string &output_contents) {
    std::ifstream file_stream(file_path);
    if (!file_stream.is_open()) {
        return false;
    }
    std::ostringstream string_stream;
    string_stream << file_stream.rdbuf();
    output_contents = string_stream.str();
    return true;
}

bool file_exists(const std::string &file_path) {
    std::error_code filesystem_error;
    return std::filesystem::exists(file_path, filesystem_error);
}

bool write_file_atomically(const std::string &file_path, const std::string &contents,
                           std::string &error_message) {
    std::error_code filesystem_error;
    std::filesystem::path target(file_path);
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), filesystem_error);
        if (filesystem_error) {
            error_message = "create directory " + target.parent_path().string() + ": " + filesystem_error.message();
            return false;
        }
    }

    std::string temporary_path = file_path + ".tmp";
    {
        std::ofstream file_stream(temporary_path, std::ios::binary | std::ios::trunc);
        if (!file_stream.is_open()) {
            error_message = "write temp file " + temporary_path + ": cannot open";
            return false;
        }
        file_stream << contents;
        file_stream.flush();
        if (!file_stream) {
            error_message = "write temp file " + temporary_path + ": write failed";
            return false;
        }
    }
    if (chmod(temporary_path.c_str(), S_IRUSR | S_IWUSR) != 0) {
        error_message = "chmod " + temporary_path + ": " + std::strerror(errno);
        return false;
    }

    std::filesystem::rename(temporary_path, target, filesystem_error);
    if (filesystem_error) {
        error_message = "rename " + temporary_path + ": " + filesystem_error.message();
        return false;
    }
    return true;
}

} // namespace platform
