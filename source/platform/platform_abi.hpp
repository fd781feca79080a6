#ifndef MCPLINK_PLATFORM_ABI_HPP
#define MCPLINK_PLATFORM_ABI_HPP

// Platform abstraction interface.
// Each OS-specific implementation lives under platform/<os>/ and provides
// definitions for the functions declared here.

#include <string>
#include <vector>

namespace platform {

// Result of spawning a child process with piped standard streams.
// The parent owns the three descriptors and must close them.
struct SpawnResult {
    bool success = false;
    int process_id = -1;
    int stdin_descriptor = -1;  // write end, connected to the child's stdin
    int stdout_descriptor = -1; // read end, connected to the child's stdout
    int stderr_descriptor = -1; // read end, connected to the child's stderr
    std::string error_message;
};

// Spawn command (searched on PATH when it has no slash) with the given
// arguments. The parent-side descriptors are non-blocking and close-on-exec.
SpawnResult spawn_piped_process(const std::string &command,
                                const std::vector<std::string> &arguments);

// Forcefully terminate a process by its process ID.
bool kill_process(int process_id);

// Wait for a terminated child so it does not linger as a zombie.
// Returns true once the child has been collected.
bool reap_process(int process_id);

// Close a descriptor if open and mark it closed.
void close_descriptor(int &descriptor);

// Writes to a pipe whose reader has gone away must fail with EPIPE instead of
// killing this process. Safe to call repeatedly.
void ignore_broken_pipe_signal();

// Read the entire contents of a text file into a string.
// Returns true on success, false on failure (file not found, permission, etc.).
bool read_file_contents(const std::string &file_path, std::string &output_contents);

// True when something exists at file_path.
bool file_exists(const std::string &file_path);

// Replace file_path with contents by writing "<file_path>.tmp" and renaming it
// over the target. Parent directories are created as needed.
bool write_file_atomically(const std::string &file_path, const std::string &contents,
                           std::string &error_message);

} // namespace platform

#endif // MCPLINK_PLATFORM_ABI_HPP
