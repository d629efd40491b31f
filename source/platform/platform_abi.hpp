#ifndef TABSCOUT_PLATFORM_ABI_HPP
#define TABSCOUT_PLATFORM_ABI_HPP

// Process and file helpers used to start a local browser.
// The OS-specific implementation lives under platform/<os>/.

#include <string>
#include <vector>

namespace platform {

struct SpawnResult {
    bool success = false;
    int process_id = -1;
    std::string error_message;
};

// Starts executable_path with arguments and returns without waiting for it.
SpawnResult spawn_process(const std::string &executable_path,
                          const std::vector<std::string> &arguments);

// Reads the whole file. Returns false if it cannot be opened.
bool read_file_contents(const std::string &file_path, std::string &output_contents);

// Polls until the file exists and is non-empty, up to timeout_milliseconds.
bool wait_for_file(const std::string &file_path, int timeout_milliseconds);

// Sends SIGTERM and reaps the child.
bool kill_process(int process_id);

// True when executable_path names an existing regular file we may execute.
bool is_executable_file(const std::string &executable_path);

// Resolves a bare program name against PATH. Returns "" when not found.
std::string find_on_path(const std::string &program_name);

} // namespace platform

#endif // TABSCOUT_PLATFORM_ABI_HPP
