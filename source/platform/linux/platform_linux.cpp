#include "platform/platform_abi.hpp"

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <signal.h>
#include <spawn.h>
#include <sstream>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char **environ;

namespace platform {

SpawnResult spawn_process(const std::string &executable_path,
                          const std::vector<std::string> &arguments) {
    SpawnResult result;

    // argv: [executable, arguments..., nullptr]; posix_spawn wants mutable pointers.
    std::vector<std::string> argv_strings;
    argv_strings.push_back(executable_path);
    argv_strings.insert(argv_strings.end(), arguments.begin(), arguments.end());
    std::vector<char *> argv_pointers;
    for (auto &argument_string : argv_strings) {
        argv_pointers.push_back(argument_string.data());
    }
    argv_pointers.push_back(nullptr);

    // Own process group, so a Ctrl-C aimed at us does not also hit the browser.
    posix_spawnattr_t spawn_attributes;
    posix_spawnattr_init(&spawn_attributes);
    posix_spawnattr_setflags(&spawn_attributes, POSIX_SPAWN_SETPGROUP);
    posix_spawnattr_setpgroup(&spawn_attributes, 0);

    pid_t child_pid = 0;
    int spawn_status = posix_spawn(&child_pid, executable_path.c_str(), nullptr, &spawn_attributes,
                                   argv_pointers.data(), environ);
    posix_spawnattr_destroy(&spawn_attributes);

    if (spawn_status != 0) {
        result.error_message = "posix_spawn failed: " + std::string(strerror(spawn_status));
        return result;
    }

    result.success = true;
    result.process_id = static_cast<int>(child_pid);
    return result;
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

bool wait_for_file(const std::string &file_path, int timeout_milliseconds) {
    constexpr int kPollIntervalMilliseconds = 100;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_milliseconds);

    while (true) {
        // The browser may create the file before writing it.
        std::string contents;
        if (read_file_contents(file_path, contents) && !contents.empty()) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(kPollIntervalMilliseconds));
    }
}

bool kill_process(int process_id) {
    if (process_id <= 0) {
        return false;
    }
    if (kill(static_cast<pid_t>(process_id), SIGTERM) != 0) {
        return false;
    }
    int status = 0;
    waitpid(static_cast<pid_t>(process_id), &status, 0);
    return true;
}

bool is_executable_file(const std::string &executable_path) {
    if (executable_path.empty()) {
        return false;
    }
    return access(executable_path.c_str(), X_OK) == 0;
}

std::string find_on_path(const std::string &program_name) {
    const char *path_environment = std::getenv("PATH");
    if (path_environment == nullptr) {
        return "";
    }
    std::istringstream path_stream(path_environment);
    std::string directory;
    while (std::getline(path_stream, directory, ':')) {
        if (directory.empty()) {
            continue;
        }
        std::string full_path = directory + "/" + program_name;
        if (is_executable_file(full_path)) {
            return full_path;
        }
    }
    return "";
}

} // namespace platform
