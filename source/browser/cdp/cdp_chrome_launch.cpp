#include "browser/cdp/cdp_chrome_launch.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

namespace cdp_chrome_launch {

// Well-known Chrome executable names and paths on Linux.
static const std::vector<std::string> kLinuxChromePaths = {
    "google-chrome",
    "google-chrome-stable",
    "chromium",
    "chromium-browser",
    "/usr/bin/google-chrome",
    "/usr/bin/google-chrome-stable",
    "/usr/bin/chromium-browser",
    "/usr/bin/chromium",
    "/snap/bin/chromium",
};

std::string find_chrome_executable(const std::string &preferred) {
    if (!preferred.empty()) {
        if (preferred.find('/') == std::string::npos) {
            return platform::find_on_path(preferred);
        }
        return platform::is_executable_file(preferred) ? preferred : "";
    }
    for (const auto &candidate : kLinuxChromePaths) {
        if (candidate.find('/') != std::string::npos) {
            if (platform::is_executable_file(candidate)) {
                return candidate;
            }
        } else {
            std::string full_path = platform::find_on_path(candidate);
            if (!full_path.empty()) {
                return full_path;
            }
        }
    }
    return "";
}

std::string profile_directory_for(const LaunchOptions &options) {
    return options.user_data_directory_base + "-" + std::to_string(options.port);
}

ChromeCommandLine build_chrome_command_line(const std::string &executable_path, const LaunchOptions &options) {
    ChromeCommandLine command_line;
    command_line.executable_path = executable_path;
    command_line.arguments = {
        "--remote-debugging-port=" + std::to_string(options.port),
        "--remote-allow-origins=*",
        "--user-data-dir=" + profile_directory_for(options),
        "--no-first-run",
        "--no-default-browser-check",
        "--disable-background-networking",
        "--disable-default-apps",
        "--disable-popup-blocking",
        "--disable-sync",
    };
    if (options.headless) {
        command_line.arguments.push_back("--headless=new");
        command_line.arguments.push_back("--disable-gpu");
        command_line.arguments.push_back("--disable-dev-shm-usage");
    }
    // Chrome refuses to run as root with the sandbox on.
    if (options.headless || getuid() == 0) {
        command_line.arguments.push_back("--no-sandbox");
    }
    command_line.arguments.push_back("about:blank");
    return command_line;
}

int parse_devtools_active_port(const std::string &file_contents) {
    std::istringstream line_stream(file_contents);
    std::string first_line;
    if (!std::getline(line_stream, first_line)) {
        return -1;
    }
    if (!first_line.empty() && first_line.back() == '\r') {
        first_line.pop_back();
    }
    if (first_line.empty()) {
        return -1;
    }

    try {
        size_t consumed = 0;
        int port = std::stoi(first_line, &consumed);
        if (consumed == first_line.size() && port > 0 && port <= 65535) {
            return port;
        }
    } catch (const std::exception &) {
        return -1;
    }
    return -1;
}

ChromeLaunchResult launch_chrome(const LaunchOptions &options) {
    ChromeLaunchResult result;

    std::string executable_path = find_chrome_executable(options.chrome_binary);
    if (executable_path.empty()) {
        result.error_message = options.chrome_binary.empty()
            ? "Could not find a Chrome executable. Install google-chrome or chromium, or set CHROME_BIN."
            : "CHROME_BIN is not an executable: " + options.chrome_binary;
        return result;
    }

    std::string profile_directory = profile_directory_for(options);
    std::error_code directory_error;
    std::filesystem::create_directories(profile_directory, directory_error);
    if (directory_error) {
        result.error_message = "Cannot create browser profile directory " + profile_directory + ": " +
                               directory_error.message();
        return result;
    }
    result.user_data_directory = profile_directory;

    // A leftover file from an earlier run would be read before the new browser writes its own.
    std::string active_port_file = profile_directory + "/DevToolsActivePort";
    std::error_code remove_error;
    std::filesystem::remove(active_port_file, remove_error);

    ChromeCommandLine command_line = build_chrome_command_line(executable_path, options);
    debug_log::log("Launching " + executable_path + " on port " + std::to_string(options.port) +
                   (options.headless ? " (headless)" : ""));

    platform::SpawnResult spawn_result = platform::spawn_process(command_line.executable_path, command_line.arguments);
    if (!spawn_result.success) {
        result.error_message = "Failed to spawn Chrome: " + spawn_result.error_message;
        return result;
    }
    result.process_id = spawn_result.process_id;

    if (!platform::wait_for_file(active_port_file, options.startup_timeout_milliseconds)) {
        debug_log::log("Timed out waiting for DevToolsActivePort, killing Chrome pid=" +
                       std::to_string(result.process_id));
        result.error_message = "Timed out waiting for DevToolsActivePort file at: " + active_port_file;
        platform::kill_process(result.process_id);
        return result;
    }

    std::string file_contents;
    if (!platform::read_file_contents(active_port_file, file_contents)) {
        result.error_message = "Cannot read " + active_port_file;
        platform::kill_process(result.process_id);
        return result;
    }
    result.debug_port = parse_devtools_active_port(file_contents);
    if (result.debug_port <= 0) {
        debug_log::log("Failed to parse DevToolsActivePort, killing Chrome pid=" + std::to_string(result.process_id));
        result.error_message = "Failed to parse debug port from DevToolsActivePort file.";
        platform::kill_process(result.process_id);
        return result;
    }

    result.success = true;
    debug_log::warn("Chrome launched (pid=" + std::to_string(result.process_id) +
                    ", port=" + std::to_string(result.debug_port) + ")");
    return result;
}

bool stop_chrome(const ChromeLaunchResult &launch_result) {
    if (!launch_result.success) {
        return false;
    }
    debug_log::log("Stopping Chrome pid=" + std::to_string(launch_result.process_id));
    return platform::kill_process(launch_result.process_id);
}

} // namespace cdp_chrome_launch
