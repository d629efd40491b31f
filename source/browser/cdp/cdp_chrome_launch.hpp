#ifndef TABSCOUT_CDP_CHROME_LAUNCH_HPP
#define TABSCOUT_CDP_CHROME_LAUNCH_HPP

// Starts a local Chrome/Chromium with remote debugging and reads back the
// port it bound from <profile>/DevToolsActivePort.

#include <string>
#include <vector>

namespace cdp_chrome_launch {

struct LaunchOptions {
    std::string chrome_binary;                            // empty: search well-known locations
    std::string user_data_directory_base = "./chrome_data"; // profile is <base>-<port>
    int port = 9222;
    bool headless = true;
    int startup_timeout_milliseconds = 15000;
};

struct ChromeLaunchResult {
    bool success = false;
    int process_id = -1;
    int debug_port = -1;
    std::string user_data_directory;
    std::string error_message;
};

struct ChromeCommandLine {
    std::string executable_path;
    std::vector<std::string> arguments;
};

// preferred (CHROME_BIN) wins when it is executable; otherwise the first
// Chrome or Chromium found. Returns "" when there is none.
std::string find_chrome_executable(const std::string &preferred = "");

std::string profile_directory_for(const LaunchOptions &options);

ChromeCommandLine build_chrome_command_line(const std::string &executable_path, const LaunchOptions &options);

// First line of DevToolsActivePort is the port; the second is the browser
// target path. Returns -1 when the first line is not a valid port.
int parse_devtools_active_port(const std::string &file_contents);

ChromeLaunchResult launch_chrome(const LaunchOptions &options);

// Terminates a browser started by launch_chrome.
bool stop_chrome(const ChromeLaunchResult &launch_result);

} // namespace cdp_chrome_launch

#endif // TABSCOUT_CDP_CHROME_LAUNCH_HPP
