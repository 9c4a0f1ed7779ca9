#pragma once
#include "kpx_common.hpp"

#include <string>
#include <vector>

// -------- Configuration --------
struct Config {
    std::string database_path;
    unsigned inactivity_timeout_seconds = 0;      // 0 disables auto-lock
    unsigned max_results = DEFAULT_MAX_RESULTS;
    unsigned clip_clear_seconds = DEFAULT_CLIP_CLEAR_SECONDS;

    std::string cli_path = DEFAULT_CLI;
    std::string xdotool_path = DEFAULT_XDOTOOL;
    unsigned tool_timeout_seconds = DEFAULT_TOOL_TIMEOUT_SECONDS;

    unsigned focus_poll_ms = DEFAULT_FOCUS_POLL_MS;
    unsigned focus_attempts = DEFAULT_FOCUS_ATTEMPTS;
    unsigned autotype_delay_ms = DEFAULT_AUTOTYPE_DELAY_MS;

    // External unlock prompt (argv, stdout = passphrase); empty = terminal
    std::vector<std::string> prompt_command;
    std::string prompt_title = "Unlock KeePassXC database";
    unsigned prompt_timeout_seconds = DEFAULT_PROMPT_TIMEOUT_SECONDS;

    unsigned timer_granularity_ms = DEFAULT_TIMER_GRANULARITY_MS;
};

// -------- Global paths --------
extern std::string g_config_root;       // e.g. /home/user/.kpxsession
extern std::string g_config_filename;   // g_config_root + "/config"

// Creates the config directory (0700), checks ownership and points the
// audit log into it
bool init_config_paths();

bool check_dir_ownership_and_perms(const std::string& path);
bool check_file_ownership_and_perms(const std::string& path, bool allow_missing);

// "key = value" lines; throws ConfigError on malformed values
Config parse_config(const std::string& text);

// Missing file yields defaults; insecure file or bad value throws ConfigError
Config load_config(const std::string& path);

// Splits a command line on blanks, honouring double quotes
std::vector<std::string> split_command(const std::string& s);
