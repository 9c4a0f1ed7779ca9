#include "config.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "util.hpp"

#include <climits>
#include <fstream>

// -------- Global paths --------
std::string g_config_root;
std::string g_config_filename;

// ---------- Path helpers ----------
static bool ensure_dir_exists(const std::string& path, mode_t mode) {
    struct stat st;
    if (stat(path.c_str(), &st) == 0) {
        if (!S_ISDIR(st.st_mode)) {
            std::cerr << path << " exists but is not a directory\n";
            return false;
        }
        if ((st.st_mode & 0777) != mode) {
            chmod(path.c_str(), mode);
        }
        return true;
    }
    if (mkdir(path.c_str(), mode) != 0) {
        if (errno != EEXIST) {
            std::cerr << "Failed to create directory " << path << ": " << strerror(errno) << "\n";
            return false;
        }
    }
    return true;
}

// -------- Ownership and permission checks ----------
bool check_dir_ownership_and_perms(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        std::cerr << "Internal error: config directory check failed.\n";
        return false;
    }
    if (st.st_uid != geteuid()) {
        audit_log_level(LogLevel::ERROR,
            "Directory ownership violation: " + path,
            "config_module",
            "failure");
        return false;
    }
    // No group/other access allowed
    if ((st.st_mode & 0077) != 0) {
        audit_log_level(LogLevel::ERROR,
            "Insecure directory permissions on: " + path,
            "config_module",
            "failure");
        return false;
    }
    return true;
}

bool check_file_ownership_and_perms(const std::string& path, bool allow_missing) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        if (errno == ENOENT && allow_missing) return true;
        return false;
    }
    if (st.st_uid != geteuid()) {
        audit_log_level(LogLevel::ERROR,
            "File ownership violation: " + path,
            "config_module",
            "failure");
        return false;
    }
    if ((st.st_mode & 0077) != 0) {
        audit_log_level(LogLevel::ERROR,
            "Insecure file permissions on " + path,
            "config_module",
            "failure");
        return false;
    }
    return true;
}


// ---------- Initialization ----------
bool init_config_paths() {
    g_config_root = get_user_home_dir() + "/" + CONFIG_DIRNAME;
    if (!ensure_dir_exists(g_config_root, S_IRWXU)) {
        return false;
    }
    if (!check_dir_ownership_and_perms(g_config_root)) {
        return false;
    }
    g_config_filename = g_config_root + "/" + CONFIG_FILENAME;

    std::string log_path = g_config_root + "/" + AUDIT_LOG;
    if (!check_file_ownership_and_perms(log_path, true)) {
        return false;
    }
    set_audit_log_path(log_path);
    return true;
}


// ---------- Parsing ----------
static unsigned parse_unsigned(const std::string& key, const std::string& value) {
    if (value.empty() || !std::all_of(value.begin(), value.end(),
        [](unsigned char c) { return std::isdigit(c); })) {
        throw ConfigError(key + ": expected a non-negative number, got \"" + value + "\"");
    }
    unsigned long v = 0;
    try {
        v = std::stoul(value);
    }
    catch (const std::out_of_range&) {
        throw ConfigError(key + ": value out of range");
    }
    if (v > UINT_MAX) {
        throw ConfigError(key + ": value out of range");
    }
    return static_cast<unsigned>(v);
}

std::vector<std::string> split_command(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    bool in_quotes = false;
    bool have = false;
    for (char c : s) {
        if (c == '"') {
            in_quotes = !in_quotes;
            have = true;
        }
        else if ((c == ' ' || c == '\t') && !in_quotes) {
            if (have) out.push_back(cur);
            cur.clear();
            have = false;
        }
        else {
            cur.push_back(c);
            have = true;
        }
    }
    if (in_quotes) {
        throw ConfigError("unterminated quote in command: " + s);
    }
    if (have) out.push_back(cur);
    return out;
}

Config parse_config(const std::string& text) {
    Config cfg;
    std::istringstream iss(text);
    std::string line;
    unsigned lineno = 0;

    while (std::getline(iss, line)) {
        ++lineno;
        strip_cr(line);
        trim_spaces(line);
        if (line.empty() || line[0] == '#') continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            throw ConfigError("line " + std::to_string(lineno) + ": expected key = value");
        }
        std::string key = line.substr(0, eq);
        std::string value = line.substr(eq + 1);
        trim_spaces(key);
        trim_spaces(value);

        if (key == "database-path") cfg.database_path = expand_home(value);
        else if (key == "inactivity-lock-timeout") cfg.inactivity_timeout_seconds = parse_unsigned(key, value);
        else if (key == "max-results") cfg.max_results = parse_unsigned(key, value);
        else if (key == "clip-clear-timeout") cfg.clip_clear_seconds = parse_unsigned(key, value);
        else if (key == "keepassxc-cli") cfg.cli_path = expand_home(value);
        else if (key == "xdotool") cfg.xdotool_path = expand_home(value);
        else if (key == "tool-timeout") cfg.tool_timeout_seconds = parse_unsigned(key, value);
        else if (key == "focus-poll-interval-ms") cfg.focus_poll_ms = parse_unsigned(key, value);
        else if (key == "focus-max-attempts") cfg.focus_attempts = parse_unsigned(key, value);
        else if (key == "autotype-delay-ms") cfg.autotype_delay_ms = parse_unsigned(key, value);
        else if (key == "unlock-prompt") cfg.prompt_command = split_command(value);
        else if (key == "unlock-prompt-title") cfg.prompt_title = value;
        else if (key == "unlock-prompt-timeout") cfg.prompt_timeout_seconds = parse_unsigned(key, value);
        else if (key == "timer-granularity-ms") cfg.timer_granularity_ms = parse_unsigned(key, value);
        else {
            audit_log_level(LogLevel::WARN,
                "Unknown configuration key ignored: " + key,
                "config_module",
                "notify");
        }
    }

    if (cfg.max_results == 0) {
        throw ConfigError("max-results: must be at least 1");
    }
    if (cfg.focus_attempts == 0) {
        throw ConfigError("focus-max-attempts: must be at least 1");
    }
    if (cfg.tool_timeout_seconds == 0) {
        throw ConfigError("tool-timeout: must be at least 1");
    }
    return cfg;
}

Config load_config(const std::string& path) {
    if (!check_file_ownership_and_perms(path, true)) {
        throw ConfigError("configuration file has insecure ownership or permissions: " + path);
    }
    std::ifstream in(path);
    if (!in) {
        if (access(path.c_str(), F_OK) != 0) {
            audit_log_level(LogLevel::INFO,
                "No configuration file, using defaults",
                "config_module",
                "notify");
            return Config{};
        }
        throw ConfigError("cannot read configuration file: " + path);
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    Config cfg = parse_config(oss.str());
    audit_log_level(LogLevel::INFO,
        "Configuration loaded from " + path,
        "config_module",
        "success");
    return cfg;
}
