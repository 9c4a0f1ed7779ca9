#include "logging.hpp"
#include "util.hpp"

#include <fcntl.h>
#include <pwd.h>
#include <mutex>
#include <set>

LogContext g_log_ctx;

namespace {

std::mutex g_log_mutex;
std::string g_audit_log_path;

std::string current_user() {
    struct passwd pw;
    struct passwd* found = nullptr;
    char buf[1024];
    if (getpwuid_r(geteuid(), &pw, buf, sizeof(buf), &found) == 0 && found && found->pw_name) {
        return found->pw_name;
    }
    const char* env = std::getenv("USER");
    return (env && *env) ? env : "unknown";
}

// First word of the SSH variables is the client address; local runs log loopback
std::string remote_address() {
    for (const char* var : { "SSH_CONNECTION", "SSH_CLIENT" }) {
        const char* v = std::getenv(var);
        if (!v || !*v) continue;
        std::istringstream iss(v);
        std::string ip;
        if (iss >> ip) return ip;
    }
    return "127.0.0.1";
}

// one record per line, columns split on '|'
std::string column(const std::string& s, bool last) {
    std::string r = s;
    for (char& c : r) {
        if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) c = ' ';
        else if (c == '|' && !last) c = '/';
    }
    return r;
}

bool write_all(int fd, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        off += static_cast<size_t>(n);
    }
    return true;
}

} // namespace


void init_log_context() {
    g_log_ctx.userId = current_user();
    g_log_ctx.sessionId = generate_session_id();
    g_log_ctx.ip = remote_address();
}

void set_audit_log_path(const std::string& path) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_audit_log_path = path;
}

std::string audit_log_path() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    return g_audit_log_path.empty() ? std::string(AUDIT_LOG) : g_audit_log_path;
}

const char* log_level_name(LogLevel lvl) {
    switch (lvl) {
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    case LogLevel::ALERT: return "ALERT";
    default:              return "UNKNOWN";
    }
}

std::string format_audit_line(LogLevel lvl, const LogContext& ctx, std::time_t when,
    const std::string& entry, const std::string& event, const std::string& outcome)
{
    std::tm tm{};
    char tbuf[32] = "0000-00-00 00:00:00";
    if (localtime_r(&when, &tm)) {
        std::strftime(tbuf, sizeof(tbuf), "%Y-%m-%d %H:%M:%S", &tm);
    }

    std::ostringstream line;
    line << tbuf
         << " | " << log_level_name(lvl)
         << " | user=" << column(ctx.userId, false)
         << " | ip=" << column(ctx.ip, false)
         << " | session=" << column(ctx.sessionId, false)
         << " | event=" << column(event, false)
         << " | outcome=" << column(outcome, false)
         << " | " << column(entry, true)
         << "\n";
    return line.str();
}

void audit_log_level(
    LogLevel lvl,
    const std::string& entry,
    const std::string& event,
    const std::string& outcome
)
{
    const std::string path = audit_log_path();
    const std::string line = format_audit_line(lvl, g_log_ctx, std::time(nullptr),
        entry, event, outcome);

    // timer thread and request handler both log
    std::lock_guard<std::mutex> lock(g_log_mutex);

    int fd = ::open(path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, S_IRUSR | S_IWUSR);
    if (fd < 0) {
        std::fprintf(stderr, "[audit-fail] %s: %s\n", log_level_name(lvl), entry.c_str());
        return;
    }
    // a file created by someone else keeps its mode through open()
    fchmod(fd, S_IRUSR | S_IWUSR);

    if (!write_all(fd, line)) {
        std::fprintf(stderr, "[audit-fail] %s: %s\n", log_level_name(lvl), entry.c_str());
    }
    fsync(fd);
    ::close(fd);
}

void warn_once(const std::string& key, const std::string& entry, const std::string& event) {
    static std::mutex once_mutex;
    static std::set<std::string> warned;
    {
        std::lock_guard<std::mutex> lock(once_mutex);
        if (!warned.insert(key).second) return;
    }
    std::cerr << "Warning: " << entry << "\n";
    audit_log_level(LogLevel::WARN, entry, event, "degraded");
}
