#pragma once
#include "kpx_common.hpp"

// -------- Logging (levels) --------
enum class LogLevel { INFO, WARN, ERROR, ALERT }; // levels

struct LogContext {
    std::string userId;
    std::string sessionId;
    std::string ip;
};

extern LogContext g_log_ctx;

// Initialize global logging context
void init_log_context();

// Redirect the audit log; empty path restores the default "audit.log"
void set_audit_log_path(const std::string& path);
std::string audit_log_path();

const char* log_level_name(LogLevel lvl);

// One audit record, newline-terminated:
// timestamp | LEVEL | user= | ip= | session= | event= | outcome= | message
// Control characters become spaces; '|' is replaced outside the message column.
std::string format_audit_line(LogLevel lvl, const LogContext& ctx, std::time_t when,
    const std::string& entry, const std::string& event, const std::string& outcome);

// Log with level, message, optional event + outcome
// audit_log_level(LogLevel::INFO, "Database unlocked", "session", "success");
// Never pass secret material in any of the fields.
void audit_log_level(
    LogLevel lvl,
    const std::string& entry,
    const std::string& event = "",
    const std::string& outcome = ""
);

// Logs a WARN once per process for the given key (degraded optional tools)
void warn_once(const std::string& key, const std::string& entry, const std::string& event);
