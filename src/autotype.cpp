#include "autotype.hpp"
#include "logging.hpp"

const char* autotype_state_name(AutotypeState s) {
    switch (s) {
    case AutotypeState::Idle:          return "idle";
    case AutotypeState::Resolving:     return "resolving";
    case AutotypeState::AwaitingFocus: return "awaiting focus";
    case AutotypeState::Injecting:     return "injecting";
    case AutotypeState::Done:          return "done";
    case AutotypeState::Aborted:       return "aborted";
    default:                           return "unknown";
    }
}

Keystroke Keystroke::type(SecretPtr secret) {
    Keystroke k;
    k.text = std::move(secret);
    return k;
}

Keystroke Keystroke::press(std::string key_name) {
    Keystroke k;
    k.key = std::move(key_name);
    return k;
}

namespace {

// Wipes every text step of a payload when the run ends, whatever the path
struct PayloadWiper {
    std::vector<Keystroke>& payload;
    ~PayloadWiper() {
        for (auto& k : payload) {
            if (k.text) k.text->wipe();
        }
    }
};

} // namespace


AutotypeDriver::AutotypeDriver(ProcessRunner& runner, WindowTool& windows,
    FocusPoller& poller, AutotypeSettings settings)
    : runner_(runner), windows_(windows), poller_(poller), settings_(std::move(settings))
{
}

std::string AutotypeDriver::capture_target() {
    state_ = AutotypeState::Resolving;
    try {
        return windows_.active_window();
    }
    catch (const ToolNotFoundError& e) {
        warn_once("focus-tool", "window tool not found (" + e.tool +
            "), autotype target cannot be confirmed", "autotype");
    }
    catch (const EngineError&) {
        audit_log_level(LogLevel::WARN,
            "capture_target: active window query failed",
            "autotype",
            "failure");
    }
    return "";
}

void AutotypeDriver::run(AutotypeRequest req) {
    PayloadWiper wiper{ req.payload };
    degraded_ = false;

    try {
        // ---- AwaitingFocus ----
        state_ = AutotypeState::AwaitingFocus;
        FocusResult focus = FocusResult::Unavailable;
        if (!req.window_id.empty()) {
            try {
                windows_.activate(req.window_id);
            }
            catch (const ToolNotFoundError&) {
                // reported by the poller below
            }
            catch (const EngineError&) {
                // activation is a hint; the poll decides
            }
            focus = poller_.wait_for_focus(req.window_id,
                settings_.focus.poll_interval, settings_.focus.max_attempts);
        }
        else if (window_tool_present()) {
            // the tool works but the target was never captured
            audit_log_level(LogLevel::WARN,
                std::string("Autotype aborted, no target window for ") + field_kind_name(req.kind),
                "autotype",
                "failure");
            throw FocusError("(unknown)");
        }

        if (focus == FocusResult::TimedOut) {
            audit_log_level(LogLevel::WARN,
                std::string("Autotype aborted, no focus on target for ") + field_kind_name(req.kind),
                "autotype",
                "failure");
            throw FocusError(req.window_id);
        }
        if (focus == FocusResult::Unavailable) {
            degraded_ = true;
            warn_once("autotype-unconfirmed",
                "autotype proceeds without focus confirmation", "autotype");
        }

        // ---- Injecting ----
        state_ = AutotypeState::Injecting;
        for (auto& k : req.payload) {
            if (k.text) {
                try {
                    inject_text(*k.text);
                }
                catch (...) {
                    k.text->wipe();
                    throw;
                }
                k.text->mark_consumed();
                k.text->wipe();
            }
            else if (!k.key.empty()) {
                inject_key(k.key);
            }
        }
    }
    catch (const std::exception&) {
        audit_log_level(LogLevel::WARN,
            std::string("Autotype aborted while ") + autotype_state_name(state_.load()),
            "autotype",
            "failure");
        state_ = AutotypeState::Aborted;
        throw;
    }

    state_ = AutotypeState::Done;
    audit_log_level(LogLevel::INFO,
        std::string("Autotype of ") + field_kind_name(req.kind) + " completed" +
        (degraded_ ? " (unconfirmed focus)" : ""),
        "autotype",
        "success");
}

// Only a missing tool allows an unconfirmed run; any other answer means the
// capture itself failed.
bool AutotypeDriver::window_tool_present() {
    try {
        windows_.active_window();
    }
    catch (const ToolNotFoundError& e) {
        warn_once("focus-tool", "window tool not found (" + e.tool +
            "), autotype target cannot be confirmed", "autotype");
        return false;
    }
    catch (const EngineError&) {
        return true;
    }
    return true;
}

void AutotypeDriver::inject_text(const SecretBuffer& text) {
    ProcessRequest req;
    req.command = settings_.xdotool;
    req.args = { "type", "--clearmodifiers", "--delay",
        std::to_string(settings_.delay_ms), "--file", "-" };
    req.stdin_secret = &text;
    // typing speed bounds the run time on top of the tool timeout
    req.timeout = settings_.tool_timeout +
        std::chrono::milliseconds(static_cast<long long>(settings_.delay_ms) * text.size());
    runner_.run(req);
}

void AutotypeDriver::inject_key(const std::string& key) {
    ProcessRequest req;
    req.command = settings_.xdotool;
    req.args = { "key", "--clearmodifiers", key };
    req.timeout = settings_.tool_timeout;
    runner_.run(req);
}
