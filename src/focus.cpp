#include "focus.hpp"
#include "logging.hpp"

const char* focus_result_name(FocusResult r) {
    switch (r) {
    case FocusResult::Focused:     return "focused";
    case FocusResult::TimedOut:    return "timed out";
    case FocusResult::Unavailable: return "unavailable";
    default:                       return "unknown";
    }
}

static std::string first_line(const std::string& s) {
    std::string line = s.substr(0, s.find('\n'));
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
        line.pop_back();
    }
    return line;
}

// xdotool search takes a POSIX extended regex
static std::string exact_title_regex(const std::string& title) {
    static const std::string special = "\\^$.|?*+()[]{}";
    std::string r = "^";
    for (char c : title) {
        if (special.find(c) != std::string::npos) r.push_back('\\');
        r.push_back(c);
    }
    r.push_back('$');
    return r;
}


// ---------------- XdotoolWindowTool ----------------
XdotoolWindowTool::XdotoolWindowTool(ProcessRunner& runner, std::string xdotool,
    std::chrono::milliseconds timeout)
    : runner_(runner), xdotool_(std::move(xdotool)), timeout_(timeout)
{
}

ProcessResult XdotoolWindowTool::query(const std::vector<std::string>& args) {
    ProcessRequest req;
    req.command = xdotool_;
    req.args = args;
    req.timeout = timeout_;
    return runner_.run(req);
}

std::string XdotoolWindowTool::active_window() {
    try {
        return first_line(query({ "getactivewindow" }).stdout_data);
    }
    catch (const ExternalToolError&) {
        // xdotool exits 1 when no window has focus
        return "";
    }
}

void XdotoolWindowTool::activate(const std::string& window_id) {
    query({ "windowactivate", window_id });
}

std::string XdotoolWindowTool::find_window(const std::string& title) {
    try {
        return first_line(query({ "search", "--name", exact_title_regex(title) }).stdout_data);
    }
    catch (const ExternalToolError&) {
        return "";
    }
}


// ---------------- FocusPoller ----------------
FocusPoller::FocusPoller(WindowTool& tool, Sleeper sleeper)
    : tool_(tool), sleep_(std::move(sleeper))
{
    if (!sleep_) {
        sleep_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

FocusResult FocusPoller::wait_for_focus(const std::string& window_id,
    std::chrono::milliseconds poll_interval,
    unsigned max_attempts)
{
    last_checks_ = 0;
    for (unsigned attempt = 0; attempt < max_attempts; ++attempt) {
        if (attempt > 0) sleep_(poll_interval);
        std::string active;
        try {
            ++last_checks_;
            active = tool_.active_window();
        }
        catch (const ToolNotFoundError& e) {
            warn_once("focus-tool", "window tool not found (" + e.tool +
                "), focus cannot be confirmed", "focus_poller");
            return FocusResult::Unavailable;
        }
        catch (const EngineError&) {
            // timeout or tool failure counts as a failed check
            continue;
        }
        if (!window_id.empty() && active == window_id) {
            return FocusResult::Focused;
        }
    }
    audit_log_level(LogLevel::WARN,
        "wait_for_focus: window " + window_id + " not focused after " +
        std::to_string(last_checks_) + " checks",
        "focus_poller",
        "failure");
    return FocusResult::TimedOut;
}

FocusResult FocusPoller::wait_for_titled_window(const std::string& title,
    std::chrono::milliseconds poll_interval,
    unsigned max_attempts,
    const std::atomic<bool>* cancel)
{
    last_checks_ = 0;
    for (unsigned attempt = 0; attempt < max_attempts; ++attempt) {
        if (cancel && cancel->load()) break;
        if (attempt > 0) sleep_(poll_interval);
        try {
            ++last_checks_;
            std::string id = tool_.find_window(title);
            if (id.empty()) continue; // window not mapped yet
            if (tool_.active_window() == id) {
                return FocusResult::Focused;
            }
            tool_.activate(id);
            if (tool_.active_window() == id) {
                return FocusResult::Focused;
            }
        }
        catch (const ToolNotFoundError& e) {
            warn_once("focus-tool", "window tool not found (" + e.tool +
                "), focus cannot be confirmed", "focus_poller");
            return FocusResult::Unavailable;
        }
        catch (const EngineError&) {
            continue;
        }
    }
    audit_log_level(LogLevel::WARN,
        "wait_for_titled_window: \"" + title + "\" not focused",
        "focus_poller",
        "failure");
    return FocusResult::TimedOut;
}
