#pragma once
#include "kpx_common.hpp"
#include "process_runner.hpp"

#include <chrono>
#include <functional>
#include <string>

// -------- Window focus --------

enum class FocusResult {
    Focused,
    TimedOut,
    Unavailable   // window tool missing: caller continues unconfirmed
};

const char* focus_result_name(FocusResult r);

struct FocusPolicy {
    std::chrono::milliseconds poll_interval{ DEFAULT_FOCUS_POLL_MS };
    unsigned max_attempts = DEFAULT_FOCUS_ATTEMPTS;
};

// Queries and activates windows through an external tool
class WindowTool {
public:
    virtual ~WindowTool() = default;

    // Identifier of the focused window; "" when nothing has focus
    virtual std::string active_window() = 0;
    virtual void activate(const std::string& window_id) = 0;
    // First window whose title matches exactly; "" when none
    virtual std::string find_window(const std::string& title) = 0;
};

class XdotoolWindowTool : public WindowTool {
public:
    XdotoolWindowTool(ProcessRunner& runner, std::string xdotool,
        std::chrono::milliseconds timeout);

    std::string active_window() override;
    void activate(const std::string& window_id) override;
    std::string find_window(const std::string& title) override;

private:
    ProcessResult query(const std::vector<std::string>& args);

    ProcessRunner& runner_;
    std::string xdotool_;
    std::chrono::milliseconds timeout_;
};

// Active polling: every check is a real query of the focused window. No
// fixed sleep ever stands in for a confirmation.
class FocusPoller {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    explicit FocusPoller(WindowTool& tool, Sleeper sleeper = Sleeper());

    // Exactly max_attempts checks at most, poll_interval between them
    FocusResult wait_for_focus(const std::string& window_id,
        std::chrono::milliseconds poll_interval,
        unsigned max_attempts);

    // Finds the window by title, activates it and confirms focus.
    // Stops early with TimedOut when *cancel becomes true.
    FocusResult wait_for_titled_window(const std::string& title,
        std::chrono::milliseconds poll_interval,
        unsigned max_attempts,
        const std::atomic<bool>* cancel = nullptr);

    unsigned last_checks() const noexcept { return last_checks_; }

private:
    WindowTool& tool_;
    Sleeper sleep_;
    unsigned last_checks_ = 0;
};
