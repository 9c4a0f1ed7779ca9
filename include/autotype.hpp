#pragma once
#include "kpx_common.hpp"
#include "focus.hpp"
#include "process_runner.hpp"
#include "secret_buffer.hpp"

#include <string>
#include <vector>

// -------- Autotype --------

enum class AutotypeState { Idle, Resolving, AwaitingFocus, Injecting, Done, Aborted };

const char* autotype_state_name(AutotypeState s);

// One step of the keystroke payload: either secret text (sent through the
// injection tool's stdin) or a named control key such as "Tab".
struct Keystroke {
    SecretPtr text;
    std::string key;

    static Keystroke type(SecretPtr secret);
    static Keystroke press(std::string key_name);
};

struct AutotypeRequest {
    FieldKind kind = FieldKind::Password;
    // captured before any of our own UI took focus; "" = unknown
    std::string window_id;
    std::vector<Keystroke> payload;
};

struct AutotypeSettings {
    std::string xdotool = DEFAULT_XDOTOOL;
    std::chrono::milliseconds tool_timeout{ DEFAULT_TOOL_TIMEOUT_SECONDS * 1000 };
    unsigned delay_ms = DEFAULT_AUTOTYPE_DELAY_MS;
    FocusPolicy focus;
};

class AutotypeDriver {
public:
    AutotypeDriver(ProcessRunner& runner, WindowTool& windows, FocusPoller& poller,
        AutotypeSettings settings);

    // Resolving: identifier of the window focused right now
    std::string capture_target();

    // AwaitingFocus -> Injecting -> Done. On any failure the state is Aborted
    // and the error propagates (FocusError when the target never got focus).
    // Every text buffer of the payload is wiped before this returns.
    void run(AutotypeRequest req);

    AutotypeState state() const noexcept { return state_.load(); }
    // true when the last run injected without focus confirmation
    bool degraded() const noexcept { return degraded_; }

    void set_settings(const AutotypeSettings& s) { settings_ = s; }

private:
    bool window_tool_present();
    void inject_text(const SecretBuffer& text);
    void inject_key(const std::string& key);

    ProcessRunner& runner_;
    WindowTool& windows_;
    FocusPoller& poller_;
    AutotypeSettings settings_;
    std::atomic<AutotypeState> state_{ AutotypeState::Idle };
    bool degraded_ = false;
};
