#pragma once
#include "kpx_common.hpp"
#include "autotype.hpp"
#include "clipboard.hpp"
#include "config.hpp"
#include "credential_store.hpp"
#include "focus.hpp"
#include "logging.hpp"
#include "process_runner.hpp"
#include "prompt.hpp"
#include "session.hpp"

#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <vector>

// -------- Engine facade --------
// One object per process. Each public operation is a request: on success it
// re-arms the inactivity timer; taxonomy errors end the request and
// propagate for user_message(); anything else also locks the session.

struct SearchResults {
    std::vector<std::string> entries;
    size_t more = 0;        // matches dropped by max-results
};

AutotypeSettings autotype_settings_from(const Config& cfg);

class Engine {
public:
    Engine(const Config& cfg, ProcessRunner& runner, WindowTool& windows,
        FocusPoller::Sleeper sleeper = FocusPoller::Sleeper(),
        ClipboardCoordinator::ToolCheck tool_check = ClipboardCoordinator::ToolCheck());

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    bool unlock(SecretPtr passphrase);
    bool unlock(PassphrasePrompt& prompt);
    // Prompt built from the configuration (external command or terminal)
    std::unique_ptr<PassphrasePrompt> make_prompt();

    // Empty term lists the recently used entries
    SearchResults search(const std::string& term);
    EntryDetails details(const std::string& entry);
    ClipboardTransfer copy(const std::string& entry, FieldKind kind);

    // Must run before any UI of ours takes focus
    std::string capture_target();
    void autotype(const std::string& target, const std::string& entry, FieldKind kind);
    // UserName, Tab, Password, Return
    void autotype_login(const std::string& target, const std::string& entry);

    void lock();
    // Database, timeout or tool change locks the session first
    void reload(const Config& cfg);

    std::vector<std::string> recent() const;

    const Config& config() const noexcept { return cfg_; }
    SessionManager& session() noexcept { return session_; }
    AutotypeDriver& autotype_driver() noexcept { return autotype_; }
    CredentialStore& store() noexcept { return store_; }

private:
    template <typename Fn>
    auto request(const char* op, Fn&& fn) -> decltype(fn());

    void remember(const std::string& entry);
    FocusPolicy focus_policy() const;
    static void check_entry(const std::string& entry);

    Config cfg_;
    ProcessRunner& runner_;
    CredentialStore store_;
    FocusPoller poller_;
    AutotypeDriver autotype_;
    ClipboardCoordinator clipboard_;

    mutable std::mutex recent_mutex_;
    std::deque<std::string> recent_;

    // last member: destroyed first, wiping everything still live
    SessionManager session_;
};

template <typename Fn>
auto Engine::request(const char* op, Fn&& fn) -> decltype(fn()) {
    try {
        if constexpr (std::is_void_v<decltype(fn())>) {
            fn();
            session_.touch();
        }
        else {
            auto result = fn();
            session_.touch();
            return result;
        }
    }
    catch (const EngineError&) {
        throw;
    }
    catch (const std::exception& e) {
        audit_log_level(LogLevel::ALERT,
            std::string(op) + ": unexpected failure: " + e.what(),
            "engine",
            "failure");
        session_.lock(LockReason::Error);
        throw;
    }
}
