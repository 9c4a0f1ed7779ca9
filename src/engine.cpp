#include "engine.hpp"
#include "logging.hpp"
#include "util.hpp"

AutotypeSettings autotype_settings_from(const Config& cfg) {
    AutotypeSettings s;
    s.xdotool = cfg.xdotool_path;
    s.tool_timeout = std::chrono::seconds(cfg.tool_timeout_seconds);
    s.delay_ms = cfg.autotype_delay_ms;
    s.focus.poll_interval = std::chrono::milliseconds(cfg.focus_poll_ms);
    s.focus.max_attempts = cfg.focus_attempts;
    return s;
}

Engine::Engine(const Config& cfg, ProcessRunner& runner, WindowTool& windows,
    FocusPoller::Sleeper sleeper, ClipboardCoordinator::ToolCheck tool_check)
    : cfg_(cfg),
      runner_(runner),
      store_(runner, cfg.cli_path, std::chrono::seconds(cfg.tool_timeout_seconds)),
      poller_(windows, std::move(sleeper)),
      autotype_(runner, windows, poller_, autotype_settings_from(cfg)),
      clipboard_(runner, store_, cfg.clip_clear_seconds, std::move(tool_check)),
      session_(store_, poller_,
          std::chrono::seconds(cfg.inactivity_timeout_seconds),
          std::chrono::milliseconds(cfg.timer_granularity_ms))
{
    store_.set_database(expand_home(cfg.database_path));
}

FocusPolicy Engine::focus_policy() const {
    FocusPolicy p;
    p.poll_interval = std::chrono::milliseconds(cfg_.focus_poll_ms);
    p.max_attempts = cfg_.focus_attempts;
    return p;
}

void Engine::check_entry(const std::string& entry) {
    if (!valid_entry_name(entry)) {
        throw InvalidInputError("entry name");
    }
}

bool Engine::unlock(SecretPtr passphrase) {
    return session_.unlock(std::move(passphrase));
}

bool Engine::unlock(PassphrasePrompt& prompt) {
    return session_.unlock_with_prompt(prompt, focus_policy());
}

std::unique_ptr<PassphrasePrompt> Engine::make_prompt() {
    if (!cfg_.prompt_command.empty()) {
        return std::make_unique<CommandPrompt>(runner_, cfg_.prompt_command,
            cfg_.prompt_title, std::chrono::seconds(cfg_.prompt_timeout_seconds));
    }
    return std::make_unique<TerminalPrompt>();
}

SearchResults Engine::search(const std::string& term) {
    return request("search", [&]() {
        SearchResults out;
        if (term.empty()) {
            out.entries = recent();
            return out;
        }
        if (!valid_search_term(term)) {
            throw InvalidInputError("search term");
        }
        SecretPtr pass = session_.passphrase_copy();
        SecretWipeGuard guard(pass.get());
        out.entries = store_.search(*pass, term);
        if (out.entries.size() > cfg_.max_results) {
            out.more = out.entries.size() - cfg_.max_results;
            out.entries.resize(cfg_.max_results);
        }
        return out;
    });
}

EntryDetails Engine::details(const std::string& entry) {
    return request("details", [&]() {
        check_entry(entry);
        SecretPtr pass = session_.passphrase_copy();
        SecretWipeGuard guard(pass.get());
        EntryDetails d = store_.details(*pass, entry);
        remember(entry);
        return d;
    });
}

ClipboardTransfer Engine::copy(const std::string& entry, FieldKind kind) {
    return request("copy", [&]() {
        check_entry(entry);
        ClipboardTransfer t = clipboard_.copy(entry, kind, session_.passphrase_copy());
        remember(entry);
        return t;
    });
}

std::string Engine::capture_target() {
    return autotype_.capture_target();
}

void Engine::autotype(const std::string& target, const std::string& entry, FieldKind kind) {
    request("autotype", [&]() {
        check_entry(entry);
        AutotypeRequest req;
        req.kind = kind;
        req.window_id = target;
        {
            SecretPtr pass = session_.passphrase_copy();
            SecretWipeGuard guard(pass.get());
            req.payload.push_back(Keystroke::type(
                store_.fetch(*pass, entry, kind, &session_.registry())));
        }
        autotype_.run(std::move(req));
        remember(entry);
    });
}

void Engine::autotype_login(const std::string& target, const std::string& entry) {
    request("autotype_login", [&]() {
        check_entry(entry);
        AutotypeRequest req;
        req.kind = FieldKind::Password;
        req.window_id = target;
        {
            SecretPtr pass = session_.passphrase_copy();
            SecretWipeGuard guard(pass.get());
            try {
                req.payload.push_back(Keystroke::type(
                    store_.fetch(*pass, entry, FieldKind::Username, &session_.registry())));
            }
            catch (const EmptyAttributeError&) {
                // no username: still Tab into the password field
                audit_log_level(LogLevel::INFO,
                    "autotype_login: entry has no username, typing password only",
                    "autotype",
                    "notify");
            }
            req.payload.push_back(Keystroke::press("Tab"));
            req.payload.push_back(Keystroke::type(
                store_.fetch(*pass, entry, FieldKind::Password, &session_.registry())));
            req.payload.push_back(Keystroke::press("Return"));
        }
        autotype_.run(std::move(req));
        remember(entry);
    });
}

void Engine::lock() {
    session_.lock(LockReason::User);
}

void Engine::reload(const Config& cfg) {
    const std::string old_db = store_.database();
    const std::string new_db = expand_home(cfg.database_path);
    const bool relock = new_db != old_db ||
        cfg.inactivity_timeout_seconds != cfg_.inactivity_timeout_seconds ||
        cfg.cli_path != cfg_.cli_path;

    if (relock) {
        session_.lock(LockReason::Reload);
    }
    if (new_db != old_db) {
        std::lock_guard<std::mutex> lock(recent_mutex_);
        recent_.clear();
    }
    if (cfg.xdotool_path != cfg_.xdotool_path) {
        audit_log_level(LogLevel::WARN,
            "reload: xdotool path change takes effect after restart",
            "engine",
            "ignored");
    }

    store_.set_database(new_db);
    store_.set_cli(cfg.cli_path);
    store_.set_timeout(std::chrono::seconds(cfg.tool_timeout_seconds));
    session_.set_timeout(std::chrono::seconds(cfg.inactivity_timeout_seconds));
    clipboard_.set_clear_seconds(cfg.clip_clear_seconds);

    AutotypeSettings s = autotype_settings_from(cfg);
    s.xdotool = cfg_.xdotool_path;
    autotype_.set_settings(s);

    std::string keep_xdotool = cfg_.xdotool_path;
    cfg_ = cfg;
    cfg_.xdotool_path = keep_xdotool;

    audit_log_level(LogLevel::INFO,
        std::string("Configuration reloaded") + (relock ? ", session locked" : ""),
        "engine",
        "success");
}

std::vector<std::string> Engine::recent() const {
    std::lock_guard<std::mutex> lock(recent_mutex_);
    return std::vector<std::string>(recent_.begin(), recent_.end());
}

void Engine::remember(const std::string& entry) {
    std::lock_guard<std::mutex> lock(recent_mutex_);
    auto it = std::find(recent_.begin(), recent_.end(), entry);
    if (it != recent_.end()) recent_.erase(it);
    recent_.push_front(entry);
    while (recent_.size() > cfg_.max_results) recent_.pop_back();
}
