#include "session.hpp"
#include "logging.hpp"

#include <future>

const char* session_state_name(SessionState s) {
    switch (s) {
    case SessionState::Locked:       return "locked";
    case SessionState::Unlocking:    return "unlocking";
    case SessionState::Unlocked:     return "unlocked";
    case SessionState::ForceLocking: return "force-locking";
    default:                         return "unknown";
    }
}

const char* lock_reason_name(LockReason r) {
    switch (r) {
    case LockReason::Timeout:  return "inactivity timeout";
    case LockReason::User:     return "user request";
    case LockReason::Error:    return "engine error";
    case LockReason::Reload:   return "configuration reload";
    case LockReason::Shutdown: return "shutdown";
    default:                   return "unknown";
    }
}


SessionManager::SessionManager(CredentialStore& store, FocusPoller& poller,
    std::chrono::milliseconds inactivity_timeout, std::chrono::milliseconds granularity)
    : store_(store), poller_(poller),
      last_activity_(Clock::now()),
      timeout_(inactivity_timeout),
      granularity_(granularity.count() > 0 ? granularity : std::chrono::milliseconds(DEFAULT_TIMER_GRANULARITY_MS))
{
    registry_.seal_and_wipe();
    // independent of request threads: a hung tool cannot hold off the lock
    timer_ = std::thread([this]() { timer_loop(); });
}

SessionManager::~SessionManager() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    if (timer_.joinable()) timer_.join();
    lock(LockReason::Shutdown);
}

void SessionManager::timer_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_) {
        auto wake = Clock::now() + granularity_;
        const bool armed = state_ == SessionState::Unlocked && timeout_.count() > 0;
        if (armed) {
            wake = std::min(wake, last_activity_ + timeout_);
        }
        cv_.wait_until(lock, wake);
        if (stop_) break;

        if (state_ == SessionState::Unlocked && timeout_.count() > 0 &&
            Clock::now() - last_activity_ >= timeout_) {
            lock.unlock();
            this->lock(LockReason::Timeout);
            lock.lock();
        }
    }
}

bool SessionManager::unlock(SecretPtr passphrase) {
    if (!passphrase) return false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::Unlocked) {
            passphrase->wipe();
            return true;
        }
        state_ = SessionState::Unlocking;
        registry_.unseal();
        passphrase->attach(&registry_);
    }

    bool ok = false;
    try {
        ok = store_.verify(*passphrase);
    }
    catch (const std::exception&) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::Unlocking) {
            state_ = SessionState::Locked;
            registry_.seal_and_wipe();
        }
        passphrase->wipe();
        throw;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::Unlocking) {
        // locked while verifying
        passphrase->wipe();
        audit_log_level(LogLevel::WARN,
            std::string("Unlock discarded, session now ") + session_state_name(state_),
            "unlock",
            "failure");
        return false;
    }
    if (!ok) {
        state_ = SessionState::Locked;
        registry_.seal_and_wipe();
        audit_log_level(LogLevel::WARN,
            "Unlock rejected for " + store_.database(),
            "unlock",
            "failure");
        return false;
    }
    passphrase_ = std::move(passphrase);
    state_ = SessionState::Unlocked;
    last_activity_ = Clock::now();
    cv_.notify_all();
    audit_log_level(LogLevel::INFO,
        "Database unlocked: " + store_.database(),
        "unlock",
        "success");
    return true;
}

bool SessionManager::unlock_with_prompt(PassphrasePrompt& prompt, const FocusPolicy& policy) {
    if (unlocked()) return true;

    const std::string title = prompt.window_title();
    if (title.empty()) {
        SecretPtr pass = prompt.read(nullptr);
        if (!pass) return false;
        return unlock(std::move(pass));
    }

    // the prompt blocks in its own task while this thread confirms focus
    std::atomic<bool> prompt_done{ false };
    auto pending = std::async(std::launch::async, [&prompt, &prompt_done]() {
        struct Done {
            std::atomic<bool>& flag;
            ~Done() { flag.store(true); }
        } done{ prompt_done };
        return prompt.read(nullptr);
    });

    FocusResult focus = poller_.wait_for_titled_window(title,
        policy.poll_interval, policy.max_attempts, &prompt_done);

    SecretPtr pass = pending.get();
    if (!pass) return false;
    audit_log_level(LogLevel::INFO,
        "Unlock prompt focus: " + std::string(focus_result_name(focus)),
        "unlock",
        "notify");

    if (focus == FocusResult::TimedOut) {
        pass->wipe();
        audit_log_level(LogLevel::WARN,
            "Unlock prompt \"" + title + "\" never confirmed focused, input discarded",
            "unlock",
            "failure");
        throw UnlockFocusError();
    }
    return unlock(std::move(pass));
}

void SessionManager::lock(LockReason reason) noexcept {
    size_t wiped = 0;
    size_t remaining = 0;
    LockListener listener;
    bool was_open = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        was_open = state_ != SessionState::Locked;
        state_ = SessionState::ForceLocking;
        wiped = registry_.seal_and_wipe();
        remaining = registry_.live();
        if (passphrase_) {
            passphrase_->wipe();
            passphrase_.reset();
        }
        state_ = SessionState::Locked;
        listener = listener_;
    }
    cv_.notify_all();

    if (remaining != 0) {
        audit_log_level(LogLevel::ALERT,
            "lock: " + std::to_string(remaining) + " buffers still tracked after wipe",
            "session",
            "failure");
    }
    if (was_open) {
        audit_log_level(LogLevel::INFO,
            std::string("Session locked (") + lock_reason_name(reason) + "), " +
            std::to_string(wiped) + " buffers wiped",
            "lock",
            "success");
    }

    if (listener && was_open) {
        try {
            listener(reason);
        }
        catch (const std::exception& e) {
            audit_log_level(LogLevel::ALERT,
                std::string("lock listener failed: ") + e.what(),
                "session",
                "failure");
        }
    }
}

void SessionManager::touch() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SessionState::Unlocked) {
        last_activity_ = Clock::now();
    }
}

void SessionManager::set_timeout(std::chrono::milliseconds timeout) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        timeout_ = timeout;
    }
    cv_.notify_all();
}

std::chrono::milliseconds SessionManager::timeout() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timeout_;
}

SecretPtr SessionManager::passphrase_copy() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::Unlocked || !passphrase_) {
        throw SessionLockedError();
    }
    return clone_secret(*passphrase_, FieldKind::Passphrase, &registry_);
}

SecretPtr SessionManager::make_secret(FieldKind kind, std::string_view content) {
    if (!unlocked()) {
        throw SessionLockedError();
    }
    // a lock racing with this call seals the registry and the buffer dies
    return ::make_secret(kind, content, &registry_);
}

SessionState SessionManager::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

SessionManager::Clock::time_point SessionManager::last_activity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_activity_;
}

void SessionManager::set_lock_listener(LockListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}
