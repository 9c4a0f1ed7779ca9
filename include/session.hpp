#pragma once
#include "kpx_common.hpp"
#include "credential_store.hpp"
#include "focus.hpp"
#include "prompt.hpp"
#include "secret_buffer.hpp"

#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

// -------- Session manager --------
// Owns the lock state, the cached database passphrase, the live-buffer
// registry and the inactivity timer thread.
//
// Invariant: while Locked the registry is sealed and empty, so no secret
// buffer created for this session can exist.

enum class SessionState { Locked, Unlocking, Unlocked, ForceLocking };
enum class LockReason { Timeout, User, Error, Reload, Shutdown };

const char* session_state_name(SessionState s);
const char* lock_reason_name(LockReason r);

class SessionManager {
public:
    using Clock = std::chrono::steady_clock;
    using LockListener = std::function<void(LockReason)>;

    SessionManager(CredentialStore& store, FocusPoller& poller,
        std::chrono::milliseconds inactivity_timeout,
        std::chrono::milliseconds granularity = std::chrono::milliseconds(DEFAULT_TIMER_GRANULARITY_MS));
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Verifies the passphrase with the store and caches it. false when the
    // store rejects it; the passphrase is wiped in that case.
    bool unlock(SecretPtr passphrase);

    // Runs the prompt; a prompt with a window must be confirmed focused by
    // the poller or the entry is discarded with UnlockFocusError.
    // false when the prompt was cancelled or the passphrase rejected.
    bool unlock_with_prompt(PassphrasePrompt& prompt, const FocusPolicy& policy);

    // Wipe every live buffer, drop the cached passphrase, then Locked.
    // Completes even if a wipe reports a failure.
    void lock(LockReason reason = LockReason::User) noexcept;

    // Activity: re-arms the inactivity timer
    void touch();

    // 0 disables the inactivity lock
    void set_timeout(std::chrono::milliseconds timeout);
    std::chrono::milliseconds timeout() const;

    // Per-request copy of the cached passphrase, tracked by the registry.
    // Throws SessionLockedError unless Unlocked.
    SecretPtr passphrase_copy();

    // New tracked buffer; throws SessionLockedError unless Unlocked
    SecretPtr make_secret(FieldKind kind, std::string_view content);

    SecretRegistry& registry() noexcept { return registry_; }
    size_t live_secrets() const { return registry_.live(); }

    SessionState state() const;
    bool unlocked() const { return state() == SessionState::Unlocked; }
    Clock::time_point last_activity() const;

    // Called after every forced lock, from the locking thread
    void set_lock_listener(LockListener listener);

private:
    void timer_loop();

    CredentialStore& store_;
    FocusPoller& poller_;
    SecretRegistry registry_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    SessionState state_ = SessionState::Locked;
    SecretPtr passphrase_;
    Clock::time_point last_activity_;
    std::chrono::milliseconds timeout_;
    std::chrono::milliseconds granularity_;
    LockListener listener_;
    bool stop_ = false;
    std::thread timer_;
};
