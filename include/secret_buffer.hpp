#pragma once
#include "kpx_common.hpp"
#include "errors.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string_view>
#include <unordered_set>

class SecretRegistry;

// Wipeable container for one piece of decrypted material.
//
// Storage comes from sodium_malloc and stays PROT_NONE except inside
// with_view(). wipe() zeroes and frees the storage immediately; afterwards
// every view fails with AlreadyWipedError. View and wipe are serialized on
// the buffer's mutex, so a wipe never overlaps a read.
class SecretBuffer {
public:
    using Clock = std::chrono::steady_clock;

    SecretBuffer(FieldKind kind, std::string_view content, SecretRegistry* registry = nullptr);
    ~SecretBuffer();

    // Non-copyable, non-movable: the registry tracks the address
    SecretBuffer(const SecretBuffer&) = delete;
    SecretBuffer& operator=(const SecretBuffer&) = delete;
    SecretBuffer(SecretBuffer&&) = delete;
    SecretBuffer& operator=(SecretBuffer&&) = delete;

    template <typename Fn>
    auto with_view(Fn&& fn) const -> decltype(fn(std::string_view{})) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (wiped_) {
            throw AlreadyWipedError();
        }
        sodium_mprotect_readonly(ptr_);
        struct Reprotect {
            char* p;
            ~Reprotect() { sodium_mprotect_noaccess(p); }
        } reprotect{ ptr_ };
        return fn(std::string_view(ptr_, size_));
    }

    // Returns true when this call destroyed the content
    bool wipe() noexcept;

    bool wiped() const;
    FieldKind kind() const noexcept { return kind_; }
    size_t size() const noexcept { return size_; }
    Clock::time_point created() const noexcept { return created_; }

    bool consumed() const noexcept { return consumed_.load(); }
    void mark_consumed() noexcept { consumed_.store(true); }

    // Starts tracking in a registry (no-op when already tracked). A sealed
    // registry refuses the buffer and it is wiped on the spot.
    void attach(SecretRegistry* registry);
    bool attached() const noexcept { return registry_.load() != nullptr; }

private:
    friend class SecretRegistry;

    bool wipe_storage() noexcept;

    mutable std::mutex mutex_;
    char* ptr_ = nullptr;
    size_t size_ = 0;
    size_t alloc_size_ = 0;
    bool wiped_ = false;
    FieldKind kind_;
    Clock::time_point created_;
    std::atomic<bool> consumed_{ false };
    std::atomic<SecretRegistry*> registry_{ nullptr };
};

using SecretPtr = std::unique_ptr<SecretBuffer>;

// Weak accounting of live buffers. Holds addresses only; owners keep the
// buffers. wipe_all() is the session's force-wipe; while sealed (session
// locked) no buffer can be added.
//
// Lock order: registry before buffer. Never register while holding a view.
class SecretRegistry {
public:
    SecretRegistry() = default;
    ~SecretRegistry();

    SecretRegistry(const SecretRegistry&) = delete;
    SecretRegistry& operator=(const SecretRegistry&) = delete;

    // false when sealed
    bool add(SecretBuffer* buf);
    void remove(SecretBuffer* buf);

    // Wipes and forgets every tracked buffer; returns how many were wiped
    size_t wipe_all() noexcept;
    size_t seal_and_wipe() noexcept;
    void unseal();
    bool sealed() const;

    size_t live() const;
    size_t wiped_count() const noexcept { return wiped_count_.load(); }
    void note_wiped() noexcept { wiped_count_.fetch_add(1); }

private:
    size_t wipe_locked() noexcept;

    mutable std::mutex mutex_;
    std::unordered_set<SecretBuffer*> live_;
    bool sealed_ = false;
    std::atomic<size_t> wiped_count_{ 0 };
};

// Wipes a buffer when the scope ends, whatever the exit path
class SecretWipeGuard {
public:
    explicit SecretWipeGuard(SecretBuffer* buf) noexcept : buf_(buf) {}
    ~SecretWipeGuard() {
        if (buf_) buf_->wipe();
    }

    SecretWipeGuard(const SecretWipeGuard&) = delete;
    SecretWipeGuard& operator=(const SecretWipeGuard&) = delete;

private:
    SecretBuffer* buf_;
};

SecretPtr make_secret(FieldKind kind, std::string_view content, SecretRegistry* registry = nullptr);

// Copies the content of one buffer into a fresh one (same registry)
SecretPtr clone_secret(const SecretBuffer& src, FieldKind kind, SecretRegistry* registry);

// Zeroes a temporary string that held secret material
void wipe_string(std::string& s) noexcept;
