#include "secret_buffer.hpp"
#include "logging.hpp"

// ---------------- SecretBuffer ----------------
SecretBuffer::SecretBuffer(FieldKind kind, std::string_view content, SecretRegistry* registry)
    : size_(content.size()),
      kind_(kind),
      created_(Clock::now())
{
    if (sodium_init() < 0) {
        throw AllocationError("SecretBuffer: libsodium initialization failed");
    }
    if (content.size() > MAX_SECRET_LEN) {
        throw AllocationError("SecretBuffer: secret too large");
    }

    // sodium_malloc(0) is valid but keep one guarded byte for a stable address
    alloc_size_ = size_ > 0 ? size_ : 1;
    ptr_ = static_cast<char*>(sodium_malloc(alloc_size_));
    if (!ptr_) {
        throw AllocationError("SecretBuffer: sodium_malloc failed");
    }

    if (sodium_mlock(ptr_, alloc_size_) != 0) {
        audit_log_level(LogLevel::WARN,
            "SecretBuffer: sodium_mlock failed, secret may be swapped",
            "secret_buffer",
            "degraded");
    }

    sodium_memzero(ptr_, alloc_size_);
    if (size_ > 0) {
        std::memcpy(ptr_, content.data(), size_);
    }
    sodium_mprotect_noaccess(ptr_);

    attach(registry);
}

void SecretBuffer::attach(SecretRegistry* registry) {
    if (!registry || registry_.load()) {
        return;
    }
    registry_.store(registry);
    if (!registry->add(this)) {
        registry_.store(nullptr);
        wipe_storage();
        audit_log_level(LogLevel::WARN,
            "SecretBuffer: created while session locked, wiped immediately",
            "secret_buffer",
            "failure");
    }
}

SecretBuffer::~SecretBuffer() {
    wipe();
}

bool SecretBuffer::wipe() noexcept {
    // deregister first; the registry lock is never taken under mutex_
    SecretRegistry* reg = registry_.exchange(nullptr);
    if (reg) {
        reg->remove(this);
    }
    bool did = wipe_storage();
    if (did && reg) {
        reg->note_wiped();
    }
    return did;
}

bool SecretBuffer::wipe_storage() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (wiped_) {
        return false;
    }
    wiped_ = true;
    if (ptr_) {
        if (sodium_mprotect_readwrite(ptr_) == 0) {
            sodium_memzero(ptr_, alloc_size_);
        }
        else {
            // sodium_free still zeroes the region before unmapping it
            audit_log_level(LogLevel::ALERT,
                "SecretBuffer: mprotect failed during wipe",
                "secret_buffer",
                "failure");
        }
        sodium_munlock(ptr_, alloc_size_);
        sodium_free(ptr_);
    }
    ptr_ = nullptr;
    size_ = 0;
    alloc_size_ = 0;
    return true;
}

bool SecretBuffer::wiped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return wiped_;
}


// ---------------- SecretRegistry ----------------
SecretRegistry::~SecretRegistry() {
    wipe_all();
}

bool SecretRegistry::add(SecretBuffer* buf) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sealed_) return false;
    live_.insert(buf);
    return true;
}

void SecretRegistry::remove(SecretBuffer* buf) {
    std::lock_guard<std::mutex> lock(mutex_);
    live_.erase(buf);
}

size_t SecretRegistry::wipe_all() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return wipe_locked();
}

size_t SecretRegistry::seal_and_wipe() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    sealed_ = true;
    return wipe_locked();
}

void SecretRegistry::unseal() {
    std::lock_guard<std::mutex> lock(mutex_);
    sealed_ = false;
}

bool SecretRegistry::sealed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sealed_;
}

size_t SecretRegistry::wipe_locked() noexcept {
    size_t n = 0;
    for (SecretBuffer* buf : live_) {
        // wipe before detaching: an owner that still sees the registry blocks
        // in remove() and cannot free the buffer under us
        if (buf->wipe_storage()) {
            ++n;
            wiped_count_.fetch_add(1);
        }
        buf->registry_.store(nullptr);
    }
    live_.clear();
    return n;
}

size_t SecretRegistry::live() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_.size();
}


// ---------------- helpers ----------------
SecretPtr make_secret(FieldKind kind, std::string_view content, SecretRegistry* registry) {
    try {
        return std::make_unique<SecretBuffer>(kind, content, registry);
    }
    catch (const std::bad_alloc&) {
        throw AllocationError("SecretBuffer: container allocation failed");
    }
}

SecretPtr clone_secret(const SecretBuffer& src, FieldKind kind, SecretRegistry* registry) {
    // register only after the source view is released (lock order)
    SecretPtr copy = src.with_view([&](std::string_view s) {
        return make_secret(kind, s, nullptr);
    });
    copy->attach(registry);
    return copy;
}

void wipe_string(std::string& s) noexcept {
    if (!s.empty()) {
        sodium_memzero(&s[0], s.size());
    }
    s.clear();
}
