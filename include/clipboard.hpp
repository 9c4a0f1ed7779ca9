#pragma once
#include "kpx_common.hpp"
#include "credential_store.hpp"
#include "process_runner.hpp"
#include "secret_buffer.hpp"

#include <functional>
#include <string>

// -------- Clipboard coordinator --------
// Copies go through the credential store's "clip" mode so the clear-after
// timer belongs to that tool. The engine never holds the copied value.

struct ClipboardTransfer {
    std::string entry;
    FieldKind kind = FieldKind::Password;
    unsigned clear_seconds = DEFAULT_CLIP_CLEAR_SECONDS;
    std::chrono::system_clock::time_point clear_deadline;
};

// "wl-copy" under Wayland, "xclip" otherwise
std::string clipboard_tool_name();

class ClipboardCoordinator {
public:
    using ToolCheck = std::function<bool(const std::string&)>;

    ClipboardCoordinator(ProcessRunner& runner, CredentialStore& store,
        unsigned clear_seconds = DEFAULT_CLIP_CLEAR_SECONDS,
        ToolCheck tool_check = ToolCheck());

    // 'credential' is the database passphrase for this request; it is wiped
    // before copy() returns or throws. Throws ClipboardToolUnavailable when
    // the system clipboard tool is missing or the clip mode did nothing.
    ClipboardTransfer copy(const std::string& entry, FieldKind kind, SecretPtr credential);

    void set_clear_seconds(unsigned s) { clear_seconds_ = s; }
    unsigned clear_seconds() const noexcept { return clear_seconds_; }

private:
    ProcessRunner& runner_;
    CredentialStore& store_;
    unsigned clear_seconds_;
    ToolCheck tool_check_;
};
