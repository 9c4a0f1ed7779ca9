#include "clipboard.hpp"
#include "logging.hpp"

namespace {

bool mentions_clipboard_tool(const std::string& text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("xclip") != std::string::npos ||
        lower.find("wl-copy") != std::string::npos ||
        lower.find("clipboard") != std::string::npos;
}

} // namespace


std::string clipboard_tool_name() {
    const char* wayland = std::getenv("WAYLAND_DISPLAY");
    if (wayland && *wayland) {
        return "wl-copy";
    }
    return "xclip";
}

ClipboardCoordinator::ClipboardCoordinator(ProcessRunner& runner, CredentialStore& store,
    unsigned clear_seconds, ToolCheck tool_check)
    : runner_(runner), store_(store), clear_seconds_(clear_seconds),
      tool_check_(std::move(tool_check))
{
    if (!tool_check_) {
        tool_check_ = [](const std::string& name) { return find_executable(name); };
    }
}

ClipboardTransfer ClipboardCoordinator::copy(const std::string& entry, FieldKind kind,
    SecretPtr credential)
{
    SecretWipeGuard guard(credential.get());
    if (!credential) {
        throw SessionLockedError();
    }

    const std::string tool = clipboard_tool_name();
    if (!tool_check_(tool)) {
        audit_log_level(LogLevel::WARN,
            "copy: clipboard tool " + tool + " not installed",
            "clipboard_module",
            "failure");
        throw ClipboardToolUnavailable(tool);
    }

    ProcessRequest req = store_.clip_request(*credential, entry, kind, clear_seconds_);
    ProcessResult res;
    try {
        res = runner_.run(req);
    }
    catch (const ExternalToolError& e) {
        credential->wipe();
        if (mentions_clipboard_tool(e.stderr_text)) {
            audit_log_level(LogLevel::WARN,
                "copy: clip mode could not reach the clipboard for " + entry,
                "clipboard_module",
                "failure");
            throw ClipboardToolUnavailable(tool);
        }
        throw;
    }
    // the store tool has the value now (or never will)
    credential->mark_consumed();
    credential->wipe();
    wipe_string(res.stdout_data);

    if (!res.acknowledged) {
        // exit 0 without the acknowledgement: nothing reached the clipboard
        audit_log_level(LogLevel::WARN,
            "copy: clip mode exited without acknowledgement for " + entry,
            "clipboard_module",
            "failure");
        throw ClipboardToolUnavailable(tool);
    }

    ClipboardTransfer t;
    t.entry = entry;
    t.kind = kind;
    t.clear_seconds = clear_seconds_;
    t.clear_deadline = std::chrono::system_clock::now() + std::chrono::seconds(clear_seconds_);
    audit_log_level(LogLevel::INFO,
        std::string("Copied ") + field_kind_name(kind) + " of " + entry +
        ", clears in " + std::to_string(clear_seconds_) + "s",
        "clipboard_module",
        "success");
    return t;
}
