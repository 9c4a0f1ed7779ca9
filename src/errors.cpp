#include "errors.hpp"

std::string user_message(const std::exception& e) {
    if (auto* t = dynamic_cast<const ToolNotFoundError*>(&e)) {
        return "Cannot execute " + t->tool + ". Please make sure it is installed and on PATH.";
    }
    if (auto* c = dynamic_cast<const ClipboardToolUnavailable*>(&e)) {
        return "No clipboard tool available (" + c->tool + "). Please install it.";
    }
    if (dynamic_cast<const DatabaseNotFoundError*>(&e)) {
        return "Cannot find the database file. Please verify the database path.";
    }
    if (dynamic_cast<const SessionLockedError*>(&e)) {
        return "Database is locked. Unlock it first.";
    }
    if (auto* x = dynamic_cast<const ExternalToolError*>(&e)) {
        std::string msg = "Error while calling " + x->tool;
        std::string detail = x->stderr_text;
        while (!detail.empty() && (detail.back() == '\n' || detail.back() == '\r')) {
            detail.pop_back();
        }
        size_t nl = detail.find('\n');
        if (nl != std::string::npos) detail.resize(nl);
        if (!detail.empty()) msg += ": " + detail;
        return msg;
    }
    if (auto* t = dynamic_cast<const TimeoutError*>(&e)) {
        return t->tool + " did not respond in time.";
    }
    if (dynamic_cast<const FocusError*>(&e)) {
        return "Autotype aborted: target window did not get focus.";
    }
    if (dynamic_cast<const UnlockFocusError*>(&e)) {
        return "Unlock prompt did not get focus; passphrase discarded. Please try again.";
    }
    if (dynamic_cast<const AlreadyWipedError*>(&e)) {
        return "Secret was wiped before use (session locked).";
    }
    if (dynamic_cast<const AllocationError*>(&e)) {
        return "Unable to allocate protected memory.";
    }
    if (auto* i = dynamic_cast<const InvalidInputError*>(&e)) {
        return std::string("Invalid input: ") + i->what();
    }
    if (auto* c = dynamic_cast<const ConfigError*>(&e)) {
        return std::string("Configuration error: ") + c->what();
    }
    return "An unexpected error occurred. Check audit log.";
}
