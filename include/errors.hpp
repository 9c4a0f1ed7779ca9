#pragma once
#include <stdexcept>
#include <string>

// -------- Engine error taxonomy --------
// Every failure inside a request is one of these; the request boundary
// turns them into a one-line message with user_message().

struct EngineError : public std::runtime_error {
    explicit EngineError(const std::string& msg) : std::runtime_error(msg) {}
};

struct AllocationError : public EngineError {
    explicit AllocationError(const std::string& msg) : EngineError(msg) {}
};

struct AlreadyWipedError : public EngineError {
    AlreadyWipedError() : EngineError("secret buffer already wiped") {}
};

struct TimeoutError : public EngineError {
    std::string tool;
    explicit TimeoutError(const std::string& t)
        : EngineError(t + ": timed out"), tool(t) {}
};

struct ExternalToolError : public EngineError {
    std::string tool;
    int code;
    std::string stderr_text;
    ExternalToolError(const std::string& t, int c, const std::string& err)
        : EngineError(t + ": exited with code " + std::to_string(c)),
          tool(t), code(c), stderr_text(err) {}
};

// The entry exists but the requested attribute is empty
struct EmptyAttributeError : public ExternalToolError {
    EmptyAttributeError(const std::string& t, const std::string& attribute)
        : ExternalToolError(t, 0, "entry has no " + attribute) {}
};

struct ToolNotFoundError : public EngineError {
    std::string tool;
    explicit ToolNotFoundError(const std::string& t)
        : EngineError(t + ": not found"), tool(t) {}
};

struct FocusError : public EngineError {
    explicit FocusError(const std::string& window)
        : EngineError("target window " + window + " never received focus") {}
};

struct UnlockFocusError : public EngineError {
    UnlockFocusError() : EngineError("unlock prompt never received focus") {}
};

struct ClipboardToolUnavailable : public EngineError {
    std::string tool;
    explicit ClipboardToolUnavailable(const std::string& t)
        : EngineError("clipboard tool unavailable: " + t), tool(t) {}
};

struct SessionLockedError : public EngineError {
    SessionLockedError() : EngineError("database is locked") {}
};

struct DatabaseNotFoundError : public EngineError {
    explicit DatabaseNotFoundError(const std::string& path)
        : EngineError("database file not found: " + path) {}
};

struct InvalidInputError : public EngineError {
    explicit InvalidInputError(const std::string& msg) : EngineError(msg) {}
};

struct ConfigError : public EngineError {
    explicit ConfigError(const std::string& msg) : EngineError(msg) {}
};

// Short user-facing text for any exception caught at a request boundary
std::string user_message(const std::exception& e);
