#pragma once
#include "kpx_common.hpp"
#include "secret_buffer.hpp"

#include <chrono>
#include <string>
#include <vector>

// -------- External tool invocation --------

struct ProcessRequest {
    std::string command;
    std::vector<std::string> args;
    // Streamed to the child's stdin, then stdin is closed. Never placed on
    // the argument list or in the environment.
    const SecretBuffer* stdin_secret = nullptr;
    std::chrono::milliseconds timeout{ DEFAULT_TOOL_TIMEOUT_SECONDS * 1000 };
    // When set, run() returns as soon as stdout contains this text and the
    // child is left running (its output drained and reaped in background).
    std::string ack_marker;
};

struct ProcessResult {
    std::string stdout_data;
    std::string stderr_data;
    int exit_code = 0;
    bool acknowledged = false;
};

class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    // Blocks until the child exits, acknowledges, or the timeout elapses.
    // Throws ToolNotFoundError, TimeoutError (child killed) or
    // ExternalToolError for a non-zero exit.
    virtual ProcessResult run(const ProcessRequest& req) = 0;
};

// fork/exec implementation over CLOEXEC pipes
class SubprocessRunner : public ProcessRunner {
public:
    SubprocessRunner();
    ProcessResult run(const ProcessRequest& req) override;
};

// PATH lookup; absolute or relative paths are checked directly
bool find_executable(const std::string& name, std::string* resolved = nullptr);
