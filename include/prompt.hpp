#pragma once
#include "kpx_common.hpp"
#include "process_runner.hpp"
#include "secret_buffer.hpp"

#include <string>
#include <vector>

// -------- Database unlock prompts --------

class PassphrasePrompt {
public:
    virtual ~PassphrasePrompt() = default;

    // nullptr when the user cancelled
    virtual SecretPtr read(SecretRegistry* registry) = 0;
    // Title of the prompt window whose focus must be confirmed; "" when
    // the prompt has no window of its own
    virtual std::string window_title() const = 0;
};

// Echo-less prompt on the controlling terminal
class TerminalPrompt : public PassphrasePrompt {
public:
    explicit TerminalPrompt(std::string text = "Database passphrase: ")
        : text_(std::move(text)) {}

    SecretPtr read(SecretRegistry* registry) override;
    std::string window_title() const override { return ""; }

private:
    std::string text_;
};

// External dialog (e.g. zenity --password); its stdout is the passphrase.
// Exit code 1 means the dialog was cancelled.
class CommandPrompt : public PassphrasePrompt {
public:
    CommandPrompt(ProcessRunner& runner, std::vector<std::string> argv,
        std::string title, std::chrono::milliseconds timeout);

    SecretPtr read(SecretRegistry* registry) override;
    std::string window_title() const override { return title_; }

private:
    ProcessRunner& runner_;
    std::vector<std::string> argv_;
    std::string title_;
    std::chrono::milliseconds timeout_;
};
