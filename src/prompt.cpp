#include "prompt.hpp"
#include "logging.hpp"
#include "util.hpp"

SecretPtr TerminalPrompt::read(SecretRegistry* registry) {
    return read_passphrase_terminal(text_.c_str(), registry);
}

CommandPrompt::CommandPrompt(ProcessRunner& runner, std::vector<std::string> argv,
    std::string title, std::chrono::milliseconds timeout)
    : runner_(runner), argv_(std::move(argv)), title_(std::move(title)), timeout_(timeout)
{
    if (argv_.empty()) {
        throw ConfigError("unlock-prompt: empty command");
    }
}

SecretPtr CommandPrompt::read(SecretRegistry* registry) {
    ProcessRequest req;
    req.command = argv_.front();
    req.args.assign(argv_.begin() + 1, argv_.end());
    req.timeout = timeout_;

    ProcessResult res;
    try {
        res = runner_.run(req);
    }
    catch (const ExternalToolError& e) {
        if (e.code == 1) {
            audit_log_level(LogLevel::INFO,
                "Unlock prompt cancelled",
                "unlock",
                "cancelled");
            return nullptr;
        }
        throw;
    }

    std::string& out = res.stdout_data;
    if (!out.empty() && out.back() == '\n') out.pop_back();
    if (!out.empty() && out.back() == '\r') out.pop_back();

    SecretPtr secret;
    try {
        secret = make_secret(FieldKind::Passphrase, out, registry);
    }
    catch (...) {
        wipe_string(out);
        throw;
    }
    wipe_string(out);
    return secret;
}
