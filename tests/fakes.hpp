#pragma once
#include "focus.hpp"
#include "logging.hpp"
#include "process_runner.hpp"
#include "prompt.hpp"

#include <stdlib.h>

#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

// Shared test doubles. Real child processes are only used by the process
// runner tests; everything else scripts tool behaviour here.

struct RecordedCall {
    std::string command;
    std::vector<std::string> args;
    bool had_stdin = false;
    std::string stdin_data;
    std::string ack_marker;
    std::chrono::milliseconds timeout{ 0 };

    bool args_contain(const std::string& needle) const {
        for (const auto& a : args) {
            if (a.find(needle) != std::string::npos) return true;
        }
        return false;
    }
    const std::string& verb() const {
        static const std::string none;
        return args.empty() ? none : args.front();
    }
};

class FakeRunner : public ProcessRunner {
public:
    using Handler = std::function<ProcessResult(const RecordedCall&)>;

    ProcessResult run(const ProcessRequest& req) override {
        RecordedCall call;
        call.command = req.command;
        call.args = req.args;
        call.ack_marker = req.ack_marker;
        call.timeout = req.timeout;
        if (req.stdin_secret) {
            call.had_stdin = true;
            call.stdin_data = req.stdin_secret->with_view(
                [](std::string_view s) { return std::string(s); });
        }
        Handler h;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back(call);
            h = handler_;
        }
        if (h) return h(call);
        return ProcessResult{};
    }

    void on_run(Handler h) {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(h);
    }

    std::vector<RecordedCall> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    size_t count_verb(const std::string& verb) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& c : calls_) {
            if (c.verb() == verb) ++n;
        }
        return n;
    }

private:
    mutable std::mutex mutex_;
    std::vector<RecordedCall> calls_;
    Handler handler_;
};

inline ProcessResult output(const std::string& out) {
    ProcessResult r;
    r.stdout_data = out;
    return r;
}

class FakeWindowTool : public WindowTool {
public:
    // reported by active_window(); 'script' overrides it per call number
    std::string active_id;
    std::function<std::string(unsigned)> script;
    // activate() moves focus to the requested window
    bool activate_focuses = false;
    // every call throws ToolNotFoundError
    bool missing = false;
    std::vector<std::pair<std::string, std::string>> titles;

    unsigned active_calls = 0;
    std::vector<std::string> activated;

    std::string active_window() override {
        ++active_calls;
        if (missing) throw ToolNotFoundError("xdotool");
        if (script) return script(active_calls);
        return active_id;
    }

    void activate(const std::string& window_id) override {
        if (missing) throw ToolNotFoundError("xdotool");
        activated.push_back(window_id);
        if (activate_focuses) active_id = window_id;
    }

    std::string find_window(const std::string& title) override {
        if (missing) throw ToolNotFoundError("xdotool");
        for (const auto& t : titles) {
            if (t.first == title) return t.second;
        }
        return "";
    }
};

inline FocusPoller::Sleeper no_sleep() {
    return [](std::chrono::milliseconds) {};
}

class FakePrompt : public PassphrasePrompt {
public:
    FakePrompt(std::string answer, std::string title,
        std::chrono::milliseconds delay = std::chrono::milliseconds(0),
        bool cancel = false)
        : answer_(std::move(answer)), title_(std::move(title)), delay_(delay), cancel_(cancel) {}

    SecretPtr read(SecretRegistry* registry) override {
        std::this_thread::sleep_for(delay_);
        if (cancel_) return nullptr;
        return make_secret(FieldKind::Passphrase, answer_, registry);
    }
    std::string window_title() const override { return title_; }

private:
    std::string answer_;
    std::string title_;
    std::chrono::milliseconds delay_;
    bool cancel_;
};

// Scratch directory holding the audit log and a stand-in database file
class TempDir {
public:
    TempDir() {
        char tmpl[] = "/tmp/kpxsession-test-XXXXXX";
        char* p = mkdtemp(tmpl);
        if (p) path_ = p;
        set_audit_log_path(path_ + "/audit.log");
    }
    ~TempDir() {
        set_audit_log_path("");
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::string& path() const { return path_; }

    std::string write_file(const std::string& name, const std::string& content) {
        std::string p = path_ + "/" + name;
        std::ofstream out(p);
        out << content;
        return p;
    }

private:
    std::string path_;
};
