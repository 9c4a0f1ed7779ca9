#pragma once
#include "kpx_common.hpp"
#include "process_runner.hpp"
#include "secret_buffer.hpp"

#include <string>
#include <utility>
#include <vector>

// -------- keepassxc-cli wrapper --------
// The database passphrase is always the child's stdin; it never appears on
// the command line.

// Display fields of one entry, in the order the tool printed them
struct EntryDetails {
    std::vector<std::pair<std::string, std::string>> fields;

    bool has(const std::string& key) const;
    std::string get(const std::string& key) const;
};

// keepassxc attribute name for a kind ("" for TOTP/Passphrase)
const char* attribute_name(FieldKind kind);

EntryDetails parse_entry_details(const std::string& show_output);

class CredentialStore {
public:
    CredentialStore(ProcessRunner& runner, std::string cli, std::chrono::milliseconds timeout);

    void set_database(const std::string& path) { database_ = path; }
    const std::string& database() const noexcept { return database_; }
    void set_cli(const std::string& cli) { cli_ = cli; }
    const std::string& cli() const noexcept { return cli_; }
    void set_timeout(std::chrono::milliseconds t) { timeout_ = t; }

    // Throws DatabaseNotFoundError when the file is not readable
    void check_database() const;

    // false for a rejected passphrase; ToolNotFoundError/TimeoutError propagate
    bool verify(const SecretBuffer& passphrase);

    std::vector<std::string> search(const SecretBuffer& passphrase, const std::string& term);
    EntryDetails details(const SecretBuffer& passphrase, const std::string& entry);

    // Attribute value, or the current TOTP code for FieldKind::TOTP
    SecretPtr fetch(const SecretBuffer& passphrase, const std::string& entry,
        FieldKind kind, SecretRegistry* registry);

    // "clip" invocation with the tool's own auto-clear after clear_seconds
    ProcessRequest clip_request(const SecretBuffer& passphrase, const std::string& entry,
        FieldKind kind, unsigned clear_seconds) const;

private:
    ProcessRequest request(const SecretBuffer& passphrase, std::vector<std::string> args) const;

    ProcessRunner& runner_;
    std::string cli_;
    std::string database_;
    std::chrono::milliseconds timeout_;
};
