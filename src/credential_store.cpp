#include "credential_store.hpp"
#include "logging.hpp"
#include "util.hpp"

const char* attribute_name(FieldKind kind) {
    switch (kind) {
    case FieldKind::Password: return "Password";
    case FieldKind::Username: return "UserName";
    case FieldKind::URL:      return "URL";
    case FieldKind::Notes:    return "Notes";
    default:                  return "";
    }
}


// -------- EntryDetails --------
bool EntryDetails::has(const std::string& key) const {
    for (const auto& f : fields) {
        if (f.first == key) return true;
    }
    return false;
}

std::string EntryDetails::get(const std::string& key) const {
    for (const auto& f : fields) {
        if (f.first == key) return f.second;
    }
    return "";
}


// ----------- Parse "show" output to details ------------
// "Key: value" per line; lines without a key continue the previous value
// (multi-line notes).
EntryDetails parse_entry_details(const std::string& s) {
    EntryDetails d;
    std::istringstream iss(s);
    std::string line;

    while (std::getline(iss, line)) {
        strip_cr(line);
        size_t sep = line.find(": ");
        bool keyed = sep != std::string::npos && sep > 0 &&
            std::all_of(line.begin(), line.begin() + sep, [](unsigned char c) {
                return std::isalnum(c) || c == '_' || c == '-';
            });

        if (!keyed) {
            if (line.empty() && d.fields.empty()) continue;
            if (d.fields.empty()) {
                audit_log_level(LogLevel::WARN,
                    "parse_entry_details: skipped malformed line",
                    "credential_store",
                    "failure");
                continue;
            }
            d.fields.back().second += "\n" + line;
            continue;
        }

        std::string key = line.substr(0, sep);
        std::string value = line.substr(sep + 2);
        // never keep a clear-text password in display data
        if (key == "Password" && !value.empty()) {
            wipe_string(value);
            value = "PROTECTED";
        }
        d.fields.emplace_back(std::move(key), std::move(value));
    }

    for (auto& f : d.fields) {
        while (!f.second.empty() && f.second.back() == '\n') f.second.pop_back();
    }
    return d;
}


// ---------------- CredentialStore ----------------
CredentialStore::CredentialStore(ProcessRunner& runner, std::string cli,
    std::chrono::milliseconds timeout)
    : runner_(runner), cli_(std::move(cli)), timeout_(timeout)
{
}

void CredentialStore::check_database() const {
    if (database_.empty() || access(database_.c_str(), R_OK) != 0) {
        audit_log_level(LogLevel::WARN,
            "Database file not found: " + database_,
            "credential_store",
            "failure");
        throw DatabaseNotFoundError(database_);
    }
}

ProcessRequest CredentialStore::request(const SecretBuffer& passphrase,
    std::vector<std::string> args) const
{
    ProcessRequest req;
    req.command = cli_;
    req.args = std::move(args);
    req.stdin_secret = &passphrase;
    req.timeout = timeout_;
    return req;
}

bool CredentialStore::verify(const SecretBuffer& passphrase) {
    check_database();
    try {
        ProcessResult r = runner_.run(request(passphrase, { "ls", "-q", database_ }));
        wipe_string(r.stdout_data);
        return true;
    }
    catch (const ExternalToolError& e) {
        audit_log_level(LogLevel::WARN,
            "Passphrase rejected for " + database_ + " (code " + std::to_string(e.code) + ")",
            "credential_store",
            "failure");
        return false;
    }
}

std::vector<std::string> CredentialStore::search(const SecretBuffer& passphrase,
    const std::string& term)
{
    check_database();
    ProcessResult r;
    try {
        r = runner_.run(request(passphrase, { "search", "-q", database_, term }));
    }
    catch (const ExternalToolError& e) {
        // exit 1 with "No results for that search term." is an empty result
        if (e.code == 1 && e.stderr_text.find("No results") != std::string::npos) {
            return {};
        }
        throw;
    }

    std::vector<std::string> entries;
    std::istringstream iss(r.stdout_data);
    std::string line;
    while (std::getline(iss, line)) {
        strip_cr(line);
        if (!line.empty()) entries.push_back(line);
    }
    return entries;
}

EntryDetails CredentialStore::details(const SecretBuffer& passphrase, const std::string& entry) {
    check_database();
    ProcessResult r = runner_.run(request(passphrase, { "show", "-q", database_, entry }));
    EntryDetails d = parse_entry_details(r.stdout_data);
    wipe_string(r.stdout_data);
    return d;
}

SecretPtr CredentialStore::fetch(const SecretBuffer& passphrase, const std::string& entry,
    FieldKind kind, SecretRegistry* registry)
{
    check_database();
    std::vector<std::string> args = { "show", "-q" };
    if (kind == FieldKind::TOTP) {
        args.push_back("-t");
    }
    else {
        const char* attr = attribute_name(kind);
        if (!*attr) {
            throw ExternalToolError(cli_, 0, "unsupported field kind");
        }
        args.push_back("-a");
        args.push_back(attr);
    }
    args.push_back(database_);
    args.push_back(entry);

    ProcessResult r = runner_.run(request(passphrase, std::move(args)));

    // drop exactly one trailing newline; notes may end with blank lines
    std::string& out = r.stdout_data;
    if (!out.empty() && out.back() == '\n') out.pop_back();
    if (!out.empty() && out.back() == '\r') out.pop_back();

    if (out.empty()) {
        audit_log_level(LogLevel::WARN,
            std::string("Empty ") + field_kind_name(kind) + " for entry " + entry,
            "credential_store",
            "failure");
        throw EmptyAttributeError(cli_, field_kind_name(kind));
    }

    SecretPtr secret;
    try {
        secret = make_secret(kind, out, registry);
    }
    catch (...) {
        wipe_string(out);
        throw;
    }
    wipe_string(out);
    return secret;
}

ProcessRequest CredentialStore::clip_request(const SecretBuffer& passphrase,
    const std::string& entry, FieldKind kind, unsigned clear_seconds) const
{
    // no -q here: quiet mode also silences the "copied" acknowledgement
    std::vector<std::string> args = { "clip" };
    if (kind == FieldKind::TOTP) {
        args.push_back("-t");
    }
    else if (kind != FieldKind::Password) {
        args.push_back("-a");
        args.push_back(attribute_name(kind));
    }
    args.push_back(database_);
    args.push_back(entry);
    args.push_back(std::to_string(clear_seconds));

    ProcessRequest req = request(passphrase, std::move(args));
    req.ack_marker = CLIP_ACK_MARKER;
    // the tool blocks until it clears; only the acknowledgement is awaited
    return req;
}
