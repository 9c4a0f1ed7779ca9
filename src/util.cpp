#include "util.hpp"
#include "logging.hpp"

#include <array>
#include <pwd.h>
#include <termios.h>


// ---------- SessionID ----------
std::string generate_session_id() {
    std::array<byte, 16> buf{};
    randombytes_buf(buf.data(), buf.size());

    static const char* hex = "0123456789abcdef";
    std::string out;
    out.resize(32);

    for (size_t i = 0; i < buf.size(); ++i) {
        out[2 * i] = hex[(buf[i] >> 4) & 0x0F];
        out[2 * i + 1] = hex[buf[i] & 0x0F];
    }
    return out;
}


// ---------- Field kinds ----------
const char* field_kind_name(FieldKind kind) {
    switch (kind) {
    case FieldKind::Password:   return "password";
    case FieldKind::Username:   return "username";
    case FieldKind::URL:        return "URL";
    case FieldKind::TOTP:       return "TOTP";
    case FieldKind::Notes:      return "notes";
    case FieldKind::Passphrase: return "passphrase";
    default:                    return "unknown";
    }
}

std::optional<FieldKind> parse_field_kind(const std::string& s) {
    std::string k;
    k.reserve(s.size());
    for (unsigned char c : s) k.push_back(static_cast<char>(std::tolower(c)));

    if (k == "password" || k == "pass" || k == "pw") return FieldKind::Password;
    if (k == "username" || k == "user") return FieldKind::Username;
    if (k == "url") return FieldKind::URL;
    if (k == "totp" || k == "otp") return FieldKind::TOTP;
    if (k == "notes") return FieldKind::Notes;
    return std::nullopt;
}


// ---------- Helpers: input validation ----------
bool contains_control_or_null(const std::string& s) {
    for (unsigned char c : s) {
        if (c == '\0') return true;
        if (c < 0x20 || c == 0x7F) return true; // control chars incl. tab/newline
    }
    return false;
}

bool valid_entry_name(const std::string& s) {
    if (s.empty()) return false;
    if (s.size() > MAX_ENTRY_LEN) return false;
    if (contains_control_or_null(s)) return false;

    // disallow whitespace-only
    if (std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); })) return false;
    return true;
}

bool valid_search_term(const std::string& s) {
    return valid_entry_name(s);
}


// ---------- String helpers ----------
void strip_cr(std::string& s) {
    if (!s.empty() && s.back() == '\r') s.pop_back();
}

void trim_spaces(std::string& s) {
    auto first = s.find_first_not_of(" \t");
    auto last = s.find_last_not_of(" \t");
    if (first == std::string::npos) { s.clear(); return; }
    s = s.substr(first, last - first + 1);
}

std::string get_user_home_dir() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        struct passwd* pw = getpwuid(geteuid());
        if (pw && pw->pw_dir) {
            home = pw->pw_dir;
        }
    }
    if (!home || !*home) return ".";
    return std::string(home);
}

std::string expand_home(const std::string& path) {
    if (path == "~") return get_user_home_dir();
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        return get_user_home_dir() + path.substr(1);
    }
    return path;
}


// ---------- Secure input ----------
static bool set_echo(bool enable) {
    termios tty;
    if (tcgetattr(STDIN_FILENO, &tty) != 0) return false;

    if (enable) tty.c_lflag |= ECHO;
    else        tty.c_lflag &= ~ECHO;

    return tcsetattr(STDIN_FILENO, TCSANOW, &tty) == 0;
}

SecretPtr read_passphrase_terminal(const char* prompt, SecretRegistry* registry) {
    std::cout << prompt;
    std::fflush(stdout);

    bool echo_off = set_echo(false);

    // read byte-wise into a fixed buffer so no growing std::string copies exist
    std::array<char, 1024> buf{};
    size_t len = 0;
    bool eof = true;
    int c;
    while ((c = std::fgetc(stdin)) != EOF) {
        eof = false;
        if (c == '\n') break;
        if (len < buf.size()) buf[len++] = static_cast<char>(c);
    }
    if (len > 0 && buf[len - 1] == '\r') --len;

    if (echo_off) set_echo(true);
    std::cout << "\n";

    if (eof) {
        sodium_memzero(buf.data(), buf.size());
        return nullptr;
    }

    SecretPtr out;
    try {
        out = make_secret(FieldKind::Passphrase, std::string_view(buf.data(), len), registry);
    }
    catch (...) {
        sodium_memzero(buf.data(), buf.size());
        throw;
    }
    sodium_memzero(buf.data(), buf.size());
    return out;
}


// ---------- Program flow helpers ----------
void clear_screen() {
    // Clear visible screen and scrollback buffer
    std::cout << "\033[3J\033[2J\033[H";
}

void print_menu(bool unlocked) {
    std::cout << "\n";
    std::cout << "kpxsession - " << (unlocked ? "unlocked" : "locked") << "\n";
    std::cout << "1) Search entries\n";
    std::cout << "2) Show entry details\n";
    std::cout << "3) Copy field to clipboard\n";
    std::cout << "4) Unlock database\n";
    std::cout << "5) Lock database\n";
    std::cout << "6) Reload configuration\n";
    std::cout << "7) Quit\n";
}
