#pragma once
#include "kpx_common.hpp"
#include "secret_buffer.hpp"

#include <optional>
#include <string>

// ---------- SessionID ----------
std::string generate_session_id();

// ---------- Field kinds ----------
// Accepts "password", "username", "url", "totp", "notes" (any case)
std::optional<FieldKind> parse_field_kind(const std::string& s);

// ---------- Helpers: input validation ----------
bool contains_control_or_null(const std::string& s);
bool valid_entry_name(const std::string& s);
bool valid_search_term(const std::string& s);

// ---------- String helpers ----------
void strip_cr(std::string& s);
void trim_spaces(std::string& s);
std::string expand_home(const std::string& path);
std::string get_user_home_dir();

// ---------- Secure input ----------
// Reads one line from the terminal with echo disabled straight into a
// secret buffer; nullptr on EOF.
SecretPtr read_passphrase_terminal(const char* prompt, SecretRegistry* registry);

// ---------- Menu ----------
void clear_screen();
void print_menu(bool unlocked);
