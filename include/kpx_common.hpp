#pragma once

#include <sodium.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <fcntl.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>
#include <iostream>
#include <sstream>
#include <ctime>
#include <cerrno>
#include <algorithm>
#include <thread>
#include <chrono>
#include <atomic>
#include <cctype>

// -------- Configuration constants --------
inline constexpr const char* CONFIG_DIRNAME = ".kpxsession";
inline constexpr const char* CONFIG_FILENAME = "config";
inline constexpr const char* AUDIT_LOG = "audit.log";

inline constexpr const char* DEFAULT_CLI = "keepassxc-cli";
inline constexpr const char* DEFAULT_XDOTOOL = "xdotool";

inline constexpr unsigned DEFAULT_CLIP_CLEAR_SECONDS = 10;
inline constexpr unsigned DEFAULT_MAX_RESULTS = 10;
inline constexpr unsigned DEFAULT_TOOL_TIMEOUT_SECONDS = 10;
inline constexpr unsigned DEFAULT_PROMPT_TIMEOUT_SECONDS = 120;
inline constexpr unsigned DEFAULT_FOCUS_POLL_MS = 100;
inline constexpr unsigned DEFAULT_FOCUS_ATTEMPTS = 20;
inline constexpr unsigned DEFAULT_AUTOTYPE_DELAY_MS = 12;
inline constexpr unsigned DEFAULT_TIMER_GRANULARITY_MS = 1000;

// limits
inline constexpr size_t MAX_SECRET_LEN = 64 * 1024;
inline constexpr size_t MAX_ENTRY_LEN = 1024;
inline constexpr size_t MAX_TOOL_OUTPUT = 1024 * 1024; // 1 MB cap

// acknowledgement printed by "keepassxc-cli clip" once the clipboard is set
inline constexpr const char* CLIP_ACK_MARKER = "copied to the clipboard";

using byte = unsigned char;

// Kind tag for decrypted material
enum class FieldKind { Password, Username, URL, TOTP, Notes, Passphrase };

const char* field_kind_name(FieldKind kind);
