#include "kpx_common.hpp"
#include "config.hpp"
#include "engine.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "util.hpp"

static constexpr unsigned MAX_UNLOCK_ATTEMPTS = 3;

static inline int parse_choice(const std::string& s) {
    try {
        return std::stoi(s);
    }
    catch (const std::exception&) {
        return -1;
    }
}

static void print_usage() {
    std::cerr << "usage: kpxsession                      interactive menu\n"
              << "       kpxsession type <entry> [field] autotype one field\n"
              << "       kpxsession login <entry>        autotype username, Tab, password, Return\n"
              << "       kpxsession copy <entry> [field] copy one field to the clipboard\n"
              << "       kpxsession search <term>        list matching entries\n"
              << "fields: password (default), username, url, totp, notes\n";
}

static bool read_line(const char* prompt, std::string& out) {
    std::cout << prompt;
    if (!std::getline(std::cin, out)) return false;
    strip_cr(out);
    trim_spaces(out);
    return true;
}

// Prompts until unlocked, the user cancels, or the attempts run out
static bool ensure_unlocked(Engine& engine) {
    if (engine.session().unlocked()) return true;
    std::unique_ptr<PassphrasePrompt> prompt = engine.make_prompt();
    for (unsigned attempt = 0; attempt < MAX_UNLOCK_ATTEMPTS; ++attempt) {
        try {
            if (engine.unlock(*prompt)) {
                return true;
            }
            std::cerr << "Invalid passphrase or prompt cancelled.\n";
        }
        catch (const UnlockFocusError& e) {
            std::cerr << user_message(e) << "\n";
        }
    }
    audit_log_level(LogLevel::WARN,
        "Unlock attempts exhausted",
        "unlock",
        "failure");
    return false;
}

static FieldKind field_or_default(int argc, char** argv, int idx) {
    if (argc <= idx) return FieldKind::Password;
    auto k = parse_field_kind(argv[idx]);
    if (!k) {
        throw InvalidInputError(std::string("unknown field '") + argv[idx] + "'");
    }
    return *k;
}

static void print_results(const SearchResults& r) {
    if (r.entries.empty()) {
        std::cout << "No entries.\n";
        return;
    }
    size_t i = 1;
    for (const auto& e : r.entries) {
        std::cout << " " << i++ << ") " << e << "\n";
    }
    if (r.more > 0) {
        std::cout << " ... and " << r.more << " more\n";
    }
}

static void print_degraded(Engine& engine) {
    if (engine.autotype_driver().degraded()) {
        std::cerr << "Warning: target window focus was not confirmed.\n";
    }
}

// ---------------- One-shot commands ----------------
static int run_command(Engine& engine, const std::string& target, int argc, char** argv) {
    const std::string cmd = argv[1];
    if (argc < 3) {
        print_usage();
        return 2;
    }
    const std::string arg = argv[2];

    if (cmd == "search") {
        if (!ensure_unlocked(engine)) return 1;
        print_results(engine.search(arg));
        return 0;
    }
    if (cmd == "type") {
        FieldKind kind = field_or_default(argc, argv, 3);
        if (!ensure_unlocked(engine)) return 1;
        engine.autotype(target, arg, kind);
        print_degraded(engine);
        return 0;
    }
    if (cmd == "login") {
        if (!ensure_unlocked(engine)) return 1;
        engine.autotype_login(target, arg);
        print_degraded(engine);
        return 0;
    }
    if (cmd == "copy") {
        FieldKind kind = field_or_default(argc, argv, 3);
        if (!ensure_unlocked(engine)) return 1;
        ClipboardTransfer t = engine.copy(arg, kind);
        std::cout << field_kind_name(t.kind) << " copied, clipboard clears in "
                  << t.clear_seconds << " seconds.\n";
        return 0;
    }
    print_usage();
    return 2;
}

// ---------------- Interactive menu ----------------
static void run_menu(Engine& engine) {
    clear_screen();
    bool running = true;
    while (running) {
        print_menu(engine.session().unlocked());
        std::string choice;
        if (!read_line("> ", choice)) {
            break; // EOF or stdin closed
        }

        try {
            switch (parse_choice(choice)) {
            case 1: {
                std::string term;
                if (!read_line("Search (empty = recent): ", term)) break;
                if (!ensure_unlocked(engine)) break;
                print_results(engine.search(term));
                break;
            }
            case 2: {
                std::string entry;
                if (!read_line("Entry: ", entry)) break;
                if (!ensure_unlocked(engine)) break;
                EntryDetails d = engine.details(entry);
                for (const auto& f : d.fields) {
                    std::cout << " " << f.first << ": " << f.second << "\n";
                }
                break;
            }
            case 3: {
                std::string entry, field;
                if (!read_line("Entry: ", entry)) break;
                if (!read_line("Field [password]: ", field)) break;
                FieldKind kind = FieldKind::Password;
                if (!field.empty()) {
                    auto k = parse_field_kind(field);
                    if (!k) {
                        std::cout << "Unknown field\n";
                        break;
                    }
                    kind = *k;
                }
                if (!ensure_unlocked(engine)) break;
                ClipboardTransfer t = engine.copy(entry, kind);
                std::cout << "Copied. Clipboard clears in " << t.clear_seconds << " seconds.\n";
                break;
            }
            case 4:
                if (ensure_unlocked(engine)) {
                    std::cout << "Database unlocked.\n";
                }
                break;
            case 5:
                engine.lock();
                std::cout << "Database locked.\n";
                break;
            case 6:
                engine.reload(load_config(g_config_filename));
                std::cout << "Configuration reloaded.\n";
                break;
            case 7:
                running = false;
                break;
            default:
                std::cout << "Invalid option\n";
                break;
            }
        }
        catch (const std::exception& e) {
            std::cerr << user_message(e) << "\n";
        }
    }
}


// -----------------------------------------------------------------------
// main
// -----------------------------------------------------------------------
int main(int argc, char** argv) {
    if (sodium_init() < 0) {
        std::fprintf(stderr, "An unexpected error occurred. Check audit log.\n");
        return 1;
    }
    if (!init_config_paths()) {
        std::fprintf(stderr, "Failed to initialize configuration directory.\n");
        return 1;
    }
    init_log_context();
    audit_log_level(LogLevel::INFO,
        "kpxsession starting",
        "session",
        "notify");

    Config cfg;
    try {
        cfg = load_config(g_config_filename);
    }
    catch (const ConfigError& e) {
        std::cerr << user_message(e) << "\n";
        return 2;
    }

    SubprocessRunner runner;
    XdotoolWindowTool windows(runner, cfg.xdotool_path,
        std::chrono::seconds(cfg.tool_timeout_seconds));
    Engine engine(cfg, runner, windows);

    const bool one_shot = argc > 1;
    // destination window: before our own prompt can take focus
    std::string target;
    if (one_shot && (std::string(argv[1]) == "type" || std::string(argv[1]) == "login")) {
        target = engine.capture_target();
    }

    engine.session().set_lock_listener([](LockReason reason) {
        if (reason == LockReason::Timeout) {
            std::cout << "\n[!] Database locked due to inactivity.\n";
            std::cout.flush();
        }
    });

    int rc = 0;
    if (one_shot) {
        try {
            rc = run_command(engine, target, argc, argv);
        }
        catch (const std::exception& e) {
            std::cerr << user_message(e) << "\n";
            rc = 1;
        }
    }
    else {
        run_menu(engine);
    }

    engine.lock();
    audit_log_level(LogLevel::INFO,
        "kpxsession exiting",
        "session",
        "notify");
    return rc;
}
