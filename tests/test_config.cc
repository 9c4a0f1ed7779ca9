#include <gtest/gtest.h>
#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"
#include "fakes.hpp"

#include <sys/stat.h>

TEST(ConfigTest, defaults_without_any_keys) {
  TempDir dir;
  Config cfg = parse_config("");
  EXPECT_EQ(cfg.inactivity_timeout_seconds, 0u);
  EXPECT_EQ(cfg.max_results, DEFAULT_MAX_RESULTS);
  EXPECT_EQ(cfg.clip_clear_seconds, 10u);
  EXPECT_EQ(cfg.cli_path, "keepassxc-cli");
  EXPECT_EQ(cfg.xdotool_path, "xdotool");
  EXPECT_EQ(cfg.focus_poll_ms, 100u);
  EXPECT_EQ(cfg.focus_attempts, 20u);
  EXPECT_TRUE(cfg.prompt_command.empty());
}

TEST(ConfigTest, parses_known_keys_and_comments) {
  TempDir dir;
  Config cfg = parse_config(
      "# kpxsession\n"
      "database-path = /data/passwords.kdbx\n"
      "inactivity-lock-timeout=300\r\n"
      "  max-results = 25  \n"
      "clip-clear-timeout = 30\n"
      "keepassxc-cli = /opt/keepassxc/bin/keepassxc-cli\n"
      "focus-poll-interval-ms = 50\n"
      "focus-max-attempts = 8\n"
      "autotype-delay-ms = 5\n"
      "unlock-prompt = zenity --password --title \"Unlock KeePassXC database\"\n"
      "unlock-prompt-timeout = 60\n"
      "timer-granularity-ms = 250\n");

  EXPECT_EQ(cfg.database_path, "/data/passwords.kdbx");
  EXPECT_EQ(cfg.inactivity_timeout_seconds, 300u);
  EXPECT_EQ(cfg.max_results, 25u);
  EXPECT_EQ(cfg.clip_clear_seconds, 30u);
  EXPECT_EQ(cfg.cli_path, "/opt/keepassxc/bin/keepassxc-cli");
  EXPECT_EQ(cfg.focus_poll_ms, 50u);
  EXPECT_EQ(cfg.focus_attempts, 8u);
  EXPECT_EQ(cfg.autotype_delay_ms, 5u);
  EXPECT_EQ(cfg.prompt_command, (std::vector<std::string>{
                                    "zenity", "--password", "--title", "Unlock KeePassXC database" }));
  EXPECT_EQ(cfg.prompt_timeout_seconds, 60u);
  EXPECT_EQ(cfg.timer_granularity_ms, 250u);
}

TEST(ConfigTest, home_is_expanded_in_paths) {
  TempDir dir;
  Config cfg = parse_config("database-path = ~/db.kdbx\n");
  EXPECT_EQ(cfg.database_path, get_user_home_dir() + "/db.kdbx");
}

TEST(ConfigTest, unknown_keys_are_ignored) {
  TempDir dir;
  Config cfg = parse_config("theme = dark\nmax-results = 4\n");
  EXPECT_EQ(cfg.max_results, 4u);
}

TEST(ConfigTest, malformed_values_are_config_errors) {
  TempDir dir;
  EXPECT_THROW(parse_config("max-results = ten\n"), ConfigError);
  EXPECT_THROW(parse_config("inactivity-lock-timeout = -5\n"), ConfigError);
  EXPECT_THROW(parse_config("inactivity-lock-timeout = 99999999999999999999\n"), ConfigError);
  EXPECT_THROW(parse_config("max-results = 0\n"), ConfigError);
  EXPECT_THROW(parse_config("focus-max-attempts = 0\n"), ConfigError);
  EXPECT_THROW(parse_config("tool-timeout = 0\n"), ConfigError);
  EXPECT_THROW(parse_config("just some words\n"), ConfigError);
  EXPECT_THROW(parse_config("unlock-prompt = zenity \"unterminated\n"), ConfigError);
}

TEST(ConfigTest, missing_file_yields_defaults) {
  TempDir dir;
  Config cfg = load_config(dir.path() + "/absent");
  EXPECT_EQ(cfg.max_results, DEFAULT_MAX_RESULTS);
}

TEST(ConfigTest, file_is_loaded) {
  TempDir dir;
  std::string path = dir.write_file("config", "max-results = 7\n");
  chmod(path.c_str(), 0600);
  EXPECT_EQ(load_config(path).max_results, 7u);
}

TEST(ConfigTest, group_writable_file_is_rejected) {
  TempDir dir;
  std::string path = dir.write_file("config", "max-results = 7\n");
  chmod(path.c_str(), 0666);
  EXPECT_THROW(load_config(path), ConfigError);
}

TEST(ConfigTest, world_readable_file_is_rejected) {
  TempDir dir;
  std::string path = dir.write_file("config", "max-results = 7\n");
  chmod(path.c_str(), 0644);
  EXPECT_THROW(load_config(path), ConfigError);
}

TEST(ConfigTest, group_readable_file_is_rejected) {
  TempDir dir;
  std::string path = dir.write_file("config", "max-results = 7\n");
  chmod(path.c_str(), 0640);
  EXPECT_THROW(load_config(path), ConfigError);
}

TEST(ConfigTest, split_command_honours_quotes) {
  EXPECT_EQ(split_command("a  b\t\"c d\" \"\""),
            (std::vector<std::string>{ "a", "b", "c d", "" }));
  EXPECT_TRUE(split_command("   ").empty());
}

TEST(UtilTest, field_kinds_parse_case_insensitively) {
  EXPECT_EQ(parse_field_kind("Password"), FieldKind::Password);
  EXPECT_EQ(parse_field_kind("USER"), FieldKind::Username);
  EXPECT_EQ(parse_field_kind("url"), FieldKind::URL);
  EXPECT_EQ(parse_field_kind("otp"), FieldKind::TOTP);
  EXPECT_EQ(parse_field_kind("notes"), FieldKind::Notes);
  EXPECT_FALSE(parse_field_kind("passphrase").has_value());
}

TEST(UtilTest, entry_names_reject_control_characters) {
  EXPECT_TRUE(valid_entry_name("/Internet/mail"));
  EXPECT_FALSE(valid_entry_name(""));
  EXPECT_FALSE(valid_entry_name("  "));
  EXPECT_FALSE(valid_entry_name("a\nb"));
  EXPECT_FALSE(valid_entry_name(std::string(MAX_ENTRY_LEN + 1, 'a')));
}

TEST(ErrorsTest, user_messages_are_specific) {
  EXPECT_NE(user_message(ToolNotFoundError("keepassxc-cli")).find("keepassxc-cli"), std::string::npos);
  EXPECT_NE(user_message(ClipboardToolUnavailable("xclip")).find("xclip"), std::string::npos);
  EXPECT_NE(user_message(ExternalToolError("keepassxc-cli", 1, "Invalid credentials\nmore"))
                .find("Invalid credentials"),
            std::string::npos);
  EXPECT_EQ(user_message(ExternalToolError("t", 1, "first\nsecond")).find("second"), std::string::npos);
  EXPECT_NE(user_message(FocusError("42")).find("focus"), std::string::npos);
  EXPECT_EQ(user_message(std::runtime_error("internal detail")),
            "An unexpected error occurred. Check audit log.");
}
