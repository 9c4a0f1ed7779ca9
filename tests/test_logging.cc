#include <gtest/gtest.h>
#include "logging.hpp"
#include "fakes.hpp"

#include <fstream>

namespace {

LogContext sample_context() {
  LogContext ctx;
  ctx.userId = "alice";
  ctx.ip = "10.0.0.7";
  ctx.sessionId = "abcd1234";
  return ctx;
}

std::string read_log(const std::string& path) {
  std::ifstream in(path);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

size_t count_of(const std::string& hay, const std::string& needle) {
  size_t n = 0;
  for (size_t pos = hay.find(needle); pos != std::string::npos; pos = hay.find(needle, pos + 1)) {
    ++n;
  }
  return n;
}

}  // namespace

TEST(LoggingTest, line_has_all_columns_in_order) {
  std::string line = format_audit_line(LogLevel::WARN, sample_context(), 0,
                                       "Database locked", "session", "success");
  ASSERT_FALSE(line.empty());
  EXPECT_EQ(line.back(), '\n');
  size_t first = line.find(" | ");
  ASSERT_NE(first, std::string::npos);
  EXPECT_EQ(line.substr(first),
            " | WARN | user=alice | ip=10.0.0.7 | session=abcd1234"
            " | event=session | outcome=success | Database locked\n");
}

TEST(LoggingTest, newlines_cannot_forge_records) {
  std::string line = format_audit_line(LogLevel::INFO, sample_context(), 0,
                                       "entry\nFAKE | ALERT", "ev|ent\r", "ok");
  EXPECT_EQ(count_of(line, "\n"), 1u);
  EXPECT_NE(line.find("event=ev/ent "), std::string::npos);
  EXPECT_NE(line.find("| entry FAKE | ALERT\n"), std::string::npos);
}

TEST(LoggingTest, level_names) {
  EXPECT_STREQ(log_level_name(LogLevel::INFO), "INFO");
  EXPECT_STREQ(log_level_name(LogLevel::ERROR), "ERROR");
  EXPECT_STREQ(log_level_name(LogLevel::ALERT), "ALERT");
}

TEST(LoggingTest, log_file_is_owner_only) {
  TempDir dir;
  std::string path = dir.write_file("audit.log", "");
  chmod(path.c_str(), 0644);

  audit_log_level(LogLevel::INFO, "Database unlocked", "session", "success");

  struct stat st;
  ASSERT_EQ(stat(path.c_str(), &st), 0);
  EXPECT_EQ(st.st_mode & 0777, 0600u);
  std::string content = read_log(path);
  EXPECT_NE(content.find("event=session | outcome=success | Database unlocked\n"),
            std::string::npos);
}

TEST(LoggingTest, records_are_appended) {
  TempDir dir;
  audit_log_level(LogLevel::INFO, "first", "test", "notify");
  audit_log_level(LogLevel::ERROR, "second", "test", "failure");

  std::string content = read_log(dir.path() + "/audit.log");
  EXPECT_EQ(count_of(content, "\n"), 2u);
  EXPECT_LT(content.find("first"), content.find("second"));
}

TEST(LoggingTest, warn_once_logs_a_key_only_once) {
  TempDir dir;
  warn_once("logging-test-key", "xdotool missing", "focus");
  warn_once("logging-test-key", "xdotool missing", "focus");

  std::string content = read_log(dir.path() + "/audit.log");
  EXPECT_EQ(count_of(content, "xdotool missing"), 1u);
  EXPECT_NE(content.find("| WARN |"), std::string::npos);
  EXPECT_NE(content.find("outcome=degraded"), std::string::npos);
}

TEST(LoggingTest, redirect_can_be_reset) {
  set_audit_log_path("/tmp/somewhere.log");
  EXPECT_EQ(audit_log_path(), "/tmp/somewhere.log");
  set_audit_log_path("");
  EXPECT_EQ(audit_log_path(), std::string(AUDIT_LOG));
}
