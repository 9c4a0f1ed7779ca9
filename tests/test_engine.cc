#include <gtest/gtest.h>
#include "engine.hpp"
#include "fakes.hpp"

namespace {

// Scripted keepassxc-cli: a small in-memory database
ProcessResult fake_cli(const RecordedCall& c) {
  const std::string& verb = c.verb();
  if (verb == "ls") return ProcessResult{};
  if (verb == "search") {
    return output("/a\n/b\n/c\n/d\n/e\n");
  }
  if (verb == "show") {
    const std::string& entry = c.args.back();
    if (c.args_contain("UserName")) return output(entry == "/nouser" ? "\n" : "alice\n");
    if (c.args_contain("Password")) return output("pw-" + entry.substr(1) + "\n");
    return output("Title: " + entry.substr(1) + "\nUserName: alice\nPassword: PROTECTED\n");
  }
  if (verb == "clip") {
    ProcessResult r = output("Entry's password copied to the clipboard!\n");
    r.acknowledged = true;
    return r;
  }
  return ProcessResult{};
}

class EngineTest : public ::testing::Test {
 protected:
  EngineTest() {
    cfg.database_path = dir.write_file("db.kdbx", "x");
    cfg.max_results = 3;
    cfg.timer_granularity_ms = 20;
    cfg.focus_attempts = 3;
    cfg.focus_poll_ms = 1;
    cfg.autotype_delay_ms = 0;
    runner.on_run(fake_cli);
    windows.active_id = "42";
  }

  std::unique_ptr<Engine> make() {
    auto e = std::make_unique<Engine>(cfg, runner, windows, no_sleep(),
                                      [](const std::string&) { return true; });
    return e;
  }

  std::unique_ptr<Engine> unlocked() {
    auto e = make();
    EXPECT_TRUE(e->unlock(make_secret(FieldKind::Passphrase, "master-pass")));
    return e;
  }

  TempDir dir;
  Config cfg;
  FakeRunner runner;
  FakeWindowTool windows;
};

}  // namespace

TEST_F(EngineTest, requests_on_a_locked_session_are_refused) {
  auto e = make();
  EXPECT_THROW(e->search("mail"), SessionLockedError);
  EXPECT_THROW(e->details("/a"), SessionLockedError);
  EXPECT_THROW(e->copy("/a", FieldKind::Password), SessionLockedError);
  EXPECT_THROW(e->autotype("42", "/a", FieldKind::Password), SessionLockedError);
  EXPECT_EQ(runner.calls().size(), 0u);
}

TEST_F(EngineTest, search_truncates_to_max_results) {
  auto e = unlocked();
  SearchResults r = e->search("x");
  EXPECT_EQ(r.entries, (std::vector<std::string>{ "/a", "/b", "/c" }));
  EXPECT_EQ(r.more, 2u);
}

TEST_F(EngineTest, empty_search_lists_recent_entries) {
  auto e = unlocked();
  e->details("/a");
  e->details("/b");
  e->details("/a");
  SearchResults r = e->search("");
  EXPECT_EQ(r.entries, (std::vector<std::string>{ "/a", "/b" }));
  EXPECT_EQ(r.more, 0u);
}

TEST_F(EngineTest, recent_entries_are_bounded) {
  auto e = unlocked();
  for (const char* name : { "/a", "/b", "/c", "/d" }) e->details(name);
  EXPECT_EQ(e->recent(), (std::vector<std::string>{ "/d", "/c", "/b" }));
}

TEST_F(EngineTest, details_never_carry_the_password) {
  auto e = unlocked();
  EntryDetails d = e->details("/a");
  EXPECT_EQ(d.get("Title"), "a");
  EXPECT_EQ(d.get("Password"), "PROTECTED");
}

TEST_F(EngineTest, autotype_fetches_types_and_wipes) {
  auto e = unlocked();
  std::string target = e->capture_target();
  EXPECT_EQ(target, "42");

  e->autotype(target, "/a", FieldKind::Password);

  auto calls = runner.calls();
  ASSERT_FALSE(calls.empty());
  const RecordedCall& typed = calls.back();
  EXPECT_EQ(typed.verb(), "type");
  EXPECT_EQ(typed.stdin_data, "pw-a");
  EXPECT_FALSE(typed.args_contain("pw-a"));
  // only the cached passphrase is still alive
  EXPECT_EQ(e->session().live_secrets(), 1u);
  EXPECT_EQ(e->autotype_driver().state(), AutotypeState::Done);
}

TEST_F(EngineTest, autotype_login_types_both_fields) {
  auto e = unlocked();
  e->autotype_login("42", "/b");

  std::vector<std::string> injected;
  for (const auto& c : runner.calls()) {
    if (c.verb() == "type") injected.push_back(c.stdin_data);
    if (c.verb() == "key") injected.push_back("<" + c.args.back() + ">");
  }
  EXPECT_EQ(injected, (std::vector<std::string>{ "alice", "<Tab>", "pw-b", "<Return>" }));
  EXPECT_EQ(e->session().live_secrets(), 1u);
}

TEST_F(EngineTest, autotype_login_without_username_types_tab_and_password) {
  auto e = unlocked();
  e->autotype_login("42", "/nouser");

  std::vector<std::string> injected;
  for (const auto& c : runner.calls()) {
    if (c.verb() == "type") injected.push_back(c.stdin_data);
    if (c.verb() == "key") injected.push_back("<" + c.args.back() + ">");
  }
  EXPECT_EQ(injected, (std::vector<std::string>{ "<Tab>", "pw-nouser", "<Return>" }));
  EXPECT_EQ(e->session().live_secrets(), 1u);
  EXPECT_TRUE(e->session().unlocked());
}

TEST_F(EngineTest, autotype_focus_failure_is_reported_and_session_survives) {
  windows.active_id = "1";
  auto e = unlocked();
  EXPECT_THROW(e->autotype("42", "/a", FieldKind::Password), FocusError);
  EXPECT_EQ(runner.count_verb("type"), 0u);
  EXPECT_EQ(e->session().live_secrets(), 1u);
  EXPECT_TRUE(e->session().unlocked());
}

TEST_F(EngineTest, copy_hands_the_passphrase_to_clip_mode) {
  auto e = unlocked();
  ClipboardTransfer t = e->copy("/c", FieldKind::Password);
  EXPECT_EQ(t.clear_seconds, DEFAULT_CLIP_CLEAR_SECONDS);
  EXPECT_EQ(runner.count_verb("clip"), 1u);
  EXPECT_EQ(e->session().live_secrets(), 1u);
  EXPECT_EQ(e->recent().front(), "/c");
}

TEST_F(EngineTest, invalid_entry_names_are_rejected) {
  auto e = unlocked();
  EXPECT_THROW(e->details("   "), InvalidInputError);
  EXPECT_THROW(e->copy(std::string("a\nb"), FieldKind::Password), InvalidInputError);
}

TEST_F(EngineTest, lock_wipes_and_refuses_further_requests) {
  auto e = unlocked();
  e->lock();
  EXPECT_EQ(e->session().live_secrets(), 0u);
  EXPECT_THROW(e->search("x"), SessionLockedError);
}

TEST_F(EngineTest, reload_with_new_database_locks_and_resets_recent) {
  auto e = unlocked();
  e->details("/a");

  Config next = cfg;
  next.database_path = dir.write_file("other.kdbx", "y");
  e->reload(next);

  EXPECT_FALSE(e->session().unlocked());
  EXPECT_TRUE(e->recent().empty());
  EXPECT_EQ(e->store().database(), next.database_path);
}

TEST_F(EngineTest, reload_of_unrelated_settings_keeps_the_session) {
  auto e = unlocked();
  e->details("/a");

  Config next = cfg;
  next.max_results = 10;
  next.clip_clear_seconds = 30;
  e->reload(next);

  EXPECT_TRUE(e->session().unlocked());
  EXPECT_EQ(e->recent().size(), 1u);
  EXPECT_EQ(e->copy("/a", FieldKind::Password).clear_seconds, 30u);
}

TEST_F(EngineTest, reload_with_new_timeout_locks) {
  auto e = unlocked();
  Config next = cfg;
  next.inactivity_timeout_seconds = 60;
  e->reload(next);
  EXPECT_FALSE(e->session().unlocked());
  EXPECT_EQ(e->session().timeout(), std::chrono::seconds(60));
}
