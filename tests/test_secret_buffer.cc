#include <gtest/gtest.h>
#include "secret_buffer.hpp"
#include "fakes.hpp"

#include <atomic>
#include <thread>

// Buffers are tracked by address, so they must never be copied or moved
static_assert(!std::is_copy_constructible_v<SecretBuffer>);
static_assert(!std::is_move_constructible_v<SecretBuffer>);

static std::string read_all(const SecretBuffer& b) {
  return b.with_view([](std::string_view s) { return std::string(s); });
}

TEST(SecretBufferTest, view_returns_content_and_kind) {
  TempDir dir;
  SecretBuffer b(FieldKind::Username, "alice");
  EXPECT_EQ(read_all(b), "alice");
  EXPECT_EQ(b.kind(), FieldKind::Username);
  EXPECT_EQ(b.size(), 5u);
  EXPECT_FALSE(b.wiped());
  EXPECT_FALSE(b.consumed());
  EXPECT_LE(b.created(), SecretBuffer::Clock::now());
  b.mark_consumed();
  EXPECT_TRUE(b.consumed());
}

TEST(SecretBufferTest, view_after_wipe_always_fails) {
  TempDir dir;
  SecretBuffer b(FieldKind::Password, "hunter2");
  b.wipe();
  EXPECT_TRUE(b.wiped());
  for (int i = 0; i < 3; ++i) {
    EXPECT_THROW(read_all(b), AlreadyWipedError);
  }
}

TEST(SecretBufferTest, wipe_is_idempotent) {
  TempDir dir;
  SecretBuffer b(FieldKind::TOTP, "123456");
  EXPECT_TRUE(b.wipe());
  EXPECT_FALSE(b.wipe());
  EXPECT_FALSE(b.wipe());
}

TEST(SecretBufferTest, empty_content_is_allowed) {
  TempDir dir;
  SecretBuffer b(FieldKind::Notes, "");
  EXPECT_EQ(read_all(b), "");
  EXPECT_TRUE(b.wipe());
}

TEST(SecretBufferTest, oversized_content_is_an_allocation_error) {
  TempDir dir;
  std::string big(MAX_SECRET_LEN + 1, 'x');
  EXPECT_THROW(make_secret(FieldKind::Notes, big), AllocationError);
}

TEST(SecretBufferTest, registry_counts_live_buffers) {
  TempDir dir;
  SecretRegistry reg;
  SecretPtr a = make_secret(FieldKind::Password, "a", &reg);
  SecretPtr b = make_secret(FieldKind::Username, "b", &reg);
  EXPECT_EQ(reg.live(), 2u);
  EXPECT_TRUE(a->attached());

  a->wipe();
  EXPECT_EQ(reg.live(), 1u);
  EXPECT_EQ(reg.wiped_count(), 1u);

  b.reset();  // destruction wipes and deregisters
  EXPECT_EQ(reg.live(), 0u);
  EXPECT_EQ(reg.wiped_count(), 2u);
}

TEST(SecretBufferTest, wipe_all_kills_every_tracked_buffer) {
  TempDir dir;
  SecretRegistry reg;
  SecretPtr a = make_secret(FieldKind::Password, "a", &reg);
  SecretPtr b = make_secret(FieldKind::URL, "https://example.org", &reg);
  SecretPtr untracked = make_secret(FieldKind::Password, "c");

  EXPECT_EQ(reg.wipe_all(), 2u);
  EXPECT_EQ(reg.live(), 0u);
  EXPECT_THROW(read_all(*a), AlreadyWipedError);
  EXPECT_THROW(read_all(*b), AlreadyWipedError);
  EXPECT_FALSE(a->attached());
  EXPECT_EQ(read_all(*untracked), "c");
}

TEST(SecretBufferTest, sealed_registry_wipes_new_buffers_on_arrival) {
  TempDir dir;
  SecretRegistry reg;
  reg.seal_and_wipe();
  EXPECT_TRUE(reg.sealed());

  SecretPtr late = make_secret(FieldKind::Password, "too late", &reg);
  EXPECT_TRUE(late->wiped());
  EXPECT_EQ(reg.live(), 0u);

  reg.unseal();
  SecretPtr ok = make_secret(FieldKind::Password, "fine", &reg);
  EXPECT_FALSE(ok->wiped());
  EXPECT_EQ(reg.live(), 1u);
}

TEST(SecretBufferTest, guard_wipes_on_exception) {
  TempDir dir;
  SecretPtr s = make_secret(FieldKind::Password, "pw");
  try {
    SecretWipeGuard guard(s.get());
    throw std::runtime_error("boom");
  }
  catch (const std::runtime_error&) {
  }
  EXPECT_TRUE(s->wiped());
}

TEST(SecretBufferTest, clone_is_independent_and_tracked) {
  TempDir dir;
  SecretRegistry reg;
  SecretPtr src = make_secret(FieldKind::Passphrase, "master", &reg);
  SecretPtr copy = clone_secret(*src, FieldKind::Passphrase, &reg);

  EXPECT_EQ(reg.live(), 2u);
  copy->wipe();
  EXPECT_EQ(read_all(*src), "master");
  EXPECT_EQ(reg.live(), 1u);
}

TEST(SecretBufferTest, wipe_waits_for_an_active_view) {
  TempDir dir;
  SecretPtr s = make_secret(FieldKind::Password, "abcdefgh");
  std::atomic<bool> in_view{ false };
  std::atomic<bool> wiped{ false };
  std::string seen;

  std::thread reader([&]() {
    s->with_view([&](std::string_view v) {
      in_view = true;
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
      // the wipe has started but must not have overlapped this read
      EXPECT_FALSE(wiped.load());
      seen.assign(v);
    });
  });
  while (!in_view.load()) std::this_thread::yield();
  s->wipe();
  wiped = true;
  reader.join();

  EXPECT_EQ(seen, "abcdefgh");
  EXPECT_THROW(read_all(*s), AlreadyWipedError);
}

TEST(SecretBufferTest, concurrent_reads_never_see_partial_content) {
  TempDir dir;
  SecretPtr s = make_secret(FieldKind::Password, "0123456789");
  std::atomic<bool> stop{ false };
  std::atomic<int> bad{ 0 };

  std::thread reader([&]() {
    while (!stop.load()) {
      try {
        std::string v = read_all(*s);
        if (v != "0123456789") ++bad;
      }
      catch (const AlreadyWipedError&) {
        stop = true;
      }
    }
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  s->wipe();
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  stop = true;
  reader.join();
  EXPECT_EQ(bad.load(), 0);
}

TEST(SecretBufferTest, wipe_string_zeroes_and_clears) {
  std::string s = "temporary secret";
  wipe_string(s);
  EXPECT_TRUE(s.empty());
}
