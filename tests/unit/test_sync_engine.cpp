/**
 * @file test_sync_engine.cpp
 * @brief Unit tests for clipboard change propagation
 */

#include <atomic>
#include <chrono>
#include <clipsync/notification.h>
#include <clipsync/security.h>
#include <clipsync/sync_engine.h>
#include <condition_variable>
#include <gtest/gtest.h>
#include <mutex>
#include <thread>
#include <vector>

using namespace clipsync;
using namespace std::chrono_literals;

namespace {

class RecordingNotifier : public Notifier {
public:
  Result<void> notify(const std::string &title,
                      const std::string &body) override {
    std::lock_guard<std::mutex> lock(mutex);
    titles.push_back(title);
    bodies.push_back(body);
    return Result<void>::ok();
  }

  size_t count() {
    std::lock_guard<std::mutex> lock(mutex);
    return titles.size();
  }

  std::mutex mutex;
  std::vector<std::string> titles;
  std::vector<std::string> bodies;
};

ClipboardMessage peer_message(const std::string &text,
                              const DeviceId &sender = Uuid::generate()) {
  ClipboardMessage msg;
  msg.content = TextContent{text};
  msg.timestamp = std::chrono::system_clock::now();
  msg.sender_id = sender;
  msg.sender_name = "phone";
  msg.message_id = Uuid::generate();
  return msg;
}

std::string clipboard_text(const MemoryClipboard &clipboard) {
  auto content = clipboard.get();
  if (!content || !std::holds_alternative<TextContent>(*content)) {
    return {};
  }
  return std::get<TextContent>(*content).text;
}

} // namespace

class SyncEngineTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(security_init().is_ok());
    engine = make_engine(SyncConfig{});
  }

  std::unique_ptr<SyncEngine> make_engine(SyncConfig config) {
    auto e = std::make_unique<SyncEngine>(clipboard, local_id, "laptop",
                                          config);
    e->set_notifier(&notifier);
    e->set_broadcaster([this](const ClipboardMessage &msg) {
      std::lock_guard<std::mutex> lock(sent_mutex);
      sent.push_back(msg);
    });
    return e;
  }

  size_t sent_count() {
    std::lock_guard<std::mutex> lock(sent_mutex);
    return sent.size();
  }

  MemoryClipboard clipboard;
  RecordingNotifier notifier;
  DeviceId local_id = Uuid::generate();

  std::mutex sent_mutex;
  std::vector<ClipboardMessage> sent;

  std::unique_ptr<SyncEngine> engine;
};

// ============================================================================
// Polling
// ============================================================================

TEST_F(SyncEngineTest, FirstPollAdoptsBaseline) {
  clipboard.set(TextContent{"already here"});

  auto first = engine->poll_once();
  ASSERT_TRUE(first.is_ok());
  EXPECT_FALSE(first.value());
  EXPECT_EQ(sent_count(), 0u);
}

TEST_F(SyncEngineTest, LocalChangeIsBroadcastOnce) {
  clipboard.set(TextContent{"old"});
  ASSERT_TRUE(engine->poll_once().is_ok());

  clipboard.set(TextContent{"hello"});
  auto changed = engine->poll_once();
  ASSERT_TRUE(changed.is_ok());
  EXPECT_TRUE(changed.value());

  auto unchanged = engine->poll_once();
  ASSERT_TRUE(unchanged.is_ok());
  EXPECT_FALSE(unchanged.value());

  ASSERT_EQ(sent_count(), 1u);
  const auto &msg = sent[0];
  EXPECT_EQ(std::get<TextContent>(msg.content).text, "hello");
  EXPECT_EQ(msg.sender_id, local_id);
  EXPECT_EQ(msg.sender_name, "laptop");
  EXPECT_FALSE(msg.message_id.is_zero());
  EXPECT_TRUE(engine->was_applied(msg.message_id));
  EXPECT_EQ(engine->get_stats().changes_broadcast, 1u);
}

TEST_F(SyncEngineTest, EmptyClipboardThenCopy) {
  ASSERT_TRUE(engine->poll_once().is_ok());

  clipboard.set(TextContent{"first copy"});
  auto changed = engine->poll_once();
  ASSERT_TRUE(changed.is_ok());
  EXPECT_TRUE(changed.value());
}

TEST_F(SyncEngineTest, EmptyTextIsNotBroadcast) {
  ASSERT_TRUE(engine->poll_once().is_ok());

  clipboard.set(TextContent{""});
  auto polled = engine->poll_once();
  ASSERT_TRUE(polled.is_ok());
  EXPECT_FALSE(polled.value());
  EXPECT_EQ(sent_count(), 0u);
}

TEST_F(SyncEngineTest, ImageChangeIsBroadcast) {
  ASSERT_TRUE(engine->poll_once().is_ok());

  ImageContent image;
  image.width = 1;
  image.height = 1;
  image.bytes = {0x89, 'P', 'N', 'G'};
  clipboard.set(image);

  auto changed = engine->poll_once();
  ASSERT_TRUE(changed.is_ok());
  EXPECT_TRUE(changed.value());
  ASSERT_EQ(sent_count(), 1u);
  EXPECT_EQ(std::get<ImageContent>(sent[0].content), image);
}

TEST_F(SyncEngineTest, ReadFailureSkipsCycle) {
  ASSERT_TRUE(engine->poll_once().is_ok());

  clipboard.set_fail_reads(true);
  clipboard.set(TextContent{"unreadable"});
  auto failed = engine->poll_once();
  ASSERT_TRUE(failed.is_error());
  EXPECT_EQ(failed.error().code, ErrorCode::ClipboardAccessError);
  EXPECT_EQ(engine->get_stats().access_errors, 1u);

  clipboard.set_fail_reads(false);
  auto retried = engine->poll_once();
  ASSERT_TRUE(retried.is_ok());
  EXPECT_TRUE(retried.value());
}

// ============================================================================
// Apply
// ============================================================================

TEST_F(SyncEngineTest, ApplyWritesAndIsNotEchoed) {
  ASSERT_TRUE(engine->poll_once().is_ok());

  auto msg = peer_message("hello");
  auto applied = engine->apply(msg);
  ASSERT_TRUE(applied.is_ok());
  EXPECT_TRUE(applied.value());
  EXPECT_EQ(clipboard_text(clipboard), "hello");

  // The applied content must not come back as a local change
  auto polled = engine->poll_once();
  ASSERT_TRUE(polled.is_ok());
  EXPECT_FALSE(polled.value());
  EXPECT_EQ(sent_count(), 0u);
}

TEST_F(SyncEngineTest, SameMessageAppliedOnce) {
  auto msg = peer_message("hello");

  EXPECT_TRUE(engine->apply(msg).value());
  EXPECT_FALSE(engine->apply(msg).value());

  EXPECT_EQ(clipboard.write_count(), 1u);
  auto stats = engine->get_stats();
  EXPECT_EQ(stats.messages_applied, 1u);
  EXPECT_EQ(stats.duplicates_dropped, 1u);
}

TEST_F(SyncEngineTest, OwnMessageNeverApplied) {
  auto echo = peer_message("mine", local_id);

  auto applied = engine->apply(echo);
  ASSERT_TRUE(applied.is_ok());
  EXPECT_FALSE(applied.value());
  EXPECT_EQ(clipboard.write_count(), 0u);
  EXPECT_EQ(engine->get_stats().echoes_dropped, 1u);
}

TEST_F(SyncEngineTest, BroadcastEchoedBackIsDropped) {
  clipboard.set(TextContent{"a"});
  ASSERT_TRUE(engine->poll_once().is_ok());
  clipboard.set(TextContent{"b"});
  ASSERT_TRUE(engine->poll_once().value());
  ASSERT_EQ(sent_count(), 1u);

  // A peer relays our own message, even under its own sender id
  auto relayed = sent[0];
  relayed.sender_id = Uuid::generate();
  EXPECT_FALSE(engine->apply(relayed).value());
  EXPECT_EQ(clipboard.write_count(), 0u);
}

TEST_F(SyncEngineTest, FailedWriteIsNotRemembered) {
  auto msg = peer_message("retry me");

  clipboard.set_fail_writes(true);
  auto failed = engine->apply(msg);
  ASSERT_TRUE(failed.is_error());
  EXPECT_EQ(failed.error().code, ErrorCode::ClipboardAccessError);
  EXPECT_FALSE(engine->was_applied(msg.message_id));
  EXPECT_EQ(notifier.count(), 0u);

  clipboard.set_fail_writes(false);
  auto redelivered = engine->apply(msg);
  ASSERT_TRUE(redelivered.is_ok());
  EXPECT_TRUE(redelivered.value());
  EXPECT_EQ(clipboard_text(clipboard), "retry me");
}

TEST_F(SyncEngineTest, ApplyNotifies) {
  ASSERT_TRUE(engine->apply(peer_message("hello")).is_ok());

  ASSERT_EQ(notifier.count(), 1u);
  EXPECT_EQ(notifier.titles[0], "Clipboard synced");
  EXPECT_NE(notifier.bodies[0].find("hello"), std::string::npos);
  EXPECT_NE(notifier.bodies[0].find("phone"), std::string::npos);
}

TEST_F(SyncEngineTest, NotificationTextIsValidUtf8) {
  auto msg = peer_message("\xFF\xFE");
  msg.sender_name = std::string("bad") + "\xC3";

  auto applied = engine->apply(msg);
  ASSERT_TRUE(applied.is_ok());
  EXPECT_TRUE(applied.value());

  // Clipboard gets the bytes as sent
  EXPECT_EQ(clipboard_text(clipboard), "\xFF\xFE");

  ASSERT_EQ(notifier.count(), 1u);
  EXPECT_EQ(sanitize_utf8(notifier.bodies[0]), notifier.bodies[0]);
  EXPECT_NE(notifier.bodies[0].find("bad"), std::string::npos);
}

TEST_F(SyncEngineTest, DesktopNotifierAcceptsInvalidUtf8) {
  // Without a session bus notify() fails and apply() carries on
  auto desktop = create_desktop_notifier("ClipSync Test");
  ASSERT_NE(desktop, nullptr);
  engine->set_notifier(desktop.get());

  auto msg = peer_message("\xFF\xFE");
  msg.sender_name = std::string("\xC0") + "\xAF";
  auto applied = engine->apply(msg);
  ASSERT_TRUE(applied.is_ok());
  EXPECT_TRUE(applied.value());
  EXPECT_EQ(engine->get_stats().messages_applied, 1u);

  auto direct = desktop->notify("\xFF", "\xFE\xFD");
  if (direct.is_error()) {
    EXPECT_EQ(direct.error().code, ErrorCode::NotificationFailed);
  }
  engine->set_notifier(nullptr);
}

TEST_F(SyncEngineTest, SlowNotifierDoesNotDelayApply) {
  // Stands in for a notification daemon that takes its full call timeout
  class SlowNotifier : public Notifier {
  public:
    Result<void> notify(const std::string &title,
                        const std::string &body) override {
      CLIPSYNC_UNUSED(title);
      CLIPSYNC_UNUSED(body);
      std::this_thread::sleep_for(500ms);
      ++calls;
      return Result<void>::ok();
    }
    std::atomic<int> calls{0};
  };

  auto slow = std::make_unique<SlowNotifier>();
  SlowNotifier &inner = *slow;
  AsyncNotifier queued(std::move(slow));
  engine->set_notifier(&queued);

  auto started = std::chrono::steady_clock::now();
  ASSERT_TRUE(engine->apply(peer_message("first")).value());
  ASSERT_TRUE(engine->apply(peer_message("second")).value());
  EXPECT_LT(std::chrono::steady_clock::now() - started, 250ms);

  queued.flush();
  EXPECT_EQ(inner.calls.load(), 2);
  engine->set_notifier(nullptr);
}

TEST(AsyncNotifierTest, RejectsWhenQueueIsFull) {
  struct Gate {
    std::mutex mutex;
    std::condition_variable cv;
    bool entered = false;
    bool released = false;
  };

  class GatedNotifier : public Notifier {
  public:
    explicit GatedNotifier(Gate &gate) : gate_(gate) {}
    Result<void> notify(const std::string &title,
                        const std::string &body) override {
      CLIPSYNC_UNUSED(body);
      std::unique_lock<std::mutex> lock(gate_.mutex);
      titles.push_back(title);
      gate_.entered = true;
      gate_.cv.notify_all();
      gate_.cv.wait(lock, [this] { return gate_.released; });
      return Error(ErrorCode::NotificationFailed, "No daemon");
    }
    std::vector<std::string> titles;

  private:
    Gate &gate_;
  };

  Gate gate;
  auto gated = std::make_unique<GatedNotifier>(gate);
  GatedNotifier &inner = *gated;
  AsyncNotifier queued(std::move(gated), 1);

  ASSERT_TRUE(queued.notify("one", "").is_ok());
  {
    std::unique_lock<std::mutex> lock(gate.mutex);
    ASSERT_TRUE(gate.cv.wait_for(lock, 3s, [&] { return gate.entered; }));
  }
  EXPECT_TRUE(queued.notify("two", "").is_ok());

  auto full = queued.notify("three", "");
  ASSERT_TRUE(full.is_error());
  EXPECT_EQ(full.error().code, ErrorCode::NotificationFailed);

  {
    std::lock_guard<std::mutex> lock(gate.mutex);
    gate.released = true;
  }
  gate.cv.notify_all();
  queued.flush();

  std::lock_guard<std::mutex> lock(gate.mutex);
  EXPECT_EQ(inner.titles, (std::vector<std::string>{"one", "two"}));
}

TEST_F(SyncEngineTest, NotificationsCanBeDisabled) {
  SyncConfig config;
  config.notifications = false;
  auto quiet = make_engine(config);

  ASSERT_TRUE(quiet->apply(peer_message("hello")).is_ok());
  EXPECT_EQ(notifier.count(), 0u);
}

TEST_F(SyncEngineTest, RecentSetIsBounded) {
  SyncConfig config;
  config.dedup_capacity = 3;
  auto bounded = make_engine(config);

  std::vector<ClipboardMessage> messages;
  for (int i = 0; i < 5; ++i) {
    messages.push_back(peer_message("m" + std::to_string(i)));
    ASSERT_TRUE(bounded->apply(messages.back()).value());
  }

  EXPECT_EQ(bounded->recent_count(), 3u);
  EXPECT_FALSE(bounded->was_applied(messages[0].message_id));
  EXPECT_FALSE(bounded->was_applied(messages[1].message_id));
  EXPECT_TRUE(bounded->was_applied(messages[4].message_id));
}

TEST_F(SyncEngineTest, RecentEntriesExpire) {
  SyncConfig config;
  config.dedup_retention = 1ms;
  auto forgetful = make_engine(config);

  auto first = peer_message("one");
  ASSERT_TRUE(forgetful->apply(first).value());
  std::this_thread::sleep_for(10ms);
  ASSERT_TRUE(forgetful->apply(peer_message("two")).value());

  EXPECT_FALSE(forgetful->was_applied(first.message_id));
}

// ============================================================================
// Queue and Task
// ============================================================================

TEST_F(SyncEngineTest, PollDrainsQueueFirst) {
  ASSERT_TRUE(engine->poll_once().is_ok());

  engine->enqueue(peer_message("queued"));
  EXPECT_EQ(engine->pending_count(), 1u);

  auto polled = engine->poll_once();
  ASSERT_TRUE(polled.is_ok());
  EXPECT_FALSE(polled.value());
  EXPECT_EQ(engine->pending_count(), 0u);
  EXPECT_EQ(clipboard_text(clipboard), "queued");
  EXPECT_EQ(sent_count(), 0u);
}

TEST_F(SyncEngineTest, RunningTaskAppliesAndBroadcasts) {
  SyncConfig config;
  config.poll_interval = 20ms;
  auto live = make_engine(config);

  ASSERT_TRUE(live->start().is_ok());
  EXPECT_EQ(live->start().error().code, ErrorCode::AlreadyInitialized);

  live->enqueue(peer_message("from peer"));
  auto deadline = std::chrono::steady_clock::now() + 2s;
  while (clipboard_text(clipboard) != "from peer" &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(5ms);
  }
  EXPECT_EQ(clipboard_text(clipboard), "from peer");

  clipboard.set(TextContent{"typed locally"});
  while (sent_count() == 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(5ms);
  }
  live->stop();
  EXPECT_FALSE(live->is_running());

  ASSERT_EQ(sent_count(), 1u);
  EXPECT_EQ(std::get<TextContent>(sent[0].content).text, "typed locally");
}
