/**
 * @file test_board_scenarios.cpp
 * @brief End-to-end board scenarios driven through the hub
 */

#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <recording_transport.h>
#include <syncboard/syncboard.h>
#include <thread>
#include <vector>

using namespace syncboard;
using syncboard::testing::RecordingTransport;
using namespace std::chrono_literals;

class BoardScenarioTest : public ::testing::Test {
protected:
  static BoardConfig scenario_board() {
    BoardConfig config;
    config.max_text_size_bytes = 1024;
    config.files.ttl = 1s;
    config.files.max_file_size_bytes = 1024;
    config.files.max_total_bytes = 4096;
    return config;
  }

  void SetUp() override { ASSERT_TRUE(security_init().is_ok()); }

  Board board{scenario_board()};
  RecordingTransport transport;
  BroadcastHub hub{board, transport};
};

// ============================================================================
// Concurrent Text Edits
// ============================================================================

TEST_F(BoardScenarioTest, TwoEditorsRaceOnTheSameVersion) {
  ASSERT_TRUE(hub.on_client_connected("alice").is_ok());
  ASSERT_TRUE(hub.on_client_connected("bob").is_ok());
  transport.clear_events();

  ASSERT_TRUE(hub.on_text_submit("alice", "hello", 0).is_ok());
  auto lost = hub.on_text_submit("bob", "world", 0);
  ASSERT_TRUE(lost.is_error());
  EXPECT_EQ(lost.error().code, ErrorCode::StaleVersion);

  // Bob learns the winning text and retries on top of it
  auto rejected = transport.events_of<TextRejectedEvent>("bob");
  ASSERT_EQ(rejected.size(), 1u);
  ASSERT_EQ(rejected[0].current.version, 1u);
  ASSERT_TRUE(
      hub.on_text_submit("bob", "world", rejected[0].current.version).is_ok());

  auto alice_view = transport.events_of<TextUpdatedEvent>("alice");
  ASSERT_EQ(alice_view.size(), 2u);
  EXPECT_EQ(alice_view[0].text.content, "hello");
  EXPECT_EQ(alice_view[1].text.content, "world");
  EXPECT_EQ(alice_view[1].text.version, 2u);
  EXPECT_TRUE(transport.events_of<TextRejectedEvent>("alice").empty());
}

TEST_F(BoardScenarioTest, ParallelSubmittersSeeOneWinnerPerVersion) {
  constexpr int kClients = 6;
  for (int i = 0; i < kClients; ++i) {
    ASSERT_TRUE(hub.on_client_connected("c" + std::to_string(i)).is_ok());
  }
  transport.clear_events();

  std::atomic<int> accepted{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kClients; ++i) {
    threads.emplace_back([this, i, &accepted]() {
      auto id = "c" + std::to_string(i);
      if (hub.on_text_submit(id, "from " + id, 0).is_ok()) {
        accepted.fetch_add(1);
      }
    });
  }
  for (auto &t : threads) {
    t.join();
  }

  EXPECT_EQ(accepted.load(), 1);
  EXPECT_EQ(board.clipboard().version(), 1u);

  // Every client saw the same single update
  const auto winner = board.clipboard().current().content;
  for (int i = 0; i < kClients; ++i) {
    auto updates = transport.events_of<TextUpdatedEvent>("c" + std::to_string(i));
    ASSERT_EQ(updates.size(), 1u);
    EXPECT_EQ(updates[0].text.content, winner);
  }
}

// ============================================================================
// File Expiry
// ============================================================================

TEST_F(BoardScenarioTest, FileExpiresEvenWithoutASweep) {
  ASSERT_TRUE(hub.on_client_connected("alice").is_ok());
  auto t0 = MonoClock::now();
  auto uploaded = board.files().put("note.txt", "text/plain", Bytes(10, 'x'),
                                    "alice", t0);
  ASSERT_TRUE(uploaded.is_ok());

  auto later = t0 + 2s;
  auto got = board.files().get(uploaded.value().id, later);
  ASSERT_TRUE(got.is_error());
  EXPECT_EQ(got.error().code, ErrorCode::Expired);
  EXPECT_TRUE(board.files().list(later).empty());
}

TEST_F(BoardScenarioTest, SweepAnnouncesExpiredFile) {
  ASSERT_TRUE(hub.on_client_connected("alice").is_ok());
  ASSERT_TRUE(hub.on_client_connected("bob").is_ok());
  auto uploaded = hub.on_file_upload("alice", "note.txt", "text/plain",
                                     Bytes(10, 'x'));
  ASSERT_TRUE(uploaded.is_ok());
  transport.clear_events();

  auto removed = hub.periodic_sweep(MonoClock::now() + 2s);
  ASSERT_EQ(removed.size(), 1u);

  auto bob_view = transport.events_of<FileRemovedEvent>("bob");
  ASSERT_EQ(bob_view.size(), 1u);
  EXPECT_EQ(bob_view[0].id, uploaded.value().id);
  EXPECT_EQ(hub.on_file_download_request(uploaded.value().id).error().code,
            ErrorCode::NotFound);
}

TEST_F(BoardScenarioTest, SweeperThreadDrivesTheHub) {
  ASSERT_TRUE(hub.on_client_connected("alice").is_ok());
  auto stale = board.files().put("old.bin", "", Bytes(4, 0), "alice",
                                 MonoClock::now() - 10s);
  ASSERT_TRUE(stale.is_ok());
  transport.clear_events();

  Sweeper sweeper("expiry sweeper");
  ASSERT_TRUE(sweeper.start(10ms, [this]() { hub.periodic_sweep(); }).is_ok());

  auto deadline = MonoClock::now() + 2s;
  while (board.files().count() != 0 && MonoClock::now() < deadline) {
    std::this_thread::sleep_for(5ms);
  }
  sweeper.stop();

  EXPECT_EQ(board.files().count(), 0u);
  auto removed = transport.events_of<FileRemovedEvent>("alice");
  ASSERT_EQ(removed.size(), 1u);
  EXPECT_EQ(removed[0].id, stale.value().id);
}

// ============================================================================
// Limits And Failures
// ============================================================================

TEST_F(BoardScenarioTest, OversizedUploadLeavesBoardUntouched) {
  ASSERT_TRUE(hub.on_client_connected("alice").is_ok());
  ASSERT_TRUE(hub.on_client_connected("bob").is_ok());
  transport.clear_events();

  auto result = hub.on_file_upload("alice", "huge.iso", "", Bytes(2048, 0));
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::PayloadTooLarge);

  EXPECT_EQ(board.files().count(), 0u);
  EXPECT_EQ(board.files().total_bytes(), 0u);
  EXPECT_TRUE(transport.events_for("bob").empty());
}

TEST_F(BoardScenarioTest, ClientVanishingMidBroadcastDoesNotStopOthers) {
  for (const char *id : {"a", "b", "c", "d"}) {
    ASSERT_TRUE(hub.on_client_connected(id).is_ok());
  }
  transport.fail_sends_to("c");
  transport.clear_events();

  auto uploaded = hub.on_file_upload("a", "photo.jpg", "image/jpeg",
                                     Bytes(16, 0xff));
  ASSERT_TRUE(uploaded.is_ok());

  for (const char *id : {"a", "b", "d"}) {
    EXPECT_EQ(transport.events_of<FileAddedEvent>(id).size(), 1u) << id;
    auto presence = transport.events_of<PresenceChangedEvent>(id);
    ASSERT_EQ(presence.size(), 1u) << id;
    EXPECT_EQ(presence[0].client_count, 3u);
  }
  EXPECT_FALSE(board.clients().contains("c"));

  // The board keeps working for the survivors
  ASSERT_TRUE(hub.on_text_submit("b", "still here", 0).is_ok());
  EXPECT_EQ(transport.events_of<TextUpdatedEvent>("d").size(), 1u);
}

TEST_F(BoardScenarioTest, ReconnectAfterDisconnectGetsFreshSnapshot) {
  ASSERT_TRUE(hub.on_client_connected("alice").is_ok());
  ASSERT_TRUE(hub.on_text_submit("alice", "persisted", 0).is_ok());
  hub.on_client_disconnected("alice");
  EXPECT_EQ(board.clients().count(), 0u);

  transport.clear_events();
  ASSERT_TRUE(hub.on_client_connected("alice2").is_ok());
  auto text = transport.events_of<TextUpdatedEvent>("alice2");
  ASSERT_EQ(text.size(), 1u);
  EXPECT_EQ(text[0].text.content, "persisted");
}
