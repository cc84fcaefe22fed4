/**
 * @file test_hub.cpp
 * @brief Unit tests for the BroadcastHub against a recording transport
 */

#include <gtest/gtest.h>
#include <recording_transport.h>
#include <syncboard/syncboard.h>

using namespace syncboard;
using syncboard::testing::RecordingTransport;
using namespace std::chrono_literals;

class HubTest : public ::testing::Test {
protected:
  static BoardConfig small_board() {
    BoardConfig config;
    config.max_text_size_bytes = 64;
    config.files.ttl = 60s;
    config.files.max_file_size_bytes = 100;
    config.files.max_total_bytes = 200;
    config.client_timeout = 30s;
    return config;
  }

  void SetUp() override { ASSERT_TRUE(security_init().is_ok()); }

  void connect(const ClientId &id) {
    ASSERT_TRUE(hub.on_client_connected(id, "127.0.0.1:1").is_ok());
  }

  Board board{small_board()};
  RecordingTransport transport;
  BroadcastHub hub{board, transport};
};

// ============================================================================
// Connection Lifecycle
// ============================================================================

TEST_F(HubTest, ConnectSendsSnapshotToNewClientOnly) {
  connect("a");
  transport.clear_events();
  connect("b");

  auto events = transport.events_for("b");
  ASSERT_EQ(events.size(), 4u);
  ASSERT_TRUE(std::holds_alternative<WelcomeEvent>(events[0]));
  EXPECT_EQ(std::get<WelcomeEvent>(events[0]).client_id, "b");
  EXPECT_EQ(std::get<WelcomeEvent>(events[0]).server_version, VERSION_STRING);
  EXPECT_TRUE(std::holds_alternative<TextUpdatedEvent>(events[1]));
  EXPECT_TRUE(std::holds_alternative<FileListEvent>(events[2]));
  ASSERT_TRUE(std::holds_alternative<PresenceChangedEvent>(events[3]));
  EXPECT_EQ(std::get<PresenceChangedEvent>(events[3]).client_count, 2u);

  // The existing client only hears about presence
  auto other = transport.events_for("a");
  ASSERT_EQ(other.size(), 1u);
  EXPECT_TRUE(std::holds_alternative<PresenceChangedEvent>(other[0]));
}

TEST_F(HubTest, SnapshotCarriesCurrentState) {
  connect("a");
  ASSERT_TRUE(hub.on_text_submit("a", "hello", 0).is_ok());
  ASSERT_TRUE(hub.on_file_upload("a", "f.txt", "text/plain", Bytes(5, 1))
                  .is_ok());

  connect("b");
  auto text = transport.events_of<TextUpdatedEvent>("b");
  ASSERT_EQ(text.size(), 1u);
  EXPECT_EQ(text[0].text.content, "hello");
  EXPECT_EQ(text[0].text.version, 1u);

  auto lists = transport.events_of<FileListEvent>("b");
  ASSERT_EQ(lists.size(), 1u);
  ASSERT_EQ(lists[0].files.size(), 1u);
  EXPECT_EQ(lists[0].files[0].filename, "f.txt");
}

TEST_F(HubTest, DuplicateConnectIsRejected) {
  connect("a");
  auto again = hub.on_client_connected("a");
  ASSERT_TRUE(again.is_error());
  EXPECT_EQ(again.error().code, ErrorCode::DuplicateClient);
  EXPECT_EQ(board.clients().count(), 1u);
}

TEST_F(HubTest, DisconnectBroadcastsPresence) {
  connect("a");
  connect("b");
  transport.clear_events();

  hub.on_client_disconnected("b");

  auto presence = transport.events_of<PresenceChangedEvent>("a");
  ASSERT_EQ(presence.size(), 1u);
  EXPECT_EQ(presence[0].client_count, 1u);
  EXPECT_FALSE(board.clients().contains("b"));
}

TEST_F(HubTest, DisconnectOfUnknownClientIsNoop) {
  connect("a");
  transport.clear_events();

  hub.on_client_disconnected("ghost");
  EXPECT_TRUE(transport.events_for("a").empty());
}

// ============================================================================
// Text
// ============================================================================

TEST_F(HubTest, AcceptedTextIsBroadcastToEveryoneIncludingSender) {
  connect("a");
  connect("b");
  transport.clear_events();

  auto result = hub.on_text_submit("a", "hello", 0);
  ASSERT_TRUE(result.is_ok());

  for (const char *id : {"a", "b"}) {
    auto updates = transport.events_of<TextUpdatedEvent>(id);
    ASSERT_EQ(updates.size(), 1u) << id;
    EXPECT_EQ(updates[0].text.content, "hello");
    EXPECT_EQ(updates[0].text.version, 1u);
    EXPECT_EQ(updates[0].text.updated_by, "a");
  }
}

TEST_F(HubTest, StaleTextIsRejectedToSenderOnly) {
  connect("a");
  connect("b");
  ASSERT_TRUE(hub.on_text_submit("a", "hello", 0).is_ok());
  transport.clear_events();

  auto result = hub.on_text_submit("b", "world", 0);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::StaleVersion);

  auto rejected = transport.events_of<TextRejectedEvent>("b");
  ASSERT_EQ(rejected.size(), 1u);
  EXPECT_EQ(rejected[0].current.content, "hello");
  EXPECT_EQ(rejected[0].current.version, 1u);

  EXPECT_TRUE(transport.events_for("a").empty());
  EXPECT_EQ(board.clipboard().current().content, "hello");
}

TEST_F(HubTest, OversizedTextGetsErrorToSenderOnly) {
  connect("a");
  connect("b");
  transport.clear_events();

  auto result = hub.on_text_submit("a", std::string(65, 'x'), 0);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::PayloadTooLarge);

  auto errors = transport.events_of<ErrorEvent>("a");
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0].code, ErrorCode::PayloadTooLarge);
  EXPECT_TRUE(transport.events_for("b").empty());
}

// ============================================================================
// Files
// ============================================================================

TEST_F(HubTest, UploadBroadcastsFileAdded) {
  connect("a");
  connect("b");
  transport.clear_events();

  auto result = hub.on_file_upload("a", "notes.txt", "text/plain", Bytes(10, 1));
  ASSERT_TRUE(result.is_ok());
  EXPECT_EQ(result.value().uploaded_by, "a");

  for (const char *id : {"a", "b"}) {
    auto added = transport.events_of<FileAddedEvent>(id);
    ASSERT_EQ(added.size(), 1u) << id;
    EXPECT_EQ(added[0].file.id, result.value().id);
  }

  auto download = hub.on_file_download_request(result.value().id);
  ASSERT_TRUE(download.is_ok());
  EXPECT_EQ(download.value().data->size(), 10u);
}

TEST_F(HubTest, AnonymousUploadStillBroadcasts) {
  connect("a");
  transport.clear_events();

  ASSERT_TRUE(hub.on_file_upload("", "x.bin", "", Bytes(3, 0)).is_ok());
  EXPECT_EQ(transport.events_of<FileAddedEvent>("a").size(), 1u);
}

TEST_F(HubTest, OversizedUploadIsNotBroadcast) {
  connect("a");
  connect("b");
  transport.clear_events();

  auto result = hub.on_file_upload("a", "big.bin", "", Bytes(101, 0));
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::PayloadTooLarge);

  EXPECT_TRUE(transport.events_of<FileAddedEvent>("a").empty());
  EXPECT_TRUE(transport.events_for("b").empty());
  EXPECT_EQ(transport.events_of<ErrorEvent>("a").size(), 1u);
  EXPECT_TRUE(board.files().list().empty());
}

TEST_F(HubTest, FullStorageSweepsExpiredFilesBeforeRetrying) {
  connect("a");
  auto past = MonoClock::now() - 120s;
  auto stale = board.files().put("old.bin", "", Bytes(100, 0), "a", past);
  ASSERT_TRUE(stale.is_ok());
  ASSERT_TRUE(board.files().put("live.bin", "", Bytes(100, 0), "a").is_ok());
  transport.clear_events();

  auto result = hub.on_file_upload("a", "new.bin", "", Bytes(100, 0));
  ASSERT_TRUE(result.is_ok()) << result.error().to_string();

  auto removed = transport.events_of<FileRemovedEvent>("a");
  ASSERT_EQ(removed.size(), 1u);
  EXPECT_EQ(removed[0].id, stale.value().id);

  // Removal is announced before the new file
  auto events = transport.events_for("a");
  ASSERT_EQ(events.size(), 2u);
  EXPECT_TRUE(std::holds_alternative<FileRemovedEvent>(events[0]));
  EXPECT_TRUE(std::holds_alternative<FileAddedEvent>(events[1]));
}

TEST_F(HubTest, FullStorageWithNothingExpiredFails) {
  connect("a");
  ASSERT_TRUE(hub.on_file_upload("a", "1", "", Bytes(100, 0)).is_ok());
  ASSERT_TRUE(hub.on_file_upload("a", "2", "", Bytes(100, 0)).is_ok());
  transport.clear_events();

  auto result = hub.on_file_upload("a", "3", "", Bytes(1, 0));
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::StorageFull);
  EXPECT_TRUE(transport.events_of<FileAddedEvent>("a").empty());
}

TEST_F(HubTest, DeleteBroadcastsFileRemoved) {
  connect("a");
  connect("b");
  auto uploaded = hub.on_file_upload("a", "x", "", Bytes(1, 0));
  ASSERT_TRUE(uploaded.is_ok());
  transport.clear_events();

  ASSERT_TRUE(hub.on_file_delete("b", uploaded.value().id).is_ok());
  for (const char *id : {"a", "b"}) {
    auto removed = transport.events_of<FileRemovedEvent>(id);
    ASSERT_EQ(removed.size(), 1u) << id;
    EXPECT_EQ(removed[0].id, uploaded.value().id);
  }

  auto again = hub.on_file_delete("b", uploaded.value().id);
  ASSERT_TRUE(again.is_error());
  EXPECT_EQ(again.error().code, ErrorCode::NotFound);
  EXPECT_EQ(transport.events_of<ErrorEvent>("b").size(), 1u);
  EXPECT_EQ(transport.events_of<FileRemovedEvent>("a").size(), 1u);
}

TEST_F(HubTest, DownloadOfMissingFile) {
  auto result = hub.on_file_download_request("missing");
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::NotFound);
}

TEST_F(HubTest, PeriodicSweepBroadcastsRemovals) {
  connect("a");
  auto uploaded = hub.on_file_upload("a", "x", "", Bytes(1, 0));
  ASSERT_TRUE(uploaded.is_ok());
  transport.clear_events();

  EXPECT_TRUE(hub.periodic_sweep(MonoClock::now()).empty());
  EXPECT_TRUE(transport.events_for("a").empty());

  auto removed = hub.periodic_sweep(MonoClock::now() + 61s);
  ASSERT_EQ(removed.size(), 1u);
  auto events = transport.events_of<FileRemovedEvent>("a");
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].id, uploaded.value().id);
}

// ============================================================================
// Clear
// ============================================================================

TEST_F(HubTest, ClearEmptiesTextAndFiles) {
  connect("a");
  connect("b");
  ASSERT_TRUE(hub.on_text_submit("a", "hello", 0).is_ok());
  ASSERT_TRUE(hub.on_file_upload("a", "x", "", Bytes(1, 0)).is_ok());
  ASSERT_TRUE(hub.on_file_upload("a", "y", "", Bytes(1, 0)).is_ok());
  transport.clear_events();

  hub.on_clear("b");

  auto text = transport.events_of<TextUpdatedEvent>("a");
  ASSERT_EQ(text.size(), 1u);
  EXPECT_EQ(text[0].text.content, "");
  EXPECT_EQ(text[0].text.version, 2u);
  EXPECT_EQ(transport.events_of<FileRemovedEvent>("a").size(), 2u);
  EXPECT_EQ(board.files().count(), 0u);
}

// ============================================================================
// Message Dispatch
// ============================================================================

TEST_F(HubTest, MessageDispatchesTextIntent) {
  connect("a");
  transport.clear_events();

  hub.on_message("a", R"({"type":"text","content":"via ws","version":0})");
  EXPECT_EQ(board.clipboard().current().content, "via ws");
  EXPECT_EQ(transport.events_of<TextUpdatedEvent>("a").size(), 1u);
}

TEST_F(HubTest, MessageDispatchesOtherIntents) {
  connect("a");
  transport.clear_events();

  hub.on_message("a", R"({"type":"ping"})");
  hub.on_message("a", R"({"type":"file_meta_request"})");
  hub.on_message("a", R"({"type":"file_delete","id":"nope"})");

  auto events = transport.events_for("a");
  ASSERT_EQ(events.size(), 3u);
  EXPECT_TRUE(std::holds_alternative<PongEvent>(events[0]));
  EXPECT_TRUE(std::holds_alternative<FileListEvent>(events[1]));
  ASSERT_TRUE(std::holds_alternative<ErrorEvent>(events[2]));
  EXPECT_EQ(std::get<ErrorEvent>(events[2]).code, ErrorCode::NotFound);
}

TEST_F(HubTest, MalformedMessageGetsErrorToSenderOnly) {
  connect("a");
  connect("b");
  transport.clear_events();

  hub.on_message("a", "{{{");
  hub.on_message("a", R"({"type":"warp_drive"})");

  auto errors = transport.events_of<ErrorEvent>("a");
  ASSERT_EQ(errors.size(), 2u);
  EXPECT_EQ(errors[0].code, ErrorCode::MalformedMessage);
  EXPECT_EQ(errors[1].code, ErrorCode::UnknownMessageType);
  EXPECT_TRUE(transport.events_for("b").empty());
  EXPECT_TRUE(board.clients().contains("a"));
}

TEST_F(HubTest, MessageFromUnregisteredClientIsIgnored) {
  connect("a");
  transport.clear_events();

  hub.on_message("ghost", R"({"type":"text","content":"x","version":0})");
  EXPECT_EQ(board.clipboard().version(), 0u);
  EXPECT_TRUE(transport.events_for("a").empty());
  EXPECT_TRUE(transport.events_for("ghost").empty());
}

// ============================================================================
// Failure Isolation
// ============================================================================

TEST_F(HubTest, FailedSendDropsOnlyThatClient) {
  connect("a");
  connect("b");
  connect("c");
  transport.fail_sends_to("b");
  transport.clear_events();

  ASSERT_TRUE(hub.on_text_submit("a", "hello", 0).is_ok());

  EXPECT_EQ(transport.events_of<TextUpdatedEvent>("a").size(), 1u);
  EXPECT_EQ(transport.events_of<TextUpdatedEvent>("c").size(), 1u);

  EXPECT_TRUE(transport.was_closed("b"));
  EXPECT_FALSE(board.clients().contains("b"));
  EXPECT_EQ(board.clients().list(), (std::set<ClientId>{"a", "c"}));

  auto presence = transport.events_of<PresenceChangedEvent>("a");
  ASSERT_EQ(presence.size(), 1u);
  EXPECT_EQ(presence[0].client_count, 2u);
}

TEST_F(HubTest, FailureDuringDropPresenceIsAlsoHandled) {
  connect("a");
  connect("b");
  connect("c");
  transport.fail_sends_to("b");
  transport.fail_sends_to("c");

  ASSERT_TRUE(hub.on_text_submit("a", "hello", 0).is_ok());

  EXPECT_EQ(board.clients().list(), std::set<ClientId>{"a"});
  EXPECT_TRUE(transport.was_closed("b"));
  EXPECT_TRUE(transport.was_closed("c"));
}

// ============================================================================
// Idle Reaping
// ============================================================================

TEST_F(HubTest, ReapsSilentClients) {
  connect("quiet");
  connect("chatty");
  auto now = MonoClock::now();
  ASSERT_TRUE(board.clients().touch("chatty", now + 25s).is_ok());
  transport.clear_events();

  auto reaped = hub.reap_idle_clients(now + 31s);
  ASSERT_EQ(reaped.size(), 1u);
  EXPECT_EQ(reaped[0], "quiet");
  EXPECT_TRUE(transport.was_closed("quiet"));
  EXPECT_FALSE(board.clients().contains("quiet"));
  EXPECT_EQ(transport.events_of<PresenceChangedEvent>("chatty").size(), 1u);
}

TEST_F(HubTest, HeartbeatKeepsListenOnlyClientAlive) {
  connect("listener");
  connect("writer");
  auto now = MonoClock::now();

  // The listener never sends a frame, only answers transport pings
  hub.on_client_heartbeat("listener", now + 20s);
  ASSERT_TRUE(board.clients().touch("writer", now + 20s).is_ok());

  EXPECT_TRUE(hub.reap_idle_clients(now + 31s).empty());
  EXPECT_FALSE(transport.was_closed("listener"));

  transport.clear_events();
  ASSERT_TRUE(hub.on_text_submit("writer", "still there?", 0).is_ok());
  EXPECT_EQ(transport.events_of<TextUpdatedEvent>("listener").size(), 1u);
}

TEST_F(HubTest, HeartbeatFromUnknownClientIsIgnored) {
  hub.on_client_heartbeat("ghost");
  EXPECT_FALSE(board.clients().contains("ghost"));
}

TEST_F(HubTest, MessagesCountAsHeartbeats) {
  connect("a");
  auto before = board.clients().get("a").value().last_seen_at;
  hub.on_message("a", R"({"type":"ping"})");
  EXPECT_GE(board.clients().get("a").value().last_seen_at, before);
}

TEST(HubReapTest, ZeroTimeoutDisablesReaping) {
  BoardConfig config;
  config.client_timeout = std::chrono::seconds(0);
  Board board(config);
  RecordingTransport transport;
  BroadcastHub hub(board, transport);

  ASSERT_TRUE(hub.on_client_connected("a").is_ok());
  EXPECT_TRUE(hub.reap_idle_clients(MonoClock::now() + 24h).empty());
  EXPECT_TRUE(board.clients().contains("a"));
}
