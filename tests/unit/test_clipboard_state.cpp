/**
 * @file test_clipboard_state.cpp
 * @brief Unit tests for the versioned clipboard text
 */

#include <gtest/gtest.h>
#include <syncboard/syncboard.h>
#include <atomic>
#include <thread>
#include <vector>

using namespace syncboard;

class ClipboardStateTest : public ::testing::Test {
protected:
  ClipboardState state{1024};
};

// ============================================================================
// Initial State
// ============================================================================

TEST_F(ClipboardStateTest, StartsEmptyAtVersionZero) {
  auto text = state.current();

  EXPECT_EQ(text.content, "");
  EXPECT_EQ(text.version, 0u);
  EXPECT_TRUE(text.updated_by.empty());
  EXPECT_EQ(state.version(), 0u);
  EXPECT_EQ(state.max_size(), 1024u);
}

// ============================================================================
// Compare-and-Set
// ============================================================================

TEST_F(ClipboardStateTest, UpdateAtCurrentVersionSucceeds) {
  auto result = state.update("hello", 0, "alice");

  ASSERT_TRUE(result.is_ok());
  EXPECT_EQ(result.value().content, "hello");
  EXPECT_EQ(result.value().version, 1u);
  EXPECT_EQ(result.value().updated_by, "alice");
  EXPECT_EQ(state.current().content, "hello");
}

TEST_F(ClipboardStateTest, StaleUpdateIsRejectedWithoutMutation) {
  ASSERT_TRUE(state.update("hello", 0, "alice").is_ok());

  ClipboardText current;
  auto result = state.update("world", 0, "bob", &current);

  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::StaleVersion);
  EXPECT_EQ(current.content, "hello");
  EXPECT_EQ(current.version, 1u);
  EXPECT_EQ(state.current().content, "hello");
  EXPECT_EQ(state.version(), 1u);
}

TEST_F(ClipboardStateTest, FutureVersionIsAlsoStale) {
  auto result = state.update("ahead", 5, "alice");

  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::StaleVersion);
  EXPECT_EQ(state.version(), 0u);
}

TEST_F(ClipboardStateTest, EveryAcceptedUpdateBumpsVersionByOne) {
  for (uint64_t v = 0; v < 5; ++v) {
    auto result = state.update("text " + std::to_string(v), v, "alice");
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().version, v + 1);
  }
  EXPECT_EQ(state.version(), 5u);
}

TEST_F(ClipboardStateTest, SameContentStillBumpsVersion) {
  ASSERT_TRUE(state.update("same", 0, "alice").is_ok());
  auto result = state.update("same", 1, "alice");

  ASSERT_TRUE(result.is_ok());
  EXPECT_EQ(result.value().version, 2u);
}

TEST_F(ClipboardStateTest, EmptyTextIsAValidUpdate) {
  ASSERT_TRUE(state.update("x", 0, "alice").is_ok());
  auto result = state.update("", 1, "bob");

  ASSERT_TRUE(result.is_ok());
  EXPECT_EQ(result.value().content, "");
  EXPECT_EQ(result.value().version, 2u);
}

// ============================================================================
// Size Limit
// ============================================================================

TEST_F(ClipboardStateTest, OversizedTextIsRejected) {
  std::string big(1025, 'a');
  auto result = state.update(big, 0, "alice");

  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::PayloadTooLarge);
  EXPECT_EQ(state.version(), 0u);
}

TEST_F(ClipboardStateTest, TextAtLimitIsAccepted) {
  std::string exact(1024, 'a');
  EXPECT_TRUE(state.update(exact, 0, "alice").is_ok());
}

TEST_F(ClipboardStateTest, SizeIsCheckedBeforeVersion) {
  std::string big(2048, 'a');
  auto result = state.update(big, 7, "alice");

  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::PayloadTooLarge);
}

// ============================================================================
// Clear
// ============================================================================

TEST_F(ClipboardStateTest, ClearEmptiesAndBumpsVersion) {
  ASSERT_TRUE(state.update("hello", 0, "alice").is_ok());
  auto cleared = state.clear("bob");

  EXPECT_EQ(cleared.content, "");
  EXPECT_EQ(cleared.version, 2u);
  EXPECT_EQ(cleared.updated_by, "bob");
  EXPECT_EQ(state.current().version, 2u);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(ClipboardStateTest, ConcurrentWritersAtSameVersionOnlyOneWins) {
  constexpr int kWriters = 8;
  std::vector<std::thread> threads;
  std::atomic<int> accepted{0};

  for (int i = 0; i < kWriters; ++i) {
    threads.emplace_back([this, i, &accepted]() {
      if (state.update("writer " + std::to_string(i), 0,
                       "client" + std::to_string(i))
              .is_ok()) {
        accepted.fetch_add(1);
      }
    });
  }
  for (auto &t : threads) {
    t.join();
  }

  EXPECT_EQ(accepted.load(), 1);
  EXPECT_EQ(state.version(), 1u);
}
