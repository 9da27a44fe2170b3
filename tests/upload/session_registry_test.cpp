#include "guestdrop/upload/session_registry.hpp"
#include "support/manual_clock.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <set>
#include <thread>

using namespace std::chrono_literals;
using guestdrop::ErrorKind;
using guestdrop::testing::ManualClock;
using guestdrop::upload::SessionRegistry;
using guestdrop::upload::UploadState;

namespace {

constexpr std::uint64_t kLimit = 1000;

std::string create_session(SessionRegistry& registry, std::uint32_t total = 3) {
    auto created = registry.create("Anna", "photo.jpg", total);
    EXPECT_TRUE(created.is_ok());
    return created.is_ok() ? created.value() : std::string();
}

void store(SessionRegistry& registry, const std::string& id, std::uint32_t index, std::uint64_t bytes) {
    ASSERT_TRUE(registry.acquire_write(id, index, bytes, kLimit).is_ok());
    ASSERT_TRUE(registry.record_chunk(id, index, bytes).is_ok());
    registry.release_write(id, bytes);
}

} // namespace

TEST(SessionRegistryTest, CreateIssuesDistinctHexIds) {
    ManualClock clock;
    SessionRegistry registry(clock);

    std::set<std::string> ids;
    for (int i = 0; i < 50; ++i) {
        ids.insert(create_session(registry));
    }
    EXPECT_EQ(ids.size(), 50u);
    EXPECT_EQ(registry.size(), 50u);
    EXPECT_EQ(ids.begin()->size(), 32u);
}

TEST(SessionRegistryTest, CreateRejectsZeroChunks) {
    ManualClock clock;
    SessionRegistry registry(clock);

    auto created = registry.create("Anna", "photo.jpg", 0);
    ASSERT_TRUE(created.is_error());
    EXPECT_EQ(created.error().kind, ErrorKind::InvalidInput);
}

TEST(SessionRegistryTest, RecordsChunksInAnyOrder) {
    ManualClock clock;
    SessionRegistry registry(clock);
    const auto id = create_session(registry);

    store(registry, id, 3, 10);
    store(registry, id, 1, 20);

    auto snapshot = registry.get(id);
    ASSERT_TRUE(snapshot.is_ok());
    EXPECT_EQ(snapshot.value().state, UploadState::Receiving);
    EXPECT_EQ(snapshot.value().received, (std::set<std::uint32_t>{1, 3}));
    EXPECT_EQ(snapshot.value().received_bytes, 30u);
    EXPECT_EQ(snapshot.value().missing(), std::vector<std::uint32_t>{2});
    EXPECT_FALSE(snapshot.value().is_complete());
}

TEST(SessionRegistryTest, DuplicateChunkReplacesBytes) {
    ManualClock clock;
    SessionRegistry registry(clock);
    const auto id = create_session(registry, 2);

    store(registry, id, 1, 100);
    store(registry, id, 1, 40);

    auto snapshot = registry.get(id);
    ASSERT_TRUE(snapshot.is_ok());
    EXPECT_EQ(snapshot.value().received.size(), 1u);
    EXPECT_EQ(snapshot.value().received_bytes, 40u);
}

TEST(SessionRegistryTest, RejectsIndexOutOfRange) {
    ManualClock clock;
    SessionRegistry registry(clock);
    const auto id = create_session(registry, 3);

    auto zero = registry.acquire_write(id, 0, 1, kLimit);
    ASSERT_TRUE(zero.is_error());
    EXPECT_EQ(zero.error().kind, ErrorKind::InvalidInput);

    auto past_end = registry.acquire_write(id, 4, 1, kLimit);
    ASSERT_TRUE(past_end.is_error());
    EXPECT_EQ(past_end.error().kind, ErrorKind::InvalidInput);

    EXPECT_TRUE(registry.acquire_write(id, 3, 1, kLimit).is_ok());
    registry.release_write(id, 1);
}

TEST(SessionRegistryTest, UnknownSession) {
    ManualClock clock;
    SessionRegistry registry(clock);

    auto acquired = registry.acquire_write("feedface", 1, 1, kLimit);
    ASSERT_TRUE(acquired.is_error());
    EXPECT_EQ(acquired.error().kind, ErrorKind::SessionNotFound);
    EXPECT_EQ(registry.get("feedface").error().kind, ErrorKind::SessionNotFound);
    EXPECT_EQ(registry.begin_completion("feedface").error().kind, ErrorKind::SessionNotFound);
}

TEST(SessionRegistryTest, SizeLimitCountsWritesInFlight) {
    ManualClock clock;
    SessionRegistry registry(clock);
    const auto id = create_session(registry, 3);

    store(registry, id, 1, 600);
    ASSERT_TRUE(registry.acquire_write(id, 2, 300, kLimit).is_ok());

    // 600 stored + 300 in flight + 200 would pass 1000.
    auto third = registry.acquire_write(id, 3, 200, kLimit);
    ASSERT_TRUE(third.is_error());
    EXPECT_EQ(third.error().kind, ErrorKind::FileTooLarge);

    // Re-sending chunk 1 with fewer bytes fits because its old bytes are replaced.
    EXPECT_TRUE(registry.acquire_write(id, 1, 100, kLimit).is_ok());
    registry.release_write(id, 100);
    registry.release_write(id, 300);
}

TEST(SessionRegistryTest, OnlyOneCompletionClaimWins) {
    ManualClock clock;
    SessionRegistry registry(clock);
    const auto id = create_session(registry, 1);
    store(registry, id, 1, 5);

    auto first = registry.begin_completion(id);
    ASSERT_TRUE(first.is_ok());
    EXPECT_EQ(first.value().state, UploadState::Completing);

    auto second = registry.begin_completion(id);
    ASSERT_TRUE(second.is_error());
    EXPECT_EQ(second.error().kind, ErrorKind::AlreadyCompleting);

    auto write = registry.acquire_write(id, 1, 5, kLimit);
    ASSERT_TRUE(write.is_error());
    EXPECT_EQ(write.error().kind, ErrorKind::AlreadyCompleting);

    registry.abort_completion(id);
    EXPECT_EQ(registry.get(id).value().state, UploadState::Receiving);
    EXPECT_TRUE(registry.begin_completion(id).is_ok());
}

TEST(SessionRegistryTest, CompletionWaitsForWriteInFlight) {
    ManualClock clock;
    SessionRegistry registry(clock);
    const auto id = create_session(registry, 2);
    store(registry, id, 1, 5);

    ASSERT_TRUE(registry.acquire_write(id, 2, 5, kLimit).is_ok());

    std::atomic<bool> claimed{false};
    auto completion = std::async(std::launch::async, [&] {
        auto snapshot = registry.begin_completion(id);
        claimed = true;
        return snapshot;
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(claimed.load());

    // The write acquired before the claim still lands.
    ASSERT_TRUE(registry.record_chunk(id, 2, 5).is_ok());
    registry.release_write(id, 5);

    auto snapshot = completion.get();
    ASSERT_TRUE(snapshot.is_ok());
    EXPECT_TRUE(snapshot.value().is_complete());
}

TEST(SessionRegistryTest, RemoveWakesWaitingCompletion) {
    ManualClock clock;
    SessionRegistry registry(clock);
    const auto id = create_session(registry, 1);

    ASSERT_TRUE(registry.acquire_write(id, 1, 5, kLimit).is_ok());
    auto completion = std::async(std::launch::async, [&] { return registry.begin_completion(id); });

    std::this_thread::sleep_for(20ms);
    registry.remove(id);

    auto result = completion.get();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::SessionNotFound);
    EXPECT_EQ(registry.size(), 0u);
}

TEST(SessionRegistryTest, CollectStaleUsesLastActivity) {
    ManualClock clock;
    SessionRegistry registry(clock);
    const auto idle = create_session(registry);
    const auto active = create_session(registry);

    clock.advance(50min);
    store(registry, active, 1, 1);
    clock.advance(20min);

    auto stale = registry.collect_stale(clock.now(), std::chrono::hours(1));
    ASSERT_EQ(stale.size(), 1u);
    EXPECT_EQ(stale.front().id, idle);
    EXPECT_EQ(registry.get(idle).error().kind, ErrorKind::SessionNotFound);
    EXPECT_TRUE(registry.get(active).is_ok());
}

TEST(SessionRegistryTest, CollectStaleSkipsBusySessions) {
    ManualClock clock;
    SessionRegistry registry(clock);
    const auto writing = create_session(registry);
    const auto completing = create_session(registry, 1);
    store(registry, completing, 1, 1);

    ASSERT_TRUE(registry.acquire_write(writing, 1, 1, kLimit).is_ok());
    ASSERT_TRUE(registry.begin_completion(completing).is_ok());
    clock.advance(std::chrono::hours(2));

    EXPECT_TRUE(registry.collect_stale(clock.now(), std::chrono::hours(1)).empty());
    EXPECT_EQ(registry.size(), 2u);

    registry.release_write(writing, 1);
    auto stale = registry.collect_stale(clock.now(), std::chrono::hours(1));
    ASSERT_EQ(stale.size(), 1u);
    EXPECT_EQ(stale.front().id, writing);
}
