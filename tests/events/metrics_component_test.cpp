#include "guestdrop/events/components.hpp"
#include "guestdrop/events/event_bus.hpp"
#include "guestdrop/events/events.hpp"

#include <gtest/gtest.h>

#include <chrono>

using guestdrop::ErrorKind;
using guestdrop::events::ChunkStoredEvent;
using guestdrop::events::EventBus;
using guestdrop::events::LoggerComponent;
using guestdrop::events::MetricsComponent;
using guestdrop::events::SessionEvictedEvent;
using guestdrop::events::UploadCompletedEvent;
using guestdrop::events::UploadFailedEvent;
using guestdrop::events::UploadStartedEvent;

TEST(MetricsComponentTest, TracksUploadCounters) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(UploadStartedEvent{"abc123", "Anna", "photo.jpg", 2});
    bus.emit(ChunkStoredEvent{"abc123", 1, 1, 2, 1000});
    bus.emit(ChunkStoredEvent{"abc123", 2, 2, 2, 24});
    bus.emit(UploadCompletedEvent{"abc123", "Anna", "Anna/photo.jpg", 1024, std::chrono::milliseconds{200}});

    bus.emit(UploadStartedEvent{"def456", "Ben", "clip.mp4", 3});
    bus.emit(UploadFailedEvent{"def456", ErrorKind::AssemblyFailed, "corrupt chunk"});

    bus.emit(UploadStartedEvent{"0a0b0c", "Cleo", "clip.mov", 3});
    bus.emit(SessionEvictedEvent{"0a0b0c", "Cleo", "clip.mov", 0, 3});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.sessions_started.load(), 3u);
    EXPECT_EQ(stats.chunks_received.load(), 2u);
    EXPECT_EQ(stats.bytes_received.load(), 1024u);
    EXPECT_EQ(stats.uploads_completed.load(), 1u);
    EXPECT_EQ(stats.bytes_stored.load(), 1024u);
    EXPECT_EQ(stats.uploads_failed.load(), 1u);
    EXPECT_EQ(stats.sessions_evicted.load(), 1u);
}

TEST(LoggerComponentTest, SubscribesToLifecycleEvents) {
    EventBus bus;
    LoggerComponent logger(bus);

    EXPECT_EQ(bus.subscriber_count<UploadStartedEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<UploadCompletedEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<UploadFailedEvent>(), 1u);
    EXPECT_NO_THROW(bus.emit(UploadFailedEvent{"abc123", ErrorKind::StorageIO, "disk full"}));
}
