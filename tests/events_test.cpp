#include <gtest/gtest.h>

#include "events.hpp"

#include <stdexcept>
#include <vector>

TEST(EventStreamTest, PublishesToEverySubscriber)
{
    events::EventStream stream;
    int a = 0;
    int b = 0;
    stream.subscribe([&](const events::TransferEvent&) { ++a; });
    stream.subscribe([&](const events::TransferEvent&) { ++b; });

    stream.publish(events::TransferEvent{});
    stream.publish(events::TransferEvent{});
    EXPECT_EQ(a, 2);
    EXPECT_EQ(b, 2);
}

TEST(EventStreamTest, UnsubscribeStopsDelivery)
{
    events::EventStream stream;
    int count = 0;
    auto id = stream.subscribe([&](const events::TransferEvent&) { ++count; });

    stream.publish(events::TransferEvent{});
    stream.unsubscribe(id);
    stream.publish(events::TransferEvent{});
    EXPECT_EQ(count, 1);
}

TEST(EventStreamTest, ThrowingSubscriberDoesNotStopOthers)
{
    events::EventStream stream;
    int delivered = 0;
    stream.subscribe([](const events::TransferEvent&) { throw std::runtime_error("boom"); });
    stream.subscribe([&](const events::TransferEvent&) { ++delivered; });

    EXPECT_NO_THROW(stream.publish(events::TransferEvent{}));
    EXPECT_EQ(delivered, 1);
}

TEST(EventStreamTest, SubscriberMayUnsubscribeItself)
{
    events::EventStream stream;
    int count = 0;
    events::EventStream::SubscriptionId id = 0;
    id = stream.subscribe([&](const events::TransferEvent&) {
        ++count;
        stream.unsubscribe(id);
    });

    stream.publish(events::TransferEvent{});
    stream.publish(events::TransferEvent{});
    EXPECT_EQ(count, 1);
}

TEST(EventAdapterTest, NarrowCallbackSeesIdPercentAndMessage)
{
    std::vector<std::string> seen;
    auto cb = events::adapt([&](const std::string& id, int percent, const std::string& message) {
        seen.push_back(id + ":" + std::to_string(percent) + ":" + message);
    });

    events::TransferEvent event;
    event.transfer_id = "t1";
    event.kind = events::EventKind::Progress;
    event.percent = 42;
    event.message = "42%";
    cb(event);

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "t1:42:42%");
    EXPECT_FALSE(events::adapt(nullptr));
}
