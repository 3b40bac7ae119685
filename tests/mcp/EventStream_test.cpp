#include "mcp/EventStream.hpp"
#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace mcpd;
using namespace std::chrono_literals;
using json = nlohmann::json;

namespace {

std::vector<std::uint64_t> drain(EventStream& stream, std::uint64_t generation) {
    std::vector<std::uint64_t> cursors;
    StreamEvent event;
    while (stream.next(generation, 0ms, event) == EventStream::WaitStatus::Event) {
        cursors.push_back(event.cursor);
    }
    return cursors;
}

json message(int n) {
    return {{"jsonrpc", "2.0"}, {"method", "notifications/message"}, {"params", {{"n", n}}}};
}

} // namespace

TEST(EventStreamTest, CursorsStrictlyIncrease) {
    EventStream stream("s", 16, 16);
    auto attachment = stream.attach();
    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(stream.push(message(i)));
    }
    EXPECT_EQ(drain(stream, attachment.generation), (std::vector<std::uint64_t>{1, 2, 3, 4, 5}));
    EXPECT_EQ(stream.last_cursor(), 5);
}

TEST(EventStreamTest, PushWithoutConsumerIsRetainedOnly) {
    EventStream stream("s", 16, 16);
    EXPECT_FALSE(stream.push(message(1)));
    EXPECT_FALSE(stream.has_consumer());

    auto attachment = stream.attach();
    EXPECT_TRUE(drain(stream, attachment.generation).empty());
}

TEST(EventStreamTest, ResumeReplaysEventsAfterCursor) {
    // Cursors 1..5 delivered, client disconnected after receiving 3
    EventStream stream("s", 16, 16);
    auto first = stream.attach();
    for (int i = 1; i <= 5; ++i) {
        stream.push(message(i));
    }
    StreamEvent event;
    for (int i = 0; i < 3; ++i) {
        ASSERT_EQ(stream.next(first.generation, 0ms, event), EventStream::WaitStatus::Event);
    }
    EXPECT_EQ(event.cursor, 3);
    stream.detach(first.generation);

    auto resumed = stream.attach(3);
    EXPECT_FALSE(resumed.gap);
    EXPECT_EQ(resumed.replayed, 2);

    stream.push(message(6));
    EXPECT_EQ(drain(stream, resumed.generation), (std::vector<std::uint64_t>{4, 5, 6}));
}

TEST(EventStreamTest, ResumeAtNewestReplaysNothing) {
    EventStream stream("s", 16, 16);
    stream.push(message(1));
    stream.push(message(2));

    auto attachment = stream.attach(2);
    EXPECT_FALSE(attachment.gap);
    EXPECT_EQ(attachment.replayed, 0);
}

TEST(EventStreamTest, CursorOutsideRetentionReportsGap) {
    EventStream stream("s", 3, 16);
    for (int i = 1; i <= 10; ++i) {
        stream.push(message(i));
    }

    auto attachment = stream.attach(2);
    EXPECT_TRUE(attachment.gap);
    EXPECT_EQ(attachment.replayed, 0);

    stream.push(message(11));
    EXPECT_EQ(drain(stream, attachment.generation), (std::vector<std::uint64_t>{11}));
}

TEST(EventStreamTest, CursorJustBeforeRetentionWindowIsNotAGap) {
    EventStream stream("s", 3, 16);
    for (int i = 1; i <= 10; ++i) {
        stream.push(message(i));
    }
    // retained: 8, 9, 10
    auto attachment = stream.attach(7);
    EXPECT_FALSE(attachment.gap);
    EXPECT_EQ(drain(stream, attachment.generation), (std::vector<std::uint64_t>{8, 9, 10}));
}

TEST(EventStreamTest, NewAttachmentSupersedesOldConsumer) {
    EventStream stream("s", 16, 16);
    auto first = stream.attach();
    auto second = stream.attach();
    EXPECT_NE(first.generation, second.generation);

    StreamEvent event;
    EXPECT_EQ(stream.next(first.generation, 0ms, event), EventStream::WaitStatus::Closed);

    stream.push(message(1));
    EXPECT_EQ(stream.next(second.generation, 0ms, event), EventStream::WaitStatus::Event);

    // stale detach leaves the new consumer attached
    stream.detach(first.generation);
    EXPECT_TRUE(stream.has_consumer());
}

TEST(EventStreamTest, FullQueueDropsForLiveConsumer) {
    EventStream stream("s", 16, 2);
    auto attachment = stream.attach();
    EXPECT_TRUE(stream.push(message(1)));
    EXPECT_TRUE(stream.push(message(2)));
    EXPECT_FALSE(stream.push(message(3)));
    EXPECT_EQ(stream.dropped(), 1);

    EXPECT_EQ(drain(stream, attachment.generation), (std::vector<std::uint64_t>{1, 2}));
}

TEST(EventStreamTest, FinishDrainsThenReportsFinished) {
    EventStream stream("s", 0, 16);
    auto attachment = stream.attach();
    stream.push(message(1));
    stream.finish();
    EXPECT_FALSE(stream.push(message(2)));

    StreamEvent event;
    EXPECT_EQ(stream.next(attachment.generation, 0ms, event), EventStream::WaitStatus::Event);
    EXPECT_EQ(stream.next(attachment.generation, 0ms, event), EventStream::WaitStatus::Finished);
}

TEST(EventStreamTest, TimeoutWhenIdle) {
    EventStream stream("s", 0, 16);
    auto attachment = stream.attach();
    StreamEvent event;
    EXPECT_EQ(stream.next(attachment.generation, 10ms, event), EventStream::WaitStatus::Timeout);
}

TEST(EventStreamTest, CloseWakesBlockedConsumer) {
    EventStream stream("s", 0, 16);
    auto attachment = stream.attach();

    std::thread closer([&stream]() {
        std::this_thread::sleep_for(20ms);
        stream.close();
    });

    StreamEvent event;
    EXPECT_EQ(stream.next(attachment.generation, 5s, event), EventStream::WaitStatus::Closed);
    closer.join();
    EXPECT_TRUE(stream.is_closed());
    EXPECT_FALSE(stream.push(message(1)));
}

TEST(EventStreamTest, FormatProducesSseFrame) {
    StreamEvent event{42, {{"jsonrpc", "2.0"}, {"id", 1}, {"result", json::object()}}};
    EXPECT_EQ(EventStream::format(event), "id: 42\ndata: {\"id\":1,\"jsonrpc\":\"2.0\",\"result\":{}}\n\n");
}

TEST(EventStreamTest, HandlesAreUnique) {
    EventStream a("s", 0, 1);
    EventStream b("s", 0, 1);
    EXPECT_NE(a.handle(), b.handle());
}
