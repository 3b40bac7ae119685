#include "mcp/NotificationHub.hpp"
#include <gtest/gtest.h>
#include <vector>

using namespace mcpd;
using namespace std::chrono_literals;
using json = nlohmann::json;

class NotificationHubTest : public ::testing::Test {
protected:
    struct Consumer {
        std::shared_ptr<EventStream> stream;
        std::uint64_t generation;
    };

    Consumer connect(const std::string& session_id) {
        auto stream = hub.open_channel(session_id);
        return {stream, stream->attach().generation};
    }

    static std::vector<json> received(const Consumer& consumer) {
        std::vector<json> messages;
        StreamEvent event;
        while (consumer.stream->next(consumer.generation, 0ms, event) == EventStream::WaitStatus::Event) {
            messages.push_back(event.message);
        }
        return messages;
    }

    NotificationHub hub{16, 16};
};

TEST_F(NotificationHubTest, OpenChannelIsStablePerSession) {
    auto a = hub.open_channel("s1");
    auto b = hub.open_channel("s1");
    EXPECT_EQ(a, b);
    EXPECT_EQ(hub.channel("s1"), a);
    EXPECT_EQ(hub.channel("unknown"), nullptr);
    EXPECT_EQ(hub.channel_count(), 1);
}

TEST_F(NotificationHubTest, ListChangedReachesEverySession) {
    auto one = connect("s1");
    auto two = connect("s2");

    EXPECT_EQ(hub.notify_list_changed("tools"), 2);

    auto first = received(one);
    ASSERT_EQ(first.size(), 1);
    EXPECT_EQ(first[0]["method"], "notifications/tools/list_changed");
    EXPECT_FALSE(first[0].contains("id"));
    EXPECT_EQ(received(two).size(), 1);
}

TEST_F(NotificationHubTest, TemplateChangesAnnouncedAsResourceChanges) {
    auto consumer = connect("s1");
    hub.notify_list_changed("resource_templates");
    auto messages = received(consumer);
    ASSERT_EQ(messages.size(), 1);
    EXPECT_EQ(messages[0]["method"], "notifications/resources/list_changed");
}

TEST_F(NotificationHubTest, ResourceUpdatesOnlyReachSubscribers) {
    auto subscriber = connect("s1");
    auto bystander = connect("s2");
    hub.subscribe("s1", "text://hello");
    EXPECT_TRUE(hub.is_subscribed("s1", "text://hello"));

    EXPECT_EQ(hub.notify_resource_updated("text://hello"), 1);
    auto messages = received(subscriber);
    ASSERT_EQ(messages.size(), 1);
    EXPECT_EQ(messages[0]["params"]["uri"], "text://hello");
    EXPECT_TRUE(received(bystander).empty());

    EXPECT_TRUE(hub.unsubscribe("s1", "text://hello"));
    EXPECT_FALSE(hub.unsubscribe("s1", "text://hello"));
    EXPECT_EQ(hub.notify_resource_updated("text://hello"), 0);
}

TEST_F(NotificationHubTest, LogMessagesRespectSessionLevel) {
    auto chatty = connect("s1");
    auto quiet = connect("s2");
    hub.set_log_level("s1", LogLevel::Debug);
    hub.set_log_level("s2", LogLevel::Error);

    hub.log_message(LogLevel::Info, "server", "hello");
    hub.log_message(LogLevel::Critical, "server", "fire");

    auto all = received(chatty);
    ASSERT_EQ(all.size(), 2);
    EXPECT_EQ(all[0]["params"]["level"], "info");
    EXPECT_EQ(all[0]["params"]["logger"], "server");
    EXPECT_EQ(all[0]["params"]["data"], "hello");

    auto filtered = received(quiet);
    ASSERT_EQ(filtered.size(), 1);
    EXPECT_EQ(filtered[0]["params"]["level"], "critical");
}

TEST_F(NotificationHubTest, DefaultLevelIsInfo) {
    auto consumer = connect("s1");
    EXPECT_EQ(hub.log_level("s1"), LogLevel::Info);
    hub.log_message(LogLevel::Debug, "", "noise");
    hub.log_message(LogLevel::Notice, "", "signal");

    auto messages = received(consumer);
    ASSERT_EQ(messages.size(), 1);
    EXPECT_EQ(messages[0]["params"]["data"], "signal");
    EXPECT_FALSE(messages[0]["params"].contains("logger"));
}

TEST_F(NotificationHubTest, LogMessageTargetedAtOneSession) {
    auto target = connect("s1");
    auto other = connect("s2");
    hub.log_message(LogLevel::Error, "tools", "failed", "s1");
    EXPECT_EQ(received(target).size(), 1);
    EXPECT_TRUE(received(other).empty());
}

TEST_F(NotificationHubTest, ProgressGoesToRequestingSession) {
    auto target = connect("s1");
    auto other = connect("s2");
    hub.notify_progress("s1", "tok", 0.5, 1.0);

    auto messages = received(target);
    ASSERT_EQ(messages.size(), 1);
    EXPECT_EQ(messages[0]["method"], "notifications/progress");
    EXPECT_EQ(messages[0]["params"]["progressToken"], "tok");
    EXPECT_DOUBLE_EQ(messages[0]["params"]["progress"].get<double>(), 0.5);
    EXPECT_DOUBLE_EQ(messages[0]["params"]["total"].get<double>(), 1.0);
    EXPECT_TRUE(received(other).empty());
}

TEST_F(NotificationHubTest, DropSessionClosesChannelAndForgetsInterest) {
    auto consumer = connect("s1");
    hub.subscribe("s1", "text://hello");
    hub.set_log_level("s1", LogLevel::Emergency);

    hub.drop_session("s1");
    EXPECT_TRUE(consumer.stream->is_closed());
    EXPECT_EQ(hub.channel("s1"), nullptr);
    EXPECT_FALSE(hub.is_subscribed("s1", "text://hello"));
    EXPECT_EQ(hub.log_level("s1"), LogLevel::Info);

    // a later open starts a fresh channel
    auto reopened = hub.open_channel("s1");
    EXPECT_NE(reopened, consumer.stream);
    EXPECT_FALSE(reopened->is_closed());
}

TEST_F(NotificationHubTest, DisconnectedChannelRetainsForResume) {
    auto consumer = connect("s1");
    consumer.stream->detach(consumer.generation);

    EXPECT_EQ(hub.notify_list_changed("prompts"), 0);
    auto resumed = consumer.stream->attach(0);
    EXPECT_EQ(resumed.replayed, 1);
}

TEST(LogLevelTest, ParseAndPrint) {
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warning);
    EXPECT_EQ(parse_log_level("emergency"), LogLevel::Emergency);
    EXPECT_FALSE(parse_log_level("warn").has_value());
    EXPECT_STREQ(to_string(LogLevel::Alert), "alert");
    EXPECT_LT(LogLevel::Debug, LogLevel::Emergency);
}
