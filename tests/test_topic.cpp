#include <gtest/gtest.h>

#include "fake_transport.hpp"
#include "ros.hpp"
#include "topic.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace roslink;
using namespace std::chrono_literals;
using roslink::test::FakeTransport;
using roslink::test::eventually;

namespace {

class TopicTests : public ::testing::Test {
protected:
    void SetUp() override { start(test::test_config()); }
    void TearDown() override { ros.reset(); }

    // Without open the handshake is left pending after connect()
    void start(RosConfig config, bool open = true) {
        ros.reset();
        auto transport = std::make_unique<FakeTransport>(open);
        fake = transport.get();
        ros = std::make_unique<Ros>(config, std::move(transport));
        if (open) {
            ros->run();
        } else {
            ros->connect();
        }
    }

    std::vector<json> frames_with_op(const std::string& op) {
        std::vector<json> matching;
        for (const auto& frame : fake->sent()) {
            if (frame["op"] == op) matching.push_back(frame);
        }
        return matching;
    }

    FakeTransport* fake = nullptr;
    std::unique_ptr<Ros> ros;
};

} // namespace

TEST_F(TopicTests, SubscribeReceivesMessagesInOrder) {
    Topic topic(*ros, "/chatter", "std_msgs/String");

    std::vector<json> received;
    topic.subscribe([&](const json& msg) { received.push_back(msg); });

    json subscribe = fake->wait_for_op("subscribe");
    EXPECT_EQ(subscribe["id"], "subscribe:/chatter:1");
    EXPECT_EQ(subscribe["topic"], "/chatter");
    EXPECT_EQ(subscribe["type"], "std_msgs/String");
    EXPECT_EQ(subscribe["compression"], "none");

    fake->inject({{"op", "publish"}, {"topic", "/chatter"}, {"msg", {{"data", "hello"}}}});
    fake->inject({{"op", "publish"}, {"topic", "/chatter"}, {"msg", {{"data", "world"}}}});

    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(received[0]["data"], "hello");
    EXPECT_EQ(received[1]["data"], "world");
}

TEST_F(TopicTests, SubscribeTwiceSendsOneSubscription) {
    Topic topic(*ros, "/chatter", "std_msgs/String");
    topic.subscribe([](const json&) {});
    topic.subscribe([](const json&) {});

    EXPECT_TRUE(topic.is_subscribed());
    EXPECT_EQ(frames_with_op("subscribe").size(), 1u);
}

TEST_F(TopicTests, UnsubscribeStopsDeliveryAndIsIdempotent) {
    Topic topic(*ros, "/chatter", "std_msgs/String");
    int count = 0;
    topic.subscribe([&](const json&) { ++count; });

    topic.unsubscribe();
    topic.unsubscribe();
    EXPECT_FALSE(topic.is_subscribed());

    auto unsubscribes = frames_with_op("unsubscribe");
    ASSERT_EQ(unsubscribes.size(), 1u);
    EXPECT_EQ(unsubscribes[0]["id"], "subscribe:/chatter:1");

    fake->inject({{"op", "publish"}, {"topic", "/chatter"}, {"msg", {}}});
    EXPECT_EQ(count, 0);
}

TEST_F(TopicTests, PublishAdvertisesFirst) {
    TopicOptions options;
    options.latch = true;
    options.queue_size = 5;
    Topic topic(*ros, "/cmd_vel", "geometry_msgs/Twist", options);

    topic.publish({{"linear", {{"x", 0.2}}}});
    topic.publish({{"linear", {{"x", 0.3}}}});

    auto sent = fake->sent();
    ASSERT_EQ(sent.size(), 3u);
    EXPECT_EQ(sent[0]["op"], "advertise");
    EXPECT_EQ(sent[0]["latch"], true);
    EXPECT_EQ(sent[0]["queue_size"], 5);
    EXPECT_EQ(sent[1]["op"], "publish");
    EXPECT_EQ(sent[1]["msg"]["linear"]["x"], 0.2);
    EXPECT_EQ(sent[2]["msg"]["linear"]["x"], 0.3);
    EXPECT_TRUE(topic.is_advertised());
}

TEST_F(TopicTests, AdvertiseAndUnadvertiseAreIdempotent) {
    Topic topic(*ros, "/cmd_vel", "geometry_msgs/Twist");
    topic.advertise();
    topic.advertise();
    topic.unadvertise();
    topic.unadvertise();

    EXPECT_EQ(frames_with_op("advertise").size(), 1u);
    EXPECT_EQ(frames_with_op("unadvertise").size(), 1u);
}

TEST_F(TopicTests, DestructionReleasesRegistrations) {
    {
        Topic topic(*ros, "/chatter", "std_msgs/String");
        topic.subscribe([](const json&) {});
        topic.advertise();
    }

    EXPECT_EQ(frames_with_op("unsubscribe").size(), 1u);
    EXPECT_EQ(frames_with_op("unadvertise").size(), 1u);
}

TEST_F(TopicTests, UnsupportedCompressionIsRejected) {
    TopicOptions options;
    options.compression = "zip";
    EXPECT_THROW(Topic(*ros, "/chatter", "std_msgs/String", options), std::invalid_argument);
}

TEST_F(TopicTests, ReconnectResubscribesWithFreshId) {
    RosConfig config = test::test_config();
    config.reconnect = true;
    start(config);

    Topic topic(*ros, "/chatter", "std_msgs/String");
    std::vector<json> received;
    topic.subscribe([&](const json& msg) { received.push_back(msg); });

    const std::string first_id = fake->wait_for_op("subscribe")["id"].get<std::string>();
    const size_t before_drop = fake->sent_count();

    fake->drop();

    json resubscribe = fake->wait_for_op("subscribe", before_drop, 3000ms);
    ASSERT_FALSE(resubscribe.is_null());
    EXPECT_NE(resubscribe["id"], first_id);
    EXPECT_EQ(resubscribe["topic"], "/chatter");
    EXPECT_TRUE(topic.is_subscribed());

    // Same callback keeps receiving the stream
    fake->inject({{"op", "publish"}, {"topic", "/chatter"}, {"msg", {{"data", "again"}}}});
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0]["data"], "again");
}

TEST_F(TopicTests, DeliberateCloseDoesNotResubscribe) {
    Topic topic(*ros, "/chatter", "std_msgs/String");
    topic.subscribe([](const json&) {});
    ASSERT_FALSE(fake->wait_for_op("subscribe").is_null());

    ros->close();
    std::this_thread::sleep_for(700ms);

    EXPECT_EQ(frames_with_op("subscribe").size(), 1u);
}

TEST_F(TopicTests, ReconnectDisabledLeavesRegistrationAlone) {
    RosConfig config = test::test_config();
    config.reconnect = true;
    start(config);

    TopicOptions options;
    options.reconnect_on_close = false;
    Topic topic(*ros, "/chatter", "std_msgs/String", options);
    topic.subscribe([](const json&) {});

    fake->drop();
    ASSERT_TRUE(eventually([&] { return ros->is_connected(); }));
    std::this_thread::sleep_for(700ms);

    EXPECT_EQ(frames_with_op("subscribe").size(), 1u);
}

TEST_F(TopicTests, SubscribeQueuedAcrossFailedHandshakeIsSentOnce) {
    RosConfig config = test::test_config();
    config.reconnect = true;
    start(config, false);

    Topic topic(*ros, "/chatter", "std_msgs/String");
    topic.subscribe([](const json&) {});
    EXPECT_EQ(fake->sent_count(), 0u);

    fake->set_auto_open(true);
    fake->fail();
    ASSERT_TRUE(eventually([&] { return ros->is_connected(); }));

    // Past the re-registration delay
    std::this_thread::sleep_for(900ms);
    topic.unsubscribe();

    auto subscribes = frames_with_op("subscribe");
    auto unsubscribes = frames_with_op("unsubscribe");
    ASSERT_EQ(subscribes.size(), 1u);
    ASSERT_EQ(unsubscribes.size(), 1u);
    EXPECT_EQ(unsubscribes[0]["id"], subscribes[0]["id"]);
}

TEST_F(TopicTests, TopicDestroyedDuringCloseIsNotResubscribed) {
    RosConfig config = test::test_config();
    config.reconnect = true;
    start(config);

    // Holds the transport thread inside the close event
    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    std::atomic<bool> first_close{true};
    ros->on(events::CLOSE, [&, released](const json&) {
        if (!first_close.exchange(false)) return;
        entered.set_value();
        released.wait();
    });

    auto topic = std::make_unique<Topic>(*ros, "/chatter", "std_msgs/String");
    topic->subscribe([](const json&) {});
    ASSERT_FALSE(fake->wait_for_op("subscribe").is_null());

    auto dropping = std::async(std::launch::async, [&] { fake->drop(); });
    ASSERT_EQ(entered.get_future().wait_for(2s), std::future_status::ready);

    topic.reset();
    release.set_value();
    dropping.get();

    ASSERT_TRUE(eventually([&] { return ros->is_connected(); }));
    std::this_thread::sleep_for(700ms);

    EXPECT_EQ(frames_with_op("subscribe").size(), 1u);
}
