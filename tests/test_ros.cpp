#include <gtest/gtest.h>

#include "errors.hpp"
#include "fake_transport.hpp"
#include "ros.hpp"

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

class RosTests : public ::testing::Test {
protected:
    void SetUp() override { start(true); }
    void TearDown() override { ros.reset(); }

    void start(bool auto_open, RosConfig config = test::test_config()) {
        ros.reset();
        auto transport = std::make_unique<FakeTransport>(auto_open);
        fake = transport.get();
        ros = std::make_unique<Ros>(config, std::move(transport));
    }

    // Collects payloads of the "error" event. Errors are raised on the
    // transport thread, and inject() returns only after it is done.
    std::shared_ptr<std::vector<json>> collect_errors() {
        auto errors = std::make_shared<std::vector<json>>();
        ros->on(events::ERROR, [errors](const json& payload) { errors->push_back(payload); });
        return errors;
    }

    FakeTransport* fake = nullptr;
    std::unique_ptr<Ros> ros;
};

} // namespace

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(RosTests, RunReturnsOnceConnected) {
    std::promise<void> ready;
    auto got_ready = ready.get_future();
    ros->once(events::READY, [&](const json&) { ready.set_value(); });

    ros->run();

    EXPECT_TRUE(ros->is_connected());
    EXPECT_EQ(got_ready.wait_for(1s), std::future_status::ready);
    EXPECT_EQ(fake->connect_calls(), 1);
}

TEST_F(RosTests, RunTimesOutWithoutHandshake) {
    start(false);
    EXPECT_THROW(ros->run(100ms), ConnectionTimeoutError);
    EXPECT_FALSE(ros->is_connected());
}

TEST_F(RosTests, ConnectWhileConnectingIsNoOp) {
    start(false);
    ros->connect();
    ros->connect();
    EXPECT_EQ(fake->connect_calls(), 1);
    EXPECT_TRUE(ros->is_connecting());
}

TEST_F(RosTests, TerminateFromScheduledTaskEndsRunForever) {
    for (int round = 0; round < 20; ++round) {
        start(true);
        Ros* raw = ros.get();
        ASSERT_TRUE(ros->call_later(5ms, [raw] { raw->terminate(); }));

        ros->run_forever();
        ros.reset();
    }
}

TEST_F(RosTests, ConcurrentTerminateWaitsForShutdown) {
    ros->run();

    auto first = std::async(std::launch::async, [&] { ros->terminate(); });
    auto second = std::async(std::launch::async, [&] { ros->terminate(); });
    first.get();
    second.get();

    EXPECT_FALSE(ros->is_connected());
    EXPECT_FALSE(ros->call_later(1ms, [] {}));
}

TEST_F(RosTests, IdsAreScopedAndMonotonic) {
    EXPECT_EQ(ros->make_id("subscribe", "/topic"), "subscribe:/topic:1");
    EXPECT_EQ(ros->make_id("call_service", "/svc"), "call_service:/svc:2");
    EXPECT_EQ(ros->next_id(), 3u);
}

// ============================================================================
// Ready queue
// ============================================================================

TEST_F(RosTests, SendsBeforeReadyAreQueuedAndFlushedInOrder) {
    start(false);
    ros->connect();

    ros->send_on_ready({{"op", "publish"}, {"topic", "/a"}, {"msg", 1}});
    ros->send_on_ready({{"op", "publish"}, {"topic", "/a"}, {"msg", 2}});
    ros->send_on_ready({{"op", "publish"}, {"topic", "/a"}, {"msg", 3}});
    EXPECT_EQ(fake->sent_count(), 0u);

    fake->open();
    ros->send_on_ready({{"op", "publish"}, {"topic", "/a"}, {"msg", 4}});

    auto sent = fake->sent();
    ASSERT_EQ(sent.size(), 4u);
    for (int i = 0; i < 4; ++i) {
        EXPECT_EQ(sent[i]["msg"], i + 1);
    }
}

TEST_F(RosTests, OnReadyRunsInlineWhenConnected) {
    ros->run();

    bool ran = false;
    ros->on_ready([&] { ran = true; }, false);
    EXPECT_TRUE(ran);
}

TEST_F(RosTests, BackgroundReadyCallbackRunsOffTransportThread) {
    start(false);
    ros->connect();

    std::promise<bool> on_io_thread;
    auto result = on_io_thread.get_future();
    ros->on_ready([&] { on_io_thread.set_value(ros->is_io_thread()); });

    fake->open();
    ASSERT_EQ(result.wait_for(1s), std::future_status::ready);
    EXPECT_FALSE(result.get());
}

// ============================================================================
// Inbound routing
// ============================================================================

TEST_F(RosTests, PublishIsRoutedByTopic) {
    ros->run();

    json received;
    int other = 0;
    ros->on("/chatter", [&](const json& msg) { received = msg; });
    ros->on("/other", [&](const json&) { ++other; });

    fake->inject({{"op", "publish"}, {"topic", "/chatter"}, {"msg", {{"data", "hello"}}}});

    EXPECT_EQ(received["data"], "hello");
    EXPECT_EQ(other, 0);
}

TEST_F(RosTests, StatusMessageIsEmitted) {
    ros->run();

    json status;
    ros->on(events::STATUS, [&](const json& payload) { status = payload; });
    fake->inject({{"op", "status"}, {"level", "warning"}, {"msg", "throttled"}, {"id", "x"}});

    EXPECT_EQ(status["level"], "warning");
    EXPECT_EQ(status["msg"], "throttled");
}

TEST_F(RosTests, UnknownOpIsReportedNotDropped) {
    ros->run();
    auto errors = collect_errors();

    fake->inject({{"op", "png"}, {"data", "..."}});

    ASSERT_EQ(errors->size(), 1u);
    EXPECT_EQ((*errors)[0]["error"], "UnhandledOperationError");
}

TEST_F(RosTests, MalformedAndBinaryFramesAreProtocolErrors) {
    ros->run();
    auto errors = collect_errors();

    fake->inject_text("{not json");
    fake->inject_text(R"({"topic": "/no_op"})");
    fake->inject_text("\x01\x02", true);

    ASSERT_EQ(errors->size(), 3u);
    for (const auto& error : *errors) {
        EXPECT_EQ(error["error"], "ProtocolError");
    }
    EXPECT_TRUE(ros->is_connected());
}

// ============================================================================
// Services
// ============================================================================

TEST_F(RosTests, AsyncServiceReplyResolvesExactlyOnce) {
    ros->run();
    auto errors = collect_errors();

    int successes = 0;
    json values;
    const std::string id = ros->make_id(ops::CALL_SERVICE, "/add_two_ints");
    ros->call_async_service(
        envelope::call_service(id, "/add_two_ints", {{"a", 2}, {"b", 3}}),
        [&](const json& v) { ++successes; values = v; },
        nullptr);

    json request = fake->wait_for_op("call_service");
    ASSERT_EQ(request["id"], id);
    EXPECT_EQ(request["args"]["a"], 2);
    EXPECT_EQ(ros->pending_service_requests(), 1u);

    json reply = {{"op", "service_response"}, {"id", id}, {"values", {{"sum", 5}}}, {"result", true}};
    fake->inject(reply);
    EXPECT_EQ(successes, 1);
    EXPECT_EQ(values["sum"], 5);
    EXPECT_EQ(ros->pending_service_requests(), 0u);

    // A second reply for the same id matches nothing
    fake->inject(reply);
    EXPECT_EQ(successes, 1);
    ASSERT_EQ(errors->size(), 1u);
    EXPECT_EQ((*errors)[0]["error"], "UnmatchedReplyError");
}

TEST_F(RosTests, AsyncServiceFailureGoesToErrorCallback) {
    ros->run();

    json failure;
    bool succeeded = false;
    const std::string id = ros->make_id(ops::CALL_SERVICE, "/svc");
    ros->call_async_service(envelope::call_service(id, "/svc", json::object()),
                            [&](const json&) { succeeded = true; },
                            [&](const json& v) { failure = v; });

    fake->inject({{"op", "service_response"}, {"id", id}, {"values", "no such service"}, {"result", false}});

    EXPECT_FALSE(succeeded);
    EXPECT_EQ(failure, "no such service");
}

TEST_F(RosTests, ThrowingReplyCallbackIsReported) {
    ros->run();
    auto errors = collect_errors();

    const std::string id = ros->make_id(ops::CALL_SERVICE, "/svc");
    ros->call_async_service(envelope::call_service(id, "/svc", json::object()),
                            [](const json&) { throw std::runtime_error("callback broke"); }, nullptr);
    fake->inject({{"op", "service_response"}, {"id", id}, {"values", {}}, {"result", true}});

    ASSERT_EQ(errors->size(), 1u);
    EXPECT_EQ((*errors)[0]["error"], "CallbackError");
    EXPECT_EQ((*errors)[0]["what"], "callback broke");
}

TEST_F(RosTests, BlockingServiceCallReturnsValues) {
    ros->run();

    const std::string id = ros->make_id(ops::CALL_SERVICE, "/add_two_ints");
    auto call = std::async(std::launch::async, [&] {
        return ros->call_sync_service(envelope::call_service(id, "/add_two_ints", {{"a", 1}, {"b", 2}}), 2s);
    });

    ASSERT_FALSE(fake->wait_for_op("call_service").is_null());
    fake->inject({{"op", "service_response"}, {"id", id}, {"values", {{"sum", 3}}}, {"result", true}});

    ASSERT_EQ(call.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(call.get()["sum"], 3);
}

TEST_F(RosTests, BlockingServiceCallRaisesServiceError) {
    ros->run();

    const std::string id = ros->make_id(ops::CALL_SERVICE, "/svc");
    auto call = std::async(std::launch::async, [&] {
        return ros->call_sync_service(envelope::call_service(id, "/svc", json::object()), 2s);
    });

    ASSERT_FALSE(fake->wait_for_op("call_service").is_null());
    fake->inject({{"op", "service_response"}, {"id", id}, {"values", {{"reason", "denied"}}}, {"result", false}});

    try {
        call.get();
        FAIL() << "Expected ServiceError";
    } catch (const ServiceError& e) {
        EXPECT_EQ(e.values()["reason"], "denied");
    }
}

TEST_F(RosTests, BlockingServiceCallTimesOutOnSchedule) {
    ros->run();

    const std::string id = ros->make_id(ops::CALL_SERVICE, "/slow");
    const auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(ros->call_sync_service(envelope::call_service(id, "/slow", json::object()), 200ms),
                 ServiceTimeoutError);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_GE(elapsed, 200ms);
    EXPECT_LT(elapsed, 1000ms);
    EXPECT_EQ(ros->pending_service_requests(), 0u);
}

TEST_F(RosTests, LateReplyAfterTimeoutIsDiscarded) {
    ros->run();
    auto errors = collect_errors();

    const std::string id = ros->make_id(ops::CALL_SERVICE, "/slow");
    EXPECT_THROW(ros->call_sync_service(envelope::call_service(id, "/slow", json::object()), 50ms),
                 ServiceTimeoutError);

    fake->inject({{"op", "service_response"}, {"id", id}, {"values", {}}, {"result", true}});
    EXPECT_TRUE(errors->empty());
}

TEST_F(RosTests, TerminateFailsPendingBlockingCall) {
    ros->run();

    const std::string id = ros->make_id(ops::CALL_SERVICE, "/never");
    auto call = std::async(std::launch::async, [&] {
        return ros->call_sync_service(envelope::call_service(id, "/never", json::object()), 5s);
    });

    ASSERT_FALSE(fake->wait_for_op("call_service").is_null());
    const auto start = std::chrono::steady_clock::now();
    ros->terminate();

    ASSERT_EQ(call.wait_for(2s), std::future_status::ready);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    try {
        call.get();
        FAIL() << "Expected RosBridgeError";
    } catch (const TimeoutError&) {
        FAIL() << "Call waited out its timeout instead of failing on terminate";
    } catch (const RosBridgeError& e) {
        EXPECT_NE(std::string(e.what()).find(id), std::string::npos);
    }
}

TEST_F(RosTests, BlockingCallOnTransportThreadIsRefused) {
    ros->run();

    bool refused = false;
    ros->on("/trigger", [&](const json&) {
        try {
            ros->call_sync_service(envelope::call_service("call_service:/svc:99", "/svc", json::object()), 50ms);
        } catch (const TimeoutError&) {
            // Would mean we blocked the transport thread
        } catch (const RosBridgeError&) {
            refused = true;
        }
    });

    fake->inject({{"op", "publish"}, {"topic", "/trigger"}, {"msg", {}}});
    EXPECT_TRUE(refused);
}

TEST_F(RosTests, RosapiHelpersUnpackResponses) {
    ros->run();

    auto topics = std::async(std::launch::async, [&] { return ros->get_topics(); });

    json request = fake->wait_for_op("call_service");
    ASSERT_EQ(request["service"], "/rosapi/topics");
    fake->inject({{"op", "service_response"}, {"id", request["id"]},
                  {"values", {{"topics", {"/rosout", "/chatter"}}, {"types", {"a", "b"}}}}, {"result", true}});

    ASSERT_EQ(topics.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(topics.get(), (std::vector<std::string>{"/rosout", "/chatter"}));
}

// ============================================================================
// Bridge-native actions
// ============================================================================

TEST_F(RosTests, ActionFeedbackAndResultAreCorrelated) {
    ros->run();

    std::vector<json> feedback;
    json result;
    const std::string id = ros->make_id(ops::SEND_ACTION_GOAL, "/fibonacci");
    ros->send_action_goal(
        envelope::send_action_goal(id, "/fibonacci", "action_tutorials_interfaces/action/Fibonacci",
                                   {{"order", 3}}, true),
        [&](const json& r) { result = r; },
        [&](const json& f) { feedback.push_back(f); },
        nullptr);

    ASSERT_FALSE(fake->wait_for_op("send_action_goal").is_null());
    fake->inject({{"op", "action_feedback"}, {"id", id}, {"action", "/fibonacci"}, {"values", {{"partial", {0, 1}}}}});
    fake->inject({{"op", "action_result"}, {"id", id}, {"action", "/fibonacci"}, {"status", 4},
                  {"values", {{"sequence", {0, 1, 1}}}}, {"result", true}});

    ASSERT_EQ(feedback.size(), 1u);
    EXPECT_EQ(feedback[0]["partial"].size(), 2u);
    EXPECT_EQ(result["status"], "SUCCEEDED");
    EXPECT_EQ(result["values"]["sequence"].size(), 3u);
    EXPECT_EQ(ros->pending_action_goals(), 0u);
}

TEST_F(RosTests, FailedActionResultGoesToErrorCallback) {
    ros->run();

    json error;
    const std::string id = ros->make_id(ops::SEND_ACTION_GOAL, "/fibonacci");
    ros->send_action_goal(envelope::send_action_goal(id, "/fibonacci", "t", json::object(), false),
                          nullptr, nullptr, [&](const json& e) { error = e; });

    fake->inject({{"op", "action_result"}, {"id", id}, {"status", 5}, {"values", {}}, {"result", false}});
    EXPECT_EQ(error["status"], "ABORTED");
}

TEST_F(RosTests, FeedbackForUnknownGoalIsSkipped) {
    ros->run();
    auto errors = collect_errors();

    fake->inject({{"op", "action_feedback"}, {"id", "send_action_goal:/x:42"}, {"action", "/x"}, {"values", {}}});
    EXPECT_TRUE(errors->empty());
}

TEST_F(RosTests, BlockingActionGoalTimesOut) {
    ros->run();

    const std::string id = ros->make_id(ops::SEND_ACTION_GOAL, "/slow");
    EXPECT_THROW(ros->call_sync_action(envelope::send_action_goal(id, "/slow", "t", json::object(), false), 100ms),
                 GoalTimeoutError);
    EXPECT_EQ(ros->pending_action_goals(), 0u);
}

TEST_F(RosTests, SetStatusLevelSendsSetLevel) {
    ros->run();
    ros->set_status_level("error", "set_level:1");

    json frame = fake->wait_for_op("set_level");
    EXPECT_EQ(frame["level"], "error");
}

// ============================================================================
// Close and reconnect
// ============================================================================

TEST_F(RosTests, DeliberateCloseAnnouncesClosingAndDoesNotReconnect) {
    RosConfig config = test::test_config();
    config.reconnect = true;
    start(true, config);
    ros->run();

    std::atomic<bool> connected_during_closing{false};
    json close_event;
    ros->on(events::CLOSING, [&](const json&) { connected_during_closing = ros->is_connected(); });
    ros->on(events::CLOSE, [&](const json& payload) { close_event = payload; });

    ros->close();

    EXPECT_TRUE(connected_during_closing.load());
    EXPECT_FALSE(ros->is_connected());
    EXPECT_TRUE(close_event["user_initiated"].get<bool>());
    EXPECT_EQ(fake->close_calls(), 1);

    std::this_thread::sleep_for(200ms);
    EXPECT_EQ(fake->connect_calls(), 1);
}

TEST_F(RosTests, UnexpectedDropReconnects) {
    RosConfig config = test::test_config();
    config.reconnect = true;
    start(true, config);
    ros->run();

    json close_event;
    ros->on(events::CLOSE, [&](const json& payload) { close_event = payload; });
    fake->drop("server went away");

    EXPECT_FALSE(close_event["user_initiated"].get<bool>());
    EXPECT_EQ(close_event["reason"], "server went away");
    EXPECT_TRUE(eventually([&] { return fake->connect_calls() == 2 && ros->is_connected(); }));
}

TEST_F(RosTests, SendsBetweenDropAndReconnectAreQueued) {
    RosConfig config = test::test_config();
    config.reconnect = true;
    start(true, config);
    ros->run();

    fake->set_auto_open(false);
    fake->drop();
    fake->clear_sent();

    ros->send_on_ready({{"op", "publish"}, {"topic", "/a"}, {"msg", "queued"}});
    EXPECT_EQ(fake->sent_count(), 0u);

    ASSERT_TRUE(eventually([&] { return fake->connect_calls() == 2; }));
    fake->open();

    ASSERT_EQ(fake->sent_count(), 1u);
    EXPECT_EQ(fake->sent_at(0)["msg"], "queued");
}

TEST_F(RosTests, FailedHandshakeEmitsCloseAndRetries) {
    RosConfig config = test::test_config();
    config.reconnect = true;
    start(false, config);
    ros->connect();

    json close_event;
    ros->on(events::CLOSE, [&](const json& payload) { close_event = payload; });
    fake->set_auto_open(true);
    fake->fail("refused");

    EXPECT_EQ(close_event["reason"], "refused");
    EXPECT_TRUE(eventually([&] { return ros->is_connected(); }));
}
