#include <gtest/gtest.h>
#include <vector>

#include "swarm/core/frame_scheduler.hpp"
#include "swarm/core/input_inbox.hpp"

TEST(FrameSchedulerTest, RequestFiresOnceWithTimestamp) {
    ManualFrameScheduler scheduler;
    std::vector<double> seen;

    FrameRequestId id = scheduler.requestFrame([&](double t) { seen.push_back(t); });
    EXPECT_NE(id, NoFrameRequest);
    EXPECT_EQ(scheduler.pendingCount(), 1u);

    EXPECT_EQ(scheduler.runFrame(16.0), 1u);
    EXPECT_EQ(scheduler.runFrame(32.0), 0u);
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_DOUBLE_EQ(seen[0], 16.0);
}

TEST(FrameSchedulerTest, CancelledRequestNeverFires) {
    ManualFrameScheduler scheduler;
    int calls = 0;

    FrameRequestId id = scheduler.requestFrame([&](double) { ++calls; });
    scheduler.cancelFrame(id);
    EXPECT_EQ(scheduler.pendingCount(), 0u);
    scheduler.runFrame(16.0);
    EXPECT_EQ(calls, 0);

    // Unknown ids are ignored
    scheduler.cancelFrame(id);
    scheduler.cancelFrame(12345);
}

TEST(FrameSchedulerTest, RequestMadeDuringFrameRunsNextFrame) {
    ManualFrameScheduler scheduler;
    std::vector<double> seen;

    std::function<void(double)> loop = [&](double t) {
        seen.push_back(t);
        scheduler.requestFrame(loop);
    };
    scheduler.requestFrame(loop);

    scheduler.runFrame(1.0);
    EXPECT_EQ(seen.size(), 1u);
    EXPECT_EQ(scheduler.pendingCount(), 1u);
    scheduler.runFrame(2.0);
    EXPECT_EQ(seen.size(), 2u);
}

TEST(FrameSchedulerTest, CallbackCanCancelLaterRequest) {
    ManualFrameScheduler scheduler;
    int secondCalls = 0;
    FrameRequestId second = NoFrameRequest;

    scheduler.requestFrame([&](double) { scheduler.cancelFrame(second); });
    second = scheduler.requestFrame([&](double) { ++secondCalls; });

    EXPECT_EQ(scheduler.runFrame(1.0), 1u);
    EXPECT_EQ(secondCalls, 0);
}

TEST(InputInboxTest, ClosedInboxDropsEvents) {
    Input::InputInbox inbox;
    EXPECT_FALSE(inbox.isOpen());
    EXPECT_FALSE(inbox.post(Input::PointerMoved{Position(1.0, 2.0)}));
    EXPECT_EQ(inbox.size(), 0u);

    inbox.open();
    EXPECT_TRUE(inbox.post(Input::PointerMoved{Position(1.0, 2.0)}));
    EXPECT_TRUE(inbox.post(Input::ColorChanged{"#FFFFFF"}));
    EXPECT_EQ(inbox.size(), 2u);

    inbox.close();
    EXPECT_EQ(inbox.size(), 0u);
    EXPECT_FALSE(inbox.post(Input::ViewportResized{100.0, 100.0}));
}

TEST(InputInboxTest, DrainReturnsEventsInArrivalOrder) {
    Input::InputInbox inbox;
    inbox.open();
    inbox.post(Input::PointerMoved{Position(1.0, 0.0)});
    inbox.post(Input::ViewportResized{640.0, 480.0});
    inbox.post(Input::PointerMoved{Position(2.0, 0.0)});

    auto events = inbox.drain();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_TRUE(std::holds_alternative<Input::PointerMoved>(events[0]));
    EXPECT_TRUE(std::holds_alternative<Input::ViewportResized>(events[1]));
    EXPECT_DOUBLE_EQ(std::get<Input::PointerMoved>(events[2]).position.x, 2.0);
    EXPECT_EQ(inbox.size(), 0u);
    EXPECT_TRUE(inbox.drain().empty());
}
