#include <gtest/gtest.h>

#include "session/session_controller.hpp"
#include "time/manual_clock.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

class SessionControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock.set_time_of_day(make_time_of_day(9, 0, 0));
        controller = std::make_unique<SessionController>(window, clock, 1ms);
        controller->set_transition_callback([this](const PhaseTransition& t) {
            std::lock_guard<std::mutex> lk(mu);
            transitions.push_back(t);
        });
    }

    void TearDown() override { controller.reset(); }

    std::vector<PhaseTransition> seen() {
        std::lock_guard<std::mutex> lk(mu);
        return transitions;
    }

    SessionWindow window{.open = make_time_of_day(9, 15, 0),
                         .close = make_time_of_day(15, 30, 0)};
    ManualClock clock;
    std::unique_ptr<SessionController> controller;

    std::mutex mu;
    std::vector<PhaseTransition> transitions;
};

// =============================================================================
// Window validation
// =============================================================================

TEST(SessionWindowTest, AcceptsOpenBeforeClose) {
    SessionWindow w{.open = make_time_of_day(9, 0, 0), .close = make_time_of_day(17, 0, 0)};
    EXPECT_NO_THROW(w.validate());
}

TEST(SessionWindowTest, RejectsCloseEqualToOpen) {
    SessionWindow w{.open = make_time_of_day(9, 0, 0), .close = make_time_of_day(9, 0, 0)};
    EXPECT_THROW(w.validate(), std::invalid_argument);
}

TEST(SessionWindowTest, RejectsCloseBeforeOpen) {
    SessionWindow w{.open = make_time_of_day(22, 0, 0), .close = make_time_of_day(2, 0, 0)};
    EXPECT_THROW(w.validate(), std::invalid_argument);
}

TEST(SessionWindowTest, ContainsIsHalfOpen) {
    SessionWindow w{.open = TimeOfDay{100}, .close = TimeOfDay{200}};
    EXPECT_FALSE(w.contains(TimeOfDay{99}));
    EXPECT_TRUE(w.contains(TimeOfDay{100}));
    EXPECT_TRUE(w.contains(TimeOfDay{199}));
    EXPECT_FALSE(w.contains(TimeOfDay{200}));
}

TEST(SessionWindowTest, ControllerRejectsInvalidWindow) {
    ManualClock clock;
    SessionWindow w{.open = make_time_of_day(10, 0, 0), .close = make_time_of_day(9, 0, 0)};
    EXPECT_THROW(SessionController controller(w, clock), std::invalid_argument);
}

// =============================================================================
// Phase transitions
// =============================================================================

TEST_F(SessionControllerTest, StartsBeforeOpen) {
    EXPECT_EQ(controller->current_phase(), Phase::BEFORE_OPEN);
    EXPECT_EQ(controller->poll(), Phase::BEFORE_OPEN);
    EXPECT_TRUE(seen().empty());
}

TEST_F(SessionControllerTest, OpensAtOpenTimeAndFiresLogon) {
    clock.set_time_of_day(window.open);
    EXPECT_EQ(controller->poll(), Phase::OPEN);

    auto t = seen();
    ASSERT_EQ(t.size(), 1);
    EXPECT_EQ(t[0].from, Phase::BEFORE_OPEN);
    EXPECT_EQ(t[0].to, Phase::OPEN);
}

TEST_F(SessionControllerTest, ClosesAtCloseTimeAndFiresLogout) {
    clock.set_time_of_day(make_time_of_day(10, 0, 0));
    controller->poll();
    clock.set_time_of_day(window.close);
    EXPECT_EQ(controller->poll(), Phase::CLOSED);

    auto t = seen();
    ASSERT_EQ(t.size(), 2);
    EXPECT_EQ(t[1].from, Phase::OPEN);
    EXPECT_EQ(t[1].to, Phase::CLOSED);
}

TEST_F(SessionControllerTest, RepeatedPollsFireEachTransitionOnce) {
    clock.set_time_of_day(make_time_of_day(10, 0, 0));
    for (int i = 0; i < 5; ++i) {
        controller->poll();
    }
    clock.set_time_of_day(make_time_of_day(16, 0, 0));
    for (int i = 0; i < 5; ++i) {
        controller->poll();
    }
    EXPECT_EQ(seen().size(), 2);
}

TEST_F(SessionControllerTest, NeverReopensAfterClose) {
    clock.set_time_of_day(make_time_of_day(10, 0, 0));
    controller->poll();
    clock.set_time_of_day(make_time_of_day(16, 0, 0));
    controller->poll();

    clock.set_time_of_day(make_time_of_day(10, 0, 0));
    EXPECT_EQ(controller->poll(), Phase::CLOSED);
    EXPECT_EQ(seen().size(), 2);
}

TEST_F(SessionControllerTest, StartingAfterWindowGoesStraightToClosedSilently) {
    clock.set_time_of_day(make_time_of_day(18, 0, 0));
    EXPECT_EQ(controller->poll(), Phase::CLOSED);
    EXPECT_TRUE(seen().empty());
}

TEST_F(SessionControllerTest, ClosesWhenClockPassesMidnightWhileOpen) {
    clock.set_time_of_day(make_time_of_day(10, 0, 0));
    controller->poll();
    clock.set_time_of_day(make_time_of_day(0, 0, 5));
    EXPECT_EQ(controller->poll(), Phase::CLOSED);
    EXPECT_EQ(seen().back().to, Phase::CLOSED);
}

TEST_F(SessionControllerTest, TransitionCarriesClockTimestamp) {
    clock.set_now(Timestamp{123'456});
    clock.set_time_of_day(window.open);
    controller->poll();
    EXPECT_EQ(seen().at(0).timestamp, Timestamp{123'456});
}

// =============================================================================
// Waiting and background polling
// =============================================================================

TEST_F(SessionControllerTest, WaitReturnsImmediatelyWhenOpen) {
    clock.set_time_of_day(make_time_of_day(10, 0, 0));
    controller->poll();
    EXPECT_TRUE(controller->wait_until_open(0ms));
}

TEST_F(SessionControllerTest, WaitTimesOutBeforeOpen) {
    EXPECT_FALSE(controller->wait_until_open(20ms));
}

TEST_F(SessionControllerTest, WaitReturnsFalseOnceClosed) {
    clock.set_time_of_day(make_time_of_day(18, 0, 0));
    controller->poll();
    EXPECT_FALSE(controller->wait_until_open(1s));
}

TEST_F(SessionControllerTest, BackgroundPollerWakesWaiter) {
    controller->start();

    std::thread opener([this] {
        std::this_thread::sleep_for(20ms);
        clock.set_time_of_day(make_time_of_day(9, 15, 0));
    });

    EXPECT_TRUE(controller->wait_until_open(5s));
    opener.join();
    controller->stop();

    EXPECT_EQ(controller->current_phase(), Phase::OPEN);
    EXPECT_EQ(seen().size(), 1);
}

TEST_F(SessionControllerTest, BackgroundPollerDrivesFullSession) {
    controller->start();

    clock.set_time_of_day(make_time_of_day(12, 0, 0));
    ASSERT_TRUE(controller->wait_until_open(5s));

    clock.set_time_of_day(make_time_of_day(15, 30, 0));
    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (controller->current_phase() != Phase::CLOSED &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    controller->stop();

    EXPECT_EQ(controller->current_phase(), Phase::CLOSED);
    auto t = seen();
    ASSERT_EQ(t.size(), 2);
    EXPECT_EQ(t[0].to, Phase::OPEN);
    EXPECT_EQ(t[1].to, Phase::CLOSED);
}

TEST_F(SessionControllerTest, ConcurrentPollsDeliverTransitionsInOrder) {
    std::atomic<bool> logon_delivered{false};
    controller->set_transition_callback([this, &logon_delivered](const PhaseTransition& t) {
        if (t.to == Phase::OPEN) {
            // Close the window while this logon is still being delivered.
            clock.set_time_of_day(window.close);
            logon_delivered = true;
            std::this_thread::sleep_for(20ms);
        }
        std::lock_guard<std::mutex> lk(mu);
        transitions.push_back(t);
    });

    clock.set_time_of_day(make_time_of_day(10, 0, 0));
    std::thread first([this] { controller->poll(); });

    std::thread second([this, &logon_delivered] {
        while (!logon_delivered.load()) {
            std::this_thread::yield();
        }
        controller->poll();
    });

    first.join();
    second.join();

    auto t = seen();
    ASSERT_EQ(t.size(), 2);
    EXPECT_EQ(t[0].to, Phase::OPEN);
    EXPECT_EQ(t[1].to, Phase::CLOSED);
}
