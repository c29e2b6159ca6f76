// ============================================================================
// MOTION WAITER TESTS
// ============================================================================

#include <catch2/catch.hpp>

#include "MockStageLink.h"
#include "movement/MotionWaiters.h"
#include "movement/StageController.h"

using namespace TestStage;

TEST_CASE("Home/jog waiter polls one read at a time", "[waiters]") {
    MockStageLink link;
    StageProtocol protocol(link);
    AxisSet axes;
    axes.discover(0b11);

    link.script("l1", {"-1", steps(1000.0)});
    link.script("l2", {"-5", "-5", steps(750.0)});
    link.script("r1", {"0"});
    link.script("r2", {"0"});

    HomeJogWaiter waiter(protocol, axes, {1, 2}, TimeUtils::Deadline(10000));
    REQUIRE(waiter.poll() == WaitState::WAIT_PENDING);   // l1 -1
    REQUIRE(waiter.poll() == WaitState::WAIT_PENDING);   // l1 done, l2 next
    REQUIRE(waiter.poll() == WaitState::WAIT_PENDING);   // l2 -5
    REQUIRE(waiter.poll() == WaitState::WAIT_PENDING);   // l2 -5
    REQUIRE(waiter.poll() == WaitState::WAIT_DONE);

    REQUIRE(waiter.lengthsSteps() == std::vector<long>{6400000, 4800000});
    REQUIRE(axes.find(1)->currentPositionSteps == 0L);

    // Finished waiters stay finished without touching the link
    size_t sentBefore = link.sent.size();
    REQUIRE(waiter.poll() == WaitState::WAIT_DONE);
    REQUIRE(link.sent.size() == sentBefore);
}

TEST_CASE("Home/jog waiter with nothing to wait for", "[waiters]") {
    MockStageLink link;
    StageProtocol protocol(link);
    AxisSet axes;

    HomeJogWaiter waiter(protocol, axes, {}, TimeUtils::Deadline(0));
    REQUIRE(waiter.state() == WaitState::WAIT_DONE);
    REQUIRE(runUntilFinished(waiter, 0) == WaitState::WAIT_DONE);
    REQUIRE(link.sent.empty());
}

TEST_CASE("Settle waiter needs two equal readable positions", "[waiters]") {
    MockStageLink link;
    StageProtocol protocol(link);
    AxisRecord axis(1);

    link.script("r1", {"100", "garbage", "100", "100"});

    SettleWaiter waiter(protocol, axis, 100, TimeUtils::Deadline(10000));
    REQUIRE(waiter.poll() == WaitState::WAIT_PENDING);   // 100
    REQUIRE(waiter.poll() == WaitState::WAIT_PENDING);   // unreadable, window restarts
    REQUIRE(waiter.poll() == WaitState::WAIT_PENDING);   // 100
    REQUIRE(waiter.poll() == WaitState::WAIT_DONE);      // 100 again

    REQUIRE(waiter.reachedTarget());
    REQUIRE(axis.currentPositionSteps == 100L);
}

TEST_CASE("Settle waiter on a dead link times out", "[waiters][timeout]") {
    MockStageLink link;
    link.unreachable = true;
    StageProtocol protocol(link);
    AxisRecord axis(1);

    SettleWaiter waiter(protocol, axis, 100, TimeUtils::Deadline(20));
    REQUIRE(runUntilFinished(waiter, 1) == WaitState::WAIT_TIMED_OUT);
    REQUIRE_FALSE(waiter.settledSteps());
}

TEST_CASE("Waiting through the controller", "[waiters]") {
    MockStageLink link;
    scriptHomedStage(link, {1000.0, 750.0});
    StageController controller(link, twoAxisConfig());
    REQUIRE(controller.connect() == ErrorCode::OK);

    SECTION("lengths come back in mm and the stage is homed") {
        link.script("l1", {"-1", steps(1000.0)});
        link.script("l2", {steps(750.0)});

        auto lengths = controller.waitForHomeOrJog();
        REQUIRE(lengths.ok());
        REQUIRE(lengths.value().size() == 2);
        REQUIRE(lengths.value()[0] == Approx(1000.0));
        REQUIRE(lengths.value()[1] == Approx(750.0));
        REQUIRE(controller.isHomed());
    }

    SECTION("a length that never turns non-negative times out") {
        link.script("l1", {"-1"});

        auto lengths = controller.waitForHomeOrJog(ALL_AXES, 30);
        REQUIRE(lengths.code() == ErrorCode::ERR_TIMEOUT);
        REQUIRE(toInt(lengths.code()) == -1);
        REQUIRE_FALSE(controller.isHomed());
    }

    SECTION("single axis") {
        link.script("l2", {"-1", steps(750.0)});

        auto lengths = controller.waitForHomeOrJog(2);
        REQUIRE(lengths.ok());
        REQUIRE(lengths.value() == std::vector<double>{750.0});
        REQUIRE_FALSE(link.wasSent("l3"));
    }

    SECTION("unknown axis") {
        REQUIRE(controller.waitForHomeOrJog(3).code() == ErrorCode::ERR_INVALID_AXIS);
    }
}
