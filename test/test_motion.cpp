// ============================================================================
// GOTO / MOVE / JOG / POSITION TESTS
// ============================================================================

#include <catch2/catch.hpp>

#include "MockStageLink.h"
#include "movement/StageController.h"

using namespace TestStage;

namespace {
struct ConnectedStage {
    MockStageLink link;
    StageController controller{link, twoAxisConfig()};

    ConnectedStage() {
        scriptHomedStage(link, {1000.0, 750.0});
        REQUIRE(controller.connect() == ErrorCode::OK);
        link.sent.clear();
    }
};
}

// ============================================================================
// GOTO
// ============================================================================

TEST_CASE_METHOD(ConnectedStage, "Goto into a keepout zone sends nothing", "[motion][goto][bounds]") {
    REQUIRE(controller.goTo({25.0}, {1}) == ErrorCode::ERR_OUT_OF_BOUNDS);
    REQUIRE(link.count("g") == 0);
}

TEST_CASE_METHOD(ConnectedStage, "Goto into an end buffer sends nothing", "[motion][goto][bounds]") {
    REQUIRE(controller.goTo({4.0}, {1}) == ErrorCode::ERR_OUT_OF_BOUNDS);
    REQUIRE(controller.goTo({996.0}, {1}) == ErrorCode::ERR_OUT_OF_BOUNDS);
    REQUIRE(controller.goTo({748.0}, {2}) == ErrorCode::ERR_OUT_OF_BOUNDS);
    REQUIRE(link.count("g") == 0);
}

TEST_CASE_METHOD(ConnectedStage, "One bad axis blocks the whole goto", "[motion][goto][bounds]") {
    REQUIRE(controller.goToAll({500.0, 1.0}) == ErrorCode::ERR_OUT_OF_BOUNDS);
    REQUIRE(link.count("g") == 0);
}

TEST_CASE_METHOD(ConnectedStage, "Goto in free travel sends exactly one command", "[motion][goto]") {
    REQUIRE(controller.goTo({500.0}, {1}, false) == ErrorCode::OK);
    REQUIRE(link.count("g") == 1);
    REQUIRE(link.wasSent("g13200000"));
}

TEST_CASE_METHOD(ConnectedStage, "Blocking goto waits for the axis to settle", "[motion][goto]") {
    link.script("r1", {steps(100.0), steps(300.0), steps(500.0), steps(500.0)});

    REQUIRE(controller.goTo({500.0}, {1}) == ErrorCode::OK);
    REQUIRE(link.count("r1") == 4);
    REQUIRE(*controller.cachedPositionsMM()[0] == Approx(500.0));
}

TEST_CASE_METHOD(ConnectedStage, "Axis stopping short of its target is a stall", "[motion][goto]") {
    link.script("r1", {steps(480.0)});
    REQUIRE(controller.goTo({500.0}, {1}) == ErrorCode::ERR_STALLED);
}

TEST_CASE_METHOD(ConnectedStage, "Stall is kept while later axes still settle", "[motion][goto]") {
    link.script("r1", {steps(480.0)});
    link.script("r2", {steps(300.0)});

    REQUIRE(controller.goToAll({500.0, 300.0}) == ErrorCode::ERR_STALLED);
    REQUIRE(link.count("r2") == 2);
    REQUIRE(*controller.cachedPositionsMM()[1] == Approx(300.0));
}

TEST_CASE_METHOD(ConnectedStage, "Goto that never settles times out", "[motion][goto][timeout]") {
    long position = 0;
    link.handler = [&position](const std::string& command) {
        return command == "r1" ? std::to_string(position += 100) : std::string();
    };
    link.replies.erase("r1");

    REQUIRE(controller.goTo({500.0}, {1}, true, 30) == ErrorCode::ERR_TIMEOUT);
}

TEST_CASE_METHOD(ConnectedStage, "Goto refused by the controller", "[motion][goto]") {
    link.script("g13200000", {"busy"});
    REQUIRE(controller.goTo({500.0}, {1}) == ErrorCode::ERR_REJECTED);
}

TEST_CASE_METHOD(ConnectedStage, "Goto on an unhomed stage", "[motion][goto][homed]") {
    link.script("l2", {"0"});

    REQUIRE(controller.goToAll({500.0, 300.0}) == ErrorCode::ERR_REJECTED);
    REQUIRE_FALSE(controller.isHomed());
    REQUIRE(link.count("g") == 0);
}

TEST_CASE_METHOD(ConnectedStage, "Malformed goto requests", "[motion][goto]") {
    REQUIRE(controller.goTo({100.0, 200.0}, {1}) == ErrorCode::ERR_LIST_MISMATCH);
    REQUIRE(toInt(controller.goToAll({100.0})) == -7);
    REQUIRE(controller.goTo({100.0}, {3}) == ErrorCode::ERR_INVALID_AXIS);
    REQUIRE(controller.goTo({}, {}) == ErrorCode::ERR_INVALID_AXIS);
    REQUIRE(link.sent.empty());
}

TEST_CASE("Whole-stage goto re-asserts homed", "[motion][goto][homed]") {
    MockStageLink link;
    scriptHomedStage(link, {1000.0, 770.0});
    StageController controller(link, twoAxisConfig());
    REQUIRE(controller.connect() == ErrorCode::OK);
    REQUIRE_FALSE(controller.isHomed());

    link.script("r1", {steps(500.0)});
    link.script("r2", {steps(300.0)});

    SECTION("single axis leaves the flag alone") {
        REQUIRE(controller.goTo({500.0}, {1}) == ErrorCode::OK);
        REQUIRE_FALSE(controller.isHomed());
    }

    SECTION("every axis sets it") {
        REQUIRE(controller.goTo({300.0, 500.0}, {2, 1}) == ErrorCode::OK);
        REQUIRE(controller.isHomed());
    }
}

TEST_CASE_METHOD(ConnectedStage, "Prepared requests dispatch on relative", "[motion]") {
    MotionRequest request;
    request.valuesMM = {500.0, 300.0};
    request.block = false;

    REQUIRE(controller.execute(request) == ErrorCode::OK);
    REQUIRE(link.wasSent("g13200000"));
    REQUIRE(link.wasSent("g21920000"));
}

// ============================================================================
// MOVE
// ============================================================================

TEST_CASE_METHOD(ConnectedStage, "Move adds offsets to fresh positions", "[motion][move]") {
    link.script("r1", {steps(100.0)});
    link.script("r2", {steps(50.0)});

    REQUIRE(controller.move({20.0, 20.0}, {1, 2}, false) == ErrorCode::OK);
    REQUIRE(link.wasSent("g1768000"));
    REQUIRE(link.wasSent("g2448000"));
    REQUIRE(link.count("g") == 2);
}

TEST_CASE_METHOD(ConnectedStage, "Move into a keepout zone sends nothing", "[motion][move][bounds]") {
    link.script("r1", {steps(15.0)});
    REQUIRE(controller.move({10.0}, {1}) == ErrorCode::ERR_OUT_OF_BOUNDS);
    REQUIRE(link.count("g") == 0);
}

TEST_CASE_METHOD(ConnectedStage, "Move needs a known position", "[motion][move]") {
    link.script("r2", {"0"});
    REQUIRE(controller.moveAll({1.0, 1.0}) == ErrorCode::ERR_REJECTED);
    REQUIRE(link.count("g") == 0);
}

// ============================================================================
// JOG
// ============================================================================

TEST_CASE_METHOD(ConnectedStage, "Jog without waiting", "[motion][jog]") {
    REQUIRE(controller.jog(1, JogDirection::JOG_A, false) == ErrorCode::OK);
    REQUIRE(link.sent == std::vector<std::string>{"j1a"});
}

TEST_CASE_METHOD(ConnectedStage, "Jog waits for the length to come back", "[motion][jog]") {
    link.script("l1", {"-1", "-1", steps(1000.0)});

    REQUIRE(controller.jog(1) == ErrorCode::OK);
    REQUIRE(link.wasSent("j1b"));
    REQUIRE(link.count("l1") >= 3);
}

TEST_CASE_METHOD(ConnectedStage, "Jog failures", "[motion][jog]") {
    SECTION("unknown axis") {
        REQUIRE(controller.jog(3, JogDirection::JOG_A) == ErrorCode::ERR_INVALID_AXIS);
        REQUIRE(link.sent.empty());
    }

    SECTION("refused") {
        link.script("j2b", {"busy"});
        REQUIRE(controller.jog(2) == ErrorCode::ERR_REJECTED);
    }

    SECTION("never finishes") {
        link.script("l1", {"-1"});
        REQUIRE(controller.jog(1, JogDirection::JOG_B, true, 30) == ErrorCode::ERR_TIMEOUT);
    }
}

// ============================================================================
// POSITION
// ============================================================================

TEST_CASE_METHOD(ConnectedStage, "Positions in mm, absent where unknown", "[motion][position]") {
    link.script("r1", {steps(100.0)});
    link.script("r2", {"0"});

    auto positions = controller.getPosition({1, 2, 3});
    REQUIRE(positions.size() == 3);
    REQUIRE(*positions[0] == Approx(100.0));
    REQUIRE_FALSE(positions[1]);
    REQUIRE_FALSE(positions[2]);
    REQUIRE_FALSE(link.wasSent("r3"));

    auto all = controller.getPositionAll();
    REQUIRE(all.size() == 2);
    REQUIRE(controller.cachedPositionsMM()[1] == std::nullopt);
}
