// ============================================================================
// STAGE PROTOCOL TESTS
// ============================================================================

#include <catch2/catch.hpp>

#include "MockStageLink.h"
#include "communication/StageProtocol.h"

TEST_CASE("Command text matches the controller box", "[protocol]") {
    REQUIRE(StageProtocol::discoverCommand() == "e");
    REQUIRE(StageProtocol::lengthCommand(1) == "l1");
    REQUIRE(StageProtocol::positionCommand(3) == "r3");
    REQUIRE(StageProtocol::homeCommand(ALL_AXES) == "h");
    REQUIRE(StageProtocol::homeCommand(2) == "h2");
    REQUIRE(StageProtocol::jogCommand(1, JogDirection::JOG_A) == "j1a");
    REQUIRE(StageProtocol::jogCommand(2, JogDirection::JOG_B) == "j2b");
    REQUIRE(StageProtocol::gotoCommand(2, 160000) == "g2160000");
    REQUIRE(StageProtocol::stopCommand(ALL_AXES) == "b");
    REQUIRE(StageProtocol::stopCommand(3) == "b3");
}

TEST_CASE("Numeric replies", "[protocol]") {
    REQUIRE(StageProtocol::parseNumber("123") == 123L);
    REQUIRE(StageProtocol::parseNumber(" 4800000\r\n") == 4800000L);
    REQUIRE(StageProtocol::parseNumber("-1") == -1L);
    REQUIRE_FALSE(StageProtocol::parseNumber(""));
    REQUIRE_FALSE(StageProtocol::parseNumber("   "));
    REQUIRE_FALSE(StageProtocol::parseNumber("12a"));
    REQUIRE_FALSE(StageProtocol::parseNumber("busy"));
}

TEST_CASE("Command replies are classified", "[protocol]") {
    MockStageLink link;
    StageProtocol protocol(link);

    SECTION("empty reply acknowledges") {
        REQUIRE(protocol.home(ALL_AXES));
        REQUIRE(link.sent == std::vector<std::string>{"h"});
    }

    SECTION("any text rejects") {
        link.script("j1b", {"busy"});
        REQUIRE_FALSE(protocol.jog(1, JogDirection::JOG_B));
    }

    SECTION("link failure rejects without throwing") {
        link.unreachable = true;
        REQUIRE_FALSE(protocol.moveTo(1, 3200000));
        REQUIRE_FALSE(protocol.stop(ALL_AXES));
        REQUIRE(link.sent == std::vector<std::string>{"g13200000", "b"});
    }
}

TEST_CASE("Reads turn failures into absent values", "[protocol]") {
    MockStageLink link;
    StageProtocol protocol(link);

    link.script("l1", {"6400000"});
    link.script("r2", {"garbage"});
    REQUIRE(protocol.readLength(1) == 6400000L);
    REQUIRE_FALSE(protocol.readPosition(2));

    link.unreachable = true;
    REQUIRE_FALSE(protocol.readLength(1));
    REQUIRE(protocol.transactionCount() == 3UL);
}

TEST_CASE("Discovery distinguishes unreachable from unparsable", "[protocol]") {
    MockStageLink link;
    StageProtocol protocol(link);

    link.script("e", {"5"});
    REQUIRE(protocol.discoverAxes() == 5L);

    link.script("e", {"what?"});
    REQUIRE_FALSE(protocol.discoverAxes());

    link.unreachable = true;
    REQUIRE_THROWS_AS(protocol.discoverAxes(), LinkError);
}
