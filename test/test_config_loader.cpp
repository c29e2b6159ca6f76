// ============================================================================
// CONFIGURATION LOADER / VALIDATOR TESTS
// ============================================================================

#include <catch2/catch.hpp>

#include <cstdio>
#include <fstream>

#include "core/StageConfigLoader.h"
#include "core/Validators.h"

TEST_CASE("Full stage document", "[config]") {
    const std::string json = R"({
        "steps_per_mm": 3200,
        "expected_lengths_mm": [1000, 750.5],
        "keepout_zones_mm": [[30, 20], null],
        "end_buffer_mm": 2.5,
        "allowed_length_deviation_mm": 4,
        "variant": "otter",
        "otter_safe_x_mm": 600,
        "poll_interval_ms": 50,
        "settle_interval_ms": 0
    })";

    StageConfig config;
    std::string errorMsg;
    REQUIRE(StageConfigLoader::parse(json, config, errorMsg));

    REQUIRE(config.stepsPerMM == Approx(3200.0));
    REQUIRE(config.expectedLengthsMM == std::vector<double>{1000.0, 750.5});
    REQUIRE(config.keepoutZones.size() == 2);
    REQUIRE(config.keepoutZones[0].minMM == Approx(20.0));
    REQUIRE(config.keepoutZones[0].maxMM == Approx(30.0));
    REQUIRE(config.keepoutZones[1].isEmpty());
    REQUIRE(config.endBufferMM == Approx(2.5));
    REQUIRE(config.allowedLengthDeviationMM == Approx(4.0));
    REQUIRE(config.variant == StageVariant::STAGE_OTTER);
    REQUIRE(config.otterSafeXMM == Approx(600.0));
    REQUIRE(config.pollIntervalMs == 50);
    REQUIRE(config.settleIntervalMs == 0);
}

TEST_CASE("Missing keys keep their defaults", "[config]") {
    StageConfig config;
    std::string errorMsg;
    REQUIRE(StageConfigLoader::parse(R"({"expected_lengths_mm": [500]})", config, errorMsg));

    REQUIRE(config.stepsPerMM == Approx(DEFAULT_STEPS_PER_MM));
    REQUIRE(config.stepsPerMM == Approx(6400.0));
    REQUIRE(config.endBufferMM == Approx(END_BUFFER_MM));
    REQUIRE(config.variant == StageVariant::STAGE_STANDARD);
    REQUIRE(config.pollIntervalMs == WAIT_POLL_INTERVAL_MS);
    REQUIRE(config.keepoutZones.empty());
}

TEST_CASE("Bad documents are refused and leave the config untouched", "[config]") {
    StageConfig config;
    config.expectedLengthsMM = {123.0};
    std::string errorMsg;

    SECTION("not JSON") {
        REQUIRE_FALSE(StageConfigLoader::parse("{steps_per_mm: ", config, errorMsg));
        REQUIRE(errorMsg.find("invalid JSON") != std::string::npos);
    }
    SECTION("not an object") {
        REQUIRE_FALSE(StageConfigLoader::parse("[1, 2]", config, errorMsg));
    }
    SECTION("wrong type") {
        REQUIRE_FALSE(StageConfigLoader::parse(R"({"end_buffer_mm": "five"})", config, errorMsg));
        REQUIRE(errorMsg.find("end_buffer_mm") != std::string::npos);
    }
    SECTION("unknown variant") {
        REQUIRE_FALSE(StageConfigLoader::parse(R"({"variant": "diagonal"})", config, errorMsg));
    }
    SECTION("malformed keepout") {
        REQUIRE_FALSE(StageConfigLoader::parse(R"({"keepout_zones_mm": [[1]]})", config, errorMsg));
    }
    SECTION("negative interval") {
        REQUIRE_FALSE(StageConfigLoader::parse(R"({"poll_interval_ms": -5})", config, errorMsg));
    }
    SECTION("zero steps per mm") {
        REQUIRE_FALSE(StageConfigLoader::parse(R"({"steps_per_mm": 0})", config, errorMsg));
        REQUIRE(errorMsg.find("steps_per_mm") != std::string::npos);
    }
    SECTION("otter without two lengths") {
        REQUIRE_FALSE(StageConfigLoader::parse(R"({"variant": "otter", "expected_lengths_mm": [900]})",
                                               config, errorMsg));
    }

    REQUIRE(config.expectedLengthsMM == std::vector<double>{123.0});
}

TEST_CASE("Empty keepout entries mean no zone", "[config]") {
    StageConfig config;
    std::string errorMsg;
    REQUIRE(StageConfigLoader::parse(R"({"keepout_zones_mm": [[], null, [5, 6]]})", config, errorMsg));
    REQUIRE(config.keepoutZones[0].isEmpty());
    REQUIRE(config.keepoutZones[1].isEmpty());
    REQUIRE_FALSE(config.keepoutZones[2].isEmpty());
}

TEST_CASE("Validator rules", "[config][validators]") {
    StageConfig config;
    std::string errorMsg;
    REQUIRE(Validators::validateStageConfig(config, errorMsg));

    config.expectedLengthsMM = {100.0, 200.0, 300.0, 400.0};
    REQUIRE_FALSE(Validators::validateStageConfig(config, errorMsg));

    config.expectedLengthsMM = {100.0, -1.0};
    REQUIRE_FALSE(Validators::validateStageConfig(config, errorMsg));

    config.expectedLengthsMM = {100.0};
    config.allowedLengthDeviationMM = -0.1;
    REQUIRE_FALSE(Validators::validateStageConfig(config, errorMsg));

    REQUIRE(Validators::isPositive(0.5));
    REQUIRE_FALSE(Validators::isPositive(0.0));
    REQUIRE(Validators::isNonNegative(0.0));
}

TEST_CASE("Simulator section", "[config][simulator]") {
    SimulatedStageConfig sim;
    std::string errorMsg;

    SECTION("parsed with top-level steps per mm") {
        REQUIRE(StageConfigLoader::parseSimulator(
            R"({"steps_per_mm": 100, "simulator": {"axes_mask": 5, "lengths_mm": [300, 400],
                "steps_per_query": 1000, "homing_queries": 2, "start_homed": true}})",
            sim, errorMsg));
        REQUIRE(sim.axesMask == 5);
        REQUIRE(sim.lengthsMM == std::vector<double>{300.0, 400.0});
        REQUIRE(sim.stepsPerMM == Approx(100.0));
        REQUIRE(sim.stepsPerQuery == 1000);
        REQUIRE(sim.homingQueries == 2);
        REQUIRE(sim.startHomed);
    }

    SECTION("mask beyond three axes") {
        REQUIRE_FALSE(StageConfigLoader::parseSimulator(R"({"simulator": {"axes_mask": 9}})", sim, errorMsg));
    }

    SECTION("no section keeps defaults") {
        REQUIRE(StageConfigLoader::parseSimulator("{}", sim, errorMsg));
        REQUIRE(sim.axesMask == 3);
    }
}

TEST_CASE("Simulator defaults validate without the simulator itself", "[config][simulator][validators]") {
    SimulatedStageConfig sim;
    std::string errorMsg;
    REQUIRE(Validators::validateSimulatorConfig(sim, errorMsg));
    REQUIRE(sim.stepsPerQuery == static_cast<long>(SIM_DEFAULT_SPEED_MM * DEFAULT_STEPS_PER_MM));
    REQUIRE(sim.homingQueries == SIM_DEFAULT_HOMING_QUERIES);

    sim.stepsPerQuery = 0;
    REQUIRE_FALSE(Validators::validateSimulatorConfig(sim, errorMsg));
}

TEST_CASE("Logging keys", "[config][logging]") {
    LoggingConfig logging;
    std::string errorMsg;

    REQUIRE(StageConfigLoader::parseLogging(R"({"log_level": "warn", "log_file": "x.log"})", logging, errorMsg));
    REQUIRE(logging.level == LogLevel::LOG_WARNING);
    REQUIRE(logging.filePath == "x.log");

    REQUIRE_FALSE(StageConfigLoader::parseLogging(R"({"log_level": "loud"})", logging, errorMsg));
    REQUIRE(logging.level == LogLevel::LOG_WARNING);
}

TEST_CASE("Configuration files", "[config][file]") {
    std::string contents;
    std::string errorMsg;

    REQUIRE_FALSE(StageConfigLoader::readFile("/nonexistent/stage.json", contents, errorMsg));
    REQUIRE(errorMsg.find("/nonexistent/stage.json") != std::string::npos);

    const std::string path = "stage_config_loader_test.json";
    {
        std::ofstream out(path);
        out << R"({"end_buffer_mm": 7})";
    }
    REQUIRE(StageConfigLoader::readFile(path, contents, errorMsg));

    StageConfig config;
    REQUIRE(StageConfigLoader::parse(contents, config, errorMsg));
    REQUIRE(config.endBufferMM == Approx(7.0));
    std::remove(path.c_str());
}
