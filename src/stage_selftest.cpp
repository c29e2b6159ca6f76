// ============================================================================
// STAGE SELF-TEST - Command line entry point
// ============================================================================
// Runs the full self-test sequence against a simulated controller box.
//
// Usage: stage_selftest [config.json]
//   Without a file the compile-time defaults (Config.h) are used.
// Exit code: 0 = passed, 1 = self-test failed, 2 = configuration error
// ============================================================================

#include <string>

#include "core/StageConfigLoader.h"
#include "core/Types.h"
#include "core/UtilityEngine.h"
#include "hardware/SimulatedStage.h"
#include "movement/StageController.h"
#include "movement/StageSelfTest.h"

namespace {

constexpr int EXIT_PASSED = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_CONFIG_ERROR = 2;

// ============================================================================
// CONFIGURATION
// ============================================================================

bool loadConfiguration(const std::string& path, StageConfig& stage, SimulatedStageConfig& sim,
                       LoggingConfig& logging) {
    std::string json;
    std::string errorMsg;

    if (!StageConfigLoader::readFile(path, json, errorMsg) ||
        !StageConfigLoader::parseLogging(json, logging, errorMsg) ||
        !StageConfigLoader::parse(json, stage, errorMsg) ||
        !StageConfigLoader::parseSimulator(json, sim, errorMsg)) {
        engine->error("❌ Configuration '" + path + "': " + errorMsg);
        return false;
    }

    engine->info("📂 Configuration loaded from " + path);
    return true;
}

} // namespace

// ============================================================================
// MAIN
// ============================================================================

int main(int argc, char** argv) {
    StageConfig stage;
    SimulatedStageConfig sim;
    LoggingConfig logging;

    if (argc > 2) {
        engine->error("Usage: stage_selftest [config.json]");
        return EXIT_CONFIG_ERROR;
    }
    if (argc == 2 && !loadConfiguration(argv[1], stage, sim, logging)) {
        return EXIT_CONFIG_ERROR;
    }

    std::string errorMsg;
    if (!StageConfigLoader::applyLogging(logging, errorMsg)) {
        engine->error("❌ " + errorMsg);
        return EXIT_CONFIG_ERROR;
    }

    engine->info("🚀 Stage self-test starting (" +
                 std::string(stage.variant == StageVariant::STAGE_OTTER ? "otter" : "standard") + " stage, " +
                 std::to_string(stage.expectedLengthsMM.size()) + " configured axes)");

    SimulatedStage link(sim);
    ErrorCode result;
    {
        StageController controller(link, stage);
        result = StageSelfTest::run(controller);
    }

    if (result != ErrorCode::OK) {
        engine->error(std::string("❌ Self-test FAILED: ") + errorCodeName(result) + " (" +
                      std::to_string(toInt(result)) + ")");
    }

    engine->flushLogBuffer(true);
    engine->closeLogFile();
    return result == ErrorCode::OK ? EXIT_PASSED : EXIT_FAILED;
}
