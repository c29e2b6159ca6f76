// ============================================================================
// STAGE CONTROLLER - Implementation
// ============================================================================

#include "movement/StageController.h"

#include <utility>

#include "core/MovementMath.h"
#include "core/UtilityEngine.h"

StageController::StageController(StageLink& link, StageConfig config) :
    m_config(std::move(config)),
    m_protocol(link),
    m_validator(m_protocol, m_axes, m_config),
    m_executor(m_protocol, m_axes, m_config, m_validator),
    m_homing(m_protocol, m_axes, m_config, m_validator, m_executor),
    m_estop(m_protocol, m_axes) {}

StageController::~StageController() {
    if (m_connected) close();
}

// ============================================================================
// SESSION
// ============================================================================

ErrorCode StageController::connect() {
    engine->info("🔌 Connecting to stage controller...");

    std::optional<long> mask;
    try {
        mask = m_protocol.discoverAxes();
    } catch (const LinkError& e) {
        engine->error(std::string("❌ Stage controller unreachable: ") + e.what());
        m_axes.clear();
        m_connected = false;
        return ErrorCode::ERR_TIMEOUT;
    }

    if (!mask || *mask < 0) {
        engine->error("❌ Axis discovery failed");
        m_axes.clear();
        m_connected = false;
        return ErrorCode::ERR_TIMEOUT;
    }

    size_t found = m_axes.discover(*mask);

    std::vector<long> expectedSteps;
    expectedSteps.reserve(m_config.expectedLengthsMM.size());
    for (double lengthMM : m_config.expectedLengthsMM) {
        expectedSteps.push_back(MovementMath::mmToSteps(lengthMM, m_config.stepsPerMM));
    }
    bool consistent = m_axes.assignConfiguration(expectedSteps, m_config.keepoutZones);

    for (int axis : m_axes.indices()) {
        m_axes.find(axis)->currentPositionSteps = m_protocol.readPosition(axis);
    }

    m_connected = true;

    if (!consistent) {
        engine->warn("⚠️ Configuration gives " + std::to_string(m_config.expectedLengthsMM.size()) +
                     " expected lengths, but " + std::to_string(found) + " axes were found");
        engine->warn("   Length check skipped: stage treated as not homed");
        return ErrorCode::OK;
    }

    if (m_validator.check(ALL_AXES) != ErrorCode::OK) {
        engine->warn("⚠️ Stage lengths did not check out: homing required");
    }

    engine->info("✅ Connected: " + std::to_string(found) + " axes, " +
                 (m_axes.isHomed() ? "homed" : "NOT homed"));
    return ErrorCode::OK;
}

void StageController::close() {
    m_axes.clear();
    m_connected = false;
    engine->info("🔌 Stage session closed");
}

// ============================================================================
// HOMING
// ============================================================================

Outcome<std::vector<double>> StageController::home(int axis, bool block, unsigned long timeoutMs) {
    return m_homing.home(axis, block, timeoutMs);
}

Outcome<std::vector<double>> StageController::otterHome(double safeXMM, unsigned long timeoutMs) {
    return m_homing.otterHome(safeXMM, timeoutMs);
}

Outcome<std::vector<double>> StageController::waitForHomeOrJog(int axis, unsigned long timeoutMs) {
    auto waited = m_executor.waitForHomeOrJog(axis, timeoutMs);
    if (!waited) return Outcome<std::vector<double>>::failure(waited.code());

    std::vector<double> lengthsMM;
    for (long steps : waited.value()) {
        lengthsMM.push_back(MovementMath::stepsToMM(steps, m_config.stepsPerMM));
    }
    return Outcome<std::vector<double>>::success(lengthsMM);
}

// ============================================================================
// MOTION
// ============================================================================

ErrorCode StageController::jog(int axis, JogDirection direction, bool block, unsigned long timeoutMs) {
    return m_executor.jog(axis, direction, block, timeoutMs);
}

ErrorCode StageController::goTo(const std::vector<double>& targetsMM, const std::vector<int>& axes,
                                bool block, unsigned long timeoutMs) {
    return m_executor.goTo(MotionRequest::absolute(targetsMM, axes, block, timeoutMs));
}

ErrorCode StageController::goToAll(const std::vector<double>& targetsMM, bool block, unsigned long timeoutMs) {
    return goTo(targetsMM, m_axes.indices(), block, timeoutMs);
}

ErrorCode StageController::move(const std::vector<double>& deltasMM, const std::vector<int>& axes,
                                bool block, unsigned long timeoutMs) {
    return m_executor.move(MotionRequest::offset(deltasMM, axes, block, timeoutMs));
}

ErrorCode StageController::moveAll(const std::vector<double>& deltasMM, bool block, unsigned long timeoutMs) {
    return move(deltasMM, m_axes.indices(), block, timeoutMs);
}

ErrorCode StageController::execute(const MotionRequest& request) {
    return m_executor.execute(request);
}

ErrorCode StageController::estop(const std::vector<int>& axes) {
    return m_estop.estop(axes);
}

ErrorCode StageController::estopAll() {
    return m_estop.estopAll();
}

// ============================================================================
// STATE
// ============================================================================

std::vector<std::optional<double>> StageController::getPosition(const std::vector<int>& axes) {
    return m_executor.getPosition(axes);
}

std::vector<std::optional<double>> StageController::getPositionAll() {
    return m_executor.getPosition(m_axes.indices());
}

ErrorCode StageController::checkLengths(int axis) {
    return m_validator.check(axis);
}

std::optional<double> StageController::toMM(const std::optional<long>& steps) const {
    if (!steps) return std::nullopt;
    return MovementMath::stepsToMM(*steps, m_config.stepsPerMM);
}

std::vector<std::optional<double>> StageController::measuredLengthsMM() const {
    std::vector<std::optional<double>> out;
    for (const auto& record : m_axes.records()) {
        out.push_back(toMM(record.measuredLengthSteps));
    }
    return out;
}

std::vector<std::optional<double>> StageController::cachedPositionsMM() const {
    std::vector<std::optional<double>> out;
    for (const auto& record : m_axes.records()) {
        out.push_back(toMM(record.currentPositionSteps));
    }
    return out;
}
