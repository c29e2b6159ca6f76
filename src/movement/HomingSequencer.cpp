// ============================================================================
// HOMING SEQUENCER - Implementation
// ============================================================================

#include "movement/HomingSequencer.h"

#include "core/MovementMath.h"
#include "core/TextUtils.h"
#include "core/TimeUtils.h"
#include "core/UtilityEngine.h"

using enum ErrorCode;

namespace {
using HomeOutcome = Outcome<std::vector<double>>;

constexpr int OTTER_X_AXIS = 1;
constexpr int OTTER_Y_AXIS = 2;
}

HomingSequencer::HomingSequencer(StageProtocol& protocol, AxisSet& axes, const StageConfig& config,
                                 LengthValidator& validator, MotionExecutor& executor) :
    m_protocol(protocol),
    m_axes(axes),
    m_config(config),
    m_validator(validator),
    m_executor(executor) {}

// ============================================================================
// ENTRY POINT
// ============================================================================

HomeOutcome HomingSequencer::home(int axis, bool block, unsigned long timeoutMs, bool enableComposite) {
    TimeUtils::Deadline deadline(timeoutMs);

    if (m_config.variant == StageVariant::STAGE_OTTER && enableComposite) {
        if (axis == ALL_AXES && block) {
            return otterHome(m_config.otterSafeXMM, deadline.remainingMs());
        }
        engine->warn("⚠️ Otter stage homes the whole stage, blocking, or not at all");
        return HomeOutcome::failure(ERR_UNSUPPORTED);
    }

    return directHome(axis, block, deadline.remainingMs());
}

// ============================================================================
// DIRECT HOMING
// ============================================================================

HomeOutcome HomingSequencer::directHome(int axis, bool block, unsigned long timeoutMs) {
    TimeUtils::Deadline deadline(timeoutMs);

    if (axis != ALL_AXES && !m_axes.contains(axis)) {
        engine->warn("⚠️ Home: invalid axis " + std::to_string(axis));
        return HomeOutcome::failure(ERR_INVALID_AXIS);
    }

    engine->info("🏠 Homing " + (axis == ALL_AXES ? std::string("stage") : "axis " + std::to_string(axis)) + "...");
    if (!m_protocol.home(axis)) {
        // Typically "already homing"
        return HomeOutcome::failure(ERR_REJECTED);
    }

    if (!block) return HomeOutcome::success({});

    auto waited = m_executor.waitForHomeOrJog(axis, deadline.remainingMs());
    if (!waited) {
        engine->error(std::string("❌ Homing did not complete: ") + errorCodeName(waited.code()));
        return HomeOutcome::failure(waited.code());
    }

    std::vector<double> lengthsMM;
    lengthsMM.reserve(waited.value().size());
    for (long steps : waited.value()) {
        lengthsMM.push_back(MovementMath::stepsToMM(steps, m_config.stepsPerMM));
    }
    engine->info("✅ Homed, lengths " + TextUtils::list(lengthsMM) + " mm");
    return HomeOutcome::success(lengthsMM);
}

// ============================================================================
// COMPOSITE (OTTER) HOMING
// ============================================================================

HomeOutcome HomingSequencer::otterHome(double safeXMM, unsigned long timeoutMs) {
    TimeUtils::Deadline deadline(timeoutMs);

    // 1. Clear axis 2 out of axis 1's way
    engine->info("🦦 Otter homing 1/4: jogging axis 2 to its motor end");
    if (ErrorCode jogged = m_executor.jog(OTTER_Y_AXIS, JogDirection::JOG_B, true, deadline.remainingMs());
        jogged != OK) {
        engine->error(std::string("❌ Otter homing: axis 2 jog failed: ") + errorCodeName(jogged));
        return HomeOutcome::failure(jogged);
    }

    // 2. Home axis 1
    engine->info("🦦 Otter homing 2/4: homing axis 1");
    HomeOutcome xHome = directHome(OTTER_X_AXIS, true, deadline.remainingMs());
    if (!xHome) return xHome;

    // 3. Axis 1 must be the expected length before anything else moves
    if (m_validator.check(OTTER_X_AXIS) != OK) {
        engine->error("❌ Otter homing: axis 1 is not the expected length");
        return HomeOutcome::failure(ERR_OTTER_AXIS1_LENGTH);
    }

    // 4. Park axis 1 where axis 2 can home
    engine->info("🦦 Otter homing 3/4: moving axis 1 to safe X " + TextUtils::fixed(safeXMM, 1) + " mm");
    MotionRequest park = MotionRequest::absolute({safeXMM}, {OTTER_X_AXIS}, true, deadline.remainingMs());
    if (ErrorCode parked = m_executor.goTo(park); parked != OK) {
        engine->error(std::string("❌ Otter homing: axis 1 park failed: ") + errorCodeName(parked));
        return HomeOutcome::failure(parked);
    }

    // 5. Home axis 2
    engine->info("🦦 Otter homing 4/4: homing axis 2");
    HomeOutcome yHome = directHome(OTTER_Y_AXIS, true, deadline.remainingMs());
    if (!yHome) return yHome;

    // 6. Stage-level homed flag from the full check
    if (m_validator.check(ALL_AXES) != OK) {
        engine->warn("⚠️ Otter homing finished but stage lengths did not check out");
    }

    return HomeOutcome::success({xHome.value().front(), yHome.value().front()});
}
