// ============================================================================
// BOUNDS GUARD - Implementation
// ============================================================================

#include "movement/BoundsGuard.h"

#include "core/MovementMath.h"
#include "core/UtilityEngine.h"

BoundsGuard::BoundsGuard(const StageConfig& config) : m_config(config) {}

ErrorCode BoundsGuard::check(const AxisRecord& axis, long targetSteps, long axisLengthSteps) const {
    using MovementMath::StepInterval;

    StepInterval travel = MovementMath::allowedTravel(axisLengthSteps, m_config.endBufferMM, m_config.stepsPerMM);
    StepInterval keepout = MovementMath::keepoutSteps(axis.keepout, m_config.stepsPerMM);

    if (MovementMath::isTargetAllowed(targetSteps, travel, keepout)) {
        return ErrorCode::OK;
    }

    std::string detail = "axis " + std::to_string(axis.index) + " target=" + std::to_string(targetSteps) +
                         " travel=[" + std::to_string(travel.lo) + ", " + std::to_string(travel.hi) + "]";
    if (!keepout.isEmpty()) {
        detail += " keepout=[" + std::to_string(keepout.lo) + ", " + std::to_string(keepout.hi) + "]";
    }
    engine->warn("🚫 Out of bounds: " + detail);
    return ErrorCode::ERR_OUT_OF_BOUNDS;
}
