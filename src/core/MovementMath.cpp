// ============================================================================
// MOVEMENT MATH - Implementation
// ============================================================================
// Pure math, no link, no globals. See MovementMath.h for declarations.
// ============================================================================

#include "core/MovementMath.h"

namespace MovementMath {

// ============================================================================
// INTERVALS
// ============================================================================

StepInterval allowedTravel(long axisLengthSteps, double endBufferMM, double stepsPerMM) {
    long buffer = mmToSteps(endBufferMM, stepsPerMM);
    return StepInterval{buffer, axisLengthSteps - buffer};
}

StepInterval keepoutSteps(const KeepoutZone& zone, double stepsPerMM) {
    if (zone.isEmpty()) return StepInterval{1, 0};
    return StepInterval{mmToSteps(zone.minMM, stepsPerMM), mmToSteps(zone.maxMM, stepsPerMM)};
}

StepInterval lengthTolerance(long expectedLengthSteps, double allowedDeviationMM, double stepsPerMM) {
    long tolerance = mmToSteps(allowedDeviationMM, stepsPerMM);
    return StepInterval{expectedLengthSteps - tolerance, expectedLengthSteps + tolerance};
}

bool isTargetAllowed(long targetSteps, const StepInterval& travel, const StepInterval& keepout) {
    if (!travel.contains(targetSteps)) return false;
    // An empty keepout contains nothing
    return !keepout.contains(targetSteps);
}

} // namespace MovementMath
