// ============================================================================
// MOVEMENT MATH - Pure, testable math functions for the stage controller
// ============================================================================
// Unit conversion between millimeters and microsteps, and the interval
// arithmetic shared by every motion primitive (end buffers, keepout zones,
// length tolerance).
//
// All functions are free (namespace-scoped), pure, and depend only on
// Types.h + <cmath>.  No link, no globals, no side effects.
//
// Rounding happens in exactly one place: mmToSteps(). Everything that
// compares positions does so in step space.
// ============================================================================

#pragma once

#include <cmath>
#include "core/Types.h"

namespace MovementMath {

// ============================================================================
// UNIT CONVERSIONS
// ============================================================================

/** Convert millimeters to microsteps, rounded to the nearest step */
inline long mmToSteps(double mm, double stepsPerMM) { return std::lround(mm * stepsPerMM); }

/** Convert microsteps to millimeters (not rounded) */
inline double stepsToMM(long steps, double stepsPerMM) { return static_cast<double>(steps) / stepsPerMM; }

// ============================================================================
// INTERVALS (step space)
// ============================================================================

/** Closed interval in steps. lo > hi means empty. */
struct StepInterval {
    long lo;
    long hi;

    constexpr bool contains(long steps) const { return steps >= lo && steps <= hi; }
    constexpr bool isEmpty() const { return lo > hi; }
};

/** Travel an axis of the given length may be commanded to: [buffer, length - buffer] */
StepInterval allowedTravel(long axisLengthSteps, double endBufferMM, double stepsPerMM);

/** Keepout zone converted at use time; empty interval when the zone is empty */
StepInterval keepoutSteps(const KeepoutZone& zone, double stepsPerMM);

/** Accepted measured lengths: [expected - tolerance, expected + tolerance] */
StepInterval lengthTolerance(long expectedLengthSteps, double allowedDeviationMM, double stepsPerMM);

/** True when target is inside the allowed travel and outside the keepout */
bool isTargetAllowed(long targetSteps, const StepInterval& travel, const StepInterval& keepout);

} // namespace MovementMath
