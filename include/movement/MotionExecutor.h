/**
 * ============================================================================
 * MotionExecutor.h - Jog, goto, move, position reads, home/jog waiting
 * ============================================================================
 *
 * goTo():
 *   1. every target converted to steps, every axis length read FRESH from
 *      hardware (homing may have changed it), BoundsGuard applied
 *   2. only if every axis passes: one goto command per axis
 *   3. blocking: SettleWaiter per axis, stopped-off-target → ERR_STALLED
 *   A whole-stage goto that ends OK re-asserts the homed flag.
 *
 * move():  fresh position read + offset → goTo() with absolute targets
 * jog():   direction-only run to a limit, one axis, waits via
 *          waitForHomeOrJog()
 *
 * Dependencies:
 * - StageProtocol (link access), AxisSet (records), LengthValidator
 * - BoundsGuard (pre-flight), MotionWaiters (polling)
 * ============================================================================
 */

#ifndef MOTION_EXECUTOR_H
#define MOTION_EXECUTOR_H

#include <optional>
#include <vector>

#include "communication/StageProtocol.h"
#include "core/Types.h"
#include "hardware/AxisSet.h"
#include "movement/BoundsGuard.h"
#include "movement/LengthValidator.h"

class MotionExecutor {
public:
    MotionExecutor(StageProtocol& protocol, AxisSet& axes, const StageConfig& config,
                   LengthValidator& validator);

    // ========================================================================
    // MOTION
    // ========================================================================

    /** Dispatch to goTo() or move() on request.relative */
    ErrorCode execute(const MotionRequest& request);

    /**
     * Absolute motion
     * @return OK, ERR_LIST_MISMATCH, ERR_INVALID_AXIS, ERR_REJECTED,
     *         ERR_OUT_OF_BOUNDS, ERR_TIMEOUT, ERR_STALLED
     */
    ErrorCode goTo(const MotionRequest& request);

    /**
     * Relative motion from freshly read positions
     * @return as goTo(); ERR_REJECTED if a position cannot be read
     */
    ErrorCode move(const MotionRequest& request);

    /**
     * Run one axis to a limit
     * @return OK, ERR_INVALID_AXIS, ERR_REJECTED, ERR_TIMEOUT
     */
    ErrorCode jog(int axis, JogDirection direction, bool block, unsigned long timeoutMs);

    // ========================================================================
    // STATE READS
    // ========================================================================

    /**
     * Positions in mm, one entry per requested axis
     * Absent / non-positive reads and unknown axes give std::nullopt.
     * Refreshes the cached position of every known axis.
     */
    std::vector<std::optional<double>> getPosition(const std::vector<int>& axes);

    /**
     * Block until the axis (or every axis) finished homing / jogging
     * @return Finished lengths in steps (axis order), or ERR_INVALID_AXIS /
     *         ERR_TIMEOUT (partial results discarded)
     */
    Outcome<std::vector<long>> waitForHomeOrJog(int axis, unsigned long timeoutMs);

private:
    /** Axes addressed by a request, or ERR_* on a malformed request */
    ErrorCode resolveRequest(const MotionRequest& request, std::vector<int>& axes) const;

    bool addressesWholeStage(const std::vector<int>& axes) const;

    StageProtocol& m_protocol;
    AxisSet& m_axes;
    const StageConfig& m_config;
    LengthValidator& m_validator;
    BoundsGuard m_guard;
};

#endif // MOTION_EXECUTOR_H
