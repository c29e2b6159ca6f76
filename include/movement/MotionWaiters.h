/**
 * ============================================================================
 * MotionWaiters.h - Poll state machines for motion completion
 * ============================================================================
 *
 * The controller never reports completion on its own, so completion is
 * polled. Each waiter is a small state machine:
 *   poll() → one link read, one state transition, never sleeps
 *   runUntilFinished() → poll() + fixed sleep until DONE / TIMED_OUT
 *
 * The same waiter can therefore run from a cooperative scheduler (call
 * poll() from a loop) or block a dedicated thread (runUntilFinished()).
 *
 * HomeJogWaiter: an axis is finished once its length read is >= 0
 *                (negative / absent = still homing or jogging)
 * SettleWaiter:  an axis has stopped once two consecutive readable
 *                positions are equal
 * ============================================================================
 */

#ifndef MOTION_WAITERS_H
#define MOTION_WAITERS_H

#include <optional>
#include <vector>

#include "communication/StageProtocol.h"
#include "core/TimeUtils.h"
#include "hardware/AxisSet.h"

enum class WaitState {
    WAIT_PENDING,
    WAIT_DONE,
    WAIT_TIMED_OUT
};

// ============================================================================
// HOME / JOG COMPLETION
// ============================================================================

class HomeJogWaiter {
public:
    /**
     * @param axes Axes to wait for, finished in this order
     * @param deadline Budget shared by all axes
     */
    HomeJogWaiter(StageProtocol& protocol, AxisSet& axisSet, std::vector<int> axes,
                  TimeUtils::Deadline deadline);

    WaitState poll();

    WaitState state() const { return m_state; }

    /** Lengths (steps) of finished axes, in axis order */
    const std::vector<long>& lengthsSteps() const { return m_lengths; }

private:
    StageProtocol& m_protocol;
    AxisSet& m_axisSet;
    std::vector<int> m_axes;
    TimeUtils::Deadline m_deadline;
    size_t m_next = 0;
    std::vector<long> m_lengths;
    WaitState m_state = WaitState::WAIT_PENDING;
};

// ============================================================================
// GOTO SETTLING
// ============================================================================

class SettleWaiter {
public:
    SettleWaiter(StageProtocol& protocol, AxisRecord& axis, long targetSteps,
                 TimeUtils::Deadline deadline);

    WaitState poll();

    WaitState state() const { return m_state; }

    /** Position the axis stopped at (only once DONE) */
    std::optional<long> settledSteps() const { return m_settled; }

    bool reachedTarget() const { return m_settled && *m_settled == m_target; }

    long targetSteps() const { return m_target; }

private:
    StageProtocol& m_protocol;
    AxisRecord& m_axis;
    long m_target;
    TimeUtils::Deadline m_deadline;
    std::optional<long> m_previous;
    std::optional<long> m_settled;
    WaitState m_state = WaitState::WAIT_PENDING;
};

// ============================================================================
// BLOCKING RUNNER
// ============================================================================

/**
 * Poll until the waiter leaves WAIT_PENDING, sleeping between polls
 */
template <typename Waiter>
WaitState runUntilFinished(Waiter& waiter, unsigned long pollIntervalMs) {
    WaitState state = waiter.poll();
    while (state == WaitState::WAIT_PENDING) {
        TimeUtils::sleepMs(pollIntervalMs);
        state = waiter.poll();
    }
    return state;
}

#endif // MOTION_WAITERS_H
