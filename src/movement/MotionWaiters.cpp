// ============================================================================
// MOTION WAITERS - Implementation
// ============================================================================

#include "movement/MotionWaiters.h"

#include <utility>

#include "core/UtilityEngine.h"

// ============================================================================
// HOME / JOG COMPLETION
// ============================================================================

HomeJogWaiter::HomeJogWaiter(StageProtocol& protocol, AxisSet& axisSet, std::vector<int> axes,
                             TimeUtils::Deadline deadline) :
    m_protocol(protocol),
    m_axisSet(axisSet),
    m_axes(std::move(axes)),
    m_deadline(deadline) {
    if (m_axes.empty()) m_state = WaitState::WAIT_DONE;
}

WaitState HomeJogWaiter::poll() {
    if (m_state != WaitState::WAIT_PENDING) return m_state;

    if (m_deadline.expired()) {
        engine->warn("⏱️ Timed out waiting for axis " + std::to_string(m_axes[m_next]) +
                     " to finish homing/jogging (" + std::to_string(m_deadline.budgetMs()) + " ms)");
        m_state = WaitState::WAIT_TIMED_OUT;
        return m_state;
    }

    int axis = m_axes[m_next];
    std::optional<long> length = m_protocol.readLength(axis);
    if (!length || *length < 0) return m_state;

    m_lengths.push_back(*length);
    if (AxisRecord* record = m_axisSet.find(axis)) {
        record->currentPositionSteps = m_protocol.readPosition(axis);
    }
    engine->debug("✓ Axis " + std::to_string(axis) + " finished, length=" + std::to_string(*length));

    m_next++;
    if (m_next >= m_axes.size()) {
        m_state = WaitState::WAIT_DONE;
    }
    return m_state;
}

// ============================================================================
// GOTO SETTLING
// ============================================================================

SettleWaiter::SettleWaiter(StageProtocol& protocol, AxisRecord& axis, long targetSteps,
                           TimeUtils::Deadline deadline) :
    m_protocol(protocol),
    m_axis(axis),
    m_target(targetSteps),
    m_deadline(deadline) {}

WaitState SettleWaiter::poll() {
    if (m_state != WaitState::WAIT_PENDING) return m_state;

    if (m_deadline.expired()) {
        engine->warn("⏱️ Timed out waiting for axis " + std::to_string(m_axis.index) + " to stop");
        m_state = WaitState::WAIT_TIMED_OUT;
        return m_state;
    }

    std::optional<long> position = m_protocol.readPosition(m_axis.index);

    // An unreadable position restarts the two-read window
    if (position && m_previous && *position == *m_previous) {
        m_settled = position;
        m_axis.currentPositionSteps = position;
        m_state = WaitState::WAIT_DONE;
        return m_state;
    }

    m_previous = position;
    return m_state;
}
