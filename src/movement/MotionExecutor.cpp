// ============================================================================
// MOTION EXECUTOR - Implementation
// ============================================================================

#include "movement/MotionExecutor.h"

#include <algorithm>

#include "core/MovementMath.h"
#include "core/TextUtils.h"
#include "core/TimeUtils.h"
#include "core/UtilityEngine.h"
#include "movement/MotionWaiters.h"

MotionExecutor::MotionExecutor(StageProtocol& protocol, AxisSet& axes, const StageConfig& config,
                               LengthValidator& validator) :
    m_protocol(protocol),
    m_axes(axes),
    m_config(config),
    m_validator(validator),
    m_guard(config) {}

// ============================================================================
// REQUEST HELPERS
// ============================================================================

ErrorCode MotionExecutor::resolveRequest(const MotionRequest& request, std::vector<int>& axes) const {
    axes = request.allAxes ? m_axes.indices() : request.axes;

    if (request.valuesMM.size() != axes.size()) {
        engine->error("❌ " + std::to_string(request.valuesMM.size()) + " values given for " +
                      std::to_string(axes.size()) + " axes");
        return ErrorCode::ERR_LIST_MISMATCH;
    }
    if (axes.empty()) {
        engine->warn("⚠️ Motion request addresses no axis");
        return ErrorCode::ERR_INVALID_AXIS;
    }
    for (int axis : axes) {
        if (!m_axes.contains(axis)) {
            engine->warn("⚠️ Motion request: invalid axis " + std::to_string(axis));
            return ErrorCode::ERR_INVALID_AXIS;
        }
    }
    return ErrorCode::OK;
}

bool MotionExecutor::addressesWholeStage(const std::vector<int>& axes) const {
    if (m_axes.empty()) return false;
    for (int axis : m_axes.indices()) {
        if (std::find(axes.begin(), axes.end(), axis) == axes.end()) return false;
    }
    return true;
}

// ============================================================================
// MOTION
// ============================================================================

ErrorCode MotionExecutor::execute(const MotionRequest& request) {
    return request.relative ? move(request) : goTo(request);
}

ErrorCode MotionExecutor::goTo(const MotionRequest& request) {
    TimeUtils::Deadline deadline(request.timeoutMs);

    std::vector<int> axes;
    if (auto code = resolveRequest(request, axes); code != ErrorCode::OK) {
        return code;
    }

    // ── Pre-flight: every axis validated before anything moves ──
    std::vector<long> targets(axes.size());
    for (size_t i = 0; i < axes.size(); i++) {
        targets[i] = MovementMath::mmToSteps(request.valuesMM[i], m_config.stepsPerMM);

        std::optional<long> length = m_protocol.readLength(axes[i]);
        if (!length || *length <= 0) {
            engine->warn("⚠️ Goto refused: axis " + std::to_string(axes[i]) + " length unknown (" +
                         TextUtils::orNone(length) + "), stage needs homing");
            m_axes.setHomed(false);
            return ErrorCode::ERR_REJECTED;
        }

        if (m_guard.check(*m_axes.find(axes[i]), targets[i], *length) != ErrorCode::OK) {
            return ErrorCode::ERR_OUT_OF_BOUNDS;
        }
    }

    // ── Issue ──
    for (size_t i = 0; i < axes.size(); i++) {
        if (!m_protocol.moveTo(axes[i], targets[i])) {
            return ErrorCode::ERR_REJECTED;
        }
    }
    engine->debug("➡️ Goto " + TextUtils::list(request.valuesMM) + " mm on axes " + TextUtils::list(axes));

    ErrorCode result = ErrorCode::OK;

    // ── Settle ──
    if (request.block) {
        for (size_t i = 0; i < axes.size(); i++) {
            SettleWaiter waiter(m_protocol, *m_axes.find(axes[i]), targets[i], deadline);
            if (runUntilFinished(waiter, m_config.settleIntervalMs) == WaitState::WAIT_TIMED_OUT) {
                return ErrorCode::ERR_TIMEOUT;
            }
            if (!waiter.reachedTarget()) {
                engine->error("❌ Goto axis " + std::to_string(axes[i]) + " wanted " +
                              TextUtils::fixed(MovementMath::stepsToMM(targets[i], m_config.stepsPerMM), 3) +
                              " mm, got " +
                              TextUtils::fixed(MovementMath::stepsToMM(*waiter.settledSteps(), m_config.stepsPerMM), 3) +
                              " mm (stall?)");
                // Stall is sticky, remaining axes are still settled
                result = ErrorCode::ERR_STALLED;
            }
        }
    }

    if (result == ErrorCode::OK && addressesWholeStage(axes)) {
        m_axes.setHomed(true);
    }
    return result;
}

ErrorCode MotionExecutor::move(const MotionRequest& request) {
    TimeUtils::Deadline deadline(request.timeoutMs);

    std::vector<int> axes;
    if (auto code = resolveRequest(request, axes); code != ErrorCode::OK) {
        return code;
    }

    std::vector<double> targetsMM(axes.size());
    for (size_t i = 0; i < axes.size(); i++) {
        std::optional<long> here = m_protocol.readPosition(axes[i]);
        if (!here || *here <= 0) {
            engine->warn("⚠️ Move refused: axis " + std::to_string(axes[i]) + " position unknown (" +
                         TextUtils::orNone(here) + ")");
            return ErrorCode::ERR_REJECTED;
        }
        targetsMM[i] = MovementMath::stepsToMM(*here, m_config.stepsPerMM) + request.valuesMM[i];
    }

    MotionRequest absolute = MotionRequest::absolute(targetsMM, axes, request.block, deadline.remainingMs());
    return goTo(absolute);
}

ErrorCode MotionExecutor::jog(int axis, JogDirection direction, bool block, unsigned long timeoutMs) {
    TimeUtils::Deadline deadline(timeoutMs);

    if (!m_axes.contains(axis)) {
        engine->warn("⚠️ Jog: invalid axis " + std::to_string(axis));
        return ErrorCode::ERR_INVALID_AXIS;
    }

    if (!m_protocol.jog(axis, direction)) {
        return ErrorCode::ERR_REJECTED;
    }
    engine->debug("↔️ Jogging axis " + std::to_string(axis) + " toward " + static_cast<char>(direction));

    if (!block) return ErrorCode::OK;

    return waitForHomeOrJog(axis, deadline.remainingMs()).code();
}

// ============================================================================
// STATE READS
// ============================================================================

std::vector<std::optional<double>> MotionExecutor::getPosition(const std::vector<int>& axes) {
    std::vector<std::optional<double>> positions;
    positions.reserve(axes.size());

    for (int axis : axes) {
        AxisRecord* record = m_axes.find(axis);
        if (!record) {
            engine->warn("⚠️ Position read: invalid axis " + std::to_string(axis));
            positions.emplace_back(std::nullopt);
            continue;
        }

        std::optional<long> steps = m_protocol.readPosition(axis);
        if (steps && *steps > 0) {
            record->currentPositionSteps = steps;
            positions.emplace_back(MovementMath::stepsToMM(*steps, m_config.stepsPerMM));
        } else {
            record->currentPositionSteps = std::nullopt;
            positions.emplace_back(std::nullopt);
        }
    }
    return positions;
}

Outcome<std::vector<long>> MotionExecutor::waitForHomeOrJog(int axis, unsigned long timeoutMs) {
    std::vector<int> toWaitFor = m_axes.resolve(axis);
    if (axis != ALL_AXES && toWaitFor.empty()) {
        engine->warn("⚠️ Wait: invalid axis " + std::to_string(axis));
        return Outcome<std::vector<long>>::failure(ErrorCode::ERR_INVALID_AXIS);
    }
    if (toWaitFor.empty()) {
        engine->error("❌ Wait: no axes discovered");
        return Outcome<std::vector<long>>::failure(ErrorCode::ERR_INTERNAL);
    }

    HomeJogWaiter waiter(m_protocol, m_axes, toWaitFor, TimeUtils::Deadline(timeoutMs));
    WaitState state = runUntilFinished(waiter, m_config.pollIntervalMs);

    if (axis == ALL_AXES) {
        if (m_validator.check(ALL_AXES) != ErrorCode::OK) {
            engine->warn("⚠️ Stage lengths did not check out after waiting");
        }
    } else if (state == WaitState::WAIT_DONE) {
        // Records the fresh length; homed flag untouched for one axis
        if (m_validator.check(axis) != ErrorCode::OK) {
            engine->warn("⚠️ Axis " + std::to_string(axis) + " length did not check out after waiting");
        }
    }

    if (state != WaitState::WAIT_DONE) {
        return Outcome<std::vector<long>>::failure(ErrorCode::ERR_TIMEOUT);
    }
    return Outcome<std::vector<long>>::success(waiter.lengthsSteps());
}
