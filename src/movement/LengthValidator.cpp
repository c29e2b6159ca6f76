// ============================================================================
// LENGTH VALIDATOR - Implementation
// ============================================================================

#include "movement/LengthValidator.h"

#include "core/MovementMath.h"
#include "core/TextUtils.h"
#include "core/UtilityEngine.h"

LengthValidator::LengthValidator(StageProtocol& protocol, AxisSet& axes, const StageConfig& config) :
    m_protocol(protocol),
    m_axes(axes),
    m_config(config) {}

ErrorCode LengthValidator::check(int axis) {
    std::vector<int> toCheck = m_axes.resolve(axis);
    if (axis != ALL_AXES && toCheck.empty()) {
        engine->warn("⚠️ Length check: invalid axis " + std::to_string(axis));
        return ErrorCode::ERR_INVALID_AXIS;
    }

    ErrorCode result = ErrorCode::ERR_INTERNAL;
    for (int ax : toCheck) {
        result = checkAxis(*m_axes.find(ax));
        if (result != ErrorCode::OK) break;
    }

    if (axis == ALL_AXES) {
        m_axes.setHomed(result == ErrorCode::OK);
    }

    engine->debug("📏 Length check (" + (axis == ALL_AXES ? std::string("all") : std::to_string(axis)) +
                  ") → " + lengthCheckName(result));
    return result;
}

ErrorCode LengthValidator::checkAxis(AxisRecord& record) {
    std::optional<long> measured = m_protocol.readLength(record.index);
    record.measuredLengthSteps = measured;

    if (!measured || *measured <= 0) {
        engine->info("📏 Axis " + std::to_string(record.index) + " length unknown (" +
                     TextUtils::orNone(measured) + "): homing required");
        return ErrorCode::ERR_REJECTED;
    }

    if (!record.expectedLengthSteps) {
        engine->warn("⚠️ Axis " + std::to_string(record.index) + " has no configured expected length");
        return ErrorCode::ERR_LENGTH_INVALID;
    }

    MovementMath::StepInterval accepted = MovementMath::lengthTolerance(
        *record.expectedLengthSteps, m_config.allowedLengthDeviationMM, m_config.stepsPerMM);

    if (!accepted.contains(*measured)) {
        engine->warn("⚠️ Axis " + std::to_string(record.index) + " length " + std::to_string(*measured) +
                     " is not on [" + std::to_string(accepted.lo) + ", " + std::to_string(accepted.hi) + "]");
        return ErrorCode::ERR_LENGTH_INVALID;
    }
    return ErrorCode::OK;
}
