/**
 * ============================================================================
 * LengthValidator.h - Measured vs expected axis length
 * ============================================================================
 *
 * check(axis | ALL_AXES):
 *   - reads each axis length from hardware and ALWAYS records it
 *   - absent / non-positive length → ERR_REJECTED (unknowable, homing needed)
 *   - outside [expected - tol, expected + tol] → ERR_LENGTH_INVALID
 *   - fail-fast: the first failing axis ends the check
 *
 * Only the ALL_AXES form drives the stage homed flag (true iff OK). A
 * single-axis check leaves it alone.
 * ============================================================================
 */

#ifndef LENGTH_VALIDATOR_H
#define LENGTH_VALIDATOR_H

#include "communication/StageProtocol.h"
#include "core/Types.h"
#include "hardware/AxisSet.h"

class LengthValidator {
public:
    LengthValidator(StageProtocol& protocol, AxisSet& axes, const StageConfig& config);

    /**
     * Check one axis or the whole stage
     * @param axis Axis index or ALL_AXES
     * @return OK, ERR_LENGTH_INVALID, ERR_REJECTED, ERR_INVALID_AXIS,
     *         or ERR_INTERNAL (ALL_AXES on a stage with no axes)
     */
    ErrorCode check(int axis);

private:
    ErrorCode checkAxis(AxisRecord& record);

    StageProtocol& m_protocol;
    AxisSet& m_axes;
    const StageConfig& m_config;
};

#endif // LENGTH_VALIDATOR_H
