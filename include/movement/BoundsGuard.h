/**
 * BoundsGuard.h - Pre-flight target validation
 *
 * A target (steps) is accepted when
 *   endBuffer <= target <= axisLength - endBuffer
 * and it lies outside the axis keepout interval. The keepout is converted to
 * steps here, at use time, with the ratio in force. Same rule for every
 * motion primitive; nothing is sent to the controller from here.
 */

#pragma once

#include "core/Types.h"

class BoundsGuard {
public:
    explicit BoundsGuard(const StageConfig& config);

    /**
     * @param axis Record providing the keepout zone
     * @param targetSteps Requested absolute position
     * @param axisLengthSteps Length just read from hardware
     * @return OK or ERR_OUT_OF_BOUNDS
     */
    ErrorCode check(const AxisRecord& axis, long targetSteps, long axisLengthSteps) const;

private:
    const StageConfig& m_config;
};
