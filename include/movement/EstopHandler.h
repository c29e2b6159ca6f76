/**
 * EstopHandler.h - Emergency stop (unpowers the motors)
 *
 * Whole stage addressed → one stage-wide stop command.
 * Subset addressed      → one stop per axis, folded stickily: the first
 *                         failure is kept even if later axes acknowledge.
 *
 * Valid axes are always stopped, even when the list also names unknown ones.
 */

#pragma once

#include <vector>

#include "communication/StageProtocol.h"
#include "core/Types.h"
#include "hardware/AxisSet.h"

class EstopHandler {
public:
    EstopHandler(StageProtocol& protocol, const AxisSet& axes);

    /** Stop every discovered axis */
    ErrorCode estopAll();

    /**
     * Stop the listed axes
     * @return OK, ERR_REJECTED, or ERR_INVALID_AXIS (unknown axis / empty list)
     */
    ErrorCode estop(const std::vector<int>& axes);

    /** Sticky fold step: an earlier failure is never overwritten */
    static ErrorCode foldSticky(ErrorCode accumulated, ErrorCode next);

private:
    StageProtocol& m_protocol;
    const AxisSet& m_axes;
};
