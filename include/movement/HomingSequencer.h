/**
 * ============================================================================
 * HomingSequencer.h - Direct and composite (otter) homing
 * ============================================================================
 *
 * Direct homing: home-all or home-one command, then (blocking) wait for the
 * controller to report the measured length(s).
 *
 * Composite homing (StageVariant::STAGE_OTTER): axis 2's home is only well
 * defined once axis 1 is out of its way, so the order is a hard constraint:
 *
 *   1. jog axis 2 to its motor end (JOG_B)
 *   2. home axis 1
 *   3. check axis 1 length          → ERR_OTTER_AXIS1_LENGTH if wrong
 *   4. goto axis 1 to the safe X offset (ordinary BoundsGuard applies)
 *   5. home axis 2
 *   6. full-stage length check (side effect only)
 *
 * Any failing step ends the sequence with that step's code. Composite homing
 * always blocks and always covers the whole stage.
 * ============================================================================
 */

#ifndef HOMING_SEQUENCER_H
#define HOMING_SEQUENCER_H

#include <vector>

#include "communication/StageProtocol.h"
#include "core/Types.h"
#include "hardware/AxisSet.h"
#include "movement/LengthValidator.h"
#include "movement/MotionExecutor.h"

class HomingSequencer {
public:
    HomingSequencer(StageProtocol& protocol, AxisSet& axes, const StageConfig& config,
                    LengthValidator& validator, MotionExecutor& executor);

    /**
     * Home one axis or the whole stage
     * @param axis Axis index or ALL_AXES
     * @param block Wait for completion
     * @param timeoutMs Budget for the whole operation
     * @param enableComposite Use the composite sequence on an OTTER stage
     * @return Measured lengths in mm (empty when !block), or
     *         ERR_INVALID_AXIS, ERR_REJECTED, ERR_TIMEOUT, ERR_UNSUPPORTED,
     *         or any composite-sequence code
     */
    Outcome<std::vector<double>> home(int axis, bool block, unsigned long timeoutMs,
                                      bool enableComposite = true);

    /**
     * Composite otter homing (always blocking, whole stage)
     * @param safeXMM Axis 1 position from which axis 2 can home
     * @return [axis 1 length, axis 2 length] in mm, or the failing step's code
     */
    Outcome<std::vector<double>> otterHome(double safeXMM, unsigned long timeoutMs = OTTER_HOME_TIMEOUT_MS);

private:
    Outcome<std::vector<double>> directHome(int axis, bool block, unsigned long timeoutMs);

    StageProtocol& m_protocol;
    AxisSet& m_axes;
    const StageConfig& m_config;
    LengthValidator& m_validator;
    MotionExecutor& m_executor;
};

#endif // HOMING_SEQUENCER_H
