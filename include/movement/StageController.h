/**
 * ============================================================================
 * StageController.h - Public motion service for the measurement orchestrator
 * ============================================================================
 *
 * One instance per controller session:
 *   connect() → discover axes, read positions, full-stage length check
 *   home / jog / goTo / move / getPosition / estop / checkLengths
 *   close()   → forget every axis
 *
 * Every operation returns an ErrorCode (or Outcome<T>) instead of throwing;
 * the orchestrator decides from the code whether to retry, log, or abort.
 *
 * CALLER DISCIPLINE: the controller does not lock. The caller holds an
 * exclusive lease on it (and on the link) for the duration of each call;
 * the one exception is estop(), which may be issued from another thread
 * while a blocking call is outstanding. estop() only reads the axis list and
 * goes through the shared protocol, so the link must accept transact()
 * calls from two threads (one at a time on the wire).
 * ============================================================================
 */

#ifndef STAGE_CONTROLLER_H
#define STAGE_CONTROLLER_H

#include <optional>
#include <vector>

#include "communication/StageLink.h"
#include "communication/StageProtocol.h"
#include "core/Types.h"
#include "hardware/AxisSet.h"
#include "movement/EstopHandler.h"
#include "movement/HomingSequencer.h"
#include "movement/LengthValidator.h"
#include "movement/MotionExecutor.h"

class StageController {
public:
    StageController(StageLink& link, StageConfig config);
    ~StageController();

    StageController(const StageController&) = delete;
    StageController& operator=(const StageController&) = delete;

    // ========================================================================
    // SESSION
    // ========================================================================

    /**
     * Discover axes and check the stage
     * Succeeds even when the stage is not homed (check isHomed()) or when
     * the configured axis count differs (check hasConfigMismatch()).
     * @return OK, or ERR_TIMEOUT if the controller could not be reached
     */
    ErrorCode connect();

    /** End the session; axis records are discarded */
    void close();

    bool isConnected() const { return m_connected; }

    // ========================================================================
    // HOMING
    // ========================================================================

    /**
     * @return Measured lengths in mm (empty for a non-blocking home)
     */
    Outcome<std::vector<double>> home(int axis = ALL_AXES, bool block = true,
                                      unsigned long timeoutMs = HOME_TIMEOUT_MS);

    /**
     * Composite otter homing with an explicit safe X offset
     */
    Outcome<std::vector<double>> otterHome(double safeXMM, unsigned long timeoutMs = OTTER_HOME_TIMEOUT_MS);

    /**
     * Block until homing/jogging finished
     * @return Measured lengths in mm, axis order
     */
    Outcome<std::vector<double>> waitForHomeOrJog(int axis = ALL_AXES,
                                                  unsigned long timeoutMs = WAIT_TIMEOUT_MS);

    // ========================================================================
    // MOTION
    // ========================================================================

    ErrorCode jog(int axis, JogDirection direction = JogDirection::JOG_B, bool block = true,
                  unsigned long timeoutMs = JOG_TIMEOUT_MS);

    /** Absolute targets (mm) for the listed axes */
    ErrorCode goTo(const std::vector<double>& targetsMM, const std::vector<int>& axes,
                   bool block = true, unsigned long timeoutMs = MOTION_TIMEOUT_MS);

    /** Absolute targets (mm), one per discovered axis */
    ErrorCode goToAll(const std::vector<double>& targetsMM, bool block = true,
                      unsigned long timeoutMs = MOTION_TIMEOUT_MS);

    /** Relative offsets (mm) for the listed axes */
    ErrorCode move(const std::vector<double>& deltasMM, const std::vector<int>& axes,
                   bool block = true, unsigned long timeoutMs = MOTION_TIMEOUT_MS);

    /** Relative offsets (mm), one per discovered axis */
    ErrorCode moveAll(const std::vector<double>& deltasMM, bool block = true,
                      unsigned long timeoutMs = MOTION_TIMEOUT_MS);

    /** Run a prepared MotionRequest */
    ErrorCode execute(const MotionRequest& request);

    ErrorCode estop(const std::vector<int>& axes);
    ErrorCode estopAll();

    // ========================================================================
    // STATE
    // ========================================================================

    std::vector<std::optional<double>> getPosition(const std::vector<int>& axes);
    std::vector<std::optional<double>> getPositionAll();

    ErrorCode checkLengths(int axis = ALL_AXES);

    bool isHomed() const { return m_axes.isHomed(); }
    bool hasConfigMismatch() const { return m_axes.hasConfigMismatch(); }

    std::vector<int> axisIndices() const { return m_axes.indices(); }
    size_t axisCount() const { return m_axes.size(); }
    const AxisSet& axes() const { return m_axes; }

    /** Last measured lengths (mm), nullopt where unknown */
    std::vector<std::optional<double>> measuredLengthsMM() const;

    /** Last read positions (mm), nullopt where unknown */
    std::vector<std::optional<double>> cachedPositionsMM() const;

    const StageConfig& config() const { return m_config; }

private:
    std::optional<double> toMM(const std::optional<long>& steps) const;

    // Declaration order matters: later members hold references to earlier ones
    StageConfig m_config;
    StageProtocol m_protocol;
    AxisSet m_axes;
    LengthValidator m_validator;
    MotionExecutor m_executor;
    HomingSequencer m_homing;
    EstopHandler m_estop;
    bool m_connected = false;
};

#endif // STAGE_CONTROLLER_H
