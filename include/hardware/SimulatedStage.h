// ============================================================================
// SIMULATED_STAGE.H - In-memory uStepper control box
// ============================================================================
// Answers the same command set as the real controller box so the whole
// motion stack can run without hardware (self-test executable, tests).
//
// Model per axis:
//   - Motion only advances when the axis is queried (l<n> / r<n>), by
//     stepsPerQuery each time. Polling therefore always converges and
//     the simulation is fully deterministic (no threads, no clock).
//   - Homing takes homingQueries length/position queries, then the axis is
//     homed at position 0 and reports its physical length.
//   - Length reads: negative while homing/jogging, 0 if never homed.
//   - Stop (b / b<n>) unpowers the axis: it stays where it is and must be
//     homed again before it accepts a goto.
// ============================================================================

#pragma once

#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "communication/StageLink.h"
#include "core/Types.h"

class SimulatedStage : public StageLink {
public:
    explicit SimulatedStage(const SimulatedStageConfig& config);

    std::string transact(const std::string& command) override;

    // ========================================================================
    // FAULT INJECTION
    // ========================================================================

    /** Every transaction throws LinkError while set */
    void setUnreachable(bool unreachable) { m_unreachable = unreachable; }

    /** The axis stops at this position (steps) whenever a goto crosses it */
    void setStall(int axis, long positionSteps);
    void clearStall(int axis);

    /** Change the physical length (steps) the axis reports after homing */
    void setPhysicalLength(int axis, long lengthSteps);

    // ========================================================================
    // INSPECTION
    // ========================================================================

    /** The last SIM_COMMAND_LOG_SIZE commands, oldest first */
    const std::deque<std::string>& commandLog() const { return m_commandLog; }
    void clearCommandLog() { m_commandLog.clear(); }

    /** Number of retained commands starting with prefix (e.g. "g", "h2") */
    size_t countCommands(const std::string& prefix) const;

    std::optional<long> positionSteps(int axis) const;
    bool isHomed(int axis) const;
    bool isPowered(int axis) const;
    bool isBusy(int axis) const;

private:
    enum class Activity {
        SIM_IDLE,
        SIM_HOMING,
        SIM_JOGGING,
        SIM_MOVING
    };

    struct Axis {
        long lengthSteps = 0;
        long positionSteps = 0;
        long targetSteps = 0;
        bool homed = false;
        bool powered = true;
        Activity activity = Activity::SIM_IDLE;
        unsigned homingLeft = 0;
        std::optional<long> stallSteps;
    };

    Axis* findAxis(int axis);
    const Axis* findAxis(int axis) const;

    /** Advance one query's worth of motion */
    void tick(Axis& axis);

    std::string handleLength(int axis);
    std::string handlePosition(int axis);
    std::string handleHome(int axis);
    std::string handleJog(int axis, char direction);
    std::string handleGoto(int axis, long targetSteps);
    std::string handleStop(int axis);

    void startHoming(Axis& axis);

    SimulatedStageConfig m_config;
    std::map<int, Axis> m_axes;
    std::deque<std::string> m_commandLog;
    bool m_unreachable = false;
};
