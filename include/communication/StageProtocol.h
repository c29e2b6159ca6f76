/**
 * StageProtocol.h - Command encoding and reply classification
 *
 * Wire commands (uStepper control box):
 *   e            discover axes     → decimal bitmask
 *   l<n>         axis length       → steps (negative while homing/jogging)
 *   r<n>         axis position     → steps
 *   h / h<n>     home all / one
 *   j<n><a|b>    jog to a limit
 *   g<n><steps>  goto absolute position
 *   b / b<n>     stop (unpower) all / one
 *
 * This is the lowest layer that can classify a LinkError, so it is caught
 * here: a failed command reads as "rejected", a failed read as "absent".
 * discoverAxes() is the exception and lets LinkError through, because
 * connect() must tell "unreachable" apart from "no axes".
 *
 * One protocol is shared by the blocking calls and estop(), so it keeps no
 * state besides an atomic counter. Serializing transact() calls is up to
 * the StageLink.
 */

#pragma once

#include <atomic>
#include <optional>
#include <string>

#include "communication/StageLink.h"
#include "core/Types.h"

class StageProtocol {
public:
    explicit StageProtocol(StageLink& link);

    // ========================================================================
    // COMMAND TEXT
    // ========================================================================

    static std::string discoverCommand();
    static std::string lengthCommand(int axis);
    static std::string positionCommand(int axis);
    static std::string homeCommand(int axis);               // ALL_AXES → "h"
    static std::string jogCommand(int axis, JogDirection direction);
    static std::string gotoCommand(int axis, long targetSteps);
    static std::string stopCommand(int axis);               // ALL_AXES → "b"

    /**
     * Parse a numeric reply
     * @return Value, or nullopt for empty / non-numeric text
     */
    static std::optional<long> parseNumber(const std::string& reply);

    // ========================================================================
    // READS
    // ========================================================================

    /**
     * Read the axis presence bitmask
     * @return Bitmask, or nullopt if the reply was not a number
     * @throws LinkError if the controller is unreachable
     */
    std::optional<long> discoverAxes();

    /** Measured axis length in steps; absent on link failure or garbage */
    std::optional<long> readLength(int axis);

    /** Axis position in steps; absent on link failure or garbage */
    std::optional<long> readPosition(int axis);

    // ========================================================================
    // COMMANDS (true = acknowledged)
    // ========================================================================

    bool home(int axis);
    bool jog(int axis, JogDirection direction);
    bool moveTo(int axis, long targetSteps);
    bool stop(int axis);

    /** Number of transactions attempted through this protocol */
    unsigned long transactionCount() const { return m_transactions.load(); }

private:
    bool sendCommand(const std::string& command);
    std::optional<long> readValue(const std::string& command);

    StageLink& m_link;
    std::atomic<unsigned long> m_transactions{0};
};
