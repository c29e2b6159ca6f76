// ============================================================================
// SIMULATED_STAGE.CPP - In-memory uStepper control box
// ============================================================================

#include "hardware/SimulatedStage.h"

#include <algorithm>

#include "communication/StageProtocol.h"
#include "core/MovementMath.h"
#include "core/UtilityEngine.h"

namespace {
const char* REPLY_BUSY = "busy";
const char* REPLY_NOT_HOMED = "not homed";
const char* REPLY_UNKNOWN_AXIS = "unknown axis";
const char* REPLY_UNKNOWN_COMMAND = "unknown command";

/** Move `from` toward `to` by at most `step` */
long approach(long from, long to, long step) {
    if (from < to) return std::min(from + step, to);
    if (from > to) return std::max(from - step, to);
    return from;
}
}

// ============================================================================
// CONSTRUCTION
// ============================================================================

SimulatedStage::SimulatedStage(const SimulatedStageConfig& config) :
    m_config(config) {
    if (m_config.stepsPerQuery <= 0) m_config.stepsPerQuery = 1;

    size_t slot = 0;
    for (int bit = 0; bit < MAX_AXES; bit++) {
        if (!((m_config.axesMask >> bit) & 1)) continue;

        double lengthMM = slot < m_config.lengthsMM.size() ? m_config.lengthsMM[slot] : SIM_DEFAULT_LENGTH_MM;
        slot++;

        Axis axis;
        axis.lengthSteps = MovementMath::mmToSteps(lengthMM, m_config.stepsPerMM);
        if (m_config.startHomed) {
            axis.homed = true;
            axis.positionSteps = axis.lengthSteps / 2;
        }
        m_axes[bit + 1] = axis;
    }

    engine->info("🧪 Simulated stage: " + std::to_string(m_axes.size()) + " axes (mask " +
                 std::to_string(m_config.axesMask) + ")" + (m_config.startHomed ? ", homed" : ""));
}

// ============================================================================
// TRANSACTION
// ============================================================================

std::string SimulatedStage::transact(const std::string& command) {
    m_commandLog.push_back(command);
    while (m_commandLog.size() > SIM_COMMAND_LOG_SIZE) {
        m_commandLog.pop_front();
    }

    if (m_unreachable) {
        throw LinkError("simulated controller unreachable");
    }
    if (command.empty()) return REPLY_UNKNOWN_COMMAND;

    const char op = command[0];
    const std::string args = command.substr(1);

    switch (op) {
        case 'e':
            return std::to_string(m_config.axesMask);

        case 'l':
        case 'r': {
            auto axis = StageProtocol::parseNumber(args);
            if (!axis) return REPLY_UNKNOWN_COMMAND;
            return op == 'l' ? handleLength(static_cast<int>(*axis)) : handlePosition(static_cast<int>(*axis));
        }

        case 'h':
        case 'b': {
            int axis = ALL_AXES;
            if (!args.empty()) {
                auto parsed = StageProtocol::parseNumber(args);
                if (!parsed) return REPLY_UNKNOWN_COMMAND;
                axis = static_cast<int>(*parsed);
            }
            return op == 'h' ? handleHome(axis) : handleStop(axis);
        }

        case 'j':
            if (args.size() != 2) return REPLY_UNKNOWN_COMMAND;
            return handleJog(args[0] - '0', args[1]);

        case 'g': {
            if (args.size() < 2) return REPLY_UNKNOWN_COMMAND;
            auto target = StageProtocol::parseNumber(args.substr(1));
            if (!target) return REPLY_UNKNOWN_COMMAND;
            return handleGoto(args[0] - '0', *target);
        }

        default:
            return REPLY_UNKNOWN_COMMAND;
    }
}

// ============================================================================
// MOTION MODEL
// ============================================================================

void SimulatedStage::tick(Axis& axis) {
    switch (axis.activity) {
        case Activity::SIM_IDLE:
            break;

        case Activity::SIM_HOMING:
            if (axis.homingLeft > 0) axis.homingLeft--;
            if (axis.homingLeft == 0) {
                axis.positionSteps = 0;
                axis.homed = true;
                axis.activity = Activity::SIM_IDLE;
            }
            break;

        case Activity::SIM_JOGGING:
            axis.positionSteps = approach(axis.positionSteps, axis.targetSteps, m_config.stepsPerQuery);
            if (axis.positionSteps == axis.targetSteps) axis.activity = Activity::SIM_IDLE;
            break;

        case Activity::SIM_MOVING: {
            long next = approach(axis.positionSteps, axis.targetSteps, m_config.stepsPerQuery);
            if (axis.stallSteps) {
                long stall = *axis.stallSteps;
                bool crosses = (axis.positionSteps < stall && next >= stall) ||
                               (axis.positionSteps > stall && next <= stall);
                if (crosses) {
                    axis.positionSteps = stall;
                    axis.activity = Activity::SIM_IDLE;
                    break;
                }
            }
            axis.positionSteps = next;
            if (axis.positionSteps == axis.targetSteps) axis.activity = Activity::SIM_IDLE;
            break;
        }
    }
}

void SimulatedStage::startHoming(Axis& axis) {
    axis.powered = true;
    axis.homed = false;
    axis.homingLeft = std::max(1u, m_config.homingQueries);
    axis.activity = Activity::SIM_HOMING;
}

// ============================================================================
// COMMAND HANDLERS
// ============================================================================

std::string SimulatedStage::handleLength(int axisIndex) {
    Axis* axis = findAxis(axisIndex);
    if (!axis) return REPLY_UNKNOWN_AXIS;

    tick(*axis);
    if (axis->activity == Activity::SIM_HOMING || axis->activity == Activity::SIM_JOGGING) {
        return "-1";
    }
    return std::to_string(axis->homed ? axis->lengthSteps : 0);
}

std::string SimulatedStage::handlePosition(int axisIndex) {
    Axis* axis = findAxis(axisIndex);
    if (!axis) return REPLY_UNKNOWN_AXIS;

    tick(*axis);
    return std::to_string(axis->positionSteps);
}

std::string SimulatedStage::handleHome(int axisIndex) {
    if (axisIndex == ALL_AXES) {
        for (const auto& [index, axis] : m_axes) {
            if (axis.activity != Activity::SIM_IDLE) return REPLY_BUSY;
        }
        for (auto& [index, axis] : m_axes) {
            startHoming(axis);
        }
        return "";
    }

    Axis* axis = findAxis(axisIndex);
    if (!axis) return REPLY_UNKNOWN_AXIS;
    if (axis->activity != Activity::SIM_IDLE) return REPLY_BUSY;

    startHoming(*axis);
    return "";
}

std::string SimulatedStage::handleJog(int axisIndex, char direction) {
    Axis* axis = findAxis(axisIndex);
    if (!axis) return REPLY_UNKNOWN_AXIS;
    if (direction != 'a' && direction != 'b') return REPLY_UNKNOWN_COMMAND;
    if (axis->activity != Activity::SIM_IDLE) return REPLY_BUSY;

    axis->powered = true;
    axis->targetSteps = direction == 'a' ? 0 : axis->lengthSteps;
    axis->activity = Activity::SIM_JOGGING;
    return "";
}

std::string SimulatedStage::handleGoto(int axisIndex, long targetSteps) {
    Axis* axis = findAxis(axisIndex);
    if (!axis) return REPLY_UNKNOWN_AXIS;
    if (axis->activity == Activity::SIM_HOMING || axis->activity == Activity::SIM_JOGGING) return REPLY_BUSY;
    if (!axis->homed) return REPLY_NOT_HOMED;

    axis->powered = true;
    axis->targetSteps = std::clamp(targetSteps, 0L, axis->lengthSteps);
    axis->activity = Activity::SIM_MOVING;
    return "";
}

std::string SimulatedStage::handleStop(int axisIndex) {
    auto unpower = [](Axis& axis) {
        axis.activity = Activity::SIM_IDLE;
        axis.powered = false;
        axis.homed = false;
    };

    if (axisIndex == ALL_AXES) {
        for (auto& [index, axis] : m_axes) unpower(axis);
        return "";
    }

    Axis* axis = findAxis(axisIndex);
    if (!axis) return REPLY_UNKNOWN_AXIS;
    unpower(*axis);
    return "";
}

// ============================================================================
// FAULT INJECTION / INSPECTION
// ============================================================================

void SimulatedStage::setStall(int axis, long positionSteps) {
    if (Axis* a = findAxis(axis)) a->stallSteps = positionSteps;
}

void SimulatedStage::clearStall(int axis) {
    if (Axis* a = findAxis(axis)) a->stallSteps.reset();
}

void SimulatedStage::setPhysicalLength(int axis, long lengthSteps) {
    if (Axis* a = findAxis(axis)) a->lengthSteps = lengthSteps;
}

size_t SimulatedStage::countCommands(const std::string& prefix) const {
    return static_cast<size_t>(std::count_if(m_commandLog.begin(), m_commandLog.end(),
                                             [&prefix](const std::string& c) { return c.rfind(prefix, 0) == 0; }));
}

std::optional<long> SimulatedStage::positionSteps(int axis) const {
    const Axis* a = findAxis(axis);
    if (!a) return std::nullopt;
    return a->positionSteps;
}

bool SimulatedStage::isHomed(int axis) const {
    const Axis* a = findAxis(axis);
    return a && a->homed;
}

bool SimulatedStage::isPowered(int axis) const {
    const Axis* a = findAxis(axis);
    return a && a->powered;
}

bool SimulatedStage::isBusy(int axis) const {
    const Axis* a = findAxis(axis);
    return a && a->activity != Activity::SIM_IDLE;
}

SimulatedStage::Axis* SimulatedStage::findAxis(int axis) {
    auto it = m_axes.find(axis);
    return it == m_axes.end() ? nullptr : &it->second;
}

const SimulatedStage::Axis* SimulatedStage::findAxis(int axis) const {
    auto it = m_axes.find(axis);
    return it == m_axes.end() ? nullptr : &it->second;
}
