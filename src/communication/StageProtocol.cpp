/**
 * StageProtocol.cpp - Command encoding and reply classification
 */

#include "communication/StageProtocol.h"

#include <cctype>
#include <charconv>

#include "core/UtilityEngine.h"

StageProtocol::StageProtocol(StageLink& link) : m_link(link) {}

// ============================================================================
// COMMAND TEXT
// ============================================================================

std::string StageProtocol::discoverCommand() {
    return "e";
}

std::string StageProtocol::lengthCommand(int axis) {
    return "l" + std::to_string(axis);
}

std::string StageProtocol::positionCommand(int axis) {
    return "r" + std::to_string(axis);
}

std::string StageProtocol::homeCommand(int axis) {
    return axis == ALL_AXES ? std::string("h") : "h" + std::to_string(axis);
}

std::string StageProtocol::jogCommand(int axis, JogDirection direction) {
    return "j" + std::to_string(axis) + static_cast<char>(direction);
}

std::string StageProtocol::gotoCommand(int axis, long targetSteps) {
    return "g" + std::to_string(axis) + std::to_string(targetSteps);
}

std::string StageProtocol::stopCommand(int axis) {
    return axis == ALL_AXES ? std::string("b") : "b" + std::to_string(axis);
}

std::optional<long> StageProtocol::parseNumber(const std::string& reply) {
    size_t first = 0;
    size_t last = reply.size();
    while (first < last && std::isspace(static_cast<unsigned char>(reply[first]))) first++;
    while (last > first && std::isspace(static_cast<unsigned char>(reply[last - 1]))) last--;
    if (first == last) return std::nullopt;

    long value = 0;
    const char* begin = reply.data() + first;
    const char* end = reply.data() + last;
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end) return std::nullopt;
    return value;
}

// ============================================================================
// READS
// ============================================================================

std::optional<long> StageProtocol::discoverAxes() {
    m_transactions++;
    std::string reply = m_link.transact(discoverCommand());
    auto mask = parseNumber(reply);
    if (!mask) {
        engine->warn("⚠️ Axis discovery reply is not a bitmask: '" + reply + "'");
    }
    return mask;
}

std::optional<long> StageProtocol::readLength(int axis) {
    return readValue(lengthCommand(axis));
}

std::optional<long> StageProtocol::readPosition(int axis) {
    return readValue(positionCommand(axis));
}

std::optional<long> StageProtocol::readValue(const std::string& command) {
    m_transactions++;
    try {
        return parseNumber(m_link.transact(command));
    } catch (const LinkError& e) {
        engine->error("❌ Link failure on '" + command + "': " + e.what());
        return std::nullopt;
    }
}

// ============================================================================
// COMMANDS
// ============================================================================

bool StageProtocol::home(int axis) {
    return sendCommand(homeCommand(axis));
}

bool StageProtocol::jog(int axis, JogDirection direction) {
    return sendCommand(jogCommand(axis, direction));
}

bool StageProtocol::moveTo(int axis, long targetSteps) {
    return sendCommand(gotoCommand(axis, targetSteps));
}

bool StageProtocol::stop(int axis) {
    return sendCommand(stopCommand(axis));
}

bool StageProtocol::sendCommand(const std::string& command) {
    m_transactions++;
    std::string reply;
    try {
        reply = m_link.transact(command);
    } catch (const LinkError& e) {
        engine->error("❌ Link failure on '" + command + "': " + e.what());
        return false;
    }

    if (!reply.empty()) {
        engine->warn("⚠️ Controller rejected '" + command + "': " + reply);
        return false;
    }
    return true;
}
