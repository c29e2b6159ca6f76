// ============================================================================
// AXIS_SET.CPP - Axis discovery and per-axis records
// ============================================================================

#include "hardware/AxisSet.h"

#include "core/UtilityEngine.h"

// ============================================================================
// SESSION LIFECYCLE
// ============================================================================

size_t AxisSet::discover(long presenceMask) {
    clear();

    for (int bit = 0; bit < MAX_AXES; bit++) {
        if ((presenceMask >> bit) & 1) {
            m_records.emplace_back(bit + 1);
        }
    }

    if (engine->isDebugEnabled()) {
        engine->debug("🔍 Presence mask " + std::to_string(presenceMask) + " → " +
                      std::to_string(m_records.size()) + " axes");
    }
    return m_records.size();
}

void AxisSet::clear() {
    m_records.clear();
    m_homed = false;
    m_configMismatch = false;
    m_configured = false;
}

bool AxisSet::assignConfiguration(const std::vector<long>& expectedLengthsSteps,
                                  const std::vector<KeepoutZone>& keepouts) {
    if (m_configured) {
        engine->error("❌ Axis configuration already assigned for this session");
        return false;
    }
    m_configured = true;

    for (size_t i = 0; i < m_records.size(); i++) {
        if (i < expectedLengthsSteps.size()) {
            m_records[i].expectedLengthSteps = expectedLengthsSteps[i];
        }
        if (i < keepouts.size()) {
            m_records[i].keepout = keepouts[i];
        }
    }

    m_configMismatch = (expectedLengthsSteps.size() != m_records.size());
    return !m_configMismatch;
}

// ============================================================================
// LOOKUP
// ============================================================================

bool AxisSet::contains(int axis) const {
    return find(axis) != nullptr;
}

AxisRecord* AxisSet::find(int axis) {
    for (auto& record : m_records) {
        if (record.index == axis) return &record;
    }
    return nullptr;
}

const AxisRecord* AxisSet::find(int axis) const {
    for (const auto& record : m_records) {
        if (record.index == axis) return &record;
    }
    return nullptr;
}

std::vector<int> AxisSet::resolve(int axis) const {
    if (axis == ALL_AXES) return indices();
    if (contains(axis)) return {axis};
    return {};
}

std::vector<int> AxisSet::indices() const {
    std::vector<int> out;
    out.reserve(m_records.size());
    for (const auto& record : m_records) {
        out.push_back(record.index);
    }
    return out;
}
