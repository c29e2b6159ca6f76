// ============================================================================
// AXIS_SET.H - Discovered axes of one controller session
// ============================================================================
// Built at connect() from the controller's presence bitmask (bit i → axis
// i+1, at most MAX_AXES), discarded at close(). Holds per-axis expected,
// measured and current values plus the stage-level homed flag.
//
// Expected lengths are assigned once per session (assignConfiguration);
// measured lengths and positions only ever come from hardware reads.
// ============================================================================

#pragma once

#include <vector>

#include "core/Types.h"

class AxisSet {
public:
    // ========================================================================
    // SESSION LIFECYCLE
    // ========================================================================

    /**
     * Rebuild the axis list from a presence bitmask
     * Bits above MAX_AXES are ignored
     * @return Number of axes discovered
     */
    size_t discover(long presenceMask);

    /** Forget every axis (close / disconnect) */
    void clear();

    /**
     * Assign configured lengths (steps) and keepouts pairwise in axis order
     * Can only succeed once per discovery.
     * @return false if the configured count differs from the discovered count
     *         (the overlapping part is still assigned)
     */
    bool assignConfiguration(const std::vector<long>& expectedLengthsSteps,
                             const std::vector<KeepoutZone>& keepouts);

    // ========================================================================
    // LOOKUP
    // ========================================================================

    bool contains(int axis) const;
    AxisRecord* find(int axis);
    const AxisRecord* find(int axis) const;

    /**
     * ALL_AXES → every axis; a known axis → {axis}; anything else → {}
     */
    std::vector<int> resolve(int axis) const;

    /** Axis indices in discovery order */
    std::vector<int> indices() const;

    size_t size() const { return m_records.size(); }
    bool empty() const { return m_records.empty(); }

    const std::vector<AxisRecord>& records() const { return m_records; }

    // ========================================================================
    // STAGE STATE
    // ========================================================================

    bool isHomed() const { return m_homed; }
    void setHomed(bool homed) { m_homed = homed; }

    bool hasConfigMismatch() const { return m_configMismatch; }

private:
    std::vector<AxisRecord> m_records;
    bool m_homed = false;
    bool m_configMismatch = false;
    bool m_configured = false;
};
