// ============================================================================
// TYPES.H - Data Structures and Enums
// ============================================================================
// All type definitions (enums, structs) centralized for clarity
// Runtime configuration structures with default values in constructors
// ============================================================================
//
// RESULT ARCHITECTURE:
// ═══════════════════════════════════════════════════════════════════════════
//
//   Every public stage operation returns EITHER a success value OR exactly
//   one ErrorCode, never both:
//     - operations without payload return ErrorCode (OK = success)
//     - operations with payload return Outcome<T>
//
//   Link failures (LinkError) are caught in StageProtocol and never reach
//   the caller: commands become ERR_REJECTED, reads become "absent".
//
// UNITS:
// ═══════════════════════════════════════════════════════════════════════════
//   *MM    → double millimeters (never rounded)
//   *Steps → long microsteps (rounded once, in MovementMath::mmToSteps)
// ═══════════════════════════════════════════════════════════════════════════

#ifndef TYPES_H
#define TYPES_H

#include <algorithm>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "core/Config.h"

// ============================================================================
// ERROR CODES
// ============================================================================

enum class ErrorCode : int {
  OK = 0,
  ERR_TIMEOUT = -1,             // Wait budget exhausted / controller unreachable at connect
  ERR_LENGTH_INVALID = -1,      // Length checker: measured length outside tolerance
  ERR_REJECTED = -2,            // Controller refused (busy, unhomed, length unknowable)
  ERR_INVALID_AXIS = -3,        // Axis not discovered on this stage
  ERR_UNSUPPORTED = -4,         // Composite homing asked for non-blocking or single axis
  ERR_OTTER_AXIS1_LENGTH = -5,  // Composite homing: axis 1 homed to the wrong length
  ERR_OUT_OF_BOUNDS = -6,       // Target in end buffer or keepout zone, nothing sent
  ERR_LIST_MISMATCH = -7,       // Axis list and value list lengths differ
  ERR_STALLED = -8,             // Axis stopped but not on target
  ERR_INTERNAL = -9             // Programming error
};

constexpr int toInt(ErrorCode code) { return static_cast<int>(code); }

constexpr bool isFailure(ErrorCode code) { return code != ErrorCode::OK; }

inline const char* errorCodeName(ErrorCode code) {
  switch (toInt(code)) {
    case 0:  return "OK";
    case -1: return "TIMEOUT";
    case -2: return "REJECTED";
    case -3: return "INVALID_AXIS";
    case -4: return "UNSUPPORTED";
    case -5: return "OTTER_AXIS1_LENGTH";
    case -6: return "OUT_OF_BOUNDS";
    case -7: return "LIST_MISMATCH";
    case -8: return "STALLED";
    case -9: return "INTERNAL";
    default: return "UNKNOWN";
  }
}

/** Name for a length check result, where -1 means "out of tolerance" */
inline const char* lengthCheckName(ErrorCode code) {
  return code == ErrorCode::ERR_LENGTH_INVALID ? "LENGTH_INVALID" : errorCodeName(code);
}

// ============================================================================
// OUTCOME - success value XOR error code
// ============================================================================

template <typename T>
class Outcome {
public:
  static Outcome success(T value) { return Outcome(std::move(value)); }

  static Outcome failure(ErrorCode code) {
    // A "failure" carrying OK would be indistinguishable from success
    return Outcome(code == ErrorCode::OK ? ErrorCode::ERR_INTERNAL : code);
  }

  bool ok() const { return std::holds_alternative<T>(m_state); }
  explicit operator bool() const { return ok(); }

  /** ErrorCode::OK on success, the failure code otherwise */
  ErrorCode code() const {
    return ok() ? ErrorCode::OK : std::get<ErrorCode>(m_state);
  }

  /** Payload; only valid when ok() */
  const T& value() const { return std::get<T>(m_state); }

private:
  explicit Outcome(T value) : m_state(std::move(value)) {}
  explicit Outcome(ErrorCode code) : m_state(code) {}

  std::variant<T, ErrorCode> m_state;
};

// ============================================================================
// STAGE ENUMS
// ============================================================================

enum class StageVariant {
  STAGE_STANDARD,  // Independent axes, direct homing
  STAGE_OTTER      // Axis 2 must be cleared by axis 1 before it can home
};

enum class JogDirection : char {
  JOG_A = 'a',     // Toward the home end
  JOG_B = 'b'      // Toward the motor end
};

// ============================================================================
// KEEPOUT ZONE - closed interval in mm, empty = no restriction
// ============================================================================

struct KeepoutZone {
  bool enabled;
  double minMM;
  double maxMM;

  constexpr KeepoutZone() :
    enabled(false),
    minMM(0.0),
    maxMM(0.0) {}

  /** Bounds may be given in either order */
  static constexpr KeepoutZone between(double a, double b) {
    KeepoutZone zone;
    zone.enabled = true;
    zone.minMM = std::min(a, b);
    zone.maxMM = std::max(a, b);
    return zone;
  }

  constexpr bool isEmpty() const { return !enabled; }
};

// ============================================================================
// AXIS RECORD - one discovered axis, owned by AxisSet
// ============================================================================

struct AxisRecord {
  int index;                                   // 1-based controller slot, stable per connection
  std::optional<long> expectedLengthSteps;     // Set once at connect, never changed
  std::optional<long> measuredLengthSteps;     // Last hardware length read
  std::optional<long> currentPositionSteps;    // Last hardware position read
  KeepoutZone keepout;

  explicit AxisRecord(int axisIndex) :
    index(axisIndex) {}
};

// ============================================================================
// STAGE CONFIGURATION
// ============================================================================

struct StageConfig {
  double stepsPerMM;
  std::vector<double> expectedLengthsMM;       // One per axis, in discovery order
  std::vector<KeepoutZone> keepoutZones;       // One per axis (missing = none)
  double endBufferMM;
  double allowedLengthDeviationMM;
  StageVariant variant;
  double otterSafeXMM;
  unsigned long pollIntervalMs;
  unsigned long settleIntervalMs;

  StageConfig() :
    stepsPerMM(DEFAULT_STEPS_PER_MM),
    endBufferMM(END_BUFFER_MM),
    allowedLengthDeviationMM(ALLOWED_LENGTH_DEVIATION_MM),
    variant(StageVariant::STAGE_STANDARD),
    otterSafeXMM(OTTER_SAFE_X_MM),
    pollIntervalMs(WAIT_POLL_INTERVAL_MS),
    settleIntervalMs(SETTLE_CHECK_INTERVAL_MS) {}
};

// ============================================================================
// SIMULATOR CONFIGURATION
// ============================================================================

struct SimulatedStageConfig {
  long axesMask;                    // Presence bitmask (bit 0 → axis 1)
  std::vector<double> lengthsMM;    // Physical lengths, one per present axis
  double stepsPerMM;
  long stepsPerQuery;
  unsigned homingQueries;
  bool startHomed;                  // Axes powered up already homed, at mid-travel

  SimulatedStageConfig() :
    axesMask(0b11),
    stepsPerMM(DEFAULT_STEPS_PER_MM),
    stepsPerQuery(static_cast<long>(SIM_DEFAULT_SPEED_MM * DEFAULT_STEPS_PER_MM)),
    homingQueries(SIM_DEFAULT_HOMING_QUERIES),
    startHomed(false) {}
};

// ============================================================================
// MOTION REQUEST - created per call, consumed synchronously
// ============================================================================

struct MotionRequest {
  std::vector<double> valuesMM;   // Absolute targets or relative offsets
  std::vector<int> axes;          // Ignored when allAxes
  bool allAxes;
  bool relative;
  bool block;
  unsigned long timeoutMs;

  MotionRequest() :
    allAxes(true),
    relative(false),
    block(true),
    timeoutMs(MOTION_TIMEOUT_MS) {}

  static MotionRequest absolute(std::vector<double> targetsMM, std::vector<int> axes,
                                bool block, unsigned long timeoutMs) {
    MotionRequest request;
    request.valuesMM = std::move(targetsMM);
    request.axes = std::move(axes);
    request.allAxes = false;
    request.block = block;
    request.timeoutMs = timeoutMs;
    return request;
  }

  static MotionRequest offset(std::vector<double> deltasMM, std::vector<int> axes,
                              bool block, unsigned long timeoutMs) {
    MotionRequest request = absolute(std::move(deltasMM), std::move(axes), block, timeoutMs);
    request.relative = true;
    return request;
  }
};

#endif // TYPES_H
