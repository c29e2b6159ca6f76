// ============================================================================
// ESTOP HANDLER - Implementation
// ============================================================================

#include "movement/EstopHandler.h"

#include <algorithm>

#include "core/TextUtils.h"
#include "core/UtilityEngine.h"

EstopHandler::EstopHandler(StageProtocol& protocol, const AxisSet& axes) :
    m_protocol(protocol),
    m_axes(axes) {}

ErrorCode EstopHandler::foldSticky(ErrorCode accumulated, ErrorCode next) {
    return isFailure(accumulated) ? accumulated : next;
}

ErrorCode EstopHandler::estopAll() {
    return estop(m_axes.indices());
}

ErrorCode EstopHandler::estop(const std::vector<int>& axes) {
    if (axes.empty()) {
        engine->error("❌ Emergency stop requested for no axes");
        return ErrorCode::ERR_INVALID_AXIS;
    }

    engine->warn("🛑 EMERGENCY STOP axes " + TextUtils::list(axes));

    // Every discovered axis addressed: one stage-wide command
    bool wholeStage = !m_axes.empty() &&
                      std::all_of(m_axes.records().begin(), m_axes.records().end(), [&axes](const AxisRecord& r) {
                          return std::find(axes.begin(), axes.end(), r.index) != axes.end();
                      }) &&
                      std::all_of(axes.begin(), axes.end(), [this](int axis) { return m_axes.contains(axis); });

    if (wholeStage) {
        return m_protocol.stop(ALL_AXES) ? ErrorCode::OK : ErrorCode::ERR_REJECTED;
    }

    ErrorCode result = ErrorCode::OK;
    for (int axis : axes) {
        ErrorCode axisResult;
        if (!m_axes.contains(axis)) {
            engine->error("❌ Emergency stop: invalid axis " + std::to_string(axis));
            axisResult = ErrorCode::ERR_INVALID_AXIS;
        } else {
            axisResult = m_protocol.stop(axis) ? ErrorCode::OK : ErrorCode::ERR_REJECTED;
        }
        result = foldSticky(result, axisResult);
    }

    if (isFailure(result)) {
        engine->error(std::string("❌ Emergency stop incomplete: ") + errorCodeName(result));
    }
    return result;
}
