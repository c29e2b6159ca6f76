// ============================================================================
// TEXTUTILS.H - Small formatting helpers for log messages
// ============================================================================

#pragma once

#include <cstdio>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace TextUtils {

/** Fixed-point text, e.g. fixed(12.3456, 1) → "12.3" */
inline std::string fixed(double value, int decimals) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.*f", decimals, value);
    return std::string(buffer);
}

/** "none" for an absent reading */
inline std::string orNone(const std::optional<long>& value) {
    return value ? std::to_string(*value) : std::string("none");
}

/** "[1, 2, 3]" */
template <typename T>
std::string list(const std::vector<T>& values) {
    std::string out = "[";
    for (size_t i = 0; i < values.size(); i++) {
        if (i > 0) out += ", ";
        if constexpr (std::is_floating_point_v<T>) {
            out += fixed(values[i], 3);
        } else {
            out += std::to_string(values[i]);
        }
    }
    return out + "]";
}

} // namespace TextUtils
