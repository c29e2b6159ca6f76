// ============================================================================
// STAGE CONFIG LOADER - Implementation (ArduinoJson v7)
// ============================================================================

#include "core/StageConfigLoader.h"

#include <ArduinoJson.h>

#include <fstream>
#include <sstream>

#include "core/Validators.h"

namespace {

// ============================================================================
// FIELD READERS - absent key keeps the default, wrong type is an error
// ============================================================================

bool parseRoot(const std::string& json, JsonDocument& doc, std::string& errorMsg) {
    DeserializationError error = deserializeJson(doc, json);
    if (error) {
        errorMsg = std::string("invalid JSON: ") + error.c_str();
        return false;
    }
    if (!doc.is<JsonObjectConst>()) {
        errorMsg = "configuration root must be an object";
        return false;
    }
    return true;
}

bool readDouble(JsonVariantConst value, const char* key, double& out, std::string& errorMsg) {
    if (value.isNull()) return true;
    if (!value.is<double>()) {
        errorMsg = std::string(key) + " must be a number";
        return false;
    }
    out = value.as<double>();
    return true;
}

bool readUnsigned(JsonVariantConst value, const char* key, unsigned long& out, std::string& errorMsg) {
    if (value.isNull()) return true;
    if (!value.is<unsigned long>()) {
        errorMsg = std::string(key) + " must be a non-negative integer";
        return false;
    }
    out = value.as<unsigned long>();
    return true;
}

bool readDoubleList(JsonVariantConst value, const char* key, std::vector<double>& out, std::string& errorMsg) {
    if (value.isNull()) return true;
    if (!value.is<JsonArrayConst>()) {
        errorMsg = std::string(key) + " must be an array of numbers";
        return false;
    }

    std::vector<double> parsed;
    for (JsonVariantConst item : value.as<JsonArrayConst>()) {
        if (!item.is<double>()) {
            errorMsg = std::string(key) + " must contain only numbers";
            return false;
        }
        parsed.push_back(item.as<double>());
    }
    out = parsed;
    return true;
}

/** Each entry: null / [] (no zone) or [a, b] in either order */
bool readKeepouts(JsonVariantConst value, std::vector<KeepoutZone>& out, std::string& errorMsg) {
    if (value.isNull()) return true;
    if (!value.is<JsonArrayConst>()) {
        errorMsg = "keepout_zones_mm must be an array";
        return false;
    }

    std::vector<KeepoutZone> zones;
    for (JsonVariantConst item : value.as<JsonArrayConst>()) {
        if (item.isNull()) {
            zones.emplace_back();
            continue;
        }
        if (!item.is<JsonArrayConst>()) {
            errorMsg = "keepout zone " + std::to_string(zones.size() + 1) + " must be null or [min, max]";
            return false;
        }

        JsonArrayConst bounds = item.as<JsonArrayConst>();
        if (bounds.size() == 0) {
            zones.emplace_back();
            continue;
        }
        if (bounds.size() != 2 || !bounds[0].is<double>() || !bounds[1].is<double>()) {
            errorMsg = "keepout zone " + std::to_string(zones.size() + 1) + " must be null or [min, max]";
            return false;
        }
        zones.push_back(KeepoutZone::between(bounds[0].as<double>(), bounds[1].as<double>()));
    }
    out = zones;
    return true;
}

bool readVariant(JsonVariantConst value, StageVariant& out, std::string& errorMsg) {
    if (value.isNull()) return true;
    if (!value.is<const char*>()) {
        errorMsg = "variant must be \"standard\" or \"otter\"";
        return false;
    }

    std::string name = value.as<const char*>();
    if (name == "standard") {
        out = StageVariant::STAGE_STANDARD;
    } else if (name == "otter") {
        out = StageVariant::STAGE_OTTER;
    } else {
        errorMsg = "unknown stage variant '" + name + "'";
        return false;
    }
    return true;
}

} // namespace

namespace StageConfigLoader {

// ============================================================================
// STAGE
// ============================================================================

bool parse(const std::string& json, StageConfig& config, std::string& errorMsg) {
    JsonDocument doc;
    if (!parseRoot(json, doc, errorMsg)) return false;

    StageConfig parsed = config;
    bool ok = readDouble(doc["steps_per_mm"], "steps_per_mm", parsed.stepsPerMM, errorMsg) &&
              readDoubleList(doc["expected_lengths_mm"], "expected_lengths_mm", parsed.expectedLengthsMM, errorMsg) &&
              readKeepouts(doc["keepout_zones_mm"], parsed.keepoutZones, errorMsg) &&
              readDouble(doc["end_buffer_mm"], "end_buffer_mm", parsed.endBufferMM, errorMsg) &&
              readDouble(doc["allowed_length_deviation_mm"], "allowed_length_deviation_mm",
                         parsed.allowedLengthDeviationMM, errorMsg) &&
              readVariant(doc["variant"], parsed.variant, errorMsg) &&
              readDouble(doc["otter_safe_x_mm"], "otter_safe_x_mm", parsed.otterSafeXMM, errorMsg) &&
              readUnsigned(doc["poll_interval_ms"], "poll_interval_ms", parsed.pollIntervalMs, errorMsg) &&
              readUnsigned(doc["settle_interval_ms"], "settle_interval_ms", parsed.settleIntervalMs, errorMsg);
    if (!ok) return false;

    if (!Validators::validateStageConfig(parsed, errorMsg)) return false;

    config = parsed;
    return true;
}

// ============================================================================
// SIMULATOR
// ============================================================================

bool parseSimulator(const std::string& json, SimulatedStageConfig& config, std::string& errorMsg) {
    JsonDocument doc;
    if (!parseRoot(json, doc, errorMsg)) return false;

    SimulatedStageConfig parsed = config;
    if (!readDouble(doc["steps_per_mm"], "steps_per_mm", parsed.stepsPerMM, errorMsg)) return false;

    JsonVariantConst sim = doc["simulator"];
    if (!sim.isNull()) {
        if (!sim.is<JsonObjectConst>()) {
            errorMsg = "simulator must be an object";
            return false;
        }

        JsonVariantConst mask = sim["axes_mask"];
        if (!mask.isNull()) {
            if (!mask.is<long>()) {
                errorMsg = "simulator.axes_mask must be an integer";
                return false;
            }
            parsed.axesMask = mask.as<long>();
        }

        JsonVariantConst perQuery = sim["steps_per_query"];
        if (!perQuery.isNull()) {
            if (!perQuery.is<long>()) {
                errorMsg = "simulator.steps_per_query must be an integer";
                return false;
            }
            parsed.stepsPerQuery = perQuery.as<long>();
        }

        JsonVariantConst homing = sim["homing_queries"];
        if (!homing.isNull()) {
            if (!homing.is<unsigned>()) {
                errorMsg = "simulator.homing_queries must be a non-negative integer";
                return false;
            }
            parsed.homingQueries = homing.as<unsigned>();
        }

        JsonVariantConst startHomed = sim["start_homed"];
        if (!startHomed.isNull()) {
            if (!startHomed.is<bool>()) {
                errorMsg = "simulator.start_homed must be true or false";
                return false;
            }
            parsed.startHomed = startHomed.as<bool>();
        }

        if (!readDoubleList(sim["lengths_mm"], "simulator.lengths_mm", parsed.lengthsMM, errorMsg)) return false;
    }

    if (!Validators::validateSimulatorConfig(parsed, errorMsg)) return false;

    config = parsed;
    return true;
}

// ============================================================================
// LOGGING
// ============================================================================

bool parseLogging(const std::string& json, LoggingConfig& config, std::string& errorMsg) {
    JsonDocument doc;
    if (!parseRoot(json, doc, errorMsg)) return false;

    LoggingConfig parsed = config;

    JsonVariantConst level = doc["log_level"];
    if (!level.isNull()) {
        if (!level.is<const char*>() || !UtilityEngine::parseLogLevel(level.as<const char*>(), parsed.level)) {
            errorMsg = "log_level must be one of debug, info, warn, error";
            return false;
        }
    }

    JsonVariantConst file = doc["log_file"];
    if (!file.isNull()) {
        if (!file.is<const char*>()) {
            errorMsg = "log_file must be a string";
            return false;
        }
        parsed.filePath = file.as<const char*>();
    }

    config = parsed;
    return true;
}

bool applyLogging(const LoggingConfig& config, std::string& errorMsg) {
    engine->setLogLevel(config.level);
    if (config.filePath.empty()) return true;

    if (!engine->openLogFile(config.filePath)) {
        errorMsg = "cannot open log file '" + config.filePath + "'";
        return false;
    }
    return true;
}

// ============================================================================
// FILE
// ============================================================================

bool readFile(const std::string& path, std::string& contents, std::string& errorMsg) {
    std::ifstream file(path);
    if (!file) {
        errorMsg = "cannot open '" + path + "'";
        return false;
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        errorMsg = "error reading '" + path + "'";
        return false;
    }
    contents = buffer.str();
    return true;
}

} // namespace StageConfigLoader
