#include "json.hpp"

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
int JsonParse::GetInt(const nlohmann::json &j, const std::string &key, int fallback) {
    if (!j.contains(key)) {
        spdlog::debug("JsonParse: Key '{}' not found, using fallback {}", key, fallback);
        return fallback;
    }
    if (j.at(key).is_number_integer()) {
        return j.at(key).get<int>();
    }
    if (j.at(key).is_number()) {
        int val = static_cast<int>(j.at(key).get<double>());
        spdlog::debug("JsonParse: Converted double to int for key '{}': {}", key, val);
        return val;
    }
    spdlog::warn("JsonParse: Key '{}' is not a number, using fallback {}", key, fallback);
    return fallback;
}

// ─────────────────────────────────────
double JsonParse::GetDouble(const nlohmann::json &j, const std::string &key, double fallback) {
    if (!j.contains(key)) {
        spdlog::debug("JsonParse: Key '{}' not found, using fallback {}", key, fallback);
        return fallback;
    }
    if (j.at(key).is_number()) {
        return j.at(key).get<double>();
    }
    spdlog::warn("JsonParse: Key '{}' is not a number, using fallback {}", key, fallback);
    return fallback;
}

// ─────────────────────────────────────
std::string JsonParse::GetString(const nlohmann::json &j, const std::string &key,
                                 const std::string &fallback) {
    if (!j.contains(key)) {
        spdlog::debug("JsonParse: Key '{}' not found, using fallback '{}'", key, fallback);
        return fallback;
    }
    if (j.at(key).is_string()) {
        return j.at(key).get<std::string>();
    }
    spdlog::warn("JsonParse: Key '{}' is not a string, using fallback '{}'", key, fallback);
    return fallback;
}

// ─────────────────────────────────────
nlohmann::json JsonParse::GetObject(const nlohmann::json &j, const std::string &key) {
    if (!j.contains(key)) {
        spdlog::debug("JsonParse: Section '{}' not found", key);
        return nlohmann::json::object();
    }
    if (j.at(key).is_object()) {
        return j.at(key);
    }
    spdlog::warn("JsonParse: Section '{}' is not an object, ignoring it", key);
    return nlohmann::json::object();
}

// ─────────────────────────────────────
nlohmann::json JsonParse::MergeObjects(const nlohmann::json &base, const nlohmann::json &overrides) {
    if (!overrides.is_object()) {
        spdlog::warn("JsonParse: Expected object, got {}", overrides.type_name());
        return base;
    }

    nlohmann::json merged = base;
    for (auto it = overrides.begin(); it != overrides.end(); ++it) {
        const std::string &key = it.key();
        if (!merged.contains(key)) {
            // Unknown keys are kept so a rewritten file does not lose them.
            merged[key] = it.value();
            continue;
        }

        nlohmann::json &current = merged[key];
        if (current.is_object()) {
            if (it.value().is_object()) {
                current = MergeObjects(current, it.value());
            } else {
                spdlog::warn("JsonParse: '{}' must be an object, keeping defaults", key);
            }
            continue;
        }

        if (it.value().is_structured()) {
            spdlog::warn("JsonParse: '{}' has type {}, expected {}; keeping default", key,
                         it.value().type_name(), current.type_name());
            continue;
        }
        // Scalar types are checked by whoever reads the value.
        current = it.value();
    }
    return merged;
}
