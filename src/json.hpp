#pragma once

#include <string>
#include <nlohmann/json.hpp>

class JsonParse {
  public:
    int GetInt(const nlohmann::json &j, const std::string &key, int fallback);
    double GetDouble(const nlohmann::json &j, const std::string &key, double fallback);
    std::string GetString(const nlohmann::json &j, const std::string &key,
                          const std::string &fallback);
    nlohmann::json GetObject(const nlohmann::json &j, const std::string &key);

    // Recursively overlays `overrides` on `base`. An object in the base is never replaced by a
    // scalar or array, and vice versa.
    nlohmann::json MergeObjects(const nlohmann::json &base, const nlohmann::json &overrides);
};
