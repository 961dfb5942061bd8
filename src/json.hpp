#pragma once

#include <string>

#include <nlohmann/json.hpp>

// Typed lookups that fall back (with a log line) when a key is missing or mistyped.
class JsonParse {
  public:
    int GetInt(const nlohmann::json &j, const std::string &key, int fallback);
    bool GetBool(const nlohmann::json &j, const std::string &key, bool fallback);
    std::string GetString(const nlohmann::json &j, const std::string &key,
                          const std::string &fallback);
};
