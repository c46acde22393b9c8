#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace XBridge {

/**
 * @brief Startup toggles, read once and handed to the core as plain values.
 *
 * Environment:
 *   XBRIDGE_DISPLAY (falls back to DISPLAY)
 *   XBRIDGE_XSHM=0 turns shared-memory capture off
 *   XBRIDGE_SYNCHRONIZE=1 makes every request synchronous (debugging)
 *   XBRIDGE_DEBUG_EVENTS=1 logs every routed event
 *   XBRIDGE_SLOW_EVENT_MS threshold for the slow handler warning
 */
struct Config {
    std::string displayName;
    bool useXShm = true;
    bool synchronous = false;
    bool debugEvents = false;
    int slowEventMs = 50;

    static Config fromEnvironment();

    // Keys missing from the object keep the values of base (defaults
    // when no base is given)
    static Config fromJson(const nlohmann::json& j);
    static Config fromJson(const nlohmann::json& j, const Config& base);
    static std::optional<Config> fromJsonFile(const std::string& path);
    static std::optional<Config> fromJsonFile(const std::string& path, const Config& base);

    nlohmann::json toJson() const;
};

/**
 * @brief Parses 1/0, true/false, yes/no, on/off (any case)
 */
std::optional<bool> parseFlag(const std::string& value);

} // namespace XBridge
