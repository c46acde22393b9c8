#include "Config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace XBridge {

namespace {

bool envFlag(const char* name, bool fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    auto flag = parseFlag(value);
    if (!flag) {
        std::cerr << "Ignoring invalid value for " << name << ": '" << value << "'" << std::endl;
        return fallback;
    }
    return *flag;
}

int envInt(const char* name, int fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    char* end = nullptr;
    long parsed = std::strtol(value, &end, 10);
    if (end == value || *end != '\0' || parsed < 0) {
        std::cerr << "Ignoring invalid value for " << name << ": '" << value << "'" << std::endl;
        return fallback;
    }
    return static_cast<int>(parsed);
}

} // namespace

std::optional<bool> parseFlag(const std::string& value) {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
        return false;
    }
    return std::nullopt;
}

Config Config::fromEnvironment() {
    Config config;
    const char* display = std::getenv("XBRIDGE_DISPLAY");
    if (!display) {
        display = std::getenv("DISPLAY");
    }
    config.displayName = display ? display : "";
    config.useXShm = envFlag("XBRIDGE_XSHM", config.useXShm);
    config.synchronous = envFlag("XBRIDGE_SYNCHRONIZE", config.synchronous);
    config.debugEvents = envFlag("XBRIDGE_DEBUG_EVENTS", config.debugEvents);
    config.slowEventMs = envInt("XBRIDGE_SLOW_EVENT_MS", config.slowEventMs);
    return config;
}

Config Config::fromJson(const nlohmann::json& j) {
    return fromJson(j, Config());
}

Config Config::fromJson(const nlohmann::json& j, const Config& base) {
    Config config = base;
    config.displayName = j.value("display", config.displayName);
    config.useXShm = j.value("xshm", config.useXShm);
    config.synchronous = j.value("synchronize", config.synchronous);
    config.debugEvents = j.value("debug_events", config.debugEvents);
    config.slowEventMs = j.value("slow_event_ms", config.slowEventMs);
    return config;
}

std::optional<Config> Config::fromJsonFile(const std::string& path) {
    return fromJsonFile(path, Config());
}

std::optional<Config> Config::fromJsonFile(const std::string& path, const Config& base) {
    std::ifstream file(path);
    if (!file) {
        std::cerr << "Could not open config file " << path << std::endl;
        return std::nullopt;
    }
    try {
        return fromJson(nlohmann::json::parse(file), base);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Invalid config file " << path << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

nlohmann::json Config::toJson() const {
    return {
        {"display", displayName},
        {"xshm", useXShm},
        {"synchronize", synchronous},
        {"debug_events", debugEvents},
        {"slow_event_ms", slowEventMs},
    };
}

} // namespace XBridge
