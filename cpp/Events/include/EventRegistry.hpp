#pragma once
#include "ParsedEvent.hpp"
#include "AtomCache.hpp"
#include "IXConnection.hpp"
#include <X11/Xlib.h>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace XBridge {

struct ParseContext {
    IXConnection& connection;
    AtomCache& atoms;
};

/**
 * @brief Thrown by a parser when the wire data does not make sense.
 *
 * Returning nothing means "recognized, nothing to route" and is not an
 * error.
 */
class EventParseError : public std::runtime_error {
public:
    explicit EventParseError(const std::string& what) : std::runtime_error(what) {}
};

using EventParser = std::function<std::optional<ParsedEvent>(ParseContext&, const XEvent&)>;

struct RegisteredEventType {
    int code = 0;
    std::string shortName;
    std::string signalName;         // routed to event.window, may be empty
    std::string parentSignalName;   // routed to event.deliveredTo, may be empty
    EventParser parser;
};

/**
 * @brief Maps event type codes (core, or extension base + sub-type) to a
 * name pair and the parser that knows the wire layout.
 */
class EventRegistry {
public:
    /**
     * @brief Registers or replaces the entry for code
     */
    void registerType(int code, std::string shortName, std::string signalName,
                      std::string parentSignalName, EventParser parser);

    const RegisteredEventType* lookup(int code) const;

    /**
     * @brief Reads the type tag only, never the payload
     */
    static int classify(const XEvent& event);

    std::string name(int code) const;
    std::size_t size() const { return m_types.size(); }
    std::vector<int> registeredCodes() const;

private:
    std::map<int, RegisteredEventType> m_types;
};

} // namespace XBridge
