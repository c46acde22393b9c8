#pragma once
#include "ParsedEvent.hpp"
#include <string>

namespace XBridge {

class IEventRouter {
public:
    virtual ~IEventRouter() = default;

    /**
     * @brief Hands a parsed event to its subscribers.
     *
     * Should not throw; the event loop logs and swallows anything that
     * escapes.
     */
    virtual void route(int code, const ParsedEvent& event,
                       const std::string& signalName, const std::string& parentSignalName) = 0;
};

} // namespace XBridge
