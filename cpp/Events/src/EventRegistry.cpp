#include "EventRegistry.hpp"
#include <utility>

namespace XBridge {

void EventRegistry::registerType(int code, std::string shortName, std::string signalName,
                                 std::string parentSignalName, EventParser parser) {
    RegisteredEventType& entry = m_types[code];
    entry.code = code;
    entry.shortName = std::move(shortName);
    entry.signalName = std::move(signalName);
    entry.parentSignalName = std::move(parentSignalName);
    entry.parser = std::move(parser);
}

const RegisteredEventType* EventRegistry::lookup(int code) const {
    auto it = m_types.find(code);
    return it == m_types.end() ? nullptr : &it->second;
}

int EventRegistry::classify(const XEvent& event) {
    // Xlib keeps the SendEvent flag in send_event, type is the bare code
    return event.type & 0x7f;
}

std::string EventRegistry::name(int code) const {
    const RegisteredEventType* entry = lookup(code);
    if (entry) {
        return entry->shortName;
    }
    return "unknown-event-" + std::to_string(code);
}

std::vector<int> EventRegistry::registeredCodes() const {
    std::vector<int> codes;
    codes.reserve(m_types.size());
    for (const auto& item : m_types) {
        codes.push_back(item.first);
    }
    return codes;
}

} // namespace XBridge
