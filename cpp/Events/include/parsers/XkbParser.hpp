#pragma once
#include "EventRegistry.hpp"
#include "Extension.hpp"

namespace XBridge {

/**
 * @brief All XKB events share one type code, the sub-type is xkb_type.
 *
 * Only bell notifications are routed; bells not tied to a window (the
 * window field is zero) are routed to the root window.
 */
std::optional<ParsedEvent> parseXkbEvent(ParseContext& context, const XEvent& event);

/**
 * @throws ExtensionUnavailable
 */
void registerXkbEvents(EventRegistry& registry, Extension& xkb);

} // namespace XBridge
