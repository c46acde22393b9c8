#pragma once
#include "EventRegistry.hpp"
#include "Extension.hpp"

namespace XBridge {

std::optional<ParsedEvent> parseCursorNotify(ParseContext& context, const XEvent& event);
std::optional<ParsedEvent> parseXFixesSelectionNotify(ParseContext& context, const XEvent& event);

/**
 * @throws ExtensionUnavailable
 */
void registerXFixesEvents(EventRegistry& registry, Extension& xfixes);

} // namespace XBridge
