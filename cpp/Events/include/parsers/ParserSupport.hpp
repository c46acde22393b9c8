#pragma once
#include "EventRegistry.hpp"
#include <string>

namespace XBridge {

/**
 * @brief Fills the common header from the XAnyEvent part of the event.
 * Only valid for layouts that start with XAnyEvent (not XKB).
 */
ParsedEvent makeEvent(const XEvent& event, Window window, Window deliveredTo);

// Empty string for None or for atoms that no longer exist
std::string atomNameOrEmpty(ParseContext& context, Atom atom);

} // namespace XBridge
