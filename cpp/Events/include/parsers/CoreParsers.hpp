#pragma once
#include "EventRegistry.hpp"

namespace XBridge {

std::optional<ParsedEvent> parseMapRequest(ParseContext& context, const XEvent& event);
std::optional<ParsedEvent> parseConfigureRequest(ParseContext& context, const XEvent& event);
std::optional<ParsedEvent> parseCirculateRequest(ParseContext& context, const XEvent& event);
std::optional<ParsedEvent> parseCreateNotify(ParseContext& context, const XEvent& event);
std::optional<ParsedEvent> parseMapNotify(ParseContext& context, const XEvent& event);
std::optional<ParsedEvent> parseUnmapNotify(ParseContext& context, const XEvent& event);
std::optional<ParsedEvent> parseDestroyNotify(ParseContext& context, const XEvent& event);
std::optional<ParsedEvent> parseConfigureNotify(ParseContext& context, const XEvent& event);
std::optional<ParsedEvent> parseReparentNotify(ParseContext& context, const XEvent& event);
std::optional<ParsedEvent> parsePropertyNotify(ParseContext& context, const XEvent& event);
std::optional<ParsedEvent> parseClientMessage(ParseContext& context, const XEvent& event);
std::optional<ParsedEvent> parseFocus(ParseContext& context, const XEvent& event);
std::optional<ParsedEvent> parseCrossing(ParseContext& context, const XEvent& event);
std::optional<ParsedEvent> parseMotion(ParseContext& context, const XEvent& event);
std::optional<ParsedEvent> parseKey(ParseContext& context, const XEvent& event);
std::optional<ParsedEvent> parseButton(ParseContext& context, const XEvent& event);
std::optional<ParsedEvent> parseSelectionRequest(ParseContext& context, const XEvent& event);
std::optional<ParsedEvent> parseSelectionClear(ParseContext& context, const XEvent& event);
std::optional<ParsedEvent> parseSelectionNotify(ParseContext& context, const XEvent& event);

/**
 * @brief Registers every core protocol event the forwarding server acts on
 */
void registerCoreEvents(EventRegistry& registry);

} // namespace XBridge
