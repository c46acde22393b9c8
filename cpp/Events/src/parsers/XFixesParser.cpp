#include "parsers/XFixesParser.hpp"
#include "parsers/ParserSupport.hpp"
#include <X11/extensions/Xfixes.h>

namespace XBridge {

std::optional<ParsedEvent> parseCursorNotify(ParseContext& context, const XEvent& event) {
    const auto& e = reinterpret_cast<const XFixesCursorNotifyEvent&>(event);
    ParsedEvent parsed = makeEvent(event, e.window, e.window);
    CursorEvent payload;
    payload.subtype = e.subtype;
    payload.cursorSerial = e.cursor_serial;
    payload.cursorName = e.cursor_name;
    payload.cursorNameString = atomNameOrEmpty(context, e.cursor_name);
    payload.timestamp = e.timestamp;
    parsed.payload = payload;
    return parsed;
}

std::optional<ParsedEvent> parseXFixesSelectionNotify(ParseContext& context, const XEvent& event) {
    const auto& e = reinterpret_cast<const XFixesSelectionNotifyEvent&>(event);
    if (e.subtype != XFixesSetSelectionOwnerNotify
        && e.subtype != XFixesSelectionWindowDestroyNotify
        && e.subtype != XFixesSelectionClientCloseNotify) {
        throw EventParseError("invalid xfixes selection subtype " + std::to_string(e.subtype));
    }
    ParsedEvent parsed = makeEvent(event, e.window, e.window);
    XFixesSelectionEvent payload;
    payload.subtype = e.subtype;
    payload.owner = e.owner;
    payload.selection = atomNameOrEmpty(context, e.selection);
    payload.timestamp = e.timestamp;
    payload.selectionTimestamp = e.selection_timestamp;
    parsed.payload = payload;
    return parsed;
}

void registerXFixesEvents(EventRegistry& registry, Extension& xfixes) {
    xfixes.ensureSupport();
    registry.registerType(xfixes.eventBase() + XFixesCursorNotify, "XFixesCursorNotify",
                          "x11-cursor-event", "", parseCursorNotify);
    registry.registerType(xfixes.eventBase() + XFixesSelectionNotify, "XFixesSelectionNotify",
                          "x11-xfixes-selection-notify-event", "", parseXFixesSelectionNotify);
}

} // namespace XBridge
