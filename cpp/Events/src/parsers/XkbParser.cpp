#include "parsers/XkbParser.hpp"
#include "parsers/ParserSupport.hpp"
#include <X11/XKBlib.h>

namespace XBridge {

std::optional<ParsedEvent> parseXkbEvent(ParseContext& context, const XEvent& event) {
    const auto& xkb = reinterpret_cast<const XkbEvent&>(event);
    if (xkb.any.xkb_type != XkbBellNotify) {
        return std::nullopt;
    }

    const XkbBellNotifyEvent& bell = xkb.bell;
    Window window = bell.window;
    if (window == None) {
        window = context.connection.defaultRootWindow();
    }

    // XkbAnyEvent has no window field, so don't go through makeEvent()
    ParsedEvent parsed;
    parsed.type = bell.type;
    parsed.serial = bell.serial;
    parsed.sendEvent = bell.send_event != False;
    parsed.window = window;
    parsed.deliveredTo = window;

    BellEvent payload;
    payload.device = bell.device;
    payload.percent = bell.percent;
    payload.pitch = bell.pitch;
    payload.duration = bell.duration;
    payload.bellClass = bell.bell_class;
    payload.bellId = bell.bell_id;
    payload.nameAtom = bell.name;
    payload.bellName = atomNameOrEmpty(context, bell.name);
    payload.eventOnly = bell.event_only != False;
    payload.time = bell.time;
    parsed.payload = payload;
    return parsed;
}

void registerXkbEvents(EventRegistry& registry, Extension& xkb) {
    xkb.ensureSupport();
    registry.registerType(xkb.eventBase() + XkbEventCode, "XKBNotify", "x11-xkb-event", "", parseXkbEvent);
}

} // namespace XBridge
