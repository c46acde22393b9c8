#include "parsers/CoreParsers.hpp"
#include "parsers/ParserSupport.hpp"

namespace XBridge {

std::optional<ParsedEvent> parseMapRequest(ParseContext&, const XEvent& event) {
    const XMapRequestEvent& e = event.xmaprequest;
    ParsedEvent parsed = makeEvent(event, e.window, e.parent);
    parsed.payload = MapRequestEvent{};
    return parsed;
}

std::optional<ParsedEvent> parseConfigureRequest(ParseContext&, const XEvent& event) {
    const XConfigureRequestEvent& e = event.xconfigurerequest;
    ParsedEvent parsed = makeEvent(event, e.window, e.parent);
    ConfigureRequestEvent payload;
    payload.x = e.x;
    payload.y = e.y;
    payload.width = e.width;
    payload.height = e.height;
    payload.borderWidth = e.border_width;
    payload.above = e.above;
    payload.detail = e.detail;
    payload.valueMask = e.value_mask;
    parsed.payload = payload;
    return parsed;
}

std::optional<ParsedEvent> parseCirculateRequest(ParseContext&, const XEvent& event) {
    const XCirculateRequestEvent& e = event.xcirculaterequest;
    if (e.place != PlaceOnTop && e.place != PlaceOnBottom) {
        throw EventParseError("invalid circulate place " + std::to_string(e.place));
    }
    ParsedEvent parsed = makeEvent(event, e.window, e.parent);
    parsed.payload = CirculateRequestEvent{e.place};
    return parsed;
}

std::optional<ParsedEvent> parseCreateNotify(ParseContext&, const XEvent& event) {
    const XCreateWindowEvent& e = event.xcreatewindow;
    ParsedEvent parsed = makeEvent(event, e.window, e.parent);
    CreateEvent payload;
    payload.x = e.x;
    payload.y = e.y;
    payload.width = e.width;
    payload.height = e.height;
    payload.borderWidth = e.border_width;
    payload.overrideRedirect = e.override_redirect != False;
    parsed.payload = payload;
    return parsed;
}

std::optional<ParsedEvent> parseMapNotify(ParseContext&, const XEvent& event) {
    const XMapEvent& e = event.xmap;
    ParsedEvent parsed = makeEvent(event, e.window, e.event);
    parsed.payload = MapEvent{e.override_redirect != False};
    return parsed;
}

std::optional<ParsedEvent> parseUnmapNotify(ParseContext&, const XEvent& event) {
    const XUnmapEvent& e = event.xunmap;
    ParsedEvent parsed = makeEvent(event, e.window, e.event);
    parsed.payload = UnmapEvent{e.from_configure != False};
    return parsed;
}

std::optional<ParsedEvent> parseDestroyNotify(ParseContext&, const XEvent& event) {
    const XDestroyWindowEvent& e = event.xdestroywindow;
    ParsedEvent parsed = makeEvent(event, e.window, e.event);
    parsed.payload = DestroyEvent{};
    return parsed;
}

std::optional<ParsedEvent> parseConfigureNotify(ParseContext&, const XEvent& event) {
    const XConfigureEvent& e = event.xconfigure;
    ParsedEvent parsed = makeEvent(event, e.window, e.event);
    ConfigureEvent payload;
    payload.x = e.x;
    payload.y = e.y;
    payload.width = e.width;
    payload.height = e.height;
    payload.borderWidth = e.border_width;
    payload.above = e.above;
    payload.overrideRedirect = e.override_redirect != False;
    parsed.payload = payload;
    return parsed;
}

std::optional<ParsedEvent> parseReparentNotify(ParseContext&, const XEvent& event) {
    const XReparentEvent& e = event.xreparent;
    ParsedEvent parsed = makeEvent(event, e.window, e.event);
    ReparentEvent payload;
    payload.parent = e.parent;
    payload.x = e.x;
    payload.y = e.y;
    payload.overrideRedirect = e.override_redirect != False;
    parsed.payload = payload;
    return parsed;
}

std::optional<ParsedEvent> parsePropertyNotify(ParseContext& context, const XEvent& event) {
    const XPropertyEvent& e = event.xproperty;
    if (e.state != PropertyNewValue && e.state != PropertyDelete) {
        throw EventParseError("invalid property state " + std::to_string(e.state));
    }
    ParsedEvent parsed = makeEvent(event, e.window, e.window);
    PropertyEvent payload;
    payload.atom = e.atom;
    payload.atomName = atomNameOrEmpty(context, e.atom);
    payload.state = e.state;
    payload.time = e.time;
    parsed.payload = payload;
    return parsed;
}

std::optional<ParsedEvent> parseClientMessage(ParseContext& context, const XEvent& event) {
    const XClientMessageEvent& e = event.xclient;
    if (e.format != 8 && e.format != 16 && e.format != 32) {
        throw EventParseError("invalid client message format " + std::to_string(e.format));
    }
    ParsedEvent parsed = makeEvent(event, e.window, e.window);
    ClientMessageEvent payload;
    payload.messageType = e.message_type;
    payload.messageTypeName = atomNameOrEmpty(context, e.message_type);
    payload.format = e.format;
    for (std::size_t i = 0; i < payload.data.size(); ++i) {
        payload.data[i] = e.data.l[i];
    }
    parsed.payload = payload;
    return parsed;
}

std::optional<ParsedEvent> parseFocus(ParseContext&, const XEvent& event) {
    const XFocusChangeEvent& e = event.xfocus;
    ParsedEvent parsed = makeEvent(event, e.window, e.window);
    parsed.payload = FocusEvent{e.mode, e.detail};
    return parsed;
}

std::optional<ParsedEvent> parseCrossing(ParseContext&, const XEvent& event) {
    const XCrossingEvent& e = event.xcrossing;
    ParsedEvent parsed = makeEvent(event, e.window, e.window);
    CrossingEvent payload;
    payload.root = e.root;
    payload.subwindow = e.subwindow;
    payload.x = e.x;
    payload.y = e.y;
    payload.xRoot = e.x_root;
    payload.yRoot = e.y_root;
    payload.mode = e.mode;
    payload.detail = e.detail;
    payload.focus = e.focus != False;
    payload.state = e.state;
    payload.time = e.time;
    parsed.payload = payload;
    return parsed;
}

std::optional<ParsedEvent> parseMotion(ParseContext&, const XEvent& event) {
    const XMotionEvent& e = event.xmotion;
    ParsedEvent parsed = makeEvent(event, e.window, e.window);
    MotionEvent payload;
    payload.root = e.root;
    payload.subwindow = e.subwindow;
    payload.x = e.x;
    payload.y = e.y;
    payload.xRoot = e.x_root;
    payload.yRoot = e.y_root;
    payload.state = e.state;
    payload.isHint = e.is_hint != NotifyNormal;
    payload.time = e.time;
    parsed.payload = payload;
    return parsed;
}

std::optional<ParsedEvent> parseKey(ParseContext&, const XEvent& event) {
    const XKeyEvent& e = event.xkey;
    ParsedEvent parsed = makeEvent(event, e.window, e.window);
    KeyEvent payload;
    payload.root = e.root;
    payload.subwindow = e.subwindow;
    payload.keycode = e.keycode;
    payload.state = e.state;
    payload.time = e.time;
    parsed.payload = payload;
    return parsed;
}

std::optional<ParsedEvent> parseButton(ParseContext&, const XEvent& event) {
    const XButtonEvent& e = event.xbutton;
    ParsedEvent parsed = makeEvent(event, e.window, e.window);
    ButtonEvent payload;
    payload.root = e.root;
    payload.subwindow = e.subwindow;
    payload.x = e.x;
    payload.y = e.y;
    payload.xRoot = e.x_root;
    payload.yRoot = e.y_root;
    payload.button = e.button;
    payload.state = e.state;
    payload.time = e.time;
    parsed.payload = payload;
    return parsed;
}

std::optional<ParsedEvent> parseSelectionRequest(ParseContext& context, const XEvent& event) {
    const XSelectionRequestEvent& e = event.xselectionrequest;
    ParsedEvent parsed = makeEvent(event, e.owner, e.owner);
    SelectionRequestEvent payload;
    payload.owner = e.owner;
    payload.requestor = e.requestor;
    payload.selection = atomNameOrEmpty(context, e.selection);
    payload.target = atomNameOrEmpty(context, e.target);
    payload.property = atomNameOrEmpty(context, e.property);
    payload.time = e.time;
    parsed.payload = payload;
    return parsed;
}

std::optional<ParsedEvent> parseSelectionClear(ParseContext& context, const XEvent& event) {
    const XSelectionClearEvent& e = event.xselectionclear;
    ParsedEvent parsed = makeEvent(event, e.window, e.window);
    parsed.payload = SelectionClearEvent{atomNameOrEmpty(context, e.selection), e.time};
    return parsed;
}

std::optional<ParsedEvent> parseSelectionNotify(ParseContext& context, const XEvent& event) {
    const XSelectionEvent& e = event.xselection;
    ParsedEvent parsed = makeEvent(event, e.requestor, e.requestor);
    SelectionNotifyEvent payload;
    payload.requestor = e.requestor;
    payload.selection = atomNameOrEmpty(context, e.selection);
    payload.target = atomNameOrEmpty(context, e.target);
    payload.property = atomNameOrEmpty(context, e.property);
    payload.time = e.time;
    parsed.payload = payload;
    return parsed;
}

void registerCoreEvents(EventRegistry& registry) {
    registry.registerType(MapRequest, "MapRequest", "", "x11-child-map-request-event", parseMapRequest);
    registry.registerType(ConfigureRequest, "ConfigureRequest", "", "x11-child-configure-request-event", parseConfigureRequest);
    registry.registerType(CirculateRequest, "CirculateRequest", "", "x11-child-circulate-request-event", parseCirculateRequest);
    registry.registerType(CreateNotify, "CreateNotify", "x11-create-event", "", parseCreateNotify);
    registry.registerType(MapNotify, "MapNotify", "x11-map-event", "x11-child-map-event", parseMapNotify);
    registry.registerType(UnmapNotify, "UnmapNotify", "x11-unmap-event", "x11-child-unmap-event", parseUnmapNotify);
    registry.registerType(DestroyNotify, "DestroyNotify", "x11-destroy-event", "", parseDestroyNotify);
    registry.registerType(ConfigureNotify, "ConfigureNotify", "x11-configure-event", "", parseConfigureNotify);
    registry.registerType(ReparentNotify, "ReparentNotify", "x11-reparent-event", "", parseReparentNotify);
    registry.registerType(PropertyNotify, "PropertyNotify", "x11-property-notify-event", "", parsePropertyNotify);
    registry.registerType(ClientMessage, "ClientMessage", "x11-client-message-event", "", parseClientMessage);
    registry.registerType(FocusIn, "FocusIn", "x11-focus-in-event", "", parseFocus);
    registry.registerType(FocusOut, "FocusOut", "x11-focus-out-event", "", parseFocus);
    registry.registerType(EnterNotify, "EnterNotify", "x11-enter-event", "", parseCrossing);
    registry.registerType(LeaveNotify, "LeaveNotify", "x11-leave-event", "", parseCrossing);
    registry.registerType(MotionNotify, "MotionNotify", "x11-motion-event", "", parseMotion);
    registry.registerType(KeyPress, "KeyPress", "x11-key-press-event", "", parseKey);
    registry.registerType(KeyRelease, "KeyRelease", "x11-key-release-event", "", parseKey);
    registry.registerType(ButtonPress, "ButtonPress", "x11-button-press-event", "", parseButton);
    registry.registerType(ButtonRelease, "ButtonRelease", "x11-button-release-event", "", parseButton);
    registry.registerType(SelectionRequest, "SelectionRequest", "x11-selection-request", "", parseSelectionRequest);
    registry.registerType(SelectionClear, "SelectionClear", "x11-selection-clear", "", parseSelectionClear);
    registry.registerType(SelectionNotify, "SelectionNotify", "x11-selection-notify", "", parseSelectionNotify);
}

} // namespace XBridge
