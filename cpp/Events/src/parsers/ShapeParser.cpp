#include "parsers/ShapeParser.hpp"
#include "parsers/ParserSupport.hpp"
#include <X11/extensions/shape.h>

namespace XBridge {

std::optional<ParsedEvent> parseShapeNotify(ParseContext&, const XEvent& event) {
    const auto& e = reinterpret_cast<const XShapeEvent&>(event);
    if (e.kind != ShapeBounding && e.kind != ShapeClip && e.kind != ShapeInput) {
        throw EventParseError("invalid shape kind " + std::to_string(e.kind));
    }
    ParsedEvent parsed = makeEvent(event, e.window, e.window);
    ShapeEvent payload;
    payload.kind = e.kind;
    payload.region = Rectangle{e.x, e.y, e.width, e.height};
    payload.shaped = e.shaped != False;
    payload.time = e.time;
    parsed.payload = payload;
    return parsed;
}

void registerShapeEvents(EventRegistry& registry, Extension& shape) {
    shape.ensureSupport();
    registry.registerType(shape.eventBase() + ShapeNotify, "ShapeNotify", "x11-shape-event", "", parseShapeNotify);
}

} // namespace XBridge
