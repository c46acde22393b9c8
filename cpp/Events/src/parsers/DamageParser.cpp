#include "parsers/DamageParser.hpp"
#include "parsers/ParserSupport.hpp"
#include <X11/extensions/Xdamage.h>

namespace XBridge {

std::optional<ParsedEvent> parseDamageNotify(ParseContext&, const XEvent& event) {
    const auto& e = reinterpret_cast<const XDamageNotifyEvent&>(event);
    ParsedEvent parsed = makeEvent(event, e.drawable, e.drawable);
    DamageEvent payload;
    payload.damage = e.damage;
    payload.level = e.level;
    payload.more = e.more != False;
    payload.timestamp = e.timestamp;
    payload.area = Rectangle{e.area.x, e.area.y, e.area.width, e.area.height};
    payload.geometry = Rectangle{e.geometry.x, e.geometry.y, e.geometry.width, e.geometry.height};
    parsed.payload = payload;
    return parsed;
}

void registerDamageEvents(EventRegistry& registry, Extension& damage) {
    damage.ensureSupport();
    registry.registerType(damage.eventBase() + XDamageNotify, "DamageNotify", "x11-damage-event", "", parseDamageNotify);
}

} // namespace XBridge
