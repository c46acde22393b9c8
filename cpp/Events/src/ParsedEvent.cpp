#include "ParsedEvent.hpp"

namespace XBridge {

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Rectangle, x, y, width, height)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ConfigureRequestEvent, x, y, width, height, borderWidth, above, detail, valueMask)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(CirculateRequestEvent, place)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(CreateEvent, x, y, width, height, borderWidth, overrideRedirect)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(MapEvent, overrideRedirect)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(UnmapEvent, fromConfigure)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ConfigureEvent, x, y, width, height, borderWidth, above, overrideRedirect)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ReparentEvent, parent, x, y, overrideRedirect)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(PropertyEvent, atom, atomName, state, time)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ClientMessageEvent, messageType, messageTypeName, format, data)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(FocusEvent, mode, detail)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(CrossingEvent, root, subwindow, x, y, xRoot, yRoot, mode, detail, focus, state, time)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(MotionEvent, root, subwindow, x, y, xRoot, yRoot, state, isHint, time)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(KeyEvent, root, subwindow, keycode, state, time)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ButtonEvent, root, subwindow, x, y, xRoot, yRoot, button, state, time)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(SelectionRequestEvent, owner, requestor, selection, target, property, time)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(SelectionClearEvent, selection, time)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(SelectionNotifyEvent, requestor, selection, target, property, time)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(DamageEvent, damage, level, more, timestamp, area, geometry)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ShapeEvent, kind, region, shaped, time)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(BellEvent, subtype, device, percent, pitch, duration, bellClass, bellId, nameAtom, bellName, eventOnly, time)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(CursorEvent, subtype, cursorSerial, cursorName, cursorNameString, timestamp)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(XFixesSelectionEvent, subtype, owner, selection, timestamp, selectionTimestamp)

// No fields beyond the common header
void to_json(nlohmann::json& j, const MapRequestEvent&) {
    j = nlohmann::json::object();
}

void to_json(nlohmann::json& j, const DestroyEvent&) {
    j = nlohmann::json::object();
}

nlohmann::json toJson(const ParsedEvent& event) {
    nlohmann::json j = std::visit([](const auto& payload) {
        nlohmann::json fields = payload;
        return fields;
    }, event.payload);
    j["type"] = event.type;
    j["name"] = event.name;
    j["serial"] = event.serial;
    j["send_event"] = event.sendEvent;
    j["window"] = event.window;
    j["delivered_to"] = event.deliveredTo;
    return j;
}

} // namespace XBridge
