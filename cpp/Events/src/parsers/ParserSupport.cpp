#include "parsers/ParserSupport.hpp"

namespace XBridge {

ParsedEvent makeEvent(const XEvent& event, Window window, Window deliveredTo) {
    ParsedEvent parsed;
    parsed.type = event.type;
    parsed.serial = event.xany.serial;
    parsed.sendEvent = event.xany.send_event != False;
    parsed.window = window;
    parsed.deliveredTo = deliveredTo;
    return parsed;
}

std::string atomNameOrEmpty(ParseContext& context, Atom atom) {
    if (atom == None) {
        return "";
    }
    return context.atoms.nameOf(atom).value_or("");
}

} // namespace XBridge
