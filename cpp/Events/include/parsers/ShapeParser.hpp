#pragma once
#include "EventRegistry.hpp"
#include "Extension.hpp"

namespace XBridge {

std::optional<ParsedEvent> parseShapeNotify(ParseContext& context, const XEvent& event);

/**
 * @brief Registers ShapeNotify at the extension's event base
 * @throws ExtensionUnavailable
 */
void registerShapeEvents(EventRegistry& registry, Extension& shape);

} // namespace XBridge
